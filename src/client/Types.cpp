// +-------------------------------------------------------------------------
// | Copyright (C) 2017 Yunify, Inc.
// +-------------------------------------------------------------------------
// | Licensed under the Apache License, Version 2.0 (the "License");
// | You may not use this work except in compliance with the License.
// | You may obtain a copy of the License in the LICENSE file, or at:
// |
// | http://www.apache.org/licenses/LICENSE-2.0
// |
// | Unless required by applicable law or agreed to in writing, software
// | distributed under the License is distributed on an "AS IS" BASIS,
// | WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// | See the License for the specific language governing permissions and
// | limitations under the License.
// +-------------------------------------------------------------------------

#include "client/Types.h"

#include <stdint.h>
#include <time.h>

#include <exception>
#include <string>

#include "boost/foreach.hpp"
#include "boost/optional.hpp"
#include "boost/property_tree/exceptions.hpp"
#include "boost/property_tree/ptree.hpp"

#include "base/TimeUtils.h"

namespace KW {

namespace Client {

using boost::property_tree::ptree;
using std::string;

namespace {

ClientError<KWError::Value> DecodeError(const string &type,
                                        const std::exception &err) {
  return MakeKWError(KWError::DECODE,
                     "Bad " + type + " entity: " + string(err.what()));
}

// Throws ptree_error when id or the totals are missing or not numbers
void DecodeUploadRecord(const ptree &tree, UploadRecord *record) {
  record->id = tree.get<int64_t>("id");
  record->totalSize = tree.get<int64_t>("totalSize");
  record->totalChunks = tree.get<int64_t>("totalChunks");
  record->uploadedSize = tree.get<int64_t>("uploadedSize", 0);
  record->uploadedChunks = tree.get<int64_t>("uploadedChunks", 0);
  record->finished = tree.get<bool>("finished", false);
  record->uri = tree.get<string>("uri", string());
  record->fileId = tree.get<int64_t>("fileId", 0);
}

}  // namespace

// --------------------------------------------------------------------------
ClientError<KWError::Value> Decode(const ptree &tree, EntityId *entity) {
  try {
    entity->id = tree.get<int64_t>("id", 0);
  } catch (const boost::property_tree::ptree_error &err) {
    return DecodeError("id", err);
  }
  return ClientError<KWError::Value>();
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> Decode(const ptree &tree, UploadRecord *record) {
  try {
    DecodeUploadRecord(tree, record);
  } catch (const boost::property_tree::ptree_error &err) {
    return DecodeError("upload", err);
  }
  return ClientError<KWError::Value>();
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> Decode(const ptree &tree, UploadList *list) {
  list->data.clear();
  boost::optional<const ptree &> data = tree.get_child_optional("data");
  if (!data) {
    return ClientError<KWError::Value>();
  }
  try {
    BOOST_FOREACH (const ptree::value_type &item, *data) {
      UploadRecord record;
      DecodeUploadRecord(item.second, &record);
      list->data.push_back(record);
    }
  } catch (const boost::property_tree::ptree_error &err) {
    return DecodeError("upload", err);
  }
  return ClientError<KWError::Value>();
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> Decode(const ptree &tree, FileInfo *info) {
  try {
    info->id = tree.get<int64_t>("id", 0);
    info->name = tree.get<string>("name", string());
    info->size = tree.get<int64_t>("size", 0);
    string modified = tree.get<string>("modified", string());
    if (!KW::TimeUtils::KWTimeToSeconds(modified, &info->modified)) {
      info->modified = 0;
    }
  } catch (const boost::property_tree::ptree_error &err) {
    return DecodeError("file", err);
  }
  return ClientError<KWError::Value>();
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> Decode(const ptree &tree, AuthToken *token) {
  try {
    token->accessToken = tree.get<string>("access_token", string());
    token->refreshToken = tree.get<string>("refresh_token", string());
    int64_t expiresIn = tree.get<int64_t>("expires_in", 0);
    token->expires = expiresIn > 0 ? time(NULL) + expiresIn : 0;
  } catch (const boost::property_tree::ptree_error &err) {
    return DecodeError("token", err);
  }
  return ClientError<KWError::Value>();
}

}  // namespace Client
}  // namespace KW
