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

#ifndef KWCLIENT_CLIENT_TYPES_H_
#define KWCLIENT_CLIENT_TYPES_H_

#include <stdint.h>
#include <time.h>

#include <string>
#include <vector>

#include "boost/property_tree/ptree_fwd.hpp"

#include "client/KWError.h"
#include "client/TokenStore.h"

namespace KW {

namespace Client {

// Entity reference returned by calls with returnEntity=true
struct EntityId {
  EntityId() : id(0) {}

  int64_t id;
};

// Server side state of a chunked upload
struct UploadRecord {
  UploadRecord()
      : id(0),
        totalSize(0),
        totalChunks(0),
        uploadedSize(0),
        uploadedChunks(0),
        finished(false),
        fileId(0) {}

  int64_t id;
  int64_t totalSize;
  int64_t totalChunks;
  int64_t uploadedSize;
  int64_t uploadedChunks;
  bool finished;
  std::string uri;  // chunk submission path, without leading '/'
  int64_t fileId;
};

struct UploadList {
  std::vector<UploadRecord> data;
};

struct FileInfo {
  FileInfo() : id(0), size(0), modified(0) {}

  int64_t id;
  std::string name;
  int64_t size;
  time_t modified;  // 0 if unknown
};

// Decoders used by CallEngine::Call. Absent fields keep their defaults,
// fields of a wrong type yield a DECODE error.
ClientError<KWError::Value> Decode(const boost::property_tree::ptree &tree,
                                   EntityId *entity);
ClientError<KWError::Value> Decode(const boost::property_tree::ptree &tree,
                                   UploadRecord *record);
ClientError<KWError::Value> Decode(const boost::property_tree::ptree &tree,
                                   UploadList *list);
ClientError<KWError::Value> Decode(const boost::property_tree::ptree &tree,
                                   FileInfo *info);

// Token endpoint answer {access_token, refresh_token, expires_in}, expiry
// is turned into an absolute time
ClientError<KWError::Value> Decode(const boost::property_tree::ptree &tree,
                                   AuthToken *token);

}  // namespace Client
}  // namespace KW

#endif  // KWCLIENT_CLIENT_TYPES_H_
