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

#include "client/ChunkedUploader.h"

#include <stdint.h>

#include <istream>
#include <string>
#include <utility>

#include "boost/exception/to_string.hpp"
#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"

#include "base/Exception.h"
#include "base/LogMacros.h"
#include "client/MultipartBody.h"
#include "client/TransferMonitor.h"
#include "configure/Default.h"

namespace KW {

namespace Client {

using boost::shared_ptr;
using boost::to_string;
using KW::Configure::Default::GetInitiateUploadAPIVersion;
using KW::Configure::Default::GetMaxChunkSize;
using KW::Configure::Default::GetMinChunkSize;
using KW::Configure::Default::GetTransferAPIVersion;
using std::make_pair;
using std::string;

namespace {

const char *const UPLOAD_RECORD_FIELDS =
    "(id,totalSize,totalChunks,uploadedChunks,finished,uploadedSize,uri,"
    "fileId)";

// Close the transfer record on every way out of an upload
class RecordFinisher {
 public:
  explicit RecordFinisher(const shared_ptr<TransferRecord> &record)
      : m_record(record) {}
  ~RecordFinisher() {
    if (m_record) {
      m_record->Finish();
    }
  }

 private:
  shared_ptr<TransferRecord> m_record;
};

}  // namespace

// --------------------------------------------------------------------------
int64_t GetTotalChunks(int64_t totalSize, uint64_t maxChunkSize) {
  int64_t maxSize = static_cast<int64_t>(GetMaxChunkSize());
  int64_t minSize = static_cast<int64_t>(GetMinChunkSize());

  int64_t chunkSize = static_cast<int64_t>(maxChunkSize);
  if (maxChunkSize == 0 || maxChunkSize > GetMaxChunkSize()) {
    chunkSize = maxSize;
  }
  if (chunkSize <= minSize) {
    chunkSize = minSize;
  }

  if (totalSize <= chunkSize) {
    return 1;
  }
  while (totalSize % chunkSize != 0) {
    --chunkSize;
  }
  return totalSize / chunkSize;
}

// --------------------------------------------------------------------------
ChunkedUploader::ChunkedUploader(const shared_ptr<CallEngine> &engine,
                                 const shared_ptr<TransferMonitor> &monitor)
    : m_engine(engine), m_monitor(monitor) {
  if (!m_engine) {
    throw KW::Exception::ConfigurationException("Call engine is not set");
  }
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> ChunkedUploader::NewUpload(int64_t folderId,
                                                       const string &filename,
                                                       int64_t fileSize,
                                                       int64_t *uploadId) {
  return InitiateUpload(
      "/rest/folders/" + to_string(folderId) + "/actions/initiateUpload",
      filename, fileSize, uploadId);
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> ChunkedUploader::NewVersion(int64_t fileId,
                                                        const string &filename,
                                                        int64_t fileSize,
                                                        int64_t *uploadId) {
  return InitiateUpload(
      "/rest/files/" + to_string(fileId) + "/actions/initiateUpload", filename,
      fileSize, uploadId);
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> ChunkedUploader::GetUploadRecord(
    int64_t uploadId, UploadRecord *record) {
  APIRequest request(Http::HttpMethod::Get, "/rest/uploads");
  request.params.Add(Query()
                         .Set("locate_id", uploadId)
                         .Set("limit", 1)
                         .Set("with", UPLOAD_RECORD_FIELDS));

  UploadList uploads;
  ClientError<KWError::Value> err = m_engine->Call(request, &uploads);
  if (!IsGoodKWError(err)) {
    return err;
  }
  if (uploads.data.empty() || uploads.data.front().id != uploadId) {
    return MakeKWError(KWError::PROTOCOL, "Upload ID not found.");
  }
  *record = uploads.data.front();
  return ClientError<KWError::Value>();
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> ChunkedUploader::Upload(const string &filename,
                                                    int64_t uploadId,
                                                    std::istream *source,
                                                    int64_t *fileId) {
  if (source == NULL) {
    return MakeKWError(KWError::PARAMETER, "Upload source is null");
  }

  UploadRecord record;
  ClientError<KWError::Value> err = GetUploadRecord(uploadId, &record);
  if (!IsGoodKWError(err)) {
    return err;
  }

  int64_t total = record.totalSize;
  int64_t totalChunks = record.totalChunks > 0 ? record.totalChunks : 1;
  int64_t chunkSize = total / totalChunks;
  if (chunkSize > static_cast<int64_t>(GetMaxChunkSize())) {
    return MakeKWError(KWError::PROTOCOL,
                       "Chunk size " + to_string(chunkSize) + " of upload " +
                           to_string(uploadId) + " exceeds limit");
  }

  int64_t index = record.uploadedChunks;
  int64_t transferred = record.uploadedSize;

  if (total > 0 && transferred >= total) {
    DebugInfo("Upload " << uploadId << " is complete already");
    if (record.fileId == 0) {
      return MakeKWError(KWError::PROTOCOL,
                         "Unexpected empty response from server.");
    }
    *fileId = record.fileId;
    return ClientError<KWError::Value>();
  }

  if (index > 0 && transferred > 0) {
    source->clear();
    source->seekg(chunkSize * index, std::ios_base::beg);
    if (source->fail()) {
      return MakeKWError(KWError::IO, "Unable to seek upload source to " +
                                          to_string(chunkSize * index));
    }
    DebugInfo("Resume upload " << uploadId << " from chunk " << index + 1
                               << " of " << totalChunks);
  }

  shared_ptr<TransferRecord> transfer;
  if (m_monitor) {
    transfer = m_monitor->Register(filename, total);
    transfer->SetOffset(transferred);
  }
  RecordFinisher finisher(transfer);

  EntityId result;
  while (transferred < total || total == 0) {
    bool last = index >= totalChunks - 1;
    int64_t size = last ? total - transferred : chunkSize;

    APIRequest request(Http::HttpMethod::Post, "/" + record.uri,
                       GetTransferAPIVersion());
    request.streaming = true;
    if (last) {
      request.params.Add(
          Query().Set("returnEntity", true).Set("mode", "full"));
    }

    FormFields fields;
    fields.push_back(make_pair(string("compressionMode"), string("NORMAL")));
    fields.push_back(make_pair(string("index"), to_string(index + 1)));
    fields.push_back(make_pair(string("compressionSize"), to_string(size)));
    fields.push_back(make_pair(string("originalSize"), to_string(size)));
    request.body = boost::make_shared<MultipartBody>(
        source, chunkSize * index, size, filename, fields, transfer);

    DebugInfo("Upload chunk " << index + 1 << " of " << totalChunks << " ["
                              << filename << "]");
    err = m_engine->Call(request, &result);
    if (!IsGoodKWError(err)) {
      return err;
    }

    ++index;
    transferred += size;
    if (total == 0) {
      break;
    }
  }

  if (result.id == 0) {
    return MakeKWError(KWError::PROTOCOL,
                       "Unexpected empty response from server.");
  }
  *fileId = result.id;
  return ClientError<KWError::Value>();
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> ChunkedUploader::InitiateUpload(
    const string &path, const string &filename, int64_t fileSize,
    int64_t *uploadId) {
  APIRequest request(Http::HttpMethod::Post, path,
                     GetInitiateUploadAPIVersion());
  request.params
      .Add(PostJSON()
               .Set("filename", filename)
               .Set("totalSize", fileSize)
               .Set("totalChunks",
                    GetTotalChunks(fileSize, m_engine->GetSession()
                                                 ->GetConfiguration()
                                                 .GetMaxChunkSize())))
      .Add(Query().Set("returnEntity", true));

  EntityId upload;
  ClientError<KWError::Value> err = m_engine->Call(request, &upload);
  if (!IsGoodKWError(err)) {
    return err;
  }
  if (upload.id == 0) {
    return MakeKWError(KWError::PROTOCOL,
                       "Unexpected empty response from server.");
  }
  *uploadId = upload.id;
  return ClientError<KWError::Value>();
}

}  // namespace Client
}  // namespace KW
