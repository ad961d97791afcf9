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

#ifndef KWCLIENT_CLIENT_CHUNKEDUPLOADER_H_
#define KWCLIENT_CLIENT_CHUNKEDUPLOADER_H_

#include <stdint.h>

#include <istream>
#include <string>

#include "boost/shared_ptr.hpp"

#include "client/CallEngine.h"
#include "client/KWError.h"
#include "client/Types.h"

namespace KW {

namespace Client {

class TransferMonitor;

// Number of chunks a file is sent in
//
// @param  : total size, max chunk size (0 for the largest allowed)
// @return : count of chunks of equal size which divide total size, chunk
//           size is kept within [1MB, 65MB]
int64_t GetTotalChunks(int64_t totalSize, uint64_t maxChunkSize);

// --------------------------------------------------------------------------
//
// ChunkedUploader
//
// Sends files in chunks. Chunk geometry and resume point are taken from the
// upload record kept by the server, so an interrupted upload is continued
// by calling Upload again with the same upload id.
//
class ChunkedUploader {
 public:
  // @param  : call engine, monitor to report transfers to (may be null)
  ChunkedUploader(const boost::shared_ptr<CallEngine> &engine,
                  const boost::shared_ptr<TransferMonitor> &monitor =
                      boost::shared_ptr<TransferMonitor>());

 public:
  // Initiate an upload of a new file into a folder
  //
  // @param  : folder id, file name, file size
  // @param  : output upload id
  // @return : error
  ClientError<KWError::Value> NewUpload(int64_t folderId,
                                        const std::string &filename,
                                        int64_t fileSize, int64_t *uploadId);

  // Initiate an upload of a new version of a file
  ClientError<KWError::Value> NewVersion(int64_t fileId,
                                         const std::string &filename,
                                         int64_t fileSize, int64_t *uploadId);

  // Get server side state of an upload
  //
  // @param  : upload id, output record
  // @return : PROTOCOL error if upload id is not found
  ClientError<KWError::Value> GetUploadRecord(int64_t uploadId,
                                              UploadRecord *record);

  // Send the remaining chunks of an upload
  //
  // @param  : file name, upload id
  // @param  : seekable source positioned anywhere
  // @param  : output id of the uploaded file
  // @return : error
  ClientError<KWError::Value> Upload(const std::string &filename,
                                     int64_t uploadId, std::istream *source,
                                     int64_t *fileId);

 private:
  ClientError<KWError::Value> InitiateUpload(const std::string &path,
                                             const std::string &filename,
                                             int64_t fileSize,
                                             int64_t *uploadId);

 private:
  boost::shared_ptr<CallEngine> m_engine;
  boost::shared_ptr<TransferMonitor> m_monitor;
};

}  // namespace Client
}  // namespace KW

#endif  // KWCLIENT_CLIENT_CHUNKEDUPLOADER_H_
