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

#ifndef KWCLIENT_CLIENT_CLIENT_H_
#define KWCLIENT_CLIENT_CLIENT_H_

#include <stdint.h>

#include <istream>
#include <string>

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"

#include "client/AuthSession.h"
#include "client/CallEngine.h"
#include "client/ChunkedUploader.h"
#include "client/ClientConfiguration.h"
#include "client/KWError.h"
#include "client/ResumableDownloader.h"
#include "client/Types.h"

namespace KW {

namespace Client {

class TransferMonitor;

// --------------------------------------------------------------------------
//
// Client
//
// Entry point for one user of a kiteworks host. Wires session, call engine
// and transfer engines together. Several clients may share one monitor.
//
class Client : private boost::noncopyable {
 public:
  // @param  : configuration, user name, transfer monitor (may be null)
  Client(const ClientConfiguration &config, const std::string &username,
         const boost::shared_ptr<TransferMonitor> &monitor =
             boost::shared_ptr<TransferMonitor>());

  ~Client() {}

 public:
  // Password grant, token is kept in the token store
  ClientError<KWError::Value> Login(const std::string &password);

  // Execute an arbitrary api call
  //
  // @param  : request, output result with a Decode overload
  // @return : error
  template <typename Result>
  ClientError<KWError::Value> Call(const APIRequest &request, Result *result) {
    return m_engine->Call(request, result);
  }
  ClientError<KWError::Value> Call(const APIRequest &request) {
    return m_engine->Call(request);
  }

  // Initiate upload of a new file into a folder
  //
  // @param  : folder id, file name, file size, output upload id
  // @return : error
  ClientError<KWError::Value> NewUpload(int64_t folderId,
                                        const std::string &filename,
                                        int64_t fileSize, int64_t *uploadId);

  // Initiate upload of a new version of a file
  ClientError<KWError::Value> NewVersion(int64_t fileId,
                                         const std::string &filename,
                                         int64_t fileSize, int64_t *uploadId);

  // Send or resume an upload
  //
  // @param  : file name, upload id, seekable source, output file id
  // @return : error
  ClientError<KWError::Value> Upload(const std::string &filename,
                                     int64_t uploadId, std::istream *source,
                                     int64_t *fileId);

  ClientError<KWError::Value> GetFileInfo(int64_t fileId, FileInfo *info);

  // Open file content for reading
  //
  // @param  : file id, output stream, output file info (may be null)
  // @return : error
  //
  // Content is requested by the first read. Seeking the stream before it
  // resumes a download at the given offset.
  ClientError<KWError::Value> Download(int64_t fileId,
                                       boost::shared_ptr<std::istream> *stream,
                                       FileInfo *info = NULL);

  const boost::shared_ptr<AuthSession> &GetSession() const {
    return m_session;
  }
  const boost::shared_ptr<CallEngine> &GetCallEngine() const {
    return m_engine;
  }

 private:
  boost::shared_ptr<AuthSession> m_session;
  boost::shared_ptr<CallEngine> m_engine;
  ChunkedUploader m_uploader;
  ResumableDownloader m_downloader;
};

}  // namespace Client
}  // namespace KW

#endif  // KWCLIENT_CLIENT_CLIENT_H_
