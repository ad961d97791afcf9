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

#include "client/Client.h"

#include <istream>
#include <string>

#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"

#include "client/TransferMonitor.h"

namespace KW {

namespace Client {

using boost::shared_ptr;
using std::string;

// --------------------------------------------------------------------------
Client::Client(const ClientConfiguration &config, const string &username,
               const shared_ptr<TransferMonitor> &monitor)
    : m_session(boost::make_shared<AuthSession>(config, username)),
      m_engine(boost::make_shared<CallEngine>(m_session)),
      m_uploader(m_engine, monitor),
      m_downloader(m_engine, monitor) {}

// --------------------------------------------------------------------------
ClientError<KWError::Value> Client::Login(const string &password) {
  return m_session->Login(password);
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> Client::NewUpload(int64_t folderId,
                                              const string &filename,
                                              int64_t fileSize,
                                              int64_t *uploadId) {
  return m_uploader.NewUpload(folderId, filename, fileSize, uploadId);
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> Client::NewVersion(int64_t fileId,
                                               const string &filename,
                                               int64_t fileSize,
                                               int64_t *uploadId) {
  return m_uploader.NewVersion(fileId, filename, fileSize, uploadId);
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> Client::Upload(const string &filename,
                                           int64_t uploadId,
                                           std::istream *source,
                                           int64_t *fileId) {
  return m_uploader.Upload(filename, uploadId, source, fileId);
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> Client::GetFileInfo(int64_t fileId,
                                                FileInfo *info) {
  return m_downloader.GetFileInfo(fileId, info);
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> Client::Download(int64_t fileId,
                                             shared_ptr<std::istream> *stream,
                                             FileInfo *info) {
  return m_downloader.Download(fileId, stream, info);
}

}  // namespace Client
}  // namespace KW
