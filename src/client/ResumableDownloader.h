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

#ifndef KWCLIENT_CLIENT_RESUMABLEDOWNLOADER_H_
#define KWCLIENT_CLIENT_RESUMABLEDOWNLOADER_H_

#include <stddef.h>
#include <stdint.h>

#include <istream>
#include <string>

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"

#include "client/CallEngine.h"
#include "client/Http.h"
#include "client/HttpClient.h"
#include "client/KWError.h"
#include "client/Types.h"

namespace KW {

namespace Client {

class AuthSession;
class TransferMonitor;

// --------------------------------------------------------------------------
//
// DownloadStream
//
// Pull stream over a prepared GET request. The request is only sent by the
// first Read, a Seek before it turns into a range header.
//
class DownloadStream : private boost::noncopyable {
 public:
  DownloadStream(const boost::shared_ptr<AuthSession> &session,
                 const Http::HttpRequest &request);
  ~DownloadStream();

 public:
  // Start reading at offset
  //
  // @param  : offset in bytes
  // @return : PARAMETER error if offset is negative or reading has started
  ClientError<KWError::Value> Seek(int64_t offset);

  // @param  : buffer, buffer length
  // @param  : output count of bytes, 0 at the end of content
  // @return : error, stream is closed on error and at the end
  ClientError<KWError::Value> Read(char *buf, size_t len, size_t *bytesRead);

  void Close();

  bool IsStarted() const { return m_started; }
  bool IsClosed() const { return m_closed; }
  int64_t GetOffset() const { return m_offset; }
  const Http::HttpRequest &GetRequest() const { return m_request; }

 private:
  ClientError<KWError::Value> Start();

 private:
  boost::shared_ptr<AuthSession> m_session;
  Http::HttpRequest m_request;
  boost::shared_ptr<Http::ResponseStream> m_response;
  int64_t m_offset;
  bool m_started;
  bool m_closed;
};

// --------------------------------------------------------------------------
//
// ResumableDownloader
//
class ResumableDownloader {
 public:
  // @param  : call engine, monitor to report transfers to (may be null)
  ResumableDownloader(const boost::shared_ptr<CallEngine> &engine,
                      const boost::shared_ptr<TransferMonitor> &monitor =
                          boost::shared_ptr<TransferMonitor>());

 public:
  // Get name and size of a file
  ClientError<KWError::Value> GetFileInfo(int64_t fileId, FileInfo *info);

  // Prepare a lazy content stream
  //
  // @param  : file id
  // @param  : output stream, nothing is sent before its first read
  // @return : error from building the request
  ClientError<KWError::Value> OpenContent(
      int64_t fileId, boost::shared_ptr<DownloadStream> *stream);

  // Fetch file info and prepare a monitored content stream
  //
  // @param  : file id
  // @param  : output std::istream, see Data::TransferStream for errors
  // @param  : output file info, may be null
  // @return : error
  ClientError<KWError::Value> Download(int64_t fileId,
                                       boost::shared_ptr<std::istream> *stream,
                                       FileInfo *info = NULL);

 private:
  boost::shared_ptr<CallEngine> m_engine;
  boost::shared_ptr<TransferMonitor> m_monitor;
};

}  // namespace Client
}  // namespace KW

#endif  // KWCLIENT_CLIENT_RESUMABLEDOWNLOADER_H_
