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

#include "client/ResumableDownloader.h"

#include <stdint.h>

#include <istream>
#include <string>

#include "boost/exception/to_string.hpp"
#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"

#include "base/Exception.h"
#include "base/LogMacros.h"
#include "client/AuthSession.h"
#include "client/Constants.h"
#include "client/TransferMonitor.h"
#include "client/Utils.h"
#include "configure/Default.h"
#include "data/TransferStream.h"

namespace KW {

namespace Client {

using boost::shared_ptr;
using boost::to_string;
using KW::Data::TransferStream;
using std::string;

// --------------------------------------------------------------------------
DownloadStream::DownloadStream(const shared_ptr<AuthSession> &session,
                               const Http::HttpRequest &request)
    : m_session(session),
      m_request(request),
      m_offset(0),
      m_started(false),
      m_closed(false) {}

// --------------------------------------------------------------------------
DownloadStream::~DownloadStream() { Close(); }

// --------------------------------------------------------------------------
ClientError<KWError::Value> DownloadStream::Seek(int64_t offset) {
  if (offset < 0) {
    return MakeKWError(KWError::PARAMETER,
                       "Can't read before the start of the file.");
  }
  if (m_started) {
    return MakeKWError(KWError::PARAMETER,
                       "Can't seek once download has started.");
  }
  m_request.SetHeader("Range", Utils::BuildRequestRangeStart(offset));
  m_offset = offset;
  return ClientError<KWError::Value>();
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> DownloadStream::Read(char *buf, size_t len,
                                                 size_t *bytesRead) {
  *bytesRead = 0;
  if (!m_started) {
    ClientError<KWError::Value> err = Start();
    if (!IsGoodKWError(err)) {
      Close();
      return err;
    }
  }
  if (m_closed) {
    return ClientError<KWError::Value>();
  }

  ClientError<KWError::Value> err = m_response->Read(buf, len, bytesRead);
  if (!IsGoodKWError(err) || *bytesRead == 0) {
    Close();
  }
  return err;
}

// --------------------------------------------------------------------------
void DownloadStream::Close() {
  if (m_response) {
    m_response->Close();
    m_response.reset();
  }
  m_closed = true;
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> DownloadStream::Start() {
  m_started = true;
  if (m_closed) {
    return MakeKWError(KWError::IO, "Download stream is closed");
  }

  ClientError<KWError::Value> err =
      m_session->NewClient(true)->Open(m_request, &m_response);
  if (!IsGoodKWError(err)) {
    return err;
  }

  long status = m_response->GetStatusCode();  // NOLINT
  if (!Http::IsSuccessStatus(status)) {
    return MakeKWError(KWError::UNEXPECTED_RESPONSE,
                       "GET " + m_request.GetURL() + ": " + to_string(status));
  }

  if (m_offset > 0) {
    string contentRange = m_response->GetHeader("Content-Range");
    int64_t start = 0;
    if (Utils::ParseResponseContentRangeStart(contentRange, &start) &&
        start != m_offset) {
      return MakeKWError(KWError::PROTOCOL,
                         "Requested byte " + to_string(m_offset) + ", got " +
                             to_string(start) + " instead.");
    }
  }
  return ClientError<KWError::Value>();
}

// --------------------------------------------------------------------------
ResumableDownloader::ResumableDownloader(
    const shared_ptr<CallEngine> &engine,
    const shared_ptr<TransferMonitor> &monitor)
    : m_engine(engine), m_monitor(monitor) {
  if (!m_engine) {
    throw KW::Exception::ConfigurationException("Call engine is not set");
  }
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> ResumableDownloader::GetFileInfo(int64_t fileId,
                                                             FileInfo *info) {
  APIRequest request(Http::HttpMethod::Get, "/rest/files/" + to_string(fileId));
  return m_engine->Call(request, info);
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> ResumableDownloader::OpenContent(
    int64_t fileId, shared_ptr<DownloadStream> *stream) {
  const shared_ptr<AuthSession> &session = m_engine->GetSession();
  Http::HttpRequest request;
  ClientError<KWError::Value> err = session->NewRequest(
      Http::HttpMethod::Get, "/rest/files/" + to_string(fileId) + "/content",
      KW::Configure::Default::GetTransferAPIVersion(), &request);
  if (!IsGoodKWError(err)) {
    return err;
  }
  request.SetHeader("Content-Type", Constants::ContentTypeOctetStream);
  *stream = boost::make_shared<DownloadStream>(session, request);
  return ClientError<KWError::Value>();
}

// --------------------------------------------------------------------------
ClientError<KWError::Value> ResumableDownloader::Download(
    int64_t fileId, shared_ptr<std::istream> *stream, FileInfo *info) {
  FileInfo fileInfo;
  ClientError<KWError::Value> err = GetFileInfo(fileId, &fileInfo);
  if (!IsGoodKWError(err)) {
    return err;
  }

  shared_ptr<DownloadStream> content;
  err = OpenContent(fileId, &content);
  if (!IsGoodKWError(err)) {
    return err;
  }

  shared_ptr<TransferRecord> record;
  if (m_monitor) {
    record = m_monitor->Register(fileInfo.name, fileInfo.size);
  }
  *stream = boost::make_shared<TransferStream>(content, record);
  if (info != NULL) {
    *info = fileInfo;
  }
  return ClientError<KWError::Value>();
}

}  // namespace Client
}  // namespace KW
