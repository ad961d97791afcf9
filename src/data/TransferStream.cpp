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

#include "data/TransferStream.h"

#include <stddef.h>
#include <stdint.h>

#include <istream>

#include "boost/shared_ptr.hpp"

#include "base/LogMacros.h"
#include "client/ResumableDownloader.h"
#include "client/TransferMonitor.h"
#include "configure/Default.h"

namespace KW {

namespace Data {

using boost::shared_ptr;
using KW::Client::ClientError;
using KW::Client::DownloadStream;
using KW::Client::GetMessageForKWError;
using KW::Client::IsGoodKWError;
using KW::Client::KWError;
using KW::Client::TransferRecord;

// --------------------------------------------------------------------------
DownloadStreamBuf::DownloadStreamBuf(
    const shared_ptr<DownloadStream> &source,
    const shared_ptr<TransferRecord> &record)
    : m_source(source),
      m_record(record),
      m_buffer(KW::Configure::Default::GetDownloadBufferSize()),
      m_position(0) {
  setg(&m_buffer[0], &m_buffer[0], &m_buffer[0]);
}

// --------------------------------------------------------------------------
DownloadStreamBuf::~DownloadStreamBuf() {
  if (m_source) {
    m_source->Close();
  }
  Finish();
}

// --------------------------------------------------------------------------
DownloadStreamBuf::int_type DownloadStreamBuf::underflow() {
  if (gptr() < egptr()) {
    return traits_type::to_int_type(*gptr());
  }
  if (!m_source || !IsGoodKWError(m_lastError)) {
    return traits_type::eof();
  }

  size_t bytesRead = 0;
  ClientError<KWError::Value> err =
      m_source->Read(&m_buffer[0], m_buffer.size(), &bytesRead);
  if (!IsGoodKWError(err)) {
    m_lastError = err;
    DebugError(GetMessageForKWError(err));
  }
  if (bytesRead == 0) {
    Finish();
    return traits_type::eof();
  }

  m_position += static_cast<int64_t>(bytesRead);
  if (m_record) {
    m_record->AddTransferred(static_cast<int64_t>(bytesRead));
  }
  setg(&m_buffer[0], &m_buffer[0], &m_buffer[0] + bytesRead);
  return traits_type::to_int_type(*gptr());
}

// --------------------------------------------------------------------------
std::streamsize DownloadStreamBuf::showmanyc() {
  std::streamsize avail = egptr() - gptr();
  if (avail > 0) {
    return avail;
  }
  return m_source && m_source->IsClosed() ? -1 : 0;
}

// --------------------------------------------------------------------------
DownloadStreamBuf::pos_type DownloadStreamBuf::seekoff(
    off_type off, std::ios_base::seekdir dir, std::ios_base::openmode which) {
  // tellg
  if (dir == std::ios_base::cur && off == 0) {
    return pos_type(m_position - (egptr() - gptr()));
  }
  if (dir == std::ios_base::beg) {
    return seekpos(pos_type(off), which);
  }
  return pos_type(off_type(-1));
}

// --------------------------------------------------------------------------
DownloadStreamBuf::pos_type DownloadStreamBuf::seekpos(
    pos_type pos, std::ios_base::openmode which) {
  if ((which & std::ios_base::in) == 0 || !m_source) {
    return pos_type(off_type(-1));
  }
  int64_t offset = static_cast<int64_t>(off_type(pos));
  ClientError<KWError::Value> err = m_source->Seek(offset);
  if (!IsGoodKWError(err)) {
    DebugError(GetMessageForKWError(err));
    return pos_type(off_type(-1));
  }
  m_position = offset;
  setg(&m_buffer[0], &m_buffer[0], &m_buffer[0]);
  if (m_record) {
    m_record->SetOffset(offset);
  }
  return pos;
}

// --------------------------------------------------------------------------
void DownloadStreamBuf::Finish() {
  if (m_record) {
    m_record->Finish();
  }
}

// --------------------------------------------------------------------------
TransferStream::TransferStream(const shared_ptr<DownloadStream> &source,
                               const shared_ptr<TransferRecord> &record)
    : std::istream(NULL), m_streamBuf(source, record) {
  rdbuf(&m_streamBuf);
}

}  // namespace Data
}  // namespace KW
