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

#include "client/MultipartBody.h"

#include <string.h>

#include <algorithm>
#include <istream>
#include <string>

#include "boost/exception/to_string.hpp"
#include "boost/shared_ptr.hpp"

#include "base/HashUtils.h"
#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "client/Constants.h"
#include "client/TransferMonitor.h"
#include "configure/Default.h"

namespace KW {

namespace Client {

using boost::shared_ptr;
using boost::to_string;
using KW::StringUtils::ReplaceAll;
using std::string;

namespace {

const char *const CRLF = "\r\n";

string EscapeQuotes(const string &str) {
  return ReplaceAll(ReplaceAll(str, "\\", "\\\\"), "\"", "\\\"");
}

}  // namespace

// --------------------------------------------------------------------------
MultipartBody::MultipartBody(std::istream *source, int64_t chunkStart,
                             int64_t chunkSize, const string &filename,
                             const FormFields &fields,
                             const shared_ptr<TransferRecord> &record)
    : m_source(source),
      m_chunkStart(chunkStart),
      m_chunkSize(chunkSize),
      m_boundary(KW::HashUtils::RandomHex(30)),
      m_relaySize(KW::Configure::Default::GetUploadRelayBufferSize()),
      m_record(record),
      m_part(Part::Head),
      m_partPos(0),
      m_contentSent(0) {
  m_contentType = "multipart/form-data; boundary=" + m_boundary;

  for (FormFields::const_iterator it = fields.begin(); it != fields.end();
       ++it) {
    m_head += "--" + m_boundary + CRLF;
    m_head += "Content-Disposition: form-data; name=\"" +
              EscapeQuotes(it->first) + "\"" + CRLF + CRLF;
    m_head += it->second + CRLF;
  }
  m_head += "--" + m_boundary + CRLF;
  m_head += "Content-Disposition: form-data; name=\"content\"; filename=\"" +
            EscapeQuotes(filename) + "\"" + CRLF;
  m_head += string("Content-Type: ") + Constants::ContentTypeOctetStream +
            CRLF + CRLF;
  m_tail = string(CRLF) + "--" + m_boundary + "--" + CRLF;
}

// --------------------------------------------------------------------------
bool MultipartBody::Read(char *buf, size_t len, size_t *bytesRead) {
  *bytesRead = 0;
  if (m_part == Part::Head) {
    *bytesRead = CopyOut(m_head, buf, len);
    if (m_partPos == m_head.size()) {
      m_part = Part::Content;
      m_partPos = 0;
    }
    return true;
  }

  if (m_part == Part::Content) {
    int64_t remaining = m_chunkSize - m_contentSent;
    if (remaining > 0) {
      size_t want = std::min(std::min(len, m_relaySize),
                             static_cast<size_t>(remaining));
      m_source->read(buf, want);
      size_t got = static_cast<size_t>(m_source->gcount());
      if (got == 0) {
        m_lastError = m_source->bad()
                          ? "Unable to read upload source"
                          : "Upload source ended " + to_string(remaining) +
                                " bytes before end of chunk";
        DebugError(m_lastError);
        return false;
      }
      m_contentSent += got;
      if (m_record) {
        m_record->UpdatePosition(m_chunkStart + m_contentSent);
      }
      *bytesRead = got;
      return true;
    }
    m_part = Part::Tail;
    m_partPos = 0;
  }

  if (m_part == Part::Tail) {
    *bytesRead = CopyOut(m_tail, buf, len);
    if (m_partPos == m_tail.size()) {
      m_part = Part::Done;
    }
    return true;
  }
  return true;
}

// --------------------------------------------------------------------------
bool MultipartBody::Rewind() {
  m_part = Part::Head;
  m_partPos = 0;
  m_contentSent = 0;
  m_source->clear();
  m_source->seekg(m_chunkStart, std::ios_base::beg);
  if (m_source->fail()) {
    m_lastError = "Unable to seek upload source to " + to_string(m_chunkStart);
    DebugError(m_lastError);
    return false;
  }
  return true;
}

// --------------------------------------------------------------------------
size_t MultipartBody::CopyOut(const string &from, char *buf, size_t len) {
  size_t count = std::min(len, from.size() - m_partPos);
  memcpy(buf, from.data() + m_partPos, count);
  m_partPos += count;
  return count;
}

}  // namespace Client
}  // namespace KW
