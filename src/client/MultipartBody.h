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

#ifndef KWCLIENT_CLIENT_MULTIPARTBODY_H_
#define KWCLIENT_CLIENT_MULTIPARTBODY_H_

#include <stddef.h>
#include <stdint.h>

#include <istream>
#include <string>
#include <utility>
#include <vector>

#include "boost/shared_ptr.hpp"

#include "client/Http.h"

namespace KW {

namespace Client {

class TransferRecord;

typedef std::vector<std::pair<std::string, std::string> > FormFields;

// --------------------------------------------------------------------------
//
// MultipartBody
//
// multipart/form-data body of one upload chunk: text fields followed by a
// "content" part holding 'chunkSize' bytes of the source from 'chunkStart'.
// Content is relayed from the source in small pieces, the chunk is never
// held in memory. Rewind seeks the source back to chunk start.
//
class MultipartBody : public Http::RequestBody {
 public:
  // @param  : source stream, chunk start, chunk size, file name, fields
  // @param  : record to report source position to, may be null
  MultipartBody(std::istream *source, int64_t chunkStart, int64_t chunkSize,
                const std::string &filename, const FormFields &fields,
                const boost::shared_ptr<TransferRecord> &record);

 public:
  bool Read(char *buf, size_t len, size_t *bytesRead);
  bool Rewind();
  int64_t GetContentLength() const { return -1; }
  const std::string &GetContentType() const { return m_contentType; }

  const std::string &GetBoundary() const { return m_boundary; }
  int64_t GetContentSent() const { return m_contentSent; }
  const std::string &GetLastError() const { return m_lastError; }

 private:
  struct Part {
    enum Value { Head, Content, Tail, Done };
  };

  size_t CopyOut(const std::string &from, char *buf, size_t len);

 private:
  std::istream *m_source;
  int64_t m_chunkStart;
  int64_t m_chunkSize;
  std::string m_boundary;
  std::string m_contentType;
  std::string m_head;  // fields and header of content part
  std::string m_tail;
  size_t m_relaySize;
  boost::shared_ptr<TransferRecord> m_record;

  Part::Value m_part;
  size_t m_partPos;  // position in head or tail
  int64_t m_contentSent;
  std::string m_lastError;
};

}  // namespace Client
}  // namespace KW

#endif  // KWCLIENT_CLIENT_MULTIPARTBODY_H_
