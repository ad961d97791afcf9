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

#ifndef KWCLIENT_DATA_TRANSFERSTREAM_H_
#define KWCLIENT_DATA_TRANSFERSTREAM_H_

#include <stdint.h>

#include <istream>
#include <streambuf>  // NOLINT
#include <vector>

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"

#include "client/KWError.h"

namespace KW {

namespace Client {
class DownloadStream;
class TransferRecord;
}  // namespace Client

namespace Data {

/**
 * A read only stream buf pulling from a download stream. Bytes read are
 * reported to the transfer record, which is finished at the end of content
 * or on the first error.
 */
class DownloadStreamBuf : public std::streambuf, private boost::noncopyable {
 public:
  DownloadStreamBuf(const boost::shared_ptr<Client::DownloadStream> &source,
                    const boost::shared_ptr<Client::TransferRecord> &record);

  ~DownloadStreamBuf();

  const Client::ClientError<Client::KWError::Value> &GetLastError() const {
    return m_lastError;
  }

 protected:
  int_type underflow();
  std::streamsize showmanyc();

  // Only allowed before the first read, moves the start of the download
  pos_type seekoff(off_type off, std::ios_base::seekdir dir,
                   std::ios_base::openmode which = std::ios_base::in);
  pos_type seekpos(pos_type pos,
                   std::ios_base::openmode which = std::ios_base::in);

 private:
  void Finish();

 private:
  boost::shared_ptr<Client::DownloadStream> m_source;
  boost::shared_ptr<Client::TransferRecord> m_record;
  std::vector<char> m_buffer;
  int64_t m_position;  // offset of the end of buffered data
  Client::ClientError<Client::KWError::Value> m_lastError;
};

// std::istream owning its DownloadStreamBuf
class TransferStream : public std::istream, private boost::noncopyable {
 public:
  TransferStream(const boost::shared_ptr<Client::DownloadStream> &source,
                 const boost::shared_ptr<Client::TransferRecord> &record);

  // Error which ended the stream, GOOD at normal end of content
  const Client::ClientError<Client::KWError::Value> &GetLastError() const {
    return m_streamBuf.GetLastError();
  }

 private:
  DownloadStreamBuf m_streamBuf;
};

}  // namespace Data
}  // namespace KW

#endif  // KWCLIENT_DATA_TRANSFERSTREAM_H_
