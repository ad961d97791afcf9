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

#ifndef KWCLIENT_CLIENT_TRANSFERMONITOR_H_
#define KWCLIENT_CLIENT_TRANSFERMONITOR_H_

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

#include "boost/atomic.hpp"
#include "boost/chrono/chrono.hpp"
#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/mutex.hpp"
#include "boost/thread/shared_mutex.hpp"
#include "boost/thread/thread.hpp"

#include "base/BitFlag.hpp"

namespace KW {

namespace Client {

// --------------------------------------------------------------------------
//
// ProgressOutput
//
// Sink of transfer status lines. A flash line overwrites the previous one,
// a log line is kept.
//
class ProgressOutput : private boost::noncopyable {
 public:
  virtual ~ProgressOutput() {}

  virtual void Flash(const std::string &line) = 0;
  virtual void Log(const std::string &line) = 0;
};

// Writes to stderr, log lines are also sent to the log file
class ConsoleProgressOutput : public ProgressOutput {
 public:
  ConsoleProgressOutput() : m_flashed(false) {}

  void Flash(const std::string &line);
  void Log(const std::string &line);

 private:
  boost::mutex m_lock;
  bool m_flashed;
};

struct TransferState {
  enum Value {
    ACTIVE = 1 << 0,
    CLOSED = 1 << 1,
    COMPLETE = 1 << 2  // rate is frozen
  };
};

// Rate in 1000 based units, e.g. "12.5mbps"
std::string FormatRate(double bitsPerSecond);

// e.g. "[######...................] 24%", full when total is 0
std::string FormatProgressBar(int64_t transferred, int64_t total,
                              size_t width);

// First characters of name followed by "..." if name is longer
std::string ShortenName(const std::string &name, size_t length);

// --------------------------------------------------------------------------
//
// TransferRecord
//
// Byte accounting of one transfer. Counters are updated by the transfer
// thread and read by the display thread.
//
class TransferRecord : private boost::noncopyable {
 public:
  TransferRecord(const std::string &name, int64_t totalSize,
                 const boost::shared_ptr<ProgressOutput> &output);

 public:
  // Count bytes moved
  void AddTransferred(int64_t bytes);

  // Transfer starts at offset, e.g. a resumed upload, bytes before offset
  // are not taken into account for rate
  void SetOffset(int64_t offset);

  // Move transferred counter forward to position, it never moves back
  void UpdatePosition(int64_t position);

  // Log the final status line once and close the record
  void Finish();

  // Status line
  //
  // @param  : final, use the full name instead of the short one
  // @return : "[name] rate bar (transferred/total)"
  std::string GetStatusLine(bool final);

  std::string GetRate();
  std::string GetProgressBar() const;

  bool IsClosed() const { return m_state.Has(TransferState::CLOSED); }
  bool IsActive() const { return m_state.Has(TransferState::ACTIVE); }
  const std::string &GetName() const { return m_name; }
  const std::string &GetShortName() const { return m_shortName; }
  int64_t GetTotalSize() const { return m_totalSize; }
  int64_t GetTransferred() const { return m_transferred.load(); }
  int64_t GetOffset() const { return m_offset.load(); }

 private:
  std::string m_name;
  std::string m_shortName;
  int64_t m_totalSize;  // -1 if unknown
  boost::atomic<int64_t> m_transferred;
  boost::atomic<int64_t> m_offset;
  BitFlag<TransferState> m_state;
  boost::chrono::steady_clock::time_point m_startTime;
  boost::mutex m_rateLock;
  std::string m_rate;  // last rate, guarded by m_rateLock
  boost::shared_ptr<ProgressOutput> m_output;
};

// --------------------------------------------------------------------------
//
// TransferMonitor
//
// Registry of transfers with a display thread. The thread is started by
// the first registration and exits once every record is closed.
//
class TransferMonitor : private boost::noncopyable {
 public:
  // @param  : output sink (console if null), tick in milliseconds (default
  //           if 0)
  explicit TransferMonitor(
      const boost::shared_ptr<ProgressOutput> &output =
          boost::shared_ptr<ProgressOutput>(),
      uint32_t displayInterval = 0);

  ~TransferMonitor();

 public:
  // Add a transfer
  //
  // @param  : name, total size (-1 if unknown)
  // @return : record to account bytes with
  boost::shared_ptr<TransferRecord> Register(const std::string &name,
                                             int64_t totalSize);

  size_t GetRecordCount() const;
  bool IsDisplaying() const;
  const boost::shared_ptr<ProgressOutput> &GetOutput() const {
    return m_output;
  }

 private:
  void DisplayLoop();

 private:
  boost::shared_ptr<ProgressOutput> m_output;
  uint32_t m_displayInterval;  // in milliseconds

  mutable boost::shared_mutex m_lock;
  std::vector<boost::shared_ptr<TransferRecord> > m_records;
  bool m_displaying;
  bool m_stop;
  boost::thread m_thread;
};

}  // namespace Client
}  // namespace KW

#endif  // KWCLIENT_CLIENT_TRANSFERMONITOR_H_
