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

#include "client/TransferMonitor.h"

#include <stdint.h>
#include <stdio.h>

#include <algorithm>
#include <string>
#include <vector>

#include "boost/bind.hpp"
#include "boost/chrono/chrono.hpp"
#include "boost/exception/to_string.hpp"
#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/thread.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "configure/Default.h"

namespace KW {

namespace Client {

using boost::bind;
using boost::lock_guard;
using boost::shared_lock;
using boost::shared_mutex;
using boost::shared_ptr;
using boost::to_string;
using boost::unique_lock;
using KW::StringUtils::HumanSize;
using std::string;
using std::vector;

namespace {

const char *const RATE_UNITS[] = {"bps", "kbps", "mbps", "gbps"};
const size_t RATE_UNITS_COUNT = sizeof(RATE_UNITS) / sizeof(RATE_UNITS[0]);

bool IsClosedRecord(const shared_ptr<TransferRecord> &record) {
  return !record || record->IsClosed();
}

}  // namespace

// --------------------------------------------------------------------------
void ConsoleProgressOutput::Flash(const string &line) {
  lock_guard<boost::mutex> lock(m_lock);
  fprintf(stderr, "\r%s", line.c_str());
  fflush(stderr);
  m_flashed = true;
}

// --------------------------------------------------------------------------
void ConsoleProgressOutput::Log(const string &line) {
  {
    lock_guard<boost::mutex> lock(m_lock);
    fprintf(stderr, "%s%s\n", m_flashed ? "\r" : "", line.c_str());
    fflush(stderr);
    m_flashed = false;
  }
  // glog writes to stderr itself when there is no log directory
  if (!KW::Logging::Log::Instance().LogsToConsole()) {
    Info(line);
  }
}

// --------------------------------------------------------------------------
string FormatRate(double bitsPerSecond) {
  size_t unit = 0;
  while (bitsPerSecond >= 1000 && unit < RATE_UNITS_COUNT - 1) {
    bitsPerSecond /= 1000;
    ++unit;
  }
  if (bitsPerSecond <= 0) {
    return "0.0bps";
  }
  char buf[32];
  snprintf(buf, sizeof(buf), "%.1f%s", bitsPerSecond, RATE_UNITS[unit]);
  return buf;
}

// --------------------------------------------------------------------------
string FormatProgressBar(int64_t transferred, int64_t total, size_t width) {
  int percent = 100;
  if (total > 0) {
    percent = static_cast<int>(static_cast<double>(transferred) /
                               static_cast<double>(total) * 100);
    percent = std::max(0, std::min(percent, 100));
  }
  size_t filled = static_cast<size_t>(percent / 4);
  filled = std::min(filled, width);
  return "[" + string(filled, '#') + string(width - filled, '.') + "] " +
         to_string(percent) + "%";
}

// --------------------------------------------------------------------------
string ShortenName(const string &name, size_t length) {
  // count characters, not utf-8 continuation bytes
  size_t chars = 0;
  for (size_t i = 0; i < name.size(); ++i) {
    if ((static_cast<unsigned char>(name[i]) & 0xC0) == 0x80) {
      continue;
    }
    if (chars == length) {
      return name.substr(0, i) + "...";
    }
    ++chars;
  }
  return name;
}

// --------------------------------------------------------------------------
TransferRecord::TransferRecord(const string &name, int64_t totalSize,
                               const shared_ptr<ProgressOutput> &output)
    : m_name(name),
      m_shortName(ShortenName(
          name, KW::Configure::Default::GetTransferShortNameLength())),
      m_totalSize(totalSize),
      m_transferred(0),
      m_offset(0),
      m_state(TransferState::ACTIVE),
      m_startTime(boost::chrono::steady_clock::now()),
      m_rate("0.0bps"),
      m_output(output) {}

// --------------------------------------------------------------------------
void TransferRecord::AddTransferred(int64_t bytes) {
  if (bytes > 0) {
    m_transferred.fetch_add(bytes);
  }
}

// --------------------------------------------------------------------------
void TransferRecord::SetOffset(int64_t offset) {
  m_offset.store(offset);
  UpdatePosition(offset);
}

// --------------------------------------------------------------------------
void TransferRecord::UpdatePosition(int64_t position) {
  int64_t current = m_transferred.load();
  while (position > current &&
         !m_transferred.compare_exchange_weak(current, position)) {
  }
}

// --------------------------------------------------------------------------
void TransferRecord::Finish() {
  if (IsClosed()) {
    return;
  }
  string line = GetStatusLine(true);
  m_state.Unset(TransferState::ACTIVE);
  if (m_output) {
    m_output->Log(line);
  }
  m_state.Set(TransferState::CLOSED);
}

// --------------------------------------------------------------------------
string TransferRecord::GetStatusLine(bool final) {
  const string &name = final ? m_name : m_shortName;
  string rate = GetRate();
  if (m_totalSize < 0) {
    return "[" + name + "] " + rate + " (" +
           HumanSize(m_transferred.load()) + ")";
  }
  return "[" + name + "] " + rate + " " + GetProgressBar() + " (" +
         HumanSize(m_transferred.load()) + "/" + HumanSize(m_totalSize) + ")";
}

// --------------------------------------------------------------------------
string TransferRecord::GetRate() {
  lock_guard<boost::mutex> lock(m_rateLock);
  int64_t transferred = m_transferred.load();
  if (transferred == 0 || m_state.Has(TransferState::COMPLETE)) {
    return m_rate;
  }

  boost::chrono::duration<double> elapsed =
      boost::chrono::steady_clock::now() - m_startTime;
  double seconds = std::max(elapsed.count(), 0.1);
  m_rate = FormatRate(static_cast<double>(transferred - m_offset.load()) * 8 /
                      seconds);

  if (m_totalSize >= 0 && transferred >= m_totalSize) {
    m_state.Set(TransferState::COMPLETE);
  }
  return m_rate;
}

// --------------------------------------------------------------------------
string TransferRecord::GetProgressBar() const {
  return FormatProgressBar(m_transferred.load(), m_totalSize,
                           KW::Configure::Default::GetProgressBarWidth());
}

// --------------------------------------------------------------------------
TransferMonitor::TransferMonitor(const shared_ptr<ProgressOutput> &output,
                                 uint32_t displayInterval)
    : m_output(output),
      m_displayInterval(displayInterval),
      m_displaying(false),
      m_stop(false) {
  if (!m_output) {
    m_output = boost::make_shared<ConsoleProgressOutput>();
  }
  if (m_displayInterval == 0) {
    m_displayInterval = KW::Configure::Default::GetTransferDisplayInterval();
  }
}

// --------------------------------------------------------------------------
TransferMonitor::~TransferMonitor() {
  {
    lock_guard<shared_mutex> lock(m_lock);
    m_stop = true;
  }
  m_thread.interrupt();
  if (m_thread.joinable()) {
    m_thread.join();
  }
}

// --------------------------------------------------------------------------
shared_ptr<TransferRecord> TransferMonitor::Register(const string &name,
                                                     int64_t totalSize) {
  shared_ptr<TransferRecord> record =
      boost::make_shared<TransferRecord>(name, totalSize, m_output);

  lock_guard<shared_mutex> lock(m_lock);
  m_records.push_back(record);
  if (!m_displaying && !m_stop) {
    // previous display thread has left the loop already
    if (m_thread.joinable()) {
      m_thread.join();
    }
    m_displaying = true;
    m_thread = boost::thread(
        bind(boost::type<void>(), &TransferMonitor::DisplayLoop, this));
  }
  return record;
}

// --------------------------------------------------------------------------
size_t TransferMonitor::GetRecordCount() const {
  shared_lock<shared_mutex> lock(m_lock);
  return m_records.size();
}

// --------------------------------------------------------------------------
bool TransferMonitor::IsDisplaying() const {
  shared_lock<shared_mutex> lock(m_lock);
  return m_displaying;
}

// --------------------------------------------------------------------------
void TransferMonitor::DisplayLoop() {
  while (true) {
    vector<shared_ptr<TransferRecord> > records;
    {
      lock_guard<shared_mutex> lock(m_lock);
      m_records.erase(
          std::remove_if(m_records.begin(), m_records.end(), IsClosedRecord),
          m_records.end());
      if (m_stop || m_records.empty()) {
        m_displaying = false;
        return;
      }
      records = m_records;
    }

    for (vector<shared_ptr<TransferRecord> >::iterator it = records.begin();
         it != records.end(); ++it) {
      if ((*it)->IsActive()) {
        m_output->Flash((*it)->GetStatusLine(false));
      }
    }

    try {
      boost::this_thread::sleep_for(
          boost::chrono::milliseconds(m_displayInterval));
    } catch (const boost::thread_interrupted &) {
      lock_guard<shared_mutex> lock(m_lock);
      m_displaying = false;
      return;
    }
  }
}

}  // namespace Client
}  // namespace KW
