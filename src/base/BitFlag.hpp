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

#ifndef KWCLIENT_BASE_BITFLAG_HPP_
#define KWCLIENT_BASE_BITFLAG_HPP_

#include <stdint.h>

#include "boost/atomic.hpp"

namespace KW {

//
// BitFlag
//
// A set of flags drawn from FLAG_TYPE::Value, stored in one atomic word.
// FLAG_TYPE is the usual "struct X { enum Value {...}; };" whose values
// are distinct powers of two.
//
template <typename FLAG_TYPE>
class BitFlag {
 public:
  typedef typename FLAG_TYPE::Value Value;

  BitFlag() : m_bits(0) {}
  explicit BitFlag(uint32_t bits) : m_bits(bits) {}
  BitFlag(const BitFlag &rhs) : m_bits(rhs.m_bits.load()) {}

  BitFlag &operator=(const BitFlag &rhs) {
    if (&rhs != this) {
      m_bits.store(rhs.m_bits.load());
    }
    return *this;
  }

 public:
  bool Has(Value flag) const {
    uint32_t f = static_cast<uint32_t>(flag);
    return (m_bits.load() & f) == f;
  }
  // true if any bit of mask is set
  bool HasAny(uint32_t mask) const { return (m_bits.load() & mask) != 0; }
  bool IsEmpty() const { return m_bits.load() == 0; }
  uint32_t GetBits() const { return m_bits.load(); }

  void Set(Value flag) { m_bits.fetch_or(static_cast<uint32_t>(flag)); }
  void Merge(const BitFlag &rhs) { m_bits.fetch_or(rhs.GetBits()); }
  void Unset(Value flag) { m_bits.fetch_and(~static_cast<uint32_t>(flag)); }

 private:
  boost::atomic<uint32_t> m_bits;
};

}  // namespace KW

#endif  // KWCLIENT_BASE_BITFLAG_HPP_
