/*
 * Copyright (c) 2014-2015, Hewlett-Packard Development Company, LP.
 * This program is free software; you can redistribute it and/or modify it
 * under the terms of the GNU General Public License as published by the Free
 * Software Foundation; either version 2 of the License, or (at your option)
 * any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT
 * ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 * FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for
 * more details. You should have received a copy of the GNU General Public
 * License along with this program; if not, write to the Free Software
 * Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA 02111-1307 USA
 *
 * HP designates this particular file as subject to the "Classpath" exception
 * as provided by HP in the LICENSE.txt file that accompanied this code.
 */
#include "cloudfn/soc/command_ring.hpp"

#include <cstring>
#include <string>

#include "cloudfn/assert_nd.hpp"
#include "cloudfn/assorted/assorted_func.hpp"

namespace cloudfn {
namespace soc {

uint64_t CommandRing::calculate_size(uint32_t capacity) {
  // keep the following region 8-byte aligned
  uint64_t size = sizeof(CommandRing) + capacity;
  return ((size + 7ULL) / 8ULL) * 8ULL;
}

void CommandRing::initialize(uint32_t capacity) {
  ASSERT_ND(capacity > kLengthPrefixSize);
  mutex_.initialize();
  pushed_.initialize();
  popped_.initialize();
  capacity_ = capacity;
  read_pos_ = 0;
  write_pos_ = 0;
  message_count_ = 0;
  closed_ = false;
}

void CommandRing::copy_in(uint64_t pos, const char* src, uint32_t len) {
  uint32_t offset = static_cast<uint32_t>(pos % capacity_);
  uint32_t first = capacity_ - offset;
  if (first >= len) {
    std::memcpy(data() + offset, src, len);
  } else {
    std::memcpy(data() + offset, src, first);
    std::memcpy(data(), src + first, len - first);
  }
}

void CommandRing::copy_out(uint64_t pos, char* dest, uint32_t len) {
  uint32_t offset = static_cast<uint32_t>(pos % capacity_);
  uint32_t first = capacity_ - offset;
  if (first >= len) {
    std::memcpy(dest, data() + offset, len);
  } else {
    std::memcpy(dest, data() + offset, first);
    std::memcpy(dest + first, data(), len - first);
  }
}

ErrorCode CommandRing::push(const std::string& message, uint64_t timeout_microsec) {
  if (message.size() > get_max_message_size()) {
    return kErrorCodeChannelMessageTooLarge;
  }
  const uint32_t len = static_cast<uint32_t>(message.size());
  const uint64_t required = kLengthPrefixSize + len;
  const uint64_t deadline = timeout_microsec ? assorted::get_now_microsec() + timeout_microsec : 0;
  while (true) {
    uint64_t ticket;
    {
      SharedMutexScope scope(&mutex_);
      if (closed_) {
        return kErrorCodeChannelClosed;
      }
      const uint64_t used = write_pos_ - read_pos_;
      if (capacity_ - used >= required) {
        char prefix[kLengthPrefixSize];
        std::memcpy(prefix, &len, kLengthPrefixSize);
        copy_in(write_pos_, prefix, kLengthPrefixSize);
        copy_in(write_pos_ + kLengthPrefixSize, message.data(), len);
        write_pos_ += required;
        ++message_count_;
        scope.unlock();
        pushed_.signal();
        return kErrorCodeOk;
      }
      // taken while the lock is held, so a pop after our check always satisfies it
      ticket = popped_.acquire_ticket();
    }
    if (deadline == 0) {
      popped_.wait(ticket, kDefaultPollingSpins, kMaxPollingIntervalUs);
    } else {
      uint64_t now = assorted::get_now_microsec();
      if (now >= deadline) {
        return kErrorCodeTimeout;
      }
      popped_.timedwait(ticket, deadline - now, kDefaultPollingSpins, kMaxPollingIntervalUs);
    }
  }
}

ErrorCode CommandRing::pop(std::string* message, uint64_t timeout_microsec) {
  const uint64_t deadline = timeout_microsec ? assorted::get_now_microsec() + timeout_microsec : 0;
  while (true) {
    uint64_t ticket;
    {
      SharedMutexScope scope(&mutex_);
      if (message_count_ > 0) {
        uint32_t len;
        char prefix[kLengthPrefixSize];
        copy_out(read_pos_, prefix, kLengthPrefixSize);
        std::memcpy(&len, prefix, kLengthPrefixSize);
        ASSERT_ND(len <= get_max_message_size());
        message->resize(len);
        if (len > 0) {
          copy_out(read_pos_ + kLengthPrefixSize, &(*message)[0], len);
        }
        read_pos_ += kLengthPrefixSize + len;
        --message_count_;
        scope.unlock();
        popped_.signal();
        return kErrorCodeOk;
      }
      if (closed_) {
        return kErrorCodeChannelClosed;
      }
      ticket = pushed_.acquire_ticket();
    }
    if (deadline == 0) {
      pushed_.wait(ticket, kDefaultPollingSpins, kMaxPollingIntervalUs);
    } else {
      uint64_t now = assorted::get_now_microsec();
      if (now >= deadline) {
        return kErrorCodeTimeout;
      }
      pushed_.timedwait(ticket, deadline - now, kDefaultPollingSpins, kMaxPollingIntervalUs);
    }
  }
}

void CommandRing::close() {
  {
    SharedMutexScope scope(&mutex_);
    closed_ = true;
  }
  pushed_.signal();
  popped_.signal();
}

bool CommandRing::is_closed() const {
  SharedMutexScope scope(const_cast<SharedMutex*>(&mutex_));
  return closed_;
}

uint32_t CommandRing::get_message_count() const {
  SharedMutexScope scope(const_cast<SharedMutex*>(&mutex_));
  return message_count_;
}

}  // namespace soc
}  // namespace cloudfn
