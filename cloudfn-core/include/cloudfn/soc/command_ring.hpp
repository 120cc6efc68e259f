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
#ifndef CLOUDFN_SOC_COMMAND_RING_HPP_
#define CLOUDFN_SOC_COMMAND_RING_HPP_

#include <stdint.h>

#include <string>

#include "cloudfn/cxx11.hpp"
#include "cloudfn/error_code.hpp"
#include "cloudfn/soc/shared_mutex.hpp"
#include "cloudfn/soc/shared_polling.hpp"

namespace cloudfn {
namespace soc {
/**
 * @brief A bounded, ordered, single-consumer FIFO of length-prefixed messages placed in
 * shared memory.
 * @ingroup SOC
 * @details
 * The ring header is followed by capacity bytes of data in the same memory region, so an
 * instance must be constructed by placement-new on a region of calculate_size() bytes and
 * then initialize()-d. See ChannelBlock.
 *
 * Each message is a 4-byte length followed by the bytes, wrapping around the end of the
 * data area. push() blocks while there is not enough free space (backpressure), pop()
 * blocks until a message arrives. Both accept a timeout so that the caller can re-check
 * the liveness of the other side.
 */
class CommandRing CXX11_FINAL {
 public:
  /** Byte size of the length prefix of each message. */
  static const uint32_t kLengthPrefixSize = 4U;
  /** Polling sleeps of push/pop never exceed this, in microseconds. */
  static const uint64_t kMaxPollingIntervalUs = 1000ULL;

  CommandRing() : capacity_(0), read_pos_(0), write_pos_(0), message_count_(0), closed_(false) {}

  // Disable copy constructors
  CommandRing(const CommandRing&) CXX11_FUNC_DELETE;
  CommandRing& operator=(const CommandRing&) CXX11_FUNC_DELETE;

  /** Byte size of a region that holds a ring of the given data capacity. */
  static uint64_t calculate_size(uint32_t capacity);

  /** Resets the ring to an empty one with the given data capacity. */
  void        initialize(uint32_t capacity);

  /**
   * @brief Appends one message.
   * @param[in] message bytes to append
   * @param[in] timeout_microsec gives up after this period while the ring is full. 0 means
   * wait forever.
   * @return kErrorCodeOk, kErrorCodeTimeout, kErrorCodeChannelClosed, or
   * kErrorCodeChannelMessageTooLarge if the message could never fit in this ring.
   */
  ErrorCode   push(const std::string& message, uint64_t timeout_microsec = 0);

  /**
   * @brief Takes the oldest message.
   * @param[out] message receives the message bytes
   * @param[in] timeout_microsec gives up after this period while the ring is empty. 0 means
   * wait forever.
   * @return kErrorCodeOk, kErrorCodeTimeout, or kErrorCodeChannelClosed when the ring is
   * closed \e and empty.
   */
  ErrorCode   pop(std::string* message, uint64_t timeout_microsec = 0);

  /** Closes the ring. Remaining messages can be still popped. Wakes up all waiters. */
  void        close();
  bool        is_closed() const;

  /** Number of messages currently in the ring. */
  uint32_t    get_message_count() const;
  uint32_t    get_capacity() const { return capacity_; }
  /** Largest message this ring can hold. */
  uint32_t    get_max_message_size() const { return capacity_ - kLengthPrefixSize; }

 private:
  SharedMutex     mutex_;
  /** Signalled whenever a message is pushed or the ring is closed. */
  SharedPolling   pushed_;
  /** Signalled whenever a message is popped or the ring is closed. */
  SharedPolling   popped_;
  uint32_t        capacity_;
  /** Monotonically increasing byte positions. The offset in data is pos % capacity_. */
  uint64_t        read_pos_;
  uint64_t        write_pos_;
  uint32_t        message_count_;
  bool            closed_;

  char*       data() { return reinterpret_cast<char*>(this) + sizeof(CommandRing); }
  void        copy_in(uint64_t pos, const char* src, uint32_t len);
  void        copy_out(uint64_t pos, char* dest, uint32_t len);
};

}  // namespace soc
}  // namespace cloudfn
#endif  // CLOUDFN_SOC_COMMAND_RING_HPP_
