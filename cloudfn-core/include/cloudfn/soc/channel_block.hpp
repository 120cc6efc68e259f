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
#ifndef CLOUDFN_SOC_CHANNEL_BLOCK_HPP_
#define CLOUDFN_SOC_CHANNEL_BLOCK_HPP_

#include <stdint.h>

#include "cloudfn/cxx11.hpp"
#include "cloudfn/error_code.hpp"
#include "cloudfn/soc/channel_message.hpp"
#include "cloudfn/soc/command_ring.hpp"
#include "cloudfn/soc/shared_rendezvous.hpp"

namespace cloudfn {
namespace soc {
/**
 * @brief The command channel and readiness signal of one worker, placed in shared memory.
 * @ingroup SOC
 * @details
 * Memory layout: this header, then the request ring (control plane to worker), then the
 * response ring (worker to control plane). Both rings have the same capacity.
 * Construct with construct() on a zero-cleared region of calculate_size() bytes, which is
 * usually a memory::SharedMemory allocated before forking the worker.
 *
 * Each ring has exactly one consumer: the worker pops requests, the control plane pops
 * responses. Messages are processed strictly in push order.
 */
class ChannelBlock CXX11_FINAL {
 public:
  /** Byte size of a region that holds a channel with the given ring capacity. */
  static uint64_t       calculate_size(uint32_t ring_capacity);
  /** Placement-constructs and initializes a channel on the given region. */
  static ChannelBlock*  construct(char* memory, uint32_t ring_capacity);

  SharedRendezvous*     get_ready() { return &ready_; }
  CommandRing*          get_request_ring();
  CommandRing*          get_response_ring();

  /** Encodes and pushes a request. */
  ErrorCode send_request(const ChannelMessage& message, uint64_t timeout_microsec = 0);
  /** Pops and decodes a request. */
  ErrorCode receive_request(ChannelMessage* message, uint64_t timeout_microsec = 0);
  /** Encodes and pushes a response. */
  ErrorCode send_response(const ChannelMessage& message, uint64_t timeout_microsec = 0);
  /** Pops and decodes a response. */
  ErrorCode receive_response(ChannelMessage* message, uint64_t timeout_microsec = 0);

  /** Closes both rings. Blocked senders/receivers return kErrorCodeChannelClosed. */
  void      close();
  bool      is_closed();

  uint32_t  get_ring_capacity() const { return ring_capacity_; }

 private:
  ChannelBlock() : ring_capacity_(0), ring_size_(0) {}
  ~ChannelBlock() {}
  ChannelBlock(const ChannelBlock&) CXX11_FUNC_DELETE;
  ChannelBlock& operator=(const ChannelBlock&) CXX11_FUNC_DELETE;

  SharedRendezvous  ready_;
  uint32_t          ring_capacity_;
  /** CommandRing::calculate_size(ring_capacity_) */
  uint64_t          ring_size_;

  static uint64_t   header_size();
};

}  // namespace soc
}  // namespace cloudfn
#endif  // CLOUDFN_SOC_CHANNEL_BLOCK_HPP_
