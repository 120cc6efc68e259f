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
#include "cloudfn/soc/channel_block.hpp"

#include <new>
#include <string>

namespace cloudfn {
namespace soc {

uint64_t ChannelBlock::header_size() {
  return ((sizeof(ChannelBlock) + 7ULL) / 8ULL) * 8ULL;
}

uint64_t ChannelBlock::calculate_size(uint32_t ring_capacity) {
  return header_size() + CommandRing::calculate_size(ring_capacity) * 2ULL;
}

ChannelBlock* ChannelBlock::construct(char* memory, uint32_t ring_capacity) {
  ChannelBlock* block = new (memory) ChannelBlock();
  block->ring_capacity_ = ring_capacity;
  block->ring_size_ = CommandRing::calculate_size(ring_capacity);
  CommandRing* request = new (memory + header_size()) CommandRing();
  request->initialize(ring_capacity);
  CommandRing* response = new (memory + header_size() + block->ring_size_) CommandRing();
  response->initialize(ring_capacity);
  return block;
}

CommandRing* ChannelBlock::get_request_ring() {
  return reinterpret_cast<CommandRing*>(reinterpret_cast<char*>(this) + header_size());
}

CommandRing* ChannelBlock::get_response_ring() {
  return reinterpret_cast<CommandRing*>(
    reinterpret_cast<char*>(this) + header_size() + ring_size_);
}

ErrorCode ChannelBlock::send_request(const ChannelMessage& message, uint64_t timeout_microsec) {
  return get_request_ring()->push(message.encode(), timeout_microsec);
}

ErrorCode ChannelBlock::receive_request(ChannelMessage* message, uint64_t timeout_microsec) {
  std::string bytes;
  CHECK_ERROR_CODE(get_request_ring()->pop(&bytes, timeout_microsec));
  return ChannelMessage::decode(bytes, message);
}

ErrorCode ChannelBlock::send_response(const ChannelMessage& message, uint64_t timeout_microsec) {
  return get_response_ring()->push(message.encode(), timeout_microsec);
}

ErrorCode ChannelBlock::receive_response(ChannelMessage* message, uint64_t timeout_microsec) {
  std::string bytes;
  CHECK_ERROR_CODE(get_response_ring()->pop(&bytes, timeout_microsec));
  return ChannelMessage::decode(bytes, message);
}

void ChannelBlock::close() {
  get_request_ring()->close();
  get_response_ring()->close();
}

bool ChannelBlock::is_closed() {
  return get_request_ring()->is_closed();
}

}  // namespace soc
}  // namespace cloudfn
