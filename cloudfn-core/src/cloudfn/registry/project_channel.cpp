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
#include "cloudfn/registry/project_channel.hpp"

#include <glog/logging.h>

#include <ostream>
#include <string>

#include "cloudfn/soc/channel_block.hpp"
#include "cloudfn/soc/shared_rendezvous.hpp"

namespace cloudfn {
namespace registry {

ProjectChannel::ProjectChannel(const std::string& key) : key_(key), block_(CXX11_NULLPTR) {
}

ProjectChannel::~ProjectChannel() {
  release();
  detach();
}

ErrorStack ProjectChannel::allocate(uint32_t ring_capacity) {
  ASSERT_ND(is_null());
  CHECK_ERROR(memory_.alloc(soc::ChannelBlock::calculate_size(ring_capacity)));
  block_ = soc::ChannelBlock::construct(memory_.get_block(), ring_capacity);
  VLOG(0) << "Allocated channel " << *this;
  return kRetOk;
}

void ProjectChannel::release() {
  if (block_ == CXX11_NULLPTR) {
    return;
  }
  block_->close();
}

void ProjectChannel::detach() {
  block_ = CXX11_NULLPTR;
  memory_.release_block();
}

bool ProjectChannel::is_closed() const {
  return block_ == CXX11_NULLPTR || block_->is_closed();
}

bool ProjectChannel::is_ready() const {
  return block_ != CXX11_NULLPTR && block_->get_ready()->is_signaled();
}

bool ProjectChannel::wait_ready(uint64_t timeout_ms) const {
  if (block_ == CXX11_NULLPTR) {
    return false;
  }
  return block_->get_ready()->wait_for(timeout_ms * 1000000ULL);
}

std::ostream& operator<<(std::ostream& o, const ProjectChannel& v) {
  o << "<ProjectChannel>"
    << "<key>" << v.key_ << "</key>"
    << "<ready>" << v.is_ready() << "</ready>"
    << "<closed>" << v.is_closed() << "</closed>"
    << v.memory_
    << "</ProjectChannel>";
  return o;
}

}  // namespace registry
}  // namespace cloudfn
