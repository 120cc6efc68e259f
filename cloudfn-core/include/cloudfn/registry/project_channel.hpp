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
#ifndef CLOUDFN_REGISTRY_PROJECT_CHANNEL_HPP_
#define CLOUDFN_REGISTRY_PROJECT_CHANNEL_HPP_
#include <stdint.h>

#include <iosfwd>
#include <string>

#include "cloudfn/cxx11.hpp"
#include "cloudfn/error_stack.hpp"
#include "cloudfn/memory/shared_memory.hpp"
#include "cloudfn/soc/fwd.hpp"

namespace cloudfn {
namespace registry {
/**
 * @brief Owner of one command channel and its readiness signal.
 * @ingroup REGISTRY
 * @details
 * The channel is a soc::ChannelBlock constructed in a dedicated shared memory block.
 * The block is marked for release right after allocation, so the kernel reclaims it as soon
 * as the last process detaches, even when the control plane crashes.
 * Instances are shared via std::shared_ptr so that a thread blocked on the channel keeps it
 * alive while the registry drops its own reference.
 */
class ProjectChannel CXX11_FINAL {
 public:
  explicit ProjectChannel(const std::string& key);
  ~ProjectChannel();

  ProjectChannel() CXX11_FUNC_DELETE;
  ProjectChannel(const ProjectChannel&) CXX11_FUNC_DELETE;
  ProjectChannel& operator=(const ProjectChannel&) CXX11_FUNC_DELETE;

  /** Allocates the shared memory and constructs an empty, unsignaled channel in it. */
  ErrorStack          allocate(uint32_t ring_capacity);
  /**
   * Closes the channel so that blocked peers wake up.
   * The memory stays attached until the destructor runs, so a thread that still holds this
   * object can keep polling the closed channel.
   */
  void                release();
  /**
   * Detaches the memory without closing the channel.
   * Used in a forked worker for channels that belong to other workers.
   */
  void                detach();

  const std::string&  get_key() const { return key_; }
  soc::ChannelBlock*  get_block() const { return block_; }
  bool                is_null() const { return block_ == CXX11_NULLPTR; }
  bool                is_closed() const;
  /** Readiness signal of the worker attached to this channel. */
  bool                is_ready() const;
  bool                wait_ready(uint64_t timeout_ms) const;

  friend std::ostream& operator<<(std::ostream& o, const ProjectChannel& v);

 private:
  const std::string     key_;
  memory::SharedMemory  memory_;
  soc::ChannelBlock*    block_;
};

}  // namespace registry
}  // namespace cloudfn
#endif  // CLOUDFN_REGISTRY_PROJECT_CHANNEL_HPP_
