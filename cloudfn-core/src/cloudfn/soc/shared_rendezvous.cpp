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
#include "cloudfn/soc/shared_rendezvous.hpp"

#include "cloudfn/assert_nd.hpp"
#include "cloudfn/assorted/atomic_fences.hpp"

namespace cloudfn {
namespace soc {

void SharedRendezvous::initialize() {
  uninitialize();
  signaled_ = false;
  initialized_ = true;
  cond_.initialize();
}

void SharedRendezvous::uninitialize() {
  if (!is_initialized()) {
    return;
  }
  initialized_ = false;
}

void SharedRendezvous::wait() {
  if (is_signaled_weak()) {  // just an optimization.
    return;
  }

  uint64_t demand = cond_.acquire_ticket();
  if (is_signaled()) {
    return;
  }
  cond_.wait(demand);
  ASSERT_ND(is_signaled());
}

bool SharedRendezvous::wait_for(uint64_t timeout_nanosec) {
  if (is_signaled_weak()) {  // just an optimization.
    return true;
  }

  uint64_t demand = cond_.acquire_ticket();
  if (is_signaled()) {
    return true;
  }
  bool received = cond_.timedwait(demand, timeout_nanosec / 1000ULL);
  ASSERT_ND(!received || is_signaled());
  UNUSED_ND(received);
  return is_signaled();
}

void SharedRendezvous::signal() {
  assorted::memory_fence_release();
  signaled_ = true;
  cond_.signal();
}

}  // namespace soc
}  // namespace cloudfn
