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
#ifndef CLOUDFN_THREAD_RENDEZVOUS_IMPL_HPP_
#define CLOUDFN_THREAD_RENDEZVOUS_IMPL_HPP_

#include <atomic>
#include <chrono>

#include "cloudfn/assert_nd.hpp"
#include "cloudfn/thread/condition_variable_impl.hpp"

namespace cloudfn {
namespace thread {
/**
 * @brief The frequently appearing triplet of condition_varible, "signal" flag for spurious
 * wakeup, and mutex for a one-time single-producer multiple-consumer event synchronization.
 * @ingroup THREAD
 * @details
 * In-process counterpart of soc::SharedRendezvous.
 */
class Rendezvous final {
 public:
  Rendezvous() : signaled_(false) {}

  // not copyable, assignable.
  Rendezvous(const Rendezvous &other) = delete;
  Rendezvous& operator=(const Rendezvous &other) = delete;
  Rendezvous(Rendezvous &&other) = delete;
  Rendezvous& operator=(Rendezvous &&other) = delete;

  /** Block until the event happens. */
  void wait() {
    if (is_signaled()) {
      return;
    }
    condition_.wait([this]{ return is_signaled(); });
  }

  /**
   * @brief Block until the event happens \b or the given period elapses.
   * @return whether the event happened by now.
   */
  template<class REP, class PERIOD>
  bool wait_for(const std::chrono::duration<REP, PERIOD>& timeout) {
    if (is_signaled()) {
      return true;
    }
    return condition_.wait_for(timeout, [this]{ return is_signaled(); });
  }

  /**
   * @brief Notify all waiters that the event has happened.
   * @details
   * There must be only one thread that might call this method, and it should call this only once.
   */
  void signal() {
    ASSERT_ND(!is_signaled());
    condition_.notify_all([this]{ signaled_.store(true); });
    // we must not put ANYTHING after this because notified waiters might have already
    // deleted this object.
  }

  /** returns whether the even has signaled. */
  bool is_signaled() const {
    return signaled_.load();
  }

 private:
  /** used to notify waiters to wakeup. */
  ConditionVariable               condition_;
  /** whether the event has signaled. */
  std::atomic<bool>               signaled_;
};

}  // namespace thread
}  // namespace cloudfn
#endif  // CLOUDFN_THREAD_RENDEZVOUS_IMPL_HPP_
