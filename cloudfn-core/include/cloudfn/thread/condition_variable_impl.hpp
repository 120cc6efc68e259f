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
#ifndef CLOUDFN_THREAD_CONDITION_VARIABLE_IMPL_HPP_
#define CLOUDFN_THREAD_CONDITION_VARIABLE_IMPL_HPP_

#include <stdint.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

#include "cloudfn/assert_nd.hpp"
#include "cloudfn/assorted/assorted_func.hpp"

namespace cloudfn {
namespace thread {
/**
 * @brief A std::condition_variable paired with its mutex and waiter/notifier accounting.
 * @ingroup THREAD
 * @details
 * The signal actions passed to notify_xxx() run inside the critical section, which rules out
 * lost signals without the caller touching the mutex. The destructor waits for in-flight
 * notifiers, so a waiter may destroy the object right after it wakes up.
 *
 * As this depends on C++11, the name of this file ends with impl. Thus, only private implementation
 * classes directly use this class.
 *
 * This class is totally header-only.
 */
class ConditionVariable final {
 public:
  ConditionVariable() : waiters_(0), notifiers_(0) {}
  ~ConditionVariable() {
    ASSERT_ND(waiters_ == 0);
    // we must wait until all notifiers exit notify_all.
    // this assumes no new notifiers are newly coming in this situation.
    while (notifiers_ > 0) {
      assorted::spinlock_yield();
    }
  }

  // not copyable, assignable.
  ConditionVariable(const ConditionVariable &other) = delete;
  ConditionVariable& operator=(const ConditionVariable &other) = delete;
  ConditionVariable(ConditionVariable &&other) = delete;
  ConditionVariable& operator=(ConditionVariable &&other) = delete;

  /**
   * @brief Block until the event happens.
   * @details
   * Equivalent to std::condition_variable::wait().
   */
  template<typename PREDICATE>
  void wait(PREDICATE predicate) {
    WaiterScope scope(this);
    condition_.wait(scope.lock_, predicate);
  }

  /**
   * @brief Block until the event happens \b or the given period elapses.
   * @return whether the event happened by now.
   */
  template<class REP, class PERIOD, typename PREDICATE>
  bool wait_for(const std::chrono::duration<REP, PERIOD>& timeout, PREDICATE predicate) {
    WaiterScope scope(this);
    return condition_.wait_for(scope.lock_, timeout, predicate);
  }

  /**
   * @brief Block until the event happens \b or the given time point arrives.
   * @return whether the event happened by now.
   */
  template< class CLOCK, class DURATION, typename PREDICATE>
  bool wait_until(const std::chrono::time_point<CLOCK, DURATION>& until, PREDICATE predicate) {
    WaiterScope scope(this);
    return condition_.wait_until(scope.lock_, until, predicate);
  }

  /**
   * @brief Notify all waiters that the event has happened.
   * @param[in] signal_action Functor to update actual values that changes the condition variable
   * to signaling state. This will be executed in critical section to avoid lost signal and
   * spurious wakeup.
   */
  template<typename SIGNAL_ACTION>
  void notify_all(SIGNAL_ACTION signal_action) {
    NotifierScope scope(this);
    {
      std::lock_guard<std::mutex> guard(mutex_);
      signal_action();  // conduct the action to update actual values *in* critical section
    }
    condition_.notify_all();
  }

  /**
   * @brief Notify one waiter that the event has happened.
   * @param[in] signal_action Functor to update actual values that changes the condition variable
   * to signaling state. This will be executed in critical section.
   */
  template<typename SIGNAL_ACTION>
  void notify_one(SIGNAL_ACTION signal_action) {
    NotifierScope scope(this);
    {
      std::lock_guard<std::mutex> guard(mutex_);
      signal_action();
    }
    if (waiters_ > 0) {
      condition_.notify_one();
    }
  }

  /** Runs the given functor in the critical section without notifying anyone. */
  template<typename ACTION>
  void locked(ACTION action) {
    std::lock_guard<std::mutex> guard(mutex_);
    action();
  }

 private:
  /** used to notify waiters to wakeup. */
  std::condition_variable         condition_;
  /**
   * Protects the condition variable and read/write of actual values.
   * The actual values (wait condition) must be atomically read/written to avoid spurrious
   * wakeup \b and lost signals.
   */
  std::mutex                      mutex_;
  /** Number of waitors. */
  std::atomic<uint32_t>           waiters_;
  /** Number of notifiers, used to safely destruct this object. */
  std::atomic<uint32_t>           notifiers_;

  /** automatically increments/decrements waiter count and does sanity check. */
  struct WaiterScope {
    explicit WaiterScope(ConditionVariable* enclosure)
      : enclosure_(enclosure), lock_(enclosure_->mutex_) {
      ASSERT_ND(lock_.owns_lock());
      ++enclosure_->waiters_;
    }
    ~WaiterScope() {
      ASSERT_ND(lock_.owns_lock());
      ASSERT_ND(enclosure_->waiters_ > 0);
      --enclosure_->waiters_;
    }
    ConditionVariable* const enclosure_;
    std::unique_lock<std::mutex> lock_;
  };
  /** same for notifier. */
  struct NotifierScope {
    explicit NotifierScope(ConditionVariable* enclosure) : enclosure_(enclosure) {
      ++enclosure_->notifiers_;
    }
    ~NotifierScope() {
      ASSERT_ND(enclosure_->notifiers_ > 0);
      --enclosure_->notifiers_;
    }
    ConditionVariable* const enclosure_;
  };
};

}  // namespace thread
}  // namespace cloudfn
#endif  // CLOUDFN_THREAD_CONDITION_VARIABLE_IMPL_HPP_
