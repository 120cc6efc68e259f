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
#ifndef CLOUDFN_THREAD_STOPPABLE_THREAD_IMPL_HPP_
#define CLOUDFN_THREAD_STOPPABLE_THREAD_IMPL_HPP_

#include <atomic>
#include <chrono>
#include <functional>
#include <iosfwd>
#include <string>
#include <thread>

#include "cloudfn/thread/condition_variable_impl.hpp"

namespace cloudfn {
namespace thread {
/**
 * @brief The frequently appearing quartet of std::thread, condition_varible, stop-request flag,
 * and mutex.
 * @ingroup THREAD
 * @details
 * This quartet helps implement a thread that periodically does some job and also occasionally
 * checks if someone requested to stop this thread, such as the task sweeper and the scheduler.
 * As this depends on C++11, the name of this file ends with impl.
 */
class StoppableThread final {
 public:
  StoppableThread() : sleep_interval_(0),
    started_(false), stop_requested_(false), wakeup_requested_(false), stopped_(false) {}
  ~StoppableThread() { stop(); }

  // non-copyable assignable.
  StoppableThread(const StoppableThread &other) = delete;
  StoppableThread& operator=(const StoppableThread &other) = delete;
  StoppableThread(StoppableThread &&other) = delete;
  StoppableThread& operator=(StoppableThread &&other) = delete;

  /**
   * Sets up properties of this object and then starts a thread that runs the given handler.
   * The handler receives this object and should return when sleep() returns true.
   */
  void launch(const std::string &name, const std::chrono::microseconds &sleep_interval,
    const std::function<void(StoppableThread*)>& handler);

  /**
   * request_stop() plus wait_for_stop().
   * This method is idempotent. If the thread is not running already, this immediately returns.
   */
  void stop();
  /**
   * If the thread is still running, requests the thread to stop.
   * Unlike stop(), this method doesn't join the thread. So, it immediately returns.
   */
  void request_stop();
  /**
   * Blocks until the thread stops. If the thread is not running anyways, this does nothing.
   */
  void wait_for_stop();
  /**
   * If the thread is still running and also sleeping, requests the thread to immediately wakeup
   * and do its job. If the thread is not running or not sleeping, has no effect.
   */
  void wakeup();

  /**
   * Sleep until the interval elapses or someone requests to stop this thread.
   * @return whether someone has requested to stop this thread.
   * @details
   * For example, use it as follows.
   * @code{.cpp}
   * void my_thread_handler(StoppableThread* me) {
   *   while (!me->sleep()) {
   *     // some stuff
   *   }
   * }
   * @endcode
   */
  bool sleep();
  /** Same as sleep(), but up to the given period rather than the default interval. */
  bool sleep_for(const std::chrono::microseconds &interval);

  /** returns whether someone has requested to stop this. */
  bool is_stop_requested() const { return stop_requested_; }
  /** returns whether this thread has stopped (if the thread hasn't started, false too). */
  bool is_stopped() const { return stopped_; }
  const std::string& get_name() const { return name_; }

  std::string             to_string() const;
  friend std::ostream&    operator<<(std::ostream& o, const StoppableThread& v);

 private:
  /** Used only for debug logging. */
  std::string                     name_;
  /** Actual thread object. */
  std::thread                     thread_;
  /** How long do we sleep at most for each sleep() call. */
  std::chrono::microseconds       sleep_interval_;
  /** used to notify the thread to wakeup. */
  ConditionVariable               condition_;
  /** whether this thread has started. */
  std::atomic<bool>               started_;
  /** whether someone has requested to stop this. */
  std::atomic<bool>               stop_requested_;
  /** whether someone has requested to wake up this. reset after each sleep. */
  std::atomic<bool>               wakeup_requested_;
  /** whether this thread has stopped (if the thread hasn't started, false too). */
  std::atomic<bool>               stopped_;
};

}  // namespace thread
}  // namespace cloudfn
#endif  // CLOUDFN_THREAD_STOPPABLE_THREAD_IMPL_HPP_
