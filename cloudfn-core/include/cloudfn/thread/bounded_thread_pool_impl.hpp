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
#ifndef CLOUDFN_THREAD_BOUNDED_THREAD_POOL_IMPL_HPP_
#define CLOUDFN_THREAD_BOUNDED_THREAD_POOL_IMPL_HPP_

#include <stdint.h>

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "cloudfn/error_stack.hpp"
#include "cloudfn/thread/condition_variable_impl.hpp"
#include "cloudfn/thread/rendezvous_impl.hpp"

namespace cloudfn {
namespace thread {
/**
 * @brief One job submitted to a BoundedThreadPool.
 * @ingroup THREAD
 * @details
 * This object works as a \e future to synchronously wait for the completion of the functor.
 * Both the pool and the submitter hold it via shared_ptr, so either side may go away first.
 */
class PoolJob final {
 public:
  typedef std::function<ErrorStack()> Functor;

  explicit PoolJob(const Functor& functor) : functor_(functor) {}

  PoolJob(const PoolJob &other) = delete;
  PoolJob& operator=(const PoolJob &other) = delete;

  /** Blocks until the completion of the job. */
  void        wait() { done_.wait(); }
  /** Blocks until the completion of the job or the timeout. @return whether it completed. */
  template<class REP, class PERIOD>
  bool        wait_for(const std::chrono::duration<REP, PERIOD>& timeout) {
    return done_.wait_for(timeout);
  }
  bool        is_done() const { return done_.is_signaled(); }

  /**
   * @brief Waits until the completion of the job and retrieves the result.
   * @details
   * The result carries its custom message only once. Call this once per job.
   */
  ErrorStack  get_result() {
    wait();
    return result_;
  }

 private:
  friend class BoundedThreadPool;
  Functor       functor_;
  ErrorStack    result_;
  Rendezvous    done_;

  void run();
  void abandon(const ErrorStack& reason);
};

/**
 * @brief A fixed number of threads that run submitted jobs in FIFO order.
 * @ingroup THREAD
 * @details
 * Used by workers to run synchronous handlers without stalling their command loop, and by the
 * task manager to run background tasks. The number of threads bounds the concurrency; the
 * queue itself is not bounded.
 *
 * Jobs still queued when the pool stops are completed with kErrorCodeWorkerPoolStopped so that
 * nobody waits forever.
 * As this depends on C++11, the name of this file ends with impl.
 */
class BoundedThreadPool final {
 public:
  BoundedThreadPool(const std::string& name, uint32_t thread_count);
  ~BoundedThreadPool() { stop(); }

  BoundedThreadPool(const BoundedThreadPool &other) = delete;
  BoundedThreadPool& operator=(const BoundedThreadPool &other) = delete;

  /**
   * Queues the functor.
   * @return the job, or null if the pool has been already stopped.
   */
  std::shared_ptr<PoolJob> submit(const PoolJob::Functor& functor);

  /**
   * Stops accepting jobs, waits for the running ones, abandons the queued ones and joins
   * all threads. Idempotent.
   */
  void        stop();

  const std::string& get_name() const { return name_; }
  uint32_t    get_thread_count() const { return thread_count_; }
  /** Number of jobs accepted by submit() so far. */
  uint64_t    get_submitted_count() const { return submitted_count_; }
  /** Number of jobs that have finished running. */
  uint64_t    get_completed_count() const { return completed_count_; }
  /** Number of jobs waiting for a thread. */
  uint32_t    get_queued_count();
  bool        is_stopped() const { return stopped_; }

 private:
  const std::string                       name_;
  const uint32_t                          thread_count_;
  std::vector<std::thread>                threads_;
  std::deque< std::shared_ptr<PoolJob> >  queue_;
  ConditionVariable                       queue_cond_;
  std::atomic<bool>                       stop_requested_;
  std::atomic<bool>                       stopped_;
  std::atomic<uint64_t>                   submitted_count_;
  std::atomic<uint64_t>                   completed_count_;

  void        handle_thread(uint32_t ordinal);
};

}  // namespace thread
}  // namespace cloudfn
#endif  // CLOUDFN_THREAD_BOUNDED_THREAD_POOL_IMPL_HPP_
