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
#include "cloudfn/thread/bounded_thread_pool_impl.hpp"

#include <glog/logging.h>

#include <deque>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace cloudfn {
namespace thread {

void PoolJob::run() {
  result_ = functor_();
  functor_ = Functor();  // release captured resources before waking up the waiter
  done_.signal();
}

void PoolJob::abandon(const ErrorStack& reason) {
  result_ = reason;
  functor_ = Functor();
  done_.signal();
}

BoundedThreadPool::BoundedThreadPool(const std::string& name, uint32_t thread_count)
  : name_(name),
    thread_count_(thread_count == 0 ? 1U : thread_count),
    stop_requested_(false),
    stopped_(false),
    submitted_count_(0),
    completed_count_(0) {
  for (uint32_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&BoundedThreadPool::handle_thread, this, i);
  }
  LOG(INFO) << "Thread pool " << name_ << " started with " << thread_count_ << " threads";
}

std::shared_ptr<PoolJob> BoundedThreadPool::submit(const PoolJob::Functor& functor) {
  std::shared_ptr<PoolJob> job(new PoolJob(functor));
  bool accepted = false;
  queue_cond_.notify_one([this, &job, &accepted]{
    if (!stop_requested_) {
      queue_.push_back(job);
      accepted = true;
    }
  });
  if (!accepted) {
    LOG(WARNING) << "Thread pool " << name_ << " is stopped. Rejected a job";
    return std::shared_ptr<PoolJob>();
  }
  ++submitted_count_;
  return job;
}

uint32_t BoundedThreadPool::get_queued_count() {
  uint32_t count = 0;
  queue_cond_.locked([this, &count]{ count = queue_.size(); });
  return count;
}

void BoundedThreadPool::handle_thread(uint32_t ordinal) {
  VLOG(1) << name_ << "-" << ordinal << " started";
  while (true) {
    std::shared_ptr<PoolJob> job;
    queue_cond_.wait([this, &job]{
      if (stop_requested_) {
        return true;
      }
      if (queue_.empty()) {
        return false;
      }
      job = queue_.front();
      queue_.pop_front();
      return true;
    });
    if (!job) {
      break;  // stop requested
    }
    job->run();
    ++completed_count_;
  }
  VLOG(1) << name_ << "-" << ordinal << " exits";
}

void BoundedThreadPool::stop() {
  if (stopped_) {
    return;
  }
  LOG(INFO) << "Stopping thread pool " << name_ << "...";
  std::deque< std::shared_ptr<PoolJob> > abandoned;
  queue_cond_.notify_all([this, &abandoned]{
    stop_requested_ = true;
    abandoned.swap(queue_);
  });
  for (std::thread& t : threads_) {
    if (t.joinable()) {
      t.join();
    }
  }
  threads_.clear();
  for (const std::shared_ptr<PoolJob>& job : abandoned) {
    job->abandon(ERROR_STACK_MSG(kErrorCodeWorkerPoolStopped, name_.c_str()));
  }
  if (!abandoned.empty()) {
    LOG(WARNING) << "Thread pool " << name_ << " abandoned " << abandoned.size() << " jobs";
  }
  stopped_ = true;
  LOG(INFO) << "Stopped thread pool " << name_;
}

}  // namespace thread
}  // namespace cloudfn
