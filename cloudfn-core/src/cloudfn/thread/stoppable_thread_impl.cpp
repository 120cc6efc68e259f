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
#include "cloudfn/thread/stoppable_thread_impl.hpp"

#include <glog/logging.h>

#include <chrono>
#include <ostream>
#include <sstream>
#include <string>
#include <thread>

namespace cloudfn {
namespace thread {

void StoppableThread::launch(const std::string& name,
  const std::chrono::microseconds &sleep_interval,
  const std::function<void(StoppableThread*)>& handler) {
  name_ = name;
  sleep_interval_ = sleep_interval;
  stop_requested_ = false;
  wakeup_requested_ = false;
  stopped_ = false;
  started_ = true;
  thread_ = std::thread(handler, this);
  LOG(INFO) << name_ << " launched. sleep_interval=" << sleep_interval_.count() << " microsec";
}

bool StoppableThread::sleep() {
  return sleep_for(sleep_interval_);
}

bool StoppableThread::sleep_for(const std::chrono::microseconds &interval) {
  VLOG(1) << name_ << " sleeping for " << interval.count() << " microsec";
  condition_.wait_for(interval, [this]{ return stop_requested_ || wakeup_requested_; });
  wakeup_requested_ = false;
  VLOG(1) << name_ << " woke up";
  if (is_stop_requested()) {
    LOG(INFO) << name_ << " stop requested";
    return true;
  } else {
    return false;
  }
}

void StoppableThread::wakeup() {
  VLOG(1) << "Waking up " << name_ << "...";
  condition_.notify_one([this]{ wakeup_requested_ = true; });
}

void StoppableThread::stop() {
  request_stop();
  wait_for_stop();
}

void StoppableThread::request_stop() {
  if (started_ && !is_stopped() && !is_stop_requested()) {
    LOG(INFO) << "Requesting to stop " << name_ << "...";
    condition_.notify_all([this]{ stop_requested_ = true; });
    LOG(INFO) << "Requested to stop " << name_;
  }
}

void StoppableThread::wait_for_stop() {
  if (started_ && !is_stopped()) {
    LOG(INFO) << "Stopping " << name_ << "...";
    if (thread_.joinable()) {
      thread_.join();
    }
    LOG(INFO) << "Successfully Stopped " << name_;
    stopped_ = true;
  }
}

std::string StoppableThread::to_string() const {
  std::stringstream stream;
  stream << *this;
  return stream.str();
}

std::ostream& operator<<(std::ostream& o, const StoppableThread& v) {
  o << "<StoppableThread>"
    << "<name_>" << v.name_ << "</name_>"
    << "<native_thread_id>" << v.thread_.get_id() << "</native_thread_id>"
    << "<sleep_interval_>" << v.sleep_interval_.count() << "</sleep_interval_>"
    << "<started_>" << v.started_.load() << "</started_>"
    << "<stop_requested_>" << v.stop_requested_.load() << "</stop_requested_>"
    << "<stopped_>" << v.stopped_.load() << "</stopped_>"
    << "</StoppableThread>";
  return o;
}

}  // namespace thread
}  // namespace cloudfn
