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
#include "cloudfn/registry/worker_handle.hpp"

#include <errno.h>
#include <signal.h>
#include <sys/wait.h>
#include <glog/logging.h>

#include <chrono>
#include <ostream>
#include <thread>

#include "cloudfn/assorted/assorted_func.hpp"
#include "cloudfn/registry/project_channel.hpp"

namespace cloudfn {
namespace registry {

WorkerHandle::WorkerHandle(
  const std::string& project_name,
  pid_t pid,
  const std::shared_ptr<ProjectChannel>& channel)
  : project_name_(project_name), pid_(pid), channel_(channel), exited_(false), exit_status_(0) {
}

bool WorkerHandle::is_process_alive() {
  if (exited_) {
    return false;
  }
  int status = 0;
  pid_t wait_ret = ::waitpid(pid_, &status, WNOHANG);
  if (wait_ret == 0) {
    return true;
  } else if (wait_ret == pid_) {
    exited_ = true;
    exit_status_ = status;
    if (WIFSIGNALED(status)) {
      LOG(WARNING) << "Worker for project " << project_name_ << " (pid=" << pid_ << ")"
        << " was terminated by signal " << WTERMSIG(status);
    } else {
      LOG(INFO) << "Worker for project " << project_name_ << " (pid=" << pid_ << ")"
        << " exited with status " << WEXITSTATUS(status);
    }
    return false;
  } else {
    // ECHILD: somebody else reaped it. Either way it's gone.
    LOG(WARNING) << "waitpid() for worker " << pid_ << " failed. os_error="
      << assorted::os_error();
    exited_ = true;
    return false;
  }
}

bool WorkerHandle::is_ready() const {
  return channel_ && channel_->is_ready();
}

bool WorkerHandle::wait_for_exit(uint64_t timeout_ms) {
  const uint32_t kIntervalMillisecond = 10;
  uint64_t waited = 0;
  while (is_process_alive()) {
    if (waited >= timeout_ms) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(kIntervalMillisecond));
    waited += kIntervalMillisecond;
  }
  return true;
}

bool WorkerHandle::send_signal(int sig) {
  if (exited_) {
    return false;
  }
  if (::kill(pid_, sig) != 0) {
    LOG(WARNING) << "kill(" << pid_ << ", " << sig << ") failed. os_error="
      << assorted::os_error();
    return false;
  }
  return true;
}

std::ostream& operator<<(std::ostream& o, const WorkerHandle& v) {
  o << "<WorkerHandle>"
    << "<project>" << v.project_name_ << "</project>"
    << "<pid>" << v.pid_ << "</pid>"
    << "<ready>" << v.is_ready() << "</ready>"
    << "<exited>" << v.exited_ << "</exited>";
  if (v.exited_) {
    o << "<exit_status>" << v.exit_status_ << "</exit_status>";
  }
  o << "</WorkerHandle>";
  return o;
}

}  // namespace registry
}  // namespace cloudfn
