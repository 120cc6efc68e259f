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
#ifndef CLOUDFN_REGISTRY_WORKER_HANDLE_HPP_
#define CLOUDFN_REGISTRY_WORKER_HANDLE_HPP_
#include <stdint.h>
#include <sys/types.h>

#include <iosfwd>
#include <memory>
#include <string>

#include "cloudfn/cxx11.hpp"
#include "cloudfn/registry/fwd.hpp"

namespace cloudfn {
namespace registry {
/**
 * @brief Represents one forked worker process.
 * @ingroup REGISTRY
 * @details
 * The handle reaps the child with waitpid() and remembers the exit status, so asking
 * twice after the child exited gives the same answer.
 * Not thread-safe. The registry serializes all accesses.
 */
class WorkerHandle CXX11_FINAL {
 public:
  WorkerHandle(
    const std::string& project_name,
    pid_t pid,
    const std::shared_ptr<ProjectChannel>& channel);

  WorkerHandle() CXX11_FUNC_DELETE;
  WorkerHandle(const WorkerHandle&) CXX11_FUNC_DELETE;
  WorkerHandle& operator=(const WorkerHandle&) CXX11_FUNC_DELETE;

  const std::string&  get_project_name() const { return project_name_; }
  pid_t               get_pid() const { return pid_; }
  const std::shared_ptr<ProjectChannel>& get_channel() const { return channel_; }

  /** Polls the child without blocking. Reaps it if it has exited. */
  bool                is_process_alive();
  /** Whether the worker has signaled readiness on its channel. */
  bool                is_ready() const;
  /** is_process_alive() && is_ready(). */
  bool                is_live() { return is_process_alive() && is_ready(); }

  /**
   * Waits for the child to exit, polling every few milliseconds.
   * @return whether the child exited (and was reaped) within the timeout
   */
  bool                wait_for_exit(uint64_t timeout_ms);
  /** Sends the signal unless the child is already reaped. */
  bool                send_signal(int sig);

  bool                has_exited() const { return exited_; }
  /** Raw status from waitpid(). Meaningful only when has_exited(). */
  int                 get_exit_status() const { return exit_status_; }

  friend std::ostream& operator<<(std::ostream& o, const WorkerHandle& v);

 private:
  const std::string               project_name_;
  const pid_t                     pid_;
  std::shared_ptr<ProjectChannel> channel_;
  bool                            exited_;
  int                             exit_status_;
};

}  // namespace registry
}  // namespace cloudfn
#endif  // CLOUDFN_REGISTRY_WORKER_HANDLE_HPP_
