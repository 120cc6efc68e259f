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
#ifndef CLOUDFN_MASTER_MASTER_PIMPL_HPP_
#define CLOUDFN_MASTER_MASTER_PIMPL_HPP_

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "cloudfn/error_stack.hpp"
#include "cloudfn/master/fwd.hpp"
#include "cloudfn/master/master.hpp"
#include "cloudfn/master/master_options.hpp"
#include "cloudfn/registry/coordination_registry.hpp"
#include "cloudfn/worker/worker_options.hpp"

namespace cloudfn {
namespace master {
/**
 * @brief Pimpl object of Master.
 * @ingroup MASTER
 * @details
 * state_ and failed_projects_ are protected by mutex_.
 * Each project additionally has its own mutex, held while launching its worker and during
 * one execution, so that one worker channel carries one request at a time.
 * Stopping a project does not take the project mutex. It closes the channel instead, which
 * wakes up an execution waiting on it.
 */
class MasterPimpl final {
 public:
  MasterPimpl() = delete;
  MasterPimpl(
    Master* holder,
    registry::CoordinationRegistry* registry,
    const MasterOptions& options,
    const worker::WorkerOptions& worker_options,
    const worker::NativeFunctionTable* natives);

  ErrorStack  start();
  ErrorStack  stop();
  ErrorStack  execute_function(
    const std::string& project,
    const std::string& function,
    const std::string& payload,
    std::string* result);
  ErrorStack  start_project(const std::string& name);
  ErrorStack  stop_project(const std::string& name);
  ErrorStack  restart_project(const std::string& name);

  std::vector<std::string>    discover_projects() const;
  std::vector<ProjectStatus>  list_projects() const;
  std::vector<std::string>    get_failed_projects() const;
  MasterState                 get_state() const;

  /** Whether the project has a directory or native functions. */
  bool        is_known_project(const std::string& name) const;
  std::shared_ptr<std::mutex> get_project_mutex(const std::string& name);
  registry::WorkerEntry       make_worker_entry(const std::string& name) const;

  /** Launches the worker and waits for readiness. Caller holds the project mutex. */
  ErrorStack  launch_and_wait(const std::string& name);
  /**
   * Makes sure the project has a live worker, restarting a dead one once.
   * Caller holds the project mutex.
   */
  ErrorStack  ensure_live(const std::string& name);
  /** Sends one execute request and waits for its response. Caller holds the project mutex. */
  ErrorStack  exchange(
    const std::string& project,
    const std::string& function,
    const std::string& payload,
    std::string* result);
  /** Error for a call whose worker left the registry while the call was in flight. */
  ErrorStack  worker_gone(
    const std::string& project,
    const registry::ProjectChannel& channel) const;
  ErrorStack  wait_api_layer_ready();
  void        set_failed(const std::string& name, const std::string& reason);
  void        clear_failed(const std::string& name);

  Master* const                       holder_;
  registry::CoordinationRegistry* const registry_;
  const MasterOptions                 options_;
  const worker::WorkerOptions         worker_options_;
  const worker::NativeFunctionTable* const natives_;
  ApiLayer*                           api_layer_;

  mutable std::mutex                  mutex_;
  MasterState                         state_;
  std::map<std::string, std::string>  failed_projects_;
  std::map<std::string, std::shared_ptr<std::mutex> > project_mutexes_;
};

}  // namespace master
}  // namespace cloudfn
#endif  // CLOUDFN_MASTER_MASTER_PIMPL_HPP_
