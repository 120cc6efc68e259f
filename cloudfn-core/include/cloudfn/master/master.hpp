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
#ifndef CLOUDFN_MASTER_MASTER_HPP_
#define CLOUDFN_MASTER_MASTER_HPP_
#include <sys/types.h>

#include <iosfwd>
#include <string>
#include <vector>

#include "cloudfn/cxx11.hpp"
#include "cloudfn/error_stack.hpp"
#include "cloudfn/master/fwd.hpp"
#include "cloudfn/master/function_invoker.hpp"
#include "cloudfn/registry/component.hpp"
#include "cloudfn/registry/fwd.hpp"
#include "cloudfn/worker/fwd.hpp"

namespace cloudfn {
namespace master {

/** Lifecycle of Master itself. */
enum MasterState {
  kMasterStopped = 0,
  kMasterInitializing,
  kMasterRunning,
  kMasterStopping,
};
const char* to_state_name(MasterState state);

/** @brief Snapshot of one project as seen by Master. @ingroup MASTER */
struct ProjectStatus {
  enum State {
    kAbsent = 0,
    kStarting,
    kReady,
    kDead,
    kFailed,
  };
  ProjectStatus() : state_(kAbsent), pid_(0) {}

  std::string name_;
  State       state_;
  /** 0 unless a worker process exists. */
  pid_t       pid_;
  /** Why the project failed to start. Empty unless kFailed. */
  std::string failure_;

  static const char* to_state_name(State state);
  friend std::ostream& operator<<(std::ostream& o, const ProjectStatus& v);
};

/**
 * @brief Supervises the worker processes of all projects and runs functions on them.
 * @ingroup MASTER
 * @details
 * Master registers itself in the "master" slot of the registry during start().
 * Worker processes are forked from the calling process and run worker::worker_main() with
 * the given worker options and native function table.
 * All methods are thread-safe.
 */
class Master CXX11_FINAL : public registry::Component, public FunctionInvoker {
 public:
  /**
   * @param[in] registry not owned, must outlive this object
   * @param[in] natives optional, not owned. See worker::NativeFunctionTable.
   */
  Master(
    registry::CoordinationRegistry* registry,
    const MasterOptions& options,
    const worker::WorkerOptions& worker_options,
    const worker::NativeFunctionTable* natives = CXX11_NULLPTR);
  ~Master();

  Master() CXX11_FUNC_DELETE;
  Master(const Master&) CXX11_FUNC_DELETE;
  Master& operator=(const Master&) CXX11_FUNC_DELETE;

  const char* get_component_name() const CXX11_OVERRIDE;

  /** Sets the API layer started by start(). Not owned. Call before start(). */
  void        set_api_layer(ApiLayer* api_layer);

  /**
   * Starts the API layer, waits for it, then launches every discovered project and waits for
   * each to become ready. A project that fails is recorded as failed and the rest continue.
   * @return error if the API layer failed, in which case everything is stopped again
   */
  ErrorStack  start();
  /** Stops all workers, the API layer and the registry resources. Always ends stopped. */
  ErrorStack  stop();

  ErrorStack  execute_function(
    const std::string& project,
    const std::string& function,
    const std::string& payload,
    std::string* result) CXX11_OVERRIDE;

  /** Launches the project's worker unless it is live, then waits for readiness. */
  ErrorStack  start_project(const std::string& name);
  /** Terminates the project's worker. No-op if it has none. */
  ErrorStack  stop_project(const std::string& name);
  /** Terminates and launches again, eg after a redeploy. */
  ErrorStack  restart_project(const std::string& name);

  /** Directories under MasterOptions::projects_dir_ and projects of native functions. */
  std::vector<std::string>    discover_projects() const;
  /** Status of discovered projects and of projects that have a worker. Sorted by name. */
  std::vector<ProjectStatus>  list_projects() const;
  /** Projects that failed to become ready with the reasons, "name: reason". */
  std::vector<std::string>    get_failed_projects() const;
  MasterState                 get_state() const;

  const MasterOptions&        get_options() const;
  registry::CoordinationRegistry* get_registry() const;

 private:
  MasterPimpl* pimpl_;
};

}  // namespace master
}  // namespace cloudfn
#endif  // CLOUDFN_MASTER_MASTER_HPP_
