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
#ifndef CLOUDFN_WORKER_WORKER_PROCESS_HPP_
#define CLOUDFN_WORKER_WORKER_PROCESS_HPP_
#include <stdint.h>

#include <deque>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "cloudfn/cxx11.hpp"
#include "cloudfn/error_stack.hpp"
#include "cloudfn/initializable.hpp"
#include "cloudfn/fs/path.hpp"
#include "cloudfn/registry/fwd.hpp"
#include "cloudfn/soc/channel_message.hpp"
#include "cloudfn/soc/fwd.hpp"
#include "cloudfn/thread/fwd.hpp"
#include "cloudfn/worker/function_info.hpp"
#include "cloudfn/worker/fwd.hpp"
#include "cloudfn/worker/project_environment.hpp"
#include "cloudfn/worker/worker_options.hpp"

namespace cloudfn {
namespace worker {
/**
 * @brief Owns the functions of one project and serves commands from its channel.
 * @ingroup WORKER
 * @details
 * @par Initialization
 * initialize() loads the project environment, ensures the dependency environment,
 * installs dependencies and scans the project's function files. A function file without
 * the entry point is kept as kUnregistered. Functions are loaded lazily on first execution,
 * and a load failure only affects that function.
 *
 * @par Command loop
 * run() signals readiness first, whether or not initialize() succeeded, then serves commands
 * in channel order until a stop command or until the channel is closed.
 * A worker that failed to initialize answers every execute command with
 * kErrorCodeWorkerNotInitialized carrying the initialization error.
 * While a synchronous handler runs on the handler pool, the loop keeps reading the channel.
 * A stop command seen at that point makes the current execution fail and ends the loop.
 * Other commands seen meanwhile are kept in order and served afterwards.
 *
 * Counters are updated by the loop thread only. Read them after run() returns.
 */
class WorkerProcess CXX11_FINAL : public DefaultInitializable {
 public:
  /** Pluggable parts. None of them is owned by the worker. natives_ may be null. */
  struct Collaborators {
    Collaborators()
      : provisioner_(CXX11_NULLPTR), source_provider_(CXX11_NULLPTR),
        resolver_(CXX11_NULLPTR), natives_(CXX11_NULLPTR) {}
    EnvironmentProvisioner*     provisioner_;
    FunctionSourceProvider*     source_provider_;
    HandlerResolver*            resolver_;
    const NativeFunctionTable*  natives_;
  };

  WorkerProcess(
    const std::string& project_name,
    const WorkerOptions& options,
    const fs::Path& projects_dir,
    soc::ChannelBlock* channel,
    thread::BoundedThreadPool* executor,
    const Collaborators& collaborators);
  ~WorkerProcess();

  WorkerProcess() CXX11_FUNC_DELETE;
  WorkerProcess(const WorkerProcess&) CXX11_FUNC_DELETE;
  WorkerProcess& operator=(const WorkerProcess&) CXX11_FUNC_DELETE;

  ErrorStack  initialize_once() CXX11_OVERRIDE;
  ErrorStack  uninitialize_once() CXX11_OVERRIDE;

  /** Signals readiness and serves commands until stopped. */
  ErrorStack  run();

  /**
   * Looks up, loads if needed, and runs one function.
   * Unknown or unregistered functions fail without touching the handler pool.
   */
  ErrorStack  execute_function(
    const std::string& function_name,
    const std::string& payload,
    std::string* result);

  const std::string&  get_project_name() const { return project_name_; }
  /** Message of the initialization error. Empty if initialize() succeeded. */
  const std::string&  get_init_error_message() const { return init_error_message_; }
  bool                get_function(const std::string& name, FunctionInfo* out) const;
  std::vector<FunctionInfo> list_functions() const;
  const ProjectEnvironment& get_environment() const { return *environment_; }

  uint64_t    get_succeeded_count() const { return succeeded_count_; }
  uint64_t    get_failed_count() const { return failed_count_; }
  uint64_t    get_rejected_count() const { return rejected_count_; }

 private:
  const std::string                         project_name_;
  const WorkerOptions                       options_;
  const fs::Path                            projects_dir_;
  soc::ChannelBlock* const                  channel_;
  thread::BoundedThreadPool* const          executor_;
  const Collaborators                       collaborators_;

  /** Shared with running pool jobs, which may outlive an interrupted execution. */
  std::shared_ptr<const ProjectEnvironment> environment_;
  std::map<std::string, FunctionInfo>       functions_;
  std::map<std::string, std::shared_ptr<Handler> > handlers_;
  /** Requests read from the channel while a handler was running. */
  std::deque<soc::ChannelMessage>           pending_;
  bool                                      stop_requested_;
  std::string                               init_error_message_;

  uint64_t                                  succeeded_count_;
  uint64_t                                  failed_count_;
  uint64_t                                  rejected_count_;

  ErrorStack  initialize_impl();
  ErrorStack  scan_functions();
  ErrorStack  load_function(FunctionInfo* function, std::shared_ptr<Handler>* handler);
  ErrorStack  dispatch(
    const std::shared_ptr<Handler>& handler,
    const std::string& payload,
    std::string* result);
  /** Reads the channel without waiting while a pool job runs. */
  void        poll_channel_during_execution();
  soc::ChannelMessage handle_execute(const soc::ChannelMessage& request);
};

/**
 * @brief Body of a forked worker process with the default collaborators.
 * @ingroup WORKER
 * @details
 * Used as the registry::WorkerEntry of every project launched by the master.
 * @return exit status of the worker process
 */
int worker_main(
  const registry::WorkerContext& context,
  const WorkerOptions& options,
  const fs::Path& projects_dir,
  const NativeFunctionTable* natives);

}  // namespace worker
}  // namespace cloudfn
#endif  // CLOUDFN_WORKER_WORKER_PROCESS_HPP_
