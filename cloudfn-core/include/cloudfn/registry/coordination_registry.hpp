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
#ifndef CLOUDFN_REGISTRY_COORDINATION_REGISTRY_HPP_
#define CLOUDFN_REGISTRY_COORDINATION_REGISTRY_HPP_
#include <sys/types.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "cloudfn/cxx11.hpp"
#include "cloudfn/error_stack.hpp"
#include "cloudfn/registry/component.hpp"
#include "cloudfn/registry/fwd.hpp"
#include "cloudfn/soc/fwd.hpp"
#include "cloudfn/thread/fwd.hpp"

namespace cloudfn {
namespace registry {

/** Slot names accepted by CoordinationRegistry::register_component(). */
const char* const kComponentRegistry = "registry";
const char* const kComponentMaster = "master";
const char* const kComponentProjectManager = "project_manager";
const char* const kComponentApiServer = "api_server";
const char* const kComponentTaskManager = "task_manager";

/**
 * @brief What a forked worker receives from the registry.
 * @ingroup REGISTRY
 */
struct WorkerContext {
  std::string               project_name_;
  std::vector<std::string>  args_;
  /** Channel shared with the control plane. The worker signals readiness on it. */
  soc::ChannelBlock*        channel_;
  /** The registry as seen from the forked process. Only this project's state remains. */
  CoordinationRegistry*     registry_;
};

/** Body of a forked worker. The return value becomes the exit status of the process. */
typedef std::function<int(const WorkerContext& context)> WorkerEntry;

/**
 * @brief Process-wide bookkeeping of components, channels and worker processes.
 * @ingroup REGISTRY
 * @details
 * All methods are thread-safe.
 * The registry is explicitly constructed and passed to components by pointer.
 * Methods that report "absent" (null, false or 0) do so only for missing entries.
 * Errors are reported as ErrorStack except start_project_process(), which logs and returns
 * false so that a caller can treat every start failure alike.
 */
class CoordinationRegistry CXX11_FINAL : public Component {
 public:
  explicit CoordinationRegistry(const RegistryOptions& options);
  ~CoordinationRegistry();

  CoordinationRegistry() CXX11_FUNC_DELETE;
  CoordinationRegistry(const CoordinationRegistry&) CXX11_FUNC_DELETE;
  CoordinationRegistry& operator=(const CoordinationRegistry&) CXX11_FUNC_DELETE;

  const char*     get_component_name() const CXX11_OVERRIDE { return kComponentRegistry; }
  const RegistryOptions& get_options() const;

  /**
   * Places the component in the named slot.
   * @return kErrorCodeRegistryUnknownComponent if the name is not one of the fixed slots
   */
  ErrorStack      register_component(const std::string& name, Component* component);
  /** Clears the slot if it still holds the given component. */
  void            unregister_component(const std::string& name, Component* component);
  /** Null for an empty slot. Unknown names are logged and also give null. */
  Component*      get_component(const std::string& name) const;
  template <class T>
  T*              get_component_as(const std::string& name) const {
    return dynamic_cast<T*>(get_component(name));
  }

  /** Command channel + readiness signal of a project, created on first request. */
  ErrorStack      get_or_create_project_channel(
    const std::string& name,
    std::shared_ptr<ProjectChannel>* out);
  /** Null if the project has no channel. */
  std::shared_ptr<ProjectChannel> get_project_channel(const std::string& name) const;
  ErrorStack      get_or_create_task_channel(
    const std::string& task_id,
    std::shared_ptr<ProjectChannel>* out);
  std::shared_ptr<ProjectChannel> get_task_channel(const std::string& task_id) const;

  /**
   * Forks a worker process for the project unless one is already running.
   * A handle whose process has exited is cleaned up before the new launch.
   * The child runs entry() and exits with its return value. It dies with the control plane.
   * @return whether a worker process is running for the project after this call
   */
  bool            start_project_process(
    const std::string& name,
    const WorkerEntry& entry,
    const std::vector<std::string>& args);
  /**
   * Sends the stop command, waits terminate_wait_ms_, then kills with SIGKILL.
   * Bookkeeping of the project is always removed. Unknown projects are a no-op.
   */
  ErrorStack      terminate_process(const std::string& name);
  /** Whether the project has a live worker: process running and ready signaled. */
  bool            check_process_status(const std::string& name);
  /** Whether the project has a worker process that has not exited, ready or not. */
  bool            is_process_alive(const std::string& name);
  bool            has_worker(const std::string& name) const;
  /** Blocks until the worker signals readiness, the worker dies, or the timeout. */
  bool            wait_for_ready(const std::string& name, uint64_t timeout_ms);
  /** 0 if the project has no worker. */
  pid_t           get_worker_pid(const std::string& name) const;

  /** Releases handle, channel and executor of the project. Safe to call repeatedly. */
  ErrorStack      cleanup_project(const std::string& name);
  /** Releases the channel of the task. Safe to call repeatedly. */
  void            cleanup_task_resources(const std::string& task_id);
  /**
   * Full shutdown. Workers first, then channels, then executors, then component slots.
   * Every step runs even if an earlier one failed.
   */
  ErrorStack      cleanup_resources();

  /** Lazily created handler pool of the project. Used inside worker processes. */
  thread::BoundedThreadPool* get_executor(const std::string& name, uint32_t thread_count);

  std::vector<std::string> list_live_projects();
  /** Projects that have a handle, live or not. */
  std::vector<std::string> list_worker_projects() const;
  /** True in a forked worker process. */
  bool            is_forked_worker() const;

 private:
  CoordinationRegistryPimpl* pimpl_;
};

}  // namespace registry
}  // namespace cloudfn
#endif  // CLOUDFN_REGISTRY_COORDINATION_REGISTRY_HPP_
