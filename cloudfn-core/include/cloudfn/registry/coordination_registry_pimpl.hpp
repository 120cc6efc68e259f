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
#ifndef CLOUDFN_REGISTRY_COORDINATION_REGISTRY_PIMPL_HPP_
#define CLOUDFN_REGISTRY_COORDINATION_REGISTRY_PIMPL_HPP_
#include <sys/types.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "cloudfn/error_stack.hpp"
#include "cloudfn/registry/coordination_registry.hpp"
#include "cloudfn/registry/fwd.hpp"
#include "cloudfn/registry/registry_options.hpp"
#include "cloudfn/thread/bounded_thread_pool_impl.hpp"

namespace cloudfn {
namespace registry {
/**
 * @brief Pimpl object of CoordinationRegistry.
 * @ingroup REGISTRY
 * @details
 * A private class of CoordinationRegistry. All members are protected by mutex_.
 */
class CoordinationRegistryPimpl final {
 public:
  typedef std::map< std::string, std::shared_ptr<ProjectChannel> > ChannelMap;

  CoordinationRegistryPimpl() = delete;
  CoordinationRegistryPimpl(CoordinationRegistry* holder, const RegistryOptions& options);

  ErrorStack  register_component(const std::string& name, Component* component);
  void        unregister_component(const std::string& name, Component* component);
  Component*  get_component(const std::string& name) const;

  ErrorStack  get_or_create_channel(
    ChannelMap* channels,
    const std::string& key,
    uint32_t capacity,
    std::shared_ptr<ProjectChannel>* out);
  std::shared_ptr<ProjectChannel> find_channel(
    const ChannelMap& channels,
    const std::string& key) const;

  bool        start_project_process(
    const std::string& name,
    const WorkerEntry& entry,
    const std::vector<std::string>& args);
  ErrorStack  terminate_process(const std::string& name);
  bool        check_process_status(const std::string& name);
  bool        is_process_alive(const std::string& name);
  bool        wait_for_ready(const std::string& name, uint64_t timeout_ms);
  pid_t       get_worker_pid(const std::string& name) const;

  ErrorStack  cleanup_project(const std::string& name);
  void        cleanup_task_resources(const std::string& task_id);
  ErrorStack  cleanup_resources();

  thread::BoundedThreadPool* get_executor(const std::string& name, uint32_t thread_count);
  std::vector<std::string>   list_live_projects();
  std::vector<std::string>   list_worker_projects() const;

  /** Sends stop, waits, kills. The handle must already be removed from workers_. */
  ErrorStack  stop_and_reap(WorkerHandle* handle);
  /** Releases channel and executor of the project. mutex_ must be held. */
  void        release_project_locked(
    const std::string& name,
    const std::shared_ptr<ProjectChannel>& expected_channel);
  ErrorStack  cleanup_project_locked(const std::string& name);

  /** Body of the forked child. Never returns to the caller of fork(). */
  int         forked_child_main(
    const std::string& name,
    const WorkerEntry& entry,
    const std::vector<std::string>& args,
    const std::shared_ptr<ProjectChannel>& channel,
    std::unique_lock<std::mutex>* guard);
  /** Drops everything inherited from the control plane that does not belong to this worker. */
  void        reset_for_forked_child(const std::string& name);

  CoordinationRegistry* const holder_;
  const RegistryOptions       options_;
  const pid_t                 control_plane_pid_;

  mutable std::mutex          mutex_;
  std::map< std::string, Component* >                             components_;
  ChannelMap                                                      project_channels_;
  ChannelMap                                                      task_channels_;
  std::map< std::string, std::shared_ptr<WorkerHandle> >          workers_;
  std::map< std::string, std::unique_ptr<thread::BoundedThreadPool> > executors_;
  /** Non-empty only in a forked worker process. */
  std::string                 forked_project_;
};
}  // namespace registry
}  // namespace cloudfn
#endif  // CLOUDFN_REGISTRY_COORDINATION_REGISTRY_PIMPL_HPP_
