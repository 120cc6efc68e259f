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
#include "cloudfn/registry/coordination_registry_pimpl.hpp"

#include <signal.h>
#include <unistd.h>
#include <sys/prctl.h>
#include <glog/logging.h>

#include <algorithm>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include "cloudfn/error_stack_batch.hpp"
#include "cloudfn/assorted/assorted_func.hpp"
#include "cloudfn/debugging/debugging_supports.hpp"
#include "cloudfn/debugging/raw_log.hpp"
#include "cloudfn/registry/project_channel.hpp"
#include "cloudfn/registry/worker_handle.hpp"
#include "cloudfn/soc/channel_block.hpp"
#include "cloudfn/soc/channel_message.hpp"

namespace cloudfn {
namespace registry {

CoordinationRegistryPimpl::CoordinationRegistryPimpl(
  CoordinationRegistry* holder,
  const RegistryOptions& options)
  : holder_(holder), options_(options), control_plane_pid_(::getpid()) {
  components_[kComponentRegistry] = holder;
  components_[kComponentMaster] = nullptr;
  components_[kComponentProjectManager] = nullptr;
  components_[kComponentApiServer] = nullptr;
  components_[kComponentTaskManager] = nullptr;
}

////////////////////////////////////////////////////////////////////////////////////
//
//              Component slots
//
////////////////////////////////////////////////////////////////////////////////////
ErrorStack CoordinationRegistryPimpl::register_component(
  const std::string& name,
  Component* component) {
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = components_.find(name);
  if (it == components_.end()) {
    LOG(ERROR) << "Unknown component slot: " << name;
    return ERROR_STACK_MSG(kErrorCodeRegistryUnknownComponent, name.c_str());
  }
  if (it->second != nullptr && it->second != component) {
    LOG(WARNING) << "Component slot " << name << " is overwritten";
  }
  it->second = component;
  VLOG(0) << "Registered component " << name;
  return kRetOk;
}

void CoordinationRegistryPimpl::unregister_component(
  const std::string& name,
  Component* component) {
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = components_.find(name);
  if (it != components_.end() && it->second == component) {
    it->second = nullptr;
  }
}

Component* CoordinationRegistryPimpl::get_component(const std::string& name) const {
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = components_.find(name);
  if (it == components_.end()) {
    LOG(WARNING) << "Asked for an unknown component slot: " << name;
    return nullptr;
  }
  return it->second;
}

////////////////////////////////////////////////////////////////////////////////////
//
//              Channels
//
////////////////////////////////////////////////////////////////////////////////////
ErrorStack CoordinationRegistryPimpl::get_or_create_channel(
  ChannelMap* channels,
  const std::string& key,
  uint32_t capacity,
  std::shared_ptr<ProjectChannel>* out) {
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = channels->find(key);
  if (it != channels->end()) {
    *out = it->second;
    return kRetOk;
  }
  std::shared_ptr<ProjectChannel> channel(new ProjectChannel(key));
  CHECK_ERROR(channel->allocate(capacity));
  (*channels)[key] = channel;
  *out = channel;
  return kRetOk;
}

std::shared_ptr<ProjectChannel> CoordinationRegistryPimpl::find_channel(
  const ChannelMap& channels,
  const std::string& key) const {
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = channels.find(key);
  if (it == channels.end()) {
    return std::shared_ptr<ProjectChannel>();
  }
  return it->second;
}

void CoordinationRegistryPimpl::cleanup_task_resources(const std::string& task_id) {
  std::shared_ptr<ProjectChannel> channel;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = task_channels_.find(task_id);
    if (it == task_channels_.end()) {
      return;
    }
    channel = it->second;
    task_channels_.erase(it);
  }
  channel->release();
  VLOG(0) << "Released resources of task " << task_id;
}

////////////////////////////////////////////////////////////////////////////////////
//
//              Worker processes
//
////////////////////////////////////////////////////////////////////////////////////
bool CoordinationRegistryPimpl::start_project_process(
  const std::string& name,
  const WorkerEntry& entry,
  const std::vector<std::string>& args) {
  std::unique_lock<std::mutex> guard(mutex_);
  if (!forked_project_.empty()) {
    LOG(ERROR) << "A worker process cannot launch another worker: " << name;
    return false;
  }
  auto it = workers_.find(name);
  if (it != workers_.end()) {
    if (it->second->is_process_alive()) {
      VLOG(0) << "Worker for project " << name << " is already running. pid="
        << it->second->get_pid();
      return true;
    }
    LOG(WARNING) << "Worker for project " << name << " is dead: " << *it->second
      << ". Cleaning it up before restart";
    ErrorStack cleanup_error = cleanup_project_locked(name);
    if (cleanup_error.is_error()) {
      LOG(ERROR) << "Failed to clean up project " << name << ": " << cleanup_error;
      return false;
    }
  }

  // reuse a channel created beforehand unless a previous worker already signaled on it
  // or it was closed.
  std::shared_ptr<ProjectChannel> channel;
  auto existing = project_channels_.find(name);
  if (existing != project_channels_.end()
    && !existing->second->is_ready()
    && !existing->second->is_closed()) {
    channel = existing->second;
  } else {
    release_project_locked(name, std::shared_ptr<ProjectChannel>());
    channel.reset(new ProjectChannel(name));
    ErrorStack alloc_error = channel->allocate(options_.channel_capacity_);
    if (alloc_error.is_error()) {
      LOG(ERROR) << "Failed to allocate the channel for project " << name << ": "
        << alloc_error;
      return false;
    }
    project_channels_[name] = channel;
  }

  pid_t pid = ::fork();
  if (pid == -1) {
    LOG(ERROR) << "Failed to fork a worker for project " << name << ". os_error="
      << assorted::os_error();
    project_channels_.erase(name);
    channel->release();
    return false;
  } else if (pid == 0) {
    int child_ret = forked_child_main(name, entry, args, channel, &guard);
    ::_exit(child_ret);
  }

  workers_[name] = std::shared_ptr<WorkerHandle>(new WorkerHandle(name, pid, channel));
  LOG(INFO) << "Launched worker for project " << name << ". pid=" << pid;
  return true;
}

int CoordinationRegistryPimpl::forked_child_main(
  const std::string& name,
  const WorkerEntry& entry,
  const std::vector<std::string>& args,
  const std::shared_ptr<ProjectChannel>& channel,
  std::unique_lock<std::mutex>* guard) {
  // Only the forking thread exists here. Locks other threads held stay held forever.
  debugging::DebuggingSupports::enter_forked_child();

  // In order to make sure workers die as soon as the control plane dies, we use prctl.
  ::prctl(PR_SET_PDEATHSIG, SIGHUP);
  if (::getppid() != control_plane_pid_) {
    RAW_LOG_STREAM(ERROR) << "Control plane died before worker " << name << " started";
    return EXIT_FAILURE;
  }

  // The forking thread held mutex_, so it is ours to release in this process.
  reset_for_forked_child(name);
  guard->unlock();

  WorkerContext context;
  context.project_name_ = name;
  context.args_ = args;
  context.channel_ = channel->get_block();
  context.registry_ = holder_;
  return entry(context);
}

void CoordinationRegistryPimpl::reset_for_forked_child(const std::string& name) {
  forked_project_ = name;
  for (auto& kv : project_channels_) {
    if (kv.first != name) {
      kv.second->detach();
    }
  }
  std::shared_ptr<ProjectChannel> mine = project_channels_[name];
  project_channels_.clear();
  project_channels_[name] = mine;
  for (auto& kv : task_channels_) {
    kv.second->detach();
  }
  task_channels_.clear();
  workers_.clear();
  // Threads of the parent's pools do not exist in this process. Joining them would hang,
  // so the pool objects are left behind.
  for (auto& kv : executors_) {
    kv.second.release();
  }
  executors_.clear();
  for (auto& kv : components_) {
    if (kv.first != kComponentRegistry) {
      kv.second = nullptr;
    }
  }
}

ErrorStack CoordinationRegistryPimpl::terminate_process(const std::string& name) {
  std::shared_ptr<WorkerHandle> handle;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = workers_.find(name);
    if (it == workers_.end()) {
      LOG(INFO) << "No worker for project " << name << ". Nothing to terminate";
      release_project_locked(name, std::shared_ptr<ProjectChannel>());
      return kRetOk;
    }
    handle = it->second;
    workers_.erase(it);
    // A caller that sees the worker gone also sees the channel closed.
    // The worker reads the closed channel as a stop command.
    handle->get_channel()->release();
  }

  // no lock while waiting. other projects can proceed.
  ErrorStack result = stop_and_reap(handle.get());
  {
    std::lock_guard<std::mutex> guard(mutex_);
    release_project_locked(name, handle->get_channel());
  }
  if (result.is_error()) {
    LOG(ERROR) << "Worker for project " << name << " did not terminate cleanly: " << result;
  } else {
    LOG(INFO) << "Terminated worker for project " << name;
  }
  return result;
}

ErrorStack CoordinationRegistryPimpl::stop_and_reap(WorkerHandle* handle) {
  if (!handle->is_process_alive()) {
    return kRetOk;
  }
  soc::ChannelBlock* block = handle->get_channel()->get_block();
  if (block && !block->is_closed()) {
    ErrorCode code = block->send_request(
      soc::ChannelMessage::make_stop(),
      static_cast<uint64_t>(options_.terminate_wait_ms_) * 1000ULL);
    if (code != kErrorCodeOk) {
      LOG(WARNING) << "Could not send the stop command to " << *handle
        << ": " << get_error_name(code);
    }
  }
  if (handle->wait_for_exit(options_.terminate_wait_ms_)) {
    return kRetOk;
  }

  LOG(WARNING) << "Worker did not exit in " << options_.terminate_wait_ms_ << "ms. Killing "
    << *handle;
  handle->send_signal(SIGKILL);
  if (handle->wait_for_exit(options_.kill_wait_ms_)) {
    return kRetOk;
  }
  std::string msg = "pid=" + std::to_string(handle->get_pid());
  return ERROR_STACK_MSG(kErrorCodeRegistryWorkerStopFailed, msg.c_str());
}

void CoordinationRegistryPimpl::release_project_locked(
  const std::string& name,
  const std::shared_ptr<ProjectChannel>& expected_channel) {
  auto channel = project_channels_.find(name);
  if (channel != project_channels_.end()) {
    // a newer worker may have been launched meanwhile. leave its channel alone.
    if (!expected_channel || channel->second == expected_channel) {
      channel->second->release();
      project_channels_.erase(channel);
    }
  }
  auto executor = executors_.find(name);
  if (executor != executors_.end() && !workers_.count(name)) {
    executors_.erase(executor);
  }
}

ErrorStack CoordinationRegistryPimpl::cleanup_project_locked(const std::string& name) {
  ErrorStack result;
  auto it = workers_.find(name);
  if (it != workers_.end()) {
    std::shared_ptr<WorkerHandle> handle = it->second;
    workers_.erase(it);
    handle->get_channel()->release();
    if (handle->is_process_alive()) {
      LOG(WARNING) << "Killing still running worker during cleanup: " << *handle;
      handle->send_signal(SIGKILL);
      if (!handle->wait_for_exit(options_.kill_wait_ms_)) {
        std::string msg = "pid=" + std::to_string(handle->get_pid());
        result = ERROR_STACK_MSG(kErrorCodeRegistryWorkerStopFailed, msg.c_str());
      }
    }
  }
  release_project_locked(name, std::shared_ptr<ProjectChannel>());
  return result;
}

ErrorStack CoordinationRegistryPimpl::cleanup_project(const std::string& name) {
  std::lock_guard<std::mutex> guard(mutex_);
  return cleanup_project_locked(name);
}

bool CoordinationRegistryPimpl::check_process_status(const std::string& name) {
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = workers_.find(name);
  if (it == workers_.end()) {
    return false;
  }
  return it->second->is_live();
}

bool CoordinationRegistryPimpl::is_process_alive(const std::string& name) {
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = workers_.find(name);
  if (it == workers_.end()) {
    return false;
  }
  return it->second->is_process_alive();
}

bool CoordinationRegistryPimpl::wait_for_ready(const std::string& name, uint64_t timeout_ms) {
  const uint64_t kIntervalMillisecond = 20;
  uint64_t waited = 0;
  while (true) {
    std::shared_ptr<ProjectChannel> channel;
    {
      std::lock_guard<std::mutex> guard(mutex_);
      auto it = workers_.find(name);
      if (it == workers_.end() || !it->second->is_process_alive()) {
        return false;
      }
      if (it->second->is_ready()) {
        return true;
      }
      channel = it->second->get_channel();
    }
    if (waited >= timeout_ms) {
      return false;
    }
    // wait on the signal itself, but wake up periodically to notice a dead worker.
    uint64_t chunk = std::min(kIntervalMillisecond, timeout_ms - waited);
    if (channel->wait_ready(chunk)) {
      continue;  // re-check liveness under the lock
    }
    waited += chunk;
  }
}

pid_t CoordinationRegistryPimpl::get_worker_pid(const std::string& name) const {
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = workers_.find(name);
  if (it == workers_.end()) {
    return 0;
  }
  return it->second->get_pid();
}

////////////////////////////////////////////////////////////////////////////////////
//
//              Executors and listing
//
////////////////////////////////////////////////////////////////////////////////////
thread::BoundedThreadPool* CoordinationRegistryPimpl::get_executor(
  const std::string& name,
  uint32_t thread_count) {
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = executors_.find(name);
  if (it != executors_.end()) {
    return it->second.get();
  }
  thread::BoundedThreadPool* pool = new thread::BoundedThreadPool("handler-" + name, thread_count);
  executors_[name].reset(pool);
  LOG(INFO) << "Created handler pool for project " << name << " with " << thread_count
    << " threads";
  return pool;
}

std::vector<std::string> CoordinationRegistryPimpl::list_live_projects() {
  std::lock_guard<std::mutex> guard(mutex_);
  std::vector<std::string> ret;
  for (auto& kv : workers_) {
    if (kv.second->is_live()) {
      ret.push_back(kv.first);
    }
  }
  return ret;
}

std::vector<std::string> CoordinationRegistryPimpl::list_worker_projects() const {
  std::lock_guard<std::mutex> guard(mutex_);
  std::vector<std::string> ret;
  for (const auto& kv : workers_) {
    ret.push_back(kv.first);
  }
  return ret;
}

////////////////////////////////////////////////////////////////////////////////////
//
//              Shutdown
//
////////////////////////////////////////////////////////////////////////////////////
ErrorStack CoordinationRegistryPimpl::cleanup_resources() {
  LOG(INFO) << "Releasing all resources in the coordination registry...";
  ErrorStackBatch batch;

  // workers first. a worker blocked on a channel must not see it disappear.
  std::vector<std::string> projects = list_worker_projects();
  for (const std::string& name : projects) {
    batch.push_back(terminate_process(name));
  }

  std::lock_guard<std::mutex> guard(mutex_);
  for (auto& kv : project_channels_) {
    kv.second->release();
  }
  project_channels_.clear();
  for (auto& kv : task_channels_) {
    kv.second->release();
  }
  task_channels_.clear();

  for (auto& kv : executors_) {
    kv.second->stop();
  }
  executors_.clear();

  for (auto& kv : components_) {
    if (kv.first != kComponentRegistry) {
      kv.second = nullptr;
    }
  }
  LOG(INFO) << "Released all resources in the coordination registry";
  return SUMMARIZE_ERROR_BATCH(batch);
}

}  // namespace registry
}  // namespace cloudfn
