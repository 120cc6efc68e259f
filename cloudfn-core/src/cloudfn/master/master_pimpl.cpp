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
#include "cloudfn/master/master_pimpl.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <chrono>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "cloudfn/error_code.hpp"
#include "cloudfn/error_stack_batch.hpp"
#include "cloudfn/assorted/assorted_func.hpp"
#include "cloudfn/fs/filesystem.hpp"
#include "cloudfn/fs/path.hpp"
#include "cloudfn/master/api_layer.hpp"
#include "cloudfn/registry/project_channel.hpp"
#include "cloudfn/soc/channel_block.hpp"
#include "cloudfn/soc/channel_message.hpp"
#include "cloudfn/worker/native_function_table.hpp"
#include "cloudfn/worker/worker_process.hpp"

namespace cloudfn {
namespace master {
MasterPimpl::MasterPimpl(
  Master* holder,
  registry::CoordinationRegistry* registry,
  const MasterOptions& options,
  const worker::WorkerOptions& worker_options,
  const worker::NativeFunctionTable* natives)
  : holder_(holder),
    registry_(registry),
    options_(options),
    worker_options_(worker_options),
    natives_(natives),
    api_layer_(nullptr),
    state_(kMasterStopped) {
}

MasterState MasterPimpl::get_state() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return state_;
}

registry::WorkerEntry MasterPimpl::make_worker_entry(const std::string& name) const {
  // copied into the closure. the forked child must not reach back into this object.
  const worker::WorkerOptions worker_options = worker_options_;
  const fs::Path projects_dir(options_.projects_dir_);
  std::shared_ptr<worker::NativeFunctionTable> natives;
  if (natives_) {
    natives.reset(new worker::NativeFunctionTable());
    natives_->copy_project(name, natives.get());
  }
  return [worker_options, projects_dir, natives](const registry::WorkerContext& context) {
    return worker::worker_main(context, worker_options, projects_dir, natives.get());
  };
}

std::shared_ptr<std::mutex> MasterPimpl::get_project_mutex(const std::string& name) {
  std::lock_guard<std::mutex> guard(mutex_);
  std::shared_ptr<std::mutex>& ret = project_mutexes_[name];
  if (!ret) {
    ret.reset(new std::mutex());
  }
  return ret;
}

void MasterPimpl::set_failed(const std::string& name, const std::string& reason) {
  std::lock_guard<std::mutex> guard(mutex_);
  failed_projects_[name] = reason;
}

void MasterPimpl::clear_failed(const std::string& name) {
  std::lock_guard<std::mutex> guard(mutex_);
  failed_projects_.erase(name);
}

std::vector<std::string> MasterPimpl::get_failed_projects() const {
  std::lock_guard<std::mutex> guard(mutex_);
  std::vector<std::string> ret;
  for (auto it = failed_projects_.begin(); it != failed_projects_.end(); ++it) {
    ret.push_back(it->first + ": " + it->second);
  }
  return ret;
}

////////////////////////////////////////////////////////////////////////////////
///
///      Project discovery
///
////////////////////////////////////////////////////////////////////////////////
std::vector<std::string> MasterPimpl::discover_projects() const {
  std::set<std::string> names;
  fs::Path projects_dir(options_.projects_dir_);
  if (fs::is_directory(projects_dir)) {
    std::vector<fs::Path> children = projects_dir.child_paths();
    for (const fs::Path& child : children) {
      std::string name = child.filename();
      if (name.empty() || name[0] == '.' || name[0] == '_') {
        continue;
      }
      if (fs::is_directory(child)) {
        names.insert(name);
      }
    }
  }
  if (natives_) {
    std::vector<std::string> native_projects = natives_->list_projects();
    names.insert(native_projects.begin(), native_projects.end());
  }
  return std::vector<std::string>(names.begin(), names.end());
}

bool MasterPimpl::is_known_project(const std::string& name) const {
  if (name.empty() || name.find('/') != std::string::npos || name[0] == '.') {
    return false;
  }
  fs::Path dir(options_.projects_dir_);
  dir /= name;
  if (fs::is_directory(dir)) {
    return true;
  }
  return natives_ && !natives_->list_functions(name).empty();
}

std::vector<ProjectStatus> MasterPimpl::list_projects() const {
  std::set<std::string> names;
  std::vector<std::string> discovered = discover_projects();
  names.insert(discovered.begin(), discovered.end());
  std::vector<std::string> workers = registry_->list_worker_projects();
  names.insert(workers.begin(), workers.end());
  std::map<std::string, std::string> failed;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    failed = failed_projects_;
  }

  std::vector<ProjectStatus> ret;
  for (const std::string& name : names) {
    ProjectStatus status;
    status.name_ = name;
    status.pid_ = registry_->get_worker_pid(name);
    if (registry_->check_process_status(name)) {
      status.state_ = ProjectStatus::kReady;
    } else if (registry_->is_process_alive(name)) {
      status.state_ = ProjectStatus::kStarting;
    } else if (failed.count(name)) {
      status.state_ = ProjectStatus::kFailed;
      status.failure_ = failed[name];
    } else if (registry_->has_worker(name)) {
      status.state_ = ProjectStatus::kDead;
    } else {
      status.state_ = ProjectStatus::kAbsent;
    }
    ret.push_back(status);
  }
  return ret;
}

////////////////////////////////////////////////////////////////////////////////
///
///      Startup and Shutdown
///
////////////////////////////////////////////////////////////////////////////////
ErrorStack MasterPimpl::start() {
  {
    std::lock_guard<std::mutex> guard(mutex_);
    if (state_ != kMasterStopped) {
      return ERROR_STACK_MSG(kErrorCodeAlreadyInitialized, "master is already started");
    }
    state_ = kMasterInitializing;
    failed_projects_.clear();
  }
  LOG(INFO) << "Starting master. projects_dir=" << options_.projects_dir_;

  ErrorStack registered = registry_->register_component(registry::kComponentMaster, holder_);
  if (registered.is_error()) {
    std::lock_guard<std::mutex> guard(mutex_);
    state_ = kMasterStopped;
    return registered;
  }

  if (api_layer_) {
    ErrorStack api_error = wait_api_layer_ready();
    if (api_error.is_error()) {
      LOG(ERROR) << "API layer failed to start. Stopping master: " << api_error;
      ErrorStack stopped = stop();
      if (stopped.is_error()) {
        LOG(ERROR) << "Errors while stopping master: " << stopped;
      }
      return api_error;
    }
  }

  if (options_.auto_start_projects_) {
    std::vector<std::string> projects = discover_projects();
    LOG(INFO) << "Launching workers for " << projects.size() << " projects";
    for (const std::string& name : projects) {
      std::shared_ptr<std::mutex> project_mutex = get_project_mutex(name);
      std::lock_guard<std::mutex> guard(*project_mutex);
      ErrorStack launched = launch_and_wait(name);
      if (launched.is_error()) {
        set_failed(name, launched.describe_brief());
      }
    }
    std::vector<std::string> failed = get_failed_projects();
    if (!failed.empty()) {
      std::string joined;
      for (const std::string& f : failed) {
        joined += "\n  " + f;
      }
      LOG(ERROR) << failed.size() << " of " << projects.size()
        << " projects failed to start:" << joined;
    }
  }

  {
    std::lock_guard<std::mutex> guard(mutex_);
    state_ = kMasterRunning;
  }
  LOG(INFO) << "Master started";
  return kRetOk;
}

ErrorStack MasterPimpl::wait_api_layer_ready() {
  CHECK_ERROR(registry_->register_component(registry::kComponentApiServer, api_layer_));
  if (!api_layer_->is_initialized()) {
    ErrorStack init_error = api_layer_->initialize();
    if (init_error.is_error()) {
      return ERROR_STACK_MSG(kErrorCodeMasterApiLayerFailed, init_error.describe_brief().c_str());
    }
  }
  const uint64_t timeout_us = static_cast<uint64_t>(options_.api_ready_timeout_ms_) * 1000ULL;
  const uint64_t deadline = assorted::get_now_microsec() + timeout_us;
  while (!api_layer_->is_ready()) {
    if (assorted::get_now_microsec() >= deadline) {
      return ERROR_STACK_MSG(kErrorCodeMasterReadyTimeout, "API layer did not become ready");
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  LOG(INFO) << "API layer is ready";
  return kRetOk;
}

ErrorStack MasterPimpl::stop() {
  {
    std::lock_guard<std::mutex> guard(mutex_);
    if (state_ == kMasterStopped) {
      return kRetOk;
    }
    state_ = kMasterStopping;
  }
  LOG(INFO) << "Stopping master";

  ErrorStackBatch batch;
  std::vector<std::string> workers = registry_->list_worker_projects();
  for (const std::string& name : workers) {
    ErrorStack terminated = registry_->terminate_process(name);
    if (terminated.is_error()) {
      LOG(ERROR) << "Failed to terminate the worker of " << name << ": " << terminated;
      batch.push_back(terminated);
    }
  }

  if (api_layer_) {
    if (api_layer_->is_initialized()) {
      ErrorStack api_error = api_layer_->uninitialize();
      if (api_error.is_error()) {
        LOG(ERROR) << "Failed to stop the API layer: " << api_error;
        batch.push_back(api_error);
      }
    }
    registry_->unregister_component(registry::kComponentApiServer, api_layer_);
  }
  registry_->unregister_component(registry::kComponentMaster, holder_);

  ErrorStack released = registry_->cleanup_resources();
  if (released.is_error()) {
    LOG(ERROR) << "Failed to release registry resources: " << released;
    batch.push_back(released);
  }

  {
    std::lock_guard<std::mutex> guard(mutex_);
    state_ = kMasterStopped;
  }
  LOG(INFO) << "Master stopped";
  return SUMMARIZE_ERROR_BATCH(batch);
}

////////////////////////////////////////////////////////////////////////////////
///
///      Per-project lifecycle
///
////////////////////////////////////////////////////////////////////////////////
ErrorStack MasterPimpl::launch_and_wait(const std::string& name) {
  if (!is_known_project(name)) {
    std::string message = "no such project: " + name;
    return ERROR_STACK_MSG(kErrorCodeMasterProjectUnavailable, message.c_str());
  }
  std::vector<std::string> args;
  if (!registry_->start_project_process(name, make_worker_entry(name), args)) {
    return ERROR_STACK_MSG(kErrorCodeRegistryWorkerStartFailed, name.c_str());
  }
  if (registry_->wait_for_ready(name, options_.worker_ready_timeout_ms_)) {
    clear_failed(name);
    LOG(INFO) << "Worker of " << name << " is ready. pid=" << registry_->get_worker_pid(name);
    return kRetOk;
  }
  if (registry_->is_process_alive(name)) {
    LOG(ERROR) << "Worker of " << name << " did not become ready in "
      << options_.worker_ready_timeout_ms_ << "ms";
    return ERROR_STACK_MSG(kErrorCodeMasterReadyTimeout, name.c_str());
  }
  LOG(ERROR) << "Worker of " << name << " exited before becoming ready";
  ErrorStack cleaned = registry_->cleanup_project(name);
  if (cleaned.is_error()) {
    LOG(ERROR) << "Failed to clean up " << name << ": " << cleaned;
  }
  std::string message = name + " exited before becoming ready";
  return ERROR_STACK_MSG(kErrorCodeMasterWorkerDied, message.c_str());
}

ErrorStack MasterPimpl::ensure_live(const std::string& name) {
  if (registry_->check_process_status(name)) {
    return kRetOk;
  }
  if (registry_->is_process_alive(name)) {
    // still starting
    if (registry_->wait_for_ready(name, options_.worker_ready_timeout_ms_)) {
      return kRetOk;
    }
    if (registry_->is_process_alive(name)) {
      return ERROR_STACK_MSG(kErrorCodeMasterReadyTimeout, name.c_str());
    }
  }
  if (registry_->has_worker(name)) {
    LOG(WARNING) << "Worker of " << name << " is dead. Restarting it";
    ErrorStack cleaned = registry_->cleanup_project(name);
    if (cleaned.is_error()) {
      LOG(ERROR) << "Failed to clean up " << name << ": " << cleaned;
    }
  }

  ErrorStack launched = launch_and_wait(name);
  if (launched.is_error()) {
    set_failed(name, launched.describe_brief());
    std::string message = name + " is unavailable: " + launched.describe_brief();
    return ERROR_STACK_MSG(kErrorCodeMasterProjectUnavailable, message.c_str());
  }
  return kRetOk;
}

ErrorStack MasterPimpl::start_project(const std::string& name) {
  std::shared_ptr<std::mutex> project_mutex = get_project_mutex(name);
  std::lock_guard<std::mutex> guard(*project_mutex);
  return ensure_live(name);
}

ErrorStack MasterPimpl::stop_project(const std::string& name) {
  LOG(INFO) << "Stopping the worker of " << name;
  clear_failed(name);
  return registry_->terminate_process(name);
}

ErrorStack MasterPimpl::restart_project(const std::string& name) {
  LOG(INFO) << "Restarting the worker of " << name;
  CHECK_ERROR(registry_->terminate_process(name));
  std::shared_ptr<std::mutex> project_mutex = get_project_mutex(name);
  std::lock_guard<std::mutex> guard(*project_mutex);
  ErrorStack launched = launch_and_wait(name);
  if (launched.is_error()) {
    set_failed(name, launched.describe_brief());
  }
  return launched;
}

////////////////////////////////////////////////////////////////////////////////
///
///      Execution
///
////////////////////////////////////////////////////////////////////////////////
ErrorStack MasterPimpl::execute_function(
  const std::string& project,
  const std::string& function,
  const std::string& payload,
  std::string* result) {
  if (get_state() != kMasterRunning) {
    return ERROR_STACK(kErrorCodeMasterNotRunning);
  }
  std::shared_ptr<std::mutex> project_mutex = get_project_mutex(project);
  std::lock_guard<std::mutex> guard(*project_mutex);
  CHECK_ERROR(ensure_live(project));

  ErrorStack exchanged = exchange(project, function, payload, result);
  if (exchanged.is_error()
    && exchanged.get_error_code() == kErrorCodeMasterWorkerDied
    && get_state() == kMasterRunning) {
    // the call fails, but the next one finds a fresh worker
    LOG(WARNING) << "Worker of " << project << " died while running " << function;
    ErrorStack cleaned = registry_->cleanup_project(project);
    if (cleaned.is_error()) {
      LOG(ERROR) << "Failed to clean up " << project << ": " << cleaned;
    }
    ErrorStack relaunched = launch_and_wait(project);
    if (relaunched.is_error()) {
      LOG(ERROR) << "Failed to restart " << project << ": " << relaunched;
      set_failed(project, relaunched.describe_brief());
    }
  }
  return exchanged;
}

ErrorStack MasterPimpl::worker_gone(
  const std::string& project,
  const registry::ProjectChannel& channel) const {
  // terminate_process() closes the channel before the worker leaves the registry
  if (channel.is_closed()) {
    std::string message = project + " was stopped during execution";
    return ERROR_STACK_MSG(kErrorCodeMasterProjectUnavailable, message.c_str());
  }
  return ERROR_STACK_MSG(kErrorCodeMasterWorkerDied, project.c_str());
}

ErrorStack MasterPimpl::exchange(
  const std::string& project,
  const std::string& function,
  const std::string& payload,
  std::string* result) {
  std::shared_ptr<registry::ProjectChannel> channel = registry_->get_project_channel(project);
  if (!channel || channel->is_closed()) {
    return ERROR_STACK_MSG(kErrorCodeMasterProjectUnavailable, project.c_str());
  }
  soc::ChannelBlock* block = channel->get_block();
  const uint64_t interval_microsec
    = static_cast<uint64_t>(options_.liveness_check_interval_ms_) * 1000ULL;
  const uint64_t started = assorted::get_now_microsec();
  const uint64_t timeout_microsec
    = static_cast<uint64_t>(options_.execution_timeout_ms_) * 1000ULL;

  VLOG(0) << "Executing " << project << "/" << function;
  soc::ChannelMessage request = soc::ChannelMessage::make_execute(function, payload);
  while (true) {
    ErrorCode sent = block->send_request(request, interval_microsec);
    if (sent == kErrorCodeOk) {
      break;
    } else if (sent == kErrorCodeTimeout) {
      if (!registry_->is_process_alive(project)) {
        return worker_gone(project, *channel);
      }
      continue;
    } else if (sent == kErrorCodeChannelClosed) {
      std::string message = project + " was stopped";
      return ERROR_STACK_MSG(kErrorCodeMasterProjectUnavailable, message.c_str());
    }
    return ERROR_STACK(sent);
  }

  soc::ChannelMessage response;
  while (true) {
    ErrorCode received = block->receive_response(&response, interval_microsec);
    if (received == kErrorCodeOk) {
      break;
    } else if (received == kErrorCodeTimeout) {
      if (!registry_->is_process_alive(project)) {
        return worker_gone(project, *channel);
      }
      if (timeout_microsec > 0 && assorted::get_now_microsec() - started >= timeout_microsec) {
        LOG(ERROR) << project << "/" << function << " timed out. Terminating the worker";
        ErrorStack terminated = registry_->terminate_process(project);
        if (terminated.is_error()) {
          LOG(ERROR) << "Failed to terminate " << project << ": " << terminated;
        }
        std::string message = project + "/" + function;
        return ERROR_STACK_MSG(kErrorCodeMasterExecutionTimeout, message.c_str());
      }
      continue;
    } else if (received == kErrorCodeChannelClosed) {
      std::string message = project + " was stopped during execution";
      return ERROR_STACK_MSG(kErrorCodeMasterProjectUnavailable, message.c_str());
    }
    return ERROR_STACK(received);
  }

  if (response.type_ == soc::ChannelMessage::kSuccess) {
    *result = response.body_;
    return kRetOk;
  } else if (response.type_ != soc::ChannelMessage::kError) {
    return ERROR_STACK(kErrorCodeChannelMalformedMessage);
  }

  // rejections keep their own code. anything else is an execution error.
  ErrorCode worker_code = get_error_code_by_name(response.name_.c_str());
  if (worker_code == kErrorCodeWorkerFunctionNotFound
    || worker_code == kErrorCodeWorkerEntryPointMissing
    || worker_code == kErrorCodeWorkerNotInitialized) {
    return ERROR_STACK_MSG(worker_code, response.body_.c_str());
  }
  std::string message = response.name_ + ": " + response.body_;
  return ERROR_STACK_MSG(kErrorCodeFunctionExecutionFailed, message.c_str());
}

}  // namespace master
}  // namespace cloudfn
