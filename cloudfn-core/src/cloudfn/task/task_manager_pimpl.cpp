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
#include "cloudfn/task/task_manager_pimpl.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

#include "cloudfn/error_code.hpp"
#include "cloudfn/assorted/assorted_func.hpp"
#include "cloudfn/registry/project_channel.hpp"

namespace cloudfn {
namespace task {
const uint64_t kMicrosecPerDay = 24ULL * 3600ULL * 1000000ULL;

TaskManagerPimpl::TaskManagerPimpl(
  TaskManager* holder,
  registry::CoordinationRegistry* registry,
  master::FunctionInvoker* invoker,
  const TaskOptions& options)
  : holder_(holder),
    registry_(registry),
    invoker_(invoker),
    options_(options),
    store_(fs::Path(options.task_dir_)) {
}

ErrorStack TaskManagerPimpl::initialize_once() {
  LOG(INFO) << "Initializing task manager. task_dir=" << options_.task_dir_;
  CHECK_ERROR(store_.prepare());
  CHECK_ERROR(recover_interrupted_tasks());
  executor_.reset(new thread::BoundedThreadPool("task_runner", options_.execution_threads_));
  CHECK_ERROR(registry_->register_component(registry::kComponentTaskManager, holder_));

  if (options_.cleanup_interval_ms_ > 0) {
    sweeper_.launch(
      "task_sweeper",
      std::chrono::milliseconds(options_.cleanup_interval_ms_),
      [this](thread::StoppableThread* me) { handle_sweeper(me); });
  }
  if (!schedule_.jobs_.empty()) {
    scheduler_.reset(new Scheduler(holder_, schedule_, options_.scheduler_interval_ms_));
    CHECK_ERROR(scheduler_->start());
  }
  return kRetOk;
}

ErrorStack TaskManagerPimpl::uninitialize_once() {
  LOG(INFO) << "Uninitializing task manager";
  if (scheduler_) {
    scheduler_->stop();
    scheduler_.reset();
  }
  sweeper_.stop();
  if (executor_) {
    // tasks still waiting in the pool stay created on disk, and become failed on restart
    executor_->stop();
    executor_.reset();
  }
  registry_->unregister_component(registry::kComponentTaskManager, holder_);
  std::lock_guard<std::mutex> guard(mutex_);
  tasks_.clear();
  active_.clear();
  return kRetOk;
}

void TaskManagerPimpl::handle_sweeper(thread::StoppableThread* me) {
  while (!me->sleep()) {
    uint32_t removed = 0;
    ErrorStack swept = cleanup_old_tasks(options_.retention_days_, &removed);
    if (swept.is_error()) {
      LOG(ERROR) << "Task sweeper failed: " << swept;
    } else if (removed > 0) {
      LOG(INFO) << "Task sweeper removed " << removed << " records";
    }
  }
}

ErrorStack TaskManagerPimpl::recover_interrupted_tasks() {
  std::vector<std::string> ids;
  CHECK_ERROR(store_.list_ids(&ids));
  uint32_t recovered = 0;
  for (const std::string& id : ids) {
    Task task;
    bool found = false;
    ErrorStack loaded = store_.load(id, &task, &found);
    if (loaded.is_error()) {
      LOG(WARNING) << "Skipped an unreadable task record " << id << ": " << loaded;
      continue;
    }
    if (!found || !task.is_active()) {
      continue;
    }
    task.error_ = std::string(get_error_message(kErrorCodeTaskInterrupted)) + " while "
      + to_status_name(task.status_);
    task.transition(kTaskFailed);
    CHECK_ERROR(store_.save(task));
    ++recovered;
  }
  if (recovered > 0) {
    LOG(WARNING) << "Marked " << recovered << " interrupted tasks as failed";
  }
  return kRetOk;
}

void TaskManagerPimpl::notify_changed() {
  task_changed_.notify_all([]{});
}

void TaskManagerPimpl::persist_locked(const Task& task) {
  ErrorStack saved = store_.save(task);
  if (saved.is_error()) {
    LOG(ERROR) << "Failed to write the record of " << task.task_id_ << ": " << saved;
  }
}

void TaskManagerPimpl::release_active_locked(const Task& task) {
  std::map<FunctionKey, std::string>::iterator it
    = active_.find(FunctionKey(task.project_name_, task.function_name_));
  if (it != active_.end() && it->second == task.task_id_) {
    active_.erase(it);
  }
}

////////////////////////////////////////////////////////////////////////////////
///
///      Creation and execution
///
////////////////////////////////////////////////////////////////////////////////
ErrorStack TaskManagerPimpl::create_task(
  const std::string& project,
  const std::string& function,
  const std::string& payload,
  Task* out) {
  if (project.empty() || function.empty()
    || project.find('/') != std::string::npos || function.find('/') != std::string::npos) {
    std::string message = "invalid function: " + project + "/" + function;
    return ERROR_STACK_MSG(kErrorCodeInvalidParameter, message.c_str());
  }

  std::string task_id;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    FunctionKey key(project, function);
    std::map<FunctionKey, std::string>::const_iterator active = active_.find(key);
    if (active != active_.end()) {
      *out = tasks_[active->second];
      VLOG(0) << "Returning the active task " << out->task_id_;
      return kRetOk;
    }

    Task task;
    task.task_id_ = Task::generate_task_id(project, function);
    task.project_name_ = project;
    task.function_name_ = function;
    task.payload_ = payload;
    task.created_at_ = assorted::format_iso8601(assorted::get_now_microsec());
    task.transition(kTaskCreated);

    std::shared_ptr<registry::ProjectChannel> channel;
    CHECK_ERROR(registry_->get_or_create_task_channel(task.task_id_, &channel));
    ErrorStack saved = store_.save(task);
    if (saved.is_error()) {
      registry_->cleanup_task_resources(task.task_id_);
      return saved;
    }
    tasks_[task.task_id_] = task;
    active_[key] = task.task_id_;
    task_id = task.task_id_;
    *out = task;
  }
  LOG(INFO) << "Created task " << task_id;

  std::shared_ptr<thread::PoolJob> job;
  if (executor_) {
    job = executor_->submit([this, task_id]() { return run_task(task_id); });
  }
  if (!job) {
    std::lock_guard<std::mutex> guard(mutex_);
    Task& task = tasks_[task_id];
    if (task.status_ == kTaskCreated) {
      task.error_ = get_error_message(kErrorCodeWorkerPoolStopped);
      task.transition(kTaskFailed);
      persist_locked(task);
    }
    release_active_locked(task);
    *out = task;
    registry_->cleanup_task_resources(task_id);
  }
  return kRetOk;
}

ErrorStack TaskManagerPimpl::run_task(const std::string& task_id) {
  Task task;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    std::map<std::string, Task>::iterator it = tasks_.find(task_id);
    if (it == tasks_.end()) {
      LOG(ERROR) << "Task " << task_id << " vanished before running";
      return kRetOk;
    }
    if (it->second.status_ != kTaskCreated) {
      VLOG(0) << "Task " << task_id << " is " << to_status_name(it->second.status_)
        << ". Not running it";
      return kRetOk;
    }
    it->second.transition(kTaskRunning);
    persist_locked(it->second);
    task = it->second;
  }
  notify_changed();

  std::string result;
  ErrorStack executed = invoker_->execute_function(
    task.project_name_,
    task.function_name_,
    task.payload_,
    &result);

  {
    std::lock_guard<std::mutex> guard(mutex_);
    std::map<std::string, Task>::iterator it = tasks_.find(task_id);
    if (it != tasks_.end()) {
      Task& current = it->second;
      if (current.status_ == kTaskRunning) {
        if (executed.is_error()) {
          current.error_ = executed.describe_brief();
          current.transition(kTaskFailed);
          LOG(WARNING) << "Task " << task_id << " failed: " << executed;
        } else {
          current.result_ = result;
          current.transition(kTaskCompleted);
          VLOG(0) << "Task " << task_id << " completed";
        }
        persist_locked(current);
      } else {
        LOG(INFO) << "Task " << task_id << " became " << to_status_name(current.status_)
          << " while running. Discarding its outcome";
      }
      release_active_locked(current);
    }
  }
  registry_->cleanup_task_resources(task_id);
  notify_changed();
  return kRetOk;
}

////////////////////////////////////////////////////////////////////////////////
///
///      Queries
///
////////////////////////////////////////////////////////////////////////////////
ErrorStack TaskManagerPimpl::get_task_status(
  const std::string& task_id,
  Task* out,
  bool* found) {
  std::lock_guard<std::mutex> guard(mutex_);
  std::map<std::string, Task>::const_iterator it = tasks_.find(task_id);
  if (it != tasks_.end()) {
    *out = it->second;
    *found = true;
    return kRetOk;
  }
  CHECK_ERROR(store_.load(task_id, out, found));
  if (*found) {
    tasks_[task_id] = *out;
  }
  return kRetOk;
}

ErrorStack TaskManagerPimpl::list_tasks(const TaskFilter& filter, std::vector<Task>* out) {
  out->clear();
  std::vector<std::string> ids;
  CHECK_ERROR(store_.list_ids(&ids));

  std::lock_guard<std::mutex> guard(mutex_);
  std::map<std::string, Task> merged;
  for (const std::string& id : ids) {
    if (tasks_.count(id)) {
      continue;
    }
    Task task;
    bool found = false;
    ErrorStack loaded = store_.load(id, &task, &found);
    if (loaded.is_error()) {
      LOG(WARNING) << "Skipped an unreadable task record " << id << ": " << loaded;
      continue;
    }
    if (found) {
      merged[id] = task;
    }
  }
  for (std::map<std::string, Task>::const_iterator it = tasks_.begin(); it != tasks_.end(); ++it) {
    merged[it->first] = it->second;
  }

  for (std::map<std::string, Task>::const_iterator it = merged.begin(); it != merged.end(); ++it) {
    if (filter.matches(it->second)) {
      out->push_back(it->second);
    }
  }
  std::stable_sort(out->begin(), out->end(), [](const Task& left, const Task& right) {
    return left.created_at_ < right.created_at_;
  });
  return kRetOk;
}

bool TaskManagerPimpl::wait_for_task(const std::string& task_id, uint64_t timeout_ms, Task* out) {
  bool known = false;
  bool terminal = false;
  auto check = [this, &task_id, out, &known, &terminal]() {
    std::lock_guard<std::mutex> guard(mutex_);
    std::map<std::string, Task>::const_iterator it = tasks_.find(task_id);
    if (it == tasks_.end()) {
      return false;
    }
    known = true;
    *out = it->second;
    terminal = !it->second.is_active();
    return terminal;
  };
  task_changed_.wait_for(std::chrono::milliseconds(timeout_ms), check);
  if (!known) {
    // not in memory. maybe only on disk.
    Task task;
    bool found = false;
    ErrorStack loaded = get_task_status(task_id, &task, &found);
    if (loaded.is_error()) {
      LOG(WARNING) << "Failed to read task " << task_id << ": " << loaded;
      return false;
    }
    if (found) {
      *out = task;
      terminal = !task.is_active();
    }
  }
  return terminal;
}

////////////////////////////////////////////////////////////////////////////////
///
///      Cancellation and cleanup
///
////////////////////////////////////////////////////////////////////////////////
ErrorStack TaskManagerPimpl::cancel_task(const std::string& task_id, bool* cancelled) {
  *cancelled = false;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    std::map<std::string, Task>::iterator it = tasks_.find(task_id);
    if (it == tasks_.end()) {
      Task task;
      bool found = false;
      CHECK_ERROR(store_.load(task_id, &task, &found));
      if (!found) {
        VLOG(0) << "No task to cancel: " << task_id;
        return kRetOk;
      }
      it = tasks_.insert(std::make_pair(task_id, task)).first;
    }
    Task& task = it->second;
    if (!task.is_active()) {
      VLOG(0) << "Task " << task_id << " is already " << to_status_name(task.status_);
      return kRetOk;
    }
    TaskStatus previous = task.status_;
    task.transition(kTaskCancelled);
    ErrorStack saved = store_.save(task);
    if (saved.is_error()) {
      task.transition(previous);
      return saved;
    }
    release_active_locked(task);
    *cancelled = true;
  }
  LOG(INFO) << "Cancelled task " << task_id;
  registry_->cleanup_task_resources(task_id);
  notify_changed();
  return kRetOk;
}

ErrorStack TaskManagerPimpl::cleanup_old_tasks(uint32_t days, uint32_t* removed) {
  *removed = 0;
  std::vector<std::string> ids;
  CHECK_ERROR(store_.list_ids(&ids));
  const uint64_t now = assorted::get_now_microsec();

  for (const std::string& id : ids) {
    std::lock_guard<std::mutex> guard(mutex_);
    std::map<std::string, Task>::const_iterator it = tasks_.find(id);
    if (it != tasks_.end() && it->second.is_active()) {
      continue;
    }
    Task task;
    bool found = false;
    ErrorStack loaded = store_.load(id, &task, &found);
    if (loaded.is_error()) {
      LOG(WARNING) << "Skipped an unreadable task record " << id << ": " << loaded;
      continue;
    }
    if (!found) {
      continue;
    }
    uint64_t created = task.get_created_at_microsec();
    if (created == 0 || created > now) {
      continue;
    }
    // only whole elapsed days count. a record 7.5 days old is 7 days old.
    uint64_t elapsed_days = (now - created) / kMicrosecPerDay;
    if (elapsed_days <= days) {
      continue;
    }
    CHECK_ERROR(store_.remove(id));
    tasks_.erase(id);
    ++(*removed);
  }
  if (*removed > 0) {
    LOG(INFO) << "Removed " << *removed << " task records older than " << days << " days";
  }
  return kRetOk;
}

}  // namespace task
}  // namespace cloudfn
