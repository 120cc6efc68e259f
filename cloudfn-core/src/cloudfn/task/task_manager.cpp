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
#include "cloudfn/task/task_manager.hpp"

#include <string>
#include <vector>

#include "cloudfn/registry/coordination_registry.hpp"
#include "cloudfn/task/task_manager_pimpl.hpp"

namespace cloudfn {
namespace task {
bool TaskFilter::matches(const Task& task) const {
  if (!project_name_.empty() && task.project_name_ != project_name_) {
    return false;
  }
  if (filter_status_ && task.status_ != status_) {
    return false;
  }
  return true;
}

TaskManager::TaskManager(
  registry::CoordinationRegistry* registry,
  master::FunctionInvoker* invoker,
  const TaskOptions& options) : pimpl_(nullptr) {
  pimpl_ = new TaskManagerPimpl(this, registry, invoker, options);
}
TaskManager::~TaskManager() {
  delete pimpl_;
  pimpl_ = nullptr;
}

const char* TaskManager::get_component_name() const { return registry::kComponentTaskManager; }
const TaskOptions& TaskManager::get_options() const { return pimpl_->options_; }
void TaskManager::set_schedule(const ScheduleDefinition& schedule) {
  pimpl_->schedule_ = schedule;
}
Scheduler* TaskManager::get_scheduler() const { return pimpl_->scheduler_.get(); }

ErrorStack TaskManager::initialize_once() { return pimpl_->initialize_once(); }
ErrorStack TaskManager::uninitialize_once() { return pimpl_->uninitialize_once(); }

ErrorStack TaskManager::create_task(
  const std::string& project,
  const std::string& function,
  const std::string& payload,
  Task* out) {
  if (!is_initialized()) {
    return ERROR_STACK(kErrorCodeNotInitialized);
  }
  return pimpl_->create_task(project, function, payload, out);
}

ErrorStack TaskManager::get_task_status(const std::string& task_id, Task* out, bool* found) {
  return pimpl_->get_task_status(task_id, out, found);
}

ErrorStack TaskManager::list_tasks(const TaskFilter& filter, std::vector<Task>* out) {
  return pimpl_->list_tasks(filter, out);
}

ErrorStack TaskManager::cancel_task(const std::string& task_id, bool* cancelled) {
  return pimpl_->cancel_task(task_id, cancelled);
}

ErrorStack TaskManager::cleanup_old_tasks(uint32_t days, uint32_t* removed) {
  return pimpl_->cleanup_old_tasks(days, removed);
}

bool TaskManager::wait_for_task(const std::string& task_id, uint64_t timeout_ms, Task* out) {
  return pimpl_->wait_for_task(task_id, timeout_ms, out);
}

}  // namespace task
}  // namespace cloudfn
