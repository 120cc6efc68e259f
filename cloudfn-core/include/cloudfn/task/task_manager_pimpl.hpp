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
#ifndef CLOUDFN_TASK_TASK_MANAGER_PIMPL_HPP_
#define CLOUDFN_TASK_TASK_MANAGER_PIMPL_HPP_
#include <stdint.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "cloudfn/error_stack.hpp"
#include "cloudfn/master/function_invoker.hpp"
#include "cloudfn/registry/coordination_registry.hpp"
#include "cloudfn/task/scheduled_job.hpp"
#include "cloudfn/task/scheduler.hpp"
#include "cloudfn/task/task.hpp"
#include "cloudfn/task/task_manager.hpp"
#include "cloudfn/task/task_options.hpp"
#include "cloudfn/task/task_store.hpp"
#include "cloudfn/thread/bounded_thread_pool_impl.hpp"
#include "cloudfn/thread/condition_variable_impl.hpp"
#include "cloudfn/thread/stoppable_thread_impl.hpp"

namespace cloudfn {
namespace task {
/**
 * @brief Pimpl object of TaskManager.
 * @ingroup TASK
 * @details
 * tasks_ and active_ are protected by mutex_. Every record write of a task happens with
 * mutex_ held, so records are never written concurrently for the same task.
 * task_changed_ is notified after a task changes, without holding mutex_.
 */
class TaskManagerPimpl final {
 public:
  typedef std::pair<std::string, std::string> FunctionKey;

  TaskManagerPimpl() = delete;
  TaskManagerPimpl(
    TaskManager* holder,
    registry::CoordinationRegistry* registry,
    master::FunctionInvoker* invoker,
    const TaskOptions& options);

  ErrorStack  initialize_once();
  ErrorStack  uninitialize_once();

  ErrorStack  create_task(
    const std::string& project,
    const std::string& function,
    const std::string& payload,
    Task* out);
  ErrorStack  get_task_status(const std::string& task_id, Task* out, bool* found);
  ErrorStack  list_tasks(const TaskFilter& filter, std::vector<Task>* out);
  ErrorStack  cancel_task(const std::string& task_id, bool* cancelled);
  ErrorStack  cleanup_old_tasks(uint32_t days, uint32_t* removed);
  bool        wait_for_task(const std::string& task_id, uint64_t timeout_ms, Task* out);

  /** Body of a pool job. Runs one task from created to a terminal status. */
  ErrorStack  run_task(const std::string& task_id);
  /** Marks records in created or running state as failed. */
  ErrorStack  recover_interrupted_tasks();
  /** Drops the dedup entry if it points to the task. Caller holds mutex_. */
  void        release_active_locked(const Task& task);
  /** Writes the record and logs a failure. Caller holds mutex_. */
  void        persist_locked(const Task& task);
  void        notify_changed();
  void        handle_sweeper(thread::StoppableThread* me);

  TaskManager* const                holder_;
  registry::CoordinationRegistry* const registry_;
  master::FunctionInvoker* const    invoker_;
  const TaskOptions                 options_;
  TaskStore                         store_;
  ScheduleDefinition                schedule_;

  std::mutex                        mutex_;
  std::map<std::string, Task>       tasks_;
  /** Active task id of each (project, function). */
  std::map<FunctionKey, std::string> active_;
  thread::ConditionVariable         task_changed_;

  std::unique_ptr<thread::BoundedThreadPool> executor_;
  thread::StoppableThread           sweeper_;
  std::unique_ptr<Scheduler>        scheduler_;
};

}  // namespace task
}  // namespace cloudfn
#endif  // CLOUDFN_TASK_TASK_MANAGER_PIMPL_HPP_
