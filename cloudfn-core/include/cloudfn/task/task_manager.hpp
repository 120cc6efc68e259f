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
#ifndef CLOUDFN_TASK_TASK_MANAGER_HPP_
#define CLOUDFN_TASK_TASK_MANAGER_HPP_
#include <stdint.h>

#include <string>
#include <vector>

#include "cloudfn/cxx11.hpp"
#include "cloudfn/error_stack.hpp"
#include "cloudfn/initializable.hpp"
#include "cloudfn/master/fwd.hpp"
#include "cloudfn/registry/component.hpp"
#include "cloudfn/registry/fwd.hpp"
#include "cloudfn/task/fwd.hpp"
#include "cloudfn/task/task.hpp"

namespace cloudfn {
namespace task {

/** @brief Criteria of TaskManager::list_tasks(). Empty criteria match everything. */
struct TaskFilter {
  TaskFilter() : filter_status_(false), status_(kTaskCreated) {}

  /** Only tasks of this project. Empty for all projects. */
  std::string project_name_;
  /** Whether status_ is a criterion. */
  bool        filter_status_;
  TaskStatus  status_;

  bool        matches(const Task& task) const;
};

/**
 * @brief Runs functions asynchronously as tasks and keeps their records.
 * @ingroup TASK
 * @details
 * See the task namespace for the task model.
 *
 * @par Threads
 * Tasks run on a pool of TaskOptions::execution_threads_ threads. Another thread sweeps
 * records older than TaskOptions::retention_days_. The scheduler has its own thread.
 * All public methods are thread-safe.
 *
 * @par Restart recovery
 * initialize() marks records left in created or running state as failed, because nothing
 * runs them anymore.
 *
 * @par Shutdown
 * uninitialize() waits for running executions. Stop the invoker first (eg Master::stop()),
 * which makes pending executions fail quickly.
 */
class TaskManager CXX11_FINAL : public registry::Component, public DefaultInitializable {
 public:
  /**
   * @param[in] registry not owned. Holds the per-task channels.
   * @param[in] invoker not owned. Usually the master::Master.
   */
  TaskManager(
    registry::CoordinationRegistry* registry,
    master::FunctionInvoker* invoker,
    const TaskOptions& options);
  ~TaskManager();

  TaskManager() CXX11_FUNC_DELETE;
  TaskManager(const TaskManager&) CXX11_FUNC_DELETE;
  TaskManager& operator=(const TaskManager&) CXX11_FUNC_DELETE;

  const char* get_component_name() const CXX11_OVERRIDE;
  const TaskOptions& get_options() const;

  /** Jobs fired by the scheduler while initialized. Call before initialize(). */
  void        set_schedule(const ScheduleDefinition& schedule);
  /** Null unless initialized with a non-empty schedule. */
  Scheduler*  get_scheduler() const;

  ErrorStack  initialize_once() CXX11_OVERRIDE;
  ErrorStack  uninitialize_once() CXX11_OVERRIDE;

  /**
   * Creates a task and starts it in the background, or returns the active task of the same
   * project and function if there is one.
   * @param[out] out the created or the active task
   */
  ErrorStack  create_task(
    const std::string& project,
    const std::string& function,
    const std::string& payload,
    Task* out);

  /**
   * Looks in memory first, then on disk.
   * @param[out] found false if the task is known nowhere, which is not an error
   */
  ErrorStack  get_task_status(const std::string& task_id, Task* out, bool* found);

  /** Tasks on disk and in memory that match the filter, ordered by creation. */
  ErrorStack  list_tasks(const TaskFilter& filter, std::vector<Task>* out);

  /**
   * Cancels a created or running task. Tasks in other states and unknown tasks are left as
   * they are, which is not an error.
   * @param[out] cancelled whether this call cancelled the task
   */
  ErrorStack  cancel_task(const std::string& task_id, bool* cancelled);

  /**
   * Removes records whose age in whole days is more than the given days.
   * A record 7.5 days old counts as 7 days old. Active tasks are kept.
   * @param[out] removed number of removed records
   */
  ErrorStack  cleanup_old_tasks(uint32_t days, uint32_t* removed);

  /**
   * Blocks until the task reaches a terminal status or the timeout.
   * @return whether the task is terminal. out is set whenever the task is known.
   */
  bool        wait_for_task(const std::string& task_id, uint64_t timeout_ms, Task* out);

 private:
  TaskManagerPimpl* pimpl_;
};

}  // namespace task
}  // namespace cloudfn
#endif  // CLOUDFN_TASK_TASK_MANAGER_HPP_
