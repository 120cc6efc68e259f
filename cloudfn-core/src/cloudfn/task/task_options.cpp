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
#include "cloudfn/task/task_options.hpp"

#include "cloudfn/externalize/externalizable.hpp"

namespace cloudfn {
namespace task {
const char* TaskOptions::kDefaultTaskDir = "/tmp/cloudfn/tasks";

TaskOptions::TaskOptions() :
  task_dir_(kDefaultTaskDir),
  execution_threads_(kDefaultExecutionThreads),
  schedule_file_(""),
  retention_days_(kDefaultRetentionDays),
  cleanup_interval_ms_(kDefaultCleanupIntervalMs),
  scheduler_interval_ms_(kDefaultSchedulerIntervalMs) {
}

ErrorStack TaskOptions::load(tinyxml2::XMLElement* element) {
  EXTERNALIZE_LOAD_ELEMENT(element, task_dir_);
  EXTERNALIZE_LOAD_ELEMENT(element, execution_threads_);
  EXTERNALIZE_LOAD_ELEMENT(element, schedule_file_);
  EXTERNALIZE_LOAD_ELEMENT(element, retention_days_);
  EXTERNALIZE_LOAD_ELEMENT(element, cleanup_interval_ms_);
  EXTERNALIZE_LOAD_ELEMENT(element, scheduler_interval_ms_);
  if (execution_threads_ == 0) {
    return ERROR_STACK_MSG(kErrorCodeConfValueOutofrange, "execution_threads_ is 0");
  }
  if (scheduler_interval_ms_ == 0) {
    return ERROR_STACK_MSG(kErrorCodeConfValueOutofrange, "scheduler_interval_ms_ is 0");
  }
  return kRetOk;
}

ErrorStack TaskOptions::save(tinyxml2::XMLElement* element) const {
  CHECK_ERROR(insert_comment(element, "Set of options for the task manager"));

  EXTERNALIZE_SAVE_ELEMENT(element, task_dir_,
    "Directory of task records, one XML file per task.");
  EXTERNALIZE_SAVE_ELEMENT(element, execution_threads_,
    "Number of tasks executed concurrently.");
  EXTERNALIZE_SAVE_ELEMENT(element, schedule_file_,
    "System-wide schedule definition. Empty for none. Projects may also have schedule.xml.");
  EXTERNALIZE_SAVE_ELEMENT(element, retention_days_,
    "Task records created more than this many days ago are removed by the sweeper.");
  EXTERNALIZE_SAVE_ELEMENT(element, cleanup_interval_ms_,
    "Interval of the sweeper in milliseconds. 0 disables it.");
  EXTERNALIZE_SAVE_ELEMENT(element, scheduler_interval_ms_,
    "Interval in milliseconds at which the scheduler looks for due jobs.");
  return kRetOk;
}

}  // namespace task
}  // namespace cloudfn
