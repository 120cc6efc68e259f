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
#ifndef CLOUDFN_TASK_TASK_OPTIONS_HPP_
#define CLOUDFN_TASK_TASK_OPTIONS_HPP_
#include <stdint.h>

#include <string>

#include "cloudfn/cxx11.hpp"
#include "cloudfn/externalize/externalizable.hpp"

namespace cloudfn {
namespace task {
/**
 * @brief Set of options for TaskManager and its scheduler.
 * @ingroup TASK
 * @details
 * This is a POD struct. Default destructor/copy-constructor/assignment operator work fine.
 */
struct TaskOptions CXX11_FINAL : public virtual externalize::Externalizable {
  enum Constants {
    kDefaultExecutionThreads = 10,
    kDefaultRetentionDays = 7,
    kDefaultCleanupIntervalMs = 3600000,
    kDefaultSchedulerIntervalMs = 1000,
  };
  /** Default value for task_dir_. */
  static const char* kDefaultTaskDir;

  TaskOptions();

  /** Directory of task records, one XML file per task. */
  std::string task_dir_;

  /** Number of tasks executed concurrently. Further tasks wait in created state. */
  uint32_t    execution_threads_;

  /**
   * System-wide schedule definition. Empty for none.
   * Each project may additionally have a schedule.xml in its directory.
   */
  std::string schedule_file_;

  /** The sweeper removes task records created more than this many days ago. */
  uint32_t    retention_days_;

  /** Interval of the sweeper in milliseconds. 0 disables the sweeper. */
  uint32_t    cleanup_interval_ms_;

  /** Interval at which the scheduler looks for due jobs. */
  uint32_t    scheduler_interval_ms_;

  EXTERNALIZABLE(TaskOptions);
};
}  // namespace task
}  // namespace cloudfn
#endif  // CLOUDFN_TASK_TASK_OPTIONS_HPP_
