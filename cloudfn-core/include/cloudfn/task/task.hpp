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
#ifndef CLOUDFN_TASK_TASK_HPP_
#define CLOUDFN_TASK_TASK_HPP_
#include <stdint.h>

#include <string>

#include "cloudfn/cxx11.hpp"
#include "cloudfn/externalize/externalizable.hpp"

namespace cloudfn {
namespace task {

enum TaskStatus {
  kTaskCreated = 0,
  kTaskRunning,
  kTaskCompleted,
  kTaskFailed,
  kTaskCancelled,
};
/** "created", "running", "completed", "failed" or "cancelled". */
const char* to_status_name(TaskStatus status);
/** @return false if the name is not one of to_status_name() */
bool        parse_status_name(const std::string& name, TaskStatus* out);
inline bool is_active_status(TaskStatus status) {
  return status == kTaskCreated || status == kTaskRunning;
}

/**
 * @brief Record of one asynchronous execution.
 * @ingroup TASK
 * @details
 * Persisted as one XML document per task. Timestamps are ISO-8601 in UTC.
 * This is a POD struct. Default destructor/copy-constructor/assignment operator work fine.
 */
struct Task CXX11_FINAL : public virtual externalize::Externalizable {
  Task();

  /** "<project>_<function>_<uuid>" */
  std::string task_id_;
  std::string project_name_;
  std::string function_name_;
  std::string payload_;
  TaskStatus  status_;
  std::string created_at_;
  std::string updated_at_;
  /** What the function returned. Set when completed. */
  std::string result_;
  /** Why the task failed. Set when failed. */
  std::string error_;

  bool        is_active() const { return is_active_status(status_); }
  /** Sets the status and updated_at_ to now. */
  void        transition(TaskStatus status);
  /** Microseconds since the epoch of created_at_, 0 if it can't be parsed. */
  uint64_t    get_created_at_microsec() const;

  static std::string generate_task_id(const std::string& project, const std::string& function);

  EXTERNALIZABLE(Task);
};

}  // namespace task
}  // namespace cloudfn
#endif  // CLOUDFN_TASK_TASK_HPP_
