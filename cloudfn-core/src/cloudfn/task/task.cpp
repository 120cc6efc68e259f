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
#include "cloudfn/task/task.hpp"

#include <string>

#include "cloudfn/error_code.hpp"
#include "cloudfn/assorted/assorted_func.hpp"
#include "cloudfn/externalize/externalizable.hpp"

namespace cloudfn {
namespace task {
const char* to_status_name(TaskStatus status) {
  switch (status) {
  case kTaskCreated: return "created";
  case kTaskRunning: return "running";
  case kTaskCompleted: return "completed";
  case kTaskFailed: return "failed";
  case kTaskCancelled: return "cancelled";
  default: return "unknown";
  }
}

bool parse_status_name(const std::string& name, TaskStatus* out) {
  const TaskStatus kAll[] = {
    kTaskCreated, kTaskRunning, kTaskCompleted, kTaskFailed, kTaskCancelled
  };
  for (TaskStatus status : kAll) {
    if (name == to_status_name(status)) {
      *out = status;
      return true;
    }
  }
  return false;
}

Task::Task() : status_(kTaskCreated) {
}

void Task::transition(TaskStatus status) {
  status_ = status;
  updated_at_ = assorted::format_iso8601(assorted::get_now_microsec());
}

uint64_t Task::get_created_at_microsec() const {
  uint64_t ret = 0;
  if (!assorted::parse_iso8601(created_at_, &ret)) {
    return 0;
  }
  return ret;
}

std::string Task::generate_task_id(const std::string& project, const std::string& function) {
  return project + "_" + function + "_" + assorted::generate_uuid();
}

ErrorStack Task::load(tinyxml2::XMLElement* element) {
  EXTERNALIZE_LOAD_ELEMENT(element, task_id_);
  EXTERNALIZE_LOAD_ELEMENT(element, project_name_);
  EXTERNALIZE_LOAD_ELEMENT(element, function_name_);
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, payload_, "");
  std::string status;
  CHECK_ERROR(get_element(element, "status_", &status));
  if (!parse_status_name(status, &status_)) {
    return ERROR_STACK_MSG(kErrorCodeTaskInvalidStatus, status.c_str());
  }
  EXTERNALIZE_LOAD_ELEMENT(element, created_at_);
  EXTERNALIZE_LOAD_ELEMENT(element, updated_at_);
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, result_, "");
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, error_, "");
  return kRetOk;
}

ErrorStack Task::save(tinyxml2::XMLElement* element) const {
  EXTERNALIZE_SAVE_ELEMENT(element, task_id_, "");
  EXTERNALIZE_SAVE_ELEMENT(element, project_name_, "");
  EXTERNALIZE_SAVE_ELEMENT(element, function_name_, "");
  EXTERNALIZE_SAVE_ELEMENT(element, payload_, "");
  std::string status(to_status_name(status_));
  CHECK_ERROR(add_element(element, "status_", "", status));
  EXTERNALIZE_SAVE_ELEMENT(element, created_at_, "");
  EXTERNALIZE_SAVE_ELEMENT(element, updated_at_, "");
  EXTERNALIZE_SAVE_ELEMENT(element, result_, "");
  EXTERNALIZE_SAVE_ELEMENT(element, error_, "");
  return kRetOk;
}

}  // namespace task
}  // namespace cloudfn
