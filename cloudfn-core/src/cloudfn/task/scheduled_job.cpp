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
#include "cloudfn/task/scheduled_job.hpp"

#include <glog/logging.h>

#include <set>
#include <string>
#include <vector>

#include "cloudfn/error_code.hpp"
#include "cloudfn/externalize/externalizable.hpp"
#include "cloudfn/fs/filesystem.hpp"
#include "cloudfn/task/cron_expression.hpp"

namespace cloudfn {
namespace task {
const char* ScheduleDefinition::kProjectScheduleFile = "schedule.xml";

ScheduledJob::ScheduledJob() : payload_("{}"), enabled_(true) {
}

ErrorStack ScheduledJob::load(tinyxml2::XMLElement* element) {
  EXTERNALIZE_LOAD_ELEMENT(element, job_id_);
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, project_name_, "");
  EXTERNALIZE_LOAD_ELEMENT(element, function_name_);
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, payload_, "{}");
  EXTERNALIZE_LOAD_ELEMENT(element, cron_);
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, enabled_, true);
  return kRetOk;
}

ErrorStack ScheduledJob::save(tinyxml2::XMLElement* element) const {
  EXTERNALIZE_SAVE_ELEMENT(element, job_id_, "");
  EXTERNALIZE_SAVE_ELEMENT(element, project_name_, "");
  EXTERNALIZE_SAVE_ELEMENT(element, function_name_, "");
  EXTERNALIZE_SAVE_ELEMENT(element, payload_, "");
  EXTERNALIZE_SAVE_ELEMENT(element, cron_, "minute hour day-of-month month day-of-week");
  EXTERNALIZE_SAVE_ELEMENT(element, enabled_, "");
  return kRetOk;
}

ErrorStack ScheduleDefinition::load(tinyxml2::XMLElement* element) {
  jobs_.clear();
  for (tinyxml2::XMLElement* child = element->FirstChildElement("job");
        child; child = child->NextSiblingElement("job")) {
    ScheduledJob job;
    CHECK_ERROR(job.load(child));
    jobs_.push_back(job);
  }
  return kRetOk;
}

ErrorStack ScheduleDefinition::save(tinyxml2::XMLElement* element) const {
  CHECK_ERROR(insert_comment(element, "Cron-triggered jobs. Each firing creates a task."));
  for (const ScheduledJob& job : jobs_) {
    CHECK_ERROR(add_child_element(element, "job", "", job));
  }
  return kRetOk;
}

ErrorStack ScheduleDefinition::validate() const {
  std::set<std::string> ids;
  for (const ScheduledJob& job : jobs_) {
    if (job.job_id_.empty() || job.project_name_.empty() || job.function_name_.empty()) {
      std::string message = "job '" + job.job_id_ + "' needs id, project and function";
      return ERROR_STACK_MSG(kErrorCodeScheduleInvalidJob, message.c_str());
    }
    if (!ids.insert(job.job_id_).second) {
      std::string message = "duplicate job id '" + job.job_id_ + "'";
      return ERROR_STACK_MSG(kErrorCodeScheduleInvalidJob, message.c_str());
    }
    CronExpression cron;
    ErrorStack parsed = CronExpression::parse(job.cron_, &cron);
    if (parsed.is_error()) {
      std::string message = "job '" + job.job_id_ + "': " + parsed.describe_brief();
      return ERROR_STACK_MSG(kErrorCodeScheduleInvalidJob, message.c_str());
    }
  }
  return kRetOk;
}

ErrorStack ScheduleDefinition::load_all(
  const fs::Path& system_file,
  const fs::Path& projects_dir,
  ScheduleDefinition* out) {
  out->jobs_.clear();
  if (!system_file.empty()) {
    if (fs::exists(system_file)) {
      CHECK_ERROR(out->load_from_file(system_file));
      LOG(INFO) << "Loaded " << out->jobs_.size() << " scheduled jobs from " << system_file;
    } else {
      LOG(WARNING) << "Schedule definition " << system_file << " does not exist";
    }
  }

  if (!projects_dir.empty() && fs::is_directory(projects_dir)) {
    std::vector<fs::Path> children = projects_dir.child_paths();
    for (const fs::Path& child : children) {
      std::string project = child.filename();
      fs::Path file(child);
      file /= kProjectScheduleFile;
      if (project.empty() || project[0] == '.' || !fs::is_regular_file(file)) {
        continue;
      }
      ScheduleDefinition project_schedule;
      CHECK_ERROR(project_schedule.load_from_file(file));
      for (ScheduledJob job : project_schedule.jobs_) {
        job.job_id_ = project + "." + job.job_id_;
        job.project_name_ = project;
        out->jobs_.push_back(job);
      }
      LOG(INFO) << "Loaded " << project_schedule.jobs_.size() << " scheduled jobs of " << project;
    }
  }
  return out->validate();
}

}  // namespace task
}  // namespace cloudfn
