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
#ifndef CLOUDFN_TASK_SCHEDULED_JOB_HPP_
#define CLOUDFN_TASK_SCHEDULED_JOB_HPP_

#include <string>
#include <vector>

#include "cloudfn/cxx11.hpp"
#include "cloudfn/externalize/externalizable.hpp"
#include "cloudfn/fs/path.hpp"

namespace cloudfn {
namespace task {
/**
 * @brief A cron trigger bound to a function and a fixed payload.
 * @ingroup TASK
 * @details
 * This is a POD struct. Default destructor/copy-constructor/assignment operator work fine.
 */
struct ScheduledJob CXX11_FINAL : public virtual externalize::Externalizable {
  ScheduledJob();

  std::string job_id_;
  std::string project_name_;
  std::string function_name_;
  /** Payload of every task the job creates. */
  std::string payload_;
  /** See CronExpression. */
  std::string cron_;
  bool        enabled_;

  EXTERNALIZABLE(ScheduledJob);
};

/**
 * @brief A list of scheduled jobs, read from XML.
 * @ingroup TASK
 * @details
 * The document has one \<job\> element per ScheduledJob. For example:
 * @code{.xml}
 * <ScheduleDefinition>
 *   <job>
 *     <job_id_>nightly_report</job_id_>
 *     <project_name_>demo</project_name_>
 *     <function_name_>report</function_name_>
 *     <payload_>{"days": 1}</payload_>
 *     <cron_>0 3 * * *</cron_>
 *   </job>
 * </ScheduleDefinition>
 * @endcode
 * In a project's schedule.xml, project_name_ may be omitted and is always the project.
 */
struct ScheduleDefinition CXX11_FINAL : public virtual externalize::Externalizable {
  /** File name of per-project schedule definitions. */
  static const char* kProjectScheduleFile;

  std::vector<ScheduledJob> jobs_;

  /**
   * Reads the system-wide file (skipped if empty or missing) and the schedule.xml of every
   * project directory under projects_dir. Ids of project jobs become "<project>.<job_id>".
   * @return kErrorCodeScheduleInvalidJob if a job is malformed or an id is duplicated
   */
  static ErrorStack load_all(
    const fs::Path& system_file,
    const fs::Path& projects_dir,
    ScheduleDefinition* out);

  /** Checks every job and the uniqueness of ids. */
  ErrorStack  validate() const;

  EXTERNALIZABLE(ScheduleDefinition);
};

}  // namespace task
}  // namespace cloudfn
#endif  // CLOUDFN_TASK_SCHEDULED_JOB_HPP_
