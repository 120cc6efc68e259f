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
#include "cloudfn/master/master_options.hpp"

#include <string>

#include "cloudfn/externalize/externalizable.hpp"

namespace cloudfn {
namespace master {
const char* MasterOptions::kDefaultProjectsDir = "/tmp/cloudfn/projects";

MasterOptions::MasterOptions() :
  projects_dir_(kDefaultProjectsDir),
  api_ready_timeout_ms_(kDefaultApiReadyTimeoutMs),
  worker_ready_timeout_ms_(kDefaultWorkerReadyTimeoutMs),
  execution_timeout_ms_(kDefaultExecutionTimeoutMs),
  liveness_check_interval_ms_(kDefaultLivenessCheckIntervalMs),
  auto_start_projects_(true) {
}

ErrorStack MasterOptions::load(tinyxml2::XMLElement* element) {
  EXTERNALIZE_LOAD_ELEMENT(element, projects_dir_);
  EXTERNALIZE_LOAD_ELEMENT(element, api_ready_timeout_ms_);
  EXTERNALIZE_LOAD_ELEMENT(element, worker_ready_timeout_ms_);
  EXTERNALIZE_LOAD_ELEMENT(element, execution_timeout_ms_);
  EXTERNALIZE_LOAD_ELEMENT(element, liveness_check_interval_ms_);
  EXTERNALIZE_LOAD_ELEMENT(element, auto_start_projects_);
  if (liveness_check_interval_ms_ == 0) {
    return ERROR_STACK_MSG(kErrorCodeConfValueOutofrange, "liveness_check_interval_ms_ is 0");
  }
  return kRetOk;
}

ErrorStack MasterOptions::save(tinyxml2::XMLElement* element) const {
  CHECK_ERROR(insert_comment(element, "Set of options for the master"));

  EXTERNALIZE_SAVE_ELEMENT(element, projects_dir_,
    "Directory whose sub-directories are the deployed projects.");
  EXTERNALIZE_SAVE_ELEMENT(element, api_ready_timeout_ms_,
    "Milliseconds to wait for the API layer to become ready during startup.");
  EXTERNALIZE_SAVE_ELEMENT(element, worker_ready_timeout_ms_,
    "Milliseconds to wait for a launched worker to signal readiness.");
  EXTERNALIZE_SAVE_ELEMENT(element, execution_timeout_ms_,
    "Upper bound of one synchronous execution in milliseconds. 0 means no bound.");
  EXTERNALIZE_SAVE_ELEMENT(element, liveness_check_interval_ms_,
    "Interval in milliseconds to re-check worker liveness while waiting for a response.");
  EXTERNALIZE_SAVE_ELEMENT(element, auto_start_projects_,
    "Whether startup launches a worker for every discovered project.");
  return kRetOk;
}

}  // namespace master
}  // namespace cloudfn
