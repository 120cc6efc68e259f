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
#ifndef CLOUDFN_MASTER_MASTER_OPTIONS_HPP_
#define CLOUDFN_MASTER_MASTER_OPTIONS_HPP_
#include <stdint.h>

#include <string>

#include "cloudfn/cxx11.hpp"
#include "cloudfn/externalize/externalizable.hpp"

namespace cloudfn {
namespace master {
/**
 * @brief Set of options for Master and ProjectManager.
 * @ingroup MASTER
 * @details
 * This is a POD struct. Default destructor/copy-constructor/assignment operator work fine.
 */
struct MasterOptions CXX11_FINAL : public virtual externalize::Externalizable {
  enum Constants {
    kDefaultApiReadyTimeoutMs = 10000,
    kDefaultWorkerReadyTimeoutMs = 30000,
    kDefaultExecutionTimeoutMs = 0,
    kDefaultLivenessCheckIntervalMs = 100,
  };
  /** Default value for projects_dir_. */
  static const char* kDefaultProjectsDir;

  MasterOptions();

  /** Each directory under this is a project. */
  std::string projects_dir_;

  /** How long start() waits for the API layer to report ready. */
  uint32_t    api_ready_timeout_ms_;

  /** How long to wait for a launched worker to signal readiness. */
  uint32_t    worker_ready_timeout_ms_;

  /**
   * Upper bound of one execute_function() call. 0 (default) waits as long as the worker
   * is alive. A timed out worker is terminated so that its late response is never read.
   */
  uint32_t    execution_timeout_ms_;

  /** While waiting for a response, worker liveness is checked at this interval. */
  uint32_t    liveness_check_interval_ms_;

  /** Whether start() launches a worker for every discovered project. */
  bool        auto_start_projects_;

  EXTERNALIZABLE(MasterOptions);
};
}  // namespace master
}  // namespace cloudfn
#endif  // CLOUDFN_MASTER_MASTER_OPTIONS_HPP_
