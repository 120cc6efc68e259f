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
#ifndef CLOUDFN_WORKER_ENVIRONMENT_PROVISIONER_HPP_
#define CLOUDFN_WORKER_ENVIRONMENT_PROVISIONER_HPP_

#include <map>
#include <string>

#include "cloudfn/cxx11.hpp"
#include "cloudfn/error_stack.hpp"
#include "cloudfn/fs/path.hpp"
#include "cloudfn/worker/worker_options.hpp"

namespace cloudfn {
namespace worker {
/**
 * @brief Prepares the isolated dependency environment of a project.
 * @ingroup WORKER
 * @details
 * The worker only needs to know whether the environment is ready. How packages are
 * resolved is up to the implementation.
 */
class EnvironmentProvisioner {
 public:
  virtual ~EnvironmentProvisioner() {}
  /** @return kErrorCodeEnvProvisionFailed if the environment can't be created */
  virtual ErrorStack ensure_environment(const std::string& project) = 0;
  /** @return kErrorCodeEnvInstallFailed if the dependencies can't be installed */
  virtual ErrorStack install_dependencies(const std::string& project) = 0;
};

/**
 * @brief EnvironmentProvisioner that runs the shell commands given in WorkerOptions.
 * @ingroup WORKER
 * @details
 * ensure_environment() runs ensure_environment_command_ only when the environment directory
 * does not exist yet. install_dependencies() merges the system-wide manifest with the
 * project's (project entries win per package name), writes the result into the environment
 * directory and runs install_command_ on it. Empty commands are skipped.
 */
class CommandProvisioner CXX11_FINAL : public EnvironmentProvisioner {
 public:
  CommandProvisioner(const WorkerOptions& options, const fs::Path& projects_dir);

  ErrorStack ensure_environment(const std::string& project) CXX11_OVERRIDE;
  ErrorStack install_dependencies(const std::string& project) CXX11_OVERRIDE;

  /** Placeholder values for the project, as described in WorkerOptions. */
  std::map<std::string, std::string> get_placeholders(const std::string& project) const;
  static std::string expand_placeholders(
    const std::string& pattern,
    const std::map<std::string, std::string>& placeholders);

  /**
   * Merges two requirement manifests.
   * System entries keep their order. A project entry replaces the system entry of the same
   * package in place, and project-only entries follow. Comments and blank lines are dropped.
   */
  static std::string merge_manifests(const std::string& system, const std::string& project);
  /** Lower-cased package name of a requirement line such as "Requests[socks]>=2.0". */
  static std::string get_package_name(const std::string& requirement);

 private:
  const WorkerOptions options_;
  const fs::Path      projects_dir_;

  ErrorStack  run_command(
    const std::string& pattern,
    const std::map<std::string, std::string>& placeholders,
    ErrorCode failure_code);
};

}  // namespace worker
}  // namespace cloudfn
#endif  // CLOUDFN_WORKER_ENVIRONMENT_PROVISIONER_HPP_
