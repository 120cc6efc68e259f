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
#include "cloudfn/worker/environment_provisioner.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>
#include <string>
#include <vector>

#include "cloudfn/assorted/assorted_func.hpp"
#include "cloudfn/debugging/raw_log.hpp"
#include "cloudfn/fs/filesystem.hpp"
#include "cloudfn/process/subprocess.hpp"

namespace cloudfn {
namespace worker {

CommandProvisioner::CommandProvisioner(const WorkerOptions& options, const fs::Path& projects_dir)
  : options_(options), projects_dir_(projects_dir) {
}

std::map<std::string, std::string> CommandProvisioner::get_placeholders(
  const std::string& project) const {
  fs::Path project_dir(projects_dir_);
  project_dir /= project;
  std::map<std::string, std::string> placeholders;
  placeholders["$PROJECT$"] = project;
  placeholders["$PROJECT_DIR$"] = project_dir.string();
  placeholders["$ENV_DIR$"] = options_.convert_environments_dir_pattern(project);
  return placeholders;
}

std::string CommandProvisioner::expand_placeholders(
  const std::string& pattern,
  const std::map<std::string, std::string>& placeholders) {
  std::string ret = pattern;
  for (std::map<std::string, std::string>::const_iterator it = placeholders.begin();
    it != placeholders.end(); ++it) {
    ret = assorted::replace_all(ret, it->first, it->second);
  }
  return ret;
}

ErrorStack CommandProvisioner::run_command(
  const std::string& pattern,
  const std::map<std::string, std::string>& placeholders,
  ErrorCode failure_code) {
  std::string command = expand_placeholders(pattern, placeholders);
  RAW_LOG_STREAM(INFO) << "Running: " << command;
  process::SubprocessResult result;
  ErrorStack run_error = process::run_shell_command(
    command,
    std::map<std::string, std::string>(),
    0,
    &result);
  if (run_error.is_error()) {
    return ERROR_STACK_MSG(failure_code, run_error.describe_brief().c_str());
  }
  if (!result.is_success()) {
    RAW_LOG_STREAM(ERROR) << "Command failed: " << command << ". " << result;
    return ERROR_STACK_MSG(failure_code, result.describe_failure().c_str());
  }
  return kRetOk;
}

ErrorStack CommandProvisioner::ensure_environment(const std::string& project) {
  if (options_.ensure_environment_command_.empty()) {
    return kRetOk;
  }
  std::map<std::string, std::string> placeholders = get_placeholders(project);
  fs::Path env_dir(placeholders["$ENV_DIR$"]);
  if (fs::is_directory(env_dir)) {
    RAW_LOG_STREAM(INFO) << "Environment of project " << project << " already exists at "
      << env_dir;
    return kRetOk;
  }
  if (!fs::create_directories(env_dir.parent_path())) {
    return ERROR_STACK_MSG(kErrorCodeEnvProvisionFailed, env_dir.parent_path().c_str());
  }
  RAW_LOG_STREAM(INFO) << "Creating environment of project " << project << " at " << env_dir;
  CHECK_ERROR(run_command(
    options_.ensure_environment_command_,
    placeholders,
    kErrorCodeEnvProvisionFailed));
  return kRetOk;
}

ErrorStack CommandProvisioner::install_dependencies(const std::string& project) {
  if (options_.install_command_.empty()) {
    return kRetOk;
  }
  std::map<std::string, std::string> placeholders = get_placeholders(project);
  fs::Path project_manifest(placeholders["$PROJECT_DIR$"]);
  project_manifest /= options_.dependency_manifest_name_;
  std::string project_content;
  if (fs::exists(project_manifest) && !fs::read_file(project_manifest, &project_content)) {
    return ERROR_STACK_MSG(kErrorCodeEnvInstallFailed, project_manifest.c_str());
  }
  std::string system_content;
  if (!options_.system_manifest_path_.empty()) {
    fs::Path system_manifest(options_.system_manifest_path_);
    if (fs::exists(system_manifest) && !fs::read_file(system_manifest, &system_content)) {
      return ERROR_STACK_MSG(kErrorCodeEnvInstallFailed, system_manifest.c_str());
    }
  }

  std::string merged = merge_manifests(system_content, project_content);
  if (merged.empty()) {
    RAW_LOG_STREAM(INFO) << "Project " << project << " has no dependencies to install";
    return kRetOk;
  }

  fs::Path env_dir(placeholders["$ENV_DIR$"]);
  if (!fs::create_directories(env_dir)) {
    return ERROR_STACK_MSG(kErrorCodeEnvInstallFailed, env_dir.c_str());
  }
  fs::Path merged_manifest(env_dir);
  merged_manifest /= std::string("cloudfn-merged-") + options_.dependency_manifest_name_;
  if (!fs::durable_write_file(merged_manifest, merged)) {
    return ERROR_STACK_MSG(kErrorCodeEnvInstallFailed, merged_manifest.c_str());
  }
  placeholders["$MANIFEST$"] = merged_manifest.string();

  RAW_LOG_STREAM(INFO) << "Installing dependencies of project " << project << " from "
    << merged_manifest;
  CHECK_ERROR(run_command(options_.install_command_, placeholders, kErrorCodeEnvInstallFailed));
  return kRetOk;
}

std::string CommandProvisioner::get_package_name(const std::string& requirement) {
  std::string line = assorted::trim(requirement);
  std::string::size_type end = line.find_first_of("=<>!~[;@ \t");
  std::string name = (end == std::string::npos) ? line : line.substr(0, end);
  std::transform(name.begin(), name.end(), name.begin(), ::tolower);
  return name;
}

namespace {
std::vector<std::string> requirement_lines(const std::string& content) {
  std::vector<std::string> ret;
  std::vector<std::string> lines = assorted::split(content, '\n');
  for (const std::string& raw : lines) {
    std::string line = raw;
    std::string::size_type comment = line.find('#');
    if (comment != std::string::npos) {
      line = line.substr(0, comment);
    }
    line = assorted::trim(line);
    if (!line.empty()) {
      ret.push_back(line);
    }
  }
  return ret;
}
}  // namespace

std::string CommandProvisioner::merge_manifests(
  const std::string& system,
  const std::string& project) {
  std::vector<std::string> merged = requirement_lines(system);
  std::map<std::string, size_t> positions;
  for (size_t i = 0; i < merged.size(); ++i) {
    positions[get_package_name(merged[i])] = i;
  }

  std::vector<std::string> project_lines = requirement_lines(project);
  for (const std::string& line : project_lines) {
    std::string name = get_package_name(line);
    std::map<std::string, size_t>::iterator it = positions.find(name);
    if (it != positions.end()) {
      merged[it->second] = line;
    } else {
      positions[name] = merged.size();
      merged.push_back(line);
    }
  }

  std::stringstream out;
  for (const std::string& line : merged) {
    out << line << "\n";
  }
  return out.str();
}

}  // namespace worker
}  // namespace cloudfn
