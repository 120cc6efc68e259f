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
#include "cloudfn/master/project_manager.hpp"

#include <glog/logging.h>

#include <map>
#include <ostream>
#include <string>
#include <vector>

#include "cloudfn/error_code.hpp"
#include "cloudfn/assorted/assorted_func.hpp"
#include "cloudfn/fs/filesystem.hpp"
#include "cloudfn/master/master_options.hpp"
#include "cloudfn/registry/coordination_registry.hpp"
#include "cloudfn/worker/function_source_provider.hpp"
#include "cloudfn/worker/native_function_table.hpp"

namespace cloudfn {
namespace master {
std::ostream& operator<<(std::ostream& o, const ProjectSummary& v) {
  o << "<ProjectSummary name=\"" << v.name_ << "\" functions=\"" << v.function_count_
    << "\" state=\"" << ProjectStatus::to_state_name(v.state_) << "\" />";
  return o;
}

ProjectManager::ProjectManager(
  Master* master,
  const worker::WorkerOptions& worker_options,
  const worker::NativeFunctionTable* natives)
  : master_(master), worker_options_(worker_options), natives_(natives) {
}

ProjectManager::~ProjectManager() {
  detach();
}

ErrorStack ProjectManager::attach() {
  return master_->get_registry()->register_component(registry::kComponentProjectManager, this);
}

void ProjectManager::detach() {
  master_->get_registry()->unregister_component(registry::kComponentProjectManager, this);
}

bool ProjectManager::is_valid_name(const std::string& name) {
  if (name.empty() || name[0] == '.' || name[0] == '_') {
    return false;
  }
  if (assorted::starts_with(name, "test_")) {
    return false;
  }
  for (size_t i = 0; i < name.size(); ++i) {
    char c = name[i];
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
      || c == '_' || c == '-' || c == '.';
    if (!ok) {
      return false;
    }
  }
  return true;
}

fs::Path ProjectManager::get_project_dir(const std::string& project) const {
  fs::Path dir(master_->get_options().projects_dir_);
  dir /= project;
  return dir;
}

fs::Path ProjectManager::get_function_file(
  const std::string& project,
  const std::string& function) const {
  fs::Path file(get_project_dir(project));
  file /= function + worker_options_.function_file_suffix_;
  return file;
}

ErrorStack ProjectManager::list_projects(std::vector<ProjectSummary>* out) const {
  out->clear();
  std::vector<ProjectStatus> statuses = master_->list_projects();
  for (const ProjectStatus& status : statuses) {
    ProjectSummary summary;
    summary.name_ = status.name_;
    summary.state_ = status.state_;
    std::vector<worker::FunctionInfo> functions;
    ErrorStack listed = list_functions(status.name_, &functions);
    if (listed.is_error() && listed.get_error_code() != kErrorCodeProjectDirMissing) {
      return listed;
    }
    for (const worker::FunctionInfo& f : functions) {
      if (f.status_ != worker::FunctionInfo::kUnregistered) {
        ++summary.function_count_;
      }
    }
    out->push_back(summary);
  }
  return kRetOk;
}

ErrorStack ProjectManager::list_functions(
  const std::string& project,
  std::vector<worker::FunctionInfo>* out) const {
  out->clear();
  std::map<std::string, worker::FunctionInfo> functions;
  worker::ScriptSourceProvider provider(
    fs::Path(master_->get_options().projects_dir_),
    worker_options_.function_file_suffix_);
  std::vector<fs::Path> files;
  ErrorStack listed = provider.list_function_files(project, &files);
  bool has_natives = natives_ && !natives_->list_functions(project).empty();
  if (listed.is_error() && !(listed.get_error_code() == kErrorCodeProjectDirMissing
    && has_natives)) {
    return listed;
  }

  for (const fs::Path& file : files) {
    worker::FunctionInfo info;
    info.name_ = provider.get_function_name(file);
    info.file_path_ = file.string();
    info.entry_ = worker_options_.entry_point_;
    worker::EntryPointInfo entry;
    ErrorStack read = provider.read_entry_point(file, worker_options_.entry_point_, &entry);
    if (read.is_error()) {
      info.load_error_ = read.describe_brief();
    } else if (entry.found_) {
      info.status_ = worker::FunctionInfo::kRegistered;
      info.asynchronous_ = entry.asynchronous_;
      info.description_ = entry.description_;
    } else {
      info.load_error_ = "no entry point";
    }
    functions[info.name_] = info;
  }

  if (has_natives) {
    std::vector<std::string> names = natives_->list_functions(project);
    for (const std::string& name : names) {
      worker::NativeFunctionTable::Entry entry;
      if (!natives_->find(project, name, &entry)) {
        continue;
      }
      worker::FunctionInfo info;
      info.name_ = name;
      info.entry_ = worker_options_.entry_point_;
      info.description_ = entry.description_;
      info.asynchronous_ = entry.asynchronous_;
      info.status_ = worker::FunctionInfo::kRegistered;
      functions[name] = info;
    }
  }

  for (auto it = functions.begin(); it != functions.end(); ++it) {
    out->push_back(it->second);
  }
  return kRetOk;
}

ErrorStack ProjectManager::reload_project(const std::string& project) {
  registry::CoordinationRegistry* registry = master_->get_registry();
  if (!registry->has_worker(project)) {
    return kRetOk;
  }
  LOG(INFO) << "Reloading " << project;
  return master_->restart_project(project);
}

ErrorStack ProjectManager::deploy_function(
  const std::string& project,
  const std::string& function,
  const std::string& source) {
  if (!is_valid_name(project) || !is_valid_name(function)) {
    std::string message = "invalid name: " + project + "/" + function;
    return ERROR_STACK_MSG(kErrorCodeInvalidParameter, message.c_str());
  }
  fs::Path dir = get_project_dir(project);
  if (!fs::is_directory(dir) && !fs::create_directories(dir, true)) {
    return ERROR_STACK_MSG(kErrorCodeFsMkdirFailed, dir.c_str());
  }
  fs::Path file = get_function_file(project, function);
  if (!fs::durable_write_file(file, source)) {
    return ERROR_STACK_MSG(kErrorCodeFsWriteFail, file.c_str());
  }
  LOG(INFO) << "Deployed " << project << "/" << function << " to " << file;
  return reload_project(project);
}

ErrorStack ProjectManager::deploy_manifest(
  const std::string& project,
  const std::string& content) {
  if (!is_valid_name(project)) {
    return ERROR_STACK_MSG(kErrorCodeInvalidParameter, project.c_str());
  }
  fs::Path dir = get_project_dir(project);
  if (!fs::is_directory(dir) && !fs::create_directories(dir, true)) {
    return ERROR_STACK_MSG(kErrorCodeFsMkdirFailed, dir.c_str());
  }
  fs::Path file(dir);
  file /= worker_options_.dependency_manifest_name_;
  if (!fs::durable_write_file(file, content)) {
    return ERROR_STACK_MSG(kErrorCodeFsWriteFail, file.c_str());
  }
  LOG(INFO) << "Deployed the manifest of " << project;
  return reload_project(project);
}

ErrorStack ProjectManager::delete_function(
  const std::string& project,
  const std::string& function,
  bool* deleted) {
  *deleted = false;
  if (!is_valid_name(project) || !is_valid_name(function)) {
    return kRetOk;
  }
  fs::Path file = get_function_file(project, function);
  if (!fs::is_regular_file(file)) {
    return kRetOk;
  }
  if (!fs::remove(file)) {
    return ERROR_STACK_MSG(kErrorCodeFsRemoveFailed, file.c_str());
  }
  *deleted = true;
  LOG(INFO) << "Deleted " << project << "/" << function;
  return reload_project(project);
}

ErrorStack ProjectManager::delete_project(const std::string& project, bool* deleted) {
  *deleted = false;
  if (!is_valid_name(project)) {
    return kRetOk;
  }
  fs::Path dir = get_project_dir(project);
  registry::CoordinationRegistry* registry = master_->get_registry();
  if (!fs::exists(dir) && !registry->has_worker(project)) {
    return kRetOk;
  }
  CHECK_ERROR(master_->stop_project(project));
  if (fs::exists(dir)) {
    fs::remove_all(dir);
    if (fs::exists(dir)) {
      return ERROR_STACK_MSG(kErrorCodeFsRemoveFailed, dir.c_str());
    }
  }
  fs::Path env_dir(worker_options_.convert_environments_dir_pattern(project));
  if (!env_dir.empty() && fs::exists(env_dir)) {
    fs::remove_all(env_dir);
    if (fs::exists(env_dir)) {
      return ERROR_STACK_MSG(kErrorCodeFsRemoveFailed, env_dir.c_str());
    }
  }
  *deleted = true;
  LOG(INFO) << "Deleted project " << project;
  return kRetOk;
}

}  // namespace master
}  // namespace cloudfn
