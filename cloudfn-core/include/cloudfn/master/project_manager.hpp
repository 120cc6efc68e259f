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
#ifndef CLOUDFN_MASTER_PROJECT_MANAGER_HPP_
#define CLOUDFN_MASTER_PROJECT_MANAGER_HPP_
#include <stdint.h>

#include <iosfwd>
#include <string>
#include <vector>

#include "cloudfn/cxx11.hpp"
#include "cloudfn/error_stack.hpp"
#include "cloudfn/fs/path.hpp"
#include "cloudfn/master/fwd.hpp"
#include "cloudfn/master/master.hpp"
#include "cloudfn/registry/component.hpp"
#include "cloudfn/registry/coordination_registry.hpp"
#include "cloudfn/worker/function_info.hpp"
#include "cloudfn/worker/worker_options.hpp"

namespace cloudfn {
namespace master {

/** @brief One line of ProjectManager::list_projects(). @ingroup MASTER */
struct ProjectSummary {
  ProjectSummary() : function_count_(0), state_(ProjectStatus::kAbsent) {}
  std::string           name_;
  /** Functions with an entry point, including native ones. */
  uint32_t              function_count_;
  ProjectStatus::State  state_;

  friend std::ostream& operator<<(std::ostream& o, const ProjectSummary& v);
};

/**
 * @brief Deploys, lists and deletes projects and their functions on disk.
 * @ingroup MASTER
 * @details
 * Listing reads the function files from the control plane, without asking the worker.
 * Every change restarts the project's worker if it has one, so that the worker reloads the
 * project. Occupies the "project_manager" slot of the registry while it lives.
 */
class ProjectManager CXX11_FINAL : public registry::Component {
 public:
  ProjectManager(
    Master* master,
    const worker::WorkerOptions& worker_options,
    const worker::NativeFunctionTable* natives = CXX11_NULLPTR);
  ~ProjectManager();

  ProjectManager() CXX11_FUNC_DELETE;
  ProjectManager(const ProjectManager&) CXX11_FUNC_DELETE;
  ProjectManager& operator=(const ProjectManager&) CXX11_FUNC_DELETE;

  const char* get_component_name() const CXX11_OVERRIDE {
    return registry::kComponentProjectManager;
  }

  /** Puts this object in the "project_manager" slot. */
  ErrorStack  attach();
  void        detach();

  ErrorStack  list_projects(std::vector<ProjectSummary>* out) const;
  /** @return kErrorCodeProjectDirMissing if the project has neither directory nor natives */
  ErrorStack  list_functions(
    const std::string& project,
    std::vector<worker::FunctionInfo>* out) const;

  /** Writes the source of one function, creating the project if needed. */
  ErrorStack  deploy_function(
    const std::string& project,
    const std::string& function,
    const std::string& source);
  /** Writes the dependency manifest of the project. */
  ErrorStack  deploy_manifest(const std::string& project, const std::string& content);

  /** @param[out] deleted false if there was no such function file */
  ErrorStack  delete_function(
    const std::string& project,
    const std::string& function,
    bool* deleted);
  /** Stops the worker, then removes the project directory and its environment. */
  ErrorStack  delete_project(const std::string& project, bool* deleted);

  /** Whether the name can be used as a project or function name. */
  static bool is_valid_name(const std::string& name);

 private:
  Master* const                       master_;
  const worker::WorkerOptions         worker_options_;
  const worker::NativeFunctionTable* const natives_;

  fs::Path    get_project_dir(const std::string& project) const;
  fs::Path    get_function_file(const std::string& project, const std::string& function) const;
  /** Restarts the project's worker if it has one. */
  ErrorStack  reload_project(const std::string& project);
};

}  // namespace master
}  // namespace cloudfn
#endif  // CLOUDFN_MASTER_PROJECT_MANAGER_HPP_
