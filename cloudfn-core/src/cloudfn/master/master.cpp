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
#include "cloudfn/master/master.hpp"

#include <glog/logging.h>

#include <ostream>
#include <string>
#include <vector>

#include "cloudfn/master/master_pimpl.hpp"

namespace cloudfn {
namespace master {
const char* to_state_name(MasterState state) {
  switch (state) {
  case kMasterStopped: return "stopped";
  case kMasterInitializing: return "initializing";
  case kMasterRunning: return "running";
  case kMasterStopping: return "stopping";
  default: return "unknown";
  }
}

const char* ProjectStatus::to_state_name(State state) {
  switch (state) {
  case kAbsent: return "absent";
  case kStarting: return "starting";
  case kReady: return "ready";
  case kDead: return "dead";
  case kFailed: return "failed";
  default: return "unknown";
  }
}

std::ostream& operator<<(std::ostream& o, const ProjectStatus& v) {
  o << "<Project name=\"" << v.name_ << "\" state=\"" << ProjectStatus::to_state_name(v.state_)
    << "\" pid=\"" << v.pid_ << "\"";
  if (!v.failure_.empty()) {
    o << " failure=\"" << v.failure_ << "\"";
  }
  o << " />";
  return o;
}

Master::Master(
  registry::CoordinationRegistry* registry,
  const MasterOptions& options,
  const worker::WorkerOptions& worker_options,
  const worker::NativeFunctionTable* natives) : pimpl_(nullptr) {
  pimpl_ = new MasterPimpl(this, registry, options, worker_options, natives);
}
Master::~Master() {
  ErrorStack error = pimpl_->stop();
  if (error.is_error()) {
    LOG(ERROR) << "Errors while stopping master: " << error;
  }
  delete pimpl_;
  pimpl_ = nullptr;
}

const char* Master::get_component_name() const { return registry::kComponentMaster; }
void Master::set_api_layer(ApiLayer* api_layer) { pimpl_->api_layer_ = api_layer; }

ErrorStack Master::start() { return pimpl_->start(); }
ErrorStack Master::stop() { return pimpl_->stop(); }

ErrorStack Master::execute_function(
  const std::string& project,
  const std::string& function,
  const std::string& payload,
  std::string* result) {
  return pimpl_->execute_function(project, function, payload, result);
}

ErrorStack Master::start_project(const std::string& name) { return pimpl_->start_project(name); }
ErrorStack Master::stop_project(const std::string& name) { return pimpl_->stop_project(name); }
ErrorStack Master::restart_project(const std::string& name) {
  return pimpl_->restart_project(name);
}

std::vector<std::string> Master::discover_projects() const {
  return pimpl_->discover_projects();
}
std::vector<ProjectStatus> Master::list_projects() const { return pimpl_->list_projects(); }
std::vector<std::string> Master::get_failed_projects() const {
  return pimpl_->get_failed_projects();
}
MasterState Master::get_state() const { return pimpl_->get_state(); }
const MasterOptions& Master::get_options() const { return pimpl_->options_; }
registry::CoordinationRegistry* Master::get_registry() const { return pimpl_->registry_; }

}  // namespace master
}  // namespace cloudfn
