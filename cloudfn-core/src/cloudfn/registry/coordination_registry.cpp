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
#include "cloudfn/registry/coordination_registry.hpp"

#include <glog/logging.h>

#include <string>
#include <vector>

#include "cloudfn/registry/coordination_registry_pimpl.hpp"

namespace cloudfn {
namespace registry {
CoordinationRegistry::CoordinationRegistry(const RegistryOptions& options) : pimpl_(nullptr) {
  pimpl_ = new CoordinationRegistryPimpl(this, options);
}
CoordinationRegistry::~CoordinationRegistry() {
  if (!pimpl_->forked_project_.empty()) {
    // a forked worker exits with _exit(). reaching here means it returned into the parent's
    // stack. never touch the parent's workers from here.
    return;
  }
  ErrorStack error = pimpl_->cleanup_resources();
  if (error.is_error()) {
    LOG(ERROR) << "Errors while releasing the coordination registry: " << error;
  }
  delete pimpl_;
  pimpl_ = nullptr;
}

const RegistryOptions& CoordinationRegistry::get_options() const { return pimpl_->options_; }

ErrorStack CoordinationRegistry::register_component(const std::string& name, Component* component) {
  return pimpl_->register_component(name, component);
}
void CoordinationRegistry::unregister_component(const std::string& name, Component* component) {
  pimpl_->unregister_component(name, component);
}
Component* CoordinationRegistry::get_component(const std::string& name) const {
  return pimpl_->get_component(name);
}

ErrorStack CoordinationRegistry::get_or_create_project_channel(
  const std::string& name,
  std::shared_ptr<ProjectChannel>* out) {
  return pimpl_->get_or_create_channel(
    &pimpl_->project_channels_,
    name,
    pimpl_->options_.channel_capacity_,
    out);
}
std::shared_ptr<ProjectChannel> CoordinationRegistry::get_project_channel(
  const std::string& name) const {
  return pimpl_->find_channel(pimpl_->project_channels_, name);
}
ErrorStack CoordinationRegistry::get_or_create_task_channel(
  const std::string& task_id,
  std::shared_ptr<ProjectChannel>* out) {
  return pimpl_->get_or_create_channel(
    &pimpl_->task_channels_,
    task_id,
    pimpl_->options_.task_channel_capacity_,
    out);
}
std::shared_ptr<ProjectChannel> CoordinationRegistry::get_task_channel(
  const std::string& task_id) const {
  return pimpl_->find_channel(pimpl_->task_channels_, task_id);
}

bool CoordinationRegistry::start_project_process(
  const std::string& name,
  const WorkerEntry& entry,
  const std::vector<std::string>& args) {
  return pimpl_->start_project_process(name, entry, args);
}
ErrorStack CoordinationRegistry::terminate_process(const std::string& name) {
  return pimpl_->terminate_process(name);
}
bool CoordinationRegistry::check_process_status(const std::string& name) {
  return pimpl_->check_process_status(name);
}
bool CoordinationRegistry::is_process_alive(const std::string& name) {
  return pimpl_->is_process_alive(name);
}
bool CoordinationRegistry::has_worker(const std::string& name) const {
  return pimpl_->get_worker_pid(name) != 0;
}
bool CoordinationRegistry::wait_for_ready(const std::string& name, uint64_t timeout_ms) {
  return pimpl_->wait_for_ready(name, timeout_ms);
}
pid_t CoordinationRegistry::get_worker_pid(const std::string& name) const {
  return pimpl_->get_worker_pid(name);
}

ErrorStack CoordinationRegistry::cleanup_project(const std::string& name) {
  return pimpl_->cleanup_project(name);
}
void CoordinationRegistry::cleanup_task_resources(const std::string& task_id) {
  pimpl_->cleanup_task_resources(task_id);
}
ErrorStack CoordinationRegistry::cleanup_resources() { return pimpl_->cleanup_resources(); }

thread::BoundedThreadPool* CoordinationRegistry::get_executor(
  const std::string& name,
  uint32_t thread_count) {
  return pimpl_->get_executor(name, thread_count);
}
std::vector<std::string> CoordinationRegistry::list_live_projects() {
  return pimpl_->list_live_projects();
}
std::vector<std::string> CoordinationRegistry::list_worker_projects() const {
  return pimpl_->list_worker_projects();
}
bool CoordinationRegistry::is_forked_worker() const {
  std::lock_guard<std::mutex> guard(pimpl_->mutex_);
  return !pimpl_->forked_project_.empty();
}

}  // namespace registry
}  // namespace cloudfn
