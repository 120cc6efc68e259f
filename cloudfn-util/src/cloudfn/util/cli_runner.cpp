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
#include "cloudfn/util/cli_runner.hpp"

#include <glog/logging.h>
#include <signal.h>
#include <stdint.h>
#include <unistd.h>

#include <iostream>
#include <string>
#include <vector>

#include "cloudfn/error_stack_batch.hpp"
#include "cloudfn/fs/filesystem.hpp"
#include "cloudfn/fs/path.hpp"
#include "cloudfn/master/master.hpp"
#include "cloudfn/master/project_manager.hpp"
#include "cloudfn/registry/coordination_registry.hpp"
#include "cloudfn/task/scheduled_job.hpp"
#include "cloudfn/task/scheduler.hpp"
#include "cloudfn/task/task.hpp"
#include "cloudfn/task/task_manager.hpp"
#include "cloudfn/worker/function_info.hpp"

namespace cloudfn {
namespace util {

namespace {
volatile sig_atomic_t stop_signal_received = 0;

void handle_stop_signal(int /*signum*/) {
  stop_signal_received = 1;
}

void install_stop_handlers() {
  struct sigaction action;
  action.sa_handler = handle_stop_signal;
  ::sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  ::sigaction(SIGINT, &action, CXX11_NULLPTR);
  ::sigaction(SIGTERM, &action, CXX11_NULLPTR);
}

/** Uninitializes the task manager and stops the master, in this order, even after errors. */
ErrorStack shutdown_all(master::Master* master, task::TaskManager* task_manager) {
  ErrorStackBatch batch;
  if (task_manager && task_manager->is_initialized()) {
    if (task_manager->get_scheduler()) {
      task_manager->get_scheduler()->stop();
    }
  }
  // stop the master before joining running tasks so that they fail fast
  batch.push_back(master->stop());
  if (task_manager) {
    batch.push_back(task_manager->uninitialize());
  }
  return SUMMARIZE_ERROR_BATCH(batch);
}
}  // namespace

bool CliRunner::parse_mode(const std::string& name, Mode* out) {
#define X(a, b, c) if (name == b) { *out = a; return true; }
CLI_MODES
#undef X
  return false;
}

const char* CliRunner::to_mode_name(Mode mode) {
  switch (mode) {
#define X(a, b, c) case a: return b;
CLI_MODES
#undef X
    default:
      return "unknown";
  }
}

void CliRunner::describe_modes(std::ostream* out) {
#define X(a, b, c) *out << "    " << b << ": " << c << std::endl;
CLI_MODES
#undef X
}

int CliRunner::execute() {
  ErrorStack result;
  switch (mode_) {
    case kServe:
      result = serve();
      break;
    case kInvoke:
      result = invoke();
      break;
    case kSubmit:
      result = submit();
      break;
    case kStatus:
    case kList:
    case kCancel:
    case kCleanup:
      result = run_task_mode();
      break;
    case kProjects:
    case kFunctions:
    case kDeploy:
    case kDeleteFunction:
    case kDeleteProject:
      result = run_project_mode();
      break;
    case kDumpConfig:
      result = dump_config();
      break;
  }
  if (result.is_error()) {
    std::cerr << "cloudfn_cli " << to_mode_name(mode_) << " failed: " << result << std::endl;
    return 1;
  }
  return 0;
}

ErrorStack CliRunner::serve() {
  task::ScheduleDefinition schedule;
  CHECK_ERROR(task::ScheduleDefinition::load_all(
    fs::Path(options_.task_.schedule_file_),
    fs::Path(options_.master_.projects_dir_),
    &schedule));

  registry::CoordinationRegistry registry(options_.registry_);
  master::Master master(&registry, options_.master_, options_.worker_);
  master::ProjectManager project_manager(&master, options_.worker_);
  task::TaskManager task_manager(&registry, &master, options_.task_);
  task_manager.set_schedule(schedule);

  install_stop_handlers();
  CHECK_ERROR(master.start());
  std::vector<std::string> failed = master.get_failed_projects();
  for (const std::string& project : failed) {
    std::cerr << "Project " << project << " failed to start" << std::endl;
  }
  ErrorStack attached = project_manager.attach();
  if (attached.is_error()) {
    LOG(ERROR) << "Failed to attach the project manager: " << attached;
    ErrorStack stopped = master.stop();
    if (stopped.is_error()) {
      LOG(ERROR) << "Failed to stop the master: " << stopped;
    }
    return attached;
  }
  ErrorStack initialized = task_manager.initialize();
  if (initialized.is_error()) {
    LOG(ERROR) << "Failed to start the task manager: " << initialized;
    project_manager.detach();
    ErrorStack stopped = master.stop();
    if (stopped.is_error()) {
      LOG(ERROR) << "Failed to stop the master: " << stopped;
    }
    return initialized;
  }

  LOG(INFO) << "cloudfn is serving " << master.discover_projects().size() << " projects with "
    << schedule.jobs_.size() << " scheduled jobs. Send SIGINT or SIGTERM to stop.";
  while (!stop_signal_received) {
    ::usleep(100000);
  }
  LOG(INFO) << "Stop signal received. Shutting down";
  project_manager.detach();
  return shutdown_all(&master, &task_manager);
}

ErrorStack CliRunner::invoke() {
  if (project_.empty() || function_.empty()) {
    return ERROR_STACK_MSG(kErrorCodeInvalidParameter, "--project and --function are required");
  }
  master::MasterOptions master_options(options_.master_);
  master_options.auto_start_projects_ = false;
  registry::CoordinationRegistry registry(options_.registry_);
  master::Master master(&registry, master_options, options_.worker_);
  CHECK_ERROR(master.start());

  std::string result;
  ErrorStack executed = master.execute_function(project_, function_, payload_, &result);
  if (executed.is_error()) {
    LOG(ERROR) << "Execution failed: " << executed;
    ErrorStack stopped = master.stop();
    if (stopped.is_error()) {
      LOG(ERROR) << "Failed to stop the master: " << stopped;
    }
    return executed;
  }
  std::cout << result << std::endl;
  return master.stop();
}

ErrorStack CliRunner::submit() {
  if (project_.empty() || function_.empty()) {
    return ERROR_STACK_MSG(kErrorCodeInvalidParameter, "--project and --function are required");
  }
  master::MasterOptions master_options(options_.master_);
  master_options.auto_start_projects_ = false;
  task::TaskOptions task_options(options_.task_);
  task_options.cleanup_interval_ms_ = 0;
  registry::CoordinationRegistry registry(options_.registry_);
  master::Master master(&registry, master_options, options_.worker_);
  task::TaskManager task_manager(&registry, &master, task_options);

  CHECK_ERROR(master.start());
  ErrorStack initialized = task_manager.initialize();
  if (initialized.is_error()) {
    LOG(ERROR) << "Failed to start the task manager: " << initialized;
    ErrorStack stopped = master.stop();
    if (stopped.is_error()) {
      LOG(ERROR) << "Failed to stop the master: " << stopped;
    }
    return initialized;
  }

  task::Task task;
  ErrorStack created = task_manager.create_task(project_, function_, payload_, &task);
  if (created.is_error()) {
    LOG(ERROR) << "Failed to create a task: " << created;
    ErrorStack shut = shutdown_all(&master, &task_manager);
    if (shut.is_error()) {
      LOG(ERROR) << "Failed to shut down: " << shut;
    }
    return created;
  }
  std::cerr << "Submitted task " << task.task_id_ << std::endl;

  const uint64_t kChunkMs = 1000;
  bool finished = false;
  uint64_t waited = 0;
  while (!finished && (wait_ms_ == 0 || waited < wait_ms_)) {
    uint64_t chunk = kChunkMs;
    if (wait_ms_ != 0 && wait_ms_ - waited < chunk) {
      chunk = wait_ms_ - waited;
    }
    finished = task_manager.wait_for_task(task.task_id_, chunk, &task);
    waited += chunk;
  }
  std::cout << task << std::endl;
  if (!finished) {
    std::cerr << "Task " << task.task_id_ << " did not finish in " << wait_ms_ << "ms."
      << " It is marked failed on the next start." << std::endl;
  }
  return shutdown_all(&master, &task_manager);
}

ErrorStack CliRunner::run_task_mode() {
  task::TaskOptions task_options(options_.task_);
  task_options.cleanup_interval_ms_ = 0;
  registry::CoordinationRegistry registry(options_.registry_);
  // only reads and updates records. nothing is executed.
  master::Master master(&registry, options_.master_, options_.worker_);
  task::TaskManager task_manager(&registry, &master, task_options);
  CHECK_ERROR(task_manager.initialize());

  ErrorStack result;
  if (mode_ == kStatus || mode_ == kCancel) {
    if (task_id_.empty()) {
      result = ERROR_STACK_MSG(kErrorCodeInvalidParameter, "--task_id is required");
    } else if (mode_ == kStatus) {
      task::Task task;
      bool found = false;
      result = task_manager.get_task_status(task_id_, &task, &found);
      if (!result.is_error()) {
        if (found) {
          std::cout << task << std::endl;
        } else {
          result = ERROR_STACK_MSG(kErrorCodeTaskNotFound, task_id_.c_str());
        }
      }
    } else {
      bool cancelled = false;
      result = task_manager.cancel_task(task_id_, &cancelled);
      if (!result.is_error()) {
        std::cout << "<cancelled>" << (cancelled ? "true" : "false") << "</cancelled>"
          << std::endl;
      }
    }
  } else if (mode_ == kList) {
    task::TaskFilter filter;
    filter.project_name_ = project_;
    if (!status_filter_.empty()) {
      filter.filter_status_ = true;
      if (!task::parse_status_name(status_filter_, &filter.status_)) {
        result = ERROR_STACK_MSG(kErrorCodeTaskInvalidStatus, status_filter_.c_str());
      }
    }
    std::vector<task::Task> tasks;
    if (!result.is_error()) {
      result = task_manager.list_tasks(filter, &tasks);
    }
    if (!result.is_error()) {
      std::cout << "<Tasks count=\"" << tasks.size() << "\">" << std::endl;
      for (const task::Task& task : tasks) {
        std::cout << task;
      }
      std::cout << "</Tasks>" << std::endl;
    }
  } else {
    uint32_t removed = 0;
    result = task_manager.cleanup_old_tasks(days_, &removed);
    if (!result.is_error()) {
      std::cout << "<removed>" << removed << "</removed>" << std::endl;
    }
  }

  ErrorStack uninitialized = task_manager.uninitialize();
  if (result.is_error()) {
    if (uninitialized.is_error()) {
      LOG(ERROR) << "Failed to stop the task manager: " << uninitialized;
    }
    return result;
  }
  return uninitialized;
}

ErrorStack CliRunner::run_project_mode() {
  registry::CoordinationRegistry registry(options_.registry_);
  master::Master master(&registry, options_.master_, options_.worker_);
  master::ProjectManager project_manager(&master, options_.worker_);

  if (mode_ == kProjects) {
    std::vector<master::ProjectSummary> projects;
    CHECK_ERROR(project_manager.list_projects(&projects));
    std::cout << "<Projects count=\"" << projects.size() << "\">" << std::endl;
    for (const master::ProjectSummary& project : projects) {
      std::cout << "  " << project << std::endl;
    }
    std::cout << "</Projects>" << std::endl;
    return kRetOk;
  }

  if (project_.empty()) {
    return ERROR_STACK_MSG(kErrorCodeInvalidParameter, "--project is required");
  }
  if (mode_ == kFunctions) {
    std::vector<worker::FunctionInfo> functions;
    CHECK_ERROR(project_manager.list_functions(project_, &functions));
    std::cout << "<Functions project=\"" << project_ << "\" count=\"" << functions.size()
      << "\">" << std::endl;
    for (const worker::FunctionInfo& function : functions) {
      std::cout << "  " << function << std::endl;
    }
    std::cout << "</Functions>" << std::endl;
  } else if (mode_ == kDeploy) {
    if (function_.empty() || source_file_.empty()) {
      return ERROR_STACK_MSG(kErrorCodeInvalidParameter,
        "--function and --source_file are required");
    }
    std::string source;
    if (!fs::read_file(fs::Path(source_file_), &source)) {
      return ERROR_STACK_MSG(kErrorCodeFsReadFail, source_file_.c_str());
    }
    CHECK_ERROR(project_manager.deploy_function(project_, function_, source));
    std::cout << "Deployed " << project_ << "/" << function_ << std::endl;
  } else if (mode_ == kDeleteFunction) {
    if (function_.empty()) {
      return ERROR_STACK_MSG(kErrorCodeInvalidParameter, "--function is required");
    }
    bool deleted = false;
    CHECK_ERROR(project_manager.delete_function(project_, function_, &deleted));
    std::cout << "<deleted>" << (deleted ? "true" : "false") << "</deleted>" << std::endl;
  } else {
    bool deleted = false;
    CHECK_ERROR(project_manager.delete_project(project_, &deleted));
    std::cout << "<deleted>" << (deleted ? "true" : "false") << "</deleted>" << std::endl;
  }
  return kRetOk;
}

ErrorStack CliRunner::dump_config() {
  std::cout << options_ << std::endl;
  return kRetOk;
}

}  // namespace util
}  // namespace cloudfn
