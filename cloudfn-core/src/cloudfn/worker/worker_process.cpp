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
#include "cloudfn/worker/worker_process.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "cloudfn/error_code.hpp"
#include "cloudfn/debugging/raw_log.hpp"
#include "cloudfn/registry/coordination_registry.hpp"
#include "cloudfn/soc/channel_block.hpp"
#include "cloudfn/soc/shared_rendezvous.hpp"
#include "cloudfn/thread/bounded_thread_pool_impl.hpp"
#include "cloudfn/worker/environment_provisioner.hpp"
#include "cloudfn/worker/function_source_provider.hpp"
#include "cloudfn/worker/handler.hpp"
#include "cloudfn/worker/native_function_table.hpp"

namespace cloudfn {
namespace worker {

/** Interval to check the channel while a handler runs on the pool. */
const uint64_t kPollIntervalMicrosec = 10000;

WorkerProcess::WorkerProcess(
  const std::string& project_name,
  const WorkerOptions& options,
  const fs::Path& projects_dir,
  soc::ChannelBlock* channel,
  thread::BoundedThreadPool* executor,
  const Collaborators& collaborators)
  : project_name_(project_name),
    options_(options),
    projects_dir_(projects_dir),
    channel_(channel),
    executor_(executor),
    collaborators_(collaborators),
    environment_(new ProjectEnvironment()),
    stop_requested_(false),
    succeeded_count_(0),
    failed_count_(0),
    rejected_count_(0) {
}

WorkerProcess::~WorkerProcess() {
}

ErrorStack WorkerProcess::initialize_once() {
  init_error_message_.clear();
  ErrorStack result = initialize_impl();
  if (result.is_error()) {
    init_error_message_ = result.describe_brief();
    RAW_LOG_STREAM(ERROR) << "[" << project_name_ << "] Worker failed to initialize: " << result;
  }
  return result;
}

ErrorStack WorkerProcess::initialize_impl() {
  fs::Path project_dir(projects_dir_);
  project_dir /= project_name_;
  fs::Path project_env_file(project_dir);
  project_env_file /= std::string(".env");

  std::shared_ptr<ProjectEnvironment> environment(new ProjectEnvironment());
  CHECK_ERROR(ProjectEnvironment::load(
    fs::Path(options_.system_env_file_),
    project_env_file,
    environment.get()));
  environment_ = environment;
  RAW_LOG_STREAM(INFO) << "[" << project_name_ << "] Loaded environment " << *environment_;

  if (collaborators_.provisioner_) {
    CHECK_ERROR(collaborators_.provisioner_->ensure_environment(project_name_));
    CHECK_ERROR(collaborators_.provisioner_->install_dependencies(project_name_));
  }
  CHECK_ERROR(scan_functions());
  RAW_LOG_STREAM(INFO) << "[" << project_name_ << "] Worker initialized with " << functions_.size()
    << " functions";
  return kRetOk;
}

ErrorStack WorkerProcess::scan_functions() {
  functions_.clear();
  handlers_.clear();

  std::vector<std::string> natives;
  if (collaborators_.natives_) {
    natives = collaborators_.natives_->list_functions(project_name_);
  }

  std::vector<fs::Path> files;
  if (collaborators_.source_provider_) {
    ErrorStack listed = collaborators_.source_provider_->list_function_files(
      project_name_,
      &files);
    if (listed.is_error()) {
      if (listed.get_error_code() != kErrorCodeProjectDirMissing || natives.empty()) {
        return listed;
      }
      RAW_LOG_STREAM(INFO) << "[" << project_name_
        << "] No project directory. Serving native functions only";
    }
  }

  for (size_t i = 0; i < files.size(); ++i) {
    FunctionInfo info;
    info.name_ = collaborators_.source_provider_->get_function_name(files[i]);
    info.file_path_ = files[i].string();
    info.entry_ = options_.entry_point_;
    EntryPointInfo entry;
    ErrorStack read = collaborators_.source_provider_->read_entry_point(
      files[i],
      options_.entry_point_,
      &entry);
    if (read.is_error()) {
      info.load_error_ = read.describe_brief();
      RAW_LOG_STREAM(WARNING) << "[" << project_name_ << "] Could not read " << files[i] << ": "
        << info.load_error_;
    } else if (!entry.found_) {
      info.load_error_ = "no entry point '" + options_.entry_point_ + "' in " + info.file_path_;
      RAW_LOG_STREAM(WARNING) << "[" << project_name_ << "] " << info.load_error_;
    } else {
      info.status_ = FunctionInfo::kRegistered;
      info.asynchronous_ = entry.asynchronous_;
      info.description_ = entry.description_;
    }
    functions_[info.name_] = info;
  }

  // native functions shadow files of the same name
  for (size_t i = 0; i < natives.size(); ++i) {
    NativeFunctionTable::Entry entry;
    if (!collaborators_.natives_->find(project_name_, natives[i], &entry)) {
      continue;  // removed concurrently
    }
    FunctionInfo info;
    info.name_ = natives[i];
    info.entry_ = options_.entry_point_;
    info.description_ = entry.description_;
    info.asynchronous_ = entry.asynchronous_;
    info.status_ = FunctionInfo::kRegistered;
    functions_[info.name_] = info;
  }
  return kRetOk;
}

ErrorStack WorkerProcess::uninitialize_once() {
  handlers_.clear();
  functions_.clear();
  pending_.clear();
  return kRetOk;
}

bool WorkerProcess::get_function(const std::string& name, FunctionInfo* out) const {
  std::map<std::string, FunctionInfo>::const_iterator it = functions_.find(name);
  if (it == functions_.end()) {
    return false;
  }
  *out = it->second;
  return true;
}

std::vector<FunctionInfo> WorkerProcess::list_functions() const {
  std::vector<FunctionInfo> ret;
  for (std::map<std::string, FunctionInfo>::const_iterator it = functions_.begin();
        it != functions_.end(); ++it) {
    ret.push_back(it->second);
  }
  return ret;
}

ErrorStack WorkerProcess::load_function(
  FunctionInfo* function,
  std::shared_ptr<Handler>* handler) {
  std::map<std::string, std::shared_ptr<Handler> >::const_iterator it
    = handlers_.find(function->name_);
  if (it != handlers_.end()) {
    *handler = it->second;
    return kRetOk;
  }
  if (collaborators_.resolver_ == CXX11_NULLPTR) {
    return ERROR_STACK_MSG(kErrorCodeWorkerFunctionLoadFailed, "no handler resolver");
  }
  ErrorStack resolved = collaborators_.resolver_->resolve(project_name_, *function, handler);
  if (resolved.is_error()) {
    function->load_error_ = resolved.describe_brief();
    RAW_LOG_STREAM(WARNING) << "[" << project_name_ << "] Failed to load " << function->name_
      << ": " << function->load_error_;
    return resolved;
  }
  function->status_ = FunctionInfo::kLoaded;
  function->asynchronous_ = (*handler)->is_asynchronous();
  function->load_error_.clear();
  handlers_[function->name_] = *handler;
  RAW_LOG_STREAM(INFO) << "[" << project_name_ << "] Loaded " << *function;
  return kRetOk;
}

ErrorStack WorkerProcess::execute_function(
  const std::string& function_name,
  const std::string& payload,
  std::string* result) {
  if (!is_initialized()) {
    if (init_error_message_.empty()) {
      return ERROR_STACK(kErrorCodeWorkerNotInitialized);
    }
    return ERROR_STACK_MSG(kErrorCodeWorkerNotInitialized, init_error_message_.c_str());
  }
  std::map<std::string, FunctionInfo>::iterator it = functions_.find(function_name);
  if (it == functions_.end()) {
    std::string message = "'" + function_name + "' in project " + project_name_;
    return ERROR_STACK_MSG(kErrorCodeWorkerFunctionNotFound, message.c_str());
  }
  FunctionInfo* function = &it->second;
  if (function->status_ == FunctionInfo::kUnregistered) {
    return ERROR_STACK_MSG(kErrorCodeWorkerEntryPointMissing, function->load_error_.c_str());
  }

  std::shared_ptr<Handler> handler;
  CHECK_ERROR(load_function(function, &handler));
  return dispatch(handler, payload, result);
}

ErrorStack WorkerProcess::dispatch(
  const std::shared_ptr<Handler>& handler,
  const std::string& payload,
  std::string* result) {
  if (handler->is_asynchronous()) {
    return handler->invoke(payload, *environment_, result);
  }

  if (executor_ == CXX11_NULLPTR) {
    return ERROR_STACK(kErrorCodeWorkerPoolStopped);
  }
  // The job owns everything it touches. An interrupted execution leaves it running.
  std::shared_ptr<const std::string> shared_payload(new std::string(payload));
  std::shared_ptr<std::string> output(new std::string());
  std::shared_ptr<const ProjectEnvironment> environment = environment_;
  std::shared_ptr<thread::PoolJob> job = executor_->submit(
    [handler, shared_payload, output, environment]() {
      return handler->invoke(*shared_payload, *environment, output.get());
    });
  if (!job) {
    return ERROR_STACK(kErrorCodeWorkerPoolStopped);
  }

  while (!job->is_done()) {
    poll_channel_during_execution();
    if (stop_requested_) {
      RAW_LOG_STREAM(WARNING) << "[" << project_name_
        << "] Stop requested while a handler is running";
      return ERROR_STACK_MSG(kErrorCodeFunctionExecutionFailed, "worker is stopping");
    }
  }
  CHECK_ERROR(job->get_result());
  *result = *output;
  return kRetOk;
}

void WorkerProcess::poll_channel_during_execution() {
  soc::ChannelMessage message;
  ErrorCode code = channel_->receive_request(&message, kPollIntervalMicrosec);
  if (code == kErrorCodeTimeout) {
    return;
  } else if (code == kErrorCodeChannelClosed) {
    stop_requested_ = true;
  } else if (code != kErrorCodeOk) {
    RAW_LOG_STREAM(ERROR) << "[" << project_name_ << "] Dropped a request: "
      << get_error_message(code);
  } else if (message.type_ == soc::ChannelMessage::kStop) {
    stop_requested_ = true;
  } else {
    pending_.push_back(message);
  }
}

soc::ChannelMessage WorkerProcess::handle_execute(const soc::ChannelMessage& request) {
  std::string result;
  ErrorStack error = execute_function(request.name_, request.body_, &result);
  if (!error.is_error()) {
    ++succeeded_count_;
    return soc::ChannelMessage::make_success(result);
  }

  ErrorCode code = error.get_error_code();
  if (code == kErrorCodeWorkerNotInitialized
    || code == kErrorCodeWorkerFunctionNotFound
    || code == kErrorCodeWorkerEntryPointMissing) {
    ++rejected_count_;
  } else {
    ++failed_count_;
  }
  RAW_LOG_STREAM(INFO) << "[" << project_name_ << "] " << request.name_ << " failed: " << error;
  return soc::ChannelMessage::make_error(error);
}

ErrorStack WorkerProcess::run() {
  channel_->get_ready()->signal();
  RAW_LOG_STREAM(INFO) << "[" << project_name_ << "] Worker is ready"
    << (is_initialized() ? "" : " (not initialized)");

  while (!stop_requested_) {
    soc::ChannelMessage request;
    if (!pending_.empty()) {
      request = pending_.front();
      pending_.pop_front();
    } else {
      ErrorCode code = channel_->receive_request(&request);
      if (code == kErrorCodeChannelClosed) {
        RAW_LOG_STREAM(INFO) << "[" << project_name_ << "] Channel closed";
        break;
      } else if (code == kErrorCodeChannelMalformedMessage) {
        RAW_LOG_STREAM(ERROR) << "[" << project_name_ << "] Ignored a malformed request";
        continue;
      } else if (code != kErrorCodeOk) {
        return ERROR_STACK(code);
      }
    }

    if (request.type_ == soc::ChannelMessage::kStop) {
      RAW_LOG_STREAM(INFO) << "[" << project_name_ << "] Received stop";
      break;
    } else if (request.type_ != soc::ChannelMessage::kExecute) {
      RAW_LOG_STREAM(ERROR) << "[" << project_name_ << "] Ignored an unexpected message "
        << request;
      continue;
    }

    soc::ChannelMessage response = handle_execute(request);
    ErrorCode sent = channel_->send_response(response);
    if (sent == kErrorCodeChannelMessageTooLarge) {
      RAW_LOG_STREAM(ERROR) << "[" << project_name_ << "] Result of " << request.name_
        << " does not fit in the channel";
      ErrorStack too_large = ERROR_STACK_MSG(
        kErrorCodeChannelMessageTooLarge,
        "result does not fit in the channel");
      sent = channel_->send_response(soc::ChannelMessage::make_error(too_large));
    }
    if (sent == kErrorCodeChannelClosed) {
      RAW_LOG_STREAM(INFO) << "[" << project_name_ << "] Channel closed";
      break;
    } else if (sent != kErrorCodeOk) {
      return ERROR_STACK(sent);
    }
  }

  RAW_LOG_STREAM(INFO) << "[" << project_name_ << "] Worker loop ended. succeeded="
    << succeeded_count_ << ", failed=" << failed_count_ << ", rejected=" << rejected_count_;
  return kRetOk;
}

int worker_main(
  const registry::WorkerContext& context,
  const WorkerOptions& options,
  const fs::Path& projects_dir,
  const NativeFunctionTable* natives) {
  CommandProvisioner provisioner(options, projects_dir);
  ScriptSourceProvider source_provider(projects_dir, options.function_file_suffix_);
  DefaultHandlerResolver resolver(options, natives);

  WorkerProcess::Collaborators collaborators;
  collaborators.provisioner_ = &provisioner;
  collaborators.source_provider_ = &source_provider;
  collaborators.resolver_ = &resolver;
  collaborators.natives_ = natives;

  thread::BoundedThreadPool* executor = context.registry_->get_executor(
    context.project_name_,
    options.handler_pool_size_);
  WorkerProcess worker(
    context.project_name_,
    options,
    projects_dir,
    context.channel_,
    executor,
    collaborators);

  // a failed initialization is reported to every execute request
  ErrorStack init_error = worker.initialize();
  if (init_error.is_error()) {
    RAW_LOG_STREAM(WARNING) << "[" << context.project_name_ << "] Serving in not-initialized state";
  }
  ErrorStack run_error = worker.run();
  if (run_error.is_error()) {
    RAW_LOG_STREAM(ERROR) << "[" << context.project_name_ << "] Worker loop failed: " << run_error;
  }
  if (worker.is_initialized()) {
    ErrorStack uninit_error = worker.uninitialize();
    if (uninit_error.is_error()) {
      RAW_LOG_STREAM(ERROR) << "[" << context.project_name_ << "] Failed to uninitialize: "
        << uninit_error;
    }
  }
  return run_error.is_error() ? 1 : 0;
}

}  // namespace worker
}  // namespace cloudfn
