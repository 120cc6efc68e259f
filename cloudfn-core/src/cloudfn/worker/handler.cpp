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
#include "cloudfn/worker/handler.hpp"

#include <exception>
#include <map>
#include <memory>
#include <string>

#include "cloudfn/assorted/assorted_func.hpp"
#include "cloudfn/debugging/raw_log.hpp"
#include "cloudfn/fs/filesystem.hpp"
#include "cloudfn/process/subprocess.hpp"
#include "cloudfn/worker/environment_provisioner.hpp"
#include "cloudfn/worker/project_environment.hpp"

namespace cloudfn {
namespace worker {

////////////////////////////////////////////////////////////////////////////////////
//
//              SubprocessHandler
//
////////////////////////////////////////////////////////////////////////////////////
SubprocessHandler::SubprocessHandler(
  const std::string& command,
  const std::string& project,
  const FunctionInfo& function,
  uint64_t timeout_ms)
  : command_(command),
    project_(project),
    function_name_(function.name_),
    file_path_(function.file_path_),
    entry_(function.entry_),
    asynchronous_(function.asynchronous_),
    timeout_ms_(timeout_ms) {
}

ErrorStack SubprocessHandler::invoke(
  const std::string& payload,
  const ProjectEnvironment& environment,
  std::string* result) {
  process::SubprocessRequest request;
  request.argv_.push_back("/bin/sh");
  request.argv_.push_back("-c");
  request.argv_.push_back(command_);
  request.search_path_ = false;
  request.stdin_data_ = payload;
  request.timeout_ms_ = timeout_ms_;
  request.extra_env_ = environment.get_variables();
  request.extra_env_["CLOUDFN_PROJECT"] = project_;
  request.extra_env_["CLOUDFN_FUNCTION_NAME"] = function_name_;
  request.extra_env_["CLOUDFN_FUNCTION_FILE"] = file_path_;
  request.extra_env_["CLOUDFN_FUNCTION_ENTRY"] = entry_;

  process::SubprocessResult output;
  CHECK_ERROR(process::run_subprocess(request, &output));
  if (!output.is_success()) {
    RAW_LOG_STREAM(INFO) << "Function " << project_ << "/" << function_name_ << " failed: "
      << output;
    return ERROR_STACK_MSG(kErrorCodeSubprocessFailed, output.describe_failure().c_str());
  }
  *result = output.stdout_;
  if (!result->empty() && (*result)[result->size() - 1] == '\n') {
    result->erase(result->size() - 1);
  }
  return kRetOk;
}

////////////////////////////////////////////////////////////////////////////////////
//
//              NativeHandler
//
////////////////////////////////////////////////////////////////////////////////////
ErrorStack NativeHandler::invoke(
  const std::string& payload,
  const ProjectEnvironment& environment,
  std::string* result) {
  try {
    return entry_.function_(payload, environment, result);
  } catch (const std::exception& ex) {
    // user code. convert to an execution error like any other handler failure.
    return ERROR_STACK_MSG(kErrorCodeFunctionExecutionFailed, ex.what());
  }
}

////////////////////////////////////////////////////////////////////////////////////
//
//              DefaultHandlerResolver
//
////////////////////////////////////////////////////////////////////////////////////
DefaultHandlerResolver::DefaultHandlerResolver(
  const WorkerOptions& options,
  const NativeFunctionTable* natives)
  : options_(options), natives_(natives) {
}

ErrorStack DefaultHandlerResolver::resolve(
  const std::string& project,
  const FunctionInfo& function,
  std::shared_ptr<Handler>* out) {
  NativeFunctionTable::Entry native;
  if (natives_ && natives_->find(project, function.name_, &native)) {
    out->reset(new NativeHandler(native));
    return kRetOk;
  }
  if (function.file_path_.empty() || !fs::is_regular_file(fs::Path(function.file_path_))) {
    std::string msg = project + "/" + function.name_ + ": function file is gone";
    return ERROR_STACK_MSG(kErrorCodeWorkerFunctionLoadFailed, msg.c_str());
  }

  std::map<std::string, std::string> placeholders;
  placeholders["$PROJECT$"] = project;
  placeholders["$PROJECT_DIR$"] = fs::Path(function.file_path_).parent_path().string();
  placeholders["$ENV_DIR$"] = options_.convert_environments_dir_pattern(project);
  std::string command = CommandProvisioner::expand_placeholders(
    options_.runtime_command_,
    placeholders);
  out->reset(new SubprocessHandler(command, project, function, options_.handler_timeout_ms_));
  return kRetOk;
}

}  // namespace worker
}  // namespace cloudfn
