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
#include "cloudfn/worker/worker_options.hpp"

#include <string>

#include "cloudfn/assorted/assorted_func.hpp"
#include "cloudfn/externalize/externalizable.hpp"

namespace cloudfn {
namespace worker {

const char* const WorkerOptions::kDefaultRuntimeCommand =
  "\"$ENV_DIR$/bin/python\" -c '"
  "import asyncio, importlib.util, inspect, json, os, sys\n"
  "spec = importlib.util.spec_from_file_location(\"cloudfn_function\","
  " os.environ[\"CLOUDFN_FUNCTION_FILE\"])\n"
  "module = importlib.util.module_from_spec(spec)\n"
  "spec.loader.exec_module(module)\n"
  "handler = getattr(module, os.environ[\"CLOUDFN_FUNCTION_ENTRY\"])\n"
  "data = sys.stdin.read()\n"
  "result = handler(json.loads(data) if data.strip() else None)\n"
  "if inspect.isawaitable(result):\n"
  "    result = asyncio.run(result)\n"
  "sys.stdout.write(json.dumps(result))\n"
  "'";

WorkerOptions::WorkerOptions() :
  handler_pool_size_(kDefaultHandlerPoolSize),
  function_file_suffix_(".py"),
  entry_point_("main"),
  runtime_command_(kDefaultRuntimeCommand),
  environments_dir_pattern_("/tmp/cloudfn/envs/$PROJECT$"),
  ensure_environment_command_("python3 -m venv \"$ENV_DIR$\""),
  install_command_("\"$ENV_DIR$/bin/pip\" install -r \"$MANIFEST$\""),
  dependency_manifest_name_("requirements.txt"),
  system_manifest_path_(""),
  system_env_file_(""),
  handler_timeout_ms_(0) {
}

std::string WorkerOptions::convert_environments_dir_pattern(const std::string& project) const {
  return assorted::replace_all(environments_dir_pattern_, "$PROJECT$", project);
}

ErrorStack WorkerOptions::load(tinyxml2::XMLElement* element) {
  EXTERNALIZE_LOAD_ELEMENT(element, handler_pool_size_);
  EXTERNALIZE_LOAD_ELEMENT(element, function_file_suffix_);
  EXTERNALIZE_LOAD_ELEMENT(element, entry_point_);
  EXTERNALIZE_LOAD_ELEMENT(element, runtime_command_);
  EXTERNALIZE_LOAD_ELEMENT(element, environments_dir_pattern_);
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, ensure_environment_command_, "");
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, install_command_, "");
  EXTERNALIZE_LOAD_ELEMENT(element, dependency_manifest_name_);
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, system_manifest_path_, "");
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, system_env_file_, "");
  EXTERNALIZE_LOAD_ELEMENT(element, handler_timeout_ms_);
  if (handler_pool_size_ == 0) {
    return ERROR_STACK_MSG(kErrorCodeConfValueOutofrange, "handler_pool_size_ must be positive");
  }
  if (entry_point_.empty() || function_file_suffix_.empty()) {
    return ERROR_STACK_MSG(kErrorCodeConfInvalidElement, "entry point and suffix are mandatory");
  }
  return kRetOk;
}

ErrorStack WorkerOptions::save(tinyxml2::XMLElement* element) const {
  CHECK_ERROR(insert_comment(element, "Set of options for worker processes.\n"
    " Commands are run with /bin/sh and may contain placeholders:\n"
    " $PROJECT$, $PROJECT_DIR$, $ENV_DIR$ and $MANIFEST$ (install_command_ only)."));

  EXTERNALIZE_SAVE_ELEMENT(element, handler_pool_size_,
    "Number of threads that run synchronous handlers in each worker. Default is 10.");
  EXTERNALIZE_SAVE_ELEMENT(element, function_file_suffix_,
    "Files with this suffix in a project directory are function files.");
  EXTERNALIZE_SAVE_ELEMENT(element, entry_point_,
    "Name of the entry point each function file must define. Default is main.");
  EXTERNALIZE_SAVE_ELEMENT(element, runtime_command_,
    "Command that runs one function. Payload on stdin, result on stdout.\n"
    " CLOUDFN_FUNCTION_FILE and CLOUDFN_FUNCTION_ENTRY tell which function to run.");
  EXTERNALIZE_SAVE_ELEMENT(element, environments_dir_pattern_,
    "Directory of each project's isolated environment. $PROJECT$ is replaced.");
  EXTERNALIZE_SAVE_ELEMENT(element, ensure_environment_command_,
    "Creates the environment when its directory does not exist. Empty to skip.");
  EXTERNALIZE_SAVE_ELEMENT(element, install_command_,
    "Installs the merged dependency manifest into the environment. Empty to skip.");
  EXTERNALIZE_SAVE_ELEMENT(element, dependency_manifest_name_,
    "File name of the dependency manifest in each project directory.");
  EXTERNALIZE_SAVE_ELEMENT(element, system_manifest_path_,
    "System-wide dependency manifest. Project entries override it by package name.");
  EXTERNALIZE_SAVE_ELEMENT(element, system_env_file_,
    "System-wide .env file. Each project's .env overrides it per key.");
  EXTERNALIZE_SAVE_ELEMENT(element, handler_timeout_ms_,
    "Milliseconds before a running function subprocess is killed. 0 means no limit.");
  return kRetOk;
}

}  // namespace worker
}  // namespace cloudfn
