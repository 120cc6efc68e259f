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
#ifndef CLOUDFN_UTIL_CLI_RUNNER_HPP_
#define CLOUDFN_UTIL_CLI_RUNNER_HPP_
#include <stdint.h>

#include <iosfwd>
#include <string>

#include "cloudfn/cloudfn_options.hpp"
#include "cloudfn/error_stack.hpp"

namespace cloudfn {
namespace util {

// X-Macro for CliRunner::Mode
#define CLI_MODES \
  X(kServe, "serve", "Runs master, task manager and scheduler until SIGINT/SIGTERM.") \
  X(kInvoke, "invoke", "Executes one function synchronously and prints its result.") \
  X(kSubmit, "submit", "Creates a task, waits for it, and prints the task record.") \
  X(kStatus, "status", "Prints the record of --task_id.") \
  X(kList, "list", "Prints task records, optionally filtered by --project/--status_filter.") \
  X(kCancel, "cancel", "Cancels --task_id if it is still created or running.") \
  X(kCleanup, "cleanup", "Removes task records older than --days days.") \
  X(kProjects, "projects", "Prints discovered projects and their function counts.") \
  X(kFunctions, "functions", "Prints functions of --project.") \
  X(kDeploy, "deploy", "Deploys --source_file as --function of --project.") \
  X(kDeleteFunction, "delete_function", "Deletes --function of --project.") \
  X(kDeleteProject, "delete_project", "Deletes --project with its environment.") \
  X(kDumpConfig, "dump_config", "Prints the effective configuration as XML.")

/**
 * @brief Implementation of the cloudfn_cli command-line tool.
 * @details
 * The tool constructs its own registry and components in this process.
 * Task modes other than serve and submit open the task directory themselves, so they
 * should not be used on a task directory a running serve process is using.
 */
struct CliRunner {
  enum Mode {
#define X(a, b, c) /** c */ a,
CLI_MODES
#undef X
  };
  static bool         parse_mode(const std::string& name, Mode* out);
  static const char*  to_mode_name(Mode mode);
  static void         describe_modes(std::ostream* out);

  CliRunner() : mode_(kDumpConfig), days_(7), wait_ms_(0) {}

  /** @return exit status of the tool */
  int         execute();

  CloudfnOptions  options_;
  Mode            mode_;
  std::string     project_;
  std::string     function_;
  std::string     payload_;
  std::string     task_id_;
  std::string     status_filter_;
  std::string     source_file_;
  uint32_t        days_;
  /** submit waits this long for the task to finish. 0 waits forever. */
  uint64_t        wait_ms_;

 private:
  ErrorStack  serve();
  ErrorStack  invoke();
  ErrorStack  submit();
  ErrorStack  run_task_mode();
  ErrorStack  run_project_mode();
  ErrorStack  dump_config();
};

}  // namespace util
}  // namespace cloudfn
#endif  // CLOUDFN_UTIL_CLI_RUNNER_HPP_
