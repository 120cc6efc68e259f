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
#include <gflags/gflags.h>
#include <glog/logging.h>
#include <stdint.h>

#include <iostream>
#include <sstream>
#include <string>

#include "cloudfn/cloudfn_options.hpp"
#include "cloudfn/debugging/debugging_supports.hpp"
#include "cloudfn/fs/filesystem.hpp"
#include "cloudfn/fs/path.hpp"
#include "cloudfn/util/cli_runner.hpp"

/**
 * @file cloudfn_cli.cpp
 * @brief Command-line tool of cloudfn
 * @details
 * Runs the control plane (serve), executes functions, and manages tasks and projects.
 */
DEFINE_string(config, "", "Path of an XML file of CloudfnOptions. Defaults apply if empty.");
DEFINE_string(mode, "dump_config", "What to do. See the usage message for the list of modes.");
DEFINE_string(project, "", "Project name.");
DEFINE_string(function, "", "Function name.");
DEFINE_string(payload, "{}", "Payload given to the function.");
DEFINE_string(task_id, "", "Task ID for status and cancel.");
DEFINE_string(status_filter, "", "Only list tasks in this status (created, running, completed,"
  " failed, cancelled).");
DEFINE_string(source_file, "", "Source file to deploy.");
DEFINE_int32(days, 7, "cleanup removes task records created more than this many days ago.");
DEFINE_int64(wait_ms, 0, "submit waits this long for the task to finish. 0 waits forever.");

bool ValidateMode(const char* flagname, const std::string& value) {
  cloudfn::util::CliRunner::Mode mode;
  if (cloudfn::util::CliRunner::parse_mode(value, &mode)) {
    return true;
  } else {
    std::cout << "Invalid value for --" << flagname << ": " << value << std::endl;
    return false;
  }
}

bool ValidateNonNegative(const char* flagname, int32_t value) {
  if (value >= 0) {
    return true;
  } else {
    std::cout << "Invalid value for --" << flagname << ": " << value << std::endl;
    return false;
  }
}

bool ValidateWait(const char* flagname, int64_t value) {
  if (value >= 0) {
    return true;
  } else {
    std::cout << "Invalid value for --" << flagname << ": " << value << std::endl;
    return false;
  }
}

int main(int argc, char* argv[]) {
  std::stringstream usage;
  usage << "Command-line tool of cloudfn" << std::endl
    << "  Usage: cloudfn_cli --config=<xml> --mode=<mode> <flags>" << std::endl
    << "  Modes:" << std::endl;
  cloudfn::util::CliRunner::describe_modes(&usage);
  usage << "  Example: cloudfn_cli --config=cloudfn.xml --mode=serve" << std::endl
    << "  Example2: cloudfn_cli --mode=invoke --project=demo --function=echo --payload='{\"x\":1}'";
  gflags::SetUsageMessage(usage.str());
  gflags::RegisterFlagValidator(&FLAGS_mode,      &ValidateMode);
  gflags::RegisterFlagValidator(&FLAGS_days,      &ValidateNonNegative);
  gflags::RegisterFlagValidator(&FLAGS_wait_ms,   &ValidateWait);
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  cloudfn::util::CliRunner runner;
  cloudfn::util::CliRunner::parse_mode(FLAGS_mode, &runner.mode_);
  runner.project_       = FLAGS_project;
  runner.function_      = FLAGS_function;
  runner.payload_       = FLAGS_payload;
  runner.task_id_       = FLAGS_task_id;
  runner.status_filter_ = FLAGS_status_filter;
  runner.source_file_   = FLAGS_source_file;
  runner.days_          = static_cast<uint32_t>(FLAGS_days);
  runner.wait_ms_       = static_cast<uint64_t>(FLAGS_wait_ms);

  if (!FLAGS_config.empty()) {
    cloudfn::fs::Path path(FLAGS_config);
    if (!cloudfn::fs::exists(path)) {
      std::cerr << "Config file does not exist: " << FLAGS_config << std::endl;
      return 1;
    }
    // glog is not initialized yet. errors go to stderr.
    cloudfn::ErrorStack loaded = runner.options_.load_from_file(path);
    if (loaded.is_error()) {
      std::cerr << "Failed to load " << FLAGS_config << ": " << loaded << std::endl;
      return 1;
    }
  }

  cloudfn::debugging::DebuggingSupports debugging(runner.options_.debugging_);
  cloudfn::ErrorStack initialized = debugging.initialize();
  if (initialized.is_error()) {
    std::cerr << "Failed to initialize logging: " << initialized << std::endl;
    return 1;
  }
  int ret = runner.execute();
  cloudfn::ErrorStack uninitialized = debugging.uninitialize();
  if (uninitialized.is_error()) {
    std::cerr << "Failed to uninitialize logging: " << uninitialized << std::endl;
  }
  return ret;
}
