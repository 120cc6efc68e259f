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
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "cloudfn/cloudfn_options.hpp"
#include "cloudfn/test_common.hpp"
#include "cloudfn/fs/filesystem.hpp"
#include "cloudfn/fs/path.hpp"
#include "cloudfn/util/cli_runner.hpp"

namespace cloudfn {
namespace util {
DEFINE_TEST_CASE_PACKAGE(CliRunnerTest, cloudfn.util);

const char* const kEchoSource = "def main(payload):\n    return payload\n";

/** Runs the tool and returns what it printed to stdout. */
std::string run_cli(CliRunner* runner, int* exit_status) {
  testing::internal::CaptureStdout();
  *exit_status = runner->execute();
  return testing::internal::GetCapturedStdout();
}

CliRunner make_runner(const CloudfnOptions& options, CliRunner::Mode mode) {
  CliRunner runner;
  runner.options_ = options;
  runner.mode_ = mode;
  return runner;
}

TEST(CliRunnerTest, Modes) {
  CliRunner::Mode mode = CliRunner::kServe;
  EXPECT_TRUE(CliRunner::parse_mode("delete_function", &mode));
  EXPECT_EQ(CliRunner::kDeleteFunction, mode);
  EXPECT_TRUE(CliRunner::parse_mode("submit", &mode));
  EXPECT_EQ(CliRunner::kSubmit, mode);
  EXPECT_FALSE(CliRunner::parse_mode("Submit", &mode));
  EXPECT_FALSE(CliRunner::parse_mode("", &mode));
  EXPECT_STREQ("dump_config", CliRunner::to_mode_name(CliRunner::kDumpConfig));
  EXPECT_STREQ("serve", CliRunner::to_mode_name(CliRunner::kServe));

  std::stringstream str;
  CliRunner::describe_modes(&str);
  EXPECT_NE(std::string::npos, str.str().find("    serve: "));
  EXPECT_NE(std::string::npos, str.str().find("    delete_project: "));
}

TEST(CliRunnerTest, DumpConfig) {
  CloudfnOptions options = get_tiny_options();
  CliRunner runner = make_runner(options, CliRunner::kDumpConfig);
  int status = -1;
  std::string out = run_cli(&runner, &status);
  EXPECT_EQ(0, status);
  EXPECT_NE(std::string::npos, out.find(options.master_.projects_dir_));
  EXPECT_NE(std::string::npos, out.find("<CloudfnOptions>"));
  cleanup_test(options);
}

TEST(CliRunnerTest, ProjectModes) {
  CloudfnOptions options = get_tiny_options();
  fs::Path source(options.master_.projects_dir_);
  source = source.parent_path();
  EXPECT_TRUE(fs::create_directories(source));
  source /= std::string("upload.py");
  EXPECT_TRUE(fs::durable_write_file(source, kEchoSource));

  int status = -1;
  CliRunner deploy = make_runner(options, CliRunner::kDeploy);
  deploy.project_ = "shop";
  deploy.function_ = "checkout";
  deploy.source_file_ = source.string();
  EXPECT_EQ("Deployed shop/checkout\n", run_cli(&deploy, &status));
  EXPECT_EQ(0, status);

  CliRunner functions = make_runner(options, CliRunner::kFunctions);
  functions.project_ = "shop";
  std::string out = run_cli(&functions, &status);
  EXPECT_EQ(0, status);
  EXPECT_NE(std::string::npos, out.find("count=\"1\""));
  EXPECT_NE(std::string::npos, out.find("checkout"));

  CliRunner projects = make_runner(options, CliRunner::kProjects);
  out = run_cli(&projects, &status);
  EXPECT_EQ(0, status);
  EXPECT_NE(std::string::npos, out.find("<Projects count=\"1\">"));
  EXPECT_NE(std::string::npos, out.find("name=\"shop\""));

  CliRunner delete_function = make_runner(options, CliRunner::kDeleteFunction);
  delete_function.project_ = "shop";
  delete_function.function_ = "checkout";
  EXPECT_EQ("<deleted>true</deleted>\n", run_cli(&delete_function, &status));
  EXPECT_EQ("<deleted>false</deleted>\n", run_cli(&delete_function, &status));
  EXPECT_EQ(0, status);

  CliRunner delete_project = make_runner(options, CliRunner::kDeleteProject);
  delete_project.project_ = "shop";
  EXPECT_EQ("<deleted>true</deleted>\n", run_cli(&delete_project, &status));
  EXPECT_EQ(0, status);

  // missing arguments fail the tool
  CliRunner incomplete = make_runner(options, CliRunner::kDeploy);
  incomplete.project_ = "shop";
  run_cli(&incomplete, &status);
  EXPECT_EQ(1, status);
  incomplete.function_ = "checkout";
  incomplete.source_file_ = source.string() + ".missing";
  run_cli(&incomplete, &status);
  EXPECT_EQ(1, status);
  CliRunner no_project = make_runner(options, CliRunner::kFunctions);
  run_cli(&no_project, &status);
  EXPECT_EQ(1, status);
  cleanup_test(options);
}

TEST(CliRunnerTest, Invoke) {
  CloudfnOptions options = get_tiny_options();
  write_function_file(options, "shop", "echo", kEchoSource);
  int status = -1;
  CliRunner invoke = make_runner(options, CliRunner::kInvoke);
  invoke.project_ = "shop";
  invoke.function_ = "echo";
  invoke.payload_ = "{\"cart\":3}";
  EXPECT_EQ("{\"cart\":3}\n", run_cli(&invoke, &status));
  EXPECT_EQ(0, status);

  invoke.function_ = "nope";
  EXPECT_EQ("", run_cli(&invoke, &status));
  EXPECT_EQ(1, status);
  cleanup_test(options);
}

TEST(CliRunnerTest, TaskModes) {
  CloudfnOptions options = get_tiny_options();
  write_function_file(options, "shop", "echo", kEchoSource);
  int status = -1;
  CliRunner submit = make_runner(options, CliRunner::kSubmit);
  submit.project_ = "shop";
  submit.function_ = "echo";
  submit.payload_ = "order";
  submit.wait_ms_ = 20000;
  std::string out = run_cli(&submit, &status);
  EXPECT_EQ(0, status);
  EXPECT_NE(std::string::npos, out.find("<status_>completed</status_>"));
  EXPECT_NE(std::string::npos, out.find("<result_>order</result_>"));
  std::string::size_type begin = out.find("<task_id_>");
  std::string::size_type end = out.find("</task_id_>");
  ASSERT_NE(std::string::npos, begin);
  ASSERT_NE(std::string::npos, end);
  begin += std::string("<task_id_>").size();
  std::string task_id = out.substr(begin, end - begin);

  CliRunner task_status = make_runner(options, CliRunner::kStatus);
  task_status.task_id_ = task_id;
  out = run_cli(&task_status, &status);
  EXPECT_EQ(0, status);
  EXPECT_NE(std::string::npos, out.find(task_id));
  task_status.task_id_ = "no_such_task";
  run_cli(&task_status, &status);
  EXPECT_EQ(1, status);

  CliRunner list = make_runner(options, CliRunner::kList);
  out = run_cli(&list, &status);
  EXPECT_EQ(0, status);
  EXPECT_NE(std::string::npos, out.find("<Tasks count=\"1\">"));
  list.status_filter_ = "failed";
  out = run_cli(&list, &status);
  EXPECT_NE(std::string::npos, out.find("<Tasks count=\"0\">"));
  list.status_filter_ = "sleeping";
  run_cli(&list, &status);
  EXPECT_EQ(1, status);

  CliRunner cancel = make_runner(options, CliRunner::kCancel);
  cancel.task_id_ = task_id;
  EXPECT_EQ("<cancelled>false</cancelled>\n", run_cli(&cancel, &status));
  EXPECT_EQ(0, status);

  CliRunner cleanup = make_runner(options, CliRunner::kCleanup);
  cleanup.days_ = 7;
  EXPECT_EQ("<removed>0</removed>\n", run_cli(&cleanup, &status));
  EXPECT_EQ(0, status);
  cleanup_test(options);
}

}  // namespace util
}  // namespace cloudfn

TEST_MAIN_CAPTURE_SIGNALS(CliRunnerTest, cloudfn.util);
