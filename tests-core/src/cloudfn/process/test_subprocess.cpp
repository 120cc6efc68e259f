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

#include <map>
#include <string>

#include "cloudfn/error_code.hpp"
#include "cloudfn/test_common.hpp"
#include "cloudfn/process/subprocess.hpp"

namespace cloudfn {
namespace process {
DEFINE_TEST_CASE_PACKAGE(SubprocessTest, cloudfn.process);

TEST(SubprocessTest, StdinToStdout) {
  SubprocessRequest request;
  request.argv_.push_back("cat");
  request.stdin_data_ = "{\"x\":1}";
  SubprocessResult result;
  COERCE_ERROR(run_subprocess(request, &result));
  EXPECT_TRUE(result.is_success());
  EXPECT_EQ("{\"x\":1}", result.stdout_);
  EXPECT_EQ("", result.stderr_);
}

TEST(SubprocessTest, LargeStdin) {
  // larger than a pipe buffer in both directions
  std::string big(1 << 20, 'z');
  SubprocessRequest request;
  request.argv_.push_back("cat");
  request.stdin_data_ = big;
  SubprocessResult result;
  COERCE_ERROR(run_subprocess(request, &result));
  EXPECT_TRUE(result.is_success());
  EXPECT_EQ(big.size(), result.stdout_.size());
}

TEST(SubprocessTest, ExitCodeAndStderr) {
  std::map<std::string, std::string> env;
  SubprocessResult result;
  COERCE_ERROR(run_shell_command("echo broken >&2; exit 3", env, 0, &result));
  EXPECT_FALSE(result.is_success());
  EXPECT_EQ(3, result.exit_code_);
  EXPECT_EQ("broken", result.describe_failure());

  COERCE_ERROR(run_shell_command("exit 4", env, 0, &result));
  EXPECT_EQ(4, result.exit_code_);
  EXPECT_NE(std::string::npos, result.describe_failure().find("exited with status 4"));
}

TEST(SubprocessTest, ExtraEnvironment) {
  std::map<std::string, std::string> env;
  env["CLOUDFN_TEST_VALUE"] = "hello world";
  SubprocessResult result;
  COERCE_ERROR(run_shell_command("printf '%s' \"$CLOUDFN_TEST_VALUE\"", env, 0, &result));
  EXPECT_TRUE(result.is_success());
  EXPECT_EQ("hello world", result.stdout_);
}

TEST(SubprocessTest, Timeout) {
  std::map<std::string, std::string> env;
  SubprocessResult result;
  ErrorStack error = run_shell_command("sleep 10", env, 100, &result);
  EXPECT_TRUE(error.is_error());
  EXPECT_EQ(kErrorCodeTimeout, error.get_error_code());
  EXPECT_TRUE(result.signaled_);
}

TEST(SubprocessTest, SpawnFailure) {
  SubprocessRequest request;
  request.argv_.push_back("/nonexistent/cloudfn_binary");
  request.search_path_ = false;
  SubprocessResult result;
  ErrorStack error = run_subprocess(request, &result);
  EXPECT_TRUE(error.is_error());
  EXPECT_EQ(kErrorCodeSocSpawnFailed, error.get_error_code());

  SubprocessRequest empty;
  EXPECT_EQ(kErrorCodeInvalidParameter, run_subprocess(empty, &result).get_error_code());
}

}  // namespace process
}  // namespace cloudfn

TEST_MAIN_CAPTURE_SIGNALS(SubprocessTest, cloudfn.process);
