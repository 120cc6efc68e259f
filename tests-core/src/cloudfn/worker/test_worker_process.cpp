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

#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "cloudfn/cloudfn_options.hpp"
#include "cloudfn/error_code.hpp"
#include "cloudfn/test_common.hpp"
#include "cloudfn/fs/filesystem.hpp"
#include "cloudfn/fs/path.hpp"
#include "cloudfn/registry/project_channel.hpp"
#include "cloudfn/soc/channel_block.hpp"
#include "cloudfn/soc/channel_message.hpp"
#include "cloudfn/thread/bounded_thread_pool_impl.hpp"
#include "cloudfn/worker/environment_provisioner.hpp"
#include "cloudfn/worker/function_info.hpp"
#include "cloudfn/worker/function_source_provider.hpp"
#include "cloudfn/worker/handler.hpp"
#include "cloudfn/worker/native_function_table.hpp"
#include "cloudfn/worker/project_environment.hpp"
#include "cloudfn/worker/worker_process.hpp"

namespace cloudfn {
namespace worker {
DEFINE_TEST_CASE_PACKAGE(WorkerProcessTest, cloudfn.worker);

const char* const kEchoSource = "# description: echoes the payload\ndef main(payload):\n"
  "    return payload\n";

/** Wires a WorkerProcess the same way worker_main() does, but in this process. */
struct WorkerFixture {
  explicit WorkerFixture(const CloudfnOptions& options)
    : options_(options),
      projects_dir_(options.master_.projects_dir_),
      provisioner_(options.worker_, projects_dir_),
      source_provider_(projects_dir_, options.worker_.function_file_suffix_),
      resolver_(options.worker_, &natives_),
      channel_("worker_test"),
      pool_("worker_test", 2) {
    COERCE_ERROR(channel_.allocate(options.registry_.channel_capacity_));
    collaborators_.provisioner_ = &provisioner_;
    collaborators_.source_provider_ = &source_provider_;
    collaborators_.resolver_ = &resolver_;
    collaborators_.natives_ = &natives_;
  }

  WorkerProcess* create(const std::string& project) {
    return new WorkerProcess(
      project,
      options_.worker_,
      projects_dir_,
      channel_.get_block(),
      &pool_,
      collaborators_);
  }

  CloudfnOptions                options_;
  fs::Path                      projects_dir_;
  NativeFunctionTable           natives_;
  CommandProvisioner            provisioner_;
  ScriptSourceProvider          source_provider_;
  DefaultHandlerResolver        resolver_;
  WorkerProcess::Collaborators  collaborators_;
  registry::ProjectChannel      channel_;
  thread::BoundedThreadPool     pool_;
};

TEST(WorkerProcessTest, NotInitialized) {
  CloudfnOptions options = get_tiny_options();
  {
    WorkerFixture fixture(options);
    std::unique_ptr<WorkerProcess> worker(fixture.create("nowhere"));
    std::string result;
    ErrorStack error = worker->execute_function("echo", "{}", &result);
    EXPECT_EQ(kErrorCodeWorkerNotInitialized, error.get_error_code());

    // no project directory and no native function. initialization fails and says why.
    ErrorStack init_error = worker->initialize();
    EXPECT_EQ(kErrorCodeProjectDirMissing, init_error.get_error_code());
    EXPECT_FALSE(worker->is_initialized());
    EXPECT_FALSE(worker->get_init_error_message().empty());
    error = worker->execute_function("echo", "{}", &result);
    EXPECT_EQ(kErrorCodeWorkerNotInitialized, error.get_error_code());
    EXPECT_EQ(worker->get_init_error_message(), error.describe_brief());
    EXPECT_EQ(0U, fixture.pool_.get_submitted_count());
  }
  cleanup_test(options);
}

TEST(WorkerProcessTest, ScriptFunctions) {
  CloudfnOptions options = get_tiny_options();
  write_function_file(options, "proj", "echo", kEchoSource);
  write_function_file(options, "proj", "later", "async def main(payload):\n    return 1\n");
  write_function_file(options, "proj", "broken", "def helper():\n    pass\n");
  write_function_file(options, "proj", "_private", kEchoSource);
  write_function_file(options, "proj", "test_echo", kEchoSource);
  {
    WorkerFixture fixture(options);
    std::unique_ptr<WorkerProcess> worker(fixture.create("proj"));
    COERCE_ERROR(worker->initialize());

    std::vector<FunctionInfo> functions = worker->list_functions();
    ASSERT_EQ(3U, functions.size());
    EXPECT_EQ("broken", functions[0].name_);
    EXPECT_EQ(FunctionInfo::kUnregistered, functions[0].status_);
    EXPECT_EQ("echo", functions[1].name_);
    EXPECT_EQ(FunctionInfo::kRegistered, functions[1].status_);
    EXPECT_EQ("echoes the payload", functions[1].description_);
    EXPECT_FALSE(functions[1].asynchronous_);
    EXPECT_EQ("later", functions[2].name_);
    EXPECT_TRUE(functions[2].asynchronous_);

    // "cat" is the runtime, so the payload comes back as the result
    std::string result;
    COERCE_ERROR(worker->execute_function("echo", "{\"a\":1}", &result));
    EXPECT_EQ("{\"a\":1}", result);
    EXPECT_EQ(1U, fixture.pool_.get_submitted_count());
    FunctionInfo echo;
    EXPECT_TRUE(worker->get_function("echo", &echo));
    EXPECT_EQ(FunctionInfo::kLoaded, echo.status_);

    // asynchronous functions run on the calling thread
    COERCE_ERROR(worker->execute_function("later", "2", &result));
    EXPECT_EQ("2", result);
    EXPECT_EQ(1U, fixture.pool_.get_submitted_count());

    ErrorStack error = worker->execute_function("broken", "{}", &result);
    EXPECT_EQ(kErrorCodeWorkerEntryPointMissing, error.get_error_code());
    error = worker->execute_function("_private", "{}", &result);
    EXPECT_EQ(kErrorCodeWorkerFunctionNotFound, error.get_error_code());
    error = worker->execute_function("nope", "{}", &result);
    EXPECT_EQ(kErrorCodeWorkerFunctionNotFound, error.get_error_code());
    EXPECT_EQ(1U, fixture.pool_.get_submitted_count());
    COERCE_ERROR(worker->uninitialize());
  }
  cleanup_test(options);
}

TEST(WorkerProcessTest, FailingRuntime) {
  CloudfnOptions options = get_tiny_options();
  options.worker_.runtime_command_ = "cat > /dev/null; echo oops 1>&2; exit 4";
  write_function_file(options, "proj", "echo", kEchoSource);
  {
    WorkerFixture fixture(options);
    std::unique_ptr<WorkerProcess> worker(fixture.create("proj"));
    COERCE_ERROR(worker->initialize());
    std::string result;
    ErrorStack error = worker->execute_function("echo", "{}", &result);
    EXPECT_EQ(kErrorCodeSubprocessFailed, error.get_error_code());
    EXPECT_NE(std::string::npos, error.describe_brief().find("oops"));
  }
  cleanup_test(options);
}

TEST(WorkerProcessTest, NativeFunctions) {
  CloudfnOptions options = get_tiny_options();
  {
    WorkerFixture fixture(options);
    fixture.natives_.register_function(
      "natives",
      "greet",
      [](const std::string& payload, const ProjectEnvironment&, std::string* result) {
        *result = "hello " + payload;
        return kRetOk;
      },
      false,
      "says hello");
    fixture.natives_.register_function(
      "natives",
      "throws",
      [](const std::string&, const ProjectEnvironment&, std::string*) -> ErrorStack {
        throw std::runtime_error("boom");
      });
    fixture.natives_.register_function(
      "natives",
      "fails",
      [](const std::string&, const ProjectEnvironment&, std::string*) {
        return ERROR_STACK_MSG(kErrorCodeFunctionExecutionFailed, "bad input");
      },
      true);

    // no project directory is fine when native functions exist
    std::unique_ptr<WorkerProcess> worker(fixture.create("natives"));
    COERCE_ERROR(worker->initialize());
    EXPECT_EQ(3U, worker->list_functions().size());

    std::string result;
    COERCE_ERROR(worker->execute_function("greet", "world", &result));
    EXPECT_EQ("hello world", result);
    FunctionInfo greet;
    EXPECT_TRUE(worker->get_function("greet", &greet));
    EXPECT_EQ("says hello", greet.description_);

    ErrorStack error = worker->execute_function("throws", "", &result);
    EXPECT_EQ(kErrorCodeFunctionExecutionFailed, error.get_error_code());
    EXPECT_EQ("boom", error.describe_brief());
    error = worker->execute_function("fails", "", &result);
    EXPECT_EQ(kErrorCodeFunctionExecutionFailed, error.get_error_code());
    EXPECT_EQ("bad input", error.describe_brief());
  }
  cleanup_test(options);
}

TEST(WorkerProcessTest, NativeShadowsFile) {
  CloudfnOptions options = get_tiny_options();
  write_function_file(options, "proj", "echo", kEchoSource);
  {
    WorkerFixture fixture(options);
    fixture.natives_.register_function(
      "proj",
      "echo",
      [](const std::string&, const ProjectEnvironment&, std::string* result) {
        *result = "native";
        return kRetOk;
      });
    std::unique_ptr<WorkerProcess> worker(fixture.create("proj"));
    COERCE_ERROR(worker->initialize());
    ASSERT_EQ(1U, worker->list_functions().size());
    std::string result;
    COERCE_ERROR(worker->execute_function("echo", "{}", &result));
    EXPECT_EQ("native", result);
  }
  cleanup_test(options);
}

TEST(WorkerProcessTest, ProjectEnvironment) {
  CloudfnOptions options = get_tiny_options();
  options.worker_.runtime_command_ = "printf '%s:%s' \"$GREETING\" \"$CLOUDFN_FUNCTION_NAME\"";
  write_function_file(options, "proj", "env", kEchoSource);
  fs::Path system_env(options.master_.projects_dir_);
  system_env = system_env.parent_path();
  system_env /= std::string("system.env");
  EXPECT_TRUE(fs::durable_write_file(system_env, "GREETING=system\nLEVEL=debug\n"));
  options.worker_.system_env_file_ = system_env.string();
  fs::Path project_env(options.master_.projects_dir_);
  project_env /= std::string("proj");
  project_env /= std::string(".env");
  EXPECT_TRUE(fs::durable_write_file(project_env, "export GREETING=\"project\"\n"));
  {
    WorkerFixture fixture(options);
    std::unique_ptr<WorkerProcess> worker(fixture.create("proj"));
    COERCE_ERROR(worker->initialize());
    std::string value;
    EXPECT_TRUE(worker->get_environment().get("GREETING", &value));
    EXPECT_EQ("project", value);
    EXPECT_TRUE(worker->get_environment().get("LEVEL", &value));
    EXPECT_EQ("debug", value);

    std::string result;
    COERCE_ERROR(worker->execute_function("env", "{}", &result));
    EXPECT_EQ("project:env", result);
  }
  cleanup_test(options);
}

TEST(WorkerProcessTest, ProvisionFailure) {
  CloudfnOptions options = get_tiny_options();
  options.worker_.ensure_environment_command_ = "exit 3";
  write_function_file(options, "proj", "echo", kEchoSource);
  {
    WorkerFixture fixture(options);
    std::unique_ptr<WorkerProcess> worker(fixture.create("proj"));
    ErrorStack error = worker->initialize();
    EXPECT_EQ(kErrorCodeEnvProvisionFailed, error.get_error_code());
    std::string result;
    error = worker->execute_function("echo", "{}", &result);
    EXPECT_EQ(kErrorCodeWorkerNotInitialized, error.get_error_code());
  }
  cleanup_test(options);
}

TEST(WorkerProcessTest, RunLoop) {
  CloudfnOptions options = get_tiny_options();
  write_function_file(options, "proj", "echo", kEchoSource);
  {
    WorkerFixture fixture(options);
    std::unique_ptr<WorkerProcess> worker(fixture.create("proj"));
    COERCE_ERROR(worker->initialize());
    ErrorStack run_result;
    std::thread loop([&]() { run_result = worker->run(); });
    EXPECT_TRUE(fixture.channel_.wait_ready(5000));

    soc::ChannelBlock* block = fixture.channel_.get_block();
    EXPECT_EQ(kErrorCodeOk, block->send_request(soc::ChannelMessage::make_execute("echo", "1")));
    EXPECT_EQ(kErrorCodeOk, block->send_request(soc::ChannelMessage::make_execute("nope", "2")));
    EXPECT_EQ(kErrorCodeOk, block->send_request(soc::ChannelMessage::make_execute("echo", "3")));

    soc::ChannelMessage response;
    EXPECT_EQ(kErrorCodeOk, block->receive_response(&response, 5000000));
    EXPECT_EQ(soc::ChannelMessage::kSuccess, response.type_);
    EXPECT_EQ("1", response.body_);
    EXPECT_EQ(kErrorCodeOk, block->receive_response(&response, 5000000));
    EXPECT_EQ(soc::ChannelMessage::kError, response.type_);
    EXPECT_EQ("kErrorCodeWorkerFunctionNotFound", response.name_);
    EXPECT_EQ(kErrorCodeOk, block->receive_response(&response, 5000000));
    EXPECT_EQ(soc::ChannelMessage::kSuccess, response.type_);
    EXPECT_EQ("3", response.body_);

    EXPECT_EQ(kErrorCodeOk, block->send_request(soc::ChannelMessage::make_stop()));
    loop.join();
    EXPECT_FALSE(run_result.is_error());
    EXPECT_EQ(2U, worker->get_succeeded_count());
    EXPECT_EQ(1U, worker->get_rejected_count());
    EXPECT_EQ(0U, worker->get_failed_count());
  }
  cleanup_test(options);
}

TEST(WorkerProcessTest, StopDuringExecution) {
  CloudfnOptions options = get_tiny_options();
  options.worker_.runtime_command_ = "sleep 2; cat";
  write_function_file(options, "proj", "slow", kEchoSource);
  {
    WorkerFixture fixture(options);
    std::unique_ptr<WorkerProcess> worker(fixture.create("proj"));
    COERCE_ERROR(worker->initialize());
    ErrorStack run_result;
    std::thread loop([&]() { run_result = worker->run(); });
    EXPECT_TRUE(fixture.channel_.wait_ready(5000));

    soc::ChannelBlock* block = fixture.channel_.get_block();
    EXPECT_EQ(kErrorCodeOk, block->send_request(soc::ChannelMessage::make_execute("slow", "x")));
    EXPECT_TRUE(wait_until([&]() { return fixture.pool_.get_submitted_count() > 0; }, 5000));
    EXPECT_EQ(kErrorCodeOk, block->send_request(soc::ChannelMessage::make_stop()));

    soc::ChannelMessage response;
    EXPECT_EQ(kErrorCodeOk, block->receive_response(&response, 5000000));
    EXPECT_EQ(soc::ChannelMessage::kError, response.type_);
    EXPECT_EQ("kErrorCodeFunctionExecutionFailed", response.name_);
    loop.join();
    EXPECT_FALSE(run_result.is_error());
    EXPECT_EQ(1U, worker->get_failed_count());
  }
  cleanup_test(options);
}

}  // namespace worker
}  // namespace cloudfn

TEST_MAIN_CAPTURE_SIGNALS(WorkerProcessTest, cloudfn.worker);
