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
#include <fcntl.h>
#include <gtest/gtest.h>
#include <glog/logging.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "cloudfn/cloudfn_options.hpp"
#include "cloudfn/error_code.hpp"
#include "cloudfn/test_common.hpp"
#include "cloudfn/assorted/assorted_func.hpp"
#include "cloudfn/debugging/debugging_supports.hpp"
#include "cloudfn/debugging/raw_log.hpp"
#include "cloudfn/fs/filesystem.hpp"
#include "cloudfn/fs/path.hpp"
#include "cloudfn/registry/component.hpp"
#include "cloudfn/registry/coordination_registry.hpp"
#include "cloudfn/registry/project_channel.hpp"
#include "cloudfn/soc/channel_block.hpp"
#include "cloudfn/soc/channel_message.hpp"
#include "cloudfn/thread/bounded_thread_pool_impl.hpp"

namespace cloudfn {
namespace registry {
DEFINE_TEST_CASE_PACKAGE(CoordinationRegistryTest, cloudfn.registry);

class DummyComponent : public Component {
 public:
  const char* get_component_name() const CXX11_OVERRIDE { return kComponentMaster; }
};

/** Replies to every execute request with its payload until told to stop. */
int echo_worker(const WorkerContext& context) {
  context.channel_->get_ready()->signal();
  while (true) {
    soc::ChannelMessage request;
    ErrorCode code = context.channel_->receive_request(&request, 0);
    if (code != kErrorCodeOk || request.type_ == soc::ChannelMessage::kStop) {
      return 0;
    }
    code = context.channel_->send_response(soc::ChannelMessage::make_success(request.body_));
    if (code != kErrorCodeOk) {
      return 1;
    }
  }
}

/** Exits without ever becoming ready. */
int dying_worker(const WorkerContext& /*context*/) {
  return 3;
}

/** Becomes ready, then ignores the stop command. */
int stubborn_worker(const WorkerContext& context) {
  context.channel_->get_ready()->signal();
  while (true) {
    ::sleep(1);
  }
  return 0;
}

/** Logs like a real worker, then serves like echo_worker. */
int logging_worker(const WorkerContext& context) {
  LOG(INFO) << "Dropped in a worker: " << context.project_name_;
  RAW_LOG_STREAM(INFO) << "Worker of " << context.project_name_ << " started";
  return echo_worker(context);
}

/** Appends its pid to the given file, then serves like echo_worker. */
WorkerEntry make_counting_worker(const std::string& counter_path) {
  return [counter_path](const WorkerContext& context) {
    int fd = ::open(counter_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (fd == -1) {
      return 4;
    }
    std::string line = std::to_string(::getpid()) + "\n";
    ssize_t written = ::write(fd, line.data(), line.size());
    ::close(fd);
    if (written != static_cast<ssize_t>(line.size())) {
      return 5;
    }
    return echo_worker(context);
  };
}

TEST(CoordinationRegistryTest, Components) {
  CloudfnOptions options = get_tiny_options();
  CoordinationRegistry registry(options.registry_);
  EXPECT_EQ(&registry, registry.get_component(kComponentRegistry));
  EXPECT_EQ(nullptr, registry.get_component(kComponentMaster));

  DummyComponent dummy;
  ErrorStack ret = registry.register_component("no_such_slot", &dummy);
  EXPECT_EQ(kErrorCodeRegistryUnknownComponent, ret.get_error_code());

  COERCE_ERROR(registry.register_component(kComponentMaster, &dummy));
  EXPECT_EQ(&dummy, registry.get_component_as<DummyComponent>(kComponentMaster));
  EXPECT_EQ(nullptr, registry.get_component_as<CoordinationRegistry>(kComponentMaster));
  registry.unregister_component(kComponentMaster, &dummy);
  EXPECT_EQ(nullptr, registry.get_component(kComponentMaster));
  cleanup_test(options);
}

TEST(CoordinationRegistryTest, LaunchAndTerminate) {
  CloudfnOptions options = get_tiny_options();
  CoordinationRegistry registry(options.registry_);
  std::vector<std::string> args;
  EXPECT_FALSE(registry.has_worker("proj"));
  EXPECT_TRUE(registry.start_project_process("proj", echo_worker, args));
  pid_t pid = registry.get_worker_pid("proj");
  EXPECT_GT(pid, 0);
  EXPECT_TRUE(registry.wait_for_ready("proj", 10000));
  EXPECT_TRUE(registry.check_process_status("proj"));

  // a second launch request reuses the live worker
  EXPECT_TRUE(registry.start_project_process("proj", echo_worker, args));
  EXPECT_EQ(pid, registry.get_worker_pid("proj"));

  std::shared_ptr<ProjectChannel> channel = registry.get_project_channel("proj");
  ASSERT_TRUE(channel.get() != nullptr);
  soc::ChannelBlock* block = channel->get_block();
  EXPECT_EQ(kErrorCodeOk, block->send_request(soc::ChannelMessage::make_execute("f", "hi")));
  soc::ChannelMessage response;
  EXPECT_EQ(kErrorCodeOk, block->receive_response(&response, 5000000));
  EXPECT_EQ(soc::ChannelMessage::kSuccess, response.type_);
  EXPECT_EQ("hi", response.body_);

  std::vector<std::string> live = registry.list_live_projects();
  ASSERT_EQ(1U, live.size());
  EXPECT_EQ("proj", live[0]);

  COERCE_ERROR(registry.terminate_process("proj"));
  EXPECT_FALSE(registry.check_process_status("proj"));
  EXPECT_FALSE(registry.has_worker("proj"));
  EXPECT_EQ(0, registry.get_worker_pid("proj"));
  // terminating again, or terminating an unknown project, is harmless
  COERCE_ERROR(registry.terminate_process("proj"));
  COERCE_ERROR(registry.terminate_process("never_started"));
  cleanup_test(options);
}

TEST(CoordinationRegistryTest, DeadWorker) {
  CloudfnOptions options = get_tiny_options();
  CoordinationRegistry registry(options.registry_);
  std::vector<std::string> args;
  EXPECT_TRUE(registry.start_project_process("dies", dying_worker, args));
  EXPECT_FALSE(registry.wait_for_ready("dies", 5000));
  EXPECT_TRUE(wait_until([&]() { return !registry.is_process_alive("dies"); }, 5000));
  EXPECT_FALSE(registry.check_process_status("dies"));
  EXPECT_TRUE(registry.list_live_projects().empty());

  // a relaunch replaces the dead handle
  EXPECT_TRUE(registry.start_project_process("dies", echo_worker, args));
  EXPECT_TRUE(registry.wait_for_ready("dies", 10000));
  EXPECT_TRUE(registry.check_process_status("dies"));
  COERCE_ERROR(registry.cleanup_project("dies"));
  EXPECT_FALSE(registry.has_worker("dies"));
  cleanup_test(options);
}

TEST(CoordinationRegistryTest, KillStubbornWorker) {
  CloudfnOptions options = get_tiny_options();
  options.registry_.terminate_wait_ms_ = 200;
  CoordinationRegistry registry(options.registry_);
  std::vector<std::string> args;
  EXPECT_TRUE(registry.start_project_process("stubborn", stubborn_worker, args));
  EXPECT_TRUE(registry.wait_for_ready("stubborn", 10000));
  COERCE_ERROR(registry.terminate_process("stubborn"));
  EXPECT_FALSE(registry.is_process_alive("stubborn"));
  cleanup_test(options);
}

TEST(CoordinationRegistryTest, ConcurrentLaunchForksOnce) {
  CloudfnOptions options = get_tiny_options();
  CoordinationRegistry registry(options.registry_);
  const std::string counter_path = get_random_tmp_file_path("launch_counter");
  WorkerEntry entry = make_counting_worker(counter_path);
  std::vector<std::string> args;

  for (int round = 0; round < 5; ++round) {
    std::atomic<bool> go(false);
    bool launched[2] = {false, false};
    std::vector<std::thread> launchers;
    for (int i = 0; i < 2; ++i) {
      launchers.emplace_back([&registry, &entry, &args, &go, &launched, i]() {
        while (!go.load()) {
          std::this_thread::yield();
        }
        launched[i] = registry.start_project_process("p", entry, args);
      });
    }
    go.store(true);
    for (std::thread& launcher : launchers) {
      launcher.join();
    }
    EXPECT_TRUE(launched[0]);
    EXPECT_TRUE(launched[1]);
    pid_t pid = registry.get_worker_pid("p");
    EXPECT_GT(pid, 0);
    EXPECT_TRUE(registry.wait_for_ready("p", 10000));
    EXPECT_EQ(pid, registry.get_worker_pid("p"));
    std::vector<std::string> projects = registry.list_worker_projects();
    ASSERT_EQ(1U, projects.size());
    EXPECT_EQ("p", projects[0]);

    std::string content;
    ASSERT_TRUE(fs::read_file(fs::Path(counter_path), &content));
    std::vector<std::string> lines = assorted::split(assorted::trim(content), '\n');
    ASSERT_EQ(static_cast<size_t>(round + 1), lines.size());
    EXPECT_EQ(std::to_string(pid), lines.back());
    COERCE_ERROR(registry.terminate_process("p"));
  }
  cleanup_test(options);
}

TEST(CoordinationRegistryTest, LaunchWhileOtherThreadsLog) {
  CloudfnOptions options = get_tiny_options();
  options.debugging_.debug_log_stderr_threshold_ = debugging::DebuggingOptions::kDebugLogError;
  debugging::DebuggingSupports debugging(options.debugging_);
  COERCE_ERROR(debugging.initialize());
  {
    CoordinationRegistry registry(options.registry_);
    std::atomic<bool> stop_logging(false);
    std::vector<std::thread> loggers;
    for (int i = 0; i < 2; ++i) {
      loggers.emplace_back([&stop_logging, i]() {
        uint64_t count = 0;
        while (!stop_logging.load()) {
          LOG(INFO) << "Logger " << i << " keeps glog busy. count=" << ++count;
          std::this_thread::sleep_for(std::chrono::microseconds(20));
        }
      });
    }

    std::vector<std::string> args;
    for (int round = 0; round < 20; ++round) {
      ASSERT_TRUE(registry.start_project_process("logs", logging_worker, args));
      // a worker stuck on a lock inherited from a logger never becomes ready
      EXPECT_TRUE(registry.wait_for_ready("logs", 10000)) << "round " << round;
      COERCE_ERROR(registry.terminate_process("logs"));
    }
    stop_logging.store(true);
    for (std::thread& logger : loggers) {
      logger.join();
    }
  }
  COERCE_ERROR(debugging.uninitialize());
  cleanup_test(options);
}

TEST(CoordinationRegistryTest, TaskChannels) {
  CloudfnOptions options = get_tiny_options();
  CoordinationRegistry registry(options.registry_);
  std::shared_ptr<ProjectChannel> first;
  std::shared_ptr<ProjectChannel> second;
  COERCE_ERROR(registry.get_or_create_task_channel("task-1", &first));
  COERCE_ERROR(registry.get_or_create_task_channel("task-1", &second));
  EXPECT_EQ(first.get(), second.get());
  EXPECT_EQ(first.get(), registry.get_task_channel("task-1").get());
  EXPECT_TRUE(first->get_block() != nullptr);

  registry.cleanup_task_resources("task-1");
  EXPECT_TRUE(registry.get_task_channel("task-1").get() == nullptr);
  // unknown ids are ignored
  registry.cleanup_task_resources("task-1");
  registry.cleanup_task_resources("task-2");
  cleanup_test(options);
}

TEST(CoordinationRegistryTest, Executors) {
  CloudfnOptions options = get_tiny_options();
  CoordinationRegistry registry(options.registry_);
  thread::BoundedThreadPool* pool = registry.get_executor("runner", 2);
  ASSERT_TRUE(pool != nullptr);
  EXPECT_EQ(pool, registry.get_executor("runner", 4));
  EXPECT_NE(pool, registry.get_executor("another", 1));
  COERCE_ERROR(registry.cleanup_resources());
  cleanup_test(options);
}

TEST(CoordinationRegistryTest, CleanupResources) {
  CloudfnOptions options = get_tiny_options();
  CoordinationRegistry registry(options.registry_);
  DummyComponent dummy;
  COERCE_ERROR(registry.register_component(kComponentMaster, &dummy));
  std::vector<std::string> args;
  EXPECT_TRUE(registry.start_project_process("a", echo_worker, args));
  EXPECT_TRUE(registry.start_project_process("b", echo_worker, args));
  EXPECT_TRUE(registry.wait_for_ready("a", 10000));
  EXPECT_TRUE(registry.wait_for_ready("b", 10000));
  std::vector<std::string> projects = registry.list_worker_projects();
  std::sort(projects.begin(), projects.end());
  ASSERT_EQ(2U, projects.size());
  EXPECT_EQ("a", projects[0]);
  EXPECT_EQ("b", projects[1]);

  COERCE_ERROR(registry.cleanup_resources());
  EXPECT_TRUE(registry.list_worker_projects().empty());
  EXPECT_TRUE(registry.get_project_channel("a").get() == nullptr);
  EXPECT_EQ(nullptr, registry.get_component(kComponentMaster));
  EXPECT_FALSE(registry.is_forked_worker());
  cleanup_test(options);
}

}  // namespace registry
}  // namespace cloudfn

TEST_MAIN_CAPTURE_SIGNALS(CoordinationRegistryTest, cloudfn.registry);
