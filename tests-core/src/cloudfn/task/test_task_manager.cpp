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

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstring>
#include <ctime>
#include <mutex>
#include <string>
#include <vector>

#include "cloudfn/cloudfn_options.hpp"
#include "cloudfn/error_code.hpp"
#include "cloudfn/test_common.hpp"
#include "cloudfn/assorted/assorted_func.hpp"
#include "cloudfn/fs/path.hpp"
#include "cloudfn/master/function_invoker.hpp"
#include "cloudfn/registry/coordination_registry.hpp"
#include "cloudfn/task/scheduled_job.hpp"
#include "cloudfn/task/scheduler.hpp"
#include "cloudfn/task/task.hpp"
#include "cloudfn/task/task_manager.hpp"
#include "cloudfn/task/task_store.hpp"

namespace cloudfn {
namespace task {
DEFINE_TEST_CASE_PACKAGE(TaskManagerTest, cloudfn.task);

const uint64_t kMicrosecPerDay = 24ULL * 3600ULL * 1000000ULL;

/**
 * Stands in for the master. "fail" fails, "block" waits for release(), anything else
 * returns the payload with a '!' appended.
 */
class FakeInvoker : public master::FunctionInvoker {
 public:
  FakeInvoker() : released_(false), started_(0), finished_(0) {}

  ErrorStack execute_function(
    const std::string& project,
    const std::string& function,
    const std::string& payload,
    std::string* result) CXX11_OVERRIDE {
    ++started_;
    {
      std::lock_guard<std::mutex> guard(mutex_);
      invoked_.push_back(project + "/" + function);
    }
    ErrorStack ret;
    if (function == "fail") {
      ret = ERROR_STACK_MSG(kErrorCodeFunctionExecutionFailed, "boom");
    } else {
      if (function == "block") {
        std::unique_lock<std::mutex> lock(mutex_);
        released_cond_.wait(lock, [this]() { return released_; });
      }
      *result = project + "/" + payload + "!";
    }
    ++finished_;
    return ret;
  }

  bool was_invoked(const std::string& project, const std::string& function) {
    std::lock_guard<std::mutex> guard(mutex_);
    const std::string key = project + "/" + function;
    return std::find(invoked_.begin(), invoked_.end(), key) != invoked_.end();
  }

  void release() {
    std::lock_guard<std::mutex> guard(mutex_);
    released_ = true;
    released_cond_.notify_all();
  }

  std::mutex              mutex_;
  std::condition_variable released_cond_;
  bool                    released_;
  std::atomic<int>        started_;
  std::atomic<int>        finished_;
  std::vector<std::string> invoked_;
};

Task make_record(
  const std::string& id,
  TaskStatus status,
  uint64_t created_microsec) {
  Task task;
  task.task_id_ = id;
  task.project_name_ = "proj";
  task.function_name_ = "func";
  task.payload_ = "{}";
  task.created_at_ = assorted::format_iso8601(created_microsec);
  task.transition(status);
  return task;
}

TEST(TaskManagerTest, Completes) {
  CloudfnOptions options = get_tiny_options();
  {
    FakeInvoker invoker;
    registry::CoordinationRegistry registry(options.registry_);
    TaskManager manager(&registry, &invoker, options.task_);
    COERCE_ERROR(manager.initialize());
    EXPECT_EQ(&manager, registry.get_component_as<TaskManager>(registry::kComponentTaskManager));

    Task created;
    COERCE_ERROR(manager.create_task("proj", "echo", "hi", &created));
    EXPECT_EQ(0U, created.task_id_.find("proj_echo_"));
    EXPECT_FALSE(created.created_at_.empty());

    Task done;
    EXPECT_TRUE(manager.wait_for_task(created.task_id_, 5000, &done));
    EXPECT_EQ(kTaskCompleted, done.status_);
    EXPECT_EQ("proj/hi!", done.result_);
    EXPECT_TRUE(done.error_.empty());
    EXPECT_TRUE(wait_until(
      [&]() { return registry.get_task_channel(created.task_id_).get() == nullptr; }, 5000));

    // the record on disk matches
    TaskStore store(fs::Path(options.task_.task_dir_));
    Task on_disk;
    bool found = false;
    COERCE_ERROR(store.load(created.task_id_, &on_disk, &found));
    EXPECT_TRUE(found);
    EXPECT_EQ(kTaskCompleted, on_disk.status_);
    EXPECT_EQ("proj/hi!", on_disk.result_);

    COERCE_ERROR(manager.uninitialize());
    EXPECT_EQ(nullptr, registry.get_component(registry::kComponentTaskManager));
  }
  cleanup_test(options);
}

TEST(TaskManagerTest, Fails) {
  CloudfnOptions options = get_tiny_options();
  {
    FakeInvoker invoker;
    registry::CoordinationRegistry registry(options.registry_);
    TaskManager manager(&registry, &invoker, options.task_);
    COERCE_ERROR(manager.initialize());
    Task created;
    COERCE_ERROR(manager.create_task("proj", "fail", "{}", &created));
    Task done;
    EXPECT_TRUE(manager.wait_for_task(created.task_id_, 5000, &done));
    EXPECT_EQ(kTaskFailed, done.status_);
    EXPECT_EQ("boom", done.error_);
    EXPECT_TRUE(done.result_.empty());
    COERCE_ERROR(manager.uninitialize());
  }
  cleanup_test(options);
}

TEST(TaskManagerTest, InvalidNames) {
  CloudfnOptions options = get_tiny_options();
  {
    FakeInvoker invoker;
    registry::CoordinationRegistry registry(options.registry_);
    TaskManager manager(&registry, &invoker, options.task_);
    COERCE_ERROR(manager.initialize());
    Task created;
    EXPECT_EQ(kErrorCodeInvalidParameter,
      manager.create_task("", "echo", "{}", &created).get_error_code());
    EXPECT_EQ(kErrorCodeInvalidParameter,
      manager.create_task("proj", "", "{}", &created).get_error_code());
    EXPECT_EQ(kErrorCodeInvalidParameter,
      manager.create_task("../proj", "echo", "{}", &created).get_error_code());
    EXPECT_EQ(0, invoker.started_.load());

    bool found = true;
    COERCE_ERROR(manager.get_task_status("no_such_task", &created, &found));
    EXPECT_FALSE(found);
    Task waited;
    EXPECT_FALSE(manager.wait_for_task("no_such_task", 10, &waited));
    COERCE_ERROR(manager.uninitialize());
  }
  cleanup_test(options);
}

TEST(TaskManagerTest, Deduplicate) {
  CloudfnOptions options = get_tiny_options();
  {
    FakeInvoker invoker;
    registry::CoordinationRegistry registry(options.registry_);
    TaskManager manager(&registry, &invoker, options.task_);
    COERCE_ERROR(manager.initialize());

    Task first;
    COERCE_ERROR(manager.create_task("proj", "block", "1", &first));
    Task second;
    COERCE_ERROR(manager.create_task("proj", "block", "2", &second));
    EXPECT_EQ(first.task_id_, second.task_id_);
    EXPECT_EQ("1", second.payload_);

    // other functions and projects are not affected
    Task other_function;
    COERCE_ERROR(manager.create_task("proj", "echo", "x", &other_function));
    EXPECT_NE(first.task_id_, other_function.task_id_);
    Task other_project;
    COERCE_ERROR(manager.create_task("other", "block", "x", &other_project));
    EXPECT_NE(first.task_id_, other_project.task_id_);

    invoker.release();
    Task done;
    EXPECT_TRUE(manager.wait_for_task(first.task_id_, 5000, &done));
    EXPECT_EQ("proj/1!", done.result_);
    EXPECT_TRUE(manager.wait_for_task(other_project.task_id_, 5000, &done));

    // finished tasks no longer absorb new requests
    Task third;
    COERCE_ERROR(manager.create_task("proj", "block", "3", &third));
    EXPECT_NE(first.task_id_, third.task_id_);
    EXPECT_TRUE(manager.wait_for_task(third.task_id_, 5000, &done));
    EXPECT_EQ("proj/3!", done.result_);
    COERCE_ERROR(manager.uninitialize());
  }
  cleanup_test(options);
}

TEST(TaskManagerTest, Cancel) {
  CloudfnOptions options = get_tiny_options();
  {
    FakeInvoker invoker;
    registry::CoordinationRegistry registry(options.registry_);
    TaskManager manager(&registry, &invoker, options.task_);
    COERCE_ERROR(manager.initialize());

    Task created;
    COERCE_ERROR(manager.create_task("proj", "block", "1", &created));
    EXPECT_TRUE(wait_until([&]() { return invoker.started_.load() == 1; }, 5000));
    Task status;
    bool found = false;
    COERCE_ERROR(manager.get_task_status(created.task_id_, &status, &found));
    EXPECT_TRUE(found);
    EXPECT_EQ(kTaskRunning, status.status_);

    bool cancelled = false;
    COERCE_ERROR(manager.cancel_task(created.task_id_, &cancelled));
    EXPECT_TRUE(cancelled);
    COERCE_ERROR(manager.cancel_task(created.task_id_, &cancelled));
    EXPECT_FALSE(cancelled);
    COERCE_ERROR(manager.cancel_task("no_such_task", &cancelled));
    EXPECT_FALSE(cancelled);

    // the execution goes on, but its outcome is dropped
    invoker.release();
    EXPECT_TRUE(wait_until([&]() { return invoker.finished_.load() == 1; }, 5000));
    EXPECT_TRUE(wait_until(
      [&]() { return registry.get_task_channel(created.task_id_).get() == nullptr; }, 5000));
    COERCE_ERROR(manager.get_task_status(created.task_id_, &status, &found));
    EXPECT_EQ(kTaskCancelled, status.status_);
    EXPECT_TRUE(status.result_.empty());

    // a cancelled task does not block a new one
    Task again;
    COERCE_ERROR(manager.create_task("proj", "block", "2", &again));
    EXPECT_NE(created.task_id_, again.task_id_);
    Task done;
    EXPECT_TRUE(manager.wait_for_task(again.task_id_, 5000, &done));
    EXPECT_EQ(kTaskCompleted, done.status_);

    // terminal tasks stay as they are
    COERCE_ERROR(manager.cancel_task(again.task_id_, &cancelled));
    EXPECT_FALSE(cancelled);
    COERCE_ERROR(manager.uninitialize());
  }
  cleanup_test(options);
}

TEST(TaskManagerTest, RecoverInterrupted) {
  CloudfnOptions options = get_tiny_options();
  const uint64_t now = assorted::get_now_microsec();
  {
    TaskStore store(fs::Path(options.task_.task_dir_));
    COERCE_ERROR(store.prepare());
    COERCE_ERROR(store.save(make_record("was_running", kTaskRunning, now)));
    COERCE_ERROR(store.save(make_record("was_created", kTaskCreated, now)));
    Task completed = make_record("was_completed", kTaskCompleted, now);
    completed.result_ = "42";
    COERCE_ERROR(store.save(completed));
  }
  {
    FakeInvoker invoker;
    registry::CoordinationRegistry registry(options.registry_);
    TaskManager manager(&registry, &invoker, options.task_);
    COERCE_ERROR(manager.initialize());

    Task task;
    bool found = false;
    COERCE_ERROR(manager.get_task_status("was_running", &task, &found));
    EXPECT_TRUE(found);
    EXPECT_EQ(kTaskFailed, task.status_);
    EXPECT_EQ("Task was interrupted by a restart while running", task.error_);
    COERCE_ERROR(manager.get_task_status("was_created", &task, &found));
    EXPECT_EQ(kTaskFailed, task.status_);
    COERCE_ERROR(manager.get_task_status("was_completed", &task, &found));
    EXPECT_EQ(kTaskCompleted, task.status_);
    EXPECT_EQ("42", task.result_);
    EXPECT_EQ(0, invoker.started_.load());

    // recovered tasks can be waited on without running anything
    EXPECT_TRUE(manager.wait_for_task("was_running", 10, &task));
    EXPECT_EQ(kTaskFailed, task.status_);
    COERCE_ERROR(manager.uninitialize());
  }
  cleanup_test(options);
}

TEST(TaskManagerTest, SurvivesRestart) {
  CloudfnOptions options = get_tiny_options();
  std::string task_id;
  {
    FakeInvoker invoker;
    registry::CoordinationRegistry registry(options.registry_);
    TaskManager manager(&registry, &invoker, options.task_);
    COERCE_ERROR(manager.initialize());
    Task created;
    COERCE_ERROR(manager.create_task("proj", "echo", "persisted", &created));
    Task done;
    EXPECT_TRUE(manager.wait_for_task(created.task_id_, 5000, &done));
    task_id = created.task_id_;
    COERCE_ERROR(manager.uninitialize());
  }
  {
    FakeInvoker invoker;
    registry::CoordinationRegistry registry(options.registry_);
    TaskManager manager(&registry, &invoker, options.task_);
    COERCE_ERROR(manager.initialize());
    Task task;
    bool found = false;
    COERCE_ERROR(manager.get_task_status(task_id, &task, &found));
    EXPECT_TRUE(found);
    EXPECT_EQ(kTaskCompleted, task.status_);
    EXPECT_EQ("proj/persisted!", task.result_);
    std::vector<Task> tasks;
    COERCE_ERROR(manager.list_tasks(TaskFilter(), &tasks));
    ASSERT_EQ(1U, tasks.size());
    EXPECT_EQ(task_id, tasks[0].task_id_);
    COERCE_ERROR(manager.uninitialize());
  }
  cleanup_test(options);
}

TEST(TaskManagerTest, CancelQueuedTask) {
  CloudfnOptions options = get_tiny_options();
  options.task_.execution_threads_ = 2;
  {
    FakeInvoker invoker;
    registry::CoordinationRegistry registry(options.registry_);
    TaskManager manager(&registry, &invoker, options.task_);
    COERCE_ERROR(manager.initialize());

    // occupy every execution thread
    Task first;
    Task second;
    COERCE_ERROR(manager.create_task("p1", "block", "1", &first));
    COERCE_ERROR(manager.create_task("p2", "block", "2", &second));
    EXPECT_TRUE(wait_until([&]() { return invoker.started_.load() == 2; }, 5000));

    Task queued;
    COERCE_ERROR(manager.create_task("proj", "queued", "3", &queued));
    Task status;
    bool found = false;
    COERCE_ERROR(manager.get_task_status(queued.task_id_, &status, &found));
    EXPECT_TRUE(found);
    EXPECT_EQ(kTaskCreated, status.status_);

    bool cancelled = false;
    COERCE_ERROR(manager.cancel_task(queued.task_id_, &cancelled));
    EXPECT_TRUE(cancelled);
    COERCE_ERROR(manager.get_task_status(queued.task_id_, &status, &found));
    EXPECT_EQ(kTaskCancelled, status.status_);

    invoker.release();
    Task done;
    EXPECT_TRUE(manager.wait_for_task(first.task_id_, 5000, &done));
    EXPECT_EQ(kTaskCompleted, done.status_);
    EXPECT_TRUE(manager.wait_for_task(second.task_id_, 5000, &done));
    EXPECT_EQ(kTaskCompleted, done.status_);
    // the queue is first-in first-out. once this one ran, the cancelled job was dequeued too.
    Task later;
    COERCE_ERROR(manager.create_task("proj", "later", "4", &later));
    EXPECT_TRUE(manager.wait_for_task(later.task_id_, 5000, &done));
    EXPECT_EQ(kTaskCompleted, done.status_);

    COERCE_ERROR(manager.get_task_status(queued.task_id_, &status, &found));
    EXPECT_EQ(kTaskCancelled, status.status_);
    EXPECT_TRUE(status.result_.empty());
    EXPECT_FALSE(invoker.was_invoked("proj", "queued"));
    EXPECT_TRUE(invoker.was_invoked("proj", "later"));
    EXPECT_EQ(3, invoker.started_.load());
    EXPECT_TRUE(registry.get_task_channel(queued.task_id_).get() == nullptr);
    COERCE_ERROR(manager.uninitialize());
  }
  cleanup_test(options);
}

TEST(TaskManagerTest, CleanupOldTasks) {
  CloudfnOptions options = get_tiny_options();
  const uint64_t now = assorted::get_now_microsec();
  {
    TaskStore store(fs::Path(options.task_.task_dir_));
    COERCE_ERROR(store.prepare());
    const uint64_t day = kMicrosecPerDay;
    COERCE_ERROR(store.save(make_record("old_completed", kTaskCompleted, now - 10 * day)));
    COERCE_ERROR(store.save(make_record("old_failed", kTaskFailed, now - 8 * day)));
    COERCE_ERROR(store.save(make_record("recent", kTaskCompleted, now - day)));
    // 7.5 days is 7 whole days, which is not more than the retention
    COERCE_ERROR(store.save(make_record("half_day_over", kTaskCompleted, now - 7 * day - day / 2)));
    COERCE_ERROR(store.save(make_record("eight_and_half", kTaskFailed, now - 8 * day - day / 2)));
  }
  {
    FakeInvoker invoker;
    registry::CoordinationRegistry registry(options.registry_);
    TaskManager manager(&registry, &invoker, options.task_);
    COERCE_ERROR(manager.initialize());
    Task blocked;
    COERCE_ERROR(manager.create_task("proj", "block", "{}", &blocked));

    uint32_t removed = 0;
    COERCE_ERROR(manager.cleanup_old_tasks(7, &removed));
    EXPECT_EQ(3U, removed);
    std::vector<Task> tasks;
    COERCE_ERROR(manager.list_tasks(TaskFilter(), &tasks));
    ASSERT_EQ(3U, tasks.size());
    EXPECT_EQ("half_day_over", tasks[0].task_id_);
    EXPECT_EQ("recent", tasks[1].task_id_);
    EXPECT_EQ(blocked.task_id_, tasks[2].task_id_);

    // the active task is never removed, however short the retention
    COERCE_ERROR(manager.cleanup_old_tasks(0, &removed));
    Task task;
    bool found = false;
    COERCE_ERROR(manager.get_task_status(blocked.task_id_, &task, &found));
    EXPECT_TRUE(found);
    EXPECT_TRUE(task.is_active());

    invoker.release();
    EXPECT_TRUE(manager.wait_for_task(blocked.task_id_, 5000, &task));
    COERCE_ERROR(manager.uninitialize());
  }
  cleanup_test(options);
}

TEST(TaskManagerTest, ListFilter) {
  CloudfnOptions options = get_tiny_options();
  {
    FakeInvoker invoker;
    registry::CoordinationRegistry registry(options.registry_);
    TaskManager manager(&registry, &invoker, options.task_);
    COERCE_ERROR(manager.initialize());
    const char* const kFunctions[][2] = {
      {"alpha", "echo"}, {"alpha", "fail"}, {"beta", "echo"},
    };
    std::vector<std::string> ids;
    for (int i = 0; i < 3; ++i) {
      Task created;
      COERCE_ERROR(manager.create_task(kFunctions[i][0], kFunctions[i][1], "{}", &created));
      Task done;
      EXPECT_TRUE(manager.wait_for_task(created.task_id_, 5000, &done));
      ids.push_back(created.task_id_);
      sleep_ms(2);
    }

    std::vector<Task> tasks;
    COERCE_ERROR(manager.list_tasks(TaskFilter(), &tasks));
    ASSERT_EQ(3U, tasks.size());
    for (int i = 0; i < 3; ++i) {
      EXPECT_EQ(ids[i], tasks[i].task_id_);
    }

    TaskFilter by_project;
    by_project.project_name_ = "alpha";
    COERCE_ERROR(manager.list_tasks(by_project, &tasks));
    EXPECT_EQ(2U, tasks.size());

    TaskFilter by_status;
    by_status.filter_status_ = true;
    by_status.status_ = kTaskFailed;
    COERCE_ERROR(manager.list_tasks(by_status, &tasks));
    ASSERT_EQ(1U, tasks.size());
    EXPECT_EQ(ids[1], tasks[0].task_id_);

    by_status.project_name_ = "beta";
    COERCE_ERROR(manager.list_tasks(by_status, &tasks));
    EXPECT_TRUE(tasks.empty());
    COERCE_ERROR(manager.uninitialize());
  }
  cleanup_test(options);
}

TEST(TaskManagerTest, Scheduler) {
  CloudfnOptions options = get_tiny_options();
  {
    FakeInvoker invoker;
    registry::CoordinationRegistry registry(options.registry_);
    TaskManager manager(&registry, &invoker, options.task_);
    COERCE_ERROR(manager.initialize());

    ScheduleDefinition schedule;
    ScheduledJob every_five;
    every_five.job_id_ = "every_five";
    every_five.project_name_ = "proj";
    every_five.function_name_ = "echo";
    every_five.payload_ = "tick";
    every_five.cron_ = "*/5 * * * *";
    schedule.jobs_.push_back(every_five);
    ScheduledJob disabled = every_five;
    disabled.job_id_ = "disabled";
    disabled.function_name_ = "other";
    disabled.enabled_ = false;
    schedule.jobs_.push_back(disabled);

    Scheduler scheduler(&manager, schedule, 50);
    EXPECT_EQ(2U, scheduler.get_job_count());
    struct tm local;
    std::memset(&local, 0, sizeof(local));
    local.tm_year = 2024 - 1900;
    local.tm_mon = 4;
    local.tm_mday = 10;
    local.tm_hour = 12;
    local.tm_min = 1;
    local.tm_isdst = -1;
    const time_t start = ::mktime(&local);
    COERCE_ERROR(scheduler.prepare(start));

    time_t next = 0;
    EXPECT_TRUE(scheduler.get_next_firing("every_five", &next));
    EXPECT_EQ(start + 4 * 60, next);
    EXPECT_FALSE(scheduler.get_next_firing("disabled", &next));
    EXPECT_FALSE(scheduler.get_next_firing("unknown", &next));

    EXPECT_EQ(0U, scheduler.fire_due_jobs(start + 60));
    EXPECT_EQ(1U, scheduler.fire_due_jobs(start + 4 * 60));
    EXPECT_EQ(0U, scheduler.fire_due_jobs(start + 4 * 60));
    EXPECT_TRUE(scheduler.get_next_firing("every_five", &next));
    EXPECT_EQ(start + 9 * 60, next);
    EXPECT_EQ(1U, scheduler.get_fired_count());

    std::vector<Task> tasks;
    EXPECT_TRUE(wait_until([&]() {
      TaskFilter completed;
      completed.filter_status_ = true;
      completed.status_ = kTaskCompleted;
      return !manager.list_tasks(completed, &tasks).is_error() && tasks.size() == 1U;
    }, 5000));
    ASSERT_EQ(1U, tasks.size());
    EXPECT_EQ("echo", tasks[0].function_name_);
    EXPECT_EQ("proj/tick!", tasks[0].result_);

    // a missed window fires once, not once per missed slot
    EXPECT_EQ(1U, scheduler.fire_due_jobs(start + 60 * 60));
    EXPECT_TRUE(scheduler.get_next_firing("every_five", &next));
    EXPECT_EQ(start + 64 * 60, next);
    COERCE_ERROR(manager.uninitialize());
  }
  cleanup_test(options);
}

TEST(TaskManagerTest, ScheduleAtStartup) {
  CloudfnOptions options = get_tiny_options();
  {
    FakeInvoker invoker;
    registry::CoordinationRegistry registry(options.registry_);
    TaskManager manager(&registry, &invoker, options.task_);
    ScheduleDefinition schedule;
    ScheduledJob job;
    job.job_id_ = "nightly";
    job.project_name_ = "proj";
    job.function_name_ = "echo";
    job.cron_ = "@daily";
    schedule.jobs_.push_back(job);
    manager.set_schedule(schedule);
    EXPECT_TRUE(manager.get_scheduler() == nullptr);
    COERCE_ERROR(manager.initialize());
    ASSERT_TRUE(manager.get_scheduler() != nullptr);
    time_t next = 0;
    EXPECT_TRUE(manager.get_scheduler()->get_next_firing("nightly", &next));
    EXPECT_GT(next, ::time(nullptr));
    COERCE_ERROR(manager.uninitialize());
    EXPECT_TRUE(manager.get_scheduler() == nullptr);
  }
  cleanup_test(options);
}

}  // namespace task
}  // namespace cloudfn

TEST_MAIN_CAPTURE_SIGNALS(TaskManagerTest, cloudfn.task);
