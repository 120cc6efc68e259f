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

#include <string>
#include <vector>

#include "cloudfn/cloudfn_options.hpp"
#include "cloudfn/error_code.hpp"
#include "cloudfn/test_common.hpp"
#include "cloudfn/assorted/assorted_func.hpp"
#include "cloudfn/fs/filesystem.hpp"
#include "cloudfn/fs/path.hpp"
#include "cloudfn/task/task.hpp"
#include "cloudfn/task/task_store.hpp"

namespace cloudfn {
namespace task {
DEFINE_TEST_CASE_PACKAGE(TaskStoreTest, cloudfn.task);

TEST(TaskStoreTest, StatusNames) {
  TaskStatus status = kTaskCreated;
  EXPECT_TRUE(parse_status_name("running", &status));
  EXPECT_EQ(kTaskRunning, status);
  EXPECT_TRUE(parse_status_name("cancelled", &status));
  EXPECT_EQ(kTaskCancelled, status);
  EXPECT_FALSE(parse_status_name("RUNNING", &status));
  EXPECT_FALSE(parse_status_name("done", &status));
  EXPECT_TRUE(is_active_status(kTaskCreated));
  EXPECT_TRUE(is_active_status(kTaskRunning));
  EXPECT_FALSE(is_active_status(kTaskCompleted));
  EXPECT_FALSE(is_active_status(kTaskFailed));
  EXPECT_FALSE(is_active_status(kTaskCancelled));
}

TEST(TaskStoreTest, TaskIds) {
  std::string first = Task::generate_task_id("proj", "func");
  std::string second = Task::generate_task_id("proj", "func");
  EXPECT_EQ(0U, first.find("proj_func_"));
  EXPECT_NE(first, second);
  EXPECT_TRUE(TaskStore::is_valid_id(first));
  EXPECT_FALSE(TaskStore::is_valid_id(""));
  EXPECT_FALSE(TaskStore::is_valid_id(".hidden"));
  EXPECT_FALSE(TaskStore::is_valid_id("../escape"));
}

TEST(TaskStoreTest, SaveLoad) {
  CloudfnOptions options = get_tiny_options();
  TaskStore store(fs::Path(options.task_.task_dir_));
  COERCE_ERROR(store.prepare());
  EXPECT_TRUE(fs::is_directory(store.get_task_dir()));

  Task task;
  task.task_id_ = Task::generate_task_id("proj", "func");
  task.project_name_ = "proj";
  task.function_name_ = "func";
  task.payload_ = "{\"quote\":\"<&>\"}";
  task.created_at_ = assorted::format_iso8601(assorted::get_now_microsec());
  task.transition(kTaskCompleted);
  task.result_ = "line1\nline2";
  COERCE_ERROR(store.save(task));
  EXPECT_TRUE(fs::is_regular_file(store.get_task_file(task.task_id_)));

  Task loaded;
  bool found = false;
  COERCE_ERROR(store.load(task.task_id_, &loaded, &found));
  EXPECT_TRUE(found);
  EXPECT_EQ(task.task_id_, loaded.task_id_);
  EXPECT_EQ(task.payload_, loaded.payload_);
  EXPECT_EQ(kTaskCompleted, loaded.status_);
  EXPECT_EQ(task.created_at_, loaded.created_at_);
  EXPECT_EQ(task.updated_at_, loaded.updated_at_);
  EXPECT_EQ("line1\nline2", loaded.result_);
  EXPECT_EQ("", loaded.error_);
  EXPECT_LT(0U, loaded.get_created_at_microsec());

  // updates overwrite the record
  task.transition(kTaskFailed);
  task.error_ = "late failure";
  COERCE_ERROR(store.save(task));
  COERCE_ERROR(store.load(task.task_id_, &loaded, &found));
  EXPECT_EQ(kTaskFailed, loaded.status_);
  EXPECT_EQ("late failure", loaded.error_);

  COERCE_ERROR(store.load("missing", &loaded, &found));
  EXPECT_FALSE(found);
  COERCE_ERROR(store.load("../escape", &loaded, &found));
  EXPECT_FALSE(found);

  Task invalid;
  invalid.task_id_ = "a/b";
  EXPECT_EQ(kErrorCodeInvalidParameter, store.save(invalid).get_error_code());
  cleanup_test(options);
}

TEST(TaskStoreTest, ListAndRemove) {
  CloudfnOptions options = get_tiny_options();
  TaskStore store(fs::Path(options.task_.task_dir_));
  std::vector<std::string> ids;
  COERCE_ERROR(store.list_ids(&ids));
  EXPECT_TRUE(ids.empty());
  COERCE_ERROR(store.prepare());

  const char* const kIds[] = {"c_task", "a_task", "b_task"};
  for (const char* id : kIds) {
    Task task;
    task.task_id_ = id;
    task.project_name_ = "proj";
    task.function_name_ = "func";
    task.created_at_ = assorted::format_iso8601(assorted::get_now_microsec());
    task.transition(kTaskCreated);
    COERCE_ERROR(store.save(task));
  }
  fs::Path stray(store.get_task_dir());
  stray /= std::string("notes.txt");
  EXPECT_TRUE(fs::durable_write_file(stray, "ignored"));
  fs::Path hidden(store.get_task_dir());
  hidden /= std::string(".partial.xml");
  EXPECT_TRUE(fs::durable_write_file(hidden, "ignored"));

  COERCE_ERROR(store.list_ids(&ids));
  ASSERT_EQ(3U, ids.size());
  EXPECT_EQ("a_task", ids[0]);
  EXPECT_EQ("b_task", ids[1]);
  EXPECT_EQ("c_task", ids[2]);

  COERCE_ERROR(store.remove("b_task"));
  COERCE_ERROR(store.remove("b_task"));
  COERCE_ERROR(store.list_ids(&ids));
  EXPECT_EQ(2U, ids.size());
  cleanup_test(options);
}

TEST(TaskStoreTest, CorruptRecords) {
  CloudfnOptions options = get_tiny_options();
  TaskStore store(fs::Path(options.task_.task_dir_));
  COERCE_ERROR(store.prepare());
  Task loaded;
  bool found = false;

  EXPECT_TRUE(fs::durable_write_file(store.get_task_file("truncated"), "<Task><task_id_>"));
  ErrorStack error = store.load("truncated", &loaded, &found);
  EXPECT_EQ(kErrorCodeConfParseFailed, error.get_error_code());
  EXPECT_FALSE(found);

  Task task;
  task.task_id_ = "bad_status";
  task.project_name_ = "proj";
  task.function_name_ = "func";
  task.created_at_ = "2024-01-01T00:00:00.000000Z";
  task.updated_at_ = task.created_at_;
  COERCE_ERROR(store.save(task));
  std::string content;
  EXPECT_TRUE(fs::read_file(store.get_task_file("bad_status"), &content));
  content = assorted::replace_all(content, ">created<", ">sleeping<");
  EXPECT_TRUE(fs::durable_write_file(store.get_task_file("bad_status"), content));
  error = store.load("bad_status", &loaded, &found);
  EXPECT_EQ(kErrorCodeTaskInvalidStatus, error.get_error_code());
  cleanup_test(options);
}

}  // namespace task
}  // namespace cloudfn

TEST_MAIN_CAPTURE_SIGNALS(TaskStoreTest, cloudfn.task);
