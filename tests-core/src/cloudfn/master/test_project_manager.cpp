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
#include "cloudfn/fs/filesystem.hpp"
#include "cloudfn/fs/path.hpp"
#include "cloudfn/master/master.hpp"
#include "cloudfn/master/project_manager.hpp"
#include "cloudfn/registry/coordination_registry.hpp"
#include "cloudfn/worker/function_info.hpp"
#include "cloudfn/worker/native_function_table.hpp"
#include "cloudfn/worker/project_environment.hpp"

namespace cloudfn {
namespace master {
DEFINE_TEST_CASE_PACKAGE(ProjectManagerTest, cloudfn.master);

const char* const kEchoSource = "# description: echo\ndef main(payload):\n    return payload\n";

fs::Path project_path(const CloudfnOptions& options, const std::string& project) {
  fs::Path dir(options.master_.projects_dir_);
  dir /= project;
  return dir;
}

TEST(ProjectManagerTest, ValidNames) {
  EXPECT_TRUE(ProjectManager::is_valid_name("orders"));
  EXPECT_TRUE(ProjectManager::is_valid_name("my-project_2.v1"));
  EXPECT_FALSE(ProjectManager::is_valid_name(""));
  EXPECT_FALSE(ProjectManager::is_valid_name(".hidden"));
  EXPECT_FALSE(ProjectManager::is_valid_name("_private"));
  EXPECT_FALSE(ProjectManager::is_valid_name("test_helper"));
  EXPECT_FALSE(ProjectManager::is_valid_name("a/b"));
  EXPECT_FALSE(ProjectManager::is_valid_name("with space"));
}

TEST(ProjectManagerTest, Attach) {
  CloudfnOptions options = get_tiny_options();
  {
    registry::CoordinationRegistry registry(options.registry_);
    Master master(&registry, options.master_, options.worker_);
    ProjectManager manager(&master, options.worker_);
    COERCE_ERROR(manager.attach());
    EXPECT_EQ(&manager,
      registry.get_component_as<ProjectManager>(registry::kComponentProjectManager));
    manager.detach();
    EXPECT_EQ(nullptr, registry.get_component(registry::kComponentProjectManager));
  }
  cleanup_test(options);
}

TEST(ProjectManagerTest, DeployAndList) {
  CloudfnOptions options = get_tiny_options();
  {
    registry::CoordinationRegistry registry(options.registry_);
    Master master(&registry, options.master_, options.worker_);
    ProjectManager manager(&master, options.worker_);
    COERCE_ERROR(manager.deploy_function("alpha", "hello", kEchoSource));
    COERCE_ERROR(manager.deploy_function("alpha", "draft", "print('no entry')\n"));
    COERCE_ERROR(manager.deploy_manifest("alpha", "requests\n"));

    std::vector<worker::FunctionInfo> functions;
    COERCE_ERROR(manager.list_functions("alpha", &functions));
    ASSERT_EQ(2U, functions.size());
    EXPECT_EQ("draft", functions[0].name_);
    EXPECT_EQ(worker::FunctionInfo::kUnregistered, functions[0].status_);
    EXPECT_EQ("hello", functions[1].name_);
    EXPECT_EQ(worker::FunctionInfo::kRegistered, functions[1].status_);
    EXPECT_EQ("echo", functions[1].description_);

    fs::Path manifest(project_path(options, "alpha"));
    manifest /= options.worker_.dependency_manifest_name_;
    std::string content;
    EXPECT_TRUE(fs::read_file(manifest, &content));
    EXPECT_EQ("requests\n", content);

    std::vector<ProjectSummary> projects;
    COERCE_ERROR(manager.list_projects(&projects));
    ASSERT_EQ(1U, projects.size());
    EXPECT_EQ("alpha", projects[0].name_);
    EXPECT_EQ(1U, projects[0].function_count_);
    EXPECT_EQ(ProjectStatus::kAbsent, projects[0].state_);

    ErrorStack error = manager.deploy_function("alpha", "../escape", kEchoSource);
    EXPECT_EQ(kErrorCodeInvalidParameter, error.get_error_code());
    error = manager.deploy_function("_hidden", "hello", kEchoSource);
    EXPECT_EQ(kErrorCodeInvalidParameter, error.get_error_code());
    error = manager.deploy_manifest(".git", "requests\n");
    EXPECT_EQ(kErrorCodeInvalidParameter, error.get_error_code());

    error = manager.list_functions("missing", &functions);
    EXPECT_EQ(kErrorCodeProjectDirMissing, error.get_error_code());
  }
  cleanup_test(options);
}

TEST(ProjectManagerTest, NativeFunctions) {
  CloudfnOptions options = get_tiny_options();
  write_function_file(options, "mixed", "from_file", kEchoSource);
  {
    worker::NativeFunctionTable natives;
    natives.register_function(
      "mixed",
      "native",
      [](const std::string&, const worker::ProjectEnvironment&, std::string*) {
        return kRetOk;
      },
      true,
      "built in");
    natives.register_function(
      "native_only",
      "ping",
      [](const std::string&, const worker::ProjectEnvironment&, std::string*) {
        return kRetOk;
      });
    registry::CoordinationRegistry registry(options.registry_);
    Master master(&registry, options.master_, options.worker_, &natives);
    ProjectManager manager(&master, options.worker_, &natives);

    std::vector<worker::FunctionInfo> functions;
    COERCE_ERROR(manager.list_functions("mixed", &functions));
    ASSERT_EQ(2U, functions.size());
    EXPECT_EQ("from_file", functions[0].name_);
    EXPECT_EQ("native", functions[1].name_);
    EXPECT_TRUE(functions[1].asynchronous_);
    EXPECT_EQ("built in", functions[1].description_);

    COERCE_ERROR(manager.list_functions("native_only", &functions));
    ASSERT_EQ(1U, functions.size());

    std::vector<ProjectSummary> projects;
    COERCE_ERROR(manager.list_projects(&projects));
    ASSERT_EQ(2U, projects.size());
    EXPECT_EQ("mixed", projects[0].name_);
    EXPECT_EQ(2U, projects[0].function_count_);
    EXPECT_EQ("native_only", projects[1].name_);
    EXPECT_EQ(1U, projects[1].function_count_);
  }
  cleanup_test(options);
}

TEST(ProjectManagerTest, DeployReloadsWorker) {
  CloudfnOptions options = get_tiny_options();
  options.master_.auto_start_projects_ = false;
  write_function_file(options, "alpha", "first", kEchoSource);
  {
    registry::CoordinationRegistry registry(options.registry_);
    Master master(&registry, options.master_, options.worker_);
    ProjectManager manager(&master, options.worker_);
    COERCE_ERROR(master.start());

    // no worker yet. deploying does not start one.
    COERCE_ERROR(manager.deploy_function("alpha", "second", kEchoSource));
    EXPECT_FALSE(registry.has_worker("alpha"));

    COERCE_ERROR(master.start_project("alpha"));
    pid_t before = registry.get_worker_pid("alpha");
    std::string result;
    ErrorStack error = master.execute_function("alpha", "third", "3", &result);
    EXPECT_EQ(kErrorCodeWorkerFunctionNotFound, error.get_error_code());

    COERCE_ERROR(manager.deploy_function("alpha", "third", kEchoSource));
    pid_t after = registry.get_worker_pid("alpha");
    EXPECT_GT(after, 0);
    EXPECT_NE(before, after);
    COERCE_ERROR(master.execute_function("alpha", "third", "3", &result));
    EXPECT_EQ("3", result);

    bool deleted = false;
    COERCE_ERROR(manager.delete_function("alpha", "third", &deleted));
    EXPECT_TRUE(deleted);
    error = master.execute_function("alpha", "third", "3", &result);
    EXPECT_EQ(kErrorCodeWorkerFunctionNotFound, error.get_error_code());
  }
  cleanup_test(options);
}

TEST(ProjectManagerTest, DeleteFunction) {
  CloudfnOptions options = get_tiny_options();
  write_function_file(options, "alpha", "hello", kEchoSource);
  {
    registry::CoordinationRegistry registry(options.registry_);
    Master master(&registry, options.master_, options.worker_);
    ProjectManager manager(&master, options.worker_);
    bool deleted = false;
    COERCE_ERROR(manager.delete_function("alpha", "hello", &deleted));
    EXPECT_TRUE(deleted);
    COERCE_ERROR(manager.delete_function("alpha", "hello", &deleted));
    EXPECT_FALSE(deleted);
    COERCE_ERROR(manager.delete_function("alpha", "../../etc", &deleted));
    EXPECT_FALSE(deleted);
    COERCE_ERROR(manager.delete_function("nosuch", "hello", &deleted));
    EXPECT_FALSE(deleted);
    EXPECT_TRUE(fs::is_directory(project_path(options, "alpha")));
  }
  cleanup_test(options);
}

TEST(ProjectManagerTest, DeleteProject) {
  CloudfnOptions options = get_tiny_options();
  options.master_.auto_start_projects_ = false;
  write_function_file(options, "alpha", "hello", kEchoSource);
  fs::Path env_dir(options.worker_.convert_environments_dir_pattern("alpha"));
  EXPECT_TRUE(fs::create_directories(env_dir));
  {
    registry::CoordinationRegistry registry(options.registry_);
    Master master(&registry, options.master_, options.worker_);
    ProjectManager manager(&master, options.worker_);
    COERCE_ERROR(master.start());
    COERCE_ERROR(master.start_project("alpha"));
    EXPECT_TRUE(registry.has_worker("alpha"));

    bool deleted = false;
    COERCE_ERROR(manager.delete_project("alpha", &deleted));
    EXPECT_TRUE(deleted);
    EXPECT_FALSE(registry.has_worker("alpha"));
    EXPECT_FALSE(fs::exists(project_path(options, "alpha")));
    EXPECT_FALSE(fs::exists(env_dir));

    COERCE_ERROR(manager.delete_project("alpha", &deleted));
    EXPECT_FALSE(deleted);
    COERCE_ERROR(manager.delete_project("..", &deleted));
    EXPECT_FALSE(deleted);
    EXPECT_TRUE(fs::is_directory(fs::Path(options.master_.projects_dir_)));
  }
  cleanup_test(options);
}

}  // namespace master
}  // namespace cloudfn

TEST_MAIN_CAPTURE_SIGNALS(ProjectManagerTest, cloudfn.master);
