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
#ifndef CLOUDFN_TASK_TASK_STORE_HPP_
#define CLOUDFN_TASK_TASK_STORE_HPP_

#include <string>
#include <vector>

#include "cloudfn/cxx11.hpp"
#include "cloudfn/error_stack.hpp"
#include "cloudfn/fs/path.hpp"
#include "cloudfn/task/fwd.hpp"

namespace cloudfn {
namespace task {
/**
 * @brief On-disk records of tasks, "<task_id>.xml" in one directory.
 * @ingroup TASK
 * @details
 * Each save() durably replaces the whole record. Not thread-safe for the same task id.
 */
class TaskStore CXX11_FINAL {
 public:
  explicit TaskStore(const fs::Path& task_dir) : task_dir_(task_dir) {}

  /** Creates the directory if it doesn't exist. */
  ErrorStack  prepare();

  ErrorStack  save(const Task& task);
  /** @param[out] found false if there is no record of the id */
  ErrorStack  load(const std::string& task_id, Task* out, bool* found) const;
  /** Ids of all records, sorted. */
  ErrorStack  list_ids(std::vector<std::string>* out) const;
  ErrorStack  remove(const std::string& task_id);

  fs::Path    get_task_file(const std::string& task_id) const;
  const fs::Path& get_task_dir() const { return task_dir_; }
  /** Whether the id can name a record file. */
  static bool is_valid_id(const std::string& task_id);

 private:
  const fs::Path task_dir_;
};

}  // namespace task
}  // namespace cloudfn
#endif  // CLOUDFN_TASK_TASK_STORE_HPP_
