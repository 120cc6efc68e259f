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
#include "cloudfn/task/task_store.hpp"

#include <algorithm>
#include <cstring>
#include <string>
#include <vector>

#include "cloudfn/error_code.hpp"
#include "cloudfn/assorted/assorted_func.hpp"
#include "cloudfn/fs/filesystem.hpp"
#include "cloudfn/task/task.hpp"

namespace cloudfn {
namespace task {
const char* const kRecordSuffix = ".xml";

bool TaskStore::is_valid_id(const std::string& task_id) {
  return !task_id.empty() && task_id[0] != '.' && task_id.find('/') == std::string::npos;
}

fs::Path TaskStore::get_task_file(const std::string& task_id) const {
  fs::Path file(task_dir_);
  file /= task_id + kRecordSuffix;
  return file;
}

ErrorStack TaskStore::prepare() {
  if (!fs::is_directory(task_dir_) && !fs::create_directories(task_dir_, true)) {
    return ERROR_STACK_MSG(kErrorCodeFsMkdirFailed, task_dir_.c_str());
  }
  return kRetOk;
}

ErrorStack TaskStore::save(const Task& task) {
  if (!is_valid_id(task.task_id_)) {
    return ERROR_STACK_MSG(kErrorCodeInvalidParameter, task.task_id_.c_str());
  }
  return task.save_to_file(get_task_file(task.task_id_));
}

ErrorStack TaskStore::load(const std::string& task_id, Task* out, bool* found) const {
  *found = false;
  if (!is_valid_id(task_id)) {
    return kRetOk;
  }
  fs::Path file = get_task_file(task_id);
  if (!fs::is_regular_file(file)) {
    return kRetOk;
  }
  CHECK_ERROR(out->load_from_file(file));
  *found = true;
  return kRetOk;
}

ErrorStack TaskStore::list_ids(std::vector<std::string>* out) const {
  out->clear();
  if (!fs::is_directory(task_dir_)) {
    return kRetOk;
  }
  std::vector<fs::Path> children = task_dir_.child_paths();
  for (const fs::Path& child : children) {
    std::string name = child.filename();
    if (name.size() <= std::strlen(kRecordSuffix) || name[0] == '.'
      || !assorted::ends_with(name, kRecordSuffix)) {
      continue;
    }
    out->push_back(name.substr(0, name.size() - std::strlen(kRecordSuffix)));
  }
  std::sort(out->begin(), out->end());
  return kRetOk;
}

ErrorStack TaskStore::remove(const std::string& task_id) {
  fs::Path file = get_task_file(task_id);
  if (fs::exists(file) && !fs::remove(file)) {
    return ERROR_STACK_MSG(kErrorCodeFsRemoveFailed, file.c_str());
  }
  return kRetOk;
}

}  // namespace task
}  // namespace cloudfn
