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
#include "cloudfn/worker/function_source_provider.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <string>
#include <vector>

#include "cloudfn/assorted/assorted_func.hpp"
#include "cloudfn/fs/filesystem.hpp"

namespace cloudfn {
namespace worker {

ScriptSourceProvider::ScriptSourceProvider(const fs::Path& projects_dir, const std::string& suffix)
  : projects_dir_(projects_dir), suffix_(suffix) {
}

ErrorStack ScriptSourceProvider::list_function_files(
  const std::string& project,
  std::vector<fs::Path>* out) {
  out->clear();
  fs::Path project_dir(projects_dir_);
  project_dir /= project;
  if (!fs::is_directory(project_dir)) {
    return ERROR_STACK_MSG(kErrorCodeProjectDirMissing, project_dir.c_str());
  }
  std::vector<fs::Path> children = project_dir.child_paths();
  for (const fs::Path& child : children) {
    std::string name = child.filename();
    if (!assorted::ends_with(name, suffix_) || name.size() == suffix_.size()) {
      continue;
    }
    if (assorted::starts_with(name, "_") || assorted::starts_with(name, "test_")) {
      continue;
    }
    if (!fs::is_regular_file(child)) {
      continue;
    }
    out->push_back(child);
  }
  std::sort(out->begin(), out->end());
  return kRetOk;
}

ErrorStack ScriptSourceProvider::read_entry_point(
  const fs::Path& file,
  const std::string& entry,
  EntryPointInfo* out) {
  std::string source;
  if (!fs::read_file(file, &source)) {
    return ERROR_STACK_MSG(kErrorCodeFsReadFail, file.c_str());
  }
  *out = parse_entry_point(source, entry);
  return kRetOk;
}

EntryPointInfo ScriptSourceProvider::parse_entry_point(
  const std::string& source,
  const std::string& entry) {
  const std::string sync_def = "def " + entry + "(";
  const std::string async_def = "async def " + entry + "(";
  const std::string description_tag = "# description:";
  EntryPointInfo info;
  std::vector<std::string> lines = assorted::split(source, '\n');
  for (const std::string& line : lines) {
    // only top-level definitions. a nested def main( is not the entry point.
    if (!info.found_) {
      if (assorted::starts_with(line, async_def)) {
        info.found_ = true;
        info.asynchronous_ = true;
      } else if (assorted::starts_with(line, sync_def)) {
        info.found_ = true;
        info.asynchronous_ = false;
      }
    }
    if (info.description_.empty()) {
      std::string trimmed = assorted::trim(line);
      if (assorted::starts_with(trimmed, description_tag)) {
        info.description_ = assorted::trim(trimmed.substr(description_tag.size()));
      }
    }
  }
  return info;
}

std::string ScriptSourceProvider::get_function_name(const fs::Path& file) const {
  std::string name = file.filename();
  if (assorted::ends_with(name, suffix_)) {
    name = name.substr(0, name.size() - suffix_.size());
  }
  return name;
}

}  // namespace worker
}  // namespace cloudfn
