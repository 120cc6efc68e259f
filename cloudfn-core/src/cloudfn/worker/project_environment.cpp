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
#include "cloudfn/worker/project_environment.hpp"

#include <ostream>
#include <string>
#include <vector>

#include "cloudfn/assorted/assorted_func.hpp"
#include "cloudfn/debugging/raw_log.hpp"
#include "cloudfn/fs/filesystem.hpp"

namespace cloudfn {
namespace worker {

namespace {
ErrorStack load_file_if_exists(const fs::Path& path, ProjectEnvironment::VariableMap* out) {
  if (path.empty() || !fs::exists(path)) {
    return kRetOk;
  }
  std::string content;
  if (!fs::read_file(path, &content)) {
    return ERROR_STACK_MSG(kErrorCodeFsReadFail, path.c_str());
  }
  ProjectEnvironment::parse_dotenv(content, out);
  RAW_LOG_STREAM(INFO) << "Loaded environment variables from " << path;
  return kRetOk;
}
}  // namespace

ErrorStack ProjectEnvironment::load(
  const fs::Path& system_env_file,
  const fs::Path& project_env_file,
  ProjectEnvironment* out) {
  VariableMap variables;
  CHECK_ERROR(load_file_if_exists(system_env_file, &variables));
  CHECK_ERROR(load_file_if_exists(project_env_file, &variables));
  *out = ProjectEnvironment(variables);
  return kRetOk;
}

void ProjectEnvironment::parse_dotenv(const std::string& content, VariableMap* out) {
  std::vector<std::string> lines = assorted::split(content, '\n');
  for (const std::string& raw : lines) {
    std::string line = assorted::trim(raw);
    if (line.empty() || line[0] == '#') {
      continue;
    }
    if (assorted::starts_with(line, "export ")) {
      line = assorted::trim(line.substr(7));
    }
    std::string::size_type eq = line.find('=');
    if (eq == std::string::npos || eq == 0) {
      continue;
    }
    std::string key = assorted::trim(line.substr(0, eq));
    std::string value = assorted::trim(line.substr(eq + 1));
    if (value.size() >= 2U
      && (value[0] == '"' || value[0] == '\'')
      && value[value.size() - 1] == value[0]) {
      value = value.substr(1, value.size() - 2U);
    } else {
      // unquoted values may carry a trailing comment
      std::string::size_type comment = value.find(" #");
      if (comment != std::string::npos) {
        value = assorted::trim(value.substr(0, comment));
      }
    }
    (*out)[key] = value;
  }
}

bool ProjectEnvironment::get(const std::string& key, std::string* value) const {
  VariableMap::const_iterator it = variables_.find(key);
  if (it == variables_.end()) {
    return false;
  }
  *value = it->second;
  return true;
}

std::ostream& operator<<(std::ostream& o, const ProjectEnvironment& v) {
  // values may be secrets. keys only.
  o << "<ProjectEnvironment>";
  for (ProjectEnvironment::VariableMap::const_iterator it = v.variables_.begin();
    it != v.variables_.end(); ++it) {
    o << "<key>" << it->first << "</key>";
  }
  o << "</ProjectEnvironment>";
  return o;
}

}  // namespace worker
}  // namespace cloudfn
