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
#ifndef CLOUDFN_WORKER_PROJECT_ENVIRONMENT_HPP_
#define CLOUDFN_WORKER_PROJECT_ENVIRONMENT_HPP_

#include <iosfwd>
#include <map>
#include <string>

#include "cloudfn/error_stack.hpp"
#include "cloudfn/fs/path.hpp"

namespace cloudfn {
namespace worker {
/**
 * @brief Immutable key/value environment of one project.
 * @ingroup WORKER
 * @details
 * Built from the system-wide .env file overlaid by the project's own .env file.
 * It is handed to handlers explicitly and never written to the process environment.
 */
class ProjectEnvironment {
 public:
  typedef std::map<std::string, std::string> VariableMap;

  ProjectEnvironment() {}
  explicit ProjectEnvironment(const VariableMap& variables) : variables_(variables) {}

  /**
   * Loads both files. A path that is empty or does not exist contributes nothing.
   * @return kErrorCodeFsReadFail if an existing file can't be read
   */
  static ErrorStack load(
    const fs::Path& system_env_file,
    const fs::Path& project_env_file,
    ProjectEnvironment* out);

  /**
   * Parses dotenv content: KEY=VALUE per line, '#' comments, optional "export " prefix,
   * optionally single- or double-quoted values. Later keys override earlier ones.
   */
  static void parse_dotenv(const std::string& content, VariableMap* out);

  bool                get(const std::string& key, std::string* value) const;
  const VariableMap&  get_variables() const { return variables_; }
  bool                empty() const { return variables_.empty(); }
  size_t              size() const { return variables_.size(); }

  friend std::ostream& operator<<(std::ostream& o, const ProjectEnvironment& v);

 private:
  VariableMap variables_;
};

}  // namespace worker
}  // namespace cloudfn
#endif  // CLOUDFN_WORKER_PROJECT_ENVIRONMENT_HPP_
