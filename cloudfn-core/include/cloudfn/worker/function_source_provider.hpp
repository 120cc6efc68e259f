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
#ifndef CLOUDFN_WORKER_FUNCTION_SOURCE_PROVIDER_HPP_
#define CLOUDFN_WORKER_FUNCTION_SOURCE_PROVIDER_HPP_

#include <string>
#include <vector>

#include "cloudfn/cxx11.hpp"
#include "cloudfn/error_stack.hpp"
#include "cloudfn/fs/path.hpp"

namespace cloudfn {
namespace worker {
/**
 * @brief What a FunctionSourceProvider found about the entry point of one function file.
 * @ingroup WORKER
 */
struct EntryPointInfo {
  EntryPointInfo() : found_(false), asynchronous_(false) {}
  bool        found_;
  bool        asynchronous_;
  std::string description_;
};

/**
 * @brief Lists the function files of a project and inspects their entry points.
 * @ingroup WORKER
 */
class FunctionSourceProvider {
 public:
  virtual ~FunctionSourceProvider() {}
  /** @return kErrorCodeProjectDirMissing if the project has no directory */
  virtual ErrorStack list_function_files(
    const std::string& project,
    std::vector<fs::Path>* out) = 0;
  virtual ErrorStack read_entry_point(
    const fs::Path& file,
    const std::string& entry,
    EntryPointInfo* out) = 0;
  /** Name under which the function in the file is registered. */
  virtual std::string get_function_name(const fs::Path& file) const = 0;
};

/**
 * @brief FunctionSourceProvider for script files such as Python sources.
 * @ingroup WORKER
 * @details
 * Function files are the files in the project directory with the given suffix, except
 * private ones (name starting with '_') and tests (name starting with "test_").
 * The entry point is found textually: a top-level line starting with "def <entry>(" or
 * "async def <entry>(". A line "# description: ..." gives the description.
 */
class ScriptSourceProvider CXX11_FINAL : public FunctionSourceProvider {
 public:
  ScriptSourceProvider(const fs::Path& projects_dir, const std::string& suffix);

  ErrorStack list_function_files(
    const std::string& project,
    std::vector<fs::Path>* out) CXX11_OVERRIDE;
  ErrorStack read_entry_point(
    const fs::Path& file,
    const std::string& entry,
    EntryPointInfo* out) CXX11_OVERRIDE;

  /** The file name without suffix. */
  std::string get_function_name(const fs::Path& file) const CXX11_OVERRIDE;

  /** Parses the content of a function file. */
  static EntryPointInfo parse_entry_point(const std::string& source, const std::string& entry);

 private:
  const fs::Path    projects_dir_;
  const std::string suffix_;
};

}  // namespace worker
}  // namespace cloudfn
#endif  // CLOUDFN_WORKER_FUNCTION_SOURCE_PROVIDER_HPP_
