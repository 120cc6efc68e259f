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
#ifndef CLOUDFN_WORKER_FUNCTION_INFO_HPP_
#define CLOUDFN_WORKER_FUNCTION_INFO_HPP_

#include <iosfwd>
#include <string>

namespace cloudfn {
namespace worker {
/**
 * @brief One entry of a worker's function registry.
 * @ingroup WORKER
 * @details
 * Keyed by name within the project. A function found on disk without the entry point stays
 * kUnregistered with load_error_ set. Registered functions are loaded on first execution.
 */
struct FunctionInfo {
  enum Status {
    kUnregistered = 0,
    kRegistered,
    kLoaded,
  };

  FunctionInfo() : status_(kUnregistered), asynchronous_(false) {}

  std::string name_;
  /** Empty for functions registered in a NativeFunctionTable. */
  std::string file_path_;
  std::string entry_;
  std::string description_;
  Status      status_;
  bool        asynchronous_;
  /** Why the function is not registered, or why its last load failed. */
  std::string load_error_;

  friend std::ostream& operator<<(std::ostream& o, const FunctionInfo& v);
};

const char* to_status_name(FunctionInfo::Status status);

}  // namespace worker
}  // namespace cloudfn
#endif  // CLOUDFN_WORKER_FUNCTION_INFO_HPP_
