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
#ifndef CLOUDFN_WORKER_NATIVE_FUNCTION_TABLE_HPP_
#define CLOUDFN_WORKER_NATIVE_FUNCTION_TABLE_HPP_

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "cloudfn/cxx11.hpp"
#include "cloudfn/error_stack.hpp"
#include "cloudfn/worker/fwd.hpp"

namespace cloudfn {
namespace worker {
/**
 * @brief C++ functions made available to workers, keyed by (project, function).
 * @ingroup WORKER
 * @details
 * Functions must be registered before the worker of the project is launched. The forked
 * worker receives a private copy of the project's entries, taken by copy_project() before
 * fork(), so it never waits on a lock another thread of the control plane held.
 * A native function takes precedence over a function file of the same name.
 */
class NativeFunctionTable CXX11_FINAL {
 public:
  typedef std::function<ErrorStack(
    const std::string& payload,
    const ProjectEnvironment& environment,
    std::string* result)> Function;

  struct Entry {
    Entry() : asynchronous_(false) {}
    Function    function_;
    bool        asynchronous_;
    std::string description_;
  };

  NativeFunctionTable() {}
  NativeFunctionTable(const NativeFunctionTable&) CXX11_FUNC_DELETE;
  NativeFunctionTable& operator=(const NativeFunctionTable&) CXX11_FUNC_DELETE;

  void register_function(
    const std::string& project,
    const std::string& name,
    const Function& function,
    bool asynchronous = false,
    const std::string& description = "");
  bool remove_function(const std::string& project, const std::string& name);
  bool find(const std::string& project, const std::string& name, Entry* out) const;
  std::vector<std::string> list_functions(const std::string& project) const;
  /** Adds every function of the project to another table. */
  void copy_project(const std::string& project, NativeFunctionTable* out) const;
  /** Projects having at least one native function, sorted. */
  std::vector<std::string> list_projects() const;

 private:
  typedef std::pair<std::string, std::string> Key;
  mutable std::mutex      mutex_;
  std::map<Key, Entry>    entries_;
};

}  // namespace worker
}  // namespace cloudfn
#endif  // CLOUDFN_WORKER_NATIVE_FUNCTION_TABLE_HPP_
