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
#include "cloudfn/worker/native_function_table.hpp"

#include <string>
#include <vector>

namespace cloudfn {
namespace worker {

void NativeFunctionTable::register_function(
  const std::string& project,
  const std::string& name,
  const Function& function,
  bool asynchronous,
  const std::string& description) {
  Entry entry;
  entry.function_ = function;
  entry.asynchronous_ = asynchronous;
  entry.description_ = description;
  std::lock_guard<std::mutex> guard(mutex_);
  entries_[Key(project, name)] = entry;
}

bool NativeFunctionTable::remove_function(const std::string& project, const std::string& name) {
  std::lock_guard<std::mutex> guard(mutex_);
  return entries_.erase(Key(project, name)) > 0;
}

bool NativeFunctionTable::find(
  const std::string& project,
  const std::string& name,
  Entry* out) const {
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = entries_.find(Key(project, name));
  if (it == entries_.end()) {
    return false;
  }
  *out = it->second;
  return true;
}

std::vector<std::string> NativeFunctionTable::list_functions(const std::string& project) const {
  std::lock_guard<std::mutex> guard(mutex_);
  std::vector<std::string> ret;
  for (auto it = entries_.lower_bound(Key(project, "")); it != entries_.end(); ++it) {
    if (it->first.first != project) {
      break;
    }
    ret.push_back(it->first.second);
  }
  return ret;
}

void NativeFunctionTable::copy_project(
  const std::string& project,
  NativeFunctionTable* out) const {
  std::vector< std::pair<Key, Entry> > copied;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    for (auto it = entries_.lower_bound(Key(project, "")); it != entries_.end(); ++it) {
      if (it->first.first != project) {
        break;
      }
      copied.push_back(*it);
    }
  }
  std::lock_guard<std::mutex> guard(out->mutex_);
  for (const auto& kv : copied) {
    out->entries_[kv.first] = kv.second;
  }
}

std::vector<std::string> NativeFunctionTable::list_projects() const {
  std::lock_guard<std::mutex> guard(mutex_);
  std::vector<std::string> ret;
  for (auto it = entries_.begin(); it != entries_.end(); ++it) {
    if (ret.empty() || ret.back() != it->first.first) {
      ret.push_back(it->first.first);
    }
  }
  return ret;
}

}  // namespace worker
}  // namespace cloudfn
