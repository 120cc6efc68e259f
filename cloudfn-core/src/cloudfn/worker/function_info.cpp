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
#include "cloudfn/worker/function_info.hpp"

#include <ostream>

namespace cloudfn {
namespace worker {

const char* to_status_name(FunctionInfo::Status status) {
  switch (status) {
  case FunctionInfo::kUnregistered:
    return "unregistered";
  case FunctionInfo::kRegistered:
    return "registered";
  case FunctionInfo::kLoaded:
    return "loaded";
  default:
    return "unknown";
  }
}

std::ostream& operator<<(std::ostream& o, const FunctionInfo& v) {
  o << "<Function>"
    << "<name>" << v.name_ << "</name>"
    << "<file>" << v.file_path_ << "</file>"
    << "<entry>" << v.entry_ << "</entry>"
    << "<status>" << to_status_name(v.status_) << "</status>"
    << "<async>" << v.asynchronous_ << "</async>";
  if (!v.description_.empty()) {
    o << "<description>" << v.description_ << "</description>";
  }
  if (!v.load_error_.empty()) {
    o << "<load_error>" << v.load_error_ << "</load_error>";
  }
  o << "</Function>";
  return o;
}

}  // namespace worker
}  // namespace cloudfn
