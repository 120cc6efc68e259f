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
#include "cloudfn/error_stack.hpp"

#include <glog/logging.h>

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

#include "cloudfn/assert_nd.hpp"
#include "cloudfn/assorted/assorted_func.hpp"

namespace cloudfn {

#define X(a, b, c) if (std::strcmp(name, #a) == 0) { return a; }
ErrorCode get_error_code_by_name(const char* name) {
  if (name == CXX11_NULLPTR) {
    return kErrorCodeOk;
  }
#include "cloudfn/error_code.xmacro" // NOLINT
  return kErrorCodeOk;
}
#undef X

void ErrorStack::output(std::ostream* ptr) const {
  std::ostream &o = *ptr;  // just to workaround non-const reference rule.
  if (!is_error()) {
    o << "No error";
  } else {
    o << get_error_name(error_code_) << "(" << error_code_ << "):" << get_message();
    if (os_errno_ != 0) {
      o << " (Latest system call error=" << assorted::os_error(os_errno_) << ")";
    }
    if (get_custom_message()) {
      o << " (Additional message=" << get_custom_message() << ")";
    }

    for (uint16_t stack_index = 0; stack_index < get_stack_depth(); ++stack_index) {
      o << std::endl << "  " << get_filename(stack_index)
        << ":" << get_linenum(stack_index) << ": ";
      if (get_func(stack_index) != CXX11_NULLPTR) {
        o << get_func(stack_index) << "()";
      }
    }
    if (get_stack_depth() >= cloudfn::ErrorStack::kMaxStackDepth) {
      o << std::endl << "  .. and more. Increase kMaxStackDepth to see full stacktraces";
    }
  }
}

std::string ErrorStack::describe_brief() const {
  if (!is_error()) {
    return std::string();
  }
  if (get_custom_message()) {
    return std::string(get_custom_message());
  }
  return std::string(get_message());
}

void ErrorStack::dump_and_abort(const char *abort_message) const {
  std::stringstream str;
  str << "cloudfn::ErrorStack::dump_and_abort: " << abort_message << std::endl
    << *this << std::endl;
  str << print_backtrace();
  LOG(ERROR) << str.str();
  std::cerr.flush();
  std::abort();
}

std::ostream& operator<<(std::ostream& o, const ErrorStack& obj) {
  obj.output(&o);
  return o;
}

}  // namespace cloudfn
