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
#ifndef CLOUDFN_MASTER_FUNCTION_INVOKER_HPP_
#define CLOUDFN_MASTER_FUNCTION_INVOKER_HPP_

#include <string>

#include "cloudfn/error_stack.hpp"

namespace cloudfn {
namespace master {
/**
 * @brief Synchronous execution of a project function.
 * @ingroup MASTER
 * @details
 * Implemented by Master. TaskManager runs tasks through this interface, which lets tests
 * drive it without worker processes.
 */
class FunctionInvoker {
 public:
  virtual ~FunctionInvoker() {}

  /**
   * Runs the function with the payload and blocks until it finishes.
   * @param[out] result what the function returned, valid only on success
   */
  virtual ErrorStack execute_function(
    const std::string& project,
    const std::string& function,
    const std::string& payload,
    std::string* result) = 0;
};

}  // namespace master
}  // namespace cloudfn
#endif  // CLOUDFN_MASTER_FUNCTION_INVOKER_HPP_
