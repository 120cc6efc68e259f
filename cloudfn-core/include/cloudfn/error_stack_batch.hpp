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
#ifndef CLOUDFN_ERROR_STACK_BATCH_HPP_
#define CLOUDFN_ERROR_STACK_BATCH_HPP_
#include <stdint.h>

#include <iosfwd>
#include <vector>

#include "cloudfn/cxx11.hpp"
#include "cloudfn/error_stack.hpp"

namespace cloudfn {
/**
 * @brief Batches zero or more ErrorStack objects to represent in one ErrorStack.
 * @ingroup ERRORCODES
 * @details
 * This is used in places that have multiple steps to run, each of which might fail, but
 * all of which must run anyway. Shutdown sequences are the typical example:
 * @code{.cpp}
 * ErrorStackBatch batch;
 * batch.emprace_back(terminate_all_workers());
 * batch.emprace_back(release_channels());
 * return SUMMARIZE_ERROR_BATCH(batch);
 * @endcode
 */
class ErrorStackBatch {
 public:
  ErrorStackBatch() {}
  ErrorStackBatch(const ErrorStackBatch &other) : error_batch_(other.error_batch_) {}
  ErrorStackBatch& operator=(const ErrorStackBatch &other) {
    error_batch_ = other.error_batch_;
    return *this;
  }

  void clear() { error_batch_.clear(); }

  /** If the given ErrorStack is an error, this method adds it to the end of this batch. */
  void push_back(const ErrorStack &error_stack) {
    if (!error_stack.is_error()) {
      return;
    }
    error_batch_.push_back(error_stack);
  }

#ifndef DISABLE_CXX11_IN_PUBLIC_HEADERS
  /** Same as push_back(), but receives an rvalue. */
  void emprace_back(ErrorStack &&error_stack) {
    if (!error_stack.is_error()) {
      return;
    }
    error_batch_.emplace_back(error_stack);
  }
#endif  // DISABLE_CXX11_IN_PUBLIC_HEADERS

  /** Returns whether there was any error. */
  bool        is_error() const { return !error_batch_.empty(); }

  /** Number of errors collected so far. */
  size_t      size() const { return error_batch_.size(); }

  /**
   * Uninitialize and delete all Initializable objects in a vector, storing all errors in
   * this batch.
   */
  template<class T>
  void        uninitialize_and_delete_all(std::vector< T* > *vec) {
    while (!vec->empty()) {
      push_back(vec->back()->uninitialize());
      delete vec->back();
      vec->pop_back();
    }
  }

  /**
   * Instantiate an ErrorStack object that summarizes all errors in this batch.
   * Consider using SUMMARIZE_ERROR_BATCH(batch).
   */
  ErrorStack  summarize(const char* filename, const char* func, uint32_t linenum) const;

  friend std::ostream& operator<<(std::ostream& o, const ErrorStackBatch& obj);

 private:
  std::vector<ErrorStack> error_batch_;
};
}  // namespace cloudfn

/**
 * @def SUMMARIZE_ERROR_BATCH(batch)
 * @ingroup ERRORCODES
 * @brief This macro calls ErrorStackBatch#summarize() with automatically provided parameters.
 */
#define SUMMARIZE_ERROR_BATCH(x) x.summarize(__FILE__, __FUNCTION__, __LINE__)

#endif  // CLOUDFN_ERROR_STACK_BATCH_HPP_
