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
#ifndef CLOUDFN_ERROR_STACK_HPP_
#define CLOUDFN_ERROR_STACK_HPP_

#include <errno.h>
#include <stdint.h>

#include <cstring>
#include <iosfwd>
#include <string>

#include "cloudfn/assert_nd.hpp"
#include "cloudfn/compiler.hpp"
#include "cloudfn/cxx11.hpp"
#include "cloudfn/error_code.hpp"

namespace cloudfn {

/**
 * @brief Brings error stacktrace information as return value of functions.
 * @ingroup ERRORCODES
 * @details
 * This is returned by most API functions of the control plane.
 * As it brings stacktrace information, it's more informative than just returning ErrorCode.
 * We don't throw or catch exceptions in our program. Errors raised by user functions never
 * reach us as exceptions either; they come back as messages over the worker channel and
 * are re-created here as ErrorStack.
 *
 * @par Macros to help use ErrorStack
 * In most places, you should use kRetOk, CHECK_ERROR(x), or ERROR_STACK(e) to handle this class.
 *
 * @par Maximum stack trace depth
 * We store just line numbers and const pointers to file names, up to kMaxStackDepth frames.
 * The only thing that has to be allocated on heap is a custom error message.
 *
 * @par Moveable/Copiable
 * The copy constructor and copy assignment operator are equivalent to \e move. Although they
 * take a const reference, we \e steal its checked_ and custom_message_.
 */
class ErrorStack {
 public:
  /** Constant values. */
  enum Constants {
     /** Maximum stack trace depth. */
     kMaxStackDepth = 8,
  };

  /** Empty constructor. This is same as duplicating kRetOk. */
  ErrorStack();

  /** Instantiate a return code without a custom error message nor stacktrace. */
  explicit ErrorStack(ErrorCode code);

  /**
   * @brief Instantiate a return code with stacktrace and optionally a custom error message.
   * @param[in] filename file name of the current place. Must be permanent, such as __FILE__.
   * @param[in] func function name of the current place. Must be permanent, such as __FUNCTION__.
   * @param[in] linenum line number of the current place. Usually "__LINE__".
   * @param[in] code Error code, must be real errors.
   * @param[in] custom_message Optional custom error message. We deep-copy it.
   */
  ErrorStack(const char* filename, const char* func, uint32_t linenum, ErrorCode code,
        const char* custom_message = CXX11_NULLPTR);

  /** Copy constructor. */
  ErrorStack(const ErrorStack &other);

  /** Copy constructor to augment the stacktrace. */
  ErrorStack(const ErrorStack &other, const char* filename, const char* func, uint32_t linenum,
        const char* more_custom_message = CXX11_NULLPTR);

  /** Assignment operator. */
  ErrorStack& operator=(const ErrorStack &other);

  ~ErrorStack();

  /** Returns if this return code is not kErrorCodeOk. */
  bool                is_error() const;

  /** Return the integer error code. */
  ErrorCode           get_error_code() const;

  /** Returns the error message inferred by the error code. */
  const char*         get_message() const;

  /** Returns the custom error message. */
  const char*         get_custom_message() const;

  /** Copy the given custom message into this object. */
  void                copy_custom_message(const char* message);

  /** Deletes custom message from this object. */
  void                clear_custom_message();

  /** Appends more custom error message at the end. */
  void                append_custom_message(const char* more_custom_message);

  /** Returns the depth of stack this error code has collected. */
  uint16_t            get_stack_depth() const;

  /** Returns the line number of the given stack position. */
  uint32_t            get_linenum(uint16_t stack_index) const;

  /** Returns the file name of the given stack position. */
  const char*         get_filename(uint16_t stack_index) const;

  /** Returns the function name of the given stack position. */
  const char*         get_func(uint16_t stack_index) const;

  /** Describe this object to the given stream. */
  void                output(std::ostream* ptr) const;

  /**
   * One-line description: custom message if any, otherwise the default message.
   * This is what we ship back to the caller of a function over the worker channel.
   */
  std::string         describe_brief() const;

  /** Describe this object to std::cerr and then abort. Only for COERCE_ERROR. */
  void                dump_and_abort(const char *abort_message) const;

  friend std::ostream& operator<<(std::ostream& o, const ErrorStack& obj);

 private:
  /** Filenames of stacktraces. Deep-first, no deep-copy. */
  const char*     filenames_[kMaxStackDepth];

  /** Functions of stacktraces (no deep-copy as well). */
  const char*     funcs_[kMaxStackDepth];

  /** Line numbers of stacktraces. */
  uint32_t        linenums_[kMaxStackDepth];

  /** Optional custom error message. We deep-copy this string if it's non-NULL. */
  mutable const char*     custom_message_;

  /** errno retrieved when this stack was instantiated. Might be unrelated to the error. */
  int             os_errno_;

  /**
   * @brief Integer error code.
   * @invariant
   * If this value is kErrorCodeOk, all other members have no meanings.
   */
  ErrorCode       error_code_;

  /** Current stack depth. */
  uint16_t        stack_depth_;

  /** Whether someone already checked the error code of this object. */
  mutable bool    checked_;
};

/**
 * @var kRetOk
 * @ingroup ERRORCODES
 * @brief Normal return value for no-error case.
 */
const ErrorStack kRetOk;

inline ErrorStack::ErrorStack()
  : custom_message_(CXX11_NULLPTR), os_errno_(0), error_code_(kErrorCodeOk),
    stack_depth_(0), checked_(true) {
}

inline ErrorStack::ErrorStack(ErrorCode code)
  : custom_message_(CXX11_NULLPTR), os_errno_(errno), error_code_(code),
    stack_depth_(0), checked_(false) {
}

inline ErrorStack::ErrorStack(const char* filename, const char* func, uint32_t linenum,
                ErrorCode code, const char* custom_message)
  : custom_message_(CXX11_NULLPTR), os_errno_(errno), error_code_(code), stack_depth_(1),
    checked_(false) {
  ASSERT_ND(code != kErrorCodeOk);
  filenames_[0] = filename;
  funcs_[0] = func;
  linenums_[0] = linenum;
  copy_custom_message(custom_message);
}

inline ErrorStack::ErrorStack(const ErrorStack &other)
  : custom_message_(CXX11_NULLPTR), os_errno_(0), error_code_(kErrorCodeOk),
    stack_depth_(0), checked_(true) {
  operator=(other);
}

inline ErrorStack::ErrorStack(const ErrorStack &other, const char* filename,
              const char* func, uint32_t linenum, const char* more_custom_message)
  : custom_message_(CXX11_NULLPTR), os_errno_(0), error_code_(kErrorCodeOk),
    stack_depth_(0), checked_(true) {
  if (LIKELY(other.error_code_ == kErrorCodeOk)) {
    return;
  }

  operator=(other);
  if (stack_depth_ != 0 && stack_depth_ < kMaxStackDepth) {
    filenames_[stack_depth_] = filename;
    funcs_[stack_depth_] = func;
    linenums_[stack_depth_] = linenum;
    ++stack_depth_;
  }
  if (more_custom_message) {
    append_custom_message(more_custom_message);
  }
}

inline ErrorStack& ErrorStack::operator=(const ErrorStack &other) {
  if (this == &other) {
    return *this;
  }
  clear_custom_message();
  if (LIKELY(other.error_code_ == kErrorCodeOk)) {
    error_code_ = kErrorCodeOk;
    stack_depth_ = 0;
    checked_ = true;
    return *this;
  }

  // this copy assignment is actually a move assignment.
  custom_message_ = other.custom_message_;
  other.custom_message_ = CXX11_NULLPTR;
  stack_depth_ = other.stack_depth_;
  for (int i = 0; i < other.stack_depth_; ++i) {
    filenames_[i] = other.filenames_[i];
    funcs_[i] = other.funcs_[i];
    linenums_[i] = other.linenums_[i];
  }
  os_errno_ = other.os_errno_;
  error_code_ = other.error_code_;
  checked_ = false;
  other.checked_ = true;
  return *this;
}

inline ErrorStack::~ErrorStack() {
  clear_custom_message();
}

inline void ErrorStack::clear_custom_message() {
  if (UNLIKELY(custom_message_ != CXX11_NULLPTR)) {
    delete[] custom_message_;
    custom_message_ = CXX11_NULLPTR;
  }
}

inline void ErrorStack::copy_custom_message(const char* message) {
  if (LIKELY(error_code_ == kErrorCodeOk)) {
    return;
  }

  clear_custom_message();
  if (message) {
    // do NOT use strdup to make sure new/delete everywhere.
    size_t len = std::strlen(message);
    char *copied = new char[len + 1];
    std::memcpy(copied, message, len + 1);
    custom_message_ = copied;
  }
}

inline void ErrorStack::append_custom_message(const char* more_custom_message) {
  if (LIKELY(error_code_ == kErrorCodeOk)) {
    return;
  }
  if (custom_message_) {
    size_t cur_len = std::strlen(custom_message_);
    size_t more_len = std::strlen(more_custom_message);
    char *copied = new char[cur_len + more_len + 1];
    std::memcpy(copied, custom_message_, cur_len);
    std::memcpy(copied + cur_len, more_custom_message, more_len + 1);
    clear_custom_message();
    custom_message_ = copied;
  } else {
    copy_custom_message(more_custom_message);
  }
}

inline bool ErrorStack::is_error() const {
  checked_ = true;
  return error_code_ != kErrorCodeOk;
}

inline ErrorCode ErrorStack::get_error_code() const {
  checked_ = true;
  return error_code_;
}

inline const char* ErrorStack::get_message() const {
  return get_error_message(error_code_);
}

inline const char* ErrorStack::get_custom_message() const {
  if (error_code_ == kErrorCodeOk) {
    return CXX11_NULLPTR;
  }
  return custom_message_;
}

inline uint16_t ErrorStack::get_stack_depth() const {
  if (error_code_ == kErrorCodeOk) {
    return 0;
  }
  return stack_depth_;
}

inline uint32_t ErrorStack::get_linenum(uint16_t stack_index) const {
  if (error_code_ == kErrorCodeOk) {
    return 0;
  }
  ASSERT_ND(stack_index < stack_depth_);
  return linenums_[stack_index];
}

inline const char* ErrorStack::get_filename(uint16_t stack_index) const {
  if (error_code_ == kErrorCodeOk) {
    return CXX11_NULLPTR;
  }
  ASSERT_ND(stack_index < stack_depth_);
  return filenames_[stack_index];
}

inline const char* ErrorStack::get_func(uint16_t stack_index) const {
  if (error_code_ == kErrorCodeOk) {
    return CXX11_NULLPTR;
  }
  ASSERT_ND(stack_index < stack_depth_);
  return funcs_[stack_index];
}

}  // namespace cloudfn

// The followings are macros. So, they belong to no namespaces.

/**
 * @def ERROR_STACK(e)
 * @ingroup ERRORCODES
 * @brief Instantiates ErrorStack with the given cloudfn::ErrorCode,
 * creating an error stack with the current file, line, and error code.
 */
#define ERROR_STACK(e)      cloudfn::ErrorStack(__FILE__, __FUNCTION__, __LINE__, e)

/**
 * @def ERROR_STACK_MSG(e, m)
 * @ingroup ERRORCODES
 * @brief Overload of ERROR_STACK(e) to receive a custom error message.
 */
#define ERROR_STACK_MSG(e, m)   cloudfn::ErrorStack(__FILE__, __FUNCTION__, __LINE__, e, m)

/**
 * @def CHECK_ERROR(x)
 * @ingroup ERRORCODES
 * @brief
 * This macro calls \b x and checks its returned value.  If an error is encountered, it
 * immediately returns from the current function or method, augmenting
 * the stack trace held by the return code.
 * @note The name is CHECK_ERROR, not CHECK, because Google-logging defines CHECK.
 */
#define CHECK_ERROR(x)\
{\
  cloudfn::ErrorStack __e(x);\
  if (UNLIKELY(__e.is_error())) {\
    return cloudfn::ErrorStack(__e, __FILE__, __FUNCTION__, __LINE__);\
  }\
}

/**
 * @def WRAP_ERROR_CODE(x)
 * @ingroup ERRORCODES
 * @brief
 * Same as CHECK_ERROR(x) except it receives only an error code, thus more efficient.
 */
#define WRAP_ERROR_CODE(x)\
{\
  cloudfn::ErrorCode __e = x;\
  if (UNLIKELY(__e != cloudfn::kErrorCodeOk)) {return ERROR_STACK(__e);}\
}

/**
 * @def CHECK_OUTOFMEMORY(ptr)
 * @ingroup ERRORCODES
 * @brief
 * This macro checks if \b ptr is nullptr, and if so exists with kErrorCodeOutofmemory error stack.
 */
#define CHECK_OUTOFMEMORY(ptr)\
if (UNLIKELY(!ptr)) {\
  return cloudfn::ErrorStack(__FILE__, __FUNCTION__, __LINE__, cloudfn::kErrorCodeOutofmemory);\
}

/**
 * @def COERCE_ERROR(x)
 * @ingroup ERRORCODES
 * @brief
 * This macro calls \b x and aborts if encounters an error.
 * This should be used only in places that expects no error, such as tests.
 */
#define COERCE_ERROR(x)\
{\
  cloudfn::ErrorStack __e(x);\
  if (UNLIKELY(__e.is_error())) {\
    __e.dump_and_abort("Unexpected error happened");\
  }\
}

#endif  // CLOUDFN_ERROR_STACK_HPP_
