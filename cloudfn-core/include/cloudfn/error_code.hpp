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
#ifndef CLOUDFN_ERROR_CODE_HPP_
#define CLOUDFN_ERROR_CODE_HPP_

namespace cloudfn {

/**
 * @defgroup ERRORCODES Error codes, messages, and stacktraces
 * @ingroup IDIOMS
 * @brief Error codes (cloudfn::ErrorCode), their error messages defined in error_code.xmacro, and
 * stacktrace information (ErrorStack) returned by our API functions.
 * @details
 * @par What it is
 * We define all error codes and their error messages here.
 * Whenever you want a new error message, add a new line in error_code.xmacro like existing lines.
 * This file is completely independent and header-only. Just include this file to use.
 *
 * @par X-Macros
 * To concisely define error codes, error names, and error messages,
 * we use the so-called "X Macro" style, which doesn't require any code generation.
 * @see http://en.wikipedia.org/wiki/X_Macro
 *
 * @par ErrorCode vs ErrorStack
 * cloudfn::ErrorCode is merely an integer to identify the type of error.
 * Lightweight internal functions return it. Public API methods return ErrorStack, which
 * additionally contains a stacktrace and an optional custom error message.
 */

#define X(a, b, c) /** b: c. */ a = b,
/**
 * @var ErrorCode
 * @ingroup ERRORCODES
 * @brief Enum of error codes defined in error_code.xmacro.
 */
enum ErrorCode {
  /** 0 means no-error. */
  kErrorCodeOk = 0,
#include "cloudfn/error_code.xmacro" // NOLINT
};
#undef X

/**
 * @brief Returns the names of ErrorCode enum defined in error_code.xmacro.
 * @ingroup ERRORCODES
 */
const char* get_error_name(ErrorCode code);

/**
 * @brief Returns the error messages corresponding to ErrorCode enum defined in error_code.xmacro.
 * @ingroup ERRORCODES
 */
const char* get_error_message(ErrorCode code);

/**
 * @brief Reverse lookup of get_error_name(). Returns kErrorCodeOk if the name is unknown.
 * @ingroup ERRORCODES
 * @details
 * Used when an error crosses a process boundary as text.
 */
ErrorCode   get_error_code_by_name(const char* name);

// A bit tricky to get "a" from a in C macro.
#define X_QUOTE(str) #str
#define X_EXPAND_AND_QUOTE(str) X_QUOTE(str)
#define X(a, b, c) case a: return X_EXPAND_AND_QUOTE(a);
inline const char* get_error_name(ErrorCode code) {
  switch (code) {
    case kErrorCodeOk: return "kErrorCodeOk";
#include "cloudfn/error_code.xmacro" // NOLINT
  }
  return "Unexpected error code";
}
#undef X
#undef X_EXPAND_AND_QUOTE
#undef X_QUOTE

#define X(a, b, c) case a: return c;
inline const char* get_error_message(ErrorCode code) {
  switch (code) {
    case kErrorCodeOk: return "no_error";
#include "cloudfn/error_code.xmacro" // NOLINT
  }
  return "Unexpected error code";
}
#undef X
}  // namespace cloudfn

/**
 * @def CHECK_ERROR_CODE(x)
 * @ingroup ERRORCODES
 * @brief
 * This macro calls \b x and checks its returned error code.  If the code is NOT kErrorCodeOk, it
 * immediately returns from the current function or method, returning the error code code.
 * @see WRAP_ERROR_CODE(x)
 */
#define CHECK_ERROR_CODE(x)\
{\
  cloudfn::ErrorCode __e = x;\
  if (UNLIKELY(__e != cloudfn::kErrorCodeOk)) {\
    return __e;\
  }\
}

#endif  // CLOUDFN_ERROR_CODE_HPP_
