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
#ifndef CLOUDFN_CXX11_HPP_
#define CLOUDFN_CXX11_HPP_
/**
 * @defgroup CXX11 C++11 Keywords in Public Headers
 * @ingroup IDIOMS
 * @brief Macros to hide C++11 keywords in public header files.
 * @details
 * libcloudfn itself is compiled with C++11, but its public headers at least compile in C++98 so
 * that a client program can embed the control plane without turning on C++11.
 * Private headers (xxx_impl.hpp, xxx_pimpl.hpp) and cpp files freely use C++11.
 *
 * @par DISABLE_CXX11_IN_PUBLIC_HEADERS macro
 * Defined if __cplusplus < 201103L. If defined, our public headers hide all C++11 dependent APIs.
 */

#if __cplusplus < 201103L
#ifndef NO_CLOUDFN_CXX11_WARNING
#pragma message("C++11 is disabled. libcloudfn can be used without C++11,")
#pragma message(" but enabling C++11 allows more flexible use of the library.")
#pragma message(" To suppress this warning without enabling C++11, set -DNO_CLOUDFN_CXX11_WARNING.")
#endif  // NO_CLOUDFN_CXX11_WARNING
#define DISABLE_CXX11_IN_PUBLIC_HEADERS
#endif  // __cplusplus < 201103L

/**
 * @def CXX11_FUNC_DELETE
 * @ingroup CXX11
 * @brief Used in public headers in place of " = delete" of C++11.
 */
/**
 * @def CXX11_FINAL
 * @ingroup CXX11
 * @brief Used in public headers in place of "final" of C++11.
 */
/**
 * @def CXX11_NULLPTR
 * @ingroup CXX11
 * @brief Used in public headers in place of "nullptr" of C++11.
 */
/**
 * @def CXX11_OVERRIDE
 * @ingroup CXX11
 * @brief Used in public headers in place of "override" of C++11.
 */
#ifdef DISABLE_CXX11_IN_PUBLIC_HEADERS
#define CXX11_FUNC_DELETE
#define CXX11_FUNC_DEFAULT
#define CXX11_CONSTEXPR
#define CXX11_FINAL
#define CXX11_NULLPTR NULL
#define CXX11_NOEXCEPT
#define CXX11_OVERRIDE
#define CXX11_STATIC_ASSERT(expr, message)
#else   // DISABLE_CXX11_IN_PUBLIC_HEADERS
#define CXX11_FUNC_DELETE = delete
#define CXX11_FUNC_DEFAULT = default
#define CXX11_CONSTEXPR constexpr
#define CXX11_FINAL final
#define CXX11_NULLPTR nullptr
#define CXX11_NOEXCEPT noexcept
#define CXX11_OVERRIDE override
#define CXX11_STATIC_ASSERT(expr, message) static_assert(expr, message)
#endif  // DISABLE_CXX11_IN_PUBLIC_HEADERS

#endif  // CLOUDFN_CXX11_HPP_
