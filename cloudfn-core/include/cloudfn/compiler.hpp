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
#ifndef CLOUDFN_COMPILER_HPP_
#define CLOUDFN_COMPILER_HPP_

/**
 * @defgroup COMPILER Compiler Specific Optimizations
 * @ingroup IDIOMS
 * @brief A few macros to exploit compiler specific hints, analogous to linux/compiler.h.
 * @details
 * We use them only in a few places that are very easy to predict by human, mostly in the
 * error-propagation macros where the no-error path is by far the common case.
 */

/**
 * @def LIKELY(x)
 * @ingroup COMPILER
 * @brief Hints that x is highly likely true. GCC's __builtin_expect.
 */
/**
 * @def UNLIKELY(x)
 * @ingroup COMPILER
 * @brief Hints that x is highly likely false. GCC's __builtin_expect.
 */
#if defined(__GNUC__) || defined(__clang__)
#define LIKELY(x)      __builtin_expect(!!(x), 1)
#define UNLIKELY(x)    __builtin_expect(!!(x), 0)
#else  // defined(__GNUC__) || defined(__clang__)
#define LIKELY(x)      (x)
#define UNLIKELY(x)    (x)
#endif  // defined(__GNUC__) || defined(__clang__)

#endif  // CLOUDFN_COMPILER_HPP_
