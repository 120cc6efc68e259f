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
#ifndef CLOUDFN_ASSORTED_ATOMIC_FENCES_HPP_
#define CLOUDFN_ASSORTED_ATOMIC_FENCES_HPP_

#include <stdint.h>

/**
 * @file cloudfn/assorted/atomic_fences.hpp
 * @ingroup ASSORTED
 * @brief Atomic fence methods and load/store with fences that work for both C++11/non-C++11 code.
 * @details
 * Objects placed in shared memory (rings, rendezvous) can't hold std::atomic members
 * portably across processes, so they use gcc/clang's builtins on raw integers instead.
 */
namespace cloudfn {
namespace assorted {
/**
 * @brief Equivalent to std::atomic_thread_fence(std::memory_order_acquire).
 * @ingroup ASSORTED
 */
inline void memory_fence_acquire() {
  ::__atomic_thread_fence(__ATOMIC_ACQUIRE);
}
/**
 * @brief Equivalent to std::atomic_thread_fence(std::memory_order_release).
 * @ingroup ASSORTED
 */
inline void memory_fence_release() {
  ::__atomic_thread_fence(__ATOMIC_RELEASE);
}
/**
 * @brief Equivalent to std::atomic_thread_fence(std::memory_order_acq_rel).
 * @ingroup ASSORTED
 */
inline void memory_fence_acq_rel() {
  ::__atomic_thread_fence(__ATOMIC_ACQ_REL);
}
/**
 * @brief Atomic load with an acquire barrier for raw primitive types rather than std::atomic<T>.
 * @tparam T integer type
 * @return result of load
 * @ingroup ASSORTED
 */
template <typename T>
inline T atomic_load_acquire(const T* target) {
  return ::__atomic_load_n(target, __ATOMIC_ACQUIRE);
}
/**
 * @brief Atomic fetch-add with a full barrier for raw primitive types.
 * @return the value before the addition
 * @ingroup ASSORTED
 */
template <typename T>
inline T raw_atomic_fetch_add(T* target, T addendum) {
  return ::__atomic_fetch_add(target, addendum, __ATOMIC_SEQ_CST);
}
}  // namespace assorted
}  // namespace cloudfn

#endif  // CLOUDFN_ASSORTED_ATOMIC_FENCES_HPP_
