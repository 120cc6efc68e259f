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
#ifndef CLOUDFN_SOC_SHARED_MUTEX_HPP_
#define CLOUDFN_SOC_SHARED_MUTEX_HPP_

#include <pthread.h>
#include <stdint.h>

#include "cloudfn/cxx11.hpp"

namespace cloudfn {
namespace soc {
/**
 * @brief A mutex that can be placed in shared memory and used from multiple processes.
 * @ingroup SOC
 * @details
 * C++11's mutex doesn't work for multi-process.
 * We need to directly manipulate pthread_mutexattr_setpshared, hence this class.
 * This object is also shared-memory friendly, meaning it has no heap-allocated member.
 *
 * @par Robustness
 * Worker processes might be killed at any moment, even while holding this mutex.
 * The mutex is thus a robust one. When the owner died, the next locker receives the mutex
 * and marks it consistent again. Data protected by the mutex is always updated in a way that
 * a half-done update is harmless (counters are updated last).
 *
 * Example usage:
 * @code{.cpp}
 * SharedMutex mtx;
 * mtx.initialize();  // omit this if you invoked constructor. be careful on reinterpret_cast
 * {
 *   SharedMutexScope scope(&mtx);
 *   do_something();
 * }
 * @endcode
 */
class SharedMutex CXX11_FINAL {
 public:
  SharedMutex() : initialized_(false) { initialize(); }
  ~SharedMutex() { uninitialize(); }

  // Disable copy constructors
  SharedMutex(const SharedMutex&) CXX11_FUNC_DELETE;
  SharedMutex& operator=(const SharedMutex&) CXX11_FUNC_DELETE;

  void initialize();
  void uninitialize();
  bool is_initialized() const { return initialized_; }

  /**
   * Unconditionally lock.
   * @return false if the previous owner died while holding the lock. The lock is taken anyway.
   */
  bool lock();

  /**
   * Instantaneously try the lock.
   * @return whether this thread acquired the lock
   */
  bool trylock();

  /** Unlock it */
  void unlock();

 private:
  /** Whether this mutex is ready for use. We don't tolerate race in initialization. */
  bool                initialized_;
  pthread_mutex_t     mutex_;
  pthread_mutexattr_t attr_;
};

/**
 * @brief Auto-lock scope object for SharedMutex.
 * @ingroup SOC
 * @details
 * SharedMutex itself has auto-release feature, but only when it is on stack.
 * In many cases SharedMutex is placed in shared memory, so its destructor is never called.
 * Instead, this object provides the auto-release semantics.
 */
class SharedMutexScope CXX11_FINAL {
 public:
  explicit SharedMutexScope(SharedMutex* mutex, bool lock_initially = true)
    : mutex_(mutex), locked_by_me_(false) {
    if (lock_initially) {
      lock();
    }
  }
  ~SharedMutexScope() { unlock(); }

  // Disable copy constructors
  SharedMutexScope(const SharedMutexScope&) CXX11_FUNC_DELETE;
  SharedMutexScope& operator=(const SharedMutexScope&) CXX11_FUNC_DELETE;

  bool is_locked_by_me() const { return locked_by_me_; }
  SharedMutex* get_mutex() const { return mutex_; }

  void lock();
  void unlock();

 private:
  SharedMutex* const  mutex_;
  bool                locked_by_me_;
};

}  // namespace soc
}  // namespace cloudfn
#endif  // CLOUDFN_SOC_SHARED_MUTEX_HPP_
