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
#include "cloudfn/soc/shared_mutex.hpp"

#include <errno.h>
#include <pthread.h>
#include <glog/logging.h>

#include "cloudfn/assert_nd.hpp"

namespace cloudfn {
namespace soc {

void SharedMutex::initialize() {
  uninitialize();

  int attr_ret = ::pthread_mutexattr_init(&attr_);
  ASSERT_ND(attr_ret == 0);

  int shared_ret = ::pthread_mutexattr_setpshared(&attr_, PTHREAD_PROCESS_SHARED);
  ASSERT_ND(shared_ret == 0);

  int robust_ret = ::pthread_mutexattr_setrobust(&attr_, PTHREAD_MUTEX_ROBUST);
  ASSERT_ND(robust_ret == 0);

  int mutex_ret = ::pthread_mutex_init(&mutex_, &attr_);
  ASSERT_ND(mutex_ret == 0);
  UNUSED_ND(attr_ret);
  UNUSED_ND(shared_ret);
  UNUSED_ND(robust_ret);
  UNUSED_ND(mutex_ret);

  initialized_ = true;
}

void SharedMutex::uninitialize() {
  if (!initialized_) {
    return;
  }

  int mutex_ret = ::pthread_mutex_destroy(&mutex_);
  ASSERT_ND(mutex_ret == 0);

  int attr_ret = ::pthread_mutexattr_destroy(&attr_);
  ASSERT_ND(attr_ret == 0);
  UNUSED_ND(mutex_ret);
  UNUSED_ND(attr_ret);

  initialized_ = false;
}

bool SharedMutex::lock() {
  ASSERT_ND(initialized_);
  int ret = ::pthread_mutex_lock(&mutex_);
  if (ret == EOWNERDEAD) {
    LOG(WARNING) << "The previous owner of a shared mutex died while holding it. Recovering";
    ::pthread_mutex_consistent(&mutex_);
    return false;
  }
  ASSERT_ND(ret == 0);
  return true;
}

bool SharedMutex::trylock() {
  ASSERT_ND(initialized_);
  int ret = ::pthread_mutex_trylock(&mutex_);
  if (ret == EOWNERDEAD) {
    ::pthread_mutex_consistent(&mutex_);
    return true;
  }
  return ret == 0;
}

void SharedMutex::unlock() {
  ASSERT_ND(initialized_);
  int ret = ::pthread_mutex_unlock(&mutex_);
  ASSERT_ND(ret == 0);
  UNUSED_ND(ret);
}

void SharedMutexScope::lock() {
  if (locked_by_me_) {
    return;
  }

  mutex_->lock();
  locked_by_me_ = true;
}

void SharedMutexScope::unlock() {
  if (!locked_by_me_) {
    return;
  }

  mutex_->unlock();
  locked_by_me_ = false;
}

}  // namespace soc
}  // namespace cloudfn
