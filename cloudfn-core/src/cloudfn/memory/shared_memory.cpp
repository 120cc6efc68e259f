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
#include "cloudfn/memory/shared_memory.hpp"

#include <unistd.h>
#include <sys/ipc.h>
#include <sys/shm.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <glog/logging.h>

#include <cstring>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>

#include "cloudfn/assorted/assorted_func.hpp"

namespace cloudfn {
namespace memory {

SharedMemory::SharedMemory(SharedMemory &&other) noexcept : block_(nullptr) {
  *this = std::move(other);
}
SharedMemory& SharedMemory::operator=(SharedMemory &&other) noexcept {
  release_block();
  size_ = other.size_;
  shmid_ = other.shmid_;
  owner_pid_ = other.owner_pid_;
  marked_for_release_ = other.marked_for_release_;
  block_ = other.block_;
  other.block_ = nullptr;
  return *this;
}

bool SharedMemory::is_owned() const {
  return owner_pid_ != 0 && owner_pid_ == ::getpid();
}

ErrorStack SharedMemory::alloc(uint64_t size) {
  release_block();
  if (size == 0) {
    return ERROR_STACK_MSG(kErrorCodeInvalidParameter, "shared memory size must be positive");
  }

  // round up to pages
  const uint64_t kPageSize = 1ULL << 12;
  if (size % kPageSize != 0) {
    size = ((size / kPageSize) + 1ULL) * kPageSize;
  }

  shmid_ = ::shmget(IPC_PRIVATE, size, IPC_CREAT | IPC_EXCL | S_IRUSR | S_IWUSR);
  if (shmid_ == -1) {
    shmid_ = 0;
    std::string msg = std::string("shmget() failed! size=") + std::to_string(size)
      + std::string(", os_error=") + assorted::os_error();
    return ERROR_STACK_MSG(kErrorCodeSocShmAllocFailed, msg.c_str());
  }
  size_ = size;
  owner_pid_ = ::getpid();
  marked_for_release_ = false;

  block_ = reinterpret_cast<char*>(::shmat(shmid_, nullptr, 0));
  if (block_ == reinterpret_cast<void*>(-1)) {
    ::shmctl(shmid_, IPC_RMID, nullptr);  // first thing. release it! before everything else.
    block_ = nullptr;
    std::stringstream msg;
    msg << "shmat alloc failed!" << *this << ", error=" << assorted::os_error();
    std::string str = msg.str();
    return ERROR_STACK_MSG(kErrorCodeSocShmAttachFailed, str.c_str());
  }

  // forked children inherit the attachment, so we can release the ID right away.
  mark_for_release();
  std::memset(block_, 0, size_);
  return kRetOk;
}

void SharedMemory::mark_for_release() {
  if (block_ != nullptr && shmid_ != 0 && !marked_for_release_) {
    ::shmctl(shmid_, IPC_RMID, nullptr);
    marked_for_release_ = true;
  }
}

void SharedMemory::release_block() {
  if (block_ != nullptr) {
    if (is_owned()) {
      mark_for_release();
    }

    // Just detach it. linux will release it once the reference count reaches zero.
    int dt_ret = ::shmdt(block_);
    if (dt_ret == -1) {
      LOG(WARNING) << "shmdt() failed." << *this << ", error=" << assorted::os_error();
    }
    block_ = nullptr;
  }
}

std::ostream& operator<<(std::ostream& o, const SharedMemory& v) {
  o << "<SharedMemory>";
  o << "<size>" << v.get_size() << "</size>";
  o << "<owned>" << v.is_owned() << "</owned>";
  o << "<owner_pid>" << v.get_owner_pid() << "</owner_pid>";
  o << "<shmid>" << v.get_shmid() << "</shmid>";
  o << "<address>" << reinterpret_cast<uintptr_t>(v.get_block()) << "</address>";
  o << "</SharedMemory>";
  return o;
}

}  // namespace memory
}  // namespace cloudfn
