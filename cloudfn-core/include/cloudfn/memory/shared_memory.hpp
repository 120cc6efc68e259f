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
#ifndef CLOUDFN_MEMORY_SHARED_MEMORY_HPP_
#define CLOUDFN_MEMORY_SHARED_MEMORY_HPP_

#include <stdint.h>
#include <sys/types.h>

#include <iosfwd>

#include "cloudfn/cxx11.hpp"
#include "cloudfn/error_stack.hpp"

namespace cloudfn {
namespace memory {
/**
 * @brief Represents memory shared between the control plane and its forked workers.
 * @ingroup MEMORY
 * @details
 * @par Alloc/dealloc type
 * We always use System-V shmget(IPC_PRIVATE) and shmat()/shmdt(). Workers are launched with
 * fork(), so they inherit the attachment and never need to look the segment up by key.
 *
 * @par Ownership
 * Every shared memory is allocated and owned by the control-plane process.
 * Forked child processes do not have ownership thus do not release them at exit.
 *
 * @par Reclamation
 * alloc() invokes shmctl(IPC_RMID) right after attaching. Linux keeps the segment alive while
 * some process (the owner or a forked child) has it attached, and reclaims it automatically
 * when the last one detaches or dies. Thus a crash never leaks a segment.
 *
 * @par Moveable/Copiable
 * This object is \e NOT copiable.
 * This object \e is moveable (the original object becomes null after the move).
 *
 * @par Debugging shared memories
 * ipcs -m
 */
class SharedMemory CXX11_FINAL {
 public:
  /** Empty constructor which allocates nothing. */
  SharedMemory() CXX11_NOEXCEPT
    : size_(0), shmid_(0), owner_pid_(0), marked_for_release_(false), block_(CXX11_NULLPTR) {}
  // Disable copy constructor
  SharedMemory(const SharedMemory &other) CXX11_FUNC_DELETE;
  SharedMemory& operator=(const SharedMemory &other) CXX11_FUNC_DELETE;

#ifndef DISABLE_CXX11_IN_PUBLIC_HEADERS
  /**
   * Move constructor that steals the memory block from other.
   */
  SharedMemory(SharedMemory &&other) noexcept;
  /**
   * Move assignment operator that steals the memory block from other.
   */
  SharedMemory& operator=(SharedMemory &&other) noexcept;
#endif  // DISABLE_CXX11_IN_PUBLIC_HEADERS

  /** Automatically releases the memory. */
  ~SharedMemory() { release_block(); }

  /**
   * @brief Newly allocate a zero-cleared shared memory of given size.
   * @param[in] size Byte size of the memory block. Actual allocation is at least of this size.
   * @details
   * This method should be called only at the control-plane process, before forking the
   * processes that will use the memory.
   */
  ErrorStack  alloc(uint64_t size);

  /** Returns the memory block. */
  char*       get_block() const { return block_; }
  /** Returns the ID of this shared memory */
  int         get_shmid() const { return shmid_; }
  /** If non-zero, it means the ID of the process that allocated the shared memory. */
  pid_t       get_owner_pid() const { return owner_pid_; }
  /** Returns if this object doesn't hold a valid memory block. */
  bool        is_null() const { return block_ == CXX11_NULLPTR; }
  /** Returns if this process owns this memory and is responsible to delete it. */
  bool        is_owned() const;
  /** Returns the byte size of the memory block. */
  uint64_t    get_size() const { return size_; }

  /**
   * @brief Marks the shared memory as being removed so that it will be reclaimed when all
   * processes detach it.
   * @details
   * This method is idempotent, meaning you can safely call this many times.
   */
  void        mark_for_release();

  /** Detaches the memory block, releasing it \b IF this process has an ownership. */
  void        release_block();

  friend std::ostream&    operator<<(std::ostream& o, const SharedMemory& v);

 private:
  /** Byte size of the memory block. */
  uint64_t    size_;
  /** Shared memory ID used for shmat/shmdt. */
  int         shmid_;
  /**
   * If this value is non-zero and also equivalent to ::getpid(), this process is the one
   * that allocated this memory and also is responsible to delete it.
   */
  pid_t       owner_pid_;
  bool        marked_for_release_;
  /** Allocated memory block. */
  char*       block_;
};

}  // namespace memory
}  // namespace cloudfn
#endif  // CLOUDFN_MEMORY_SHARED_MEMORY_HPP_
