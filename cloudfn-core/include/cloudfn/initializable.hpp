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
#ifndef CLOUDFN_INITIALIZABLE_HPP_
#define CLOUDFN_INITIALIZABLE_HPP_

#include "cloudfn/cxx11.hpp"
#include "cloudfn/error_stack.hpp"

namespace cloudfn {
/**
 * @defgroup INITIALIZABLE Initialize/Uninitialize Resources
 * @ingroup IDIOMS
 * @brief Defines a uniform class interface to initialize/uninitialize non-trivial resources.
 * @details
 * @par Constructor/Destructor vs initialize()/uninitialize()
 * Constructor should not do complicated initialization as it can't return errors.
 * Instead, we universally use initialize()/uninitialize() semantics for all long-living objects,
 * such as the master, the coordination registry, worker processes and the task manager.
 * The destructor does NOT call uninitialize(). Make sure you always explicitly call it.
 *
 * @par DefaultInitializable
 * For most classes, derive from DefaultInitializable and define initialize_once() and
 * uninitialize_once(). uninitialize_once() should continue releasing resources even when
 * some step fails, using ErrorStackBatch.
 */

/**
 * The pure-virtual interface to initialize/uninitialize non-trivial resources.
 * @ingroup INITIALIZABLE
 */
class Initializable {
 public:
  virtual ~Initializable() {}

  /**
   * @brief Acquires resources in this object, usually called right after constructor.
   * @pre is_initialized() == FALSE
   * @details
   * If and only if the return value was not an error, is_initialized() will return TRUE.
   * This method is responsible for releasing all acquired resources when initialization fails.
   */
  virtual ErrorStack  initialize() = 0;

  /** Returns whether the object has been already initialized or not. */
  virtual bool        is_initialized() const = 0;

  /**
   * @brief An \e idempotent method to release all resources of this object, if any.
   * @details
   * Whether this method encounters an error or not, the implementation should make the best
   * effort to release as many resources as possible.
   */
  virtual ErrorStack  uninitialize() = 0;
};

/**
 * @brief Typical implementation of Initializable as a skeleton base class.
 * @ingroup INITIALIZABLE
 */
class DefaultInitializable : public virtual Initializable {
 public:
  DefaultInitializable() : initialized_(false) {}
  virtual ~DefaultInitializable() {}

  DefaultInitializable(const DefaultInitializable&) CXX11_FUNC_DELETE;
  DefaultInitializable& operator=(const DefaultInitializable&) CXX11_FUNC_DELETE;

  /** Initialize-once semantics. Calls uninitialize_once() if initialize_once() fails. */
  ErrorStack  initialize() CXX11_OVERRIDE CXX11_FINAL {
    if (is_initialized()) {
      return ERROR_STACK(kErrorCodeAlreadyInitialized);
    }
    ErrorStack init_error = initialize_once();
    if (init_error.is_error()) {
      // if error happens in the middle of initialization, we release resources we acquired.
      CHECK_ERROR(uninitialize_once());
      return init_error;
    }
    initialized_ = true;
    return kRetOk;
  }

  /** Uninitialize-once semantics. */
  ErrorStack  uninitialize() CXX11_OVERRIDE CXX11_FINAL {
    if (!is_initialized()) {
      return kRetOk;
    }
    // even if uninitialize_once() fails, there is no point to call it again.
    initialized_ = false;
    CHECK_ERROR(uninitialize_once());
    return kRetOk;
  }

  bool        is_initialized() const CXX11_OVERRIDE CXX11_FINAL {
    return initialized_;
  }

  virtual ErrorStack  initialize_once() = 0;
  virtual ErrorStack  uninitialize_once() = 0;

 private:
  bool    initialized_;
};

/**
 * @brief Calls Initializable#uninitialize() automatically when it gets out of scope.
 * @ingroup INITIALIZABLE
 * @details
 * \b NOT \b A \b SILVER \b BULLET! C++'s destructor can't propagate any errors, so all this
 * can do is to report the error of uninitialize() to stderr.
 * The only correct solution is for every code to make sure calling uninitialize() explicitly
 * and handling the returned ErrorStack responsively.
 */
class UninitializeGuard {
 public:
  enum Policy {
    /**
     * Automatically calls uninitialize() if it wasn't called when it gets out of scope,
     * and complains to stderr when uninitialize() actually returns an error.
     */
    kWarnIfUninitializeError = 0,
    /** Same as above, but stays quiet. NOT RECOMMENDED. */
    kSilent,
  };
  UninitializeGuard(Initializable *target, Policy policy = kWarnIfUninitializeError)
    : target_(target), policy_(policy) {}
  ~UninitializeGuard();

 private:
  Initializable*  target_;
  Policy          policy_;
};

}  // namespace cloudfn
#endif  // CLOUDFN_INITIALIZABLE_HPP_
