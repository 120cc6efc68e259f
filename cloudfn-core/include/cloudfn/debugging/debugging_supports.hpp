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
#ifndef CLOUDFN_DEBUGGING_DEBUGGING_SUPPORTS_HPP_
#define CLOUDFN_DEBUGGING_DEBUGGING_SUPPORTS_HPP_

#include <string>

#include "cloudfn/cxx11.hpp"
#include "cloudfn/initializable.hpp"
#include "cloudfn/debugging/debugging_options.hpp"

namespace cloudfn {
namespace debugging {
/**
 * @brief APIs to support debugging functionalities.
 * @ingroup DEBUGGING
 * @details
 * Owns the process-wide glog initialization. Every long-running entry point (the CLI's serve
 * mode, each test) initializes one of these first, so that all other modules can use glog.
 * Multiple instances in one process are fine; glog is initialized by the first and shut down
 * by the last.
 */
class DebuggingSupports CXX11_FINAL : public DefaultInitializable {
 public:
  DebuggingSupports() CXX11_FUNC_DELETE;
  explicit DebuggingSupports(const DebuggingOptions& options) : options_(options) {}
  ErrorStack  initialize_once() CXX11_OVERRIDE;
  ErrorStack  uninitialize_once() CXX11_OVERRIDE;

  /** @copydoc DebuggingOptions#debug_log_to_stderr_ */
  void                set_debug_log_to_stderr(bool value);
  /** @copydoc DebuggingOptions#debug_log_stderr_threshold_ */
  void                set_debug_log_stderr_threshold(DebuggingOptions::DebugLogLevel level);
  /** @copydoc DebuggingOptions#debug_log_min_threshold_ */
  void                set_debug_log_min_threshold(DebuggingOptions::DebugLogLevel level);
  /** @copydoc DebuggingOptions#verbose_log_level_ */
  void                set_verbose_log_level(int verbose);
  /** @copydoc DebuggingOptions#verbose_modules_ */
  void                set_verbose_module(const std::string &module, int verbose);

  /** Whether some DebuggingSupports in this process currently holds glog initialized. */
  static bool         is_glog_initialized();
  /**
   * Must be the first thing a forked worker does.
   * Another thread of the control plane might have held glog's internal lock when fork()
   * ran. This raises FLAGS_minloglevel above FATAL so that LOG() in this process returns
   * before it takes the lock. Worker code logs via RAW_LOG_STREAM() instead.
   * It takes no lock, so static_glog_initialize_lock is not touched either.
   */
  static void         enter_forked_child();

 private:
  /**
   * Initialize Google-logging only once. This is called at the beginning of initialize_once()
   * so that all other initialization can use glog.
   */
  void                initialize_glog();
  /**
   * Uninitialize Google-logging only once.  This is called at the end of uninitialize_once()
   * so that all other uninitialization can use glog.
   */
  void                uninitialize_glog();

  const DebuggingOptions  options_;
};
}  // namespace debugging
}  // namespace cloudfn
#endif  // CLOUDFN_DEBUGGING_DEBUGGING_SUPPORTS_HPP_
