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
#ifndef CLOUDFN_PROCESS_SUBPROCESS_HPP_
#define CLOUDFN_PROCESS_SUBPROCESS_HPP_

#include <stdint.h>

#include <iosfwd>
#include <map>
#include <string>
#include <vector>

#include "cloudfn/error_stack.hpp"

namespace cloudfn {
namespace process {
/**
 * @brief What to run in a child process.
 * @ingroup PROCESS
 */
struct SubprocessRequest {
  SubprocessRequest() : search_path_(true), timeout_ms_(0) {}

  /** argv_[0] is the executable, looked up in PATH if search_path_. */
  std::vector<std::string>            argv_;
  /** Added to (or overriding) the inherited environment of the child only. */
  std::map<std::string, std::string>  extra_env_;
  /** Written to stdin of the child, which is then closed. */
  std::string                         stdin_data_;
  bool                                search_path_;
  /** The child is killed after this period. 0 means no limit. */
  uint64_t                            timeout_ms_;
};

/**
 * @brief Outcome of a child process that ran to its end.
 * @ingroup PROCESS
 */
struct SubprocessResult {
  SubprocessResult() : pid_(0), exit_code_(0), signaled_(false), term_signal_(0) {}

  /** Whether the child exited normally with status 0. */
  bool        is_success() const { return !signaled_ && exit_code_ == 0; }

  /** A one-line summary for error messages: stderr if any, otherwise the exit status. */
  std::string describe_failure() const;

  int         pid_;
  int         exit_code_;
  bool        signaled_;
  int         term_signal_;
  std::string stdout_;
  std::string stderr_;

  friend std::ostream& operator<<(std::ostream& o, const SubprocessResult& v);
};

/**
 * @brief Runs a child process to its end, feeding stdin and collecting stdout/stderr.
 * @ingroup PROCESS
 * @details
 * The child is started with posix_spawn() and never shares the caller's environment
 * modifications: extra_env_ is applied to the child's envp only.
 * A non-zero exit is \e not an error of this function. It is reported in the result.
 * @return kErrorCodeSocPipeFailed or kErrorCodeSocSpawnFailed if the child could not be started,
 * kErrorCodeTimeout if the child was killed due to the timeout.
 */
ErrorStack run_subprocess(const SubprocessRequest& request, SubprocessResult* result);

/** Runs "/bin/sh -c command" with the given extra environment. */
ErrorStack run_shell_command(
  const std::string& command,
  const std::map<std::string, std::string>& extra_env,
  uint64_t timeout_ms,
  SubprocessResult* result);

}  // namespace process
}  // namespace cloudfn
#endif  // CLOUDFN_PROCESS_SUBPROCESS_HPP_
