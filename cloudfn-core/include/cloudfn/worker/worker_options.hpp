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
#ifndef CLOUDFN_WORKER_WORKER_OPTIONS_HPP_
#define CLOUDFN_WORKER_WORKER_OPTIONS_HPP_
#include <stdint.h>

#include <string>

#include "cloudfn/cxx11.hpp"
#include "cloudfn/externalize/externalizable.hpp"

namespace cloudfn {
namespace worker {
/**
 * @brief Set of options for worker processes.
 * @ingroup WORKER
 * @details
 * Command options are shell commands run with /bin/sh. They may contain the following
 * placeholders, replaced before execution:
 *  \li $PROJECT$ : name of the project
 *  \li $PROJECT_DIR$ : directory of the project
 *  \li $ENV_DIR$ : environment directory of the project, see environments_dir_pattern_
 *  \li $MANIFEST$ : merged dependency manifest (install_command_ only)
 */
struct WorkerOptions CXX11_FINAL : public virtual externalize::Externalizable {
  enum Constants {
    kDefaultHandlerPoolSize = 10,
  };
  /** Default runtime command. Runs a Python function file in the project's virtualenv. */
  static const char* const kDefaultRuntimeCommand;

  WorkerOptions();

  /** Number of threads in the handler pool of each worker. */
  uint32_t    handler_pool_size_;

  /** Files with this suffix in a project directory are function files. */
  std::string function_file_suffix_;

  /** Name of the entry point each function file must define. */
  std::string entry_point_;

  /**
   * Command that runs one function.
   * The payload is given on stdin and the result is read from stdout.
   * The function file and entry point are given as CLOUDFN_FUNCTION_FILE and
   * CLOUDFN_FUNCTION_ENTRY environment variables.
   */
  std::string runtime_command_;

  /** Per-project environment directory. May contain $PROJECT$. */
  std::string environments_dir_pattern_;

  /** Command that creates the environment if its directory doesn't exist. Empty to skip. */
  std::string ensure_environment_command_;

  /** Command that installs the merged manifest into the environment. Empty to skip. */
  std::string install_command_;

  /** File name of the dependency manifest in each project directory. */
  std::string dependency_manifest_name_;

  /** System-wide dependency manifest merged under each project's. Empty for none. */
  std::string system_manifest_path_;

  /** System-wide .env file overlaid by each project's .env. Empty for none. */
  std::string system_env_file_;

  /** Milliseconds before a subprocess handler is killed. 0 for no limit. */
  uint32_t    handler_timeout_ms_;

  std::string convert_environments_dir_pattern(const std::string& project) const;

  EXTERNALIZABLE(WorkerOptions);
};
}  // namespace worker
}  // namespace cloudfn
#endif  // CLOUDFN_WORKER_WORKER_OPTIONS_HPP_
