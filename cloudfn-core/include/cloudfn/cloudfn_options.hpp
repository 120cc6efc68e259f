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
#ifndef CLOUDFN_CLOUDFN_OPTIONS_HPP_
#define CLOUDFN_CLOUDFN_OPTIONS_HPP_

// option classes of each module are small. we include them here rather than
// demanding user code to include each of them.
#include "cloudfn/cxx11.hpp"
#include "cloudfn/error_stack.hpp"
#include "cloudfn/debugging/debugging_options.hpp"
#include "cloudfn/externalize/externalizable.hpp"
#include "cloudfn/master/master_options.hpp"
#include "cloudfn/registry/registry_options.hpp"
#include "cloudfn/task/task_options.hpp"
#include "cloudfn/worker/worker_options.hpp"

namespace cloudfn {
/**
 * @brief Set of option values given to a cloudfn process at start-up.
 * @details
 * A collection of settings for individual modules (XxxOptions). Instantiate this class
 * to get default values, then modify values in each module's options.
 *
 * @section EXTERNALIZATION Loading and saving config values.
 * @code{.cpp}
 * CloudfnOptions options;
 * options.master_.projects_dir_ = "/srv/functions";
 * if (options.save_to_file("/etc/cloudfn/cloudfn.xml").is_error()) {
 *    // handle errors. probably file permission.
 * }
 * ....
 * if (options.load_from_file("/etc/cloudfn/cloudfn.xml").is_error()) {
 *    // handle errors. It might be file permission, corrupted XML files, etc.
 * }
 * @endcode
 * A module element absent from the file keeps its default values.
 */
struct CloudfnOptions CXX11_FINAL : public virtual externalize::Externalizable {
  /**
   * Constructs option values with default values.
   */
  CloudfnOptions();
  CloudfnOptions(const CloudfnOptions& other);
  CloudfnOptions& operator=(const CloudfnOptions& other);

  // options for each module
  debugging::DebuggingOptions debugging_;
  registry::RegistryOptions   registry_;
  master::MasterOptions       master_;
  worker::WorkerOptions       worker_;
  task::TaskOptions           task_;

  EXTERNALIZABLE(CloudfnOptions);
};
}  // namespace cloudfn
#endif  // CLOUDFN_CLOUDFN_OPTIONS_HPP_
