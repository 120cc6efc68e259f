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
#ifndef CLOUDFN_REGISTRY_REGISTRY_OPTIONS_HPP_
#define CLOUDFN_REGISTRY_REGISTRY_OPTIONS_HPP_
#include <stdint.h>

#include "cloudfn/cxx11.hpp"
#include "cloudfn/externalize/externalizable.hpp"

namespace cloudfn {
namespace registry {
/**
 * @brief Set of options for the coordination registry.
 * @ingroup REGISTRY
 * @details
 * This is a POD struct. Default destructor/copy-constructor/assignment operator work fine.
 */
struct RegistryOptions CXX11_FINAL : public virtual externalize::Externalizable {
  enum Constants {
    kDefaultChannelCapacity = 1 << 20,
    kDefaultTaskChannelCapacity = 1 << 16,
    kDefaultTerminateWaitMs = 5000,
    kDefaultKillWaitMs = 2000,
  };

  RegistryOptions();

  /**
   * Byte size of each ring (request and response) in a project channel.
   * The largest payload or result that can be exchanged with a worker is slightly less.
   */
  uint32_t    channel_capacity_;

  /** Byte size of each ring in a per-task channel. */
  uint32_t    task_channel_capacity_;

  /** How long terminate_process() waits for a worker to exit after the stop command. */
  uint32_t    terminate_wait_ms_;

  /** How long terminate_process() waits after SIGKILL before giving up on reaping. */
  uint32_t    kill_wait_ms_;

  EXTERNALIZABLE(RegistryOptions);
};
}  // namespace registry
}  // namespace cloudfn
#endif  // CLOUDFN_REGISTRY_REGISTRY_OPTIONS_HPP_
