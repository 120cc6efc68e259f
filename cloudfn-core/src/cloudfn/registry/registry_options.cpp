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
#include "cloudfn/registry/registry_options.hpp"

#include "cloudfn/externalize/externalizable.hpp"

namespace cloudfn {
namespace registry {
RegistryOptions::RegistryOptions() :
  channel_capacity_(kDefaultChannelCapacity),
  task_channel_capacity_(kDefaultTaskChannelCapacity),
  terminate_wait_ms_(kDefaultTerminateWaitMs),
  kill_wait_ms_(kDefaultKillWaitMs) {
}

ErrorStack RegistryOptions::load(tinyxml2::XMLElement* element) {
  EXTERNALIZE_LOAD_ELEMENT(element, channel_capacity_);
  EXTERNALIZE_LOAD_ELEMENT(element, task_channel_capacity_);
  EXTERNALIZE_LOAD_ELEMENT(element, terminate_wait_ms_);
  EXTERNALIZE_LOAD_ELEMENT(element, kill_wait_ms_);
  if (channel_capacity_ < 1024U || task_channel_capacity_ < 1024U) {
    return ERROR_STACK_MSG(kErrorCodeConfValueOutofrange, "channel capacity must be >= 1024");
  }
  return kRetOk;
}

ErrorStack RegistryOptions::save(tinyxml2::XMLElement* element) const {
  CHECK_ERROR(insert_comment(element, "Set of options for the coordination registry"));

  EXTERNALIZE_SAVE_ELEMENT(element, channel_capacity_,
    "Byte size of each ring (request and response) in a project channel."
    " The largest payload or result exchanged with a worker is slightly smaller.");
  EXTERNALIZE_SAVE_ELEMENT(element, task_channel_capacity_,
    "Byte size of each ring in a per-task channel.");
  EXTERNALIZE_SAVE_ELEMENT(element, terminate_wait_ms_,
    "Milliseconds to wait for a worker to exit after sending the stop command."
    " The worker is killed with SIGKILL afterwards.");
  EXTERNALIZE_SAVE_ELEMENT(element, kill_wait_ms_,
    "Milliseconds to wait for a killed worker to be reaped.");
  return kRetOk;
}

}  // namespace registry
}  // namespace cloudfn
