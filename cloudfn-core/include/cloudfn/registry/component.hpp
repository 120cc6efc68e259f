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
#ifndef CLOUDFN_REGISTRY_COMPONENT_HPP_
#define CLOUDFN_REGISTRY_COMPONENT_HPP_

namespace cloudfn {
namespace registry {
/**
 * @brief Base class of objects that can occupy a named slot in the CoordinationRegistry.
 * @ingroup REGISTRY
 * @details
 * The registry does not own components. Registering a component only makes it reachable
 * from other components by name, and cleanup_resources() only clears the slot.
 */
class Component {
 public:
  virtual ~Component() {}

  /** Name of the slot this component is registered to, eg "master". */
  virtual const char* get_component_name() const = 0;
};

}  // namespace registry
}  // namespace cloudfn
#endif  // CLOUDFN_REGISTRY_COMPONENT_HPP_
