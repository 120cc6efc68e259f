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
#ifndef CLOUDFN_MASTER_API_LAYER_HPP_
#define CLOUDFN_MASTER_API_LAYER_HPP_

#include "cloudfn/initializable.hpp"
#include "cloudfn/registry/component.hpp"
#include "cloudfn/registry/coordination_registry.hpp"

namespace cloudfn {
namespace master {
/**
 * @brief The request-facing layer (eg an HTTP server) started and stopped by Master.
 * @ingroup MASTER
 * @details
 * The API layer calls into Master and TaskManager, never the other way around, except that
 * Master drives its lifecycle: initialize() during Master::start(), then is_ready() is
 * polled until it returns true, and uninitialize() during Master::stop().
 * It occupies the "api_server" slot of the registry while Master runs.
 */
class ApiLayer : public registry::Component, public virtual Initializable {
 public:
  virtual ~ApiLayer() {}

  const char* get_component_name() const CXX11_OVERRIDE { return registry::kComponentApiServer; }

  /** Whether the layer accepts requests. Must not block. */
  virtual bool is_ready() const = 0;
};

}  // namespace master
}  // namespace cloudfn
#endif  // CLOUDFN_MASTER_API_LAYER_HPP_
