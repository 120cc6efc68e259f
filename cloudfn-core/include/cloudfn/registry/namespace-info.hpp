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
#ifndef CLOUDFN_REGISTRY_NAMESPACE_INFO_HPP_
#define CLOUDFN_REGISTRY_NAMESPACE_INFO_HPP_

/**
 * @namespace cloudfn::registry
 * @brief \b Coordination \b Registry, the bookkeeping hub shared by all control-plane components.
 * @details
 * The registry is explicitly constructed once per control-plane process and handed to every
 * component by pointer. It holds:
 *  \li A fixed set of named component slots (registry, master, project_manager, api_server,
 * task_manager).
 *  \li One command channel and readiness signal per project, and the same per task.
 * Channels live in System-V shared memory so that forked workers inherit them.
 *  \li One WorkerHandle per running project worker.
 *  \li Per-project handler pools used inside worker processes.
 *
 * The registry has no business logic. Master decides when to start or restart a worker,
 * the registry only knows how to do it.
 *
 * @par Liveness
 * A worker is \e live when its process has not exited and it has signaled readiness.
 * A worker that is running but not ready yet is \e starting.
 */

/**
 * @defgroup REGISTRY Coordination Registry
 * @ingroup COMPONENTS
 * @copydoc cloudfn::registry
 */

#endif  // CLOUDFN_REGISTRY_NAMESPACE_INFO_HPP_
