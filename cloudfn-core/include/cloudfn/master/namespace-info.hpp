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
#ifndef CLOUDFN_MASTER_NAMESPACE_INFO_HPP_
#define CLOUDFN_MASTER_NAMESPACE_INFO_HPP_

/**
 * @namespace cloudfn::master
 * @brief \b Master, the control-plane entry point that supervises project workers.
 * @details
 * Master starts the API layer and then one worker per discovered project, and dispatches
 * synchronous executions to the workers over their command channels.
 *
 * @par Project states
 * absent, starting, ready, dead and failed. A project becomes \e failed when its worker did
 * not become ready during start(). A failed project is retried on its next execution.
 *
 * @par Startup
 * One project that fails to become ready does not abort the startup. Failures are collected
 * and logged once after all projects were tried.
 *
 * @par Execution
 * Executions against the same project are serialized, so that each worker channel carries
 * at most one request at a time. Different projects proceed independently.
 * A dead worker found before sending the request is cleaned up and restarted once.
 * A worker that dies while the request is in flight fails that call with
 * kErrorCodeMasterWorkerDied and is restarted for the next call.
 * There is no execution timeout unless MasterOptions::execution_timeout_ms_ is set.
 *
 * @par ProjectManager
 * Deploys, lists and deletes projects and functions on disk, restarting the affected worker.
 */

/**
 * @defgroup MASTER Master
 * @ingroup COMPONENTS
 * @copydoc cloudfn::master
 */

#endif  // CLOUDFN_MASTER_NAMESPACE_INFO_HPP_
