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
#ifndef CLOUDFN_WORKER_NAMESPACE_INFO_HPP_
#define CLOUDFN_WORKER_NAMESPACE_INFO_HPP_

/**
 * @namespace cloudfn::worker
 * @brief \b Worker \b Process, the isolation boundary that owns and runs one project's functions.
 * @details
 * Each project runs in its own forked process. The process:
 *  \li Prepares the project's dependency environment through an EnvironmentProvisioner.
 *  \li Scans the project directory through a FunctionSourceProvider and registers every
 * function file that exposes the entry point.
 *  \li Signals readiness on its channel, always, even when initialization failed.
 *  \li Serves stop and execute commands one at a time until it is told to stop.
 *
 * @par Handlers
 * A HandlerResolver turns a registered function into a Handler on first use.
 * The default resolver prefers C++ functions registered in a NativeFunctionTable before
 * the fork, and otherwise runs the function file with the configured runtime command
 * (SubprocessHandler): payload on stdin, result from stdout.
 * Synchronous handlers run on the project's bounded handler pool so that the worker keeps
 * watching its channel for a stop command. Asynchronous handlers run inline.
 *
 * @par Errors
 * Errors never crash the worker. They are converted to error responses at the dispatch
 * boundary and re-created on the control plane side.
 */

/**
 * @defgroup WORKER Worker Process
 * @ingroup COMPONENTS
 * @copydoc cloudfn::worker
 */

#endif  // CLOUDFN_WORKER_NAMESPACE_INFO_HPP_
