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
#ifndef CLOUDFN_TASK_NAMESPACE_INFO_HPP_
#define CLOUDFN_TASK_NAMESPACE_INFO_HPP_

/**
 * @namespace cloudfn::task
 * @brief \b Task \b Manager, asynchronous and scheduled executions.
 * @details
 * A task is one asynchronous execution of a project function. TaskManager creates it,
 * runs it on a bounded pool through master::FunctionInvoker, and records every transition
 * in one XML file per task, so that its status can be queried after a restart.
 *
 * @par Status transitions
 * created -> running -> completed | failed, and created | running -> cancelled.
 * completed, failed and cancelled are terminal. Cancellation only changes the record. An
 * execution already sent to a worker still runs to its end, and its outcome is discarded.
 *
 * @par De-duplication
 * At most one active (created or running) task exists per (project, function). Creating a
 * task while one is active returns the active one.
 *
 * @par Scheduler
 * Scheduler fires the jobs of a ScheduleDefinition by their cron expressions. Each firing
 * creates a task, so a firing during an active task of the same function is absorbed by the
 * de-duplication.
 */

/**
 * @defgroup TASK Task Manager
 * @ingroup COMPONENTS
 * @copydoc cloudfn::task
 */

#endif  // CLOUDFN_TASK_NAMESPACE_INFO_HPP_
