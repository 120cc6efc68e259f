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
#ifndef CLOUDFN_NAMESPACE_INFO_HPP_
#define CLOUDFN_NAMESPACE_INFO_HPP_

/**
 * @namespace cloudfn
 * @brief Root package of \b cloudfn, a control plane for function-as-a-service projects.
 * @details
 * A Master process supervises one worker process per project. Workers are launched on
 * demand, provision the project's environment, and execute functions on behalf of the
 * Master. A Task Manager runs functions asynchronously with records persisted on disk,
 * and a cron-like Scheduler creates such tasks periodically.
 * Everything shares one explicitly constructed registry::CoordinationRegistry.
 */

/**
 * @defgroup COMPONENTS Components of cloudfn
 * @brief Modules of cloudfn.
 */

#endif  // CLOUDFN_NAMESPACE_INFO_HPP_
