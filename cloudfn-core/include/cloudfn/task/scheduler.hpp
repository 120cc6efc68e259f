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
#ifndef CLOUDFN_TASK_SCHEDULER_HPP_
#define CLOUDFN_TASK_SCHEDULER_HPP_
#include <stdint.h>
#include <time.h>

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include "cloudfn/cxx11.hpp"
#include "cloudfn/error_stack.hpp"
#include "cloudfn/task/cron_expression.hpp"
#include "cloudfn/task/fwd.hpp"
#include "cloudfn/task/scheduled_job.hpp"
#include "cloudfn/thread/stoppable_thread_impl.hpp"

namespace cloudfn {
namespace task {
/**
 * @brief Fires scheduled jobs by creating tasks.
 * @ingroup TASK
 * @details
 * A thread wakes up every interval and fires the jobs whose next firing time has come.
 * A job fires at most once per wake-up. Firings missed while the process was down or busy
 * are not caught up.
 * Disabled jobs are kept but never fire.
 */
class Scheduler CXX11_FINAL {
 public:
  Scheduler(TaskManager* task_manager, const ScheduleDefinition& schedule, uint32_t interval_ms);
  ~Scheduler() { stop(); }

  Scheduler() CXX11_FUNC_DELETE;
  Scheduler(const Scheduler&) CXX11_FUNC_DELETE;
  Scheduler& operator=(const Scheduler&) CXX11_FUNC_DELETE;

  /** Parses the jobs and computes each first firing after now. Does not start the thread. */
  ErrorStack  prepare(time_t now);
  /** prepare() with the current time, then starts the thread. */
  ErrorStack  start();
  void        stop();

  /**
   * Fires every enabled job due at or before now and computes its next firing.
   * @return number of jobs fired
   */
  uint32_t    fire_due_jobs(time_t now);

  /** @return false if the job is unknown, disabled or never fires again */
  bool        get_next_firing(const std::string& job_id, time_t* out) const;
  uint64_t    get_fired_count() const { return fired_count_; }
  size_t      get_job_count() const { return jobs_.size(); }

 private:
  struct Entry {
    ScheduledJob    job_;
    CronExpression  cron_;
    bool            has_next_;
    time_t          next_;
  };

  TaskManager* const          task_manager_;
  const std::vector<ScheduledJob> jobs_;
  const uint32_t              interval_ms_;

  mutable std::mutex          mutex_;
  std::vector<Entry>          entries_;
  std::atomic<uint64_t>       fired_count_;
  thread::StoppableThread     thread_;

  void        handle_thread(thread::StoppableThread* me);
};

}  // namespace task
}  // namespace cloudfn
#endif  // CLOUDFN_TASK_SCHEDULER_HPP_
