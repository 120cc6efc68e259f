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
#include "cloudfn/task/scheduler.hpp"

#include <glog/logging.h>

#include <chrono>
#include <string>
#include <vector>

#include "cloudfn/task/task.hpp"
#include "cloudfn/task/task_manager.hpp"

namespace cloudfn {
namespace task {
Scheduler::Scheduler(
  TaskManager* task_manager,
  const ScheduleDefinition& schedule,
  uint32_t interval_ms)
  : task_manager_(task_manager),
    jobs_(schedule.jobs_),
    interval_ms_(interval_ms),
    fired_count_(0) {
}

ErrorStack Scheduler::prepare(time_t now) {
  std::vector<Entry> entries;
  for (const ScheduledJob& job : jobs_) {
    Entry entry;
    entry.job_ = job;
    CHECK_ERROR(CronExpression::parse(job.cron_, &entry.cron_));
    entry.has_next_ = job.enabled_ && entry.cron_.next_after(now, &entry.next_);
    if (!job.enabled_) {
      VLOG(0) << "Scheduled job " << job.job_id_ << " is disabled";
    } else if (!entry.has_next_) {
      LOG(WARNING) << "Scheduled job " << job.job_id_ << " never fires: " << job.cron_;
    }
    entries.push_back(entry);
  }
  std::lock_guard<std::mutex> guard(mutex_);
  entries_.swap(entries);
  return kRetOk;
}

ErrorStack Scheduler::start() {
  CHECK_ERROR(prepare(::time(nullptr)));
  LOG(INFO) << "Starting scheduler with " << jobs_.size() << " jobs";
  thread_.launch(
    "scheduler",
    std::chrono::milliseconds(interval_ms_),
    [this](thread::StoppableThread* me) { handle_thread(me); });
  return kRetOk;
}

void Scheduler::stop() {
  thread_.stop();
}

void Scheduler::handle_thread(thread::StoppableThread* me) {
  while (!me->sleep()) {
    fire_due_jobs(::time(nullptr));
  }
}

uint32_t Scheduler::fire_due_jobs(time_t now) {
  std::vector<ScheduledJob> due;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    for (Entry& entry : entries_) {
      if (!entry.has_next_ || entry.next_ > now) {
        continue;
      }
      due.push_back(entry.job_);
      entry.has_next_ = entry.cron_.next_after(now, &entry.next_);
    }
  }

  // create_task() takes the task manager's lock. Never call it with mutex_ held.
  for (const ScheduledJob& job : due) {
    Task task;
    ErrorStack created = task_manager_->create_task(
      job.project_name_,
      job.function_name_,
      job.payload_,
      &task);
    ++fired_count_;
    if (created.is_error()) {
      LOG(ERROR) << "Scheduled job " << job.job_id_ << " failed to create a task: " << created;
    } else {
      LOG(INFO) << "Scheduled job " << job.job_id_ << " fired. task=" << task.task_id_
        << " (" << to_status_name(task.status_) << ")";
    }
  }
  return static_cast<uint32_t>(due.size());
}

bool Scheduler::get_next_firing(const std::string& job_id, time_t* out) const {
  std::lock_guard<std::mutex> guard(mutex_);
  for (const Entry& entry : entries_) {
    if (entry.job_.job_id_ == job_id) {
      if (!entry.has_next_) {
        return false;
      }
      *out = entry.next_;
      return true;
    }
  }
  return false;
}

}  // namespace task
}  // namespace cloudfn
