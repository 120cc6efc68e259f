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
#ifndef CLOUDFN_TASK_CRON_EXPRESSION_HPP_
#define CLOUDFN_TASK_CRON_EXPRESSION_HPP_
#include <stdint.h>
#include <time.h>

#include <iosfwd>
#include <string>

#include "cloudfn/cxx11.hpp"
#include "cloudfn/error_stack.hpp"

namespace cloudfn {
namespace task {
/**
 * @brief A five-field cron expression: minute, hour, day of month, month, day of week.
 * @ingroup TASK
 * @details
 * Each field accepts "*", numbers, ranges "a-b", lists "a,b,c" and steps "* /n" or "a-b/n"
 * (without the space). Months accept jan..dec and days of week sun..sat, case-insensitive.
 * Day of week 7 is Sunday, same as 0.
 * The shortcuts \@yearly, \@annually, \@monthly, \@weekly, \@daily and \@hourly are accepted.
 *
 * As in Vixie cron, when both day of month and day of week are restricted (neither starts
 * with "*"), a day matches if \e either of them matches.
 * Times are evaluated in the local time zone.
 */
class CronExpression CXX11_FINAL {
 public:
  CronExpression();

  /** @return kErrorCodeCronInvalidExpression with the offending part */
  static ErrorStack parse(const std::string& text, CronExpression* out);

  /** Whether the given local time (seconds ignored) matches. */
  bool        matches(const struct tm& local) const;
  /**
   * Earliest matching minute strictly after the given time.
   * @return false if nothing matches within several years, eg "0 0 31 2 *"
   */
  bool        next_after(time_t after, time_t* out) const;

  const std::string& get_text() const { return text_; }

  friend std::ostream& operator<<(std::ostream& o, const CronExpression& v);

 private:
  std::string text_;
  /** Bit i set if value i matches. */
  uint64_t    minutes_;
  uint32_t    hours_;
  uint32_t    days_of_month_;
  uint32_t    months_;
  uint32_t    days_of_week_;
  bool        day_of_month_restricted_;
  bool        day_of_week_restricted_;

  bool        matches_day(const struct tm& local) const;
  static bool parse_field(
    const std::string& field,
    int min_value,
    int max_value,
    const char* const* names,
    uint64_t* mask);
  static bool parse_value(
    const std::string& token,
    int min_value,
    int max_value,
    const char* const* names,
    int* out);
};

}  // namespace task
}  // namespace cloudfn
#endif  // CLOUDFN_TASK_CRON_EXPRESSION_HPP_
