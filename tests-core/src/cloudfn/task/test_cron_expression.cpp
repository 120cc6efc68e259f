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
#include <gtest/gtest.h>

#include <cstring>
#include <ctime>
#include <string>

#include "cloudfn/error_code.hpp"
#include "cloudfn/test_common.hpp"
#include "cloudfn/task/cron_expression.hpp"

namespace cloudfn {
namespace task {
DEFINE_TEST_CASE_PACKAGE(CronExpressionTest, cloudfn.task);

time_t local_time(int year, int month, int day, int hour, int minute) {
  struct tm local;
  std::memset(&local, 0, sizeof(local));
  local.tm_year = year - 1900;
  local.tm_mon = month - 1;
  local.tm_mday = day;
  local.tm_hour = hour;
  local.tm_min = minute;
  local.tm_isdst = -1;
  return ::mktime(&local);
}

time_t next_of(const std::string& text, time_t after) {
  CronExpression cron;
  COERCE_ERROR(CronExpression::parse(text, &cron));
  time_t next = 0;
  EXPECT_TRUE(cron.next_after(after, &next));
  return next;
}

void expect_invalid(const std::string& text) {
  CronExpression cron;
  ErrorStack error = CronExpression::parse(text, &cron);
  EXPECT_EQ(kErrorCodeCronInvalidExpression, error.get_error_code()) << text;
}

TEST(CronExpressionTest, Parse) {
  CronExpression cron;
  COERCE_ERROR(CronExpression::parse("*/15 * * * *", &cron));
  EXPECT_EQ("*/15 * * * *", cron.get_text());
  COERCE_ERROR(CronExpression::parse("  0 9 * * MON-FRI ", &cron));
  EXPECT_EQ("0 9 * * MON-FRI", cron.get_text());
  COERCE_ERROR(CronExpression::parse("0 0 1 jan,jul *", &cron));
  COERCE_ERROR(CronExpression::parse("5,10-20/5 0-23/6 1-31 * 0-7", &cron));
  COERCE_ERROR(CronExpression::parse("@hourly", &cron));
  COERCE_ERROR(CronExpression::parse("@annually", &cron));

  expect_invalid("");
  expect_invalid("* * * *");
  expect_invalid("* * * * * *");
  expect_invalid("60 * * * *");
  expect_invalid("* 24 * * *");
  expect_invalid("* * 0 * *");
  expect_invalid("* * * 13 *");
  expect_invalid("* * * * 8");
  expect_invalid("*/0 * * * *");
  expect_invalid("5-1 * * * *");
  expect_invalid("abc * * * *");
  expect_invalid("1,,2 * * * *");
  expect_invalid("@fortnightly");
}

TEST(CronExpressionTest, Matches) {
  CronExpression cron;
  COERCE_ERROR(CronExpression::parse("*/15 9-17 * * mon-fri", &cron));
  time_t monday = local_time(2024, 3, 4, 9, 30);
  struct tm local;
  ::localtime_r(&monday, &local);
  EXPECT_TRUE(cron.matches(local));
  local.tm_min = 31;
  EXPECT_FALSE(cron.matches(local));
  local.tm_min = 45;
  local.tm_hour = 18;
  EXPECT_FALSE(cron.matches(local));

  time_t saturday = local_time(2024, 3, 2, 9, 30);
  ::localtime_r(&saturday, &local);
  EXPECT_FALSE(cron.matches(local));
}

TEST(CronExpressionTest, NextAfter) {
  EXPECT_EQ(local_time(2024, 3, 4, 10, 15), next_of("*/15 * * * *", local_time(2024, 3, 4, 10, 7)));
  // strictly after
  EXPECT_EQ(local_time(2024, 3, 4, 10, 30),
    next_of("*/15 * * * *", local_time(2024, 3, 4, 10, 15)));
  EXPECT_EQ(local_time(2024, 3, 4, 10, 16),
    next_of("* * * * *", local_time(2024, 3, 4, 10, 15) + 59));
  // friday evening to monday morning
  EXPECT_EQ(local_time(2024, 3, 4, 9, 0),
    next_of("0 9 * * mon-fri", local_time(2024, 3, 1, 10, 0)));
  EXPECT_EQ(local_time(2024, 2, 1, 0, 0), next_of("@monthly", local_time(2024, 1, 31, 12, 0)));
  EXPECT_EQ(local_time(2025, 1, 1, 0, 0), next_of("@yearly", local_time(2024, 1, 1, 0, 0)));
  // the next leap day is a year away
  EXPECT_EQ(local_time(2024, 2, 29, 0, 0), next_of("0 0 29 2 *", local_time(2023, 3, 1, 0, 0)));
  // 7 is sunday too
  EXPECT_EQ(local_time(2024, 3, 3, 2, 30), next_of("30 2 * * 7", local_time(2024, 3, 1, 0, 0)));
}

TEST(CronExpressionTest, DayOfMonthOrDayOfWeek) {
  // both restricted: either one matches
  EXPECT_EQ(local_time(2024, 1, 5, 0, 0), next_of("0 0 13 * fri", local_time(2024, 1, 1, 0, 0)));
  EXPECT_EQ(local_time(2024, 1, 13, 0, 0), next_of("0 0 13 * fri", local_time(2024, 1, 12, 0, 0)));
  // only one restricted: it alone decides
  EXPECT_EQ(local_time(2024, 1, 13, 0, 0), next_of("0 0 13 * *", local_time(2024, 1, 1, 0, 0)));
}

TEST(CronExpressionTest, NeverFires) {
  CronExpression cron;
  time_t next = 0;
  EXPECT_FALSE(cron.next_after(local_time(2024, 1, 1, 0, 0), &next));
  COERCE_ERROR(CronExpression::parse("0 0 31 2 *", &cron));
  EXPECT_FALSE(cron.next_after(local_time(2024, 1, 1, 0, 0), &next));
}

}  // namespace task
}  // namespace cloudfn

TEST_MAIN_CAPTURE_SIGNALS(CronExpressionTest, cloudfn.task);
