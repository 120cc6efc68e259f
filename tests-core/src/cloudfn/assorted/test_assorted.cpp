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
#include <stdint.h>

#include <set>
#include <string>
#include <vector>

#include "cloudfn/test_common.hpp"
#include "cloudfn/assorted/assorted_func.hpp"

namespace cloudfn {
namespace assorted {
DEFINE_TEST_CASE_PACKAGE(AssortedTest, cloudfn.assorted);

TEST(AssortedTest, ReplaceAll) {
  EXPECT_EQ("/envs/demo/bin", replace_all("/envs/$PROJECT$/bin", "$PROJECT$", "demo"));
  EXPECT_EQ("a1b1", replace_all("a$N$b$N$", "$N$", 1));
  EXPECT_EQ("nothing", replace_all("nothing", "$X$", "y"));
}

TEST(AssortedTest, TrimSplit) {
  EXPECT_EQ("a b", trim("  a b \t\n"));
  EXPECT_EQ("", trim(" \t "));
  std::vector<std::string> tokens = split("a,,b,", ',');
  ASSERT_EQ(4U, tokens.size());
  EXPECT_EQ("a", tokens[0]);
  EXPECT_EQ("", tokens[1]);
  EXPECT_EQ("b", tokens[2]);
  EXPECT_EQ("", tokens[3]);
}

TEST(AssortedTest, StartsEndsWith) {
  EXPECT_TRUE(starts_with("test_echo.py", "test_"));
  EXPECT_FALSE(starts_with("te", "test_"));
  EXPECT_TRUE(ends_with("echo.py", ".py"));
  EXPECT_FALSE(ends_with("echo.pyc", ".py"));
}

TEST(AssortedTest, Iso8601) {
  const uint64_t kTime = 1700000000123456ULL;
  std::string formatted = format_iso8601(kTime);
  EXPECT_EQ("2023-11-14T22:13:20.123456Z", formatted);
  uint64_t parsed = 0;
  EXPECT_TRUE(parse_iso8601(formatted, &parsed));
  EXPECT_EQ(kTime, parsed);

  EXPECT_TRUE(parse_iso8601("2023-11-14T22:13:20", &parsed));
  EXPECT_EQ(1700000000000000ULL, parsed);
  EXPECT_FALSE(parse_iso8601("yesterday", &parsed));
}

TEST(AssortedTest, Uuid) {
  std::set<std::string> generated;
  for (int i = 0; i < 100; ++i) {
    std::string uuid = generate_uuid();
    ASSERT_EQ(36U, uuid.size());
    EXPECT_EQ('-', uuid[8]);
    EXPECT_EQ('-', uuid[13]);
    EXPECT_EQ('4', uuid[14]);
    generated.insert(uuid);
  }
  EXPECT_EQ(100U, generated.size());
}

}  // namespace assorted
}  // namespace cloudfn

TEST_MAIN_CAPTURE_SIGNALS(AssortedTest, cloudfn.assorted);
