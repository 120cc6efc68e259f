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
#include <string>

#include "cloudfn/error_code.hpp"
#include "cloudfn/error_stack.hpp"
#include "cloudfn/error_stack_batch.hpp"
#include "cloudfn/test_common.hpp"

namespace cloudfn {
DEFINE_TEST_CASE_PACKAGE(ErrorStackTest, cloudfn);

ErrorStack fail_with_message() {
  return ERROR_STACK_MSG(kErrorCodeWorkerFunctionNotFound, "demo/nope");
}
ErrorStack forward_failure() {
  CHECK_ERROR(fail_with_message());
  return kRetOk;
}
ErrorStack wrap_code(ErrorCode code) {
  WRAP_ERROR_CODE(code);
  return kRetOk;
}

TEST(ErrorStackTest, Ok) {
  ErrorStack ok = kRetOk;
  EXPECT_FALSE(ok.is_error());
  EXPECT_EQ(kErrorCodeOk, ok.get_error_code());
  EXPECT_EQ(std::string(), ok.describe_brief());
}

TEST(ErrorStackTest, StackTrace) {
  ErrorStack error = forward_failure();
  EXPECT_TRUE(error.is_error());
  EXPECT_EQ(kErrorCodeWorkerFunctionNotFound, error.get_error_code());
  EXPECT_EQ(2U, error.get_stack_depth());
  EXPECT_EQ(std::string("demo/nope"), error.describe_brief());
}

TEST(ErrorStackTest, DefaultMessage) {
  ErrorStack error = wrap_code(kErrorCodeChannelClosed);
  EXPECT_TRUE(error.is_error());
  EXPECT_EQ(std::string(get_error_message(kErrorCodeChannelClosed)), error.describe_brief());
  EXPECT_FALSE(wrap_code(kErrorCodeOk).is_error());
}

TEST(ErrorStackTest, NameLookup) {
  EXPECT_EQ(std::string("kErrorCodeMasterWorkerDied"),
            std::string(get_error_name(kErrorCodeMasterWorkerDied)));
  EXPECT_EQ(kErrorCodeMasterWorkerDied, get_error_code_by_name("kErrorCodeMasterWorkerDied"));
  EXPECT_EQ(kErrorCodeOk, get_error_code_by_name("kErrorCodeNoSuchThing"));
}

TEST(ErrorStackTest, Batch) {
  ErrorStackBatch batch;
  batch.push_back(kRetOk);
  EXPECT_FALSE(batch.is_error());
  EXPECT_FALSE(SUMMARIZE_ERROR_BATCH(batch).is_error());

  batch.push_back(ERROR_STACK(kErrorCodeFsRemoveFailed));
  ErrorStack single = SUMMARIZE_ERROR_BATCH(batch);
  EXPECT_EQ(kErrorCodeFsRemoveFailed, single.get_error_code());

  batch.push_back(ERROR_STACK(kErrorCodeRegistryWorkerStopFailed));
  ErrorStack multi = SUMMARIZE_ERROR_BATCH(batch);
  EXPECT_EQ(kErrorCodeBatchedError, multi.get_error_code());
}

}  // namespace cloudfn

TEST_MAIN_CAPTURE_SIGNALS(ErrorStackTest, cloudfn);
