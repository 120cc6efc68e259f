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
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "cloudfn/error_code.hpp"
#include "cloudfn/test_common.hpp"
#include "cloudfn/registry/project_channel.hpp"
#include "cloudfn/soc/channel_block.hpp"
#include "cloudfn/soc/channel_message.hpp"
#include "cloudfn/soc/command_ring.hpp"

namespace cloudfn {
namespace soc {
DEFINE_TEST_CASE_PACKAGE(ChannelTest, cloudfn.soc);

const uint32_t kCapacity = 1 << 10;

TEST(ChannelTest, MessageEncoding) {
  ChannelMessage execute = ChannelMessage::make_execute("echo", "{\"x\":1}");
  EXPECT_TRUE(execute.is_request());
  ChannelMessage decoded;
  EXPECT_EQ(kErrorCodeOk, ChannelMessage::decode(execute.encode(), &decoded));
  EXPECT_EQ(ChannelMessage::kExecute, decoded.type_);
  EXPECT_EQ("echo", decoded.name_);
  EXPECT_EQ("{\"x\":1}", decoded.body_);

  ChannelMessage error = ChannelMessage::make_error(
    ERROR_STACK_MSG(kErrorCodeWorkerFunctionNotFound, "demo/nope"));
  EXPECT_TRUE(error.is_response());
  EXPECT_EQ("kErrorCodeWorkerFunctionNotFound", error.name_);
  EXPECT_EQ("demo/nope", error.body_);

  EXPECT_EQ(kErrorCodeChannelMalformedMessage, ChannelMessage::decode("", &decoded));
  EXPECT_EQ(kErrorCodeChannelMalformedMessage, ChannelMessage::decode("\x09", &decoded));
  std::string truncated = execute.encode();
  truncated.resize(truncated.size() - 1);
  EXPECT_EQ(kErrorCodeChannelMalformedMessage, ChannelMessage::decode(truncated, &decoded));
}

TEST(ChannelTest, OrderedExchange) {
  registry::ProjectChannel channel("channel_test");
  COERCE_ERROR(channel.allocate(kCapacity));
  ChannelBlock* block = channel.get_block();
  for (int i = 0; i < 5; ++i) {
    EXPECT_EQ(kErrorCodeOk, block->send_request(
      ChannelMessage::make_execute("f", std::to_string(i))));
  }
  EXPECT_EQ(5U, block->get_request_ring()->get_message_count());
  for (int i = 0; i < 5; ++i) {
    ChannelMessage message;
    EXPECT_EQ(kErrorCodeOk, block->receive_request(&message, 1000));
    EXPECT_EQ(std::to_string(i), message.body_);
  }
  ChannelMessage none;
  EXPECT_EQ(kErrorCodeTimeout, block->receive_request(&none, 1000));
  EXPECT_EQ(kErrorCodeTimeout, block->receive_response(&none, 1000));
}

TEST(ChannelTest, Backpressure) {
  registry::ProjectChannel channel("channel_test_full");
  COERCE_ERROR(channel.allocate(kCapacity));
  ChannelBlock* block = channel.get_block();
  std::string big(kCapacity / 2, 'a');
  EXPECT_EQ(kErrorCodeOk, block->send_request(ChannelMessage::make_execute("f", big)));
  // the second one doesn't fit until the first is consumed
  EXPECT_EQ(kErrorCodeTimeout,
    block->send_request(ChannelMessage::make_execute("f", big), 10000));
  ChannelMessage message;
  EXPECT_EQ(kErrorCodeOk, block->receive_request(&message, 1000));
  EXPECT_EQ(kErrorCodeOk,
    block->send_request(ChannelMessage::make_execute("f", big), 10000));

  std::string huge(kCapacity, 'b');
  EXPECT_EQ(kErrorCodeChannelMessageTooLarge,
    block->send_response(ChannelMessage::make_success(huge)));
}

TEST(ChannelTest, Close) {
  registry::ProjectChannel channel("channel_test_close");
  COERCE_ERROR(channel.allocate(kCapacity));
  ChannelBlock* block = channel.get_block();
  EXPECT_EQ(kErrorCodeOk, block->send_request(ChannelMessage::make_stop()));
  block->close();
  EXPECT_EQ(kErrorCodeChannelClosed, block->send_request(ChannelMessage::make_stop()));
  // messages already queued are still delivered
  ChannelMessage message;
  EXPECT_EQ(kErrorCodeOk, block->receive_request(&message));
  EXPECT_EQ(ChannelMessage::kStop, message.type_);
  EXPECT_EQ(kErrorCodeChannelClosed, block->receive_request(&message));
}

TEST(ChannelTest, ReleaseWhileReceiving) {
  std::shared_ptr<registry::ProjectChannel> channel(
    new registry::ProjectChannel("channel_test_release"));
  COERCE_ERROR(channel->allocate(kCapacity));
  EXPECT_FALSE(channel->is_closed());

  // the receiver keeps its own reference, like a caller waiting on a worker
  ErrorCode received = kErrorCodeOk;
  std::shared_ptr<registry::ProjectChannel> receiver_ref = channel;
  std::thread receiver([receiver_ref, &received]() {
    ChannelMessage message;
    ErrorCode code = kErrorCodeTimeout;
    while (code == kErrorCodeTimeout) {
      code = receiver_ref->get_block()->receive_response(&message, 20000ULL);
    }
    received = code;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  channel->release();
  EXPECT_TRUE(channel->is_closed());
  // releasing only closes. the block stays readable for the receiver.
  EXPECT_FALSE(channel->is_null());
  channel.reset();
  receiver.join();
  EXPECT_EQ(kErrorCodeChannelClosed, received);
  EXPECT_TRUE(receiver_ref->is_closed());
  EXPECT_EQ(kErrorCodeChannelClosed, receiver_ref->get_block()->send_request(
    ChannelMessage::make_stop()));
}

TEST(ChannelTest, ForkedPeer) {
  registry::ProjectChannel channel("channel_test_fork");
  COERCE_ERROR(channel.allocate(kCapacity));
  ChannelBlock* block = channel.get_block();
  EXPECT_FALSE(channel.is_ready());

  pid_t pid = ::fork();
  ASSERT_NE(-1, pid);
  if (pid == 0) {
    // echo server until stop
    block->get_ready()->signal();
    while (true) {
      ChannelMessage request;
      if (block->receive_request(&request) != kErrorCodeOk) {
        ::_exit(1);
      }
      if (request.type_ == ChannelMessage::kStop) {
        ::_exit(0);
      }
      ChannelMessage response = ChannelMessage::make_success(request.name_ + ":" + request.body_);
      if (block->send_response(response) != kErrorCodeOk) {
        ::_exit(2);
      }
    }
  }

  EXPECT_TRUE(channel.wait_ready(5000));
  EXPECT_TRUE(channel.is_ready());
  for (int i = 0; i < 20; ++i) {
    EXPECT_EQ(kErrorCodeOk,
      block->send_request(ChannelMessage::make_execute("echo", std::to_string(i))));
    ChannelMessage response;
    EXPECT_EQ(kErrorCodeOk, block->receive_response(&response, 5000000));
    EXPECT_EQ(ChannelMessage::kSuccess, response.type_);
    EXPECT_EQ("echo:" + std::to_string(i), response.body_);
  }
  EXPECT_EQ(kErrorCodeOk, block->send_request(ChannelMessage::make_stop()));
  int status = 0;
  EXPECT_EQ(pid, ::waitpid(pid, &status, 0));
  EXPECT_TRUE(WIFEXITED(status));
  EXPECT_EQ(0, WEXITSTATUS(status));
}

}  // namespace soc
}  // namespace cloudfn

TEST_MAIN_CAPTURE_SIGNALS(ChannelTest, cloudfn.soc);
