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
#ifndef CLOUDFN_SOC_CHANNEL_MESSAGE_HPP_
#define CLOUDFN_SOC_CHANNEL_MESSAGE_HPP_

#include <stdint.h>

#include <iosfwd>
#include <string>

#include "cloudfn/error_code.hpp"
#include "cloudfn/error_stack.hpp"

namespace cloudfn {
namespace soc {
/**
 * @brief One message exchanged between the control plane and a worker.
 * @ingroup SOC
 * @details
 * Requests (control plane to worker) are kStop and kExecute. Responses (worker to control
 * plane) are kSuccess and kError.
 *
 * @par Wire format
 * One type byte, then two fields, each a 4-byte little-endian length followed by the bytes.
 * The meaning of the fields depends on the type:
 *  - kStop: both empty.
 *  - kExecute: name_ is the function name, body_ is the payload.
 *  - kSuccess: name_ is empty, body_ is the result.
 *  - kError: name_ is the error code name (e.g. kErrorCodeWorkerFunctionNotFound), body_ is
 *    the error message.
 */
struct ChannelMessage {
  enum Type {
    kInvalid = 0,
    kStop = 1,
    kExecute = 2,
    kSuccess = 3,
    kError = 4,
  };

  ChannelMessage() : type_(kInvalid) {}
  ChannelMessage(Type type, const std::string& name, const std::string& body)
    : type_(type), name_(name), body_(body) {}

  static ChannelMessage make_stop() { return ChannelMessage(kStop, "", ""); }
  static ChannelMessage make_execute(const std::string& function_name,
                                     const std::string& payload) {
    return ChannelMessage(kExecute, function_name, payload);
  }
  static ChannelMessage make_success(const std::string& result) {
    return ChannelMessage(kSuccess, "", result);
  }
  /** Converts an error to a kError message carrying its name and message text. */
  static ChannelMessage make_error(const ErrorStack& error);

  bool is_request() const { return type_ == kStop || type_ == kExecute; }
  bool is_response() const { return type_ == kSuccess || type_ == kError; }

  /** Serializes this message into bytes. */
  std::string encode() const;
  /**
   * Parses the given bytes.
   * @return kErrorCodeChannelMalformedMessage if the bytes are not a valid message.
   */
  static ErrorCode decode(const std::string& bytes, ChannelMessage* out);

  friend std::ostream& operator<<(std::ostream& o, const ChannelMessage& v);

  Type        type_;
  std::string name_;
  std::string body_;
};

}  // namespace soc
}  // namespace cloudfn
#endif  // CLOUDFN_SOC_CHANNEL_MESSAGE_HPP_
