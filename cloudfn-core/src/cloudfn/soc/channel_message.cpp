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
#include "cloudfn/soc/channel_message.hpp"

#include <ostream>
#include <string>

namespace cloudfn {
namespace soc {

namespace {
void append_field(const std::string& field, std::string* out) {
  uint32_t len = static_cast<uint32_t>(field.size());
  for (int i = 0; i < 4; ++i) {
    out->push_back(static_cast<char>((len >> (8 * i)) & 0xFFU));
  }
  out->append(field);
}

bool read_field(const std::string& bytes, uint64_t* pos, std::string* field) {
  if (*pos + 4ULL > bytes.size()) {
    return false;
  }
  uint32_t len = 0;
  for (int i = 0; i < 4; ++i) {
    len |= static_cast<uint32_t>(static_cast<unsigned char>(bytes[*pos + i])) << (8 * i);
  }
  *pos += 4ULL;
  if (*pos + len > bytes.size()) {
    return false;
  }
  field->assign(bytes, *pos, len);
  *pos += len;
  return true;
}
}  // namespace

ChannelMessage ChannelMessage::make_error(const ErrorStack& error) {
  const char* message = error.get_custom_message();
  if (message == CXX11_NULLPTR || message[0] == '\0') {
    message = error.get_message();
  }
  return ChannelMessage(kError, get_error_name(error.get_error_code()), message);
}

std::string ChannelMessage::encode() const {
  std::string out;
  out.reserve(9 + name_.size() + body_.size());
  out.push_back(static_cast<char>(type_));
  append_field(name_, &out);
  append_field(body_, &out);
  return out;
}

ErrorCode ChannelMessage::decode(const std::string& bytes, ChannelMessage* out) {
  if (bytes.empty()) {
    return kErrorCodeChannelMalformedMessage;
  }
  int type = static_cast<unsigned char>(bytes[0]);
  if (type < kStop || type > kError) {
    return kErrorCodeChannelMalformedMessage;
  }
  uint64_t pos = 1;
  ChannelMessage tmp;
  tmp.type_ = static_cast<Type>(type);
  if (!read_field(bytes, &pos, &tmp.name_) || !read_field(bytes, &pos, &tmp.body_)) {
    return kErrorCodeChannelMalformedMessage;
  }
  if (pos != bytes.size()) {
    return kErrorCodeChannelMalformedMessage;
  }
  *out = tmp;
  return kErrorCodeOk;
}

std::ostream& operator<<(std::ostream& o, const ChannelMessage& v) {
  o << "<ChannelMessage type=\"";
  switch (v.type_) {
  case ChannelMessage::kStop: o << "stop"; break;
  case ChannelMessage::kExecute: o << "execute"; break;
  case ChannelMessage::kSuccess: o << "success"; break;
  case ChannelMessage::kError: o << "error"; break;
  default: o << "invalid"; break;
  }
  o << "\" name=\"" << v.name_ << "\" body_size=\"" << v.body_.size() << "\" />";
  return o;
}

}  // namespace soc
}  // namespace cloudfn
