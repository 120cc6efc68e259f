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
#include "cloudfn/assorted/assorted_func.hpp"

#include <errno.h>
#include <time.h>
#include <unistd.h>

#include <chrono>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <mutex>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace cloudfn {
namespace assorted {

std::string replace_all(const std::string& target, const std::string& search,
               const std::string& replacement) {
  if (search.empty()) {
    return target;
  }
  std::string subject = target;
  std::size_t pos = 0;
  while ((pos = subject.find(search, pos)) != std::string::npos) {
    subject.replace(pos, search.size(), replacement);
    pos += replacement.size();
  }
  return subject;
}

std::string replace_all(const std::string& target, const std::string& search,
               int replacement) {
  std::stringstream str;
  str << replacement;
  return replace_all(target, search, str.str());
}

std::string os_error() {
  return os_error(errno);
}

std::string os_error(int error_number) {
  if (error_number == 0) {
    return "[No Error]";
  }
  char buf[256];
  buf[0] = '\0';
  // GNU strerror_r returns a pointer that might not be buf.
  const char* message = ::strerror_r(error_number, buf, sizeof(buf));
  std::stringstream str;
  str << "[Errno " << error_number << "] " << message;
  return str.str();
}

std::string get_current_executable_path() {
  char buf[1024];
  ssize_t len = ::readlink("/proc/self/exe", buf, sizeof(buf));
  if (len == -1) {
    std::cerr << "Failed to get the path of current executable. error=" << os_error() << std::endl;
    return "";
  }
  return std::string(buf, len);
}

std::string trim(const std::string& str) {
  const char* kSpaces = " \t\r\n";
  std::size_t begin = str.find_first_not_of(kSpaces);
  if (begin == std::string::npos) {
    return "";
  }
  std::size_t end = str.find_last_not_of(kSpaces);
  return str.substr(begin, end - begin + 1);
}

std::vector<std::string> split(const std::string& str, char delimiter) {
  std::vector<std::string> tokens;
  std::size_t begin = 0;
  while (true) {
    std::size_t pos = str.find(delimiter, begin);
    if (pos == std::string::npos) {
      tokens.push_back(str.substr(begin));
      break;
    }
    tokens.push_back(str.substr(begin, pos - begin));
    begin = pos + 1;
  }
  return tokens;
}

bool starts_with(const std::string& str, const std::string& prefix) {
  return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& str, const std::string& suffix) {
  return str.size() >= suffix.size()
    && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

uint64_t get_now_microsec() {
  std::chrono::system_clock::time_point now = std::chrono::system_clock::now();
  return std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();
}

std::string format_iso8601(uint64_t epoch_microsec) {
  time_t seconds = static_cast<time_t>(epoch_microsec / 1000000ULL);
  uint32_t micros = static_cast<uint32_t>(epoch_microsec % 1000000ULL);
  struct tm parts;
  ::gmtime_r(&seconds, &parts);
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06uZ",
    parts.tm_year + 1900, parts.tm_mon + 1, parts.tm_mday,
    parts.tm_hour, parts.tm_min, parts.tm_sec, micros);
  return buf;
}

bool parse_iso8601(const std::string& str, uint64_t* epoch_microsec) {
  struct tm parts;
  std::memset(&parts, 0, sizeof(parts));
  int consumed = 0;
  if (std::sscanf(str.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
      &parts.tm_year, &parts.tm_mon, &parts.tm_mday,
      &parts.tm_hour, &parts.tm_min, &parts.tm_sec, &consumed) != 6) {
    return false;
  }
  uint64_t micros = 0;
  std::size_t pos = consumed;
  if (pos < str.size() && str[pos] == '.') {
    ++pos;
    uint64_t scale = 100000ULL;
    while (pos < str.size() && str[pos] >= '0' && str[pos] <= '9') {
      micros += (str[pos] - '0') * scale;
      scale /= 10ULL;
      ++pos;
    }
  }
  parts.tm_year -= 1900;
  parts.tm_mon -= 1;
  time_t seconds = ::timegm(&parts);
  if (seconds == static_cast<time_t>(-1)) {
    return false;
  }
  *epoch_microsec = static_cast<uint64_t>(seconds) * 1000000ULL + micros;
  return true;
}

std::string generate_uuid() {
  static std::mutex rnd_mutex;
  static std::mt19937_64 rnd(std::random_device{}());
  uint64_t high;
  uint64_t low;
  {
    std::lock_guard<std::mutex> guard(rnd_mutex);
    high = rnd();
    low = rnd();
  }
  high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
  low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // RFC 4122 variant
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
    static_cast<uint32_t>(high >> 32),
    static_cast<uint32_t>((high >> 16) & 0xFFFFU),
    static_cast<uint32_t>(high & 0xFFFFU),
    static_cast<uint32_t>(low >> 48),
    static_cast<unsigned long long>(low & 0xFFFFFFFFFFFFULL));  // NOLINT(runtime/int)
  return buf;
}

void spinlock_yield() {
  std::this_thread::yield();
}

}  // namespace assorted
}  // namespace cloudfn
