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
#include "cloudfn/task/cron_expression.hpp"

#include <ctype.h>
#include <stdlib.h>

#include <ostream>
#include <sstream>
#include <string>
#include <vector>

#include "cloudfn/error_code.hpp"
#include "cloudfn/assorted/assorted_func.hpp"

namespace cloudfn {
namespace task {
namespace {
const char* const kMonthNames[] = {
  "jan", "feb", "mar", "apr", "may", "jun", "jul", "aug", "sep", "oct", "nov", "dec",
  CXX11_NULLPTR
};
const char* const kDayNames[] = {
  "sun", "mon", "tue", "wed", "thu", "fri", "sat", CXX11_NULLPTR
};

/** Iterations of next_after(). Each one advances at least a minute, usually a day or more. */
const int kMaxSearchSteps = 200000;

std::string expand_shortcut(const std::string& text) {
  if (text == "@yearly" || text == "@annually") {
    return "0 0 1 1 *";
  } else if (text == "@monthly") {
    return "0 0 1 * *";
  } else if (text == "@weekly") {
    return "0 0 * * 0";
  } else if (text == "@daily" || text == "@midnight") {
    return "0 0 * * *";
  } else if (text == "@hourly") {
    return "0 * * * *";
  }
  return text;
}

std::string to_lower(const std::string& str) {
  std::string ret(str);
  for (size_t i = 0; i < ret.size(); ++i) {
    ret[i] = static_cast<char>(::tolower(static_cast<unsigned char>(ret[i])));
  }
  return ret;
}

bool parse_number(const std::string& token, int* out) {
  if (token.empty() || token.size() > 4) {
    return false;
  }
  for (size_t i = 0; i < token.size(); ++i) {
    if (!::isdigit(static_cast<unsigned char>(token[i]))) {
      return false;
    }
  }
  *out = ::atoi(token.c_str());
  return true;
}
}  // namespace

CronExpression::CronExpression()
  : minutes_(0), hours_(0), days_of_month_(0), months_(0), days_of_week_(0),
    day_of_month_restricted_(false), day_of_week_restricted_(false) {
}

bool CronExpression::parse_value(
  const std::string& token,
  int min_value,
  int max_value,
  const char* const* names,
  int* out) {
  if (names) {
    std::string lowered = to_lower(token);
    for (int i = 0; names[i]; ++i) {
      if (lowered == names[i]) {
        *out = min_value + i;
        return true;
      }
    }
  }
  int value;
  if (!parse_number(token, &value) || value < min_value || value > max_value) {
    return false;
  }
  *out = value;
  return true;
}

bool CronExpression::parse_field(
  const std::string& field,
  int min_value,
  int max_value,
  const char* const* names,
  uint64_t* mask) {
  *mask = 0;
  std::vector<std::string> parts = assorted::split(field, ',');
  if (parts.empty()) {
    return false;
  }
  for (const std::string& part : parts) {
    std::string range = part;
    int step = 1;
    bool has_step = false;
    size_t slash = part.find('/');
    if (slash != std::string::npos) {
      range = part.substr(0, slash);
      if (!parse_number(part.substr(slash + 1), &step) || step == 0 || step > max_value) {
        return false;
      }
      has_step = true;
    }

    int low;
    int high;
    size_t dash = range.find('-');
    if (range == "*") {
      low = min_value;
      high = max_value;
    } else if (dash != std::string::npos && dash > 0) {
      if (!parse_value(range.substr(0, dash), min_value, max_value, names, &low)
        || !parse_value(range.substr(dash + 1), min_value, max_value, names, &high)) {
        return false;
      }
    } else {
      if (!parse_value(range, min_value, max_value, names, &low)) {
        return false;
      }
      // "a/n" means every n-th from a
      high = has_step ? max_value : low;
    }
    if (low > high) {
      return false;
    }
    for (int v = low; v <= high; v += step) {
      *mask |= (1ULL << v);
    }
  }
  return *mask != 0;
}

ErrorStack CronExpression::parse(const std::string& text, CronExpression* out) {
  std::string expanded = expand_shortcut(to_lower(assorted::trim(text)));
  std::istringstream stream(expanded);
  std::vector<std::string> fields;
  std::string field;
  while (stream >> field) {
    fields.push_back(field);
  }
  if (fields.size() != 5U) {
    std::string message = "expected 5 fields: '" + text + "'";
    return ERROR_STACK_MSG(kErrorCodeCronInvalidExpression, message.c_str());
  }

  CronExpression tmp;
  tmp.text_ = assorted::trim(text);
  uint64_t mask;
  const char* kFieldNames[] = {"minute", "hour", "day of month", "month", "day of week"};
  const int kMins[] = {0, 0, 1, 1, 0};
  const int kMaxs[] = {59, 23, 31, 12, 7};
  const char* const* kNames[] = {
    CXX11_NULLPTR, CXX11_NULLPTR, CXX11_NULLPTR, kMonthNames, kDayNames
  };
  for (int i = 0; i < 5; ++i) {
    if (!parse_field(fields[i], kMins[i], kMaxs[i], kNames[i], &mask)) {
      std::string message = std::string("invalid ") + kFieldNames[i] + " '" + fields[i]
        + "' in '" + text + "'";
      return ERROR_STACK_MSG(kErrorCodeCronInvalidExpression, message.c_str());
    }
    switch (i) {
    case 0: tmp.minutes_ = mask; break;
    case 1: tmp.hours_ = static_cast<uint32_t>(mask); break;
    case 2: tmp.days_of_month_ = static_cast<uint32_t>(mask); break;
    case 3: tmp.months_ = static_cast<uint32_t>(mask); break;
    default:
      if (mask & (1ULL << 7)) {
        mask = (mask | 1ULL) & ~(1ULL << 7);
      }
      tmp.days_of_week_ = static_cast<uint32_t>(mask);
      break;
    }
  }
  tmp.day_of_month_restricted_ = fields[2][0] != '*';
  tmp.day_of_week_restricted_ = fields[4][0] != '*';
  *out = tmp;
  return kRetOk;
}

bool CronExpression::matches_day(const struct tm& local) const {
  bool dom = (days_of_month_ & (1U << local.tm_mday)) != 0;
  bool dow = (days_of_week_ & (1U << local.tm_wday)) != 0;
  if (day_of_month_restricted_ && day_of_week_restricted_) {
    return dom || dow;
  }
  return dom && dow;
}

bool CronExpression::matches(const struct tm& local) const {
  return (minutes_ & (1ULL << local.tm_min)) != 0
    && (hours_ & (1U << local.tm_hour)) != 0
    && (months_ & (1U << (local.tm_mon + 1))) != 0
    && matches_day(local);
}

bool CronExpression::next_after(time_t after, time_t* out) const {
  if (minutes_ == 0) {
    return false;  // not parsed
  }
  struct tm local;
  ::localtime_r(&after, &local);
  local.tm_sec = 0;
  local.tm_min += 1;
  local.tm_isdst = -1;
  time_t current = ::mktime(&local);

  for (int step = 0; step < kMaxSearchSteps; ++step) {
    ::localtime_r(&current, &local);
    if ((months_ & (1U << (local.tm_mon + 1))) == 0) {
      local.tm_mon += 1;
      local.tm_mday = 1;
      local.tm_hour = 0;
      local.tm_min = 0;
    } else if (!matches_day(local)) {
      local.tm_mday += 1;
      local.tm_hour = 0;
      local.tm_min = 0;
    } else if ((hours_ & (1U << local.tm_hour)) == 0) {
      local.tm_hour += 1;
      local.tm_min = 0;
    } else if ((minutes_ & (1ULL << local.tm_min)) == 0) {
      local.tm_min += 1;
    } else {
      *out = current;
      return true;
    }
    local.tm_sec = 0;
    local.tm_isdst = -1;
    time_t next = ::mktime(&local);
    // daylight saving transitions may map back
    current = next > current ? next : current + 60;
  }
  return false;
}

std::ostream& operator<<(std::ostream& o, const CronExpression& v) {
  o << "<CronExpression>" << v.text_ << "</CronExpression>";
  return o;
}

}  // namespace task
}  // namespace cloudfn
