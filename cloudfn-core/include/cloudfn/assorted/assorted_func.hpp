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
#ifndef CLOUDFN_ASSORTED_ASSORTED_FUNC_HPP_
#define CLOUDFN_ASSORTED_ASSORTED_FUNC_HPP_

#include <stdint.h>

#include <iosfwd>
#include <string>
#include <vector>

namespace cloudfn {
namespace assorted {

/**
 * Replaces all occurences of "search" with "replacement" in "target".
 * @ingroup ASSORTED
 */
std::string replace_all(const std::string& target, const std::string& search,
               const std::string& replacement);
/**
 * Overload of replace_all() that takes an integer replacement.
 * @ingroup ASSORTED
 */
std::string replace_all(const std::string& target, const std::string& search,
               int replacement);

/**
 * @brief Thread-safe strerror(errno). We might do some trick here for portability, too.
 * @ingroup ASSORTED
 */
std::string os_error();

/**
 * @brief This version receives errno.
 * @ingroup ASSORTED
 */
std::string os_error(int error_number);

/**
 * @brief Returns the full path of current executable.
 * @ingroup ASSORTED
 */
std::string get_current_executable_path();

/** Removes leading and trailing whitespaces. */
std::string trim(const std::string& str);

/** Splits the string by the delimiter. Empty tokens are kept. */
std::vector<std::string> split(const std::string& str, char delimiter);

/** Returns if str begins with prefix. */
bool        starts_with(const std::string& str, const std::string& prefix);

/** Returns if str ends with suffix. */
bool        ends_with(const std::string& str, const std::string& suffix);

/** Current wall-clock time in microseconds since the epoch. */
uint64_t    get_now_microsec();

/**
 * @brief Formats a wall-clock time as ISO-8601 in UTC, eg "2026-10-18T07:12:00.123456Z".
 * @ingroup ASSORTED
 */
std::string format_iso8601(uint64_t epoch_microsec);

/**
 * @brief Parses what format_iso8601() produced. Fractional seconds and the trailing 'Z'
 * are optional.
 * @return whether the string was parsed
 * @ingroup ASSORTED
 */
bool        parse_iso8601(const std::string& str, uint64_t* epoch_microsec);

/**
 * @brief Generates a random (version 4) UUID in the canonical 8-4-4-4-12 hex format.
 * @ingroup ASSORTED
 */
std::string generate_uuid();

/**
 * @brief Yields the processor in a spin loop.
 * @ingroup ASSORTED
 */
void        spinlock_yield();

}  // namespace assorted
}  // namespace cloudfn

#endif  // CLOUDFN_ASSORTED_ASSORTED_FUNC_HPP_
