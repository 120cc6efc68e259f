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
#ifndef CLOUDFN_DEBUGGING_RAW_LOG_HPP_
#define CLOUDFN_DEBUGGING_RAW_LOG_HPP_

#include <glog/logging.h>

#include <sstream>

#include "cloudfn/cxx11.hpp"

namespace cloudfn {
namespace debugging {
/**
 * @brief A LOG()-like stream for code that runs in forked worker processes.
 * @ingroup DEBUGGING
 * @details
 * The control plane forks workers while other threads keep logging, so a forked child may
 * inherit glog's internal locks in the held state. This message formats into its own buffer
 * and hands the text to google::RawLog__(), which takes no lock and writes straight to
 * stderr. Hence it follows FLAGS_logtostderr and FLAGS_stderrthreshold, not the log files.
 * Use it through RAW_LOG_STREAM().
 */
class RawLogMessage CXX11_FINAL {
 public:
  RawLogMessage(LogSeverity severity, const char* file, int line)
    : severity_(severity), file_(file), line_(line) {}
  ~RawLogMessage();

  RawLogMessage() CXX11_FUNC_DELETE;
  RawLogMessage(const RawLogMessage&) CXX11_FUNC_DELETE;
  RawLogMessage& operator=(const RawLogMessage&) CXX11_FUNC_DELETE;

  std::ostream& stream() { return stream_; }

 private:
  const LogSeverity         severity_;
  const char* const         file_;
  const int                 line_;
  std::ostringstream        stream_;
};

}  // namespace debugging
}  // namespace cloudfn

/**
 * @def RAW_LOG_STREAM(severity)
 * @ingroup DEBUGGING
 * @brief Same usage as LOG(severity), but safe in a forked child. FATAL is not supported.
 */
#define RAW_LOG_STREAM(severity) \
  cloudfn::debugging::RawLogMessage(GLOG_ ## severity, __FILE__, __LINE__).stream()

#endif  // CLOUDFN_DEBUGGING_RAW_LOG_HPP_
