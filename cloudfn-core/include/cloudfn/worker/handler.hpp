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
#ifndef CLOUDFN_WORKER_HANDLER_HPP_
#define CLOUDFN_WORKER_HANDLER_HPP_
#include <stdint.h>

#include <memory>
#include <string>

#include "cloudfn/cxx11.hpp"
#include "cloudfn/error_stack.hpp"
#include "cloudfn/worker/fwd.hpp"
#include "cloudfn/worker/function_info.hpp"
#include "cloudfn/worker/native_function_table.hpp"
#include "cloudfn/worker/worker_options.hpp"

namespace cloudfn {
namespace worker {
/**
 * @brief A loaded function, callable with one payload and returning one result.
 * @ingroup WORKER
 * @details
 * Payloads and results are opaque strings, typically JSON documents.
 * invoke() may be called from any thread, but never concurrently for the same worker.
 */
class Handler {
 public:
  virtual ~Handler() {}
  /** Asynchronous handlers run inline on the worker loop, others on the handler pool. */
  virtual bool        is_asynchronous() const = 0;
  virtual ErrorStack  invoke(
    const std::string& payload,
    const ProjectEnvironment& environment,
    std::string* result) = 0;
};

/**
 * @brief Turns a registered function into a Handler.
 * @ingroup WORKER
 */
class HandlerResolver {
 public:
  virtual ~HandlerResolver() {}
  /** @return kErrorCodeWorkerFunctionLoadFailed if the function can't be loaded */
  virtual ErrorStack  resolve(
    const std::string& project,
    const FunctionInfo& function,
    std::shared_ptr<Handler>* out) = 0;
};

/**
 * @brief Runs a function file with the runtime command of the project.
 * @ingroup WORKER
 * @details
 * The payload is written to the child's stdin and the result is its stdout, without one
 * trailing newline. A non-zero exit is an execution error carrying the child's stderr.
 * The project environment and CLOUDFN_* variables are added to the child's environment only.
 */
class SubprocessHandler CXX11_FINAL : public Handler {
 public:
  SubprocessHandler(
    const std::string& command,
    const std::string& project,
    const FunctionInfo& function,
    uint64_t timeout_ms);

  bool        is_asynchronous() const CXX11_OVERRIDE { return asynchronous_; }
  ErrorStack  invoke(
    const std::string& payload,
    const ProjectEnvironment& environment,
    std::string* result) CXX11_OVERRIDE;

  const std::string& get_command() const { return command_; }

 private:
  const std::string command_;
  const std::string project_;
  const std::string function_name_;
  const std::string file_path_;
  const std::string entry_;
  const bool        asynchronous_;
  const uint64_t    timeout_ms_;
};

/**
 * @brief Calls a C++ function registered in a NativeFunctionTable.
 * @ingroup WORKER
 */
class NativeHandler CXX11_FINAL : public Handler {
 public:
  explicit NativeHandler(const NativeFunctionTable::Entry& entry) : entry_(entry) {}

  bool        is_asynchronous() const CXX11_OVERRIDE { return entry_.asynchronous_; }
  ErrorStack  invoke(
    const std::string& payload,
    const ProjectEnvironment& environment,
    std::string* result) CXX11_OVERRIDE;

 private:
  const NativeFunctionTable::Entry entry_;
};

/**
 * @brief Resolves native functions first, then function files via SubprocessHandler.
 * @ingroup WORKER
 */
class DefaultHandlerResolver CXX11_FINAL : public HandlerResolver {
 public:
  /** natives may be null. */
  DefaultHandlerResolver(const WorkerOptions& options, const NativeFunctionTable* natives);

  ErrorStack  resolve(
    const std::string& project,
    const FunctionInfo& function,
    std::shared_ptr<Handler>* out) CXX11_OVERRIDE;

 private:
  const WorkerOptions         options_;
  const NativeFunctionTable*  natives_;
};

}  // namespace worker
}  // namespace cloudfn
#endif  // CLOUDFN_WORKER_HANDLER_HPP_
