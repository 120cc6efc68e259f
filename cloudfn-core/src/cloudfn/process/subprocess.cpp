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
#include "cloudfn/process/subprocess.hpp"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <cstring>
#include <map>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

#include "cloudfn/assorted/assorted_func.hpp"
#include "cloudfn/debugging/raw_log.hpp"

extern char** environ;

namespace cloudfn {
namespace process {

namespace {
std::once_flag ignore_sigpipe_once;

/** Writing to a child that closed its stdin must be an EPIPE, not a SIGPIPE that kills us. */
void ignore_sigpipe() {
  ::signal(SIGPIPE, SIG_IGN);
}

std::vector<std::string> build_environment(const std::map<std::string, std::string>& extra) {
  std::vector<std::string> ret;
  for (char** cur = environ; cur && *cur; ++cur) {
    std::string entry(*cur);
    std::size_t eq = entry.find('=');
    std::string key = eq == std::string::npos ? entry : entry.substr(0, eq);
    if (extra.find(key) == extra.end()) {
      ret.push_back(entry);
    }
  }
  for (std::map<std::string, std::string>::const_iterator it = extra.begin();
      it != extra.end(); ++it) {
    ret.push_back(it->first + "=" + it->second);
  }
  return ret;
}

void close_fd(int* fd) {
  if (*fd >= 0) {
    ::close(*fd);
    *fd = -1;
  }
}

void set_nonblocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}
}  // namespace

std::string SubprocessResult::describe_failure() const {
  std::string err = assorted::trim(stderr_);
  if (!err.empty()) {
    return err;
  }
  std::stringstream str;
  if (signaled_) {
    str << "process " << pid_ << " was killed by signal " << term_signal_;
  } else {
    str << "process " << pid_ << " exited with status " << exit_code_;
  }
  return str.str();
}

std::ostream& operator<<(std::ostream& o, const SubprocessResult& v) {
  o << "<SubprocessResult>"
    << "<pid>" << v.pid_ << "</pid>"
    << "<exit_code>" << v.exit_code_ << "</exit_code>"
    << "<signaled>" << v.signaled_ << "</signaled>"
    << "<term_signal>" << v.term_signal_ << "</term_signal>"
    << "<stdout_size>" << v.stdout_.size() << "</stdout_size>"
    << "<stderr_size>" << v.stderr_.size() << "</stderr_size>"
    << "</SubprocessResult>";
  return o;
}

ErrorStack run_subprocess(const SubprocessRequest& request, SubprocessResult* result) {
  if (request.argv_.empty()) {
    return ERROR_STACK_MSG(kErrorCodeInvalidParameter, "empty argv");
  }
  std::call_once(ignore_sigpipe_once, ignore_sigpipe);
  *result = SubprocessResult();

  // [0] read end, [1] write end
  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (::pipe2(in_pipe, O_CLOEXEC) != 0 || ::pipe2(out_pipe, O_CLOEXEC) != 0
    || ::pipe2(err_pipe, O_CLOEXEC) != 0) {
    std::string msg = assorted::os_error();
    close_fd(&in_pipe[0]); close_fd(&in_pipe[1]);
    close_fd(&out_pipe[0]); close_fd(&out_pipe[1]);
    close_fd(&err_pipe[0]); close_fd(&err_pipe[1]);
    return ERROR_STACK_MSG(kErrorCodeSocPipeFailed, msg.c_str());
  }

  posix_spawn_file_actions_t file_actions;
  ::posix_spawn_file_actions_init(&file_actions);
  ::posix_spawn_file_actions_adddup2(&file_actions, in_pipe[0], STDIN_FILENO);
  ::posix_spawn_file_actions_adddup2(&file_actions, out_pipe[1], STDOUT_FILENO);
  ::posix_spawn_file_actions_adddup2(&file_actions, err_pipe[1], STDERR_FILENO);
  posix_spawnattr_t attr;
  ::posix_spawnattr_init(&attr);
  // the child must not inherit our SIG_IGN of SIGPIPE
  sigset_t default_signals;
  sigemptyset(&default_signals);
  sigaddset(&default_signals, SIGPIPE);
  ::posix_spawnattr_setsigdefault(&attr, &default_signals);
  ::posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGDEF);

  std::vector<char*> argv;
  for (std::size_t i = 0; i < request.argv_.size(); ++i) {
    argv.push_back(const_cast<char*>(request.argv_[i].c_str()));
  }
  argv.push_back(nullptr);
  std::vector<std::string> env_strings = build_environment(request.extra_env_);
  std::vector<char*> envp;
  for (std::size_t i = 0; i < env_strings.size(); ++i) {
    envp.push_back(const_cast<char*>(env_strings[i].c_str()));
  }
  envp.push_back(nullptr);

  pid_t child_pid = 0;
  int spawn_ret;
  if (request.search_path_) {
    spawn_ret = ::posix_spawnp(&child_pid, argv[0], &file_actions, &attr, &argv[0], &envp[0]);
  } else {
    spawn_ret = ::posix_spawn(&child_pid, argv[0], &file_actions, &attr, &argv[0], &envp[0]);
  }
  ::posix_spawn_file_actions_destroy(&file_actions);
  ::posix_spawnattr_destroy(&attr);
  close_fd(&in_pipe[0]);
  close_fd(&out_pipe[1]);
  close_fd(&err_pipe[1]);
  if (spawn_ret != 0) {
    close_fd(&in_pipe[1]);
    close_fd(&out_pipe[0]);
    close_fd(&err_pipe[0]);
    std::string msg = request.argv_[0] + ": " + assorted::os_error(spawn_ret);
    return ERROR_STACK_MSG(kErrorCodeSocSpawnFailed, msg.c_str());
  }
  result->pid_ = child_pid;
  RAW_LOG_STREAM(INFO) << "Spawned " << request.argv_[0] << ", pid=" << child_pid;

  set_nonblocking(in_pipe[1]);
  set_nonblocking(out_pipe[0]);
  set_nonblocking(err_pipe[0]);
  std::size_t stdin_written = 0;
  if (request.stdin_data_.empty()) {
    close_fd(&in_pipe[1]);
  }

  const uint64_t start_ms = assorted::get_now_microsec() / 1000ULL;
  bool timed_out = false;
  char buffer[1 << 12];
  while (out_pipe[0] >= 0 || err_pipe[0] >= 0 || in_pipe[1] >= 0) {
    struct pollfd fds[3];
    int nfds = 0;
    int* owners[3];
    if (in_pipe[1] >= 0) {
      fds[nfds].fd = in_pipe[1];
      fds[nfds].events = POLLOUT;
      owners[nfds++] = &in_pipe[1];
    }
    if (out_pipe[0] >= 0) {
      fds[nfds].fd = out_pipe[0];
      fds[nfds].events = POLLIN;
      owners[nfds++] = &out_pipe[0];
    }
    if (err_pipe[0] >= 0) {
      fds[nfds].fd = err_pipe[0];
      fds[nfds].events = POLLIN;
      owners[nfds++] = &err_pipe[0];
    }

    int poll_timeout = -1;
    if (request.timeout_ms_ > 0) {
      uint64_t elapsed = assorted::get_now_microsec() / 1000ULL - start_ms;
      if (elapsed >= request.timeout_ms_) {
        timed_out = true;
        break;
      }
      poll_timeout = static_cast<int>(request.timeout_ms_ - elapsed);
    }
    int poll_ret = ::poll(fds, nfds, poll_timeout);
    if (poll_ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      RAW_LOG_STREAM(ERROR) << "poll() failed while talking to pid " << child_pid << ": "
        << assorted::os_error();
      break;
    }
    for (int i = 0; i < nfds; ++i) {
      if (fds[i].revents == 0) {
        continue;
      }
      if (owners[i] == &in_pipe[1]) {
        if (fds[i].revents & (POLLERR | POLLHUP)) {
          close_fd(&in_pipe[1]);  // the child doesn't read stdin
          continue;
        }
        ssize_t w = ::write(in_pipe[1], request.stdin_data_.data() + stdin_written,
                            request.stdin_data_.size() - stdin_written);
        if (w > 0) {
          stdin_written += static_cast<std::size_t>(w);
        } else if (w < 0 && errno != EAGAIN && errno != EINTR) {
          close_fd(&in_pipe[1]);
          continue;
        }
        if (stdin_written >= request.stdin_data_.size()) {
          close_fd(&in_pipe[1]);
        }
      } else {
        std::string* dest = (owners[i] == &out_pipe[0]) ? &result->stdout_ : &result->stderr_;
        ssize_t r = ::read(*owners[i], buffer, sizeof(buffer));
        if (r > 0) {
          dest->append(buffer, static_cast<std::size_t>(r));
        } else if (r == 0 || (errno != EAGAIN && errno != EINTR)) {
          close_fd(owners[i]);
        }
      }
    }
  }

  if (timed_out) {
    RAW_LOG_STREAM(WARNING) << "Killing pid " << child_pid << " (" << request.argv_[0] << ") after "
      << request.timeout_ms_ << " ms";
    ::kill(child_pid, SIGKILL);
  }
  close_fd(&in_pipe[1]);
  close_fd(&out_pipe[0]);
  close_fd(&err_pipe[0]);

  int status = 0;
  pid_t wait_ret;
  do {
    wait_ret = ::waitpid(child_pid, &status, 0);
  } while (wait_ret == -1 && errno == EINTR);
  if (wait_ret == child_pid) {
    if (WIFEXITED(status)) {
      result->exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      result->signaled_ = true;
      result->term_signal_ = WTERMSIG(status);
    }
  } else {
    RAW_LOG_STREAM(ERROR) << "waitpid() for pid " << child_pid << " failed: "
      << assorted::os_error();
    result->exit_code_ = -1;
  }

  if (timed_out) {
    std::stringstream msg;
    msg << request.argv_[0] << " did not finish in " << request.timeout_ms_ << " ms";
    return ERROR_STACK_MSG(kErrorCodeTimeout, msg.str().c_str());
  }
  return kRetOk;
}

ErrorStack run_shell_command(
  const std::string& command,
  const std::map<std::string, std::string>& extra_env,
  uint64_t timeout_ms,
  SubprocessResult* result) {
  SubprocessRequest request;
  request.argv_.push_back("/bin/sh");
  request.argv_.push_back("-c");
  request.argv_.push_back(command);
  request.search_path_ = false;
  request.extra_env_ = extra_env;
  request.timeout_ms_ = timeout_ms;
  return run_subprocess(request, result);
}

}  // namespace process
}  // namespace cloudfn
