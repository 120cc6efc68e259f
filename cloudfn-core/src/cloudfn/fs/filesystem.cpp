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
#include "cloudfn/fs/filesystem.hpp"

#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <stdint.h>
#include <stdlib.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "cloudfn/fs/path.hpp"

namespace cloudfn {
namespace fs {
FileStatus status(const Path& p) {
  struct stat path_stat;
  int ret = ::stat(p.c_str(), &path_stat);
  if (ret != 0) {
    // This is quite normal as we use this to check if a file exists. No message for it.
    if (errno == ENOENT || errno == ENOTDIR) {
      return FileStatus(kFileNotFound);
    }
    return FileStatus(kStatusError);
  } else if (S_ISDIR(path_stat.st_mode)) {
    return FileStatus(kDirectoryFile);
  } else if (S_ISREG(path_stat.st_mode)) {
    return FileStatus(kRegularFile);
  }
  return FileStatus(kTypeUnknown);
}

Path current_path() {
  Path cur;
  for (size_t path_max = 128; path_max < (1U << 20); path_max *= 2) {
    std::vector<char> buf(path_max);
    if (::getcwd(&buf[0], path_max) != 0) {
      cur = Path(std::string(&buf[0]));
      break;
    } else if (errno != ERANGE) {
      break;
    }
  }
  return cur;
}

Path home_path() {
  const char *home = ::getenv("HOME");
  if (home) {
    return Path(std::string(home));
  } else {
    return Path();
  }
}

bool create_directories(const Path& p, bool sync) {
  if (exists(p)) {
    return true;
  }
  if (create_directory(p, sync)) {
    return true;
  }
  // if failed, create parent then try again
  Path parent = p.parent_path();
  if (parent.empty()) {
    return false;
  }
  if (!create_directories(parent, sync) && !exists(parent)) {
    return false;
  }
  // another process might have created it concurrently
  return create_directory(p, sync) || is_directory(p);
}

bool create_directory(const Path& p, bool sync) {
  int ret = ::mkdir(p.c_str(), S_IRWXU);
  if (ret != 0) {
    return false;
  }
  if (sync) {
    return fsync(p, true);
  } else {
    return true;
  }
}

uint64_t file_size(const Path& p) {
  struct stat path_stat;
  int ret = ::stat(p.c_str(), &path_stat);
  if (ret != 0 || !S_ISREG(path_stat.st_mode)) {
    return static_cast<uint64_t>(-1);
  }
  return static_cast<uint64_t>(path_stat.st_size);
}

bool remove(const Path& p) {
  FileStatus s = status(p);
  if (!s.exists()) {
    return false;
  } else if (s.is_directory()) {
    return ::rmdir(p.c_str()) == 0;
  } else {
    return ::unlink(p.c_str()) == 0;
  }
}

uint64_t remove_all(const Path& p) {
  uint64_t count = 1;
  std::vector< Path > child_paths = p.child_paths();
  for (const Path& child : child_paths) {
    count += remove_all(child);
  }
  remove(p);
  return count;
}

std::string unique_name(const std::string& model, uint64_t differentiator) {
  const char* kHexChars = "0123456789abcdef";
  uint64_t seed64 = std::chrono::high_resolution_clock::now().time_since_epoch().count();
  seed64 += ::getpid();
  seed64 ^= differentiator;
  uint32_t seed32 = (seed64 >> 32) ^ seed64;
  std::string s(model);
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '%') {
      seed32 = ::rand_r(&seed32);
      s[i] = kHexChars[seed32 & 0xf];
    }
  }
  return s;
}

bool atomic_rename(const Path& old_path, const Path& new_path) {
  return ::rename(old_path.c_str(), new_path.c_str()) == 0;
}

bool fsync(const Path& path, bool sync_parent_directory) {
  int descriptor = ::open(path.c_str(), O_RDONLY);
  if (descriptor < 0) {
    return false;
  }
  int sync_ret = ::fsync(descriptor);
  ::close(descriptor);
  if (sync_ret != 0) {
    return false;
  }

  if (sync_parent_directory && !path.parent_path().empty()) {
    return fsync(path.parent_path(), false);
  }
  return true;
}

bool durable_atomic_rename(const Path& old_path, const Path& new_path) {
  if (!fsync(old_path, false)) {
    return false;
  }
  if (!atomic_rename(old_path, new_path)) {
    return false;
  }
  return fsync(new_path.parent_path(), false);
}

bool read_file(const Path& path, std::string* content) {
  std::ifstream in(path.c_str(), std::ios::in | std::ios::binary);
  if (!in.is_open()) {
    return false;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return false;
  }
  *content = buffer.str();
  return true;
}

bool durable_write_file(const Path& path, const std::string& content) {
  Path tmp_path(path);
  tmp_path += ".";
  tmp_path += unique_name("%%%%%%%%");
  tmp_path += ".tmp";
  {
    std::ofstream out(tmp_path.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      return false;
    }
    out << content;
    out.flush();
    if (!out.good()) {
      out.close();
      remove(tmp_path);
      return false;
    }
  }
  if (!durable_atomic_rename(tmp_path, path)) {
    remove(tmp_path);
    return false;
  }
  return true;
}

}  // namespace fs
}  // namespace cloudfn
