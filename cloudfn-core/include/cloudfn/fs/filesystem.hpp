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
#ifndef CLOUDFN_FS_FILESYSTEM_HPP_
#define CLOUDFN_FS_FILESYSTEM_HPP_
#include <stdint.h>

#include <string>

#include "cloudfn/fs/path.hpp"

/**
 * @defgroup FILESYSTEM Filesystem wrapper
 * @brief Analogue of boost::filesystem.
 * @details
 * We don't use boost::filesystem because we want to minimize dependencies. The C++17
 * std::filesystem is not an option either as we stick to C++11.
 * These functions return bool or a special value rather than ErrorStack. The caller
 * converts a failure into an ErrorStack with the right context.
 */

namespace cloudfn {
namespace fs {
/**
 * @brief Analogue of boost::filesystem::file_type.
 * @ingroup FILESYSTEM
 */
enum FileType {
  kStatusError = 0,
  kFileNotFound,
  kRegularFile,
  kDirectoryFile,
  kTypeUnknown,
};

/**
 * @brief Analogue of boost::filesystem::file_status.
 * @ingroup FILESYSTEM
 */
struct FileStatus {
  FileStatus() : type_(kStatusError) {}
  explicit FileStatus(FileType type) : type_(type) {}

  bool exists() const             { return type_ != kStatusError && type_ != kFileNotFound; }
  bool is_regular_file() const    { return type_ == kRegularFile; }
  bool is_directory() const       { return type_ == kDirectoryFile; }

  FileType        type_;
};

/**
 * Returns the status of the file.
 * @ingroup FILESYSTEM
 */
FileStatus  status(const Path& p);
/** @ingroup FILESYSTEM */
inline bool exists(const Path& p) {return status(p).exists(); }
/** @ingroup FILESYSTEM */
inline bool is_directory(const Path& p) {return status(p).is_directory(); }
/** @ingroup FILESYSTEM */
inline bool is_regular_file(const Path& p) {return status(p).is_regular_file(); }

/** @ingroup FILESYSTEM */
Path        current_path();
/** @ingroup FILESYSTEM */
Path        home_path();

/**
 * Recursive mkdir (mkdirs).
 * @param[in] p path of the directory to create
 * @param[in] sync (optional, default false) wheter to call fsync() on the created directories
 * and their parents.
 * @return whether the directory already exists or creation whatever required succeeded
 * @ingroup FILESYSTEM
 */
bool        create_directories(const Path& p, bool sync = false);
/** Non-recursive mkdir. @ingroup FILESYSTEM */
bool        create_directory(const Path& p, bool sync = false);
/** Returns size of the file, or static_cast<uint64_t>(-1) if not a regular file. */
uint64_t    file_size(const Path& p);
/** Deletes a regular file or an empty directory. @ingroup FILESYSTEM */
bool        remove(const Path& p);
/** Recursively deletes a directory. Returns the number of deleted entries. */
uint64_t    remove_all(const Path& p);

/**
 * @brief Returns a randomly generated name, eg "%%%%-%%%%-%%%%-%%%%" with each % replaced by
 * a hex digit.
 * @param[in] model the template
 * @param[in] differentiator additional seed to make the name unique across processes.
 * @ingroup FILESYSTEM
 */
std::string unique_name(const std::string& model, uint64_t differentiator = 0);

/**
 * Makes the content and/or directory entry of the given file durable.
 * @ingroup FILESYSTEM
 */
bool        fsync(const Path& path, bool sync_parent_directory = false);

/** rename(2). Atomic within one filesystem. @ingroup FILESYSTEM */
bool        atomic_rename(const Path& old_path, const Path& new_path);

/**
 * fsync() on the old file, atomic_rename(), and then fsync() on the parent directory.
 * @ingroup FILESYSTEM
 */
bool        durable_atomic_rename(const Path& old_path, const Path& new_path);

/**
 * Reads the whole content of a regular file.
 * @ingroup FILESYSTEM
 */
bool        read_file(const Path& path, std::string* content);

/**
 * Writes the content to a temporary file beside the path, then durable_atomic_rename() it.
 * Readers never see a half-written file.
 * @ingroup FILESYSTEM
 */
bool        durable_write_file(const Path& path, const std::string& content);

}  // namespace fs
}  // namespace cloudfn
#endif  // CLOUDFN_FS_FILESYSTEM_HPP_
