/*
 *    Copyright (C) 2026 The cowcopy authors
 *
 *    This file is part of cowcopy.
 *
 *    cowcopy is free software: you can redistribute it and/or modify
 *    it under the terms of the GNU General Public License as published by
 *    the Free Software Foundation, either version 3 of the License, or
 *    (at your option) any later version.
 *
 *    cowcopy is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    GNU General Public License for more details.
 *
 *    You should have received a copy of the GNU General Public License
 *    along with cowcopy.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <boost/filesystem.hpp>
namespace fs = boost::filesystem;

extern "C" {
	#include <sys/stat.h>
	#include <sys/types.h>
}

/**
 * @brief Owning wrapper around an open file descriptor. Remembers the path
 * it was opened from so errors can name the file.
 *
 */
class FileDescriptor {
public:
	/**
	 * @brief Construct an empty File Descriptor object
	 *
	 */
	FileDescriptor(void);
	/**
	 * @brief Take ownership of an already open descriptor
	 *
	 * @param fd Open file descriptor, closed on destruction
	 * @param path Path used in error messages
	 */
	FileDescriptor(int fd, const fs::path &path);
	FileDescriptor(const FileDescriptor &) = delete;
	FileDescriptor &operator=(const FileDescriptor &) = delete;
	FileDescriptor(FileDescriptor &&other);
	FileDescriptor &operator=(FileDescriptor &&other);
	/**
	 * @brief Destroy the File Descriptor object, closing the descriptor.
	 * A failed close() is logged as a warning.
	 *
	 */
	~FileDescriptor(void);
	/**
	 * @brief Open path with open(2)
	 *
	 * @param path File to open
	 * @param flags open(2) flags, O_CLOEXEC is always added
	 * @param mode Mode when creating
	 * @return FileDescriptor
	 */
	static FileDescriptor open(const fs::path &path, int flags, mode_t mode = 0);
	/**
	 * @brief Open path read only
	 *
	 * @param path
	 * @return FileDescriptor
	 */
	static FileDescriptor open_read(const fs::path &path);
	/**
	 * @brief Create or truncate path for writing
	 *
	 * @param path
	 * @param mode Mode if the file is created, before umask
	 * @return FileDescriptor
	 */
	static FileDescriptor create(const fs::path &path, mode_t mode = 0666);
	/**
	 * @brief Get the raw descriptor
	 *
	 * @return int
	 */
	int get(void) const;
	/**
	 * @brief Get the path the descriptor was opened with
	 *
	 * @return const fs::path&
	 */
	const fs::path &path(void) const;
	/**
	 * @brief Check whether this object holds a descriptor
	 *
	 * @return true
	 * @return false
	 */
	bool is_open(void) const;
	/**
	 * @brief fstat() the descriptor
	 *
	 * @return struct stat
	 */
	struct stat stat(void) const;
	/**
	 * @brief Logical length of the file
	 *
	 * @return uintmax_t st_size from fstat()
	 */
	uintmax_t size(void) const;
	/**
	 * @brief Close the descriptor, throwing on failure.
	 *
	 */
	void close(void);
private:
	int fd_;        ///< Owned descriptor, -1 when empty
	fs::path path_; ///< Path given at open time
};
