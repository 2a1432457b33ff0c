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

#include "fileDescriptor.hpp"
#include "alert.hpp"
#include "errors.hpp"

#include <cstring>
#include <utility>

extern "C" {
	#include <fcntl.h>
	#include <unistd.h>
}

FileDescriptor::FileDescriptor(void) : fd_(-1), path_() {}

FileDescriptor::FileDescriptor(int fd, const fs::path &path) : fd_(fd), path_(path) {}

FileDescriptor::FileDescriptor(FileDescriptor &&other)
	: fd_(other.fd_)
	, path_(std::move(other.path_)) {
	other.fd_ = -1;
}

FileDescriptor &FileDescriptor::operator=(FileDescriptor &&other) {
	if (this != &other) {
		if (fd_ != -1 && ::close(fd_) == -1) {
			int err = errno;
			Logging::log.warning("close() failed on " + path_.string() + ": " + strerror(err));
		}
		fd_ = other.fd_;
		path_ = std::move(other.path_);
		other.fd_ = -1;
	}
	return *this;
}

FileDescriptor::~FileDescriptor(void) {
	if (fd_ == -1)
		return;
	if (::close(fd_) == -1) {
		int err = errno;
		Logging::log.warning("close() failed on " + path_.string() + ": " + strerror(err));
	}
}

FileDescriptor FileDescriptor::open(const fs::path &path, int flags, mode_t mode) {
	int fd;
	do {
		fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
	} while (fd == -1 && errno == EINTR);
	if (fd == -1)
		throw_errno(errno, "open", path);
	return FileDescriptor(fd, path);
}

FileDescriptor FileDescriptor::open_read(const fs::path &path) {
	return FileDescriptor::open(path, O_RDONLY);
}

FileDescriptor FileDescriptor::create(const fs::path &path, mode_t mode) {
	return FileDescriptor::open(path, O_WRONLY | O_CREAT | O_TRUNC, mode);
}

int FileDescriptor::get(void) const {
	return fd_;
}

const fs::path &FileDescriptor::path(void) const {
	return path_;
}

bool FileDescriptor::is_open(void) const {
	return fd_ != -1;
}

struct stat FileDescriptor::stat(void) const {
	struct stat st = {};
	if (::fstat(fd_, &st) == -1)
		throw_errno(errno, "fstat", path_);
	return st;
}

uintmax_t FileDescriptor::size(void) const {
	return static_cast<uintmax_t>(stat().st_size);
}

void FileDescriptor::close(void) {
	if (fd_ == -1)
		return;
	int fd = fd_;
	fd_ = -1;
	// the descriptor is released by close() even when it reports an error
	if (::close(fd) == -1)
		throw_errno(errno, "close", path_);
}
