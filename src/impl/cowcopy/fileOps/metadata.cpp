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

#include "fileOps.hpp"
#include "alert.hpp"
#include "errors.hpp"

#include <cerrno>

extern "C" {
	#include <sys/stat.h>
	#include <unistd.h>
}

namespace file_ops {
	void allocate_file(const FileDescriptor &fd, uint64_t len) {
		int res;
		do {
			res = ::ftruncate(fd.get(), static_cast<off_t>(len));
		} while (res == -1 && errno == EINTR);
		if (res == -1)
			throw_errno(errno, "ftruncate", fd.path());
	}

	void copy_permissions(const FileDescriptor &infd, const FileDescriptor &outfd) {
		struct stat info = infd.stat();
		// chown first, it clears setuid/setgid bits that fchmod() restores
		if (::fchown(outfd.get(), info.st_uid, info.st_gid) == -1) {
			int err = errno;
			if (err != EPERM)
				throw_errno(err, "fchown", outfd.path());
			Logging::log.message("Not permitted to change owner of " + outfd.path().string(),
								 Logger::log_level_t::DEBUG);
		}
		if (::fchmod(outfd.get(), info.st_mode & 07777) == -1)
			throw_errno(errno, "fchmod", outfd.path());
	}

	void sync(const FileDescriptor &fd) {
		if (::fsync(fd.get()) == -1)
			throw_errno(errno, "fsync", fd.path());
	}

	bool is_same_file(const FileDescriptor &a, const FileDescriptor &b) {
		struct stat sa = a.stat();
		struct stat sb = b.stat();
		return sa.st_dev == sb.st_dev && sa.st_ino == sb.st_ino;
	}

	bool is_same_file(const fs::path &a, const fs::path &b) {
		struct stat sa = {};
		struct stat sb = {};
		if (::stat(a.c_str(), &sa) == -1)
			throw_errno(errno, "stat", a);
		if (::stat(b.c_str(), &sb) == -1)
			throw_errno(errno, "stat", b);
		return sa.st_dev == sb.st_dev && sa.st_ino == sb.st_ino;
	}
} // namespace file_ops
