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
#include "errors.hpp"

#include <cerrno>

extern "C" {
	#include <linux/fs.h>
	#include <sys/ioctl.h>
}

namespace file_ops {
	errno_class_t classify_reflink_error(int err) {
		switch (err) {
			case EOPNOTSUPP: // filesystem can't share extents
			case ENOTTY:     // ioctl not understood for this file
			case EINVAL:     // not regular files, or unaligned ranges
			case EXDEV:      // different filesystems
			case ENOSYS:
				return FALLBACK;
			default:
				return FATAL;
		}
	}

	bool reflink(const FileDescriptor &infd, const FileDescriptor &outfd) {
		int res;
		do {
			res = ::ioctl(outfd.get(), FICLONE, infd.get());
		} while (res == -1 && errno == EINTR);
		if (res == -1) {
			int err = errno;
			if (classify_reflink_error(err) == FALLBACK)
				return false;
			throw_errno(err, "ioctl(FICLONE)", infd.path(), outfd.path());
		}
		return true;
	}
} // namespace file_ops
