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

#include <algorithm>
#include <cerrno>
#include <limits>

extern "C" {
	#include <unistd.h>
}

namespace l {
	/**
	 * @brief Single copy_file_range(2) call. boost::none means the kernel
	 * won't do it for these files and the caller should copy in user space.
	 *
	 */
	boost::optional<size_t> try_copy_file_range(const FileDescriptor &infd,
												loff_t *off_in,
												const FileDescriptor &outfd,
												loff_t *off_out,
												uint64_t bytes) {
		size_t len = static_cast<size_t>(
			std::min<uint64_t>(bytes, std::numeric_limits<ssize_t>::max()));
		ssize_t res;
		do {
			res = ::copy_file_range(infd.get(), off_in, outfd.get(), off_out, len, 0);
		} while (res == -1 && errno == EINTR);
		if (res == -1) {
			int err = errno;
			if (file_ops::classify_copy_range_error(err) == file_ops::FALLBACK)
				return boost::none;
			throw_errno(err, "copy_file_range", infd.path(), outfd.path());
		}
		return static_cast<size_t>(res);
	}
} // namespace l

namespace file_ops {
	errno_class_t classify_copy_range_error(int err) {
		switch (err) {
			case ENOSYS:     // kernel without the syscall
			case EPERM:      // seccomp filters, immutable or append-only files
			case EXDEV:      // different filesystems, kernels >= 5.19 refuse again
			case EINVAL:     // not regular files, or ranges the syscall rejects
			case EOPNOTSUPP: // filesystem refuses, eg. some network filesystems
				return FALLBACK;
			default:
				return FATAL;
		}
	}

	size_t copy_file_bytes(const FileDescriptor &infd, const FileDescriptor &outfd, uint64_t bytes) {
		boost::optional<size_t> res = l::try_copy_file_range(infd, nullptr, outfd, nullptr, bytes);
		if (res)
			return *res;
		return copy_bytes_uspace(infd, outfd, static_cast<size_t>(bytes));
	}

	size_t copy_file_offset(const FileDescriptor &infd,
							const FileDescriptor &outfd,
							uint64_t bytes,
							uint64_t off_in,
							uint64_t off_out) {
		loff_t in = static_cast<loff_t>(off_in);
		loff_t out = static_cast<loff_t>(off_out);
		boost::optional<size_t> res = l::try_copy_file_range(infd, &in, outfd, &out, bytes);
		if (res)
			return *res;
		return copy_range_uspace(infd, outfd, static_cast<size_t>(bytes), off_in, off_out);
	}

	size_t copy_file_offset(const FileDescriptor &infd,
							const FileDescriptor &outfd,
							uint64_t bytes,
							uint64_t off) {
		return copy_file_offset(infd, outfd, bytes, off, off);
	}
} // namespace file_ops
