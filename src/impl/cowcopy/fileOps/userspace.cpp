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
#include <vector>

extern "C" {
	#include <unistd.h>
}

namespace l {
	void write_all(const FileDescriptor &outfd, const char *buff, size_t len) {
		size_t done = 0;
		while (done < len) {
			ssize_t res = ::write(outfd.get(), buff + done, len - done);
			if (res == -1) {
				if (errno == EINTR)
					continue;
				throw_errno(errno, "write", outfd.path());
			}
			done += res;
		}
	}

	void pwrite_all(const FileDescriptor &outfd, const char *buff, size_t len, uint64_t off) {
		size_t done = 0;
		while (done < len) {
			ssize_t res = ::pwrite(outfd.get(), buff + done, len - done, off + done);
			if (res == -1) {
				if (errno == EINTR)
					continue;
				throw_errno(errno, "pwrite", outfd.path());
			}
			done += res;
		}
	}
} // namespace l

namespace file_ops {
	size_t copy_bytes_uspace(const FileDescriptor &infd, const FileDescriptor &outfd, size_t bytes) {
		std::vector<char> buff(std::min<size_t>(bytes, USPACE_COPY_BUFF_SZ));
		size_t written = 0;
		while (written < bytes) {
			size_t to_read = std::min(bytes - written, buff.size());
			ssize_t bytes_read = ::read(infd.get(), buff.data(), to_read);
			if (bytes_read == -1) {
				if (errno == EINTR)
					continue;
				throw_errno(errno, "read", infd.path());
			}
			if (bytes_read == 0)
				break; // EOF
			l::write_all(outfd, buff.data(), bytes_read);
			written += bytes_read;
		}
		return written;
	}

	size_t copy_range_uspace(const FileDescriptor &infd,
							 const FileDescriptor &outfd,
							 size_t bytes,
							 uint64_t off_in,
							 uint64_t off_out) {
		std::vector<char> buff(std::min<size_t>(bytes, USPACE_COPY_BUFF_SZ));
		size_t written = 0;
		while (written < bytes) {
			size_t to_read = std::min(bytes - written, buff.size());
			ssize_t bytes_read = ::pread(infd.get(), buff.data(), to_read, off_in + written);
			if (bytes_read == -1) {
				if (errno == EINTR)
					continue;
				throw_errno(errno, "pread", infd.path());
			}
			if (bytes_read == 0)
				break; // EOF
			l::pwrite_all(outfd, buff.data(), bytes_read, off_out + written);
			written += bytes_read;
		}
		return written;
	}
} // namespace file_ops
