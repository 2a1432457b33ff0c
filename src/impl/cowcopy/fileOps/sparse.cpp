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
	#include <unistd.h>
}

namespace file_ops {
	bool probably_sparse(const FileDescriptor &fd) {
		struct stat st = fd.stat();
		return static_cast<uintmax_t>(st.st_blocks) * ST_NBLOCKSIZE < static_cast<uintmax_t>(st.st_size);
	}

	boost::optional<uint64_t> lseek(const FileDescriptor &fd, int64_t off, int whence) {
		off_t res = ::lseek(fd.get(), static_cast<off_t>(off), whence);
		if (res == (off_t)-1) {
			int err = errno;
			if (err == ENXIO)
				return boost::none;
			throw_errno(err, "lseek", fd.path());
		}
		return static_cast<uint64_t>(res);
	}

	std::pair<uint64_t, uint64_t> next_sparse_segments(const FileDescriptor &infd,
													   const FileDescriptor &outfd,
													   uint64_t pos) {
		uint64_t len = infd.size();
		uint64_t next_data = lseek(infd, pos, SEEK_DATA).value_or(len);
		uint64_t next_hole = lseek(infd, next_data, SEEK_HOLE).value_or(len);

		// past EOF is a valid position for SEEK_SET, so these never report ENXIO
		lseek(infd, next_data, SEEK_SET);
		lseek(outfd, next_data, SEEK_SET);

		return std::make_pair(next_data, next_hole);
	}
} // namespace file_ops
