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
#include "fiemap.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iterator>

extern "C" {
	#include <linux/fs.h>
	#include <sys/ioctl.h>
}

namespace file_ops {
	errno_class_t classify_fiemap_error(int err) {
		if (err == EOPNOTSUPP)
			return FALLBACK;
		return FATAL;
	}

	boost::optional<std::vector<Extent>> map_extents(const FileDescriptor &fd) {
		FiemapRequest req;
		std::memset(&req, 0, sizeof(req));
		req.fm_start = 0;
		req.fm_length = FIEMAP_MAX_OFFSET;
		req.fm_flags = FIEMAP_FLAG_SYNC; // flush delayed allocation so it shows up
		req.fm_extent_count = FIEMAP_BATCH_SIZE;

		std::vector<Extent> extents;
		extents.reserve(FIEMAP_BATCH_SIZE);

		for (;;) {
			req.fm_mapped_extents = 0;
			if (::ioctl(fd.get(), FS_IOC_FIEMAP, &req) == -1) {
				int err = errno;
				if (classify_fiemap_error(err) == FALLBACK) {
					Logging::log.message("Extent mapping not supported for " + fd.path().string(),
										 Logger::log_level_t::DEBUG);
					return boost::none;
				}
				throw_errno(err, "ioctl(FS_IOC_FIEMAP)", fd.path());
			}

			if (req.fm_mapped_extents == 0)
				break;

			for (uint32_t i = 0; i < req.fm_mapped_extents; ++i) {
				const FiemapExtent &e = req.fm_extents[i];
				extents.push_back(Extent{e.fe_logical, e.fe_logical + e.fe_length});
			}

			const FiemapExtent &last = req.fm_extents[req.fm_mapped_extents - 1];
			if (last.fe_flags & FIEMAP_EXTENT_LAST)
				break;

			// go around again, starting after what we already have
			req.fm_start = last.fe_logical + last.fe_length;
		}

		return extents;
	}

	std::vector<Extent> merge_extents(std::vector<Extent> extents) {
		if (extents.empty())
			return extents;
		std::sort(extents.begin(), extents.end(), [](const Extent &a, const Extent &b) {
			return a.start < b.start || (a.start == b.start && a.end < b.end);
		});
		std::vector<Extent> merged;
		merged.push_back(extents.front());
		for (std::vector<Extent>::const_iterator itr = std::next(extents.begin()); itr != extents.end(); ++itr) {
			Extent &prev = merged.back();
			if (itr->start <= prev.end)
				prev.end = std::max(prev.end, itr->end);
			else
				merged.push_back(*itr);
		}
		return merged;
	}
} // namespace file_ops
