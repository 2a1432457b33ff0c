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

#include "fileDescriptor.hpp"

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>
#include <boost/optional.hpp>

/**
 * @brief Block size st_blocks is counted in, independent of the filesystem.
 *
 */
#define ST_NBLOCKSIZE 512
/**
 * @brief Size of the buffer used when copying through user space.
 *
 */
#define USPACE_COPY_BUFF_SZ (64 * 1024)

/**
 * @brief Byte level file operations used by CopyHandle.
 * Each wrapper around a kernel facility decides for itself which errno values
 * mean "use the fallback" and throws fs::filesystem_error for everything else.
 *
 */
namespace file_ops {
	/**
	 * @brief What to do with an errno value returned by a kernel facility.
	 *
	 */
	enum errno_class_t {
		FALLBACK, ///< Facility unavailable for these files, use the fallback path
		FATAL     ///< Real error, propagate it
	};

	/**
	 * @brief Half open byte range [start, end) known to be allocated.
	 *
	 */
	struct Extent {
		uint64_t start;
		uint64_t end;
		bool operator==(const Extent &other) const {
			return start == other.start && end == other.end;
		}
		bool operator!=(const Extent &other) const {
			return !(*this == other);
		}
	};

	/**
	 * @brief Classify an errno from copy_file_range(2).
	 * ENOSYS, EPERM, EXDEV, EINVAL and EOPNOTSUPP fall back to a user space copy.
	 *
	 * @param err errno value
	 * @return errno_class_t
	 */
	errno_class_t classify_copy_range_error(int err);
	/**
	 * @brief Classify an errno from the FICLONE ioctl.
	 * EOPNOTSUPP, ENOTTY, EINVAL, EXDEV and ENOSYS mean cloning is not possible
	 * for this pair of files.
	 *
	 * @param err errno value
	 * @return errno_class_t
	 */
	errno_class_t classify_reflink_error(int err);
	/**
	 * @brief Classify an errno from the FS_IOC_FIEMAP ioctl.
	 * Only EOPNOTSUPP means the filesystem does not map extents.
	 *
	 * @param err errno value
	 * @return errno_class_t
	 */
	errno_class_t classify_fiemap_error(int err);

	/**
	 * @brief Copy up to bytes from the current offset of infd to the current
	 * offset of outfd, advancing both. Uses copy_file_range(2), falling back
	 * to copy_bytes_uspace() when the kernel can't do it for these files.
	 * May copy less than asked; call in a loop.
	 *
	 * @param infd Source
	 * @param outfd Destination
	 * @param bytes Maximum number of bytes to copy
	 * @return size_t Bytes copied, 0 at end of file
	 */
	size_t copy_file_bytes(const FileDescriptor &infd, const FileDescriptor &outfd, uint64_t bytes);
	/**
	 * @brief Same as copy_file_bytes() but at explicit offsets; the file
	 * offsets of both descriptors are left untouched.
	 *
	 * @param infd Source
	 * @param outfd Destination
	 * @param bytes Maximum number of bytes to copy
	 * @param off_in Offset to read from in infd
	 * @param off_out Offset to write to in outfd
	 * @return size_t Bytes copied, 0 at end of file
	 */
	size_t copy_file_offset(const FileDescriptor &infd,
							const FileDescriptor &outfd,
							uint64_t bytes,
							uint64_t off_in,
							uint64_t off_out);
	/**
	 * @brief copy_file_offset() with the same offset in both files.
	 *
	 */
	size_t copy_file_offset(const FileDescriptor &infd,
							const FileDescriptor &outfd,
							uint64_t bytes,
							uint64_t off);
	/**
	 * @brief read()/write() copy of up to bytes at the current offsets.
	 *
	 * @return size_t Bytes copied, less than bytes only at end of file
	 */
	size_t copy_bytes_uspace(const FileDescriptor &infd, const FileDescriptor &outfd, size_t bytes);
	/**
	 * @brief pread()/pwrite() copy of up to bytes at explicit offsets.
	 *
	 * @return size_t Bytes copied, less than bytes only at end of file
	 */
	size_t copy_range_uspace(const FileDescriptor &infd,
							 const FileDescriptor &outfd,
							 size_t bytes,
							 uint64_t off_in,
							 uint64_t off_out);

	/**
	 * @brief Guess whether a file has holes: fewer 512 byte blocks allocated
	 * than its length needs. Same test as coreutils cp.
	 *
	 * @param fd File to test
	 * @return true st_blocks * 512 < st_size
	 * @return false File looks fully allocated
	 */
	bool probably_sparse(const FileDescriptor &fd);
	/**
	 * @brief lseek(2) wrapper that understands SEEK_DATA/SEEK_HOLE running off
	 * the end of the file.
	 *
	 * @param fd File to seek
	 * @param off Offset
	 * @param whence SEEK_SET, SEEK_CUR, SEEK_END, SEEK_DATA or SEEK_HOLE
	 * @return boost::optional<uint64_t> New offset, boost::none on ENXIO (no more data/holes)
	 */
	boost::optional<uint64_t> lseek(const FileDescriptor &fd, int64_t off, int whence);
	/**
	 * @brief Find the next allocated region at or after pos in infd and the hole
	 * following it, then seek both descriptors to the start of the region.
	 * End of file stands in for a missing region or hole.
	 *
	 * @param infd Source
	 * @param outfd Destination, pre-sized to the length of infd
	 * @param pos Logical offset to search from
	 * @return std::pair<uint64_t, uint64_t> (data start, hole start)
	 */
	std::pair<uint64_t, uint64_t> next_sparse_segments(const FileDescriptor &infd,
													   const FileDescriptor &outfd,
													   uint64_t pos);

	/**
	 * @brief Ask the filesystem for the allocated ranges of fd with FS_IOC_FIEMAP.
	 *
	 * @param fd File to map
	 * @return boost::optional<std::vector<Extent>> Ordered extents, boost::none
	 * if the filesystem can't map extents
	 */
	boost::optional<std::vector<Extent>> map_extents(const FileDescriptor &fd);
	/**
	 * @brief Sort extents and join the ones that touch or overlap.
	 *
	 * @param extents
	 * @return std::vector<Extent> Minimal covering set, ordered
	 */
	std::vector<Extent> merge_extents(std::vector<Extent> extents);

	/**
	 * @brief Clone the whole of infd into outfd with FICLONE.
	 *
	 * @param infd Source
	 * @param outfd Destination
	 * @return true outfd now shares storage with infd
	 * @return false Cloning isn't possible for this pair of files
	 */
	bool reflink(const FileDescriptor &infd, const FileDescriptor &outfd);

	/**
	 * @brief Set the length of fd to len with ftruncate(), leaving it unallocated.
	 *
	 * @param fd
	 * @param len
	 */
	void allocate_file(const FileDescriptor &fd, uint64_t len);
	/**
	 * @brief Copy owner, group and mode from infd to outfd.
	 * Failing to chown because we aren't privileged is not an error.
	 *
	 * @param infd
	 * @param outfd
	 */
	void copy_permissions(const FileDescriptor &infd, const FileDescriptor &outfd);
	/**
	 * @brief fsync() fd.
	 *
	 * @param fd
	 */
	void sync(const FileDescriptor &fd);
	/**
	 * @brief Check whether two descriptors refer to the same inode.
	 *
	 */
	bool is_same_file(const FileDescriptor &a, const FileDescriptor &b);
	/**
	 * @brief Check whether two paths refer to the same inode.
	 * Symlinks are followed.
	 *
	 */
	bool is_same_file(const fs::path &a, const fs::path &b);
} // namespace file_ops
