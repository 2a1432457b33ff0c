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

#include "copyHandle.hpp"
#include "alert.hpp"
#include "errors.hpp"
#include "fileOps.hpp"

#include <algorithm>
#include <cerrno>
#include <utility>

CopyHandle::CopyHandle(const fs::path &from, const fs::path &to, std::shared_ptr<const CopyOptions> opts)
	: infd_(FileDescriptor::open_read(from))
	, outfd_()
	, metadata_(infd_.stat())
	, opts_(std::move(opts))
	, finalized_(false) {
	if (!opts_)
		throw InvalidArgumentsException("No copy options given");
	if (opts_->batch_size == 0)
		throw InvalidArgumentsException("Batch size must be greater than zero");
	outfd_ = FileDescriptor::create(to);
	file_ops::allocate_file(outfd_, metadata_.st_size);
}

CopyHandle::~CopyHandle(void) {
	if (finalized_ || !outfd_.is_open())
		return;
	try {
		finalize();
	} catch (const std::exception &e) {
		Logging::log.error("Error during finalising copy operation " + infd_.path().string() + " -> "
						   + outfd_.path().string() + ": " + e.what());
	}
}

bool CopyHandle::reflink_files(void) {
	return file_ops::reflink(infd_, outfd_);
}

bool CopyHandle::try_reflink(void) {
	switch (opts_->reflink) {
		case CopyOptions::ALWAYS:
		case CopyOptions::AUTO:
			Logging::log.message("Attempting reflink from " + infd_.path().string() + " -> "
									 + outfd_.path().string(),
								 Logger::log_level_t::DEBUG);
			if (reflink_files()) {
				Logging::log.message("Reflink " + outfd_.path().string() + " succeeded",
									 Logger::log_level_t::DEBUG);
				return true;
			}
			if (opts_->reflink == CopyOptions::ALWAYS)
				throw ReflinkFailedException(infd_.path(), outfd_.path());
			Logging::log.message("Failed to reflink, falling back to copy", Logger::log_level_t::DEBUG);
			return false;
		case CopyOptions::NEVER:
			return false;
	}
	return false;
}

uintmax_t CopyHandle::copy_bytes(uintmax_t len, BatchUpdater &updates) {
	uintmax_t written = 0;
	while (written < len) {
		uintmax_t bytes_to_copy = std::min(len - written, updates.batch_size());
		size_t res = file_ops::copy_file_bytes(infd_, outfd_, bytes_to_copy);
		// the source shrank under us, stop instead of spinning on it
		if (res == 0)
			throw_errno(EIO, "Unexpected end of file", infd_.path(), outfd_.path());
		written += res;
		updates.update(res);
	}
	return written;
}

uintmax_t CopyHandle::copy_sparse(BatchUpdater &updates) {
	uintmax_t len = length();
	uintmax_t pos = 0;

	while (pos < len) {
		std::pair<uint64_t, uint64_t> segment = file_ops::next_sparse_segments(infd_, outfd_, pos);
		uint64_t next_data = segment.first;
		uint64_t next_hole = std::min<uint64_t>(segment.second, len);
		if (next_data >= len)
			break; // only a hole left, already there from allocate_file()
		if (next_hole <= pos)
			throw_errno(EIO, "Unexpected end of file", infd_.path(), outfd_.path());
		copy_bytes(next_hole - next_data, updates);
		pos = next_hole;
	}

	return len;
}

uintmax_t CopyHandle::copy_file(BatchUpdater &updates) {
	if (try_reflink())
		return length();
	uintmax_t total;
	if (file_ops::probably_sparse(infd_)) {
		Logging::log.message("Copying " + infd_.path().string() + " as a sparse file",
							 Logger::log_level_t::DEBUG);
		total = copy_sparse(updates);
	} else {
		total = copy_bytes(length(), updates);
	}
	return total;
}

void CopyHandle::finalize(void) {
	if (finalized_)
		return;
	finalized_ = true;
	if (!opts_->no_perms)
		file_ops::copy_permissions(infd_, outfd_);
	if (opts_->fsync) {
		Logging::log.message("Syncing file " + outfd_.path().string(), Logger::log_level_t::DEBUG);
		file_ops::sync(outfd_);
	}
}

const FileDescriptor &CopyHandle::infd(void) const {
	return infd_;
}

const FileDescriptor &CopyHandle::outfd(void) const {
	return outfd_;
}

const struct stat &CopyHandle::metadata(void) const {
	return metadata_;
}

uintmax_t CopyHandle::length(void) const {
	return static_cast<uintmax_t>(metadata_.st_size);
}
