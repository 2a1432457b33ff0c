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

#include "copyOptions.hpp"
#include "fileDescriptor.hpp"
#include "progress.hpp"

#include <memory>
#include <boost/filesystem.hpp>
namespace fs = boost::filesystem;

/**
 * @brief Copy of one file. Owns both descriptors and a snapshot of the source
 * metadata taken at open time.
 *
 * Finalisation (owner/mode copy, fsync) has two entry points. finalize() throws
 * on failure for callers that want to know. The destructor calls finalize() if
 * it hasn't run yet and only logs failures, since destruction can't fail; this
 * also covers a copy abandoned because copy_file() threw.
 *
 */
class CopyHandle {
public:
	/**
	 * @brief Open from, create or truncate to, and size to to the length of from.
	 *
	 * @param from Source path
	 * @param to Destination path
	 * @param opts Shared options
	 */
	CopyHandle(const fs::path &from, const fs::path &to, std::shared_ptr<const CopyOptions> opts);
	CopyHandle(const CopyHandle &) = delete;
	CopyHandle &operator=(const CopyHandle &) = delete;
	/**
	 * @brief Destroy the Copy Handle object, finalising if finalize() was not called.
	 *
	 */
	virtual ~CopyHandle(void);
	/**
	 * @brief Copy the whole file: clone it, or copy only its allocated regions
	 * if it looks sparse, or copy it in batch_size chunks.
	 *
	 * @param updates Progress for this copy
	 * @return uintmax_t Length of the source
	 */
	uintmax_t copy_file(BatchUpdater &updates);
	/**
	 * @brief Clone the source into the destination according to the reflink option.
	 *
	 * @return true Destination is a clone, nothing left to copy
	 * @return false Copy the bytes
	 * @throws ReflinkFailedException if reflink is ALWAYS and cloning isn't possible
	 */
	bool try_reflink(void);
	/**
	 * @brief Copy owner and mode unless no_perms, then fsync if asked to.
	 * Runs at most once per handle.
	 *
	 */
	void finalize(void);
	const FileDescriptor &infd(void) const;
	const FileDescriptor &outfd(void) const;
	/**
	 * @brief Source metadata as of construction.
	 *
	 * @return const struct stat&
	 */
	const struct stat &metadata(void) const;
	/**
	 * @brief Source length as of construction.
	 *
	 * @return uintmax_t
	 */
	uintmax_t length(void) const;
protected:
	/**
	 * @brief Clone call used by try_reflink(). Override to substitute the filesystem.
	 *
	 * @return true Cloned
	 * @return false Cloning not possible for this pair
	 */
	virtual bool reflink_files(void);
private:
	FileDescriptor infd_;  ///< Source, read only
	FileDescriptor outfd_; ///< Destination, pre-sized to the source length
	struct stat metadata_; ///< Source metadata snapshot
	std::shared_ptr<const CopyOptions> opts_;
	bool finalized_; ///< Set once finalize() has been entered
	/**
	 * @brief Copy len bytes from wherever the descriptor offsets are.
	 *
	 * @param len
	 * @param updates
	 * @return uintmax_t Bytes copied, always len
	 */
	uintmax_t copy_bytes(uintmax_t len, BatchUpdater &updates);
	/**
	 * @brief Copy the allocated regions of the source, skipping holes.
	 *
	 * @param updates
	 * @return uintmax_t Source length
	 */
	uintmax_t copy_sparse(BatchUpdater &updates);
};
