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

#include <cstdint>
#include <string>

#define DEFAULT_BATCH_SIZE (64 * 1024 * 1024)

/**
 * @brief Settings shared read-only by every CopyHandle.
 *
 */
struct CopyOptions {
	/**
	 * @brief Copy-on-write clone policy.
	 *
	 */
	enum reflink_t {
		ALWAYS, ///< Clone or fail
		AUTO,   ///< Clone if the filesystem can, else copy
		NEVER   ///< Always copy bytes
	};
	reflink_t reflink = AUTO;
	bool no_perms = false; ///< Skip copying owner and mode when finalising
	bool fsync = false;    ///< fsync() the destination when finalising
	/**
	 * @brief Largest number of bytes moved by a single kernel copy call,
	 * and so the granularity of progress reports.
	 *
	 */
	uintmax_t batch_size = DEFAULT_BATCH_SIZE;
};

/**
 * @brief Parse "always", "auto" or "never", ignoring case.
 *
 * @param str Value from config file or CLI
 * @return CopyOptions::reflink_t
 * @throws InvalidArgumentsException for anything else
 */
CopyOptions::reflink_t parse_reflink(const std::string &str);

/**
 * @brief Inverse of parse_reflink().
 *
 * @param reflink
 * @return std::string
 */
std::string to_string(CopyOptions::reflink_t reflink);

/**
 * @brief Parse a batch size the way the config file spells it, e.g. "64 MiB".
 *
 * @param str Value from the CLI
 * @return uintmax_t Number of bytes
 * @throws InvalidArgumentsException if str isn't a size or is zero
 */
uintmax_t parse_batch_size(const std::string &str);
