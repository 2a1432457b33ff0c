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

#include <stdexcept>
#include <string>
#include <boost/filesystem.hpp>
namespace fs = boost::filesystem;

/**
 * @brief Base class of the copy engine's own errors.
 * OS errors are thrown as fs::filesystem_error instead, see throw_errno().
 *
 */
class CopyException : public std::runtime_error {
public:
	explicit CopyException(const std::string &what) : std::runtime_error(what) {}
};

/**
 * @brief Thrown for malformed option values, from the config file or the CLI.
 *
 */
class InvalidArgumentsException : public CopyException {
public:
	explicit InvalidArgumentsException(const std::string &what) : CopyException(what) {}
};

/**
 * @brief Thrown when reflink = always and the pair of files cannot be cloned.
 *
 */
class ReflinkFailedException : public CopyException {
public:
	/**
	 * @brief Construct a new Reflink Failed Exception object
	 *
	 * @param from Source of the attempted clone
	 * @param to Destination of the attempted clone
	 */
	ReflinkFailedException(const fs::path &from, const fs::path &to);
	/**
	 * @brief Path of the source file
	 *
	 * @return const fs::path&
	 */
	const fs::path &from(void) const;
	/**
	 * @brief Path of the destination file
	 *
	 * @return const fs::path&
	 */
	const fs::path &to(void) const;
private:
	fs::path from_;
	fs::path to_;
};

/**
 * @brief Throw fs::filesystem_error for errno value err.
 *
 * @param err errno value
 * @param op Operation that failed, used as the message
 * @param path File the operation was done on
 */
[[noreturn]] void throw_errno(int err, const std::string &op, const fs::path &path);

/**
 * @brief Throw fs::filesystem_error for errno value err naming both files
 * of a two-file operation.
 *
 * @param err errno value
 * @param op Operation that failed, used as the message
 * @param path1 Source file
 * @param path2 Destination file
 */
[[noreturn]] void throw_errno(int err, const std::string &op, const fs::path &path1, const fs::path &path2);
