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

#include "errors.hpp"

ReflinkFailedException::ReflinkFailedException(const fs::path &from, const fs::path &to)
	: CopyException("Reflink failed: " + from.string() + " -> " + to.string())
	, from_(from)
	, to_(to) {}

const fs::path &ReflinkFailedException::from(void) const {
	return from_;
}

const fs::path &ReflinkFailedException::to(void) const {
	return to_;
}

void throw_errno(int err, const std::string &op, const fs::path &path) {
	throw fs::filesystem_error(op, path, boost::system::error_code(err, boost::system::system_category()));
}

void throw_errno(int err, const std::string &op, const fs::path &path1, const fs::path &path2) {
	throw fs::filesystem_error(
		op, path1, path2, boost::system::error_code(err, boost::system::system_category()));
}
