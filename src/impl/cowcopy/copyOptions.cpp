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

#include "copyOptions.hpp"
#include "errors.hpp"

#include <45d/Bytes.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

CopyOptions::reflink_t parse_reflink(const std::string &str) {
	std::string lower = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(str));
	if (lower == "always")
		return CopyOptions::ALWAYS;
	if (lower == "auto")
		return CopyOptions::AUTO;
	if (lower == "never")
		return CopyOptions::NEVER;
	throw InvalidArgumentsException("Unexpected value for 'reflink': " + str);
}

std::string to_string(CopyOptions::reflink_t reflink) {
	switch (reflink) {
		case CopyOptions::ALWAYS:
			return "always";
		case CopyOptions::AUTO:
			return "auto";
		case CopyOptions::NEVER:
			return "never";
	}
	return "auto";
}

uintmax_t parse_batch_size(const std::string &str) {
	ffd::Bytes::bytes_type bytes;
	try {
		bytes = ffd::Bytes(boost::algorithm::trim_copy(str)).get();
	} catch (const std::exception &e) {
		throw InvalidArgumentsException("Invalid batch size: " + str + ": " + e.what());
	}
	if (bytes <= 0)
		throw InvalidArgumentsException("Batch size must be greater than zero: " + str);
	return static_cast<uintmax_t>(bytes);
}
