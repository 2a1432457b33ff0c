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

#include "gtest/gtest.h"
#include "copyOptions.hpp"
#include "errors.hpp"

#include <45d/Bytes.hpp>

TEST(ParseBatchSizeTest, SameSpellingAsConfigFile) {
	EXPECT_EQ(parse_batch_size("64 MiB"), 64u * 1024 * 1024);
	EXPECT_EQ(parse_batch_size("4 KiB"), 4096u);
	EXPECT_EQ(parse_batch_size(" 1 MiB "), 1024u * 1024);
	EXPECT_EQ(parse_batch_size(ffd::Bytes(DEFAULT_BATCH_SIZE).get_str()), uintmax_t(DEFAULT_BATCH_SIZE));
}

TEST(ParseBatchSizeTest, RejectsGarbage) {
	EXPECT_THROW(parse_batch_size(""), InvalidArgumentsException);
	EXPECT_THROW(parse_batch_size("lots"), InvalidArgumentsException);
	EXPECT_THROW(parse_batch_size("0 B"), InvalidArgumentsException);
}

TEST(ParseReflinkTest, AcceptsEachModeIgnoringCase) {
	EXPECT_EQ(parse_reflink("always"), CopyOptions::ALWAYS);
	EXPECT_EQ(parse_reflink("Auto"), CopyOptions::AUTO);
	EXPECT_EQ(parse_reflink("NEVER"), CopyOptions::NEVER);
	EXPECT_EQ(parse_reflink(" never "), CopyOptions::NEVER);
}

TEST(ParseReflinkTest, RejectsUnknownToken) {
	try {
		parse_reflink("sometimes");
		FAIL() << "expected InvalidArgumentsException";
	} catch (const InvalidArgumentsException &e) {
		EXPECT_STREQ(e.what(), "Unexpected value for 'reflink': sometimes");
	}
	EXPECT_THROW(parse_reflink(""), CopyException);
}

TEST(ParseReflinkTest, ToStringRoundTrips) {
	for (CopyOptions::reflink_t mode : {CopyOptions::ALWAYS, CopyOptions::AUTO, CopyOptions::NEVER})
		EXPECT_EQ(parse_reflink(to_string(mode)), mode);
}

TEST(CopyOptionsTest, Defaults) {
	CopyOptions opts;
	EXPECT_EQ(opts.reflink, CopyOptions::AUTO);
	EXPECT_FALSE(opts.no_perms);
	EXPECT_FALSE(opts.fsync);
	EXPECT_EQ(opts.batch_size, 64u * 1024 * 1024);
}
