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
#include "config.hpp"
#include "errors.hpp"
#include "testUtils.hpp"

#include <45d/Bytes.hpp>
#include <fstream>

using test_utils::ScratchDir;

class ConfigTest : public ::testing::Test {
protected:
	ScratchDir dir;
	fs::path config_path;

	void SetUp() override {
		config_path = dir / "cowcopy.conf";
	}

	void TearDown() override {
		Logging::log.set_level(Logger::log_level_t::NORMAL);
	}

	void write_config(const std::string &contents) {
		std::ofstream f(config_path.string());
		f << contents;
	}
};

TEST_F(ConfigTest, ReadsGlobalSection) {
	write_config(
		"[Global]\n"
		"Log Level = 0\n"
		"Reflink = never\n"
		"Preserve Permissions = false\n"
		"Fsync = true\n"
		"Batch Size = 1 MiB\n");
	Config config(config_path, ConfigOverrides());
	std::shared_ptr<const CopyOptions> opts = config.copy_options();
	ASSERT_TRUE(opts);
	EXPECT_EQ(config.log_level(), Logger::log_level_t::NONE);
	EXPECT_EQ(Logging::log.level(), Logger::log_level_t::NONE);
	EXPECT_EQ(opts->reflink, CopyOptions::NEVER);
	EXPECT_TRUE(opts->no_perms);
	EXPECT_TRUE(opts->fsync);
	EXPECT_EQ(opts->batch_size, 1024u * 1024);
}

TEST_F(ConfigTest, MissingKeysTakeDefaults) {
	write_config("[Global]\nFsync = true\n");
	Config config(config_path, ConfigOverrides());
	std::shared_ptr<const CopyOptions> opts = config.copy_options();
	EXPECT_EQ(config.log_level(), Logger::log_level_t::NORMAL);
	EXPECT_EQ(opts->reflink, CopyOptions::AUTO);
	EXPECT_FALSE(opts->no_perms);
	EXPECT_TRUE(opts->fsync);
	EXPECT_EQ(opts->batch_size, uintmax_t(DEFAULT_BATCH_SIZE));
}

TEST_F(ConfigTest, OverridesWin) {
	write_config("[Global]\nReflink = never\nBatch Size = 1 MiB\n");
	ConfigOverrides overrides;
	overrides.reflink_override = ConfigOverride<CopyOptions::reflink_t>(CopyOptions::ALWAYS);
	overrides.batch_size_override = ConfigOverride<uintmax_t>(4096);
	overrides.log_level_override = ConfigOverride<Logger::log_level_t>(Logger::log_level_t::DEBUG);
	Config config(config_path, overrides);
	std::shared_ptr<const CopyOptions> opts = config.copy_options();
	EXPECT_EQ(opts->reflink, CopyOptions::ALWAYS);
	EXPECT_EQ(opts->batch_size, 4096u);
	EXPECT_EQ(config.log_level(), Logger::log_level_t::DEBUG);
}

TEST_F(ConfigTest, BadReflinkThrows) {
	write_config("[Global]\nReflink = maybe\n");
	EXPECT_THROW(Config(config_path, ConfigOverrides()), InvalidArgumentsException);
}

TEST_F(ConfigTest, ZeroBatchSizeThrows) {
	write_config("[Global]\nReflink = auto\n");
	ConfigOverrides overrides;
	overrides.batch_size_override = ConfigOverride<uintmax_t>(0);
	EXPECT_THROW(Config(config_path, overrides), InvalidArgumentsException);
}

TEST_F(ConfigTest, MissingFileIsCreatedWithDefaults) {
	ASSERT_FALSE(fs::exists(config_path));
	Config config(config_path, ConfigOverrides());
	EXPECT_TRUE(fs::exists(config_path));
	std::shared_ptr<const CopyOptions> opts = config.copy_options();
	EXPECT_EQ(opts->reflink, CopyOptions::AUTO);
	EXPECT_FALSE(opts->no_perms);
	EXPECT_FALSE(opts->fsync);
	EXPECT_EQ(opts->batch_size, uintmax_t(DEFAULT_BATCH_SIZE));
}

TEST_F(ConfigTest, DumpShowsEffectiveSettings) {
	write_config("[Global]\nReflink = never\nFsync = true\nBatch Size = 1 MiB\n");
	Config config(config_path, ConfigOverrides());
	std::stringstream ss;
	config.dump(ss);
	std::string out = ss.str();
	EXPECT_NE(out.find("[Global]"), std::string::npos);
	EXPECT_NE(out.find("Reflink = never"), std::string::npos);
	EXPECT_NE(out.find("Fsync = true"), std::string::npos);
	EXPECT_NE(out.find("Preserve Permissions = true"), std::string::npos);
	EXPECT_NE(out.find("Batch Size = " + ffd::Bytes(1024 * 1024).get_str()), std::string::npos);
}

TEST(ApplyOverridesTest, NoOverridesKeepsBase) {
	CopyOptions base;
	base.fsync = true;
	std::shared_ptr<const CopyOptions> opts = apply_overrides(base, ConfigOverrides());
	EXPECT_TRUE(opts->fsync);
	EXPECT_EQ(opts->reflink, CopyOptions::AUTO);
}

TEST(ApplyOverridesTest, FlagsOverride) {
	ConfigOverrides overrides;
	overrides.no_perms_override = ConfigOverride<bool>(true);
	overrides.fsync_override = ConfigOverride<bool>(true);
	std::shared_ptr<const CopyOptions> opts = apply_overrides(CopyOptions(), overrides);
	EXPECT_TRUE(opts->no_perms);
	EXPECT_TRUE(opts->fsync);
}
