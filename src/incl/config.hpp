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

#include "alert.hpp"
#include "copyOptions.hpp"

#include <45d/config/ConfigParser.hpp>
#include <memory>
#include <sstream>
#include <boost/filesystem.hpp>
namespace fs = boost::filesystem;

#define DEFAULT_CONFIG_PATH "/etc/cowcopy.conf"

template<class T>
/* ConfigOverride is used with command line flags
 * to allow for easy overridding of configuration values.
 */
class ConfigOverride{
private:
	T value_;
	/* The value to override with.
	 */
	bool overridden_;
	/* Whether or not the field is overridden.
	 * Since ConfigOverride objects are constructed in main()
	 * without a value, overridden_ will be set to false. If
	 * the value is updated through copying a newly constructed
	 * ConfigOverride object with a value, this will be true.
	 */
public:
	ConfigOverride(void) : value_() {
		overridden_ = false;
	}
	ConfigOverride(const T &value_passed) : value_(value_passed){
		overridden_ = true;
	}
	~ConfigOverride(void) = default;
	const T &value(void) const{
		return value_;
	}
	const bool &overridden(void) const{
		return overridden_;
	}
};

struct ConfigOverrides{
	ConfigOverride<Logger::log_level_t> log_level_override;
	ConfigOverride<CopyOptions::reflink_t> reflink_override;
	ConfigOverride<bool> no_perms_override;
	ConfigOverride<bool> fsync_override;
	ConfigOverride<uintmax_t> batch_size_override;
};

/**
 * @brief Apply CLI overrides on top of options from a config file or defaults.
 *
 * @param base Options before overriding
 * @param config_overrides Overridden values from CLI flags
 * @return std::shared_ptr<const CopyOptions> Options to share between copies
 * @throws InvalidArgumentsException if the resulting batch size is 0
 */
std::shared_ptr<const CopyOptions> apply_overrides(CopyOptions base, const ConfigOverrides &config_overrides);

/**
 * @brief Configuration class
 *
 */
class Config : public ffd::ConfigParser{
public:
	enum LogLevel { NONE, NORMAL, DEBUG }; ///< Enum for log level
	/**
	 * @brief Open config file at config_path and parse the global section.
	 * Sets the level of Logging::log.
	 *
	 * @param config_path Path to config file
	 * @param config_overrides Overridden config values from CLI flags
	 * @throws InvalidArgumentsException on malformed values
	 */
	Config(const fs::path &config_path, const ConfigOverrides &config_overrides);
	/* Default destructor.
	 */
	~Config() = default;
	/**
	 * @brief Get the options to hand to each CopyHandle.
	 *
	 * @return std::shared_ptr<const CopyOptions>
	 */
	std::shared_ptr<const CopyOptions> copy_options(void) const;
	/* Get log_level_.
	 */
	Logger::log_level_t log_level(void) const;
	/* print out loaded options from config file
	 */
	void dump(std::stringstream &ss) const;
private:
	/**
	 * @brief value read from config file which may be overridden in main()
	 * by CLI flags [ --verbose | --quiet ]
	 *
	 */
	Logger::log_level_t log_level_;
	/**
	 * @brief Copy options after applying overrides.
	 *
	 */
	std::shared_ptr<const CopyOptions> copy_options_;
	/**
	 * @brief parse global options
	 *
	 * @param config_path Path to config file
	 * @param config_overrides Overridden config values from CLI flags
	 */
	void load_config(const fs::path &config_path, const ConfigOverrides &config_overrides);
	/**
	 * @brief Read the option keys from the current scope.
	 *
	 * @param options Filled in from the config file
	 */
	void load_options(CopyOptions &options);
};

/**
 * @brief Write a config file holding the default settings.
 *
 * @param config_path Path to config file
 */
void init_config_file(const fs::path &config_path);
