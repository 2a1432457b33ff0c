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

#include "config.hpp"
#include "alert.hpp"
#include "errors.hpp"
#include <45d/Bytes.hpp>
#include <45d/config/ConfigSubsectionGuard.hpp>
#include <cerrno>
#include <fstream>
#include <sstream>

namespace l {
	/**
	 * @brief Create config_path with defaults if it doesn't exist yet.
	 *
	 * @param config_path
	 * @return const fs::path& config_path
	 */
	const fs::path &ensure_config_file(const fs::path &config_path) {
		if (!fs::exists(config_path))
			init_config_file(config_path);
		return config_path;
	}
} // namespace l

std::shared_ptr<const CopyOptions> apply_overrides(CopyOptions base, const ConfigOverrides &config_overrides) {
	if (config_overrides.reflink_override.overridden())
		base.reflink = config_overrides.reflink_override.value();
	if (config_overrides.no_perms_override.overridden())
		base.no_perms = config_overrides.no_perms_override.value();
	if (config_overrides.fsync_override.overridden())
		base.fsync = config_overrides.fsync_override.value();
	if (config_overrides.batch_size_override.overridden())
		base.batch_size = config_overrides.batch_size_override.value();
	if (base.batch_size == 0)
		throw InvalidArgumentsException("Batch size must be greater than zero");
	return std::make_shared<const CopyOptions>(base);
}

Config::Config(const fs::path &config_path, const ConfigOverrides &config_overrides)
	: ffd::ConfigParser(l::ensure_config_file(config_path).string()) {
	load_config(config_path, config_overrides);
}

void Config::load_options(CopyOptions &options) {
	int log_level_tmp = get<int>("Log Level", LogLevel::NORMAL);
	log_level_ = (Logger::log_level_t)(log_level_tmp > 2 ? 2 : (log_level_tmp < 0 ? 0 : log_level_tmp));
	options.reflink = parse_reflink(get<std::string>("Reflink", to_string(CopyOptions::AUTO)));
	options.no_perms = !get<bool>("Preserve Permissions", true);
	options.fsync = get<bool>("Fsync", false);
	options.batch_size = get<ffd::Bytes>("Batch Size", ffd::Bytes(DEFAULT_BATCH_SIZE)).get();
}

void Config::load_config(const fs::path &config_path, const ConfigOverrides &config_overrides) {
	CopyOptions options;

	std::vector<std::string> valid_global_headers = {"Global", "global"};
	std::vector<std::string>::iterator global_header_itr = valid_global_headers.begin();
	while (global_header_itr != valid_global_headers.end()) {
		try {
			ffd::ConfigSubsectionGuard guard(*this, *global_header_itr);
			load_options(options);
			break;
		} catch (const std::out_of_range &) {
			++global_header_itr;
		}
	}
	if (global_header_itr == valid_global_headers.end()) {
		Logging::log.warning("No global section in " + config_path.string() + "! Trying top level scope or defaults.");
		load_options(options);
	}

	if (config_overrides.log_level_override.overridden())
		log_level_ = config_overrides.log_level_override.value();
	Logging::log.set_level(log_level_);

	copy_options_ = apply_overrides(options, config_overrides);
	Logging::log.message("Config loaded from " + config_path.string(), Logger::log_level_t::DEBUG);
}

std::shared_ptr<const CopyOptions> Config::copy_options(void) const {
	return copy_options_;
}

Logger::log_level_t Config::log_level(void) const {
	return log_level_;
}

void Config::dump(std::stringstream &ss) const {
	ss << "[Global]" << std::endl;
	ss << "Log Level = " << log_level_ << std::endl;
	ss << "Reflink = " << to_string(copy_options_->reflink) << std::endl;
	ss << "Preserve Permissions = " << (copy_options_->no_perms ? "false" : "true") << std::endl;
	ss << "Fsync = " << (copy_options_->fsync ? "true" : "false") << std::endl;
	ss << "Batch Size = " << ffd::Bytes(copy_options_->batch_size).get_str() << std::endl;
}

void init_config_file(const fs::path &config_path) {
	if (config_path.has_parent_path())
		fs::create_directories(config_path.parent_path());
	std::ofstream f(config_path.string());
	if (!f)
		throw_errno(errno ? errno : EIO, "Error opening config file", config_path);
	f <<
	"# cowcopy config\n"
	"[Global]                       # global settings\n"
	"Log Level = 1                  # 0 = none, 1 = normal, 2 = debug\n"
	"Reflink = auto                 # always | auto | never\n"
	"Preserve Permissions = true    # copy owner and mode to the destination\n"
	"Fsync = false                  # fsync the destination after copying\n"
	"Batch Size = 64 MiB            # largest chunk copied between progress reports\n";
	f.close();
	if (!f)
		throw_errno(EIO, "Error writing config file", config_path);
}
