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

#include <string>
#include <cstdint>
#include <mutex>

/**
 * @brief Class to print logs to either stdout/stderr or the syslog.
 * Safe to call from several copy threads at once.
 *
 */
class Logger {
public:
	/**
	 * @brief Whether to print to stdout/stderr or the syslog
	 *
	 */
	enum output_t {
		STD,   ///< Print to stdout/stderr
		SYSLOG ///< Print to syslog
	};
	enum log_level_t { NONE, NORMAL, DEBUG };
	/**
	 * @brief Construct a new Logger object
	 *
	 * @param log_level Assigned to log_level_
	 * @param output Where to output, default is STD
	 */
	explicit Logger(log_level_t log_level, output_t output = STD);
	/**
	 * @brief Destroy the Logger object
	 * Close syslog if output_ == SYSLOG
	 *
	 */
	~Logger(void);
	/**
	 * @brief Print message if lvl <= log_level_.
	 * Use this for regular informational log messages.
	 *
	 * @param msg String to print
	 * @param lvl Log level to test against
	 */
	void message(const std::string &msg, log_level_t lvl) const;
	/**
	 * @brief Print message (to stderr if output_ == STD) prepended with "Warning: ".
	 * Use this for non-fatal errors.
	 *
	 * @param msg String to print
	 */
	void warning(const std::string &msg) const;
	/**
	 * @brief Print message (to stderr if output_ == STD) prepended with "Error: ".
	 * Use this for failed copies and failed finalisation.
	 *
	 * @param msg
	 */
	void error(const std::string &msg) const;
	/**
	 * @brief Set the log_level_ member to log_level
	 *
	 * @param log_level New log level
	 */
	void set_level(log_level_t log_level);
	/**
	 * @brief Get the current log level.
	 *
	 * @return log_level_t
	 */
	log_level_t level(void) const;
	/**
	 * @brief Set which type of logging to do.
	 * If switching from STD to SYSLOG, open the log.
	 * If switching from SYSLOG to STD, closes log.
	 *
	 * @param output
	 */
	void set_output(output_t output);
private:
	/**
	 * @brief Value from config file or CLI flags. Each log message
	 * passes a log level to check against this number.
	 * If the message's level is lower or equal, it is printed.
	 *
	 */
	log_level_t log_level_;
	output_t output_; ///< Whether to output to stdout (STD) or syslog (SYSLOG)
	mutable std::mutex output_mt_; ///< Keeps lines from concurrent copies from interleaving
};

/**
 * @brief Namespace for containing a global instance of a Logger object.
 *
 */
namespace Logging {
	/**
	 * @brief Global Logger object. Use Logging::log.<method> in source
	 * files including this header.
	 *
	 */
	extern Logger log;
} // namespace Logging
