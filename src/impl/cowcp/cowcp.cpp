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

#include "alert.hpp"
#include "config.hpp"
#include "copyHandle.hpp"
#include "errors.hpp"
#include "fileDescriptor.hpp"
#include "fileOps.hpp"
#include "progress.hpp"
#include "tools.hpp"

#include <45d/Bytes.hpp>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <sstream>
#include <thread>
#include <vector>

extern "C" {
#include <getopt.h>
}

#define PROGRESS_PERIOD_MS 250

namespace l {
	/**
	 * @brief Print the merged extents of path, one "start-end" per line.
	 *
	 * @param path File to map
	 * @return int Exit status
	 */
	int print_extents(const fs::path &path) {
		FileDescriptor fd = FileDescriptor::open_read(path);
		boost::optional<std::vector<file_ops::Extent>> extents = file_ops::map_extents(fd);
		if (!extents) {
			Logging::log.error("Extent mapping not supported for " + path.string());
			return EXIT_FAILURE;
		}
		std::stringstream ss;
		for (const file_ops::Extent &extent : file_ops::merge_extents(*extents))
			ss << extent.start << "-" << extent.end << std::endl;
		std::string out = ss.str();
		if (!out.empty())
			out.pop_back();
		Logging::log.message(out, Logger::log_level_t::NONE);
		return EXIT_SUCCESS;
	}

	/**
	 * @brief Load options from config_path, falling back to defaults if the
	 * default config file can't be created.
	 *
	 * @param config_path
	 * @param explicit_path Whether config_path came from --config
	 * @param config_overrides
	 * @return std::shared_ptr<const CopyOptions>
	 */
	std::shared_ptr<const CopyOptions> load_options(const fs::path &config_path, bool explicit_path,
													const ConfigOverrides &config_overrides) {
		try {
			Config config(config_path, config_overrides);
			std::stringstream ss;
			config.dump(ss);
			Logging::log.message(ss.str(), Logger::log_level_t::DEBUG);
			return config.copy_options();
		} catch (const fs::filesystem_error &e) {
			if (explicit_path)
				throw;
			Logging::log.message(std::string("Using default settings: ") + e.what(), Logger::log_level_t::DEBUG);
		}
		return apply_overrides(CopyOptions(), config_overrides);
	}

	/**
	 * @brief Copy from to to on a worker thread while draining progress here.
	 *
	 * @param from
	 * @param to
	 * @param opts
	 * @return uintmax_t Length of the copied file
	 */
	uintmax_t run_copy(const fs::path &from, const fs::path &to, std::shared_ptr<const CopyOptions> opts) {
		ProgressQueue progress;
		CopyHandle handle(from, to, opts);
		BatchUpdater updates(progress, opts->batch_size);
		std::exception_ptr copy_error;
		std::mutex done_mt;
		std::condition_variable done_cv;
		bool done = false;
		uintmax_t copied = 0;

		std::thread worker([&]() {
			try {
				copied = handle.copy_file(updates);
			} catch (const std::exception &e) {
				updates.fail(e.what());
				copy_error = std::current_exception();
			}
			{
				std::lock_guard<std::mutex> lk(done_mt);
				done = true;
			}
			done_cv.notify_one();
		});

		{
			std::unique_lock<std::mutex> lk(done_mt);
			while (!done_cv.wait_for(lk, std::chrono::milliseconds(PROGRESS_PERIOD_MS), [&done]() { return done; })) {
				lk.unlock();
				if (progress.drain() != 0)
					Logging::log.message(ffd::Bytes(progress.total()).get_str() + " / "
											 + ffd::Bytes(handle.length()).get_str(),
										 Logger::log_level_t::DEBUG);
				lk.lock();
			}
		}
		worker.join();
		progress.drain();

		if (copy_error)
			std::rethrow_exception(copy_error);
		handle.finalize();
		Logging::log.message(ffd::Bytes(progress.total()).get_str() + " moved by copying",
							 Logger::log_level_t::DEBUG);
		return copied;
	}
} // namespace l

int main(int argc, char *argv[]) {
	int opt;
	int option_ind = 0;
	bool print_version = false;
	bool extents = false;
	bool explicit_config = false;
	fs::path config_path = DEFAULT_CONFIG_PATH;
	ConfigOverrides config_overrides;

	static struct option long_options[] = { { "batch-size", required_argument, 0, 'b' },
											{ "config", required_argument, 0, 'c' },
											{ "extents", no_argument, 0, 'e' },
											{ "fsync", no_argument, 0, 'f' },
											{ "help", no_argument, 0, 'h' },
											{ "no-perms", no_argument, 0, 'p' },
											{ "quiet", no_argument, 0, 'q' },
											{ "reflink", required_argument, 0, 'r' },
											{ "syslog", no_argument, 0, 's' },
											{ "verbose", no_argument, 0, 'v' },
											{ "version", no_argument, 0, 'V' },
											{ 0, 0, 0, 0 } };

	/* Get CLI options.
	 */
	try {
		while ((opt = getopt_long(argc, argv, "b:c:ehqr:svV", long_options, &option_ind)) != -1) {
			switch (opt) {
				case 'b':
					config_overrides.batch_size_override = ConfigOverride<uintmax_t>(parse_batch_size(optarg));
					break;
				case 'c':
					config_path = optarg;
					explicit_config = true;
					break;
				case 'e':
					extents = true;
					break;
				case 'f':
					config_overrides.fsync_override = ConfigOverride<bool>(true);
					break;
				case 'h':
					cli_usage();
					exit(EXIT_SUCCESS);
				case 'p':
					config_overrides.no_perms_override = ConfigOverride<bool>(true);
					break;
				case 'q':
					config_overrides.log_level_override = ConfigOverride<Logger::log_level_t>(Logger::log_level_t::NONE);
					Logging::log.set_level(Logger::log_level_t::NONE);
					break;
				case 'r':
					config_overrides.reflink_override = ConfigOverride<CopyOptions::reflink_t>(parse_reflink(optarg));
					break;
				case 's':
					Logging::log.set_output(Logger::output_t::SYSLOG);
					break;
				case 'v':
					config_overrides.log_level_override = ConfigOverride<Logger::log_level_t>(Logger::log_level_t::DEBUG);
					Logging::log.set_level(Logger::log_level_t::DEBUG);
					break;
				case 'V':
					print_version = true;
					break;
				case '?':
					cli_usage();
					exit(EXIT_FAILURE); // getopt_long prints errors
				default:
					cli_usage();
					exit(EXIT_FAILURE);
			}
		}
	} catch (const InvalidArgumentsException &e) {
		Logging::log.error(e.what());
		exit(EXIT_FAILURE);
	}

	if (print_version) {
		Logging::log.message("cowcp " VERS, Logger::log_level_t::NONE);
		exit(EXIT_SUCCESS);
	}

	std::vector<fs::path> args;
	while (optind < argc)
		args.emplace_back(argv[optind++]);

	try {
		if (extents) {
			if (args.size() != 1) {
				Logging::log.error("--extents takes exactly one file.");
				cli_usage();
				exit(EXIT_FAILURE);
			}
			exit(l::print_extents(args.front()));
		}

		if (args.size() != 2) {
			Logging::log.error("Expected a source and a destination.");
			cli_usage();
			exit(EXIT_FAILURE);
		}
		fs::path from = args[0];
		fs::path to = args[1];
		if (fs::is_directory(to))
			to /= from.filename();
		if (fs::is_directory(from)) {
			Logging::log.error("Not a regular file: " + from.string());
			exit(EXIT_FAILURE);
		}
		if (fs::exists(to) && file_ops::is_same_file(from, to)) {
			Logging::log.error("Source and destination are the same file: " + from.string());
			exit(EXIT_FAILURE);
		}

		std::shared_ptr<const CopyOptions> opts = l::load_options(config_path, explicit_config, config_overrides);
		uintmax_t total = l::run_copy(from, to, opts);
		Logging::log.message("Copied " + ffd::Bytes(total).get_str() + " from " + from.string() + " to "
								 + to.string(),
							 Logger::log_level_t::NORMAL);
	} catch (const ReflinkFailedException &e) {
		Logging::log.error(std::string(e.what()) + ". Try --reflink auto.");
		exit(EXIT_FAILURE);
	} catch (const fs::filesystem_error &e) {
		Logging::log.error(e.what());
		exit(EXIT_FAILURE);
	} catch (const std::exception &e) {
		Logging::log.error(e.what());
		exit(EXIT_FAILURE);
	}

	return EXIT_SUCCESS;
}
