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

#include "tools.hpp"
#include "alert.hpp"
#include "config.hpp"

void cli_usage(void) {
	Logging::log.message(
		"cowcopy Copyright (C) 2026  The cowcopy authors\n"
		"This program is released under the GNU General Public License v3.\n"
		"See <https://www.gnu.org/licenses/> for more details.\n"
		"\n"
		"Usage:\n"
		"  cowcp [<flags>] <source> <destination>\n"
		"  cowcp --extents <file>\n"
		"Flags:\n"
		"  -b, --batch-size <size>\n"
		"              - largest chunk copied per progress report, eg. \"64 MiB\"\n"
		"  -c, --config <path/to/config>\n"
		"              - override configuration file path (default " DEFAULT_CONFIG_PATH ")\n"
		"  -e, --extents\n"
		"              - print the allocated extents of <file> and exit\n"
		"  --fsync     - fsync the destination once copied\n"
		"  -h, --help  - display this message and exit\n"
		"  --no-perms  - don't copy owner and mode to the destination\n"
		"  -q, --quiet - set log level to 0 (no output)\n"
		"  -r, --reflink <always|auto|never>\n"
		"              - copy-on-write clone policy (default auto)\n"
		"  -s, --syslog\n"
		"              - log to the syslog instead of stdout/stderr\n"
		"  -v, --verbose\n"
		"              - set log level to 2 (debug output)\n"
		"  -V, --version\n"
		"              - print version and exit",
		Logger::log_level_t::NONE);
}
