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
#include <iostream>

extern "C"{
	#include <syslog.h>
}

namespace Logging{
	Logger log(Logger::log_level_t::NORMAL);
}

Logger::Logger(log_level_t log_level, output_t output){
	log_level_ = log_level;
	output_ = output;
	if(output_ == SYSLOG){
		openlog("cowcopy", LOG_USER, LOG_USER);
	}
}

Logger::~Logger(void){
	if(output_ == SYSLOG)
		closelog();
}

void Logger::message(const std::string &msg, log_level_t lvl) const{
	if(log_level_ >= lvl){
		std::lock_guard<std::mutex> lk(output_mt_);
		switch(output_){
			case STD:
				std::cout << msg << std::endl;
				break;
			case SYSLOG:
				syslog(LOG_INFO, "%s", msg.c_str());
				break;
		}
	}
}

void Logger::warning(const std::string &msg) const{
	std::lock_guard<std::mutex> lk(output_mt_);
	switch(output_){
		case STD:
			std::cerr << "Warning: " << msg << std::endl;
			break;
		case SYSLOG:
			syslog(LOG_WARNING, "%s", msg.c_str());
			break;
	}
}

void Logger::error(const std::string &msg) const{
	std::lock_guard<std::mutex> lk(output_mt_);
	switch(output_){
		case STD:
			std::cerr << "Error: " << msg << std::endl;
			break;
		case SYSLOG:
			syslog(LOG_ERR, "%s", msg.c_str());
			break;
	}
}

void Logger::set_level(log_level_t log_level){
	log_level_ = log_level;
}

Logger::log_level_t Logger::level(void) const{
	return log_level_;
}

void Logger::set_output(output_t output){
	std::lock_guard<std::mutex> lk(output_mt_);
	if (output_ == output)
		return;
	if (output == Logger::output_t::SYSLOG) {
		openlog("cowcopy", LOG_USER, LOG_USER);
	} else if (output == Logger::output_t::STD) {
		closelog();
	}
	output_ = output;
}
