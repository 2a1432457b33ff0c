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

#include "progress.hpp"

ProgressQueue::ProgressQueue(void) : queue_(), total_(0), errors_() {}

void ProgressQueue::report(const ProgressUpdate &update) {
	queue_.push(update);
}

uintmax_t ProgressQueue::drain(void) {
	uintmax_t count = 0;
	ProgressUpdate update;
	while (queue_.try_pop(update)) {
		switch (update.kind) {
			case ProgressUpdate::BYTES:
				total_ += update.bytes;
				break;
			case ProgressUpdate::ERROR:
				errors_.push_back(update.error);
				break;
		}
		++count;
	}
	return count;
}

uintmax_t ProgressQueue::total(void) const {
	return total_;
}

const std::vector<std::string> &ProgressQueue::errors(void) const {
	return errors_;
}

BatchUpdater::BatchUpdater(ProgressSink &sink, uintmax_t batch_size)
	: sink_(sink)
	, batch_size_(batch_size)
	, reported_(0) {}

void BatchUpdater::update(uintmax_t bytes) {
	ProgressUpdate update;
	update.kind = ProgressUpdate::BYTES;
	update.bytes = bytes;
	sink_.report(update);
	reported_ += bytes;
}

void BatchUpdater::fail(const std::string &msg) {
	ProgressUpdate update;
	update.kind = ProgressUpdate::ERROR;
	update.error = msg;
	sink_.report(update);
}

uintmax_t BatchUpdater::batch_size(void) const {
	return batch_size_;
}

uintmax_t BatchUpdater::reported(void) const {
	return reported_;
}
