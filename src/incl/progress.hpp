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

#include "concurrentQueue.hpp"

#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief One progress report: bytes moved by one copy chunk, or a failure.
 *
 */
struct ProgressUpdate {
	enum kind_t { BYTES, ERROR };
	kind_t kind = BYTES;
	uintmax_t bytes = 0;
	std::string error;
};

/**
 * @brief Receiver of progress reports. Shared by every copy running at once,
 * so implementations must be thread safe.
 *
 */
class ProgressSink {
public:
	virtual ~ProgressSink(void) = default;
	/**
	 * @brief Accept one report.
	 *
	 * @param update
	 */
	virtual void report(const ProgressUpdate &update) = 0;
};

/**
 * @brief ProgressSink that queues reports from any number of copy threads
 * for a single consumer to aggregate with drain().
 *
 */
class ProgressQueue : public ProgressSink {
public:
	ProgressQueue(void);
	~ProgressQueue(void) = default;
	/**
	 * @brief Queue update. Called from copy threads.
	 *
	 * @param update
	 */
	void report(const ProgressUpdate &update) override;
	/**
	 * @brief Fold every queued report into the running totals.
	 * Only call from one thread.
	 *
	 * @return uintmax_t Number of reports consumed
	 */
	uintmax_t drain(void);
	/**
	 * @brief Bytes reported so far, as of the last drain().
	 *
	 * @return uintmax_t
	 */
	uintmax_t total(void) const;
	/**
	 * @brief Failures reported so far, as of the last drain().
	 *
	 * @return const std::vector<std::string>&
	 */
	const std::vector<std::string> &errors(void) const;
private:
	ConcurrentQueue<ProgressUpdate> queue_; ///< Reports not yet drained
	uintmax_t total_;                       ///< Sum of drained BYTES reports
	std::vector<std::string> errors_;       ///< Messages of drained ERROR reports
};

/**
 * @brief Per-copy handle on a shared ProgressSink. CopyHandle never moves
 * more than batch_size() bytes between two update() calls.
 *
 */
class BatchUpdater {
public:
	/**
	 * @brief Construct a new Batch Updater object
	 *
	 * @param sink Shared sink, must outlive this object
	 * @param batch_size Largest chunk of bytes copied per report
	 */
	BatchUpdater(ProgressSink &sink, uintmax_t batch_size);
	/**
	 * @brief Report bytes copied by one chunk.
	 *
	 * @param bytes
	 */
	void update(uintmax_t bytes);
	/**
	 * @brief Report a failed copy.
	 *
	 * @param msg
	 */
	void fail(const std::string &msg);
	uintmax_t batch_size(void) const;
	/**
	 * @brief Bytes reported through this updater.
	 *
	 * @return uintmax_t
	 */
	uintmax_t reported(void) const;
private:
	ProgressSink &sink_;
	uintmax_t batch_size_;
	uintmax_t reported_;
};
