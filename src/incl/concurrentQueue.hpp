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

/* Simple concurrent queue implementation. Intended for multiple producer,
 * single consumer use: copy threads push progress, one reporter drains it.
 */

#pragma once

#include <queue>
#include <mutex>
#include <utility>

/**
 * @brief Single-consumer multiple-producer concurrent FIFO queue.
 *
 * @tparam T Type to store.
 */
template<class T>
class ConcurrentQueue{
public:
	/**
	 * @brief Construct a new Concurrent Queue object
	 *
	 */
	ConcurrentQueue() : mt_(), queue_() {}
	/**
	 * @brief Destroy the Concurrent Queue object
	 *
	 */
	~ConcurrentQueue() = default;
	/**
	 * @brief Check if queue is empty.
	 *
	 * @return true Queue is empty.
	 * @return false Queue is not empty.
	 */
	bool empty(void) const{
		std::lock_guard<std::mutex> lk(mt_);
		return queue_.empty();
	}
	/**
	 * @brief Insert into queue with std::queue<T>::push().
	 *
	 * @param val Value to insert.
	 */
	void push(const T &val){
		std::lock_guard<std::mutex> lk(mt_);
		queue_.push(val);
	}
	/**
	 * @brief Emplace into queue with std::queue<T>::emplace().
	 *
	 * @tparam Args args to expand into constructor of T
	 * @param args args to expand into constructor of T
	 */
	template<typename... Args>
	void emplace(Args&&... args){
		std::lock_guard<std::mutex> lk(mt_);
		queue_.emplace(std::forward<Args>(args)...);
	}
	/**
	 * @brief Pop the front value into val if there is one.
	 * Checking and popping under one lock keeps this safe without
	 * a separate call to empty().
	 *
	 * @param val Receives the popped value
	 * @return true val was set
	 * @return false Queue was empty
	 */
	bool try_pop(T &val){
		std::lock_guard<std::mutex> lk(mt_);
		if(queue_.empty())
			return false;
		val = std::move(queue_.front());
		queue_.pop();
		return true;
	}
private:
	mutable std::mutex mt_; ///< Mutex for synchronization
	std::queue<T> queue_; ///< Underlying queue to store objects in
};
