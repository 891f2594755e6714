/*

Copyright (c) 2017, Steven Siloti
Copyright (c) 2017-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECEPROOF_HASH_THREAD_POOL_HPP_INCLUDED
#define PIECEPROOF_HASH_THREAD_POOL_HPP_INCLUDED

#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "pieceproof/config.hpp"
#include "pieceproof/aux_/exhaust_queue.hpp"
#include "pieceproof/aux_/piece_task.hpp"

namespace pieceproof::aux {

	// a fixed number of threads pulling piece_tasks off the task queue and
	// pushing a piece_result for each of them onto the result queue. Tasks
	// carrying an error are forwarded as-is, tasks without payload produce a
	// result without digest.
	//
	// Once the last thread exits (the task queue is drained and exhausted,
	// or the pool was stopped), the result queue is exhausted.
	struct PIECEPROOF_EXTRA_EXPORT hash_thread_pool
	{
		using error_handler = std::function<void(std::exception_ptr)>;

		// ``on_error`` is called (from a hashing thread) if a thread fails
		// with an exception
		hash_thread_pool(exhaust_queue<piece_task>& tasks
			, exhaust_queue<piece_result>& results
			, error_handler on_error);
		~hash_thread_pool();

		hash_thread_pool(hash_thread_pool const&) = delete;
		hash_thread_pool& operator=(hash_thread_pool const&) = delete;

		// spawn ``num_threads`` hashing threads
		void start(int num_threads);

		// may be called from any thread. Threads exit after the task they're
		// currently hashing
		void stop();

		// wait for all threads to exit
		void join();

		int num_threads() const
		{
			std::lock_guard<std::mutex> l(m_mutex);
			return int(m_threads.size());
		}

	private:

		void thread_fun();

		exhaust_queue<piece_task>& m_tasks;
		exhaust_queue<piece_result>& m_results;
		error_handler m_on_error;

		std::atomic<bool> m_stop{false};

		// the number of threads that haven't exited yet
		std::atomic<int> m_running{0};

		// ensures thread creation/destruction is atomic
		mutable std::mutex m_mutex;
		std::vector<std::thread> m_threads;
	};
}

#endif
