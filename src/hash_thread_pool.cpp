/*

Copyright (c) 2017, Steven Siloti
Copyright (c) 2017-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "pieceproof/aux_/hash_thread_pool.hpp"
#include "pieceproof/hasher.hpp"
#include "pieceproof/assert.hpp"
#include "pieceproof/aux_/debug_log.hpp"

namespace pieceproof::aux {

	hash_thread_pool::hash_thread_pool(exhaust_queue<piece_task>& tasks
		, exhaust_queue<piece_result>& results
		, error_handler on_error)
		: m_tasks(tasks)
		, m_results(results)
		, m_on_error(std::move(on_error))
	{}

	hash_thread_pool::~hash_thread_pool()
	{
		stop();
		join();
	}

	void hash_thread_pool::start(int const num_threads)
	{
		PIECEPROOF_ASSERT(num_threads > 0);
		std::lock_guard<std::mutex> l(m_mutex);
		for (int i = 0; i < num_threads; ++i)
		{
			++m_running;
			try
			{
				m_threads.emplace_back([this] { thread_fun(); });
			}
			catch (...)
			{
				if (--m_running == 0) m_results.exhaust();
				throw;
			}
		}
		DLOG("hash pool: started %d threads\n", num_threads);
	}

	void hash_thread_pool::stop()
	{
		m_stop = true;
		m_tasks.exhaust();
	}

	void hash_thread_pool::join()
	{
		std::vector<std::thread> threads;
		{
			// must release m_mutex to avoid a deadlock if a thread tries to
			// acquire it
			std::lock_guard<std::mutex> l(m_mutex);
			threads.swap(m_threads);
		}
		for (auto& t : threads) t.join();
	}

	void hash_thread_pool::thread_fun()
	{
		try
		{
			piece_task t;
			while (!m_stop && m_tasks.pop(t))
			{
				piece_result r;
				r.piece = t.piece;
				r.file = t.file;
				r.forced_mismatch = t.forced_mismatch;

				if (t.error.ec)
					r.error = std::move(t.error);
				else if (t.payload)
					r.hash = hasher(*t.payload).final();

				if (!m_results.push(std::move(r))) break;
			}
		}
		catch (...)
		{
			if (m_on_error) m_on_error(std::current_exception());
			else m_stop = true;
		}

		// the last thread out closes the result queue, which lets the
		// collector finish once it has drained it
		if (--m_running == 0)
		{
			DLOG("hash pool: last thread exiting\n");
			m_results.exhaust();
		}
	}
}
