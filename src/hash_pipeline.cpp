/*

Copyright (c) 2022, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "pieceproof/aux_/hash_pipeline.hpp"
#include "pieceproof/aux_/debug_log.hpp"

#include <thread>

namespace pieceproof::aux {

	hash_pipeline::hash_pipeline(file_storage const& fs, std::string content_path
		, hash_settings const& sett, result_handler h)
		: m_settings(sett)
		, m_tasks(sett.queue_capacity())
		, m_reader(fs, std::move(content_path), m_tasks)
		, m_pool(m_tasks, m_results, [this](std::exception_ptr e)
			{
				set_error(std::move(e));
				stop();
			})
		, m_collector(m_results, fs.num_pieces(), std::move(h))
	{}

	hash_pipeline::~hash_pipeline()
	{
		stop();
		m_pool.join();
	}

	void hash_pipeline::run()
	{
		int const num_threads = m_settings.num_threads();
		DLOG("pipeline: start %d hashing threads, queue capacity %d\n"
			, num_threads, m_tasks.capacity());

		std::thread reader;
		std::thread collector;
		try
		{
			m_pool.start(num_threads);
			reader = std::thread([this]
			{
				try { m_reader.read(); }
				catch (...)
				{
					set_error(std::current_exception());
					stop();
				}
			});
			collector = std::thread([this]
			{
				try { m_collector.run(); }
				catch (...)
				{
					set_error(std::current_exception());
					stop();
				}
			});
		}
		catch (...)
		{
			stop();
			if (reader.joinable()) reader.join();
			m_pool.join();
			throw;
		}

		reader.join();
		m_pool.join();
		collector.join();

		DLOG("pipeline: done, %d pieces%s\n", m_collector.pieces_done()
			, stopped() ? " (stopped)" : "");

		std::lock_guard<std::mutex> l(m_error_mutex);
		if (m_error) std::rethrow_exception(m_error);
	}

	void hash_pipeline::stop()
	{
		m_reader.stop();
		m_pool.stop();
		m_collector.stop();
		m_results.exhaust();
	}

	bool hash_pipeline::stopped() const
	{
		return m_collector.stopped() || m_reader.stopped();
	}

	void hash_pipeline::set_error(std::exception_ptr e)
	{
		std::lock_guard<std::mutex> l(m_error_mutex);
		if (!m_error) m_error = std::move(e);
	}
}
