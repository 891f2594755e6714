/*

Copyright (c) 2022, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECEPROOF_HASH_PIPELINE_HPP_INCLUDED
#define PIECEPROOF_HASH_PIPELINE_HPP_INCLUDED

#include <exception>
#include <mutex>
#include <string>

#include "pieceproof/config.hpp"
#include "pieceproof/file_storage.hpp"
#include "pieceproof/settings.hpp"
#include "pieceproof/piece_hashes.hpp"
#include "pieceproof/aux_/exhaust_queue.hpp"
#include "pieceproof/aux_/piece_task.hpp"
#include "pieceproof/aux_/chunk_reader.hpp"
#include "pieceproof/aux_/hash_thread_pool.hpp"
#include "pieceproof/aux_/piece_collector.hpp"

namespace pieceproof::aux {

	// ties the stages together:
	//
	//   chunk_reader -> task queue (bounded) -> hash_thread_pool
	//      -> result queue -> piece_collector -> result handler
	//
	// run() blocks until all stages are done, or one of them failed, or
	// stop() was called. Every thread is joined before run() returns.
	struct PIECEPROOF_EXTRA_EXPORT hash_pipeline
	{
		using result_handler = piece_collector::result_handler;

		// ``fs`` must outlive the pipeline. The handler is called on the
		// collector thread, it may call stop() and skip_file()
		hash_pipeline(file_storage const& fs, std::string content_path
			, hash_settings const& sett, result_handler h);
		~hash_pipeline();

		hash_pipeline(hash_pipeline const&) = delete;
		hash_pipeline& operator=(hash_pipeline const&) = delete;

		// run all stages to completion. The first exception thrown by any
		// stage (including the result handler) is rethrown once all threads
		// have been joined
		void run();

		// may be called from any thread
		void stop();
		bool stopped() const;

		// stop reading file ``f``, see chunk_reader::skip_file()
		void skip_file(file_index_t f) { m_reader.skip_file(f); }

		int pieces_done() const { return m_collector.pieces_done(); }

		// the digest blob, valid once run() returned. It's only complete if
		// the pipeline wasn't stopped
		piece_hashes hashes() const { return m_collector.hashes(); }

	private:

		void set_error(std::exception_ptr e);

		hash_settings const m_settings;

		exhaust_queue<piece_task> m_tasks;
		exhaust_queue<piece_result> m_results;

		chunk_reader m_reader;
		hash_thread_pool m_pool;
		piece_collector m_collector;

		std::mutex m_error_mutex;
		std::exception_ptr m_error;
	};
}

#endif
