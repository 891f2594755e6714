/*

Copyright (c) 2022, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECEPROOF_PIECE_COLLECTOR_HPP_INCLUDED
#define PIECEPROOF_PIECE_COLLECTOR_HPP_INCLUDED

#include <atomic>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

#include "pieceproof/config.hpp"
#include "pieceproof/units.hpp"
#include "pieceproof/sha1_hash.hpp"
#include "pieceproof/piece_hashes.hpp"
#include "pieceproof/aux_/exhaust_queue.hpp"
#include "pieceproof/aux_/piece_task.hpp"

namespace pieceproof::aux {

	// the single consumer of the result queue. It counts the distinct pieces
	// seen so far, keeps the digests and calls the result handler once per
	// result, in arrival order. The handler is never called concurrently
	// with itself.
	struct PIECEPROOF_EXTRA_EXPORT piece_collector
	{
		// ``pieces_done`` is the number of distinct pieces seen, including
		// the one in ``r``
		using result_handler = std::function<void(piece_result const& r, int pieces_done)>;

		piece_collector(exhaust_queue<piece_result>& results, int num_pieces
			, result_handler h);

		piece_collector(piece_collector const&) = delete;
		piece_collector& operator=(piece_collector const&) = delete;

		// consume results until the result queue is drained and exhausted, or
		// until stopped. Exceptions thrown by the handler propagate
		void run();

		// may be called from any thread, including from within the handler
		void stop();
		bool stopped() const { return m_stop; }

		int pieces_done() const { return m_pieces_done; }

		// the digests collected so far, sorted by piece index. This may be
		// called once run() has returned
		std::vector<std::pair<piece_index_t, sha1_hash>> digests() const;

		// the digests concatenated into a digest blob. This may be called
		// once run() has returned
		piece_hashes hashes() const;

	private:

		exhaust_queue<piece_result>& m_results;
		result_handler m_handler;

		// one entry per piece, set once the piece has been seen
		std::vector<bool> m_seen;
		std::atomic<int> m_pieces_done{0};

		std::vector<std::pair<piece_index_t, sha1_hash>> m_digests;

		std::atomic<bool> m_stop{false};
	};
}

#endif
