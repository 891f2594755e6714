/*

Copyright (c) 2022, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "pieceproof/aux_/piece_collector.hpp"
#include "pieceproof/aux_/debug_log.hpp"

#include <algorithm>

namespace pieceproof::aux {

	piece_collector::piece_collector(exhaust_queue<piece_result>& results
		, int const num_pieces, result_handler h)
		: m_results(results)
		, m_handler(std::move(h))
		, m_seen(std::size_t(std::max(0, num_pieces)), false)
	{
		m_digests.reserve(m_seen.size());
	}

	void piece_collector::run()
	{
		piece_result r;
		while (!m_stop && m_results.pop(r))
		{
			int const idx = static_cast<int>(r.piece);
			if (idx >= 0 && idx < int(m_seen.size()) && !m_seen[std::size_t(idx)])
			{
				m_seen[std::size_t(idx)] = true;
				++m_pieces_done;
			}

			if (r.hash) m_digests.emplace_back(r.piece, *r.hash);

			if (m_handler) m_handler(r, m_pieces_done);
		}
		DLOG("collector: done, %d pieces %d digests\n", int(m_pieces_done)
			, int(m_digests.size()));
	}

	void piece_collector::stop()
	{
		m_stop = true;
	}

	std::vector<std::pair<piece_index_t, sha1_hash>> piece_collector::digests() const
	{
		auto ret = m_digests;
		std::sort(ret.begin(), ret.end()
			, [](std::pair<piece_index_t, sha1_hash> const& lhs
				, std::pair<piece_index_t, sha1_hash> const& rhs)
			{ return lhs.first < rhs.first; });
		return ret;
	}

	piece_hashes piece_collector::hashes() const
	{
		std::vector<sha1_hash> ret;
		ret.reserve(m_digests.size());
		for (auto const& d : digests())
			ret.push_back(d.second);
		return piece_hashes(ret);
	}
}
