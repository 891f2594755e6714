/*

Copyright (c) 2022, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "pieceproof/piece_hashes.hpp"
#include "pieceproof/error_code.hpp"
#include "pieceproof/assert.hpp"
#include "pieceproof/aux_/throw.hpp"

namespace pieceproof {

	piece_hashes::piece_hashes(std::string blob)
		: m_blob(std::move(blob))
	{
		if (m_blob.size() % std::size_t(sha1_hash::size()) != 0)
			aux::throw_ex<system_error>(errors::invalid_piece_hashes);
	}

	piece_hashes::piece_hashes(std::vector<sha1_hash> const& digests)
	{
		m_blob.reserve(digests.size() * std::size_t(sha1_hash::size()));
		for (auto const& h : digests)
			m_blob.append(h.data(), std::size_t(h.size()));
	}

	sha1_hash piece_hashes::hash(piece_index_t const piece) const
	{
		PIECEPROOF_ASSERT_PRECOND(piece >= piece_index_t(0));
		PIECEPROOF_ASSERT_PRECOND(static_cast<int>(piece) < num_pieces());
		return sha1_hash(m_blob.data()
			+ std::size_t(static_cast<int>(piece)) * std::size_t(sha1_hash::size()));
	}
}
