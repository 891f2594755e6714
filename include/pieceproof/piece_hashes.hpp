/*

Copyright (c) 2022, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECEPROOF_PIECE_HASHES_HPP_INCLUDED
#define PIECEPROOF_PIECE_HASHES_HPP_INCLUDED

#include <string>
#include <vector>

#include "pieceproof/config.hpp"
#include "pieceproof/units.hpp"
#include "pieceproof/sha1_hash.hpp"

namespace pieceproof {

	// the digest blob: the 20 byte SHA-1 digests of all pieces, concatenated
	// in piece order. The digest of piece ``i`` occupies bytes
	// [20 * i, 20 * i + 20). This is the ``pieces`` field of a .torrent
	// file's info dictionary.
	class PIECEPROOF_EXPORT piece_hashes
	{
	public:

		piece_hashes() = default;

		// throws system_error(errors::invalid_piece_hashes) if the size of
		// ``blob`` isn't a multiple of 20
		explicit piece_hashes(std::string blob);

		explicit piece_hashes(std::vector<sha1_hash> const& digests);

		// the number of digests
		int num_pieces() const { return int(m_blob.size() / std::size_t(sha1_hash::size())); }
		bool empty() const { return m_blob.empty(); }

		// the digest of ``piece``
		sha1_hash hash(piece_index_t piece) const;

		// the raw blob
		std::string const& bytes() const { return m_blob; }

		bool operator==(piece_hashes const& rhs) const { return m_blob == rhs.m_blob; }
		bool operator!=(piece_hashes const& rhs) const { return m_blob != rhs.m_blob; }

	private:
		std::string m_blob;
	};
}

#endif
