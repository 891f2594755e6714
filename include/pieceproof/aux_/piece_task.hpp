/*

Copyright (c) 2022, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECEPROOF_PIECE_TASK_HPP_INCLUDED
#define PIECEPROOF_PIECE_TASK_HPP_INCLUDED

#include <optional>
#include <vector>

#include "pieceproof/config.hpp"
#include "pieceproof/units.hpp"
#include "pieceproof/error_code.hpp"
#include "pieceproof/sha1_hash.hpp"

namespace pieceproof::aux {

	// the unit of work the chunk_reader hands to the hashing threads. There
	// are three kinds:
	//
	// * a piece to hash. ``payload`` holds the piece's bytes
	// * a placeholder for a piece whose bytes could not, or should not, be
	//   read. It has neither payload nor error and only counts as progress
	// * an error report. ``error`` is set and there is no payload
	//
	// The same piece index may be used by more than one task, e.g. once for
	// an error and once for the piece itself.
	struct piece_task
	{
		piece_index_t piece{0};
		std::optional<std::vector<char>> payload;

		// the file being read when the task was produced. For error reports,
		// the file the error refers to
		file_index_t file{0};
		storage_error error;

		// the payload is known to contain placeholder bytes. Its digest must
		// be treated as a mismatch regardless of its value
		bool forced_mismatch = false;
	};

	// what a hashing thread produces out of a piece_task
	struct piece_result
	{
		piece_index_t piece{0};
		std::optional<sha1_hash> hash;
		file_index_t file{0};
		storage_error error;
		bool forced_mismatch = false;
	};
}

#endif
