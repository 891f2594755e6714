/*

Copyright (c) 2008-2020, Arvid Norberg
Copyright (c) 2016-2017, Alden Torres
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECEPROOF_GENERATE_HPP_INCLUDED
#define PIECEPROOF_GENERATE_HPP_INCLUDED

#include <functional>
#include <string>

#include "pieceproof/config.hpp"
#include "pieceproof/file_storage.hpp"
#include "pieceproof/settings.hpp"
#include "pieceproof/piece_hashes.hpp"

namespace pieceproof {

	// the progress callback of generate_piece_hashes(). It's called with the
	// file_storage, the path of the file currently being hashed, the number
	// of pieces hashed so far and the total number of pieces. Returning true
	// cancels the operation.
	using generate_callback = std::function<bool(file_storage const& fs
		, std::string const& path, int pieces_done, int pieces_total)>;

	// computes the SHA-1 digest of every piece of the content at ``path``
	// and stores them in ``hashes``. ``path`` replaces the content name of
	// the file paths (see file_storage::file_path()).
	//
	// Before any file is read, ``fs`` is validated (see
	// file_storage::validate()), ``path`` must exist and the content must not
	// be empty. Any error aborts the operation by throwing
	// storage_exception.
	//
	// Returns true once all pieces have been hashed, false if the callback
	// cancelled the operation, in which case ``hashes`` is left untouched.
	PIECEPROOF_EXPORT bool generate_piece_hashes(file_storage const& fs
		, std::string const& path, piece_hashes& hashes
		, generate_callback const& cb = generate_callback()
		, hash_settings const& sett = hash_settings());

	// this overload reports errors in ``ec`` instead of throwing
	PIECEPROOF_EXPORT bool generate_piece_hashes(file_storage const& fs
		, std::string const& path, piece_hashes& hashes
		, generate_callback const& cb, hash_settings const& sett
		, storage_error& ec);
}

#endif
