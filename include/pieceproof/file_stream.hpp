/*

Copyright (c) 2022, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECEPROOF_FILE_STREAM_HPP_INCLUDED
#define PIECEPROOF_FILE_STREAM_HPP_INCLUDED

#include <optional>
#include <string>
#include <vector>

#include "pieceproof/config.hpp"
#include "pieceproof/file_storage.hpp"
#include "pieceproof/settings.hpp"
#include "pieceproof/sha1_hash.hpp"
#include "pieceproof/aux_/file_pool.hpp"

namespace pieceproof {

	// random access to single pieces of the content on disk. Open files are
	// kept in a cache of ``hash_settings::max_open_files`` entries. All
	// files are closed by close() or when the file_stream is destructed.
	//
	// Errors are reported by throwing storage_exception.
	class PIECEPROOF_EXPORT file_stream
	{
	public:
		// ``fs`` must outlive the file_stream
		explicit file_stream(file_storage const& fs
			, hash_settings const& sett = hash_settings{});
		~file_stream();

		file_stream(file_stream const&) = delete;
		file_stream& operator=(file_stream const&) = delete;

		// returns the bytes of ``piece``, read from the files under
		// ``content_path``. Fails with errors::piece_index_out_of_range for an
		// invalid piece, with errors::file_size_mismatch if the size of a
		// file on disk differs from its recorded size, and with the
		// operating system's error if a file can't be opened or read.
		std::vector<char> read_piece(piece_index_t piece, std::string const& content_path);

		// the SHA-1 digest of ``piece``, or nullopt if one of the files the
		// piece spans doesn't exist
		std::optional<sha1_hash> piece_hash(piece_index_t piece
			, std::string const& content_path);

		// compares the digest of ``piece`` to ``expected``. Returns nullopt if
		// one of the files the piece spans doesn't exist
		std::optional<bool> verify_piece(piece_index_t piece
			, sha1_hash const& expected, std::string const& content_path);

		// close all open files
		void close();

		int num_open_files() const { return m_pool.num_open(); }

	private:

		file_storage const& m_files;
		aux::file_pool m_pool;
	};
}

#endif
