/*

Copyright (c) 2022, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECEPROOF_VERIFY_HPP_INCLUDED
#define PIECEPROOF_VERIFY_HPP_INCLUDED

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>

#include "pieceproof/config.hpp"
#include "pieceproof/file_storage.hpp"
#include "pieceproof/settings.hpp"
#include "pieceproof/piece_hashes.hpp"
#include "pieceproof/sha1_hash.hpp"
#include "pieceproof/error_code.hpp"

namespace pieceproof {

	// the progress callback of verify_file_sizes(). It's called once for
	// every file with the file_storage, the path of the file on disk, the
	// path inside the file_storage, the number of files checked so far, the
	// total number of files and the error found for the file (if any).
	// Returning true cancels the operation.
	using verify_size_callback = std::function<bool(file_storage const& fs
		, std::string const& fs_path, std::string const& torrent_path
		, int files_done, int files_total, storage_error const& error)>;

	// the progress callback of verify_content(). It's called with the
	// file_storage, the path of the file the event refers to, the number of
	// pieces checked so far, the total number of pieces, the piece the event
	// refers to, its digest (if it could be computed) and the error found
	// (if any). Returning true cancels the operation.
	using verify_content_callback = std::function<bool(file_storage const& fs
		, std::string const& path, int pieces_done, int pieces_total
		, piece_index_t piece, std::optional<sha1_hash> const& hash
		, storage_error const& error)>;

	// returns the path the content is expected at, when verifying the
	// content at ``path``. With ``allow_different_name`` (the default in
	// hash_settings) that's ``path`` itself. Otherwise the last element of
	// ``path`` is replaced by the content name.
	PIECEPROOF_EXPORT std::string content_path_for(file_storage const& fs
		, std::string const& path, bool allow_different_name);

	// checks that every file exists at the expected location with the
	// expected size, without reading any of them. Without a callback, the
	// first error is thrown as storage_exception. With a callback, errors are
	// passed to it and checking continues unless it cancels.
	//
	// Returns true if no error was found and the operation wasn't cancelled.
	PIECEPROOF_EXPORT bool verify_file_sizes(file_storage const& fs
		, std::string const& path
		, verify_size_callback const& cb = verify_size_callback()
		, hash_settings const& sett = hash_settings());

	// compares the digest of every piece of the content at ``path`` with the
	// corresponding digest in ``expected``. Error handling is the same as
	// for verify_file_sizes().
	//
	// Returns true if no error was found and the operation wasn't cancelled.
	PIECEPROOF_EXPORT bool verify_content(file_storage const& fs
		, std::string const& path, piece_hashes const& expected
		, verify_content_callback const& cb = verify_content_callback()
		, hash_settings const& sett = hash_settings());

	// the states a content_verifier goes through
	enum class verify_state : std::uint8_t
	{
		// run() hasn't been called yet
		idle,
		// the file_storage and the digest blob are checked
		validating_input,
		// the content path doesn't exist, or is a file where a directory is
		// expected (or vice versa). This is a final state
		size_mismatch_or_missing,
		// files are being read and hashed
		hashing,
		// the last digests are being compared
		comparing,
		// final states
		success,
		failure,
		cancelled
	};

	PIECEPROOF_EXPORT char const* verify_state_name(verify_state s);

	// runs one content verification. verify_content() is a convenience
	// wrapper around this class. The state can be queried from any thread.
	class PIECEPROOF_EXPORT content_verifier
	{
	public:
		// ``fs`` and ``expected`` must outlive the content_verifier
		content_verifier(file_storage const& fs, piece_hashes const& expected
			, hash_settings const& sett = hash_settings());

		content_verifier(content_verifier const&) = delete;
		content_verifier& operator=(content_verifier const&) = delete;

		// see verify_content()
		bool run(std::string const& path
			, verify_content_callback const& cb = verify_content_callback());

		verify_state state() const { return m_state; }

		// the number of errors reported
		int num_errors() const { return m_num_errors; }

	private:

		file_storage const& m_files;
		piece_hashes const& m_expected;
		hash_settings const m_settings;

		std::atomic<verify_state> m_state{verify_state::idle};
		std::atomic<int> m_num_errors{0};
	};
}

#endif
