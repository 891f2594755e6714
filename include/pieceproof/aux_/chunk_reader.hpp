/*

Copyright (c) 2022, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECEPROOF_CHUNK_READER_HPP_INCLUDED
#define PIECEPROOF_CHUNK_READER_HPP_INCLUDED

#include <atomic>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "pieceproof/config.hpp"
#include "pieceproof/file_storage.hpp"
#include "pieceproof/error_code.hpp"
#include "pieceproof/aux_/file.hpp"
#include "pieceproof/aux_/exhaust_queue.hpp"
#include "pieceproof/aux_/piece_task.hpp"

namespace pieceproof::aux {

	// the read mode of a file, decided once before its first byte is read
	namespace read_mode {

		// the file exists with the expected size and is read from disk
		struct real_read
		{
			file_handle handle;
		};

		// the file doesn't exist
		struct faked_missing {};

		// the file exists, but its size differs from the recorded size
		struct faked_size_mismatch
		{
			std::int64_t actual_size;
		};

		// stat() or open() failed, or the path is a directory
		struct faked_unreadable
		{
			storage_error error;
		};

		// skip_file() was called for the file before it was opened
		struct faked_skipped {};

		using type = std::variant<real_read, faked_missing, faked_size_mismatch
			, faked_unreadable, faked_skipped>;
	}

	// the chunk_reader walks the files of a file_storage in order, and cuts
	// the concatenated stream into pieces. Every complete piece (and the
	// final, possibly shorter, one) is pushed onto the output queue as a
	// piece_task.
	//
	// Files that are missing, have the wrong size or fail to read are not
	// (or no longer) read. Instead the reader reports the error once and
	// stands in placeholder bytes for the rest of the file, so the pieces of
	// all following files keep their alignment. A piece made up entirely of
	// placeholder bytes is sent without payload. A piece mixing real bytes
	// and placeholder bytes is sent with its payload, but flagged as a
	// forced mismatch.
	//
	// A chunk_reader can only read once.
	struct PIECEPROOF_EXTRA_EXPORT chunk_reader
	{
		// ``content_path`` replaces the content name in the file paths, see
		// file_storage::file_path(). ``fs`` and ``out`` must outlive the
		// reader.
		chunk_reader(file_storage const& fs, std::string content_path
			, exhaust_queue<piece_task>& out);

		chunk_reader(chunk_reader const&) = delete;
		chunk_reader& operator=(chunk_reader const&) = delete;

		// reads all files, blocking on the output queue when it's full. When
		// done, or stopped, the output queue is exhausted. Throws
		// system_error(errors::reader_already_used) when called a second time.
		void read();

		// may be called from any thread. read() returns as soon as possible
		void stop();
		bool stopped() const { return m_stop; }

		// may be called from any thread. The remaining bytes of ``f`` are
		// replaced by placeholder bytes, without reporting an error
		void skip_file(file_index_t f);
		bool is_skipped(file_index_t f) const;

		// the pieces that contain real bytes of one file and placeholder bytes
		// of another. Only valid once read() has returned
		std::set<piece_index_t> do_not_skip() const;

	private:

		read_mode::type open_file(file_index_t f) const;

		void read_file(file_index_t f, read_mode::real_read& mode);

		// adds ``size`` placeholder bytes for file ``f`` to the stream
		void fake_bytes(file_index_t f, std::int64_t size);

		// sends an error report for ``f``, positioned at the piece covering
		// byte ``offset`` of the stream
		void report_error(file_index_t f, std::int64_t offset, storage_error e);

		// makes sure m_buffer can hold a whole piece, and zero-fills the
		// placeholder bytes the current piece has so far
		void materialize_buffer();

		void flush_piece(file_index_t f);

		bool push(piece_task t);

		piece_index_t current_piece() const;
		int current_piece_size() const;

		file_storage const& m_files;
		std::string const m_content_path;
		exhaust_queue<piece_task>& m_queue;

		// the bytes of the current piece. Stays empty as long as the current
		// piece only has placeholder bytes
		std::vector<char> m_buffer;

		// the number of bytes (real or placeholder) of the current piece
		int m_fill = 0;
		bool m_has_real = false;
		bool m_has_fake = false;

		// the stream offset of the first byte of the current piece
		std::int64_t m_piece_start = 0;

		// pieces where real bytes meet placeholder bytes
		std::set<piece_index_t> m_do_not_skip;

		std::atomic<bool> m_stop{false};
		std::atomic<bool> m_used{false};

		mutable std::mutex m_skip_mutex;
		std::set<file_index_t> m_skipped;
	};
}

#endif
