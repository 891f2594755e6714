/*

Copyright (c) 2003-2005, 2007-2010, 2012-2020, Arvid Norberg
Copyright (c) 2016-2017, Alden Torres
Copyright (c) 2017, Steven Siloti
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECEPROOF_FILE_STORAGE_HPP_INCLUDED
#define PIECEPROOF_FILE_STORAGE_HPP_INCLUDED

#include <string>
#include <vector>
#include <cstdint>
#include <tuple>

#include "pieceproof/config.hpp"
#include "pieceproof/assert.hpp"
#include "pieceproof/units.hpp"
#include "pieceproof/error_code.hpp"

namespace pieceproof {

	struct hash_settings;

namespace aux {

	// internal
	struct file_entry
	{
		// the path segments of the file. The first segment is the content
		// name
		std::vector<std::string> path;

		// the size of this file
		std::int64_t size = 0;

		// the offset of this file inside the content stream
		std::int64_t offset = 0;
	};

} // namespace aux

	// represents a window of a file in the content stream.
	//
	// The ``file_index`` refers to the index of the file in the file_storage.
	// The ``offset`` is the byte offset in the file where the range starts,
	// and ``size`` is the number of bytes this range is. The size + offset
	// will never be greater than the file size.
	struct PIECEPROOF_EXPORT file_slice
	{
		// the index of the file
		file_index_t file_index;

		// the offset from the start of the file, in bytes
		std::int64_t offset;

		// the size of the window, in bytes
		std::int64_t size;
	};

	// The ``file_storage`` class represents an ordered file list and the piece
	// size. The files are treated as one concatenated byte stream, divided
	// into pieces of ``piece_length()`` bytes (except the last one, which may
	// be shorter). All functions are pure positional arithmetic, no file is
	// ever touched.
	//
	// Queries with an index, offset or path that is not part of the storage
	// throw system_error.
	class PIECEPROOF_EXPORT file_storage
	{
	public:
		// hidden
		file_storage() = default;
		explicit file_storage(int piece_length);
		file_storage(file_storage const&) = default;
		file_storage& operator=(file_storage const&) & = default;
		file_storage(file_storage&&) noexcept = default;
		file_storage& operator=(file_storage&&) & = default;

		// returns true if the piece length has been initialized
		bool is_valid() const { return m_piece_length > 0; }

		// Adds a file to the file storage. ``path`` is the list of path
		// segments, the first of which is the content name. The string
		// overload splits ``path`` at ``/``.
		void add_file(std::vector<std::string> path, std::int64_t size);
		void add_file(std::string const& path, std::int64_t size);

		// returns the number of files in the file_storage
		int num_files() const noexcept
		{ return int(m_files.size()); }

		// returns the index of the one-past-end file in the file storage
		file_index_t end_file() const noexcept
		{ return file_index_t(int(m_files.size())); }

		// returns the total number of bytes all the files span
		std::int64_t total_size() const { return m_total_size; }

		// set and get the size of each piece.
		void set_piece_length(int l);
		int piece_length() const { PIECEPROOF_ASSERT(m_piece_length > 0); return m_piece_length; }

		// the number of pieces, i.e. ceil(total_size() / piece_length())
		int num_pieces() const;

		// returns the index of the last piece. The last piece is special in
		// that it may be smaller than the other pieces. For an empty storage
		// this is -1.
		piece_index_t max_piece_index() const
		{ return piece_index_t(num_pieces() - 1); }

		// returns the index of the one-past-end piece
		piece_index_t end_piece() const
		{ return piece_index_t(num_pieces()); }

		// returns the piece size of ``index``. This will be the same as
		// piece_length(), except for the last piece, which may be shorter.
		int piece_size(piece_index_t index) const;

		// the name of the content. This is the first path segment of the
		// files. For multi-file content, it's the name of the root directory.
		std::string const& name() const;

		// true if the content is a single file directly named by name()
		bool single_file() const;

		// the path segments of the file at ``index``
		std::vector<std::string> const& file_path_segments(file_index_t index) const;

		// returns the ``/``-joined path of the file at ``index``. If
		// ``content_path`` is set, it replaces the first path segment (the
		// content name), forming the path of the file on disk. For single-file
		// content ``content_path`` is the file itself.
		std::string file_path(file_index_t index, std::string const& content_path = "") const;

		// the size of the file at ``index``
		std::int64_t file_size(file_index_t index) const;

		// returns the byte offset of the first byte of the file at ``index``
		// inside the content stream. This is the sum of the sizes of all
		// preceding files
		std::int64_t file_offset(file_index_t index) const;

		// returns the index of the file with the specified path. Throws
		// system_error(errors::file_not_in_storage) if there is no such file
		file_index_t file_index(std::string const& path) const;
		file_index_t file_index(std::vector<std::string> const& path) const;

		// returns the first and last byte (inclusive) of the file at
		// ``index``. For an empty file, last is one less than first.
		std::tuple<std::int64_t, std::int64_t> file_byte_range(file_index_t index) const;

		// returns the file owning the byte at ``offset``. Empty files never
		// own a byte. Throws system_error(errors::offset_out_of_range) unless
		// 0 <= ``offset`` < total_size().
		file_index_t file_index_at_offset(std::int64_t offset) const;

		// returns the files with at least one byte in the inclusive range
		// [``first``, ``last``], in order. Empty files are never included.
		std::vector<file_index_t> files_in_byte_range(std::int64_t first
			, std::int64_t last) const;

		// returns the files with at least one byte in ``piece``. Throws
		// system_error(errors::piece_index_out_of_range) if ``piece`` is
		// outside of [0, max_piece_index()].
		std::vector<file_index_t> files_at_piece(piece_index_t piece) const;

		// returns the indices of all pieces that contain at least one byte of
		// the file at ``index``. If ``exclusive`` is true, the first and last
		// piece are left out when they also contain bytes of another file.
		std::vector<piece_index_t> file_piece_indexes(file_index_t index
			, bool exclusive = false) const;

		// maps piece indices relative to the first piece of the file at
		// ``index`` into absolute piece indices. Negative values count from
		// the last piece of the file (-1 is the last piece). Out of range
		// values are clamped to the first or last piece of the file. The
		// result is sorted and has no duplicates.
		std::vector<piece_index_t> absolute_piece_indexes(file_index_t index
			, std::vector<int> const& relative) const;

		// like absolute_piece_indexes(), but the result remains relative to
		// the file's first piece.
		std::vector<int> relative_piece_indexes(file_index_t index
			, std::vector<int> const& relative) const;

		// returns a list of file_slice objects representing the portions of
		// files the specified piece index, byte offset and size range
		// overlaps. Empty files are skipped.
		//
		// Preconditions of this function is that the input range is within
		// the content stream.
		std::vector<file_slice> map_block(piece_index_t piece, std::int64_t offset
			, std::int64_t size) const;

		// checks that there is at least one file and that the piece length is
		// a power of two within the limits of ``sett``. Sets ``ec`` to
		// errors::no_files or errors::invalid_piece_size otherwise.
		void validate(hash_settings const& sett, error_code& ec) const;

	private:

		void check_file(file_index_t index) const;
		void check_piece(piece_index_t piece) const;

		// the number of bytes in a regular piece
		// (i.e. not the potentially truncated last piece)
		int m_piece_length = 0;

		// the list of files, in content stream order
		std::vector<aux::file_entry> m_files;

		// the sum of all file sizes
		std::int64_t m_total_size = 0;
	};

} // namespace pieceproof

#endif // PIECEPROOF_FILE_STORAGE_HPP_INCLUDED
