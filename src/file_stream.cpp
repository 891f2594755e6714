/*

Copyright (c) 2022, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "pieceproof/config.hpp"
#include "pieceproof/file_stream.hpp"
#include "pieceproof/hasher.hpp"
#include "pieceproof/aux_/file.hpp"
#include "pieceproof/aux_/throw.hpp"
#include "pieceproof/aux_/debug_log.hpp"

#include <algorithm>

namespace pieceproof {

	file_stream::file_stream(file_storage const& fs, hash_settings const& sett)
		: m_files(fs)
		, m_pool(std::max(1, sett.max_open_files))
	{}

	file_stream::~file_stream() = default;

	std::vector<char> file_stream::read_piece(piece_index_t const piece
		, std::string const& content_path)
	{
		if (piece < piece_index_t(0) || piece > m_files.max_piece_index())
		{
			storage_error se(errors::piece_index_out_of_range, operation_t::file_read);
			se.piece = piece;
			aux::throw_ex<storage_exception>(std::move(se));
		}

		int const piece_size = m_files.piece_size(piece);
		std::vector<char> ret(std::size_t(piece_size), 0);
		span<char> buf(ret);

		for (file_slice const& slice : m_files.map_block(piece, 0, piece_size))
		{
			std::string const path = m_files.file_path(slice.file_index, content_path);
			std::int64_t const expected_size = m_files.file_size(slice.file_index);

			storage_error se;
			se.file(slice.file_index);
			se.path = path;
			se.expected_size = expected_size;
			try
			{
				std::shared_ptr<aux::file_handle> f = m_pool.open_file(path);

				std::int64_t const size = f->get_size();
				if (size != expected_size)
				{
					se.ec = errors::file_size_mismatch;
					se.operation = operation_t::check_size;
					se.actual_size = size;
					aux::throw_ex<storage_exception>(std::move(se));
				}

				auto const chunk = buf.first(std::ptrdiff_t(slice.size));
				aux::pread_all(f->fd(), chunk, slice.offset, se.ec);
				if (se.ec)
				{
					se.operation = operation_t::file_read;
					aux::throw_ex<storage_exception>(std::move(se));
				}
				buf = buf.subspan(std::ptrdiff_t(slice.size));
			}
			catch (storage_error const& e)
			{
				// opening or stat'ing the file failed
				se.ec = e.ec;
				se.operation = e.operation;
				DLOG("file_stream: %s: %s\n", path.c_str(), se.ec.message().c_str());
				aux::throw_ex<storage_exception>(std::move(se));
			}
		}
		return ret;
	}

	std::optional<sha1_hash> file_stream::piece_hash(piece_index_t const piece
		, std::string const& content_path)
	{
		try
		{
			std::vector<char> const buf = read_piece(piece, content_path);
			return hasher(buf).final();
		}
		catch (storage_exception const& e)
		{
			if (e.error().operation == operation_t::file_open
				&& e.error().ec == boost::system::errc::no_such_file_or_directory)
				return std::nullopt;
			throw;
		}
	}

	std::optional<bool> file_stream::verify_piece(piece_index_t const piece
		, sha1_hash const& expected, std::string const& content_path)
	{
		std::optional<sha1_hash> const h = piece_hash(piece, content_path);
		if (!h) return std::nullopt;
		return *h == expected;
	}

	void file_stream::close()
	{
		m_pool.release();
	}
}
