/*

Copyright (c) 2003-2020, Arvid Norberg
Copyright (c) 2016-2017, Alden Torres
Copyright (c) 2017, Steven Siloti
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "pieceproof/config.hpp"
#include "pieceproof/file_storage.hpp"
#include "pieceproof/settings.hpp"
#include "pieceproof/aux_/path.hpp"
#include "pieceproof/aux_/throw.hpp"

#include <algorithm>
#include <set>

namespace pieceproof {

namespace {

	bool compare_file_offset(aux::file_entry const& lhs, aux::file_entry const& rhs)
	{
		return lhs.offset < rhs.offset;
	}

	std::vector<std::string> split_path(std::string const& p)
	{
		std::vector<std::string> ret;
		std::string::size_type start = 0;
		while (start <= p.size())
		{
			auto const sep = p.find('/', start);
			auto const end = sep == std::string::npos ? p.size() : sep;
			if (end > start) ret.emplace_back(p.substr(start, end - start));
			if (sep == std::string::npos) break;
			start = sep + 1;
		}
		return ret;
	}

	std::string join_path(std::vector<std::string> const& segments)
	{
		std::string ret;
		for (auto const& s : segments) aux::append_path(ret, s);
		return ret;
	}
}

	file_storage::file_storage(int const piece_length)
		: m_piece_length(piece_length)
	{
		PIECEPROOF_ASSERT_PRECOND(piece_length > 0);
	}

	void file_storage::set_piece_length(int const l)
	{
		PIECEPROOF_ASSERT_PRECOND(l > 0);
		m_piece_length = l;
	}

	void file_storage::add_file(std::vector<std::string> path, std::int64_t const size)
	{
		PIECEPROOF_ASSERT_PRECOND(!path.empty());
		PIECEPROOF_ASSERT_PRECOND(size >= 0);

		aux::file_entry e;
		e.path = std::move(path);
		e.size = size;
		e.offset = m_total_size;
		m_files.push_back(std::move(e));
		m_total_size += size;
	}

	void file_storage::add_file(std::string const& path, std::int64_t const size)
	{
		add_file(split_path(path), size);
	}

	int file_storage::num_pieces() const
	{
		PIECEPROOF_ASSERT(m_piece_length > 0);
		if (m_piece_length <= 0) return 0;
		return int((m_total_size + m_piece_length - 1) / m_piece_length);
	}

	int file_storage::piece_size(piece_index_t const index) const
	{
		check_piece(index);
		if (index == max_piece_index())
		{
			std::int64_t const size_except_last
				= (num_pieces() - 1) * std::int64_t(piece_length());
			std::int64_t const size = total_size() - size_except_last;
			PIECEPROOF_ASSERT(size <= piece_length());
			return size > 0 ? int(size) : piece_length();
		}
		else
			return piece_length();
	}

	std::string const& file_storage::name() const
	{
		static std::string const empty;
		if (m_files.empty()) return empty;
		return m_files.front().path.front();
	}

	bool file_storage::single_file() const
	{
		return m_files.size() == 1 && m_files.front().path.size() == 1;
	}

	std::vector<std::string> const& file_storage::file_path_segments(file_index_t const index) const
	{
		check_file(index);
		return m_files[std::size_t(static_cast<int>(index))].path;
	}

	std::string file_storage::file_path(file_index_t const index
		, std::string const& content_path) const
	{
		auto const& segments = file_path_segments(index);
		if (content_path.empty()) return join_path(segments);
		if (single_file()) return content_path;

		std::string ret = content_path;
		for (std::size_t i = 1; i < segments.size(); ++i)
			aux::append_path(ret, segments[i]);
		return ret;
	}

	std::int64_t file_storage::file_size(file_index_t const index) const
	{
		check_file(index);
		return m_files[std::size_t(static_cast<int>(index))].size;
	}

	std::int64_t file_storage::file_offset(file_index_t const index) const
	{
		check_file(index);
		return m_files[std::size_t(static_cast<int>(index))].offset;
	}

	file_index_t file_storage::file_index(std::vector<std::string> const& path) const
	{
		auto const i = std::find_if(m_files.begin(), m_files.end()
			, [&](aux::file_entry const& e) { return e.path == path; });
		if (i == m_files.end())
			aux::throw_ex<system_error>(errors::file_not_in_storage
				, "file not specified: " + join_path(path));
		return file_index_t(int(i - m_files.begin()));
	}

	file_index_t file_storage::file_index(std::string const& path) const
	{
		return file_index(split_path(path));
	}

	std::tuple<std::int64_t, std::int64_t> file_storage::file_byte_range(
		file_index_t const index) const
	{
		std::int64_t const start = file_offset(index);
		return std::make_tuple(start, start + file_size(index) - 1);
	}

	file_index_t file_storage::file_index_at_offset(std::int64_t const offset) const
	{
		if (offset < 0 || offset >= m_total_size)
		{
			aux::throw_ex<system_error>(errors::offset_out_of_range
				, "position is out of bounds (0 - " + std::to_string(m_total_size - 1)
				+ "): " + std::to_string(offset));
		}

		// find the file iterator and file offset
		aux::file_entry target;
		target.offset = offset;
		PIECEPROOF_ASSERT(!compare_file_offset(target, m_files.front()));

		// empty files share their offset with the next file. upper_bound()
		// skips past all of them, to the last file starting at or before
		// ``offset``, which is the one owning the byte
		auto file_iter = std::upper_bound(
			m_files.begin(), m_files.end(), target, compare_file_offset);

		PIECEPROOF_ASSERT(file_iter != m_files.begin());
		--file_iter;
		PIECEPROOF_ASSERT(file_iter->size > 0);
		return file_index_t{int(file_iter - m_files.begin())};
	}

	std::vector<file_index_t> file_storage::files_in_byte_range(std::int64_t const first
		, std::int64_t const last) const
	{
		PIECEPROOF_ASSERT_PRECOND(first <= last);
		std::vector<file_index_t> ret;
		for (std::size_t i = 0; i < m_files.size(); ++i)
		{
			auto const& e = m_files[i];
			if (e.size == 0) continue;
			std::int64_t const file_first = e.offset;
			std::int64_t const file_last = e.offset + e.size - 1;
			if (file_first > last) break;
			if (file_last < first) continue;
			ret.push_back(file_index_t(int(i)));
		}
		return ret;
	}

	std::vector<file_index_t> file_storage::files_at_piece(piece_index_t const piece) const
	{
		check_piece(piece);
		std::int64_t const first = static_cast<int>(piece) * std::int64_t(piece_length());
		std::int64_t const last = std::min(first + piece_length() - 1, m_total_size - 1);
		return files_in_byte_range(first, last);
	}

	std::vector<piece_index_t> file_storage::file_piece_indexes(file_index_t const index
		, bool const exclusive) const
	{
		std::vector<piece_index_t> ret;
		std::int64_t const size = file_size(index);
		if (size == 0) return ret;

		std::int64_t const offset = file_offset(index);
		piece_index_t const first(int(offset / piece_length()));
		piece_index_t const last(int((offset + size - 1) / piece_length()));
		for (piece_index_t i = first; i <= last; ++i)
			ret.push_back(i);

		if (exclusive)
		{
			std::vector<file_index_t> const only_this{index};
			if (files_at_piece(first) != only_this)
				ret.erase(ret.begin());
			if (!ret.empty() && ret.back() == last && files_at_piece(last) != only_this)
				ret.pop_back();
		}
		return ret;
	}

	std::vector<piece_index_t> file_storage::absolute_piece_indexes(file_index_t const index
		, std::vector<int> const& relative) const
	{
		std::vector<piece_index_t> const pieces = file_piece_indexes(index);
		if (pieces.empty()) return {};

		int const abs_min = static_cast<int>(pieces.front());
		std::set<piece_index_t> ret;
		for (int const rel : relative_piece_indexes(index, relative))
			ret.insert(piece_index_t(abs_min + rel));
		return std::vector<piece_index_t>(ret.begin(), ret.end());
	}

	std::vector<int> file_storage::relative_piece_indexes(file_index_t const index
		, std::vector<int> const& relative) const
	{
		std::vector<piece_index_t> const pieces = file_piece_indexes(index);
		if (pieces.empty()) return {};

		int const rel_max = static_cast<int>(pieces.back()) - static_cast<int>(pieces.front());
		std::set<int> ret;
		for (int rel : relative)
		{
			// negative indices count from the end. -1 is the last piece
			if (rel < 0) rel = rel_max + rel + 1;
			ret.insert(std::max(0, std::min(rel_max, rel)));
		}
		return std::vector<int>(ret.begin(), ret.end());
	}

	std::vector<file_slice> file_storage::map_block(piece_index_t const piece
		, std::int64_t const offset, std::int64_t size) const
	{
		PIECEPROOF_ASSERT_PRECOND(piece >= piece_index_t{0});
		PIECEPROOF_ASSERT_PRECOND(piece < end_piece());
		PIECEPROOF_ASSERT_PRECOND(num_files() > 0);
		PIECEPROOF_ASSERT_PRECOND(size >= 0);
		std::vector<file_slice> ret;

		if (m_files.empty()) return ret;

		// find the file iterator and file offset
		aux::file_entry target;
		target.offset = static_cast<int>(piece) * std::int64_t(m_piece_length) + offset;
		PIECEPROOF_ASSERT_PRECOND(target.offset <= m_total_size - size);
		PIECEPROOF_ASSERT(!compare_file_offset(target, m_files.front()));

		// in case the size is past the end, fix it up
		if (target.offset > m_total_size - size)
			size = m_total_size - target.offset;

		auto file_iter = std::upper_bound(
			m_files.begin(), m_files.end(), target, compare_file_offset);

		PIECEPROOF_ASSERT(file_iter != m_files.begin());
		--file_iter;

		std::int64_t file_offset = target.offset - file_iter->offset;
		for (; size > 0; file_offset -= file_iter->size, ++file_iter)
		{
			PIECEPROOF_ASSERT(file_iter != m_files.end());
			if (file_offset < file_iter->size)
			{
				file_slice f{};
				f.file_index = file_index_t(int(file_iter - m_files.begin()));
				f.offset = file_offset;
				f.size = std::min(file_iter->size - file_offset, size);
				PIECEPROOF_ASSERT(f.size <= size);
				size -= f.size;
				file_offset += f.size;
				ret.push_back(f);
			}

			PIECEPROOF_ASSERT(size >= 0);
		}
		return ret;
	}

	void file_storage::validate(hash_settings const& sett, error_code& ec) const
	{
		ec.clear();
		if (m_files.empty())
		{
			ec = errors::no_files;
			return;
		}

		// the piece size must be a power of two
		if (m_piece_length <= 0
			|| (m_piece_length & (m_piece_length - 1)) != 0
			|| m_piece_length < sett.piece_size_min
			|| m_piece_length > sett.piece_size_max)
		{
			ec = errors::invalid_piece_size;
			return;
		}
	}

	void file_storage::check_file(file_index_t const index) const
	{
		if (index < file_index_t(0) || index >= end_file())
		{
			aux::throw_ex<system_error>(errors::file_not_in_storage
				, "file index out of range: " + to_string(index));
		}
	}

	void file_storage::check_piece(piece_index_t const piece) const
	{
		if (piece < piece_index_t(0) || piece > max_piece_index())
		{
			aux::throw_ex<system_error>(errors::piece_index_out_of_range
				, "piece index is out of bounds (0 - "
				+ to_string(max_piece_index()) + "): " + to_string(piece));
		}
	}
}
