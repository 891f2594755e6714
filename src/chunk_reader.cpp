/*

Copyright (c) 2022, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "pieceproof/config.hpp"
#include "pieceproof/aux_/chunk_reader.hpp"
#include "pieceproof/aux_/path.hpp"
#include "pieceproof/aux_/throw.hpp"
#include "pieceproof/aux_/debug_log.hpp"
#include "pieceproof/assert.hpp"

#include <algorithm>
#include <cinttypes>

namespace pieceproof::aux {

namespace {

	// exhausts the queue when going out of scope, to unblock the consumers
	// regardless of how the reader exits
	struct exhaust_on_exit
	{
		explicit exhaust_on_exit(exhaust_queue<piece_task>& q) : m_queue(q) {}
		~exhaust_on_exit() { m_queue.exhaust(); }
		exhaust_on_exit(exhaust_on_exit const&) = delete;
		exhaust_on_exit& operator=(exhaust_on_exit const&) = delete;
	private:
		exhaust_queue<piece_task>& m_queue;
	};
}

	chunk_reader::chunk_reader(file_storage const& fs, std::string content_path
		, exhaust_queue<piece_task>& out)
		: m_files(fs)
		, m_content_path(std::move(content_path))
		, m_queue(out)
	{}

	void chunk_reader::read()
	{
		if (m_used.exchange(true))
			aux::throw_ex<system_error>(errors::reader_already_used);

		exhaust_on_exit guard(m_queue);

		DLOG("reader: start %d files %d pieces\n", m_files.num_files()
			, m_files.num_pieces());

		for (file_index_t f(0); f < m_files.end_file(); ++f)
		{
			if (m_stop)
			{
				DLOG("reader: stopped at piece %d\n", static_cast<int>(current_piece()));
				return;
			}

			std::int64_t const offset = m_files.file_offset(f);
			std::int64_t const size = m_files.file_size(f);
			read_mode::type mode = open_file(f);

			if (auto* r = std::get_if<read_mode::real_read>(&mode))
			{
				read_file(f, *r);
				continue;
			}

			if (std::get_if<read_mode::faked_missing>(&mode))
			{
				storage_error e(errors::path_not_found, f, operation_t::file_stat);
				e.expected_size = size;
				report_error(f, offset, std::move(e));
			}
			else if (auto* m = std::get_if<read_mode::faked_size_mismatch>(&mode))
			{
				storage_error e(errors::file_size_mismatch, f, operation_t::check_size);
				e.actual_size = m->actual_size;
				e.expected_size = size;
				report_error(f, offset, std::move(e));
			}
			else if (auto* u = std::get_if<read_mode::faked_unreadable>(&mode))
			{
				report_error(f, offset, u->error);
			}
			else
			{
				DLOG("reader: file %d skipped before opening it\n", static_cast<int>(f));
			}

			fake_bytes(f, size);
		}

		// the last piece is flushed as soon as it's complete
		PIECEPROOF_ASSERT(m_stop || m_fill == 0);
		DLOG("reader: done\n");
	}

	read_mode::type chunk_reader::open_file(file_index_t const f) const
	{
		if (is_skipped(f)) return read_mode::faked_skipped{};

		std::string const path = m_files.file_path(f, m_content_path);
		std::int64_t const expected_size = m_files.file_size(f);

		file_status st;
		error_code ec;
		stat_file(path, &st, ec);
		if (ec == boost::system::errc::no_such_file_or_directory
			|| ec == boost::system::errc::not_a_directory)
		{
			DLOG("reader: %s: missing\n", path.c_str());
			return read_mode::faked_missing{};
		}
		if (ec)
		{
			DLOG("reader: %s: stat failed: %s\n", path.c_str(), ec.message().c_str());
			return read_mode::faked_unreadable{storage_error(ec, f, operation_t::file_stat)};
		}
		if (st.mode & file_status::directory)
		{
			DLOG("reader: %s: is a directory\n", path.c_str());
			return read_mode::faked_unreadable{storage_error(errors::is_a_directory
				, f, operation_t::file_stat)};
		}
		if (st.file_size != expected_size)
		{
			DLOG("reader: %s: size %" PRId64 " expected %" PRId64 "\n", path.c_str()
				, st.file_size, expected_size);
			return read_mode::faked_size_mismatch{st.file_size};
		}

		// there's nothing to read from an empty file
		if (expected_size == 0) return read_mode::real_read{};

		try
		{
			return read_mode::real_read{file_handle(path)};
		}
		catch (storage_error const& e)
		{
			DLOG("reader: %s: open failed: %s\n", path.c_str(), e.ec.message().c_str());
			return read_mode::faked_unreadable{storage_error(e.ec, f, e.operation)};
		}
	}

	void chunk_reader::read_file(file_index_t const f, read_mode::real_read& mode)
	{
		std::int64_t const size = m_files.file_size(f);
		std::int64_t file_pos = 0;

		DLOG("reader: reading file %d (%" PRId64 " bytes)\n", static_cast<int>(f), size);

		while (file_pos < size)
		{
			if (m_stop) return;
			if (is_skipped(f))
			{
				DLOG("reader: file %d skipped at %" PRId64 "\n", static_cast<int>(f), file_pos);
				fake_bytes(f, size - file_pos);
				return;
			}

			int const piece_size = current_piece_size();
			int const want = int(std::min(std::int64_t(piece_size - m_fill), size - file_pos));
			materialize_buffer();

			error_code ec;
			int const got = pread_all(mode.handle.fd()
				, span<char>(m_buffer.data() + m_fill, want), file_pos, ec);

			if (got > 0)
			{
				if (m_has_fake) m_do_not_skip.insert(current_piece());
				m_has_real = true;
				m_fill += got;
				file_pos += got;
			}

			if (ec)
			{
				// the file may have been truncated since we stat'ed it, or
				// the device failed. Either way, the rest of the file is
				// unavailable
				DLOG("reader: file %d read failed at %" PRId64 ": %s\n"
					, static_cast<int>(f), file_pos, ec.message().c_str());
				report_error(f, m_files.file_offset(f) + file_pos
					, storage_error(ec, f, operation_t::file_read));
				fake_bytes(f, size - file_pos);
				return;
			}

			PIECEPROOF_ASSERT(got == want);
			if (m_fill == piece_size) flush_piece(f);
		}
	}

	void chunk_reader::fake_bytes(file_index_t const f, std::int64_t size)
	{
		while (size > 0)
		{
			if (m_stop) return;

			int const piece_size = current_piece_size();
			int const n = int(std::min(std::int64_t(piece_size - m_fill), size));

			// placeholder bytes are zeros. As long as there's no buffer, it
			// will be zero-filled once it's created
			if (!m_buffer.empty())
				std::fill(m_buffer.begin() + m_fill, m_buffer.begin() + m_fill + n, char(0));

			if (m_has_real) m_do_not_skip.insert(current_piece());
			m_has_fake = true;
			m_fill += n;
			size -= n;

			if (m_fill == piece_size) flush_piece(f);
		}
	}

	void chunk_reader::report_error(file_index_t const f, std::int64_t const offset
		, storage_error e)
	{
		int const last_piece = static_cast<int>(m_files.max_piece_index());
		int const piece = int(std::min(std::int64_t(last_piece)
			, offset / m_files.piece_length()));

		e.file(f);
		if (e.path.empty()) e.path = m_files.file_path(f, m_content_path);

		piece_task t;
		t.piece = piece_index_t(std::max(0, piece));
		t.file = f;
		t.error = std::move(e);
		DLOG("reader: error in file %d at piece %d: %s\n", static_cast<int>(f)
			, static_cast<int>(t.piece), t.error.message().c_str());
		push(std::move(t));
	}

	void chunk_reader::materialize_buffer()
	{
		if (!m_buffer.empty()) return;
		m_buffer.assign(std::size_t(current_piece_size()), char(0));
	}

	void chunk_reader::flush_piece(file_index_t const f)
	{
		piece_task t;
		t.piece = current_piece();
		t.file = f;

		bool const do_not_skip = m_do_not_skip.count(t.piece) > 0;
		if (m_has_real || do_not_skip)
		{
			materialize_buffer();
			m_buffer.resize(std::size_t(m_fill));
			t.payload = std::move(m_buffer);
			t.forced_mismatch = m_has_fake || do_not_skip;
		}
		m_buffer.clear();

		m_piece_start += m_fill;
		m_fill = 0;
		m_has_real = false;
		m_has_fake = false;

		push(std::move(t));
	}

	bool chunk_reader::push(piece_task t)
	{
		if (m_queue.push(std::move(t))) return true;
		// the queue was exhausted by someone stopping the pipeline
		m_stop = true;
		return false;
	}

	piece_index_t chunk_reader::current_piece() const
	{
		return piece_index_t(int(m_piece_start / m_files.piece_length()));
	}

	int chunk_reader::current_piece_size() const
	{
		return m_files.piece_size(current_piece());
	}

	void chunk_reader::stop()
	{
		m_stop = true;
		m_queue.exhaust();
	}

	void chunk_reader::skip_file(file_index_t const f)
	{
		std::lock_guard<std::mutex> l(m_skip_mutex);
		m_skipped.insert(f);
	}

	bool chunk_reader::is_skipped(file_index_t const f) const
	{
		std::lock_guard<std::mutex> l(m_skip_mutex);
		return m_skipped.count(f) > 0;
	}

	std::set<piece_index_t> chunk_reader::do_not_skip() const
	{
		return m_do_not_skip;
	}
}
