/*

Copyright (c) 2022, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "pieceproof/verify.hpp"
#include "pieceproof/aux_/hash_pipeline.hpp"
#include "pieceproof/aux_/cancellable_callback.hpp"
#include "pieceproof/aux_/path.hpp"
#include "pieceproof/aux_/throw.hpp"
#include "pieceproof/aux_/debug_log.hpp"

#include <vector>

namespace pieceproof {

namespace {

	using size_progress = aux::cancellable_callback<file_storage const&
		, std::string const&, std::string const&, int, int, storage_error const&>;

	using content_progress = aux::cancellable_callback<file_storage const&
		, std::string const&, int, int, piece_index_t
		, std::optional<sha1_hash> const&, storage_error const&>;

	void validate_input(file_storage const& fs, hash_settings const& sett)
	{
		error_code ec;
		fs.validate(sett, ec);
		if (ec) aux::throw_ex<storage_exception>(storage_error(ec, operation_t::validate));
	}

	bool is_missing(error_code const& ec)
	{
		return ec == boost::system::errc::no_such_file_or_directory
			|| ec == boost::system::errc::not_a_directory;
	}

	// checks that the content root has the right shape. Multi-file content
	// must be a directory, single-file content must not be one
	storage_error check_content_root(file_storage const& fs
		, std::string const& content_path)
	{
		storage_error ret;
		ret.path = content_path;

		aux::file_status st;
		error_code ec;
		aux::stat_file(content_path, &st, ec);
		if (is_missing(ec))
		{
			ret.ec = errors::path_not_found;
			ret.operation = operation_t::file_stat;
			ret.expected_size = fs.total_size();
		}
		else if (ec)
		{
			ret.ec = ec;
			ret.operation = operation_t::file_stat;
		}
		else if (fs.single_file() && (st.mode & aux::file_status::directory))
		{
			ret.ec = errors::is_a_directory;
			ret.operation = operation_t::check_size;
		}
		else if (!fs.single_file() && !(st.mode & aux::file_status::directory))
		{
			ret.ec = errors::not_a_directory;
			ret.operation = operation_t::check_size;
		}
		return ret;
	}

	storage_error check_file_size(file_storage const& fs, file_index_t const f
		, std::string const& fs_path)
	{
		storage_error ret(error_code(), f, operation_t::check_size);
		ret.path = fs_path;
		ret.expected_size = fs.file_size(f);

		aux::file_status st;
		error_code ec;
		aux::stat_file(fs_path, &st, ec);
		if (is_missing(ec))
		{
			ret.ec = errors::path_not_found;
			ret.operation = operation_t::file_stat;
		}
		else if (ec)
		{
			ret.ec = ec;
			ret.operation = operation_t::file_stat;
		}
		else if (st.mode & aux::file_status::directory)
		{
			ret.ec = errors::is_a_directory;
		}
		else if (st.file_size != ret.expected_size)
		{
			ret.ec = errors::file_size_mismatch;
			ret.actual_size = st.file_size;
		}
		return ret;
	}
}

	std::string content_path_for(file_storage const& fs
		, std::string const& path, bool const allow_different_name)
	{
		if (allow_different_name) return path;
		return aux::combine_path(aux::parent_path(path), fs.name());
	}

	bool verify_file_sizes(file_storage const& fs
		, std::string const& path
		, verify_size_callback const& cb
		, hash_settings const& sett)
	{
		validate_input(fs, sett);

		std::string const content_path = content_path_for(fs, path
			, sett.allow_different_name);
		int const num_files = fs.num_files();
		size_progress progress(cb, sett.progress_interval);

		storage_error const root_error = check_content_root(fs, content_path);
		bool ok = true;
		for (file_index_t f(0); f < fs.end_file(); ++f)
		{
			std::string const fs_path = fs.file_path(f, content_path);
			storage_error e = check_file_size(fs, f, fs_path);

			// a content root of the wrong shape is reported for the first
			// file, instead of its own (consequential) error
			if (root_error && f == file_index_t(0))
			{
				e = root_error;
				e.file(f);
			}

			int const files_done = static_cast<int>(f) + 1;
			if (e)
			{
				ok = false;
				DLOG("verify: %s\n", e.message().c_str());
				if (!progress) aux::throw_ex<storage_exception>(e);
			}

			if (progress(bool(e) || files_done == num_files
				, fs, fs_path, fs.file_path(f), files_done, num_files, e))
				return false;
		}
		return ok;
	}

	bool verify_content(file_storage const& fs
		, std::string const& path, piece_hashes const& expected
		, verify_content_callback const& cb
		, hash_settings const& sett)
	{
		content_verifier v(fs, expected, sett);
		return v.run(path, cb);
	}

	char const* verify_state_name(verify_state const s)
	{
		switch (s)
		{
			case verify_state::idle: return "idle";
			case verify_state::validating_input: return "validating_input";
			case verify_state::size_mismatch_or_missing: return "size_mismatch_or_missing";
			case verify_state::hashing: return "hashing";
			case verify_state::comparing: return "comparing";
			case verify_state::success: return "success";
			case verify_state::failure: return "failure";
			case verify_state::cancelled: return "cancelled";
		}
		return "";
	}

	content_verifier::content_verifier(file_storage const& fs
		, piece_hashes const& expected, hash_settings const& sett)
		: m_files(fs)
		, m_expected(expected)
		, m_settings(sett)
	{}

	bool content_verifier::run(std::string const& path
		, verify_content_callback const& cb)
	{
		m_num_errors = 0;
		m_state = verify_state::validating_input;

		try
		{
			validate_input(m_files, m_settings);
			if (m_expected.num_pieces() != m_files.num_pieces())
			{
				aux::throw_ex<storage_exception>(storage_error(errors::invalid_piece_hashes
					, operation_t::validate));
			}
		}
		catch (storage_exception const&)
		{
			m_state = verify_state::failure;
			throw;
		}

		std::string const content_path = content_path_for(m_files, path
			, m_settings.allow_different_name);
		int const num_pieces = m_files.num_pieces();
		content_progress progress(cb, m_settings.progress_interval);

		auto report = [&](storage_error const& e, piece_index_t const piece
			, std::optional<sha1_hash> const& hash, int const pieces_done)
		{
			++m_num_errors;
			DLOG("verify: piece %d: %s\n", static_cast<int>(piece), e.message().c_str());
			if (!progress) aux::throw_ex<storage_exception>(e);
			progress(true, m_files, e.path, pieces_done, num_pieces, piece, hash, e);
		};

		storage_error const root_error = check_content_root(m_files, content_path);
		if (root_error)
		{
			m_state = verify_state::size_mismatch_or_missing;
			report(root_error, piece_index_t(0), std::nullopt, 0);
			return false;
		}

		m_state = verify_state::hashing;

		// files whose size is checked again after their first passing piece.
		// Files that already had an error are not checked again
		std::vector<bool> size_checked(std::size_t(m_files.num_files()), false);

		aux::hash_pipeline pipeline(m_files, content_path, m_settings
			, [&](aux::piece_result const& r, int const pieces_done)
		{
			bool const final_event = pieces_done == num_pieces;
			if (final_event) m_state = verify_state::comparing;

			if (r.error)
			{
				size_checked[std::size_t(static_cast<int>(r.file))] = true;
				report(r.error, r.piece, std::nullopt, pieces_done);
				return;
			}

			if (!r.hash)
			{
				// a placeholder for a piece that couldn't be read. The error
				// was reported separately
				progress(final_event, m_files, m_files.file_path(r.file, content_path)
					, pieces_done, num_pieces, r.piece, r.hash, storage_error());
				return;
			}

			std::vector<file_index_t> const files = m_files.files_at_piece(r.piece);
			if (r.forced_mismatch || *r.hash != m_expected.hash(r.piece))
			{
				storage_error e(errors::content_mismatch, operation_t::check_hash);
				e.piece = r.piece;
				e.piece_size = m_files.piece_size(r.piece);
				for (file_index_t const f : files)
					e.files.push_back(m_files.file_path(f, content_path));
				if (files.size() == 1)
				{
					e.file(files.front());
					e.path = e.files.front();

					// the error is unambiguous, there's no point in reading the
					// rest of the file
					if (m_settings.skip_file_on_first_error)
						pipeline.skip_file(files.front());
				}
				else
				{
					e.file(r.file);
					e.path = m_files.file_path(r.file, content_path);
				}
				report(e, r.piece, r.hash, pieces_done);
				return;
			}

			for (file_index_t const f : files)
			{
				if (size_checked[std::size_t(static_cast<int>(f))]) continue;
				size_checked[std::size_t(static_cast<int>(f))] = true;

				// the file may have grown while we were reading it
				std::string const fs_path = m_files.file_path(f, content_path);
				storage_error const e = check_file_size(m_files, f, fs_path);
				if (e && e.ec == errors::file_size_mismatch)
					report(e, r.piece, r.hash, pieces_done);
			}

			progress(final_event, m_files, m_files.file_path(r.file, content_path)
				, pieces_done, num_pieces, r.piece, r.hash, storage_error());
		});
		progress.on_cancel([&pipeline] { pipeline.stop(); });

		DLOG("verify: %s: %d pieces\n", content_path.c_str(), num_pieces);
		try
		{
			pipeline.run();
		}
		catch (...)
		{
			m_state = verify_state::failure;
			throw;
		}

		if (progress.cancelled())
		{
			m_state = verify_state::cancelled;
			return false;
		}

		m_state = m_num_errors == 0 ? verify_state::success : verify_state::failure;
		return m_num_errors == 0;
	}
}
