/*

Copyright (c) 2008-2022, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "pieceproof/generate.hpp"
#include "pieceproof/error_code.hpp"
#include "pieceproof/aux_/hash_pipeline.hpp"
#include "pieceproof/aux_/cancellable_callback.hpp"
#include "pieceproof/aux_/path.hpp"
#include "pieceproof/aux_/throw.hpp"
#include "pieceproof/aux_/debug_log.hpp"

namespace pieceproof {

namespace {

	using progress_callback = aux::cancellable_callback<file_storage const&
		, std::string const&, int, int>;

	void check_input(file_storage const& fs, std::string const& path
		, hash_settings const& sett)
	{
		error_code ec;
		fs.validate(sett, ec);
		if (ec) aux::throw_ex<storage_exception>(storage_error(ec, operation_t::validate));

		if (!aux::exists(path))
		{
			storage_error e(errors::path_not_found, operation_t::file_stat);
			e.path = path;
			aux::throw_ex<storage_exception>(std::move(e));
		}

		if (fs.total_size() < 1)
		{
			storage_error e(errors::path_empty, operation_t::file_stat);
			e.path = path;
			aux::throw_ex<storage_exception>(std::move(e));
		}
	}
}

	bool generate_piece_hashes(file_storage const& fs
		, std::string const& path, piece_hashes& hashes
		, generate_callback const& cb
		, hash_settings const& sett)
	{
		check_input(fs, path, sett);

		int const num_pieces = fs.num_pieces();
		progress_callback progress(cb, sett.progress_interval);

		aux::hash_pipeline pipeline(fs, path, sett
			, [&](aux::piece_result const& r, int const pieces_done)
		{
			// there's no way to report an error through the callback, any
			// error ends the operation
			if (r.error) aux::throw_ex<storage_exception>(r.error);

			progress(pieces_done == num_pieces, fs, fs.file_path(r.file, path)
				, pieces_done, num_pieces);
		});
		progress.on_cancel([&pipeline] { pipeline.stop(); });

		DLOG("generate: %s: %d pieces\n", path.c_str(), num_pieces);
		pipeline.run();

		if (progress.cancelled() || pipeline.stopped())
		{
			DLOG("generate: cancelled after %d pieces\n", pipeline.pieces_done());
			return false;
		}

		hashes = pipeline.hashes();
		PIECEPROOF_ASSERT(hashes.num_pieces() == num_pieces);
		return true;
	}

	bool generate_piece_hashes(file_storage const& fs
		, std::string const& path, piece_hashes& hashes
		, generate_callback const& cb, hash_settings const& sett
		, storage_error& ec)
	{
		try
		{
			return generate_piece_hashes(fs, path, hashes, cb, sett);
		}
		catch (storage_exception const& e)
		{
			ec = e.error();
			return false;
		}
	}
}
