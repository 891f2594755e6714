/*

Copyright (c) 2009, 2013-2020, Arvid Norberg
Copyright (c) 2016-2017, Alden Torres
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECEPROOF_SETTINGS_HPP_INCLUDED
#define PIECEPROOF_SETTINGS_HPP_INCLUDED

#include "pieceproof/config.hpp"
#include "pieceproof/time.hpp"

namespace pieceproof {

	// The hash_settings is a parameter pack passed to generate_piece_hashes(),
	// verify_file_sizes(), verify_content() and file_stream. Every field has a
	// sensible default, so a default constructed object can be used as-is.
	struct PIECEPROOF_EXPORT hash_settings
	{
		// the number of threads computing SHA-1 digests. 0 means one thread
		// per hardware thread (but at least one).
		int hashing_threads = 0;

		// the capacity of the queue between the reader and the hashing
		// threads, per hashing thread. This bounds the number of pieces held
		// in memory at any given time.
		int queue_depth_per_thread = 3;

		// the minimum time between two calls to the progress callback. Errors
		// and the final progress event are always reported immediately. 0
		// means every event is reported.
		time_duration progress_interval = time_duration::zero();

		// when verifying, stop reading a file once an error has been
		// attributed to it. Pieces that only contain bytes of that file are
		// not read nor reported anymore.
		bool skip_file_on_first_error = false;

		// when verifying, the path passed in is used as the content path
		// as-is, whatever its last element is named. When false, the last
		// path element is replaced by the content name.
		bool allow_different_name = true;

		// the number of files file_stream keeps open at any given time
		int max_open_files = 10;

		// the allowed range of piece sizes, checked by file_storage::validate()
		int piece_size_min = 16 * 1024;
		int piece_size_max = 16 * 1024 * 1024;

		// the number of hashing threads to actually use, resolving 0 to the
		// hardware concurrency
		int num_threads() const;

		// the capacity of the task queue for ``num_threads()`` threads
		int queue_capacity() const;
	};
}

#endif
