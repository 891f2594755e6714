/*

Copyright (c) 2022, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "test.hpp"
#include "test_utils.hpp"

#include "pieceproof/aux_/hash_pipeline.hpp"
#include "pieceproof/aux_/path.hpp"
#include "pieceproof/error_code.hpp"

#include <stdexcept>

using namespace pieceproof;

namespace {

int const piece_len = 16;

hash_settings test_settings(int const threads)
{
	hash_settings sett;
	sett.hashing_threads = threads;
	return sett;
}

}

PIECEPROOF_TEST(digests_sorted)
{
	file_storage const fs = make_files({{"t/a", 100}, {"t/b", 333}, {"t/c", 7}}, piece_len);
	std::vector<char> const stream = create_content(fs, "t");

	for (int threads : {1, 2, 8})
	{
		std::vector<int> done_counts;
		aux::hash_pipeline p(fs, "t", test_settings(threads)
			, [&](aux::piece_result const& r, int const pieces_done)
		{
			TEST_CHECK(!r.error);
			TEST_CHECK(r.hash);
			done_counts.push_back(pieces_done);
		});
		p.run();

		TEST_CHECK(!p.stopped());
		TEST_EQUAL(p.pieces_done(), fs.num_pieces());
		TEST_CHECK(p.hashes() == hash_stream(stream, piece_len));

		// the handler sees a strictly increasing count, since every piece is
		// reported once
		TEST_EQUAL(int(done_counts.size()), fs.num_pieces());
		for (int i = 0; i < int(done_counts.size()); ++i)
			TEST_EQUAL(done_counts[std::size_t(i)], i + 1);
	}
}

PIECEPROOF_TEST(errors_and_placeholders)
{
	file_storage const fs = make_files({{"t/a", 10}, {"t/b", 40}, {"t/c", 20}}, piece_len);
	create_content(fs, "t");
	error_code ec;
	aux::remove("t/b", ec);

	int num_errors = 0;
	int num_placeholders = 0;
	int num_forced = 0;
	int last_done = 0;
	aux::hash_pipeline p(fs, "t", test_settings(3)
		, [&](aux::piece_result const& r, int const pieces_done)
	{
		TEST_CHECK(pieces_done >= last_done);
		last_done = pieces_done;
		if (r.error)
		{
			++num_errors;
			TEST_EQUAL(r.error.ec, error_code(errors::path_not_found));
			TEST_CHECK(!r.hash);
		}
		else if (!r.hash) ++num_placeholders;
		else if (r.forced_mismatch) ++num_forced;
	});
	p.run();

	TEST_EQUAL(num_errors, 1);
	TEST_EQUAL(num_placeholders, 2);
	TEST_EQUAL(num_forced, 2);
	TEST_EQUAL(last_done, fs.num_pieces());

	// placeholders have no digest
	TEST_EQUAL(p.hashes().num_pieces(), 3);
}

PIECEPROOF_TEST(handler_exception)
{
	file_storage const fs = make_files({{"t/a", 1000}}, piece_len);
	create_content(fs, "t");

	int calls = 0;
	aux::hash_pipeline p(fs, "t", test_settings(2)
		, [&](aux::piece_result const&, int)
	{
		++calls;
		throw std::runtime_error("handler failed");
	});

	TEST_THROW(p.run());
	TEST_EQUAL(calls, 1);
	TEST_CHECK(p.stopped());
}

PIECEPROOF_TEST(stop_from_handler)
{
	file_storage const fs = make_files({{"t/a", 1000}}, piece_len);
	create_content(fs, "t");

	aux::hash_pipeline* pipeline = nullptr;
	int calls = 0;
	aux::hash_pipeline p(fs, "t", test_settings(2)
		, [&](aux::piece_result const&, int)
	{
		++calls;
		if (calls == 3) pipeline->stop();
	});
	pipeline = &p;

	TEST_NOTHROW(p.run());
	TEST_EQUAL(calls, 3);
	TEST_CHECK(p.stopped());
	TEST_CHECK(p.pieces_done() < fs.num_pieces());
}

PIECEPROOF_TEST(empty_content)
{
	file_storage const fs = make_files({{"t/a", 0}}, piece_len);
	create_content(fs, "t");

	int calls = 0;
	aux::hash_pipeline p(fs, "t", test_settings(1)
		, [&](aux::piece_result const&, int) { ++calls; });
	p.run();
	TEST_EQUAL(calls, 0);
	TEST_CHECK(p.hashes().empty());
}
