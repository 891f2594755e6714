/*

Copyright (c) 2022, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "test.hpp"
#include "test_utils.hpp"

#include "pieceproof/file_stream.hpp"
#include "pieceproof/hasher.hpp"
#include "pieceproof/error_code.hpp"
#include "pieceproof/aux_/path.hpp"

using namespace pieceproof;

namespace {

int const piece_len = 0x4000;

// three files, the middle one spanning two piece boundaries
file_storage test_files()
{
	return make_files({{"content/a", 10000}, {"content/b", 40000}
		, {"content/c", 5000}}, piece_len);
}

std::vector<char> piece_of(std::vector<char> const& stream, int const piece, int const size)
{
	auto const first = stream.begin() + std::ptrdiff_t(piece) * piece_len;
	return std::vector<char>(first, first + size);
}

error_code read_error(file_stream& st, piece_index_t const piece)
{
	try
	{
		st.read_piece(piece, "content");
	}
	catch (storage_exception const& e)
	{
		return e.error().ec;
	}
	return error_code();
}

}

PIECEPROOF_TEST(read_piece)
{
	file_storage const fs = test_files();
	std::vector<char> const stream = create_content(fs, "content");

	file_stream st(fs);
	for (piece_index_t p(0); p < fs.end_piece(); ++p)
	{
		std::vector<char> const buf = st.read_piece(p, "content");
		TEST_EQUAL(int(buf.size()), fs.piece_size(p));
		TEST_CHECK(buf == piece_of(stream, static_cast<int>(p), fs.piece_size(p)));
	}

	// the last piece is short
	TEST_EQUAL(fs.piece_size(fs.max_piece_index()), 55000 - 3 * piece_len);
	TEST_EQUAL(st.num_open_files(), 3);

	st.close();
	TEST_EQUAL(st.num_open_files(), 0);
}

PIECEPROOF_TEST(piece_hash)
{
	file_storage const fs = test_files();
	std::vector<char> const stream = create_content(fs, "content");
	piece_hashes const expected = hash_stream(stream, piece_len);

	file_stream st(fs);
	for (piece_index_t p(0); p < fs.end_piece(); ++p)
	{
		std::optional<sha1_hash> const h = st.piece_hash(p, "content");
		TEST_CHECK(h);
		if (h) TEST_EQUAL(*h, expected.hash(p));
		TEST_CHECK(st.verify_piece(p, expected.hash(p), "content") == true);
	}

	flip_byte("content/b", 20000);
	// byte 30000 of the stream is in piece 1
	TEST_CHECK(st.verify_piece(1_piece, expected.hash(1_piece), "content") == false);
	TEST_CHECK(st.verify_piece(0_piece, expected.hash(0_piece), "content") == true);
}

PIECEPROOF_TEST(missing_file)
{
	file_storage const fs = test_files();
	create_content(fs, "content");
	error_code ec;
	aux::remove("content/c", ec);
	TEST_CHECK(!ec);

	file_stream st(fs);
	// piece 3 is the only piece touching c
	TEST_CHECK(!st.piece_hash(3_piece, "content"));
	TEST_CHECK(!st.verify_piece(3_piece, sha1_hash(), "content"));
	TEST_CHECK(st.piece_hash(2_piece, "content"));

	TEST_EQUAL(read_error(st, 3_piece), error_code(ENOENT, system_category()));
}

PIECEPROOF_TEST(size_mismatch)
{
	file_storage const fs = test_files();
	create_content(fs, "content");
	resize_file("content/a", 10001);

	file_stream st(fs);
	TEST_EQUAL(read_error(st, 0_piece), error_code(errors::file_size_mismatch));
	TEST_EQUAL(read_error(st, 1_piece), error_code());

	// a size mismatch isn't a missing file
	TEST_THROW(st.piece_hash(0_piece, "content"));

	try
	{
		st.read_piece(0_piece, "content");
	}
	catch (storage_exception const& e)
	{
		TEST_EQUAL(e.error().actual_size, 10001);
		TEST_EQUAL(e.error().expected_size, 10000);
		TEST_EQUAL(e.error().file(), 0_file);
		TEST_CHECK(e.error().operation == operation_t::check_size);
	}
}

PIECEPROOF_TEST(invalid_piece)
{
	file_storage const fs = test_files();
	create_content(fs, "content");

	file_stream st(fs);
	TEST_EQUAL(read_error(st, 4_piece), error_code(errors::piece_index_out_of_range));
	TEST_EQUAL(read_error(st, piece_index_t(-1)), error_code(errors::piece_index_out_of_range));
}

PIECEPROOF_TEST(open_file_limit)
{
	file_storage const fs = make_files({{"content/a", 100}, {"content/b", 100}
		, {"content/c", 100}, {"content/d", 100}}, piece_len);
	create_content(fs, "content");

	hash_settings sett;
	sett.max_open_files = 2;
	file_stream st(fs, sett);
	st.read_piece(0_piece, "content");
	TEST_EQUAL(st.num_open_files(), 2);
}
