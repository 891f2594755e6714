/*

Copyright (c) 2022, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "test.hpp"
#include "test_utils.hpp"

#include "pieceproof/verify.hpp"
#include "pieceproof/error_code.hpp"
#include "pieceproof/aux_/path.hpp"

using namespace pieceproof;

namespace {

int const piece_len = 0x4000;

file_storage multi_file()
{
	return make_files({{"content/a", 1000}, {"content/b", 2000}
		, {"content/c", 3000}}, piece_len);
}

struct size_event
{
	std::string fs_path;
	std::string torrent_path;
	int files_done;
	int files_total;
	storage_error error;
};

std::vector<size_event> check_sizes(file_storage const& fs, std::string const& path
	, bool* ret = nullptr, hash_settings const& sett = hash_settings())
{
	std::vector<size_event> events;
	bool const r = verify_file_sizes(fs, path
		, [&](file_storage const& owner, std::string const& fs_path
			, std::string const& torrent_path, int const files_done
			, int const files_total, storage_error const& e)
	{
		TEST_CHECK(&owner == &fs);
		events.push_back({fs_path, torrent_path, files_done, files_total, e});
		return false;
	}, sett);
	if (ret) *ret = r;
	return events;
}

}

PIECEPROOF_TEST(content_path_for)
{
	file_storage const fs = multi_file();
	TEST_EQUAL(content_path_for(fs, "some/where/other", false), "some/where/content");
	TEST_EQUAL(content_path_for(fs, "other", false), "content");
	TEST_EQUAL(content_path_for(fs, "some/where/other", true), "some/where/other");
}

PIECEPROOF_TEST(all_sizes_match)
{
	file_storage const fs = multi_file();
	create_content(fs, "content");

	bool ret = false;
	std::vector<size_event> const events = check_sizes(fs, "content", &ret);
	TEST_CHECK(ret);
	TEST_EQUAL(events.size(), 3);
	for (int i = 0; i < int(events.size()); ++i)
	{
		TEST_EQUAL(events[std::size_t(i)].files_done, i + 1);
		TEST_EQUAL(events[std::size_t(i)].files_total, 3);
		TEST_CHECK(!events[std::size_t(i)].error);
	}
	TEST_EQUAL(events[1].fs_path, "content/b");
	TEST_EQUAL(events[1].torrent_path, "content/b");

	TEST_CHECK(verify_file_sizes(fs, "content"));
}

PIECEPROOF_TEST(different_name)
{
	file_storage const fs = multi_file();
	create_content(fs, "renamed");

	// by default, the content may be stored under any name
	bool ret = false;
	std::vector<size_event> events = check_sizes(fs, "renamed", &ret);
	TEST_CHECK(ret);
	TEST_EQUAL(events[0].fs_path, "renamed/a");
	TEST_EQUAL(events[0].torrent_path, "content/a");

	// unless the content name is required
	hash_settings sett;
	sett.allow_different_name = false;
	events = check_sizes(fs, "renamed", &ret, sett);
	TEST_CHECK(!ret);
	TEST_EQUAL(events.front().error.ec, error_code(errors::path_not_found));
	TEST_EQUAL(events.front().fs_path, "content/a");
}

PIECEPROOF_TEST(wrong_sizes)
{
	file_storage const fs = multi_file();
	create_content(fs, "content");
	resize_file("content/a", 1001);
	error_code ec;
	aux::remove("content/b", ec);
	resize_file("content/c", 10);

	bool ret = true;
	std::vector<size_event> const events = check_sizes(fs, "content", &ret);
	TEST_CHECK(!ret);
	TEST_EQUAL(events.size(), 3);

	TEST_EQUAL(events[0].error.ec, error_code(errors::file_size_mismatch));
	TEST_EQUAL(events[0].error.actual_size, 1001);
	TEST_EQUAL(events[0].error.expected_size, 1000);
	TEST_EQUAL(events[0].error.message(), "content/a: Too big: 1001 instead of 1000 bytes");

	TEST_EQUAL(events[1].error.ec, error_code(errors::path_not_found));
	TEST_EQUAL(events[1].error.file(), 1_file);
	TEST_EQUAL(events[1].files_done, 2);

	TEST_EQUAL(events[2].error.ec, error_code(errors::file_size_mismatch));
	TEST_EQUAL(events[2].error.message(), "content/c: Too small: 10 instead of 3000 bytes");
}

PIECEPROOF_TEST(directory_in_place_of_file)
{
	file_storage const fs = multi_file();
	create_content(fs, "content");
	error_code ec;
	aux::remove("content/b", ec);
	aux::create_directory("content/b", ec);
	TEST_CHECK(!ec);

	std::vector<size_event> const events = check_sizes(fs, "content");
	TEST_EQUAL(events[1].error.ec, error_code(errors::is_a_directory));
}

PIECEPROOF_TEST(content_root_shape)
{
	// multi-file content in place of a file
	file_storage const fs = multi_file();
	create_file("content", 100);
	std::vector<size_event> events = check_sizes(fs, "content");
	TEST_EQUAL(events.size(), 3);
	TEST_EQUAL(events[0].error.ec, error_code(errors::not_a_directory));

	// single-file content in place of a directory
	file_storage const single = make_files({{"single", 100}}, piece_len);
	error_code ec;
	aux::create_directory("single", ec);
	TEST_CHECK(!ec);
	events = check_sizes(single, "single");
	TEST_EQUAL(events.size(), 1);
	TEST_EQUAL(events[0].error.ec, error_code(errors::is_a_directory));
}

PIECEPROOF_TEST(no_callback_throws)
{
	file_storage const fs = multi_file();
	create_content(fs, "content");
	resize_file("content/b", 1);

	try
	{
		verify_file_sizes(fs, "content");
		TEST_ERROR("expected verify_file_sizes to throw");
	}
	catch (storage_exception const& e)
	{
		TEST_EQUAL(e.error().ec, error_code(errors::file_size_mismatch));
		TEST_EQUAL(e.error().file(), 1_file);
	}
}

PIECEPROOF_TEST(cancel)
{
	file_storage const fs = multi_file();

	int calls = 0;
	bool const ret = verify_file_sizes(fs, "content"
		, [&](file_storage const&, std::string const&, std::string const&
			, int, int, storage_error const&)
	{
		++calls;
		return true;
	});
	TEST_CHECK(!ret);
	TEST_EQUAL(calls, 1);
}
