/*

Copyright (c) 2013-2014, 2016-2017, 2019-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "test.hpp"
#include "test_utils.hpp"

#include "pieceproof/aux_/file_pool.hpp"
#include "pieceproof/error_code.hpp"

#include <cerrno>

using namespace pieceproof;

PIECEPROOF_TEST(open_and_reuse)
{
	create_file("a", 100);
	create_file("b", 100);

	aux::file_pool pool(2);
	TEST_EQUAL(pool.size_limit(), 2);
	TEST_EQUAL(pool.num_open(), 0);

	std::shared_ptr<aux::file_handle> h1 = pool.open_file("a");
	TEST_CHECK(h1);
	TEST_CHECK(h1->is_open());
	TEST_EQUAL(h1->get_size(), 100);

	// a second open returns the cached handle
	std::shared_ptr<aux::file_handle> h2 = pool.open_file("a");
	TEST_CHECK(h1 == h2);
	TEST_EQUAL(pool.num_open(), 1);

	pool.open_file("b");
	TEST_EQUAL(pool.num_open(), 2);
}

PIECEPROOF_TEST(evict_oldest_opened)
{
	create_file("a", 10);
	create_file("b", 10);
	create_file("c", 10);

	aux::file_pool pool(2);
	pool.open_file("a");
	pool.open_file("b");

	// hitting "a" doesn't make it any younger
	pool.open_file("a");
	pool.open_file("c");

	TEST_EQUAL(pool.num_open(), 2);
	TEST_CHECK((pool.open_files() == std::vector<std::string>{"b", "c"}));
}

PIECEPROOF_TEST(handle_outlives_eviction)
{
	std::vector<char> const data = create_file("a", 10);
	create_file("b", 10);

	aux::file_pool pool(1);
	std::shared_ptr<aux::file_handle> h = pool.open_file("a");
	pool.open_file("b");
	TEST_CHECK((pool.open_files() == std::vector<std::string>{"b"}));

	// the evicted handle stays usable as long as it's referenced
	char buf[10];
	error_code ec;
	int const n = aux::pread_all(h->fd(), span<char>(buf, 10), 0, ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(n, 10);
	TEST_CHECK(std::equal(data.begin(), data.end(), buf));
}

PIECEPROOF_TEST(missing_file)
{
	aux::file_pool pool(2);
	try
	{
		pool.open_file("does-not-exist");
		TEST_ERROR("expected open_file to throw");
	}
	catch (storage_error const& e)
	{
		TEST_EQUAL(e.ec, error_code(ENOENT, system_category()));
		TEST_CHECK(e.operation == operation_t::file_open);
	}
	TEST_EQUAL(pool.num_open(), 0);
}

PIECEPROOF_TEST(release_and_resize)
{
	create_file("a", 10);
	create_file("b", 10);
	create_file("c", 10);

	aux::file_pool pool(3);
	pool.open_file("a");
	pool.open_file("b");
	pool.open_file("c");
	TEST_EQUAL(pool.num_open(), 3);

	pool.release("b");
	TEST_CHECK((pool.open_files() == std::vector<std::string>{"a", "c"}));

	// releasing a file that isn't open is fine
	pool.release("b");
	TEST_EQUAL(pool.num_open(), 2);

	pool.resize(1);
	TEST_EQUAL(pool.size_limit(), 1);
	TEST_CHECK((pool.open_files() == std::vector<std::string>{"c"}));

	pool.release();
	TEST_EQUAL(pool.num_open(), 0);
}
