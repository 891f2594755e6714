/*

Copyright (c) 2022, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include <cerrno>

#include "test.hpp"

#include "pieceproof/error_code.hpp"
#include "pieceproof/operations.hpp"

using namespace pieceproof;

PIECEPROOF_TEST(error_category)
{
	error_code const ec = errors::path_not_found;
	TEST_EQUAL(ec.category().name(), std::string("pieceproof"));
	TEST_EQUAL(ec.message(), "no such file or directory");
	TEST_EQUAL(error_code(errors::reader_already_used).message(), "reader can only read once");
	TEST_EQUAL(pieceproof_category().message(10000), "Unknown error");
}

PIECEPROOF_TEST(operation_names)
{
	TEST_EQUAL(operation_name(operation_t::file_read), std::string("file_read"));
	TEST_EQUAL(operation_name(operation_t::check_hash), std::string("check_hash"));
	TEST_EQUAL(operation_name(static_cast<operation_t>(200)), std::string("unknown operation"));
}

PIECEPROOF_TEST(storage_error_message_size)
{
	storage_error e(errors::file_size_mismatch, file_index_t(1), operation_t::check_size);
	e.path = "a/b";
	e.actual_size = 12;
	e.expected_size = 10;
	TEST_EQUAL(e.message(), "a/b: Too big: 12 instead of 10 bytes");

	e.actual_size = 8;
	TEST_EQUAL(e.message(), "a/b: Too small: 8 instead of 10 bytes");

	e.actual_size = -1;
	TEST_EQUAL(e.message(), "a/b: No such file");
}

PIECEPROOF_TEST(storage_error_message_corruption)
{
	storage_error e(errors::content_mismatch, operation_t::check_hash);
	e.piece = piece_index_t(3);
	e.files = {"content/a"};
	TEST_EQUAL(e.message(), "Corruption in piece 4 in content/a");

	e.files = {"content/a", "content/b"};
	TEST_EQUAL(e.message()
		, "Corruption in piece 4, at least one of these files is corrupt: content/a content/b");
}

PIECEPROOF_TEST(storage_error_message_other)
{
	storage_error e(errors::path_not_found, operation_t::file_stat);
	e.path = "missing";
	TEST_EQUAL(e.message(), "missing: No such file or directory");

	e.ec = errors::not_a_directory;
	TEST_EQUAL(e.message(), "missing: Not a directory");

	e.ec = errors::is_a_directory;
	TEST_EQUAL(e.message(), "missing: Is a directory");

	e.ec = errors::path_empty;
	TEST_EQUAL(e.message(), "missing: Empty file or directory");

	e.ec = error_code(EIO, system_category());
	e.operation = operation_t::file_read;
	TEST_EQUAL(e.message(), "missing: file_read: " + e.ec.message());

	TEST_EQUAL(storage_error().message(), "no error");
	TEST_CHECK(!storage_error());
}

PIECEPROOF_TEST(storage_error_kind)
{
	storage_error e(error_code(EIO, system_category()), operation_t::file_read);
	TEST_CHECK(e.is_read_error());

	e.operation = operation_t::file_write;
	TEST_CHECK(!e.is_read_error());

	storage_error const lib(errors::path_not_found, operation_t::file_stat);
	TEST_CHECK(!lib.is_read_error());
}

PIECEPROOF_TEST(storage_exception_what)
{
	storage_error e(errors::path_empty, operation_t::file_stat);
	e.path = "content";
	try
	{
		throw storage_exception(e);
	}
	catch (system_error const& ex)
	{
		TEST_EQUAL(ex.code(), error_code(errors::path_empty));
		TEST_EQUAL(std::string(ex.what()), "content: Empty file or directory");
	}
}
