/*

Copyright (c) 2003-2005, 2007, 2009, 2011-2020, Arvid Norberg
Copyright (c) 2016-2017, Alden Torres
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECEPROOF_FILE_HPP_INCLUDED
#define PIECEPROOF_FILE_HPP_INCLUDED

#include <cstdint>
#include <string>

#include "pieceproof/config.hpp"
#include "pieceproof/span.hpp"
#include "pieceproof/error_code.hpp"
#include "pieceproof/assert.hpp"

#ifndef _GNU_SOURCE
#define _GNU_SOURCE
#endif

#include <unistd.h>
#include <fcntl.h>
#include <sys/types.h>

namespace pieceproof::aux {

	using handle_type = int;
	const handle_type invalid_handle = -1;

	// reads until ``buf`` is full, end-of-file or an error. Returns the
	// number of bytes read. Hitting end-of-file before ``buf`` is full sets
	// ``ec`` to boost::asio::error::eof.
	PIECEPROOF_EXTRA_EXPORT int pread_all(handle_type handle
		, span<char> buf
		, std::int64_t file_offset
		, error_code& ec);

	// a read-only file descriptor. Opening a file that does not exist, or
	// that cannot be opened, throws a storage_error with operation_t::file_open.
	struct PIECEPROOF_EXTRA_EXPORT file_handle
	{
		file_handle(): m_fd(invalid_handle) {}
		explicit file_handle(std::string const& name);
		file_handle(file_handle const& rhs) = delete;
		file_handle& operator=(file_handle const& rhs) = delete;

		file_handle(file_handle&& rhs) noexcept : m_fd(rhs.m_fd) { rhs.m_fd = invalid_handle; }
		file_handle& operator=(file_handle&& rhs) & noexcept;

		~file_handle();

		// throws storage_error on failure
		std::int64_t get_size() const;

		handle_type fd() const { return m_fd; }
		bool is_open() const { return m_fd != invalid_handle; }

	private:
		void close();
		handle_type m_fd;
	};

}

#endif // PIECEPROOF_FILE_HPP_INCLUDED
