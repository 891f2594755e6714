/*

Copyright (c) 2004-2005, 2007-2010, 2012-2020, Arvid Norberg
Copyright (c) 2016-2017, Alden Torres
Copyright (c) 2017, Steven Siloti
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECEPROOF_PATH_HPP_INCLUDED
#define PIECEPROOF_PATH_HPP_INCLUDED

#include <cstdint>
#include <string>
#include <string_view>

#include "pieceproof/config.hpp"
#include "pieceproof/error_code.hpp"

namespace pieceproof::aux {

	struct file_status
	{
		std::int64_t file_size = 0;

		enum {
			regular_file = 0x1,
			directory = 0x2
		};
		int mode = 0;
	};

	// internal flags for stat_file. remove_all() doesn't follow links into
	// directories
	enum { dont_follow_links = 1 };

	PIECEPROOF_EXTRA_EXPORT void stat_file(std::string const& f, file_status* s
		, error_code& ec, int flags = 0);
	PIECEPROOF_EXTRA_EXPORT void create_directories(std::string const& f
		, error_code& ec);
	PIECEPROOF_EXTRA_EXPORT void create_directory(std::string const& f
		, error_code& ec);
	PIECEPROOF_EXTRA_EXPORT void remove_all(std::string const& f
		, error_code& ec);
	PIECEPROOF_EXTRA_EXPORT void remove(std::string const& f, error_code& ec);
	PIECEPROOF_EXTRA_EXPORT bool exists(std::string const& f, error_code& ec);
	PIECEPROOF_EXTRA_EXPORT bool exists(std::string const& f);
	PIECEPROOF_EXTRA_EXPORT bool is_directory(std::string const& f
		, error_code& ec);

	PIECEPROOF_EXTRA_EXPORT bool is_root_path(std::string const& f);
	PIECEPROOF_EXTRA_EXPORT bool has_parent_path(std::string const& f);
	PIECEPROOF_EXTRA_EXPORT std::string parent_path(std::string const& f);
	PIECEPROOF_EXTRA_EXPORT std::string combine_path(std::string_view lhs
		, std::string_view rhs);
	PIECEPROOF_EXTRA_EXPORT void append_path(std::string& branch
		, std::string_view leaf);
	PIECEPROOF_EXTRA_EXPORT bool is_complete(std::string_view f);
	PIECEPROOF_EXTRA_EXPORT std::string current_working_directory();
	PIECEPROOF_EXTRA_EXPORT void change_directory(std::string const& f
		, error_code& ec);
}

#endif // PIECEPROOF_PATH_HPP_INCLUDED
