/*

Copyright (c) 2008-2020, Arvid Norberg
Copyright (c) 2016-2017, Alden Torres
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "pieceproof/config.hpp"
#include "pieceproof/error_code.hpp"
#include "pieceproof/operations.hpp"

#include <sstream>

namespace pieceproof {

	struct pieceproof_error_category final : boost::system::error_category
	{
		const char* name() const BOOST_SYSTEM_NOEXCEPT override;
		std::string message(int ev) const override;
		boost::system::error_condition default_error_condition(int ev) const BOOST_SYSTEM_NOEXCEPT override
		{ return {ev, *this}; }
	};

	const char* pieceproof_error_category::name() const BOOST_SYSTEM_NOEXCEPT
	{
		return "pieceproof";
	}

	std::string pieceproof_error_category::message(int ev) const
	{
		static char const* msgs[] =
		{
			"no error",
			"no such file or directory",
			"empty file or directory",
			"file size mismatch",
			"corrupt piece",
			"not a directory",
			"is a directory",
			"no files in file list",
			"invalid piece size",
			"invalid piece hashes",
			"piece index out of range",
			"offset out of range",
			"file is not part of the file list",
			"reader can only read once",
		};
		if (ev < 0 || ev >= int(sizeof(msgs)/sizeof(msgs[0])))
			return "Unknown error";
		return msgs[ev];
	}

	boost::system::error_category& pieceproof_category()
	{
		static pieceproof_error_category pieceproof_category;
		return pieceproof_category;
	}

	namespace errors
	{
		boost::system::error_code make_error_code(error_code_enum e)
		{
			return boost::system::error_code(e, pieceproof_category());
		}
	}

	char const* operation_name(operation_t const op)
	{
		static char const* const names[] = {
			"unknown",
			"validate",
			"file_stat",
			"file_open",
			"file_read",
			"file_write",
			"check_size",
			"check_hash",
		};

		int const idx = static_cast<int>(op);
		if (idx < 0 || idx >= int(sizeof(names) / sizeof(names[0])))
			return "unknown operation";

		return names[idx];
	}

	std::string storage_error::message() const
	{
		if (!ec) return "no error";

		std::stringstream ret;
		if (ec == errors::content_mismatch)
		{
			ret << "Corruption in piece " << (static_cast<int>(piece) + 1);
			if (files.size() == 1)
			{
				ret << " in " << files.front();
			}
			else
			{
				ret << ", at least one of these files is corrupt:";
				for (auto const& f : files) ret << ' ' << f;
			}
			return ret.str();
		}

		if (!path.empty()) ret << path << ": ";

		if (ec == errors::file_size_mismatch)
		{
			if (actual_size < 0)
				ret << "No such file";
			else
				ret << (actual_size > expected_size ? "Too big: " : "Too small: ")
					<< actual_size << " instead of " << expected_size << " bytes";
		}
		else if (ec == errors::path_not_found)
			ret << "No such file or directory";
		else if (ec == errors::path_empty)
			ret << "Empty file or directory";
		else if (ec == errors::not_a_directory)
			ret << "Not a directory";
		else if (ec == errors::is_a_directory)
			ret << "Is a directory";
		else if (ec.category() == pieceproof_category())
			ret << ec.message();
		else
			ret << operation_name(operation) << ": " << ec.message();
		return ret.str();
	}

#ifndef BOOST_NO_EXCEPTIONS
	storage_exception::storage_exception(storage_error e)
		: system_error(e.ec)
		, m_error(std::move(e))
		, m_msg(m_error.message())
	{}

	char const* storage_exception::what() const noexcept
	{
		return m_msg.c_str();
	}
#endif

}
