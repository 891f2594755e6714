/*

Copyright (c) 2008-2020, Arvid Norberg
Copyright (c) 2016-2017, Alden Torres
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECEPROOF_ERROR_CODE_HPP_INCLUDED
#define PIECEPROOF_ERROR_CODE_HPP_INCLUDED

#include "pieceproof/config.hpp"
#include "pieceproof/units.hpp"
#include "pieceproof/operations.hpp"

#include <cstdint>
#include <string>
#include <vector>

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

namespace pieceproof {

	namespace errors {

		// pieceproof uses boost.system's ``error_code`` class to represent
		// errors. It has its own error category
		// (pieceproof_category()) with the error codes defined by
		// error_code_enum.
		enum error_code_enum
		{
			// Not an error
			no_error = 0,

			// a file or directory that is part of the content does not exist
			path_not_found,
			// the content exists but contains no bytes
			path_empty,
			// the on-disk size of a file does not match its recorded size
			file_size_mismatch,
			// a piece digest does not match the expected one
			content_mismatch,
			// the content path of a multi-file content is not a directory
			not_a_directory,
			// a path that should be a file is a directory
			is_a_directory,

			// the file list is empty
			no_files,
			// the piece size is not a power of two or outside the allowed range
			invalid_piece_size,
			// the digest blob does not hold one digest per piece
			invalid_piece_hashes,

			// a piece index outside of [0, max piece index]
			piece_index_out_of_range,
			// a byte offset outside of [0, total size)
			offset_out_of_range,
			// the file is not part of this file_storage
			file_not_in_storage,

			// a chunk_reader can only read its files once
			reader_already_used,

			// the number of error codes
			error_code_max
		};

		// hidden
		PIECEPROOF_EXPORT boost::system::error_code make_error_code(error_code_enum e);

	} // namespace errors

	// return the instance of the pieceproof_error_category which
	// maps pieceproof error codes to human readable error messages.
	PIECEPROOF_EXPORT boost::system::error_category& pieceproof_category();

	using error_code = boost::system::error_code;
	using error_condition = boost::system::error_condition;
	using system_error = boost::system::system_error;

	// internal
	using boost::system::generic_category;
	using boost::system::system_category;

	// used by the reader, the hashing pipeline and the verifier to report
	// errors. In addition to the error code it records which file and
	// operation failed and, depending on the kind of error, the sizes or the
	// piece involved.
	struct PIECEPROOF_EXPORT storage_error
	{
		storage_error() noexcept : operation(operation_t::unknown), m_file_idx(-1) {}
		explicit storage_error(error_code e, operation_t const op = operation_t::unknown) noexcept
			: ec(e), operation(op), m_file_idx(-1) {}
		storage_error(error_code e, file_index_t f, operation_t const op) noexcept
			: ec(e), operation(op), m_file_idx(static_cast<int>(f)) {}

		// return true if an error is set
		explicit operator bool() const { return ec.value() != 0; }

		// the error that occurred
		error_code ec;

		// the file the error occurred on
		file_index_t file() const { return file_index_t(m_file_idx); }

		// set the file the error occurred on
		void file(file_index_t f) { m_file_idx = static_cast<int>(f); }

		// returns true if this is an I/O failure reported by the operating
		// system (the error kind the verifier calls a read error)
		bool is_read_error() const
		{
			return ec && ec.category() != pieceproof_category()
				&& operation != operation_t::file_write;
		}

		// renders a human readable description of the error. Pieces are
		// printed 1-based.
		std::string message() const;

		// A code from operation_t enum, indicating what
		// kind of operation failed.
		operation_t operation;

		// the filesystem path of the file the error refers to, if any
		std::string path;

		// the size of the file on disk. -1 if it could not be determined
		std::int64_t actual_size = -1;

		// the size recorded for the file
		std::int64_t expected_size = -1;

		// the piece a content_mismatch refers to
		piece_index_t piece{-1};

		// the size of ``piece``
		int piece_size = 0;

		// the files whose bytes overlap ``piece``. When there is more than
		// one, any of them may be the corrupt one.
		std::vector<std::string> files;

		bool operator==(storage_error const& rhs) const
		{
			return ec == rhs.ec
				&& m_file_idx == rhs.m_file_idx
				&& operation == rhs.operation
				&& piece == rhs.piece;
		}

		bool operator!=(storage_error const& rhs) const
		{
			return !(*this == rhs);
		}

	private:
		int m_file_idx;
	};

#ifndef BOOST_NO_EXCEPTIONS
	// thrown by the operations that report errors by exception (i.e. when no
	// callback is installed). The full storage_error is available through
	// error().
	struct PIECEPROOF_EXPORT storage_exception : system_error
	{
		explicit storage_exception(storage_error e);
		char const* what() const noexcept override;
		storage_error const& error() const { return m_error; }
	private:
		storage_error m_error;
		std::string m_msg;
	};
#endif

}

namespace boost { namespace system {

	template<> struct is_error_code_enum<pieceproof::errors::error_code_enum>
	{ static const bool value = true; };

} }

#endif
