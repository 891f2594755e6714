/*

Copyright (c) 2015-2020, Arvid Norberg
Copyright (c) 2017, Alden Torres
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECEPROOF_OPERATIONS_HPP_INCLUDED
#define PIECEPROOF_OPERATIONS_HPP_INCLUDED

#include <cstdint>

#include "pieceproof/config.hpp"

namespace pieceproof {

	// these constants are used to identify the operation that failed, causing
	// a storage_error to be reported
	enum class operation_t : std::uint8_t
	{
		// the error was unexpected and it is unknown which operation caused it
		unknown,

		// structural validation of the file list, piece size or digest blob
		validate,

		// a call to stat() on a file or the content root failed, or
		// reported something unexpected
		file_stat,

		// opening a file failed
		file_open,

		// reading from a file failed
		file_read,

		// writing to a file failed
		file_write,

		// the on-disk size of a file did not match its recorded size
		check_size,

		// a freshly computed piece digest did not match the expected one
		check_hash
	};

	// maps an operation id to its name. See operation_t for the constants
	PIECEPROOF_EXPORT char const* operation_name(operation_t op);
}

#endif // PIECEPROOF_OPERATIONS_HPP_INCLUDED
