/*

Copyright (c) 2022, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECEPROOF_DEBUG_LOG_HPP
#define PIECEPROOF_DEBUG_LOG_HPP

#include "pieceproof/config.hpp"

#if !PIECEPROOF_DEBUG_LOGGING
#define DLOG(...) do {} while(false)
#else

#define DLOG(...) ::pieceproof::aux::debug_log(__VA_ARGS__)

namespace pieceproof::aux {

	// prints a line to stderr, prefixed by the number of milliseconds since
	// the first log line and a small number identifying the calling thread.
	PIECEPROOF_EXTRA_EXPORT void debug_log(char const* fmt, ...) PIECEPROOF_FORMAT(1,2);
}

#endif // PIECEPROOF_DEBUG_LOGGING

#endif
