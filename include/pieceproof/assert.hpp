/*

Copyright (c) 2007-2008, 2010-2011, 2013-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECEPROOF_ASSERT_HPP_INCLUDED
#define PIECEPROOF_ASSERT_HPP_INCLUDED

#include "pieceproof/config.hpp"
#include "pieceproof/aux_/export.hpp"

namespace pieceproof {

// internal
PIECEPROOF_EXPORT void assert_print(char const* fmt, ...) PIECEPROOF_FORMAT(1,2);

// internal
PIECEPROOF_EXPORT void assert_fail(const char* expr, int line
	, char const* file, char const* function, char const* val, int kind = 0);

}

#if PIECEPROOF_USE_ASSERTS

#if PIECEPROOF_USE_IOSTREAM
#include <sstream>
#endif

#define PIECEPROOF_ASSERT_PRECOND(x) \
	do { if (x) {} else pieceproof::assert_fail(#x, __LINE__, __FILE__, __func__, nullptr, 1); } while (false)

#define PIECEPROOF_ASSERT(x) \
	do { if (x) {} else pieceproof::assert_fail(#x, __LINE__, __FILE__, __func__, nullptr, 0); } while (false)

#if PIECEPROOF_USE_IOSTREAM
#define PIECEPROOF_ASSERT_VAL(x, y) \
	do { if (x) {} else { std::stringstream __s__; __s__ << #y ": " << y; \
	pieceproof::assert_fail(#x, __LINE__, __FILE__, __func__, __s__.str().c_str(), 0); } } while (false)
#else
#define PIECEPROOF_ASSERT_VAL(x, y) PIECEPROOF_ASSERT(x)
#endif

#define PIECEPROOF_ASSERT_FAIL() \
	pieceproof::assert_fail("<unconditional>", __LINE__, __FILE__, __func__, nullptr, 0)

#else // PIECEPROOF_USE_ASSERTS

#define PIECEPROOF_ASSERT_PRECOND(a) do {} while(false)
#define PIECEPROOF_ASSERT(a) do {} while(false)
#define PIECEPROOF_ASSERT_VAL(a, b) do {} while(false)
#define PIECEPROOF_ASSERT_FAIL() do {} while(false)

#endif // PIECEPROOF_USE_ASSERTS

#endif // PIECEPROOF_ASSERT_HPP_INCLUDED
