/*

Copyright (c) 2007-2020, Arvid Norberg
Copyright (c) 2016-2017, Alden Torres
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "pieceproof/config.hpp"
#include "pieceproof/assert.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstdarg>
#include <csignal>

namespace pieceproof {

PIECEPROOF_EXPORT void assert_print(char const* fmt, ...)
{
	va_list va;
	va_start(va, fmt);
	std::vfprintf(stderr, fmt, va);
	va_end(va);
}

#if PIECEPROOF_USE_ASSERTS

// we deliberately don't want asserts to be marked as no-return, since that
// would trigger warnings in debug builds of any code coming after the assert
#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wmissing-noreturn"
#endif

PIECEPROOF_EXPORT void assert_fail(char const* expr, int line
	, char const* file, char const* function, char const* value, int kind)
{
	char const* message = "assertion failed\n";

	switch (kind)
	{
		case 1:
			message = "A precondition of a pieceproof function has been violated.\n"
				"This indicates a bug in the application using pieceproof\n";
	}

	assert_print("%s\n"
		"file: '%s'\n"
		"line: %d\n"
		"function: %s\n"
		"expression: %s\n"
		"%s%s\n"
		, message
		, file, line, function, expr
		, value ? value : "", value ? "\n" : "");

	// send SIGABRT to the current process
	// to break into the debugger
	std::raise(SIGABRT);
	std::abort();
}

#ifdef __clang__
#pragma clang diagnostic pop
#endif

#else

// this is just here to make it possible for a client that built with asserts
// enabled to be able to link against a release build
PIECEPROOF_EXPORT void assert_fail(char const*, int, char const*
	, char const*, char const*, int) {}

#endif

}
