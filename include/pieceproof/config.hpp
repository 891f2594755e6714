/*

Copyright (c) 2005-2020, Arvid Norberg
Copyright (c) 2016, Alden Torres
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECEPROOF_CONFIG_HPP_INCLUDED
#define PIECEPROOF_CONFIG_HPP_INCLUDED

// make sure stat() and pread() take 64 bit offsets
#if !defined _FILE_OFFSET_BITS
#define _FILE_OFFSET_BITS 64
#endif

#include <boost/config.hpp>
#include <boost/version.hpp>

#include "pieceproof/aux_/export.hpp"

#if defined __linux__
#define PIECEPROOF_LINUX
#elif defined __APPLE__ && defined __MACH__
#define PIECEPROOF_APPLE
#elif defined __FreeBSD__ || defined __NetBSD__ || defined __OpenBSD__
#define PIECEPROOF_BSD
#endif

#if defined _WIN32
#error "pieceproof reads content through POSIX file descriptors"
#endif

#if defined __GNUC__ || defined __clang__
#define PIECEPROOF_FORMAT(fmt, ellipsis) __attribute__((__format__(__printf__, fmt, ellipsis)))
#else
#define PIECEPROOF_FORMAT(fmt, ellipsis)
#endif

#ifndef PIECEPROOF_USE_ASSERTS
#define PIECEPROOF_USE_ASSERTS 0
#endif

#ifndef PIECEPROOF_USE_IOSTREAM
#define PIECEPROOF_USE_IOSTREAM 1
#endif

// enables DLOG() output from the hashing pipeline
#ifndef PIECEPROOF_DEBUG_LOGGING
#define PIECEPROOF_DEBUG_LOGGING 0
#endif

#define PIECEPROOF_UNUSED(x) (void)(x)

#endif // PIECEPROOF_CONFIG_HPP_INCLUDED
