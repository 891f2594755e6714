/*

Copyright (c) 2005, 2008-2009, 2013-2020, Arvid Norberg
Copyright (c) 2016, Alden Torres
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECEPROOF_EXPORT_HPP_INCLUDED
#define PIECEPROOF_EXPORT_HPP_INCLUDED

#include <boost/config.hpp>

// backwards compatibility with older versions of boost
#if !defined BOOST_SYMBOL_EXPORT && !defined BOOST_SYMBOL_IMPORT
# if defined _MSC_VER || defined __MINGW32__
#  define BOOST_SYMBOL_EXPORT __declspec(dllexport)
#  define BOOST_SYMBOL_IMPORT __declspec(dllimport)
# elif __GNUC__ >= 4
#  define BOOST_SYMBOL_EXPORT __attribute__((visibility("default")))
#  define BOOST_SYMBOL_IMPORT __attribute__((visibility("default")))
# else
#  define BOOST_SYMBOL_EXPORT
#  define BOOST_SYMBOL_IMPORT
# endif
#endif

#if defined PIECEPROOF_BUILDING_SHARED
# define PIECEPROOF_EXPORT BOOST_SYMBOL_EXPORT
#elif defined PIECEPROOF_LINKING_SHARED
# define PIECEPROOF_EXPORT BOOST_SYMBOL_IMPORT
#endif

// when this is specified, export a bunch of extra
// symbols, mostly for the unit tests to reach
#if defined PIECEPROOF_EXPORT_EXTRA
# if defined PIECEPROOF_BUILDING_SHARED
#  define PIECEPROOF_EXTRA_EXPORT BOOST_SYMBOL_EXPORT
# elif defined PIECEPROOF_LINKING_SHARED
#  define PIECEPROOF_EXTRA_EXPORT BOOST_SYMBOL_IMPORT
# endif
#endif

#ifndef PIECEPROOF_EXPORT
# define PIECEPROOF_EXPORT
#endif

#ifndef PIECEPROOF_EXTRA_EXPORT
# define PIECEPROOF_EXTRA_EXPORT
#endif

#endif
