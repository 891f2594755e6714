/*

Copyright (c) 2007, 2009, 2014-2020, Arvid Norberg
Copyright (c) 2016, Alden Torres
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECEPROOF_TIME_HPP_INCLUDED
#define PIECEPROOF_TIME_HPP_INCLUDED

#include "pieceproof/config.hpp"

#include <cstdint>
#include <chrono>

namespace pieceproof {

	// progress throttling must not jump with wall-clock adjustments
	using clock_type = std::chrono::steady_clock;

	using time_point = clock_type::time_point;
	using time_duration = clock_type::duration;

	using seconds = std::chrono::seconds;
	using milliseconds = std::chrono::milliseconds;
	using microseconds = std::chrono::microseconds;
	using std::chrono::duration_cast;

	template<class T>
	std::int64_t total_seconds(T td)
	{ return duration_cast<seconds>(td).count(); }

	template<class T>
	std::int64_t total_milliseconds(T td)
	{ return duration_cast<milliseconds>(td).count(); }

	template<class T>
	std::int64_t total_microseconds(T td)
	{ return duration_cast<microseconds>(td).count(); }

}

#endif // PIECEPROOF_TIME_HPP_INCLUDED
