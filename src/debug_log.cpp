/*

Copyright (c) 2022, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "pieceproof/config.hpp"
#include "pieceproof/aux_/debug_log.hpp"

#if PIECEPROOF_DEBUG_LOGGING

#include "pieceproof/time.hpp"

#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace pieceproof::aux {

	void debug_log(char const* fmt, ...)
	{
		static std::mutex log_mutex;
		static const time_point start = clock_type::now();
		// map thread IDs to low numbers
		static std::unordered_map<std::thread::id, int> thread_ids;

		std::thread::id const self = std::this_thread::get_id();

		std::unique_lock<std::mutex> l(log_mutex);
		auto it = thread_ids.insert({self, int(thread_ids.size())}).first;

		va_list v;
		va_start(v, fmt);
		char usr[2048];
		int len = std::vsnprintf(usr, sizeof(usr), fmt, v);
		va_end(v);
		if (len <= 0) return;
		// the message was truncated
		if (len >= int(sizeof(usr))) len = int(sizeof(usr)) - 1;

		static bool prepend_time = true;
		if (!prepend_time)
		{
			prepend_time = (usr[len - 1] == '\n');
			std::fputs(usr, stderr);
			return;
		}
		char buf[2300];
		int const t = int(total_milliseconds(clock_type::now() - start));
		std::snprintf(buf, sizeof(buf), "\x1b[3%dm%05d: [%d] %s\x1b[0m"
			, (it->second % 7) + 1, t, it->second, usr);
		prepend_time = (usr[len - 1] == '\n');
		std::fputs(buf, stderr);
	}
}

#endif // PIECEPROOF_DEBUG_LOGGING
