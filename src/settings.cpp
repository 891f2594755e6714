/*

Copyright (c) 2022, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "pieceproof/settings.hpp"

#include <algorithm>
#include <thread>

namespace pieceproof {

	int hash_settings::num_threads() const
	{
		if (hashing_threads > 0) return hashing_threads;
		return std::max(1, int(std::thread::hardware_concurrency()));
	}

	int hash_settings::queue_capacity() const
	{
		return std::max(1, queue_depth_per_thread) * num_threads();
	}
}
