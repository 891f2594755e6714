/*

Copyright (c) 2017-2020, Arvid Norberg
Copyright (c) 2017, Alden Torres
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "pieceproof/sha1_hash.hpp"

#if PIECEPROOF_USE_IOSTREAM
#include <iostream>
#endif // PIECEPROOF_USE_IOSTREAM

namespace pieceproof {

	std::string sha1_hash::to_hex() const
	{
		static char const hex_chars[] = "0123456789abcdef";
		std::string ret;
		ret.resize(std::size_t(size() * 2));
		auto const* in = reinterpret_cast<std::uint8_t const*>(data());
		for (std::ptrdiff_t i = 0; i < size(); ++i)
		{
			ret[std::size_t(i * 2)] = hex_chars[in[i] >> 4];
			ret[std::size_t(i * 2 + 1)] = hex_chars[in[i] & 0xf];
		}
		return ret;
	}

#if PIECEPROOF_USE_IOSTREAM

	std::ostream& operator<<(std::ostream& os, sha1_hash const& h)
	{
		return os << h.to_hex();
	}

#endif // PIECEPROOF_USE_IOSTREAM

}
