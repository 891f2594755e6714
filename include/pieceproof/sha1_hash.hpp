/*

Copyright (c) 2003-2020, Arvid Norberg
Copyright (c) 2016-2017, Alden Torres
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECEPROOF_SHA1_HASH_HPP_INCLUDED
#define PIECEPROOF_SHA1_HASH_HPP_INCLUDED

#include <array>
#include <cstdint>
#include <cstring>
#include <algorithm>
#include <string>
#include <iosfwd>

#include "pieceproof/config.hpp"
#include "pieceproof/assert.hpp"
#include "pieceproof/span.hpp"

namespace pieceproof {

	// This type holds a SHA-1 digest or any other kind of 20 byte
	// sequence. In pieceproof it holds the digest of one piece.
	class sha1_hash
	{
		static constexpr std::ptrdiff_t number_size = 5;
	public:

		using difference_type = std::ptrdiff_t;
		using index_type = std::ptrdiff_t;

		// the size of the hash in bytes
		static constexpr difference_type size() noexcept { return 20; }

		// constructs an all-zero digest
		sha1_hash() noexcept { clear(); }

		sha1_hash(sha1_hash const&) noexcept = default;
		sha1_hash& operator=(sha1_hash const&) noexcept = default;

		// copies 20 bytes from the pointer provided, into the digest.
		// The passed in string MUST be at least 20 bytes. 0-terminators
		// are ignored, ``s`` is treated like a raw memory buffer.
		explicit sha1_hash(char const* s) noexcept
		{
			if (s == nullptr) clear();
			else std::memcpy(m_number.data(), s, size());
		}

		explicit sha1_hash(span<char const> s) noexcept
		{
			assign(s);
		}

		void assign(span<char const> s) noexcept
		{
			PIECEPROOF_ASSERT(s.size() >= size());
			auto const sl = s.size() < size() ? s.size() : size();
			std::memcpy(m_number.data(), s.data(), static_cast<std::size_t>(sl));
		}

		char const* data() const noexcept { return reinterpret_cast<char const*>(m_number.data()); }
		char* data() noexcept { return reinterpret_cast<char*>(m_number.data()); }

		// set the digest to all zeros.
		void clear() noexcept { m_number.fill(0); }

		// return true if the digest is all zero.
		bool is_all_zeros() const noexcept
		{
			return std::all_of(m_number.begin(), m_number.end()
				, [](std::uint32_t v) { return v == 0; });
		}

		bool operator==(sha1_hash const& n) const noexcept
		{
			return std::equal(n.m_number.begin(), n.m_number.end(), m_number.begin());
		}
		bool operator!=(sha1_hash const& n) const noexcept
		{
			return !std::equal(n.m_number.begin(), n.m_number.end(), m_number.begin());
		}
		bool operator<(sha1_hash const& n) const noexcept
		{
			return std::memcmp(data(), n.data(), size()) < 0;
		}

		// accessors for specific bytes
		std::uint8_t& operator[](index_type i) noexcept
		{
			PIECEPROOF_ASSERT(i < size());
			return reinterpret_cast<std::uint8_t*>(m_number.data())[i];
		}
		std::uint8_t const& operator[](index_type i) const noexcept
		{
			PIECEPROOF_ASSERT(i < size());
			return reinterpret_cast<std::uint8_t const*>(m_number.data())[i];
		}

		// return a copy of the 20 bytes representing the digest as a std::string.
		// It's still a binary string with 20 binary characters.
		std::string to_string() const
		{
			return std::string(data(), std::size_t(size()));
		}

		// return the digest as 40 lower case hexadecimal digits
		std::string to_hex() const;

	private:

		std::array<std::uint32_t, number_size> m_number;
	};

#if PIECEPROOF_USE_IOSTREAM
	// print a sha1_hash object to an ostream as 40 hexadecimal digits
	PIECEPROOF_EXPORT std::ostream& operator<<(std::ostream& os, sha1_hash const& h);
#endif
}

namespace std
{
	template <>
	struct hash<pieceproof::sha1_hash>
	{
		std::size_t operator()(pieceproof::sha1_hash const& k) const
		{
			std::size_t ret;
			// this is OK because sha1_hash is already a hash
			std::memcpy(&ret, k.data(), sizeof(ret));
			return ret;
		}
	};
}

#endif // PIECEPROOF_SHA1_HASH_HPP_INCLUDED
