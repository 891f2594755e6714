/*

Copyright (c) 2014-2020, Arvid Norberg
Copyright (c) 2016-2017, Alden Torres
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "pieceproof/hasher.hpp"
#include "pieceproof/assert.hpp"

#include <utility>

namespace pieceproof {

	hasher::hasher()
	{
		m_context = EVP_MD_CTX_new();
		EVP_DigestInit_ex(m_context, EVP_sha1(), nullptr);
	}

	hasher::hasher(span<char const> data)
		: hasher()
	{
		update(data);
	}

	hasher::hasher(hasher const& h)
	{
		m_context = EVP_MD_CTX_new();
		EVP_MD_CTX_copy_ex(m_context, h.m_context);
	}

	hasher& hasher::operator=(hasher const& h) &
	{
		if (this == &h) return *this;
		if (m_context == nullptr) m_context = EVP_MD_CTX_new();
		EVP_MD_CTX_copy_ex(m_context, h.m_context);
		return *this;
	}

	hasher::hasher(hasher&& h)
	{
		std::swap(m_context, h.m_context);
	}

	hasher& hasher::operator=(hasher&& h) &
	{
		if (this == &h) return *this;
		std::swap(m_context, h.m_context);
		return *this;
	}

	hasher& hasher::update(span<char const> data)
	{
		if (data.empty()) return *this;
		EVP_DigestUpdate(m_context, reinterpret_cast<unsigned char const*>(data.data())
			, static_cast<std::size_t>(data.size()));
		return *this;
	}

	sha1_hash hasher::final()
	{
		sha1_hash digest;
		EVP_DigestFinal_ex(m_context, reinterpret_cast<unsigned char*>(digest.data()), nullptr);
		return digest;
	}

	void hasher::reset()
	{
		EVP_DigestInit_ex(m_context, EVP_sha1(), nullptr);
	}

	hasher::~hasher()
	{
		if (m_context) EVP_MD_CTX_free(m_context);
	}

}
