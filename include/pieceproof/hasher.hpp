/*

Copyright (c) 2003-2020, Arvid Norberg
Copyright (c) 2016-2017, Alden Torres
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECEPROOF_HASHER_HPP_INCLUDED
#define PIECEPROOF_HASHER_HPP_INCLUDED

#include "pieceproof/config.hpp"
#include "pieceproof/sha1_hash.hpp"
#include "pieceproof/span.hpp"

#include <openssl/evp.h>

namespace pieceproof {

	// this is a SHA-1 hash class.
	//
	// You use it by first instantiating it, then call ``update()`` to feed it
	// with data. i.e. you don't have to keep the entire buffer of which you want to
	// create the hash in memory. You can feed the hasher parts of it at a time. When
	// You have fed the hasher with all the data, you call ``final()`` and it
	// will return the sha1-hash of the data.
	//
	// If you want to reuse the hasher object once you have created a hash, you have to
	// call ``reset()`` to reinitialize it.
	//
	// The digest is computed by OpenSSL's libcrypto.
	class PIECEPROOF_EXPORT hasher
	{
	public:

		hasher();

		// this is the same as default constructing followed by a call to
		// ``update(data)``.
		explicit hasher(span<char const> data);
		hasher(hasher const&);
		hasher& operator=(hasher const&) &;
		hasher(hasher&&);
		hasher& operator=(hasher&&) &;

		// append the following bytes to what is being hashed
		hasher& update(span<char const> data);

		// returns the SHA-1 digest of the buffers previously passed to
		// update() and the hasher constructor.
		sha1_hash final();

		// restore the hasher state to be as if the hasher has just been
		// default constructed.
		void reset();

		// hidden
		~hasher();

	private:

		EVP_MD_CTX* m_context = nullptr;
	};

}

#endif // PIECEPROOF_HASHER_HPP_INCLUDED
