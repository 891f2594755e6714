/*

Copyright (c) 2006, 2009, 2013-2021, Arvid Norberg
Copyright (c) 2016, Alden Torres
Copyright (c) 2019, Steven Siloti
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECEPROOF_FILE_POOL_HPP
#define PIECEPROOF_FILE_POOL_HPP

#include "pieceproof/config.hpp"

#include <mutex>
#include <memory>
#include <string>
#include <vector>

#include "pieceproof/aux_/file.hpp"

#define BOOST_BIND_NO_PLACEHOLDERS

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index/sequenced_index.hpp>
#include <boost/multi_index/member.hpp>

namespace pieceproof::aux {

	namespace mi = boost::multi_index;

	struct file_pool_entry
	{
		file_pool_entry(std::string p, std::shared_ptr<file_handle> h)
			: key(std::move(p)), mapping(std::move(h)) {}

		std::string key;
		std::shared_ptr<file_handle> mapping;
	};

	// this is an internal cache of open file handles, keyed by the file's
	// path. Unlike a least-recently-used cache, hits don't move an entry.
	// When the pool is full, the file that was opened first is closed.
	struct PIECEPROOF_EXTRA_EXPORT file_pool
	{
		// ``size`` specifies the number of allowed files handles
		// to hold open at any given time.
		explicit file_pool(int size = 10);
		~file_pool();

		file_pool(file_pool const&) = delete;
		file_pool& operator=(file_pool const&) = delete;

		// return an open file handle to the file at path ``p``. Throws
		// storage_error if the file cannot be opened.
		std::shared_ptr<file_handle> open_file(std::string const& p);

		// close all files, or only the one at ``p``
		void release();
		void release(std::string const& p);

		// update the allowed number of open file handles to ``size``.
		void resize(int size);

		// returns the current limit of number of allowed open file handles
		int size_limit() const
		{
			std::lock_guard<std::mutex> l(m_mutex);
			return m_size;
		}

		int num_open() const;

		// the paths of the open files, oldest first
		std::vector<std::string> open_files() const;

	private:

		std::shared_ptr<file_handle> remove_oldest(std::unique_lock<std::mutex>&);

		int m_size;

		using files_container = mi::multi_index_container<
			file_pool_entry,
			mi::indexed_by<
			// look up files by path
			mi::ordered_unique<mi::member<file_pool_entry, std::string, &file_pool_entry::key>>,
			// files in the order they were opened. New items are added to the
			// back, and old items are removed from the front.
			mi::sequenced<>
			>
		>;

		files_container m_files;
		mutable std::mutex m_mutex;
	};
}

#endif
