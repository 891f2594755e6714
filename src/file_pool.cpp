/*

Copyright (c) 2006-2020, Arvid Norberg
Copyright (c) 2016, Alden Torres
Copyright (c) 2019, Steven Siloti
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "pieceproof/config.hpp"
#include "pieceproof/assert.hpp"
#include "pieceproof/aux_/file_pool.hpp"
#include "pieceproof/aux_/debug_log.hpp"

namespace pieceproof::aux {

	file_pool::file_pool(int const size)
		: m_size(size)
	{
		PIECEPROOF_ASSERT_PRECOND(size > 0);
	}

	file_pool::~file_pool() = default;

	std::shared_ptr<file_handle> file_pool::open_file(std::string const& p)
	{
		// potentially used to hold a reference to a file object that's
		// about to be destructed. If we have such object we assign it to
		// this member to be destructed after we release the std::mutex. On some
		// operating systems (such as OSX) closing a file may take a long
		// time. We don't want to hold the std::mutex for that.
		std::shared_ptr<file_handle> defer_destruction;

		std::unique_lock<std::mutex> l(m_mutex);

		auto& key_view = m_files.get<0>();
		auto const i = key_view.find(p);
		if (i != key_view.end())
		{
			// unlike a least-recently-used cache, a hit does not move the entry
			return i->mapping;
		}

		// throws storage_error
		auto mapping = std::make_shared<file_handle>(p);

		if (int(m_files.size()) >= m_size)
		{
			// the file cache is at its maximum size, close
			// the file that was opened first
			defer_destruction = remove_oldest(l);
		}

		DLOG("file_pool: open %s (%d open)\n", p.c_str(), int(m_files.size()) + 1);
		m_files.get<1>().push_back(file_pool_entry(p, mapping));
		return mapping;
	}

	std::shared_ptr<file_handle> file_pool::remove_oldest(std::unique_lock<std::mutex>&)
	{
		auto& order_view = m_files.get<1>();
		if (order_view.empty()) return {};

		DLOG("file_pool: evict %s\n", order_view.front().key.c_str());

		std::shared_ptr<file_handle> mapping = order_view.front().mapping;
		order_view.pop_front();

		// closing a file may be long running operation (mac os x)
		// let the caller destruct it once it has released the mutex
		return mapping;
	}

	void file_pool::release(std::string const& p)
	{
		std::unique_lock<std::mutex> l(m_mutex);

		auto& key_view = m_files.get<0>();
		auto const i = key_view.find(p);
		if (i == key_view.end()) return;

		auto mapping = i->mapping;
		key_view.erase(i);

		// closing a file may take a long time (mac os x), so make sure
		// we're not holding the mutex
		l.unlock();
	}

	void file_pool::release()
	{
		files_container defer_destruction;
		std::unique_lock<std::mutex> l(m_mutex);
		defer_destruction.swap(m_files);
		l.unlock();

		// the files will be closed here, not holding the mutex
	}

	void file_pool::resize(int const size)
	{
		// these are destructed _after_ the mutex is released
		std::vector<std::shared_ptr<file_handle>> defer_destruction;

		std::unique_lock<std::mutex> l(m_mutex);

		PIECEPROOF_ASSERT_PRECOND(size > 0);

		if (size == m_size) return;
		m_size = size;
		if (int(m_files.size()) <= m_size) return;

		// close the oldest files
		while (int(m_files.size()) > m_size)
			defer_destruction.emplace_back(remove_oldest(l));
	}

	int file_pool::num_open() const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return int(m_files.size());
	}

	std::vector<std::string> file_pool::open_files() const
	{
		std::vector<std::string> ret;
		std::lock_guard<std::mutex> l(m_mutex);
		for (auto const& e : m_files.get<1>())
			ret.push_back(e.key);
		return ret;
	}
}
