/*

Copyright (c) 2022, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECEPROOF_EXHAUST_QUEUE_HPP_INCLUDED
#define PIECEPROOF_EXHAUST_QUEUE_HPP_INCLUDED

#include <deque>
#include <mutex>
#include <condition_variable>

#include "pieceproof/config.hpp"
#include "pieceproof/assert.hpp"

namespace pieceproof::aux {

	// a FIFO queue shared between threads. A non-zero capacity makes push()
	// block while the queue is full, pop() blocks while it's empty.
	//
	// Once exhausted, every blocked and future call to push() fails, and
	// pop() fails once the remaining items have been drained. This is how
	// the producer signals that it's done, and how a stopping pipeline
	// unblocks all of its threads.
	template <typename T>
	struct exhaust_queue
	{
		// a capacity of 0 means unbounded
		explicit exhaust_queue(int const capacity = 0) : m_capacity(capacity)
		{ PIECEPROOF_ASSERT(capacity >= 0); }

		exhaust_queue(exhaust_queue const&) = delete;
		exhaust_queue& operator=(exhaust_queue const&) = delete;

		// returns false if the queue was exhausted, in which case ``item`` is
		// dropped
		bool push(T item)
		{
			std::unique_lock<std::mutex> l(m_mutex);
			m_not_full.wait(l, [this] { return m_exhausted || !full(); });
			if (m_exhausted) return false;
			m_queue.push_back(std::move(item));
			l.unlock();
			m_not_empty.notify_one();
			return true;
		}

		// returns false if the queue is exhausted and empty. Otherwise the
		// oldest item is moved into ``out``
		bool pop(T& out)
		{
			std::unique_lock<std::mutex> l(m_mutex);
			m_not_empty.wait(l, [this] { return m_exhausted || !m_queue.empty(); });
			if (m_queue.empty()) return false;
			out = std::move(m_queue.front());
			m_queue.pop_front();
			l.unlock();
			m_not_full.notify_one();
			return true;
		}

		void exhaust()
		{
			{
				std::lock_guard<std::mutex> l(m_mutex);
				m_exhausted = true;
			}
			m_not_empty.notify_all();
			m_not_full.notify_all();
		}

		bool exhausted() const
		{
			std::lock_guard<std::mutex> l(m_mutex);
			return m_exhausted;
		}

		int size() const
		{
			std::lock_guard<std::mutex> l(m_mutex);
			return int(m_queue.size());
		}

		int capacity() const { return m_capacity; }

	private:

		// the caller must hold m_mutex
		bool full() const
		{ return m_capacity > 0 && int(m_queue.size()) >= m_capacity; }

		int const m_capacity;
		bool m_exhausted = false;
		std::deque<T> m_queue;
		mutable std::mutex m_mutex;
		std::condition_variable m_not_empty;
		std::condition_variable m_not_full;
	};
}

#endif
