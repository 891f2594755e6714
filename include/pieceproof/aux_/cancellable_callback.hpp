/*

Copyright (c) 2022, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECEPROOF_CANCELLABLE_CALLBACK_HPP_INCLUDED
#define PIECEPROOF_CANCELLABLE_CALLBACK_HPP_INCLUDED

#include <functional>
#include <utility>
#include <vector>

#include "pieceproof/config.hpp"
#include "pieceproof/time.hpp"

namespace pieceproof::aux {

	// wraps a user supplied progress function returning true to request
	// cancellation. Calls are throttled to at most one per ``interval``,
	// except the first call and forced calls (errors and the final event),
	// which are always made.
	//
	// When the function requests cancellation, or throws, all hooks
	// registered with on_cancel() are invoked. Exceptions are rethrown after
	// that.
	template <typename... Args>
	struct cancellable_callback
	{
		using callback_t = std::function<bool(Args...)>;
		using clock_fun = std::function<time_point()>;

		explicit cancellable_callback(callback_t cb
			, time_duration const interval = time_duration::zero()
			, clock_fun clock = &clock_type::now)
			: m_callback(std::move(cb))
			, m_interval(interval)
			, m_clock(std::move(clock))
		{}

		// returns true if the wrapped function requested cancellation, now or
		// in an earlier call. Once cancelled, the function is not called
		// anymore
		bool operator()(bool const force, Args... args)
		{
			if (m_cancelled) return true;
			if (!m_callback) return false;

			time_point const now = m_clock();
			if (!force && m_called && now - m_last_call < m_interval)
				return false;

			m_called = true;
			m_last_call = now;
			++m_num_calls;

			bool cancel = false;
			try
			{
				cancel = m_callback(std::forward<Args>(args)...);
			}
			catch (...)
			{
				cancel_all();
				throw;
			}
			if (cancel) cancel_all();
			return m_cancelled;
		}

		// register a function to be called on cancellation
		void on_cancel(std::function<void()> f)
		{ m_on_cancel.push_back(std::move(f)); }

		bool cancelled() const { return m_cancelled; }

		// the number of times the wrapped function was called
		int num_calls() const { return m_num_calls; }

		// true if there is a function to call
		explicit operator bool() const { return bool(m_callback); }

	private:

		void cancel_all()
		{
			m_cancelled = true;
			for (auto& f : m_on_cancel) f();
		}

		callback_t m_callback;
		time_duration m_interval;
		clock_fun m_clock;
		std::vector<std::function<void()>> m_on_cancel;
		time_point m_last_call{};
		int m_num_calls = 0;
		bool m_called = false;
		bool m_cancelled = false;
	};
}

#endif
