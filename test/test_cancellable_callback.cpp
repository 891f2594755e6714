/*

Copyright (c) 2022, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "test.hpp"

#include "pieceproof/aux_/cancellable_callback.hpp"

#include <stdexcept>

using namespace pieceproof;

namespace {

// a clock the test advances by hand
struct fake_clock
{
	time_point now = time_point(seconds(1000));
	time_point operator()() const { return now; }
};

using callback = aux::cancellable_callback<int>;

}

PIECEPROOF_TEST(no_callback)
{
	callback cb(callback::callback_t{});
	TEST_CHECK(!cb);
	TEST_CHECK(!cb(true, 1));
	TEST_EQUAL(cb.num_calls(), 0);
	TEST_CHECK(!cb.cancelled());
}

PIECEPROOF_TEST(zero_interval_calls_every_time)
{
	std::vector<int> calls;
	callback cb([&](int v) { calls.push_back(v); return false; });
	for (int i = 0; i < 5; ++i)
		TEST_CHECK(!cb(false, i));
	TEST_EQUAL(calls.size(), 5);
	TEST_EQUAL(cb.num_calls(), 5);
}

PIECEPROOF_TEST(interval)
{
	fake_clock clock;
	std::vector<int> calls;
	callback cb([&](int v) { calls.push_back(v); return false; }
		, seconds(1), [&] { return clock(); });

	// the first call is always made
	cb(false, 0);
	TEST_EQUAL(calls.size(), 1);

	// throttled
	clock.now += milliseconds(300);
	cb(false, 1);
	clock.now += milliseconds(300);
	cb(false, 2);
	TEST_EQUAL(calls.size(), 1);

	// forced calls ignore the interval
	cb(true, 3);
	TEST_EQUAL(calls.size(), 2);
	TEST_EQUAL(calls.back(), 3);

	// the interval restarts at the last call
	clock.now += milliseconds(900);
	cb(false, 4);
	TEST_EQUAL(calls.size(), 2);
	clock.now += milliseconds(100);
	cb(false, 5);
	TEST_EQUAL(calls.size(), 3);
	TEST_EQUAL(calls.back(), 5);
}

PIECEPROOF_TEST(calls_match_elapsed_time)
{
	fake_clock clock;
	int num_calls = 0;
	callback cb([&](int) { ++num_calls; return false; }
		, milliseconds(100), [&] { return clock(); });

	// one event every 10 ms for one second. One call per 100 ms bucket
	for (int i = 0; i < 100; ++i)
	{
		cb(false, i);
		clock.now += milliseconds(10);
	}
	TEST_EQUAL(num_calls, 10);
}

PIECEPROOF_TEST(cancel)
{
	int hooks = 0;
	int calls = 0;
	callback cb([&](int v) { ++calls; return v == 2; });
	cb.on_cancel([&] { ++hooks; });
	cb.on_cancel([&] { ++hooks; });

	TEST_CHECK(!cb(false, 1));
	TEST_CHECK(cb(false, 2));
	TEST_CHECK(cb.cancelled());
	TEST_EQUAL(hooks, 2);

	// once cancelled, the function isn't called anymore
	TEST_CHECK(cb(true, 3));
	TEST_EQUAL(calls, 2);
	TEST_EQUAL(hooks, 2);
}

PIECEPROOF_TEST(exception_cancels)
{
	int hooks = 0;
	callback cb([&](int) -> bool { throw std::runtime_error("callback failed"); });
	cb.on_cancel([&] { ++hooks; });

	TEST_THROW(cb(false, 1));
	TEST_EQUAL(hooks, 1);
	TEST_CHECK(cb.cancelled());
}
