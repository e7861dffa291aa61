// Herald
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2020 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

#include "fixture.h"

using lru = herald::util::lru<std::string, int>;

TEST_CASE("lru evicts the least recent entry at capacity", "[lru]")
{
	std::vector<std::string> evicted;
	lru cache
	{
		2, [&evicted](const std::string &key, int &)
		{
			evicted.emplace_back(key);
		}
	};

	cache.emplace("a", 1);
	cache.emplace("b", 2);
	REQUIRE(cache.size() == 2);

	SECTION("without access the oldest goes")
	{
		cache.emplace("c", 3);
		CHECK(evicted == std::vector<std::string>{"a"});
		CHECK_FALSE(cache.has("a"));
		CHECK(cache.has("b"));
		CHECK(cache.has("c"));
	}

	SECTION("get refreshes recency")
	{
		REQUIRE(cache.get("a"));
		cache.emplace("c", 3);
		CHECK(evicted == std::vector<std::string>{"b"});
		CHECK(cache.has("a"));
	}

	SECTION("find leaves recency alone")
	{
		REQUIRE(cache.find("a"));
		CHECK(*cache.find("a") == 1);
		cache.emplace("c", 3);
		CHECK(evicted == std::vector<std::string>{"a"});
	}

	SECTION("emplace of an existing key keeps the value")
	{
		CHECK(cache.emplace("a", 10) == 1);
		cache.emplace("c", 3);
		CHECK(evicted == std::vector<std::string>{"b"});
	}

	SECTION("shrinking evicts down to the capacity")
	{
		cache.resize(1);
		CHECK(cache.size() == 1);
		CHECK(evicted == std::vector<std::string>{"a"});
	}

	SECTION("erase and clear skip the eviction callback")
	{
		CHECK(cache.erase("a"));
		CHECK_FALSE(cache.erase("a"));
		cache.clear();
		CHECK(cache.empty());
		CHECK(evicted.empty());
	}
}

TEST_CASE("lru with zero capacity is unbounded", "[lru]")
{
	lru cache{0};
	for(int i(0); i < 1000; ++i)
		cache.emplace(std::to_string(i), i);

	CHECK(cache.size() == 1000);
	CHECK(cache.get("0"));
	CHECK_FALSE(cache.get("1000"));
}

TEST_CASE("lru for_each stops when the closure returns false", "[lru]")
{
	lru cache{0};
	cache.emplace("a", 1);
	cache.emplace("b", 2);
	cache.emplace("c", 3);

	size_t visited(0);
	const bool completed
	{
		cache.for_each([&visited](const std::string &, int &)
		{
			return ++visited < 2;
		})
	};

	CHECK_FALSE(completed);
	CHECK(visited == 2);
}
