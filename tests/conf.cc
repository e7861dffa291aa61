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

namespace conf = herald::conf;

TEST_CASE("conf items are registered by name", "[conf]")
{
	CHECK(conf::exists("herald.m.push.room_cache.size"));
	CHECK(conf::exists("herald.m.push.bulk.invite"));
	CHECK(conf::exists("herald.log.console.level"));
	CHECK_FALSE(conf::exists("herald.nonexistent"));

	CHECK(conf::get("herald.m.push.room_cache.size") == "10000");
	CHECK(conf::get("herald.m.push.bulk.invite") == "true");
	CHECK_THROWS_AS(conf::get("herald.nonexistent"), conf::not_found);
	CHECK_THROWS_AS(conf::set("herald.nonexistent", "1"), conf::not_found);
	CHECK_FALSE(conf::set(std::nothrow, "herald.nonexistent", "1"));
}

TEST_CASE("conf item values are set, rejected and reset", "[conf]")
{
	conf::item<uint64_t> size
	{
		{ "name",     "herald.test.conf.size" },
		{ "default",  64                      },
	};

	conf::item<bool> flag
	{
		{ "name",     "herald.test.conf.flag" },
		{ "default",  false                   },
	};

	conf::item<std::string> text
	{
		{ "name",     "herald.test.conf.text" },
		{ "default",  "plain"                 },
	};

	CHECK(uint64_t(size) == 64);
	CHECK_FALSE(bool(flag));
	CHECK(std::string(text) == "plain");

	CHECK(conf::set("herald.test.conf.size", "128"));
	CHECK(uint64_t(size) == 128);
	CHECK_THROWS_AS(conf::set("herald.test.conf.size", "many"), conf::bad_value);
	CHECK(uint64_t(size) == 128);

	CHECK(conf::set("herald.test.conf.flag", "TRUE"));
	CHECK(bool(flag));
	CHECK_THROWS_AS(flag.set("maybe"), conf::bad_value);
	CHECK(bool(flag));
	CHECK(flag.set("False"));
	CHECK_FALSE(bool(flag));
	CHECK(flag.set("1"));
	CHECK(bool(flag));
	CHECK(flag.set("0"));
	CHECK_FALSE(bool(flag));
	CHECK(flag.set("true"));

	CHECK(conf::set("herald.test.conf.text", "fancy"));
	CHECK(conf::get("herald.test.conf.text") == "fancy");

	CHECK(conf::reset("herald.test.conf.size"));
	CHECK(uint64_t(size) == 64);
	CHECK(text.reset());
	CHECK(std::string(text) == "plain");
}

TEST_CASE("conf item names are unique while the item lives", "[conf]")
{
	conf::item<int64_t> first
	{
		{ "name",     "herald.test.conf.unique" },
		{ "default",  -1                        },
	};

	CHECK(int64_t(first) == -1);
	CHECK_THROWS_AS
	(
		conf::item<int64_t>({{ "name", "herald.test.conf.unique" }}),
		conf::error
	);
}

TEST_CASE("conf item takes its value from the environment", "[conf]")
{
	::setenv("herald_test_conf_env", "7", 1);
	conf::item<uint64_t> item
	{
		{ "name",     "herald.test.conf.env" },
		{ "default",  3                      },
	};

	::unsetenv("herald_test_conf_env");
	CHECK(uint64_t(item) == 7);
}

TEST_CASE("conf set callback runs after each assignment", "[conf]")
{
	size_t calls(0);
	conf::item<bool> item
	{
		{
			{ "name",     "herald.test.conf.callback" },
			{ "default",  true                        },
		},
		[&calls]
		{
			++calls;
		}
	};

	CHECK(calls == 0);
	CHECK(item.set("false"));
	CHECK(calls == 1);
	CHECK_FALSE(bool(item));
}
