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

TEST_CASE("log levels reflect to and from their names", "[log]")
{
	using herald::log::level;
	using herald::log::reflect;

	CHECK(reflect(level::CRITICAL) == "CRITICAL");
	CHECK(reflect(level::DEBUG) == "DEBUG");
	CHECK(reflect(level::DERROR) == "ERROR");
	CHECK(reflect("NOTICE") == level::NOTICE);
	CHECK(reflect("DWARNING") == level::DWARNING);
	CHECK_THROWS_AS(reflect("LOUD"), herald::error);
}

TEST_CASE("loggers are registered by name", "[log]")
{
	CHECK(herald::log::log::find("herald") == &herald::log::general);
	CHECK(herald::log::log::find("m.push") == &herald::m::push::log);
	CHECK(herald::log::log::find("test.nonexistent") == nullptr);

	{
		herald::log::log scoped{"test.scoped"};
		CHECK(herald::log::log::exists(&scoped));
		CHECK_THROWS_AS(herald::log::log{"test.scoped"}, herald::error);
	}

	CHECK(herald::log::log::find("test.scoped") == nullptr);
}

TEST_CASE("console levels are toggled individually and by threshold", "[log]")
{
	using herald::log::level;

	herald::log::console_level(level::INFO);
	CHECK(herald::log::console_enabled(level::ERROR));
	CHECK(herald::log::console_enabled(level::INFO));
	CHECK_FALSE(herald::log::console_enabled(level::DEBUG));

	herald::log::console_enable(level::DEBUG);
	CHECK(herald::log::console_enabled(level::DEBUG));

	herald::log::console_disable();
	CHECK_FALSE(herald::log::console_enabled(level::CRITICAL));
	herald::log::console_enable();
	CHECK(herald::log::console_enabled(level::CRITICAL));

	CHECK(herald::conf::set("herald.log.console.level", "warning"));
	CHECK(herald::log::console_enabled(level::WARNING));
	CHECK_FALSE(herald::log::console_enabled(level::NOTICE));

	CHECK(herald::conf::reset("herald.log.console.level"));
	CHECK(herald::log::console_enabled(level::INFO));
	CHECK_FALSE(herald::log::console_enabled(level::DERROR));
}

TEST_CASE("format argument mismatches are not fatal", "[log]")
{
	using herald::fmt::sprintf;

	CHECK(std::string(sprintf{"%s and %d", "one", 2}) == "one and 2");
	CHECK(std::string(sprintf{"%s and %s", "one"}) == "one and ");
	CHECK(std::string(sprintf{"%s", "one", "two"}) == "one");
	CHECK_NOTHROW(herald::log::debug{herald::m::push::log, "%s %s", 1});
}

TEST_CASE("exception messages carry the name of the exception", "[log]")
{
	CHECK(std::string(herald::error{"bad %s", "thing"}.what()) == "error :bad thing");
	CHECK(std::string(herald::user_error{}.what()) == "user_error.");
	CHECK(std::string(herald::json::parse_error{"x"}.what()) == "parse_error :x");
}

TEST_CASE("matrix errors carry an errcode and an http code", "[log]")
{
	const herald::m::UNAVAILABLE unavailable;
	CHECK(unavailable.errcode == "M_UNAVAILABLE");
	CHECK(unavailable.code == herald::http::SERVICE_UNAVAILABLE);
	CHECK(std::string(unavailable.what()) == "M_UNAVAILABLE :Service Unavailable");

	const herald::m::push::NOT_A_RULE not_a_rule{"scope %s", "room"};
	CHECK(not_a_rule.errcode == "M_NOT_A_RULE");
	CHECK(not_a_rule.code == herald::http::BAD_REQUEST);
	CHECK(std::string(not_a_rule.what()) == "M_NOT_A_RULE :scope room");

	const herald::m::error plain;
	CHECK(plain.errcode == "M_UNKNOWN");
	CHECK(plain.code == herald::http::INTERNAL_SERVER_ERROR);

	try
	{
		throw herald::m::BAD_JSON{"missing %s", "type"};
	}
	catch(const herald::error &e)
	{
		CHECK(std::string(e.what()) == "M_BAD_JSON :missing type");
	}
}
