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

using namespace herald::test;
namespace json = herald::json;

namespace
{
	push::cond
	make_cond(const std::string &id)
	{
		push::cond ret;
		ret.kind = "event_match";
		ret.key = "type";
		ret.pattern = "m.room.message";
		ret.id = id;
		return ret;
	}
}

TEST_CASE("conditions without an identifier are always evaluated", "[push][memo]")
{
	push::memo memo;
	size_t calls(0);
	const auto closure{[&calls]
	{
		++calls;
		return true;
	}};

	const auto cond(make_cond({}));
	CHECK(memo(cond, closure));
	CHECK(memo(cond, closure));
	CHECK(calls == 2);
	CHECK(memo.results.empty());
	CHECK(memo.hits == 0);
	CHECK(memo.misses == 0);
}

TEST_CASE("conditions with an identifier are evaluated once", "[push][memo]")
{
	push::memo memo;
	size_t calls(0);

	CHECK_FALSE(memo(make_cond("_notice"), [&calls]
	{
		++calls;
		return false;
	}));

	CHECK_FALSE(memo(make_cond("_notice"), [&calls]
	{
		++calls;
		return true;
	}));

	CHECK(memo(make_cond("_message"), [&calls]
	{
		++calls;
		return true;
	}));

	CHECK(calls == 2);
	CHECK(memo.misses == 2);
	CHECK(memo.hits == 1);
	CHECK(memo.results.at("_notice") == false);
	CHECK(memo.results.at("_message") == true);
}

TEST_CASE("a closure which throws records nothing", "[push][memo]")
{
	push::memo memo;
	CHECK_THROWS_AS(memo(make_cond("_broken"), []() -> bool
	{
		throw herald::error{"unevaluable"};
	}), herald::error);

	CHECK(memo.results.empty());
	CHECK(memo(make_cond("_broken"), []
	{
		return true;
	}));
}

TEST_CASE("identified conditions are shared between recipients", "[push][memo]")
{
	fixture f;
	f.member("@alice:example.org");
	f.member("@bob:example.org");
	f.member("@carol:example.org");
	f.subscribe("@bob:example.org", push::rules::defaults);
	f.subscribe("@carol:example.org", push::rules::defaults);

	std::map<std::string, size_t> evaluated;
	push::bulk bulk
	{
		f.hs, [&evaluated](const auto &event, const auto &cond, const auto &opts)
		{
			++evaluated[cond.id];
			return bool(push::match{event, cond, opts});
		}
	};

	const auto actions(bulk(message("@alice:example.org"), f.context()));
	CHECK(actions.size() == 2);
	CHECK(actions.count("@bob:example.org"));
	CHECK(actions.count("@carol:example.org"));

	CHECK(evaluated.at("_suppress_notices") == 1);
	CHECK(evaluated.at("_member") == 1);
	CHECK(evaluated.at("_message") == 1);
	CHECK(evaluated.at("member_one_to_one") == 1);

	// contains_display_name and contains_user_mxid for each recipient.
	CHECK(evaluated.at("") == 4);
}

TEST_CASE("conditions which match the recipient carry no identifier", "[push][memo]")
{
	for(const auto kind : {"contains_user_mxid", "contains_display_name", "state_key_user_mxid"})
	{
		Json::Value object;
		object["kind"] = kind;
		object["_id"] = "mention";
		CHECK(push::cond{object}.id.empty());
	}

	Json::Value object;
	object["kind"] = "event_match";
	object["key"] = "type";
	object["pattern"] = "m.room.message";
	object["_id"] = "_message";
	CHECK(push::cond{object}.id == "_message");
}

TEST_CASE("a stored mention rule is evaluated for each recipient", "[push][memo]")
{
	const std::string alice{"@alice:example.org"}, bob{"@bob:example.org"}, carol{"@carol:example.org"};

	fixture f;
	f.member(alice);
	f.member(bob);
	f.member(carol);

	const auto mention
	{
		make_rule
		(
			"mention",
			json::parse(R"([{"kind":"contains_user_mxid","_id":"mention"}])"),
			json::parse(R"(["notify"])")
		)
	};

	f.subscribe(bob, push::rules{mention});
	f.subscribe(carol, push::rules{mention});

	push::bulk bulk{f.hs};
	const auto actions(bulk(message(alice, "hey @bob:example.org"), f.context()));
	CHECK(actions.size() == 1);
	CHECK(actions.count(bob));
	CHECK_FALSE(actions.count(carol));
}
