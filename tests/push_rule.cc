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

TEST_CASE("rule documents are parsed", "[push][rule]")
{
	SECTION("enabled unless stated otherwise")
	{
		const push::rule rule
		{
			json::parse(R"({"rule_id":"r","conditions":[],"actions":["notify"]})")
		};

		CHECK(rule.rule_id == "r");
		CHECK(rule.enabled);
		CHECK_FALSE(rule.default_);
		CHECK_FALSE(rule.malformed);
		CHECK(rule.conditions.empty());
	}

	SECTION("a content pattern becomes the first condition")
	{
		const push::rule rule
		{
			json::parse(R"({"rule_id":"cake","pattern":"cake*","actions":["notify"]})")
		};

		REQUIRE(rule.conditions.size() == 1);
		CHECK(rule.conditions[0].kind == "event_match");
		CHECK(rule.conditions[0].key == "content.body");
		CHECK(rule.conditions[0].pattern == "cake*");
	}

	SECTION("conditions keep their identifiers")
	{
		const push::rule rule
		{
			json::parse(R"({
				"rule_id":"r",
				"enabled":false,
				"conditions":[{"kind":"room_member_count","is":"<=10","_id":"small"}],
				"actions":[]
			})")
		};

		CHECK_FALSE(rule.enabled);
		REQUIRE(rule.conditions.size() == 1);
		CHECK(rule.conditions[0].is == "<=10");
		CHECK(rule.conditions[0].id == "small");
	}

	SECTION("missing actions or bad conditions make it malformed")
	{
		CHECK(push::rule{json::parse(R"({"rule_id":"r"})")}.malformed);
		CHECK(push::rule{json::parse(R"({"rule_id":"r","conditions":{},"actions":[]})")}.malformed);
		CHECK(push::rule{json::parse(R"(["notify"])")}.malformed);
	}
}

TEST_CASE("rulesets are flattened in priority order", "[push][rule]")
{
	const push::rules rules
	(
		json::parse(R"({
			"underride": [{"rule_id":"u","actions":["notify"]}],
			"sender": [{"rule_id":"@bob:example.org","actions":["notify"]}],
			"room": [{"rule_id":"!room:example.org","actions":["dont_notify"]}],
			"content": [{"rule_id":"c","pattern":"x","actions":["notify"]}],
			"override": [{"rule_id":"o","actions":["notify"]}]
		})")
	);

	REQUIRE(rules.size() == 5);
	CHECK(rules[0].rule_id == "o");
	CHECK(rules[1].rule_id == "c");
	CHECK(rules[2].rule_id == "!room:example.org");
	CHECK(rules[3].rule_id == "@bob:example.org");
	CHECK(rules[4].rule_id == "u");

	REQUIRE(rules[2].conditions.size() == 1);
	CHECK(rules[2].conditions[0].key == "room_id");
	CHECK(rules[2].conditions[0].pattern == "!room:example.org");

	REQUIRE(rules[3].conditions.size() == 1);
	CHECK(rules[3].conditions[0].key == "sender");
	CHECK(rules[3].conditions[0].pattern == "@bob:example.org");

	CHECK(rules[4].conditions.empty());
}

TEST_CASE("rulesets which aren't rules are rejected", "[push][rule]")
{
	CHECK_THROWS_AS(push::rules(json::parse(R"("defaults")")), push::NOT_A_RULE);
	CHECK_THROWS_AS(push::rules(json::parse(R"({"override":{}})")), push::NOT_A_RULE);
	CHECK_THROWS_AS(push::rules::flatten(json::parse("[]")), push::NOT_A_RULE);
	CHECK_THROWS_AS(json::parse("{"), json::parse_error);

	const push::rules list
	(
		json::parse(R"([{"rule_id":"a","actions":[]},{"rule_id":"b","actions":[]}])")
	);

	REQUIRE(list.size() == 2);
	CHECK(list[0].rule_id == "a");
	CHECK(list[1].rule_id == "b");
}

TEST_CASE("default ruleset", "[push][rule]")
{
	const auto &defaults(push::rules::defaults);

	REQUIRE_FALSE(defaults.empty());
	CHECK(defaults.front().rule_id == ".m.rule.master");
	CHECK_FALSE(defaults.front().enabled);
	CHECK(defaults.back().rule_id == ".m.rule.encrypted");

	for(const auto &rule : defaults)
	{
		CHECK(rule.default_);
		CHECK_FALSE(rule.malformed);
	}

	const auto it
	{
		std::find_if(begin(defaults), end(defaults), [](const auto &rule)
		{
			return rule.rule_id == ".m.rule.room_one_to_one";
		})
	};

	REQUIRE(it != end(defaults));
	REQUIRE(it->conditions.size() == 2);
	CHECK(it->conditions[0].id == "_message");
	CHECK(it->conditions[1].id == "member_one_to_one");
}

TEST_CASE("actions", "[push][rule]")
{
	const auto actions
	{
		json::parse(R"(["notify",{"set_tweak":"sound","value":"default"},{"set_tweak":"highlight"}])")
	};

	CHECK(push::notifying(actions));
	CHECK(push::highlighting(actions));
	CHECK(push::notifying(json::parse(R"(["coalesce"])")));
	CHECK_FALSE(push::notifying(json::parse(R"(["dont_notify"])")));
	CHECK_FALSE(push::highlighting(json::parse(R"(["notify",{"set_tweak":"highlight","value":false}])")));
	CHECK_FALSE(push::highlighting(json::parse(R"(["notify"])")));

	SECTION("normalize strips dont_notify")
	{
		CHECK(push::normalize(json::parse(R"(["dont_notify","notify"])")) == json::parse(R"(["notify"])"));
		CHECK(push::normalize(actions) == actions);
	}

	SECTION("normalize yields null when nothing notifies")
	{
		CHECK(push::normalize(json::parse(R"(["dont_notify"])")).isNull());
		CHECK(push::normalize(json::parse("[]")).isNull());
		CHECK(push::normalize(json::parse(R"([{"set_tweak":"sound","value":"ring"}])")).isNull());
		CHECK(push::normalize(json::parse(R"(["coalesce"])")).isNull());
	}
}
