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

decltype(herald::test::origin)
herald::test::origin
{
	"example.org"
};

decltype(herald::test::room_id)
herald::test::room_id
{
	"!room:example.org"
};

herald::test::fixture::fixture(const size_t &cache_size)
:hs
{
	{ origin, cache_size }, store, store
}
{
	state.emplace(m::event::context::state_key{"m.room.create", ""}, "$create");
}

std::string
herald::test::fixture::member(const std::string &user_id,
                              const std::string &membership)
{
	const std::string event_id
	{
		"$" + membership + "." + std::to_string(state.size()) + "." + user_id
	};

	store.add_member(event_id, user_id, membership);
	state[{"m.room.member", user_id}] = event_id;
	return event_id;
}

void
herald::test::fixture::subscribe(const std::string &user_id,
                                 push::rules rules)
{
	store.set_pusher(user_id, "pushkey:" + user_id);
	store.set_rules(user_id, std::move(rules));
}

herald::m::event::context
herald::test::fixture::context()
{
	return context("group." + std::to_string(++groups));
}

herald::m::event::context
herald::test::fixture::context(const std::string &state_group)
const
{
	return m::event::context
	{
		state_group, state
	};
}

std::shared_ptr<herald::m::push::room_rules>
herald::test::fixture::room()
{
	return hs.rules_cache.get(room_id);
}

herald::m::push::rule
herald::test::make_rule(const std::string &rule_id,
                        const Json::Value &conditions,
                        const Json::Value &actions,
                        const bool &enabled)
{
	Json::Value object;
	object["rule_id"] = rule_id;
	object["enabled"] = enabled;
	object["conditions"] = conditions;
	object["actions"] = actions;
	return push::rule{object};
}

herald::m::push::rules
herald::test::notify_on_message()
{
	return push::rules
	{
		make_rule
		(
			"message",
			json::parse(R"([{"kind":"event_match","key":"type","pattern":"m.room.message"}])"),
			json::parse(R"(["notify"])")
		)
	};
}

herald::m::event
herald::test::message(const std::string &sender,
                      const std::string &body,
                      const std::string &event_id)
{
	m::event ret;
	ret.event_id = event_id;
	ret.room_id = room_id;
	ret.type = "m.room.message";
	ret.sender = sender;
	ret.content["msgtype"] = "m.text";
	ret.content["body"] = body;
	return ret;
}

herald::m::event
herald::test::invite(const std::string &sender,
                     const std::string &invitee,
                     const std::string &event_id)
{
	m::event ret;
	ret.event_id = event_id;
	ret.room_id = room_id;
	ret.type = "m.room.member";
	ret.sender = sender;
	ret.state_key = invitee;
	ret.content["membership"] = "invite";
	return ret;
}
