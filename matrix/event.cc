// Herald
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2020 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

herald::string_view
herald::m::membership(const event &event)
{
	if(!is_member(event))
		return {};

	const auto &membership
	{
		event.content["membership"]
	};

	return membership.isString()?
		string_view{membership.asCString()}:
		string_view{};
}

bool
herald::m::is_member(const event &event)
noexcept
{
	return event.type == "m.room.member" && event.state_key;
}

//
// event::event
//

herald::m::event::event(const Json::Value &object)
try
:event_id
{
	object["event_id"].asString()
}
,room_id
{
	object["room_id"].asString()
}
,type
{
	object["type"].asString()
}
,sender
{
	object["sender"].asString()
}
,state_key
{
	object.isMember("state_key")?
		std::optional<std::string>{object["state_key"].asString()}:
		std::nullopt
}
,content
{
	object.get("content", Json::objectValue)
}
{
	if(!content.isObject())
		throw BAD_JSON
		{
			"Event %s content must be an object", event_id
		};
}
catch(const Json::Exception &e)
{
	throw BAD_JSON
	{
		"Malformed event :%s", e.what()
	};
}

//
// event::context
//

herald::m::event::context::context(std::string state_group,
                                   state_ids current_state)
:state_group{std::move(state_group)}
,current_state{std::move(current_state)}
{
}

/// {"state_group": "...", "state": [[type, state_key, event_id], ...]}
herald::m::event::context::context(const Json::Value &object)
try
:state_group
{
	object.get("state_group", "").asString()
}
{
	for(const auto &row : object["state"])
	{
		if(!row.isArray() || row.size() != 3)
			throw BAD_JSON
			{
				"Context state row must be [type, state_key, event_id]"
			};

		current_state.emplace
		(
			state_key{row[0].asString(), row[1].asString()},
			row[2].asString()
		);
	}
}
catch(const Json::Exception &e)
{
	throw BAD_JSON
	{
		"Malformed context :%s", e.what()
	};
}
