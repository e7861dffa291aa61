// Herald
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2020 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

namespace herald::m::push
{
	static std::string scalar(const Json::Value &);
}

decltype(herald::m::push::log)
herald::m::push::log
{
	"m.push"
};

//
// cond
//

herald::m::push::cond::cond(const Json::Value &object)
{
	if(!object.isObject())
		return;

	kind = scalar(object["kind"]);
	key = scalar(object["key"]);
	pattern = scalar(object["pattern"]);
	is = scalar(object["is"]);

	// These kinds match against the recipient; their outcome can't be shared.
	if(kind == "contains_user_mxid" ||
	   kind == "contains_display_name" ||
	   kind == "state_key_user_mxid")
		return;

	id = scalar(object["_id"]);
}

//
// rule
//

herald::m::push::rule::rule(const Json::Value &object)
{
	if(!object.isObject())
	{
		malformed = true;
		return;
	}

	rule_id = scalar(object["rule_id"]);
	default_ = object["default"].isBool() && object["default"].asBool();
	enabled = !object["enabled"].isBool() || object["enabled"].asBool();

	const auto &pattern
	{
		object["pattern"]
	};

	if(pattern.isString())
	{
		conditions.emplace_back();
		conditions.back().kind = "event_match";
		conditions.back().key = "content.body";
		conditions.back().pattern = pattern.asString();
	}

	const auto &conds
	{
		object["conditions"]
	};

	if(!conds.isNull() && !conds.isArray())
		malformed = true;

	if(conds.isArray())
		for(const auto &cond : conds)
			conditions.emplace_back(cond);

	actions = object["actions"];
	if(!actions.isArray())
		malformed = true;

	if(malformed)
		log::derror
		{
			log, "Rule '%s' is malformed and will never match.",
			rule_id,
		};
}

//
// rules
//

decltype(herald::m::push::rules::kinds)
herald::m::push::rules::kinds
{
	"override",
	"content",
	"room",
	"sender",
	"underride",
};

/// A list of rules is taken in the order given; a document with scopes is
/// flattened.
herald::m::push::rules::rules(const Json::Value &doc)
{
	if(doc.isObject())
	{
		*this = flatten(doc);
		return;
	}

	if(!doc.isArray())
		throw NOT_A_RULE
		{
			"A ruleset must be an array of rules or an object of scopes."
		};

	reserve(doc.size());
	for(const auto &object : doc)
		emplace_back(object);
}

/// Room rules carry the room in their rule_id and sender rules carry the
/// sender; the implied condition is made explicit here.
herald::m::push::rules
herald::m::push::rules::flatten(const Json::Value &doc)
{
	if(!doc.isObject())
		throw NOT_A_RULE
		{
			"A ruleset document must be an object of scopes."
		};

	rules ret;
	for(const auto &kind : kinds)
	{
		const auto &scope
		{
			doc[std::string{kind}]
		};

		if(scope.isNull())
			continue;

		if(!scope.isArray())
			throw NOT_A_RULE
			{
				"Scope '%s' of the ruleset must be an array.", kind
			};

		for(const auto &object : scope)
		{
			auto &rule
			{
				ret.emplace_back(object)
			};

			if(kind != "room" && kind != "sender")
				continue;

			push::cond cond;
			cond.kind = "event_match";
			cond.key = kind == "room"? "room_id" : "sender";
			cond.pattern = rule.rule_id;
			rule.conditions.emplace(std::begin(rule.conditions), std::move(cond));
		}
	}

	return ret;
}

//
// actions
//

bool
herald::m::push::notifying(const Json::Value &actions)
{
	if(!actions.isArray())
		return false;

	for(const auto &action : actions)
	{
		if(!action.isString())
			continue;

		if(action.asString() == "notify")
			return true;

		if(action.asString() == "coalesce")
			return true;
	}

	return false;
}

bool
herald::m::push::highlighting(const Json::Value &actions)
{
	if(!actions.isArray())
		return false;

	for(const auto &action : actions)
	{
		if(!action.isObject())
			continue;

		if(scalar(action["set_tweak"]) != "highlight")
			continue;

		const auto &value
		{
			action["value"]
		};

		// If a highlight tweak is given with no value, its value is defined
		// to be true. If no highlight tweak is given at all then the value
		// of highlight is defined to be false.
		return value.isNull() || (value.isBool() && value.asBool());
	}

	return false;
}

/// The actions of a matching rule with every "dont_notify" removed. Null
/// unless the remainder notifies.
Json::Value
herald::m::push::normalize(const Json::Value &actions)
{
	Json::Value ret
	{
		Json::arrayValue
	};

	bool notify {false};
	if(actions.isArray())
		for(const auto &action : actions)
		{
			if(action.isString() && action.asString() == "dont_notify")
				continue;

			notify |= action.isString() && action.asString() == "notify";
			ret.append(action);
		}

	if(ret.empty() || !notify)
		return Json::Value{};

	return ret;
}

std::string
herald::m::push::scalar(const Json::Value &value)
{
	if(value.isString())
		return value.asString();

	if(value.isIntegral())
		return value.asString();

	return {};
}

/// The server default ruleset. Conditions which don't depend on the
/// recipient carry an _id; identical conditions share it.
decltype(herald::m::push::rules::defaults)
herald::m::push::rules::defaults
{
	flatten(json::parse(R"(
{
	"override": [
		{
			"rule_id": ".m.rule.master",
			"default": true,
			"enabled": false,
			"conditions": [],
			"actions": [
				"dont_notify"
			]
		},
		{
			"rule_id": ".m.rule.suppress_notices",
			"default": true,
			"enabled": true,
			"conditions": [
				{
					"kind": "event_match",
					"key": "content.msgtype",
					"pattern": "m.notice",
					"_id": "_suppress_notices"
				}
			],
			"actions": [
				"dont_notify"
			]
		},
		{
			"rule_id": ".m.rule.invite_for_me",
			"default": true,
			"enabled": true,
			"conditions": [
				{
					"kind": "event_match",
					"key": "type",
					"pattern": "m.room.member",
					"_id": "_member"
				},
				{
					"kind": "event_match",
					"key": "content.membership",
					"pattern": "invite",
					"_id": "_invite_member"
				},
				{
					"kind": "state_key_user_mxid"
				}
			],
			"actions": [
				"notify",
				{
					"set_tweak": "sound",
					"value": "default"
				},
				{
					"set_tweak": "highlight",
					"value": false
				}
			]
		},
		{
			"rule_id": ".m.rule.member_event",
			"default": true,
			"enabled": true,
			"conditions": [
				{
					"kind": "event_match",
					"key": "type",
					"pattern": "m.room.member",
					"_id": "_member"
				}
			],
			"actions": [
				"dont_notify"
			]
		},
		{
			"rule_id": ".m.rule.contains_display_name",
			"default": true,
			"enabled": true,
			"conditions": [
				{
					"kind": "contains_display_name"
				}
			],
			"actions": [
				"notify",
				{
					"set_tweak": "sound",
					"value": "default"
				},
				{
					"set_tweak": "highlight"
				}
			]
		},
		{
			"rule_id": ".m.rule.tombstone",
			"default": true,
			"enabled": true,
			"conditions": [
				{
					"kind": "event_match",
					"key": "type",
					"pattern": "m.room.tombstone",
					"_id": "_tombstone"
				},
				{
					"kind": "event_match",
					"key": "state_key",
					"pattern": "",
					"_id": "_tombstone_statekey"
				}
			],
			"actions": [
				"notify",
				{
					"set_tweak": "highlight",
					"value": true
				}
			]
		},
		{
			"rule_id": ".m.rule.reaction",
			"default": true,
			"enabled": true,
			"conditions": [
				{
					"kind": "event_match",
					"key": "type",
					"pattern": "m.reaction",
					"_id": "_reaction"
				}
			],
			"actions": [
				"dont_notify"
			]
		}
	],
	"content": [
		{
			"rule_id": ".m.rule.contains_user_name",
			"default": true,
			"enabled": true,
			"conditions": [
				{
					"kind": "contains_user_mxid"
				}
			],
			"actions": [
				"notify",
				{
					"set_tweak": "sound",
					"value": "default"
				},
				{
					"set_tweak": "highlight",
					"value": true
				}
			]
		}
	],
	"underride": [
		{
			"rule_id": ".m.rule.call",
			"default": true,
			"enabled": true,
			"conditions": [
				{
					"kind": "event_match",
					"key": "type",
					"pattern": "m.call.invite",
					"_id": "_call"
				}
			],
			"actions": [
				"notify",
				{
					"set_tweak": "sound",
					"value": "ring"
				},
				{
					"set_tweak": "highlight",
					"value": false
				}
			]
		},
		{
			"rule_id": ".m.rule.encrypted_room_one_to_one",
			"default": true,
			"enabled": true,
			"conditions": [
				{
					"kind": "event_match",
					"key": "type",
					"pattern": "m.room.encrypted",
					"_id": "_encrypted"
				},
				{
					"kind": "room_member_count",
					"is": "2",
					"_id": "member_one_to_one"
				}
			],
			"actions": [
				"notify",
				{
					"set_tweak": "sound",
					"value": "default"
				},
				{
					"set_tweak": "highlight",
					"value": false
				}
			]
		},
		{
			"rule_id": ".m.rule.room_one_to_one",
			"default": true,
			"enabled": true,
			"conditions": [
				{
					"kind": "event_match",
					"key": "type",
					"pattern": "m.room.message",
					"_id": "_message"
				},
				{
					"kind": "room_member_count",
					"is": "2",
					"_id": "member_one_to_one"
				}
			],
			"actions": [
				"notify",
				{
					"set_tweak": "sound",
					"value": "default"
				},
				{
					"set_tweak": "highlight",
					"value": false
				}
			]
		},
		{
			"rule_id": ".m.rule.message",
			"default": true,
			"enabled": true,
			"conditions": [
				{
					"kind": "event_match",
					"key": "type",
					"pattern": "m.room.message",
					"_id": "_message"
				}
			],
			"actions": [
				"notify",
				{
					"set_tweak": "highlight",
					"value": false
				}
			]
		},
		{
			"rule_id": ".m.rule.encrypted",
			"default": true,
			"enabled": true,
			"conditions": [
				{
					"kind": "event_match",
					"key": "type",
					"pattern": "m.room.encrypted",
					"_id": "_encrypted"
				}
			],
			"actions": [
				"notify",
				{
					"set_tweak": "highlight",
					"value": false
				}
			]
		}
	]
}
)"))
};
