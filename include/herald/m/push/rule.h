// Herald
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2020 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.
#pragma once
#define HAVE_HERALD_M_PUSH_RULE_H

/// PushRule
struct herald::m::push::rule
{
	/// Required. The ID of this rule.
	std::string rule_id;

	/// Required. Whether this is a default rule, or has been set explicitly.
	bool default_ {false};

	/// Required. Whether the push rule is enabled or not.
	bool enabled {true};

	/// The conditions that must hold true for an event in order for a rule
	/// to be applied to an event. A rule with no conditions always matches.
	/// The pattern of a content rule is carried here as its first condition.
	std::vector<cond> conditions;

	/// [object or string] Required. The actions to perform when this rule is
	/// matched.
	Json::Value actions;

	/// Set when the document was not a well-formed rule (i.e. missing
	/// actions); such a rule never matches.
	bool malformed {false};

	rule() = default;
	explicit rule(const Json::Value &);
};

/// 13.13.1.5 Push Ruleset
///
/// The ordered rules of one user. Evaluation proceeds in order and the first
/// rule whose conditions all match decides the outcome.
struct herald::m::push::rules
:std::vector<rule>
{
	/// The scopes of a ruleset document in order of priority.
	static const std::array<string_view, 5> kinds;

	/// Server default ruleset of the client-server API.
	static const rules defaults;

	/// Flattens a ruleset document {override, content, room, sender,
	/// underride} into priority order.
	static rules flatten(const Json::Value &);

	using std::vector<rule>::vector;

	rules() = default;
	explicit rules(const Json::Value &);
};
