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
#define HAVE_HERALD_M_PUSH_H

/// Push notifications. For every event this system decides which local
/// members of the room are notified and with which actions.
namespace herald::m::push
{
	struct cond;
	struct rule;
	struct rules;
	struct match;
	struct memo;
	struct member;
	struct profile;
	struct invalidator;
	struct store;
	struct room_rules;
	struct room_cache;
	struct bulk;
	struct memory;

	HERALD_M_EXCEPTION(m::error, error, http::INTERNAL_SERVER_ERROR)
	HERALD_M_EXCEPTION(error, NOT_A_RULE, http::BAD_REQUEST)

	/// Rules of each interested user; the rules are shared and immutable.
	using rules_by_user = std::map<std::string, std::shared_ptr<const rules>>;

	/// Result of evaluation; the value is the array of actions.
	using actions_by_user = std::map<std::string, Json::Value>;

	/// Table of the per-room caches held by the room_cache.
	using room_table = util::lru<std::string, std::shared_ptr<room_rules>>;

	bool highlighting(const Json::Value &actions); // true for highlight tweak
	bool notifying(const Json::Value &actions); // true on "notify" or "coalesce"
	Json::Value normalize(const Json::Value &actions); // null when nothing to notify

	extern log::log log;
}

#include "cond.h"
#include "rule.h"
#include "match.h"
#include "memo.h"
#include "invalidator.h"
#include "store.h"
#include "room_rules.h"
#include "room_cache.h"
#include "bulk.h"
#include "memory.h"
