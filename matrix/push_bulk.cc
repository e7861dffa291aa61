// Herald
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2020 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

decltype(herald::m::push::bulk::invite)
herald::m::push::bulk::invite
{
	{ "name",     "herald.m.push.bulk.invite" },
	{ "default",  true                        },
};

herald::m::push::bulk::bulk(m::homeserver &hs,
                            match::func matcher)
:hs{hs}
,matcher{std::move(matcher)}
{
	if(!this->matcher)
		this->matcher = []
		(const event &event, const cond &cond, const match::opts &opts)
		{
			return bool(match{event, cond, opts});
		};
}

/// Evaluates the rules of every interested member of the room for the
/// event. The result holds the normalized actions of each member to be
/// notified; absence means no notification.
herald::m::push::actions_by_user
herald::m::push::bulk::operator()(const event &event,
                                  const event::context &context)
try
{
	const auto candidates
	{
		get_rules(event, context)
	};

	// None of these users can be peeking; they're all members of the room
	// or the invitee.
	m::visibility::recipients recipients;
	recipients.reserve(candidates.size());
	for(const auto &candidate : candidates)
		recipients.emplace_back(candidate.first, false);

	const m::visibility::contexts contexts
	{
		{ event.event_id, &context }
	};

	const auto visible
	{
		hs.visibility.filter(recipients, {&event}, contexts)
	};

	const auto members
	{
		hs.store.get_joined_members(event, context)
	};

	memo memo;
	actions_by_user ret;
	for(const auto &[user_id, rules] : candidates)
	{
		const auto vit
		{
			visible.find(user_id)
		};

		if(vit == end(visible) || vit->second.empty())
			continue;

		// Homeservers MUST NOT notify the Push Gateway for events that the
		// user has sent themselves.
		if(user_id == event.sender)
			continue;

		std::string display_name;
		if(const auto pit(members.find(user_id)); pit != end(members))
			display_name = pit->second.display_name;

		// Pushing a membership event to a user who isn't joined yet.
		if(display_name.empty() && is_member(event) && *event.state_key == user_id)
			display_name = json::string(event.content, "displayname");

		match::opts opts;
		opts.user_id = user_id;
		opts.display_name = display_name;
		opts.member_count = members.size();
		for(const auto &rule : *rules)
		{
			if(!rule.enabled)
				continue;

			if(!matching(event, rule, opts, memo))
				continue;

			auto actions
			{
				normalize(rule.actions)
			};

			if(!actions.isNull())
				ret.emplace(user_id, std::move(actions));

			break;
		}
	}

	log::debug
	{
		log, "%s in %s by %s rules:%zu visible:%zu members:%zu notify:%zu memo:%zu/%zu",
		event.event_id,
		event.room_id,
		event.sender,
		candidates.size(),
		visible.size(),
		members.size(),
		ret.size(),
		memo.hits,
		memo.hits + memo.misses,
	};

	return ret;
}
catch(const std::exception &e)
{
	log::derror
	{
		log, "Push rule evaluation of %s in %s :%s",
		event.event_id,
		event.room_id,
		e.what(),
	};

	throw;
}

/// The rules of the room's interested members, plus the invitee's for an
/// invite. The invitee isn't a member yet so their rules stay out of the
/// room's cache.
herald::m::push::rules_by_user
herald::m::push::bulk::get_rules(const event &event,
                                 const event::context &context)
{
	const auto room
	{
		hs.rules_cache.get(event.room_id)
	};

	auto ret
	{
		room->refresh(context)
	};

	if(!invite || membership(event) != "invite")
		return ret;

	const auto &invitee
	{
		*event.state_key
	};

	if(!hs.is_mine(invitee) || ret.count(invitee))
		return ret;

	if(!hs.store.has_pusher(invitee))
		return ret;

	auto rules
	{
		hs.store.get_user_rules(invitee)
	};

	if(rules)
		ret.emplace(invitee, std::move(rules));

	return ret;
}

bool
herald::m::push::bulk::matching(const event &event,
                                const rule &rule,
                                const match::opts &opts,
                                memo &memo)
const try
{
	if(rule.malformed)
		return false;

	for(const auto &cond : rule.conditions)
		if(!memo(cond, [this, &event, &cond, &opts]
		{
			return matcher(event, cond, opts);
		}))
			return false;

	return true;
}
catch(const std::exception &e)
{
	log::error
	{
		log, "Push rule matching in %s for %s at '%s' :%s",
		event.event_id,
		opts.user_id,
		rule.rule_id,
		e.what(),
	};

	return false;
}

//
// memo
//

/// The outcome of the condition; computed by the closure unless the
/// condition carries an identifier whose outcome is already recorded.
bool
herald::m::push::memo::operator()(const cond &cond,
                                  const closure &closure)
{
	if(cond.id.empty())
		return closure();

	const auto it
	{
		results.lower_bound(cond.id)
	};

	if(it != end(results) && it->first == cond.id)
	{
		++hits;
		return it->second;
	}

	const bool ret
	{
		closure()
	};

	++misses;
	results.emplace_hint(it, cond.id, ret);
	return ret;
}
