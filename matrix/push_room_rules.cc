// Herald
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2020 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

herald::m::push::room_rules::room_rules(m::homeserver &hs,
                                        std::string room_id,
                                        push::invalidator invalidator)
:hs{hs}
,room_id{std::move(room_id)}
,invalidator{std::move(invalidator)}
{
}

herald::m::push::room_rules::~room_rules()
noexcept
{
}

/// Brings the cache up to date with the state at the context and returns
/// the rules of the interested local members at that state. The return
/// value is the caller's own copy.
herald::m::push::rules_by_user
herald::m::push::room_rules::refresh(const event::context &context)
try
{
	if(valid(context))
		return rules;

	const auto sequence
	{
		this->sequence
	};

	rules_by_user ret;
	missing todo;
	for(const auto &[key, event_id] : context.current_state)
	{
		const auto it
		{
			member_map.find(event_id)
		};

		if(it != end(member_map))
		{
			const auto &member(it->second);
			if(member.membership != "join")
				continue;

			const auto rit
			{
				rules.find(member.user_id)
			};

			if(rit != end(rules))
				ret.emplace(*rit);

			continue;
		}

		const auto &[type, user_id]
		{
			key
		};

		if(type != "m.room.member")
			continue;

		if(!hs.is_mine(user_id))
			continue;

		if(hs.store.is_appservice_user(user_id))
			continue;

		todo.emplace(user_id, event_id);
	}

	members resolved;
	const auto fetched
	{
		!todo.empty()?
			resolve(todo, resolved):
			rules_by_user{}
	};

	for(const auto &[user_id, rules] : fetched)
		ret[user_id] = rules;

	const bool committed
	{
		commit(sequence, std::move(resolved), fetched, context.state_group)
	};

	log::debug
	{
		log, "%s refreshed at '%s' missing:%zu fetched:%zu result:%zu cached:%zu %s",
		room_id,
		context.state_group,
		todo.size(),
		fetched.size(),
		ret.size(),
		rules.size(),
		committed? "committed" : "discarded",
	};

	return ret;
}
catch(const std::exception &e)
{
	log::derror
	{
		log, "Refreshing push rules of %s at '%s' :%s",
		room_id,
		context.state_group,
		e.what(),
	};

	throw;
}

/// Resolves the missing memberships and fetches the rules of the members who
/// are interested. Rows for the memberships are added to the output. The
/// lookups which retain data register the invalidator.
herald::m::push::rules_by_user
herald::m::push::room_rules::resolve(const missing &todo,
                                     members &resolved)
const
{
	std::vector<std::string> event_ids;
	event_ids.reserve(todo.size());
	for(const auto &[user_id, event_id] : todo)
		event_ids.emplace_back(event_id);

	store::user_ids interested;
	for(auto &row : hs.store.get_members(event_ids))
	{
		interested.emplace(row.user_id);
		auto event_id(row.event_id);
		resolved.emplace(std::move(event_id), std::move(row));
	}

	const auto pushers
	{
		hs.store.have_pushers(interested, invalidator)
	};

	const auto has_pusher{[&pushers]
	(const std::string &user_id)
	{
		const auto it(pushers.find(user_id));
		return it != end(pushers) && it->second;
	}};

	store::user_ids user_ids;
	for(const auto &[user_id, has] : pushers)
		if(has)
			user_ids.emplace(user_id);

	// A read receipt doesn't qualify a user unless the user also has a
	// pusher; the lookup still registers for new receipts in the room.
	for(const auto &user_id : hs.store.get_receipt_users(room_id, invalidator))
		if(has_pusher(user_id))
			user_ids.emplace(user_id);

	auto ret
	{
		hs.store.get_rules(user_ids, invalidator)
	};

	for(auto it(begin(ret)); it != end(ret); )
		it = it->second?
			std::next(it):
			ret.erase(it);

	return ret;
}

/// Merges the result of a refresh which began at the given sequence. Nothing
/// is written if the cache was invalidated in the meantime.
bool
herald::m::push::room_rules::commit(const uint64_t &sequence,
                                    members &&resolved,
                                    const rules_by_user &fetched,
                                    const std::string &state_group)
{
	if(sequence != this->sequence)
	{
		log::debug
		{
			log, "%s discarding stale refresh at '%s' from sequence %lu; now %lu",
			room_id,
			state_group,
			sequence,
			this->sequence,
		};

		return false;
	}

	for(auto &[event_id, member] : resolved)
		member_map[event_id] = std::move(member);

	for(const auto &[user_id, rules] : fetched)
		this->rules[user_id] = rules;

	this->state_group = state_group;
	return true;
}

void
herald::m::push::room_rules::invalidate()
noexcept
{
	++sequence;
	state_group.clear();
	member_map.clear();
	rules.clear();
}

bool
herald::m::push::room_rules::valid(const event::context &context)
const noexcept
{
	return !state_group.empty() && state_group == context.state_group;
}
