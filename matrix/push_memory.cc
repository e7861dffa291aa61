// Herald
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2020 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

herald::m::push::memory::~memory()
noexcept
{
}

//
// mutators
//

void
herald::m::push::memory::add_member(const string_view &event_id,
                                    const string_view &user_id,
                                    const string_view &membership)
{
	members[std::string{event_id}] = member
	{
		std::string{event_id},
		std::string{user_id},
		std::string{membership},
	};
}

void
herald::m::push::memory::set_pusher(const string_view &user_id,
                                    const string_view &pushkey)
{
	const std::string key{user_id};
	pushers[key].emplace(pushkey);
	fire(pusher_invalidators, key);
}

bool
herald::m::push::memory::del_pusher(const string_view &user_id,
                                    const string_view &pushkey)
{
	const std::string key{user_id};
	const auto it
	{
		pushers.find(key)
	};

	if(it == end(pushers) || !it->second.erase(std::string{pushkey}))
		return false;

	if(it->second.empty())
		pushers.erase(it);

	fire(pusher_invalidators, key);
	return true;
}

void
herald::m::push::memory::add_receipt(const string_view &room_id,
                                     const string_view &user_id)
{
	const std::string key{room_id};
	receipts[key].emplace(user_id);
	fire(receipt_invalidators, key);
}

void
herald::m::push::memory::set_rules(const string_view &user_id,
                                   push::rules rules)
{
	const std::string key{user_id};
	this->rules[key] = std::make_shared<const push::rules>(std::move(rules));
	fire(rules_invalidators, key);
}

bool
herald::m::push::memory::del_rules(const string_view &user_id)
{
	const std::string key{user_id};
	if(!rules.erase(key))
		return false;

	fire(rules_invalidators, key);
	return true;
}

void
herald::m::push::memory::set_profile(const string_view &user_id,
                                     const string_view &display_name)
{
	profiles[std::string{user_id}].display_name = display_name;
}

void
herald::m::push::memory::set_appservice_user(const string_view &user_id)
{
	appservice_users.emplace(user_id);
}

void
herald::m::push::memory::hide(const string_view &user_id,
                              const string_view &event_id)
{
	hidden[std::string{user_id}].emplace(event_id);
}

/// Invokes and forgets the invalidators registered on the key. Returns the
/// number of caches which were invalidated.
size_t
herald::m::push::memory::fire(std::map<std::string, invalidators> &map,
                              const std::string &key)
{
	const auto it
	{
		map.find(key)
	};

	if(it == end(map))
		return 0;

	const auto fired
	{
		std::move(it->second)
	};

	map.erase(it);
	return std::count_if(begin(fired), end(fired), []
	(const invalidator &invalidator)
	{
		return invalidator();
	});
}

//
// lookups
//

void
herald::m::push::memory::lookup(const string_view &name)
{
	auto it
	{
		lookups.find(name)
	};

	if(it == end(lookups))
		it = lookups.emplace(std::string{name}, 0).first;

	++it->second;
	if(on_lookup)
		on_lookup(name);

	if(fault)
		throw m::UNAVAILABLE
		{
			"Datastore is unavailable for %s", name
		};
}

size_t
herald::m::push::memory::count(const string_view &name)
const
{
	if(name.empty())
		return std::accumulate(begin(lookups), end(lookups), size_t(0), []
		(const size_t &ret, const auto &pair)
		{
			return ret + pair.second;
		});

	const auto it
	{
		lookups.find(name)
	};

	return it != end(lookups)? it->second : 0;
}

bool
herald::m::push::memory::is_appservice_user(const string_view &user_id)
{
	lookup("is_appservice_user");
	return appservice_users.count(std::string{user_id});
}

std::vector<herald::m::push::member>
herald::m::push::memory::get_members(const std::vector<std::string> &event_ids)
{
	lookup("get_members");
	std::vector<member> ret;
	ret.reserve(event_ids.size());
	for(const auto &event_id : event_ids)
	{
		const auto it
		{
			members.find(event_id)
		};

		if(it != end(members))
			ret.emplace_back(it->second);
	}

	return ret;
}

bool
herald::m::push::memory::has_pusher(const string_view &user_id)
{
	lookup("has_pusher");
	return pushers.count(std::string{user_id});
}

std::map<std::string, bool>
herald::m::push::memory::have_pushers(const user_ids &user_ids,
                                      const push::invalidator &invalidator)
{
	lookup("have_pushers");
	std::map<std::string, bool> ret;
	for(const auto &user_id : user_ids)
	{
		pusher_invalidators[user_id].emplace(invalidator);
		ret.emplace(user_id, pushers.count(user_id));
	}

	return ret;
}

herald::m::push::store::user_ids
herald::m::push::memory::get_receipt_users(const string_view &room_id,
                                           const push::invalidator &invalidator)
{
	lookup("get_receipt_users");
	const std::string key{room_id};
	receipt_invalidators[key].emplace(invalidator);

	const auto it
	{
		receipts.find(key)
	};

	return it != end(receipts)?
		it->second:
		user_ids{};
}

herald::m::push::rules_by_user
herald::m::push::memory::get_rules(const user_ids &user_ids,
                                   const push::invalidator &invalidator)
{
	lookup("get_rules");
	rules_by_user ret;
	for(const auto &user_id : user_ids)
	{
		rules_invalidators[user_id].emplace(invalidator);
		const auto it
		{
			rules.find(user_id)
		};

		ret.emplace(user_id, it != end(rules)? it->second : nullptr);
	}

	return ret;
}

std::shared_ptr<const herald::m::push::rules>
herald::m::push::memory::get_user_rules(const string_view &user_id)
{
	lookup("get_user_rules");
	const auto it
	{
		rules.find(std::string{user_id})
	};

	return it != end(rules)?
		it->second:
		nullptr;
}

/// Members whose membership at the context is a join, with their profiles.
std::map<std::string, herald::m::push::profile>
herald::m::push::memory::get_joined_members(const event &event,
                                            const event::context &context)
{
	lookup("get_joined_members");
	std::map<std::string, profile> ret;
	for(const auto &[key, event_id] : context.current_state)
	{
		if(key.first != "m.room.member")
			continue;

		const auto it
		{
			members.find(event_id)
		};

		if(it == end(members) || it->second.membership != "join")
			continue;

		const auto pit
		{
			profiles.find(it->second.user_id)
		};

		ret.emplace(it->second.user_id, pit != end(profiles)? pit->second : profile{});
	}

	return ret;
}

/// Every event is visible to every recipient unless hidden from them.
herald::m::visibility::visible
herald::m::push::memory::filter(const recipients &recipients,
                                const std::vector<const event *> &events,
                                const contexts &contexts)
{
	lookup("filter");
	visible ret;
	for(const auto &[user_id, peeking] : recipients)
	{
		const auto hit
		{
			hidden.find(user_id)
		};

		auto &visible(ret[user_id]);
		for(const auto *const event : events)
			if(hit == end(hidden) || !hit->second.count(event->event_id))
				visible.emplace_back(event->event_id);
	}

	return ret;
}
