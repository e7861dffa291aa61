// Herald
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2020 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

decltype(herald::m::push::room_cache::size_default)
herald::m::push::room_cache::size_default
{
	{ "name",     "herald.m.push.room_cache.size" },
	{ "default",  10000                           },
};

//
// room_cache::room_cache
//

herald::m::push::room_cache::room_cache(m::homeserver &hs,
                                        const size_t &max)
:hs{hs}
,table
{
	std::make_shared<room_table>(max, []
	(const std::string &room_id, std::shared_ptr<room_rules> &rules)
	{
		log::debug
		{
			log, "%s evicted with %zu members %zu rules (refs:%ld)",
			room_id,
			rules->member_map.size(),
			rules->rules.size(),
			rules.use_count(),
		};
	})
}
{
}

herald::m::push::room_cache::~room_cache()
noexcept
{
	clear();
}

/// The entry for the room, created cold if the room isn't cached. The
/// entry becomes the most recent.
std::shared_ptr<herald::m::push::room_rules>
herald::m::push::room_cache::get(const string_view &room_id)
{
	const std::string key
	{
		room_id
	};

	if(auto *const rules{table->get(key)}; rules)
		return *rules;

	push::invalidator invalidator
	{
		key, table
	};

	return table->emplace(key, std::make_shared<room_rules>(hs, key, std::move(invalidator)));
}

/// The entry for the room if cached; the recency is unaffected.
std::shared_ptr<herald::m::push::room_rules>
herald::m::push::room_cache::find(const string_view &room_id)
const
{
	auto *const rules
	{
		table->find(std::string{room_id})
	};

	return rules?
		*rules:
		nullptr;
}

bool
herald::m::push::room_cache::invalidate(const string_view &room_id)
{
	const auto rules
	{
		find(room_id)
	};

	if(!rules)
		return false;

	rules->invalidate();
	return true;
}

/// Invalidates every cached room in which the user is known to be a member
/// or to have rules.
size_t
herald::m::push::room_cache::invalidate_user(const string_view &user_id)
{
	size_t ret(0);
	table->for_each([&ret, &user_id]
	(const std::string &room_id, std::shared_ptr<room_rules> &rules)
	{
		const bool member
		{
			std::any_of(begin(rules->member_map), end(rules->member_map), [&user_id]
			(const auto &pair)
			{
				return pair.second.user_id == user_id;
			})
		};

		if(member || rules->rules.count(std::string{user_id}))
		{
			rules->invalidate();
			++ret;
		}

		return true;
	});

	return ret;
}

size_t
herald::m::push::room_cache::size()
const noexcept
{
	return table->size();
}

void
herald::m::push::room_cache::clear()
noexcept
{
	table->clear();
}

//
// invalidator
//

/// Invalidates the entry of the room if the registry still holds one.
bool
herald::m::push::invalidator::operator()()
const
{
	const auto table
	{
		this->table.lock()
	};

	if(!table)
		return false;

	auto *const rules
	{
		table->find(room_id)
	};

	if(!rules)
		return false;

	(*rules)->invalidate();
	log::debug
	{
		log, "%s invalidated by the store; sequence now %lu",
		room_id,
		(*rules)->sequence,
	};

	return true;
}

bool
herald::m::push::invalidator::operator<(const invalidator &o)
const noexcept
{
	if(room_id != o.room_id)
		return room_id < o.room_id;

	return table.owner_before(o.table);
}

bool
herald::m::push::invalidator::operator==(const invalidator &o)
const noexcept
{
	return room_id == o.room_id
	    && !table.owner_before(o.table)
	    && !o.table.owner_before(table);
}
