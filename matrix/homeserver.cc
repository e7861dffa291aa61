// Herald
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2020 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

//
// homeserver::homeserver
//

herald::m::homeserver::homeserver(struct opts opts,
                                  push::store &store,
                                  m::visibility &visibility)
:opts
{
	std::move(opts)
}
,store
{
	store
}
,visibility
{
	visibility
}
,rules_cache
{
	*this,
	this->opts.rules_cache_size?:
		size_t(push::room_cache::size_default)
}
{
	if(this->opts.origin.empty())
		throw m::error
		{
			http::INTERNAL_SERVER_ERROR, "M_NOT_A_HOMESERVER",
			"A homeserver requires an origin."
		};

	log::info
	{
		log, "Homeserver %s rules cache capacity:%zu",
		this->opts.origin,
		rules_cache.table->max,
	};
}

herald::m::homeserver::~homeserver()
noexcept
{
	log::debug
	{
		log, "Homeserver %s shutdown with %zu cached rooms",
		opts.origin,
		rules_cache.size(),
	};
}

/// Whether the user is homed on this server.
bool
herald::m::homeserver::is_mine(const string_view &user_id)
const noexcept
{
	if(!id::valid(id::USER, user_id))
		return false;

	const auto colon
	{
		user_id.find(':')
	};

	return user_id.substr(colon + 1) == opts.origin;
}

/// Called when the rules of a user change by any means other than through
/// the store's invalidation of a retained lookup. Every room whose cache
/// knows the user is invalidated.
size_t
herald::m::homeserver::rules_changed(const string_view &user_id)
{
	const auto ret
	{
		rules_cache.invalidate_user(user_id)
	};

	log::debug
	{
		log, "Rules of %s changed; invalidated %zu rooms",
		user_id,
		ret,
	};

	return ret;
}
