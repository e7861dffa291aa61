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
#define HAVE_HERALD_M_PUSH_ROOM_CACHE_H

/// Registry of the room_rules of each room, bounded by recency. Entries are
/// created on first reference to a room and destroyed only by eviction.
///
/// An in-flight refresh holds its own reference to the entry so an eviction
/// never pulls it out from underneath; the evicted entry is simply orphaned
/// and its result is no longer retained. A later get() for the room yields
/// a cold entry which rebuilds from scratch.
struct herald::m::push::room_cache
{
	static conf::item<uint64_t> size_default;

	m::homeserver &hs;
	std::shared_ptr<room_table> table;

  public:
	size_t size() const noexcept;
	std::shared_ptr<room_rules> find(const string_view &room_id) const;
	std::shared_ptr<room_rules> get(const string_view &room_id);
	bool invalidate(const string_view &room_id);
	size_t invalidate_user(const string_view &user_id);
	void clear() noexcept;

	room_cache(m::homeserver &, const size_t &max);
	room_cache(room_cache &&) = delete;
	room_cache(const room_cache &) = delete;
	~room_cache() noexcept;
};
