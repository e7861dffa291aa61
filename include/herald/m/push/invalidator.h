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
#define HAVE_HERALD_M_PUSH_INVALIDATOR_H

/// Handed to the store with each lookup whose result a room's cache retains.
/// The store invokes it when the data behind that lookup changes, which
/// invalidates the room's cache entry.
///
/// It refers to the entry only by room id through a weak reference to the
/// registry's table; it never extends the lifetime of an entry or of the
/// registry. Once the entry has been evicted (or the registry destroyed)
/// invoking it has no effect. Copies compare equal, so a store may
/// deduplicate repeated registrations.
struct herald::m::push::invalidator
{
	std::string room_id;
	std::weak_ptr<room_table> table;

	bool operator<(const invalidator &) const noexcept;
	bool operator==(const invalidator &) const noexcept;

	bool operator()() const;
};
