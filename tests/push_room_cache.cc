// Herald
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2020 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

#include "fixture.h"

using namespace herald::test;

namespace
{
	const std::string alice {"@alice:example.org"};
	const std::string bob {"@bob:example.org"};
	const std::string carol {"@carol:example.org"};
	const std::string other_room {"!other:example.org"};
	const std::string third_room {"!third:example.org"};
}

TEST_CASE("rooms are created on first reference", "[push][room_cache]")
{
	fixture f;
	auto &cache(f.hs.rules_cache);

	CHECK(cache.table->max == 10000);
	CHECK(cache.find(room_id) == nullptr);

	const auto room(cache.get(room_id));
	REQUIRE(room);
	CHECK(room->room_id == room_id);
	CHECK(room->state_group.empty());
	CHECK(cache.get(room_id) == room);
	CHECK(cache.find(room_id) == room);
	CHECK(cache.size() == 1);

	CHECK(cache.invalidate(room_id));
	CHECK(room->sequence == 1);
	CHECK_FALSE(cache.invalidate(other_room));
}

TEST_CASE("the least recent room is evicted at capacity", "[push][room_cache]")
{
	fixture f{2};
	f.member(alice);
	f.member(bob);
	f.subscribe(bob);

	auto &cache(f.hs.rules_cache);
	const auto context(f.context());
	std::weak_ptr<push::room_rules> evicted(f.room());
	cache.get(room_id)->refresh(context);

	cache.get(other_room);
	CHECK(cache.find(room_id) != nullptr);
	cache.get(third_room);

	CHECK(cache.size() == 2);
	CHECK(cache.find(room_id) == nullptr);
	CHECK(evicted.expired());

	SECTION("a room referenced again starts cold")
	{
		const auto lookups(f.store.count("get_members"));
		const auto room(f.room());
		CHECK_FALSE(room->valid(context));
		CHECK(room->member_map.empty());
		CHECK(room->refresh(context).count(bob));
		CHECK(f.store.count("get_members") == lookups + 1);
		CHECK(cache.find(other_room) == nullptr);
	}

	SECTION("find doesn't count as a reference")
	{
		cache.find(other_room);
		f.room();
		CHECK(cache.find(other_room) == nullptr);
		CHECK(cache.find(third_room) != nullptr);
	}
}

TEST_CASE("a refresh in flight survives eviction of its room", "[push][room_cache]")
{
	fixture f{1};
	f.member(alice);
	f.member(bob);
	f.subscribe(bob);

	auto &cache(f.hs.rules_cache);
	f.store.on_lookup = [&cache](const auto &name)
	{
		if(name == "get_rules")
			cache.get(other_room);
	};

	push::bulk bulk{f.hs};
	const auto actions(bulk(message(alice), f.context()));
	CHECK(actions.count(bob));
	CHECK(cache.find(room_id) == nullptr);
	CHECK(cache.find(other_room) != nullptr);
	CHECK(cache.size() == 1);
}

TEST_CASE("invalidators never outlive what they refer to", "[push][room_cache]")
{
	push::invalidator invalidator;
	{
		fixture f{1};
		f.member(alice);
		f.member(bob);
		f.subscribe(bob);

		const auto context(f.context());
		const auto orphan(f.room());
		orphan->refresh(context);
		invalidator = orphan->invalidator;
		REQUIRE(invalidator.room_id == room_id);

		SECTION("after eviction")
		{
			f.hs.rules_cache.get(other_room);
			REQUIRE(f.hs.rules_cache.find(room_id) == nullptr);

			CHECK_FALSE(invalidator());
			f.store.set_rules(bob, push::rules{});
			CHECK(orphan->valid(context));
			CHECK(orphan->sequence == 0);
		}

		SECTION("while the room is cached")
		{
			CHECK(invalidator());
			CHECK_FALSE(orphan->valid(context));
		}
	}

	CHECK(invalidator.table.expired());
	CHECK_FALSE(invalidator());
}

TEST_CASE("invalidators of a room compare equal", "[push][room_cache]")
{
	fixture f;
	f.member(alice);
	f.member(bob);
	f.subscribe(bob);

	const auto room(f.room());
	const auto other(f.hs.rules_cache.get(other_room));
	CHECK(room->invalidator == push::invalidator{room_id, f.hs.rules_cache.table});
	CHECK_FALSE(room->invalidator == other->invalidator);

	room->refresh(f.context());
	room->invalidate();
	room->refresh(f.context());

	CHECK(f.store.pusher_invalidators.at(bob).size() == 1);
	CHECK(f.store.rules_invalidators.at(bob).size() == 1);
	CHECK(f.store.receipt_invalidators.at(room_id).size() == 1);
}

TEST_CASE("changing a user's rules invalidates the rooms which know them", "[push][room_cache]")
{
	fixture f;
	f.member(alice);
	f.member(bob);
	f.member(carol);
	f.subscribe(bob);

	const auto context(f.context());
	const auto room(f.room());
	const auto other(f.hs.rules_cache.get(other_room));
	const auto third(f.hs.rules_cache.get(third_room));
	room->refresh(context);
	other->refresh(context);

	CHECK(f.hs.rules_changed(bob) == 2);
	CHECK_FALSE(room->valid(context));
	CHECK_FALSE(other->valid(context));
	CHECK(third->sequence == 0);

	room->refresh(context);
	CHECK(f.hs.rules_cache.invalidate_user(carol) == 1);
	CHECK(f.hs.rules_changed("@nobody:example.org") == 0);
}
