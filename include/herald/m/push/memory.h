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
#define HAVE_HERALD_M_PUSH_MEMORY_H

/// Datastore and visibility filter held in memory.
///
/// Mutators invoke the invalidators registered by earlier lookups of the
/// data they change and then forget them. A fault may be raised to make
/// every lookup throw m::UNAVAILABLE. The on_lookup hook runs at the start
/// of each lookup, i.e. at the point where a lookup against a real store
/// would yield to other work; it may change the store or the caches.
struct herald::m::push::memory
:store
,m::visibility
{
	using invalidators = std::set<invalidator>;
	using on_lookup_cb = std::function<void (const string_view &name)>;

	std::map<std::string, member> members;                      // event_id ->
	std::map<std::string, std::set<std::string>> pushers;       // user_id -> pushkeys
	std::map<std::string, std::set<std::string>> receipts;      // room_id -> user_ids
	std::map<std::string, std::shared_ptr<const push::rules>> rules;  // user_id ->
	std::map<std::string, profile> profiles;                    // user_id ->
	std::set<std::string> appservice_users;
	std::map<std::string, std::set<std::string>> hidden;        // user_id -> event_ids

	std::map<std::string, invalidators> pusher_invalidators;    // user_id ->
	std::map<std::string, invalidators> receipt_invalidators;   // room_id ->
	std::map<std::string, invalidators> rules_invalidators;     // user_id ->

	std::map<std::string, size_t, std::less<>> lookups;        // name -> count
	on_lookup_cb on_lookup;
	bool fault {false};

  private:
	void lookup(const string_view &name);
	static size_t fire(std::map<std::string, invalidators> &, const std::string &key);

  public:
	// Lookups performed with the given name; all lookups for empty.
	size_t count(const string_view &name = {}) const;

	void add_member(const string_view &event_id, const string_view &user_id, const string_view &membership);
	void set_pusher(const string_view &user_id, const string_view &pushkey);
	bool del_pusher(const string_view &user_id, const string_view &pushkey);
	void add_receipt(const string_view &room_id, const string_view &user_id);
	void set_rules(const string_view &user_id, push::rules);
	bool del_rules(const string_view &user_id);
	void set_profile(const string_view &user_id, const string_view &display_name);
	void set_appservice_user(const string_view &user_id);
	void hide(const string_view &user_id, const string_view &event_id);

	// push::store
	bool is_appservice_user(const string_view &user_id) override;
	std::vector<member> get_members(const std::vector<std::string> &event_ids) override;
	bool has_pusher(const string_view &user_id) override;
	std::map<std::string, bool> have_pushers(const user_ids &, const push::invalidator &) override;
	user_ids get_receipt_users(const string_view &room_id, const push::invalidator &) override;
	rules_by_user get_rules(const user_ids &, const push::invalidator &) override;
	std::shared_ptr<const push::rules> get_user_rules(const string_view &user_id) override;
	std::map<std::string, profile> get_joined_members(const event &, const event::context &) override;

	// m::visibility
	visible filter(const recipients &, const std::vector<const event *> &, const contexts &) override;

	memory() = default;
	memory(memory &&) = delete;
	memory(const memory &) = delete;
	~memory() noexcept override;
};
