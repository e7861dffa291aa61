// Herald
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2020 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

namespace herald::m::push
{
	static bool has_word(const string_view &haystack, const string_view &needle);
	static string_view field(const event &, const string_view &key);

	static bool unknown_condition_kind(const event &, const cond &, const match::opts &);
	static bool contains_display_name(const event &, const cond &, const match::opts &);
	static bool state_key_user_mxid(const event &, const cond &, const match::opts &);
	static bool contains_user_mxid(const event &, const cond &, const match::opts &);
	static bool room_member_count(const event &, const cond &, const match::opts &);
	static bool event_match(const event &, const cond &, const match::opts &);
}

decltype(herald::m::push::match::cond_kind)
herald::m::push::match::cond_kind
{
	event_match,
	room_member_count,
	contains_user_mxid,
	state_key_user_mxid,
	contains_display_name,
	unknown_condition_kind,
};

decltype(herald::m::push::match::cond_kind_name)
herald::m::push::match::cond_kind_name
{
	"event_match",
	"room_member_count",
	"contains_user_mxid",
	"state_key_user_mxid",
	"contains_display_name",
};

//
// match::match
//

herald::m::push::match::match(const event &event,
                              const cond &cond,
                              const match::opts &opts)
:ret{[&event, &cond, &opts]
{
	const auto it
	{
		std::find(std::begin(cond_kind_name), std::end(cond_kind_name), cond.kind)
	};

	const auto pos
	{
		std::distance(std::begin(cond_kind_name), it)
	};

	const auto &func
	{
		cond_kind[pos]
	};

	return func(event, cond, opts);
}()}
{
}

//
// push::match condition functors (internal)
//

bool
herald::m::push::event_match(const event &event,
                             const cond &cond,
                             const match::opts &opts)
try
{
	assert(cond.kind == "event_match");

	const auto &value
	{
		field(event, cond.key)
	};

	if(!value.data())
		return false;

	const globular_imatch pattern
	{
		cond.pattern
	};

	return cond.key == "content.body"?
		pattern.words(value):
		pattern(value);
}
catch(const std::exception &e)
{
	log::error
	{
		log, "Push condition 'event_match' %s :%s",
		event.event_id,
		e.what(),
	};

	return false;
}

bool
herald::m::push::contains_user_mxid(const event &event,
                                    const cond &cond,
                                    const match::opts &opts)
try
{
	assert(cond.kind == "contains_user_mxid");

	if(opts.user_id.empty())
		return false;

	const auto &body
	{
		json::string(event.content, "body")
	};

	if(body.find(opts.user_id) != body.npos)
		return true;

	const auto &formatted_body
	{
		json::string(event.content, "formatted_body")
	};

	if(formatted_body.find(opts.user_id) != formatted_body.npos)
		return true;

	return false;
}
catch(const std::exception &e)
{
	log::error
	{
		log, "Push condition 'contains_user_mxid' %s :%s",
		event.event_id,
		e.what(),
	};

	return false;
}

bool
herald::m::push::state_key_user_mxid(const event &event,
                                     const cond &cond,
                                     const match::opts &opts)
{
	assert(cond.kind == "state_key_user_mxid");

	return event.state_key && *event.state_key == opts.user_id;
}

bool
herald::m::push::contains_display_name(const event &event,
                                       const cond &cond,
                                       const match::opts &opts)
try
{
	assert(cond.kind == "contains_display_name");

	if(opts.display_name.empty())
		return false;

	const auto &body
	{
		json::string(event.content, "body")
	};

	return has_word(body, opts.display_name);
}
catch(const std::exception &e)
{
	log::error
	{
		log, "Push condition 'contains_display_name' %s :%s",
		event.event_id,
		e.what(),
	};

	return false;
}

bool
herald::m::push::room_member_count(const event &event,
                                   const cond &cond,
                                   const match::opts &opts)
try
{
	assert(cond.kind == "room_member_count");

	const string_view is
	{
		cond.is
	};

	const auto digits
	{
		is.find_first_of("0123456789")
	};

	if(digits == is.npos)
		return false;

	const string_view op
	{
		is.substr(0, digits)
	};

	const auto val
	{
		boost::lexical_cast<size_t>(std::string{is.substr(digits)})
	};

	const auto &count
	{
		opts.member_count
	};

	if(op.empty() || op == "==")
		return count == val;

	if(op == "<")
		return count < val;

	if(op == ">")
		return count > val;

	if(op == "<=")
		return count <= val;

	if(op == ">=")
		return count >= val;

	log::derror
	{
		log, "Push condition 'room_member_count' %s :unknown operator '%s'",
		event.event_id,
		op,
	};

	return false;
}
catch(const boost::bad_lexical_cast &e)
{
	log::derror
	{
		log, "Push condition 'room_member_count' %s :bad value '%s'",
		event.event_id,
		cond.is,
	};

	return false;
}

bool
herald::m::push::unknown_condition_kind(const event &event,
                                        const cond &cond,
                                        const match::opts &opts)
{
	log::derror
	{
		log, "Push condition for %s by %s :unknown kind '%s' rule always fails...",
		event.event_id,
		opts.user_id,
		cond.kind,
	};

	return false;
}

/// Value of a dotted key of the event; a null view when the key is absent
/// or the value isn't a string.
herald::string_view
herald::m::push::field(const event &event,
                       const string_view &key)
{
	if(key == "type")
		return event.type;

	if(key == "sender")
		return event.sender;

	if(key == "room_id")
		return event.room_id;

	if(key == "event_id")
		return event.event_id;

	if(key == "state_key")
		return event.state_key?
			string_view{*event.state_key}:
			string_view{};

	if(key.substr(0, 8) != "content.")
		return {};

	const auto &value
	{
		json::get(event.content, key.substr(8))
	};

	if(!value.isString())
		return {};

	const char *start, *stop;
	value.getString(&start, &stop);
	return string_view
	{
		start, size_t(stop - start)
	};
}

/// Case-insensitive search for the needle delimited by the ends of the
/// haystack or by non-word characters.
bool
herald::m::push::has_word(const string_view &haystack,
                          const string_view &needle)
{
	const auto is_word{[](const char &c)
	{
		return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
	}};

	const auto h(boost::algorithm::to_lower_copy(std::string{haystack}));
	const auto n(boost::algorithm::to_lower_copy(std::string{needle}));
	for(auto pos(h.find(n)); pos != h.npos; pos = h.find(n, pos + 1))
	{
		const auto end(pos + n.size());
		if(pos > 0 && is_word(h[pos - 1]))
			continue;

		if(end < h.size() && is_word(h[end]))
			continue;

		return true;
	}

	return false;
}
