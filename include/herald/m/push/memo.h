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
#define HAVE_HERALD_M_PUSH_MEMO_H

/// Outcomes of conditions carrying an identifier, recorded while evaluating
/// one event. The same condition often appears in the ruleset of every
/// recipient; when its outcome doesn't depend on the recipient it is
/// computed once for the event. Conditions without an identifier are always
/// evaluated and never recorded. Not to be kept beyond one event.
struct herald::m::push::memo
{
	using closure = std::function<bool ()>;

	std::map<std::string, bool, std::less<>> results;
	size_t hits {0};
	size_t misses {0};

	bool operator()(const cond &, const closure &);
};
