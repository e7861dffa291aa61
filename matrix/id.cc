// Herald
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2020 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

/// The sigil is followed by a non-empty localpart, a colon and a non-empty
/// host; the host is everything after the first colon and may carry a port.
bool
herald::m::id::valid(const sigil &sigil,
                     const string_view &id)
noexcept
{
	if(id.size() < 4 || id.front() != char(sigil))
		return false;

	const auto colon
	{
		id.find(':')
	};

	return colon != id.npos && colon > 1 && colon + 1 < id.size();
}

herald::string_view
herald::m::id::localpart(const string_view &id)
{
	const auto colon
	{
		id.find(':')
	};

	if(id.empty() || colon == id.npos)
		throw INVALID_MXID
		{
			"'%s' has no host part", id
		};

	return id.substr(1, colon - 1);
}

herald::string_view
herald::m::id::host(const string_view &id)
{
	const auto colon
	{
		id.find(':')
	};

	if(colon == id.npos)
		throw INVALID_MXID
		{
			"'%s' has no host part", id
		};

	return id.substr(colon + 1);
}
