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
#define HAVE_HERALD_M_ID_H

/// Matrix identifiers, i.e @user:origin. Only the parts of the grammar the
/// push system relies upon are interpreted here: the sigil, the localpart
/// and the host.
namespace herald::m::id
{
	HERALD_M_EXCEPTION(m::error, INVALID_MXID, http::BAD_REQUEST)

	enum sigil :char
	{
		USER   = '@',
		ROOM   = '!',
		EVENT  = '$',
	};

	bool valid(const sigil &, const string_view &) noexcept;
	string_view localpart(const string_view &);
	string_view host(const string_view &);
}
