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
// error::error
//

herald::m::error::error()
:error
{
	http::INTERNAL_SERVER_ERROR
}
{}

herald::m::error::error(const http::code &code)
:error
{
	code, "M_UNKNOWN"
}
{}

herald::m::error::error(const http::code &code,
                        const string_view &errcode)
:error
{
	code, errcode, "%s", http::status(code)
}
{}
