// Herald
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2020 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

herald::string_view
herald::http::status(const code &code)
noexcept
{
	switch(code)
	{
		case OK:                       return "OK";
		case BAD_REQUEST:              return "Bad Request";
		case UNAUTHORIZED:             return "Unauthorized";
		case FORBIDDEN:                return "Forbidden";
		case NOT_FOUND:                return "Not Found";
		case INTERNAL_SERVER_ERROR:    return "Internal Server Error";
		case NOT_IMPLEMENTED:          return "Not Implemented";
		case SERVICE_UNAVAILABLE:      return "Service Unavailable";
	}

	return "Unknown";
}
