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
#define HAVE_HERALD_JSON_H

/// JavaScript Object Notation. Values are jsoncpp's Json::Value; this suite
/// carries the conveniences used throughout the project.
namespace herald::json
{
	HERALD_EXCEPTION(herald::error, error)
	HERALD_EXCEPTION(error, parse_error)
	HERALD_EXCEPTION(error, type_error)

	using array = std::vector<Json::Value>;

	Json::Value parse(const string_view &);
	std::string strung(const Json::Value &);

	// Dot-separated path lookup into nested objects; i.e "content.body".
	// Returns a null value when any component is missing.
	const Json::Value &get(const Json::Value &, const string_view &path);

	// String at the path, or the default when missing or not a string.
	std::string string(const Json::Value &, const string_view &path, const string_view &def = {});
}
