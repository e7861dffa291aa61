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
#define HAVE_HERALD_FMT_H

/// Typesafe format strings from formal grammars & standard RTTI
namespace herald::fmt
{
	struct sprintf;

	boost::format make(const string_view &fmt);
}

/// Typesafe snprintf() into a string. The format string uses the familiar
/// printf conversions (%s, %d, %u, %lu, %x...) and the arguments may be any
/// type with an ostream inserter. A mismatch between the conversions and the
/// arguments is never fatal: missing arguments render empty and surplus
/// arguments are ignored. A malformed format string is reproduced verbatim.
///
struct herald::fmt::sprintf
{
	std::string out;

	operator const std::string &() const noexcept
	{
		return out;
	}

	operator string_view() const noexcept
	{
		return out;
	}

	template<class... args>
	sprintf(const string_view &fmt, args&&... a) noexcept;
};

template<class... args>
herald::fmt::sprintf::sprintf(const string_view &fmt,
                              args&&... a)
noexcept
{
	try
	{
		boost::format f
		{
			make(fmt)
		};

		static_cast<void>((f % ... % a));
		out = f.str();
	}
	catch(const std::exception &e)
	{
		out.assign(fmt.data(), fmt.size());
	}
}
