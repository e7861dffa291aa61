// Herald
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2020 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

/// Constructs the formatter for a format string. Disagreement between the
/// number of conversions and the number of arguments is tolerated; only a
/// bad format string throws.
boost::format
herald::fmt::make(const string_view &fmt)
{
	boost::format ret
	{
		std::string{fmt}
	};

	ret.exceptions
	(
		boost::io::all_error_bits
		^ boost::io::too_many_args_bit
		^ boost::io::too_few_args_bit
	);

	return ret;
}
