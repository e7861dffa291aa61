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
#define HAVE_HERALD_GLOBULAR_H

namespace herald
{
	// Globular ('*' and '?') expression utils.
	struct globular_imatch;
}

/// Globular match. Only one side of the comparison is considered to be the
/// expression with '*' and '?' characters. The expression string is passed at
/// construction. The comparison inputs are treated as non-expression strings.
/// Case insensitive. The whole input must match the expression.
struct herald::globular_imatch
{
	string_view expr;

	bool operator()(const string_view &) const noexcept;

	// Matches if the expression matches a run of the input delimited by
	// the beginning or end of the input or by characters which aren't
	// alphanumeric or an underscore.
	bool words(const string_view &) const noexcept;

	globular_imatch(const string_view &expr)
	:expr{expr}
	{}
};
