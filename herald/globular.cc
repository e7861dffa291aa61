// Herald
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2020 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

namespace herald
{
	static bool is_word(const char &) noexcept;
	static char lower(const char &) noexcept;
}

bool
herald::globular_imatch::operator()(const string_view &a)
const noexcept
{
	auto ait(begin(a));
	auto bit(begin(expr));
	auto star_bit(end(expr));
	auto star_ait(end(a));
	while(ait != end(a))
	{
		if(bit != end(expr) && *bit == '*')
		{
			star_bit = bit++;
			star_ait = ait;
			continue;
		}

		if(bit != end(expr) && (*bit == '?' || lower(*bit) == lower(*ait)))
		{
			++bit;
			++ait;
			continue;
		}

		if(star_bit == end(expr))
			return false;

		bit = std::next(star_bit);
		ait = ++star_ait;
	}

	while(bit != end(expr) && *bit == '*')
		++bit;

	return bit == end(expr);
}

bool
herald::globular_imatch::words(const string_view &a)
const noexcept
{
	for(size_t i(0); i <= a.size(); ++i)
	{
		if(i > 0 && is_word(a[i - 1]))
			continue;

		for(size_t j(i); j <= a.size(); ++j)
		{
			if(j < a.size() && is_word(a[j]))
				continue;

			if(operator()(a.substr(i, j - i)))
				return true;
		}
	}

	return false;
}

bool
herald::is_word(const char &c)
noexcept
{
	return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

char
herald::lower(const char &c)
noexcept
{
	return std::tolower(static_cast<unsigned char>(c));
}
