// Herald
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2020 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

const char *
herald::exception::what()
const noexcept
{
	return buf;
}

size_t
herald::exception::generate(const string_view &msg)
noexcept
{
	const size_t len
	{
		std::min(msg.size(), sizeof(buf) - 1)
	};

	std::memcpy(buf, msg.data(), len);
	buf[len] = '\0';
	return len;
}

/// Composes the message of an exception into its buffer. The message is
/// prefixed with the name of the exception type; an empty message leaves
/// only the name.
size_t
herald::exception::generate(const char *const &name,
                            const string_view &msg)
noexcept
{
	const bool blank
	{
		msg.empty() || msg == " "
	};

	const int ret
	{
		blank?
			::snprintf(buf, sizeof(buf), "%s.", name):
			::snprintf(buf, sizeof(buf), "%s :%.*s", name, int(msg.size()), msg.data())
	};

	return ret > 0?
		std::min(size_t(ret), sizeof(buf) - 1):
		0UL;
}
