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
#define HAVE_HERALD_M_ERROR_H

namespace herald::m
{
	struct error;
}

/// This hierarchy is designed to allow developers to throw an exception with
/// matrix protocol specific information: the errcode (M_FORBIDDEN etc) and
/// the HTTP status which would accompany it if it ever reached a client.
/// Errors in the push subsystem rarely reach clients; nevertheless the
/// hierarchy gives a single catch point for everything matrix.
///
/// The HERALD_M_EXCEPTION macro is provided and should be used to declare the
/// error type first rather than throwing an m::error directly if possible.
///
struct herald::m::error
:herald::error
{
	http::code code;
	std::string errcode;

  protected:
	struct child_t {};
	static constexpr child_t child {};

	template<class... args> error(child_t, args&&... a)
	:error(std::forward<args>(a)...)
	{}

  public:
	template<class... args> error(const http::code &, const string_view &errcode, const string_view &fmt, args&&...);
	error(const http::code &, const string_view &errcode);
	error(const http::code &);
	error();
};

/// Macro for all matrix exceptions; all errors rooted from m::error
///
/// Unfortunately we use another macro here instead of HERALD_EXCEPTION but
/// what we gain is a more suitable exception hierarchy for the matrix
/// protocol. This macro takes 3 arguments:
///
/// - parent: A parent exception class type similar to the rest of the
/// project. For this macro, the parent can never be above m::error.
///
/// - name: The name of the exception is also what will be seen in the matrix
/// protocol errcode. The matrix protocol error codes are UPPER_CASE and
/// will appear as defined. This is also the name of this class itself too.
///
/// - httpcode: An HTTP code which will be used if this exception ever makes
/// it out to a client.
///
#define HERALD_M_EXCEPTION(_parent_, _name_, _httpcode_)                \
struct _name_                                                           \
: _parent_                                                              \
{                                                                       \
    _name_()                                                            \
    : _parent_                                                          \
    {                                                                   \
        child, _httpcode_, "M_"#_name_, "%s", http::status(_httpcode_)  \
    }{}                                                                 \
                                                                        \
    template<class... args> _name_(const string_view &fmt, args&&... a) \
    : _parent_                                                          \
    {                                                                   \
        child, _httpcode_, "M_"#_name_, fmt, std::forward<args>(a)...   \
    }{}                                                                 \
                                                                        \
    template<class... args> _name_(child_t, args&&... a)                \
    : _parent_                                                          \
    {                                                                   \
        child, std::forward<args>(a)...                                 \
    }{}                                                                 \
};

// These are some common m::error, but not all of them; other declarations
// may be dispersed throughout herald::m.
namespace herald::m
{
	HERALD_M_EXCEPTION(error, UNKNOWN, http::INTERNAL_SERVER_ERROR)
	HERALD_M_EXCEPTION(error, BAD_JSON, http::BAD_REQUEST)
	HERALD_M_EXCEPTION(error, NOT_FOUND, http::NOT_FOUND)
	HERALD_M_EXCEPTION(error, UNAVAILABLE, http::SERVICE_UNAVAILABLE)
}

template<class... args>
herald::m::error::error(const http::code &code,
                        const string_view &errcode,
                        const string_view &fmt,
                        args&&... a)
:herald::error{generate_skip}
,code{code}
,errcode{errcode}
{
	generate(this->errcode.c_str(), fmt::sprintf{fmt, std::forward<args>(a)...});
}
