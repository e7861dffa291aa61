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
#define HAVE_HERALD_EXCEPTION_H

namespace herald
{
	struct exception; // Root exception
}

/// The root exception type.
///
/// All exceptions in the project inherit from this type. We generally don't
/// have catch blocks on this type. Instead we use `herald::error` to catch
/// project-specific exceptions. This gives us just a little more indirection
/// to play with before inheriting from std::exception.
///
/// Not all exceptions are from project developer's code, such as
/// `std::out_of_range`, etc. It's not necessarily bad to just catch
/// `std::exception` and we do it often enough, but be considerate.
///
struct herald::exception
:virtual std::exception
{
	static constexpr const size_t BUFSIZE
	{
		512UL
	};

  protected:
	struct generate_skip_t {};
	static constexpr generate_skip_t generate_skip {};

	char buf[BUFSIZE];

	size_t generate(const char *const &name, const string_view &msg) noexcept;
	size_t generate(const string_view &msg) noexcept;

  public:
	const char *what() const noexcept override;

	exception(generate_skip_t = {}) noexcept
	{
		buf[0] = '\0';
	}
};

/// Exception generator convenience macro
///
/// If you want to create your own exception type, you have found the right
/// place! This macro allows creating an exception in the the hierarchy.
///
/// To create an exception, invoke this macro in your header. Examples:
///
///    HERALD_EXCEPTION(herald::exception, my_exception)
///    HERALD_EXCEPTION(my_exception, my_specific_exception)
///
/// Then your catch sequence can look like the following:
///
///    catch(const my_specific_exception &e)
///    {
///        log("something specifically bad happened: %s", e.what());
///    }
///    catch(const my_exception &e)
///    {
///        log("something generically bad happened: %s", e.what());
///    }
///    catch(const herald::exception &e)
///    {
///        log("unrelated bad happened: %s", e.what());
///    }
///    catch(const std::exception &e)
///    {
///        log("unhandled bad happened: %s", e.what());
///    }
///
/// Remember: the order of the catch blocks is important. The message of the
/// exception is prefixed by its name, i.e "not_found :no such thing".
///
#define HERALD_EXCEPTION(parent, name)                                        \
struct name                                                                   \
:parent                                                                       \
{                                                                             \
    template<class... args>                                                   \
    name(const string_view &fmt, args&&... ap) noexcept                       \
    :parent{generate_skip}                                                    \
    {                                                                         \
        generate(#name, herald::fmt::sprintf{fmt, std::forward<args>(ap)...});\
    }                                                                         \
                                                                              \
    name(const string_view &fmt = " ") noexcept                               \
    :parent{generate_skip}                                                    \
    {                                                                         \
        generate(#name, fmt);                                                 \
    }                                                                         \
                                                                              \
    name(generate_skip_t) noexcept                                            \
    :parent{generate_skip}                                                    \
    {                                                                         \
    }                                                                         \
};

namespace herald
{
	/// Root error exception type. Inherit from this.
	/// List your own exception somewhere else (unless you're overhauling libherald).
	/// example, in your namespace:
	///
	/// HERALD_EXCEPTION(herald::error, error)
	///
	HERALD_EXCEPTION(exception, error)             // throw herald::error("something bad")
	HERALD_EXCEPTION(error, user_error)            // throw herald::user_error("something silly")
}
