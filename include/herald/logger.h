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
#define HAVE_HERALD_LOGGER_H

#ifndef HERALD_LOG_LEVEL
	#define HERALD_LOG_LEVEL 7
#endif

/// Logging system
namespace herald::log
{
	enum level :uint;
	struct log;
	struct vlog;

	struct critical;
	struct error;
	struct derror;
	struct warning;
	struct dwarning;
	struct notice;
	struct info;
	struct debug;

	string_view reflect(const level &);
	level reflect(const string_view &);

	// This suite adjusts the console output for an entire level. Enabling a
	// level enables it alone; use console_level() to set a threshold.
	bool console_enabled(const level &);
	void console_disable(const level &);
	void console_enable(const level &);
	void console_level(const level &);
	void console_disable();
	void console_enable();

	extern log general;  // "herald"
}

/// Severity level; zero is the most severe. Frequency and verbosity also tends
/// to increase as the log level increases.
enum herald::log::level
:uint
{
	CRITICAL  = 0,  ///< Catastrophic/unrecoverable; program is in a compromised state.
	ERROR     = 1,  ///< Things that shouldn't happen; user impacted and should know.
	WARNING   = 2,  ///< Non-impacting undesirable behavior user should know about.
	NOTICE    = 3,  ///< An infrequent important message with neutral or positive news.
	INFO      = 4,  ///< A more frequent message with good news.
	DERROR    = 5,  ///< An error but only worthy of developers in debug mode.
	DWARNING  = 6,  ///< A warning but only for developers in debug mode.
	DEBUG     = 7,  ///< Maximum verbosity for developers.
	_NUM_
};

namespace herald::log
{
	constexpr const uint num_of_levels
	{
		level::_NUM_
	};
}

/// A named logger. Create an instance of this to help categorize log messages.
/// All messages sent to this logger will be prefixed with the given name.
/// Instances register themselves by name for de-confliction and lookup, so
/// the recommended duration of this class is static.
struct herald::log::log
{
	string_view name;                  // name of this logger
	bool cmasked {true};               // currently in the console mask (enabled)

  public:
	template<class... args> void operator()(const level &, const string_view &fmt, args&&...) const;

	explicit log(const string_view &name);
	log(log &&) = delete;
	log(const log &) = delete;
	~log() noexcept;

	static bool exists(const log *const &ptr);
	static log *find(const string_view &name);
};

/// Lower level interface; this is not a template and defined in the unit.
/// The message is already formatted. Never throws.
struct herald::log::vlog
{
	vlog(const log &log, const level &, const string_view &msg) noexcept;
};

#if HERALD_LOG_LEVEL >= 7
struct herald::log::debug
{
	template<class... args>
	debug(const log &log, const string_view &fmt, args&&... a)
	{
		vlog(log, level::DEBUG, fmt::sprintf{fmt, std::forward<args>(a)...});
	}

	template<class... args>
	debug(const string_view &fmt, args&&... a)
	{
		vlog(general, level::DEBUG, fmt::sprintf{fmt, std::forward<args>(a)...});
	}
};
#else
struct herald::log::debug
{
	template<class... args>
	debug(const log &log, const string_view &fmt, args&&... a)
	{
	}

	template<class... args>
	debug(const string_view &fmt, args&&... a)
	{
	}
};
#endif

#if HERALD_LOG_LEVEL >= 6
struct herald::log::dwarning
{
	template<class... args>
	dwarning(const log &log, const string_view &fmt, args&&... a)
	{
		vlog(log, level::DWARNING, fmt::sprintf{fmt, std::forward<args>(a)...});
	}

	template<class... args>
	dwarning(const string_view &fmt, args&&... a)
	{
		vlog(general, level::DWARNING, fmt::sprintf{fmt, std::forward<args>(a)...});
	}
};
#else
struct herald::log::dwarning
{
	template<class... args>
	dwarning(const log &log, const string_view &fmt, args&&... a)
	{
	}

	template<class... args>
	dwarning(const string_view &fmt, args&&... a)
	{
	}
};
#endif

#if HERALD_LOG_LEVEL >= 5
struct herald::log::derror
{
	template<class... args>
	derror(const log &log, const string_view &fmt, args&&... a)
	{
		vlog(log, level::DERROR, fmt::sprintf{fmt, std::forward<args>(a)...});
	}

	template<class... args>
	derror(const string_view &fmt, args&&... a)
	{
		vlog(general, level::DERROR, fmt::sprintf{fmt, std::forward<args>(a)...});
	}
};
#else
struct herald::log::derror
{
	template<class... args>
	derror(const log &log, const string_view &fmt, args&&... a)
	{
	}

	template<class... args>
	derror(const string_view &fmt, args&&... a)
	{
	}
};
#endif

#if HERALD_LOG_LEVEL >= 4
struct herald::log::info
{
	template<class... args>
	info(const log &log, const string_view &fmt, args&&... a)
	{
		vlog(log, level::INFO, fmt::sprintf{fmt, std::forward<args>(a)...});
	}

	template<class... args>
	info(const string_view &fmt, args&&... a)
	{
		vlog(general, level::INFO, fmt::sprintf{fmt, std::forward<args>(a)...});
	}
};
#else
struct herald::log::info
{
	template<class... args>
	info(const log &log, const string_view &fmt, args&&... a)
	{
	}

	template<class... args>
	info(const string_view &fmt, args&&... a)
	{
	}
};
#endif

#if HERALD_LOG_LEVEL >= 3
struct herald::log::notice
{
	template<class... args>
	notice(const log &log, const string_view &fmt, args&&... a)
	{
		vlog(log, level::NOTICE, fmt::sprintf{fmt, std::forward<args>(a)...});
	}

	template<class... args>
	notice(const string_view &fmt, args&&... a)
	{
		vlog(general, level::NOTICE, fmt::sprintf{fmt, std::forward<args>(a)...});
	}
};
#else
struct herald::log::notice
{
	template<class... args>
	notice(const log &log, const string_view &fmt, args&&... a)
	{
	}

	template<class... args>
	notice(const string_view &fmt, args&&... a)
	{
	}
};
#endif

#if HERALD_LOG_LEVEL >= 2
struct herald::log::warning
{
	template<class... args>
	warning(const log &log, const string_view &fmt, args&&... a)
	{
		vlog(log, level::WARNING, fmt::sprintf{fmt, std::forward<args>(a)...});
	}

	template<class... args>
	warning(const string_view &fmt, args&&... a)
	{
		vlog(general, level::WARNING, fmt::sprintf{fmt, std::forward<args>(a)...});
	}
};
#else
struct herald::log::warning
{
	template<class... args>
	warning(const log &log, const string_view &fmt, args&&... a)
	{
	}

	template<class... args>
	warning(const string_view &fmt, args&&... a)
	{
	}
};
#endif

#if HERALD_LOG_LEVEL >= 1
struct herald::log::error
{
	template<class... args>
	error(const log &log, const string_view &fmt, args&&... a)
	{
		vlog(log, level::ERROR, fmt::sprintf{fmt, std::forward<args>(a)...});
	}

	template<class... args>
	error(const string_view &fmt, args&&... a)
	{
		vlog(general, level::ERROR, fmt::sprintf{fmt, std::forward<args>(a)...});
	}
};
#else
struct herald::log::error
{
	template<class... args>
	error(const log &log, const string_view &fmt, args&&... a)
	{
	}

	template<class... args>
	error(const string_view &fmt, args&&... a)
	{
	}
};
#endif

#if HERALD_LOG_LEVEL >= 0
struct herald::log::critical
{
	template<class... args>
	critical(const log &log, const string_view &fmt, args&&... a)
	{
		vlog(log, level::CRITICAL, fmt::sprintf{fmt, std::forward<args>(a)...});
	}

	template<class... args>
	critical(const string_view &fmt, args&&... a)
	{
		vlog(general, level::CRITICAL, fmt::sprintf{fmt, std::forward<args>(a)...});
	}
};
#else
struct herald::log::critical
{
	template<class... args>
	critical(const log &log, const string_view &fmt, args&&... a)
	{
	}

	template<class... args>
	critical(const string_view &fmt, args&&... a)
	{
	}
};
#endif

template<class... args>
void
herald::log::log::operator()(const level &lev,
                             const string_view &fmt,
                             args&&... a)
const
{
	vlog(*this, lev, fmt::sprintf{fmt, std::forward<args>(a)...});
}
