// Herald
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2020 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

namespace herald::log
{
	static std::vector<log *> &list();
	static void slog(const log &, const level &, const string_view &msg) noexcept;
	static void set_console_level() noexcept;

	extern const size_t LOG_NAME_TRUNC;
	extern std::array<ulong, num_of_levels> console_quiet;
	extern conf::item<std::string> console_level_conf;
	std::ostream &err_console{std::cerr};
}

decltype(herald::log::general)
herald::log::general
{
	"herald"
};

decltype(herald::log::LOG_NAME_TRUNC)
herald::log::LOG_NAME_TRUNC
{
	12
};

// The developer levels are quiet until the console level is raised.
decltype(herald::log::console_quiet)
herald::log::console_quiet
{
	0, 0, 0, 0, 0, 1, 1, 1
};

/// The most verbose level printed to the console. Levels below it in
/// severity are quieted when the item is set; the environment may set it
/// at startup as herald_log_console_level.
decltype(herald::log::console_level_conf)
herald::log::console_level_conf
{
	{
		{ "name",     "herald.log.console.level" },
		{ "default",  "INFO"                     },
	},
	set_console_level
};

/// Linkage for list of named loggers. Loggers are static objects in every
/// unit; the list is constructed on first use.
std::vector<herald::log::log *> &
herald::log::list()
{
	static std::vector<log *> ret;
	return ret;
}

void
herald::log::set_console_level()
noexcept try
{
	const std::string name
	{
		boost::algorithm::to_upper_copy(std::string{console_level_conf})
	};

	console_level(reflect(name));
}
catch(const std::exception &e)
{
	herald::log::error
	{
		"log console level '%s' :%s",
		string_view{console_level_conf},
		e.what()
	};
}

void
herald::log::console_level(const level &max)
{
	for(uint lev(0); lev < num_of_levels; ++lev)
		console_quiet[lev] = lev > max;
}

void
herald::log::console_enable()
{
	for(uint lev(0); lev < num_of_levels; ++lev)
		console_enable(level(lev));
}

void
herald::log::console_disable()
{
	for(uint lev(0); lev < num_of_levels; ++lev)
		console_disable(level(lev));
}

void
herald::log::console_enable(const level &lev)
{
	if(console_quiet.at(lev))
		console_quiet[lev]--;
}

void
herald::log::console_disable(const level &lev)
{
	console_quiet.at(lev)++;
}

bool
herald::log::console_enabled(const level &lev)
{
	return !console_quiet.at(lev);
}

//
// log
//

herald::log::log *
herald::log::log::find(const string_view &name)
{
	const auto it
	{
		std::find_if(begin(list()), end(list()), [&name]
		(const auto *const &log)
		{
			return log->name == name;
		})
	};

	return it != end(list())? *it : nullptr;
}

bool
herald::log::log::exists(const log *const &ptr)
{
	const auto it
	{
		std::find(begin(list()), end(list()), ptr)
	};

	return it != end(list());
}

herald::log::log::log(const string_view &name)
:name{name}
{
	for(const auto *const &other : list())
		if(other->name == name)
			throw herald::error
			{
				"Logger with name '%s' already exists at %p",
				name,
				other
			};

	list().emplace_back(this);
}

herald::log::log::~log()
noexcept
{
	auto &list(herald::log::list());
	list.erase(std::remove(begin(list), end(list), this), end(list));
}

//
// vlog
//

herald::log::vlog::vlog(const log &log,
                        const level &lev,
                        const string_view &msg)
noexcept
{
	slog(log, lev, msg);
}

void
herald::log::slog(const log &log,
                  const level &lev,
                  const string_view &msg)
noexcept try
{
	if(!log.cmasked || !console_enabled(lev))
		return;

	char date[32];
	const time_t now(::time(nullptr));
	struct tm tm;
	::localtime_r(&now, &tm);
	const size_t date_len
	{
		::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm)
	};

	std::ostringstream s;
	s
	<< string_view{date, date_len}
	<< ' '
	<< std::setw(8)
	<< std::right
	<< reflect(lev)
	<< ' '
	<< std::setw(LOG_NAME_TRUNC)
	<< std::left
	<< log.name.substr(0, LOG_NAME_TRUNC)
	<< " :"
	<< msg
	<< '\n';

	err_console << s.str();
	if(lev <= level::WARNING)
		err_console.flush();
}
catch(const std::exception &e)
{
	std::fputs("log: failed to write message\n", stderr);
}

herald::log::level
herald::log::reflect(const string_view &f)
{
	if(f == "CRITICAL")    return level::CRITICAL;
	if(f == "ERROR")       return level::ERROR;
	if(f == "DERROR")      return level::DERROR;
	if(f == "DWARNING")    return level::DWARNING;
	if(f == "WARNING")     return level::WARNING;
	if(f == "NOTICE")      return level::NOTICE;
	if(f == "INFO")        return level::INFO;
	if(f == "DEBUG")       return level::DEBUG;

	throw herald::error
	{
		"'%s' is not a recognized log level", f
	};
}

herald::string_view
herald::log::reflect(const level &f)
{
	switch(f)
	{
		case level::CRITICAL:   return "CRITICAL";
		case level::ERROR:      return "ERROR";
		case level::DERROR:     return "ERROR";
		case level::WARNING:    return "WARNING";
		case level::DWARNING:   return "WARNING";
		case level::INFO:       return "INFO";
		case level::NOTICE:     return "NOTICE";
		case level::DEBUG:      return "DEBUG";
		case level::_NUM_:      break; // Allows -Wswitch to remind developer to add reflection here
	};

	return "??????";
}
