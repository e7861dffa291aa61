// Herald
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2020 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

#include <herald/matrix.h>
#include "lgetopt.h"

namespace m = herald::m;
namespace push = herald::m::push;
namespace json = herald::json;

const char *scenario;
const char *loglevel;
long cachesize;
bool quietmode;

lgetopt opts[]
{
	{ "help",       nullptr,        lgetopt::USAGE,   "Print this text" },
	{ "scenario",   &scenario,      lgetopt::STRING,  "JSON scenario of the store and the events to evaluate" },
	{ "loglevel",   &loglevel,      lgetopt::STRING,  "Most verbose log level printed to the terminal (e.g. DEBUG)" },
	{ "cachesize",  &cachesize,     lgetopt::INTEGER, "Number of rooms retained by the push rules cache" },
	{ "quiet",      &quietmode,     lgetopt::BOOL,    "Suppress log messages at the terminal" },
	{ nullptr,      nullptr,        lgetopt::STRING,  nullptr },
};

const char *const fatalerrstr
{R"(
***
*** A fatal error has occurred:
***

%s
)"};

const char *const usererrstr
{R"(
***
*** A fatal startup error has occurred:
***

%s

***
*** Please fix the problem to continue.
***
)"};

static void applyargs();
static Json::Value read_scenario(const char *const &path);
static void load(push::memory &, const Json::Value &scenario);
static push::rules load_rules(const Json::Value &);
static bool replay(m::homeserver &, const Json::Value &step);

int
main(int _argc, char *const *_argv)
noexcept try
{
	// '-' switched arguments come first; this function incs argv and decs argc
	auto argc(_argc);
	auto argv(_argv);
	const char *const progname(_argv[0]);
	parseargs(&argc, &argv, opts);
	applyargs();

	if(!scenario)
		throw herald::user_error
		{
			"usage :%s -scenario <file>", progname
		};

	const auto doc
	{
		read_scenario(scenario)
	};

	push::memory memory;
	load(memory, doc);

	struct m::homeserver::opts hs_opts;
	hs_opts.origin = doc["origin"].asString();
	hs_opts.rules_cache_size = cachesize;
	m::homeserver homeserver
	{
		std::move(hs_opts), memory, memory
	};

	size_t failures(0);
	for(const auto &step : doc["events"])
		failures += !replay(homeserver, step);

	herald::log::info
	{
		"Replayed %u events; %zu failed; %zu lookups",
		doc["events"].size(),
		failures,
		memory.count(),
	};

	return failures? EXIT_FAILURE : EXIT_SUCCESS;
}
catch(const herald::user_error &e)
{
	fprintf(stderr, usererrstr, e.what());
	return EXIT_FAILURE;
}
catch(const std::exception &e)
{
	fprintf(stderr, fatalerrstr, e.what());
	return EXIT_FAILURE;
}

void
applyargs()
{
	if(loglevel)
		herald::conf::set("herald.log.console.level", loglevel);

	if(quietmode)
		herald::log::console_disable();
}

Json::Value
read_scenario(const char *const &path)
{
	std::ifstream file
	{
		path
	};

	if(!file)
		throw herald::user_error
		{
			"Cannot open scenario '%s' :%s", path, std::strerror(errno)
		};

	std::stringstream buf;
	buf << file.rdbuf();
	return json::parse(buf.str());
}

/// A ruleset is given as a document of scopes, as an array of rules, or as
/// the string "defaults".
push::rules
load_rules(const Json::Value &value)
{
	if(value.isString() && value.asString() == "defaults")
		return push::rules::defaults;

	return push::rules(value);
}

void
load(push::memory &memory,
     const Json::Value &scenario)
{
	for(const auto &row : scenario["members"])
		memory.add_member
		(
			row["event_id"].asString(),
			row["user_id"].asString(),
			row["membership"].asString()
		);

	for(const auto &user_id : scenario["appservice_users"])
		memory.set_appservice_user(user_id.asString());

	const auto &pushers(scenario["pushers"]);
	for(const auto &user_id : pushers.getMemberNames())
		for(const auto &pushkey : pushers[user_id])
			memory.set_pusher(user_id, pushkey.asString());

	const auto &receipts(scenario["receipts"]);
	for(const auto &room_id : receipts.getMemberNames())
		for(const auto &user_id : receipts[room_id])
			memory.add_receipt(room_id, user_id.asString());

	const auto &rules(scenario["rules"]);
	for(const auto &user_id : rules.getMemberNames())
		memory.set_rules(user_id, load_rules(rules[user_id]));

	const auto &profiles(scenario["profiles"]);
	for(const auto &user_id : profiles.getMemberNames())
		memory.set_profile(user_id, profiles[user_id].asString());

	const auto &hidden(scenario["hidden"]);
	for(const auto &user_id : hidden.getMemberNames())
		for(const auto &event_id : hidden[user_id])
			memory.hide(user_id, event_id.asString());
}

/// Evaluates one event and prints the outcome as a line of JSON. An event
/// whose outcome couldn't be determined is printed with the error.
bool
replay(m::homeserver &homeserver,
       const Json::Value &step)
try
{
	const m::event event
	{
		step["event"]
	};

	const m::event::context context
	{
		step["context"]
	};

	push::bulk bulk
	{
		homeserver
	};

	Json::Value out;
	out["event_id"] = event.event_id;
	out["actions"] = Json::objectValue;
	out["notify"] = Json::arrayValue;
	out["highlight"] = Json::arrayValue;
	for(const auto &[user_id, actions] : bulk(event, context))
	{
		out["actions"][user_id] = actions;
		if(push::notifying(actions))
			out["notify"].append(user_id);

		if(push::highlighting(actions))
			out["highlight"].append(user_id);
	}

	std::cout << json::strung(out) << std::endl;
	return true;
}
catch(const std::exception &e)
{
	Json::Value out;
	out["event_id"] = step["event"]["event_id"];
	out["error"] = e.what();
	std::cout << json::strung(out) << std::endl;
	return false;
}
