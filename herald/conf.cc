// Herald
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2020 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

namespace herald::conf
{
	static void call_env(item<void> &) noexcept;
	static bool lex_bool(const string_view &);
}

decltype(herald::conf::log)
herald::conf::log
{
	"conf"
};

/// All items by name. Items are static objects in every unit; the map is
/// constructed on first use.
std::map<herald::string_view, herald::conf::item<> *> &
herald::conf::items()
{
	static std::map<string_view, item<> *> ret;
	return ret;
}

size_t
herald::conf::reset()
{
	size_t ret{0};
	for(const auto &p : items())
		ret += reset(p.first);

	return ret;
}

bool
herald::conf::reset(const string_view &key)
try
{
	auto &item(*items().at(key));
	return item.reset();
}
catch(const std::out_of_range &e)
{
	throw not_found
	{
		"Conf item '%s' is not available", key
	};
}

bool
herald::conf::set(std::nothrow_t,
                  const string_view &key,
                  const string_view &value)
try
{
	return set(key, value);
}
catch(const std::exception &e)
{
	log::error
	{
		log, "%s", e.what()
	};

	return false;
}

bool
herald::conf::set(const string_view &key,
                  const string_view &value)
try
{
	auto &item(*items().at(key));
	return item.set(value);
}
catch(const std::out_of_range &e)
{
	throw not_found
	{
		"Conf item '%s' is not available", key
	};
}

std::string
herald::conf::get(const string_view &key)
try
{
	const auto &item(*items().at(key));
	return item.get();
}
catch(const std::out_of_range &e)
{
	throw not_found
	{
		"Conf item '%s' is not available", key
	};
}

bool
herald::conf::exists(const string_view &key)
{
	return items().count(key);
}

//
// item
//

/// Conf item abstract constructor.
herald::conf::item<void>::item(const members &opts,
                               conf::set_cb set_cb)
:feature
{
	Json::objectValue
}
,set_cb
{
	std::move(set_cb)
}
{
	for(const auto &[key, val] : opts)
		feature[key] = val;

	name = feature["name"].asString();
	if(name.empty())
		throw error
		{
			"Conf item requires a name"
		};

	if(!items().emplace(name, this).second)
		throw error
		{
			"Conf item named '%s' already exists", name
		};
}

herald::conf::item<void>::~item()
noexcept
{
	items().erase(name);
}

/// Assigns the value. When the value is rejected the item retains its
/// previous value and the error propagates.
bool
herald::conf::item<void>::set(const string_view &val)
{
	on_set(val);
	if(set_cb)
		set_cb();

	return true;
}

/// Restores the featured default value.
bool
herald::conf::item<void>::reset()
{
	return set(feature["default"].asString());
}

std::string
herald::conf::item<void>::get()
const
{
	return on_get();
}

void
herald::conf::item<void>::call_init()
{
	// Environmental variables get the final say; this allows any
	// misconfiguration to be overridden by env vars. The variable name is
	// the conf item name with any '.' replaced to '_', case is preserved.
	conf::call_env(*this);
}

void
herald::conf::call_env(item<void> &item)
noexcept try
{
	std::string key(item.name);
	std::replace(begin(key), end(key), '.', '_');

	const char *const val
	{
		::getenv(key.c_str())
	};

	if(val && *val)
		item.set(val);
}
catch(const std::exception &e)
{
	log::error
	{
		log, "conf item[%s] environmental variable :%s",
		item.name,
		e.what()
	};
}

//
// Non-inline template specialization definitions
//

//
// std::string
//

herald::conf::item<std::string>::item(const members &members,
                                      conf::set_cb set_cb)
:conf::item<>
{
	members, std::move(set_cb)
}
,value
{
	feature["default"].asString()
}
{
	call_init();
}

void
herald::conf::item<std::string>::on_set(const string_view &s)
{
	_value = std::string{s};
}

std::string
herald::conf::item<std::string>::on_get()
const
{
	return _value;
}

//
// bool
//

herald::conf::item<bool>::item(const members &members,
                               conf::set_cb set_cb)
:conf::item<>
{
	members, std::move(set_cb)
}
,value
{
	feature.get("default", false).asBool()
}
{
	call_init();
}

void
herald::conf::item<bool>::on_set(const string_view &s)
{
	_value = lex_bool(s);
}

std::string
herald::conf::item<bool>::on_get()
const
{
	return _value? "true" : "false";
}

bool
herald::conf::lex_bool(const string_view &s)
{
	if(boost::iequals(s, "true") || s == "1")
		return true;

	if(boost::iequals(s, "false") || s == "0")
		return false;

	throw bad_value
	{
		"'%s' is not a bool literal", s
	};
}
