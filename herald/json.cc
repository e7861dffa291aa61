// Herald
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2020 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

Json::Value
herald::json::parse(const string_view &in)
{
	Json::CharReaderBuilder builder;
	builder["collectComments"] = false;
	const std::unique_ptr<Json::CharReader> reader
	{
		builder.newCharReader()
	};

	Json::Value ret;
	std::string errs;
	if(!reader->parse(in.data(), in.data() + in.size(), &ret, &errs))
		throw parse_error
		{
			"%s", errs
		};

	return ret;
}

std::string
herald::json::strung(const Json::Value &value)
{
	Json::StreamWriterBuilder builder;
	builder["indentation"] = "";
	return Json::writeString(builder, value);
}

const Json::Value &
herald::json::get(const Json::Value &value,
                  const string_view &path)
{
	const Json::Value *ret(&value);
	size_t pos(0); do
	{
		const size_t next
		{
			std::min(path.find('.', pos), path.size())
		};

		const string_view key
		{
			path.substr(pos, next - pos)
		};

		if(!ret->isObject())
			return Json::Value::nullSingleton();

		ret = ret->find(key.data(), key.data() + key.size());
		if(!ret)
			return Json::Value::nullSingleton();

		pos = next + 1;
	}
	while(pos <= path.size());

	return *ret;
}

std::string
herald::json::string(const Json::Value &value,
                     const string_view &path,
                     const string_view &def)
{
	const auto &ret
	{
		get(value, path)
	};

	return ret.isString()?
		ret.asString():
		std::string{def};
}
