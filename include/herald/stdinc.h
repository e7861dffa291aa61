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
#define HAVE_HERALD_STDINC_H

//
// Standard includes
//
// This header includes almost everything we use out of the standard library
// and the third-party headers used throughout the project. It is force-included
// into every unit of libherald and libherald_matrix.
//

extern "C"
{
	#include <unistd.h>
	#include <sys/types.h>
}

// Typography
#include <cassert>
#include <cstdarg>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <type_traits>

// Errors
#include <cerrno>
#include <exception>
#include <stdexcept>
#include <system_error>

// Dynamic memory
#include <new>
#include <memory>

// Containers
#include <optional>
#include <tuple>
#include <array>
#include <vector>
#include <list>
#include <deque>
#include <set>
#include <map>
#include <unordered_map>

// Strings
#include <cctype>
#include <cstring>
#include <string>
#include <string_view>

// Chronography
#include <ctime>
#include <chrono>

// Input/Output
#include <cstdio>
#include <iosfwd>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <iostream>

// Other standard suites
#include <utility>
#include <functional>
#include <algorithm>
#include <numeric>

// Boost
#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>

// jsoncpp
#include <json/json.h>

namespace herald
{
	using std::string_view;
	using std::begin;
	using std::end;

	using namespace std::literals::string_literals;
	using namespace std::literals::string_view_literals;
}
