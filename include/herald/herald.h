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
#define HAVE_HERALD_H

#include "stdinc.h"

/// \brief Push rule evaluation for a Matrix homeserver. This is the principal
/// namespace of the project; the matrix layer lives in herald::m.
///
namespace herald
{
}

#include "util/util.h"
#include "fmt.h"
#include "exception.h"
#include "logger.h"
#include "json.h"
#include "conf.h"
#include "globular.h"
#include "http.h"
