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
#define HAVE_HERALD_M_H

/// Matrix Protocol System
namespace herald::m
{
	struct homeserver;

	extern log::log log;
}

#include "error.h"
#include "id.h"
#include "event.h"
#include "visibility.h"
#include "push/push.h"
#include "homeserver.h"
