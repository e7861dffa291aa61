/*
 *  ircd-ratbox: A slightly useful ircd.
 *  lgetopt.h: Command line option table and parser.
 *
 *  Copyright (C) 1990 Jarkko Oikarinen and University of Oulu, Co Center
 *  Copyright (C) 1996-2002 Hybrid Development Team
 *  Copyright (C) 2002-2005 ircd-ratbox development team
 *
 *  This program is free software; you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program; if not, write to the Free Software
 *  Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307
 *  USA
 */

#pragma once
#define HAVE_HERALD_REPLAY_LGETOPT_H

struct lgetopt
{
	const char *opt;  /* name of the argument */
	void *argloc;     /* where we store the argument to it (-option argument) */
	enum
	{
		INTEGER, BOOL, STRING, USAGE,
	}
	argtype;
	const char *desc; /* description of the argument, usage for printing help */
};

[[noreturn]] void usage(const char *name, struct lgetopt *opts);
void parseargs(int *argc, char * const **argv, struct lgetopt *opts);
