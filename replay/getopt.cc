/*
 *  ircd-ratbox: A slightly useful ircd.
 *  getopt.c: Uses getopt to fetch the command line options.
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

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include "lgetopt.h"
#define OPTCHAR '-'

using argtype = decltype(lgetopt::argtype);

/* Options are consumed from the front of argv; on return argv points at
 * the first positional argument and argc counts the remainder. Arguments
 * to STRING options point into argv.
 */
void
parseargs(int *argc, char * const **argv, struct lgetopt *opts)
{
	const char *progname = (*argv)[0];

	/* loop through each argument */
	for (;;)
	{
		bool found = false;

		(*argc)--;
		(*argv)++;

		if(*argc < 1)
			return;

		/* check if it *is* an arg.. */
		if((*argv)[0][0] != OPTCHAR)
			return;

		/* search through our argument list, and see if it matches */
		for (int i = 0; opts[i].opt; i++)
		{
			if(strcmp(opts[i].opt, &(*argv)[0][1]))
				continue;

			/* found our argument */
			found = true;

			switch (opts[i].argtype)
			{
			case argtype::BOOL:
				*((bool *) opts[i].argloc) = true;
				break;

			case argtype::INTEGER:
			{
				if(*argc < 2)
				{
					fprintf(stderr,
						"error: option '%c%s' requires an argument\n",
						OPTCHAR, opts[i].opt);
					usage(progname, opts);
				}

				char *end = nullptr;
				const long val = strtol((*argv)[1], &end, 10);
				if(!end || *end || val < 0)
				{
					fprintf(stderr,
						"error: option '%c%s' requires a number\n",
						OPTCHAR, opts[i].opt);
					usage(progname, opts);
				}

				*((long *) opts[i].argloc) = val;

				(*argc)--;
				(*argv)++;
				break;
			}

			case argtype::STRING:
				if(*argc < 2)
				{
					fprintf(stderr,
						"error: option '%c%s' requires an argument\n",
						OPTCHAR, opts[i].opt);
					usage(progname, opts);
				}

				*((const char **) opts[i].argloc) = (*argv)[1];

				(*argc)--;
				(*argv)++;
				break;

			case argtype::USAGE:
				usage(progname, opts);
			}
		}

		if(!found)
		{
			fprintf(stderr, "error: unknown argument '%c%s'\n", OPTCHAR, &(*argv)[0][1]);
			usage(progname, opts);
		}
	}
}

void
usage(const char *name, struct lgetopt *myopts)
{
	fprintf(stderr, "Usage: %s [options]\n", name);
	fprintf(stderr, "Where valid options are:\n");

	for (int i = 0; myopts[i].opt; i++)
	{
		fprintf(stderr, "\t%c%-10s %-20s%s\n", OPTCHAR,
			myopts[i].opt,
			myopts[i].argtype == argtype::BOOL || myopts[i].argtype == argtype::USAGE?
				"":
			myopts[i].argtype == argtype::INTEGER?
				"<number>":
				"<string>",
			myopts[i].desc);
	}

	exit(EXIT_FAILURE);
}
