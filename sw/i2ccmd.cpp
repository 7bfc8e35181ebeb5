////////////////////////////////////////////////////////////////////////////////
//
// Filename:	i2ccmd.cpp
// {{{
// Project:	LLI2C, a low-level, cycle-accurate I2C bus master
//
// Purpose:	A command line tool for reading and writing the registers
//		of a simulated I2C device through the LLI2C master.
//
// Creator:	The LLI2C developers
//
////////////////////////////////////////////////////////////////////////////////
// }}}
// Copyright (C) 2026, The LLI2C developers
// {{{
// This program is free software (firmware): you can redistribute it and/or
// modify it under the terms of the GNU General Public License as published
// by the Free Software Foundation, either version 3 of the License, or (at
// your option) any later version.
//
// This program is distributed in the hope that it will be useful, but WITHOUT
// ANY WARRANTY; without even the implied warranty of MERCHANTIBILITY or
// FITNESS FOR A PARTICULAR PURPOSE.  See the GNU General Public License
// for more details.
//
// You should have received a copy of the GNU General Public License along
// with this program.  (It's in the $(ROOT)/doc directory.  Run make with no
// target there if the PDF file isn't present.)  If not, see
// <http://www.gnu.org/licenses/> for a copy.
// }}}
// License:	GPL, v3, as defined and found on www.gnu.org,
// {{{
//		http://www.gnu.org/licenses/gpl.html
//
////////////////////////////////////////////////////////////////////////////////
//
// }}}
#include <stdio.h>
#include <stdlib.h>
#include <strings.h>
#include <ctype.h>
#include <string.h>

#include "i2cconfig.h"
#include "i2ctb.h"

#define	MAXBYTES	256

bool	isvalue(const char *v) {
	// {{{
	const char *ptr = v;

	while(isspace(*ptr))
		ptr++;

	if ((*ptr == '+')||(*ptr == '-'))
		ptr++;
	if (*ptr == '0') {
		ptr++;
		if (tolower(*ptr) == 'x')
			ptr++;
	}

	return (isdigit(*ptr))||(isxdigit(*ptr));
	// }}}
}

void	usage(void) {
	fprintf(stderr,
"USAGE: i2ccmd [-dhpst] [-a addr] [-b rate] [-c rate] [-n count] reg [value ...]\n"
"\n"
"\tRuns register transactions from the LLI2C master against a simulated\n"
"\tslave.  With values, the values are written starting at reg, and then\n"
"\tread back.  Without, count bytes (default one) are read from reg.\n"
"\n"
"\t-a addr\tDevice address (default 0x%03x)\n"
"\t-b rate\tBus bit rate, in Hz (default %lu)\n"
"\t-c rate\tSystem clock rate, in Hz (default %lu)\n"
"\t-d\tTurns on debugging, and writes a trace to %s\n"
"\t-n count\tNumber of bytes to read\n"
"\t-p\tPreload the slave's registers with their own addresses\n"
"\t-s\tUse a single, shared SDA pin\n"
"\t-t\tUse 10-bit addressing\n",
		DEF_SLAVE_ADDR, DEF_BIT_RATE, DEF_CLOCK_RATE, DEF_TRACE_FILE);
}

int main(int argc, char **argv) {
	unsigned long	clock_rate = DEF_CLOCK_RATE, bit_rate = DEF_BIT_RATE;
	unsigned	addr = DEF_SLAVE_ADDR, reg;
	bool		debug_flag = false, preload = false, bidir = false,
			tenbit = false;
	int		count = 1, nvalues = 0, r;
	unsigned char	wbuf[MAXBYTES], rbuf[MAXBYTES];
	I2CTB		*tb;

	// Argument processing
	// {{{
	const char	*regstr = NULL;

	for(int argn=1; argn < argc; argn++) {
		if (argv[argn][0] == '-') for(int j=1;
					(j<512)&&(argv[argn][j]);j++) {
			char	opt = argv[argn][j];
			const char	*arg = NULL;

			if (strchr("abcn", opt) != NULL) {
				if (argn+1 >= argc) {
					fprintf(stderr, "ERR: -%c needs a value\n\n",
						opt);
					usage();
					exit(EXIT_FAILURE);
				}
				arg = argv[++argn];
				j = 1000;
			}

			switch(opt) {
			case 'a': addr = strtoul(arg, NULL, 0); break;
			case 'b': bit_rate = strtoul(arg, NULL, 0); break;
			case 'c': clock_rate = strtoul(arg, NULL, 0); break;
			case 'n': count = atoi(arg); break;
			case 'd': debug_flag = true; break;
			case 'h': usage(); exit(EXIT_SUCCESS); break;
			case 'p': preload = true; break;
			case 's': bidir = true; break;
			case 't': tenbit = true; break;
			default:
				fprintf(stderr, "ERR: Unexpected flag, -%c\n\n",
					opt);
				usage();
				exit(EXIT_FAILURE);
			}
		} else if (regstr == NULL) {
			if (!isvalue(argv[argn])) {
				fprintf(stderr, "ERR: Bad register, %s\n",
					argv[argn]);
				exit(EXIT_FAILURE);
			}
			regstr = argv[argn];
		} else {
			if ((!isvalue(argv[argn]))||(nvalues >= MAXBYTES)) {
				fprintf(stderr, "ERR: Bad value, %s\n", argv[argn]);
				exit(EXIT_FAILURE);
			}
			wbuf[nvalues++] = strtoul(argv[argn], NULL, 0) & 0x0ff;
		}
	}

	if (regstr == NULL) {
		fprintf(stderr, "ERR: No register given\n\n");
		usage();
		exit(EXIT_FAILURE);
	}

	reg = strtoul(regstr, NULL, 0);
	if (reg > 0x0ff) {
		fprintf(stderr, "ERR: Register 0x%x is out of range\n", reg);
		exit(EXIT_FAILURE);
	}

	if (addr > ((tenbit) ? 0x03ffu : 0x07fu)) {
		fprintf(stderr, "ERR: Address 0x%x is out of range\n", addr);
		exit(EXIT_FAILURE);
	}

	if (nvalues > 0)
		count = nvalues;
	if ((count < 1)||(count > MAXBYTES)) {
		fprintf(stderr, "ERR: Bad count, %d\n", count);
		exit(EXIT_FAILURE);
	}
	// }}}

	tb = new I2CTB(clock_rate, bit_rate, addr, tenbit, bidir);
	if (tb->m_core->config_err()) {
		delete	tb;
		exit(EXIT_FAILURE);
	}

	if (debug_flag) {
		printf("Simulating with\n");
		printf("\tClock rate       = %lu Hz\n", clock_rate);
		printf("\tBit rate         = %lu Hz\n", bit_rate);
		printf("\tTicks / half bit = %u\n",
			tb->m_core->clk().ticks_per_half_bit());
		printf("\tVCD File         = %s\n", DEF_TRACE_FILE);
		tb->m_core->debug(true);
		tb->opentrace(DEF_TRACE_FILE);
	}

	if (preload) {
		for(int k=0; k<(1<<DEF_SLAVE_MEMBITS); k++)
			(*tb->m_slave)[k] = (char)k;
	}

	if (tb->reset() != 0) {
		fprintf(stderr, "ERR: Bus priming never completed\n");
		delete	tb;
		exit(EXIT_FAILURE);
	}

	r = 0;
	if (nvalues > 0) {
		// {{{
		tb->m_mon.clear();
		r = tb->write_regs(addr, reg, nvalues, wbuf, tenbit);
		if (r != 0) {
			printf("%03x:%02x : %s\n", addr, reg,
				(r > 0) ? "NAK" : "TIMEOUT");
		} else for(int k=0; k<nvalues; k++)
			printf("%03x:%02x -> %02x\n", addr, (reg+k)&0x0ff,
				wbuf[k]);
		if (debug_flag)
			tb->m_mon.dump(stdout);
		// }}}
	}

	if (r == 0) {
		// {{{
		tb->m_mon.clear();
		memset(rbuf, 0, sizeof(rbuf));
		r = tb->read_regs(addr, reg, count, rbuf, tenbit);
		if (r != 0) {
			printf("%03x:%02x : %s\n", addr, reg,
				(r > 0) ? "NAK" : "TIMEOUT");
		} else for(int k=0; k<count; k++) {
			printf("%03x:%02x :  %02x [%c]", addr, (reg+k)&0x0ff,
				rbuf[k], isgraph(rbuf[k]) ? rbuf[k] : '.');
			if ((nvalues > 0)&&(rbuf[k] != wbuf[k]))
				printf(" MISMATCH, wrote %02x", wbuf[k]);
			printf("\n");
			if ((nvalues > 0)&&(rbuf[k] != wbuf[k]))
				r = 1;
		}
		if (debug_flag)
			tb->m_mon.dump(stdout);
		// }}}
	}

	delete	tb;
	return (r == 0) ? EXIT_SUCCESS : EXIT_FAILURE;
}
