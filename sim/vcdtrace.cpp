////////////////////////////////////////////////////////////////////////////////
//
// Filename:	vcdtrace.cpp
// {{{
// Project:	LLI2C, a low-level, cycle-accurate I2C bus master
//
// Purpose:	A minimal VCD writer.  Only values that change are written.
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
#include <time.h>

#include "vcdtrace.h"

bool	VCDTRACE::open(const char *fname, unsigned long clock_rate) {
	// {{{
	time_t	now;

	close();
	m_fp = fopen(fname, "w");
	if (NULL == m_fp) {
		fprintf(stderr, "ERR: Could not open trace file, %s\n", fname);
		perror("O/S Err: ");
		return false;
	}

	m_clock_rate = (clock_rate > 0) ? clock_rate : 1000000000ul;
	m_first = true;

	now = time(NULL);
	fprintf(m_fp, "$date\n\t%s$end\n", ctime(&now));
	fprintf(m_fp, "$version\n\tLLI2C bus trace\n$end\n");
	fprintf(m_fp, "$timescale 1ns $end\n");
	fprintf(m_fp, "$scope module lli2c $end\n");
	fprintf(m_fp, "$var wire 1 ! scl $end\n");
	fprintf(m_fp, "$var wire 1 \" sda $end\n");
	fprintf(m_fp, "$var reg 4 # state $end\n");
	fprintf(m_fp, "$upscope $end\n");
	fprintf(m_fp, "$enddefinitions $end\n");

	return true;
	// }}}
}

//
// Time of a tick, to the nearest nanosecond below.  Whole seconds and
// the remainder are scaled apart, so nothing overflows and no rounding
// error builds up from one tick to the next.
//
unsigned long long VCDTRACE::ns(unsigned long tick, unsigned long clock_rate) {
	// {{{
	const unsigned long long	NS = 1000000000ull;
	unsigned long long	t = tick, c = clock_rate;

	if (c == 0)
		return t;
	return (t / c) * NS + ((t % c) * NS) / c;
	// }}}
}

void	VCDTRACE::close(void) {
	if (m_fp) {
		fclose(m_fp);
		m_fp = NULL;
	}
}

void	VCDTRACE::sample(unsigned long tick, const I2CBUS b, int state) {
	// {{{
	if (!m_fp)
		return;

	if ((!m_first)&&(b.m_scl == m_last_scl)&&(b.m_sda == m_last_sda)
			&&(state == m_last_state))
		return;

	fprintf(m_fp, "#%llu\n", ns(tick, m_clock_rate));
	if ((m_first)||(b.m_scl != m_last_scl))
		fprintf(m_fp, "%d!\n", b.m_scl);
	if ((m_first)||(b.m_sda != m_last_sda))
		fprintf(m_fp, "%d\"\n", b.m_sda);
	if ((m_first)||(state != m_last_state)) {
		fprintf(m_fp, "b");
		for(int k=3; k>=0; k--)
			fprintf(m_fp, "%d", (state >> k)&1);
		fprintf(m_fp, " #\n");
	}

	m_last_scl = b.m_scl;
	m_last_sda = b.m_sda;
	m_last_state = state;
	m_first = false;
	// }}}
}
