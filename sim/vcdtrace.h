////////////////////////////////////////////////////////////////////////////////
//
// Filename:	vcdtrace.h
// {{{
// Project:	LLI2C, a low-level, cycle-accurate I2C bus master
//
// Purpose:	Writes the state of the bus, and of the master, to a VCD file
//		for viewing in GTKWave.
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
#ifndef	VCDTRACE_H
#define	VCDTRACE_H

#include <stdio.h>

#include "i2cbus.h"

//
// Dumps the bus wires, and the master's state, to a VCD file that can be
// viewed with GTKWave.  Only changes are written.
//
class	VCDTRACE {
	FILE		*m_fp;
	unsigned long	m_clock_rate;
	int		m_last_scl, m_last_sda, m_last_state;
	bool		m_first;
public:
	VCDTRACE(void) : m_fp(NULL), m_clock_rate(1000000000ul), m_first(true) {}
	~VCDTRACE(void) { close(); }

	bool	open(const char *fname, unsigned long clock_rate);
	void	close(void);
	bool	isopen(void) const { return m_fp != NULL; }

	void	sample(unsigned long tick, const I2CBUS b, int state);

	static	unsigned long long ns(unsigned long tick,
				unsigned long clock_rate);
};

#endif
