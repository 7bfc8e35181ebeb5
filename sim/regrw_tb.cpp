////////////////////////////////////////////////////////////////////////////////
//
// Filename:	regrw_tb.cpp
// {{{
// Project:	LLI2C, a low-level, cycle-accurate I2C bus master
//
// Purpose:	Register writes and reads, single byte and burst, against
//		7-bit and 10-bit devices.
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
#include <string.h>

#include "i2ctb.h"

#define	TENBIT_ADDR	0x1c3

//
// Write a byte to a register, read it back
//
void	loopback(I2CTB *tb, unsigned addr, bool tenbit) {
	// {{{
	static const unsigned char	pattern[] = {
		0x00, 0xff, 0xa5, 0x5a, 0x01, 0x80, 0x7e, 0x3c };
	unsigned char	v;

	for(unsigned k=0; k<sizeof(pattern); k++) {
		unsigned	reg = (k * 37 + 3) & 0x0ff;

		v = pattern[k];
		TBCHECK(tb, tb->write_regs(addr, reg, 1, &v, tenbit) == 0);
		TBCHECK(tb, ((*tb->m_slave)[reg] & 0x0ff) == pattern[k]);

		v = ~pattern[k];
		TBCHECK(tb, tb->read_regs(addr, reg, 1, &v, tenbit) == 0);
		TBCHECK(tb, v == pattern[k]);
	}
	// }}}
}

int	main(int argc, char **argv) {
	I2CTB		*tb = new I2CTB();
	unsigned char	wbuf[16], rbuf[16];
	int		r;

	if ((argc > 1)&&(strcmp(argv[1], "-d")==0)) {
		tb->m_core->debug(true);
		tb->opentrace(DEF_TRACE_FILE);
	}

	TBCHECK(tb, tb->reset() == 0);
	loopback(tb, DEF_SLAVE_ADDR, false);

	// A register read is framed as write, repeated START, then read
	// {{{
	unsigned long	starts = tb->m_slave->starts(),
			stops = tb->m_slave->stops();

	(*tb->m_slave)[0x42] = (char)0x96;
	tb->m_mon.clear();
	TBCHECK(tb, tb->read_regs(DEF_SLAVE_ADDR, 0x42, 1, rbuf) == 0);
	TBCHECK(tb, tb->m_mon.size() == 7);
	if (tb->m_mon.size() == 7) {
		TBCHECK(tb, tb->m_mon[0].m_type == I2CEV_START);
		TBCHECK(tb, tb->m_mon[1].m_byte == (DEF_SLAVE_ADDR<<1));
		TBCHECK(tb, tb->m_mon[1].m_ack);
		TBCHECK(tb, tb->m_mon[2].m_byte == 0x42);
		TBCHECK(tb, tb->m_mon[2].m_ack);
		TBCHECK(tb, tb->m_mon[3].m_type == I2CEV_START);
		TBCHECK(tb, tb->m_mon[4].m_byte == ((DEF_SLAVE_ADDR<<1)|1));
		TBCHECK(tb, tb->m_mon[4].m_ack);
		TBCHECK(tb, tb->m_mon[5].m_byte == 0x96);
		TBCHECK(tb, !tb->m_mon[5].m_ack);
		TBCHECK(tb, tb->m_mon[6].m_type == I2CEV_STOP);
	}
	TBCHECK(tb, rbuf[0] == 0x96);
	TBCHECK(tb, tb->m_slave->starts() == starts + 2);
	TBCHECK(tb, tb->m_slave->stops()  == stops + 1);
	// }}}

	// Burst write, burst read, walking through the register file
	// {{{
	for(int k=0; k<16; k++)
		wbuf[k] = (k * 0x1d + 0x11) & 0x0ff;
	memset(rbuf, 0, sizeof(rbuf));
	TBCHECK(tb, tb->write_regs(DEF_SLAVE_ADDR, 0xf8, 16, wbuf) == 0);
	TBCHECK(tb, tb->m_nwritten == 16);
	TBCHECK(tb, tb->read_regs(DEF_SLAVE_ADDR, 0xf8, 16, rbuf) == 0);
	TBCHECK(tb, tb->m_nread == 16);
	TBCHECK(tb, memcmp(wbuf, rbuf, 16) == 0);
	// The pointer wraps around the end of the register file
	TBCHECK(tb, ((*tb->m_slave)[0x03] & 0x0ff) == wbuf[11]);
	// }}}

	TBCHECK(tb, !tb->m_slave->illegal());
	r = tb->m_fails;
	delete	tb;

	// The same again, on a 10-bit device
	// {{{
	tb = new I2CTB(DEF_CLOCK_RATE, DEF_BIT_RATE, TENBIT_ADDR, true);
	tb->m_fails = r;
	TBCHECK(tb, tb->reset() == 0);
	loopback(tb, TENBIT_ADDR, true);

	tb->m_mon.clear();
	(*tb->m_slave)[0x10] = 0x2b;
	TBCHECK(tb, tb->read_regs(TENBIT_ADDR, 0x10, 1, rbuf) == 0);
	TBCHECK(tb, rbuf[0] == 0x2b);
	// S F2 C3 10 Sr F3 2b P
	TBCHECK(tb, tb->m_mon.size() == 8);
	if (tb->m_mon.size() == 8) {
		TBCHECK(tb, tb->m_mon[1].m_byte == 0x0f2);
		TBCHECK(tb, tb->m_mon[2].m_byte == 0x0c3);
		TBCHECK(tb, tb->m_mon[3].m_byte == 0x010);
		TBCHECK(tb, tb->m_mon[4].m_type == I2CEV_START);
		TBCHECK(tb, tb->m_mon[5].m_byte == 0x0f3);
		TBCHECK(tb, tb->m_mon[6].m_byte == 0x02b);
		TBCHECK(tb, tb->m_mon[7].m_type == I2CEV_STOP);
	}
	TBCHECK(tb, !tb->m_slave->illegal());
	// }}}

	r = tb->result("REGRW");
	delete	tb;
	return r;
}
