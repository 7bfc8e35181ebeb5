////////////////////////////////////////////////////////////////////////////////
//
// Filename:	addr_tb.cpp
// {{{
// Project:	LLI2C, a low-level, cycle-accurate I2C bus master
//
// Purpose:	Walks every 7-bit and 10-bit address through the master,
//		checking the address bytes as they appear on the bus.
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

#include "i2ctb.h"

#define	TENBIT_ADDR	0x2a5

static	I2CREQ	mkreq(unsigned addr, bool tenbit, bool rd) {
	I2CREQ	req;

	req.m_addr = addr; req.m_tenbit = tenbit; req.m_read = rd;
	req.m_reg  = 0;    req.m_regen  = false;
	return req;
}

static	bool	isbyte(const I2CMON &mon, int k, unsigned byte, int ack) {
	if (k >= (int)mon.size())
		return false;
	return (mon[k].m_type == I2CEV_BYTE)&&(mon[k].m_byte == byte)
		&&(mon[k].m_ack == ack);
}

static	bool	isevent(const I2CMON &mon, int k, I2CEVTYPE t) {
	return (k < (int)mon.size())&&(mon[k].m_type == t);
}

//
// Every 7-bit address, in both directions.  The first byte after START is
// always the address followed by the direction bit.
//
void	sevenbit(void) {
	// {{{
	I2CTB		*tb = new I2CTB();
	unsigned char	buf[1];
	int		fails = 0;

	tb->reset();
	for(unsigned addr=0; addr < 128; addr++) {
		for(int rd=0; rd<2; rd++) {
			bool	us = (addr == DEF_SLAVE_ADDR);
			int	r;

			tb->m_mon.clear();
			buf[0] = 0;
			r = tb->xfer(mkreq(addr, false, rd), 1, buf);
			TBCHECK(tb, r == ((us) ? 0 : 1));
			TBCHECK(tb, isevent(tb->m_mon, 0, I2CEV_START));
			TBCHECK(tb, isbyte(tb->m_mon, 1, (addr<<1)|rd, us));
			TBCHECK(tb, isevent(tb->m_mon, (int)tb->m_mon.size()-1,
						I2CEV_STOP));
			if (!us)
				TBCHECK(tb, tb->m_mon.size() == 3);
			else
				// One data byte, in either direction
				TBCHECK(tb, tb->m_mon.size() == 4);
		}
	}

	TBCHECK(tb, !tb->m_slave->illegal());
	fails = tb->m_fails;
	delete	tb;
	if (fails)
		exit(EXIT_FAILURE);
	// }}}
}

int	main(int argc, char **argv) {
	I2CTB		*tb = new I2CTB(DEF_CLOCK_RATE, DEF_BIT_RATE,
					TENBIT_ADDR, true);
	unsigned char	buf[1];
	int		r;

	sevenbit();

	tb->reset();
	(*tb->m_slave)[0] = 0x3c;

	//
	// The first byte of every 10-bit address is 11110, the top two
	// address bits, and a write bit--even for a read.
	//
	for(unsigned addr=0; addr < 1024; addr++) {
		for(int rd=0; rd<2; rd++) {
			unsigned	first = 0x0f0 | ((addr >> 7)&6);
			bool		hi_us = ((addr>>8) == (TENBIT_ADDR>>8));

			tb->m_mon.clear();
			buf[0] = 0;
			r = tb->xfer(mkreq(addr, true, rd), 1, buf);
			TBCHECK(tb, isevent(tb->m_mon, 0, I2CEV_START));
			TBCHECK(tb, isbyte(tb->m_mon, 1, first, hi_us));
			if (!hi_us) {
				TBCHECK(tb, r == 1);
				TBCHECK(tb, tb->m_mon.size() == 3);
			} else
				TBCHECK(tb, isbyte(tb->m_mon, 2, addr & 0x0ff,
					addr == TENBIT_ADDR));
			if ((hi_us)&&(addr != TENBIT_ADDR)) {
				TBCHECK(tb, r == 1);
				TBCHECK(tb, tb->m_mon.size() == 4);
			}
		}
	}

	//
	// A 10-bit read: write phase, repeated START, then the first address
	// byte again with the read bit set
	//
	buf[0] = 0;	// Point the slave back at register zero
	TBCHECK(tb, tb->xfer(mkreq(TENBIT_ADDR, true, false), 1, buf) == 0);
	tb->m_mon.clear();
	buf[0] = 0;
	r = tb->xfer(mkreq(TENBIT_ADDR, true, true), 1, buf);
	TBCHECK(tb, r == 0);
	TBCHECK(tb, buf[0] == 0x3c);
	TBCHECK(tb, tb->m_mon.size() == 7);
	TBCHECK(tb, isevent(tb->m_mon, 0, I2CEV_START));
	TBCHECK(tb, isbyte(tb->m_mon, 1, 0x0f4, 1));
	TBCHECK(tb, isbyte(tb->m_mon, 2, 0x0a5, 1));
	TBCHECK(tb, isevent(tb->m_mon, 3, I2CEV_START));
	TBCHECK(tb, isbyte(tb->m_mon, 4, 0x0f5, 1));
	TBCHECK(tb, isbyte(tb->m_mon, 5, 0x03c, 0));
	TBCHECK(tb, isevent(tb->m_mon, 6, I2CEV_STOP));

	// A 10-bit write has no repeated START
	tb->m_mon.clear();
	buf[0] = 0x77;
	r = tb->xfer(mkreq(TENBIT_ADDR, true, false), 1, buf);
	TBCHECK(tb, r == 0);
	TBCHECK(tb, tb->m_mon.size() == 5);
	TBCHECK(tb, isbyte(tb->m_mon, 1, 0x0f4, 1));
	TBCHECK(tb, isbyte(tb->m_mon, 2, 0x0a5, 1));
	TBCHECK(tb, isbyte(tb->m_mon, 3, 0x077, 1));
	TBCHECK(tb, isevent(tb->m_mon, 4, I2CEV_STOP));

	TBCHECK(tb, !tb->m_slave->illegal());

	r = tb->result("ADDR");
	delete	tb;
	return r;
}
