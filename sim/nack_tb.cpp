////////////////////////////////////////////////////////////////////////////////
//
// Filename:	nack_tb.cpp
// {{{
// Project:	LLI2C, a low-level, cycle-accurate I2C bus master
//
// Purpose:	Checks that every NAK, whether from the slave or from us,
//		ends the transaction with a STOP.
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

static	unsigned	count(const I2CMON &mon, I2CEVTYPE t) {
	unsigned	n = 0;

	for(unsigned k=0; k<mon.size(); k++)
		if (mon[k].m_type == t)
			n++;
	return n;
}

int	main(int argc, char **argv) {
	I2CTB		*tb = new I2CTB();
	unsigned char	buf[8];
	I2CREQ		req;
	int		r, last;

	if ((argc > 1)&&(strcmp(argv[1], "-d")==0))
		tb->opentrace(DEF_TRACE_FILE);

	TBCHECK(tb, tb->reset() == 0);
	for(int k=0; k<8; k++)
		(*tb->m_slave)[0x20+k] = (char)(0x30 + k);

	//
	// Multi-byte read.  Our NAK of the third byte ends the transfer: a
	// STOP follows right away, and no more bytes are clocked
	//
	// {{{
	tb->m_mon.clear();
	memset(buf, 0, sizeof(buf));
	TBCHECK(tb, tb->read_regs(DEF_SLAVE_ADDR, 0x20, 3, buf) == 0);
	TBCHECK(tb, tb->m_nread == 3);
	TBCHECK(tb, buf[0] == 0x30);
	TBCHECK(tb, buf[1] == 0x31);
	TBCHECK(tb, buf[2] == 0x32);
	// S A0 20 Sr A1 30 31 32 P
	TBCHECK(tb, tb->m_mon.size() == 9);
	TBCHECK(tb, tb->m_mon.nbytes() == 6);
	last = (int)tb->m_mon.size()-1;
	TBCHECK(tb, tb->m_mon[last].m_type == I2CEV_STOP);
	TBCHECK(tb, tb->m_mon[last-1].m_type == I2CEV_BYTE);
	TBCHECK(tb, tb->m_mon[last-1].m_byte == 0x32);
	TBCHECK(tb, tb->m_mon[last-1].m_ack == 0);
	TBCHECK(tb, tb->m_mon[last-2].m_ack == 1);
	TBCHECK(tb, tb->m_mon[last-3].m_ack == 1);
	// The STOP follows the NAK'd slot directly, no further bit cells
	TBCHECK(tb, tb->m_mon[last].m_tick - tb->m_mon[last-1].m_tick
				<= 2 * tb->bit_ticks());
	TBCHECK(tb, tb->m_core->state() == I2C_IDLE);
	// }}}

	//
	// The slave NAKs the third byte of a write
	//
	// {{{
	tb->m_slave->nack_after(2);
	for(int k=0; k<5; k++)
		buf[k] = 0xe0 + k;
	tb->m_mon.clear();
	r = tb->write_regs(DEF_SLAVE_ADDR, 0x40, 5, buf);
	TBCHECK(tb, r == 1);
	TBCHECK(tb, tb->m_core->o_err == 1);
	// Address, register, then three data bytes.  The last is NAK'd
	TBCHECK(tb, tb->m_mon.nbytes() == 5);
	TBCHECK(tb, count(tb->m_mon, I2CEV_STOP) == 1);
	last = (int)tb->m_mon.size()-1;
	TBCHECK(tb, tb->m_mon[last].m_type == I2CEV_STOP);
	TBCHECK(tb, tb->m_mon[last-1].m_byte == 0xe2);
	TBCHECK(tb, tb->m_mon[last-1].m_ack == 0);
	TBCHECK(tb, ((*tb->m_slave)[0x40] & 0x0ff) == 0xe0);
	TBCHECK(tb, ((*tb->m_slave)[0x41] & 0x0ff) == 0xe1);
	TBCHECK(tb, ((*tb->m_slave)[0x42] & 0x0ff) == 0x00);
	tb->m_slave->nack_after(-1);
	// }}}

	//
	// Nobody home.  The address is NAK'd, and the master stops
	//
	// {{{
	tb->m_mon.clear();
	buf[0] = 0x55;
	TBCHECK(tb, tb->write_regs(0x13, 0x00, 1, buf) == 1);
	TBCHECK(tb, tb->m_mon.size() == 3);
	TBCHECK(tb, tb->m_mon[1].m_byte == (0x13 << 1));
	TBCHECK(tb, tb->m_mon[1].m_ack == 0);
	TBCHECK(tb, tb->m_mon[2].m_type == I2CEV_STOP);

	tb->m_mon.clear();
	TBCHECK(tb, tb->read_regs(0x13, 0x00, 4, buf) == 1);
	TBCHECK(tb, tb->m_nread == 0);
	TBCHECK(tb, count(tb->m_mon, I2CEV_START) == 1);
	TBCHECK(tb, tb->m_mon.size() == 3);

	TBCHECK(tb, tb->probe(0x13) == 1);
	TBCHECK(tb, tb->probe(DEF_SLAVE_ADDR) == 0);
	// }}}

	// The NAK is an outcome, not a fault.  The next transaction is fine
	// {{{
	req.m_addr = DEF_SLAVE_ADDR; req.m_tenbit = false; req.m_read = true;
	req.m_reg  = 0; req.m_regen = false;
	buf[0] = 0;
	TBCHECK(tb, tb->write_regs(DEF_SLAVE_ADDR, 0x20, 0, buf) == 0);
	TBCHECK(tb, tb->xfer(req, 2, buf) == 0);
	TBCHECK(tb, tb->m_core->o_err == 0);
	TBCHECK(tb, buf[0] == 0x30);
	TBCHECK(tb, buf[1] == 0x31);
	// }}}

	TBCHECK(tb, !tb->m_slave->illegal());
	r = tb->result("NACK");
	delete	tb;
	return r;
}
