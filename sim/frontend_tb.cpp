////////////////////////////////////////////////////////////////////////////////
//
// Filename:	frontend_tb.cpp
// {{{
// Project:	LLI2C, a low-level, cycle-accurate I2C bus master
//
// Purpose:	Drives the request, write, and read handshakes by hand, and
//		compares the split and shared SDA pin configurations.
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

static	I2CREQ	mkreq(unsigned addr, bool rd, unsigned reg, bool regen) {
	I2CREQ	req;

	req.m_addr = addr; req.m_tenbit = false; req.m_read = rd;
	req.m_reg  = reg;  req.m_regen  = regen;
	return req;
}

//
// Drive the handshakes by hand.  A second request, held valid while the
// first is in flight, is not taken until the master is idle again.
//
void	backpressure(I2CTB *tb) {
	// {{{
	LLI2CM		*core = tb->m_core;
	unsigned long	maxticks = 64 * tb->bit_ticks();
	int		ackstb = 0, wrs = 0, rds = 0;
	unsigned	rdata = 0;
	bool		done = false;

	(*tb->m_slave)[0x06] = 0x61;
	tb->m_mon.clear();

	TBCHECK(tb, tb->request(mkreq(DEF_SLAVE_ADDR, false, 0x05, true))==0);
	TBCHECK(tb, core->o_busy);

	core->i_req = mkreq(DEF_SLAVE_ADDR, true, 0, false);
	core->i_stb = 1;
	for(unsigned long k=0; (k<maxticks)&&(!done); k++) {
		bool	ready = (core->o_wr_ready != 0);

		TBCHECK(tb, core->o_req_ready == 0);
		if (ready)
			TBCHECK(tb, core->o_ackslot);

		core->i_wr_stb  = (wrs == 0);
		core->i_wr_data = 0x99;
		tb->tick();

		if ((ready)&&(core->i_wr_stb))
			wrs++;
		if (core->o_ackstb) {
			ackstb++;
			TBCHECK(tb, !core->o_nacked);
		}
		TBCHECK(tb, !core->o_rd_stb);
		done = (core->o_done != 0);
	}
	core->i_wr_stb = 0;

	TBCHECK(tb, done);
	TBCHECK(tb, wrs == 1);
	// Address, register, data
	TBCHECK(tb, ackstb == 3);
	TBCHECK(tb, core->o_err == 0);
	TBCHECK(tb, ((*tb->m_slave)[0x05] & 0x0ff) == 0x99);
	TBCHECK(tb, tb->m_mon.size() == 5);

	// The held request goes out on the very next tick
	TBCHECK(tb, core->o_req_ready == 1);
	tb->tick();
	core->i_stb = 0;
	TBCHECK(tb, core->state() == I2C_START);
	TBCHECK(tb, core->o_req_ready == 0);

	done = false;
	core->i_ack = 0;
	for(unsigned long k=0; (k<maxticks)&&(!done); k++) {
		TBCHECK(tb, !core->o_wr_ready);
		tb->tick();
		if (core->o_rd_stb) {
			rds++;
			rdata = core->o_rd_data;
			// The byte closes as its ACK slot opens
			TBCHECK(tb, core->o_ackslot);
		}
		done = (core->o_done != 0);
	}

	TBCHECK(tb, done);
	TBCHECK(tb, rds == 1);
	TBCHECK(tb, rdata == 0x61);
	TBCHECK(tb, core->state() == I2C_IDLE);
	// }}}
}

//
// No write data offered: the master stops once the register is sent
//
void	nodata(I2CTB *tb) {
	// {{{
	tb->m_mon.clear();
	TBCHECK(tb, tb->xfer(mkreq(DEF_SLAVE_ADDR, false, 0x33, true), 0, NULL)
			== 0);
	TBCHECK(tb, tb->m_nwritten == 0);
	TBCHECK(tb, tb->m_mon.size() == 4);
	TBCHECK(tb, tb->m_mon[3].m_type == I2CEV_STOP);
	// }}}
}

//
// Requests that can't be put on the bus as given are refused.  They
// complete, with an error, and nothing is clocked out
//
void	badreq(I2CTB *tb) {
	// {{{
	LLI2CM		*core = tb->m_core;
	unsigned char	v = 0x77;
	I2CREQ		req;
	unsigned long	rises, starts;
	bool		done = false;

	(*tb->m_slave)[0x10] = 0x01;
	tb->m_mon.clear();
	rises  = tb->m_mon.rises();
	starts = tb->m_slave->starts();

	// 0x150 is no 7-bit address, and must not become 0x50
	TBCHECK(tb, !LLI2CM::valid_request(mkreq(0x150, false, 0x10, true)));
	TBCHECK(tb, tb->write_regs(0x150, 0x10, 1, &v) == 1);
	TBCHECK(tb, core->o_err == 1);
	TBCHECK(tb, tb->m_nwritten == 0);
	TBCHECK(tb, ((*tb->m_slave)[0x10] & 0x0ff) == 0x01);

	// Nor is 0x400 a 10-bit address
	TBCHECK(tb, tb->read_regs(0x400, 0x10, 1, &v, true) == 1);
	TBCHECK(tb, tb->m_nread == 0);

	// Nor 0x100 a register
	req = mkreq(DEF_SLAVE_ADDR, true, 0x100, true);
	TBCHECK(tb, tb->xfer(req, 1, &v) == 1);
	// ... unless there's no register phase to put it in
	req.m_regen = false;
	TBCHECK(tb, LLI2CM::valid_request(req));

	// No byte, START, or clock ever reached the wire
	TBCHECK(tb, tb->m_mon.size() == 0);
	TBCHECK(tb, tb->m_mon.rises() == rises);
	TBCHECK(tb, tb->m_slave->starts() == starts);

	// The refusal takes the handshake, then completes on the next tick
	core->i_req = mkreq(0x0ff, false, 0, false);
	core->i_stb = 1;
	TBCHECK(tb, core->o_req_ready == 1);
	tb->tick();
	core->i_stb = 0;
	TBCHECK(tb, core->state() == I2C_IDLE);
	TBCHECK(tb, core->o_busy == 1);
	TBCHECK(tb, core->o_req_ready == 0);
	TBCHECK(tb, core->o_done == 0);
	tb->tick();
	done = (core->o_done != 0);
	TBCHECK(tb, done);
	TBCHECK(tb, core->o_err == 1);
	TBCHECK(tb, core->o_busy == 0);
	TBCHECK(tb, core->o_req_ready == 1);
	TBCHECK(tb, tb->m_mon.size() == 0);

	// A good request afterwards goes through, and clears the error
	TBCHECK(tb, tb->write_regs(DEF_SLAVE_ADDR, 0x10, 1, &v) == 0);
	TBCHECK(tb, core->o_err == 0);
	TBCHECK(tb, ((*tb->m_slave)[0x10] & 0x0ff) == v);
	// }}}
}

//
// Run the same transactions through a split pin and a shared pin master.
// The bus must not be able to tell the difference.
//
void	pinmodes(I2CTB *tb) {
	// {{{
	I2CTB		*split = new I2CTB(DEF_CLOCK_RATE, DEF_BIT_RATE,
					DEF_SLAVE_ADDR, false, false),
			*shared = new I2CTB(DEF_CLOCK_RATE, DEF_BIT_RATE,
					DEF_SLAVE_ADDR, false, true);
	unsigned char	wbuf[4] = { 0x12, 0x34, 0x56, 0x78 }, ra[4], rb[4];

	TBCHECK(tb, !split->m_core->bidir());
	TBCHECK(tb, shared->m_core->bidir());

	TBCHECK(tb, split->reset() == 0);
	TBCHECK(tb, shared->reset() == 0);
	TBCHECK(tb, split->write_regs(DEF_SLAVE_ADDR, 0x70, 4, wbuf) == 0);
	TBCHECK(tb, shared->write_regs(DEF_SLAVE_ADDR, 0x70, 4, wbuf) == 0);
	TBCHECK(tb, split->read_regs(DEF_SLAVE_ADDR, 0x70, 4, ra) == 0);
	TBCHECK(tb, shared->read_regs(DEF_SLAVE_ADDR, 0x70, 4, rb) == 0);

	TBCHECK(tb, memcmp(ra, wbuf, 4) == 0);
	TBCHECK(tb, memcmp(rb, wbuf, 4) == 0);
	TBCHECK(tb, split->m_tickcount == shared->m_tickcount);
	TBCHECK(tb, split->m_mon.size() == shared->m_mon.size());
	for(unsigned k=0; k<split->m_mon.size()
				&& k<shared->m_mon.size(); k++) {
		TBCHECK(tb, split->m_mon[k].m_type == shared->m_mon[k].m_type);
		TBCHECK(tb, split->m_mon[k].m_byte == shared->m_mon[k].m_byte);
		TBCHECK(tb, split->m_mon[k].m_ack  == shared->m_mon[k].m_ack);
		TBCHECK(tb, split->m_mon[k].m_tick == shared->m_mon[k].m_tick);
	}
	TBCHECK(tb, !split->m_slave->illegal());
	TBCHECK(tb, !shared->m_slave->illegal());

	delete	split;
	delete	shared;
	// }}}
}

int	main(int argc, char **argv) {
	I2CTB	*tb = new I2CTB();
	int	r;

	if ((argc > 1)&&(strcmp(argv[1], "-d")==0))
		tb->opentrace(DEF_TRACE_FILE);

	// Nothing is accepted during the bus priming sequence
	tb->m_core->i_reset = 1;
	tb->tick();
	tb->m_core->i_reset = 0;
	tb->m_core->i_stb = 1;
	tb->m_core->i_req = mkreq(DEF_SLAVE_ADDR, false, 0, false);
	for(int k=0; k<4; k++) {
		tb->tick();
		TBCHECK(tb, tb->m_core->state() == I2C_INIT);
		TBCHECK(tb, tb->m_core->o_req_ready == 0);
	}
	tb->m_core->i_stb = 0;
	TBCHECK(tb, tb->wait_idle(16 * tb->bit_ticks()) == 0);

	backpressure(tb);
	nodata(tb);
	badreq(tb);
	pinmodes(tb);

	TBCHECK(tb, !tb->m_slave->illegal());
	r = tb->result("FRONTEND");
	delete	tb;
	return r;
}
