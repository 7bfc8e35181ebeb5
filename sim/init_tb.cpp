////////////////////////////////////////////////////////////////////////////////
//
// Filename:	init_tb.cpp
// {{{
// Project:	LLI2C, a low-level, cycle-accurate I2C bus master
//
// Purpose:	Checks the bus priming sequence: nine clock pulses with SDA
//		released, after which the bus is usable.
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

//
// Runs the bus priming sequence, checking that SDA is never pulled and that
// nothing is ever framed.  Returns the number of SCL pulses seen.
//
unsigned long	prime(I2CTB *tb) {
	// {{{
	unsigned long	maxticks = 16 * tb->bit_ticks();
	unsigned long	k;

	tb->m_mon.clear();

	tb->m_core->i_reset = 1;
	tb->tick();
	TBCHECK(tb, tb->m_core->o_req_ready == 0);
	tb->m_core->i_reset = 0;

	tb->tick();
	TBCHECK(tb, tb->m_core->state() == I2C_INIT);
	for(k=0; (k<maxticks)&&(tb->m_core->o_busy); k++) {
		TBCHECK(tb, tb->m_core->o_sda == 1);
		TBCHECK(tb, tb->m_core->o_req_ready == 0);
		tb->tick();
	}

	TBCHECK(tb, k < maxticks);
	TBCHECK(tb, tb->m_core->state() == I2C_IDLE);
	TBCHECK(tb, tb->m_core->o_scl == 1);
	TBCHECK(tb, tb->m_core->o_sda == 1);
	TBCHECK(tb, tb->m_core->o_req_ready == 1);
	TBCHECK(tb, tb->m_mon.size() == 0);

	return tb->m_mon.rises();
	// }}}
}

int	main(int argc, char **argv) {
	I2CTB		*tb = new I2CTB();
	unsigned char	wbuf[2] = { 0x5a, 0xc3 }, rbuf[2];
	int		r;

	if ((argc > 1)&&(strcmp(argv[1], "-d")==0))
		tb->opentrace(DEF_TRACE_FILE);

	// Before any reset, the master sits idle and primes nothing
	TBCHECK(tb, tb->m_core->state() == I2C_IDLE);
	TBCHECK(tb, tb->m_core->o_busy == 0);

	TBCHECK(tb, prime(tb) == 9);
	TBCHECK(tb, tb->write_regs(DEF_SLAVE_ADDR, 0x10, 2, wbuf) == 0);

	// Priming an idle bus again changes nothing
	TBCHECK(tb, prime(tb) == 9);
	TBCHECK(tb, prime(tb) == 9);
	TBCHECK(tb, tb->m_slave->vstate() == I2CIDLE);

	memset(rbuf, 0, sizeof(rbuf));
	TBCHECK(tb, tb->read_regs(DEF_SLAVE_ADDR, 0x10, 2, rbuf) == 0);
	TBCHECK(tb, rbuf[0] == 0x5a);
	TBCHECK(tb, rbuf[1] == 0xc3);
	TBCHECK(tb, !tb->m_slave->illegal());

	r = tb->result("INIT");
	delete	tb;
	return r;
}
