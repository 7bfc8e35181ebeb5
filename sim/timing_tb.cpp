////////////////////////////////////////////////////////////////////////////////
//
// Filename:	timing_tb.cpp
// {{{
// Project:	LLI2C, a low-level, cycle-accurate I2C bus master
//
// Purpose:	Measures SCL edge spacing, and SDA changes while SCL is high,
//		across several clock and bit rate combinations.
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
#include <vector>

#include "i2ctb.h"

//
// Records the tick of every SCL edge, and counts SDA changes that happen
// while SCL is high.  Outside of START and STOP, there should be none.
//
class	TIMINGTB : public I2CTB {
public:
	std::vector<unsigned long>	m_edges;
	unsigned	m_sda_high;

	TIMINGTB(unsigned long clock_rate, unsigned long bit_rate)
		: I2CTB(clock_rate, bit_rate), m_sda_high(0) {}

	void	clear(void) {
		m_edges.clear();
		m_sda_high = 0;
		m_mon.clear();
	}

	virtual	void	tick(void) {
		I2CBUS	prev = m_bus;

		I2CTB::tick();
		if (m_bus.m_scl != prev.m_scl)
			m_edges.push_back(m_tickcount);
		if ((prev.m_scl)&&(m_bus.m_scl)&&(prev.m_sda != m_bus.m_sda))
			m_sda_high++;
	}

	// The number of SCL intervals of the given length
	unsigned	intervals(unsigned long len) const {
		unsigned	n = 0;

		for(unsigned k=1; k<m_edges.size(); k++)
			if (m_edges[k] - m_edges[k-1] == len)
				n++;
		return n;
	}
};

void	runrate(unsigned long clock_rate, unsigned long bit_rate, int *fails) {
	// {{{
	TIMINGTB	*tb = new TIMINGTB(clock_rate, bit_rate);
	unsigned long	half, setup;
	unsigned char	buf[2] = { 0x0f, 0xf0 };
	unsigned	nedges;

	half  = tb->m_core->clk().ticks_per_half_bit();
	setup = tb->m_core->clk().setup_tick();

	// Bus priming: nine whole clock pulses
	tb->clear();
	TBCHECK(tb, tb->reset() == 0);
	TBCHECK(tb, tb->m_edges.size() == 18);
	TBCHECK(tb, tb->intervals(half) == 17);
	TBCHECK(tb, tb->m_sda_high == 0);

	//
	// Register write: address, register, two data bytes.  Every half bit
	// is the same length, SDA only moves with SCL high for START and STOP
	//
	tb->clear();
	TBCHECK(tb, tb->write_regs(DEF_SLAVE_ADDR, 0x21, 2, buf) == 0);
	nedges = 1 + 4 * 9 * 2 + 1;
	TBCHECK(tb, tb->m_edges.size() == nedges);
	TBCHECK(tb, tb->intervals(half) == nedges-1);
	TBCHECK(tb, tb->m_sda_high == 2);
	if ((tb->m_mon.size() > 0)&&(tb->m_edges.size() == nedges)) {
		unsigned long	st, sp;

		// START: SDA falls, then SCL follows once the hold time is up
		TBCHECK(tb, tb->m_mon[0].m_type == I2CEV_START);
		st = tb->m_mon[0].m_tick;
		TBCHECK(tb, tb->m_edges[0] > st);
		TBCHECK(tb, tb->m_edges[0] - st == half - setup);
		// STOP: SDA rises a setup time after SCL
		sp = tb->m_mon[tb->m_mon.size()-1].m_tick;
		TBCHECK(tb, tb->m_mon[tb->m_mon.size()-1].m_type == I2CEV_STOP);
		TBCHECK(tb, sp > tb->m_edges[nedges-1]);
		TBCHECK(tb, sp - tb->m_edges[nedges-1] == setup);
	}

	//
	// Register read: the repeated START holds SCL high for one extra
	// half bit, everything else keeps time
	//
	tb->clear();
	TBCHECK(tb, tb->read_regs(DEF_SLAVE_ADDR, 0x21, 2, buf) == 0);
	TBCHECK(tb, buf[0] == 0x0f);
	TBCHECK(tb, buf[1] == 0xf0);
	TBCHECK(tb, tb->intervals(2*half) == 1);
	TBCHECK(tb, tb->intervals(half) == tb->m_edges.size() - 2);
	TBCHECK(tb, tb->m_sda_high == 3);

	// One START for the write, a START and a repeated START for the read
	TBCHECK(tb, tb->m_slave->starts() == 3);
	TBCHECK(tb, tb->m_slave->stops()  == 2);
	TBCHECK(tb, !tb->m_slave->illegal());

	if (tb->m_fails)
		fprintf(stderr, "ERR: %d failures at %lu/%lu\n", tb->m_fails,
			clock_rate, bit_rate);
	*fails += tb->m_fails;
	delete	tb;
	// }}}
}

int	main(int argc, char **argv) {
	I2CTB	*tb = new I2CTB();
	int	r, fails = 0;

	runrate(DEF_CLOCK_RATE, DEF_BIT_RATE, &fails);
	runrate(100000000ul,  100000ul, &fails);
	runrate( 12000000ul, 1000000ul, &fails);
	runrate(  1000000ul,  100000ul, &fails);
	// The slowest clocks allowed: two and three ticks per half bit
	runrate(  4000000ul, 1000000ul, &fails);
	runrate(  5000000ul, 1000000ul, &fails);

	tb->m_fails = fails;
	r = tb->result("TIMING");
	delete	tb;
	return r;
}
