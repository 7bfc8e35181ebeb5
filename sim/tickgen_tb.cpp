////////////////////////////////////////////////////////////////////////////////
//
// Filename:	tickgen_tb.cpp
// {{{
// Project:	LLI2C, a low-level, cycle-accurate I2C bus master
//
// Purpose:	Checks the tick generator's rounding, limits, and pin timing,
//		the trace time stamps, and that a master with an unusable
//		configuration refuses to run.
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

int	main(int argc, char **argv) {
	I2CTB	*tb = new I2CTB();
	int	r;

	// 100 MHz clock, 100 kHz bus
	{
		TICKGEN	clk(100000000ul, 100000ul);

		TBCHECK(tb, clk.valid());
		TBCHECK(tb, clk.ticks_per_half_bit() == 500);
		TBCHECK(tb, clk.sample_tick() == 499);
		TBCHECK(tb, clk.setup_tick()  == 250);
	}

	// Half bit periods are rounded, not truncated
	{
		TICKGEN	clk(25000000ul, 1000000ul);

		TBCHECK(tb, clk.valid());
		TBCHECK(tb, clk.ticks_per_half_bit() == 13);
		TBCHECK(tb, clk.setup_tick()  == 6);
		TBCHECK(tb, clk.sample_tick() == 12);
	}

	// Four ticks per bit is the minimum
	{
		TICKGEN	ok(4000000ul, 1000000ul),
			bad(3999999ul, 1000000ul),
			zero(1000000ul, 0);

		TBCHECK(tb, ok.valid());
		TBCHECK(tb, ok.ticks_per_half_bit() == 2);
		TBCHECK(tb, !bad.valid());
		TBCHECK(tb, !zero.valid());
	}

	// SCL toggles once every half bit, unless held
	{
		TICKGEN	clk(1000000ul, 100000ul);
		int	toggles = 0, scl = clk.scl();

		TBCHECK(tb, clk.ticks_per_half_bit() == 5);
		for(int k=0; k<50; k++) {
			if (clk.advance())
				toggles++;
		}
		TBCHECK(tb, toggles == 10);
		TBCHECK(tb, clk.scl() == scl);
		TBCHECK(tb, clk.counter() == 0);

		for(int k=0; k<5; k++)
			clk.advance(true);
		TBCHECK(tb, clk.scl() == scl);
		TBCHECK(tb, clk.counter() == 0);
	}

	//
	// Two ticks per half bit.  SETUP and the toggle share a counter value,
	// but the pin only moves on the tick after, when the counter wraps
	//
	{
		TICKGEN	clk(4000000ul, 1000000ul);

		TBCHECK(tb, clk.setup_tick()  == 1);
		TBCHECK(tb, clk.sample_tick() == 1);
		TBCHECK(tb, clk.pin() == 1);

		TBCHECK(tb, !clk.advance());
		TBCHECK(tb, clk.pin() == 1);
		TBCHECK(tb, clk.at_setup());
		// SDA would change here, with the pin still high
		TBCHECK(tb, clk.advance());
		TBCHECK(tb, clk.scl() == 0);
		TBCHECK(tb, clk.pin() == 1);
		TBCHECK(tb, clk.counter() == 0);
		TBCHECK(tb, !clk.advance());
		TBCHECK(tb, clk.pin() == 0);

		// A held clock never reaches the pin
		TBCHECK(tb, !clk.advance(true));
		TBCHECK(tb, !clk.advance());
		TBCHECK(tb, clk.pin() == 0);
		TBCHECK(tb, clk.scl() == 0);

		clk.reset();
		TBCHECK(tb, clk.pin() == 1);
		TBCHECK(tb, clk.scl() == 1);
		TBCHECK(tb, clk.counter() == 0);
	}

	// Trace time stamps follow the clock exactly, not a rounded period
	{
		TBCHECK(tb, VCDTRACE::ns(1, 100000000ul) == 10);
		TBCHECK(tb, VCDTRACE::ns(1, 12000000ul) == 83);
		TBCHECK(tb, VCDTRACE::ns(3, 12000000ul) == 250);
		TBCHECK(tb, VCDTRACE::ns(12000000ul, 12000000ul) == 1000000000ull);
		TBCHECK(tb, VCDTRACE::ns(36000001ul, 12000000ul)
				== 3000000083ull);
	}

	// A master with a bad rate refuses to do anything
	{
		LLI2CM	bad(1000000ul, 400000ul);

		TBCHECK(tb, bad.config_err());
		bad.i_reset = 1;
		bad.tick();
		bad.i_reset = 0;
		bad.i_stb = 1;
		for(int k=0; k<100; k++) {
			bad.tick();
			TBCHECK(tb, bad.o_req_ready == 0);
			TBCHECK(tb, bad.o_scl == 1);
			TBCHECK(tb, bad.o_sda == 1);
		}
		TBCHECK(tb, bad.state() == I2C_IDLE);
	}

	TBCHECK(tb, !tb->m_core->config_err());

	r = tb->result("TICKGEN");
	delete	tb;
	return r;
}
