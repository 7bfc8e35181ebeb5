////////////////////////////////////////////////////////////////////////////////
//
// Filename:	tickgen.cpp
// {{{
// Project:	LLI2C, a low-level, cycle-accurate I2C bus master
//
// Purpose:	Turns the clock and bit rates into a count of ticks per half
//		bit, and walks SCL through its half bits one tick at a time.
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

#include "tickgen.h"

TICKGEN::TICKGEN(unsigned long clock_rate, unsigned long bit_rate) {
	// {{{
	m_valid = (bit_rate > 0)
		&& ((unsigned long long)clock_rate
				>= 4ull * (unsigned long long)bit_rate);

	if (m_valid) {
		// round(clock_rate / bit_rate / 2)
		unsigned long long	c = clock_rate, b = bit_rate;

		m_half = (unsigned)((c + b) / (2 * b));
	} else {
		fprintf(stderr, "ERR: Clock rate (%lu Hz) must be at least four"
			" times the bit rate (%lu Hz)\n", clock_rate, bit_rate);
		m_half = 2;
	}

	m_setup  = m_half / 2;
	m_sample = m_half - 1;
	reset();
	// }}}
}

bool	TICKGEN::advance(bool hold) {
	// {{{
	m_pin = m_scl;
	if (!at_bound()) {
		m_counter++;
		return false;
	}

	m_counter = 0;
	if (hold)
		return false;
	m_scl ^= 1;
	return true;
	// }}}
}
