////////////////////////////////////////////////////////////////////////////////
//
// Filename:	tickgen.h
// {{{
// Project:	LLI2C, a low-level, cycle-accurate I2C bus master
//
// Purpose:	Declares the bit timing generator.  Given the system clock
//		and bus bit rates, it counts ticks within each SCL half bit,
//		and says when SDA may change and when it should be sampled.
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
#ifndef	TICKGEN_H
#define	TICKGEN_H

//
// Half-bit timing for the bus master.  One call to advance() per input
// clock.  The counter runs 0 ... m_half-1, and the level of SCL changes
// once the counter reaches m_half-1, unless the caller asks for the clock
// to be held.  The pin follows one tick later, on the tick where the
// counter wraps to zero.  SETUP (m_half/2) is then never on an edge, even
// with only two ticks per half bit.
//
class	TICKGEN {
	unsigned	m_half, m_setup, m_sample, m_counter;
	int		m_scl, m_pin;
	bool		m_valid;
public:
	TICKGEN(unsigned long clock_rate, unsigned long bit_rate);

	// False if the clock to bit rate ratio is less than four
	bool	valid(void) const { return m_valid; }

	unsigned ticks_per_half_bit(void) const { return m_half; }
	unsigned setup_tick(void)  const { return m_setup; }
	unsigned sample_tick(void) const { return m_sample; }

	// Restart a half-bit period with SCL at the given level.  The pin
	// takes the new level on the next call to advance()
	void	restart(int scl) { m_counter = 0; m_scl = (scl) ? 1:0; }
	// Back to idle: counter cleared, SCL released, pin included
	void	reset(void) { m_counter = 0; m_scl = m_pin = 1; }

	// The level of the current half bit
	int	scl(void) const { return m_scl; }
	// The level on the SCL wire
	int	pin(void) const { return m_pin; }
	unsigned counter(void) const { return m_counter; }

	bool	at_setup(void)  const { return m_counter == m_setup; }
	bool	at_sample(void) const { return m_counter == m_sample; }
	bool	at_bound(void)  const { return m_counter+1 >= m_half; }

	// Returns true if SCL toggled on this tick.  The pin shows it on the
	// tick following
	bool	advance(bool hold = false);
};

#endif
