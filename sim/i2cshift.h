////////////////////////////////////////////////////////////////////////////////
//
// Filename:	i2cshift.h
// {{{
// Project:	LLI2C, a low-level, cycle-accurate I2C bus master
//
// Purpose:	An eight bit shift register, plus the acknowledgement slot
//		which follows every byte on the bus.
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
#ifndef	I2CSHIFT_H
#define	I2CSHIFT_H

#define	I2C_ACKSLOT	8

//
// The byte shift register, MSB first.  Positions 0-7 are data bits,
// position 8 (I2C_ACKSLOT) is the acknowledgement slot and is never shifted.
//
class	I2CSHIFT {
	unsigned	m_sreg, m_pos;
public:
	I2CSHIFT(void) : m_sreg(0x0ff), m_pos(0) {}

	void	load(unsigned byte) { m_sreg = byte & 0x0ff; m_pos = 0; }
	// Prepare to receive: all ones, so nothing is ever driven low
	void	clear(void) { load(0x0ff); }

	bool	ackslot(void) const { return m_pos == I2C_ACKSLOT; }
	unsigned	data(void) const { return m_sreg; }

	// The bit to place on the wire next
	int	msb(void) const { return (m_sreg >> 7) & 1; }

	int	tx_shift(void);
	void	rx_shift(int bit);

	// Move on to the next bit cell.  Returns true once the byte's eight
	// data bits are done and the ACK slot is up next
	bool	next(void);
};

#endif
