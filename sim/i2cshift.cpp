////////////////////////////////////////////////////////////////////////////////
//
// Filename:	i2cshift.cpp
// {{{
// Project:	LLI2C, a low-level, cycle-accurate I2C bus master
//
// Purpose:	Shifts bytes out MSB first, and in MSB first, one bit cell
//		at a time.
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
#include "i2cshift.h"

int	I2CSHIFT::tx_shift(void) {
	int	bit = msb();

	if (m_pos < I2C_ACKSLOT)
		m_sreg = ((m_sreg << 1) | 1) & 0x0ff;
	return bit;
}

void	I2CSHIFT::rx_shift(int bit) {
	if (m_pos < I2C_ACKSLOT)
		m_sreg = ((m_sreg << 1) | ((bit) ? 1:0)) & 0x0ff;
}

bool	I2CSHIFT::next(void) {
	if (m_pos < I2C_ACKSLOT)
		m_pos++;
	return (m_pos == I2C_ACKSLOT);
}
