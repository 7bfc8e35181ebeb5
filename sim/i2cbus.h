////////////////////////////////////////////////////////////////////////////////
//
// Filename:	i2cbus.h
// {{{
// Project:	LLI2C, a low-level, cycle-accurate I2C bus master
//
// Purpose:	The two wires of an I2C bus, as a wired-AND, together with
//		the open-drain pin model used to drive SDA from the master.
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
#ifndef	I2CBUS_H
#define	I2CBUS_H

//
// Each party on the bus produces an I2CBUS of its own, with a 1 for any
// line it releases.  Adding them together gives the wired-AND of all
// drivers, i.e. what's actually on the wire.
//
class	I2CBUS {
// {{{
public:
	unsigned int	m_scl:1;
	unsigned int	m_sda:1;
	I2CBUS(int scl=1, int sda=1) : m_scl(scl), m_sda(sda) {};
	I2CBUS	operator+(const I2CBUS b) const {
		return I2CBUS(m_scl&b.m_scl, m_sda&b.m_sda); }
	I2CBUS	operator+=(const I2CBUS b) {
		m_scl &= b.m_scl; m_sda &= b.m_sda;
		return *this;
	}
	bool	operator==(const I2CBUS b) const {
		return (m_scl == b.m_scl)&&(m_sda == b.m_sda); }
	bool	operator!=(const I2CBUS b) const { return !(*this == b); }
// }}}
};

typedef	enum { LINE_RELEASE = 0, LINE_LOW } LINEDRIVE;

//
// Open-drain SDA.  We may pull the line low, or let it go.  We never drive
// it high.  In bidirectional (single pin) mode the same pin is both written
// and read back; otherwise the resolved level comes in on a separate input.
//
class	I2CLINE {
	// {{{
	bool		m_bidir;
	LINEDRIVE	m_drive;
	// }}}
public:
	I2CLINE(bool bidir = false) : m_bidir(bidir), m_drive(LINE_RELEASE) {}

	bool	bidir(void) const { return m_bidir; }

	void	release(void)   { m_drive = LINE_RELEASE; }
	void	drive_low(void) { m_drive = LINE_LOW; }
	// Send a data bit: zeros are driven, ones are released
	void	set(int bit) { m_drive = (bit) ? LINE_RELEASE : LINE_LOW; }

	// Our contribution to the wire.  A release reads as a 1 here
	int	out(void) const { return (m_drive == LINE_LOW) ? 0 : 1; }

	// The resolved wire level, taken from whichever pin is in use
	int	in(int i_sda, int io_sda) const {
		return ((m_bidir) ? io_sda : i_sda) ? 1 : 0;
	}
};

#endif
