////////////////////////////////////////////////////////////////////////////////
//
// Filename:	i2csim.h
// {{{
// Project:	LLI2C, a low-level, cycle-accurate I2C bus master
//
// Purpose:	Declares a simulated I2C slave: a small register file, with
//		a register pointer, that can be read and written over the bus.
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
#ifndef	I2CSIM_H
#define	I2CSIM_H

#include <stdio.h>
#include <string.h>

#include "i2cbus.h"

typedef	enum { I2CIDLE=0, I2CDEVADDR, I2CDEVADDR2, I2CDEVACK,
	I2CADDR, I2CSACK, I2CSRX, I2CSTX, I2CMACK, I2CLOSTBUS, I2CILLEGAL
} I2CSTATE;

//
// A register file slave device, sitting on the bus.  The first byte
// written after the device address sets the register pointer, further
// writes (or reads) walk through memory from there.  The slave never
// stretches the clock.
//
class	I2CSIMSLAVE {
	// {{{
	char	*m_data;
	int	m_devaddr, m_daddr, m_sreg, m_bits, m_ack, m_drive,
		m_last_sda, m_last_scl, m_memsz, m_adrmsk,
		m_nwritten, m_nack_after;
	bool	m_tenbit, m_selected, m_acking, m_mack, m_illegal, m_debug;
	unsigned long	m_tick, m_starts, m_stops;

	I2CSTATE	m_state, m_next;
	// }}}

	char	read(void) {
		// {{{
		char	vl = m_data[m_daddr];
		m_daddr = (m_daddr+1)&m_adrmsk;
		return vl;
	} // }}}
	void	write(char data) {
		// {{{
		m_data[m_daddr] = data;
		m_daddr = (m_daddr+1)&m_adrmsk;
	} // }}}

	bool	shift_in(int sda) {
		m_sreg = ((m_sreg<<1) | (sda&1)) & 0x0ff;
		return (++m_bits >= 8);
	}

	void	ack(I2CSTATE st, I2CSTATE next, int nak = 0) {
		m_state = st;
		m_next  = next;
		m_ack   = nak;
		m_acking = false;
	}

	void	txbyte(void) {
		m_sreg  = read() & 0x0ff;
		m_drive = (m_sreg >> 7)&1;
		m_bits  = 1;
	}

	void	devaddr(void);
	void	illegal(const char *why);
public:
	I2CSIMSLAVE(const int ADDRESS = 0x050, const int nbits = 7,
			const bool tenbit = false);
	~I2CSIMSLAVE(void) { delete[] m_data; }

	I2CBUS	operator()(int scl, int sda);
	I2CBUS	operator()(const I2CBUS b) { return (*this)(b.m_scl, b.m_sda); }
	char	&operator[](const int a) {
		return m_data[a&m_adrmsk]; }

	unsigned vstate(void) const {
		return m_state;
	}

	// Accept n data bytes per transaction, then NAK any others.  -1
	// (the default) accepts everything
	void	nack_after(int n) { m_nack_after = n; }

	bool	illegal(void) const { return m_illegal; }
	unsigned long	starts(void) const { return m_starts; }
	unsigned long	stops(void) const { return m_stops; }
	void	debug(bool d) { m_debug = d; }
};

#endif
