////////////////////////////////////////////////////////////////////////////////
//
// Filename:	i2cmon.h
// {{{
// Project:	LLI2C, a low-level, cycle-accurate I2C bus master
//
// Purpose:	A passive I2C bus monitor.  It never drives the bus, but
//		records every START, STOP, and byte that crosses it.
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
#ifndef	I2CMON_H
#define	I2CMON_H

#include <stdio.h>
#include <vector>

#include "i2cbus.h"

typedef	enum { I2CEV_START=0, I2CEV_STOP, I2CEV_BYTE } I2CEVTYPE;

typedef	struct {
	I2CEVTYPE	m_type;
	unsigned	m_byte;
	int		m_ack;
	unsigned long	m_tick;
} I2CEVENT;

//
// A passive bus monitor.  Watches the resolved wires, and logs every
// START, STOP, and byte (with its acknowledgement) that goes by.
//
class	I2CMON {
	std::vector<I2CEVENT>	m_events;
	int		m_last_scl, m_last_sda, m_bits;
	unsigned	m_sreg;
	bool		m_active;
	unsigned long	m_rises;

	void	push(I2CEVTYPE t, unsigned byte, int ack, unsigned long tick);
public:
	I2CMON(void) { clear(); }

	void	operator()(const I2CBUS b, unsigned long tick);

	void	clear(void);
	size_t	size(void) const { return m_events.size(); }
	const I2CEVENT	&operator[](const int k) const { return m_events[k]; }

	// Number of SCL rising edges seen since the last clear()
	unsigned long	rises(void) const { return m_rises; }
	// Number of bytes between START/STOP framing
	unsigned	nbytes(void) const;

	void	dump(FILE *fp) const;
};

#endif
