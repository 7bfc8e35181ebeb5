////////////////////////////////////////////////////////////////////////////////
//
// Filename:	i2cmon.cpp
// {{{
// Project:	LLI2C, a low-level, cycle-accurate I2C bus master
//
// Purpose:	Decodes the resolved SCL and SDA wires into START, STOP, and
//		byte events, and prints them.
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
#include "i2cmon.h"

void	I2CMON::clear(void) {
	m_events.clear();
	m_last_scl = 1;
	m_last_sda = 1;
	m_bits = 0;
	m_sreg = 0;
	m_active = false;
	m_rises = 0;
}

void	I2CMON::push(I2CEVTYPE t, unsigned byte, int ack, unsigned long tick) {
	I2CEVENT	ev;

	ev.m_type = t;
	ev.m_byte = byte;
	ev.m_ack  = ack;
	ev.m_tick = tick;
	m_events.push_back(ev);
}

void	I2CMON::operator()(const I2CBUS b, unsigned long tick) {
	// {{{
	int	scl = b.m_scl, sda = b.m_sda;

	if ((scl)&&(m_last_scl)&&(m_last_sda)&&(!sda)) {
		push(I2CEV_START, 0, 0, tick);
		m_active = true;
		m_bits = 0;
		m_sreg = 0;
	} else if ((scl)&&(m_last_scl)&&(!m_last_sda)&&(sda)) {
		push(I2CEV_STOP, 0, 0, tick);
		m_active = false;
	} else if ((scl)&&(!m_last_scl)) {
		m_rises++;
		if (m_active) {
			if (m_bits < 8) {
				m_sreg = ((m_sreg << 1) | sda) & 0x0ff;
				m_bits++;
			} else {
				push(I2CEV_BYTE, m_sreg, (sda) ? 0:1, tick);
				m_bits = 0;
				m_sreg = 0;
			}
		}
	}

	m_last_scl = scl;
	m_last_sda = sda;
	// }}}
}

unsigned I2CMON::nbytes(void) const {
	unsigned	n = 0;

	for(unsigned k=0; k<m_events.size(); k++)
		if (m_events[k].m_type == I2CEV_BYTE)
			n++;
	return n;
}

void	I2CMON::dump(FILE *fp) const {
	// {{{
	for(unsigned k=0; k<m_events.size(); k++) {
		const I2CEVENT	&ev = m_events[k];

		switch(ev.m_type) {
		case I2CEV_START:
			fprintf(fp, "S ");
			break;
		case I2CEV_STOP:
			fprintf(fp, "P\n");
			break;
		default:
			fprintf(fp, "%02x%c ", ev.m_byte, (ev.m_ack) ? '>':'x');
			break;
		}
	}
	// }}}
}
