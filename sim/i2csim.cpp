////////////////////////////////////////////////////////////////////////////////
//
// Filename:	i2csim.cpp
// {{{
// Project:	LLI2C, a low-level, cycle-accurate I2C bus master
//
// Purpose:	Follows the bus, one tick at a time, as an I2C slave would.
//		Answers its own address (7 or 10 bits), keeps a register
//		pointer, and flags any protocol violation it sees.
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
#include "i2csim.h"

I2CSIMSLAVE::I2CSIMSLAVE(const int ADDRESS, const int nbits,
		const bool tenbit) {
	// {{{
	m_memsz = (1<<nbits);
	m_adrmsk = m_memsz-1;
	m_data = new char[m_memsz];
	memset(m_data, 0, m_memsz);

	m_tenbit  = tenbit;
	m_devaddr = ADDRESS & ((tenbit) ? 0x03ff : 0x07f);
	m_daddr   = 0;

	m_last_sda = 1;
	m_last_scl = 1;
	m_drive    = 1;
	m_sreg = m_bits = 0;
	m_ack  = 1;
	m_nwritten = 0;
	m_nack_after = -1;
	m_selected = false;
	m_acking = false;
	m_mack = false;
	m_illegal = false;
	m_debug = false;
	m_tick = m_starts = m_stops = 0;

	m_state = I2CIDLE;
	m_next  = I2CIDLE;
	// }}}
}

void	I2CSIMSLAVE::illegal(const char *why) {
	// {{{
	if (!m_illegal) {
		fprintf(stderr, "I2C: Illegal state!!  %s, tick %lu\n",
			why, m_tick);
		m_illegal = true;
	} m_state = I2CILLEGAL;
	m_drive = 1;
	// }}}
}

//
// A full device address byte has arrived.  Is it for us?
//
void	I2CSIMSLAVE::devaddr(void) {
	// {{{
	if (m_tenbit) {
		if (((m_sreg & 0x0f8) != 0x0f0)
				||(((m_sreg>>1)&3) != ((m_devaddr>>8)&3))) {
			m_state = I2CLOSTBUS;
		} else if (m_sreg & 1) {
			// A 10-bit read is only valid following a
			// (repeated) START, once the full address has been
			// given
			if (m_selected)
				ack(I2CDEVACK, I2CSTX);
			else
				m_state = I2CLOSTBUS;
		} else
			ack(I2CDEVACK, I2CDEVADDR2);
	} else if ((m_sreg >> 1) == m_devaddr) {
		ack(I2CDEVACK, (m_sreg & 1) ? I2CSTX : I2CADDR);
	} else
		m_state = I2CLOSTBUS;

	if ((m_debug)&&(m_state == I2CLOSTBUS))
		printf("I2C: Device byte %02x, not for us\n", m_sreg);
	// }}}
}

I2CBUS	I2CSIMSLAVE::operator()(int scl, int sda) {
	// {{{
	int	wire;
	bool	rising, falling;

	scl = (scl) ? 1:0;
	sda = (sda) ? 1:0;
	wire = sda & m_drive;
	rising  = (scl)&&(!m_last_scl);
	falling = (!scl)&&(m_last_scl);

	m_tick++;
	if ((scl)&&(m_last_scl)&&(m_last_sda)&&(!wire)) {
		// Start bit, or repeated start: SDA falls while SCL is high
		// {{{
		if (m_debug)
			printf("I2C: START\n");
		m_starts++;
		m_state = I2CDEVADDR;
		m_sreg  = 0;
		m_bits  = 0;
		m_drive = 1;
		m_acking = false;
		m_nwritten = 0;
		// }}}
	} else if ((scl)&&(m_last_scl)&&(!m_last_sda)&&(wire)) {
		// Stop bit: SDA rises while SCL is high
		// {{{
		if (m_debug)
			printf("I2C: STOP\n");
		m_stops++;
		m_state = I2CIDLE;
		m_selected = false;
		m_drive = 1;
		// }}}
	} else switch(m_state) {
	case I2CIDLE:
		m_drive = 1;
		break;
	case I2CDEVADDR:
		// {{{
		if ((rising)&&(shift_in(wire)))
			devaddr();
		break;
		// }}}
	case I2CDEVADDR2:
		// {{{
		if ((rising)&&(shift_in(wire))) {
			if (m_sreg == (m_devaddr & 0x0ff)) {
				m_selected = true;
				ack(I2CDEVACK, I2CADDR);
			} else
				m_state = I2CLOSTBUS;
		} break;
		// }}}
	case I2CDEVACK:
	case I2CSACK:
		// {{{
		// Wait for the negative edge of the last bit, then drive our
		// ACK until the next negative edge
		if ((rising)&&(m_acking)&&(m_drive)&&(!sda))
			// The master may not pull the line low during our
			// acknowledgement
			illegal("Master drove SDA during the slave's ACK");
		else if (falling) {
			if (!m_acking) {
				m_drive = m_ack;
				m_acking = true;
			} else {
				m_drive = 1;
				m_acking = false;
				m_sreg = 0;
				m_bits = 0;
				if (m_ack)
					m_state = I2CLOSTBUS;
				else {
					m_state = m_next;
					if (m_state == I2CSTX)
						txbyte();
				}
			}
		} break;
		// }}}
	case	I2CADDR:
		// {{{
		if ((rising)&&(shift_in(wire))) {
			m_daddr = m_sreg & m_adrmsk;
			ack(I2CSACK, I2CSRX);
		} break;
		// }}}
	case	I2CSRX:	// Master is writing to us, we are receiving
		// {{{
		if ((rising)&&(shift_in(wire))) {
			m_nwritten++;
			if ((m_nack_after >= 0)&&(m_nwritten > m_nack_after))
				ack(I2CSACK, I2CSRX, 1);
			else {
				write(m_sreg);
				ack(I2CSACK, I2CSRX);
			}
		} break;
		// }}}
	case	I2CSTX: // Master is reading from us, we are transmitting
		// {{{
		if ((rising)&&(m_drive)&&(!sda))
			illegal("Master drove SDA while the slave was sending");
		else if (falling) {
			if (m_bits < 8) {
				m_drive = (m_sreg >> (7-m_bits))&1;
				m_bits++;
			} else {
				// Give the master a chance to ACK
				m_drive = 1;
				m_state = I2CMACK;
			}
		} break;
		// }}}
	case	I2CMACK:
		// {{{
		// The master can NAK, and ... that's the end.  We then wait
		// for the STOP
		if (rising)
			m_mack = (!wire);
		else if (falling) {
			if (m_mack) {
				m_state = I2CSTX;
				txbyte();
			} else
				m_state = I2CLOSTBUS;
		} break;
		// }}}
	case	I2CLOSTBUS:
		// {{{
		// Someone else is being addressed, or we've been told to go
		// away.  Ignore everything until the next START or STOP
		m_drive = 1;
		break;
		// }}}
	case	I2CILLEGAL:	// fall through
	default:
		m_drive = 1;
		break;
	}

	m_last_scl = scl;
	m_last_sda = sda & m_drive;

	return I2CBUS(scl, sda & m_drive);
	// }}}
}
