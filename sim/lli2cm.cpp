////////////////////////////////////////////////////////////////////////////////
//
// Filename:	lli2cm.cpp
// {{{
// Project:	LLI2C, a low-level, cycle-accurate I2C bus master
//
// Purpose:	The control state machine of the I2C master: bus priming,
//		START, address (7 or 10 bits), register, repeated START,
//		data, and STOP, all on the timing of the tick generator.
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

#include "lli2cm.h"

LLI2CM::LLI2CM(unsigned long clock_rate, unsigned long bit_rate, bool bidir)
		: m_clk(clock_rate, bit_rate), m_line(bidir) {
	// {{{
	i_reset = 0;
	i_stb = 0;
	i_req.m_addr = 0; i_req.m_tenbit = false; i_req.m_read = false;
	i_req.m_reg  = 0; i_req.m_regen  = false;
	i_wr_stb = 0; i_wr_data = 0;
	i_ack = 0;
	i_sda = 1;
	io_sda = 1;

	m_req = i_req;
	m_debug = false;
	m_wr_data = 0;
	o_rd_data = 0;
	o_rd_stb = o_ackstb = o_nacked = o_done = o_err = 0;

	reset_state();
	// Power up idle.  Only an explicit reset primes the bus
	m_init_pending = false;

	if (config_err())
		fprintf(stderr, "ERR: LLI2C master disabled, bad bit rate\n");
	set_outputs();
	// }}}
}

const char *LLI2CM::state_name(LLI2C_STATE s) {
	switch(s) {
	case I2C_IDLE:		return "IDLE";
	case I2C_INIT:		return "INIT";
	case I2C_START:		return "START";
	case I2C_ADDR:		return "ADDR";
	case I2C_ADDR2:		return "ADDR2";
	case I2C_REG:		return "REG";
	case I2C_RESTART:	return "RESTART";
	case I2C_DATA:		return "DATA";
	case I2C_STOP:		return "STOP";
	default:		return "(UNKNOWN)";
	}
}

bool	LLI2CM::valid_request(const I2CREQ &req) {
	if (req.m_addr > ((req.m_tenbit) ? 0x03ffu : 0x07fu))
		return false;
	if ((req.m_regen)&&(req.m_reg > 0x0ffu))
		return false;
	return true;
}

void	LLI2CM::reset_state(void) {
	// {{{
	m_state = I2C_IDLE;
	m_step  = 0;
	m_clk.reset();
	m_sreg.clear();
	m_line.release();

	m_init_pending    = true;
	m_restart_pending = false;
	m_stop_pending    = false;
	m_read_pending    = false;
	m_write_pending   = false;
	m_reading   = false;
	m_restarted = false;
	m_nack      = false;
	m_reject    = false;
	o_err       = 0;
	// }}}
}

void	LLI2CM::accept(const I2CREQ &req) {
	// {{{
	m_req = req;

	m_restart_pending = m_stop_pending = false;
	m_read_pending = m_write_pending = false;
	m_reading   = false;
	m_restarted = false;
	m_nack      = false;
	o_err       = 0;

	m_state = I2C_START;
	m_step  = 0;
	m_clk.restart(1);
	m_line.release();

	if (m_debug)
		printf("LLI2C: START, %s %s 0x%03x%s\n",
			(m_req.m_read) ? "READ":"WRITE",
			(m_req.m_tenbit) ? "10b":"7b", m_req.m_addr,
			(m_req.m_regen) ? ", with register" : "");
	// }}}
}

unsigned LLI2CM::addr_byte(bool rd) const {
	if (m_req.m_tenbit)
		return 0x0f0 | ((m_req.m_addr >> 7) & 0x06) | ((rd) ? 1:0);
	return ((m_req.m_addr & 0x07f) << 1) | ((rd) ? 1:0);
}

void	LLI2CM::load_byte(LLI2C_STATE st, unsigned byte) {
	// {{{
	m_state   = st;
	m_reading = false;
	m_sreg.load(byte);

	if (m_debug)
		printf("LLI2C: %-5s 0x%02x\n", state_name(st), byte & 0x0ff);
	// }}}
}

void	LLI2CM::start_read(void) {
	m_state   = I2C_DATA;
	m_reading = true;
	m_read_pending = false;
	m_sreg.clear();
}

//
// The ACK slot of the current byte has just been sampled.  This both
// closes out this byte and decides what comes next.
//
void	LLI2CM::byte_done(int sda) {
	// {{{
	if (!m_reading) {
		o_ackstb = 1;
		o_nacked = (sda) ? 1:0;
		if (sda) {
			if (m_debug)
				printf("LLI2C: NAK in %s\n", state_name(m_state));
			m_nack = true;
			m_restart_pending = false;
			m_read_pending    = false;
			m_write_pending   = false;
			m_stop_pending    = true;
		}
	}

	if (m_stop_pending) {
		m_stop_pending = false;
		m_state = I2C_STOP;
		m_step  = 0;
	} else if ((m_state == I2C_ADDR)&&(m_req.m_tenbit)&&(!m_restarted)) {
		load_byte(I2C_ADDR2, m_req.m_addr & 0x0ff);
		if ((m_req.m_read)&&(!m_req.m_regen))
			m_restart_pending = true;
	} else if ((m_state == I2C_ADDR || m_state == I2C_ADDR2)
			&&(m_req.m_regen)&&(!m_restarted)) {
		load_byte(I2C_REG, m_req.m_reg);
		if (m_req.m_read)
			m_restart_pending = true;
	} else if (m_restart_pending) {
		m_restart_pending = false;
		m_state = I2C_RESTART;
		m_step  = 0;
	} else if (m_read_pending) {
		start_read();
	} else if (m_write_pending) {
		m_write_pending = false;
		load_byte(I2C_DATA, m_wr_data);
	} else {
		// Nothing more to send
		m_state = I2C_STOP;
		m_step  = 0;
	}
	// }}}
}

//
// We'll take write data during the ACK slot of any byte that may be
// followed by a write data byte.
//
bool	LLI2CM::wr_ready(void) const {
	// {{{
	if ((m_reading)||(!m_sreg.ackslot()))
		return false;

	switch(m_state) {
	case I2C_ADDR:
		if ((m_restarted)||(m_req.m_tenbit)||(m_req.m_regen))
			return false;
		break;
	case I2C_ADDR2:
		if (m_req.m_regen)
			return false;
		break;
	case I2C_REG:
	case I2C_DATA:
		break;
	default:
		return false;
	}

	return (!m_read_pending)&&(!m_restart_pending)
			&&(!m_stop_pending)&&(!m_write_pending);
	// }}}
}

// Returns true to hold SCL high
bool	LLI2CM::init_cell(void) {
	// {{{
	if ((m_clk.scl())&&(m_clk.at_sample())) {
		if (m_sreg.ackslot()) {
			if (m_debug)
				printf("LLI2C: INIT complete\n");
			m_state = I2C_IDLE;
			return true;
		} m_sreg.next();
	} return false;
	// }}}
}

void	LLI2CM::start_cell(void) {
	// {{{
	// SCL is high throughout
	if (m_clk.at_setup())
		m_line.drive_low();
	if (m_clk.at_bound()) {
		bool	rd = (m_req.m_read)&&(!m_req.m_regen)&&(!m_req.m_tenbit);

		load_byte(I2C_ADDR, addr_byte(rd));
		m_read_pending = rd;
	}
	// }}}
}

void	LLI2CM::byte_cell(int sda) {
	// {{{
	if ((!m_clk.scl())&&(m_clk.at_setup())) {
		if (!m_sreg.ackslot()) {
			if (m_reading)
				m_line.release();
			else
				m_line.set(m_sreg.tx_shift());
		} else if (m_reading) {
			// Our own ACK, or NAK, as the caller wishes
			if (i_ack) {
				m_line.drive_low();
				m_read_pending = true;
			} else {
				m_line.release();
				m_stop_pending = true;
			}
		} else
			m_line.release();
	}

	if ((m_clk.scl())&&(m_clk.at_sample())) {
		if (!m_sreg.ackslot()) {
			if (m_reading)
				m_sreg.rx_shift(sda);
			if ((m_sreg.next())&&(m_reading)) {
				o_rd_stb  = 1;
				o_rd_data = m_sreg.data();
				if (m_debug)
					printf("LLI2C: READ  0x%02x\n", o_rd_data);
			}
		} else
			byte_done(sda);
	}
	// }}}
}

bool	LLI2CM::restart_cell(void) {
	// {{{
	bool	hold = false;

	switch(m_step) {
	case 0:	// SCL low, let SDA rise
		if (m_clk.at_setup())
			m_line.release();
		if (m_clk.at_bound())
			m_step = 1;
		break;
	case 1:	// SCL and SDA both high.  Hold the clock for a second half bit
		if (m_clk.at_bound()) {
			m_step = 2;
			hold = true;
		} break;
	default:
		if (m_clk.at_setup())
			m_line.drive_low();
		if (m_clk.at_bound()) {
			m_restarted = true;
			load_byte(I2C_ADDR, addr_byte(true));
			m_read_pending = true;
		} break;
	}

	return hold;
	// }}}
}

bool	LLI2CM::stop_cell(void) {
	// {{{
	if (m_step == 0) {
		// SCL low, pull SDA down so we can release it once SCL is up
		if (m_clk.at_setup())
			m_line.drive_low();
		if (m_clk.at_bound())
			m_step = 1;
		return false;
	}

	if (m_clk.at_setup())
		m_line.release();
	if (m_clk.at_bound()) {
		m_state = I2C_IDLE;
		m_restart_pending = m_stop_pending = false;
		m_read_pending = m_write_pending = false;
		o_done = 1;
		o_err  = (m_nack) ? 1:0;
		if (m_debug)
			printf("LLI2C: STOP%s\n", (m_nack) ? " (NAK)" : "");
		return true;
	} return false;
	// }}}
}

void	LLI2CM::set_outputs(void) {
	// {{{
	o_scl = m_clk.pin();
	o_sda = m_line.out();
	if (m_line.bidir())
		io_sda = m_line.out();

	o_busy = ((m_state != I2C_IDLE)||(m_init_pending)
			||(m_reject)) ? 1:0;
	o_req_ready = ((!config_err())&&(!i_reset)&&(!o_busy)) ? 1:0;
	o_wr_ready  = (wr_ready()) ? 1:0;

	switch(m_state) {
	case I2C_ADDR: case I2C_ADDR2: case I2C_REG: case I2C_DATA:
		o_ackslot = (m_sreg.ackslot()) ? 1:0;
		break;
	default:
		o_ackslot = 0;
	}
	// }}}
}

void	LLI2CM::tick(void) {
	// {{{
	int	sda = m_line.in(i_sda, io_sda);
	bool	hold = false;

	o_rd_stb = 0;
	o_ackstb = 0;
	o_done   = 0;

	if (config_err()) {
		set_outputs();
		return;
	}

	if (i_reset) {
		reset_state();
		set_outputs();
		return;
	}

	if ((i_wr_stb)&&(wr_ready())) {
		m_wr_data = i_wr_data & 0x0ff;
		m_write_pending = true;
	}

	switch(m_state) {
	case I2C_IDLE:
		if (m_init_pending) {
			m_init_pending = false;
			m_state = I2C_INIT;
			m_clk.restart(0);
			m_sreg.clear();
			m_line.release();
			if (m_debug)
				printf("LLI2C: INIT\n");
		} else if (m_reject) {
			m_reject = false;
			o_done = 1;
			o_err  = 1;
		} else if ((i_stb)&&(!valid_request(i_req))) {
			fprintf(stderr, "ERR: Refusing I2C request, %s address "
				"0x%x, register 0x%x\n",
				(i_req.m_tenbit) ? "10-bit" : "7-bit",
				i_req.m_addr, i_req.m_reg);
			m_reject = true;
			o_err = 0;
		} else if (i_stb)
			accept(i_req);
		// The clock starts with the next tick
		set_outputs();
		return;
	case I2C_INIT:		hold = init_cell();	break;
	case I2C_START:		start_cell();		break;
	case I2C_RESTART:	hold = restart_cell();	break;
	case I2C_STOP:		hold = stop_cell();	break;
	default:
		byte_cell(sda);
		break;
	}

	m_clk.advance(hold);
	set_outputs();
	// }}}
}
