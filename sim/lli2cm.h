////////////////////////////////////////////////////////////////////////////////
//
// Filename:	lli2cm.h
// {{{
// Project:	LLI2C, a low-level, cycle-accurate I2C bus master
//
// Purpose:	Declares LLI2CM, a cycle-accurate I2C bus master.  Requests
//		come in with a valid/ready handshake, write data arrives one
//		byte at a time, and read data leaves the same way.
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
#ifndef	LLI2CM_H
#define	LLI2CM_H

#include "tickgen.h"
#include "i2cshift.h"
#include "i2cbus.h"

typedef	enum { I2C_IDLE=0, I2C_INIT, I2C_START, I2C_ADDR, I2C_ADDR2,
	I2C_REG, I2C_RESTART, I2C_DATA, I2C_STOP
} LLI2C_STATE;

//
// One bus transaction, as handed to the master.  m_addr is a 7-bit
// address unless m_tenbit is set.  If m_regen is set, m_reg is written to
// the device first, and a read then follows a repeated START.
//
typedef	struct {
	unsigned	m_addr;
	bool		m_tenbit, m_read;
	unsigned	m_reg;
	bool		m_regen;
} I2CREQ;

class	LLI2CM {
public:
	// Inputs, to be set before each call to tick()
	// {{{
	int		i_reset;
	// Transaction request, accepted when o_req_ready is high
	int		i_stb;
	I2CREQ		i_req;
	// Write data
	int		i_wr_stb;
	unsigned	i_wr_data;
	// 1 to ACK a byte we've just read (and read another), 0 to NACK it
	int		i_ack;
	// The resolved SDA wire, in split pin mode
	int		i_sda;
	// }}}

	// Outputs
	// {{{
	int		o_scl, o_sda;	// 0 pulls the line low, 1 releases it
	// Bidirectional SDA pin.  We write our drive here, the bus model
	// overwrites it with the wire level before the next tick
	int		io_sda;
	int		o_req_ready, o_busy;
	int		o_wr_ready;
	int		o_rd_stb;
	unsigned	o_rd_data;
	int		o_ackslot, o_ackstb, o_nacked;
	int		o_done, o_err;
	// }}}
private:
	// {{{
	TICKGEN		m_clk;
	I2CSHIFT	m_sreg;
	I2CLINE		m_line;

	LLI2C_STATE	m_state;
	I2CREQ		m_req;
	unsigned	m_step, m_wr_data;
	bool		m_init_pending, m_restart_pending, m_stop_pending,
			m_read_pending, m_write_pending;
	bool		m_reading, m_restarted, m_nack, m_reject, m_debug;
	// }}}

	void	reset_state(void);
	void	accept(const I2CREQ &req);
	unsigned	addr_byte(bool rd) const;
	void	load_byte(LLI2C_STATE st, unsigned byte);
	void	start_read(void);
	void	byte_done(int sda);
	bool	wr_ready(void) const;

	bool	init_cell(void);
	void	start_cell(void);
	void	byte_cell(int sda);
	bool	restart_cell(void);
	bool	stop_cell(void);
	void	set_outputs(void);
public:
	LLI2CM(unsigned long clock_rate, unsigned long bit_rate,
			bool bidir = false);

	void	tick(void);

	bool	config_err(void) const { return !m_clk.valid(); }
	bool	bidir(void) const { return m_line.bidir(); }
	LLI2C_STATE	state(void) const { return m_state; }
	const TICKGEN	&clk(void) const { return m_clk; }
	void	debug(bool d) { m_debug = d; }

	// False for an address too wide for its mode, or a register
	// outside 0-255.  Such requests are taken, but never reach the bus:
	// o_done and o_err follow on the next tick
	static	bool	valid_request(const I2CREQ &req);
	static	const char *state_name(LLI2C_STATE s);
};

#endif
