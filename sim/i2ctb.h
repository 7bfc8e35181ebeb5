////////////////////////////////////////////////////////////////////////////////
//
// Filename:	i2ctb.h
// {{{
// Project:	LLI2C, a low-level, cycle-accurate I2C bus master
//
// Purpose:	Connects the master, a simulated slave, and a bus monitor
//		together, and provides transaction helpers for the test
//		benches and tools.
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
#ifndef	I2CTB_H
#define	I2CTB_H

#include <stdio.h>
#include <stdlib.h>

#include "i2cconfig.h"
#include "lli2cm.h"
#include "i2csim.h"
#include "i2cmon.h"
#include "vcdtrace.h"

#define	TBCHECK(TB, A)	(TB)->check((A), #A, __FILE__, __LINE__)

//
// The master, a slave, and a monitor, all on one bus.  Each tick() is one
// system clock.
//
class	I2CTB {
public:
	LLI2CM		*m_core;
	I2CSIMSLAVE	*m_slave;
	I2CMON		m_mon;
	VCDTRACE	m_trace;
	I2CBUS		m_bus;
	unsigned long	m_tickcount, m_clock_rate;
	int		m_fails, m_nread, m_nwritten;

	I2CTB(unsigned long clock_rate = DEF_CLOCK_RATE,
			unsigned long bit_rate = DEF_BIT_RATE,
			int slave_addr = DEF_SLAVE_ADDR,
			bool tenbit = false, bool bidir = false) {
		// {{{
		m_core  = new LLI2CM(clock_rate, bit_rate, bidir);
		m_slave = new I2CSIMSLAVE(slave_addr, DEF_SLAVE_MEMBITS, tenbit);
		m_tickcount  = 0;
		m_clock_rate = clock_rate;
		m_fails = 0;
		m_nread = m_nwritten = 0;
		// }}}
	}

	virtual	~I2CTB(void) {
		closetrace();
		delete	m_core;
		delete	m_slave;
	}

	virtual	void	opentrace(const char *vcdname) {
		m_trace.open(vcdname, m_clock_rate);
	}

	virtual	void	closetrace(void) {
		m_trace.close();
	}

	virtual	void	tick(void) {
		// {{{
		int	sda;

		m_tickcount++;

		if (m_core->bidir())
			m_core->io_sda = m_bus.m_sda;
		else
			m_core->i_sda = m_bus.m_sda;

		m_core->tick();

		sda = (m_core->bidir()) ? m_core->io_sda : m_core->o_sda;
		m_bus = (*m_slave)(m_core->o_scl, sda);
		if (m_core->bidir())
			m_core->io_sda = m_bus.m_sda;

		m_mon(m_bus, m_tickcount);
		m_trace.sample(m_tickcount, m_bus, m_core->state());
		// }}}
	}

	unsigned long	bit_ticks(void) const {
		return 2ul * m_core->clk().ticks_per_half_bit();
	}

	int	wait_idle(unsigned long maxticks) {
		// {{{
		for(unsigned long k=0; k<maxticks; k++) {
			if (!m_core->o_busy)
				return 0;
			tick();
		}

		if (!m_core->o_busy)
			return 0;
		fprintf(stderr, "ERR: Master still busy after %lu ticks\n",
			maxticks);
		return -1;
		// }}}
	}

	// Reset the master, and let the bus priming sequence run out
	virtual	int	reset(void) {
		// {{{
		m_core->i_reset = 1;
		tick();
		m_core->i_reset = 0;
		tick();

		return wait_idle(16 * bit_ticks());
		// }}}
	}

	// Wait for the master to accept a request.  Returns 0 once accepted
	int	request(const I2CREQ &req) {
		// {{{
		unsigned long	maxticks = 16 * bit_ticks();

		if (m_core->config_err()) {
			fprintf(stderr, "ERR: Master is not configured\n");
			return -1;
		}

		m_core->i_req = req;
		m_core->i_stb = 1;
		for(unsigned long k=0; k<maxticks; k++) {
			bool	ready = (m_core->o_req_ready != 0);

			tick();
			if (ready) {
				m_core->i_stb = 0;
				return 0;
			}
		}

		m_core->i_stb = 0;
		fprintf(stderr, "ERR: Request not accepted\n");
		return -1;
		// }}}
	}

	//
	// Run one full transaction.  Writes send len bytes from buf, reads
	// place len bytes into it (ACKing all but the last).  Returns 0 on
	// success, 1 if the slave NAK'd or the master refused the request,
	// or -1 on any timeout.
	//
	int	xfer(const I2CREQ &req, int len, unsigned char *buf) {
		// {{{
		unsigned long	maxticks;

		maxticks = (len + 5) * DEF_TIMEOUT_BITS * bit_ticks();
		m_nread = m_nwritten = 0;

		if (request(req) != 0)
			return -1;

		for(unsigned long k=0; k<maxticks; k++) {
			bool	ready = (m_core->o_wr_ready != 0);

			m_core->i_wr_stb = (!req.m_read)&&(m_nwritten < len);
			m_core->i_wr_data = (m_nwritten < len)
						? buf[m_nwritten] : 0;
			m_core->i_ack = (m_nread < len);

			tick();

			if ((ready)&&(m_core->i_wr_stb))
				m_nwritten++;
			if (m_core->o_rd_stb) {
				if (m_nread < len)
					buf[m_nread] = m_core->o_rd_data;
				m_nread++;
			}

			if (m_core->o_done) {
				m_core->i_wr_stb = 0;
				m_core->i_ack = 0;
				return (m_core->o_err) ? 1 : 0;
			}
		}

		m_core->i_wr_stb = 0;
		fprintf(stderr, "ERR: Transaction timed out\n");
		return -1;
		// }}}
	}

	int	write_regs(unsigned addr, unsigned reg, int len,
			const unsigned char *data, bool tenbit = false) {
		// {{{
		I2CREQ		req;
		unsigned char	*buf = new unsigned char[len+1];
		int		r;

		req.m_addr = addr; req.m_tenbit = tenbit; req.m_read = false;
		req.m_reg  = reg;  req.m_regen  = true;
		for(int k=0; k<len; k++)
			buf[k] = data[k];

		r = xfer(req, len, buf);
		delete[] buf;
		return r;
		// }}}
	}

	int	read_regs(unsigned addr, unsigned reg, int len,
			unsigned char *data, bool tenbit = false) {
		I2CREQ	req;

		req.m_addr = addr; req.m_tenbit = tenbit; req.m_read = true;
		req.m_reg  = reg;  req.m_regen  = true;
		return xfer(req, len, data);
	}

	// An address only write.  Returns 0 if someone answers
	int	probe(unsigned addr, bool tenbit = false) {
		I2CREQ	req;

		req.m_addr = addr; req.m_tenbit = tenbit; req.m_read = false;
		req.m_reg  = 0;    req.m_regen  = false;
		return xfer(req, 0, NULL);
	}

	void	check(bool ok, const char *what, const char *fname, int line) {
		if (!ok) {
			fprintf(stderr, "FAIL: %s:%d: %s\n", fname, line, what);
			m_fails++;
		}
	}

	int	result(const char *name) const {
		if (m_fails) {
			printf("%s: %d FAILURE(S)\n", name, m_fails);
			return EXIT_FAILURE;
		}
		printf("%s: PASS\n", name);
		return EXIT_SUCCESS;
	}
};

#endif
