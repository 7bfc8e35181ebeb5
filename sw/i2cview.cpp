////////////////////////////////////////////////////////////////////////////////
//
// Filename:	i2cview.cpp
// {{{
// Project:	LLI2C, a low-level, cycle-accurate I2C bus master
//
// Purpose:	Runs a single register transaction, and then draws the SCL
//		and SDA waveforms, together with the decoded bus events.
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
#include <stdlib.h>
#include <ctype.h>
#include <string.h>
#include <vector>

#include <gtkmm.h>

#include "i2cconfig.h"
#include "i2ctb.h"

void	usage(void) {
	fprintf(stderr, "USAGE: i2cview [-dhrt] [-a addr] [-b rate] [-c rate] reg\n");
	fprintf(stderr,
"\t-a addr\tDevice address\n"
"\t-b rate\tBus bit rate, in Hz\n"
"\t-c rate\tSystem clock rate, in Hz\n"
"\t-d\tSets the debugging flag, and writes a trace to " DEF_TRACE_FILE "\n"
"\t-r\tRead two bytes from reg, rather than writing them\n"
"\t-t\tUse 10-bit addressing\n"
);
}

//
// Keeps a copy of every bus state, so the transaction can be drawn once
// it is complete
//
class	RECORDTB : public I2CTB {
public:
	std::vector<unsigned char>	m_scl, m_sda;

	RECORDTB(unsigned long clock_rate, unsigned long bit_rate,
			int addr, bool tenbit)
		: I2CTB(clock_rate, bit_rate, addr, tenbit) {}

	virtual	void	tick(void) {
		I2CTB::tick();
		m_scl.push_back(m_bus.m_scl);
		m_sda.push_back(m_bus.m_sda);
	}

	void	clear(void) {
		m_scl.clear();
		m_sda.clear();
		m_mon.clear();
	}
};

class	WAVEAREA : public Gtk::DrawingArea {
	RECORDTB	*m_tb;
	unsigned long	m_first;
public:
	WAVEAREA(RECORDTB *tb, unsigned long first)
			: m_tb(tb), m_first(first) {
		set_size_request(1024, 240);
	}

	// Draw one wire, high or low, across the full width
	void	trace(const Cairo::RefPtr<Cairo::Context> &cr,
			const std::vector<unsigned char> &v,
			double top, double height, double xscale) {
		// {{{
		if (v.size() == 0)
			return;

		cr->move_to(0, (v[0]) ? top : top+height);
		for(unsigned k=1; k<v.size(); k++) {
			if (v[k] != v[k-1]) {
				cr->line_to(k*xscale, (v[k-1]) ? top : top+height);
				cr->line_to(k*xscale, (v[k]) ? top : top+height);
			}
		}
		cr->line_to(v.size()*xscale, (v[v.size()-1]) ? top : top+height);
		cr->stroke();
		// }}}
	}

	virtual	bool	on_draw(const Cairo::RefPtr<Cairo::Context> &cr) {
		// {{{
		Gtk::Allocation	alloc = get_allocation();
		const double	width = alloc.get_width(),
				height = alloc.get_height(),
				lane = height / 4.;
		double		xscale;
		char		label[16];

		cr->set_source_rgb(1.0, 1.0, 1.0);
		cr->paint();

		if (m_tb->m_scl.size() == 0)
			return true;
		xscale = width / (double)m_tb->m_scl.size();

		cr->set_line_width(1.5);
		cr->set_source_rgb(0.0, 0.0, 0.8);
		trace(cr, m_tb->m_scl, 0.5*lane, lane, xscale);
		cr->set_source_rgb(0.0, 0.5, 0.0);
		trace(cr, m_tb->m_sda, 2.0*lane, lane, xscale);

		// Events, as the monitor saw them
		cr->set_source_rgb(0.6, 0.0, 0.0);
		cr->set_font_size(11.0);
		for(unsigned k=0; k<m_tb->m_mon.size(); k++) {
			const I2CEVENT	&ev = m_tb->m_mon[k];
			double		x = (ev.m_tick - m_first) * xscale;

			switch(ev.m_type) {
			case I2CEV_START: strcpy(label, "S"); break;
			case I2CEV_STOP:  strcpy(label, "P"); break;
			default:
				sprintf(label, "%02x%c", ev.m_byte & 0x0ff,
					(ev.m_ack) ? 'A' : 'N');
			}

			cr->move_to(x, 3.5*lane);
			cr->show_text(label);
		}

		return true;
		// }}}
	}
};

int	main(int argc, char **argv) {
	Gtk::Main	main_instance(argc, argv);
	unsigned long	clock_rate = DEF_CLOCK_RATE, bit_rate = DEF_BIT_RATE,
			first;
	unsigned	addr = DEF_SLAVE_ADDR, reg = 0;
	bool		debug_flag = false, rd = false, tenbit = false,
			have_reg = false;
	unsigned char	buf[2] = { 0xa5, 0x3c };
	int		r;

	// Argument processing
	// {{{
	for(int argn=1; argn < argc; argn++) {
		if (argv[argn][0] == '-') for(int j=1;
					(j<512)&&(argv[argn][j]);j++) {
			switch(tolower(argv[argn][j])) {
			case 'a': if (argn+1 >= argc) { usage(); exit(EXIT_FAILURE); }
				addr = strtoul(argv[++argn], NULL, 0); j=1000; break;
			case 'b': if (argn+1 >= argc) { usage(); exit(EXIT_FAILURE); }
				bit_rate = strtoul(argv[++argn], NULL, 0); j=1000; break;
			case 'c': if (argn+1 >= argc) { usage(); exit(EXIT_FAILURE); }
				clock_rate = strtoul(argv[++argn], NULL, 0); j=1000; break;
			case 'd': debug_flag = true; break;
			case 'r': rd = true; break;
			case 't': tenbit = true; break;
			case 'h': usage(); exit(EXIT_SUCCESS); break;
			default:
				fprintf(stderr, "ERR: Unexpected flag, -%c\n\n",
					argv[argn][j]);
				usage();
				exit(EXIT_FAILURE);
			}
		} else if (!have_reg) {
			reg = strtoul(argv[argn], NULL, 0) & 0x0ff;
			have_reg = true;
		} else {
			fprintf(stderr, "ERR: Unknown argument, %s\n", argv[argn]);
			exit(EXIT_FAILURE);
		}
	}
	// }}}

	RECORDTB	*tb = new RECORDTB(clock_rate, bit_rate, addr, tenbit);

	if (tb->m_core->config_err()) {
		delete	tb;
		exit(EXIT_FAILURE);
	}

	if (debug_flag) {
		printf("Drawing with\n");
		printf("\tTicks / half bit = %u\n",
			tb->m_core->clk().ticks_per_half_bit());
		printf("\tVCD File         = %s\n", DEF_TRACE_FILE);
		tb->m_core->debug(true);
		tb->opentrace(DEF_TRACE_FILE);
	}

	if (tb->reset() != 0) {
		delete	tb;
		exit(EXIT_FAILURE);
	}

	(*tb->m_slave)[reg] = (char)0x5a;
	(*tb->m_slave)[(reg+1)&0x0ff] = (char)0xc3;

	tb->clear();
	first = tb->m_tickcount;
	if (rd)
		r = tb->read_regs(addr, reg, 2, buf, tenbit);
	else
		r = tb->write_regs(addr, reg, 2, buf, tenbit);
	if (r != 0)
		fprintf(stderr, "ERR: Transaction %s\n",
			(r > 0) ? "NAK'd" : "timed out");
	if (debug_flag)
		tb->m_mon.dump(stdout);

	Gtk::Window	win;
	WAVEAREA	area(tb, first + 1);

	win.set_title((rd) ? "I2C Register Read" : "I2C Register Write");
	win.add(area);
	area.show();
	Gtk::Main::run(win);

	delete	tb;
	return	(r == 0) ? EXIT_SUCCESS : EXIT_FAILURE;
}
