////////////////////////////////////////////////////////////////////////////////
//
// Filename:	i2cconfig.h
// {{{
// Project:	LLI2C, a low-level, cycle-accurate I2C bus master
//
// Purpose:	Default rates, slave address, and bench limits for the
//		simulation and its tools.
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
#ifndef	I2CCONFIG_H
#define	I2CCONFIG_H

// Default system clock: 8 MHz, giving ten ticks per half bit at 400 kHz
#define	DEF_CLOCK_RATE		8000000ul
#define	DEF_BIT_RATE		400000ul

// The simulated slave device
#define	DEF_SLAVE_ADDR		0x050
#define	DEF_SLAVE_MEMBITS	8

// Bench watchdog: a transaction may take this many bit times per byte
// before we give up on it
#define	DEF_TIMEOUT_BITS	32

#define	DEF_TRACE_FILE		"trace.vcd"

#endif
