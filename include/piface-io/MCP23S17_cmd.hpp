/**
 * This file is part of piface-io, a userspace driver for the MCP23S17 SPI port expander on embedded linux.
 * 
 * This software is distributed in the hope it will be useful, but without any warranty, including the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Lesser General Public License v3.0 for details.
 * 
 * @author piface-io contributors
 * @copyright Copyright (c) 2026 piface-io contributors. All rights reserved.
 * @license Licensed under the LGPL-3.0 license.
 * SPDX-License-Identifier: LGPL-3.0-only
*/

#pragma once

#include <cstdint>

// the two 8 bit ports as wired on the board
// OUT is GPIOA, fixed to all output
// IN is GPIOB, fixed to all input with pullups
enum class MCP23S17_port : uint8_t
{
	OUT,
	IN
};

// Command and register addressing for the MCP23S17, IOCON.BANK = 0
// Every transaction is {cmd, reg addr, data}
class MCP23S17_cmd
{
public:

	enum class REG_ADDR : uint8_t
	{
		IODIRA   = 0x00,
		IODIRB   = 0x01,
		IPOLA    = 0x02,
		IPOLB    = 0x03,
		GPINTENA = 0x04,
		GPINTENB = 0x05,
		DEFVALA  = 0x06,
		DEFVALB  = 0x07,
		INTCONA  = 0x08,
		INTCONB  = 0x09,
		IOCONA   = 0x0A,
		IOCONB   = 0x0B,
		GPPUA    = 0x0C,
		GPPUB    = 0x0D,
		INTFA    = 0x0E,
		INTFB    = 0x0F,
		INTCAPA  = 0x10,
		INTCAPB  = 0x11,
		GPIOA    = 0x12,
		GPIOB    = 0x13,
		OLATA    = 0x14,
		OLATB    = 0x15
	};

	// 0 1 0 0 A2 A1 A0 R/W
	static constexpr uint8_t OPCODE      = 0x40U;
	static constexpr uint8_t HW_ADDR_MAX = 0x03U;

	static constexpr uint8_t get_write_cmd(const uint8_t hw_addr)
	{
		return OPCODE | ((hw_addr & HW_ADDR_MAX) << 1) | 0x00U;
	}

	static constexpr uint8_t get_read_cmd(const uint8_t hw_addr)
	{
		return OPCODE | ((hw_addr & HW_ADDR_MAX) << 1) | 0x01U;
	}

	static constexpr REG_ADDR get_port_reg(const MCP23S17_port port)
	{
		return (port == MCP23S17_port::OUT) ? (REG_ADDR::GPIOA) : (REG_ADDR::GPIOB);
	}
};

static_assert(MCP23S17_cmd::get_write_cmd(0) == 0x40U);
static_assert(MCP23S17_cmd::get_read_cmd(0)  == 0x41U);
