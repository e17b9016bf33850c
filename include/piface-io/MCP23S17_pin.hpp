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

#include "piface-io/MCP23S17_cmd.hpp"

#include <memory>

#include <cstdint>

class MCP23S17_expander;

enum class IO_value : uint8_t
{
	LOW,
	HIGH
};

// Read capability of a single line
class Pin_reader
{
public:
	virtual ~Pin_reader()
	{

	}

	virtual bool read_value(IO_value* const out_value) const = 0;
};

// Read and write capability of a single line
class Pin_writer : public Pin_reader
{
public:
	~Pin_writer() override
	{

	}

	virtual bool set_value(const IO_value value) const = 0;

	bool set_low() const
	{
		return set_value(IO_value::LOW);
	}
	bool set_high() const
	{
		return set_value(IO_value::HIGH);
	}
};

// View of one bit of one port
// Holds no line state, every call is a bus transaction against the chip
class MCP23S17_input : public Pin_reader
{
public:
	MCP23S17_input(const std::shared_ptr<MCP23S17_expander>& dev, const MCP23S17_port port, const unsigned int bit);
	~MCP23S17_input() override;

	bool read_value(IO_value* const out_value) const override;

	MCP23S17_port get_port() const
	{
		return m_port;
	}
	unsigned int get_bit() const
	{
		return m_bit;
	}

protected:
	std::shared_ptr<MCP23S17_expander> m_dev;
	MCP23S17_port m_port;
	unsigned int m_bit;
};

class MCP23S17_output : public Pin_writer
{
public:
	MCP23S17_output(const std::shared_ptr<MCP23S17_expander>& dev, const MCP23S17_port port, const unsigned int bit);
	~MCP23S17_output() override;

	bool read_value(IO_value* const out_value) const override;

	// read-modify-write of the port, the write is skipped if the line already holds value
	bool set_value(const IO_value value) const override;

	// reader over the same line, no bus traffic
	MCP23S17_input to_input() const;

	MCP23S17_port get_port() const
	{
		return m_port;
	}
	unsigned int get_bit() const
	{
		return m_bit;
	}

protected:
	std::shared_ptr<MCP23S17_expander> m_dev;
	MCP23S17_port m_port;
	unsigned int m_bit;
};
