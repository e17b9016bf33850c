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

#include "piface-io/MCP23S17_pin.hpp"
#include "piface-io/MCP23S17_expander.hpp"

#include <spdlog/spdlog.h>

MCP23S17_input::MCP23S17_input(const std::shared_ptr<MCP23S17_expander>& dev, const MCP23S17_port port, const unsigned int bit)
{
	m_dev  = dev;
	m_port = port;
	m_bit  = bit;
}
MCP23S17_input::~MCP23S17_input()
{

}
bool MCP23S17_input::read_value(IO_value* const out_value) const
{
	if( ! m_dev )
	{
		SPDLOG_ERROR("input pin has no expander");
		return false;
	}

	return m_dev->read_port_bit(m_port, m_bit, out_value);
}

MCP23S17_output::MCP23S17_output(const std::shared_ptr<MCP23S17_expander>& dev, const MCP23S17_port port, const unsigned int bit)
{
	m_dev  = dev;
	m_port = port;
	m_bit  = bit;
}
MCP23S17_output::~MCP23S17_output()
{

}
bool MCP23S17_output::read_value(IO_value* const out_value) const
{
	if( ! m_dev )
	{
		SPDLOG_ERROR("output pin has no expander");
		return false;
	}

	return m_dev->read_port_bit(m_port, m_bit, out_value);
}
bool MCP23S17_output::set_value(const IO_value value) const
{
	if( ! m_dev )
	{
		SPDLOG_ERROR("output pin has no expander");
		return false;
	}

	return m_dev->write_port_bit(m_port, m_bit, value);
}
MCP23S17_input MCP23S17_output::to_input() const
{
	return MCP23S17_input(m_dev, m_port, m_bit);
}
