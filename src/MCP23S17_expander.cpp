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

#include "piface-io/MCP23S17_expander.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <linux/spi/spidev.h>

#include <array>

MCP23S17_expander::MCP23S17_expander(const Private_tag&, const uint8_t hw_addr) : m_hw_addr(hw_addr)
{
	if(m_hw_addr > MCP23S17_cmd::HW_ADDR_MAX)
	{
		SPDLOG_WARN("hw addr {:d} out of range, only the low 2 bits are used", m_hw_addr);
	}
}

MCP23S17_expander::~MCP23S17_expander()
{

}

std::shared_ptr<MCP23S17_expander> MCP23S17_expander::create(const uint8_t hw_addr)
{
	return std::make_shared<MCP23S17_expander>(Private_tag(), hw_addr);
}

std::shared_ptr<MCP23S17_expander> MCP23S17_expander::open(const std::string_view& path, const uint8_t hw_addr, Expander_error* const out_err)
{
	if(out_err)
	{
		*out_err = Expander_error::NONE;
	}

	std::shared_ptr<SPIdev> spidev = std::make_shared<SPIdev>();
	if( ! spidev->open(path) )
	{
		if(out_err)
		{
			*out_err = Expander_error::OPEN;
		}
		return std::shared_ptr<MCP23S17_expander>();
	}

	if( ! configure_spidev(spidev) )
	{
		if(out_err)
		{
			*out_err = Expander_error::CONFIGURE;
		}
		return std::shared_ptr<MCP23S17_expander>();
	}

	std::shared_ptr<MCP23S17_expander> dev = create(hw_addr);
	if( ! dev->init(spidev) )
	{
		if(out_err)
		{
			*out_err = Expander_error::TRANSACTION;
		}
		return std::shared_ptr<MCP23S17_expander>();
	}

	return dev;
}

bool MCP23S17_expander::configure_spidev(const std::shared_ptr<SPIdev>& spidev)
{
	if( ! spidev->set_mode(SPI_MODE_0) )
	{
		SPDLOG_ERROR("Could not set mode on spidev");
		return false;
	}
	if( ! spidev->set_word_size(8) )
	{
		SPDLOG_ERROR("Could not set word size on spidev");
		return false;
	}
	if( ! spidev->set_max_speed(100000) )
	{
		SPDLOG_ERROR("Could not set clk speed on spidev");
		return false;
	}

	return true;
}

bool MCP23S17_expander::init(const std::shared_ptr<SPIdev_base>& spidev)
{
	std::unique_lock<std::mutex> lock(m_mutex);

	m_dev = spidev;

	if( ! m_dev )
	{
		SPDLOG_ERROR("spidev is null");
		return false;
	}

	if( ! write_reg8(MCP23S17_cmd::REG_ADDR::GPIOA, 0x00U) )
	{
		SPDLOG_ERROR("Failed to write reg GPIOA");
		m_dev.reset();
		return false;
	}

	// port A all output
	if( ! write_reg8(MCP23S17_cmd::REG_ADDR::IODIRA, 0x00U) )
	{
		SPDLOG_ERROR("Failed to write reg IODIRA");
		m_dev.reset();
		return false;
	}

	// port B all input
	if( ! write_reg8(MCP23S17_cmd::REG_ADDR::IODIRB, 0xFFU) )
	{
		SPDLOG_ERROR("Failed to write reg IODIRB");
		m_dev.reset();
		return false;
	}

	if( ! write_reg8(MCP23S17_cmd::REG_ADDR::GPPUB, 0xFFU) )
	{
		SPDLOG_ERROR("Failed to write reg GPPUB");
		m_dev.reset();
		return false;
	}

	SPDLOG_DEBUG("MCP23S17 hw addr {:d} init done", m_hw_addr);

	return true;
}

bool MCP23S17_expander::read_port(const MCP23S17_port port, uint8_t* const out_val)
{
	std::unique_lock<std::mutex> lock(m_mutex);
	return read_reg8(MCP23S17_cmd::get_port_reg(port), out_val);
}

bool MCP23S17_expander::read_port_bit(const MCP23S17_port port, const unsigned int bit, IO_value* const out_value)
{
	uint8_t reg = 0;
	{
		std::unique_lock<std::mutex> lock(m_mutex);
		if( ! read_reg8(MCP23S17_cmd::get_port_reg(port), &reg) )
		{
			return false;
		}
	}

	if(out_value)
	{
		*out_value = (reg & get_bit_mask(bit)) ? (IO_value::HIGH) : (IO_value::LOW);
	}

	return true;
}

bool MCP23S17_expander::write_port_bit(const MCP23S17_port port, const unsigned int bit, const IO_value value)
{
	const MCP23S17_cmd::REG_ADDR addr = MCP23S17_cmd::get_port_reg(port);
	const uint8_t mask                = get_bit_mask(bit);

	std::unique_lock<std::mutex> lock(m_mutex);

	uint8_t did_read = 0;
	if( ! read_reg8(addr, &did_read) )
	{
		return false;
	}

	uint8_t to_write = did_read;
	if(value == IO_value::HIGH)
	{
		to_write |= mask;
	}
	else
	{
		to_write &= uint8_t(~mask);
	}

	if(to_write == did_read)
	{
		return true;
	}

	return write_reg8(addr, to_write);
}

MCP23S17_output MCP23S17_expander::make_output(const unsigned int bit)
{
	return MCP23S17_output(shared_from_this(), MCP23S17_port::OUT, bit);
}
MCP23S17_input MCP23S17_expander::make_input(const unsigned int bit)
{
	return MCP23S17_input(shared_from_this(), MCP23S17_port::IN, bit);
}

std::string MCP23S17_expander::to_string()
{
	std::string in_str  = "NONE";
	std::string out_str = "NONE";

	{
		std::unique_lock<std::mutex> lock(m_mutex);

		uint8_t reg = 0;
		if(read_reg8(MCP23S17_cmd::get_port_reg(MCP23S17_port::IN), &reg))
		{
			in_str = fmt::format("{:d}", reg);
		}
		if(read_reg8(MCP23S17_cmd::get_port_reg(MCP23S17_port::OUT), &reg))
		{
			out_str = fmt::format("{:d}", reg);
		}
	}

	return fmt::format("{{ In: {:s}, Out: {:s} }}", in_str, out_str);
}

bool MCP23S17_expander::set_line(const unsigned int idx, const int value)
{
	if( ! is_valid_line(idx) )
	{
		return false;
	}

	if(idx >= 8)
	{
		SPDLOG_WARN("line {:d} is an input", idx);
		return false;
	}

	return write_port_bit(MCP23S17_port::OUT, idx, (value) ? (IO_value::HIGH) : (IO_value::LOW));
}
bool MCP23S17_expander::get_line(const unsigned int idx, int* const out_value)
{
	if( ! is_valid_line(idx) )
	{
		return false;
	}

	IO_value val = IO_value::LOW;
	if(idx < 8)
	{
		if( ! read_port_bit(MCP23S17_port::OUT, idx, &val) )
		{
			return false;
		}
	}
	else
	{
		if( ! read_port_bit(MCP23S17_port::IN, idx - 8, &val) )
		{
			return false;
		}
	}

	if(out_value)
	{
		*out_value = (val == IO_value::HIGH) ? (1) : (0);
	}

	return true;
}
bool MCP23S17_expander::set_all_lines(const uint64_t value)
{
	std::unique_lock<std::mutex> lock(m_mutex);
	return write_reg8(MCP23S17_cmd::get_port_reg(MCP23S17_port::OUT), uint8_t(value & 0xFFU));
}
bool MCP23S17_expander::get_all_lines(uint64_t* const out_value)
{
	uint8_t out_reg = 0;
	uint8_t in_reg  = 0;

	{
		std::unique_lock<std::mutex> lock(m_mutex);
		if( ! read_reg8(MCP23S17_cmd::get_port_reg(MCP23S17_port::OUT), &out_reg) )
		{
			return false;
		}
		if( ! read_reg8(MCP23S17_cmd::get_port_reg(MCP23S17_port::IN), &in_reg) )
		{
			return false;
		}
	}

	if(out_value)
	{
		*out_value = (uint64_t(in_reg) << 8) | uint64_t(out_reg);
	}

	return true;
}

bool MCP23S17_expander::read_reg8(const MCP23S17_cmd::REG_ADDR addr, uint8_t* const out_val)
{
	if( ! m_dev )
	{
		SPDLOG_ERROR("MCP23S17 not initialized");
		return false;
	}

	// the chip clocks out data on the third byte
	const std::array<uint8_t, 3> out_buf = {MCP23S17_cmd::get_read_cmd(m_hw_addr), uint8_t(addr), 0x00U};
	std::array<uint8_t, 3> in_buf        = {0x00U, 0x00U, 0x00U};

	if( ! m_dev->write_and_read(out_buf, in_buf) )
	{
		SPDLOG_ERROR("read of reg 0x{:02X} failed", uint8_t(addr));
		return false;
	}

	if(out_val)
	{
		*out_val = in_buf[2];
	}

	return true;
}

bool MCP23S17_expander::write_reg8(const MCP23S17_cmd::REG_ADDR addr, const uint8_t val)
{
	if( ! m_dev )
	{
		SPDLOG_ERROR("MCP23S17 not initialized");
		return false;
	}

	const std::array<uint8_t, 3> buf = {MCP23S17_cmd::get_write_cmd(m_hw_addr), uint8_t(addr), val};

	if( ! m_dev->write(buf) )
	{
		SPDLOG_ERROR("write of reg 0x{:02X} failed", uint8_t(addr));
		return false;
	}

	return true;
}
