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

#include "piface-io/SPIdev.hpp"
#include "piface-io/gpio_base.hpp"
#include "piface-io/MCP23S17_cmd.hpp"
#include "piface-io/MCP23S17_pin.hpp"

#include <boost/core/noncopyable.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <cstdint>

enum class Expander_error : uint8_t
{
	NONE,
	OPEN,        // device path invalid or inaccessible
	CONFIGURE,   // spi mode / word size / clock rejected
	TRANSACTION  // a bus transaction failed
};

// MCP23S17 with GPIOA fixed as 8 outputs and GPIOB fixed as 8 inputs with pullups
// One instance owns the spi device and serializes every bus operation on it
// Only obtainable as a std::shared_ptr through create() or open(), pins made from it keep it alive
class MCP23S17_expander : public gpio_base, public std::enable_shared_from_this<MCP23S17_expander>, private boost::noncopyable
{
protected:
	// constructor key, only nameable inside the class
	struct Private_tag
	{
		explicit Private_tag()
		{

		}
	};

public:
	MCP23S17_expander(const Private_tag&, const uint8_t hw_addr);
	~MCP23S17_expander() override;

	// uninitialized handle, call init() before use
	static std::shared_ptr<MCP23S17_expander> create(const uint8_t hw_addr = 0);

	// open, configure and init in one step
	// returns null on failure, with the cause in out_err if not null
	static std::shared_ptr<MCP23S17_expander> open(const std::string_view& path, const uint8_t hw_addr, Expander_error* const out_err);

	// Not MT-safe
	// mode 0, 8 bit words, 100 kHz
	static bool configure_spidev(const std::shared_ptr<SPIdev>& spidev);

	// Not MT-safe
	// use existing configured spidev
	// GPIOA = 0, IODIRA = 0x00, IODIRB = 0xFF, GPPUB = 0xFF, in that order
	bool init(const std::shared_ptr<SPIdev_base>& spidev);

	uint8_t get_hw_addr() const
	{
		return m_hw_addr;
	}

	// MT-safe
	bool read_port(const MCP23S17_port port, uint8_t* const out_val);
	// MT-safe
	bool get_output_byte(uint8_t* const out_val)
	{
		return read_port(MCP23S17_port::OUT, out_val);
	}
	// MT-safe
	bool get_input_byte(uint8_t* const out_val)
	{
		return read_port(MCP23S17_port::IN, out_val);
	}

	// MT-safe
	// bit is not range checked, it is taken mod 8
	bool read_port_bit(const MCP23S17_port port, const unsigned int bit, IO_value* const out_value);
	// MT-safe, the read and the conditional write are one critical section
	bool write_port_bit(const MCP23S17_port port, const unsigned int bit, const IO_value value);

	MCP23S17_output make_output(const unsigned int bit);
	MCP23S17_input  make_input(const unsigned int bit);

	// MT-safe
	// "{ In: <byte>, Out: <byte> }", NONE in place of a port that could not be read
	std::string to_string();

	// gpio_base compat
	// lines 0-7 are port OUT, lines 8-15 are port IN
	// MT-safe
	bool set_line(const unsigned int idx, const int value) override;
	// MT-safe
	bool get_line(const unsigned int idx, int* const out_value) override;
	// MT-safe, only the low byte is used
	bool set_all_lines(const uint64_t value) override;
	// MT-safe
	bool get_all_lines(uint64_t* const out_value) override;

	size_t get_num_lines() const override
	{
		return 16;
	}

protected:

	static constexpr uint8_t get_bit_mask(const unsigned int bit)
	{
		return uint8_t(1U << (bit & 0x07U));
	}

	// caller must hold m_mutex
	bool read_reg8(const MCP23S17_cmd::REG_ADDR addr, uint8_t* const out_val);
	bool write_reg8(const MCP23S17_cmd::REG_ADDR addr, const uint8_t val);

	const uint8_t m_hw_addr;

	std::mutex m_mutex;
	std::shared_ptr<SPIdev_base> m_dev;
};
