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

#include <string>
#include <string_view>
#include <span>

#include <cstdint>
#include <cstddef>

// Byte level transaction interface of a spi device
// Each call is one CS-framed transaction
class SPIdev_base
{
public:
	typedef std::span<uint8_t>       Buf_type;
	typedef std::span<const uint8_t> Const_buf_type;

	SPIdev_base()
	{

	}
	virtual ~SPIdev_base()
	{

	}

	// half duplex, clock out buf
	virtual bool write(const Const_buf_type buf) = 0;

	// full duplex, clock out out_buf while clocking in in_buf
	// out_buf and in_buf must be the same size
	virtual bool write_and_read(const Const_buf_type out_buf, Buf_type in_buf) = 0;
};

// Class modeling a kernel spidev node, /dev/spidevB.C
class SPIdev : public SPIdev_base
{
public:

	SPIdev()
	{
		m_fd = -1;
	}
	~SPIdev() override
	{
		close();
	}

	SPIdev(const SPIdev&) = delete;
	SPIdev& operator=(const SPIdev&) = delete;

	int get_fd() const
	{
		return m_fd;
	}

	const std::string& get_path() const
	{
		return m_path;
	}

	// Not MT safe
	bool open(const std::string_view& path);
	// Not MT safe
	void close();

	// Not MT safe
	// SPI_MODE_0..SPI_MODE_3 or combination of SPI_CPOL (idle high if set) and SPI_CPHA flags (sample on trailing edge if set)
	bool set_mode(uint8_t mode);
	// Not MT safe
	bool set_word_size(uint8_t word_size);
	// Not MT safe
	bool set_max_speed(uint32_t max_speed);

	// the spidev ioctl is threadsafe, but callers needing multi-transaction atomicity must lock above this
	bool write(const Const_buf_type buf) override;
	bool write_and_read(const Const_buf_type out_buf, Buf_type in_buf) override;

protected:

	int m_fd;
	std::string m_path;
};
