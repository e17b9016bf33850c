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

#include "piface-io/SPIdev.hpp"

#include <spdlog/spdlog.h>

#include <linux/spi/spidev.h>
#include <linux/types.h>

#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>

#include <cerrno>
#include <cstring>

bool SPIdev::open(const std::string_view& path)
{
	if(m_fd >= 0)
	{
		SPDLOG_ERROR("spidev {:s} already open", m_path);
		return false;
	}

	m_path = path;

	int ret = ::open(m_path.c_str(), O_RDWR);
	if(ret < 0)
	{
		SPDLOG_ERROR("Could not open spidev {:s}, errno: {:d}", m_path, errno);

		m_path.clear();
		return false;
	}

	m_fd = ret;

	return true;
}
void SPIdev::close()
{
	if(m_fd < 0)
	{
		return;
	}

	int ret = ::close(m_fd);
	if(ret != 0)
	{
		SPDLOG_WARN("Error on close spidev {:s}, errno: {:d}", m_path, errno);		
	}

	m_fd    = -1;
	m_path.clear();
}

bool SPIdev::set_mode(uint8_t mode)
{
	int ret = ioctl(m_fd, SPI_IOC_WR_MODE, &mode);
	if(ret != 0)
	{
		SPDLOG_ERROR("spidev {:s} SPI_IOC_WR_MODE failed, errno: {:d}", m_path, errno);
		return false;
	}

	return true;
}
bool SPIdev::set_word_size(uint8_t word_size)
{
	int ret = ioctl(m_fd, SPI_IOC_WR_BITS_PER_WORD, &word_size);
	if(ret != 0)
	{
		SPDLOG_ERROR("spidev {:s} SPI_IOC_WR_BITS_PER_WORD failed, errno: {:d}", m_path, errno);
		return false;
	}

	return true;
}
bool SPIdev::set_max_speed(uint32_t max_speed)
{
	int ret = ioctl(m_fd, SPI_IOC_WR_MAX_SPEED_HZ, &max_speed);
	if(ret != 0)
	{
		SPDLOG_ERROR("spidev {:s} SPI_IOC_WR_MAX_SPEED_HZ failed, errno: {:d}", m_path, errno);
		return false;
	}

	return true;
}

bool SPIdev::write(const Const_buf_type buf)
{
	spi_ioc_transfer xfer;
	memset(&xfer, 0, sizeof(xfer));

	xfer.tx_buf = (__u64) buf.data();
	xfer.len    = buf.size();

	const int ret = ioctl(m_fd, SPI_IOC_MESSAGE(1), &xfer);
	if(ret < 0)
	{
		SPDLOG_ERROR("spidev {:s} write ioctl SPI_IOC_MESSAGE failed, errno: {:d}", m_path, errno);
		return false;
	}

	return true;
}

bool SPIdev::write_and_read(const Const_buf_type out_buf, Buf_type in_buf)
{
	if(out_buf.size() != in_buf.size())
	{
		SPDLOG_ERROR("spidev {:s} write_and_read size mismatch, tx: {:d}, rx: {:d}", m_path, out_buf.size(), in_buf.size());
		return false;
	}

	spi_ioc_transfer xfer;
	memset(&xfer, 0, sizeof(xfer));

	xfer.tx_buf = (__u64) out_buf.data();
	xfer.rx_buf = (__u64) in_buf.data();
	xfer.len    = out_buf.size();

	const int ret = ioctl(m_fd, SPI_IOC_MESSAGE(1), &xfer);
	if(ret < 0)
	{
		SPDLOG_ERROR("spidev {:s} write_and_read ioctl SPI_IOC_MESSAGE failed, errno: {:d}", m_path, errno);
		return false;
	}

	return true;
}
