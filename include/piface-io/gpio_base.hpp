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

#include <cstddef>
#include <cstdint>

// Generic flat line interface over a gpio provider
// Lines are numbered [0, get_num_lines())
class gpio_base
{
public:
	gpio_base()
	{

	}
	virtual ~gpio_base()
	{

	}

	// value is 0 for low, nonzero for high
	virtual bool set_line(const unsigned int idx, const int value) = 0;
	// out_value may be null
	virtual bool get_line(const unsigned int idx, int* const out_value) = 0;

	// bit n of value is line n
	virtual bool set_all_lines(const uint64_t value) = 0;
	virtual bool get_all_lines(uint64_t* const out_value) = 0;

	virtual size_t get_num_lines() const = 0;

protected:

	bool is_valid_line(const unsigned int idx) const
	{
		return idx < get_num_lines();
	}
};
