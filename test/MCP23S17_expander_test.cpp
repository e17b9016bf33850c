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

#include "Fake_spidev.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <type_traits>

class MCP23S17_expander_test : public ::testing::Test
{
protected:
	void SetUp() override
	{
		m_spi = std::make_shared<Fake_spidev>();
		m_exp = MCP23S17_expander::create();
	}

	std::shared_ptr<Fake_spidev> m_spi;
	std::shared_ptr<MCP23S17_expander> m_exp;
};

TEST_F(MCP23S17_expander_test, init_sequence)
{
	m_spi->set_reg(MCP23S17_cmd::REG_ADDR::GPIOA,  0x5A);
	m_spi->set_reg(MCP23S17_cmd::REG_ADDR::IODIRA, 0xFF);

	ASSERT_TRUE(m_exp->init(m_spi));

	const std::vector<Fake_spidev::Transaction> writes = m_spi->get_writes();
	ASSERT_EQ(4U, writes.size());
	EXPECT_EQ((Fake_spidev::Transaction{0x40, 0x12, 0x00}), writes[0]);
	EXPECT_EQ((Fake_spidev::Transaction{0x40, 0x00, 0x00}), writes[1]);
	EXPECT_EQ((Fake_spidev::Transaction{0x40, 0x01, 0xFF}), writes[2]);
	EXPECT_EQ((Fake_spidev::Transaction{0x40, 0x0D, 0xFF}), writes[3]);

	EXPECT_EQ(0, m_spi->get_num_read());
}

TEST_F(MCP23S17_expander_test, init_hw_addr)
{
	m_exp = MCP23S17_expander::create(2);
	ASSERT_TRUE(m_exp->init(m_spi));
	EXPECT_EQ(2U, m_exp->get_hw_addr());

	for(const Fake_spidev::Transaction& t : m_spi->get_writes())
	{
		EXPECT_EQ(0x44U, t[0]);
	}

	uint8_t val = 0xFF;
	ASSERT_TRUE(m_exp->get_output_byte(&val));
	EXPECT_EQ(0x45U, m_spi->get_reads().back()[0]);
}

TEST_F(MCP23S17_expander_test, init_aborts_on_each_step)
{
	for(int step = 0; step < 4; step++)
	{
		std::shared_ptr<Fake_spidev> spi = std::make_shared<Fake_spidev>();
		std::shared_ptr<MCP23S17_expander> exp = MCP23S17_expander::create();

		spi->fail_at(step);
		EXPECT_FALSE(exp->init(spi)) << "step " << step;
		EXPECT_EQ(step + 1, spi->get_num_xfer()) << "step " << step;

		// a failed init leaves the handle unusable
		uint8_t val = 0;
		EXPECT_FALSE(exp->get_output_byte(&val));
		EXPECT_EQ(step + 1, spi->get_num_xfer());
	}
}

TEST_F(MCP23S17_expander_test, handle_only_as_shared_ptr)
{
	static_assert( ! std::is_default_constructible_v<MCP23S17_expander>);
	static_assert( ! std::is_constructible_v<MCP23S17_expander, uint8_t>);
	static_assert( ! std::is_copy_constructible_v<MCP23S17_expander>);

	std::shared_ptr<MCP23S17_expander> exp = MCP23S17_expander::create(1);
	ASSERT_TRUE(exp);
	EXPECT_EQ(1U, exp->get_hw_addr());

	// factories need shared ownership of the handle
	EXPECT_NO_THROW(exp->make_output(0));
	EXPECT_NO_THROW(exp->make_input(0));
	EXPECT_EQ(exp.get(), exp->shared_from_this().get());
}

TEST_F(MCP23S17_expander_test, persistent_transport_failure)
{
	ASSERT_TRUE(m_exp->init(m_spi));
	m_spi->set_reg(MCP23S17_cmd::REG_ADDR::GPIOA, 0x11);

	m_spi->fail_from_now();

	uint8_t val = 0;
	EXPECT_FALSE(m_exp->get_output_byte(&val));
	EXPECT_FALSE(m_exp->get_input_byte(&val));
	EXPECT_FALSE(m_exp->write_port_bit(MCP23S17_port::OUT, 0, IO_value::LOW));
	EXPECT_EQ("{ In: NONE, Out: NONE }", m_exp->to_string());
	EXPECT_EQ(0x11U, m_spi->get_reg(MCP23S17_cmd::REG_ADDR::GPIOA));
}

TEST_F(MCP23S17_expander_test, init_null_dev)
{
	EXPECT_FALSE(m_exp->init(std::shared_ptr<SPIdev_base>()));
}

TEST_F(MCP23S17_expander_test, not_initialized)
{
	uint8_t val = 0;
	EXPECT_FALSE(m_exp->read_port(MCP23S17_port::OUT, &val));
	EXPECT_FALSE(m_exp->write_port_bit(MCP23S17_port::OUT, 0, IO_value::HIGH));
	EXPECT_EQ("{ In: NONE, Out: NONE }", m_exp->to_string());
}

TEST_F(MCP23S17_expander_test, output_byte_zero_after_init)
{
	m_spi->set_reg(MCP23S17_cmd::REG_ADDR::GPIOA, 0xFF);
	ASSERT_TRUE(m_exp->init(m_spi));

	uint8_t val = 0xFF;
	ASSERT_TRUE(m_exp->get_output_byte(&val));
	EXPECT_EQ(0U, val);
}

TEST_F(MCP23S17_expander_test, read_port_transaction)
{
	ASSERT_TRUE(m_exp->init(m_spi));
	m_spi->set_reg(MCP23S17_cmd::REG_ADDR::GPIOB, 0xA5);

	uint8_t val = 0;
	ASSERT_TRUE(m_exp->get_input_byte(&val));
	EXPECT_EQ(0xA5U, val);

	const std::vector<Fake_spidev::Transaction> reads = m_spi->get_reads();
	ASSERT_EQ(1U, reads.size());
	EXPECT_EQ((Fake_spidev::Transaction{0x41, 0x13, 0x00}), reads[0]);
}

TEST_F(MCP23S17_expander_test, read_port_failure_no_write)
{
	ASSERT_TRUE(m_exp->init(m_spi));
	const int writes = m_spi->get_num_write();

	m_spi->fail_from_now();

	uint8_t val = 0x77;
	EXPECT_FALSE(m_exp->read_port(MCP23S17_port::OUT, &val));
	EXPECT_EQ(0x77U, val);
	EXPECT_EQ(writes, m_spi->get_num_write());
}

TEST_F(MCP23S17_expander_test, write_bit_read_failure_no_write)
{
	ASSERT_TRUE(m_exp->init(m_spi));
	const int writes = m_spi->get_num_write();

	m_spi->fail_from_now();

	EXPECT_FALSE(m_exp->write_port_bit(MCP23S17_port::OUT, 3, IO_value::HIGH));
	EXPECT_EQ(writes, m_spi->get_num_write());
	EXPECT_EQ(0U, m_spi->get_reg(MCP23S17_cmd::REG_ADDR::GPIOA));
}

TEST_F(MCP23S17_expander_test, write_bit_write_failure)
{
	ASSERT_TRUE(m_exp->init(m_spi));

	// read succeeds, write fails
	m_spi->fail_at(m_spi->get_num_xfer() + 1);

	EXPECT_FALSE(m_exp->write_port_bit(MCP23S17_port::OUT, 3, IO_value::HIGH));
	EXPECT_EQ(0U, m_spi->get_reg(MCP23S17_cmd::REG_ADDR::GPIOA));
}

TEST_F(MCP23S17_expander_test, to_string)
{
	ASSERT_TRUE(m_exp->init(m_spi));
	m_spi->set_reg(MCP23S17_cmd::REG_ADDR::GPIOA, 3);
	m_spi->set_reg(MCP23S17_cmd::REG_ADDR::GPIOB, 255);

	EXPECT_EQ("{ In: 255, Out: 3 }", m_exp->to_string());
}

TEST_F(MCP23S17_expander_test, to_string_absorbs_failure)
{
	ASSERT_TRUE(m_exp->init(m_spi));
	m_spi->set_reg(MCP23S17_cmd::REG_ADDR::GPIOA, 7);

	// In is read first
	m_spi->fail_at(m_spi->get_num_xfer());
	EXPECT_EQ("{ In: NONE, Out: 7 }", m_exp->to_string());

	m_spi->fail_at(m_spi->get_num_xfer() + 1);
	EXPECT_EQ("{ In: 0, Out: NONE }", m_exp->to_string());

	// handle still works afterwards
	uint8_t val = 0;
	EXPECT_TRUE(m_exp->get_output_byte(&val));
	EXPECT_EQ(7U, val);
}

TEST_F(MCP23S17_expander_test, gpio_base_lines)
{
	ASSERT_TRUE(m_exp->init(m_spi));
	m_spi->set_reg(MCP23S17_cmd::REG_ADDR::GPIOB, 0x81);

	gpio_base& gpio = *m_exp;
	EXPECT_EQ(16U, gpio.get_num_lines());

	EXPECT_TRUE(gpio.set_line(5, 1));
	EXPECT_EQ(0x20U, m_spi->get_reg(MCP23S17_cmd::REG_ADDR::GPIOA));

	int val = -1;
	EXPECT_TRUE(gpio.get_line(5, &val));
	EXPECT_EQ(1, val);
	EXPECT_TRUE(gpio.get_line(4, &val));
	EXPECT_EQ(0, val);
	EXPECT_TRUE(gpio.get_line(8, &val));
	EXPECT_EQ(1, val);
	EXPECT_TRUE(gpio.get_line(9, &val));
	EXPECT_EQ(0, val);
	EXPECT_TRUE(gpio.get_line(15, &val));
	EXPECT_EQ(1, val);

	uint64_t all = 0;
	EXPECT_TRUE(gpio.get_all_lines(&all));
	EXPECT_EQ(0x8120U, all);

	EXPECT_TRUE(gpio.set_all_lines(0xFFFF00C3U));
	EXPECT_EQ(0xC3U, m_spi->get_reg(MCP23S17_cmd::REG_ADDR::GPIOA));
	EXPECT_EQ(0x81U, m_spi->get_reg(MCP23S17_cmd::REG_ADDR::GPIOB));
}

TEST_F(MCP23S17_expander_test, gpio_base_rejects)
{
	ASSERT_TRUE(m_exp->init(m_spi));
	const int xfers = m_spi->get_num_xfer();

	int val = 0;
	EXPECT_FALSE(m_exp->set_line(8, 1));
	EXPECT_FALSE(m_exp->set_line(16, 1));
	EXPECT_FALSE(m_exp->get_line(16, &val));
	EXPECT_EQ(xfers, m_spi->get_num_xfer());
}
