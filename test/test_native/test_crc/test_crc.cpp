/**
 * @file test_crc.cpp
 * @brief Checksum vectors for the config/ring page CRC and the Modbus RTU CRC
 */

#include <unity.h>

#include "common/utils/Checksum.hpp"
#include "common/protocol/modbus/Modbus.Utils.hpp"

using modbus::ModbusUtils;

void setUp(void) {
}

void tearDown(void) {
}

// ==================== CRC16/CCITT-FALSE ====================

void test_ccitt_false_check_value(void) {
    const uint8_t data[] = {'1', '2', '3', '4', '5', '6', '7', '8', '9'};
    TEST_ASSERT_EQUAL_HEX16(0x29B1, Checksum::crc16CcittFalse(data, sizeof(data)));
}

void test_ccitt_false_empty_is_init(void) {
    TEST_ASSERT_EQUAL_HEX16(0xFFFF, Checksum::crc16CcittFalse(nullptr, 0));
}

void test_ccitt_false_detects_single_bit_flip(void) {
    uint8_t data[32];
    for (size_t i = 0; i < sizeof(data); ++i) data[i] = static_cast<uint8_t>(i * 7);
    uint16_t before = Checksum::crc16CcittFalse(data, sizeof(data));
    data[17] ^= 0x04;
    TEST_ASSERT_NOT_EQUAL(before, Checksum::crc16CcittFalse(data, sizeof(data)));
}

// ==================== Modbus CRC16 ====================

void test_modbus_crc_read_holding_vector(void) {
    const uint8_t frame[] = {0x01, 0x03, 0x00, 0x00, 0x00, 0x0A};
    TEST_ASSERT_EQUAL_HEX16(0xCDC5, ModbusUtils::crc16(frame, sizeof(frame)));
}

void test_modbus_crc_slave_17_vector(void) {
    const uint8_t frame[] = {0x11, 0x03, 0x00, 0x6B, 0x00, 0x03};
    TEST_ASSERT_EQUAL_HEX16(0x8776, ModbusUtils::crc16(frame, sizeof(frame)));
}

void test_modbus_crc_check_value(void) {
    const uint8_t data[] = {'1', '2', '3', '4', '5', '6', '7', '8', '9'};
    TEST_ASSERT_EQUAL_HEX16(0x4B37, ModbusUtils::crc16(data, sizeof(data)));
}

void test_modbus_crc_appended_little_endian(void) {
    std::vector<uint8_t> frame = {0x01, 0x03, 0x00, 0x00, 0x00, 0x0A};
    ModbusUtils::appendCrc(frame);
    TEST_ASSERT_EQUAL_UINT32(8, frame.size());
    TEST_ASSERT_EQUAL_HEX8(0xC5, frame[6]);
    TEST_ASSERT_EQUAL_HEX8(0xCD, frame[7]);
}

// ==================== 空白页判定 ====================

void test_blank_erased_page(void) {
    uint8_t page[64];
    std::memset(page, 0xFF, sizeof(page));
    TEST_ASSERT_TRUE(Checksum::isBlank(page, sizeof(page)));
}

void test_blank_zeroed_page(void) {
    uint8_t page[64] = {0};
    TEST_ASSERT_TRUE(Checksum::isBlank(page, sizeof(page)));
}

void test_mixed_page_is_not_blank(void) {
    uint8_t page[64];
    std::memset(page, 0xFF, sizeof(page));
    page[40] = 0x00;
    TEST_ASSERT_FALSE(Checksum::isBlank(page, sizeof(page)));
}

int main(int argc, char **argv) {
    UNITY_BEGIN();

    RUN_TEST(test_ccitt_false_check_value);
    RUN_TEST(test_ccitt_false_empty_is_init);
    RUN_TEST(test_ccitt_false_detects_single_bit_flip);

    RUN_TEST(test_modbus_crc_read_holding_vector);
    RUN_TEST(test_modbus_crc_slave_17_vector);
    RUN_TEST(test_modbus_crc_check_value);
    RUN_TEST(test_modbus_crc_appended_little_endian);

    RUN_TEST(test_blank_erased_page);
    RUN_TEST(test_blank_zeroed_page);
    RUN_TEST(test_mixed_page_is_not_blank);

    return UNITY_END();
}
