/**
 * @file test_modbus_handler.cpp
 * @brief Modbus slave: register map, write-through to config pages, exception replies
 */

#include <unity.h>

#include "common/protocol/modbus/Modbus.Handler.hpp"
#include "../support/MemoryStorage.hpp"

using namespace modbus;

static MemoryStorage* device = nullptr;
static std::unique_ptr<SharedStorage> shared;
static std::unique_ptr<OptionsService> options;
static std::unique_ptr<ModbusHandler> handler;
static FlowTelemetry telemetry;

static std::optional<std::vector<uint8_t>> send(std::vector<uint8_t> pdu) {
    ModbusUtils::appendCrc(pdu);
    return handler->handleFrame(pdu);
}

static void assertCrcValid(const std::vector<uint8_t>& frame) {
    TEST_ASSERT_TRUE(frame.size() >= 4);
    uint16_t crc = static_cast<uint16_t>(frame[frame.size() - 2] | (frame[frame.size() - 1] << 8));
    TEST_ASSERT_EQUAL_HEX16(ModbusUtils::crc16(frame.data(), frame.size() - 2), crc);
}

static void assertException(const std::optional<std::vector<uint8_t>>& reply, uint8_t fc, ExceptionCode code) {
    TEST_ASSERT_TRUE(reply.has_value());
    TEST_ASSERT_EQUAL(5, reply->size());
    TEST_ASSERT_EQUAL_HEX8(fc | 0x80, (*reply)[1]);
    TEST_ASSERT_EQUAL_HEX8(static_cast<uint8_t>(code), (*reply)[2]);
    assertCrcValid(*reply);
}

void setUp(void) {
    auto storage = std::make_unique<MemoryStorage>();
    device = storage.get();
    shared = std::make_unique<SharedStorage>(std::move(storage));
    options = std::make_unique<OptionsService>();
    options->initialize(*shared, 1);
    options->update([](ConfigRecord& rec) { rec.setSerialNumber(0x12345678); });

    telemetry = FlowTelemetry{12.5f, 300.0f, 4200.0f, 98000.0f};
    handler = std::make_unique<ModbusHandler>(*options, [] { return telemetry; }, 1);
}

void tearDown(void) {
    handler.reset();
    options.reset();
    shared.reset();
    device = nullptr;
}

// ==================== 读保持寄存器 ====================

void test_read_serial_number_registers(void) {
    auto reply = send({0x01, 0x03, 0x00, 0x01, 0x00, 0x02});
    TEST_ASSERT_TRUE(reply.has_value());

    uint8_t expected[] = {0x01, 0x03, 0x04, 0x78, 0x56, 0x34, 0x12};
    TEST_ASSERT_EQUAL(9, reply->size());
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, reply->data(), sizeof(expected));
    assertCrcValid(*reply);
}

void test_read_whole_options_window(void) {
    auto reply = send({0x01, 0x03, 0x00, 0x00, 0x00, 0x20});
    TEST_ASSERT_TRUE(reply.has_value());
    TEST_ASSERT_EQUAL(3 + 64 + 2, reply->size());
    TEST_ASSERT_EQUAL_HEX8(64, (*reply)[2]);

    auto rec = options->snapshot();
    TEST_ASSERT_EQUAL_HEX8_ARRAY(rec.bytes().data(), reply->data() + 3, 64);
}

void test_read_holding_telemetry(void) {
    auto reply = send({0x01, 0x03, 0x00, 0x64, 0x00, 0x08});
    TEST_ASSERT_TRUE(reply.has_value());
    TEST_ASSERT_EQUAL_HEX8(16, (*reply)[2]);

    const uint8_t* data = reply->data() + 3;
    uint8_t flowRateBytes[] = {0x41, 0x48, 0x00, 0x00};
    TEST_ASSERT_EQUAL_HEX8_ARRAY(flowRateBytes, data, 4);
    TEST_ASSERT_EQUAL_FLOAT(300.0f, ModbusUtils::readFloat(data + 4));
    TEST_ASSERT_EQUAL_FLOAT(4200.0f, ModbusUtils::readFloat(data + 8));
    TEST_ASSERT_EQUAL_FLOAT(98000.0f, ModbusUtils::readFloat(data + 12));
}

void test_read_input_telemetry_slice(void) {
    auto reply = send({0x01, 0x04, 0x00, 0x02, 0x00, 0x02});
    TEST_ASSERT_TRUE(reply.has_value());
    TEST_ASSERT_EQUAL_HEX8(0x04, (*reply)[1]);
    TEST_ASSERT_EQUAL_HEX8(4, (*reply)[2]);
    TEST_ASSERT_EQUAL_FLOAT(300.0f, ModbusUtils::readFloat(reply->data() + 3));
}

// ==================== 写 ====================

void test_write_single_echoes_and_persists(void) {
    std::vector<uint8_t> request = {0x01, 0x06, 0x00, 0x05, 0x12, 0x34, 0x94, 0xBC};
    auto reply = handler->handleFrame(request);

    TEST_ASSERT_TRUE(reply.has_value());
    TEST_ASSERT_TRUE(*reply == request);

    auto rec = options->snapshot();
    TEST_ASSERT_EQUAL_HEX8(0x12, rec.bytes()[10]);
    TEST_ASSERT_EQUAL_HEX8(0x34, rec.bytes()[11]);

    auto stored = ConfigStore::load(*device);
    TEST_ASSERT_TRUE(stored.ok());
    TEST_ASSERT_TRUE(stored.record == rec);
}

void test_write_multiple_updates_serial(void) {
    auto reply = send({0x01, 0x10, 0x00, 0x01, 0x00, 0x02, 0x04, 0x00, 0x0A, 0x01, 0x02});

    TEST_ASSERT_TRUE(reply.has_value());
    uint8_t expected[] = {0x01, 0x10, 0x00, 0x01, 0x00, 0x02};
    TEST_ASSERT_EQUAL(8, reply->size());
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, reply->data(), sizeof(expected));
    assertCrcValid(*reply);

    TEST_ASSERT_EQUAL_HEX32(0x02010A00, options->snapshot().serialNumber());
    TEST_ASSERT_EQUAL_HEX32(0x02010A00, ConfigStore::load(*device).valueOrThrow().serialNumber());
}

void test_write_crc_register_is_recomputed(void) {
    auto reply = send({0x01, 0x06, 0x00, 0x00, 0xDE, 0xAD});
    TEST_ASSERT_TRUE(reply.has_value());

    auto stored = ConfigStore::load(*device);
    TEST_ASSERT_TRUE(stored.ok());
    TEST_ASSERT_TRUE(stored.source == PageSource::Primary);
}

// ==================== 异常 ====================

void test_read_across_options_end_is_illegal_address(void) {
    assertException(send({0x01, 0x03, 0x00, 0x1F, 0x00, 0x02}), 0x03, ExceptionCode::IllegalDataAddress);
}

void test_read_unmapped_is_illegal_address(void) {
    assertException(send({0x01, 0x03, 0x00, 0x40, 0x00, 0x01}), 0x03, ExceptionCode::IllegalDataAddress);
    assertException(send({0x01, 0x04, 0x00, 0x07, 0x00, 0x02}), 0x04, ExceptionCode::IllegalDataAddress);
}

void test_write_telemetry_is_illegal_address(void) {
    assertException(send({0x01, 0x06, 0x00, 0x64, 0x00, 0x01}), 0x06, ExceptionCode::IllegalDataAddress);
}

void test_bad_quantity_is_illegal_value(void) {
    assertException(send({0x01, 0x03, 0x00, 0x00, 0x00, 0x00}), 0x03, ExceptionCode::IllegalDataValue);
    assertException(send({0x01, 0x03, 0x00, 0x00, 0x00, 0x7E}), 0x03, ExceptionCode::IllegalDataValue);
}

void test_byte_count_mismatch_is_illegal_value(void) {
    // 数量 2 但只带 2 字节
    assertException(send({0x01, 0x10, 0x00, 0x01, 0x00, 0x02, 0x02, 0x00, 0x0A}),
                    0x10, ExceptionCode::IllegalDataValue);
}

void test_unsupported_function_is_illegal_function(void) {
    assertException(send({0x01, 0x01, 0x00, 0x00, 0x00, 0x08}), 0x01, ExceptionCode::IllegalFunction);
}

void test_diagnostics_function_is_illegal_function(void) {
    assertException(send({0x01, 0x08, 0x00, 0x00, 0x12, 0x34}), 0x08, ExceptionCode::IllegalFunction);
}

void test_storage_failure_is_device_failure(void) {
    auto before = options->snapshot();
    device->failWritesAfter(0);

    assertException(send({0x01, 0x06, 0x00, 0x05, 0x12, 0x34}), 0x06, ExceptionCode::ServerDeviceFailure);
    TEST_ASSERT_TRUE(options->snapshot() == before);

    device->heal();
    auto reply = send({0x01, 0x03, 0x00, 0x01, 0x00, 0x02});
    TEST_ASSERT_TRUE(reply.has_value());
    TEST_ASSERT_EQUAL_HEX8(0x03, (*reply)[1]);
}

// ==================== 地址 ====================

void test_broadcast_write_applies_without_reply(void) {
    auto reply = send({0x00, 0x06, 0x00, 0x03, 0xAB, 0xCD});
    TEST_ASSERT_FALSE(reply.has_value());

    auto rec = options->snapshot();
    TEST_ASSERT_EQUAL_HEX8(0xAB, rec.bytes()[6]);
    TEST_ASSERT_EQUAL_HEX8(0xCD, rec.bytes()[7]);
    TEST_ASSERT_EQUAL_UINT64(1, handler->stats().broadcasts);
}

void test_other_slave_is_ignored(void) {
    TEST_ASSERT_FALSE(send({0x02, 0x03, 0x00, 0x00, 0x00, 0x01}).has_value());
    TEST_ASSERT_EQUAL_UINT64(1, handler->stats().transportErrors);
}

void test_corrupt_frame_is_ignored(void) {
    std::vector<uint8_t> frame = {0x01, 0x03, 0x00, 0x00, 0x00, 0x0A, 0x00, 0x00};
    TEST_ASSERT_FALSE(handler->handleFrame(frame).has_value());
}

void test_slave_address_follows_record(void) {
    options->update([](ConfigRecord& rec) { rec.setSlaveAddress(9); });
    TEST_ASSERT_EQUAL_UINT8(9, handler->slaveAddress());
    TEST_ASSERT_FALSE(send({0x01, 0x03, 0x00, 0x00, 0x00, 0x01}).has_value());

    auto reply = send({0x09, 0x03, 0x00, 0x00, 0x00, 0x01});
    TEST_ASSERT_TRUE(reply.has_value());
    TEST_ASSERT_EQUAL_HEX8(0x09, (*reply)[0]);
}

void test_invalid_record_address_falls_back(void) {
    options->update([](ConfigRecord& rec) { rec.setSlaveAddress(250); });
    TEST_ASSERT_EQUAL_UINT8(1, handler->slaveAddress());
    TEST_ASSERT_TRUE(send({0x01, 0x03, 0x00, 0x00, 0x00, 0x01}).has_value());
}

int main(int argc, char **argv) {
    UNITY_BEGIN();

    RUN_TEST(test_read_serial_number_registers);
    RUN_TEST(test_read_whole_options_window);
    RUN_TEST(test_read_holding_telemetry);
    RUN_TEST(test_read_input_telemetry_slice);

    RUN_TEST(test_write_single_echoes_and_persists);
    RUN_TEST(test_write_multiple_updates_serial);
    RUN_TEST(test_write_crc_register_is_recomputed);

    RUN_TEST(test_read_across_options_end_is_illegal_address);
    RUN_TEST(test_read_unmapped_is_illegal_address);
    RUN_TEST(test_write_telemetry_is_illegal_address);
    RUN_TEST(test_bad_quantity_is_illegal_value);
    RUN_TEST(test_byte_count_mismatch_is_illegal_value);
    RUN_TEST(test_unsupported_function_is_illegal_function);
    RUN_TEST(test_diagnostics_function_is_illegal_function);
    RUN_TEST(test_storage_failure_is_device_failure);

    RUN_TEST(test_broadcast_write_applies_without_reply);
    RUN_TEST(test_other_slave_is_ignored);
    RUN_TEST(test_corrupt_frame_is_ignored);
    RUN_TEST(test_slave_address_follows_record);
    RUN_TEST(test_invalid_record_address_falls_back);

    return UNITY_END();
}
