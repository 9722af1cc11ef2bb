/**
 * @file test_meter_service.cpp
 * @brief Metering loop end to end: sampling, history write-back, usage counters, reboot
 */

#include <unity.h>

#include "modules/meter/Meter.Service.hpp"
#include "../support/MemoryStorage.hpp"

using history::HistoryKind;

static constexpr uint32_t T0 = 1699938000;  // 05:00 UTC，整点

class ManualClock : public Clock {
public:
    uint32_t time;
    explicit ManualClock(uint32_t t) : time(t) {}
    uint32_t now() const override { return time; }
};

class ManualFlow : public FlowSource {
public:
    float lpm;
    explicit ManualFlow(float v) : lpm(v) {}
    float sampleLpm() override { return lpm; }
};

static MemoryStorage* device = nullptr;
static ManualClock* clock_ = nullptr;
static ManualFlow* flow = nullptr;

static MeterService& meter() { return MeterService::instance(); }

/** 以 image 作为器件内容启动（nullptr 为空白器件） */
static void boot(uint32_t now, float lpm, MemoryStorage* image = nullptr) {
    auto dev = std::make_unique<MemoryStorage>();
    if (image) {
        std::memcpy(dev->raw(), image->raw(), dev->capacity());
    }
    auto clk = std::make_unique<ManualClock>(now);
    auto src = std::make_unique<ManualFlow>(lpm);
    device = dev.get();
    clock_ = clk.get();
    flow = src.get();
    meter().initialize(std::move(dev), std::move(clk), std::move(src), MeterService::Settings{});
}

static void tick(uint32_t now) {
    clock_->time = now;
    meter().sampleTick();
}

void setUp(void) {
    boot(T0, 60.0f);
}

void tearDown(void) {}

void test_blank_device_boots_with_defaults(void) {
    TEST_ASSERT_TRUE(meter().isInitialized());
    auto stored = ConfigStore::load(*device);
    TEST_ASSERT_TRUE(stored.ok());
    TEST_ASSERT_EQUAL_UINT8(1, stored.record.slaveAddress());

    auto status = meter().getStatus();
    TEST_ASSERT_EQUAL_STRING("NEVER_WRITTEN", status["config_status"].asCString());
}

void test_sampling_updates_telemetry_and_counters(void) {
    tick(T0);
    tick(T0 + 60);
    tick(T0 + 120);

    auto t = meter().telemetry();
    TEST_ASSERT_EQUAL_FLOAT(60.0f, t.flowRate);
    TEST_ASSERT_EQUAL_FLOAT(120.0f, t.hourFlow);

    auto status = meter().getStatus();
    TEST_ASSERT_EQUAL_UINT(120, status["counters"]["total"].asUInt());
    TEST_ASSERT_EQUAL_UINT(120, status["counters"]["uptime"].asUInt());
    TEST_ASSERT_EQUAL_UINT(120, status["counters"]["hour_total"].asUInt());
}

void test_counters_saved_only_when_dirty(void) {
    TEST_ASSERT_FALSE(meter().optionsSaveTick());

    tick(T0);
    tick(T0 + 60);
    TEST_ASSERT_TRUE(meter().optionsSaveTick());
    TEST_ASSERT_EQUAL_UINT32(60, ConfigStore::load(*device).valueOrThrow().total());
    TEST_ASSERT_FALSE(meter().optionsSaveTick());
}

void test_fractional_litres_carry_over(void) {
    flow->lpm = 0.5f;
    tick(T0);
    tick(T0 + 60);  // 0.5 L
    TEST_ASSERT_EQUAL_UINT(0, meter().getStatus()["counters"]["total"].asUInt());
    tick(T0 + 120);  // 1.0 L
    TEST_ASSERT_EQUAL_UINT(1, meter().getStatus()["counters"]["total"].asUInt());
}

void test_hour_roll_writes_history(void) {
    tick(T0 + 3480);
    tick(T0 + 3540);
    tick(T0 + 3600);

    auto entry = meter().getHistoryAt(HistoryKind::Hour, T0);
    TEST_ASSERT_EQUAL_INT(60, entry["value"].asInt());
    TEST_ASSERT_EQUAL_UINT(T0, entry["time"].asUInt());

    auto midHour = meter().getHistoryAt(HistoryKind::Hour, T0 + 1800);
    TEST_ASSERT_EQUAL_INT(60, midHour["value"].asInt());
    TEST_ASSERT_EQUAL_UINT(T0, midHour["time"].asUInt());

    auto range = meter().getHistoryRange(HistoryKind::Hour);
    TEST_ASSERT_EQUAL_UINT(1, range["size"].asUInt());
    TEST_ASSERT_EQUAL_UINT(3600, range["element_size"].asUInt());
}

void test_missing_history_is_not_found(void) {
    bool thrown = false;
    try {
        meter().getHistoryAt(HistoryKind::Day, T0);
    } catch (const NotFoundException&) {
        thrown = true;
    }
    TEST_ASSERT_TRUE(thrown);
}

void test_empty_range_has_no_records(void) {
    bool thrown = false;
    try {
        meter().getHistoryRange(HistoryKind::Month);
    } catch (const AppException& e) {
        thrown = true;
        TEST_ASSERT_EQUAL_INT(ErrorCodes::HISTORY_NO_RECORDS, e.getCode());
    }
    TEST_ASSERT_TRUE(thrown);
}

void test_reboot_resumes_current_buckets(void) {
    tick(T0);
    tick(T0 + 600);  // 600 L
    meter().persistTick();
    meter().optionsSaveTick();

    MemoryStorage image;
    std::memcpy(image.raw(), device->raw(), image.capacity());

    boot(T0 + 900, 60.0f, &image);
    TEST_ASSERT_EQUAL_STRING("VALIDATED", meter().getStatus()["config_status"].asCString());
    TEST_ASSERT_EQUAL_FLOAT(600.0f, meter().telemetry().hourFlow);

    tick(T0 + 900);
    tick(T0 + 960);
    TEST_ASSERT_EQUAL_FLOAT(660.0f, meter().telemetry().hourFlow);
    TEST_ASSERT_EQUAL_UINT(660, meter().getStatus()["counters"]["total"].asUInt());
}

void test_remaining_quota_counts_down(void) {
    MemoryStorage image;
    auto rec = ConfigStore::defaults(1);
    rec.setRest(100);
    ConfigStore::save(rec, image);

    boot(T0, 60.0f, &image);
    tick(T0);
    tick(T0 + 60);
    TEST_ASSERT_EQUAL_UINT(40, meter().getStatus()["counters"]["rest"].asUInt());
    tick(T0 + 120);
    TEST_ASSERT_EQUAL_UINT(0, meter().getStatus()["counters"]["rest"].asUInt());
}

void test_negative_flow_follows_record_flag(void) {
    MemoryStorage image;
    auto rec = ConfigStore::defaults(1);
    rec.setEnableNegative(1);
    rec.setTotal(1000);
    ConfigStore::save(rec, image);

    boot(T0, -30.0f, &image);
    tick(T0);
    tick(T0 + 120);
    TEST_ASSERT_EQUAL_FLOAT(-60.0f, meter().telemetry().hourFlow);
    TEST_ASSERT_EQUAL_UINT(940, meter().getStatus()["counters"]["total"].asUInt());
}

void test_modbus_reads_live_telemetry(void) {
    tick(T0);
    tick(T0 + 60);

    std::vector<uint8_t> request = {0x01, 0x04, 0x00, 0x00, 0x00, 0x04};
    modbus::ModbusUtils::appendCrc(request);
    auto reply = meter().handleModbusFrame(request);

    TEST_ASSERT_TRUE(reply.has_value());
    TEST_ASSERT_EQUAL_FLOAT(60.0f, modbus::ModbusUtils::readFloat(reply->data() + 3));
    TEST_ASSERT_EQUAL_FLOAT(60.0f, modbus::ModbusUtils::readFloat(reply->data() + 7));
}

void test_options_json(void) {
    auto options = meter().getOptions();
    TEST_ASSERT_EQUAL_UINT(1, options["slave_address"].asUInt());
    TEST_ASSERT_EQUAL(6, options["k_factor"].size());
    TEST_ASSERT_EQUAL_FLOAT(1.0f, options["k_factor"][0].asFloat());
}

int main(int argc, char **argv) {
    UNITY_BEGIN();

    RUN_TEST(test_blank_device_boots_with_defaults);
    RUN_TEST(test_sampling_updates_telemetry_and_counters);
    RUN_TEST(test_counters_saved_only_when_dirty);
    RUN_TEST(test_fractional_litres_carry_over);
    RUN_TEST(test_hour_roll_writes_history);
    RUN_TEST(test_missing_history_is_not_found);
    RUN_TEST(test_empty_range_has_no_records);
    RUN_TEST(test_reboot_resumes_current_buckets);
    RUN_TEST(test_remaining_quota_counts_down);
    RUN_TEST(test_negative_flow_follows_record_flag);
    RUN_TEST(test_modbus_reads_live_telemetry);
    RUN_TEST(test_options_json);

    return UNITY_END();
}
