/**
 * @file test_flow_totalizer.cpp
 * @brief Flow integration into hour/day/month buckets
 */

#include <unity.h>

#include "modules/meter/FlowTotalizer.hpp"

using history::HistoryKind;

static constexpr uint32_t T0 = 1699938000;  // 05:00 UTC，整点

void setUp(void) {}

void tearDown(void) {}

void test_first_sample_only_sets_rate(void) {
    FlowTotalizer totalizer;
    auto r = totalizer.sample(30.0f, T0);

    TEST_ASSERT_EQUAL_UINT32(0, r.elapsedSec);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, static_cast<float>(r.litres));
    TEST_ASSERT_EQUAL_FLOAT(30.0f, totalizer.rateLpm());
    TEST_ASSERT_TRUE(totalizer.bucket(HistoryKind::Hour).active);
    TEST_ASSERT_EQUAL_UINT32(T0, totalizer.bucket(HistoryKind::Hour).start);
}

void test_integrates_litres_per_minute(void) {
    FlowTotalizer totalizer;
    totalizer.sample(30.0f, T0);
    auto r = totalizer.sample(30.0f, T0 + 120);

    TEST_ASSERT_EQUAL_UINT32(120, r.elapsedSec);
    TEST_ASSERT_EQUAL_FLOAT(60.0f, static_cast<float>(r.litres));
    TEST_ASSERT_EQUAL_FLOAT(60.0f, static_cast<float>(totalizer.bucket(HistoryKind::Hour).litres));
    TEST_ASSERT_EQUAL_FLOAT(60.0f, static_cast<float>(totalizer.bucket(HistoryKind::Day).litres));
    TEST_ASSERT_EQUAL_FLOAT(60.0f, static_cast<float>(totalizer.bucket(HistoryKind::Month).litres));

    auto t = totalizer.telemetry();
    TEST_ASSERT_EQUAL_FLOAT(30.0f, t.flowRate);
    TEST_ASSERT_EQUAL_FLOAT(60.0f, t.hourFlow);
}

void test_negative_flow_ignored_when_disabled(void) {
    FlowTotalizer totalizer(false);
    totalizer.sample(-10.0f, T0);
    auto r = totalizer.sample(-10.0f, T0 + 60);

    TEST_ASSERT_EQUAL_FLOAT(0.0f, static_cast<float>(r.litres));
    TEST_ASSERT_EQUAL_FLOAT(-10.0f, totalizer.rateLpm());
}

void test_negative_flow_counted_when_enabled(void) {
    FlowTotalizer totalizer(true);
    totalizer.sample(20.0f, T0);
    totalizer.sample(20.0f, T0 + 60);
    auto r = totalizer.sample(-5.0f, T0 + 120);

    TEST_ASSERT_EQUAL_FLOAT(-5.0f, static_cast<float>(r.litres));
    TEST_ASSERT_EQUAL_FLOAT(15.0f, static_cast<float>(totalizer.bucket(HistoryKind::Hour).litres));
}

void test_clock_going_backwards_adds_nothing(void) {
    FlowTotalizer totalizer;
    totalizer.sample(30.0f, T0 + 600);
    auto r = totalizer.sample(30.0f, T0 + 300);

    TEST_ASSERT_EQUAL_UINT32(0, r.elapsedSec);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, static_cast<float>(r.litres));
}

void test_hour_roll_closes_previous_bucket(void) {
    FlowTotalizer totalizer;
    totalizer.sample(60.0f, T0 + 3540);
    totalizer.sample(60.0f, T0 + 3599);
    auto r = totalizer.sample(60.0f, T0 + 3600);

    TEST_ASSERT_EQUAL(1, r.closed.size());
    TEST_ASSERT_TRUE(r.closed[0].kind == HistoryKind::Hour);
    TEST_ASSERT_EQUAL_UINT32(T0, r.closed[0].start);
    TEST_ASSERT_EQUAL_FLOAT(59.0f, static_cast<float>(r.closed[0].litres));

    // 跨桶区间的体积计入新桶
    TEST_ASSERT_EQUAL_UINT32(T0 + 3600, totalizer.bucket(HistoryKind::Hour).start);
    TEST_ASSERT_EQUAL_FLOAT(1.0f, static_cast<float>(totalizer.bucket(HistoryKind::Hour).litres));
    TEST_ASSERT_EQUAL_FLOAT(60.0f, static_cast<float>(totalizer.bucket(HistoryKind::Day).litres));
}

void test_day_roll_closes_hour_and_day(void) {
    const uint32_t midnight = T0 - 5 * 3600 + 86400;
    FlowTotalizer totalizer;
    totalizer.sample(10.0f, midnight - 60);
    auto r = totalizer.sample(10.0f, midnight);

    TEST_ASSERT_EQUAL(2, r.closed.size());
    TEST_ASSERT_TRUE(r.closed[0].kind == HistoryKind::Hour);
    TEST_ASSERT_TRUE(r.closed[1].kind == HistoryKind::Day);
    TEST_ASSERT_EQUAL_UINT32(midnight - 86400, r.closed[1].start);
}

void test_restore_continues_current_bucket(void) {
    FlowTotalizer totalizer;
    totalizer.restore(HistoryKind::Hour, T0, 120.0);
    totalizer.sample(60.0f, T0 + 600);
    auto r = totalizer.sample(60.0f, T0 + 660);

    TEST_ASSERT_EQUAL(0, r.closed.size());
    TEST_ASSERT_EQUAL_FLOAT(180.0f, static_cast<float>(totalizer.bucket(HistoryKind::Hour).litres));
}

void test_restored_bucket_closes_after_downtime(void) {
    FlowTotalizer totalizer;
    totalizer.restore(HistoryKind::Hour, T0, 75.0);
    auto r = totalizer.sample(0.0f, T0 + 2 * 3600);

    TEST_ASSERT_EQUAL(1, r.closed.size());
    TEST_ASSERT_EQUAL_UINT32(T0, r.closed[0].start);
    TEST_ASSERT_EQUAL_FLOAT(75.0f, static_cast<float>(r.closed[0].litres));
}

void test_bucket_start(void) {
    TEST_ASSERT_EQUAL_UINT32(T0, FlowTotalizer::bucketStart(T0 + 1234, 3600));
    TEST_ASSERT_EQUAL_UINT32(T0 - 5 * 3600, FlowTotalizer::bucketStart(T0, 86400));
}

int main(int argc, char **argv) {
    UNITY_BEGIN();

    RUN_TEST(test_first_sample_only_sets_rate);
    RUN_TEST(test_integrates_litres_per_minute);
    RUN_TEST(test_negative_flow_ignored_when_disabled);
    RUN_TEST(test_negative_flow_counted_when_enabled);
    RUN_TEST(test_clock_going_backwards_adds_nothing);
    RUN_TEST(test_hour_roll_closes_previous_bucket);
    RUN_TEST(test_day_roll_closes_hour_and_day);
    RUN_TEST(test_restore_continues_current_bucket);
    RUN_TEST(test_restored_bucket_closes_after_downtime);
    RUN_TEST(test_bucket_start);

    return UNITY_END();
}
