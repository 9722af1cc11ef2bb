/**
 * @file test_file_storage.cpp
 * @brief File-backed EEPROM image
 */

#include <unity.h>

#include "common/storage/FileStorage.hpp"

static fs::path imagePath;

void setUp(void) {
    imagePath = fs::temp_directory_path() / "flowmeter_test" / "eeprom.bin";
    std::error_code ec;
    fs::remove_all(imagePath.parent_path(), ec);
}

void tearDown(void) {
    std::error_code ec;
    fs::remove_all(imagePath.parent_path(), ec);
}

void test_creates_blank_image(void) {
    FileStorage storage(imagePath.string(), 4096);
    TEST_ASSERT_TRUE(fs::exists(imagePath));
    TEST_ASSERT_EQUAL_UINT32(4096, static_cast<uint32_t>(fs::file_size(imagePath)));

    uint8_t buf[16];
    storage.read(4080, buf, sizeof(buf));
    for (auto b : buf) {
        TEST_ASSERT_EQUAL_HEX8(0xFF, b);
    }
}

void test_write_survives_reopen(void) {
    const uint8_t data[] = {0xDE, 0xAD, 0xBE, 0xEF};
    {
        FileStorage storage(imagePath.string(), 4096);
        storage.write(0x400, data, sizeof(data));
    }
    FileStorage storage(imagePath.string(), 4096);
    uint8_t buf[4];
    storage.read(0x400, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_HEX8_ARRAY(data, buf, 4);
}

void test_capacity_mismatch_rejected(void) {
    { FileStorage storage(imagePath.string(), 4096); }

    bool thrown = false;
    try {
        FileStorage storage(imagePath.string(), 8192);
    } catch (const StorageException&) {
        thrown = true;
    }
    TEST_ASSERT_TRUE(thrown);
}

void test_out_of_range_access_rejected(void) {
    FileStorage storage(imagePath.string(), 4096);
    uint8_t buf[8] = {};
    bool thrown = false;
    try {
        storage.write(4092, buf, sizeof(buf));
    } catch (const StorageException& e) {
        thrown = true;
        TEST_ASSERT_EQUAL_INT(ErrorCodes::STORAGE_ERROR, e.getCode());
    }
    TEST_ASSERT_TRUE(thrown);
}

int main(int argc, char **argv) {
    UNITY_BEGIN();

    RUN_TEST(test_creates_blank_image);
    RUN_TEST(test_write_survives_reopen);
    RUN_TEST(test_capacity_mismatch_rejected);
    RUN_TEST(test_out_of_range_access_rejected);

    return UNITY_END();
}
