/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * Tests for PooledFile construction, bounded I/O and deletion
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include <filesystem>
#include <random>
#include <thread>
#include <vector>
#include "storage/handle_pool.h"
#include "storage/pooled_file.h"
#include "storage/storage_errors.h"
#include "util/endian.hpp"
#include "test_helpers.h"

using namespace fdpool::storage;
using namespace fdpool::storage::test;
using ::testing::Return;
using ::testing::StrictMock;

class PooledFileTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::shared_ptr<HandlePool> pool;

    void SetUp() override {
        test_dir = create_temp_dir("fdpool_file_test");
        PoolConfig cfg;
        cfg.max_open_files = 4;
        pool = std::make_shared<HandlePool>(cfg);
    }

    void TearDown() override {
        pool.reset();
        std::filesystem::remove_all(test_dir);
    }

    std::string path(const std::string& name) const {
        return test_dir + "/" + name;
    }
};

TEST_F(PooledFileTest, ForcedLengthFillsWithZeros) {
    PooledFile f(pool, path("zeros.dat"), false, 10000, std::nullopt, -1);

    EXPECT_EQ(f.size(), 10000);
    auto contents = read_file(path("zeros.dat"));
    ASSERT_EQ(contents.size(), 10000u);
    EXPECT_EQ(contents, std::vector<uint8_t>(10000, 0));
}

TEST_F(PooledFileTest, SeededFillIsDeterministic) {
    const int64_t len = 3 * 4096 + 123;
    PooledFile a(pool, path("a.dat"), false, len, 42u, -1);
    PooledFile b(pool, path("b.dat"), false, len, 42u, -1);
    PooledFile c(pool, path("c.dat"), false, len, 43u, -1);

    auto ca = read_file(path("a.dat"));
    auto cb = read_file(path("b.dat"));
    auto cc = read_file(path("c.dat"));

    EXPECT_EQ(ca.size(), static_cast<size_t>(len));
    EXPECT_EQ(ca, cb);
    EXPECT_NE(ca, cc);
    EXPECT_NE(ca, std::vector<uint8_t>(len, 0));

    // Same bytes through the pooled read path
    std::vector<uint8_t> buf(len);
    a.pread(0, buf.data(), 0, buf.size());
    EXPECT_EQ(buf, ca);
}

TEST_F(PooledFileTest, SeededFillIsBigEndianGeneratorOutput) {
    PooledFile f(pool, path("seeded.dat"), false, 20, 7u, -1);

    std::mt19937_64 gen(7u);
    std::vector<uint8_t> expected(24);
    for (size_t i = 0; i < expected.size(); i += 8) {
        fdpool::util::store_be64(expected.data() + i, gen());
    }
    expected.resize(20);

    EXPECT_EQ(read_file(path("seeded.dat")), expected);
}

TEST_F(PooledFileTest, ForcedLengthShrinksLongerFile) {
    write_file(path("long.dat"), generate_test_data(8192));

    PooledFile f(pool, path("long.dat"), false, 100, std::nullopt, -1);
    EXPECT_EQ(f.size(), 100);
    EXPECT_EQ(std::filesystem::file_size(path("long.dat")), 100u);
}

TEST_F(PooledFileTest, NegativeForcedLengthKeepsExistingContent) {
    auto data = generate_test_data(5000, 3);
    write_file(path("keep.dat"), data);

    PooledFile f(pool, path("keep.dat"), false, -1, std::nullopt, -1);
    EXPECT_EQ(f.size(), 5000);
    EXPECT_EQ(read_file(path("keep.dat")), data);
}

TEST_F(PooledFileTest, InitialContentsConstructor) {
    auto data = generate_test_data(300, 9);
    write_file(path("init.dat"), generate_test_data(1000));

    PooledFile f(pool, path("init.dat"), data.data(), 100, 200, 17);
    EXPECT_EQ(f.size(), 200);
    EXPECT_EQ(f.persistent_id(), 17);
    EXPECT_FALSE(f.read_only());

    auto contents = read_file(path("init.dat"));
    EXPECT_EQ(contents, std::vector<uint8_t>(data.begin() + 100, data.begin() + 300));
}

TEST_F(PooledFileTest, WriteThenReadAtOffsets) {
    PooledFile f(pool, path("rw.dat"), false, 8192, std::nullopt, -1);
    auto data = generate_test_data(1000, 5);

    f.pwrite(4000, data.data(), 0, data.size());
    f.pwrite(0, data.data(), 10, 20);

    std::vector<uint8_t> buf(1100, 0xEE);
    f.pread(4000, buf.data(), 100, 1000);
    EXPECT_TRUE(std::equal(data.begin(), data.end(), buf.begin() + 100));
    EXPECT_EQ(buf[99], 0xEE);

    std::vector<uint8_t> head(20);
    f.pread(0, head.data(), 0, head.size());
    EXPECT_TRUE(std::equal(head.begin(), head.end(), data.begin() + 10));

    EXPECT_EQ(f.size(), 8192);
}

TEST_F(PooledFileTest, WriteBeyondLengthFailsWithoutPartialWrite) {
    PooledFile f(pool, path("bounded.dat"), false, 1000, std::nullopt, -1);
    auto data = generate_test_data(100, 1);

    EXPECT_THROW(f.pwrite(950, data.data(), 0, data.size()), BoundsError);
    EXPECT_THROW(f.pwrite(1001, data.data(), 0, 1), BoundsError);
    EXPECT_NO_THROW(f.pwrite(900, data.data(), 0, data.size()));
    EXPECT_NO_THROW(f.pwrite(1000, data.data(), 0, 0));

    auto contents = read_file(path("bounded.dat"));
    ASSERT_EQ(contents.size(), 1000u);
    EXPECT_EQ(std::vector<uint8_t>(contents.begin(), contents.begin() + 900),
              std::vector<uint8_t>(900, 0));
    EXPECT_TRUE(std::equal(data.begin(), data.end(), contents.begin() + 900));
}

TEST_F(PooledFileTest, NegativeOffsetsRejected) {
    PooledFile f(pool, path("neg.dat"), false, 100, std::nullopt, -1);
    std::vector<uint8_t> buf(10);

    EXPECT_THROW(f.pread(-1, buf.data(), 0, buf.size()), std::invalid_argument);
    EXPECT_THROW(f.pwrite(-1, buf.data(), 0, buf.size()), std::invalid_argument);
    EXPECT_FALSE(f.is_locked());
}

TEST_F(PooledFileTest, ReadPastEndIsShortRead) {
    PooledFile f(pool, path("short.dat"), false, 100, std::nullopt, -1);
    std::vector<uint8_t> buf(50);

    EXPECT_THROW(f.pread(80, buf.data(), 0, buf.size()), ShortReadError);
    EXPECT_NO_THROW(f.pread(50, buf.data(), 0, buf.size()));
    // Lock is released even when the read fails
    EXPECT_FALSE(f.is_locked());
}

TEST_F(PooledFileTest, ReadOnlyFile) {
    auto data = generate_test_data(256, 11);
    write_file(path("ro.dat"), data);

    PooledFile f(pool, path("ro.dat"), true, -1, std::nullopt, -1);
    EXPECT_TRUE(f.read_only());
    EXPECT_EQ(f.size(), 256);

    std::vector<uint8_t> buf(256);
    f.pread(0, buf.data(), 0, buf.size());
    EXPECT_EQ(buf, data);

    EXPECT_THROW(f.pwrite(0, data.data(), 0, 1), ReadOnlyError);
    EXPECT_EQ(read_file(path("ro.dat")), data);
}

TEST_F(PooledFileTest, ReadOnlyCannotForceLength) {
    write_file(path("ro.dat"), generate_test_data(10));

    EXPECT_THROW(PooledFile(pool, path("ro.dat"), true, 4096, std::nullopt, -1),
                 StorageIOError);
    EXPECT_EQ(pool->open_count(), 0);
    EXPECT_EQ(pool->idle_count(), 0u);
}

TEST_F(PooledFileTest, FreeDeletesBackingFile) {
    PooledFile f(pool, path("gone.dat"), false, 100, std::nullopt, -1);
    ASSERT_TRUE(std::filesystem::exists(path("gone.dat")));

    f.free();
    EXPECT_TRUE(f.is_closed());
    EXPECT_FALSE(std::filesystem::exists(path("gone.dat")));
    EXPECT_EQ(pool->open_count(), 0);
}

TEST_F(PooledFileTest, FreeWithSecureDeleteUsesEraser) {
    auto eraser = std::make_shared<StrictMock<MockSecureEraser>>();
    PoolConfig cfg;
    cfg.max_open_files = 2;
    auto secure_pool = std::make_shared<HandlePool>(cfg, eraser);

    PooledFile f(secure_pool, path("secret.dat"), false, 100, std::nullopt, -1);
    EXPECT_FALSE(f.secure_delete());
    f.set_secure_delete(true);

    EXPECT_CALL(*eraser, secure_erase(path("secret.dat"))).WillOnce(Return(true));
    f.free();
    EXPECT_TRUE(f.is_closed());
}

TEST_F(PooledFileTest, SecureEraseFailureDoesNotThrow) {
    auto eraser = std::make_shared<StrictMock<MockSecureEraser>>();
    PoolConfig cfg;
    cfg.secure_delete_by_default = true;
    auto secure_pool = std::make_shared<HandlePool>(cfg, eraser);

    PooledFile f(secure_pool, path("secret.dat"), false, 100, std::nullopt, -1);
    EXPECT_TRUE(f.secure_delete());

    EXPECT_CALL(*eraser, secure_erase(path("secret.dat"))).WillOnce(Return(false));
    EXPECT_NO_THROW(f.free());
    EXPECT_TRUE(f.is_closed());
}

TEST_F(PooledFileTest, FreeWhileLockedThrows) {
    PooledFile f(pool, path("locked.dat"), false, 100, std::nullopt, -1);
    auto lock = f.lock_open();

    EXPECT_THROW(f.free(), PoolStateError);
    EXPECT_TRUE(std::filesystem::exists(path("locked.dat")));
}

TEST_F(PooledFileTest, ConcurrentWritersOnDisjointRegions) {
    const size_t kRegion = 4096;
    const int kThreads = 8;
    PooledFile f(pool, path("shared.dat"), false, kRegion * kThreads, std::nullopt, -1);

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; t++) {
        threads.emplace_back([&, t]() {
            auto data = generate_test_data(kRegion, static_cast<uint8_t>(t * 31));
            for (int rep = 0; rep < 20; rep++) {
                f.pwrite(static_cast<int64_t>(t * kRegion), data.data(), 0, data.size());
            }
        });
    }
    for (auto& th : threads) th.join();

    for (int t = 0; t < kThreads; t++) {
        std::vector<uint8_t> buf(kRegion);
        f.pread(static_cast<int64_t>(t * kRegion), buf.data(), 0, buf.size());
        EXPECT_EQ(buf, generate_test_data(kRegion, static_cast<uint8_t>(t * 31)));
    }
}
