#include <gtest/gtest.h>
#include "core/errors.h"
#include "core/record_codec.h"
#include "core/symbol_log.h"
#include <filesystem>
#include <fstream>
#include <set>
#include <thread>
#include <atomic>

using namespace tickagg;
namespace fs = std::filesystem;

class SymbolLogTest : public ::testing::Test {
protected:
    fs::path dir_;
    std::string path_;

    // 2022-07-21T22:07:00Z
    const Timestamp minute_ = Timestamp(1658441220000);

    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               (std::string("tickagg_symbol_log_") +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
        path_ = (dir_ / "APPL.csv").string();
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    TickRecord tick(Price price, Timestamp recorded_at) {
        return TickRecord{"APPL", price, recorded_at - Timestamp(5), recorded_at};
    }

    std::vector<std::string> readLines() {
        std::ifstream in(path_);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
        return lines;
    }
};

TEST_F(SymbolLogTest, NewLogIsEmpty) {
    SymbolLog log(path_);

    EXPECT_TRUE(log.isEmpty());
    EXPECT_EQ(log.rowCount(), 0u);
    EXPECT_TRUE(log.scanWindow(minute_, 1).empty());
}

TEST_F(SymbolLogTest, FirstAppendWritesHeader) {
    SymbolLog log(path_);
    log.append(tick(172.5, minute_ + Timestamp(100)));
    log.append(tick(173.5, minute_ + Timestamp(200)));

    auto lines = readLines();
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], RecordCodec::tickHeader());
    EXPECT_EQ(lines[1], "APPL,172.5,1658441220095,1658441220100");
    EXPECT_FALSE(log.isEmpty());
    EXPECT_EQ(log.rowCount(), 2u);
}

TEST_F(SymbolLogTest, HeaderWrittenOnlyOnce) {
    SymbolLog log(path_);
    EXPECT_TRUE(log.writeHeaderIfEmpty());
    EXPECT_FALSE(log.writeHeaderIfEmpty());

    log.append(tick(10.0, minute_));

    auto lines = readLines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], RecordCodec::tickHeader());
    EXPECT_FALSE(log.isEmpty());
}

TEST_F(SymbolLogTest, HeaderOnlyLogHasNoRows) {
    SymbolLog log(path_);
    log.writeHeaderIfEmpty();

    EXPECT_TRUE(log.isEmpty());
    EXPECT_TRUE(log.scanWindow(minute_, 15).empty());
}

TEST_F(SymbolLogTest, WindowIsHalfOpen) {
    SymbolLog log(path_);
    log.append(tick(1.0, minute_ - Timestamp(1)));        // before
    log.append(tick(2.0, minute_));                       // at start: included
    log.append(tick(3.0, minute_ + Timestamp(59999)));    // last millisecond: included
    log.append(tick(4.0, minute_ + Timestamp(60000)));    // at end: excluded

    auto records = log.scanWindow(minute_ + Timestamp(30000), 1);

    ASSERT_EQ(records.size(), 2u);
    EXPECT_DOUBLE_EQ(records[0].price, 2.0);
    EXPECT_DOUBLE_EQ(records[1].price, 3.0);
}

TEST_F(SymbolLogTest, ReferenceTimeIsFlooredToMinute) {
    SymbolLog log(path_);
    log.append(tick(5.0, minute_ + Timestamp(10)));

    // Reference late in the minute still covers the whole minute
    auto records = log.scanWindow(minute_ + Timestamp(59999), 1);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_DOUBLE_EQ(records[0].price, 5.0);
}

TEST_F(SymbolLogTest, FifteenMinuteWindow) {
    SymbolLog log(path_);
    for (int i = 0; i < 20; ++i) {
        log.append(tick(100.0 + i, minute_ + std::chrono::minutes(i)));
    }

    auto records = log.scanWindow(minute_ + std::chrono::minutes(2), 15);

    ASSERT_EQ(records.size(), 15u);
    EXPECT_DOUBLE_EQ(records.front().price, 102.0);
    EXPECT_DOUBLE_EQ(records.back().price, 116.0);
}

TEST_F(SymbolLogTest, ScanIsIdempotent) {
    SymbolLog log(path_);
    log.append(tick(172.5, minute_ + Timestamp(1)));
    log.append(tick(173.5, minute_ + Timestamp(2)));

    auto first = log.scanWindow(minute_, 1);
    auto second = log.scanWindow(minute_, 1);

    EXPECT_EQ(first, second);
    EXPECT_EQ(first.size(), 2u);
}

TEST_F(SymbolLogTest, ScanKeepsAppendOrder) {
    SymbolLog log(path_);
    // observed_at deliberately out of order
    log.append(TickRecord{"APPL", 1.0, minute_ + Timestamp(50), minute_ + Timestamp(1)});
    log.append(TickRecord{"APPL", 2.0, minute_ + Timestamp(10), minute_ + Timestamp(2)});

    auto records = log.scanWindow(minute_, 1);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_DOUBLE_EQ(records[0].price, 1.0);
    EXPECT_DOUBLE_EQ(records[1].price, 2.0);
}

TEST_F(SymbolLogTest, ReopenCountsExistingRows) {
    {
        SymbolLog log(path_);
        log.append(tick(1.0, minute_));
        log.append(tick(2.0, minute_ + Timestamp(1)));
    }

    SymbolLog reopened(path_);
    EXPECT_FALSE(reopened.isEmpty());
    EXPECT_EQ(reopened.rowCount(), 2u);
    EXPECT_FALSE(reopened.writeHeaderIfEmpty());

    reopened.append(tick(3.0, minute_ + Timestamp(2)));
    auto lines = readLines();
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], RecordCodec::tickHeader());
    EXPECT_EQ(reopened.scanWindow(minute_, 1).size(), 3u);
}

TEST_F(SymbolLogTest, BlankLinesAreIgnored) {
    {
        std::ofstream out(path_);
        out << RecordCodec::tickHeader() << "\n"
            << "APPL,1.5,1658441220000,1658441220001\n"
            << "\n"
            << "APPL,2.5,1658441220002,1658441220003\r\n";
    }

    SymbolLog log(path_);
    auto records = log.scanWindow(minute_, 1);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_DOUBLE_EQ(records[1].price, 2.5);
}

TEST_F(SymbolLogTest, MalformedRowAbortsScan) {
    {
        std::ofstream out(path_);
        out << RecordCodec::tickHeader() << "\n"
            << "APPL,1.5,1658441220000,1658441220001\n"
            << "APPL,not-a-price,1658441220002,1658441220003\n";
    }

    SymbolLog log(path_);
    try {
        log.scanWindow(minute_, 1);
        FAIL() << "Expected MalformedRecord";
    } catch (const MalformedRecord& e) {
        EXPECT_EQ(e.line(), 3u);
    }
}

TEST_F(SymbolLogTest, RowWithWrongFieldCountIsMalformed) {
    {
        std::ofstream out(path_);
        out << "APPL,1.5,1658441220000\n";
    }

    SymbolLog log(path_);
    EXPECT_THROW(log.scanWindow(minute_, 1), MalformedRecord);
}

TEST_F(SymbolLogTest, NonPositiveWindowRejected) {
    SymbolLog log(path_);
    EXPECT_THROW(log.scanWindow(minute_, 0), std::invalid_argument);
    EXPECT_THROW(log.scanWindow(minute_, -1), std::invalid_argument);
}

TEST_F(SymbolLogTest, ConcurrentAppendsDoNotInterleave) {
    SymbolLog log(path_);

    const int threads = 8;
    const int per_thread = 200;
    std::vector<std::thread> writers;

    for (int t = 0; t < threads; ++t) {
        writers.emplace_back([&log, t, this]() {
            for (int i = 0; i < per_thread; ++i) {
                log.append(TickRecord{"APPL", t * 1000.0 + i, minute_, minute_ + Timestamp(t)});
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }

    // Every row parses; nothing lost or duplicated
    auto records = log.scanWindow(minute_, 1);
    ASSERT_EQ(records.size(), static_cast<size_t>(threads * per_thread));
    EXPECT_EQ(log.rowCount(), static_cast<uint64_t>(threads * per_thread));

    std::set<double> prices;
    for (const auto& record : records) {
        EXPECT_EQ(record.symbol, "APPL");
        prices.insert(record.price);
    }
    EXPECT_EQ(prices.size(), static_cast<size_t>(threads * per_thread));

    auto lines = readLines();
    EXPECT_EQ(lines[0], RecordCodec::tickHeader());
}

TEST_F(SymbolLogTest, ScanDuringAppendsSeesPrefix) {
    SymbolLog log(path_);
    std::atomic<bool> done{false};

    std::thread writer([&]() {
        for (int i = 0; i < 500; ++i) {
            log.append(tick(static_cast<double>(i), minute_ + Timestamp(i)));
        }
        done = true;
    });

    while (!done) {
        auto records = log.scanWindow(minute_, 1);
        for (size_t i = 0; i < records.size(); ++i) {
            EXPECT_DOUBLE_EQ(records[i].price, static_cast<double>(i));
        }
    }
    writer.join();

    EXPECT_EQ(log.scanWindow(minute_, 1).size(), 500u);
}
