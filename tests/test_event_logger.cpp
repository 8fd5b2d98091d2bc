// ---------------------------------------------------------------------------
// test_event_logger.cpp
//
// EventLogger 단위 테스트
// ---------------------------------------------------------------------------

#include "logger/event_logger.hpp"
#include "logger/log_types.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

class EventLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto unique_name =
            std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
        log_dir_  = fs::temp_directory_path() / "migsafe_test_logs" / unique_name;
        log_path_ = log_dir_ / "events.log";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(log_dir_, ec);
    }

    std::vector<std::string> read_lines() const {
        std::vector<std::string> lines;
        std::ifstream            in(log_path_);
        std::string              line;
        while (std::getline(in, line)) {
            if (!line.empty()) {
                lines.push_back(line);
            }
        }
        return lines;
    }

    fs::path log_dir_;
    fs::path log_path_;
};

// ---------------------------------------------------------------------------
// 생성: 상위 디렉터리 자동 생성
// ---------------------------------------------------------------------------
TEST_F(EventLoggerTest, CreatesParentDirectory) {
    {
        EventLogger logger(log_path_);
    }
    EXPECT_TRUE(fs::exists(log_dir_));
}

TEST_F(EventLoggerTest, InvalidPath_Throws) {
    fs::create_directories(log_dir_);
    const auto blocker = log_dir_ / "not_a_dir";
    std::ofstream(blocker) << "x";

    EXPECT_THROW({ EventLogger logger(blocker / "events.log"); }, std::runtime_error);
}

// ---------------------------------------------------------------------------
// 이벤트 직렬화
// ---------------------------------------------------------------------------
TEST_F(EventLoggerTest, FileScannedEvent) {
    {
        EventLogger logger(log_path_);
        logger.log_file_scanned(FileScanLog{
            .path       = "migrations/001.sql",
            .statements = 4,
            .findings   = 2,
            .risk_score = 75,
            .timestamp  = std::chrono::system_clock::now(),
            .duration   = std::chrono::microseconds{1234},
        });
    }

    const auto lines = read_lines();
    ASSERT_EQ(lines.size(), 1u);
    const auto& line = lines[0];
    EXPECT_EQ(line.front(), '{');
    EXPECT_EQ(line.back(), '}');
    EXPECT_NE(line.find(R"("event":"file_scanned")"), std::string::npos);
    EXPECT_NE(line.find(R"("path":"migrations/001.sql")"), std::string::npos);
    EXPECT_NE(line.find(R"("statements":4)"), std::string::npos);
    EXPECT_NE(line.find(R"("findings":2)"), std::string::npos);
    EXPECT_NE(line.find(R"("risk_score":75)"), std::string::npos);
    EXPECT_NE(line.find(R"("duration_us":1234)"), std::string::npos);
    EXPECT_NE(line.find(R"("timestamp":")"), std::string::npos);
}

TEST_F(EventLoggerTest, FindingEvent_NullLockMs) {
    {
        EventLogger logger(log_path_);
        logger.log_finding(FindingLog{
            .path      = "a.sql",
            .rule_id   = "LCK001",
            .severity  = "critical",
            .line      = 12,
            .lock_type = "ACCESS EXCLUSIVE",
            .lock_ms   = std::nullopt,
            .timestamp = std::chrono::system_clock::now(),
        });
        logger.log_finding(FindingLog{
            .path      = "a.sql",
            .rule_id   = "BAN001",
            .severity  = "critical",
            .line      = 3,
            .lock_type = "ACCESS EXCLUSIVE",
            .lock_ms   = 110,
            .timestamp = std::chrono::system_clock::now(),
        });
    }

    const auto lines = read_lines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find(R"("rule_id":"LCK001")"), std::string::npos);
    EXPECT_NE(lines[0].find(R"("line":12)"), std::string::npos);
    EXPECT_NE(lines[0].find(R"("lock_ms":null)"), std::string::npos);
    EXPECT_NE(lines[1].find(R"("lock_ms":110)"), std::string::npos);
}

TEST_F(EventLoggerTest, FileErrorEvent_Escaped) {
    {
        EventLogger logger(log_path_);
        logger.log_file_error(FileErrorLog{
            .path      = "bad\"name.sql",
            .reason    = "cannot open\nfile",
            .timestamp = std::chrono::system_clock::now(),
        });
    }

    const auto lines = read_lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find(R"("event":"file_error")"), std::string::npos);
    EXPECT_NE(lines[0].find(R"("path":"bad\"name.sql")"), std::string::npos);
    EXPECT_NE(lines[0].find(R"("reason":"cannot open\nfile")"), std::string::npos);
}

// ---------------------------------------------------------------------------
// 동시 기록: 줄 단위로 섞이지 않아야 한다
// ---------------------------------------------------------------------------
TEST_F(EventLoggerTest, MultithreadedLoggingNoCrash) {
    constexpr int kThreads = 4;
    constexpr int kPerThread = 50;
    {
        EventLogger logger(log_path_);
        std::vector<std::thread> workers;
        for (int t = 0; t < kThreads; ++t) {
            workers.emplace_back([&logger, t] {
                for (int i = 0; i < kPerThread; ++i) {
                    logger.log_file_scanned(FileScanLog{
                        .path      = "f" + std::to_string(t) + "_" + std::to_string(i) + ".sql",
                        .timestamp = std::chrono::system_clock::now(),
                    });
                }
            });
        }
        for (auto& w : workers) {
            w.join();
        }
        logger.flush();
    }

    const auto lines = read_lines();
    ASSERT_EQ(lines.size(), static_cast<std::size_t>(kThreads * kPerThread));
    for (const auto& line : lines) {
        EXPECT_EQ(line.front(), '{');
        EXPECT_EQ(line.back(), '}');
    }
}
