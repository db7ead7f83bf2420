/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include <gtest/gtest.h>
#include "../../src/util/log.h"
#include "../../src/util/logmanager.h"
#include <fstream>
#include <filesystem>
#include <functional>
#include <iterator>
#include <thread>
#include <unistd.h>
#include <cstdio>

namespace dualwrite {

class LoggingTest : public ::testing::Test {
protected:
    int original_log_level;
    std::string test_log_dir;

    void SetUp() override {
        original_log_level = logLevel;
        test_log_dir = "/tmp/dualwrite_logging_test_" + std::to_string(getpid());
        std::filesystem::create_directories(test_log_dir);
    }

    void TearDown() override {
        logLevel = original_log_level;
        std::filesystem::remove_all(test_log_dir);
        unsetenv("LOG_LEVEL");
    }

    std::string readFile(const std::string& path) {
        std::ifstream file(path);
        return std::string((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
    }

    std::string captureStderr(const std::function<void()>& func) {
        std::string tmp_file = test_log_dir + "/capture.log";
        fflush(stderr);
        int saved_stderr = dup(STDERR_FILENO);
        FILE* temp = fopen(tmp_file.c_str(), "w");
        if (!temp) return "";
        dup2(fileno(temp), STDERR_FILENO);

        func();

        fflush(stderr);
        fclose(temp);
        dup2(saved_stderr, STDERR_FILENO);
        close(saved_stderr);

        std::string content = readFile(tmp_file);
        std::filesystem::remove(tmp_file);
        return content;
    }
};

TEST_F(LoggingTest, SetLogLevelFromString) {
    EXPECT_TRUE(setLogLevelFromString("TRACE"));
    EXPECT_EQ(logLevel, LOG_TRACE);
    EXPECT_TRUE(setLogLevelFromString("info"));
    EXPECT_EQ(logLevel, LOG_INFO);
    EXPECT_TRUE(setLogLevelFromString("Warn"));
    EXPECT_EQ(logLevel, LOG_WARNING);
    EXPECT_TRUE(setLogLevelFromString("FATAL"));
    EXPECT_EQ(logLevel, LOG_SEVERE);

    EXPECT_FALSE(setLogLevelFromString("LOUD"));
    EXPECT_EQ(logLevel, LOG_SEVERE);
}

TEST_F(LoggingTest, SetLogLevelFromEnvironment) {
    setenv("LOG_LEVEL", "DEBUG", 1);
    initLoggingFromEnv();
    EXPECT_EQ(logLevel, LOG_DEBUG);

    int current_level = logLevel;
    setenv("LOG_LEVEL", "NOISY", 1);
    std::string output = captureStderr([] { initLoggingFromEnv(); });
    EXPECT_EQ(logLevel, current_level);
    EXPECT_NE(output.find("ignoring LOG_LEVEL 'NOISY'"), std::string::npos);
}

TEST_F(LoggingTest, FilteredLevelsProduceNoOutput) {
    logLevel = LOG_WARNING;
    std::string output = captureStderr([] {
        debug() << "retry drained";
        info() << "operation committed";
        warning() << "secondary write failed for cart/c-1";
    });
    EXPECT_EQ(output.find("retry drained"), std::string::npos);
    EXPECT_EQ(output.find("operation committed"), std::string::npos);
    EXPECT_NE(output.find("[WARNING] secondary write failed for cart/c-1"), std::string::npos);
}

TEST_F(LoggingTest, PendingTextClearsOnFlush) {
    logLevel = LOG_INFO;
    std::string output = captureStderr([] {
        Logger& logger = Logger::get();
        const Logger& view = logger;
        EXPECT_FALSE(view.hasPending());
        logger << "ledger " << 3 << " entries";
        EXPECT_TRUE(view.hasPending());
        logger.flush();
        EXPECT_FALSE(view.hasPending());
        // an empty wrapper statement writes nothing
        { info(); }
    });
    EXPECT_NE(output.find("ledger 3 entries\n"), std::string::npos);
    EXPECT_EQ(output.find("[INFO] \n"), std::string::npos);
}

TEST_F(LoggingTest, ThreadNameAppearsInOutput) {
    logLevel = LOG_INFO;
    std::string output = captureStderr([] {
        std::thread t([] {
            setLogThreadName("retry-drain");
            info() << "worker line";
        });
        t.join();
    });
    EXPECT_NE(output.find("[retry-drain] [INFO] worker line"), std::string::npos);
}

TEST_F(LoggingTest, ConcurrentWritersKeepLinesWhole) {
    logLevel = LOG_INFO;
    const int num_threads = 8;
    const int messages_per_thread = 50;
    std::string output = captureStderr([&] {
        std::vector<std::thread> threads;
        for (int i = 0; i < num_threads; ++i) {
            threads.emplace_back([i, messages_per_thread]() {
                for (int j = 0; j < messages_per_thread; ++j) {
                    info() << "writer " << i << " message " << j << " end";
                }
            });
        }
        for (auto& t : threads) t.join();
    });

    size_t lines = 0;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        if (line.find("writer ") == std::string::npos) continue;
        lines++;
        EXPECT_EQ(line.compare(line.size() - 3, 3, "end"), 0) << line;
    }
    EXPECT_EQ(lines, static_cast<size_t>(num_threads * messages_per_thread));
}

TEST_F(LoggingTest, LogManagerFileOutput) {
    logLevel = LOG_INFO;
    {
        LogManager log_mgr(test_log_dir);
        info() << "test message to file";
        warning() << "warning to file";
    }

    std::string log_path = test_log_dir + "/dualwrite.log";
    ASSERT_TRUE(std::filesystem::exists(log_path));
    std::string content = readFile(log_path);
    EXPECT_NE(content.find("test message to file"), std::string::npos);
    EXPECT_NE(content.find("warning to file"), std::string::npos);
}

TEST_F(LoggingTest, RestartBannerOnAppend) {
    logLevel = LOG_INFO;
    {
        LogManager log_mgr(test_log_dir);
        info() << "first run";
    }
    {
        LogManager log_mgr(test_log_dir);
        info() << "second run";
    }
    std::string content = readFile(test_log_dir + "/dualwrite.log");
    size_t first = content.find("first run");
    size_t banner = content.find("SERVICE RESTARTED");
    size_t second = content.find("second run");
    ASSERT_NE(first, std::string::npos);
    ASSERT_NE(banner, std::string::npos);
    ASSERT_NE(second, std::string::npos);
    EXPECT_LT(first, banner);
    EXPECT_LT(banner, second);
}

TEST_F(LoggingTest, LogRotation) {
    logLevel = LOG_INFO;
    {
        LogManager log_mgr(test_log_dir);
        info() << "before rotation";
        log_mgr.rotate();
        info() << "after rotation";
        EXPECT_FALSE(log_mgr.rotateIfLarger(1ull << 30));
    }

    std::string current = readFile(test_log_dir + "/dualwrite.log");
    EXPECT_NE(current.find("after rotation"), std::string::npos);
    EXPECT_EQ(current.find("before rotation"), std::string::npos);

    bool found_rotated = false;
    for (const auto& entry : std::filesystem::directory_iterator(test_log_dir)) {
        if (entry.path().filename().string().rfind("dualwrite.log.", 0) == 0) {
            found_rotated = true;
            EXPECT_NE(readFile(entry.path().string()).find("before rotation"), std::string::npos);
        }
    }
    EXPECT_TRUE(found_rotated);
}

TEST_F(LoggingTest, ErrnoDescription) {
    std::string s = errnoWithDescription(ENOENT);
    EXPECT_NE(s.find("errno:2"), std::string::npos);
    EXPECT_NE(s.find(strerror(ENOENT)), std::string::npos);
}

} // namespace dualwrite
