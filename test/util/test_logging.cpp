/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The zksnap project is free software: you can redistribute it
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
#include "util/log.h"
#include "util/logmanager.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace zksnap {

class LoggingTest : public ::testing::Test {
protected:
    int original_log_level;
    std::string test_log_dir;
    std::string test_log_file;

    void SetUp() override {
        original_log_level = logLevel;

        test_log_dir = "/tmp/zksnap_logging_test_" + std::to_string(getpid());
        std::filesystem::create_directories(test_log_dir);
        test_log_file = test_log_dir + "/test.log";
    }

    void TearDown() override {
        logLevel = original_log_level;
        std::filesystem::remove_all(test_log_dir);
        unsetenv("ZKSNAP_LOG_LEVEL");
    }

    std::string readFile(const std::string& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    bool containsLogMessage(const std::string& content, const std::string& level,
                            const std::string& message) {
        std::regex re("\\[" + level + "\\].*" + message);
        return std::regex_search(content, re);
    }
};

TEST_F(LoggingTest, LevelNames) {
    EXPECT_STREQ(logLevelToString(LOG_TRACE), "TRACE");
    EXPECT_STREQ(logLevelToString(LOG_DEBUG), "DEBUG");
    EXPECT_STREQ(logLevelToString(LOG_INFO), "INFO");
    EXPECT_STREQ(logLevelToString(LOG_WARNING), "WARNING");
    EXPECT_STREQ(logLevelToString(LOG_ERROR), "ERROR");
    EXPECT_STREQ(logLevelToString(LOG_SEVERE), "SEVERE");
}

TEST_F(LoggingTest, SetLevelFromString) {
    EXPECT_TRUE(setLogLevelFromString("debug"));
    EXPECT_EQ(logLevel.load(), LOG_DEBUG);

    EXPECT_TRUE(setLogLevelFromString("WARN"));
    EXPECT_EQ(logLevel.load(), LOG_WARNING);

    EXPECT_TRUE(setLogLevelFromString("Fatal"));
    EXPECT_EQ(logLevel.load(), LOG_SEVERE);

    EXPECT_FALSE(setLogLevelFromString("chatty"));
    EXPECT_EQ(logLevel.load(), LOG_SEVERE);  // unchanged
}

TEST_F(LoggingTest, InitFromEnvironment) {
    setenv("ZKSNAP_LOG_LEVEL", "trace", 1);
    initLoggingFromEnv();
    EXPECT_EQ(logLevel.load(), LOG_TRACE);

    // Invalid value keeps the current level
    setenv("ZKSNAP_LOG_LEVEL", "nonsense", 1);
    initLoggingFromEnv();
    EXPECT_EQ(logLevel.load(), LOG_TRACE);
}

TEST_F(LoggingTest, IsLogEnabled) {
    logLevel = LOG_WARNING;
    EXPECT_FALSE(isLogEnabled(LOG_DEBUG));
    EXPECT_FALSE(isLogEnabled(LOG_INFO));
    EXPECT_TRUE(isLogEnabled(LOG_WARNING));
    EXPECT_TRUE(isLogEnabled(LOG_SEVERE));
}

TEST_F(LoggingTest, LogManagerWritesFile) {
    logLevel = LOG_INFO;
    {
        LogManager lm(test_log_file);
        EXPECT_EQ(lm.path(), test_log_file);
        info() << "loaded " << 42 << " nodes";
        debug() << "filtered out";
        warning() << "odd trailer";
        severe() << "giving up";
    }

    std::string content = readFile(test_log_file);
    EXPECT_TRUE(containsLogMessage(content, "INFO", "loaded 42 nodes"));
    EXPECT_TRUE(containsLogMessage(content, "WARNING", "odd trailer"));
    EXPECT_TRUE(containsLogMessage(content, "SEVERE", "giving up"));
    EXPECT_EQ(content.find("filtered out"), std::string::npos);
}

TEST_F(LoggingTest, LogManagerAppendsOnReopen) {
    logLevel = LOG_INFO;
    {
        LogManager lm(test_log_file);
        info() << "first run";
    }
    {
        LogManager lm(test_log_file);
        info() << "second run";
    }

    std::string content = readFile(test_log_file);
    EXPECT_NE(content.find("first run"), std::string::npos);
    EXPECT_NE(content.find("LOG REOPENED"), std::string::npos);
    EXPECT_NE(content.find("second run"), std::string::npos);
}

TEST_F(LoggingTest, LogManagerRejectsDirectory) {
    EXPECT_THROW(LogManager lm(test_log_dir), std::runtime_error);
}

TEST_F(LoggingTest, ThreadsWriteWholeLines) {
    logLevel = LOG_INFO;
    const int kThreads = 4;
    const int kLines = 50;
    {
        LogManager lm(test_log_file);
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; t++) {
            threads.emplace_back([t] {
                Logger::get().setThreadName("worker" + std::to_string(t));
                for (int i = 0; i < kLines; i++) {
                    info() << "line " << i << " end";
                }
            });
        }
        for (auto& th : threads) th.join();
    }

    std::ifstream in(test_log_file);
    std::string line;
    int count = 0;
    std::regex whole("^\\S+ \\[INFO\\] \\[worker[0-9]\\] line [0-9]+ end$");
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        EXPECT_TRUE(std::regex_match(line, whole)) << line;
        count++;
    }
    EXPECT_EQ(count, kThreads * kLines);
}

} // namespace zksnap
