// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file test_gtest.cpp
 * @brief Test runner: GoogleTest main with a file-logging listener.
 *
 * Test cases live in the other test_*.cpp files of this directory. The
 * report goes to $NANOLSP_TEST_LOG (default testlog.txt). Client logging
 * is silenced unless NANOLSP_LOG_LEVEL asks for it.
 */

#include <gtest/gtest.h>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "nanolsp/lsp_client.hpp"
#include "nanolsp/lsp_log.hpp"

// Writes one line per test and a failure digest at the end.
class FileTestListener : public ::testing::EmptyTestEventListener {
private:
    std::ofstream log_file_;
    std::chrono::steady_clock::time_point test_start_time_;
    std::vector<std::string> failures_;

public:
    explicit FileTestListener(const std::string& filename) {
        log_file_.open(filename);
        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

        std::tm tm_buf;
        localtime_r(&now, &tm_buf);

        log_file_ << "# nanolsp " << nanolsp::kClientVersion << " test run\n";
        log_file_ << "# date:      " << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "\n";
        log_file_ << "# log level: " << nanolsp::ToString(nanolsp::GetLogLevel()) << "\n\n";
    }

    void OnTestSuiteStart(const ::testing::TestSuite& test_suite) override {
        log_file_ << test_suite.name() << " (" << test_suite.test_to_run_count() << ")\n";
    }

    void OnTestStart(const ::testing::TestInfo&) override {
        test_start_time_ = std::chrono::steady_clock::now();
    }

    void OnTestEnd(const ::testing::TestInfo& test_info) override {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - test_start_time_).count();

        const bool passed = test_info.result()->Passed();
        log_file_ << (passed ? "  ok    " : "  FAIL  ") << test_info.name() << " " << ms << "ms\n";
        if (passed) return;

        const std::string full = std::string(test_info.test_suite_name()) + "." + test_info.name();
        failures_.push_back(full);
        for (int i = 0; i < test_info.result()->total_part_count(); ++i) {
            const auto& part = test_info.result()->GetTestPartResult(i);
            if (!part.failed()) continue;
            log_file_ << "        " << (part.file_name() ? part.file_name() : "?") << ":"
                      << part.line_number() << ": " << part.summary() << "\n";
        }
    }

    void OnTestSuiteEnd(const ::testing::TestSuite&) override {
        log_file_ << "\n";
    }

    void OnTestProgramEnd(const ::testing::UnitTest& unit_test) override {
        log_file_ << unit_test.successful_test_count() << "/" << unit_test.test_to_run_count()
                  << " passed in " << unit_test.elapsed_time() << " ms\n";
        if (failures_.empty()) return;

        log_file_ << "\nfailed:\n";
        for (const auto& name : failures_) log_file_ << "  " << name << "\n";
    }
};

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    const char* level = std::getenv("NANOLSP_LOG_LEVEL");
    nanolsp::SetLogLevel(level ? nanolsp::ParseLogLevel(level, nanolsp::LogLevel::Off) : nanolsp::LogLevel::Off);

    const char* logEnv = std::getenv("NANOLSP_TEST_LOG");
    const std::string logPath = (logEnv && *logEnv) ? logEnv : "testlog.txt";

    ::testing::UnitTest::GetInstance()->listeners().Append(new FileTestListener(logPath));

    const int result = RUN_ALL_TESTS();
    std::cout << "\nTest report written to " << logPath << "\n";
    return result;
}
