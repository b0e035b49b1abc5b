/*
 * test_framework.cpp - Implementation of the PsyDec test harness
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "test_framework.h"
#include <iostream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace TestFramework {

    namespace {

        std::string lowerCase(std::string text) {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return text;
        }

        std::vector<std::string> splitFilter(const char* value) {
            std::vector<std::string> filters;
            std::stringstream ss(value ? value : "");
            std::string item;
            while (std::getline(ss, item, ',')) {
                if (!item.empty()) {
                    filters.push_back(item);
                }
            }
            return filters;
        }

        const char* resultLabel(TestResult result) {
            switch (result) {
                case TestResult::PASSED: return "PASSED";
                case TestResult::FAILED: return "FAILED";
                case TestResult::ERROR: return "ERROR";
                case TestResult::SKIPPED: return "SKIPPED";
            }
            return "UNKNOWN";
        }

    } // namespace

    void fail(const char* file, int line, const std::string& message, const std::string& detail) {
        std::ostringstream oss;
        oss << "ASSERTION FAILED: " << message << " at " << file << ":" << line << " - " << detail;
        throw AssertionFailure(oss.str());
    }

    // ========================================
    // TEST CASE IMPLEMENTATION
    // ========================================

    TestCase::TestCase(const std::string& name, std::function<void()> test_func)
        : m_name(name), m_test_func(std::move(test_func)) {
    }

    TestInfo TestCase::run() const {
        TestInfo info(m_name);
        auto start_time = std::chrono::steady_clock::now();

        try {
            m_test_func();
            info.result = TestResult::PASSED;
        } catch (const AssertionFailure& e) {
            info.result = TestResult::FAILED;
            info.failure_message = e.what();
        } catch (const TestSkipped& e) {
            info.result = TestResult::SKIPPED;
            info.failure_message = e.what();
        } catch (const std::exception& e) {
            info.result = TestResult::ERROR;
            info.failure_message = std::string("Unexpected ") + typeid(e).name() + ": " + e.what();
        }

        info.execution_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        return info;
    }

    // ========================================
    // TEST SUITE IMPLEMENTATION
    // ========================================

    TestSuite::TestSuite(const std::string& name) : m_name(name) {
    }

    void TestSuite::addTest(const std::string& name, std::function<void()> test_func) {
        if (test_func) {
            m_tests.emplace_back(name, std::move(test_func));
        }
    }

    bool TestSuite::matches(const std::string& test_name, const std::vector<std::string>& filters) {
        if (filters.empty()) {
            return true;
        }
        const std::string name = lowerCase(test_name);
        return std::any_of(filters.begin(), filters.end(), [&name](const std::string& filter) {
            return name.find(lowerCase(filter)) != std::string::npos;
        });
    }

    std::vector<TestInfo> TestSuite::runAll() {
        return runMatching(splitFilter(std::getenv("PSYDEC_TEST_FILTER")));
    }

    std::vector<TestInfo> TestSuite::runAll(int argc, char* argv[]) {
        std::vector<std::string> filters;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--list") {
                for (const auto& test : m_tests) {
                    std::cout << test.getName() << std::endl;
                }
                return {};
            }
            filters.push_back(arg);
        }
        return filters.empty() ? runAll() : runMatching(filters);
    }

    std::vector<TestInfo> TestSuite::runMatching(const std::vector<std::string>& filters) {
        std::vector<TestInfo> results;
        results.reserve(m_tests.size());

        std::cout << "Running test suite: " << m_name << std::endl;
        std::cout << "===================" << std::string(m_name.length(), '=') << std::endl;

        for (const auto& test : m_tests) {
            if (!matches(test.getName(), filters)) {
                continue;
            }
            std::cout << "Running " << test.getName() << "... ";
            std::cout.flush();

            TestInfo result = test.run();
            std::cout << resultLabel(result.result);
            if (result.result == TestResult::SKIPPED) {
                std::cout << " (" << result.failure_message << ")" << std::endl;
            } else {
                std::cout << " (" << result.execution_time.count() << "ms)" << std::endl;
                if (!result.failure_message.empty()) {
                    std::cout << "  Error: " << result.failure_message << std::endl;
                }
            }
            results.push_back(std::move(result));
        }

        if (results.empty() && !filters.empty()) {
            std::cout << "No test matches the filter" << std::endl;
        }
        return results;
    }

    void TestSuite::printResults(const std::vector<TestInfo>& results) const {
        const int failed = getFailureCount(results);

        std::cout << std::endl;
        std::cout << m_name << ": " << getPassedCount(results) << " passed, " << failed << " failed, "
                  << getSkippedCount(results) << " skipped of " << results.size() << " in "
                  << getTotalTime(results).count() << "ms" << std::endl;

        for (const auto& result : results) {
            if (result.result == TestResult::FAILED || result.result == TestResult::ERROR) {
                std::cout << "  " << resultLabel(result.result) << ": " << result.name << std::endl;
                std::cout << "    " << result.failure_message << std::endl;
            }
        }
    }

    // Errors count as failures so an unexpected exception fails the executable
    int TestSuite::getFailureCount(const std::vector<TestInfo>& results) const {
        return static_cast<int>(std::count_if(results.begin(), results.end(),
            [](const TestInfo& info) {
                return info.result == TestResult::FAILED || info.result == TestResult::ERROR;
            }));
    }

    int TestSuite::getPassedCount(const std::vector<TestInfo>& results) const {
        return static_cast<int>(std::count_if(results.begin(), results.end(),
            [](const TestInfo& info) { return info.result == TestResult::PASSED; }));
    }

    int TestSuite::getSkippedCount(const std::vector<TestInfo>& results) const {
        return static_cast<int>(std::count_if(results.begin(), results.end(),
            [](const TestInfo& info) { return info.result == TestResult::SKIPPED; }));
    }

    std::chrono::milliseconds TestSuite::getTotalTime(const std::vector<TestInfo>& results) const {
        std::chrono::milliseconds total(0);
        for (const auto& result : results) {
            total += result.execution_time;
        }
        return total;
    }

} // namespace TestFramework
