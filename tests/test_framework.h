/*
 * test_framework.h - Common test framework for the PsyDec test harness
 * This file is part of PsyDec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * PsyDec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TEST_FRAMEWORK_H
#define TEST_FRAMEWORK_H

#include <string>
#include <vector>
#include <memory>
#include <iostream>
#include <sstream>
#include <exception>
#include <chrono>
#include <functional>
#include <typeinfo>
#include <cmath>
#include <cstddef>

namespace TestFramework {

    // ========================================
    // ASSERTION MACROS
    // ========================================

    /**
     * @brief Throw an AssertionFailure with location and detail
     */
    [[noreturn]] void fail(const char* file, int line, const std::string& message, const std::string& detail);

    #define ASSERT_TRUE(condition, message) \
        do { \
            if (!(condition)) { \
                TestFramework::fail(__FILE__, __LINE__, (message), "Expected: true, Got: false"); \
            } \
        } while(0)

    #define ASSERT_FALSE(condition, message) \
        do { \
            if ((condition)) { \
                TestFramework::fail(__FILE__, __LINE__, (message), "Expected: false, Got: true"); \
            } \
        } while(0)

    /**
     * @brief Assert that two values are equal
     *
     * Both values must be streamable so the failure can show them.
     */
    #define ASSERT_EQUALS(expected, actual, message) \
        do { \
            if (!((expected) == (actual))) { \
                std::ostringstream detail_; \
                detail_ << "Expected: " << (expected) << ", Got: " << (actual); \
                TestFramework::fail(__FILE__, __LINE__, (message), detail_.str()); \
            } \
        } while(0)

    #define ASSERT_NOT_EQUALS(expected, actual, message) \
        do { \
            if ((expected) == (actual)) { \
                std::ostringstream detail_; \
                detail_ << "Expected values to differ, both were: " << (actual); \
                TestFramework::fail(__FILE__, __LINE__, (message), detail_.str()); \
            } \
        } while(0)

    /**
     * @brief Assert that two numbers agree within an absolute tolerance
     */
    #define ASSERT_NEAR(expected, actual, tolerance, message) \
        do { \
            double expected_ = static_cast<double>(expected); \
            double actual_ = static_cast<double>(actual); \
            if (!(std::fabs(expected_ - actual_) <= static_cast<double>(tolerance))) { \
                std::ostringstream detail_; \
                detail_ << "Expected: " << expected_ << " +/- " << (tolerance) << ", Got: " << actual_; \
                TestFramework::fail(__FILE__, __LINE__, (message), detail_.str()); \
            } \
        } while(0)

    /**
     * @brief Assert that two sample buffers agree element by element
     *
     * Reports the first index outside the tolerance.
     */
    #define ASSERT_BUFFER_NEAR(expected, actual, count, tolerance, message) \
        do { \
            size_t index_ = TestFramework::firstMismatch((expected), (actual), (count), (tolerance)); \
            if (index_ < static_cast<size_t>(count)) { \
                std::ostringstream detail_; \
                detail_ << "Index " << index_ << " Expected: " << (expected)[index_] << " +/- " \
                        << (tolerance) << ", Got: " << (actual)[index_]; \
                TestFramework::fail(__FILE__, __LINE__, (message), detail_.str()); \
            } \
        } while(0)

    #define ASSERT_NOT_NULL(ptr, message) \
        do { \
            if ((ptr) == nullptr) { \
                TestFramework::fail(__FILE__, __LINE__, (message), "Expected: non-null pointer, Got: null"); \
            } \
        } while(0)

    /**
     * @brief Assert that an expression throws some std::exception
     */
    #define ASSERT_THROWS(expression, message) \
        do { \
            bool thrown_ = false; \
            try { \
                (void)(expression); \
            } catch (const std::exception&) { \
                thrown_ = true; \
            } \
            if (!thrown_) { \
                TestFramework::fail(__FILE__, __LINE__, (message), "Expected an exception"); \
            } \
        } while(0)

    // Index of the first pair further apart than `tolerance`, or `count`
    template<typename A, typename B>
    size_t firstMismatch(const A& expected, const B& actual, size_t count, double tolerance) {
        for (size_t i = 0; i < count; ++i) {
            double difference = static_cast<double>(expected[i]) - static_cast<double>(actual[i]);
            if (!(std::fabs(difference) <= tolerance)) {
                return i;
            }
        }
        return count;
    }

    // ========================================
    // EXCEPTION CLASSES
    // ========================================

    class AssertionFailure : public std::exception {
    public:
        explicit AssertionFailure(const std::string& message) : m_message(message) {}
        const char* what() const noexcept override { return m_message.c_str(); }
    private:
        std::string m_message;
    };

    /**
     * @brief Thrown by a test that cannot run in this build
     *
     * Tests that need an optional library (libopus, libvorbisenc,
     * RapidCheck) throw this when it was not found at configure time.
     */
    class TestSkipped : public std::exception {
    public:
        explicit TestSkipped(const std::string& reason) : m_reason(reason) {}
        const char* what() const noexcept override { return m_reason.c_str(); }
    private:
        std::string m_reason;
    };

    // ========================================
    // TEST RESULT STRUCTURES
    // ========================================

    enum class TestResult {
        PASSED,     ///< Test completed successfully
        FAILED,     ///< Test failed with assertion error
        ERROR,      ///< Test failed with unexpected error
        SKIPPED     ///< Test was skipped
    };

    struct TestInfo {
        std::string name;
        TestResult result;
        std::string failure_message;                ///< Failure text or skip reason
        std::chrono::milliseconds execution_time;

        explicit TestInfo(const std::string& test_name)
            : name(test_name), result(TestResult::PASSED), execution_time(0) {}
    };

    // ========================================
    // TEST CASE
    // ========================================

    /**
     * @brief One named test.
     *
     * run() turns AssertionFailure into FAILED, TestSkipped into SKIPPED and
     * any other std::exception (a DecoderException escaping a test, say)
     * into ERROR.
     */
    class TestCase {
    public:
        TestCase(const std::string& name, std::function<void()> test_func);

        TestInfo run() const;
        const std::string& getName() const { return m_name; }

    private:
        std::string m_name;
        std::function<void()> m_test_func;
    };

    // ========================================
    // TEST SUITE CLASS
    // ========================================

    /**
     * @brief Ordered list of tests with filtering and reporting.
     *
     * runAll(argc, argv) treats each argument as a name filter: a test runs
     * if its name contains any of them (case-insensitive). With no
     * arguments, the PSYDEC_TEST_FILTER environment variable is used the same
     * way. "--list" prints the test names and runs nothing.
     */
    class TestSuite {
    public:
        explicit TestSuite(const std::string& name);

        void addTest(const std::string& name, std::function<void()> test_func);

        std::vector<TestInfo> runAll();
        std::vector<TestInfo> runAll(int argc, char* argv[]);
        std::vector<TestInfo> runMatching(const std::vector<std::string>& filters);

        void printResults(const std::vector<TestInfo>& results) const;

        int getFailureCount(const std::vector<TestInfo>& results) const;
        int getPassedCount(const std::vector<TestInfo>& results) const;
        int getSkippedCount(const std::vector<TestInfo>& results) const;
        std::chrono::milliseconds getTotalTime(const std::vector<TestInfo>& results) const;

        const std::string& getName() const { return m_name; }
        size_t getTestCount() const { return m_tests.size(); }

        static bool matches(const std::string& test_name, const std::vector<std::string>& filters);

    private:
        std::string m_name;
        std::vector<TestCase> m_tests;
    };

    // ========================================
    // COMMON TEST PATTERNS
    // ========================================

    namespace TestPatterns {

        /**
         * @brief Test a function that should throw a specific exception
         * @param test_func Function to test
         * @param expected_message Substring the exception message must contain (optional)
         * @param message Descriptive message for failure
         */
        template<typename ExceptionType>
        void assertThrows(std::function<void()> test_func, const std::string& expected_message = "",
                          const std::string& message = "Expected exception was not thrown") {
            try {
                test_func();
            } catch (const ExceptionType& e) {
                std::string actual_message = e.what();
                if (!expected_message.empty() && actual_message.find(expected_message) == std::string::npos) {
                    std::ostringstream oss;
                    oss << "Exception message mismatch - Expected to contain: '"
                        << expected_message << "', Got: '" << actual_message << "'";
                    throw AssertionFailure(oss.str());
                }
                return;
            } catch (const std::exception& e) {
                std::ostringstream oss;
                oss << "Wrong exception type thrown - Expected: " << typeid(ExceptionType).name()
                    << ", Got: " << typeid(e).name() << " with message: " << e.what();
                throw AssertionFailure(oss.str());
            }
            throw AssertionFailure(message);
        }
    }

} // namespace TestFramework

#endif // TEST_FRAMEWORK_H
