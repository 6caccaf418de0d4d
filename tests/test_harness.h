#ifndef CODE_SANDBOX_TEST_HARNESS_H
#define CODE_SANDBOX_TEST_HARNESS_H

#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

// ANSI Colors
#define GREEN "\033[0;32m"
#define RED "\033[0;31m"
#define RESET "\033[0m"

namespace test_harness {

struct CheckFailure : std::runtime_error {
    explicit CheckFailure(const std::string& what) : std::runtime_error(what) {}
};

inline int& Passed() { static int n = 0; return n; }
inline int& Failed() { static int n = 0; return n; }

inline std::string Location(const char* file, int line) {
    return std::string(file) + ":" + std::to_string(line);
}

inline void RunTest(const std::string& name, const std::function<void()>& fn) {
    std::cout << "Testing " << name << "..." << std::flush;
    try {
        fn();
        ++Passed();
        std::cout << GREEN << " [PASS]" << RESET << std::endl;
    } catch (const CheckFailure& e) {
        ++Failed();
        std::cout << RED << " [FAIL] " << e.what() << RESET << std::endl;
    } catch (const std::exception& e) {
        ++Failed();
        std::cout << RED << " [FAIL] unexpected exception: " << e.what() << RESET << std::endl;
    }
}

// 返回进程退出码: 有失败时非 0
inline int Summary(const std::string& suite) {
    std::cout << "=== " << suite << ": " << Passed() << " passed, " << Failed() << " failed ===" << std::endl;
    return Failed() == 0 ? 0 : 1;
}

} // namespace test_harness

#define CHECK(cond) \
    do { \
        if (!(cond)) { \
            throw test_harness::CheckFailure(test_harness::Location(__FILE__, __LINE__) + ": " #cond); \
        } \
    } while (0)

#define CHECK_EQ(actual, expected) \
    do { \
        const auto& _a = (actual); \
        const auto& _e = (expected); \
        if (!(_a == _e)) { \
            std::ostringstream _os; \
            _os << test_harness::Location(__FILE__, __LINE__) << ": " #actual " == " #expected \
                << " (got '" << _a << "', expected '" << _e << "')"; \
            throw test_harness::CheckFailure(_os.str()); \
        } \
    } while (0)

#define CHECK_CONTAINS(haystack, needle) \
    do { \
        const std::string _h = (haystack); \
        const std::string _n = (needle); \
        if (_h.find(_n) == std::string::npos) { \
            throw test_harness::CheckFailure(test_harness::Location(__FILE__, __LINE__) + \
                ": '" + _h + "' does not contain '" + _n + "'"); \
        } \
    } while (0)

#define RUN_TEST(fn) test_harness::RunTest(#fn, fn)

#endif // CODE_SANDBOX_TEST_HARNESS_H
