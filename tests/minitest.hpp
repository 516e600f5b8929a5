#pragma once

#include <cmath>
#include <exception>
#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace mini {

struct TestCase {
    std::string name;
    std::function<void()> fn;
};

inline std::vector<TestCase>& registry() {
    static std::vector<TestCase> r;
    return r;
}

struct Registrar {
    Registrar(const std::string& name, std::function<void()> fn) {
        registry().push_back({name, std::move(fn)});
    }
};

struct AssertionError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

inline std::string where(const char* file, int line) {
    std::ostringstream oss;
    oss << file << ":" << line << ": ";
    return oss.str();
}

// Runs every registered test whose name contains `filter` (all when empty)
inline int run_all(const std::string& filter = "") {
    int failed = 0;
    int passed = 0;
    for (auto& t : registry()) {
        if (!filter.empty() && t.name.find(filter) == std::string::npos) continue;
        try {
            t.fn();
            ++passed;
            std::cout << "[PASS] " << t.name << "\n";
        } catch (const std::exception& e) {
            ++failed;
            std::cerr << "[FAIL] " << t.name << ": " << e.what() << "\n";
        }
    }
    std::cout << "\n" << passed << " passed, " << failed << " failed\n";
    return failed == 0 ? 0 : 1;
}

} // namespace mini

#define TEST(name) \
    static void name(); \
    static ::mini::Registrar name##_registrar{#name, name}; \
    static void name()

#define ASSERT_TRUE(expr) do { \
    if (!(expr)) throw ::mini::AssertionError(::mini::where(__FILE__, __LINE__) + "ASSERT_TRUE failed: " #expr); \
} while (0)

#define ASSERT_FALSE(expr) do { \
    if (expr) throw ::mini::AssertionError(::mini::where(__FILE__, __LINE__) + "ASSERT_FALSE failed: " #expr); \
} while (0)

#define ASSERT_EQ(a, b) do { \
    if (!((a) == (b))) throw ::mini::AssertionError(::mini::where(__FILE__, __LINE__) + "ASSERT_EQ failed: " #a " == " #b); \
} while (0)

#define ASSERT_NE(a, b) do { \
    if (!((a) != (b))) throw ::mini::AssertionError(::mini::where(__FILE__, __LINE__) + "ASSERT_NE failed: " #a " != " #b); \
} while (0)

#define ASSERT_NEAR(a, b, eps) do { \
    if (std::fabs((a) - (b)) > (eps)) throw ::mini::AssertionError(::mini::where(__FILE__, __LINE__) + "ASSERT_NEAR failed: " #a " ~ " #b); \
} while (0)

#define ASSERT_THROWS(stmt, ex) do { \
    bool thrown_ = false; \
    try { stmt; } catch (const ex&) { thrown_ = true; } \
    if (!thrown_) throw ::mini::AssertionError(::mini::where(__FILE__, __LINE__) + "ASSERT_THROWS failed: " #stmt " did not throw " #ex); \
} while (0)
