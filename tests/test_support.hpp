// Shared helpers for the agentmem test suites
#ifndef AGENTMEM_TESTS_TEST_SUPPORT_HPP
#define AGENTMEM_TESTS_TEST_SUPPORT_HPP

#include <agentmem/core/logger.hpp>
#include <agentmem/memory/types.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <unistd.h>

namespace agentmem {
namespace test {

const int64_t MS_PER_DAY = 86400000LL;

// Hand-driven clock; copies share the same instant
class ManualClock {
public:
    explicit ManualClock(int64_t start_ms = 1700000000000LL)
        : now_(new int64_t(start_ms)) {}
    
    Clock clock() const {
        std::shared_ptr<int64_t> now = now_;
        return [now]() { return *now; };
    }
    
    int64_t now() const { return *now_; }
    void set(int64_t ms) { *now_ = ms; }
    void advance(int64_t ms) { *now_ += ms; }
    void advance_days(int days) { *now_ += days * MS_PER_DAY; }

private:
    std::shared_ptr<int64_t> now_;
};

// Silences the logger for the lifetime of a fixture
class QuietTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level_ = Logger::instance().level();
        Logger::instance().set_level(LogLevel::OFF);
    }
    
    void TearDown() override {
        Logger::instance().set_level(saved_level_);
    }

private:
    LogLevel saved_level_;
};

inline std::string temp_path(const std::string& name) {
    return "/tmp/agentmem_test_" + std::to_string(static_cast<long>(getpid())) + "_" + name;
}

} // namespace test
} // namespace agentmem

#endif // AGENTMEM_TESTS_TEST_SUPPORT_HPP
