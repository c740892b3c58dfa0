#include "logging.hpp"
#include "test_common.hpp"

#include <string>

using namespace oftee;

int main() {
    auto test_parse_log_level = [] {
        EXPECT_TRUE(parse_log_level("debug") == LogLevel::Debug);
        EXPECT_TRUE(parse_log_level("TRACE") == LogLevel::Debug);
        EXPECT_TRUE(parse_log_level("Info") == LogLevel::Info);
        EXPECT_TRUE(parse_log_level("warning") == LogLevel::Warn);
        EXPECT_TRUE(parse_log_level("panic") == LogLevel::Error);
        EXPECT_FALSE(parse_log_level("loud").has_value());
        EXPECT_EQ(std::string(to_string(LogLevel::Warn)), "warn");
    };

    auto test_line_format = [] {
        set_log_level(LogLevel::Debug);
        auto line = log_debug("session");
        line << "xid=" << 42 << " bytes=" << std::string("7");
        EXPECT_TRUE(line.enabled());
        EXPECT_EQ(line.text(), "[session] xid=42 bytes=7");
        set_log_level(LogLevel::Error);
    };

    auto test_level_filters_lines = [] {
        set_log_level(LogLevel::Warn);
        EXPECT_FALSE(log_debug("x").enabled());
        EXPECT_FALSE(log_info("x").enabled());
        EXPECT_TRUE(log_warn("x").enabled());
        EXPECT_TRUE(log_error("x").enabled());

        auto line = log_info("x");
        line << "dropped";
        EXPECT_EQ(line.text(), "");
        set_log_level(LogLevel::Error);
    };

    set_log_level(LogLevel::Error);
    return run_tests({
        {"parse_log_level", test_parse_log_level},
        {"line_format", test_line_format},
        {"level_filters_lines", test_level_filters_lines},
    });
}
