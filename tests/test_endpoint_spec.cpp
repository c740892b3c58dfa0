#include "config.hpp"
#include "endpoint_spec.hpp"
#include "test_common.hpp"

#include <string>

using namespace oftee;

int main() {
    set_log_level(LogLevel::Error);

    auto test_bare_destination = [] {
        auto spec = parse_endpoint_spec("tcp://10.0.0.5:9000");
        EXPECT_TRUE(spec.rule.is_wildcard());
        EXPECT_TRUE(spec.destination.scheme == Scheme::Tcp);
        EXPECT_EQ(spec.destination.host, "10.0.0.5");
        EXPECT_EQ(spec.destination.port, 9000);
        EXPECT_EQ(spec.text, "tcp://10.0.0.5:9000");

        auto plain = parse_endpoint_spec("collector:6633");
        EXPECT_TRUE(plain.rule.is_wildcard());
        EXPECT_EQ(plain.destination.host, "collector");
        EXPECT_EQ(plain.destination.port, 6633);
    };

    auto test_conditional_spec = [] {
        auto spec = parse_endpoint_spec("dl_type=0x0806;action=tcp://127.0.0.1:8002");
        EXPECT_EQ(spec.rule.set, static_cast<std::uint64_t>(kBitDlType));
        EXPECT_EQ(spec.rule.dl_type, 0x0806);
        EXPECT_EQ(spec.destination.host, "127.0.0.1");
        EXPECT_EQ(spec.destination.port, 8002);
    };

    auto test_terms_any_order_and_case = [] {
        auto spec = parse_endpoint_spec("ACTION=tcp://h:1;DL_TYPE=2048");
        EXPECT_EQ(spec.rule.dl_type, 0x0800);
        EXPECT_EQ(spec.destination.host, "h");
        EXPECT_EQ(spec.destination.port, 1);
    };

    auto test_empty_segments_skipped = [] {
        auto spec = parse_endpoint_spec(";action=tcp://h:7;;");
        EXPECT_TRUE(spec.rule.is_wildcard());
        EXPECT_EQ(spec.destination.port, 7);
    };

    auto test_later_terms_win = [] {
        auto spec = parse_endpoint_spec("dl_type=0x0800;dl_type=0x0806;action=tcp://a:1;action=tcp://b:2");
        EXPECT_EQ(spec.rule.dl_type, 0x0806);
        EXPECT_EQ(spec.destination.host, "b");
    };

    auto test_invalid_specs = [] {
        EXPECT_THROW(parse_endpoint_spec("bogus=1;action=tcp://x:1"), ConfigError);
        EXPECT_THROW(parse_endpoint_spec("dl_type=0x0800"), ConfigError);
        EXPECT_THROW(parse_endpoint_spec("dl_type=0x0800;"), ConfigError);
        EXPECT_THROW(parse_endpoint_spec("dl_type=0x10000;action=tcp://x:1"), ConfigError);
        EXPECT_THROW(parse_endpoint_spec("dl_type=ip;action=tcp://x:1"), ConfigError);
        EXPECT_THROW(parse_endpoint_spec("dl_type;action=tcp://x:1"), ConfigError);
        EXPECT_THROW(parse_endpoint_spec("tcp://x"), ConfigError);
        EXPECT_THROW(parse_endpoint_spec("foo=bar"), ConfigError);
        EXPECT_THROW(parse_endpoint_spec(""), ConfigError);
    };

    auto test_parse_uint16 = [] {
        EXPECT_EQ(parse_uint16("0x0806"), 0x0806);
        EXPECT_EQ(parse_uint16("0X86DD"), 0x86dd);
        EXPECT_EQ(parse_uint16("2054"), 2054);
        EXPECT_EQ(parse_uint16("010"), 8);
        EXPECT_EQ(parse_uint16("65535"), 65535);
        EXPECT_THROW(parse_uint16("65536"), ConfigError);
        EXPECT_THROW(parse_uint16("-1"), ConfigError);
        EXPECT_THROW(parse_uint16("0x"), ConfigError);
        EXPECT_THROW(parse_uint16("12abc"), ConfigError);
    };

    auto test_destinations = [] {
        auto local = parse_destination(":6653");
        EXPECT_EQ(local.host, "127.0.0.1");
        EXPECT_EQ(local.port, 6653);

        auto v6 = parse_destination("tcp://[::1]:9");
        EXPECT_EQ(v6.host, "::1");
        EXPECT_EQ(v6.port, 9);

        auto http = parse_destination("http://collector/packets?x=1");
        EXPECT_TRUE(http.scheme == Scheme::Http);
        EXPECT_EQ(http.host, "collector");
        EXPECT_EQ(http.port, 80);
        EXPECT_EQ(http.target, "/packets?x=1");
        EXPECT_EQ(describe(http), "http://collector:80/packets?x=1");

        auto http_port = parse_destination("HTTP://10.1.1.1:8080");
        EXPECT_TRUE(http_port.scheme == Scheme::Http);
        EXPECT_EQ(http_port.port, 8080);
        EXPECT_EQ(http_port.target, "/");

        auto unknown = parse_destination("udp://h:5");
        EXPECT_TRUE(unknown.scheme == Scheme::Tcp);
        EXPECT_EQ(unknown.host, "h");
        EXPECT_EQ(unknown.port, 5);
        EXPECT_EQ(describe(unknown), "tcp://h:5");
    };

    return run_tests({
        {"bare_destination", test_bare_destination},
        {"conditional_spec", test_conditional_spec},
        {"terms_any_order_and_case", test_terms_any_order_and_case},
        {"empty_segments_skipped", test_empty_segments_skipped},
        {"later_terms_win", test_later_terms_win},
        {"invalid_specs", test_invalid_specs},
        {"parse_uint16", test_parse_uint16},
        {"destinations", test_destinations},
    });
}
