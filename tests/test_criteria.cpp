#include "criteria.hpp"
#include "test_common.hpp"

#include <cstdint>
#include <vector>

using namespace oftee;

int main() {
    auto test_wildcard_matches_everything = [] {
        Criteria wildcard;
        EXPECT_TRUE(wildcard.is_wildcard());
        EXPECT_TRUE(wildcard.match(Criteria{}));
        EXPECT_TRUE(wildcard.match(Criteria::with_dl_type(0x0800)));
        EXPECT_TRUE(wildcard.match(Criteria::with_dl_type(0x0000)));
        EXPECT_EQ(wildcard.describe(), "*");
    };

    auto test_dl_type_rule = [] {
        const std::vector<std::uint16_t> samples = {0x0000, 0x0001, 0x0800, 0x0806, 0x86dd, 0x88cc, 0xffff};
        for (auto rule_value : samples) {
            auto rule = Criteria::with_dl_type(rule_value);
            EXPECT_FALSE(rule.is_wildcard());
            EXPECT_FALSE(rule.match(Criteria{}));
            for (auto state_value : samples) {
                EXPECT_EQ(rule.match(Criteria::with_dl_type(state_value)), rule_value == state_value);
            }
        }
    };

    auto test_unset_field_value_ignored = [] {
        // A stale dl_type without its bit is not a constraint.
        Criteria rule;
        rule.dl_type = 0x0806;
        EXPECT_TRUE(rule.match(Criteria::with_dl_type(0x0800)));

        Criteria state;
        state.dl_type = 0x0806;
        EXPECT_FALSE(Criteria::with_dl_type(0x0806).match(state));
    };

    auto test_describe = [] {
        EXPECT_EQ(Criteria::with_dl_type(0x0806).describe(), "dl_type=0x0806");
        EXPECT_EQ(Criteria::with_dl_type(0x86dd).describe(), "dl_type=0x86dd");
    };

    return run_tests({
        {"wildcard_matches_everything", test_wildcard_matches_everything},
        {"dl_type_rule", test_dl_type_rule},
        {"unset_field_value_ignored", test_unset_field_value_ignored},
        {"describe", test_describe},
    });
}
