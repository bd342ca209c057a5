#include "unity.h"
#include "core/RunOptions.hpp"
#include <string>
#include <vector>

using namespace cavern;

void setUp() {}
void tearDown() {}

static bool rejects(const std::vector<std::string>& args) {
    try {
        (void)parseRunOptions(args);
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}

void test_defaults() {
    RunOptions o = parseRunOptions({});
    TEST_ASSERT_TRUE(o.seed == 0);
    TEST_ASSERT_EQUAL_INT(1, o.repeat);
    TEST_ASSERT_FALSE(o.display);
    TEST_ASSERT_TRUE(o.timeLimited);
    TEST_ASSERT_FALSE(o.quiet);
    TEST_ASSERT_FALSE(o.hasCavernFiles());
}

void test_all_flags() {
    RunOptions o = parseRunOptions({"-s", "12345", "-n", "3", "-g", "--no-timeout", "-q",
                                    "-l", "a.cav", "b.cav"});
    TEST_ASSERT_TRUE(o.seed == 12345u);
    TEST_ASSERT_EQUAL_INT(3, o.repeat);
    TEST_ASSERT_TRUE(o.display);
    TEST_ASSERT_FALSE(o.timeLimited);
    TEST_ASSERT_TRUE(o.quiet);
    TEST_ASSERT_TRUE(o.hasCavernFiles());
    TEST_ASSERT_EQUAL_STRING("a.cav", o.findCavernPath.c_str());
    TEST_ASSERT_EQUAL_STRING("b.cav", o.scramCavernPath.c_str());
    TEST_ASSERT_TRUE(parseRunOptions({"-h"}).help);
}

void test_seed_accepts_full_range() {
    TEST_ASSERT_TRUE(parseRunOptions({"-s", "18446744073709551615"}).seed == UINT64_MAX);
    // negativos são reinterpretados em 64 bits
    TEST_ASSERT_TRUE(parseRunOptions({"-s", "-1"}).seed == UINT64_MAX);
}

void test_malformed_numbers_rejected() {
    TEST_ASSERT_TRUE(rejects({"-s"}));
    TEST_ASSERT_TRUE(rejects({"-s", "abc"}));
    TEST_ASSERT_TRUE(rejects({"-s", "12x"}));
    TEST_ASSERT_TRUE(rejects({"-s", "99999999999999999999999"}));
    TEST_ASSERT_TRUE(rejects({"-n", "0"}));
    TEST_ASSERT_TRUE(rejects({"-n", "-2"}));
    TEST_ASSERT_TRUE(rejects({"-n"}));
}

void test_unknown_flag_and_short_load_rejected() {
    TEST_ASSERT_TRUE(rejects({"--fast"}));
    TEST_ASSERT_TRUE(rejects({"-l", "only-one.cav"}));
}

void test_usage_mentions_every_flag() {
    const std::string u = runUsage("cavern_run");
    for (const char* f : {"-s", "-n", "-g", "-l", "--no-timeout", "-q", "-h"}) {
        TEST_ASSERT_TRUE(u.find(f) != std::string::npos);
    }
}

int main(int argc, char** argv) {
    (void)argc; (void)argv;
    UNITY_BEGIN();
    RUN_TEST(test_defaults);
    RUN_TEST(test_all_flags);
    RUN_TEST(test_seed_accepts_full_range);
    RUN_TEST(test_malformed_numbers_rejected);
    RUN_TEST(test_unknown_flag_and_short_load_rejected);
    RUN_TEST(test_usage_mentions_every_flag);
    return UNITY_END();
}
