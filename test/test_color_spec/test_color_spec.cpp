/**
 * ColorSpec unit tests
 *
 * Tolerance regions are inclusive on both ends and every channel must match.
 */

#include <unity.h>

#include "ColorSpec.h"

namespace {

ColorSpec makeSpec(int r, int g, int b, int tolerance) {
    return ColorSpec(ToleranceChannel(r, tolerance),
                     ToleranceChannel(g, tolerance),
                     ToleranceChannel(b, tolerance));
}

} // namespace

void setUp() {}
void tearDown() {}

//==============================================================================
// ToleranceChannel
//==============================================================================

void test_channel_bounds_are_inclusive() {
    ToleranceChannel ch(57, 10);
    TEST_ASSERT_TRUE(ch.contains(47));
    TEST_ASSERT_TRUE(ch.contains(57));
    TEST_ASSERT_TRUE(ch.contains(67));
    TEST_ASSERT_FALSE(ch.contains(46));
    TEST_ASSERT_FALSE(ch.contains(68));
}

void test_zero_tolerance_matches_exact_value_only() {
    ToleranceChannel ch(20, 0);
    TEST_ASSERT_TRUE(ch.contains(20));
    TEST_ASSERT_FALSE(ch.contains(19));
    TEST_ASSERT_FALSE(ch.contains(21));
}

//==============================================================================
// ColorSpec::isMatch
//==============================================================================

void test_color_within_tolerances_matches() {
    TEST_ASSERT_TRUE(makeSpec(255, 57, 97, 10).isMatch(Color(255, 57, 97)));
}

void test_red_outside_tolerance_does_not_match() {
    TEST_ASSERT_FALSE(makeSpec(255, 57, 97, 10).isMatch(Color(235, 57, 97)));
}

void test_green_outside_tolerance_does_not_match() {
    TEST_ASSERT_FALSE(makeSpec(255, 57, 97, 10).isMatch(Color(255, 68, 97)));
}

void test_blue_outside_tolerance_does_not_match() {
    TEST_ASSERT_FALSE(makeSpec(255, 57, 97, 10).isMatch(Color(255, 57, 197)));
}

void test_upper_tolerance_matches() {
    TEST_ASSERT_TRUE(makeSpec(245, 57, 97, 10).isMatch(Color(255, 67, 107)));
}

void test_lower_tolerance_matches() {
    TEST_ASSERT_TRUE(makeSpec(255, 57, 97, 10).isMatch(Color(245, 47, 87)));
}

void test_default_spec_matches_only_off() {
    ColorSpec spec;
    TEST_ASSERT_TRUE(spec.isMatch(Color()));
    TEST_ASSERT_FALSE(spec.isMatch(Color(0, 0, 1)));
}

void test_specs_compare_by_value() {
    TEST_ASSERT_TRUE(makeSpec(1, 2, 3, 4) == makeSpec(1, 2, 3, 4));
    TEST_ASSERT_TRUE(makeSpec(1, 2, 3, 4) != makeSpec(1, 2, 3, 5));
}

int main() {
    UNITY_BEGIN();

    RUN_TEST(test_channel_bounds_are_inclusive);
    RUN_TEST(test_zero_tolerance_matches_exact_value_only);

    RUN_TEST(test_color_within_tolerances_matches);
    RUN_TEST(test_red_outside_tolerance_does_not_match);
    RUN_TEST(test_green_outside_tolerance_does_not_match);
    RUN_TEST(test_blue_outside_tolerance_does_not_match);
    RUN_TEST(test_upper_tolerance_matches);
    RUN_TEST(test_lower_tolerance_matches);
    RUN_TEST(test_default_spec_matches_only_off);
    RUN_TEST(test_specs_compare_by_value);

    return UNITY_END();
}
