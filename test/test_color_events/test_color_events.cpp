/**
 * ColorEventRegistry unit tests
 *
 * - handlers fire only for matching colors
 * - a handler stays busy until its MatchDone is called
 * - registration order is invocation order
 * - a null handler removes every handler of the color spec
 * - handlers may change the registry while it dispatches
 */

#include <unity.h>
#include <string>
#include <type_traits>
#include <vector>

#include "ColorEventRegistry.h"

namespace {

const SpecId kSpecA = 1;
const SpecId kSpecB = 2;

const ColorSpec kNearDark(ToleranceChannel(10, 10), ToleranceChannel(20, 10), ToleranceChannel(30, 10));
const ColorSpec kRed(ToleranceChannel(255, 5), ToleranceChannel(0, 5), ToleranceChannel(0, 5));

const Color kInside(15, 25, 35);
const Color kOutside(255, 255, 255);

int s_calls = 0;
std::vector<std::string> s_order;
MatchDone s_pending;
ColorEventRegistry* s_registry = nullptr;

char kFirst[] = "first";
char kSecond[] = "second";
char kThird[] = "third";
char kDark[] = "dark";
char kRed[] = "red";

void countAndFinish(MatchDone done, const Color&, const ColorSpec&, void*) {
    s_calls++;
    done();
}

void countAndKeepRunning(MatchDone done, const Color&, const ColorSpec&, void*) {
    s_calls++;
    s_pending = done;
}

void recordName(MatchDone done, const Color&, const ColorSpec&, void* user) {
    s_order.push_back(static_cast<const char*>(user));
    done();
}

void checkArguments(MatchDone done, const Color& color, const ColorSpec& spec, void* user) {
    TEST_ASSERT_TRUE(done.isValid());
    TEST_ASSERT_TRUE(color == kInside);
    TEST_ASSERT_TRUE(spec == kNearDark);
    *static_cast<int*>(user) += 1;
    done();
}

void registerLateHandler(MatchDone done, const Color&, const ColorSpec&, void*) {
    s_order.push_back("early");
    done();
    if (s_order.size() == 1) {
        TEST_ASSERT_NOT_EQUAL(0, s_registry->registerHandler(kSpecA, kNearDark, recordName, kThird));
    }
}

void unregisterOwnSpec(MatchDone done, const Color&, const ColorSpec&, void*) {
    s_calls++;
    done();
    TEST_ASSERT_TRUE(s_registry->unregister(kSpecA));
}

} // namespace

void setUp() {
    s_calls = 0;
    s_order.clear();
    s_pending = MatchDone();
    s_registry = nullptr;
}

void tearDown() {}

//==============================================================================
// Matching
//==============================================================================

void test_handler_invoked_for_matching_color() {
    ColorEventRegistry registry;
    TEST_ASSERT_NOT_EQUAL(0, registry.registerHandler(kSpecA, kNearDark, countAndFinish));

    registry.dispatch(kInside);
    TEST_ASSERT_EQUAL_INT(1, s_calls);
}

void test_handler_not_invoked_for_other_color() {
    ColorEventRegistry registry;
    registry.registerHandler(kSpecA, kNearDark, countAndFinish);

    registry.dispatch(kOutside);
    TEST_ASSERT_EQUAL_INT(0, s_calls);
}

void test_handler_receives_color_spec_and_user() {
    ColorEventRegistry registry;
    int seen = 0;
    registry.registerHandler(kSpecA, kNearDark, checkArguments, &seen);

    registry.dispatch(kInside);
    TEST_ASSERT_EQUAL_INT(1, seen);
}

void test_only_matching_spec_fires() {
    ColorEventRegistry registry;
    registry.registerHandler(kSpecA, kNearDark, recordName, kDark);
    registry.registerHandler(kSpecB, kRed, recordName, kRed);

    registry.dispatch(Color(252, 3, 1));
    TEST_ASSERT_EQUAL_UINT32(1, s_order.size());
    TEST_ASSERT_EQUAL_STRING("red", s_order[0].c_str());
}

//==============================================================================
// Completion
//==============================================================================

void test_busy_handler_is_skipped() {
    ColorEventRegistry registry;
    const uint32_t id = registry.registerHandler(kSpecA, kNearDark, countAndKeepRunning);

    registry.dispatch(kInside);
    TEST_ASSERT_TRUE(registry.isRunning(id));
    registry.dispatch(kInside);
    TEST_ASSERT_EQUAL_INT(1, s_calls);
}

void test_done_after_return_rearms_handler() {
    ColorEventRegistry registry;
    const uint32_t id = registry.registerHandler(kSpecA, kNearDark, countAndKeepRunning);

    registry.dispatch(kInside);
    TEST_ASSERT_TRUE(s_pending.isValid());
    TEST_ASSERT_EQUAL_UINT32(id, s_pending.handlerId());

    s_pending();
    TEST_ASSERT_FALSE(registry.isRunning(id));

    registry.dispatch(kInside);
    TEST_ASSERT_EQUAL_INT(2, s_calls);
}

void test_done_is_idempotent() {
    ColorEventRegistry registry;
    const uint32_t id = registry.registerHandler(kSpecA, kNearDark, countAndKeepRunning);
    registry.dispatch(kInside);

    MatchDone done = s_pending;
    done();
    done();
    TEST_ASSERT_FALSE(registry.isRunning(id));
}

void test_default_done_token_is_harmless() {
    MatchDone done;
    TEST_ASSERT_FALSE(done.isValid());
    done();
}

//==============================================================================
// Registration
//==============================================================================

void test_handlers_run_in_registration_order() {
    ColorEventRegistry registry;
    registry.registerHandler(kSpecA, kNearDark, recordName, kFirst);
    registry.registerHandler(kSpecA, kNearDark, recordName, kSecond);
    registry.registerHandler(kSpecA, kNearDark, recordName, kThird);
    TEST_ASSERT_EQUAL_UINT32(3, registry.handlerCount(kSpecA));
    TEST_ASSERT_EQUAL_UINT32(1, registry.specCount());

    registry.dispatch(kInside);
    TEST_ASSERT_EQUAL_UINT32(3, s_order.size());
    TEST_ASSERT_EQUAL_STRING("first", s_order[0].c_str());
    TEST_ASSERT_EQUAL_STRING("second", s_order[1].c_str());
    TEST_ASSERT_EQUAL_STRING("third", s_order[2].c_str());
}

void test_null_handler_unregisters_spec() {
    ColorEventRegistry registry;
    registry.registerHandler(kSpecA, kNearDark, countAndFinish);
    registry.registerHandler(kSpecA, kNearDark, countAndFinish);

    TEST_ASSERT_EQUAL_UINT32(0, registry.registerHandler(kSpecA, kNearDark, nullptr));
    TEST_ASSERT_EQUAL_UINT32(0, registry.handlerCount(kSpecA));
    TEST_ASSERT_EQUAL_UINT32(0, registry.specCount());

    registry.dispatch(kInside);
    TEST_ASSERT_EQUAL_INT(0, s_calls);
}

void test_unregister_unknown_spec_returns_false() {
    ColorEventRegistry registry;
    TEST_ASSERT_FALSE(registry.unregister(kSpecB));
}

void test_clear_drops_everything() {
    ColorEventRegistry registry;
    registry.registerHandler(kSpecA, kNearDark, countAndFinish);
    registry.registerHandler(kSpecB, kRed, countAndFinish);
    registry.clear();

    TEST_ASSERT_EQUAL_UINT32(0, registry.specCount());
    registry.dispatch(kInside);
    TEST_ASSERT_EQUAL_INT(0, s_calls);
}

//==============================================================================
// Reentrancy
//==============================================================================

void test_handler_may_unregister_its_spec() {
    ColorEventRegistry registry;
    s_registry = &registry;
    registry.registerHandler(kSpecA, kNearDark, unregisterOwnSpec);
    registry.registerHandler(kSpecA, kNearDark, countAndFinish);
    registry.registerHandler(kSpecB, kNearDark, countAndFinish);

    registry.dispatch(kInside);

    // the second handler of A went away with its spec, B still ran
    TEST_ASSERT_EQUAL_INT(2, s_calls);
    TEST_ASSERT_EQUAL_UINT32(1, registry.specCount());
    TEST_ASSERT_EQUAL_UINT32(1, registry.handlerCount(kSpecB));
}

void test_handler_added_during_dispatch_waits_for_next_color() {
    ColorEventRegistry registry;
    s_registry = &registry;
    registry.registerHandler(kSpecA, kNearDark, registerLateHandler);

    registry.dispatch(kInside);
    TEST_ASSERT_EQUAL_UINT32(1, s_order.size());
    TEST_ASSERT_EQUAL_UINT32(2, registry.handlerCount(kSpecA));

    registry.dispatch(kInside);
    TEST_ASSERT_EQUAL_UINT32(3, s_order.size());
    TEST_ASSERT_EQUAL_STRING("early", s_order[1].c_str());
    TEST_ASSERT_EQUAL_STRING("third", s_order[2].c_str());
}

void test_registry_is_not_copyable() {
    // outstanding MatchDone tokens hold the registry address
    TEST_ASSERT_FALSE(std::is_copy_constructible<ColorEventRegistry>::value);
    TEST_ASSERT_FALSE(std::is_copy_assignable<ColorEventRegistry>::value);
}

int main() {
    UNITY_BEGIN();

    RUN_TEST(test_handler_invoked_for_matching_color);
    RUN_TEST(test_handler_not_invoked_for_other_color);
    RUN_TEST(test_handler_receives_color_spec_and_user);
    RUN_TEST(test_only_matching_spec_fires);

    RUN_TEST(test_busy_handler_is_skipped);
    RUN_TEST(test_done_after_return_rearms_handler);
    RUN_TEST(test_done_is_idempotent);
    RUN_TEST(test_default_done_token_is_harmless);

    RUN_TEST(test_handlers_run_in_registration_order);
    RUN_TEST(test_null_handler_unregisters_spec);
    RUN_TEST(test_unregister_unknown_spec_returns_false);
    RUN_TEST(test_clear_drops_everything);

    RUN_TEST(test_handler_may_unregister_its_spec);
    RUN_TEST(test_handler_added_during_dispatch_waits_for_next_color);
    RUN_TEST(test_registry_is_not_copyable);

    return UNITY_END();
}
