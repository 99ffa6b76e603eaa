#include "countdown.hpp"
#include "test_support.hpp"
#include <unity.h>

using namespace segfx_test;
using anim_common::Binding;
using countdown_animation::Countdown;
using countdown_animation::countdown_lit_count;
namespace colors = utils::colors;

static std::unique_ptr<Rig> rig;
static std::unique_ptr<Countdown> countdown;

// 8-pixel strip, 10 s orange countdown over all of it
static void set_up(void) {
    rig = make_rig(8);
    TEST_ASSERT_EQUAL(ESP_OK, Countdown::create(Binding{rig->strip.get(), &rig->sched, segment(0, 8)},
                                                {.seconds = 10.0f, .color = colors::ORANGE}, countdown));
}

static void tear_down(void) {
    countdown.reset();
    rig.reset();
}

static void test_lit_count(void) {
    TEST_ASSERT_EQUAL_INT(8, countdown_lit_count(10.0f, 0.0, 8));
    TEST_ASSERT_EQUAL_INT(6, countdown_lit_count(10.0f, 2.5, 8));
    TEST_ASSERT_EQUAL_INT(4, countdown_lit_count(10.0f, 5.0, 8));
    TEST_ASSERT_EQUAL_INT(0, countdown_lit_count(10.0f, 10.0, 8));
    TEST_ASSERT_EQUAL_INT(0, countdown_lit_count(10.0f, 12.0, 8));
}

static void test_lit_count_never_increases(void) {
    int prev = countdown_lit_count(3.0f, 0.0, 37);
    for (int ms = 0; ms <= 4000; ms += 13) {
        const int lit = countdown_lit_count(3.0f, ms / 1000.0, 37);
        TEST_ASSERT_TRUE(lit <= prev);
        TEST_ASSERT_TRUE(lit >= 0);
        prev = lit;
    }
    TEST_ASSERT_EQUAL_INT(0, prev);
}

static void test_full_bar_at_start(void) {
    countdown->run();
    rig->tick();
    assert_span(*rig->strip, 0, 8, colors::ORANGE);
}

static void test_half_way(void) {
    countdown->run();
    rig->tick();
    rig->advance_ms(5000);
    rig->tick();
    assert_span(*rig->strip, 0, 4, colors::ORANGE);
    assert_span(*rig->strip, 4, 8, colors::OFF);
    TEST_ASSERT_TRUE(countdown->is_running());
}

static void test_expiry_goes_idle_and_dark(void) {
    countdown->run();
    rig->tick();
    rig->advance_ms(10000);
    rig->tick();
    assert_span(*rig->strip, 0, 8, colors::OFF);
    TEST_ASSERT_FALSE(countdown->is_running());
    TEST_ASSERT_EQUAL(0, rig->sched.active_count());

    // no more frames once idle
    const size_t frames = rig->sink.frames.size();
    rig->advance_ms(1000);
    rig->tick();
    TEST_ASSERT_EQUAL(frames, rig->sink.frames.size());
}

static void test_restart_after_expiry_starts_full(void) {
    countdown->run();
    rig->advance_ms(12000);
    rig->tick();
    TEST_ASSERT_FALSE(countdown->is_running());

    countdown->run();
    rig->tick();
    assert_span(*rig->strip, 0, 8, colors::ORANGE);
    rig->advance_ms(2500);
    rig->tick();
    assert_span(*rig->strip, 0, 6, colors::ORANGE);
    assert_span(*rig->strip, 6, 8, colors::OFF);
}

static void test_run_while_running_keeps_clock(void) {
    countdown->run();
    rig->advance_ms(5000);
    countdown->run();
    rig->tick();
    assert_span(*rig->strip, 0, 4, colors::ORANGE);
    assert_span(*rig->strip, 4, 8, colors::OFF);
}

static void test_bar_never_grows_while_running(void) {
    countdown->run();
    int prev = 8;
    while (countdown->is_running()) {
        rig->advance_ms(90);
        rig->tick();
        int lit = 0;
        while (lit < 8 && rig->strip->pixel(lit) == colors::ORANGE) ++lit;
        TEST_ASSERT_TRUE(lit <= prev);
        assert_span(*rig->strip, lit, 8, colors::OFF);
        prev = lit;
    }
    TEST_ASSERT_EQUAL_INT(0, prev);
}

static void test_non_positive_duration_rejected(void) {
    std::unique_ptr<Countdown> c;
    const Binding binding{rig->strip.get(), &rig->sched, segment(0, 8)};
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, Countdown::create(binding, {.seconds = 0.0f, .color = colors::RED}, c));
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, Countdown::create(binding, {.seconds = -2.0f, .color = colors::RED}, c));
    TEST_ASSERT_NULL(c.get());
}

void run_countdown_tests(void) {
    segfx_test::use_fixture(set_up, tear_down);
    RUN_TEST(test_lit_count);
    RUN_TEST(test_lit_count_never_increases);
    RUN_TEST(test_full_bar_at_start);
    RUN_TEST(test_half_way);
    RUN_TEST(test_expiry_goes_idle_and_dark);
    RUN_TEST(test_restart_after_expiry_starts_full);
    RUN_TEST(test_run_while_running_keeps_clock);
    RUN_TEST(test_bar_never_grows_while_running);
    RUN_TEST(test_non_positive_duration_rejected);
}
