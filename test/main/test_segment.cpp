#include "esp_err.h"
#include "segment.hpp"
#include "test_support.hpp"
#include <limits.h>
#include <unity.h>

using utils::StripSegment;

static void set_up(void) {}
static void tear_down(void) {}

static void test_length_is_end_minus_start(void) {
    StripSegment seg;
    TEST_ASSERT_EQUAL(ESP_OK, StripSegment::create(0, 60, seg));
    TEST_ASSERT_EQUAL_INT(0, seg.start());
    TEST_ASSERT_EQUAL_INT(60, seg.end());
    TEST_ASSERT_EQUAL_INT(60, seg.length());

    TEST_ASSERT_EQUAL(ESP_OK, StripSegment::create(10, 11, seg));
    TEST_ASSERT_EQUAL_INT(1, seg.length());
}

static void test_default_is_single_pixel(void) {
    const StripSegment seg;
    TEST_ASSERT_EQUAL_INT(0, seg.start());
    TEST_ASSERT_EQUAL_INT(1, seg.length());
}

static void test_invalid_bounds_rejected(void) {
    StripSegment seg;
    TEST_ASSERT_EQUAL(ESP_OK, StripSegment::create(2, 4, seg));

    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, StripSegment::create(5, 5, seg));
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, StripSegment::create(5, 3, seg));
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, StripSegment::create(-1, 4, seg));
    // end - start would overflow here
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, StripSegment::create(1, INT_MIN, seg));

    // untouched by the failed calls
    TEST_ASSERT_EQUAL_INT(2, seg.start());
    TEST_ASSERT_EQUAL_INT(4, seg.end());
}

static void test_widest_segment(void) {
    StripSegment seg;
    TEST_ASSERT_EQUAL(ESP_OK, StripSegment::create(0, INT_MAX, seg));
    TEST_ASSERT_EQUAL_INT(INT_MAX, seg.length());
}

static void test_contains_is_half_open(void) {
    StripSegment seg;
    TEST_ASSERT_EQUAL(ESP_OK, StripSegment::create(3, 6, seg));
    TEST_ASSERT_FALSE(seg.contains(2));
    TEST_ASSERT_TRUE(seg.contains(3));
    TEST_ASSERT_TRUE(seg.contains(5));
    TEST_ASSERT_FALSE(seg.contains(6));
}

static void test_overlapping_segments_allowed(void) {
    StripSegment a, b;
    TEST_ASSERT_EQUAL(ESP_OK, StripSegment::create(0, 10, a));
    TEST_ASSERT_EQUAL(ESP_OK, StripSegment::create(5, 15, b));
    TEST_ASSERT_TRUE(a != b);
    TEST_ASSERT_TRUE(a.contains(7) && b.contains(7));
}

void run_segment_tests(void) {
    segfx_test::use_fixture(set_up, tear_down);
    RUN_TEST(test_length_is_end_minus_start);
    RUN_TEST(test_default_is_single_pixel);
    RUN_TEST(test_invalid_bounds_rejected);
    RUN_TEST(test_widest_segment);
    RUN_TEST(test_contains_is_half_open);
    RUN_TEST(test_overlapping_segments_allowed);
}
