#include "test_support.hpp"
#include <stdlib.h>
#include <unity.h>

void run_color_tests(void);
void run_segment_tests(void);
void run_device_tests(void);
void run_vendor_animation_tests(void);
void run_scheduler_tests(void);
void run_lifecycle_tests(void);
void run_breathe_tests(void);
void run_countdown_tests(void);
void run_indicators_tests(void);
void run_range_value_tests(void);

static segfx_test::FixtureFn s_set_up = nullptr;
static segfx_test::FixtureFn s_tear_down = nullptr;

namespace segfx_test {

void use_fixture(FixtureFn set_up, FixtureFn tear_down) {
    s_set_up = set_up;
    s_tear_down = tear_down;
}

} // namespace segfx_test

void setUp(void) {
    if (s_set_up) s_set_up();
}

void tearDown(void) {
    if (s_tear_down) s_tear_down();
}

extern "C" void app_main(void) {
    UNITY_BEGIN();
    run_color_tests();
    run_segment_tests();
    run_device_tests();
    run_vendor_animation_tests();
    run_scheduler_tests();
    run_lifecycle_tests();
    run_breathe_tests();
    run_countdown_tests();
    run_indicators_tests();
    run_range_value_tests();
    // the exit status is what ctest sees
    exit(UNITY_END() == 0 ? EXIT_SUCCESS : EXIT_FAILURE);
}
