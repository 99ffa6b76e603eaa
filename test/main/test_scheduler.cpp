#include "scheduler.hpp"
#include "test_support.hpp"
#include <memory>
#include <unity.h>
#include <vector>

using scheduler::Handle;
using scheduler::TickScheduler;

static int64_t now_us;
static std::unique_ptr<TickScheduler> sched;
static std::vector<int> calls;

static void set_up(void) {
    now_us = 0;
    calls.clear();
    sched = std::make_unique<TickScheduler>([]() { return now_us; });
}

static void tear_down(void) { sched.reset(); }

static scheduler::TickCallback record(int id) {
    return [id]() {
        calls.push_back(id);
        return ESP_OK;
    };
}

static void test_runs_in_registration_order(void) {
    sched->register_callback(record(1));
    sched->register_callback(record(2));
    sched->register_callback(record(3));

    TEST_ASSERT_EQUAL(ESP_OK, sched->tick());
    TEST_ASSERT_EQUAL(ESP_OK, sched->tick());

    const int expected[] = {1, 2, 3, 1, 2, 3};
    TEST_ASSERT_EQUAL(6, calls.size());
    TEST_ASSERT_EQUAL_INT_ARRAY(expected, calls.data(), 6);
    TEST_ASSERT_EQUAL_UINT32(2, sched->ticks());
}

static void test_cancel(void) {
    const Handle a = sched->register_callback(record(1));
    const Handle b = sched->register_callback(record(2));
    TEST_ASSERT_TRUE(sched->is_active(a));
    TEST_ASSERT_EQUAL(2, sched->active_count());

    sched->cancel(a);
    sched->cancel(a);
    TEST_ASSERT_FALSE(sched->is_active(a));
    TEST_ASSERT_TRUE(sched->is_active(b));

    TEST_ASSERT_EQUAL(ESP_OK, sched->tick());
    TEST_ASSERT_EQUAL(1, calls.size());
    TEST_ASSERT_EQUAL_INT(2, calls[0]);
}

static void test_empty_callback_rejected(void) {
    TEST_ASSERT_EQUAL_UINT32(scheduler::INVALID_HANDLE, sched->register_callback(scheduler::TickCallback()));
    TEST_ASSERT_EQUAL(0, sched->active_count());
}

static void test_cancel_during_tick(void) {
    Handle later = scheduler::INVALID_HANDLE;
    Handle self = scheduler::INVALID_HANDLE;
    self = sched->register_callback([&]() {
        calls.push_back(1);
        sched->cancel(later);
        sched->cancel(self);
        return ESP_OK;
    });
    later = sched->register_callback(record(2));

    TEST_ASSERT_EQUAL(ESP_OK, sched->tick());
    TEST_ASSERT_EQUAL(ESP_OK, sched->tick());
    TEST_ASSERT_EQUAL(1, calls.size());
    TEST_ASSERT_EQUAL(0, sched->active_count());
}

static void test_register_during_tick_runs_next_tick(void) {
    bool added = false;
    sched->register_callback([&]() {
        calls.push_back(1);
        if (!added) {
            added = true;
            sched->register_callback(record(2));
        }
        return ESP_OK;
    });

    TEST_ASSERT_EQUAL(ESP_OK, sched->tick());
    TEST_ASSERT_EQUAL(1, calls.size());

    TEST_ASSERT_EQUAL(ESP_OK, sched->tick());
    const int expected[] = {1, 1, 2};
    TEST_ASSERT_EQUAL(3, calls.size());
    TEST_ASSERT_EQUAL_INT_ARRAY(expected, calls.data(), 3);
}

static void test_first_error_returned(void) {
    sched->register_callback([]() {
        calls.push_back(1);
        return ESP_FAIL;
    });
    sched->register_callback([]() {
        calls.push_back(2);
        return ESP_ERR_INVALID_STATE;
    });
    sched->register_callback(record(3));

    TEST_ASSERT_EQUAL(ESP_FAIL, sched->tick());
    // remaining callbacks still ran and stay registered
    TEST_ASSERT_EQUAL(3, calls.size());
    TEST_ASSERT_EQUAL(3, sched->active_count());
}

static void test_injected_clock(void) {
    TEST_ASSERT_TRUE(sched->now_us() == 0);
    now_us = 1500;
    TEST_ASSERT_TRUE(sched->now_us() == 1500);
}

void run_scheduler_tests(void) {
    segfx_test::use_fixture(set_up, tear_down);
    RUN_TEST(test_runs_in_registration_order);
    RUN_TEST(test_cancel);
    RUN_TEST(test_empty_callback_rejected);
    RUN_TEST(test_cancel_during_tick);
    RUN_TEST(test_register_during_tick_runs_next_tick);
    RUN_TEST(test_first_error_returned);
    RUN_TEST(test_injected_clock);
}
