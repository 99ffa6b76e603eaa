#pragma once
#include "esp_err.h"
#include <functional>
#include <map>
#include <stddef.h>
#include <stdint.h>

namespace scheduler {

using Handle = uint32_t;
constexpr Handle INVALID_HANDLE = 0;

// Per-tick callback; a non-ESP_OK return is reported by tick().
using TickCallback = std::function<esp_err_t()>;
// Microsecond clock; esp_timer_get_time by default, injected in tests.
using Clock = std::function<int64_t()>;

int64_t system_clock_us();

// Cooperative periodic runner. tick() invokes every active callback once, in
// registration order, on the calling task. Callbacks are never concurrent or
// re-entrant. A callback registered during a tick first runs on the next one;
// a callback cancelled during a tick (itself included) does not run again.
class TickScheduler {
  public:
    TickScheduler();
    explicit TickScheduler(Clock clock);
    TickScheduler(const TickScheduler &) = delete;
    TickScheduler &operator=(const TickScheduler &) = delete;

    Handle register_callback(TickCallback cb);
    void cancel(Handle handle);
    bool is_active(Handle handle) const;

    // Runs the remaining callbacks after a failure and returns the first error.
    esp_err_t tick();

    int64_t now_us() const { return clock_(); }
    size_t active_count() const;
    uint32_t ticks() const { return ticks_; }

  private:
    struct Entry {
        TickCallback cb;
        bool active;
    };

    void purge();

    Clock clock_;
    std::map<Handle, Entry> entries_;
    Handle next_handle_ = 1;
    bool ticking_ = false;
    uint32_t ticks_ = 0;
};

} // namespace scheduler
