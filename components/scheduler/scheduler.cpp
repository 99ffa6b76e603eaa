#include "include/scheduler.hpp"
#include "esp_log.h"
#include "esp_timer.h"
#include <utility>

namespace scheduler {

static const char *TAG = "scheduler";

int64_t system_clock_us() { return esp_timer_get_time(); }

TickScheduler::TickScheduler() : clock_(system_clock_us) {}

TickScheduler::TickScheduler(Clock clock) : clock_(clock ? std::move(clock) : Clock(system_clock_us)) {}

Handle TickScheduler::register_callback(TickCallback cb) {
    if (!cb) return INVALID_HANDLE;
    const Handle h = next_handle_++;
    entries_.emplace(h, Entry{std::move(cb), true});
    return h;
}

void TickScheduler::cancel(Handle handle) {
    auto it = entries_.find(handle);
    if (it == entries_.end()) return;
    if (ticking_) {
        // erased after the tick so the running callback stays alive
        it->second.active = false;
    } else {
        entries_.erase(it);
    }
}

bool TickScheduler::is_active(Handle handle) const {
    auto it = entries_.find(handle);
    return it != entries_.end() && it->second.active;
}

size_t TickScheduler::active_count() const {
    size_t n = 0;
    for (const auto &kv : entries_) {
        if (kv.second.active) ++n;
    }
    return n;
}

esp_err_t TickScheduler::tick() {
    esp_err_t first_err = ESP_OK;
    const Handle last = next_handle_;

    ticking_ = true;
    for (auto it = entries_.begin(); it != entries_.end() && it->first < last; ++it) {
        if (!it->second.active) continue;
        esp_err_t err = it->second.cb();
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "callback %lu failed on tick %lu: %s", (unsigned long)it->first, (unsigned long)ticks_,
                     esp_err_to_name(err));
            if (first_err == ESP_OK) first_err = err;
        }
    }
    ticking_ = false;

    purge();
    ++ticks_;
    return first_err;
}

void TickScheduler::purge() {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (!it->second.active) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace scheduler
