#include "common.hpp"
#include "esp_log.h"
#include <algorithm>
#include <math.h>

namespace anim_common {

static const char *TAG = "animation";

const char *kind_name(Kind kind) {
    switch (kind) {
    case Kind::BREATHE:
        return "breathe";
    case Kind::COUNTDOWN:
        return "countdown";
    case Kind::BOOLEAN_INDICATOR:
        return "boolean_indicator";
    case Kind::STATE_INDICATOR:
        return "state_indicator";
    case Kind::RANGE_VALUE:
        return "range_value";
    }
    return "unknown";
}

esp_err_t check_binding(const char *tag, const Binding &binding) {
    if (!validate(binding)) {
        ESP_LOGE(tag, "missing device or scheduler (device=%p scheduler=%p)", (void *)binding.device,
                 (void *)binding.scheduler);
        return ESP_ERR_INVALID_ARG;
    }
    return ESP_OK;
}

int bar_lit_count(double fraction, int length) {
    if (length <= 0 || isnan(fraction)) return 0;
    const double lit = floor(fraction * length + 0.5);
    if (lit <= 0.0) return 0;
    if (lit >= length) return length;
    return static_cast<int>(lit);
}

Animation::Animation(const Binding &binding)
    : device_(*binding.device), scheduler_(*binding.scheduler), segment_(binding.segment) {}

Animation::~Animation() { stop(); }

void Animation::run() {
    if (is_running()) return;
    on_start(scheduler_.now_us());
    handle_ = scheduler_.register_callback([this]() { return tick(); });
    ESP_LOGD(TAG, "%s on [%d, %d) running (handle %lu)", kind_name(kind()), segment_.start(), segment_.end(),
             (unsigned long)handle_);
}

void Animation::stop() {
    if (handle_ == scheduler::INVALID_HANDLE) return;
    scheduler_.cancel(handle_);
    handle_ = scheduler::INVALID_HANDLE;
}

esp_err_t Animation::end() {
    stop();
    esp_err_t err = fill(utils::colors::OFF);
    if (err != ESP_OK) return err;
    return device_.show();
}

bool Animation::is_running() const {
    return handle_ != scheduler::INVALID_HANDLE && scheduler_.is_active(handle_);
}

esp_err_t Animation::tick() {
    const int64_t now = scheduler_.now_us();
    esp_err_t err = draw(now);
    if (err != ESP_OK) return err;

    if (finished(now)) {
        ESP_LOGD(TAG, "%s on [%d, %d) finished", kind_name(kind()), segment_.start(), segment_.end());
        stop();
    }
    return ESP_OK;
}

esp_err_t Animation::fill(const Color &color) { return fill_range(0, segment_.length(), color); }

esp_err_t Animation::fill_range(int offset, int count, const Color &color) {
    const int lo = std::max(offset, 0);
    const int hi = std::min(offset + count, segment_.length());
    if (hi <= lo) return ESP_OK;
    return device_.write_pixels(segment_.start() + lo, hi - lo, color);
}

esp_err_t Animation::fill_bar(int lit, const Color &on, const Color &off) {
    esp_err_t err = fill_range(0, lit, on);
    if (err != ESP_OK) return err;
    return fill_range(lit, segment_.length() - lit, off);
}

} // namespace anim_common
