#include "range_value.hpp"
#include "esp_log.h"
#include <algorithm>

namespace range_animation {

static const char *TAG = "range_value";

int range_lit_count(double min, double max, double value, int length) {
    const double v = std::clamp(value, min, max);
    return bar_lit_count((v - min) / (max - min), length);
}

esp_err_t RangeValue::create(const Binding &binding, RangeValueArgs args, std::unique_ptr<RangeValue> &out) {
    esp_err_t err = check_binding(TAG, binding);
    if (err != ESP_OK) return err;
    if (!validate(args)) {
        ESP_LOGE(TAG, "%s (min=%.3f max=%.3f)", args.value ? "max must exceed min" : "no value supplier", args.min,
                 args.max);
        return ESP_ERR_INVALID_ARG;
    }
    out = std::make_unique<RangeValue>(Key{}, binding, std::move(args));
    return ESP_OK;
}

esp_err_t RangeValue::draw(int64_t now_us) {
    (void)now_us;
    const int lit = range_lit_count(args_.min, args_.max, args_.value(), segment().length());
    return fill_bar(lit, args_.fill_color, args_.empty_color);
}

} // namespace range_animation
