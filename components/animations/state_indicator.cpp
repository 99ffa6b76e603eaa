#include "state_indicator.hpp"
#include "esp_log.h"

namespace indicator_animation {

static const char *TAG = "state_indicator";

Color state_color(const std::vector<Color> &colors, int ordinal) {
    if (colors.empty()) return utils::colors::OFF;
    const int k = static_cast<int>(colors.size());
    // non-negative modulus
    return colors[((ordinal % k) + k) % k];
}

esp_err_t StateIndicator::create(const Binding &binding, StateIndicatorArgs args,
                                 std::unique_ptr<StateIndicator> &out) {
    esp_err_t err = check_binding(TAG, binding);
    if (err != ESP_OK) return err;
    if (!validate(args)) {
        ESP_LOGE(TAG, "no state supplier");
        return ESP_ERR_INVALID_ARG;
    }
    if (args.colors.empty()) {
        ESP_LOGW(TAG, "no colors for [%d, %d), segment will stay OFF", binding.segment.start(),
                 binding.segment.end());
    }
    out = std::make_unique<StateIndicator>(Key{}, binding, std::move(args));
    return ESP_OK;
}

esp_err_t StateIndicator::draw(int64_t now_us) {
    (void)now_us;
    return fill(state_color(args_.colors, args_.state()));
}

} // namespace indicator_animation
