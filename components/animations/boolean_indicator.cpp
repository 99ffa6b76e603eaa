#include "boolean_indicator.hpp"
#include "esp_log.h"

namespace indicator_animation {

static const char *TAG = "bool_indicator";

esp_err_t BooleanIndicator::create(const Binding &binding, BooleanIndicatorArgs args,
                                   std::unique_ptr<BooleanIndicator> &out) {
    esp_err_t err = check_binding(TAG, binding);
    if (err != ESP_OK) return err;
    if (!validate(args)) {
        ESP_LOGE(TAG, "no state supplier");
        return ESP_ERR_INVALID_ARG;
    }
    out = std::make_unique<BooleanIndicator>(Key{}, binding, std::move(args));
    return ESP_OK;
}

esp_err_t BooleanIndicator::draw(int64_t now_us) {
    (void)now_us;
    return fill(args_.supplier() ? args_.true_color : args_.false_color);
}

} // namespace indicator_animation
