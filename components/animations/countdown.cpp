#include "countdown.hpp"
#include "esp_log.h"
#include <algorithm>

namespace countdown_animation {

static const char *TAG = "countdown";

int countdown_lit_count(float seconds, double elapsed_s, int length) {
    const double remaining = std::max(0.0, (seconds - elapsed_s) / seconds);
    return bar_lit_count(remaining, length);
}

esp_err_t Countdown::create(const Binding &binding, const CountdownArgs &args, std::unique_ptr<Countdown> &out) {
    esp_err_t err = check_binding(TAG, binding);
    if (err != ESP_OK) return err;
    if (!validate(args)) {
        ESP_LOGE(TAG, "duration %.3f s rejected", args.seconds);
        return ESP_ERR_INVALID_ARG;
    }
    out = std::make_unique<Countdown>(Key{}, binding, args);
    return ESP_OK;
}

esp_err_t Countdown::draw(int64_t now_us) {
    const int lit = countdown_lit_count(args_.seconds, elapsed_s(now_us), segment().length());
    return fill_bar(lit, args_.color, utils::colors::OFF);
}

bool Countdown::finished(int64_t now_us) const {
    if (elapsed_s(now_us) < args_.seconds) return false;
    ESP_LOGI(TAG, "[%d, %d) expired after %.1f s", segment().start(), segment().end(), args_.seconds);
    return true;
}

} // namespace countdown_animation
