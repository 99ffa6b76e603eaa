#include "breathe.hpp"
#include "esp_log.h"
#include <math.h>

namespace breathe_animation {

static const char *TAG = "breathe";

static constexpr double TWO_PI = 6.283185307179586;

float breathe_scale(const BreatheArgs &args, int64_t now_us) {
    const double period_ms = 1000.0 / args.frequency_hz;
    const double now_ms = static_cast<double>(now_us) / 1000.0;
    const double phase = fmod(now_ms, period_ms) / period_ms * TWO_PI + args.phase_shift;
    const double brightness = (sin(phase) + 1.0) / 2.0;
    return static_cast<float>(args.dimness + brightness * (1.0 - args.dimness));
}

esp_err_t Breathe::create(const Binding &binding, const BreatheArgs &args, std::unique_ptr<Breathe> &out) {
    esp_err_t err = check_binding(TAG, binding);
    if (err != ESP_OK) return err;
    if (!validate(args)) {
        ESP_LOGE(TAG, "frequency %.3f Hz / dimness %.3f rejected", args.frequency_hz, args.dimness);
        return ESP_ERR_INVALID_ARG;
    }
    out = std::make_unique<Breathe>(Key{}, binding, args);
    return ESP_OK;
}

esp_err_t Breathe::draw(int64_t now_us) {
    const float scale = breathe_scale(args_, now_us);
    return fill(utils::scaled(args_.color, scale));
}

} // namespace breathe_animation
