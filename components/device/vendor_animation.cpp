#include "include/vendor_animation.hpp"
#include "esp_log.h"
#include <stdio.h>

namespace vendor {

static const char *TAG = "vendor";

AnimationConfig AnimationConfig::defaults() {
    return AnimationConfig{
        .speed = 0.5,
        .direction = Direction::FORWARD,
        .brightness = 1.0,
        .size = 3,
        .sparking = 0.7,
        .cooling = 0.5,
        .twinkle_percent = TwinklePercent::PERCENT_42,
        .twinkle_off_percent = TwinklePercent::PERCENT_100,
    };
}

AnimationConfig AnimationConfig::fast() { return defaults().with_speed(1.0); }
AnimationConfig AnimationConfig::slow() { return defaults().with_speed(0.2); }
AnimationConfig AnimationConfig::dim() { return defaults().with_brightness(0.3); }
AnimationConfig AnimationConfig::bright() { return defaults().with_brightness(1.0); }

AnimationConfig AnimationConfig::intense_fire() {
    return defaults().with_speed(0.8).with_sparking(0.9).with_cooling(0.2).with_brightness(0.7);
}

AnimationConfig AnimationConfig::calm_fire() {
    return defaults().with_speed(0.3).with_sparking(0.4).with_cooling(0.7).with_brightness(0.5);
}

AnimationConfig AnimationConfig::with_speed(double v) const {
    AnimationConfig c = *this;
    c.speed = v;
    return c;
}

AnimationConfig AnimationConfig::with_direction(Direction v) const {
    AnimationConfig c = *this;
    c.direction = v;
    return c;
}

AnimationConfig AnimationConfig::with_brightness(double v) const {
    AnimationConfig c = *this;
    c.brightness = v;
    return c;
}

AnimationConfig AnimationConfig::with_size(int v) const {
    AnimationConfig c = *this;
    c.size = v;
    return c;
}

AnimationConfig AnimationConfig::with_sparking(double v) const {
    AnimationConfig c = *this;
    c.sparking = v;
    return c;
}

AnimationConfig AnimationConfig::with_cooling(double v) const {
    AnimationConfig c = *this;
    c.cooling = v;
    return c;
}

AnimationConfig AnimationConfig::with_twinkle_percent(TwinklePercent v) const {
    AnimationConfig c = *this;
    c.twinkle_percent = v;
    return c;
}

AnimationConfig AnimationConfig::with_twinkle_off_percent(TwinklePercent v) const {
    AnimationConfig c = *this;
    c.twinkle_off_percent = v;
    return c;
}

esp_err_t make_vendor_animation(const StripSegment &segment, const Color &color, VendorAnimationType type,
                                const AnimationConfig &config, VendorAnimation &out) {
    VendorAnimation a{};
    a.type = type;
    a.speed = config.speed;
    a.led_count = segment.length();
    a.led_offset = segment.start();

    const bool reverse = (config.direction == Direction::BACKWARD);

    switch (type) {
    case VendorAnimationType::COLOR_FLOW:
        a.uses_color = true;
        a.color = color;
        a.direction = config.direction;
        break;
    case VendorAnimationType::FIRE:
        a.brightness = config.brightness;
        a.sparking = config.sparking;
        a.cooling = config.cooling;
        a.reverse = reverse;
        break;
    case VendorAnimationType::LARSON:
        a.uses_color = true;
        a.color = color;
        a.bounce_front = (config.direction == Direction::FORWARD);
        a.size = config.size;
        break;
    case VendorAnimationType::RAINBOW:
        a.brightness = config.brightness;
        a.reverse = reverse;
        break;
    case VendorAnimationType::RGB_FADE:
        a.brightness = config.brightness;
        break;
    case VendorAnimationType::SINGLE_FADE:
    case VendorAnimationType::STROBE:
        a.uses_color = true;
        a.color = color;
        break;
    case VendorAnimationType::TWINKLE:
        a.uses_color = true;
        a.color = color;
        a.twinkle_percent = config.twinkle_percent;
        break;
    case VendorAnimationType::TWINKLE_OFF:
        a.uses_color = true;
        a.color = color;
        a.twinkle_percent = config.twinkle_off_percent;
        break;
    default:
        ESP_LOGE(TAG, "unknown vendor animation type %d", static_cast<int>(type));
        return ESP_ERR_INVALID_ARG;
    }

    out = a;
    return ESP_OK;
}

const char *type_name(VendorAnimationType type) {
    switch (type) {
    case VendorAnimationType::COLOR_FLOW:
        return "ColorFlow";
    case VendorAnimationType::FIRE:
        return "Fire";
    case VendorAnimationType::LARSON:
        return "Larson";
    case VendorAnimationType::RAINBOW:
        return "Rainbow";
    case VendorAnimationType::RGB_FADE:
        return "RgbFade";
    case VendorAnimationType::SINGLE_FADE:
        return "SingleFade";
    case VendorAnimationType::STROBE:
        return "Strobe";
    case VendorAnimationType::TWINKLE:
        return "Twinkle";
    case VendorAnimationType::TWINKLE_OFF:
        return "TwinkleOff";
    }
    return "unknown";
}

int twinkle_percent_value(TwinklePercent p) {
    static const int VALUES[] = {100, 88, 76, 64, 42, 30, 18, 6};
    const size_t i = static_cast<size_t>(p);
    return i < sizeof(VALUES) / sizeof(VALUES[0]) ? VALUES[i] : 0;
}

const char *describe(const VendorAnimation &anim, char *buf, size_t len) {
    if (buf == nullptr || len == 0) return buf;

    int n = snprintf(buf, len, "%s [%d,%d) speed=%.2f", type_name(anim.type), anim.led_offset,
                     anim.led_offset + anim.led_count, anim.speed);

    auto append = [&](const char *fmt, auto... args) {
        if (n < 0 || static_cast<size_t>(n) >= len) return;
        int w = snprintf(buf + n, len - n, fmt, args...);
        if (w > 0) n += w;
    };

    if (anim.uses_color) {
        append(" color=%s(%d,%d,%d)", utils::color_name(anim.color), anim.color.red(), anim.color.green(),
               anim.color.blue());
    }

    switch (anim.type) {
    case VendorAnimationType::COLOR_FLOW:
        append(" dir=%s", anim.direction == Direction::FORWARD ? "forward" : "backward");
        break;
    case VendorAnimationType::FIRE:
        append(" brightness=%.2f sparking=%.2f cooling=%.2f%s", anim.brightness, anim.sparking, anim.cooling,
               anim.reverse ? " reversed" : "");
        break;
    case VendorAnimationType::LARSON:
        append(" bounce=%s size=%d", anim.bounce_front ? "front" : "back", anim.size);
        break;
    case VendorAnimationType::RAINBOW:
        append(" brightness=%.2f%s", anim.brightness, anim.reverse ? " reversed" : "");
        break;
    case VendorAnimationType::RGB_FADE:
        append(" brightness=%.2f", anim.brightness);
        break;
    case VendorAnimationType::TWINKLE:
    case VendorAnimationType::TWINKLE_OFF:
        append(" twinkle=%d%%", twinkle_percent_value(anim.twinkle_percent));
        break;
    default:
        break;
    }
    return buf;
}

} // namespace vendor
