#pragma once
#include "color.hpp"
#include "esp_err.h"
#include "segment.hpp"
#include <stddef.h>
#include <stdint.h>

namespace vendor {

using utils::Color;
using utils::StripSegment;

enum class Direction : uint8_t { FORWARD = 0, BACKWARD = 1 };

// Share of LEDs left lit by the twinkle kinds.
enum class TwinklePercent : uint8_t {
    PERCENT_100 = 0,
    PERCENT_88,
    PERCENT_76,
    PERCENT_64,
    PERCENT_42,
    PERCENT_30,
    PERCENT_18,
    PERCENT_6,
};

enum class VendorAnimationType : uint8_t {
    COLOR_FLOW = 0,
    FIRE,
    LARSON,
    RAINBOW,
    RGB_FADE,
    SINGLE_FADE,
    STROBE,
    TWINKLE,
    TWINKLE_OFF,
};

// Tuning record for the vendor kinds. Each kind reads only the fields it
// understands (see make_vendor_animation).
struct AnimationConfig {
    double speed;
    Direction direction;
    double brightness;
    int size;
    double sparking;
    double cooling;
    TwinklePercent twinkle_percent;
    TwinklePercent twinkle_off_percent;

    static AnimationConfig defaults();
    static AnimationConfig fast();
    static AnimationConfig slow();
    static AnimationConfig dim();
    static AnimationConfig bright();
    static AnimationConfig intense_fire();
    static AnimationConfig calm_fire();

    AnimationConfig with_speed(double v) const;
    AnimationConfig with_direction(Direction v) const;
    AnimationConfig with_brightness(double v) const;
    AnimationConfig with_size(int v) const;
    AnimationConfig with_sparking(double v) const;
    AnimationConfig with_cooling(double v) const;
    AnimationConfig with_twinkle_percent(TwinklePercent v) const;
    AnimationConfig with_twinkle_off_percent(TwinklePercent v) const;
};

// Flat descriptor handed to Device::animate(). Fields a kind does not use
// stay zeroed.
struct VendorAnimation {
    VendorAnimationType type;
    bool uses_color;
    Color color;
    double speed;
    double brightness;
    int led_count;
    int led_offset;
    Direction direction;
    bool reverse;
    bool bounce_front; // Larson: bounce at the front (FORWARD) or back
    int size;
    double sparking;
    double cooling;
    TwinklePercent twinkle_percent;
};

esp_err_t make_vendor_animation(const StripSegment &segment, const Color &color, VendorAnimationType type,
                                const AnimationConfig &config, VendorAnimation &out);

const char *type_name(VendorAnimationType type);
int twinkle_percent_value(TwinklePercent p);

// Human-readable one-liner, e.g. "Fire [0,60) brightness=0.70 speed=0.80 ...".
// Writes at most `len` bytes including the terminator; returns `buf`.
const char *describe(const VendorAnimation &anim, char *buf, size_t len);

} // namespace vendor
