#pragma once

#include "common.hpp"
#include <memory>

namespace breathe_animation {

using namespace anim_common;

struct BreatheArgs {
    Color color;
    float frequency_hz; // breaths per second, > 0
    float dimness;      // floor of the brightness scale, [0, 1]
    float phase_shift;  // radians; staggered shifts on neighbouring segments make a travelling wave
};

inline bool validate(const BreatheArgs &args) {
    return args.frequency_hz > 0.0f && args.dimness >= 0.0f && args.dimness <= 1.0f;
}

// Brightness scale at `now_us`, always within [dimness, 1].
float breathe_scale(const BreatheArgs &args, int64_t now_us);

// Whole segment pulsing on a sine wave. Never finishes on its own.
class Breathe final : public Animation {
  public:
    static esp_err_t create(const Binding &binding, const BreatheArgs &args, std::unique_ptr<Breathe> &out);
    Breathe(Key, const Binding &binding, const BreatheArgs &args) : Animation(binding), args_(args) {}

    Kind kind() const override { return Kind::BREATHE; }
    const BreatheArgs &args() const { return args_; }

  private:
    esp_err_t draw(int64_t now_us) override;

    BreatheArgs args_;
};

} // namespace breathe_animation
