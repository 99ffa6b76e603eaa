#pragma once

#include "common.hpp"
#include <memory>

namespace countdown_animation {

using namespace anim_common;

struct CountdownArgs {
    float seconds; // > 0
    Color color;
};

inline bool validate(const CountdownArgs &args) { return args.seconds > 0.0f; }

// Lit pixels after `elapsed_s` of a `seconds` long countdown over `length` pixels.
int countdown_lit_count(float seconds, double elapsed_s, int length);

// Bar draining from the segment end toward its start. The clock restarts on
// every Idle -> Running transition; the animation goes Idle by itself once
// the time is up.
class Countdown final : public Animation {
  public:
    static esp_err_t create(const Binding &binding, const CountdownArgs &args, std::unique_ptr<Countdown> &out);
    Countdown(Key, const Binding &binding, const CountdownArgs &args) : Animation(binding), args_(args) {}

    Kind kind() const override { return Kind::COUNTDOWN; }
    const CountdownArgs &args() const { return args_; }

  private:
    void on_start(int64_t now_us) override { start_us_ = now_us; }
    esp_err_t draw(int64_t now_us) override;
    bool finished(int64_t now_us) const override;

    double elapsed_s(int64_t now_us) const { return static_cast<double>(now_us - start_us_) / 1e6; }

    CountdownArgs args_;
    int64_t start_us_ = 0;
};

} // namespace countdown_animation
