#pragma once

#include "common.hpp"
#include <functional>
#include <memory>
#include <utility>

namespace range_animation {

using namespace anim_common;

using ValueSupplier = std::function<double()>;

struct RangeValueArgs {
    double min;
    double max; // > min
    ValueSupplier value;
    Color fill_color;
    Color empty_color;
};

inline bool validate(const RangeValueArgs &args) { return static_cast<bool>(args.value) && args.max > args.min; }

// Pixels lit for `value` (clamped to [min, max]) over `length` pixels.
int range_lit_count(double min, double max, double value, int length);

// Progress bar: fill_color on the first pixels, empty_color on the rest.
class RangeValue final : public Animation {
  public:
    static esp_err_t create(const Binding &binding, RangeValueArgs args, std::unique_ptr<RangeValue> &out);
    RangeValue(Key, const Binding &binding, RangeValueArgs args) : Animation(binding), args_(std::move(args)) {}

    Kind kind() const override { return Kind::RANGE_VALUE; }

  private:
    esp_err_t draw(int64_t now_us) override;

    RangeValueArgs args_;
};

} // namespace range_animation
