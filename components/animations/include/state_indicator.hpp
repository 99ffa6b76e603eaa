#pragma once

#include "common.hpp"
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace indicator_animation {

using namespace anim_common;

using OrdinalSupplier = std::function<int()>;

// Adapts a supplier of enum values to an ordinal supplier.
template <typename F> OrdinalSupplier ordinal_of(F supplier) {
    return [supplier]() { return static_cast<int>(supplier()); };
}

struct StateIndicatorArgs {
    OrdinalSupplier state;
    std::vector<Color> colors; // colors[ordinal mod size]; empty renders OFF
};

inline bool validate(const StateIndicatorArgs &args) { return static_cast<bool>(args.state); }

// colors[ordinal mod colors.size()], or OFF for an empty sequence.
Color state_color(const std::vector<Color> &colors, int ordinal);

// Whole segment in the color assigned to the supplier's current state.
class StateIndicator final : public Animation {
  public:
    static esp_err_t create(const Binding &binding, StateIndicatorArgs args, std::unique_ptr<StateIndicator> &out);
    StateIndicator(Key, const Binding &binding, StateIndicatorArgs args) : Animation(binding), args_(std::move(args)) {}

    Kind kind() const override { return Kind::STATE_INDICATOR; }

  private:
    esp_err_t draw(int64_t now_us) override;

    StateIndicatorArgs args_;
};

} // namespace indicator_animation
