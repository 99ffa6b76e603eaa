#pragma once

#include "common.hpp"
#include <functional>
#include <memory>
#include <utility>

namespace indicator_animation {

using namespace anim_common;

using BoolSupplier = std::function<bool()>;

struct BooleanIndicatorArgs {
    BoolSupplier supplier;
    Color true_color;
    Color false_color;
};

inline bool validate(const BooleanIndicatorArgs &args) { return static_cast<bool>(args.supplier); }

// Whole segment in true_color or false_color, following the supplier.
class BooleanIndicator final : public Animation {
  public:
    static esp_err_t create(const Binding &binding, BooleanIndicatorArgs args,
                            std::unique_ptr<BooleanIndicator> &out);
    BooleanIndicator(Key, const Binding &binding, BooleanIndicatorArgs args)
        : Animation(binding), args_(std::move(args)) {}

    Kind kind() const override { return Kind::BOOLEAN_INDICATOR; }

  private:
    esp_err_t draw(int64_t now_us) override;

    BooleanIndicatorArgs args_;
};

} // namespace indicator_animation
