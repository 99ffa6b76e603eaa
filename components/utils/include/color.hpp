#pragma once
#include <stdint.h>

namespace utils {

// Flat RGB value. Channels are nominally 0..255 but are not range-checked:
// out-of-range values are handed to the backend as-is.
class Color {
  public:
    constexpr Color() : r_(0), g_(0), b_(0) {}
    constexpr Color(int r, int g, int b) : r_(r), g_(g), b_(b) {}

    constexpr int red() const { return r_; }
    constexpr int green() const { return g_; }
    constexpr int blue() const { return b_; }

    constexpr bool operator==(const Color &o) const { return r_ == o.r_ && g_ == o.g_ && b_ == o.b_; }
    constexpr bool operator!=(const Color &o) const { return !(*this == o); }

  private:
    int r_;
    int g_;
    int b_;
};

namespace colors {
constexpr Color RED{255, 0, 0};
constexpr Color GREEN{0, 255, 0};
constexpr Color BLUE{0, 0, 255};
constexpr Color YELLOW{255, 255, 0};
constexpr Color PURPLE{128, 0, 128};
constexpr Color ORANGE{255, 165, 0};
constexpr Color WHITE{255, 255, 255};
constexpr Color CYAN{0, 255, 255};
constexpr Color MAGENTA{255, 0, 255};
constexpr Color OFF{0, 0, 0};
} // namespace colors

constexpr Color custom(int r, int g, int b) { return Color{r, g, b}; }

// Palette name ("RED", "OFF", ...) or "custom".
const char *color_name(const Color &c);

// Multiply every channel by `factor`, truncating toward zero.
Color scaled(const Color &c, float factor);

} // namespace utils
