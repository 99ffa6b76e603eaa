#include "include/color.hpp"

namespace utils {

namespace {

struct NamedEntry {
    Color color;
    const char *name;
};

constexpr NamedEntry PALETTE[] = {
    {colors::RED, "RED"},       {colors::GREEN, "GREEN"},   {colors::BLUE, "BLUE"},
    {colors::YELLOW, "YELLOW"}, {colors::PURPLE, "PURPLE"}, {colors::ORANGE, "ORANGE"},
    {colors::WHITE, "WHITE"},   {colors::CYAN, "CYAN"},     {colors::MAGENTA, "MAGENTA"},
    {colors::OFF, "OFF"},
};

} // namespace

const char *color_name(const Color &c) {
    for (const auto &entry : PALETTE) {
        if (entry.color == c) return entry.name;
    }
    return "custom";
}

Color scaled(const Color &c, float factor) {
    return Color{static_cast<int>(c.red() * factor), static_cast<int>(c.green() * factor),
                 static_cast<int>(c.blue() * factor)};
}

} // namespace utils
