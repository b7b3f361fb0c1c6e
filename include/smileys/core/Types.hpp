#pragma once

#include <cstdint>

namespace SM {

struct Color {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 255;

    friend constexpr auto operator==(Color const&, Color const&) -> bool = default;
};

struct Point {
    int x = 0;
    int y = 0;

    friend constexpr auto operator==(Point const&, Point const&) -> bool = default;
};

struct Rect {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;

    friend constexpr auto operator==(Rect const&, Rect const&) -> bool = default;
};

namespace Colors {

inline constexpr Color Transparent{0, 0, 0, 0};
inline constexpr Color Background{0, 80, 160, 255};
inline constexpr Color Shadow{0, 0, 0, 128};

} // namespace Colors

// Intersection of two rects; an empty rect (w or h of 0) when they do not overlap.
[[nodiscard]] constexpr auto intersect(Rect const& lhs, Rect const& rhs) -> Rect {
    auto const x0 = lhs.x > rhs.x ? lhs.x : rhs.x;
    auto const y0 = lhs.y > rhs.y ? lhs.y : rhs.y;
    auto const x1 = (lhs.x + lhs.w) < (rhs.x + rhs.w) ? (lhs.x + lhs.w) : (rhs.x + rhs.w);
    auto const y1 = (lhs.y + lhs.h) < (rhs.y + rhs.h) ? (lhs.y + lhs.h) : (rhs.y + rhs.h);
    if (x1 <= x0 || y1 <= y0) {
        return Rect{x0, y0, 0, 0};
    }
    return Rect{x0, y0, x1 - x0, y1 - y0};
}

[[nodiscard]] constexpr auto is_empty(Rect const& rect) -> bool {
    return rect.w <= 0 || rect.h <= 0;
}

} // namespace SM
