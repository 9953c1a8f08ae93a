#pragma once
#include <algorithm>
#include <cstdlib>
#include <string>

struct Vec2i {
    int x = 0;
    int y = 0;
};

inline bool operator==(const Vec2i& a, const Vec2i& b) {
    return a.x == b.x && a.y == b.y;
}

inline bool operator!=(const Vec2i& a, const Vec2i& b) {
    return !(a == b);
}

// Axis-aligned tile rectangle. x1/y1 are exclusive.
struct Recti {
    int x0 = 0;
    int y0 = 0;
    int x1 = 0;
    int y1 = 0;

    int width() const { return x1 - x0; }
    int height() const { return y1 - y0; }
    int cx() const { return (x0 + x1) / 2; }
    int cy() const { return (y0 + y1) / 2; }
    bool empty() const { return x1 <= x0 || y1 <= y0; }

    bool contains(int px, int py) const {
        return px >= x0 && px < x1 && py >= y0 && py < y1;
    }
};

// Cardinal directions in the order the generators index them: up, right, down, left.
constexpr int DIRS4[4][2] = { {0, -1}, {1, 0}, {0, 1}, {-1, 0} };

constexpr int DIR_UP = 0;
constexpr int DIR_RIGHT = 1;
constexpr int DIR_DOWN = 2;
constexpr int DIR_LEFT = 3;

inline int oppositeDir(int d) {
    return (d + 2) & 3;
}

inline int sign(int v) {
    return (v > 0) - (v < 0);
}

inline int clampi(int v, int lo, int hi) {
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

inline int manhattan(const Vec2i& a, const Vec2i& b) {
    return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

inline std::string toLower(std::string s) {
    for (char& c : s) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return s;
}
