#pragma once

#include <optional>
#include <set>
#include <string>
#include <utility>

// The five colors, declared in WUBRG wheel order.
enum class Color {
    WHITE,
    BLUE,
    BLACK,
    RED,
    GREEN
};

inline constexpr int NUM_COLORS = 5;

inline char toChar(Color color) {
    switch (color) {
        case Color::WHITE: return 'W';
        case Color::BLUE:  return 'U';
        case Color::BLACK: return 'B';
        case Color::RED:   return 'R';
        case Color::GREEN: return 'G';
    }
    return '?';
}

inline std::string toString(Color color) {
    return std::string(1, toChar(color));
}

// Accepts upper and lower case letters.
std::optional<Color> colorFromChar(char c);

// Position on the color wheel, 0 (white) through 4 (green).
int wheelIndex(Color color);

// Number of clockwise steps from `from` to `to`, in [0, 5).
int wheelSteps(Color from, Color to);

// Orders a pair of distinct colors so that the second is reached from the
// first by the shorter clockwise arc: W/U, U/B, B/R, R/G, G/W, W/B, U/R, B/G,
// R/W, G/U.
std::pair<Color, Color> canonicalPair(Color a, Color b);

using Colors = std::set<Color>;

// Color letters in WUBRG order, e.g. "UR".
std::string toString(const Colors& colors);
