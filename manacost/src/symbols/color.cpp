// color.cpp
#include "symbols/color.h"

#include <cctype>
#include <stdexcept>

std::optional<Color> colorFromChar(char c) {
    switch (std::toupper(static_cast<unsigned char>(c))) {
        case 'W': return Color::WHITE;
        case 'U': return Color::BLUE;
        case 'B': return Color::BLACK;
        case 'R': return Color::RED;
        case 'G': return Color::GREEN;
        default:  return std::nullopt;
    }
}

int wheelIndex(Color color) {
    return static_cast<int>(color);
}

int wheelSteps(Color from, Color to) {
    return (wheelIndex(to) - wheelIndex(from) + NUM_COLORS) % NUM_COLORS;
}

std::pair<Color, Color> canonicalPair(Color a, Color b) {
    if (a == b) {
        throw std::invalid_argument("Color pair must have two different colors: " + toString(a));
    }
    // Two distinct colors are always 1 or 2 steps apart in one direction.
    if (wheelSteps(a, b) <= 2) {
        return {a, b};
    }
    return {b, a};
}

std::string toString(const Colors& colors) {
    std::string result;
    for (Color color : colors) {
        result += toChar(color);
    }
    return result;
}
