// mana_cost.cpp
#include "symbols/mana_cost.h"

#include "parsing/parser.h"
#include "sorting/comparator.h"

#include <format>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <utility>

ManaCost::ManaCost(std::vector<Symbol> symbols) : symbols_(std::move(symbols)) {
    long long total = 0;
    for (const Symbol& symbol : symbols_) {
        total += symbol.manaValue();
        if (total > std::numeric_limits<int>::max()) {
            throw std::invalid_argument(std::format("Mana value of {} symbols exceeds {}", symbols_.size(), std::numeric_limits<int>::max()));
        }
    }
}

ManaCost ManaCost::parse(const std::string& mana_cost_str) {
    return ::parse(mana_cost_str);
}

ManaCost ManaCost::sorted() const {
    return sort(*this);
}

Colors ManaCost::colors() const {
    Colors colors;
    for (const Symbol& symbol : symbols_) {
        Colors symbol_colors = symbol.colors();
        colors.insert(symbol_colors.begin(), symbol_colors.end());
    }
    return colors;
}

int ManaCost::manaValue() const {
    return std::accumulate(symbols_.begin(), symbols_.end(), 0,
                           [](int total, const Symbol& symbol) { return total + symbol.manaValue(); });
}

std::string ManaCost::toString() const {
    std::string result;
    for (const Symbol& symbol : symbols_) {
        result += symbol.toString();
    }
    return result;
}

int manaValue(const ManaCost& cost) {
    return cost.manaValue();
}

std::string render(const ManaCost& cost) {
    return cost.toString();
}

std::ostream& operator<<(std::ostream& os, const ManaCost& cost) {
    return os << cost.toString();
}
