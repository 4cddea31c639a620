// comparator.cpp
#include "sorting/comparator.h"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

enum class Bucket {
    COLORLESS,
    COLORED,
    HYBRID,
    GENERIC,
    SNOW
};

// Hybrid bucket sub-groups
constexpr int GENERIC_HYBRID_GROUP = 0;
constexpr int COLORLESS_HYBRID_GROUP = 1;
constexpr int TWO_COLOR_GROUP = 2;

// Lexicographic sort key. Every field a symbol carries ends up in the key, so
// different symbols never share one.
using SortKey = std::array<int, 5>;

SortKey sortKey(const Symbol& symbol) {
    switch (symbol.kind()) {
        case SymbolKind::COLORLESS:
            return {static_cast<int>(Bucket::COLORLESS), 0, 0, 0, 0};
        case SymbolKind::COLORED:
            return {static_cast<int>(Bucket::COLORED), wheelIndex(symbol.color()), 0, 0, 0};
        case SymbolKind::PHYREXIAN:
            return {static_cast<int>(Bucket::COLORED), wheelIndex(symbol.color()), 1, 0, 0};
        case SymbolKind::GENERIC_HYBRID:
            return {static_cast<int>(Bucket::HYBRID), GENERIC_HYBRID_GROUP, wheelIndex(symbol.color()), symbol.amount(), 0};
        case SymbolKind::COLORLESS_HYBRID:
            return {static_cast<int>(Bucket::HYBRID), COLORLESS_HYBRID_GROUP, wheelIndex(symbol.color()), 0, 0};
        case SymbolKind::HYBRID:
        case SymbolKind::PHYREXIAN_HYBRID:
            return {static_cast<int>(Bucket::HYBRID), TWO_COLOR_GROUP,
                    wheelIndex(symbol.firstColor()),
                    wheelSteps(symbol.firstColor(), symbol.secondColor()),
                    symbol.isPhyrexian() ? 1 : 0};
        case SymbolKind::VARIABLE:
            return {static_cast<int>(Bucket::GENERIC), 0, static_cast<int>(symbol.variable()), 0, 0};
        case SymbolKind::GENERIC:
            return {static_cast<int>(Bucket::GENERIC), 1, symbol.amount(), 0, 0};
        case SymbolKind::SNOW:
            return {static_cast<int>(Bucket::SNOW), 0, 0, 0, 0};
    }
    throw std::logic_error("Unhandled symbol kind: " + toString(symbol.kind()));
}

} // namespace

Ordering compare(const Symbol& a, const Symbol& b) {
    SortKey key_a = sortKey(a);
    SortKey key_b = sortKey(b);
    if (key_a < key_b) {
        return Ordering::LESS;
    }
    if (key_b < key_a) {
        return Ordering::GREATER;
    }
    return Ordering::EQUAL;
}

ManaCost sort(const ManaCost& cost) {
    std::vector<Symbol> symbols = cost.symbols();
    std::stable_sort(symbols.begin(), symbols.end(), SymbolLess());
    ManaCost sorted(std::move(symbols));
    spdlog::trace("Sorted {} into {}", cost.toString(), sorted.toString());
    return sorted;
}
