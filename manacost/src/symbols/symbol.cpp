// symbol.cpp
#include "symbols/symbol.h"

#include <format>

std::string toString(SymbolKind kind) {
    switch (kind) {
        case SymbolKind::GENERIC:          return "generic";
        case SymbolKind::VARIABLE:         return "variable";
        case SymbolKind::COLORLESS:        return "colorless";
        case SymbolKind::COLORED:          return "colored";
        case SymbolKind::PHYREXIAN:        return "phyrexian";
        case SymbolKind::HYBRID:           return "hybrid";
        case SymbolKind::PHYREXIAN_HYBRID: return "phyrexian hybrid";
        case SymbolKind::GENERIC_HYBRID:   return "generic hybrid";
        case SymbolKind::COLORLESS_HYBRID: return "colorless hybrid";
        case SymbolKind::SNOW:             return "snow";
    }
    return "?";
}

namespace {

char toChar(Variable variable) {
    switch (variable) {
        case Variable::X: return 'X';
        case Variable::Y: return 'Y';
        case Variable::Z: return 'Z';
    }
    return '?';
}

void requireNonNegative(int amount, SymbolKind kind) {
    if (amount < 0) {
        throw InvalidSymbol(std::format("Negative amount {} for {} mana", amount, toString(kind)));
    }
}

} // namespace

Symbol::Symbol(SymbolKind kind, int amount, Color first, Color second, Variable variable)
    : kind_(kind), amount_(amount), first_(first), second_(second), variable_(variable) {}

Symbol Symbol::generic(int amount) {
    requireNonNegative(amount, SymbolKind::GENERIC);
    return Symbol(SymbolKind::GENERIC, amount, Color::WHITE, Color::WHITE, Variable::X);
}

Symbol Symbol::variable(Variable variable) {
    return Symbol(SymbolKind::VARIABLE, 0, Color::WHITE, Color::WHITE, variable);
}

Symbol Symbol::colorless() {
    return Symbol(SymbolKind::COLORLESS, 0, Color::WHITE, Color::WHITE, Variable::X);
}

Symbol Symbol::colored(Color color) {
    return Symbol(SymbolKind::COLORED, 0, color, color, Variable::X);
}

Symbol Symbol::phyrexian(Color color) {
    return Symbol(SymbolKind::PHYREXIAN, 0, color, color, Variable::X);
}

Symbol Symbol::hybrid(Color a, Color b) {
    if (a == b) {
        throw InvalidSymbol(std::format("Hybrid mana needs two different colors, got {}/{}", ::toChar(a), ::toChar(b)));
    }
    auto [first, second] = canonicalPair(a, b);
    return Symbol(SymbolKind::HYBRID, 0, first, second, Variable::X);
}

Symbol Symbol::phyrexianHybrid(Color a, Color b) {
    if (a == b) {
        throw InvalidSymbol(std::format("Phyrexian hybrid mana needs two different colors, got {}/{}/P", ::toChar(a), ::toChar(b)));
    }
    auto [first, second] = canonicalPair(a, b);
    return Symbol(SymbolKind::PHYREXIAN_HYBRID, 0, first, second, Variable::X);
}

Symbol Symbol::genericHybrid(int amount, Color color) {
    requireNonNegative(amount, SymbolKind::GENERIC_HYBRID);
    return Symbol(SymbolKind::GENERIC_HYBRID, amount, color, color, Variable::X);
}

Symbol Symbol::colorlessHybrid(Color color) {
    return Symbol(SymbolKind::COLORLESS_HYBRID, 0, color, color, Variable::X);
}

Symbol Symbol::snow() {
    return Symbol(SymbolKind::SNOW, 0, Color::WHITE, Color::WHITE, Variable::X);
}

void Symbol::requireKind(bool ok, const char* accessor) const {
    if (!ok) {
        throw std::logic_error(std::format("{} mana has no {}", ::toString(kind_), accessor));
    }
}

int Symbol::amount() const {
    requireKind(kind_ == SymbolKind::GENERIC || kind_ == SymbolKind::GENERIC_HYBRID, "amount");
    return amount_;
}

Variable Symbol::variable() const {
    requireKind(kind_ == SymbolKind::VARIABLE, "variable");
    return variable_;
}

Color Symbol::color() const {
    requireKind(kind_ == SymbolKind::COLORED ||
                kind_ == SymbolKind::PHYREXIAN ||
                kind_ == SymbolKind::GENERIC_HYBRID ||
                kind_ == SymbolKind::COLORLESS_HYBRID, "single color");
    return first_;
}

Color Symbol::firstColor() const {
    requireKind(kind_ == SymbolKind::HYBRID || kind_ == SymbolKind::PHYREXIAN_HYBRID, "color pair");
    return first_;
}

Color Symbol::secondColor() const {
    requireKind(kind_ == SymbolKind::HYBRID || kind_ == SymbolKind::PHYREXIAN_HYBRID, "color pair");
    return second_;
}

Colors Symbol::colors() const {
    switch (kind_) {
        case SymbolKind::COLORED:
        case SymbolKind::PHYREXIAN:
        case SymbolKind::GENERIC_HYBRID:
        case SymbolKind::COLORLESS_HYBRID:
            return {first_};
        case SymbolKind::HYBRID:
        case SymbolKind::PHYREXIAN_HYBRID:
            return {first_, second_};
        case SymbolKind::GENERIC:
        case SymbolKind::VARIABLE:
        case SymbolKind::COLORLESS:
        case SymbolKind::SNOW:
            return {};
    }
    return {};
}

bool Symbol::isPhyrexian() const {
    return kind_ == SymbolKind::PHYREXIAN || kind_ == SymbolKind::PHYREXIAN_HYBRID;
}

bool Symbol::isHybrid() const {
    return kind_ == SymbolKind::HYBRID ||
           kind_ == SymbolKind::PHYREXIAN_HYBRID ||
           kind_ == SymbolKind::GENERIC_HYBRID ||
           kind_ == SymbolKind::COLORLESS_HYBRID;
}

int Symbol::manaValue() const {
    switch (kind_) {
        case SymbolKind::GENERIC:
        case SymbolKind::GENERIC_HYBRID:
            // A generic hybrid counts its printed number, e.g. {2/W} is 2.
            return amount_;
        case SymbolKind::VARIABLE:
            return 0;
        case SymbolKind::COLORLESS:
        case SymbolKind::COLORED:
        case SymbolKind::PHYREXIAN:
        case SymbolKind::HYBRID:
        case SymbolKind::PHYREXIAN_HYBRID:
        case SymbolKind::COLORLESS_HYBRID:
        case SymbolKind::SNOW:
            return 1;
    }
    return 0;
}

std::string Symbol::toString() const {
    switch (kind_) {
        case SymbolKind::GENERIC:          return std::format("{{{}}}", amount_);
        case SymbolKind::VARIABLE:         return std::format("{{{}}}", toChar(variable_));
        case SymbolKind::COLORLESS:        return "{C}";
        case SymbolKind::COLORED:          return std::format("{{{}}}", ::toChar(first_));
        case SymbolKind::PHYREXIAN:        return std::format("{{{}/P}}", ::toChar(first_));
        case SymbolKind::HYBRID:           return std::format("{{{}/{}}}", ::toChar(first_), ::toChar(second_));
        case SymbolKind::PHYREXIAN_HYBRID: return std::format("{{{}/{}/P}}", ::toChar(first_), ::toChar(second_));
        case SymbolKind::GENERIC_HYBRID:   return std::format("{{{}/{}}}", amount_, ::toChar(first_));
        case SymbolKind::COLORLESS_HYBRID: return std::format("{{C/{}}}", ::toChar(first_));
        case SymbolKind::SNOW:             return "{S}";
    }
    return "{?}";
}

bool Symbol::operator==(const Symbol& other) const {
    return kind_ == other.kind_ &&
           amount_ == other.amount_ &&
           first_ == other.first_ &&
           second_ == other.second_ &&
           variable_ == other.variable_;
}

std::string render(const Symbol& symbol) {
    return symbol.toString();
}

std::ostream& operator<<(std::ostream& os, const Symbol& symbol) {
    return os << symbol.toString();
}
