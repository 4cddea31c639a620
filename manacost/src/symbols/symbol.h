#pragma once

#include <ostream>
#include <stdexcept>
#include <string>

#include "symbols/color.h"

// Thrown when a symbol would violate its own invariants.
class InvalidSymbol : public std::invalid_argument {
public:
    explicit InvalidSymbol(const std::string& message) : std::invalid_argument(message) {}
};

enum class SymbolKind {
    GENERIC,          // {5}
    VARIABLE,         // {X}
    COLORLESS,        // {C}
    COLORED,          // {U}
    PHYREXIAN,        // {U/P}
    HYBRID,           // {U/B}
    PHYREXIAN_HYBRID, // {U/B/P}
    GENERIC_HYBRID,   // {2/U}
    COLORLESS_HYBRID, // {C/U}
    SNOW              // {S}
};

std::string toString(SymbolKind kind);

enum class Variable {
    X,
    Y,
    Z
};

// A single mana symbol. Immutable; build one through the static factories,
// which validate the payload of their kind.
class Symbol {
public:
    static Symbol generic(int amount);
    static Symbol variable(Variable variable);
    static Symbol colorless();
    static Symbol colored(Color color);
    static Symbol phyrexian(Color color);
    static Symbol hybrid(Color a, Color b);
    static Symbol phyrexianHybrid(Color a, Color b);
    static Symbol genericHybrid(int amount, Color color);
    static Symbol colorlessHybrid(Color color);
    static Symbol snow();

    SymbolKind kind() const { return kind_; }

    // Numeric part of GENERIC and GENERIC_HYBRID symbols.
    int amount() const;
    Variable variable() const;
    // Single color of COLORED, PHYREXIAN, GENERIC_HYBRID and COLORLESS_HYBRID.
    Color color() const;
    // Colors of HYBRID and PHYREXIAN_HYBRID, in canonical order.
    Color firstColor() const;
    Color secondColor() const;

    Colors colors() const;
    bool isPhyrexian() const;
    bool isHybrid() const;
    int manaValue() const;

    // Canonical token including braces, e.g. "{R/G/P}".
    std::string toString() const;

    bool operator==(const Symbol& other) const;
    bool operator!=(const Symbol& other) const { return !(*this == other); }

private:
    Symbol(SymbolKind kind, int amount, Color first, Color second, Variable variable);

    void requireKind(bool ok, const char* accessor) const;

    SymbolKind kind_;
    int amount_;
    Color first_;
    Color second_;
    Variable variable_;
};

std::string render(const Symbol& symbol);

std::ostream& operator<<(std::ostream& os, const Symbol& symbol);
