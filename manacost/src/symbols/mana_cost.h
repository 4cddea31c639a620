#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "symbols/symbol.h"

// An ordered sequence of mana symbols, as printed on a card. The order is
// whatever the cost was built or parsed with; sorted() returns the canonical
// order as a new cost.
class ManaCost {
public:
    ManaCost() = default;
    // Throws std::invalid_argument if the total mana value does not fit an int.
    explicit ManaCost(std::vector<Symbol> symbols);

    // See parsing/parser.h.
    static ManaCost parse(const std::string& mana_cost_str);

    const std::vector<Symbol>& symbols() const { return symbols_; }
    size_t size() const { return symbols_.size(); }
    bool empty() const { return symbols_.empty(); }
    const Symbol& operator[](size_t index) const { return symbols_[index]; }
    std::vector<Symbol>::const_iterator begin() const { return symbols_.begin(); }
    std::vector<Symbol>::const_iterator end() const { return symbols_.end(); }

    ManaCost sorted() const;
    Colors colors() const;
    int manaValue() const;
    std::string toString() const;

    bool operator==(const ManaCost& other) const { return symbols_ == other.symbols_; }
    bool operator!=(const ManaCost& other) const { return !(*this == other); }

private:
    std::vector<Symbol> symbols_;
};

int manaValue(const ManaCost& cost);
std::string render(const ManaCost& cost);

std::ostream& operator<<(std::ostream& os, const ManaCost& cost);
