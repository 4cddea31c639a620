#pragma once

#include "symbols/mana_cost.h"

enum class Ordering {
    LESS,
    EQUAL,
    GREATER
};

// Total order over mana symbols, following the community convention for
// printing costs. Buckets, in order:
//   1. colorless        {C}
//   2. colored          {W}{W/P}{U}{U/P}...        by color (WUBRG)
//   3. hybrid           {2/W}...{C/W}...{W/U}{W/U/P}{W/B}...
//   4. generic          {X}{Y}{Z}{0}{1}...
//   5. snow             {S}
// Two-color hybrids are placed by their first canonical color, then by how
// far around the wheel the second color is.
//
// Returns EQUAL only for structurally equal symbols.
Ordering compare(const Symbol& a, const Symbol& b);

// Strict weak ordering adapter for the standard algorithms.
struct SymbolLess {
    bool operator()(const Symbol& a, const Symbol& b) const {
        return compare(a, b) == Ordering::LESS;
    }
};

// Returns a copy of `cost` in canonical order. Equal symbols keep their
// relative order.
ManaCost sort(const ManaCost& cost);
