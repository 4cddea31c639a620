// tests/sorting/test_comparator.cpp
#include "sorting/comparator.h"
#include "parsing/parser.h"

#include <gtest/gtest.h>
#include <algorithm>

namespace {

// One of every symbol shape, deliberately out of order.
std::vector<Symbol> representativeSymbols() {
    std::vector<Symbol> symbols = {
        Symbol::snow(),
        Symbol::generic(0),
        Symbol::generic(1),
        Symbol::generic(12),
        Symbol::variable(Variable::X),
        Symbol::variable(Variable::Y),
        Symbol::variable(Variable::Z),
        Symbol::colorless(),
        Symbol::genericHybrid(2, Color::WHITE),
        Symbol::genericHybrid(3, Color::WHITE),
        Symbol::genericHybrid(2, Color::GREEN),
        Symbol::colorlessHybrid(Color::BLUE),
        Symbol::colorlessHybrid(Color::RED),
    };
    for (int i = 0; i < NUM_COLORS; ++i) {
        Color color = static_cast<Color>(i);
        symbols.push_back(Symbol::colored(color));
        symbols.push_back(Symbol::phyrexian(color));
        for (int j = i + 1; j < NUM_COLORS; ++j) {
            Color other = static_cast<Color>(j);
            symbols.push_back(Symbol::hybrid(color, other));
            symbols.push_back(Symbol::phyrexianHybrid(color, other));
        }
    }
    return symbols;
}

std::string sortedText(const std::string& text) {
    return sort(parse(text)).toString();
}

} // namespace

TEST(ComparatorTest, BucketOrder) {
    ManaCost sorted = sort(parse("{U}{C}{5}"));
    ASSERT_EQ(sorted.size(), 3u);
    EXPECT_EQ(sorted[0], Symbol::colorless());
    EXPECT_EQ(sorted[1], Symbol::colored(Color::BLUE));
    EXPECT_EQ(sorted[2], Symbol::generic(5));

    EXPECT_EQ(sortedText("{S}{2}{W/U}{G}{C}"), "{C}{G}{W/U}{2}{S}");
}

TEST(ComparatorTest, ColoredFollowsWUBRG) {
    EXPECT_EQ(sortedText("{G}{R}{B}{U}{W}"), "{W}{U}{B}{R}{G}");
    EXPECT_EQ(sortedText("{G}{W}"), "{W}{G}");
}

TEST(ComparatorTest, PhyrexianFollowsItsColor) {
    EXPECT_EQ(sortedText("{U/P}{B}{U}{W/P}"), "{W/P}{U}{U/P}{B}");
    EXPECT_EQ(sortedText("{R/G/P}{R/G}"), "{R/G}{R/G/P}");
}

TEST(ComparatorTest, HybridsByFirstColor) {
    EXPECT_EQ(sortedText("{G/U}{R/W}{B/G}{U/R}{W/B}{G/W}{R/G}{B/R}{U/B}{W/U}"),
              "{W/U}{W/B}{U/B}{U/R}{B/R}{B/G}{R/G}{R/W}{G/W}{G/U}");
    EXPECT_EQ(sortedText("{W/B/P}{W/B}{W/U/P}{W/U}"), "{W/U}{W/U/P}{W/B}{W/B/P}");
}

TEST(ComparatorTest, HybridGroups) {
    EXPECT_EQ(sortedText("{W/U}{C/W}{2/U}{2/W}{C/G}{4/W}"), "{2/W}{4/W}{2/U}{C/W}{C/G}{W/U}");
}

TEST(ComparatorTest, GenericAscendingAfterVariables) {
    EXPECT_EQ(sortedText("{10}{2}{Y}{0}{X}{Z}"), "{X}{Y}{Z}{0}{2}{10}");
}

TEST(ComparatorTest, LongCost) {
    EXPECT_EQ(sortedText("{R/P}{X}{C/U}{2/B}{W}{W/U}{B}{B/R/P}{2/R}{G}{C}{G/W/P}{S}{4}{Y}{R/W}"),
              "{C}{W}{B}{R/P}{G}{2/B}{2/R}{C/U}{W/U}{B/R/P}{R/W}{G/W/P}{X}{Y}{4}{S}");
}

TEST(ComparatorTest, EmptyAndSingle) {
    EXPECT_EQ(sort(ManaCost()), ManaCost());
    EXPECT_EQ(sortedText("{R/G/P}"), "{R/G/P}");
}

TEST(ComparatorTest, SortIsIdempotent) {
    ManaCost cost(representativeSymbols());
    ManaCost once = sort(cost);
    EXPECT_EQ(sort(once), once);
    EXPECT_EQ(once.size(), cost.size());
}

TEST(ComparatorTest, SortKeepsDuplicates) {
    EXPECT_EQ(sortedText("{U}{1}{U}{C}{U}"), "{C}{U}{U}{U}{1}");
}

TEST(ComparatorTest, SortKeepsEverySymbol) {
    std::vector<Symbol> symbols = representativeSymbols();
    std::vector<Symbol> doubled = symbols;
    doubled.insert(doubled.end(), symbols.begin(), symbols.end());

    ManaCost sorted = sort(ManaCost(doubled));
    ASSERT_EQ(sorted.size(), doubled.size());
    for (const Symbol& symbol : symbols) {
        EXPECT_EQ(std::count(sorted.begin(), sorted.end(), symbol), 2) << symbol;
    }
    EXPECT_TRUE(std::is_sorted(sorted.begin(), sorted.end(), SymbolLess()));
}

TEST(ComparatorTest, EveryKindRoundTrips) {
    std::vector<Symbol> symbols = representativeSymbols();
    symbols.push_back(Symbol::genericHybrid(0, Color::WHITE));
    for (const Symbol& symbol : symbols) {
        ManaCost cost({symbol});
        EXPECT_EQ(parse(render(cost)), cost) << symbol;
    }
    ManaCost all(symbols);
    EXPECT_EQ(parse(render(all)), all);
}

TEST(ComparatorTest, EqualOnlyForEqualSymbols) {
    std::vector<Symbol> symbols = representativeSymbols();
    for (const Symbol& a : symbols) {
        for (const Symbol& b : symbols) {
            EXPECT_EQ(compare(a, b) == Ordering::EQUAL, a == b) << a << " vs " << b;
        }
    }
}

TEST(ComparatorTest, Antisymmetric) {
    std::vector<Symbol> symbols = representativeSymbols();
    for (const Symbol& a : symbols) {
        for (const Symbol& b : symbols) {
            Ordering ab = compare(a, b);
            Ordering ba = compare(b, a);
            if (ab == Ordering::LESS) {
                EXPECT_EQ(ba, Ordering::GREATER) << a << " vs " << b;
            } else if (ab == Ordering::GREATER) {
                EXPECT_EQ(ba, Ordering::LESS) << a << " vs " << b;
            } else {
                EXPECT_EQ(ba, Ordering::EQUAL) << a << " vs " << b;
            }
        }
    }
}

TEST(ComparatorTest, Transitive) {
    std::vector<Symbol> symbols = representativeSymbols();
    SymbolLess less;
    for (const Symbol& a : symbols) {
        for (const Symbol& b : symbols) {
            if (!less(a, b)) {
                continue;
            }
            for (const Symbol& c : symbols) {
                if (less(b, c)) {
                    EXPECT_TRUE(less(a, c)) << a << " < " << b << " < " << c;
                }
            }
        }
    }
}
