// parser.cpp
#include "parsing/parser.h"

#include <cctype>
#include <format>
#include <limits>
#include <optional>
#include <utility>

#include <spdlog/spdlog.h>

std::string toString(ParseErrorKind kind) {
    switch (kind) {
        case ParseErrorKind::UNMATCHED_BRACE:     return "unmatched brace";
        case ParseErrorKind::EMPTY_TOKEN:         return "empty mana symbol";
        case ParseErrorKind::UNRECOGNIZED_SYMBOL: return "unrecognized mana symbol";
        case ParseErrorKind::STRAY_CHARACTER:     return "unexpected character outside of braces";
        case ParseErrorKind::AMOUNT_OUT_OF_RANGE: return "generic amount out of range";
    }
    return "parse error";
}

ParseError::ParseError(ParseErrorKind kind, const std::string& token, size_t offset)
    : std::runtime_error(std::format("{} at offset {}: '{}'", ::toString(kind), offset, token)),
      kind_(kind),
      token_(token),
      offset_(offset) {}

namespace {

bool isWhitespace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

bool isDigits(const std::string& part) {
    if (part.empty()) {
        return false;
    }
    for (char c : part) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

bool isLetter(const std::string& part, char letter) {
    return part.size() == 1 && std::toupper(static_cast<unsigned char>(part[0])) == letter;
}

std::optional<Color> asColor(const std::string& part) {
    if (part.size() != 1) {
        return std::nullopt;
    }
    return colorFromChar(part[0]);
}

std::vector<std::string> splitBody(const std::string& body) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t slash = body.find('/', start);
        if (slash == std::string::npos) {
            parts.push_back(body.substr(start));
            return parts;
        }
        parts.push_back(body.substr(start, slash - start));
        start = slash + 1;
    }
}

int parseAmount(const std::string& digits, const std::string& token, size_t offset) {
    long long amount = 0;
    for (char c : digits) {
        amount = amount * 10 + (c - '0');
        if (amount > std::numeric_limits<int>::max()) {
            throw ParseError(ParseErrorKind::AMOUNT_OUT_OF_RANGE, token, offset);
        }
    }
    return static_cast<int>(amount);
}

} // namespace

Symbol parseSymbol(const std::string& body, size_t offset) {
    const std::string token = "{" + body + "}";
    if (body.empty()) {
        throw ParseError(ParseErrorKind::EMPTY_TOKEN, token, offset);
    }

    std::vector<std::string> parts = splitBody(body);

    if (parts.size() == 1) {
        const std::string& part = parts[0];
        if (isDigits(part)) {
            return Symbol::generic(parseAmount(part, token, offset));
        }
        if (isLetter(part, 'C')) {
            return Symbol::colorless();
        }
        if (isLetter(part, 'S')) {
            return Symbol::snow();
        }
        if (isLetter(part, 'X')) {
            return Symbol::variable(Variable::X);
        }
        if (isLetter(part, 'Y')) {
            return Symbol::variable(Variable::Y);
        }
        if (isLetter(part, 'Z')) {
            return Symbol::variable(Variable::Z);
        }
        if (std::optional<Color> color = asColor(part)) {
            return Symbol::colored(*color);
        }
    } else if (parts.size() == 2) {
        const std::string& left = parts[0];
        std::optional<Color> right = asColor(parts[1]);
        if (isDigits(left) && right) {
            return Symbol::genericHybrid(parseAmount(left, token, offset), *right);
        }
        if (isLetter(left, 'C') && right) {
            return Symbol::colorlessHybrid(*right);
        }
        std::optional<Color> color = asColor(left);
        if (color && isLetter(parts[1], 'P')) {
            return Symbol::phyrexian(*color);
        }
        if (color && right) {
            return Symbol::hybrid(*color, *right);
        }
    } else if (parts.size() == 3) {
        std::optional<Color> a = asColor(parts[0]);
        std::optional<Color> b = asColor(parts[1]);
        if (a && b && isLetter(parts[2], 'P')) {
            return Symbol::phyrexianHybrid(*a, *b);
        }
    }

    throw ParseError(ParseErrorKind::UNRECOGNIZED_SYMBOL, token, offset);
}

namespace {

// Scans a whole cost. Holds a reference to the text, so it only lives for
// the duration of one parse() call.
class ManaCostParser {
public:
    explicit ManaCostParser(const std::string& text) : text_(text), pos_(0) {}
    ManaCostParser(std::string&&) = delete;

    ManaCost parse() {
        std::vector<Symbol> symbols;
        int mana_value = 0;
        skipWhitespace();
        while (pos_ < text_.size()) {
            size_t token_start = 0;
            std::string body = nextToken(token_start);
            Symbol symbol = parseSymbol(body, token_start);
            // Keeps manaValue() of the result within int
            if (symbol.manaValue() > std::numeric_limits<int>::max() - mana_value) {
                throw ParseError(ParseErrorKind::AMOUNT_OUT_OF_RANGE, "{" + body + "}", token_start);
            }
            mana_value += symbol.manaValue();
            spdlog::trace("Parsed {} at offset {}", symbol.toString(), token_start);
            symbols.push_back(symbol);
            skipWhitespace();
        }
        return ManaCost(std::move(symbols));
    }

private:
    void skipWhitespace() {
        while (pos_ < text_.size() && isWhitespace(text_[pos_])) {
            ++pos_;
        }
    }

    // Consumes one "{...}" token starting at pos_ and returns its body.
    std::string nextToken(size_t& token_start) {
        token_start = pos_;
        if (text_[pos_] == '}') {
            throw ParseError(ParseErrorKind::UNMATCHED_BRACE, "}", pos_);
        }
        if (text_[pos_] != '{') {
            throw ParseError(ParseErrorKind::STRAY_CHARACTER, text_.substr(pos_, 1), pos_);
        }

        size_t end = pos_ + 1;
        while (end < text_.size() && text_[end] != '}') {
            if (text_[end] == '{') {
                // A new token opens before this one is closed
                throw ParseError(ParseErrorKind::UNMATCHED_BRACE, text_.substr(pos_, end - pos_), pos_);
            }
            ++end;
        }
        if (end == text_.size()) {
            throw ParseError(ParseErrorKind::UNMATCHED_BRACE, text_.substr(pos_), pos_);
        }

        std::string body = text_.substr(pos_ + 1, end - pos_ - 1);
        pos_ = end + 1;
        return body;
    }

    const std::string& text_;
    size_t pos_;
};

} // namespace

ManaCost parse(const std::string& text) {
    try {
        ManaCost cost = ManaCostParser(text).parse();
        spdlog::debug("Parsed mana cost '{}' as {}", text, cost.toString());
        return cost;
    } catch (const ParseError& e) {
        spdlog::debug("Failed to parse mana cost '{}': {}", text, e.what());
        throw;
    } catch (const InvalidSymbol& e) {
        spdlog::debug("Invalid mana symbol in '{}': {}", text, e.what());
        throw;
    }
}
