#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "symbols/mana_cost.h"

enum class ParseErrorKind {
    UNMATCHED_BRACE,
    EMPTY_TOKEN,
    UNRECOGNIZED_SYMBOL,
    STRAY_CHARACTER,
    AMOUNT_OUT_OF_RANGE
};

std::string toString(ParseErrorKind kind);

// Thrown when text does not follow the mana cost grammar. `token` is the
// offending substring and `offset` its byte offset in the parsed text.
class ParseError : public std::runtime_error {
public:
    ParseError(ParseErrorKind kind, const std::string& token, size_t offset);

    ParseErrorKind kind() const { return kind_; }
    const std::string& token() const { return token_; }
    size_t offset() const { return offset_; }

private:
    ParseErrorKind kind_;
    std::string token_;
    size_t offset_;
};

// Parses a brace-delimited cost such as "{5}{U}{U/B}" into its symbols, in
// source order. Whitespace between tokens is ignored and letters are case
// insensitive.
//
// Throws ParseError on malformed text, and InvalidSymbol when a token is well
// formed but names an impossible symbol ("{W/W}"). There are no partial
// results.
ManaCost parse(const std::string& text);

// Parses the body of a single token, without braces: "R/G/P". `offset` is
// only used for error reporting.
Symbol parseSymbol(const std::string& body, size_t offset = 0);
