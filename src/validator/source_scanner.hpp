#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "sandbox/sandbox_types.hpp"

namespace sandbar::validator {

enum class TokenKind {
    kIdentifier,
    kNumber,
    kString,
    kPunct
};

struct Token {
    TokenKind kind = TokenKind::kPunct;
    // Identifier/number/punctuation text, or the decoded value of a string literal.
    std::string text;
    std::size_t offset = 0;
    std::size_t length = 0;
    int line = 1;
    // Hex, octal, unicode or named escapes, or a backslash-escaped shell word.
    bool obfuscated_escape = false;
    // f-string or template literal carrying embedded expressions.
    bool interpolated = false;
};

// Lexes source into tokens with comments removed and string literals decoded.
// Unterminated literals end at the end of the line (or of the source) so that
// malformed input still yields a token stream.
std::vector<Token> ScanSource(std::string_view source, sandbox::Language language);

bool IsIdentifierStart(char c);
bool IsIdentifierChar(char c);

}  // namespace sandbar::validator
