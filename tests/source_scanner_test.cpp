#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "validator/source_scanner.hpp"

using sandbar::sandbox::Language;
using sandbar::validator::ScanSource;
using sandbar::validator::Token;
using sandbar::validator::TokenKind;

namespace {

std::vector<std::string> Texts(const std::vector<Token>& tokens, TokenKind kind) {
    std::vector<std::string> texts;
    for (const auto& token : tokens) {
        if (token.kind == kind) {
            texts.push_back(token.text);
        }
    }
    return texts;
}

}  // namespace

// NOLINTNEXTLINE
TEST(source_scanner, python_comments_are_dropped_and_strings_decoded) {
    const auto tokens = ScanSource("x = 'a\\tb'  # os.system\nprint(x)\n", Language::kPython);
    const auto identifiers = Texts(tokens, TokenKind::kIdentifier);
    EXPECT_EQ(identifiers, (std::vector<std::string>{"x", "print", "x"}));
    const auto strings = Texts(tokens, TokenKind::kString);
    ASSERT_EQ(strings.size(), 1u);
    EXPECT_EQ(strings[0], "a\tb");
    EXPECT_EQ(tokens.back().line, 2);
}

// NOLINTNEXTLINE
TEST(source_scanner, python_hex_escapes_are_marked_obfuscated) {
    const auto tokens = ScanSource("s = '\\x6f\\x73'\n", Language::kPython);
    const auto it = std::find_if(tokens.begin(), tokens.end(), [](const Token& t) {
        return t.kind == TokenKind::kString;
    });
    ASSERT_NE(it, tokens.end());
    EXPECT_EQ(it->text, "os");
    EXPECT_TRUE(it->obfuscated_escape);
}

// NOLINTNEXTLINE
TEST(source_scanner, python_raw_and_triple_quoted_strings) {
    const auto tokens = ScanSource("a = r'\\x41'\nb = '''line1\nline2'''\nc = 1\n", Language::kPython);
    const auto strings = Texts(tokens, TokenKind::kString);
    ASSERT_EQ(strings.size(), 2u);
    EXPECT_EQ(strings[0], "\\x41");
    EXPECT_EQ(strings[1], "line1\nline2");
    EXPECT_EQ(tokens.back().line, 4);
}

// NOLINTNEXTLINE
TEST(source_scanner, python_fstrings_are_interpolated) {
    const auto tokens = ScanSource("name = 'x'\nprint(f'hi {name}')\n", Language::kPython);
    const auto it = std::find_if(tokens.begin(), tokens.end(), [](const Token& t) {
        return t.kind == TokenKind::kString && t.interpolated;
    });
    EXPECT_NE(it, tokens.end());
}

// NOLINTNEXTLINE
TEST(source_scanner, javascript_comments_and_template_literals) {
    const auto tokens = ScanSource("// require('fs')\n/* eval */ const t = `a${b}c`;\n", Language::kJavaScript);
    const auto identifiers = Texts(tokens, TokenKind::kIdentifier);
    EXPECT_EQ(std::count(identifiers.begin(), identifiers.end(), "require"), 0);
    EXPECT_EQ(std::count(identifiers.begin(), identifiers.end(), "eval"), 0);
    EXPECT_EQ(std::count(identifiers.begin(), identifiers.end(), "b"), 1);
}

// NOLINTNEXTLINE
TEST(source_scanner, javascript_unicode_escape_in_identifier) {
    const auto tokens = ScanSource("\\u0065val('1')", Language::kJavaScript);
    ASSERT_FALSE(tokens.empty());
    EXPECT_EQ(tokens.front().kind, TokenKind::kIdentifier);
    EXPECT_EQ(tokens.front().text, "eval");
    EXPECT_TRUE(tokens.front().obfuscated_escape);
}

// NOLINTNEXTLINE
TEST(source_scanner, shell_quoting_and_escaped_words) {
    const auto tokens = ScanSource("echo 'a b' \"c $d\" $'\\x41' \\e", Language::kShell);
    const auto strings = Texts(tokens, TokenKind::kString);
    ASSERT_EQ(strings.size(), 3u);
    EXPECT_EQ(strings[0], "a b");
    EXPECT_EQ(strings[1], "c $d");
    EXPECT_EQ(strings[2], "A");
    const auto escaped = std::find_if(tokens.begin(), tokens.end(), [](const Token& t) {
        return t.kind == TokenKind::kPunct && t.text == "\\e";
    });
    ASSERT_NE(escaped, tokens.end());
    EXPECT_TRUE(escaped->obfuscated_escape);
}

// NOLINTNEXTLINE
TEST(source_scanner, unterminated_literal_ends_at_line_end) {
    const auto tokens = ScanSource("x = 'open\ny = 2\n", Language::kPython);
    const auto identifiers = Texts(tokens, TokenKind::kIdentifier);
    EXPECT_NE(std::find(identifiers.begin(), identifiers.end(), "y"), identifiers.end());
}
