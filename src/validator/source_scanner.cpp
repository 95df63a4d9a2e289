#include "validator/source_scanner.hpp"

#include <cctype>
#include <cstdint>

#include "utils/common.hpp"

namespace sandbar::validator {
namespace {

bool IsHex(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

bool IsOctal(char c) {
    return c >= '0' && c <= '7';
}

std::uint32_t HexValue(char c) {
    if (c >= '0' && c <= '9') {
        return static_cast<std::uint32_t>(c - '0');
    }
    return static_cast<std::uint32_t>(std::tolower(static_cast<unsigned char>(c)) - 'a' + 10);
}

void AppendUtf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x110000) {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back('?');
    }
}

class Scanner {
public:
    Scanner(std::string_view source, sandbox::Language language)
        : source_(source), language_(language) {}

    std::vector<Token> Run() {
        switch (language_) {
            case sandbox::Language::kPython:
                ScanPython();
                break;
            case sandbox::Language::kJavaScript:
                ScanJavaScript();
                break;
            case sandbox::Language::kShell:
                ScanShell();
                break;
        }
        return std::move(tokens_);
    }

private:
    char Peek(std::size_t ahead = 0) const {
        const auto index = pos_ + ahead;
        return index < source_.size() ? source_[index] : '\0';
    }

    bool AtEnd() const { return pos_ >= source_.size(); }

    void Advance() {
        if (source_[pos_] == '\n') {
            ++line_;
        }
        ++pos_;
    }

    void SkipToLineEnd() {
        while (!AtEnd() && Peek() != '\n') {
            ++pos_;
        }
    }

    Token& Emit(TokenKind kind, std::string text, std::size_t start, int line) {
        Token token{};
        token.kind = kind;
        token.text = std::move(text);
        token.offset = start;
        token.length = pos_ - start;
        token.line = line;
        tokens_.push_back(std::move(token));
        return tokens_.back();
    }

    void ScanIdentifier() {
        const auto start = pos_;
        while (!AtEnd() && IsIdentifierChar(Peek())) {
            ++pos_;
        }
        Emit(TokenKind::kIdentifier, std::string(source_.substr(start, pos_ - start)), start, line_);
    }

    void ScanNumber() {
        const auto start = pos_;
        while (!AtEnd() && (std::isalnum(static_cast<unsigned char>(Peek())) || Peek() == '_' || Peek() == '.')) {
            ++pos_;
        }
        Emit(TokenKind::kNumber, std::string(source_.substr(start, pos_ - start)), start, line_);
    }

    void EmitPunct() {
        const auto start = pos_;
        const int line = line_;
        Advance();
        Emit(TokenKind::kPunct, std::string(source_.substr(start, 1)), start, line);
    }

    // Reads exactly `digits` hex digits (or fewer when `at_most`); returns false on none.
    bool ReadHex(std::size_t digits, bool at_most, std::uint32_t& value) {
        value = 0;
        std::size_t count = 0;
        while (count < digits && IsHex(Peek())) {
            value = value * 16 + HexValue(Peek());
            ++pos_;
            ++count;
        }
        return at_most ? count > 0 : count == digits;
    }

    // Shared escape decoding for Python, JavaScript and ANSI-C shell strings.
    void DecodeEscape(std::string& out, bool& obfuscated) {
        ++pos_;  // backslash
        if (AtEnd()) {
            out.push_back('\\');
            return;
        }
        const char c = Peek();
        std::uint32_t value = 0;
        switch (c) {
            case 'n': out.push_back('\n'); ++pos_; return;
            case 't': out.push_back('\t'); ++pos_; return;
            case 'r': out.push_back('\r'); ++pos_; return;
            case 'b': out.push_back('\b'); ++pos_; return;
            case 'f': out.push_back('\f'); ++pos_; return;
            case 'v': out.push_back('\v'); ++pos_; return;
            case 'a': out.push_back('\a'); ++pos_; return;
            case '\\': out.push_back('\\'); ++pos_; return;
            case '\'': out.push_back('\''); ++pos_; return;
            case '"': out.push_back('"'); ++pos_; return;
            case '`': out.push_back('`'); ++pos_; return;
            case '\n': Advance(); return;
            case 'x':
                ++pos_;
                if (ReadHex(2, false, value)) {
                    AppendUtf8(out, value);
                    obfuscated = true;
                } else {
                    out += "\\x";
                }
                return;
            case 'u':
                ++pos_;
                if (Peek() == '{' && language_ == sandbox::Language::kJavaScript) {
                    ++pos_;
                    ReadHex(6, true, value);
                    if (Peek() == '}') {
                        ++pos_;
                    }
                    AppendUtf8(out, value);
                    obfuscated = true;
                } else if (ReadHex(4, false, value)) {
                    AppendUtf8(out, value);
                    obfuscated = true;
                } else {
                    out += "\\u";
                }
                return;
            case 'U':
                ++pos_;
                if (ReadHex(8, false, value)) {
                    AppendUtf8(out, value);
                    obfuscated = true;
                } else {
                    out += "\\U";
                }
                return;
            case 'N':
                ++pos_;
                if (Peek() == '{') {
                    while (!AtEnd() && Peek() != '}' && Peek() != '\n') {
                        ++pos_;
                    }
                    if (Peek() == '}') {
                        ++pos_;
                    }
                    out.push_back('?');
                    obfuscated = true;
                } else {
                    out += "\\N";
                }
                return;
            default:
                break;
        }
        if (IsOctal(c)) {
            std::size_t count = 0;
            while (count < 3 && IsOctal(Peek())) {
                value = value * 8 + static_cast<std::uint32_t>(Peek() - '0');
                ++pos_;
                ++count;
            }
            AppendUtf8(out, value);
            if (!(count == 1 && value == 0)) {
                obfuscated = true;
            }
            return;
        }
        out.push_back('\\');
        out.push_back(c);
        Advance();
    }

    void ScanPythonString(std::size_t start, const std::string& prefix) {
        const int line = line_;
        const bool raw = prefix.find('r') != std::string::npos;
        const bool formatted = prefix.find('f') != std::string::npos;
        const char quote = Peek();
        const bool triple = Peek(1) == quote && Peek(2) == quote;
        pos_ += triple ? 3 : 1;
        std::string value;
        bool obfuscated = false;
        while (!AtEnd()) {
            const char c = Peek();
            if (triple && c == quote && Peek(1) == quote && Peek(2) == quote) {
                pos_ += 3;
                break;
            }
            if (!triple && c == quote) {
                ++pos_;
                break;
            }
            if (!triple && c == '\n') {
                break;
            }
            if (c == '\\' && !raw) {
                DecodeEscape(value, obfuscated);
                continue;
            }
            if (c == '\\' && raw && Peek(1) != '\0') {
                value.push_back(c);
                ++pos_;
                value.push_back(Peek());
                Advance();
                continue;
            }
            value.push_back(c);
            Advance();
        }
        auto& token = Emit(TokenKind::kString, std::move(value), start, line);
        token.obfuscated_escape = obfuscated;
        if (formatted) {
            const auto& text = token.text;
            for (std::size_t i = 0; i < text.size(); ++i) {
                if (text[i] == '{') {
                    if (i + 1 < text.size() && text[i + 1] == '{') {
                        ++i;
                        continue;
                    }
                    token.interpolated = true;
                    break;
                }
            }
        }
    }

    void ScanPython() {
        while (!AtEnd()) {
            const char c = Peek();
            if (c == '\n' || std::isspace(static_cast<unsigned char>(c))) {
                Advance();
                continue;
            }
            if (c == '#') {
                SkipToLineEnd();
                continue;
            }
            if (c == '\\' && Peek(1) == '\n') {
                ++pos_;
                Advance();
                continue;
            }
            if (IsIdentifierStart(c) && c != '$') {
                const auto start = pos_;
                std::size_t end = pos_;
                while (end < source_.size() && IsIdentifierChar(source_[end]) && source_[end] != '$') {
                    ++end;
                }
                const auto word = utils::ToLower(source_.substr(start, end - start));
                const char after = end < source_.size() ? source_[end] : '\0';
                if ((after == '\'' || after == '"') &&
                    (word == "r" || word == "b" || word == "u" || word == "f" || word == "rb" ||
                     word == "br" || word == "fr" || word == "rf")) {
                    pos_ = end;
                    ScanPythonString(start, word);
                    continue;
                }
                pos_ = end;
                Emit(TokenKind::kIdentifier, std::string(source_.substr(start, end - start)), start, line_);
                continue;
            }
            if (std::isdigit(static_cast<unsigned char>(c)) ||
                (c == '.' && std::isdigit(static_cast<unsigned char>(Peek(1))))) {
                ScanNumber();
                continue;
            }
            if (c == '\'' || c == '"') {
                ScanPythonString(pos_, "");
                continue;
            }
            EmitPunct();
        }
    }

    // Identifier that may contain \uXXXX escapes, which JavaScript resolves
    // before keyword and name lookup.
    void ScanJsIdentifier() {
        const auto start = pos_;
        const int line = line_;
        std::string name;
        bool obfuscated = false;
        while (!AtEnd()) {
            const char c = Peek();
            if (c == '\\' && Peek(1) == 'u') {
                DecodeEscape(name, obfuscated);
                continue;
            }
            if (!IsIdentifierChar(c)) {
                break;
            }
            name.push_back(c);
            ++pos_;
        }
        auto& token = Emit(TokenKind::kIdentifier, std::move(name), start, line);
        token.obfuscated_escape = obfuscated;
    }

    void ScanJsString() {
        const auto start = pos_;
        const int line = line_;
        const char quote = Peek();
        ++pos_;
        std::string value;
        bool obfuscated = false;
        while (!AtEnd()) {
            const char c = Peek();
            if (c == quote) {
                ++pos_;
                break;
            }
            if (c == '\n') {
                break;
            }
            if (c == '\\') {
                DecodeEscape(value, obfuscated);
                continue;
            }
            value.push_back(c);
            ++pos_;
        }
        auto& token = Emit(TokenKind::kString, std::move(value), start, line);
        token.obfuscated_escape = obfuscated;
    }

    // Reads template text up to the closing backtick or the next ${.
    void ScanTemplateChunk(std::size_t start) {
        const int line = line_;
        std::string value;
        bool obfuscated = false;
        bool interpolated = false;
        while (!AtEnd()) {
            const char c = Peek();
            if (c == '`') {
                ++pos_;
                break;
            }
            if (c == '$' && Peek(1) == '{') {
                pos_ += 2;
                interpolated = true;
                template_depths_.push_back(0);
                break;
            }
            if (c == '\\') {
                DecodeEscape(value, obfuscated);
                continue;
            }
            value.push_back(c);
            Advance();
        }
        auto& token = Emit(TokenKind::kString, std::move(value), start, line);
        token.obfuscated_escape = obfuscated;
        token.interpolated = interpolated;
    }

    void ScanJavaScript() {
        while (!AtEnd()) {
            const char c = Peek();
            if (c == '\n' || std::isspace(static_cast<unsigned char>(c))) {
                Advance();
                continue;
            }
            if (c == '/' && Peek(1) == '/') {
                SkipToLineEnd();
                continue;
            }
            if (c == '/' && Peek(1) == '*') {
                pos_ += 2;
                while (!AtEnd() && !(Peek() == '*' && Peek(1) == '/')) {
                    Advance();
                }
                if (!AtEnd()) {
                    pos_ += 2;
                }
                continue;
            }
            if (IsIdentifierStart(c) || (c == '\\' && Peek(1) == 'u')) {
                ScanJsIdentifier();
                continue;
            }
            if (std::isdigit(static_cast<unsigned char>(c)) ||
                (c == '.' && std::isdigit(static_cast<unsigned char>(Peek(1))))) {
                ScanNumber();
                continue;
            }
            if (c == '\'' || c == '"') {
                ScanJsString();
                continue;
            }
            if (c == '`') {
                const auto start = pos_;
                ++pos_;
                ScanTemplateChunk(start);
                continue;
            }
            if (c == '{' && !template_depths_.empty()) {
                ++template_depths_.back();
            }
            if (c == '}' && !template_depths_.empty()) {
                if (template_depths_.back() == 0) {
                    template_depths_.pop_back();
                    const auto start = pos_;
                    ++pos_;
                    ScanTemplateChunk(start);
                    continue;
                }
                --template_depths_.back();
            }
            EmitPunct();
        }
    }

    void ScanShellSingleQuoted() {
        const auto start = pos_;
        const int line = line_;
        ++pos_;
        std::string value;
        while (!AtEnd() && Peek() != '\'') {
            value.push_back(Peek());
            Advance();
        }
        if (!AtEnd()) {
            ++pos_;
        }
        Emit(TokenKind::kString, std::move(value), start, line);
    }

    void ScanShellDoubleQuoted() {
        const auto start = pos_;
        const int line = line_;
        ++pos_;
        std::string value;
        bool interpolated = false;
        while (!AtEnd() && Peek() != '"') {
            const char c = Peek();
            if (c == '\\' && (Peek(1) == '"' || Peek(1) == '\\' || Peek(1) == '$' || Peek(1) == '`')) {
                value.push_back(Peek(1));
                pos_ += 2;
                continue;
            }
            if (c == '$' || c == '`') {
                interpolated = true;
            }
            value.push_back(c);
            Advance();
        }
        if (!AtEnd()) {
            ++pos_;
        }
        auto& token = Emit(TokenKind::kString, std::move(value), start, line);
        token.interpolated = interpolated;
    }

    void ScanShellAnsiC() {
        const auto start = pos_;
        const int line = line_;
        pos_ += 2;
        std::string value;
        bool obfuscated = false;
        while (!AtEnd() && Peek() != '\'') {
            if (Peek() == '\\') {
                DecodeEscape(value, obfuscated);
                continue;
            }
            value.push_back(Peek());
            Advance();
        }
        if (!AtEnd()) {
            ++pos_;
        }
        auto& token = Emit(TokenKind::kString, std::move(value), start, line);
        token.obfuscated_escape = obfuscated;
    }

    void ScanShell() {
        while (!AtEnd()) {
            const char c = Peek();
            if (c == '\n' || std::isspace(static_cast<unsigned char>(c))) {
                Advance();
                continue;
            }
            if (c == '#' && (pos_ == 0 || std::isspace(static_cast<unsigned char>(source_[pos_ - 1])))) {
                SkipToLineEnd();
                continue;
            }
            if (c == '\\') {
                if (Peek(1) == '\n') {
                    ++pos_;
                    Advance();
                    continue;
                }
                const auto start = pos_;
                const int line = line_;
                ++pos_;
                std::string text = "\\";
                if (!AtEnd()) {
                    text.push_back(Peek());
                    Advance();
                }
                auto& token = Emit(TokenKind::kPunct, std::move(text), start, line);
                token.obfuscated_escape = std::isalnum(static_cast<unsigned char>(token.text.back())) != 0;
                continue;
            }
            if (c == '$' && Peek(1) == '\'') {
                ScanShellAnsiC();
                continue;
            }
            if (c == '\'') {
                ScanShellSingleQuoted();
                continue;
            }
            if (c == '"') {
                ScanShellDoubleQuoted();
                continue;
            }
            if (IsIdentifierStart(c) && c != '$') {
                const auto start = pos_;
                while (!AtEnd() && IsIdentifierChar(Peek()) && Peek() != '$') {
                    ++pos_;
                }
                Emit(TokenKind::kIdentifier, std::string(source_.substr(start, pos_ - start)), start, line_);
                continue;
            }
            if (std::isdigit(static_cast<unsigned char>(c))) {
                ScanNumber();
                continue;
            }
            EmitPunct();
        }
    }

    std::string_view source_;
    sandbox::Language language_;
    std::size_t pos_ = 0;
    int line_ = 1;
    std::vector<int> template_depths_;
    std::vector<Token> tokens_;
};

}  // namespace

bool IsIdentifierStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool IsIdentifierChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

std::vector<Token> ScanSource(std::string_view source, sandbox::Language language) {
    return Scanner(source, language).Run();
}

}  // namespace sandbar::validator
