#include "validator/validation_layers.hpp"

#include <array>
#include <cctype>
#include <stdexcept>

#include <openssl/evp.h>

#include "utils/common.hpp"

namespace sandbar::validator {
namespace {

constexpr std::size_t kEncodedLiteralMin = 20;

// Names whose reconstruction from character codes or encoded literals gives away intent.
constexpr std::array<std::string_view, 22> kSuspiciousWords = {
    "import", "eval", "exec", "system", "popen", "subprocess", "require",
    "child_process", "process", "constructor", "__", "builtins", "globals",
    "open", "socket", "spawn", "getattr", "/bin/", "compile", "function",
    "os.", "fs."};

std::string FindSuspiciousWord(std::string_view text) {
    const auto lowered = utils::ToLower(text);
    for (const auto word : kSuspiciousWords) {
        if (lowered.find(word) != std::string::npos) {
            return std::string(word);
        }
    }
    return {};
}

bool IsPunct(const Token& token, std::string_view text) {
    return token.kind == TokenKind::kPunct && token.text == text;
}

bool IsIdent(const Token& token, std::string_view text) {
    return token.kind == TokenKind::kIdentifier && token.text == text;
}

bool ParseCharCode(const Token& token, unsigned long& value) {
    if (token.kind != TokenKind::kNumber) {
        return false;
    }
    try {
        value = std::stoul(token.text, nullptr, 0);
    } catch (const std::logic_error&) {
        return false;
    }
    return value < 0x110000;
}

bool LooksBase64(std::string_view text) {
    if (text.size() < kEncodedLiteralMin) {
        return false;
    }
    bool upper = false;
    bool lower = false;
    bool marker = false;
    std::size_t padding = 0;
    for (const char c : text) {
        if (c == '=') {
            ++padding;
            marker = true;
            continue;
        }
        if (padding > 0) {
            return false;
        }
        if (std::isupper(static_cast<unsigned char>(c))) {
            upper = true;
        } else if (std::islower(static_cast<unsigned char>(c))) {
            lower = true;
        } else if (std::isdigit(static_cast<unsigned char>(c)) || c == '+' || c == '/') {
            marker = true;
        } else {
            return false;
        }
    }
    return padding <= 2 && upper && lower && marker;
}

bool LooksHex(std::string_view text) {
    if (text.size() < kEncodedLiteralMin) {
        return false;
    }
    for (const char c : text) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::string DecodeBase64(std::string_view text) {
    std::string padded(text);
    while (padded.size() % 4 != 0) {
        padded.push_back('=');
    }
    std::string decoded(padded.size() / 4 * 3, '\0');
    const int length = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(decoded.data()),
                                       reinterpret_cast<const unsigned char*>(padded.data()),
                                       static_cast<int>(padded.size()));
    if (length < 0) {
        return {};
    }
    decoded.resize(static_cast<std::size_t>(length));
    return decoded;
}

std::string DecodeHex(std::string_view text) {
    std::string decoded;
    for (std::size_t i = 0; i + 1 < text.size(); i += 2) {
        decoded.push_back(static_cast<char>(std::stoi(std::string(text.substr(i, 2)), nullptr, 16)));
    }
    return decoded;
}

class BypassChecker {
public:
    explicit BypassChecker(const SourceUnit& unit) : unit_(unit), tokens_(unit.tokens) {}

    std::vector<Violation> Run() {
        for (std::size_t i = 0; i < tokens_.size(); ++i) {
            CheckCharCodes(i);
            CheckDecoderCall(i);
            CheckStringAssembly(i);
            CheckLiteral(tokens_[i]);
        }
        return std::move(violations_);
    }

private:
    void Report(ViolationKind kind, const std::string& pattern, const Token& token, const std::string& detail = {}) {
        auto violation = MakeViolation(Layer::kBypass, kind, pattern, unit_.text, token.offset, token.length);
        if (!detail.empty()) {
            violation.excerpt = SanitizeExcerpt(detail);
        }
        violations_.push_back(std::move(violation));
    }

    // chr(N) [+ chr(M) ...] in Python, String.fromCharCode(a, b, ...) in JavaScript.
    void CheckCharCodes(std::size_t i) {
        const auto& token = tokens_[i];
        if (unit_.language == sandbox::Language::kPython && (IsIdent(token, "chr") || IsIdent(token, "unichr"))) {
            if (i > 0 && IsPunct(tokens_[i - 1], ".")) {
                return;
            }
            if (i > 0 && tokens_[i - 1].kind == TokenKind::kIdentifier && tokens_[i - 1].text == "def") {
                return;
            }
            if (reconstructed_chain_end_ > i) {
                return;
            }
            std::string folded;
            std::size_t index = i;
            while (index + 3 < tokens_.size() &&
                   (IsIdent(tokens_[index], "chr") || IsIdent(tokens_[index], "unichr")) &&
                   IsPunct(tokens_[index + 1], "(") && IsPunct(tokens_[index + 3], ")")) {
                unsigned long value = 0;
                if (!ParseCharCode(tokens_[index + 2], value)) {
                    break;
                }
                folded.push_back(value < 0x80 ? static_cast<char>(value) : '?');
                index += 4;
                if (index + 1 < tokens_.size() && IsPunct(tokens_[index], "+")) {
                    ++index;
                    continue;
                }
                break;
            }
            reconstructed_chain_end_ = index;
            ReportReconstruction(token, "chr()", folded);
            return;
        }
        if (IsIdent(token, "fromCharCode") || IsIdent(token, "fromCodePoint")) {
            std::string folded;
            std::size_t index = i + 1;
            if (index < tokens_.size() && IsPunct(tokens_[index], "(")) {
                ++index;
                while (index < tokens_.size()) {
                    unsigned long value = 0;
                    if (!ParseCharCode(tokens_[index], value)) {
                        break;
                    }
                    folded.push_back(value < 0x80 ? static_cast<char>(value) : '?');
                    ++index;
                    if (index < tokens_.size() && IsPunct(tokens_[index], ",")) {
                        ++index;
                        continue;
                    }
                    break;
                }
            }
            ReportReconstruction(token, "String." + token.text, folded);
        }
    }

    void ReportReconstruction(const Token& token, const std::string& pattern, const std::string& folded) {
        if (folded.empty()) {
            Report(ViolationKind::kCharCodeReconstruction, pattern, token);
            return;
        }
        const auto word = FindSuspiciousWord(folded);
        Report(ViolationKind::kCharCodeReconstruction, pattern, token,
               word.empty() ? "-> " + folded : "-> " + folded + " (" + word + ")");
    }

    void CheckDecoderCall(std::size_t i) {
        static const std::array<std::string_view, 12> kDecoders = {
            "b64decode", "b32decode", "b16decode", "a85decode", "b85decode", "urlsafe_b64decode",
            "fromhex", "unhexlify", "atob", "unescape", "decodeURIComponent", "decodeURI"};
        const auto& token = tokens_[i];
        if (token.kind != TokenKind::kIdentifier || i + 1 >= tokens_.size() || !IsPunct(tokens_[i + 1], "(")) {
            return;
        }
        for (const auto decoder : kDecoders) {
            if (token.text == decoder) {
                Report(ViolationKind::kDecoderCall, std::string(decoder) + "(", token);
                return;
            }
        }
        if (token.text == "decode" && i >= 2 && IsPunct(tokens_[i - 1], ".") && IsIdent(tokens_[i - 2], "codecs")) {
            Report(ViolationKind::kDecoderCall, "codecs.decode(", token);
            return;
        }
        if (token.text == "from" && i >= 2 && IsPunct(tokens_[i - 1], ".") && IsIdent(tokens_[i - 2], "Buffer")) {
            for (std::size_t j = i + 2; j < tokens_.size() && j < i + 8; ++j) {
                if (tokens_[j].kind == TokenKind::kString &&
                    (tokens_[j].text == "base64" || tokens_[j].text == "hex")) {
                    Report(ViolationKind::kDecoderCall, "Buffer.from(..., '" + tokens_[j].text + "')", token);
                    return;
                }
            }
        }
    }

    // "...."[::-1] and "...".split("").reverse()
    void CheckStringAssembly(std::size_t i) {
        const auto& token = tokens_[i];
        if (unit_.language == sandbox::Language::kShell) {
            // e''val and "ev"al are glued into a single word by bash.
            if (i + 1 < tokens_.size()) {
                const auto& next = tokens_[i + 1];
                const bool adjacent = token.offset + token.length == next.offset;
                const bool glued = (token.kind == TokenKind::kIdentifier && next.kind == TokenKind::kString) ||
                                   (token.kind == TokenKind::kString && next.kind == TokenKind::kIdentifier);
                if (adjacent && glued) {
                    Report(ViolationKind::kStringAssembly, "quoted word splicing", token,
                           token.text + next.text);
                }
            }
            return;
        }
        if (token.kind != TokenKind::kString) {
            return;
        }
        if (i + 6 < tokens_.size() && IsPunct(tokens_[i + 1], "[") && IsPunct(tokens_[i + 2], ":") &&
            IsPunct(tokens_[i + 3], ":") && IsPunct(tokens_[i + 4], "-") &&
            tokens_[i + 5].kind == TokenKind::kNumber && IsPunct(tokens_[i + 6], "]")) {
            std::string reversed(token.text.rbegin(), token.text.rend());
            Report(ViolationKind::kStringAssembly, "[::-1]", token, "-> " + reversed);
            return;
        }
        for (std::size_t j = i + 1; j < tokens_.size() && j < i + 12; ++j) {
            if (IsIdent(tokens_[j], "reverse") && j > 0 && IsPunct(tokens_[j - 1], ".")) {
                std::string reversed(token.text.rbegin(), token.text.rend());
                Report(ViolationKind::kStringAssembly, ".reverse()", token, "-> " + reversed);
                return;
            }
            if (IsPunct(tokens_[j], ";")) {
                return;
            }
        }
    }

    void CheckLiteral(const Token& token) {
        if (token.obfuscated_escape) {
            const auto word = FindSuspiciousWord(token.text);
            Report(ViolationKind::kEscapeSequence,
                   token.kind == TokenKind::kString ? "escaped string literal" : "escaped identifier",
                   token, word.empty() ? std::string() : "-> " + token.text);
        }
        if (token.kind != TokenKind::kString) {
            return;
        }
        const auto trimmed = utils::Trim(token.text);
        if (LooksHex(trimmed)) {
            const auto decoded = DecodeHex(trimmed);
            const auto word = FindSuspiciousWord(decoded);
            Report(ViolationKind::kEncodedLiteral, "hex literal", token,
                   word.empty() ? std::string() : "-> " + decoded);
        } else if (LooksBase64(trimmed)) {
            const auto decoded = DecodeBase64(trimmed);
            const auto word = FindSuspiciousWord(decoded);
            Report(ViolationKind::kEncodedLiteral, "base64 literal", token,
                   word.empty() ? std::string() : "-> " + decoded);
        }
    }

    const SourceUnit& unit_;
    const std::vector<Token>& tokens_;
    std::vector<Violation> violations_;
    std::size_t reconstructed_chain_end_ = 0;
};

}  // namespace

std::vector<Violation> CheckBypasses(const SourceUnit& unit) {
    return BypassChecker(unit).Run();
}

}  // namespace sandbar::validator
