#include "validator/validation_layers.hpp"

namespace sandbar::validator {
namespace {

constexpr std::size_t kMaxImportClauseTokens = 128;

bool IsPunct(const Token& token, std::string_view text) {
    return token.kind == TokenKind::kPunct && token.text == text;
}

bool IsIdent(const Token& token, std::string_view text) {
    return token.kind == TokenKind::kIdentifier && token.text == text;
}

bool StartsStatement(const std::vector<Token>& tokens, std::size_t index) {
    if (index == 0) {
        return true;
    }
    const auto& previous = tokens[index - 1];
    return previous.line != tokens[index].line || IsPunct(previous, ";") || IsPunct(previous, ":");
}

class ImportChecker {
public:
    explicit ImportChecker(const SourceUnit& unit) : unit_(unit), tokens_(unit.tokens) {}

    std::vector<Violation> Run() {
        switch (unit_.language) {
            case sandbox::Language::kPython:
                CheckPython();
                break;
            case sandbox::Language::kJavaScript:
                CheckJavaScript();
                break;
            case sandbox::Language::kShell:
                CheckShell();
                break;
        }
        return std::move(violations_);
    }

private:
    void Report(ViolationKind kind, const std::string& pattern, const Token& token) {
        violations_.push_back(MakeViolation(
            Layer::kImport, kind, pattern, unit_.text, token.offset, token.length));
    }

    void RequireAllowed(const std::string& package, const Token& token) {
        if (unit_.sandbox && unit_.sandbox->allowed_packages.count(package) > 0) {
            return;
        }
        auto violation = MakeViolation(
            Layer::kImport, ViolationKind::kDisallowedImport, package, unit_.text, token.offset, token.length);
        violations_.push_back(std::move(violation));
    }

    // Reads `a.b.c` starting at `index`; returns the first component.
    std::string ReadDottedName(std::size_t& index) const {
        std::string first;
        bool expect_name = true;
        while (index < tokens_.size()) {
            const auto& token = tokens_[index];
            if (expect_name && token.kind == TokenKind::kIdentifier) {
                if (first.empty()) {
                    first = token.text;
                }
                expect_name = false;
                ++index;
                continue;
            }
            if (!expect_name && IsPunct(token, ".")) {
                expect_name = true;
                ++index;
                continue;
            }
            break;
        }
        return first;
    }

    void CheckPython() {
        for (std::size_t i = 0; i < tokens_.size(); ++i) {
            const auto& token = tokens_[i];
            if (!StartsStatement(tokens_, i)) {
                continue;
            }
            if (IsIdent(token, "import")) {
                std::size_t index = i + 1;
                while (index < tokens_.size() && tokens_[index].line == token.line) {
                    const auto& name_token = tokens_[index];
                    if (IsPunct(name_token, "(") || IsPunct(name_token, ")")) {
                        ++index;
                        continue;
                    }
                    const auto module = ReadDottedName(index);
                    if (module.empty()) {
                        break;
                    }
                    RequireAllowed(module, name_token);
                    if (index < tokens_.size() && IsIdent(tokens_[index], "as")) {
                        index += 2;
                    }
                    if (index < tokens_.size() && IsPunct(tokens_[index], ",")) {
                        ++index;
                        continue;
                    }
                    break;
                }
            } else if (IsIdent(token, "from")) {
                std::size_t index = i + 1;
                if (index < tokens_.size() && IsPunct(tokens_[index], ".")) {
                    Report(ViolationKind::kRelativeImport, "from .", tokens_[index]);
                    continue;
                }
                if (index >= tokens_.size()) {
                    continue;
                }
                const auto& name_token = tokens_[index];
                const auto module = ReadDottedName(index);
                if (module.empty()) {
                    continue;
                }
                RequireAllowed(module, name_token);
                if (index + 1 < tokens_.size() && IsIdent(tokens_[index], "import") &&
                    IsPunct(tokens_[index + 1], "*")) {
                    Report(ViolationKind::kWildcardImport, "import *", tokens_[index + 1]);
                }
            }
        }
    }

    void CheckSpecifier(const Token& token) {
        std::string specifier = token.text;
        if (specifier.rfind("node:", 0) == 0) {
            specifier = specifier.substr(5);
        }
        if (specifier.empty() || specifier.front() == '.' || specifier.front() == '/') {
            Report(ViolationKind::kRelativeImport, specifier.empty() ? token.text : specifier, token);
            return;
        }
        std::string package;
        const auto first_slash = specifier.find('/');
        if (specifier.front() == '@' && first_slash != std::string::npos) {
            const auto second_slash = specifier.find('/', first_slash + 1);
            package = specifier.substr(0, second_slash);
        } else {
            package = specifier.substr(0, first_slash);
        }
        RequireAllowed(package, token);
    }

    // require(<literal>) / import(<literal>); anything else cannot be checked.
    void CheckCallSpecifier(std::size_t open_paren, const Token& keyword) {
        const auto literal = open_paren + 1;
        const auto close = open_paren + 2;
        if (close < tokens_.size() && tokens_[literal].kind == TokenKind::kString &&
            !tokens_[literal].interpolated && IsPunct(tokens_[close], ")")) {
            CheckSpecifier(tokens_[literal]);
            return;
        }
        Report(ViolationKind::kDynamicImport, keyword.text + "(<expression>)", keyword);
    }

    void CheckJavaScript() {
        for (std::size_t i = 0; i < tokens_.size(); ++i) {
            const auto& token = tokens_[i];
            if (token.kind != TokenKind::kIdentifier) {
                continue;
            }
            if (i > 0 && IsPunct(tokens_[i - 1], ".")) {
                continue;
            }
            const bool has_next = i + 1 < tokens_.size();
            if (token.text == "require" && has_next && IsPunct(tokens_[i + 1], "(")) {
                CheckCallSpecifier(i + 1, token);
                continue;
            }
            if (token.text == "import" && has_next && IsPunct(tokens_[i + 1], "(")) {
                CheckCallSpecifier(i + 1, token);
                continue;
            }
            if (token.text == "import" && has_next && tokens_[i + 1].kind == TokenKind::kString) {
                CheckSpecifier(tokens_[i + 1]);
                continue;
            }
            if (token.text == "import" || token.text == "export") {
                for (std::size_t j = i + 1; j < tokens_.size() && j < i + kMaxImportClauseTokens; ++j) {
                    if (IsPunct(tokens_[j], ";")) {
                        break;
                    }
                    if (IsIdent(tokens_[j], "from") && j + 1 < tokens_.size() &&
                        tokens_[j + 1].kind == TokenKind::kString) {
                        CheckSpecifier(tokens_[j + 1]);
                        break;
                    }
                    if (token.text == "export" && !IsPunct(tokens_[j], "*") && !IsPunct(tokens_[j], "{") &&
                        j == i + 1) {
                        break;
                    }
                }
            }
        }
    }

    bool AtCommandPosition(std::size_t index) const {
        if (index == 0) {
            return true;
        }
        const auto& previous = tokens_[index - 1];
        if (previous.line != tokens_[index].line) {
            return true;
        }
        if (previous.kind == TokenKind::kPunct) {
            return previous.text == ";" || previous.text == "|" || previous.text == "&" ||
                   previous.text == "(" || previous.text == "{";
        }
        return previous.kind == TokenKind::kIdentifier &&
               (previous.text == "then" || previous.text == "do" || previous.text == "else");
    }

    void CheckShell() {
        const auto text = unit_.text;
        for (std::size_t i = 0; i < tokens_.size(); ++i) {
            const auto& token = tokens_[i];
            if (!AtCommandPosition(i)) {
                continue;
            }
            if (IsIdent(token, "source")) {
                Report(ViolationKind::kSourcedScript, "source", token);
                continue;
            }
            const auto after = token.offset + 1;
            if (IsPunct(token, ".") && after < text.size() && (text[after] == ' ' || text[after] == '\t')) {
                Report(ViolationKind::kSourcedScript, ".", token);
            }
        }
    }

    const SourceUnit& unit_;
    const std::vector<Token>& tokens_;
    std::vector<Violation> violations_;
};

}  // namespace

std::vector<Violation> CheckImports(const SourceUnit& unit) {
    return ImportChecker(unit).Run();
}

}  // namespace sandbar::validator
