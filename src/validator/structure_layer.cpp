#include "validator/validation_layers.hpp"

#include <optional>
#include <set>
#include <string>

namespace sandbar::validator {
namespace {

const std::set<std::string> kPythonReflectiveAttributes = {
    "__class__", "__bases__", "__base__", "__mro__", "__subclasses__", "__globals__",
    "__builtins__", "__code__", "__func__", "__closure__", "__dict__", "__module__",
    "__self__", "__getattribute__", "__reduce__", "__reduce_ex__", "__loader__",
    "__spec__", "__import__", "func_globals", "func_code", "gi_frame", "gi_code",
    "cr_frame", "ag_frame", "f_globals", "f_locals", "f_back", "f_code", "f_builtins",
    "co_code", "tb_frame", "mro"};

const std::set<std::string> kJavaScriptReflectiveAttributes = {
    "constructor", "prototype", "__proto__", "__defineGetter__", "__defineSetter__",
    "__lookupGetter__", "__lookupSetter__", "caller", "callee", "mainModule",
    "binding", "dlopen"};

// Dunders that ordinary Python classes define and use.
const std::set<std::string> kPythonSafeDunders = {
    "__init__", "__name__", "__main__", "__len__", "__str__", "__repr__", "__int__",
    "__float__", "__bool__", "__eq__", "__ne__", "__lt__", "__le__", "__gt__", "__ge__",
    "__hash__", "__iter__", "__next__", "__add__", "__sub__", "__mul__", "__truediv__",
    "__floordiv__", "__mod__", "__pow__", "__neg__", "__abs__", "__contains__",
    "__getitem__", "__setitem__", "__delitem__", "__call__", "__enter__", "__exit__",
    "__slots__", "__doc__", "__post_init__", "__radd__", "__rmul__", "__format__"};

const std::set<std::string> kPythonReflectiveBuiltins = {
    "globals", "locals", "vars", "getattr", "setattr", "delattr", "hasattr", "dir",
    "eval", "exec", "compile", "__import__", "breakpoint", "memoryview", "help"};

const std::set<std::string> kJavaScriptGlobals = {
    "globalThis", "global", "process", "Reflect", "Proxy", "eval", "Function",
    "Deno", "Bun"};

const std::set<std::string> kJavaScriptReflectCalls = {
    "get", "set", "apply", "construct", "getPrototypeOf", "setPrototypeOf",
    "defineProperty", "getOwnPropertyDescriptor", "ownKeys"};

const std::set<std::string> kJavaScriptObjectReflection = {
    "getPrototypeOf", "setPrototypeOf", "defineProperty", "getOwnPropertyDescriptor",
    "getOwnPropertyDescriptors", "getOwnPropertyNames", "__defineGetter__"};

bool IsPunct(const Token& token, std::string_view text) {
    return token.kind == TokenKind::kPunct && token.text == text;
}

bool IsDunder(const std::string& name) {
    return name.size() > 4 && name.rfind("__", 0) == 0 && name.compare(name.size() - 2, 2, "__") == 0;
}

class StructureWalker {
public:
    explicit StructureWalker(const SourceUnit& unit) : unit_(unit), tokens_(unit.tokens) {}

    std::vector<Violation> Run() {
        for (std::size_t i = 0; i < tokens_.size(); ++i) {
            switch (unit_.language) {
                case sandbox::Language::kPython:
                    VisitPython(i);
                    break;
                case sandbox::Language::kJavaScript:
                    VisitJavaScript(i);
                    break;
                case sandbox::Language::kShell:
                    VisitShell(i);
                    break;
            }
        }
        return std::move(violations_);
    }

private:
    void Report(ViolationKind kind, const std::string& pattern, const Token& token) {
        violations_.push_back(MakeViolation(
            Layer::kStructure, kind, pattern, unit_.text, token.offset, token.length));
    }

    // Folds `'a' + 'b' + ...` starting at `index`; `end` is left on the first unused token.
    std::optional<std::string> FoldConstantString(std::size_t index, std::size_t& end) const {
        std::string folded;
        bool expect_operand = true;
        bool any = false;
        while (index < tokens_.size()) {
            const auto& token = tokens_[index];
            if (expect_operand && token.kind == TokenKind::kString && !token.interpolated) {
                folded += token.text;
                any = true;
                expect_operand = false;
                ++index;
                continue;
            }
            if (expect_operand && IsPunct(token, "(")) {
                ++index;
                continue;
            }
            if (!expect_operand && IsPunct(token, ")") && index + 1 < tokens_.size() &&
                IsPunct(tokens_[index + 1], "+")) {
                ++index;
                continue;
            }
            if (!expect_operand && IsPunct(token, "+")) {
                expect_operand = true;
                ++index;
                continue;
            }
            // Adjacent literals concatenate in Python.
            if (!expect_operand && token.kind == TokenKind::kString && !token.interpolated &&
                unit_.language == sandbox::Language::kPython) {
                folded += token.text;
                ++index;
                continue;
            }
            break;
        }
        end = index;
        if (!any || expect_operand) {
            return std::nullopt;
        }
        return folded;
    }

    bool IsReflectiveName(const std::string& name) const {
        if (unit_.language == sandbox::Language::kPython) {
            return kPythonReflectiveAttributes.count(name) > 0 ||
                   (IsDunder(name) && kPythonSafeDunders.count(name) == 0);
        }
        return kJavaScriptReflectiveAttributes.count(name) > 0 || kJavaScriptGlobals.count(name) > 0;
    }

    void CheckAttributeAfterDot(std::size_t i) {
        if (!IsPunct(tokens_[i], ".") || i + 1 >= tokens_.size()) {
            return;
        }
        const auto& name = tokens_[i + 1];
        if (name.kind != TokenKind::kIdentifier) {
            return;
        }
        const auto& attributes = unit_.language == sandbox::Language::kPython
                                     ? kPythonReflectiveAttributes
                                     : kJavaScriptReflectiveAttributes;
        if (attributes.count(name.text) > 0 ||
            (unit_.language == sandbox::Language::kPython && IsDunder(name.text) &&
             kPythonSafeDunders.count(name.text) == 0)) {
            Report(ViolationKind::kReflectiveAttribute, "." + name.text, name);
        }
    }

    void CheckSubscript(std::size_t i) {
        if (!IsPunct(tokens_[i], "[") || i == 0) {
            return;
        }
        const auto& previous = tokens_[i - 1];
        const bool indexes_value = previous.kind == TokenKind::kIdentifier || previous.kind == TokenKind::kString ||
                                   IsPunct(previous, ")") || IsPunct(previous, "]");
        if (!indexes_value) {
            return;
        }
        std::size_t end = i + 1;
        const auto key = FoldConstantString(i + 1, end);
        if (!key || end >= tokens_.size() || !IsPunct(tokens_[end], "]")) {
            return;
        }
        if (IsReflectiveName(*key)) {
            Report(ViolationKind::kComputedAttribute, "[" + *key + "]", tokens_[i]);
        }
    }

    // getattr(obj, '__cl' + 'ass__') / Reflect.get(obj, 'constructor')
    void CheckAccessorArgument(std::size_t call_paren, const Token& callee) {
        int depth = 0;
        for (std::size_t j = call_paren; j < tokens_.size(); ++j) {
            const auto& token = tokens_[j];
            if (IsPunct(token, "(") || IsPunct(token, "[") || IsPunct(token, "{")) {
                ++depth;
            } else if (IsPunct(token, ")") || IsPunct(token, "]") || IsPunct(token, "}")) {
                if (--depth == 0) {
                    return;
                }
            } else if (depth == 1 && IsPunct(token, ",")) {
                std::size_t end = j + 1;
                const auto key = FoldConstantString(j + 1, end);
                if (key && IsReflectiveName(*key)) {
                    Report(ViolationKind::kComputedAttribute, callee.text + "(..., " + *key + ")", callee);
                }
                return;
            }
        }
    }

    void VisitPython(std::size_t i) {
        const auto& token = tokens_[i];
        CheckAttributeAfterDot(i);
        CheckSubscript(i);
        if (token.kind != TokenKind::kIdentifier) {
            return;
        }
        const bool after_dot = i > 0 && IsPunct(tokens_[i - 1], ".");
        const bool is_call = i + 1 < tokens_.size() && IsPunct(tokens_[i + 1], "(");
        if (!after_dot && is_call && kPythonReflectiveBuiltins.count(token.text) > 0) {
            Report(ViolationKind::kReflectiveBuiltin, token.text + "()", token);
            if (token.text == "getattr" || token.text == "setattr" || token.text == "delattr" ||
                token.text == "hasattr") {
                CheckAccessorArgument(i + 1, token);
            }
            return;
        }
        if (!after_dot && IsDunder(token.text) && kPythonSafeDunders.count(token.text) == 0) {
            Report(ViolationKind::kInterpreterInternal, token.text, token);
        }
        if (!after_dot && token.text == "global" && i + 1 < tokens_.size() &&
            tokens_[i + 1].kind == TokenKind::kIdentifier && tokens_[i + 1].line == token.line) {
            Report(ViolationKind::kRuntimeGlobals, "global statement", token);
        }
    }

    void VisitJavaScript(std::size_t i) {
        const auto& token = tokens_[i];
        CheckAttributeAfterDot(i);
        CheckSubscript(i);
        if (token.kind != TokenKind::kIdentifier) {
            return;
        }
        const bool after_dot = i > 0 && IsPunct(tokens_[i - 1], ".");
        if (after_dot) {
            return;
        }
        const bool member_call = i + 3 < tokens_.size() && IsPunct(tokens_[i + 1], ".") &&
                                 tokens_[i + 2].kind == TokenKind::kIdentifier && IsPunct(tokens_[i + 3], "(");
        if (token.text == "Reflect" && member_call && kJavaScriptReflectCalls.count(tokens_[i + 2].text) > 0) {
            Report(ViolationKind::kReflectiveBuiltin, "Reflect." + tokens_[i + 2].text, token);
            CheckAccessorArgument(i + 3, tokens_[i + 2]);
            return;
        }
        if (token.text == "Object" && member_call && kJavaScriptObjectReflection.count(tokens_[i + 2].text) > 0) {
            Report(ViolationKind::kReflectiveBuiltin, "Object." + tokens_[i + 2].text, token);
            return;
        }
        if (kJavaScriptGlobals.count(token.text) > 0 || token.text == "__proto__") {
            Report(ViolationKind::kInterpreterInternal, token.text, token);
        }
    }

    void VisitShell(std::size_t i) {
        if (i + 2 < tokens_.size() && IsPunct(tokens_[i], "$") && IsPunct(tokens_[i + 1], "{") &&
            IsPunct(tokens_[i + 2], "!")) {
            Report(ViolationKind::kIndirectExpansion, "${!name}", tokens_[i]);
        }
        const auto& token = tokens_[i];
        if (token.kind == TokenKind::kIdentifier && (token.text == "declare" || token.text == "typeset") &&
            i + 2 < tokens_.size() && IsPunct(tokens_[i + 1], "-") &&
            tokens_[i + 2].kind == TokenKind::kIdentifier && tokens_[i + 2].text.find('n') != std::string::npos) {
            Report(ViolationKind::kIndirectExpansion, "declare -n", token);
        }
    }

    const SourceUnit& unit_;
    const std::vector<Token>& tokens_;
    std::vector<Violation> violations_;
};

}  // namespace

std::vector<Violation> CheckStructure(const SourceUnit& unit) {
    return StructureWalker(unit).Run();
}

}  // namespace sandbar::validator
