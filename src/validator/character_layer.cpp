#include "validator/validation_layers.hpp"

#include <cstdint>

namespace sandbar::validator {
namespace {

constexpr std::size_t kMaxBlankLines = 64;

bool IsInvisible(std::uint32_t cp) {
    return (cp >= 0x200B && cp <= 0x200F) || cp == 0x2060 || cp == 0xFEFF ||
           (cp >= 0x202A && cp <= 0x202E) || (cp >= 0x2066 && cp <= 0x2069) || cp == 0x00AD;
}

// Decodes one UTF-8 sequence at `pos`; returns its length, or 0 when malformed.
std::size_t DecodeUtf8(std::string_view text, std::size_t pos, std::uint32_t& cp) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    std::size_t length = 0;
    if (lead < 0x80) {
        cp = lead;
        return 1;
    }
    if ((lead & 0xE0) == 0xC0) {
        length = 2;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        cp = lead & 0x07;
    } else {
        return 0;
    }
    if (pos + length > text.size()) {
        return 0;
    }
    for (std::size_t i = 1; i < length; ++i) {
        const auto next = static_cast<unsigned char>(text[pos + i]);
        if ((next & 0xC0) != 0x80) {
            return 0;
        }
        cp = (cp << 6) | (next & 0x3F);
    }
    const bool overlong = (length == 2 && cp < 0x80) || (length == 3 && cp < 0x800) ||
                          (length == 4 && cp < 0x10000);
    if (overlong || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return 0;
    }
    return length;
}

}  // namespace

std::vector<Violation> CheckCharacters(const SourceUnit& unit, const config::ValidatorConfig& config) {
    std::vector<Violation> violations;
    const auto text = unit.text;

    bool blank = true;
    for (const char c : text) {
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
            blank = false;
            break;
        }
    }
    if (blank) {
        violations.push_back(MakeViolation(
            Layer::kCharacter, ViolationKind::kEmptySource, "empty source", text, 0, 0));
        return violations;
    }
    if (text.size() > config.max_source_bytes) {
        auto violation = MakeViolation(
            Layer::kCharacter, ViolationKind::kSourceTooLarge, "source too large", text, 0, 0);
        violation.excerpt = std::to_string(text.size()) + " > " + std::to_string(config.max_source_bytes) + " bytes";
        violations.push_back(std::move(violation));
        return violations;
    }

    std::size_t whitespace_run = 0;
    std::size_t run_start = 0;
    std::size_t blank_lines = 0;
    bool line_has_content = false;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto c = static_cast<unsigned char>(text[pos]);
        if (c == '\n') {
            blank_lines = line_has_content ? 0 : blank_lines + 1;
            if (blank_lines == kMaxBlankLines + 1) {
                violations.push_back(MakeViolation(
                    Layer::kCharacter, ViolationKind::kWhitespacePadding, "blank line padding", text, pos, 1));
            }
            line_has_content = false;
            whitespace_run = 0;
            ++pos;
            continue;
        }
        if (c == ' ' || c == '\t') {
            if (whitespace_run == 0) {
                run_start = pos;
            }
            ++whitespace_run;
            ++pos;
            continue;
        }
        if (c != '\r') {
            if (whitespace_run > config.max_whitespace_run) {
                violations.push_back(MakeViolation(
                    Layer::kCharacter, ViolationKind::kWhitespacePadding, "whitespace padding",
                    text, run_start, whitespace_run + 8));
            }
            whitespace_run = 0;
            line_has_content = true;
        }
        if (c == 0) {
            violations.push_back(MakeViolation(
                Layer::kCharacter, ViolationKind::kNullByte, "\\x00", text, pos, 1));
            ++pos;
            continue;
        }
        if ((c < 0x20 && c != '\t' && c != '\r') || c == 0x7F) {
            violations.push_back(MakeViolation(
                Layer::kCharacter, ViolationKind::kControlCharacter, "control character", text, pos, 1));
            ++pos;
            continue;
        }
        if (c < 0x80) {
            ++pos;
            continue;
        }
        std::uint32_t cp = 0;
        const auto length = DecodeUtf8(text, pos, cp);
        if (length == 0) {
            violations.push_back(MakeViolation(
                Layer::kCharacter, ViolationKind::kInvalidEncoding, "invalid utf-8", text, pos, 1));
            ++pos;
            continue;
        }
        if (cp >= 0x80 && cp < 0xA0) {
            violations.push_back(MakeViolation(
                Layer::kCharacter, ViolationKind::kControlCharacter, "c1 control", text, pos, length));
        } else if (IsInvisible(cp)) {
            violations.push_back(MakeViolation(
                Layer::kCharacter, ViolationKind::kInvisibleCharacter, "invisible code point", text, pos, length));
        } else if (cp > 0x1000) {
            violations.push_back(MakeViolation(
                Layer::kCharacter, ViolationKind::kUnusualCodePoint, "code point above U+1000", text, pos, length));
        }
        pos += length;
    }
    return violations;
}

}  // namespace sandbar::validator
