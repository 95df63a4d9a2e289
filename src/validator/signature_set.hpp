#pragma once

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace sandbar::validator {

std::string Sha256Hex(std::string_view data);

// Lower-cased with all whitespace and trailing semicolons removed, so that
// reformatted copies of a payload hash the same.
std::string CompactForm(std::string_view source);

class SignatureSet {
public:
    SignatureSet();
    explicit SignatureSet(const std::vector<std::string>& extra_digests);

    static const std::vector<std::string>& BuiltInPayloads();

    void AddPayload(std::string_view payload);
    void AddDigest(std::string digest);

    bool Contains(const std::string& digest) const { return digests_.count(digest) > 0; }
    std::size_t Size() const { return digests_.size(); }

private:
    std::unordered_set<std::string> digests_;
};

}  // namespace sandbar::validator
