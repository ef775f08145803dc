/// @file reference.cpp
/// @brief Descriptor reference matching

#include <plughost/plugin/reference.hpp>

namespace plughost_plugin {

namespace {

/// Compare two version strings by precedence, falling back to text when unparsable
bool same_version(const std::string& a, const std::string& b) {
    auto va = SemanticVersion::parse(a);
    auto vb = SemanticVersion::parse(b);
    if (va && vb) {
        return *va == *vb;
    }
    return a == b;
}

} // anonymous namespace

const char* reference_match_name(ReferenceMatch match) noexcept {
    switch (match) {
        case ReferenceMatch::Matched: return "matched";
        case ReferenceMatch::IdentityMismatch: return "identity mismatch";
        case ReferenceMatch::BelowMinimum: return "too old";
        case ReferenceMatch::AboveMaximum: return "too new";
        case ReferenceMatch::Unparsable: return "unparsable version";
    }
    return "unknown";
}

ReferenceMatch DescriptorReference::check(
    const Uuid& owner, const Uuid& descriptor, std::string_view version) const {

    if (owner != owner_id || descriptor != descriptor_id) {
        return ReferenceMatch::IdentityMismatch;
    }

    switch (locate_in_window(version, min_version, max_version)) {
        case WindowPosition::Inside: return ReferenceMatch::Matched;
        case WindowPosition::Below: return ReferenceMatch::BelowMinimum;
        case WindowPosition::Above: return ReferenceMatch::AboveMaximum;
        case WindowPosition::Unparsable: return ReferenceMatch::Unparsable;
    }
    return ReferenceMatch::Unparsable;
}

std::string DescriptorReference::to_string() const {
    return owner_id.to_string() + "/" + descriptor_id.to_string() +
        " [" + min_version + ", " + max_version + "]";
}

bool DescriptorReference::operator==(const DescriptorReference& other) const {
    return owner_id == other.owner_id &&
           descriptor_id == other.descriptor_id &&
           same_version(min_version, other.min_version) &&
           same_version(max_version, other.max_version);
}

} // namespace plughost_plugin
