/// @file version.cpp
/// @brief Semantic versioning implementation

#include <plughost/plugin/version.hpp>
#include <sstream>
#include <charconv>
#include <algorithm>
#include <cctype>

namespace plughost_plugin {

namespace {

std::string_view trim(std::string_view str) {
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.front()))) {
        str.remove_prefix(1);
    }
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.back()))) {
        str.remove_suffix(1);
    }
    return str;
}

bool is_numeric(std::string_view id) {
    return !id.empty() && std::all_of(id.begin(), id.end(),
        [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

/// Dot-separated identifiers, each non-empty [0-9A-Za-z-]
///
/// Prerelease numeric identifiers must also have no leading zero and fit
/// in 64 bits.
bool valid_tag(std::string_view tag, bool prerelease) {
    if (tag.empty()) return false;

    std::size_t start = 0;
    while (true) {
        std::size_t end = tag.find('.', start);
        std::string_view id = tag.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);

        if (id.empty()) return false;
        bool charset_ok = std::all_of(id.begin(), id.end(), [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '-';
        });
        if (!charset_ok) return false;

        if (prerelease && is_numeric(id)) {
            if (id.size() > 1 && id.front() == '0') return false;
            std::uint64_t value = 0;
            auto [ptr, ec] = std::from_chars(id.data(), id.data() + id.size(), value);
            if (ec != std::errc{} || ptr != id.data() + id.size()) return false;
        }

        if (end == std::string_view::npos) break;
        start = end + 1;
    }
    return true;
}

/// Numeric identifiers by value, without converting
std::strong_ordering compare_numeric(std::string_view a, std::string_view b) noexcept {
    while (a.size() > 1 && a.front() == '0') a.remove_prefix(1);
    while (b.size() > 1 && b.front() == '0') b.remove_prefix(1);
    if (auto cmp = a.size() <=> b.size(); cmp != 0) return cmp;
    int cmp = a.compare(b);
    if (cmp < 0) return std::strong_ordering::less;
    if (cmp > 0) return std::strong_ordering::greater;
    return std::strong_ordering::equal;
}

plughost_core::Result<SemanticVersion> parse_error(const std::string& message) {
    return plughost_core::Err<SemanticVersion>(
        plughost_core::Error(plughost_core::ErrorCode::ParseError, message));
}

} // anonymous namespace

// =============================================================================
// SemanticVersion Implementation
// =============================================================================

plughost_core::Result<SemanticVersion> SemanticVersion::parse(std::string_view str) {
    str = trim(str);

    if (str.empty()) {
        return parse_error("Empty version string");
    }

    if (str.front() == 'v' || str.front() == 'V') {
        str.remove_prefix(1);
    }

    SemanticVersion result;

    // Build metadata starts at the first '+', prerelease at the first '-' before it
    auto plus_pos = str.find('+');
    auto dash_pos = str.substr(0, plus_pos).find('-');

    std::string_view core_str = str.substr(0, std::min(dash_pos, plus_pos));

    std::uint32_t parts[3] = {0, 0, 0};
    int part_index = 0;
    std::size_t start = 0;

    while (true) {
        std::size_t end = core_str.find('.', start);
        std::string_view num_str = core_str.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);

        if (num_str.empty()) {
            return parse_error("Empty version component in '" + std::string(str) + "'");
        }
        if (part_index == 3) {
            return parse_error("Too many version components in '" + std::string(str) + "'");
        }

        std::uint32_t value = 0;
        auto [ptr, ec] = std::from_chars(num_str.data(), num_str.data() + num_str.size(), value);
        if (ec != std::errc{} || ptr != num_str.data() + num_str.size()) {
            return parse_error("Invalid version number component: " + std::string(num_str));
        }
        parts[part_index++] = value;

        if (end == std::string_view::npos) {
            break;
        }
        start = end + 1;
    }

    result.major = parts[0];
    result.minor = parts[1];
    result.patch = parts[2];

    if (dash_pos != std::string_view::npos) {
        std::size_t prerelease_end = plus_pos != std::string_view::npos ? plus_pos : str.size();
        result.prerelease = std::string(str.substr(dash_pos + 1, prerelease_end - dash_pos - 1));

        if (!valid_tag(result.prerelease, true)) {
            return parse_error("Invalid prerelease: '" + result.prerelease + "'");
        }
    }

    if (plus_pos != std::string_view::npos) {
        result.build_metadata = std::string(str.substr(plus_pos + 1));

        if (!valid_tag(result.build_metadata, false)) {
            return parse_error("Invalid build metadata: '" + result.build_metadata + "'");
        }
    }

    return plughost_core::Ok(result);
}

std::strong_ordering SemanticVersion::operator<=>(const SemanticVersion& other) const noexcept {
    if (auto cmp = major <=> other.major; cmp != 0) return cmp;
    if (auto cmp = minor <=> other.minor; cmp != 0) return cmp;
    if (auto cmp = patch <=> other.patch; cmp != 0) return cmp;

    // A version with prerelease has LOWER precedence than one without
    if (prerelease.empty() && !other.prerelease.empty()) {
        return std::strong_ordering::greater;
    }
    if (!prerelease.empty() && other.prerelease.empty()) {
        return std::strong_ordering::less;
    }
    if (!prerelease.empty() && !other.prerelease.empty()) {
        return compare_prerelease(prerelease, other.prerelease);
    }

    return std::strong_ordering::equal;
}

bool SemanticVersion::operator==(const SemanticVersion& other) const noexcept {
    return major == other.major &&
           minor == other.minor &&
           patch == other.patch &&
           prerelease == other.prerelease;
}

std::string SemanticVersion::to_string() const {
    std::ostringstream oss;
    oss << major << '.' << minor << '.' << patch;
    if (!prerelease.empty()) {
        oss << '-' << prerelease;
    }
    if (!build_metadata.empty()) {
        oss << '+' << build_metadata;
    }
    return oss.str();
}

std::strong_ordering SemanticVersion::compare_prerelease(
    std::string_view a, std::string_view b) noexcept {

    std::size_t a_start = 0, b_start = 0;

    while (a_start < a.size() || b_start < b.size()) {
        std::size_t a_end = a.find('.', a_start);
        if (a_end == std::string_view::npos) a_end = a.size();
        std::size_t b_end = b.find('.', b_start);
        if (b_end == std::string_view::npos) b_end = b.size();

        std::string_view a_id = a_start < a.size() ? a.substr(a_start, a_end - a_start) : std::string_view{};
        std::string_view b_id = b_start < b.size() ? b.substr(b_start, b_end - b_start) : std::string_view{};

        // Fewer identifiers = lower precedence
        if (a_id.empty() && !b_id.empty()) {
            return std::strong_ordering::less;
        }
        if (!a_id.empty() && b_id.empty()) {
            return std::strong_ordering::greater;
        }
        if (a_id.empty() && b_id.empty()) {
            break;
        }

        bool a_numeric = is_numeric(a_id);
        bool b_numeric = is_numeric(b_id);

        if (a_numeric && b_numeric) {
            if (auto cmp = compare_numeric(a_id, b_id); cmp != 0) return cmp;
        } else if (a_numeric) {
            // Numeric has lower precedence than alphanumeric
            return std::strong_ordering::less;
        } else if (b_numeric) {
            return std::strong_ordering::greater;
        } else {
            if (auto cmp = a_id.compare(b_id); cmp != 0) {
                return cmp < 0 ? std::strong_ordering::less : std::strong_ordering::greater;
            }
        }

        a_start = a_end + 1;
        b_start = b_end + 1;
    }

    return std::strong_ordering::equal;
}

// =============================================================================
// Version Windows
// =============================================================================

WindowPosition locate_in_window(
    std::string_view version, std::string_view min, std::string_view max) {

    auto v = SemanticVersion::parse(version);
    auto lo = SemanticVersion::parse(min);
    auto hi = SemanticVersion::parse(max);

    if (!v || !lo || !hi) {
        return WindowPosition::Unparsable;
    }

    if (*v < *lo) {
        return WindowPosition::Below;
    }
    if (*v > *hi) {
        return WindowPosition::Above;
    }
    return WindowPosition::Inside;
}

} // namespace plughost_plugin
