#pragma once

/// @file uuid.hpp
/// @brief 128-bit identifiers for plugins and descriptors

#include "fwd.hpp"
#include "error.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <compare>
#include <ostream>
#include <functional>

namespace plughost_core {

// =============================================================================
// FNV-1a Hash (for name-derived ids)
// =============================================================================

namespace detail {

constexpr std::uint64_t FNV_OFFSET_BASIS = 0xcbf29ce484222325ULL;
constexpr std::uint64_t FNV_PRIME = 0x100000001b3ULL;

[[nodiscard]] constexpr std::uint64_t fnv1a_hash(
    const char* str, std::size_t len, std::uint64_t seed = FNV_OFFSET_BASIS) noexcept {
    std::uint64_t hash = seed;
    for (std::size_t i = 0; i < len; ++i) {
        hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(str[i]));
        hash *= FNV_PRIME;
    }
    return hash;
}

} // namespace detail

// =============================================================================
// Uuid
// =============================================================================

/// RFC 4122 style 128-bit identifier
///
/// Owner ids and descriptor ids are Uuids. Equality is bytewise; the total
/// order is lexicographic over the bytes and only exists so Uuids can key
/// ordered containers.
struct Uuid {
    std::array<std::uint8_t, 16> bytes{};

    /// Default constructor (nil uuid)
    constexpr Uuid() noexcept = default;

    /// Construct from raw bytes
    constexpr explicit Uuid(const std::array<std::uint8_t, 16>& raw) noexcept : bytes(raw) {}

    /// Nil uuid (all zero)
    [[nodiscard]] static constexpr Uuid nil() noexcept { return Uuid{}; }

    /// Parse canonical text ("xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx")
    ///
    /// Hex digits are case-insensitive and the text may be wrapped in braces.
    [[nodiscard]] static Result<Uuid> parse(std::string_view text);

    /// Deterministic id derived from a name
    ///
    /// Version nibble is 8 (vendor-specific) so these never collide with
    /// random (v4) ids produced elsewhere.
    [[nodiscard]] static Uuid from_name(std::string_view name) noexcept;

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes) {
            if (b != 0) return false;
        }
        return true;
    }

    /// Lower-case canonical form
    [[nodiscard]] std::string to_string() const;

    constexpr auto operator<=>(const Uuid&) const noexcept = default;
    constexpr bool operator==(const Uuid&) const noexcept = default;
};

inline std::ostream& operator<<(std::ostream& os, const Uuid& id) {
    return os << id.to_string();
}

} // namespace plughost_core

template<>
struct std::hash<plughost_core::Uuid> {
    std::size_t operator()(const plughost_core::Uuid& id) const noexcept {
        return static_cast<std::size_t>(plughost_core::detail::fnv1a_hash(
            reinterpret_cast<const char*>(id.bytes.data()), id.bytes.size()));
    }
};
