/// @file uuid.cpp
/// @brief Uuid parsing and formatting

#include <plughost/core/uuid.hpp>

namespace plughost_core {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

/// Value of a hex digit, or -1
int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool is_dash_position(std::size_t i) noexcept {
    return i == 8 || i == 13 || i == 18 || i == 23;
}

} // anonymous namespace

Result<Uuid> Uuid::parse(std::string_view text) {
    std::string_view body = text;
    if (body.size() == 38 && body.front() == '{' && body.back() == '}') {
        body = body.substr(1, 36);
    }

    if (body.size() != 36) {
        return Err<Uuid>(Error(ErrorCode::ParseError,
            "Invalid uuid length: '" + std::string(text) + "'"));
    }

    Uuid result;
    std::size_t byte_index = 0;

    for (std::size_t i = 0; i < body.size();) {
        if (is_dash_position(i)) {
            if (body[i] != '-') {
                return Err<Uuid>(Error(ErrorCode::ParseError,
                    "Expected '-' at offset " + std::to_string(i) + " in uuid '" + std::string(text) + "'"));
            }
            ++i;
            continue;
        }

        int hi = hex_value(body[i]);
        int lo = hex_value(body[i + 1]);
        if (hi < 0 || lo < 0 || is_dash_position(i + 1)) {
            return Err<Uuid>(Error(ErrorCode::ParseError,
                "Invalid hex digit in uuid '" + std::string(text) + "'"));
        }

        result.bytes[byte_index++] = static_cast<std::uint8_t>((hi << 4) | lo);
        i += 2;
    }

    return Ok(result);
}

Uuid Uuid::from_name(std::string_view name) noexcept {
    std::uint64_t high = detail::fnv1a_hash(name.data(), name.size());
    std::uint64_t low = detail::fnv1a_hash(name.data(), name.size(), high ^ 0x9e3779b97f4a7c15ULL);

    Uuid result;
    for (std::size_t i = 0; i < 8; ++i) {
        result.bytes[i] = static_cast<std::uint8_t>(high >> (56 - 8 * i));
        result.bytes[8 + i] = static_cast<std::uint8_t>(low >> (56 - 8 * i));
    }

    // Version 8, RFC 4122 variant
    result.bytes[6] = static_cast<std::uint8_t>((result.bytes[6] & 0x0F) | 0x80);
    result.bytes[8] = static_cast<std::uint8_t>((result.bytes[8] & 0x3F) | 0x80);

    return result;
}

std::string Uuid::to_string() const {
    std::string out;
    out.reserve(36);

    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(HEX_DIGITS[bytes[i] >> 4]);
        out.push_back(HEX_DIGITS[bytes[i] & 0x0F]);
    }

    return out;
}

} // namespace plughost_core
