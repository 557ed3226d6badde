#pragma once

#include "signage/core/Expected.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace signage::core {

/**
 * @brief Standard base64 (RFC 4648 alphabet) with '=' padding and no line breaks.
 *
 * Output length is always 4 * ceil(size / 3).
 */
std::string base64Encode(const std::uint8_t* data, std::size_t size);

inline std::string base64Encode(const std::vector<std::uint8_t>& bytes) {
    return base64Encode(bytes.data(), bytes.size());
}

/**
 * @brief Decode standard base64.
 *
 * Accepts padded or unpadded input.
 * Fails with RelayErrc::invalid_base64 on any other character, misplaced
 * padding, or a dangling single symbol.
 */
expected<std::vector<std::uint8_t>> base64Decode(std::string_view text);

} // namespace signage::core
