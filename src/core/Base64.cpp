#include "signage/core/Base64.hpp"

#include <array>

namespace signage::core {
namespace {

constexpr char ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::uint8_t INVALID = 0xFF;

constexpr std::array<std::uint8_t, 256> makeReverseTable() {
    std::array<std::uint8_t, 256> table{};
    for (auto& entry : table) {
        entry = INVALID;
    }
    for (std::uint8_t i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(ALPHABET[i])] = i;
    }
    return table;
}

constexpr auto REVERSE = makeReverseTable();

} // namespace

std::string base64Encode(const std::uint8_t* data, std::size_t size) {
    std::string out;
    out.reserve(((size + 2) / 3) * 4);

    std::size_t i = 0;
    for (; i + 3 <= size; i += 3) {
        const std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16)
                                   | (static_cast<std::uint32_t>(data[i + 1]) << 8)
                                   |  static_cast<std::uint32_t>(data[i + 2]);
        out.push_back(ALPHABET[(triple >> 18) & 0x3F]);
        out.push_back(ALPHABET[(triple >> 12) & 0x3F]);
        out.push_back(ALPHABET[(triple >> 6) & 0x3F]);
        out.push_back(ALPHABET[triple & 0x3F]);
    }

    const std::size_t remaining = size - i;
    if (remaining == 1) {
        const std::uint32_t triple = static_cast<std::uint32_t>(data[i]) << 16;
        out.push_back(ALPHABET[(triple >> 18) & 0x3F]);
        out.push_back(ALPHABET[(triple >> 12) & 0x3F]);
        out.append("==");
    } else if (remaining == 2) {
        const std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16)
                                   | (static_cast<std::uint32_t>(data[i + 1]) << 8);
        out.push_back(ALPHABET[(triple >> 18) & 0x3F]);
        out.push_back(ALPHABET[(triple >> 12) & 0x3F]);
        out.push_back(ALPHABET[(triple >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

expected<std::vector<std::uint8_t>> base64Decode(std::string_view text) {
    std::vector<std::uint8_t> out;
    out.reserve((text.size() / 4) * 3);

    std::uint32_t accumulator = 0;
    int symbols = 0;
    int padding = 0;

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0) {
            // Data after padding.
            return unexpected(make_error_code(RelayErrc::invalid_base64));
        }
        const std::uint8_t value = REVERSE[static_cast<unsigned char>(c)];
        if (value == INVALID) {
            return unexpected(make_error_code(RelayErrc::invalid_base64));
        }
        accumulator = (accumulator << 6) | value;
        if (++symbols == 4) {
            out.push_back(static_cast<std::uint8_t>((accumulator >> 16) & 0xFF));
            out.push_back(static_cast<std::uint8_t>((accumulator >> 8) & 0xFF));
            out.push_back(static_cast<std::uint8_t>(accumulator & 0xFF));
            accumulator = 0;
            symbols = 0;
        }
    }

    if (padding > 2) {
        return unexpected(make_error_code(RelayErrc::invalid_base64));
    }

    switch (symbols) {
        case 0:
            if (padding != 0) {
                return unexpected(make_error_code(RelayErrc::invalid_base64));
            }
            break;
        case 1:
            return unexpected(make_error_code(RelayErrc::invalid_base64));
        case 2:
            if (padding == 1) {
                return unexpected(make_error_code(RelayErrc::invalid_base64));
            }
            out.push_back(static_cast<std::uint8_t>((accumulator >> 4) & 0xFF));
            break;
        case 3:
            if (padding == 2) {
                return unexpected(make_error_code(RelayErrc::invalid_base64));
            }
            out.push_back(static_cast<std::uint8_t>((accumulator >> 10) & 0xFF));
            out.push_back(static_cast<std::uint8_t>((accumulator >> 2) & 0xFF));
            break;
        default:
            break;
    }
    return out;
}

} // namespace signage::core
