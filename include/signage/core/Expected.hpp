// Expected.hpp
// -----------------------------------------------------------------------------
// Central aliases for tl::expected / tl::unexpected so the rest of the codebase
// names the success/error pair consistently. The default error type is
// std::error_code; relay-specific failures use the RelayErrc category below.

#pragma once

#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

#include <tl/expected.hpp>

namespace signage {

template <typename T, typename E = std::error_code>
using expected = tl::expected<T, E>;

template <typename E>
using unexpected_t = tl::unexpected<E>;

template <typename E>
[[nodiscard]] constexpr unexpected_t<std::decay_t<E>> unexpected(E&& error) {
    return unexpected_t<std::decay_t<E>>(std::forward<E>(error));
}

enum class RelayErrc {
    malformed_envelope = 1,
    malformed_payload,
    invalid_base64,
    frame_size_mismatch,
    invalid_url,
    handshake_failed,
    protocol_violation,
    message_too_large,
    http_status,
    malformed_response,
    device_error,
};

const std::error_category& relay_category() noexcept;

inline std::error_code make_error_code(RelayErrc e) noexcept {
    return {static_cast<int>(e), relay_category()};
}

} // namespace signage

namespace std {
template <>
struct is_error_code_enum<signage::RelayErrc> : true_type {};
} // namespace std
