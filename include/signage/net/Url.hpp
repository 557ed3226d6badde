#pragma once

#include "signage/core/Expected.hpp"

#include <string>
#include <string_view>

namespace signage::net {

struct Url {
    std::string scheme;   // lower-case: "ws", "wss", "http"
    std::string host;
    unsigned short port = 0;
    std::string target;   // path + query, never empty

    bool secure() const { return scheme == "wss" || scheme == "https"; }

    /// Host header value: port omitted when it is the scheme default.
    std::string hostHeader() const;
};

/**
 * @brief Parse `scheme://host[:port][/path][?query]`.
 *
 * Supports ws, wss, http and https, bracketed IPv6 hosts, and fills in the
 * scheme's default port. Fails with RelayErrc::invalid_url.
 */
expected<Url> parseUrl(std::string_view text);

} // namespace signage::net
