#pragma once

#include "signage/core/Expected.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace signage::relay {

namespace defaults {

inline constexpr const char* WEB_ENDPOINT_KIND = "web";
inline constexpr const char* PIXOO_ENDPOINT_KIND = "pixoo64";
inline constexpr unsigned MAX_RECONNECT_ATTEMPTS = 10;
inline constexpr const char* CONFIG_DIR_NAME = ".signage";
inline constexpr const char* CONFIG_FILE_NAME = "config.json";
inline constexpr const char* CONFIG_PIXOO_KEY = "pixooIp";

} // namespace defaults

enum class SinkMode {
    Pixoo,      // push to a Pixoo at --pixoo or the saved address
    Scan,       // discover a Pixoo on the local /24, save it, then push to it
    Emulator    // render frames in this terminal
};

/// Runtime configuration of the relay executable.
struct RelayConfig {
    std::string relayUrl;
    SinkMode sink = SinkMode::Pixoo;
    std::optional<std::string> pixooAddress;
    std::optional<std::string> terminalId;
    std::string endpointKind;       // empty until parseArguments() picks one for the sink
    unsigned maxAttempts = defaults::MAX_RECONNECT_ATTEMPTS;
    bool jitter = true;
    bool verbose = false;
    bool showHelp = false;
};

/**
 * @brief Parse the command line (argv[0] is skipped).
 *
 * Returns a human-readable message on error. `--help` succeeds with
 * showHelp set and skips the remaining checks.
 */
expected<RelayConfig, std::string> parseArguments(int argc, const char* const* argv);

std::string usage(std::string_view program);

/// `$HOME/.signage/config.json`, or a path relative to the working directory without HOME.
std::string defaultConfigPath();

/**
 * @brief Saved Pixoo address from the JSON config file.
 *
 * A missing, unreadable or malformed file, or one without a string
 * `pixooIp`, yields nullopt.
 */
std::optional<std::string> loadSavedPixooAddress(const std::string& path);

/// Store `pixooIp`, keeping any other keys already in the file.
expected<void> savePixooAddress(const std::string& path, const std::string& address);

} // namespace signage::relay
