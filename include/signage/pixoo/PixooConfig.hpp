#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace signage::pixoo::config {

/**
 * @brief Constants that define the Pixoo64 local HTTP protocol and push behaviour.
 */

// Device ----------------------------------------------------------------------
constexpr std::uint32_t PIXOO64_SIZE = 64;
constexpr unsigned short PIXOO_HTTP_PORT = 80;
constexpr const char* PIXOO_POST_PATH = "/post";
constexpr int PIXOO_CUSTOM_CHANNEL = 3;       // API-driven display mode

// Draw/SendHttpGif defaults ----------------------------------------------------
constexpr int PIXOO_DEFAULT_PIC_ID = 1;
constexpr int PIXOO_DEFAULT_SPEED_MS = 1000;
constexpr long long PIXOO_PIC_ID_MODULUS = 100000;

// Push behaviour ----------------------------------------------------------------
constexpr std::chrono::milliseconds PIXOO_PUSH_TIMEOUT{3000};
constexpr std::chrono::milliseconds PIXOO_PROBE_TIMEOUT{500};
constexpr int PIXOO_PUSH_ATTEMPTS = 2;        // first try + one retry
constexpr std::chrono::milliseconds PIXOO_RETRY_DELAY{200};

// Discovery ---------------------------------------------------------------------
constexpr int DISCOVERY_FIRST_HOST = 1;
constexpr int DISCOVERY_LAST_HOST = 254;
constexpr int DISCOVERY_BATCH_SIZE = 50;

} // namespace signage::pixoo::config
