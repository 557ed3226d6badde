#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace signage::core {

/// Bytes per pixel in every frame buffer (R, G, B; no alpha).
constexpr std::size_t BYTES_PER_PIXEL = 3;

struct Rgb {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;

    bool operator==(const Rgb& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const Rgb& other) const { return !(*this == other); }
};

// A single frame of pixel data.
// - pixels : flat row-major RGB, width * height * 3 bytes, no row padding.
// Once published to a sink or a transport a frame is treated as immutable.

struct Frame {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::vector<std::uint8_t> pixels;

    std::size_t pixelCount() const {
        return static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
    }
    std::size_t expectedByteCount() const { return pixelCount() * BYTES_PER_PIXEL; }
    bool isConsistent() const { return pixels.size() == expectedByteCount(); }
};

/**
 * @brief Create a frame of the given size filled with one colour (black by default).
 */
Frame createSolidFrame(std::uint32_t width, std::uint32_t height, Rgb fill = {});

/**
 * @brief Write one pixel. Coordinates outside the frame are ignored.
 *
 * Never throws; a bad coordinate on a hot rendering path must not take the
 * pipeline down.
 */
void setPixel(Frame& frame, long long x, long long y, Rgb color) noexcept;

/**
 * @brief Read one pixel, or std::nullopt when the coordinate is out of range.
 */
std::optional<Rgb> getPixel(const Frame& frame, long long x, long long y) noexcept;

} // namespace signage::core
