#include "signage/core/Frame.hpp"

namespace signage::core {
namespace {

std::optional<std::size_t> offsetOf(const Frame& frame, long long x, long long y) noexcept {
    if (x < 0 || y < 0 ||
        x >= static_cast<long long>(frame.width) ||
        y >= static_cast<long long>(frame.height)) {
        return std::nullopt;
    }
    const auto offset = (static_cast<std::size_t>(y) * frame.width + static_cast<std::size_t>(x))
                        * BYTES_PER_PIXEL;
    // A frame whose buffer is shorter than its header claims is treated as out of range.
    if (offset + BYTES_PER_PIXEL > frame.pixels.size()) {
        return std::nullopt;
    }
    return offset;
}

} // namespace

Frame createSolidFrame(std::uint32_t width, std::uint32_t height, Rgb fill) {
    Frame frame;
    frame.width = width;
    frame.height = height;
    frame.pixels.resize(frame.expectedByteCount());
    for (std::size_t i = 0; i < frame.pixels.size(); i += BYTES_PER_PIXEL) {
        frame.pixels[i] = fill.r;
        frame.pixels[i + 1] = fill.g;
        frame.pixels[i + 2] = fill.b;
    }
    return frame;
}

void setPixel(Frame& frame, long long x, long long y, Rgb color) noexcept {
    const auto offset = offsetOf(frame, x, y);
    if (!offset) {
        return;
    }
    frame.pixels[*offset] = color.r;
    frame.pixels[*offset + 1] = color.g;
    frame.pixels[*offset + 2] = color.b;
}

std::optional<Rgb> getPixel(const Frame& frame, long long x, long long y) noexcept {
    const auto offset = offsetOf(frame, x, y);
    if (!offset) {
        return std::nullopt;
    }
    return Rgb{frame.pixels[*offset], frame.pixels[*offset + 1], frame.pixels[*offset + 2]};
}

} // namespace signage::core
