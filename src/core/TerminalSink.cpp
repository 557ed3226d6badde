#include "signage/core/TerminalSink.hpp"

#include <ostream>

namespace signage::core {
namespace {

constexpr const char* UPPER_HALF_BLOCK = "\xE2\x96\x80";
constexpr const char* RESET = "\x1b[0m";

void appendColour(std::string& out, const char* layer, const Rgb& c) {
    out += "\x1b[";
    out += layer;
    out += ";2;";
    out += std::to_string(c.r);
    out += ';';
    out += std::to_string(c.g);
    out += ';';
    out += std::to_string(c.b);
    out += 'm';
}

} // namespace

std::string renderAnsi(const Frame& frame, bool home) {
    std::string out;
    out.reserve(frame.pixelCount() * 24);
    if (home) {
        out += "\x1b[H";
    }

    for (std::uint32_t y = 0; y < frame.height; y += 2) {
        for (std::uint32_t x = 0; x < frame.width; ++x) {
            const auto upper = getPixel(frame, x, y).value_or(Rgb{});
            appendColour(out, "38", upper);
            if (const auto lower = getPixel(frame, x, y + 1)) {
                appendColour(out, "48", *lower);
            } else {
                out += "\x1b[49m";
            }
            out += UPPER_HALF_BLOCK;
        }
        out += RESET;
        out += '\n';
    }
    return out;
}

TerminalSink::TerminalSink(std::ostream& stream)
: out(stream)
{
    setPushAttempts(1);
}

TerminalSink::~TerminalSink() {
    stop();
}

expected<void> TerminalSink::pushFrame(const Frame& frame) {
    if (!cleared) {
        out << "\x1b[2J";
        cleared = true;
    }
    out << renderAnsi(frame);
    out.flush();
    if (!out) {
        out.clear();
        return unexpected(std::make_error_code(std::errc::io_error));
    }
    return {};
}

} // namespace signage::core
