#pragma once

#include "signage/core/FrameDeviceBase.hpp"

#include <iosfwd>
#include <string>

namespace signage::core {

/**
 * @brief Render a frame as 24-bit ANSI colour using upper half blocks.
 *
 * Each text row shows two pixel rows (foreground = upper, background =
 * lower); an odd final row is drawn against the terminal's default
 * background. When `home` is set the cursor is moved to the top-left first
 * so successive frames overwrite each other.
 */
std::string renderAnsi(const Frame& frame, bool home = true);

/**
 * @brief Local emulator: draws every published frame in the terminal.
 *
 * Rendering runs on the FrameDeviceBase worker so publish() stays cheap,
 * and a slow terminal simply skips stale frames.
 */
class TerminalSink : public FrameDeviceBase {
public:
    explicit TerminalSink(std::ostream& out);
    ~TerminalSink() override;

protected:
    expected<void> pushFrame(const Frame& frame) override;
    const char* deviceName() const override { return "TerminalSink"; }

private:
    std::ostream& out;
    bool cleared = false;
};

} // namespace signage::core
