#pragma once

#include "signage/core/Frame.hpp"

namespace signage::core {

/**
 * @brief Accepts decoded frames for display.
 *
 * publish() is called from the relay's strand and must return quickly;
 * implementations that do I/O hand the frame to their own worker.
 */
class FrameSink {
public:
    virtual ~FrameSink() = default;
    virtual void publish(Frame frame) = 0;
};

} // namespace signage::core
