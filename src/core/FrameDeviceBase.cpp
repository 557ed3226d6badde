#include "signage/core/FrameDeviceBase.hpp"
#include "signage/log/Log.hpp"

namespace signage::core {

FrameDeviceBase::FrameDeviceBase() = default;

FrameDeviceBase::~FrameDeviceBase() {
    stop();
}

void FrameDeviceBase::publish(Frame frame) {
    {
        std::lock_guard lock(mutex);
        ++counters.published;
        if (latest) {
            ++counters.superseded; // latest frame wins
        }
        latest = std::move(frame);
    }
    wake.notify_one();
}

void FrameDeviceBase::start() {
    if (running) return;
    running = true;
    worker = std::thread([this] { run(); });
}

void FrameDeviceBase::stop() {
    {
        std::lock_guard lock(mutex);
        running = false;
    }
    wake.notify_all();
    if (worker.joinable()) {
        worker.join();
    }
}

void FrameDeviceBase::setPushAttempts(int attempts) {
    pushAttempts.store(attempts < 1 ? 1 : attempts);
}

void FrameDeviceBase::setRetryDelay(std::chrono::milliseconds delay) {
    retryDelayMillis.store(delay.count() < 0 ? 0 : delay.count());
}

DeviceStats FrameDeviceBase::stats() const {
    std::lock_guard lock(mutex);
    return counters;
}

bool FrameDeviceBase::waitUntilIdle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex);
    return idle.wait_for(lock, timeout, [this] { return !latest && !busy; });
}

void FrameDeviceBase::run() {
    for (;;) {
        Frame frame;
        {
            std::unique_lock lock(mutex);
            wake.wait(lock, [this] { return !running || latest.has_value(); });
            if (!running) {
                break;
            }
            frame = std::move(*latest);
            latest.reset();
            busy = true;
        }

        bool delivered = false;
        const int attempts = pushAttempts.load();
        for (int attempt = 1; attempt <= attempts && running; ++attempt) {
            auto result = pushFrame(frame);
            if (result) {
                delivered = true;
                break;
            }
            logError("[", deviceName(), "] push failed (attempt ", attempt, "/", attempts, "): ",
                     result.error().message(), "\n");
            if (attempt < attempts && !waitBeforeRetry()) {
                break; // a newer frame arrived; retrying this one would be stale
            }
        }

        {
            std::lock_guard lock(mutex);
            busy = false;
            if (delivered) {
                ++counters.pushed;
            } else {
                ++counters.failed;
            }
        }
        idle.notify_all();
    }

    {
        std::lock_guard lock(mutex);
        busy = false;
    }
    idle.notify_all();
}

bool FrameDeviceBase::waitBeforeRetry() {
    // Sleep for the retry delay, but wake early on stop() or a newer frame.
    std::unique_lock lock(mutex);
    wake.wait_for(lock, std::chrono::milliseconds{retryDelayMillis.load()},
                  [this] { return !running || latest.has_value(); });
    return running && !latest.has_value();
}

} // namespace signage::core
