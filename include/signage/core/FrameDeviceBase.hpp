#pragma once

#include "signage/core/Expected.hpp"
#include "signage/core/FrameSink.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>

namespace signage::core {

/**
 * @brief Counters describing what a device worker did with published frames.
 */
struct DeviceStats {
    std::uint64_t published = 0;   // frames handed to publish()
    std::uint64_t superseded = 0;  // replaced by a newer frame before being pushed
    std::uint64_t pushed = 0;      // delivered successfully
    std::uint64_t failed = 0;      // dropped after exhausting retries
};

/**
 * @brief Base class for sinks that push frames to a device over slow I/O.
 *
 * Threading model:
 * - publish() stores the frame in a single "latest" slot and wakes the worker;
 *   it never blocks on device I/O.
 * - A worker thread takes the latest frame and calls the virtual pushFrame().
 *   A frame that arrives while a push is in flight replaces any waiting frame,
 *   so the device only ever receives the newest picture and writes never
 *   overlap.
 * - A failed push is retried up to `setPushAttempts()` times in total, unless
 *   a newer frame arrives first. Failures never propagate to the publisher.
 *
 * Derived classes must call stop() in their destructor so the worker cannot
 * call into a partially destroyed object.
 */
class FrameDeviceBase : public FrameSink {
public:
    FrameDeviceBase();
    ~FrameDeviceBase() override;

    FrameDeviceBase(const FrameDeviceBase&) = delete;
    FrameDeviceBase& operator=(const FrameDeviceBase&) = delete;

    void publish(Frame frame) override;

    /// Start the worker thread.
    void start();

    /// Ask the worker to finish its current push and wait for it.
    void stop();

    bool isRunning() const { return running.load(); }

    void setPushAttempts(int attempts);
    void setRetryDelay(std::chrono::milliseconds delay);

    DeviceStats stats() const;

    /// Block until the worker has nothing pending or the timeout elapses.
    bool waitUntilIdle(std::chrono::milliseconds timeout);

protected:
    /// Deliver one frame to the device. Runs on the worker thread.
    virtual expected<void> pushFrame(const Frame& frame) = 0;

    /// Short name used in log lines.
    virtual const char* deviceName() const = 0;

private:
    void run();
    bool waitBeforeRetry();

    std::thread worker;
    std::atomic<bool> running{false};

    mutable std::mutex mutex;
    std::condition_variable wake;
    std::condition_variable idle;
    std::optional<Frame> latest;
    bool busy = false;
    DeviceStats counters{};

    std::atomic<int> pushAttempts{2};
    std::atomic<long long> retryDelayMillis{200};
};

} // namespace signage::core
