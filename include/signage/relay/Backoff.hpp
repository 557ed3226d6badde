#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <random>

namespace signage::relay {

struct BackoffOptions {
    std::chrono::milliseconds initialDelay{1000};
    std::chrono::milliseconds maxDelay{30000};
    double multiplier = 2.0;
    unsigned maxAttempts = 10;
    bool jitter = true;   // +/-25% to spread out reconnecting clients
};

struct BackoffState {
    unsigned attempt = 0;
    std::chrono::milliseconds nextDelay{0};   // 0 when exhausted
    bool exhausted = false;
};

/// Uniform sample in [0, 1). Injected so tests can seed or pin the jitter.
using UniformSource = std::function<double()>;

/// A UniformSource backed by a std::mt19937 with the given seed.
UniformSource makeSeededSource(std::uint32_t seed);

/// A UniformSource seeded from std::random_device.
UniformSource makeDefaultSource();

/**
 * @brief Reconnect delay for a given attempt number.
 *
 * delay = min(initialDelay * multiplier^attempt, maxDelay), optionally
 * perturbed by up to +/-25% and clamped back into [0, maxDelay], then rounded
 * to whole milliseconds. Attempts at or past maxAttempts are exhausted with a
 * zero delay.
 */
BackoffState calculateBackoff(unsigned attempt,
                              const BackoffOptions& options,
                              const UniformSource& random);

/// Overload that draws jitter from a process-wide default source.
BackoffState calculateBackoff(unsigned attempt, const BackoffOptions& options = {});

/**
 * @brief Stateful wrapper that tracks the attempt counter across reconnects.
 *
 * Call next() when a connection is lost and reset() exactly once when a
 * connection is fully established.
 */
class BackoffController {
public:
    explicit BackoffController(BackoffOptions options = {},
                               UniformSource random = makeDefaultSource());

    /// Compute the state for the current attempt, then advance the counter.
    BackoffState next();

    void reset() { attempt_ = 0; }

    bool isExhausted() const { return attempt_ >= options_.maxAttempts; }

    unsigned attempt() const { return attempt_; }

    const BackoffOptions& options() const { return options_; }

private:
    BackoffOptions options_;
    UniformSource random_;
    unsigned attempt_ = 0;
};

} // namespace signage::relay
