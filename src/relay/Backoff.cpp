#include "signage/relay/Backoff.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <mutex>

namespace signage::relay {

namespace {
constexpr double JITTER_FRACTION = 0.25;
} // namespace

UniformSource makeSeededSource(std::uint32_t seed) {
    auto engine = std::make_shared<std::mt19937>(seed);
    return [engine]() {
        return std::uniform_real_distribution<double>(0.0, 1.0)(*engine);
    };
}

UniformSource makeDefaultSource() {
    std::random_device device;
    return makeSeededSource(device());
}

BackoffState calculateBackoff(unsigned attempt,
                              const BackoffOptions& options,
                              const UniformSource& random) {
    if (attempt >= options.maxAttempts) {
        return BackoffState{attempt, std::chrono::milliseconds{0}, true};
    }

    const double maxDelay = static_cast<double>(std::max<long long>(options.maxDelay.count(), 0));
    const double initialDelay = static_cast<double>(std::max<long long>(options.initialDelay.count(), 0));

    // pow() may overflow to infinity for large attempts; min() still lands on maxDelay.
    double delay = std::min(initialDelay * std::pow(options.multiplier, static_cast<double>(attempt)),
                            maxDelay);
    if (std::isnan(delay)) {
        delay = maxDelay;
    }

    if (options.jitter && random) {
        const double range = delay * JITTER_FRACTION;
        delay = delay - range + random() * range * 2.0;
    }

    delay = std::clamp(delay, 0.0, maxDelay);

    return BackoffState{attempt,
                        std::chrono::milliseconds{std::llround(delay)},
                        false};
}

BackoffState calculateBackoff(unsigned attempt, const BackoffOptions& options) {
    static std::mutex sourceMutex;
    static UniformSource source = makeDefaultSource();
    std::lock_guard lock(sourceMutex);
    return calculateBackoff(attempt, options, source);
}

BackoffController::BackoffController(BackoffOptions options, UniformSource random)
: options_(options)
, random_(std::move(random))
{}

BackoffState BackoffController::next() {
    auto state = calculateBackoff(attempt_, options_, random_);
    ++attempt_;
    return state;
}

} // namespace signage::relay
