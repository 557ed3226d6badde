#pragma once

#include "signage/net/NetConfig.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <unordered_map>

namespace signage::relay {

using TimerId = std::uint64_t;

/**
 * @brief Deferred one-shot work, used for the reconnect timer.
 *
 * A cancelled timer's task never runs. Tasks run on the same sequence of
 * events as the relay client that scheduled them.
 */
class TimerScheduler {
public:
    virtual ~TimerScheduler() = default;
    virtual TimerId schedule(std::chrono::milliseconds delay, std::function<void()> task) = 0;
    virtual void cancel(TimerId id) = 0;
};

/**
 * @brief TimerScheduler backed by `asio::steady_timer` on a strand.
 *
 * schedule() and cancel() must be called on that strand. Destroying the
 * scheduler cancels everything still pending.
 */
class AsioTimerScheduler : public TimerScheduler {
public:
    explicit AsioTimerScheduler(net::Strand strand);
    ~AsioTimerScheduler() override;

    AsioTimerScheduler(const AsioTimerScheduler&) = delete;
    AsioTimerScheduler& operator=(const AsioTimerScheduler&) = delete;

    TimerId schedule(std::chrono::milliseconds delay, std::function<void()> task) override;
    void cancel(TimerId id) override;

    std::size_t pending() const { return state_->timers.size(); }

private:
    struct State {
        std::unordered_map<TimerId, std::shared_ptr<net::asio::steady_timer>> timers;
        TimerId nextId = 1;
    };

    net::Strand strand_;
    std::shared_ptr<State> state_;
};

} // namespace signage::relay
