#include "signage/relay/TimerScheduler.hpp"

namespace signage::relay {

namespace asio = net::asio;

AsioTimerScheduler::AsioTimerScheduler(net::Strand strand)
: strand_(std::move(strand))
, state_(std::make_shared<State>())
{}

AsioTimerScheduler::~AsioTimerScheduler() {
    for (auto& entry : state_->timers) {
        entry.second->cancel();
    }
    state_->timers.clear();
}

TimerId AsioTimerScheduler::schedule(std::chrono::milliseconds delay, std::function<void()> task) {
    const TimerId id = state_->nextId++;
    auto timer = std::make_shared<asio::steady_timer>(strand_);
    timer->expires_after(delay);
    state_->timers.emplace(id, timer);

    std::weak_ptr<State> weak = state_;
    timer->async_wait([weak, id, timer, task = std::move(task)](const std::error_code& ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        auto state = weak.lock();
        // Missing entry: cancelled after the timer had already expired.
        if (!state || state->timers.erase(id) == 0) {
            return;
        }
        task();
    });
    return id;
}

void AsioTimerScheduler::cancel(TimerId id) {
    auto it = state_->timers.find(id);
    if (it == state_->timers.end()) {
        return;
    }
    it->second->cancel();
    state_->timers.erase(it);
}

} // namespace signage::relay
