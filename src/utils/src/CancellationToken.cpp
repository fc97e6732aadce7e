#include "CancellationToken.hpp"
#include <algorithm>
#include <thread>

bool CancellationToken::is_cancelled() const {
    if (!state_) return false;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

bool CancellationToken::is_expired() const {
    if (!state_) return false;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->deadline && Clock::now() >= *state_->deadline;
}

std::optional<CancellationToken::Clock::time_point> CancellationToken::deadline() const {
    if (!state_) return std::nullopt;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->deadline;
}

std::optional<std::chrono::milliseconds> CancellationToken::remaining() const {
    auto end = deadline();
    if (!end) return std::nullopt;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*end - Clock::now());
    return std::max(left, std::chrono::milliseconds(0));
}

bool CancellationToken::sleep_for(std::chrono::milliseconds duration) const {
    const auto until = Clock::now() + duration;
    if (!state_) {
        std::this_thread::sleep_until(until);
        return true;
    }

    std::unique_lock<std::mutex> lock(state_->mutex);
    const auto wake = state_->deadline ? std::min(until, *state_->deadline) : until;
    state_->cond.wait_until(lock, wake, [this] { return state_->cancelled; });

    if (state_->cancelled) return false;
    return !state_->deadline || until <= *state_->deadline;
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<CancellationToken::State>()) {}

CancellationSource::CancellationSource(std::chrono::milliseconds timeout)
    : CancellationSource() {
    state_->deadline = CancellationToken::Clock::now() + timeout;
}

CancellationSource::CancellationSource(const CancellationToken& parent,
                                       std::optional<std::chrono::milliseconds> timeout)
    : CancellationSource() {
    if (timeout) {
        state_->deadline = CancellationToken::Clock::now() + *timeout;
    }

    const auto& parent_state = parent.state_;
    if (!parent_state) return;

    std::lock_guard<std::mutex> lock(parent_state->mutex);
    if (parent_state->deadline) {
        state_->deadline = state_->deadline ? std::min(*state_->deadline, *parent_state->deadline)
                                            : *parent_state->deadline;
    }
    state_->cancelled = parent_state->cancelled;

    auto& children = parent_state->children;
    children.erase(std::remove_if(children.begin(), children.end(),
                                  [](const std::weak_ptr<CancellationToken::State>& w) { return w.expired(); }),
                   children.end());
    children.push_back(state_);
}

void CancellationSource::cancel() {
    cancel_state(state_);
}

void CancellationSource::cancel_state(const std::shared_ptr<CancellationToken::State>& state) {
    std::vector<std::shared_ptr<CancellationToken::State>> children;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->cancelled) return;
        state->cancelled = true;
        for (auto& weak : state->children) {
            if (auto child = weak.lock()) children.push_back(std::move(child));
        }
    }
    state->cond.notify_all();

    for (const auto& child : children) {
        cancel_state(child);
    }
}
