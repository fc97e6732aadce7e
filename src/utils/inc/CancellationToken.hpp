#pragma once
#include <chrono>
#include <stdexcept>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

// Observer side of a cancellation scope. A default-constructed token never fires.
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;

    // Explicitly cancelled, here or by any ancestor scope
    bool is_cancelled() const;

    // Effective deadline has passed
    bool is_expired() const;

    bool is_cancellation_requested() const { return is_cancelled() || is_expired(); }

    bool can_be_cancelled() const { return state_ != nullptr; }

    std::optional<Clock::time_point> deadline() const;

    // Time left before the deadline, clamped at zero; empty when there is no deadline
    std::optional<std::chrono::milliseconds> remaining() const;

    // Returns false when cancellation or the deadline cuts the sleep short
    bool sleep_for(std::chrono::milliseconds duration) const;

private:
    friend class CancellationSource;

    struct State {
        std::mutex mutex;
        std::condition_variable cond;
        bool cancelled = false;
        std::optional<Clock::time_point> deadline;
        std::vector<std::weak_ptr<State>> children;
    };

    explicit CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

// Owner side of a cancellation scope. Linking to a parent token inherits its
// cancellation and caps the deadline at the parent's.
class CancellationSource {
public:
    CancellationSource();
    explicit CancellationSource(std::chrono::milliseconds timeout);
    explicit CancellationSource(const CancellationToken& parent,
                                std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;

    void cancel();

    CancellationToken token() const { return CancellationToken(state_); }

private:
    static void cancel_state(const std::shared_ptr<CancellationToken::State>& state);

    std::shared_ptr<CancellationToken::State> state_;
};

// Raised when a blocking operation is abandoned because its token fired
class OperationCancelled : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
