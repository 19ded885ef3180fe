#pragma once

#include <atomic>
#include <chrono>
#include <memory>

namespace metatot {

/// Session-level cancellation flag. Copies share the same flag, so the
/// caller keeps one copy and hands another to the engine.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }
    bool cancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

/// Manages the computational budget of one planning session.
/// Tracks iterations, wall-clock time against a deadline, and the
/// cancellation token. A non-positive deadline means "no deadline".
class BudgetManager {
public:
    enum class Stop {
        None,
        Iterations,
        Deadline,
        Cancelled
    };

    BudgetManager(int max_iterations, int deadline_ms,
                  CancellationToken token = CancellationToken())
        : max_iterations_(max_iterations), deadline_ms_(deadline_ms), token_(std::move(token)) {}

    void start() {
        start_time_ = std::chrono::steady_clock::now();
        iterations_ = 0;
    }

    void recordIteration() { iterations_++; }

    /// Checked at the top of every iteration.
    bool canContinue() const { return stopReason() == Stop::None; }

    Stop stopReason() const {
        if (token_.cancelled()) return Stop::Cancelled;
        if (iterations_ >= max_iterations_) return Stop::Iterations;
        if (isTimeExhausted()) return Stop::Deadline;
        return Stop::None;
    }

    double elapsedSeconds() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double>(now - start_time_).count();
    }

    int iterations() const { return iterations_; }

    bool isTimeExhausted() const {
        return deadline_ms_ > 0 && elapsedSeconds() * 1000.0 >= deadline_ms_;
    }

private:
    int max_iterations_;
    int deadline_ms_;
    CancellationToken token_;
    int iterations_ = 0;
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace metatot
