#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <vector>

namespace metatot {

// ─── Worker Pool ───────────────────────────────────────────────
// Fixed-size pool bounding concurrent calls to the inference
// backend. Shared by every session of an engine, so a call may wait
// in the queue behind calls of other sessions. Destruction drains
// queued calls and joins the workers.

class WorkerPool {
public:
    explicit WorkerPool(size_t n_threads) {
        size_t n = n_threads == 0 ? 1 : n_threads;
        workers_.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            workers_.emplace_back([this] { drain(); });
        }
    }

    ~WorkerPool() {
        {
            std::lock_guard<std::mutex> lk(mu_);
            closing_ = true;
        }
        wake_.notify_all();
        for (auto& w : workers_) w.join();
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue fn. on_finish runs on the worker after the future is ready,
    /// whether fn returned or threw.
    template <typename F>
    auto submit(F&& fn, std::function<void()> on_finish)
        -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;
        auto call = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        std::future<R> result = call->get_future();
        enqueue(Call{[call] { (*call)(); }, std::move(on_finish)});
        return result;
    }

    template <typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        return submit(std::forward<F>(fn), std::function<void()>());
    }

    size_t size() const { return workers_.size(); }

    /// Calls queued but not yet picked up by a worker.
    size_t queued() const {
        std::lock_guard<std::mutex> lk(mu_);
        return calls_.size();
    }

private:
    struct Call {
        std::function<void()> run;  // never throws: packaged_task keeps the exception
        std::function<void()> on_finish;
    };

    void enqueue(Call call) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            calls_.push_back(std::move(call));
        }
        wake_.notify_one();
    }

    /// Next call, or nullopt once closing and the queue is empty.
    std::optional<Call> take() {
        std::unique_lock<std::mutex> lk(mu_);
        wake_.wait(lk, [this] { return closing_ || !calls_.empty(); });
        if (calls_.empty()) return std::nullopt;
        Call call = std::move(calls_.front());
        calls_.pop_front();
        return call;
    }

    void drain() {
        while (auto call = take()) {
            call->run();
            if (call->on_finish) call->on_finish();
        }
    }

    std::vector<std::thread> workers_;
    std::deque<Call> calls_;
    mutable std::mutex mu_;
    std::condition_variable wake_;
    bool closing_ = false;
};

} // namespace metatot
