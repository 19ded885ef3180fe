#include "generation/candidate_generator.hpp"
#include "util/env.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace metatot {

namespace {

using Clock = std::chrono::steady_clock;

// Shared between one batch and its queued calls. A call's timeout runs
// from the moment a worker picks it up; calls the batch has given up
// on before that never reach the backend.
struct CompletionChannel {
    std::mutex mu;
    std::condition_variable cv;
    std::deque<size_t> done;  // completion order
    std::vector<std::optional<Clock::time_point>> started;
    std::vector<bool> abandoned;

    explicit CompletionChannel(size_t n) : started(n), abandoned(n, false) {}

    /// Called by the worker. False when the batch already gave up.
    bool begin(size_t index) {
        {
            std::lock_guard<std::mutex> lk(mu);
            if (abandoned[index]) return false;
            started[index] = Clock::now();
        }
        cv.notify_one();
        return true;
    }

    void finish(size_t index) {
        {
            std::lock_guard<std::mutex> lk(mu);
            done.push_back(index);
        }
        cv.notify_one();
    }
};

bool hasUsableScore(const std::map<std::string, double>& scores) {
    return std::any_of(scores.begin(), scores.end(), [](const auto& kv) {
        return std::isfinite(kv.second) && kv.second >= 0.0;
    });
}

} // namespace

GeneratorConfig GeneratorConfig::fromEnv() {
    return fromEnv(GeneratorConfig{});
}

GeneratorConfig GeneratorConfig::fromEnv(GeneratorConfig base) {
    base.branching_factor = envInt("META_TOT_BRANCHES", base.branching_factor);
    base.call_timeout_ms = envInt("META_TOT_CALL_TIMEOUT_MS", base.call_timeout_ms);
    int workers = envInt("META_TOT_WORKERS", static_cast<int>(base.worker_count));
    base.worker_count = static_cast<size_t>(std::max(1, workers));
    return base;
}

CandidateGenerator::CandidateGenerator(std::shared_ptr<InferenceClient> client,
                                       std::shared_ptr<WorkerPool> pool,
                                       GeneratorConfig config)
    : client_(std::move(client)), pool_(std::move(pool)), config_(config) {
    if (!client_) throw std::invalid_argument("CandidateGenerator needs an inference client");
    if (!pool_) throw std::invalid_argument("CandidateGenerator needs a worker pool");
}

size_t CandidateGenerator::proposalCap(DomainPhase phase, int branching_factor) {
    int bf = std::max(1, branching_factor);
    switch (phase) {
        case DomainPhase::Explore:   return static_cast<size_t>(std::clamp(bf, 2, 4));
        case DomainPhase::Challenge: return static_cast<size_t>(bf);
        case DomainPhase::Evolve:
        case DomainPhase::Integrate:
        case DomainPhase::Leaf:      return 1;
    }
    return 1;
}

ExpansionResult CandidateGenerator::expand(const ExpansionJob& job,
                                           const EfeScorer& scorer,
                                           const nlohmann::json& context) const {
    auto results = expandBatch({job}, scorer, context);
    return std::move(results.front());
}

std::vector<ExpansionResult> CandidateGenerator::expandBatch(const std::vector<ExpansionJob>& jobs,
                                                             const EfeScorer& scorer,
                                                             const nlohmann::json& context) const {
    auto channel = std::make_shared<CompletionChannel>(jobs.size());
    std::vector<std::future<GenerationResponse>> futures;
    futures.reserve(jobs.size());

    const auto submitted = Clock::now();
    const auto timeout = std::chrono::milliseconds(std::max(0, config_.call_timeout_ms));
    // a call still queued after the batch could have run serially is dropped
    const auto queue_limit = submitted + timeout * static_cast<int>(jobs.size());

    for (size_t i = 0; i < jobs.size(); i++) {
        std::string prompt = PromptBuilder::build(jobs[i].request);
        nlohmann::json ctx = PromptBuilder::requestContext(jobs[i].request, context);
        auto client = client_;
        futures.push_back(pool_->submit(
            [client, channel, i, prompt = std::move(prompt), ctx = std::move(ctx)]() {
                if (!channel->begin(i)) return GenerationResponse{};
                return client->generate(prompt, ctx);
            },
            [channel, i] { channel->finish(i); }));
    }

    std::vector<ExpansionResult> results;
    std::vector<bool> collected(jobs.size(), false);
    results.reserve(jobs.size());
    size_t open = jobs.size();

    while (open > 0) {
        size_t index = 0;
        bool ready = false;
        {
            std::unique_lock<std::mutex> lk(channel->mu);
            while (!ready && open > 0) {
                if (!channel->done.empty()) {
                    index = channel->done.front();
                    channel->done.pop_front();
                    ready = !channel->abandoned[index];
                    continue;
                }

                auto now = Clock::now();
                auto wake = Clock::time_point::max();
                for (size_t i = 0; i < jobs.size(); i++) {
                    if (collected[i] || channel->abandoned[i]) continue;
                    auto limit = channel->started[i] ? *channel->started[i] + timeout : queue_limit;
                    if (limit <= now) {
                        channel->abandoned[i] = true;
                        open--;
                    } else {
                        wake = std::min(wake, limit);
                    }
                }
                if (open > 0) channel->cv.wait_until(lk, wake);
            }
        }
        if (!ready) break;

        open--;
        const ExpansionJob& job = jobs[index];
        double latency = std::chrono::duration<double>(Clock::now() - submitted).count();
        collected[index] = true;

        GenerationResponse response;
        try {
            response = futures[index].get();
        } catch (const std::exception& e) {
            Logger::warn("generator", "Expansion of node " + std::to_string(job.request.node_id) +
                                      " failed: " + e.what());
            ExpansionResult failed;
            failed.node_id = job.request.node_id;
            failed.phase = job.request.phase;
            failed.failure = std::string("error: ") + e.what();
            failed.latency_seconds = latency;
            results.push_back(std::move(failed));
            continue;
        }

        ExpansionResult result = score(job, response, scorer);
        result.latency_seconds = latency;
        results.push_back(std::move(result));
    }

    for (size_t i = 0; i < jobs.size(); i++) {
        if (collected[i]) continue;
        Logger::warn("generator", "Expansion of node " + std::to_string(jobs[i].request.node_id) +
                                  " timed out after " + std::to_string(config_.call_timeout_ms) + "ms");
        ExpansionResult timed_out;
        timed_out.node_id = jobs[i].request.node_id;
        timed_out.phase = jobs[i].request.phase;
        timed_out.failure = "timeout";
        timed_out.latency_seconds = std::chrono::duration<double>(Clock::now() - submitted).count();
        results.push_back(std::move(timed_out));
    }
    return results;
}

ExpansionResult CandidateGenerator::score(const ExpansionJob& job,
                                          const GenerationResponse& response,
                                          const EfeScorer& scorer) const {
    ExpansionResult result;
    result.node_id = job.request.node_id;
    result.phase = job.request.phase;

    size_t cap = proposalCap(job.request.phase, config_.branching_factor);
    for (const auto& proposal : response.proposals) {
        if (result.children.size() >= cap) break;
        if (proposal.content.empty()) continue;

        BeliefDistribution beliefs = hasUsableScore(proposal.belief_hypotheses)
            ? BeliefDistribution::fromScores(proposal.belief_hypotheses)
            : BeliefDistribution::uniform(scorer.goalKeys());

        ScoredProposal scored;
        scored.content = proposal.content;
        scored.state = scorer.deriveState(beliefs, job.parent_state);
        result.children.push_back(std::move(scored));
    }

    if (result.children.empty()) {
        result.failure = "no usable proposals";
        Logger::debug("generator", "Node " + std::to_string(job.request.node_id) +
                                   " received no usable proposals");
    }
    return result;
}

} // namespace metatot
