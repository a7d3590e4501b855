#pragma once
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "job.hpp"

struct TransitionResult {
    enum class Outcome {
        Applied,
        NotFound,
        Illegal
    };

    Outcome outcome;
    std::optional<Job> job;       // state after the call; unset when NotFound
    JobStatus previousStatus;     // meaningful unless NotFound
    std::string errorReason;

    bool applied() const { return outcome == Outcome::Applied; }
};

/**
 * @brief Owns every Job record and is the only place job status changes.
 *
 * All access goes through one mutex; callers only ever receive copies.
 * Pending jobs are handed out in the order they became PENDING.
 */
class JobStore {
public:
    using IdGenerator = std::function<std::string()>;

    // Random (version 4) UUIDs
    JobStore();
    explicit JobStore(IdGenerator generator);

    /**
     * @brief Inserts a new job and returns its id.
     *
     * @param initialStatus AWAITING_PAYMENT or PENDING; anything else throws
     *        std::invalid_argument.
     * @throws std::runtime_error if the id generator keeps colliding.
     */
    std::string create(const std::string& prompt,
                       const std::string& originator,
                       const std::optional<std::string>& locale,
                       JobStatus initialStatus);

    /**
     * @brief Atomically moves the oldest PENDING job to RUNNING.
     *
     * A job is returned by at most one call over the lifetime of the store.
     * Returns std::nullopt immediately when nothing is pending.
     */
    std::optional<Job> claimNextPending();

    TransitionResult transition(const std::string& id, JobStatus newStatus);

    std::optional<Job> get(const std::string& id) const;

    // Fails every RUNNING job whose claim happened before `cutoff`.
    std::vector<Job> failRunningClaimedBefore(std::chrono::system_clock::time_point cutoff);

    std::map<JobStatus, size_t> countByStatus() const;
    size_t size() const;

private:
    void applyLocked(Job& job, JobStatus newStatus);

    static constexpr int kMaxIdAttempts = 8;

    mutable std::mutex storeMutex;
    std::unordered_map<std::string, Job> jobs_;
    std::deque<std::string> pendingOrder_;
    IdGenerator generateId_;
};
