#include "job_store.hpp"
#include "logger.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <stdexcept>

namespace {

std::string randomUuid() {
    // random_generator is not thread-safe, one per thread
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

}

JobStore::JobStore() : JobStore(randomUuid) {}

JobStore::JobStore(IdGenerator generator) : generateId_(std::move(generator)) {}

std::string JobStore::create(const std::string& prompt,
                             const std::string& originator,
                             const std::optional<std::string>& locale,
                             JobStatus initialStatus) {
    if (initialStatus != JobStatus::AwaitingPayment && initialStatus != JobStatus::Pending) {
        throw std::invalid_argument("Job cannot start in status " + toString(initialStatus));
    }

    auto now = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(storeMutex);
    for (int attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
        std::string id = generateId_();
        if (jobs_.contains(id)) {
            Logger::formattedWarn("Job id collision on {}, regenerating", id);
            continue;
        }

        jobs_.emplace(id, Job{id, prompt, originator, locale, initialStatus, now, now});
        if (initialStatus == JobStatus::Pending) {
            pendingOrder_.push_back(id);
        }
        Logger::formattedInfo("Job created: {} for chat {} ({})", id, originator, toString(initialStatus));
        return id;
    }
    throw std::runtime_error("Could not allocate a unique job id");
}

std::optional<Job> JobStore::claimNextPending() {
    std::lock_guard<std::mutex> lock(storeMutex);
    while (!pendingOrder_.empty()) {
        std::string id = pendingOrder_.front();
        pendingOrder_.pop_front();

        auto it = jobs_.find(id);
        // Entries left behind by a direct PENDING -> RUNNING transition
        if (it == jobs_.end() || it->second.status != JobStatus::Pending) continue;

        applyLocked(it->second, JobStatus::Running);
        Logger::formattedInfo("Job claimed by worker: {}", id);
        return it->second;
    }
    return std::nullopt;
}

TransitionResult JobStore::transition(const std::string& id, JobStatus newStatus) {
    TransitionResult result{};

    std::lock_guard<std::mutex> lock(storeMutex);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        result.outcome = TransitionResult::Outcome::NotFound;
        result.errorReason = "Unknown job";
        return result;
    }

    Job& job = it->second;
    result.previousStatus = job.status;

    if (!isLegalTransition(job.status, newStatus)) {
        result.outcome = TransitionResult::Outcome::Illegal;
        result.errorReason = "Illegal transition " + toString(job.status) + " -> " + toString(newStatus);
        result.job = job;
        Logger::formattedWarn("Job {}: rejected {}", id, result.errorReason);
        return result;
    }

    applyLocked(job, newStatus);
    if (newStatus == JobStatus::Pending) {
        pendingOrder_.push_back(id);
    }

    result.outcome = TransitionResult::Outcome::Applied;
    result.job = job;
    Logger::formattedInfo("Job status: {} {} -> {}", id, toString(result.previousStatus), toString(newStatus));
    return result;
}

std::optional<Job> JobStore::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(storeMutex);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) return std::nullopt;
    return it->second;
}

std::vector<Job> JobStore::failRunningClaimedBefore(std::chrono::system_clock::time_point cutoff) {
    std::vector<Job> expired;

    std::lock_guard<std::mutex> lock(storeMutex);
    for (auto& [id, job] : jobs_) {
        if (job.status == JobStatus::Running && job.updatedAt < cutoff) {
            applyLocked(job, JobStatus::Failed);
            Logger::formattedWarn("Job {} exceeded the running timeout, marked FAILED", id);
            expired.push_back(job);
        }
    }
    return expired;
}

std::map<JobStatus, size_t> JobStore::countByStatus() const {
    std::map<JobStatus, size_t> counts;
    std::lock_guard<std::mutex> lock(storeMutex);
    for (const auto& [id, job] : jobs_) {
        ++counts[job.status];
    }
    return counts;
}

size_t JobStore::size() const {
    std::lock_guard<std::mutex> lock(storeMutex);
    return jobs_.size();
}

void JobStore::applyLocked(Job& job, JobStatus newStatus) {
    job.status = newStatus;
    job.updatedAt = std::chrono::system_clock::now();
}
