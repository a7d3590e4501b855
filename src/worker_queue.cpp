#include "worker_queue.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "utils.hpp"

WorkerQueue::WorkerQueue(JobStore& store, NotificationDispatcher& notifier)
    : store_(store),
      notifier_(notifier) {}

std::optional<TaskAssignment> WorkerQueue::getTask() {
    auto job = store_.claimNextPending();
    if (!job) return std::nullopt;
    return TaskAssignment{job->id, job->prompt, job->originator};
}

Job WorkerQueue::reportResult(const std::string& jobId,
                              const std::string& status,
                              const std::optional<std::string>& artifactReference) {
    auto parsed = parseJobStatus(status);
    if (!parsed || !isTerminal(*parsed)) {
        if (!store_.get(jobId)) {
            throw NotFoundError(jobId);
        }
        throw ValidationError("Status must be COMPLETED or FAILED, got '" + status + "'");
    }

    TransitionResult result = store_.transition(jobId, *parsed);
    switch (result.outcome) {
        case TransitionResult::Outcome::NotFound:
            throw NotFoundError(jobId);
        case TransitionResult::Outcome::Illegal:
            throw InvalidTransitionError(result.errorReason);
        case TransitionResult::Outcome::Applied:
            break;
    }

    const Job& job = *result.job;
    std::string artifact = artifactReference ? Utils::trim(*artifactReference) : "";

    if (job.status == JobStatus::Completed && !artifact.empty()) {
        notifier_.notify(job.originator, job.locale, MessageId::JobCompleted,
                         {{"job_id", job.id}, {"result_url", artifact}});
    } else if (job.status == JobStatus::Completed) {
        notifier_.notify(job.originator, job.locale, MessageId::JobCompletedNoArtifact, {{"job_id", job.id}});
    } else {
        notifier_.notify(job.originator, job.locale, MessageId::JobFailed, {{"job_id", job.id}});
    }
    return job;
}

size_t WorkerQueue::reclaimStale(std::chrono::seconds timeout) {
    auto cutoff = std::chrono::system_clock::now() - timeout;
    auto expired = store_.failRunningClaimedBefore(cutoff);
    for (const auto& job : expired) {
        notifier_.notify(job.originator, job.locale, MessageId::JobTimedOut, {{"job_id", job.id}});
    }
    return expired.size();
}
