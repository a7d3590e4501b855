#pragma once

#include <optional>
#include <string>

#include "job_store.hpp"
#include "notification_dispatcher.hpp"

struct TaskAssignment {
    std::string jobId;
    std::string prompt;
    std::string originator;
};

/**
 * @class WorkerQueue
 * @brief Pull-style task distribution for external render workers.
 *
 * Workers are not authenticated. They poll getTask() and later call
 * reportResult() with the terminal status of what they claimed.
 */
class WorkerQueue {
public:
    WorkerQueue(JobStore& store, NotificationDispatcher& notifier);

    // Claims the next pending job, or returns std::nullopt right away.
    std::optional<TaskAssignment> getTask();

    /**
     * @brief Records a worker's terminal result and notifies the originator.
     *
     * @param status "COMPLETED" or "FAILED".
     * @throws NotFoundError for an unknown id (checked before anything else).
     * @throws ValidationError for any other status string.
     * @throws InvalidTransitionError when the job is not RUNNING.
     */
    Job reportResult(const std::string& jobId,
                     const std::string& status,
                     const std::optional<std::string>& artifactReference);

    // Fails RUNNING jobs claimed more than `timeout` ago and tells their originators.
    size_t reclaimStale(std::chrono::seconds timeout);

private:
    JobStore& store_;
    NotificationDispatcher& notifier_;
};
