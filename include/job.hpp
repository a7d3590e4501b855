#pragma once

#include <chrono>
#include <optional>
#include <string>

enum class JobStatus {
    AwaitingPayment,
    Pending,
    Running,
    Completed,
    Failed
};

// Wire names: "AWAITING_PAYMENT", "PENDING", "RUNNING", "COMPLETED", "FAILED"
std::string toString(JobStatus status);
std::optional<JobStatus> parseJobStatus(const std::string& text);

bool isTerminal(JobStatus status);

/**
 * @brief Legal edges of the job state graph.
 *
 * AWAITING_PAYMENT -> PENDING -> RUNNING -> COMPLETED | FAILED.
 * Self-loops are not legal, so a repeated transition is reported as illegal.
 */
bool isLegalTransition(JobStatus from, JobStatus to);

struct Job {
    std::string id;
    std::string prompt;
    std::string originator;              // chat id the job reports back to
    std::optional<std::string> locale;   // language tag from the creating update
    JobStatus status;
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point updatedAt;  // time of the last transition
};
