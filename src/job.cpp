#include "job.hpp"

std::string toString(JobStatus status) {
    switch (status) {
        case JobStatus::AwaitingPayment: return "AWAITING_PAYMENT";
        case JobStatus::Pending:         return "PENDING";
        case JobStatus::Running:         return "RUNNING";
        case JobStatus::Completed:       return "COMPLETED";
        case JobStatus::Failed:          return "FAILED";
    }
    return "UNKNOWN";
}

std::optional<JobStatus> parseJobStatus(const std::string& text) {
    if (text == "AWAITING_PAYMENT") return JobStatus::AwaitingPayment;
    if (text == "PENDING")          return JobStatus::Pending;
    if (text == "RUNNING")          return JobStatus::Running;
    if (text == "COMPLETED")        return JobStatus::Completed;
    if (text == "FAILED")           return JobStatus::Failed;
    return std::nullopt;
}

bool isTerminal(JobStatus status) {
    return status == JobStatus::Completed || status == JobStatus::Failed;
}

bool isLegalTransition(JobStatus from, JobStatus to) {
    switch (from) {
        case JobStatus::AwaitingPayment:
            return to == JobStatus::Pending;
        case JobStatus::Pending:
            return to == JobStatus::Running;
        case JobStatus::Running:
            return to == JobStatus::Completed || to == JobStatus::Failed;
        case JobStatus::Completed:
        case JobStatus::Failed:
            return false;
    }
    return false;
}
