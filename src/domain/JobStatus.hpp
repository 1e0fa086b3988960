/**
 * @file JobStatus.hpp
 * @brief State of a dispatched background job.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "domain/ProcessingOutcome.hpp"

namespace findoc::domain {

/**
 * @enum JobState
 * @brief PENDING -> STARTED -> SUCCESS | FAILURE.
 */
enum class JobState {
    Pending,
    Started,
    Success,
    Failure
};

inline std::string JobStateToString(JobState state) {
    switch (state) {
        case JobState::Pending: return "PENDING";
        case JobState::Started: return "STARTED";
        case JobState::Success: return "SUCCESS";
        case JobState::Failure: return "FAILURE";
        default: return "UNKNOWN";
    }
}

inline std::optional<JobState> JobStateFromString(const std::string& value) {
    if (value == "PENDING") return JobState::Pending;
    if (value == "STARTED") return JobState::Started;
    if (value == "SUCCESS") return JobState::Success;
    if (value == "FAILURE") return JobState::Failure;
    return std::nullopt;
}

struct JobStatus {
    std::string jobId;
    std::int64_t documentId = 0;
    std::string filePath;
    JobState state = JobState::Pending;
    std::optional<ProcessingOutcome> result;   ///< Set on SUCCESS.
    std::string errorMessage;                  ///< Set on FAILURE.
    std::chrono::system_clock::time_point submittedAt;
    std::chrono::system_clock::time_point finishedAt;

    bool isFinished() const {
        return state == JobState::Success || state == JobState::Failure;
    }
};

} // namespace findoc::domain
