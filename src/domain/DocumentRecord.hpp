/**
 * @file DocumentRecord.hpp
 * @brief Domain entity for an uploaded document and its extraction outcome.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "domain/ParsedFields.hpp"

namespace findoc::domain {

/**
 * @enum DocumentStatus
 * @brief Lifecycle of a record. PENDING moves exactly once to a terminal status.
 */
enum class DocumentStatus {
    Pending,
    Success,
    Failed
};

inline std::string StatusToString(DocumentStatus status) {
    switch (status) {
        case DocumentStatus::Pending: return "PENDING";
        case DocumentStatus::Success: return "SUCCESS";
        case DocumentStatus::Failed: return "FAILED";
        default: return "UNKNOWN";
    }
}

inline std::optional<DocumentStatus> StatusFromString(const std::string& value) {
    if (value == "PENDING") return DocumentStatus::Pending;
    if (value == "SUCCESS") return DocumentStatus::Success;
    if (value == "FAILED") return DocumentStatus::Failed;
    return std::nullopt;
}

inline bool IsTerminal(DocumentStatus status) {
    return status != DocumentStatus::Pending;
}

/**
 * @class InvalidTransitionError
 * @brief Raised when an update would break the record lifecycle rules.
 */
class InvalidTransitionError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * @struct RecordUpdate
 * @brief A multi-field mutation applied to a record as one unit.
 */
struct RecordUpdate {
    std::optional<DocumentStatus> status;
    std::optional<std::string> rawText;
    std::optional<ParsedFields> parsedFields;
    std::optional<std::string> jobId;

    static RecordUpdate Succeeded(std::string text, ParsedFields fields) {
        RecordUpdate update;
        update.status = DocumentStatus::Success;
        update.rawText = std::move(text);
        update.parsedFields = std::move(fields);
        return update;
    }

    static RecordUpdate Failed() {
        RecordUpdate update;
        update.status = DocumentStatus::Failed;
        return update;
    }

    static RecordUpdate AssignJob(std::string id) {
        RecordUpdate update;
        update.jobId = std::move(id);
        return update;
    }
};

/**
 * @class DocumentRecord
 * @brief Persisted representation of one uploaded document.
 */
class DocumentRecord {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    std::int64_t id = 0;                  ///< Assigned by the store, immutable.
    std::optional<std::string> filename;  ///< Original upload name.
    std::string rawText;                  ///< Decoded content, empty until SUCCESS.
    ParsedFields parsedFields;
    std::optional<std::string> jobId;     ///< Set once, right after dispatch.
    DocumentStatus status = DocumentStatus::Pending;
    TimePoint createdAt;
    TimePoint updatedAt;

    DocumentRecord() = default;

    /**
     * @brief Applies an update, enforcing the lifecycle rules.
     *
     * The record is left untouched when the update is rejected.
     * @throws InvalidTransitionError on a rule violation.
     */
    void apply(const RecordUpdate& update, TimePoint now = std::chrono::system_clock::now()) {
        if (update.jobId && jobId && *jobId != *update.jobId) {
            throw InvalidTransitionError("Job id already assigned for document " + std::to_string(id));
        }
        if (update.jobId && update.jobId->empty()) {
            throw InvalidTransitionError("Empty job id for document " + std::to_string(id));
        }

        const bool touchesResult = update.rawText.has_value() || update.parsedFields.has_value();
        if (update.status) {
            if (IsTerminal(status)) {
                throw InvalidTransitionError("Document " + std::to_string(id) + " is already " +
                                             StatusToString(status));
            }
            if (*update.status == DocumentStatus::Pending) {
                throw InvalidTransitionError("Cannot move document " + std::to_string(id) + " back to PENDING");
            }
            if (*update.status == DocumentStatus::Success &&
                (!update.rawText || update.rawText->empty() || !update.parsedFields)) {
                throw InvalidTransitionError("SUCCESS requires raw text and parsed fields for document " +
                                             std::to_string(id));
            }
            if (*update.status == DocumentStatus::Failed && touchesResult) {
                throw InvalidTransitionError("FAILED must not carry text or fields for document " +
                                             std::to_string(id));
            }
        } else if (touchesResult) {
            // Text and fields only ever arrive together with SUCCESS.
            throw InvalidTransitionError("Text or fields without a status change for document " +
                                         std::to_string(id));
        }

        if (update.jobId) jobId = update.jobId;
        if (update.status) status = *update.status;
        if (update.rawText) rawText = *update.rawText;
        if (update.parsedFields) parsedFields = *update.parsedFields;
        updatedAt = now;
    }
};

} // namespace findoc::domain
