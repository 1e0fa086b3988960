/**
 * @file ProcessingOutcome.hpp
 * @brief Result of a single processing attempt on a document.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "domain/ParsedFields.hpp"

namespace findoc::domain {

enum class OutcomeKind {
    Succeeded,
    RecordNotFound,
    FileNotFound,
    AlreadyTerminal   ///< Redelivered job for a record that already finished.
};

inline std::string OutcomeToString(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::Succeeded: return "succeeded";
        case OutcomeKind::RecordNotFound: return "document not found";
        case OutcomeKind::FileNotFound: return "file not found";
        case OutcomeKind::AlreadyTerminal: return "already processed";
        default: return "unknown";
    }
}

inline std::optional<OutcomeKind> OutcomeFromString(const std::string& value) {
    if (value == "succeeded") return OutcomeKind::Succeeded;
    if (value == "document not found") return OutcomeKind::RecordNotFound;
    if (value == "file not found") return OutcomeKind::FileNotFound;
    if (value == "already processed") return OutcomeKind::AlreadyTerminal;
    return std::nullopt;
}

struct ProcessingOutcome {
    OutcomeKind kind = OutcomeKind::Succeeded;
    std::int64_t documentId = 0;
    ParsedFields fields;   ///< Populated only for Succeeded.

    bool succeeded() const { return kind == OutcomeKind::Succeeded; }
};

} // namespace findoc::domain
