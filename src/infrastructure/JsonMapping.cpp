/**
 * @file JsonMapping.cpp
 * @brief Implementation of the JSON conversions.
 */

#include "infrastructure/JsonMapping.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace findoc::infrastructure {

json OptionalToJson(const std::optional<std::string>& value) {
    if (!value) return nullptr;
    return *value;
}

std::optional<std::string> OptionalFromJson(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<std::string>();
}

long long ToEpochMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point FromEpochMillis(long long ms) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ms)));
}

std::string ToIso8601(std::chrono::system_clock::time_point tp) {
    long long ms = ToEpochMillis(tp);
    std::time_t seconds = static_cast<std::time_t>(ms / 1000);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(3) << std::setfill('0') << (ms % 1000) << 'Z';
    return ss.str();
}

} // namespace findoc::infrastructure

namespace findoc::domain {

using infrastructure::FromEpochMillis;
using infrastructure::OptionalFromJson;
using infrastructure::OptionalToJson;
using infrastructure::ToEpochMillis;

void to_json(json& j, const ParsedFields& fields) {
    j = {
        {"vendor", OptionalToJson(fields.vendor)},
        {"invoice_no", OptionalToJson(fields.invoiceNo)},
        {"date", OptionalToJson(fields.date)},
        {"total", OptionalToJson(fields.total)}
    };
}

void from_json(const json& j, ParsedFields& fields) {
    fields.vendor = OptionalFromJson(j, "vendor");
    fields.invoiceNo = OptionalFromJson(j, "invoice_no");
    fields.date = OptionalFromJson(j, "date");
    fields.total = OptionalFromJson(j, "total");
}

void to_json(json& j, const ProcessingOutcome& outcome) {
    j = {
        {"outcome", OutcomeToString(outcome.kind)},
        {"document_id", outcome.documentId}
    };
    if (outcome.succeeded()) {
        j["parsed"] = outcome.fields;
    } else {
        j["error"] = OutcomeToString(outcome.kind);
    }
}

void from_json(const json& j, ProcessingOutcome& outcome) {
    auto kind = OutcomeFromString(j.at("outcome").get<std::string>());
    if (!kind) {
        throw std::invalid_argument("unknown outcome: " + j.at("outcome").dump());
    }
    outcome.kind = *kind;
    outcome.documentId = j.value("document_id", 0LL);
    if (j.contains("parsed")) {
        outcome.fields = j.at("parsed").get<ParsedFields>();
    }
}

void to_json(json& j, const DocumentRecord& record) {
    j = {
        {"id", record.id},
        {"filename", OptionalToJson(record.filename)},
        {"raw_text", record.rawText},
        {"parsed", record.parsedFields},
        {"task_id", OptionalToJson(record.jobId)},
        {"status", StatusToString(record.status)},
        {"created_at", ToEpochMillis(record.createdAt)},
        {"updated_at", ToEpochMillis(record.updatedAt)}
    };
}

void from_json(const json& j, DocumentRecord& record) {
    auto status = StatusFromString(j.at("status").get<std::string>());
    if (!status) {
        throw std::invalid_argument("unknown status: " + j.at("status").dump());
    }
    record.id = j.at("id").get<std::int64_t>();
    record.filename = OptionalFromJson(j, "filename");
    record.rawText = j.value("raw_text", std::string());
    record.parsedFields = j.contains("parsed") ? j.at("parsed").get<ParsedFields>() : ParsedFields{};
    record.jobId = OptionalFromJson(j, "task_id");
    record.status = *status;
    record.createdAt = FromEpochMillis(j.value("created_at", 0LL));
    record.updatedAt = FromEpochMillis(j.value("updated_at", 0LL));
}

void to_json(json& j, const JobStatus& status) {
    j = {
        {"task_id", status.jobId},
        {"document_id", status.documentId},
        {"file_path", status.filePath},
        {"status", JobStateToString(status.state)},
        {"result", nullptr},
        {"error", status.errorMessage},
        {"submitted_at", ToEpochMillis(status.submittedAt)},
        {"finished_at", ToEpochMillis(status.finishedAt)}
    };
    if (status.result) {
        j["result"] = *status.result;
    }
}

void from_json(const json& j, JobStatus& status) {
    auto state = JobStateFromString(j.at("status").get<std::string>());
    if (!state) {
        throw std::invalid_argument("unknown job state: " + j.at("status").dump());
    }
    status.jobId = j.at("task_id").get<std::string>();
    status.documentId = j.value("document_id", 0LL);
    status.filePath = j.value("file_path", std::string());
    status.state = *state;
    status.result.reset();
    if (j.contains("result") && !j.at("result").is_null()) {
        status.result = j.at("result").get<ProcessingOutcome>();
    }
    status.errorMessage = j.value("error", std::string());
    status.submittedAt = FromEpochMillis(j.value("submitted_at", 0LL));
    status.finishedAt = FromEpochMillis(j.value("finished_at", 0LL));
}

} // namespace findoc::domain
