/**
 * @file DocumentQueryService.cpp
 * @brief Implementation of DocumentQueryService.
 */

#include "application/DocumentQueryService.hpp"
#include "infrastructure/JsonMapping.hpp"

namespace findoc::application {

using json = nlohmann::json;

DocumentView DocumentView::FromRecord(const domain::DocumentRecord& record) {
    DocumentView view;
    view.id = record.id;
    view.filename = record.filename;
    view.rawText = record.rawText;
    view.parsed = record.parsedFields;
    view.jobId = record.jobId;
    view.status = record.status;
    view.createdAt = record.createdAt;
    return view;
}

DocumentQueryService::DocumentQueryService(std::shared_ptr<domain::DocumentRepository> repository,
                                           std::shared_ptr<WorkDispatcher> dispatcher)
    : m_repository(std::move(repository)), m_dispatcher(std::move(dispatcher)) {}

std::optional<DocumentView> DocumentQueryService::getDocument(std::int64_t id) const {
    auto record = m_repository->getRecord(id);
    if (!record) return std::nullopt;
    return DocumentView::FromRecord(*record);
}

std::vector<DocumentView> DocumentQueryService::listDocuments(std::size_t skip, std::size_t limit) const {
    std::vector<DocumentView> views;
    for (const auto& record : m_repository->listRecords(skip, limit)) {
        views.push_back(DocumentView::FromRecord(record));
    }
    return views;
}

std::optional<domain::JobStatus> DocumentQueryService::getTaskStatus(const std::string& jobId) const {
    return m_dispatcher->getJobStatus(jobId);
}

json ToJson(const DocumentView& view) {
    return {
        {"id", view.id},
        {"filename", infrastructure::OptionalToJson(view.filename)},
        {"raw_text", view.rawText},
        {"parsed", view.parsed},
        {"task_id", infrastructure::OptionalToJson(view.jobId)},
        {"status", domain::StatusToString(view.status)},
        {"created_at", infrastructure::ToIso8601(view.createdAt)}
    };
}

json ToJson(const domain::JobStatus& status) {
    json j = {
        {"task_id", status.jobId},
        {"status", domain::JobStateToString(status.state)},
        {"result", nullptr}
    };
    if (status.state == domain::JobState::Success && status.result) {
        if (status.result->succeeded()) {
            j["result"] = status.result->fields;
        } else {
            j["result"] = {{"error", domain::OutcomeToString(status.result->kind)}};
        }
    } else if (status.state == domain::JobState::Failure) {
        j["error"] = status.errorMessage;
    }
    return j;
}

} // namespace findoc::application
