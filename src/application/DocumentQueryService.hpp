/**
 * @file DocumentQueryService.hpp
 * @brief Read side: document details, listings and job status.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "application/WorkDispatcher.hpp"
#include "domain/DocumentRepository.hpp"

namespace findoc::application {

/**
 * @struct DocumentView
 * @brief Response shape of a document. Check status: a FAILED document and
 * a SUCCESS document with no fields found look alike otherwise.
 */
struct DocumentView {
    std::int64_t id = 0;
    std::optional<std::string> filename;
    std::string rawText;
    domain::ParsedFields parsed;
    std::optional<std::string> jobId;
    domain::DocumentStatus status = domain::DocumentStatus::Pending;
    std::chrono::system_clock::time_point createdAt;

    static DocumentView FromRecord(const domain::DocumentRecord& record);
};

class DocumentQueryService {
public:
    static constexpr std::size_t kDefaultPageSize = 50;

    DocumentQueryService(std::shared_ptr<domain::DocumentRepository> repository,
                         std::shared_ptr<WorkDispatcher> dispatcher);

    std::optional<DocumentView> getDocument(std::int64_t id) const;
    std::vector<DocumentView> listDocuments(std::size_t skip = 0, std::size_t limit = kDefaultPageSize) const;

    /** @brief std::nullopt when the job id is unknown. */
    std::optional<domain::JobStatus> getTaskStatus(const std::string& jobId) const;

private:
    std::shared_ptr<domain::DocumentRepository> m_repository;
    std::shared_ptr<WorkDispatcher> m_dispatcher;
};

/** @brief {id, filename, raw_text, parsed, task_id, status, created_at}. */
nlohmann::json ToJson(const DocumentView& view);

/**
 * @brief {task_id, status, result}. result holds the parsed fields on a
 * successful extraction, {"error": ...} when the job ran but found no record
 * or file, and null otherwise; FAILURE adds an "error" message.
 */
nlohmann::json ToJson(const domain::JobStatus& status);

} // namespace findoc::application
