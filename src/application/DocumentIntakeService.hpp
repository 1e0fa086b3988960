/**
 * @file DocumentIntakeService.hpp
 * @brief Accepts uploaded documents and hands them to the background pipeline.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "application/WorkDispatcher.hpp"
#include "domain/DocumentRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace findoc::application {

/**
 * @class DocumentIntakeService
 * @brief Upload surface: saved blob + PENDING record + dispatched job.
 */
class DocumentIntakeService {
public:
    struct UploadReceipt {
        std::string jobId;
        std::int64_t documentId = 0;
    };

    DocumentIntakeService(std::string storagePath,
                          std::shared_ptr<domain::DocumentRepository> repository,
                          std::shared_ptr<WorkDispatcher> dispatcher,
                          std::shared_ptr<infrastructure::PersistenceService> persistence);

    /**
     * @brief Stores the bytes, creates the record and dispatches processing.
     *
     * The record is durable before the job is queued, and the job id is on
     * the record before the job can run.
     * @param filename Client-supplied name; only its last path component is kept.
     * @throws domain::PersistenceError if the blob or the record cannot be written.
     */
    UploadReceipt upload(const std::string& filename, const std::string& bytes);

    /** @brief Reads a local file and uploads it under its own basename. */
    UploadReceipt uploadFile(const std::string& path);

private:
    std::string m_storagePath;
    std::shared_ptr<domain::DocumentRepository> m_repository;
    std::shared_ptr<WorkDispatcher> m_dispatcher;
    std::shared_ptr<infrastructure::PersistenceService> m_persistence;
};

} // namespace findoc::application
