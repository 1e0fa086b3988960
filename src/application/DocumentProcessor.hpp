/**
 * @file DocumentProcessor.hpp
 * @brief Drives one document record through its single processing attempt.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "domain/DocumentRepository.hpp"
#include "domain/ProcessingOutcome.hpp"

namespace findoc::application {

/**
 * @class DocumentProcessor
 * @brief PENDING -> SUCCESS | FAILED state machine for a document record.
 *
 * There is no retry: a failed attempt is final for the record. Safe to run
 * concurrently for different records; callers guarantee at most one
 * invocation per record.
 */
class DocumentProcessor {
public:
    explicit DocumentProcessor(std::shared_ptr<domain::DocumentRepository> repository);

    /**
     * @brief Reads the file, extracts fields and stores the terminal status.
     *
     * - Unknown record: RecordNotFound, no writes.
     * - Record already terminal: AlreadyTerminal, no writes.
     * - Missing file: record marked FAILED, FileNotFound.
     * - Success: text, fields and SUCCESS written in one update.
     *
     * @throws Any failure after the file check (I/O, empty content, store
     * errors) is rethrown after a best-effort FAILED write. If that write
     * fails too, it is logged and the original error is still rethrown.
     */
    domain::ProcessingOutcome process(std::int64_t documentId, const std::string& filePath);

private:
    std::shared_ptr<domain::DocumentRepository> m_repository;

    void markFailed(std::int64_t documentId);
};

} // namespace findoc::application
