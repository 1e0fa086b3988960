/**
 * @file DocumentRepository.hpp
 * @brief Interface for persistence and retrieval of document records.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "domain/DocumentRecord.hpp"

namespace findoc::domain {

/**
 * @class PersistenceError
 * @brief Storage failure (I/O, corrupt stored data).
 */
class PersistenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class RecordNotFoundError
 * @brief Raised by updateRecord when the id is unknown.
 */
class RecordNotFoundError : public PersistenceError {
public:
    explicit RecordNotFoundError(std::int64_t id)
        : PersistenceError("Document not found: " + std::to_string(id)) {}
};

/**
 * @class DocumentRepository
 * @brief Abstract CRUD store over document records.
 *
 * Implementations must make every call atomic per record: a concurrent
 * reader sees a record either before or after an update, never in between.
 */
class DocumentRepository {
public:
    virtual ~DocumentRepository() = default;

    /**
     * @brief Creates a record with empty text and no parsed fields.
     * @param filename Original upload name, if any.
     * @param initialStatus PENDING or FAILED; a record cannot start as SUCCESS.
     * @return The new id. The record is durable when this returns.
     */
    virtual std::int64_t createRecord(const std::optional<std::string>& filename,
                                      DocumentStatus initialStatus = DocumentStatus::Pending) = 0;

    /** @brief Fetches a record by id. */
    virtual std::optional<DocumentRecord> getRecord(std::int64_t id) = 0;

    /**
     * @brief Applies a multi-field update atomically.
     * @return The record as stored after the update.
     * @throws RecordNotFoundError, InvalidTransitionError, PersistenceError.
     */
    virtual DocumentRecord updateRecord(std::int64_t id, const RecordUpdate& update) = 0;

    /** @brief Lists records ordered by id. */
    virtual std::vector<DocumentRecord> listRecords(std::size_t offset, std::size_t limit) = 0;
};

} // namespace findoc::domain
