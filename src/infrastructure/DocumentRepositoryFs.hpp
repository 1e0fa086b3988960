/**
 * @file DocumentRepositoryFs.hpp
 * @brief File system implementation of the DocumentRepository.
 */

#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "domain/DocumentRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace findoc::infrastructure {

/**
 * @class DocumentRepositoryFs
 * @brief Stores each record as <recordsPath>/<id>.json.
 *
 * Every call holds one repository lock, and every mutation rewrites the
 * whole record file through PersistenceService::writeAtomic, so readers
 * (in this process or another) observe either the old or the new record.
 * New records are created exclusively, so instances sharing a directory
 * never hand out the same id.
 */
class DocumentRepositoryFs : public domain::DocumentRepository {
public:
    DocumentRepositoryFs(std::string recordsPath, std::shared_ptr<PersistenceService> persistence);

    std::int64_t createRecord(const std::optional<std::string>& filename,
                              domain::DocumentStatus initialStatus = domain::DocumentStatus::Pending) override;
    std::optional<domain::DocumentRecord> getRecord(std::int64_t id) override;
    domain::DocumentRecord updateRecord(std::int64_t id, const domain::RecordUpdate& update) override;
    std::vector<domain::DocumentRecord> listRecords(std::size_t offset, std::size_t limit) override;

private:
    std::string m_recordsPath;
    std::shared_ptr<PersistenceService> m_persistence;
    std::mutex m_mutex;
    std::int64_t m_nextId = 1;

    std::string recordFilePath(std::int64_t id) const;
    std::optional<domain::DocumentRecord> readRecord(std::int64_t id) const;
    void writeRecord(const domain::DocumentRecord& record);
    static std::string serialize(const domain::DocumentRecord& record);
    std::vector<std::int64_t> storedIds() const;
};

} // namespace findoc::infrastructure
