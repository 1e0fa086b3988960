/**
 * @file DocumentRepositoryFs.cpp
 * @brief Implementation of DocumentRepositoryFs.
 */

#include "infrastructure/DocumentRepositoryFs.hpp"
#include "infrastructure/JsonMapping.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace findoc::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {
    // Accepts "<digits>.json" only; temp files and strays are ignored.
    std::optional<std::int64_t> IdFromFilename(const fs::path& path) {
        if (path.extension() != ".json") return std::nullopt;
        std::string stem = path.stem().string();
        if (stem.empty() || !std::all_of(stem.begin(), stem.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
        try {
            return std::stoll(stem);
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }
}

DocumentRepositoryFs::DocumentRepositoryFs(std::string recordsPath, std::shared_ptr<PersistenceService> persistence)
    : m_recordsPath(std::move(recordsPath)), m_persistence(std::move(persistence)) {
    std::error_code ec;
    fs::create_directories(m_recordsPath, ec);
    if (ec) {
        throw domain::PersistenceError("Cannot create records directory " + m_recordsPath + ": " + ec.message());
    }

    auto ids = storedIds();
    if (!ids.empty()) {
        m_nextId = ids.back() + 1;
    }
    std::cout << "[DocumentRepositoryFs] Opened " << m_recordsPath << " (" << ids.size() << " records)" << std::endl;
}

std::string DocumentRepositoryFs::recordFilePath(std::int64_t id) const {
    return (fs::path(m_recordsPath) / (std::to_string(id) + ".json")).string();
}

std::vector<std::int64_t> DocumentRepositoryFs::storedIds() const {
    std::vector<std::int64_t> ids;
    std::error_code ec;
    for (fs::directory_iterator it(m_recordsPath, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file()) continue;
        if (auto id = IdFromFilename(it->path())) {
            ids.push_back(*id);
        }
    }
    if (ec) {
        throw domain::PersistenceError("Cannot list records in " + m_recordsPath + ": " + ec.message());
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::optional<domain::DocumentRecord> DocumentRepositoryFs::readRecord(std::int64_t id) const {
    std::string path = recordFilePath(id);
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        std::error_code ec;
        if (!fs::exists(path, ec) && !ec) return std::nullopt;
        throw domain::PersistenceError("Cannot open record file " + path);
    }

    try {
        json j = json::parse(in);
        return j.get<domain::DocumentRecord>();
    } catch (const std::exception& e) {
        throw domain::PersistenceError("Corrupt record file " + path + ": " + e.what());
    }
}

std::string DocumentRepositoryFs::serialize(const domain::DocumentRecord& record) {
    try {
        json j = record;
        return j.dump(2);
    } catch (const json::exception& e) {
        // e.g. a filename that is not valid UTF-8
        throw domain::PersistenceError("Cannot serialize document " + std::to_string(record.id) + ": " + e.what());
    }
}

void DocumentRepositoryFs::writeRecord(const domain::DocumentRecord& record) {
    m_persistence->writeAtomic(recordFilePath(record.id), serialize(record));
}

std::int64_t DocumentRepositoryFs::createRecord(const std::optional<std::string>& filename,
                                                domain::DocumentStatus initialStatus) {
    if (initialStatus == domain::DocumentStatus::Success) {
        throw domain::InvalidTransitionError("A record cannot be created in SUCCESS");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    domain::DocumentRecord record;
    record.id = m_nextId;
    record.filename = filename;
    record.status = initialStatus;
    record.createdAt = std::chrono::system_clock::now();
    record.updatedAt = record.createdAt;

    // Another process may share the directory: never reuse an id whose file exists.
    while (!m_persistence->createExclusive(recordFilePath(record.id), serialize(record))) {
        ++record.id;
    }
    m_nextId = record.id + 1;
    return record.id;
}

std::optional<domain::DocumentRecord> DocumentRepositoryFs::getRecord(std::int64_t id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return readRecord(id);
}

domain::DocumentRecord DocumentRepositoryFs::updateRecord(std::int64_t id, const domain::RecordUpdate& update) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto record = readRecord(id);
    if (!record) {
        throw domain::RecordNotFoundError(id);
    }

    record->apply(update);
    writeRecord(*record);
    return *record;
}

std::vector<domain::DocumentRecord> DocumentRepositoryFs::listRecords(std::size_t offset, std::size_t limit) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<domain::DocumentRecord> records;
    auto ids = storedIds();
    if (offset >= ids.size()) return records;

    std::size_t end = std::min(ids.size(), offset + std::min(limit, ids.size() - offset));
    for (std::size_t i = offset; i < end; ++i) {
        if (auto record = readRecord(ids[i])) {
            records.push_back(std::move(*record));
        }
    }
    return records;
}

} // namespace findoc::infrastructure
