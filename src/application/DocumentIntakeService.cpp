/**
 * @file DocumentIntakeService.cpp
 * @brief Implementation of DocumentIntakeService.
 */

#include "application/DocumentIntakeService.hpp"
#include "infrastructure/IdGenerator.hpp"
#include "infrastructure/TextDecoder.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace findoc::application {

namespace {

std::string SafeBasename(const std::string& filename) {
    std::string name = fs::path(filename).filename().string();
    if (name == "." || name == "..") return {};
    return name;
}

void RemoveBlob(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        std::cerr << "[DocumentIntakeService] Could not remove " << path << ": " << ec.message() << std::endl;
    }
}

} // namespace

DocumentIntakeService::DocumentIntakeService(std::string storagePath,
                                             std::shared_ptr<domain::DocumentRepository> repository,
                                             std::shared_ptr<WorkDispatcher> dispatcher,
                                             std::shared_ptr<infrastructure::PersistenceService> persistence)
    : m_storagePath(std::move(storagePath)),
      m_repository(std::move(repository)),
      m_dispatcher(std::move(dispatcher)),
      m_persistence(std::move(persistence)) {
    if (!fs::exists(m_storagePath)) {
        fs::create_directories(m_storagePath);
    }
}

DocumentIntakeService::UploadReceipt DocumentIntakeService::upload(const std::string& filename, const std::string& bytes) {
    const std::string fileId = infrastructure::IdGenerator::NewUuid();
    std::string name = SafeBasename(filename);
    if (name.empty()) {
        name = "upload-" + fileId;
    }
    auto decodedName = infrastructure::TextDecoder::DecodeUtf8(name);
    if (decodedName.usedFallback) {
        std::cerr << "[DocumentIntakeService] Upload name is not valid UTF-8, replaced "
                  << decodedName.replacements << " invalid sequence(s)" << std::endl;
        name = decodedName.text;
    }

    const std::string savedPath = (fs::path(m_storagePath) / (fileId + "-" + name)).string();
    m_persistence->writeAtomic(savedPath, bytes);

    UploadReceipt receipt;
    try {
        receipt.documentId = m_repository->createRecord(name);
    } catch (const domain::PersistenceError& e) {
        std::cerr << "[DocumentIntakeService] Record creation failed for " << name << ": " << e.what() << std::endl;
        RemoveBlob(savedPath);
        throw;
    } catch (const std::exception& e) {
        std::cerr << "[DocumentIntakeService] Record creation failed for " << name << ": " << e.what() << std::endl;
        RemoveBlob(savedPath);
        throw domain::PersistenceError("Cannot create record for " + name + ": " + e.what());
    }

    try {
        receipt.jobId = m_dispatcher->submit(receipt.documentId, savedPath, [this, &receipt](const std::string& jobId) {
            m_repository->updateRecord(receipt.documentId, domain::RecordUpdate::AssignJob(jobId));
        });
    } catch (const std::exception& e) {
        std::cerr << "[DocumentIntakeService] Dispatch failed for document " << receipt.documentId << ": " << e.what() << std::endl;
        try {
            m_repository->updateRecord(receipt.documentId, domain::RecordUpdate::Failed());
        } catch (const std::exception& markError) {
            std::cerr << "[DocumentIntakeService] Could not mark document " << receipt.documentId
                      << " FAILED: " << markError.what() << std::endl;
        }
        throw;
    }

    std::cout << "[DocumentIntakeService] Document " << receipt.documentId << " (" << name << ") queued as job "
              << receipt.jobId << std::endl;
    return receipt;
}

DocumentIntakeService::UploadReceipt DocumentIntakeService::uploadFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open " + path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return upload(fs::path(path).filename().string(), buffer.str());
}

} // namespace findoc::application
