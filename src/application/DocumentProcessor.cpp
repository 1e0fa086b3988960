/**
 * @file DocumentProcessor.cpp
 * @brief Implementation of DocumentProcessor.
 */

#include "application/DocumentProcessor.hpp"
#include "domain/FieldExtractor.hpp"
#include "infrastructure/TextDecoder.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace findoc::application {

namespace {

std::string ReadAllBytes(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open " + path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("Read error on " + path);
    }
    return buffer.str();
}

} // namespace

DocumentProcessor::DocumentProcessor(std::shared_ptr<domain::DocumentRepository> repository)
    : m_repository(std::move(repository)) {}

void DocumentProcessor::markFailed(std::int64_t documentId) {
    m_repository->updateRecord(documentId, domain::RecordUpdate::Failed());
}

domain::ProcessingOutcome DocumentProcessor::process(std::int64_t documentId, const std::string& filePath) {
    domain::ProcessingOutcome outcome;
    outcome.documentId = documentId;

    auto record = m_repository->getRecord(documentId);
    if (!record) {
        std::cerr << "[DocumentProcessor] Document " << documentId << " not found" << std::endl;
        outcome.kind = domain::OutcomeKind::RecordNotFound;
        return outcome;
    }
    if (domain::IsTerminal(record->status)) {
        std::cerr << "[DocumentProcessor] Document " << documentId << " is already "
                  << domain::StatusToString(record->status) << ", skipping" << std::endl;
        outcome.kind = domain::OutcomeKind::AlreadyTerminal;
        return outcome;
    }

    std::error_code ec;
    if (!fs::exists(filePath, ec)) {
        std::cerr << "[DocumentProcessor] File not found for document " << documentId << ": " << filePath << std::endl;
        markFailed(documentId);
        outcome.kind = domain::OutcomeKind::FileNotFound;
        return outcome;
    }

    try {
        auto decoded = infrastructure::TextDecoder::DecodeUtf8(ReadAllBytes(filePath));
        if (decoded.usedFallback) {
            std::cerr << "[DocumentProcessor] Document " << documentId << " is not valid UTF-8, replaced "
                      << decoded.replacements << " invalid sequence(s)" << std::endl;
        }
        if (decoded.text.empty()) {
            throw std::runtime_error("Document " + std::to_string(documentId) + " has no content: " + filePath);
        }

        domain::ParsedFields fields = domain::FieldExtractor::Extract(decoded.text);
        m_repository->updateRecord(documentId, domain::RecordUpdate::Succeeded(decoded.text, fields));

        outcome.kind = domain::OutcomeKind::Succeeded;
        outcome.fields = std::move(fields);
        return outcome;
    } catch (const std::exception& e) {
        std::cerr << "[DocumentProcessor] Processing failed for document " << documentId << ": " << e.what() << std::endl;
        try {
            markFailed(documentId);
        } catch (const std::exception& markError) {
            std::cerr << "[DocumentProcessor] Could not mark document " << documentId
                      << " FAILED: " << markError.what() << std::endl;
        }
        throw;
    }
}

} // namespace findoc::application
