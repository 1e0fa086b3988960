/**
 * @file FinDocApp.cpp
 * @brief Implementation of the FinDocApp class.
 */
#include "app/FinDocApp.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "domain/FieldExtractor.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/DocumentRepositoryFs.hpp"
#include "infrastructure/JsonMapping.hpp"
#include "infrastructure/TextDecoder.hpp"

namespace findoc::app {

namespace {

bool ParseCount(const std::string& text, std::size_t& out) {
    try {
        std::size_t used = 0;
        long long value = std::stoll(text, &used);
        if (used != text.size() || value < 0) return false;
        out = static_cast<std::size_t>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

FinDocApp::FinDocApp(std::vector<std::string> args) : m_args(std::move(args)) {}

bool FinDocApp::ParseArgs() {
    m_projectRoot = std::filesystem::current_path().string();

    std::size_t i = 0;
    if (i < m_args.size() && m_args[i] == "--root") {
        if (i + 1 >= m_args.size()) return false;
        m_projectRoot = m_args[i + 1];
        i += 2;
    }
    if (i >= m_args.size()) return false;

    m_command = m_args[i++];
    m_commandArgs.assign(m_args.begin() + static_cast<std::ptrdiff_t>(i), m_args.end());

    if (m_command == "upload") return !m_commandArgs.empty();
    if (m_command == "list") return m_commandArgs.size() <= 2;
    if (m_command == "show" || m_command == "extract") return m_commandArgs.size() == 1;
    return false;
}

void FinDocApp::PrintUsage() const {
    std::cerr << "Usage: findoc [--root DIR] <command>\n"
              << "  upload FILE...        queue files for extraction and wait for the results\n"
              << "  list [SKIP [LIMIT]]   list stored documents\n"
              << "  show ID               print one document\n"
              << "  extract FILE          run the field extractor on a file, nothing is stored\n";
}

bool FinDocApp::Init() {
    auto config = infrastructure::ConfigLoader::Load(m_projectRoot);

    // Dependency Injection / Composition Root
    try {
        application::AppServices services;
        services.persistenceService = std::make_shared<infrastructure::PersistenceService>();
        services.repository = std::make_shared<infrastructure::DocumentRepositoryFs>(config.recordsPath, services.persistenceService);
        services.jobStore = std::make_shared<infrastructure::JobResultStore>(config.jobsPath, services.persistenceService);
        services.jobStore->load();
        services.processor = std::make_shared<application::DocumentProcessor>(services.repository);

        auto processor = services.processor;
        services.dispatcher = std::make_shared<application::WorkDispatcher>(
            config.workerCount,
            [processor](std::int64_t documentId, const std::string& filePath) {
                return processor->process(documentId, filePath);
            },
            services.jobStore);

        services.intakeService = std::make_unique<application::DocumentIntakeService>(
            config.storagePath, services.repository, services.dispatcher, services.persistenceService);
        services.queryService = std::make_unique<application::DocumentQueryService>(services.repository, services.dispatcher);

        m_services = std::move(services);
    } catch (const std::exception& e) {
        std::cerr << "[FinDocApp] Initialization failed: " << e.what() << std::endl;
        return false;
    }

    m_initialized = true;
    return true;
}

void FinDocApp::Shutdown() {
    if (!m_initialized) return;

    if (m_services.dispatcher) {
        m_services.dispatcher->shutdown();
    }
    if (m_services.persistenceService) {
        m_services.persistenceService->stop();
    }
    m_services = application::AppServices{};
    m_initialized = false;
}

int FinDocApp::Run() {
    if (!ParseArgs()) {
        PrintUsage();
        return kExitUsage;
    }

    if (m_command == "extract") {
        return RunExtract();
    }

    if (!Init()) {
        Shutdown();
        return kExitError;
    }

    int code = kExitError;
    try {
        if (m_command == "upload") code = RunUpload();
        else if (m_command == "list") code = RunList();
        else if (m_command == "show") code = RunShow();
    } catch (const std::exception& e) {
        std::cerr << "[FinDocApp] " << e.what() << std::endl;
        code = kExitError;
    }

    Shutdown();
    return code;
}

int FinDocApp::RunUpload() {
    std::vector<std::string> jobIds;
    int code = kExitOk;
    for (const auto& path : m_commandArgs) {
        try {
            jobIds.push_back(m_services.intakeService->uploadFile(path).jobId);
        } catch (const std::exception& e) {
            std::cerr << "[FinDocApp] Upload failed for " << path << ": " << e.what() << std::endl;
            code = kExitError;
        }
    }

    m_services.dispatcher->waitIdle();

    for (const auto& jobId : jobIds) {
        auto status = m_services.queryService->getTaskStatus(jobId);
        if (!status) {
            std::cerr << "[FinDocApp] Unknown job " << jobId << std::endl;
            code = kExitError;
            continue;
        }
        if (status->state == domain::JobState::Failure) code = kExitError;
        std::cout << application::ToJson(*status).dump(2) << std::endl;
    }
    return code;
}

int FinDocApp::RunList() {
    std::size_t skip = 0;
    std::size_t limit = application::DocumentQueryService::kDefaultPageSize;
    if ((m_commandArgs.size() >= 1 && !ParseCount(m_commandArgs[0], skip)) ||
        (m_commandArgs.size() >= 2 && !ParseCount(m_commandArgs[1], limit))) {
        PrintUsage();
        return kExitUsage;
    }

    nlohmann::json out = nlohmann::json::array();
    for (const auto& view : m_services.queryService->listDocuments(skip, limit)) {
        out.push_back(application::ToJson(view));
    }
    std::cout << out.dump(2) << std::endl;
    return kExitOk;
}

int FinDocApp::RunShow() {
    std::size_t id = 0;
    if (!ParseCount(m_commandArgs[0], id)) {
        PrintUsage();
        return kExitUsage;
    }

    auto view = m_services.queryService->getDocument(static_cast<std::int64_t>(id));
    if (!view) {
        std::cerr << "Document not found" << std::endl;
        return kExitError;
    }
    std::cout << application::ToJson(*view).dump(2) << std::endl;
    return kExitOk;
}

int FinDocApp::RunExtract() {
    const std::string& path = m_commandArgs[0];
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "[FinDocApp] Could not open " << path << std::endl;
        return kExitError;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();

    auto decoded = infrastructure::TextDecoder::DecodeUtf8(buffer.str());
    nlohmann::json out = domain::FieldExtractor::Extract(decoded.text);
    std::cout << out.dump(2) << std::endl;
    return kExitOk;
}

} // namespace findoc::app
