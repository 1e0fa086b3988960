/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace findoc::infrastructure {

namespace fs = std::filesystem;

namespace {

std::string Resolve(const fs::path& root, const std::string& value) {
    fs::path p(value);
    if (p.is_relative()) p = root / p;
    return p.lexically_normal().string();
}

const char* EnvValue(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

std::size_t ClampWorkers(long long requested) {
    return requested < 1 ? 1 : static_cast<std::size_t>(requested);
}

} // namespace

AppConfig ConfigLoader::Load(const std::string& projectRoot) {
    fs::path root(projectRoot);
    AppConfig config;
    config.storagePath = Resolve(root, "data/uploads");
    config.recordsPath = Resolve(root, "data/records");
    config.jobsPath = Resolve(root, "data/jobs");

    fs::path configPath = root / "settings.json";
    if (fs::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            nlohmann::json j;
            f >> j;

            AppConfig fromFile = config;
            if (j.contains("storage_path")) fromFile.storagePath = Resolve(root, j["storage_path"].get<std::string>());
            if (j.contains("records_path")) fromFile.recordsPath = Resolve(root, j["records_path"].get<std::string>());
            if (j.contains("jobs_path")) fromFile.jobsPath = Resolve(root, j["jobs_path"].get<std::string>());
            if (j.contains("worker_count")) fromFile.workerCount = ClampWorkers(j["worker_count"].get<long long>());
            config = fromFile;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
        }
    }

    if (const char* v = EnvValue("FINDOC_STORAGE_PATH")) config.storagePath = Resolve(root, v);
    if (const char* v = EnvValue("FINDOC_RECORDS_PATH")) config.recordsPath = Resolve(root, v);
    if (const char* v = EnvValue("FINDOC_JOBS_PATH")) config.jobsPath = Resolve(root, v);
    if (const char* v = EnvValue("FINDOC_WORKERS")) {
        try {
            config.workerCount = ClampWorkers(std::stoll(v));
        } catch (const std::exception&) {
            std::cerr << "[ConfigLoader] Ignoring invalid FINDOC_WORKERS: " << v << std::endl;
        }
    }

    return config;
}

} // namespace findoc::infrastructure
