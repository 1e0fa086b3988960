/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json).
 *
 * Provides a unified way to resolve storage locations and pool size
 * without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <cstddef>
#include <string>

namespace findoc::infrastructure {

struct AppConfig {
    std::string storagePath;     ///< Uploaded file blobs.
    std::string recordsPath;     ///< Document record store.
    std::string jobsPath;        ///< Job result store.
    std::size_t workerCount = 2;
};

class ConfigLoader {
public:
    /**
     * @brief Resolves the configuration for a project root.
     *
     * Order: built-in defaults under <projectRoot>/data, then settings.json
     * keys (storage_path, records_path, jobs_path, worker_count), then the
     * FINDOC_STORAGE_PATH, FINDOC_RECORDS_PATH, FINDOC_JOBS_PATH and
     * FINDOC_WORKERS environment variables. Relative paths resolve against
     * projectRoot. A broken settings.json is reported and ignored.
     */
    static AppConfig Load(const std::string& projectRoot);
};

} // namespace findoc::infrastructure
