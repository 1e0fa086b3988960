/**
 * @file FinDocApp.hpp
 * @brief Command-line application for findoc.
 */

#pragma once

#include <string>
#include <vector>

#include "application/AppServices.hpp"

namespace findoc::app {

/**
 * @class FinDocApp
 * @brief Parses the command line, wires the services and runs one command.
 *
 * Commands: upload FILE..., list [SKIP [LIMIT]], show ID, extract FILE.
 * A leading "--root DIR" selects the project root (default: current directory).
 */
class FinDocApp {
public:
    explicit FinDocApp(std::vector<std::string> args);

    /**
     * @brief Runs the requested command.
     * @return 0 on success, 1 on a runtime error, 2 on a usage error.
     */
    int Run();

    static constexpr int kExitOk = 0;
    static constexpr int kExitError = 1;
    static constexpr int kExitUsage = 2;

private:
    /**
     * @brief Loads configuration and builds the service graph (composition root).
     * @return True if initialization succeeded.
     */
    bool Init();

    /**
     * @brief Drains background work and releases services.
     */
    void Shutdown();

    bool ParseArgs();
    void PrintUsage() const;

    int RunUpload();
    int RunList();
    int RunShow();
    int RunExtract();

    std::vector<std::string> m_args;
    std::string m_projectRoot;
    std::string m_command;
    std::vector<std::string> m_commandArgs;

    application::AppServices m_services;
    bool m_initialized = false;
};

} // namespace findoc::app
