/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/DocumentIntakeService.hpp"
#include "application/DocumentProcessor.hpp"
#include "application/DocumentQueryService.hpp"
#include "application/WorkDispatcher.hpp"
#include "domain/DocumentRepository.hpp"
#include "infrastructure/JobResultStore.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace findoc::application {

/**
 * Members are declared in construction order; the dispatcher is shut down
 * explicitly before the rest is released.
 */
struct AppServices {
    std::shared_ptr<infrastructure::PersistenceService> persistenceService;
    std::shared_ptr<domain::DocumentRepository> repository;
    std::shared_ptr<infrastructure::JobResultStore> jobStore;
    std::shared_ptr<DocumentProcessor> processor;
    std::shared_ptr<WorkDispatcher> dispatcher;
    std::unique_ptr<DocumentIntakeService> intakeService;
    std::unique_ptr<DocumentQueryService> queryService;
};

} // namespace findoc::application
