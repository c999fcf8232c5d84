// Copyright 2025 Strata Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <spdlog/spdlog.h>
#include <strata/migration/migration_observer.h>

namespace strata::migration {

void LoggingMigrationObserver::onEvent(const MigrationEvent& event) {
    const char* prefix = event.dryRun ? "[dry-run] " : "";

    switch (event.type) {
        case MigrationEventType::Statement:
            spdlog::info("{}  {}", prefix, event.detail);
            break;
        case MigrationEventType::Failed:
            spdlog::error("{}migration '{}' failed: {}", prefix, event.name, event.detail);
            break;
        case MigrationEventType::Applying:
        case MigrationEventType::RollingBack:
            spdlog::debug("{}{}: {}", prefix, migrationEventTypeToString(event.type), event.name);
            break;
        default:
            spdlog::info("{}{}: {}", prefix, migrationEventTypeToString(event.type), event.name);
            break;
    }
}

} // namespace strata::migration
