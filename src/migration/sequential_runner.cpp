// Copyright 2025 Strata Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <strata/migration/sequential_runner.h>

namespace strata::migration {

namespace {

void notify(IMigrationObserver* observer, MigrationEventType type, const std::string& name,
            std::string detail = {}, bool dryRun = false) {
    if (observer) {
        observer->onEvent(MigrationEvent{type, name, std::move(detail), dryRun});
    }
}

RunOutcome failed(std::vector<std::string> names, Error error, std::string migration = {}) {
    RunOutcome outcome;
    outcome.names = std::move(names);
    outcome.status = std::move(error);
    outcome.failedMigration = std::move(migration);
    return outcome;
}

} // namespace

std::string MigrationStatus::appliedAtText() const {
    if (!appliedAt) {
        return {};
    }
    return store::formatTimestampUtc(*appliedAt);
}

SequentialMigrationRunner::SequentialMigrationRunner(store::Database& db) : db_(db), ledger_(db) {}

void SequentialMigrationRunner::registerMigration(SequentialMigration migration) {
    migrations_.push_back(std::move(migration));
}

void SequentialMigrationRunner::registerMigrations(std::vector<SequentialMigration> migrations) {
    for (auto& migration : migrations) {
        registerMigration(std::move(migration));
    }
}

std::vector<ValidationIssue> SequentialMigrationRunner::validate() const {
    return validateMigrations(migrations_);
}

std::vector<const SequentialMigration*> SequentialMigrationRunner::sortedMigrations() const {
    std::vector<const SequentialMigration*> sorted;
    sorted.reserve(migrations_.size());
    for (const auto& m : migrations_) {
        sorted.push_back(&m);
    }
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const SequentialMigration* a, const SequentialMigration* b) {
                         return a->name < b->name;
                     });
    return sorted;
}

Result<std::map<std::string, SequenceRecord>>
SequentialMigrationRunner::loadApplied(std::string_view phase, std::stop_token stop) {
    if (auto result = ledger_.ensureSchema(stop); !result) {
        return wrapError(fmt::format("{}: ensure state schema", phase), result.error());
    }
    auto applied = ledger_.applied(stop);
    if (!applied) {
        return wrapError(fmt::format("{}: query applied", phase), applied.error());
    }
    return applied;
}

RunOutcome SequentialMigrationRunner::run(const RunOptions& options, std::stop_token stop) {
    return execute(Mode::Apply, options, stop);
}

RunOutcome SequentialMigrationRunner::stamp(const RunOptions& options, std::stop_token stop) {
    return execute(Mode::Stamp, options, stop);
}

RunOutcome SequentialMigrationRunner::execute(Mode mode, const RunOptions& options,
                                              std::stop_token stop) {
    const std::string_view phase = mode == Mode::Apply ? "seq migration" : "seq stamp";

    // Validate
    auto issues = validate();
    if (hasValidationErrors(issues)) {
        return failed({}, Error{ErrorCode::ValidationError,
                                fmt::format("{} validation failed: {}", phase,
                                            formatValidationErrors(issues))});
    }
    for (const auto& issue : issues) {
        spdlog::warn("{}: {}", phase, issue.message);
    }

    auto sorted = sortedMigrations();
    if (!options.target.empty() &&
        std::none_of(sorted.begin(), sorted.end(), [&](const SequentialMigration* m) {
            return m->name == options.target;
        })) {
        return failed({}, Error{ErrorCode::ValidationError,
                                fmt::format("{}: unknown target migration '{}'", phase,
                                            options.target)});
    }

    auto appliedResult = loadApplied(phase, stop);
    if (!appliedResult) {
        return failed({}, appliedResult.error());
    }
    const auto& applied = appliedResult.value();

    // Verify checksums of already applied migrations before anything runs
    for (const auto* m : sorted) {
        auto it = applied.find(m->name);
        if (it == applied.end() || it->second.checksum.empty()) {
            continue;
        }
        auto current = migrationChecksum(*m);
        if (!current.empty() && current != it->second.checksum) {
            spdlog::warn("{} '{}': checksum mismatch", phase, m->name);
            return failed({},
                          Error{ErrorCode::ChecksumMismatch,
                                fmt::format("{} '{}': checksum mismatch (recorded {}, current {})",
                                            phase, m->name, it->second.checksum, current)},
                          m->name);
        }
    }

    // Determine pending, up to and including the target
    std::vector<const SequentialMigration*> pending;
    for (const auto* m : sorted) {
        if (!applied.contains(m->name)) {
            pending.push_back(m);
        }
        if (!options.target.empty() && m->name == options.target) {
            break;
        }
    }

    RunOutcome outcome;
    if (options.dryRun) {
        // A dry run with nobody listening still shows its plan in the log
        LoggingMigrationObserver fallback;
        IMigrationObserver* observer = options.observer ? options.observer : &fallback;
        for (const auto* m : pending) {
            outcome.names.push_back(m->name);
            notify(observer, MigrationEventType::Pending, m->name, {}, true);
            if (m->statements) {
                for (const auto& statement : m->statements->up) {
                    notify(observer, MigrationEventType::Statement, m->name, statement, true);
                }
            }
        }
        return outcome;
    }

    for (const auto* m : pending) {
        if (stop.stop_requested()) {
            outcome.status = Error{ErrorCode::OperationCancelled,
                                   fmt::format("{}: cancelled before '{}'", phase, m->name)};
            outcome.failedMigration = m->name;
            return outcome;
        }

        if (mode == Mode::Apply) {
            notify(options.observer, MigrationEventType::Applying, m->name);
            if (auto result = m->up(db_, stop); !result) {
                notify(options.observer, MigrationEventType::Failed, m->name,
                       result.error().message);
                outcome.status =
                    wrapError(fmt::format("{} '{}'", phase, m->name), result.error());
                outcome.failedMigration = m->name;
                return outcome;
            }
        }

        if (auto result = ledger_.record(m->name, migrationChecksum(*m), stop); !result) {
            notify(options.observer, MigrationEventType::Failed, m->name, result.error().message);
            outcome.status = wrapError(fmt::format("{}: record '{}'", phase, m->name),
                                       result.error());
            outcome.failedMigration = m->name;
            return outcome;
        }

        outcome.names.push_back(m->name);
        notify(options.observer,
               mode == Mode::Apply ? MigrationEventType::Applied : MigrationEventType::Stamped,
               m->name);
        spdlog::debug("{}: {} '{}'", phase, mode == Mode::Apply ? "applied" : "stamped", m->name);
    }

    if (!outcome.names.empty()) {
        spdlog::info("{}: {} {} migration(s)", phase, mode == Mode::Apply ? "applied" : "stamped",
                     outcome.names.size());
    }
    return outcome;
}

Result<std::vector<MigrationStatus>> SequentialMigrationRunner::status(std::stop_token stop) {
    auto appliedResult = loadApplied("seq migration status", stop);
    if (!appliedResult) {
        return appliedResult.error();
    }
    const auto& applied = appliedResult.value();

    std::vector<MigrationStatus> statuses;
    for (const auto* m : sortedMigrations()) {
        MigrationStatus status{m->name, false, std::nullopt};
        if (auto it = applied.find(m->name); it != applied.end()) {
            status.applied = true;
            if (it->second.appliedAt != TimePoint{}) {
                status.appliedAt = it->second.appliedAt;
            }
        }
        statuses.push_back(std::move(status));
    }
    return statuses;
}

RunOutcome SequentialMigrationRunner::rollback(int steps, IMigrationObserver* observer,
                                               std::stop_token stop) {
    RunOutcome outcome;
    if (steps <= 0) {
        return outcome;
    }

    auto appliedResult = loadApplied("seq rollback", stop);
    if (!appliedResult) {
        return failed({}, appliedResult.error());
    }

    // Most recent first, by name
    std::vector<std::string> appliedNames;
    for (const auto& entry : appliedResult.value()) {
        appliedNames.push_back(entry.first);
    }
    std::sort(appliedNames.rbegin(), appliedNames.rend());
    appliedNames.resize(std::min(appliedNames.size(), static_cast<size_t>(steps)));

    for (const auto& name : appliedNames) {
        auto it = std::find_if(migrations_.begin(), migrations_.end(),
                               [&](const SequentialMigration& m) { return m.name == name; });
        if (it == migrations_.end()) {
            outcome.status = Error{ErrorCode::NotFound,
                                   fmt::format("seq rollback: migration '{}' not found in "
                                               "provided migrations",
                                               name)};
            outcome.failedMigration = name;
            return outcome;
        }
        if (!it->down) {
            outcome.status =
                Error{ErrorCode::InvalidState,
                      fmt::format("seq rollback: migration '{}' has no down action", name)};
            outcome.failedMigration = name;
            return outcome;
        }
        if (stop.stop_requested()) {
            outcome.status = Error{ErrorCode::OperationCancelled,
                                   fmt::format("seq rollback: cancelled before '{}'", name)};
            outcome.failedMigration = name;
            return outcome;
        }

        notify(observer, MigrationEventType::RollingBack, name);
        if (auto result = it->down(db_, stop); !result) {
            notify(observer, MigrationEventType::Failed, name, result.error().message);
            outcome.status = wrapError(fmt::format("seq rollback '{}'", name), result.error());
            outcome.failedMigration = name;
            return outcome;
        }
        if (auto result = ledger_.remove(name, stop); !result) {
            notify(observer, MigrationEventType::Failed, name, result.error().message);
            outcome.status =
                wrapError(fmt::format("seq rollback: delete record '{}'", name), result.error());
            outcome.failedMigration = name;
            return outcome;
        }

        outcome.names.push_back(name);
        notify(observer, MigrationEventType::RolledBack, name);
        spdlog::debug("seq rollback: rolled back '{}'", name);
    }

    spdlog::info("seq rollback: rolled back {} migration(s)", outcome.names.size());
    return outcome;
}

} // namespace strata::migration
