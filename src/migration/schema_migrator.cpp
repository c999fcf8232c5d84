// Copyright 2025 Strata Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <strata/migration/schema_migrator.h>

namespace strata::migration {

namespace {

template <typename T> void eraseLedgerNames(std::vector<T>& items) {
    std::erase_if(items, [](const T& item) { return isLedgerType(item.name); });
}

MigrateOutcome failedOutcome(Error error) {
    MigrateOutcome outcome;
    outcome.status = std::move(error);
    return outcome;
}

} // namespace

schema::SchemaModel withoutLedgerTypes(schema::SchemaModel model) {
    eraseLedgerNames(model.attributes);
    eraseLedgerNames(model.entities);
    eraseLedgerNames(model.relations);
    return model;
}

SchemaMigrator::SchemaMigrator(store::Database& db, const schema::ISchemaProvider& provider,
                               const schema::ISchemaIntrospector& introspector)
    : db_(db), provider_(provider), introspector_(introspector), ledger_(db) {}

Result<std::string> SchemaMigrator::fetchSchema(std::stop_token stop) {
    auto text = db_.schema(stop);
    if (!text) {
        return wrapError("migrate", text.error());
    }
    return text;
}

Result<schema::SchemaDiff> SchemaMigrator::diffAgainst(std::string_view currentSchema) {
    auto desired = provider_.desiredSchema();
    if (!desired) {
        return wrapError("migrate: desired schema", desired.error());
    }

    auto current = introspector_.introspect(currentSchema);
    if (!current) {
        return wrapError("migrate: parse current schema", current.error());
    }

    return schema::diffSchemas(desired.value(), withoutLedgerTypes(std::move(current).value()));
}

Result<schema::SchemaDiff> SchemaMigrator::diff(std::stop_token stop) {
    auto text = fetchSchema(stop);
    if (!text) {
        return text.error();
    }
    return diffAgainst(text.value());
}

MigrateOutcome SchemaMigrator::migrate(const MigrateOptions& options, std::stop_token stop) {
    auto text = fetchSchema(stop);
    if (!text) {
        return failedOutcome(text.error());
    }
    return migrateFromSchema(text.value(), options, stop);
}

MigrateOutcome SchemaMigrator::migrateFromSchema(std::string_view currentSchema,
                                                 const MigrateOptions& options,
                                                 std::stop_token stop) {
    auto diffResult = diffAgainst(currentSchema);
    if (!diffResult) {
        return failedOutcome(diffResult.error());
    }

    if (options.skipIfUpToDate && diffResult.value().isEmpty()) {
        spdlog::debug("migrate: schema is up to date, skipping");
        MigrateOutcome outcome;
        outcome.diff = std::move(diffResult).value();
        return outcome;
    }

    if (auto result = ledger_.ensureSchema(stop); !result) {
        MigrateOutcome outcome;
        outcome.diff = std::move(diffResult).value();
        outcome.status = wrapError("migrate: ensure state schema", result.error());
        return outcome;
    }
    return apply(std::move(diffResult).value(), true, stop);
}

MigrateOutcome SchemaMigrator::migrateUntracked(std::stop_token stop) {
    auto text = fetchSchema(stop);
    if (!text) {
        return failedOutcome(text.error());
    }
    auto diffResult = diffAgainst(text.value());
    if (!diffResult) {
        return failedOutcome(diffResult.error());
    }
    return apply(std::move(diffResult).value(), false, stop);
}

MigrateOutcome SchemaMigrator::apply(schema::SchemaDiff diff, bool tracked, std::stop_token stop) {
    MigrateOutcome outcome;
    outcome.diff = std::move(diff);

    for (const auto& name : outcome.diff.removeTypes) {
        spdlog::warn("migrate: type '{}' exists in the database but not in the desired schema",
                     name);
    }
    for (const auto& owns : outcome.diff.removeOwns) {
        spdlog::warn("migrate: '{}' owns '{}' in the database but not in the desired schema",
                     owns.typeName, owns.attribute);
    }
    for (const auto& plays : outcome.diff.removePlays) {
        spdlog::warn("migrate: '{}' plays '{}' in the database but not in the desired schema",
                     plays.typeName, plays.role);
    }

    // Warnings alone generate nothing and record nothing
    if (!outcome.diff.hasAdditions()) {
        spdlog::debug("migrate: schema is up to date");
        return outcome;
    }

    auto statements = outcome.diff.generateMigration();
    std::string hash;
    if (tracked) {
        hash = hashStatements(statements);
        auto applied = ledger_.isApplied(hash, stop);
        if (!applied) {
            outcome.status = wrapError("migrate: check state", applied.error());
            return outcome;
        }
        if (applied.value()) {
            spdlog::debug("migrate: change set {} already applied", hash);
            outcome.alreadyApplied = true;
            return outcome;
        }
    }

    for (const auto& statement : statements) {
        if (auto result = db_.executeSchema(statement, stop); !result) {
            outcome.status =
                wrapError(fmt::format("migrate: execute \"{}\"", statement), result.error());
            return outcome;
        }
        outcome.executed.push_back(statement);
    }

    if (tracked) {
        if (auto result = ledger_.record(hash, outcome.diff.summary(), stop); !result) {
            outcome.status = wrapError("migrate: record state", result.error());
            return outcome;
        }
    }

    spdlog::info("migrate: applied {} statement(s)", outcome.executed.size());
    return outcome;
}

Result<void> SchemaMigrator::migrateFromEmpty(std::stop_token stop) {
    auto desired = provider_.desiredSchema();
    if (!desired) {
        return wrapError("migrate from empty: desired schema", desired.error());
    }

    auto text = schema::renderSchema(desired.value());
    if (text.empty()) {
        return {};
    }
    if (auto result = db_.executeSchema(text, stop); !result) {
        return wrapError("migrate from empty", result.error());
    }
    return {};
}

} // namespace strata::migration
