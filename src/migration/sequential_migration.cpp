// Copyright 2025 Strata Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>
#include <memory>
#include <set>
#include <strata/crypto/hasher.h>
#include <strata/migration/sequential_migration.h>

namespace strata::migration {

namespace {

MigrationAction statementAction(std::vector<std::string> statements) {
    auto shared = std::make_shared<const std::vector<std::string>>(std::move(statements));
    return [shared](store::Database& db, std::stop_token stop) -> Result<void> {
        for (const auto& statement : *shared) {
            if (auto result = store::executeStatement(db, statement, stop); !result) {
                return result;
            }
        }
        return {};
    };
}

} // namespace

SequentialMigration makeStatementMigration(std::string name, std::vector<std::string> up,
                                           std::vector<std::string> down) {
    SequentialMigration migration;
    migration.name = std::move(name);

    if (!up.empty() || !down.empty()) {
        migration.statements = MigrationStatements{up, down};
    }
    if (!up.empty()) {
        migration.up = statementAction(std::move(up));
    }
    if (!down.empty()) {
        migration.down = statementAction(std::move(down));
    }
    return migration;
}

std::string migrationChecksum(const SequentialMigration& migration) {
    if (!migration.statements) {
        return {};
    }

    crypto::SHA256Hasher hasher;
    for (const auto& statement : migration.statements->up) {
        hasher.update(std::string_view(statement));
    }
    hasher.update(std::string_view("|"));
    for (const auto& statement : migration.statements->down) {
        hasher.update(std::string_view(statement));
    }
    return hasher.finalize();
}

std::vector<ValidationIssue> validateMigrations(const std::vector<SequentialMigration>& migrations) {
    std::vector<ValidationIssue> issues;
    std::set<std::string> seen;

    for (size_t i = 0; i < migrations.size(); ++i) {
        const auto& m = migrations[i];
        if (m.name.empty()) {
            issues.push_back({fmt::format("[index {}]", i), "migration name is empty",
                              IssueSeverity::Error});
            continue;
        }
        if (!seen.insert(m.name).second) {
            issues.push_back({m.name, "duplicate migration name", IssueSeverity::Error});
        }
        if (!m.up) {
            issues.push_back({m.name, "up action is missing", IssueSeverity::Error});
        }
    }

    const bool sorted = std::is_sorted(
        migrations.begin(), migrations.end(),
        [](const SequentialMigration& a, const SequentialMigration& b) { return a.name < b.name; });
    if (!sorted) {
        issues.push_back({"", "migrations are not in sorted order; they will be sorted automatically",
                          IssueSeverity::Warning});
    }

    return issues;
}

bool hasValidationErrors(const std::vector<ValidationIssue>& issues) {
    return std::any_of(issues.begin(), issues.end(), [](const ValidationIssue& issue) {
        return issue.severity == IssueSeverity::Error;
    });
}

std::string formatValidationErrors(const std::vector<ValidationIssue>& issues) {
    std::vector<std::string> parts;
    for (const auto& issue : issues) {
        if (issue.severity == IssueSeverity::Error) {
            parts.push_back(fmt::format("{}: {}", issue.name.empty() ? "(global)" : issue.name,
                                        issue.message));
        }
    }
    return fmt::format("{}", fmt::join(parts, "; "));
}

} // namespace strata::migration
