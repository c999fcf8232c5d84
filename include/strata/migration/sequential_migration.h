#pragma once

#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>
#include <strata/core/types.h>
#include <strata/store/database.h>

namespace strata::migration {

/**
 * @brief Caller-supplied step run against the database
 */
using MigrationAction = std::function<Result<void>(store::Database&, std::stop_token)>;

/**
 * @brief Raw statements behind a statement migration, kept for checksums and dry runs
 */
struct MigrationStatements {
    std::vector<std::string> up;
    std::vector<std::string> down;
};

/**
 * @brief Named migration applied at most once, in name order
 */
struct SequentialMigration {
    std::string name; ///< Sole identity, typically prefixed with a date ("20240101_users")
    MigrationAction up;
    MigrationAction down; ///< Empty when rollback is not supported
    std::optional<MigrationStatements> statements;
};

/**
 * @brief Build a migration from raw statements
 *
 * Each statement runs in its own transaction of the kind inferTransactionType()
 * picks. An empty @p up list leaves the up action unset, which validation rejects;
 * an empty @p down list leaves the migration without rollback.
 */
SequentialMigration makeStatementMigration(std::string name, std::vector<std::string> up,
                                           std::vector<std::string> down = {});

/**
 * @brief SHA-256 over the up statements, "|" and the down statements
 *
 * Empty for migrations without statement lists; those are never verified.
 */
std::string migrationChecksum(const SequentialMigration& migration);

enum class IssueSeverity {
    Error,  ///< Blocks the run
    Warning ///< Reported and corrected automatically
};

struct ValidationIssue {
    std::string name; ///< Migration name, "[index N]" for unnamed ones, empty for list-wide issues
    std::string message;
    IssueSeverity severity;
};

/**
 * @brief Check a migration list without touching the database
 *
 * Empty names, duplicate names and missing up actions are errors; a list that is
 * not sorted by name is a warning.
 */
std::vector<ValidationIssue> validateMigrations(const std::vector<SequentialMigration>& migrations);

bool hasValidationErrors(const std::vector<ValidationIssue>& issues);

/**
 * @brief "name: message" for every error issue, joined with "; "
 */
std::string formatValidationErrors(const std::vector<ValidationIssue>& issues);

} // namespace strata::migration
