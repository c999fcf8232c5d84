#pragma once

#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>
#include <strata/core/types.h>
#include <strata/migration/migration_ledger.h>
#include <strata/migration/migration_observer.h>
#include <strata/migration/sequential_migration.h>
#include <strata/store/database.h>

namespace strata::migration {

/**
 * @brief Options for run() and stamp()
 */
struct RunOptions {
    bool dryRun = false;                   ///< Report pending migrations without executing or recording
    std::string target;                    ///< Stop after this migration (empty = all)
    IMigrationObserver* observer = nullptr; ///< Not owned; may be null
};

/**
 * @brief Result of an operation that can stop part way
 *
 * names lists what completed (or, in a dry run, what would run) even when
 * status holds an error.
 */
struct RunOutcome {
    std::vector<std::string> names;
    Result<void> status;
    std::string failedMigration; ///< Set when a specific migration failed

    [[nodiscard]] bool ok() const { return status.has_value(); }
};

/**
 * @brief Applied state of one provided migration
 */
struct MigrationStatus {
    std::string name;
    bool applied = false;
    std::optional<TimePoint> appliedAt;

    /**
     * @brief appliedAt as "YYYY-MM-DDTHH:MM:SSZ", empty when unknown
     */
    [[nodiscard]] std::string appliedAtText() const;
};

/**
 * @brief Applies an ordered set of named migrations, tracking them in the store
 *
 * Migrations are ordered by name. Recorded checksums are verified before anything
 * runs; apply stops at the first failure and never rolls back automatically. The
 * runner is not internally synchronized.
 */
class SequentialMigrationRunner {
public:
    explicit SequentialMigrationRunner(store::Database& db);

    /**
     * @brief Register a migration
     */
    void registerMigration(SequentialMigration migration);

    /**
     * @brief Register multiple migrations
     */
    void registerMigrations(std::vector<SequentialMigration> migrations);

    [[nodiscard]] const std::vector<SequentialMigration>& migrations() const { return migrations_; }

    /**
     * @brief Validate the registered migrations without touching the database
     */
    [[nodiscard]] std::vector<ValidationIssue> validate() const;

    /**
     * @brief Apply pending migrations up to options.target
     */
    RunOutcome run(const RunOptions& options = {}, std::stop_token stop = {});

    /**
     * @brief Record pending migrations as applied without running them
     */
    RunOutcome stamp(const RunOptions& options = {}, std::stop_token stop = {});

    /**
     * @brief Applied state of every registered migration, in name order
     */
    Result<std::vector<MigrationStatus>> status(std::stop_token stop = {});

    /**
     * @brief Roll back the @p steps most recently applied migrations (by name)
     */
    RunOutcome rollback(int steps, IMigrationObserver* observer = nullptr,
                        std::stop_token stop = {});

private:
    store::Database& db_;
    SequenceLedger ledger_;
    std::vector<SequentialMigration> migrations_;

    enum class Mode { Apply, Stamp };

    RunOutcome execute(Mode mode, const RunOptions& options, std::stop_token stop);

    std::vector<const SequentialMigration*> sortedMigrations() const;

    /**
     * @brief Ensure the ledger schema and read applied records
     */
    Result<std::map<std::string, SequenceRecord>> loadApplied(std::string_view phase,
                                                              std::stop_token stop);
};

} // namespace strata::migration
