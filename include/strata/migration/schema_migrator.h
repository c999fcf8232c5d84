#pragma once

#include <stop_token>
#include <string>
#include <string_view>
#include <vector>
#include <strata/core/types.h>
#include <strata/migration/migration_ledger.h>
#include <strata/schema/schema_differ.h>
#include <strata/schema/schema_model.h>
#include <strata/schema/schema_parser.h>
#include <strata/store/database.h>

namespace strata::migration {

/**
 * @brief Result of a one-shot migration
 *
 * The diff is reported even when status holds an error, so callers can show what
 * was attempted.
 */
struct MigrateOutcome {
    schema::SchemaDiff diff;
    Result<void> status;
    bool alreadyApplied = false; ///< The generated change set was found in the ledger
    std::vector<std::string> executed; ///< Statements that ran successfully

    [[nodiscard]] bool ok() const { return status.has_value(); }
};

struct MigrateOptions {
    /// Return before any ledger I/O when the live schema already matches
    bool skipIfUpToDate = false;
};

/**
 * @brief Brings the live schema up to the desired one with additive statements
 *
 * The desired schema comes from the provider; the live schema is fetched from
 * the database and turned into a model by the introspector. Types belonging to
 * the migration ledgers are excluded from the live model.
 */
class SchemaMigrator {
public:
    SchemaMigrator(store::Database& db, const schema::ISchemaProvider& provider,
                   const schema::ISchemaIntrospector& introspector);

    /**
     * @brief Diff of the live schema against the desired one, nothing applied
     */
    Result<schema::SchemaDiff> diff(std::stop_token stop = {});

    /**
     * @brief Diff, then apply and record the change set unless already recorded
     *
     * A failure part way leaves the change set unrecorded so a retry attempts the
     * same statements again.
     */
    MigrateOutcome migrate(const MigrateOptions& options = {}, std::stop_token stop = {});

    /**
     * @brief Like migrate() with caller-supplied live schema text
     */
    MigrateOutcome migrateFromSchema(std::string_view currentSchema,
                                     const MigrateOptions& options = {},
                                     std::stop_token stop = {});

    /**
     * @brief Diff and apply without consulting or writing the ledger
     */
    MigrateOutcome migrateUntracked(std::stop_token stop = {});

    /**
     * @brief Apply the whole desired schema as one define block to an empty database
     */
    Result<void> migrateFromEmpty(std::stop_token stop = {});

private:
    store::Database& db_;
    const schema::ISchemaProvider& provider_;
    const schema::ISchemaIntrospector& introspector_;
    MigrationLedger ledger_;

    Result<schema::SchemaDiff> diffAgainst(std::string_view currentSchema);
    Result<std::string> fetchSchema(std::stop_token stop);
    MigrateOutcome apply(schema::SchemaDiff diff, bool tracked, std::stop_token stop);
};

/**
 * @brief Drop the ledgers' own types from an introspected model
 */
schema::SchemaModel withoutLedgerTypes(schema::SchemaModel model);

} // namespace strata::migration
