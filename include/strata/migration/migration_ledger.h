#pragma once

#include <map>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>
#include <strata/core/types.h>
#include <strata/store/database.h>

namespace strata::migration {

// Persisted ledger shapes; their names are part of the on-store format
inline constexpr std::string_view kMigrationRecordType = "migration-record";
inline constexpr std::string_view kMigrationHashAttr = "migration-hash";
inline constexpr std::string_view kMigrationSummaryAttr = "migration-summary";
inline constexpr std::string_view kMigrationAppliedAtAttr = "migration-applied-at";

inline constexpr std::string_view kSeqMigrationRecordType = "seq-migration-record";
inline constexpr std::string_view kSeqMigrationNameAttr = "seq-migration-name";
inline constexpr std::string_view kSeqMigrationAppliedAtAttr = "seq-migration-applied-at";
inline constexpr std::string_view kSeqMigrationChecksumAttr = "seq-migration-checksum";

/**
 * @brief Whether @p typeName belongs to one of the ledgers' own schemas
 */
bool isLedgerType(std::string_view typeName);

/**
 * @brief Content hash of a generated statement list (SHA-256, lowercase hex)
 *
 * Each statement is hashed followed by a newline, so the hash depends on both
 * the statements and their order.
 */
std::string hashStatements(const std::vector<std::string>& statements);

/**
 * @brief Applied generated change set
 */
struct MigrationRecord {
    std::string hash;
    std::string summary;
    TimePoint appliedAt;
};

/**
 * @brief Hash-keyed ledger of applied generated diffs
 *
 * Records live in the target database as migration-record entities; the unique
 * hash key makes an identical change set apply at most once.
 */
class MigrationLedger {
public:
    explicit MigrationLedger(store::Database& db) : db_(db) {}

    /**
     * @brief Define the ledger's own types; safe to call repeatedly
     */
    Result<void> ensureSchema(std::stop_token stop = {});

    /**
     * @brief All records, oldest first
     */
    Result<std::vector<MigrationRecord>> applied(std::stop_token stop = {});

    Result<bool> isApplied(const std::string& hash, std::stop_token stop = {});

    /**
     * @brief Insert a record stamped with the current time
     *
     * A duplicate hash fails the insert and the error is returned.
     */
    Result<void> record(const std::string& hash, const std::string& summary,
                        std::stop_token stop = {});

    static const std::string& schemaDefinition();

private:
    store::Database& db_;
};

/**
 * @brief Applied sequential migration
 */
struct SequenceRecord {
    std::string name;
    TimePoint appliedAt;
    std::string checksum; ///< Empty when the migration had no statement lists
};

/**
 * @brief Name-keyed ledger of applied sequential migrations
 */
class SequenceLedger {
public:
    explicit SequenceLedger(store::Database& db) : db_(db) {}

    Result<void> ensureSchema(std::stop_token stop = {});

    /**
     * @brief Applied migrations keyed by name
     */
    Result<std::map<std::string, SequenceRecord>> applied(std::stop_token stop = {});

    /**
     * @brief Insert a record for @p name; the checksum is omitted when empty
     */
    Result<void> record(const std::string& name, const std::string& checksum,
                        std::stop_token stop = {});

    /**
     * @brief Delete the record for @p name
     */
    Result<void> remove(const std::string& name, std::stop_token stop = {});

    static const std::string& schemaDefinition();

private:
    store::Database& db_;
};

} // namespace strata::migration
