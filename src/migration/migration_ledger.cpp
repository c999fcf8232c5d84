// Copyright 2025 Strata Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <array>
#include <strata/crypto/hasher.h>
#include <strata/migration/migration_ledger.h>

namespace strata::migration {

namespace {

const std::string kMigrationSchema = R"(define
attribute migration-hash, value string;
attribute migration-summary, value string;
attribute migration-applied-at, value datetime;
entity migration-record,
    owns migration-hash @key,
    owns migration-summary,
    owns migration-applied-at;)";

const std::string kSeqMigrationSchema = R"(define
attribute seq-migration-name, value string;
attribute seq-migration-applied-at, value datetime;
attribute seq-migration-checksum, value string;
entity seq-migration-record,
    owns seq-migration-name @key,
    owns seq-migration-applied-at,
    owns seq-migration-checksum;)";

constexpr std::array<std::string_view, 8> kLedgerTypes = {
    kMigrationRecordType,       kMigrationHashAttr,        kMigrationSummaryAttr,
    kMigrationAppliedAtAttr,    kSeqMigrationRecordType,   kSeqMigrationNameAttr,
    kSeqMigrationAppliedAtAttr, kSeqMigrationChecksumAttr};

std::string textField(const store::Row& row, std::string_view column) {
    const auto* value = store::findField(row, column);
    if (!value) {
        return {};
    }
    return value->asText().value_or("");
}

TimePoint timeField(const store::Row& row, std::string_view column) {
    const auto* value = store::findField(row, column);
    if (!value) {
        return TimePoint{};
    }
    return value->toTimestamp().value_or(TimePoint{});
}

// reduce $count = count($m) yields one row with an integer "count" column
int64_t countField(const store::Rows& rows) {
    if (rows.empty()) {
        return 0;
    }
    const auto* value = store::findField(rows.front(), "count");
    if (!value) {
        return 0;
    }
    if (auto n = value->asInteger()) {
        return *n;
    }
    if (auto d = value->asDouble()) {
        return static_cast<int64_t>(*d);
    }
    return 0;
}

std::string nowLiteral() {
    return store::formatDatetime(std::chrono::system_clock::now());
}

} // namespace

bool isLedgerType(std::string_view typeName) {
    return std::find(kLedgerTypes.begin(), kLedgerTypes.end(), typeName) != kLedgerTypes.end();
}

std::string hashStatements(const std::vector<std::string>& statements) {
    crypto::SHA256Hasher hasher;
    for (const auto& statement : statements) {
        hasher.update(std::string_view(statement));
        hasher.update(std::string_view("\n"));
    }
    return hasher.finalize();
}

// MigrationLedger implementation
const std::string& MigrationLedger::schemaDefinition() {
    return kMigrationSchema;
}

Result<void> MigrationLedger::ensureSchema(std::stop_token stop) {
    if (auto result = db_.executeSchema(kMigrationSchema, stop); !result) {
        return wrapError("migration ledger: ensure schema", result.error());
    }
    return {};
}

Result<std::vector<MigrationRecord>> MigrationLedger::applied(std::stop_token stop) {
    const std::string query = fmt::format(R"(match
$m isa {};
fetch {{
  "hash": $m.{},
  "summary": $m.{},
  "applied-at": $m.{}
}};)",
                                          kMigrationRecordType, kMigrationHashAttr,
                                          kMigrationSummaryAttr, kMigrationAppliedAtAttr);

    auto rows = db_.executeRead(query, stop);
    if (!rows) {
        return wrapError("migration ledger: query applied", rows.error());
    }

    std::vector<MigrationRecord> records;
    records.reserve(rows.value().size());
    for (const auto& row : rows.value()) {
        records.push_back(MigrationRecord{textField(row, "hash"), textField(row, "summary"),
                                          timeField(row, "applied-at")});
    }

    std::stable_sort(records.begin(), records.end(),
                     [](const MigrationRecord& a, const MigrationRecord& b) {
                         return a.appliedAt < b.appliedAt;
                     });
    return records;
}

Result<bool> MigrationLedger::isApplied(const std::string& hash, std::stop_token stop) {
    const std::string query = fmt::format("match\n$m isa {}, has {} {};\nreduce $count = count($m);",
                                          kMigrationRecordType, kMigrationHashAttr,
                                          store::quoteString(hash));

    auto rows = db_.executeRead(query, stop);
    if (!rows) {
        return wrapError("migration ledger: check applied", rows.error());
    }
    return countField(rows.value()) > 0;
}

Result<void> MigrationLedger::record(const std::string& hash, const std::string& summary,
                                     std::stop_token stop) {
    const std::string query =
        fmt::format("insert\n$m isa {},\nhas {} {},\nhas {} {},\nhas {} {};", kMigrationRecordType,
                    kMigrationHashAttr, store::quoteString(hash), kMigrationSummaryAttr,
                    store::quoteString(summary), kMigrationAppliedAtAttr, nowLiteral());

    if (auto result = db_.executeWrite(query, stop); !result) {
        return wrapError("migration ledger: record", result.error());
    }
    spdlog::debug("Recorded migration {}", hash);
    return {};
}

// SequenceLedger implementation
const std::string& SequenceLedger::schemaDefinition() {
    return kSeqMigrationSchema;
}

Result<void> SequenceLedger::ensureSchema(std::stop_token stop) {
    if (auto result = db_.executeSchema(kSeqMigrationSchema, stop); !result) {
        return wrapError("seq migration ledger: ensure schema", result.error());
    }
    return {};
}

Result<std::map<std::string, SequenceRecord>> SequenceLedger::applied(std::stop_token stop) {
    const std::string query = fmt::format(R"(match
$m isa {};
fetch {{
  "name": $m.{},
  "applied-at": $m.{},
  "checksum": $m.{}
}};)",
                                          kSeqMigrationRecordType, kSeqMigrationNameAttr,
                                          kSeqMigrationAppliedAtAttr, kSeqMigrationChecksumAttr);

    auto rows = db_.executeRead(query, stop);
    if (!rows) {
        return wrapError("seq migration ledger: query applied", rows.error());
    }

    std::map<std::string, SequenceRecord> applied;
    for (const auto& row : rows.value()) {
        auto name = textField(row, "name");
        if (name.empty()) {
            spdlog::warn("Ignoring sequential migration record without a name");
            continue;
        }
        SequenceRecord record{name, timeField(row, "applied-at"), textField(row, "checksum")};
        applied.emplace(std::move(name), std::move(record));
    }
    return applied;
}

Result<void> SequenceLedger::record(const std::string& name, const std::string& checksum,
                                    std::stop_token stop) {
    std::string checksumClause;
    if (!checksum.empty()) {
        checksumClause =
            fmt::format(",\nhas {} {}", kSeqMigrationChecksumAttr, store::quoteString(checksum));
    }
    const std::string query =
        fmt::format("insert\n$m isa {},\nhas {} {},\nhas {} {}{};", kSeqMigrationRecordType,
                    kSeqMigrationNameAttr, store::quoteString(name), kSeqMigrationAppliedAtAttr,
                    nowLiteral(), checksumClause);

    if (auto result = db_.executeWrite(query, stop); !result) {
        return wrapError(fmt::format("seq migration ledger: record '{}'", name), result.error());
    }
    return {};
}

Result<void> SequenceLedger::remove(const std::string& name, std::stop_token stop) {
    const std::string query =
        fmt::format("match\n$m isa {}, has {} {};\ndelete $m;", kSeqMigrationRecordType,
                    kSeqMigrationNameAttr, store::quoteString(name));

    if (auto result = db_.executeWrite(query, stop); !result) {
        return wrapError(fmt::format("seq migration ledger: delete '{}'", name), result.error());
    }
    return {};
}

} // namespace strata::migration
