#include <gtest/gtest.h>

#include <strata/migration/schema_migrator.h>

#include "../../support/memory_store.h"

using namespace strata;
using namespace strata::migration;
using namespace strata::schema;
using strata::test_support::MemoryStore;

namespace {

SchemaModel companySchema() {
    SchemaBuilder builder;
    builder.attribute("name", "string")
        .attribute("email", "string")
        .attribute("since", "datetime")
        .entity({.name = "person",
                 .owns = {{.attribute = "name", .key = true}, {.attribute = "email"}},
                 .plays = {"employment:employee"}})
        .entity({.name = "company", .owns = {{.attribute = "name"}}, .plays = {"employment:employer"}})
        .relation({.name = "employment",
                   .relates = {{"employer", ""}, {"employee", ""}},
                   .owns = {{.attribute = "since"}}});
    return builder.build().value();
}

class FailingProvider : public ISchemaProvider {
public:
    Result<SchemaModel> desiredSchema() const override {
        return Error{ErrorCode::NotFound, "schema file missing"};
    }
};

} // namespace

class SchemaMigratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = MemoryStore::create();
        store_->addDatabase("app");
        db_ = std::make_unique<store::Database>(
            std::shared_ptr<store::IConnection>(store_->connect()), "app");
    }

    SchemaModel live() const { return store_->schemaOf("app").value_or(SchemaModel{}); }

    std::shared_ptr<MemoryStore> store_;
    std::unique_ptr<store::Database> db_;
    TypeQLSchemaParser parser_;
};

TEST_F(SchemaMigratorTest, MigratesEmptyDatabaseThenIsNoOp) {
    StaticSchemaProvider provider(companySchema());
    SchemaMigrator migrator(*db_, provider, parser_);

    auto first = migrator.migrate();
    ASSERT_TRUE(first.ok()) << first.status.error().message;
    EXPECT_FALSE(first.alreadyApplied);
    EXPECT_EQ(first.executed.size(), 6u);
    EXPECT_EQ(store_->countInstances("app", "migration-record"), 1u);
    EXPECT_TRUE(diffSchemas(companySchema(), withoutLedgerTypes(live())).isEmpty());

    store_->clearStatements();
    auto second = migrator.migrate();
    ASSERT_TRUE(second.ok());
    EXPECT_TRUE(second.diff.isEmpty());
    EXPECT_TRUE(second.executed.empty());
    EXPECT_EQ(store_->countInstances("app", "migration-record"), 1u);
}

TEST_F(SchemaMigratorTest, SkipIfUpToDateTouchesNothing) {
    StaticSchemaProvider provider(companySchema());
    SchemaMigrator migrator(*db_, provider, parser_);
    ASSERT_TRUE(migrator.migrate().ok());

    store_->clearStatements();
    auto skipped = migrator.migrate({.skipIfUpToDate = true});
    ASSERT_TRUE(skipped.ok());
    EXPECT_TRUE(skipped.diff.isEmpty());
    EXPECT_TRUE(skipped.executed.empty());
    EXPECT_TRUE(store_->statements().empty());

    // Without the option the ledger schema is still defined on every run
    auto plain = migrator.migrate();
    ASSERT_TRUE(plain.ok());
    EXPECT_TRUE(plain.executed.empty());
    EXPECT_FALSE(store_->statements().empty());
}

TEST_F(SchemaMigratorTest, SkipIfUpToDateStillAppliesPendingChanges) {
    StaticSchemaProvider provider(companySchema());
    SchemaMigrator migrator(*db_, provider, parser_);

    auto outcome = migrator.migrate({.skipIfUpToDate = true});
    ASSERT_TRUE(outcome.ok()) << outcome.status.error().message;
    EXPECT_EQ(outcome.executed.size(), 6u);
    EXPECT_EQ(store_->countInstances("app", "migration-record"), 1u);
}

TEST_F(SchemaMigratorTest, MissingPlaysAreAddedToExistingTypes) {
    ASSERT_TRUE(db_->executeSchema(R"(define
attribute name, value string;
attribute email, value string;
attribute since, value datetime;
entity person, owns name @key, owns email;
entity company, owns name;
relation employment, relates employer, relates employee, owns since;)"));

    StaticSchemaProvider provider(companySchema());
    SchemaMigrator migrator(*db_, provider, parser_);

    auto outcome = migrator.migrate();
    ASSERT_TRUE(outcome.ok()) << outcome.status.error().message;
    EXPECT_EQ(outcome.executed, (std::vector<std::string>{
                                    "define person plays employment:employee;",
                                    "define company plays employment:employer;"}));
    EXPECT_EQ(withoutLedgerTypes(live()), companySchema());
}

TEST_F(SchemaMigratorTest, LedgerTypesAreNotReportedAsRemovals) {
    StaticSchemaProvider provider(companySchema());
    SchemaMigrator migrator(*db_, provider, parser_);
    ASSERT_TRUE(migrator.migrate().ok());

    ASSERT_TRUE(live().hasType("migration-record"));
    auto diff = migrator.diff();
    ASSERT_TRUE(diff);
    EXPECT_TRUE(diff.value().removeTypes.empty());
    EXPECT_TRUE(diff.value().isEmpty());
}

TEST_F(SchemaMigratorTest, RecordedChangeSetIsSkipped) {
    StaticSchemaProvider provider(companySchema());
    SchemaMigrator migrator(*db_, provider, parser_);

    auto pending = migrator.diff();
    ASSERT_TRUE(pending);
    MigrationLedger ledger(*db_);
    ASSERT_TRUE(ledger.ensureSchema());
    ASSERT_TRUE(ledger.record(hashStatements(pending.value().generateMigration()), "by hand"));

    auto outcome = migrator.migrate();
    ASSERT_TRUE(outcome.ok());
    EXPECT_TRUE(outcome.alreadyApplied);
    EXPECT_TRUE(outcome.executed.empty());
    EXPECT_FALSE(live().hasType("person"));
}

TEST_F(SchemaMigratorTest, FailurePartWayLeavesChangeSetUnrecorded) {
    StaticSchemaProvider provider(companySchema());
    SchemaMigrator migrator(*db_, provider, parser_);

    store_->failOn("entity company");
    auto failed = migrator.migrate();
    ASSERT_FALSE(failed.ok());
    EXPECT_EQ(failed.status.error().message.rfind("migrate: execute \"define entity company", 0),
              0u);
    ASSERT_EQ(failed.executed.size(), 4u);
    EXPECT_EQ(failed.executed[0], "define attribute name, value string;");
    EXPECT_TRUE(live().hasType("person"));
    EXPECT_FALSE(live().hasType("company"));
    EXPECT_EQ(store_->countInstances("app", "migration-record"), 0u);

    store_->clearFailure();
    auto retry = migrator.migrate();
    ASSERT_TRUE(retry.ok()) << retry.status.error().message;
    EXPECT_EQ(retry.executed.size(), 2u);
    EXPECT_TRUE(live().hasType("company"));
    EXPECT_TRUE(live().hasType("employment"));
    EXPECT_EQ(store_->countInstances("app", "migration-record"), 1u);
}

TEST_F(SchemaMigratorTest, WarningsOnlyRecordNothing) {
    ASSERT_TRUE(db_->executeSchema(R"(define
attribute name, value string;
attribute nickname, value string;
entity person, owns name @key, owns nickname;)"));

    SchemaBuilder builder;
    builder.attribute("name", "string").entity({.name = "person", .owns = {{.attribute = "name", .key = true}}});
    StaticSchemaProvider provider(builder.build().value());
    SchemaMigrator migrator(*db_, provider, parser_);

    auto outcome = migrator.migrate();
    ASSERT_TRUE(outcome.ok());
    EXPECT_FALSE(outcome.diff.hasAdditions());
    EXPECT_EQ(outcome.diff.removeTypes, std::vector<std::string>{"nickname"});
    ASSERT_EQ(outcome.diff.removeOwns.size(), 1u);
    EXPECT_TRUE(outcome.executed.empty());
    EXPECT_EQ(store_->countInstances("app", "migration-record"), 0u);
    EXPECT_TRUE(live().hasType("nickname"));
}

TEST_F(SchemaMigratorTest, UntrackedMigrationSkipsLedger) {
    StaticSchemaProvider provider(companySchema());
    SchemaMigrator migrator(*db_, provider, parser_);

    auto outcome = migrator.migrateUntracked();
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.executed.size(), 6u);
    EXPECT_TRUE(live().hasType("employment"));
    EXPECT_FALSE(live().hasType("migration-record"));
    EXPECT_FALSE(live().hasType("migration-hash"));
}

TEST_F(SchemaMigratorTest, MigrateFromEmptyDefinesWholeSchemaAtOnce) {
    StaticSchemaProvider provider(companySchema());
    SchemaMigrator migrator(*db_, provider, parser_);

    ASSERT_TRUE(migrator.migrateFromEmpty());
    EXPECT_EQ(store_->statements().size(), 1u);
    EXPECT_EQ(live(), companySchema());

    StaticSchemaProvider emptyProvider(SchemaModel{});
    SchemaMigrator noop(*db_, emptyProvider, parser_);
    store_->clearStatements();
    ASSERT_TRUE(noop.migrateFromEmpty());
    EXPECT_TRUE(store_->statements().empty());
}

TEST_F(SchemaMigratorTest, MigrateFromSuppliedSchemaText) {
    ASSERT_TRUE(db_->executeSchema("define attribute name, value string; entity person, owns name @key;"));

    StaticSchemaProvider provider(companySchema());
    SchemaMigrator migrator(*db_, provider, parser_);

    auto outcome = migrator.migrateFromSchema(renderSchema(live()));
    ASSERT_TRUE(outcome.ok()) << outcome.status.error().message;
    EXPECT_EQ(outcome.diff.addAttributes.size(), 2u);
    EXPECT_EQ(outcome.diff.addEntities.size(), 1u);
    EXPECT_EQ(outcome.diff.addRelations.size(), 1u);
    EXPECT_TRUE(diffSchemas(companySchema(), withoutLedgerTypes(live())).generateMigration().empty());
}

TEST_F(SchemaMigratorTest, UnparseableSchemaTextIsReported) {
    StaticSchemaProvider provider(companySchema());
    SchemaMigrator migrator(*db_, provider, parser_);

    auto outcome = migrator.migrateFromSchema("define entity person, owns name");
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.status.error().message.rfind("migrate: parse current schema", 0), 0u);
    EXPECT_FALSE(live().hasType("person"));
}

TEST_F(SchemaMigratorTest, ProviderErrorIsWrapped) {
    FailingProvider provider;
    SchemaMigrator migrator(*db_, provider, parser_);

    auto diff = migrator.diff();
    ASSERT_FALSE(diff);
    EXPECT_EQ(diff.error().code, ErrorCode::NotFound);
    EXPECT_EQ(diff.error().message, "migrate: desired schema: schema file missing");

    auto empty = migrator.migrateFromEmpty();
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().message.rfind("migrate from empty: desired schema", 0), 0u);
}

TEST_F(SchemaMigratorTest, UnknownDatabaseFailsBeforeDiffing) {
    store::Database missing(std::shared_ptr<store::IConnection>(store_->connect()), "nowhere");
    StaticSchemaProvider provider(companySchema());
    SchemaMigrator migrator(missing, provider, parser_);

    auto diff = migrator.diff();
    ASSERT_FALSE(diff);
    EXPECT_EQ(diff.error().message.rfind("migrate: ", 0), 0u);
}

TEST(LedgerFilterTest, RemovesOnlyLedgerTypes) {
    TypeQLSchemaParser parser;
    auto model = parser.parse(R"(define
attribute name, value string;
attribute migration-hash, value string;
entity person, owns name;
entity migration-record, owns migration-hash @key;)");
    ASSERT_TRUE(model);

    auto filtered = withoutLedgerTypes(model.value());
    EXPECT_TRUE(filtered.hasType("name"));
    EXPECT_TRUE(filtered.hasType("person"));
    EXPECT_FALSE(filtered.hasType("migration-hash"));
    EXPECT_FALSE(filtered.hasType("migration-record"));
}
