#include <gtest/gtest.h>

#include <strata/schema/schema_parser.h>

using namespace strata;
using namespace strata::schema;

namespace {

const char* kLibrarySchema = R"(define
  # people and the books they write
  attribute name, value string;
  attribute isbn, value string @regex("^[0-9-]+$");
  attribute published, value datetime;
  attribute tag, value string;

  entity person @abstract,
    owns name @key,
    plays authorship:author;

  entity writer sub person;

  entity book,
    owns isbn @key @unique,
    owns tag[] @card(0..5),
    owns published,
    plays authorship:work;

  relation authorship,
    relates author @card(1..),
    relates work,
    owns published;

  fun books_by($p: person) -> { book }:
    match
      $a isa authorship, links (author: $p, work: $b);
    return { $b };

  struct address:
    street value string;
)";

} // namespace

TEST(TypeQLSchemaParserTest, EmptyTextYieldsEmptyModel) {
    TypeQLSchemaParser parser;
    auto model = parser.parse("");
    ASSERT_TRUE(model);
    EXPECT_TRUE(model.value().empty());

    auto defineOnly = parser.parse("define\n# nothing yet\n");
    ASSERT_TRUE(defineOnly);
    EXPECT_TRUE(defineOnly.value().empty());
}

TEST(TypeQLSchemaParserTest, ParsesFullSchema) {
    TypeQLSchemaParser parser;
    auto result = parser.parse(kLibrarySchema);
    ASSERT_TRUE(result) << result.error().message;
    const auto& model = result.value();

    ASSERT_EQ(model.attributes.size(), 4u);
    ASSERT_NE(model.findAttribute("isbn"), nullptr);
    EXPECT_EQ(model.findAttribute("isbn")->valueType, "string");
    EXPECT_EQ(model.findAttribute("published")->valueType, "datetime");

    const auto* person = model.findEntity("person");
    ASSERT_NE(person, nullptr);
    EXPECT_TRUE(person->abstract);
    ASSERT_NE(person->findOwns("name"), nullptr);
    EXPECT_TRUE(person->findOwns("name")->key);
    EXPECT_EQ(person->plays, std::vector<std::string>{"authorship:author"});

    const auto* writer = model.findEntity("writer");
    ASSERT_NE(writer, nullptr);
    EXPECT_EQ(writer->parent, "person");
    EXPECT_FALSE(writer->abstract);

    const auto* book = model.findEntity("book");
    ASSERT_NE(book, nullptr);
    const auto* isbn = book->findOwns("isbn");
    ASSERT_NE(isbn, nullptr);
    EXPECT_TRUE(isbn->key);
    EXPECT_TRUE(isbn->unique);
    const auto* tag = book->findOwns("tag");
    ASSERT_NE(tag, nullptr);
    EXPECT_EQ(tag->card, "0..5");

    const auto* authorship = model.findRelation("authorship");
    ASSERT_NE(authorship, nullptr);
    ASSERT_EQ(authorship->relates.size(), 2u);
    EXPECT_EQ(authorship->relates[0].role, "author");
    EXPECT_EQ(authorship->relates[0].card, "1..");
    EXPECT_EQ(authorship->relates[1].role, "work");
    EXPECT_NE(authorship->findOwns("published"), nullptr);

    // Functions and structs are not types
    EXPECT_FALSE(model.hasType("books_by"));
    EXPECT_FALSE(model.hasType("address"));
    EXPECT_EQ(model.entities.size(), 3u);
    EXPECT_EQ(model.relations.size(), 1u);
}

TEST(TypeQLSchemaParserTest, RenderedSchemaParsesBackToSameModel) {
    TypeQLSchemaParser parser;
    auto first = parser.parse(kLibrarySchema);
    ASSERT_TRUE(first);

    auto second = parser.parse(renderSchema(first.value()));
    ASSERT_TRUE(second) << second.error().message;
    EXPECT_EQ(second.value(), first.value());
}

TEST(TypeQLSchemaParserTest, AdditiveFormsMergeIntoExistingTypes) {
    TypeQLSchemaParser parser;
    SchemaModel model;
    ASSERT_TRUE(parser.parseInto(R"(define
attribute name, value string;
attribute email, value string;
entity person, owns name;
relation friendship, relates friend;)",
                                 model));

    ASSERT_TRUE(parser.parseInto("define person owns email @unique;", model));
    ASSERT_TRUE(parser.parseInto("define friendship relates witness @card(0..1);", model));

    const auto* person = model.findEntity("person");
    ASSERT_NE(person, nullptr);
    ASSERT_EQ(person->owns.size(), 2u);
    EXPECT_TRUE(person->findOwns("email")->unique);

    const auto* friendship = model.findRelation("friendship");
    ASSERT_NE(friendship, nullptr);
    ASSERT_NE(friendship->findRelates("witness"), nullptr);
    EXPECT_EQ(friendship->findRelates("witness")->card, "0..1");
}

TEST(TypeQLSchemaParserTest, RedefinitionIsIdempotent) {
    TypeQLSchemaParser parser;
    const std::string text = R"(define
attribute name, value string;
entity person, owns name @key, plays marriage:spouse;)";

    SchemaModel model;
    ASSERT_TRUE(parser.parseInto(text, model));
    SchemaModel once = model;
    ASSERT_TRUE(parser.parseInto(text, model));
    EXPECT_EQ(model, once);
}

TEST(TypeQLSchemaParserTest, UnknownTypeInAdditiveFormFailsAtomically) {
    TypeQLSchemaParser parser;
    SchemaModel model;
    ASSERT_TRUE(parser.parseInto("define attribute name, value string;", model));
    SchemaModel before = model;

    auto result = parser.parseInto(R"(define
attribute email, value string;
company owns email;)",
                                   model);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::InvalidData);
    EXPECT_NE(result.error().message.find("unknown type 'company'"), std::string::npos);
    EXPECT_EQ(model, before);
}

TEST(TypeQLSchemaParserTest, KindConflictIsRejected) {
    TypeQLSchemaParser parser;
    auto result = parser.parse(R"(define
attribute person, value string;
entity person;)");
    ASSERT_FALSE(result);
    EXPECT_NE(result.error().message.find("already defined as"), std::string::npos);
}

TEST(TypeQLSchemaParserTest, MalformedInputIsRejected) {
    TypeQLSchemaParser parser;

    auto unterminated = parser.parse("define entity person, owns name");
    ASSERT_FALSE(unterminated);
    EXPECT_EQ(unterminated.error().code, ErrorCode::InvalidData);

    auto badString = parser.parse("define attribute a, value string @regex(\"abc);");
    ASSERT_FALSE(badString);

    auto emptyClause = parser.parse("define entity person,, owns name;");
    ASSERT_FALSE(emptyClause);

    auto relatesOnEntity = parser.parse("define entity person, relates friend;");
    ASSERT_FALSE(relatesOnEntity);
}

TEST(TypeQLSchemaParserTest, IntrospectUsesParser) {
    TypeQLSchemaParser parser;
    const ISchemaIntrospector& introspector = parser;
    auto model = introspector.introspect("define attribute name, value string;");
    ASSERT_TRUE(model);
    EXPECT_TRUE(model.value().hasType("name"));
}
