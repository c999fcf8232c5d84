#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <strata/core/types.h>

namespace strata::schema {

/**
 * @brief Attribute type with its value type (string, integer, datetime, ...)
 */
struct AttributeSpec {
    std::string name;
    std::string valueType;

    bool operator==(const AttributeSpec&) const = default;
};

/**
 * @brief Ownership of an attribute by an entity or relation type
 */
struct OwnsSpec {
    std::string attribute;
    bool key = false;
    bool unique = false;
    std::string card; ///< Cardinality expression, e.g. "0..1" or "1.."; empty for default

    bool operator==(const OwnsSpec&) const = default;
};

/**
 * @brief Role declared by a relation type
 */
struct RelatesSpec {
    std::string role;
    std::string card;

    bool operator==(const RelatesSpec&) const = default;
};

struct EntitySpec {
    std::string name;
    std::string parent;
    bool abstract = false;
    std::vector<OwnsSpec> owns;
    std::vector<std::string> plays; ///< "relation:role"

    const OwnsSpec* findOwns(std::string_view attribute) const;

    bool operator==(const EntitySpec&) const = default;
};

struct RelationSpec {
    std::string name;
    std::string parent;
    bool abstract = false;
    std::vector<RelatesSpec> relates;
    std::vector<OwnsSpec> owns;
    std::vector<std::string> plays;

    const OwnsSpec* findOwns(std::string_view attribute) const;
    const RelatesSpec* findRelates(std::string_view role) const;

    bool operator==(const RelationSpec&) const = default;
};

/**
 * @brief Value snapshot of a schema
 *
 * Produced either by introspecting the store's schema text or by a provider of
 * the desired state. Declaration order is preserved and is the order in which
 * definitions are rendered.
 */
struct SchemaModel {
    std::vector<AttributeSpec> attributes;
    std::vector<EntitySpec> entities;
    std::vector<RelationSpec> relations;

    const AttributeSpec* findAttribute(std::string_view name) const;
    const EntitySpec* findEntity(std::string_view name) const;
    const RelationSpec* findRelation(std::string_view name) const;

    EntitySpec* findEntity(std::string_view name);
    RelationSpec* findRelation(std::string_view name);

    /**
     * @brief Any attribute, entity or relation with this name
     */
    [[nodiscard]] bool hasType(std::string_view name) const;

    [[nodiscard]] bool empty() const {
        return attributes.empty() && entities.empty() && relations.empty();
    }

    bool operator==(const SchemaModel&) const = default;
};

/**
 * @brief Whether @p valueType is one of the store's attribute value types
 */
bool isKnownValueType(std::string_view valueType);

/**
 * @brief Whether @p card is a well-formed cardinality ("N", "N..", "N..M" with N <= M)
 */
bool isValidCardinality(std::string_view card);

// Definition rendering

/**
 * @brief Owns annotations in fixed order: @key, @unique, @card(...)
 */
std::string formatOwnsAnnotations(const OwnsSpec& owns);

/**
 * @brief "attribute name, value type;"
 */
std::string formatAttributeDefinition(const AttributeSpec& attribute);

/**
 * @brief Full entity definition without the leading define keyword
 */
std::string formatEntityDefinition(const EntitySpec& entity);

/**
 * @brief Full relation definition without the leading define keyword
 *
 * Roles come before plays and owns clauses.
 */
std::string formatRelationDefinition(const RelationSpec& relation);

/**
 * @brief Render the whole model as one define block; empty string for an empty model
 */
std::string renderSchema(const SchemaModel& model);

/**
 * @brief Assembles a SchemaModel and validates it once
 *
 * @code
 * SchemaBuilder builder;
 * builder.attribute("email", "string")
 *     .entity({.name = "person", .owns = {{.attribute = "email", .key = true}}});
 * auto model = builder.build();
 * @endcode
 */
class SchemaBuilder {
public:
    SchemaBuilder& attribute(std::string name, std::string valueType);
    SchemaBuilder& entity(EntitySpec spec);
    SchemaBuilder& relation(RelationSpec spec);

    /**
     * @brief Validate and return the model
     *
     * Fails with ValidationError listing every problem found: invalid names or
     * value types, duplicate types or ownerships, ownership of undeclared
     * attributes, unknown parents, relations without roles and malformed
     * cardinalities.
     */
    Result<SchemaModel> build() const;

private:
    SchemaModel model_;
};

/**
 * @brief Source of the desired schema
 */
class ISchemaProvider {
public:
    virtual ~ISchemaProvider() = default;

    virtual Result<SchemaModel> desiredSchema() const = 0;
};

/**
 * @brief Provider returning a fixed model
 */
class StaticSchemaProvider : public ISchemaProvider {
public:
    explicit StaticSchemaProvider(SchemaModel model) : model_(std::move(model)) {}

    Result<SchemaModel> desiredSchema() const override { return model_; }

private:
    SchemaModel model_;
};

} // namespace strata::schema
