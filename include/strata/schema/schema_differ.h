#pragma once

#include <string>
#include <vector>
#include <strata/schema/schema_model.h>

namespace strata::schema {

/**
 * @brief Attribute type to be defined
 */
struct AttributeChange {
    std::string name;
    std::string valueType;

    bool operator==(const AttributeChange&) const = default;
};

/**
 * @brief Entity or relation type to be defined in full
 */
struct TypeChange {
    std::string name;
    std::string definition; ///< Definition text without the leading define keyword

    bool operator==(const TypeChange&) const = default;
};

/**
 * @brief Attribute ownership added to (or missing from) an existing type
 */
struct OwnsChange {
    std::string typeName;
    std::string attribute;
    std::string annotations; ///< e.g. "@key" or "@card(0..1)"; empty for none

    bool operator==(const OwnsChange&) const = default;
};

/**
 * @brief Role added to an existing relation type
 */
struct RelatesChange {
    std::string typeName;
    std::string role;
    std::string card;

    bool operator==(const RelatesChange&) const = default;
};

/**
 * @brief Role played by an existing type, as "relation:role"
 */
struct PlaysChange {
    std::string typeName;
    std::string role;

    bool operator==(const PlaysChange&) const = default;
};

enum class OperationKind { AddAttribute, AddEntity, AddRelation, AddOwns, AddRelates, AddPlays };

constexpr const char* operationKindToString(OperationKind kind) {
    switch (kind) {
        case OperationKind::AddAttribute:
            return "add attribute";
        case OperationKind::AddEntity:
            return "add entity";
        case OperationKind::AddRelation:
            return "add relation";
        case OperationKind::AddOwns:
            return "add owns";
        case OperationKind::AddRelates:
            return "add relates";
        case OperationKind::AddPlays:
            return "add plays";
    }
    return "unknown";
}

/**
 * @brief One additive step of a diff and the statement that undoes it
 */
struct SchemaOperation {
    OperationKind kind;
    std::string typeName; ///< Type the step defines or extends
    std::string statement;
    std::string rollbackStatement; ///< Empty when the step cannot be undone

    [[nodiscard]] bool isReversible() const { return !rollbackStatement.empty(); }

    bool operator==(const SchemaOperation&) const = default;
};

enum class BreakingChangeKind { TypeRemoval, OwnsRemoval, PlaysRemoval };

/**
 * @brief Structure in the store that applying the desired schema in full would remove
 */
struct BreakingChange {
    BreakingChangeKind kind;
    std::string typeName;
    std::string detail;

    bool operator==(const BreakingChange&) const = default;
};

/**
 * @brief One-directional difference from the live schema to the desired one
 *
 * Only additions ever produce statements. Types, ownerships and played roles
 * present in the store but not in the desired schema are reported as warnings
 * in summary() and as breakingChanges().
 */
struct SchemaDiff {
    std::vector<AttributeChange> addAttributes;
    std::vector<TypeChange> addEntities;
    std::vector<TypeChange> addRelations;
    std::vector<OwnsChange> addOwns;
    std::vector<RelatesChange> addRelates;
    std::vector<PlaysChange> addPlays;
    std::vector<OwnsChange> removeOwns;   ///< Informational only
    std::vector<PlaysChange> removePlays; ///< Informational only
    std::vector<std::string> removeTypes; ///< Informational only

    /**
     * @brief True when nothing is to be added and nothing is to be reported
     */
    [[nodiscard]] bool isEmpty() const;

    /**
     * @brief True when there is at least one statement to generate
     */
    [[nodiscard]] bool hasAdditions() const;

    /**
     * @brief Human readable description, one line per category and per warning
     */
    [[nodiscard]] std::string summary() const;

    /**
     * @brief Additive steps in dependency order: attributes, entities, relations,
     * owns, relates, plays
     */
    [[nodiscard]] std::vector<SchemaOperation> operations() const;

    /**
     * @brief Statements of operations(), in order
     */
    [[nodiscard]] std::vector<std::string> generateMigration() const;

    /**
     * @brief Undo statements of operations(), last step first
     */
    [[nodiscard]] std::vector<std::string> generateRollback() const;

    /**
     * @brief Removals the additive migration leaves in place
     *
     * Types first, then ownerships, then played roles.
     */
    [[nodiscard]] std::vector<BreakingChange> breakingChanges() const;

    [[nodiscard]] bool hasBreakingChanges() const;

    bool operator==(const SchemaDiff&) const = default;
};

/**
 * @brief Compute the additive diff that brings @p current to @p desired
 */
SchemaDiff diffSchemas(const SchemaModel& desired, const SchemaModel& current);

} // namespace strata::schema
