#pragma once

#include <string_view>
#include <strata/core/types.h>
#include <strata/schema/schema_model.h>

namespace strata::schema {

/**
 * @brief Turns the store's schema text into a SchemaModel
 */
class ISchemaIntrospector {
public:
    virtual ~ISchemaIntrospector() = default;

    virtual Result<SchemaModel> introspect(std::string_view schemaText) const = 0;
};

/**
 * @brief Parser for the TypeQL schema definition subset
 *
 * Understands attribute, entity and relation definitions with owns, relates,
 * plays, sub, value, @abstract, @key, @unique and @card, plus the additive forms
 * "define T owns a;" and "define R relates r;" against types already in the
 * model. Function and struct definitions are skipped and other annotations are
 * ignored. Empty text yields an empty model.
 */
class TypeQLSchemaParser : public ISchemaIntrospector {
public:
    Result<SchemaModel> introspect(std::string_view schemaText) const override {
        return parse(schemaText);
    }

    Result<SchemaModel> parse(std::string_view text) const;

    /**
     * @brief Merge definitions from @p text into @p model
     *
     * Redefining an existing type merges clauses into it. On error @p model is
     * left unchanged.
     */
    Result<void> parseInto(std::string_view text, SchemaModel& model) const;
};

} // namespace strata::schema
