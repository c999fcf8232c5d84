// Copyright 2025 Strata Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <set>
#include <strata/schema/schema_model.h>

namespace strata::schema {

namespace {

constexpr std::array<std::string_view, 9> kValueTypes = {
    "string", "integer", "double", "decimal", "boolean", "date", "datetime", "datetime-tz",
    "duration"};

template <typename T> const T* findByName(const std::vector<T>& items, std::string_view name) {
    auto it = std::find_if(items.begin(), items.end(),
                           [name](const T& item) { return item.name == name; });
    return it == items.end() ? nullptr : &*it;
}

template <typename T> T* findByName(std::vector<T>& items, std::string_view name) {
    auto it = std::find_if(items.begin(), items.end(),
                           [name](const T& item) { return item.name == name; });
    return it == items.end() ? nullptr : &*it;
}

bool isValidTypeName(std::string_view name) {
    if (name.empty() || !std::isalpha(static_cast<unsigned char>(name.front()))) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
    });
}

bool parseCount(std::string_view text, long& out) {
    if (text.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size() && out >= 0;
}

std::string formatOwnsClause(const OwnsSpec& owns) {
    std::string line = "    owns " + owns.attribute;
    auto annotations = formatOwnsAnnotations(owns);
    if (!annotations.empty()) {
        line += " " + annotations;
    }
    return line;
}

std::string formatHeader(std::string_view kind, std::string_view name, bool abstract,
                         std::string_view parent) {
    std::string header = fmt::format("{} {}", kind, name);
    if (abstract) {
        header += " @abstract";
    }
    if (!parent.empty()) {
        header += fmt::format(" sub {}", parent);
    }
    return header;
}

void checkOwns(const SchemaModel& model, std::string_view typeName,
               const std::vector<OwnsSpec>& owns, std::vector<std::string>& problems) {
    std::set<std::string, std::less<>> seen;
    for (const auto& o : owns) {
        if (!model.findAttribute(o.attribute)) {
            problems.push_back(
                fmt::format("type '{}' owns undeclared attribute '{}'", typeName, o.attribute));
        }
        if (!seen.insert(o.attribute).second) {
            problems.push_back(
                fmt::format("type '{}' owns attribute '{}' more than once", typeName, o.attribute));
        }
        if (!o.card.empty() && !isValidCardinality(o.card)) {
            problems.push_back(fmt::format("type '{}' owns '{}' with invalid cardinality '{}'",
                                           typeName, o.attribute, o.card));
        }
    }
}

} // namespace

const OwnsSpec* EntitySpec::findOwns(std::string_view attribute) const {
    auto it = std::find_if(owns.begin(), owns.end(),
                           [attribute](const OwnsSpec& o) { return o.attribute == attribute; });
    return it == owns.end() ? nullptr : &*it;
}

const OwnsSpec* RelationSpec::findOwns(std::string_view attribute) const {
    auto it = std::find_if(owns.begin(), owns.end(),
                           [attribute](const OwnsSpec& o) { return o.attribute == attribute; });
    return it == owns.end() ? nullptr : &*it;
}

const RelatesSpec* RelationSpec::findRelates(std::string_view role) const {
    auto it = std::find_if(relates.begin(), relates.end(),
                           [role](const RelatesSpec& r) { return r.role == role; });
    return it == relates.end() ? nullptr : &*it;
}

const AttributeSpec* SchemaModel::findAttribute(std::string_view name) const {
    return findByName(attributes, name);
}

const EntitySpec* SchemaModel::findEntity(std::string_view name) const {
    return findByName(entities, name);
}

const RelationSpec* SchemaModel::findRelation(std::string_view name) const {
    return findByName(relations, name);
}

EntitySpec* SchemaModel::findEntity(std::string_view name) {
    return findByName(entities, name);
}

RelationSpec* SchemaModel::findRelation(std::string_view name) {
    return findByName(relations, name);
}

bool SchemaModel::hasType(std::string_view name) const {
    return findAttribute(name) || findEntity(name) || findRelation(name);
}

bool isKnownValueType(std::string_view valueType) {
    return std::find(kValueTypes.begin(), kValueTypes.end(), valueType) != kValueTypes.end();
}

bool isValidCardinality(std::string_view card) {
    auto dots = card.find("..");
    long min = 0;
    if (dots == std::string_view::npos) {
        return parseCount(card, min);
    }
    if (!parseCount(card.substr(0, dots), min)) {
        return false;
    }
    auto rest = card.substr(dots + 2);
    if (rest.empty()) {
        return true;
    }
    long max = 0;
    return parseCount(rest, max) && min <= max;
}

std::string formatOwnsAnnotations(const OwnsSpec& owns) {
    std::vector<std::string> parts;
    if (owns.key) {
        parts.emplace_back("@key");
    }
    if (owns.unique) {
        parts.emplace_back("@unique");
    }
    if (!owns.card.empty()) {
        parts.push_back(fmt::format("@card({})", owns.card));
    }
    return fmt::format("{}", fmt::join(parts, " "));
}

std::string formatAttributeDefinition(const AttributeSpec& attribute) {
    return fmt::format("attribute {}, value {};", attribute.name, attribute.valueType);
}

std::string formatEntityDefinition(const EntitySpec& entity) {
    std::vector<std::string> lines;
    lines.push_back(formatHeader("entity", entity.name, entity.abstract, entity.parent));
    for (const auto& p : entity.plays) {
        lines.push_back("    plays " + p);
    }
    for (const auto& o : entity.owns) {
        lines.push_back(formatOwnsClause(o));
    }
    return fmt::format("{};", fmt::join(lines, ",\n"));
}

std::string formatRelationDefinition(const RelationSpec& relation) {
    std::vector<std::string> lines;
    lines.push_back(formatHeader("relation", relation.name, relation.abstract, relation.parent));
    for (const auto& r : relation.relates) {
        std::string line = "    relates " + r.role;
        if (!r.card.empty()) {
            line += fmt::format(" @card({})", r.card);
        }
        lines.push_back(std::move(line));
    }
    for (const auto& p : relation.plays) {
        lines.push_back("    plays " + p);
    }
    for (const auto& o : relation.owns) {
        lines.push_back(formatOwnsClause(o));
    }
    return fmt::format("{};", fmt::join(lines, ",\n"));
}

std::string renderSchema(const SchemaModel& model) {
    if (model.empty()) {
        return {};
    }

    std::vector<std::string> parts;
    for (const auto& a : model.attributes) {
        parts.push_back(formatAttributeDefinition(a));
    }
    for (const auto& e : model.entities) {
        parts.push_back(formatEntityDefinition(e));
    }
    for (const auto& r : model.relations) {
        parts.push_back(formatRelationDefinition(r));
    }
    return fmt::format("define\n{}", fmt::join(parts, "\n"));
}

// SchemaBuilder implementation
SchemaBuilder& SchemaBuilder::attribute(std::string name, std::string valueType) {
    model_.attributes.push_back(AttributeSpec{std::move(name), std::move(valueType)});
    return *this;
}

SchemaBuilder& SchemaBuilder::entity(EntitySpec spec) {
    model_.entities.push_back(std::move(spec));
    return *this;
}

SchemaBuilder& SchemaBuilder::relation(RelationSpec spec) {
    model_.relations.push_back(std::move(spec));
    return *this;
}

Result<SchemaModel> SchemaBuilder::build() const {
    std::vector<std::string> problems;
    std::set<std::string, std::less<>> names;

    auto checkName = [&](std::string_view kind, const std::string& name) {
        if (!isValidTypeName(name)) {
            problems.push_back(fmt::format("invalid {} name '{}'", kind, name));
        }
        if (!names.insert(name).second) {
            problems.push_back(fmt::format("duplicate type name '{}'", name));
        }
    };

    for (const auto& a : model_.attributes) {
        checkName("attribute", a.name);
        if (!isKnownValueType(a.valueType)) {
            problems.push_back(
                fmt::format("attribute '{}' has unknown value type '{}'", a.name, a.valueType));
        }
    }

    for (const auto& e : model_.entities) {
        checkName("entity", e.name);
        if (!e.parent.empty() && !model_.findEntity(e.parent)) {
            problems.push_back(fmt::format("entity '{}' has unknown parent '{}'", e.name, e.parent));
        }
        if (e.parent == e.name) {
            problems.push_back(fmt::format("entity '{}' cannot be its own parent", e.name));
        }
        checkOwns(model_, e.name, e.owns, problems);
    }

    for (const auto& r : model_.relations) {
        checkName("relation", r.name);
        if (!r.parent.empty() && !model_.findRelation(r.parent)) {
            problems.push_back(
                fmt::format("relation '{}' has unknown parent '{}'", r.name, r.parent));
        }
        if (r.parent == r.name) {
            problems.push_back(fmt::format("relation '{}' cannot be its own parent", r.name));
        }
        if (r.relates.empty() && r.parent.empty()) {
            problems.push_back(fmt::format("relation '{}' declares no roles", r.name));
        }
        std::set<std::string, std::less<>> roles;
        for (const auto& role : r.relates) {
            if (!isValidTypeName(role.role)) {
                problems.push_back(
                    fmt::format("relation '{}' has invalid role name '{}'", r.name, role.role));
            }
            if (!roles.insert(role.role).second) {
                problems.push_back(
                    fmt::format("relation '{}' declares role '{}' twice", r.name, role.role));
            }
            if (!role.card.empty() && !isValidCardinality(role.card)) {
                problems.push_back(fmt::format("relation '{}' role '{}' has invalid cardinality '{}'",
                                               r.name, role.role, role.card));
            }
        }
        checkOwns(model_, r.name, r.owns, problems);
    }

    if (!problems.empty()) {
        return Error{ErrorCode::ValidationError,
                     fmt::format("invalid schema: {}", fmt::join(problems, "; "))};
    }
    return model_;
}

} // namespace strata::schema
