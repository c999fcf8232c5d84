// Copyright 2025 Strata Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>
#include <strata/schema/schema_differ.h>

namespace strata::schema {

namespace {

template <typename Spec>
void diffOwns(const Spec& desired, const Spec& current, SchemaDiff& diff) {
    for (const auto& o : desired.owns) {
        if (!current.findOwns(o.attribute)) {
            diff.addOwns.push_back({desired.name, o.attribute, formatOwnsAnnotations(o)});
        }
    }
    for (const auto& o : current.owns) {
        if (!desired.findOwns(o.attribute)) {
            diff.removeOwns.push_back({current.name, o.attribute, formatOwnsAnnotations(o)});
        }
    }
}

template <typename Spec>
void diffPlays(const Spec& desired, const Spec& current, SchemaDiff& diff) {
    auto contains = [](const std::vector<std::string>& list, const std::string& role) {
        return std::find(list.begin(), list.end(), role) != list.end();
    };
    for (const auto& role : desired.plays) {
        if (!contains(current.plays, role)) {
            diff.addPlays.push_back({desired.name, role});
        }
    }
    for (const auto& role : current.plays) {
        if (!contains(desired.plays, role)) {
            diff.removePlays.push_back({current.name, role});
        }
    }
}

template <typename Change>
std::string joinNames(const std::vector<Change>& changes) {
    std::vector<std::string> names;
    names.reserve(changes.size());
    for (const auto& c : changes) {
        names.push_back(c.name);
    }
    return fmt::format("{}", fmt::join(names, ", "));
}

} // namespace

bool SchemaDiff::isEmpty() const {
    return !hasAdditions() && !hasBreakingChanges();
}

bool SchemaDiff::hasAdditions() const {
    return !addAttributes.empty() || !addEntities.empty() || !addRelations.empty() ||
           !addOwns.empty() || !addRelates.empty() || !addPlays.empty();
}

bool SchemaDiff::hasBreakingChanges() const {
    return !removeTypes.empty() || !removeOwns.empty() || !removePlays.empty();
}

std::string SchemaDiff::summary() const {
    if (isEmpty()) {
        return "schema is up to date";
    }

    std::vector<std::string> lines;
    if (!addAttributes.empty()) {
        lines.push_back(fmt::format("add {} attribute(s): {}", addAttributes.size(),
                                    joinNames(addAttributes)));
    }
    if (!addEntities.empty()) {
        lines.push_back(
            fmt::format("add {} entity type(s): {}", addEntities.size(), joinNames(addEntities)));
    }
    if (!addRelations.empty()) {
        lines.push_back(fmt::format("add {} relation type(s): {}", addRelations.size(),
                                    joinNames(addRelations)));
    }
    if (!addOwns.empty()) {
        lines.push_back(fmt::format("add {} owns clause(s)", addOwns.size()));
    }
    if (!addRelates.empty()) {
        lines.push_back(fmt::format("add {} relates clause(s)", addRelates.size()));
    }
    if (!addPlays.empty()) {
        lines.push_back(fmt::format("add {} plays clause(s)", addPlays.size()));
    }
    for (const auto& name : removeTypes) {
        lines.push_back(fmt::format(
            "WARNING: type '{}' exists in the database but not in the desired schema", name));
    }
    for (const auto& o : removeOwns) {
        lines.push_back(fmt::format(
            "WARNING: '{}' owns '{}' in the database but not in the desired schema", o.typeName,
            o.attribute));
    }
    for (const auto& p : removePlays) {
        lines.push_back(fmt::format(
            "WARNING: '{}' plays '{}' in the database but not in the desired schema", p.typeName,
            p.role));
    }
    return fmt::format("{}", fmt::join(lines, "\n"));
}

std::vector<SchemaOperation> SchemaDiff::operations() const {
    std::vector<SchemaOperation> ops;

    // Attributes first; types and clauses below refer to them
    for (const auto& a : addAttributes) {
        ops.push_back({OperationKind::AddAttribute, a.name,
                       fmt::format("define attribute {}, value {};", a.name, a.valueType),
                       fmt::format("undefine {};", a.name)});
    }
    for (const auto& e : addEntities) {
        ops.push_back({OperationKind::AddEntity, e.name, "define " + e.definition,
                       fmt::format("undefine {};", e.name)});
    }
    for (const auto& r : addRelations) {
        ops.push_back({OperationKind::AddRelation, r.name, "define " + r.definition,
                       fmt::format("undefine {};", r.name)});
    }
    for (const auto& o : addOwns) {
        std::string annotations = o.annotations.empty() ? "" : " " + o.annotations;
        ops.push_back({OperationKind::AddOwns, o.typeName,
                       fmt::format("define {} owns {}{};", o.typeName, o.attribute, annotations),
                       fmt::format("undefine owns {} from {};", o.attribute, o.typeName)});
    }
    for (const auto& r : addRelates) {
        std::string card = r.card.empty() ? "" : fmt::format(" @card({})", r.card);
        ops.push_back({OperationKind::AddRelates, r.typeName,
                       fmt::format("define {} relates {}{};", r.typeName, r.role, card),
                       fmt::format("undefine relates {} from {};", r.role, r.typeName)});
    }
    for (const auto& p : addPlays) {
        ops.push_back({OperationKind::AddPlays, p.typeName,
                       fmt::format("define {} plays {};", p.typeName, p.role),
                       fmt::format("undefine plays {} from {};", p.role, p.typeName)});
    }

    return ops;
}

std::vector<std::string> SchemaDiff::generateMigration() const {
    std::vector<std::string> statements;
    for (auto& op : operations()) {
        statements.push_back(std::move(op.statement));
    }
    return statements;
}

std::vector<std::string> SchemaDiff::generateRollback() const {
    auto ops = operations();
    std::vector<std::string> statements;
    for (auto it = ops.rbegin(); it != ops.rend(); ++it) {
        if (it->isReversible()) {
            statements.push_back(std::move(it->rollbackStatement));
        }
    }
    return statements;
}

std::vector<BreakingChange> SchemaDiff::breakingChanges() const {
    std::vector<BreakingChange> changes;
    for (const auto& name : removeTypes) {
        changes.push_back({BreakingChangeKind::TypeRemoval, name,
                           fmt::format("type '{}' exists in the database but not in the desired "
                                       "schema; removing it would delete all its instances",
                                       name)});
    }
    for (const auto& o : removeOwns) {
        changes.push_back({BreakingChangeKind::OwnsRemoval, o.typeName,
                           fmt::format("'{}' owns '{}' in the database but not in the desired "
                                       "schema; removing it would delete attribute data",
                                       o.typeName, o.attribute)});
    }
    for (const auto& p : removePlays) {
        changes.push_back({BreakingChangeKind::PlaysRemoval, p.typeName,
                           fmt::format("'{}' plays '{}' in the database but not in the desired "
                                       "schema; removing it would orphan existing role players",
                                       p.typeName, p.role)});
    }
    return changes;
}

SchemaDiff diffSchemas(const SchemaModel& desired, const SchemaModel& current) {
    SchemaDiff diff;

    for (const auto& a : desired.attributes) {
        if (!current.findAttribute(a.name)) {
            diff.addAttributes.push_back({a.name, a.valueType});
        }
    }

    for (const auto& e : desired.entities) {
        const auto* existing = current.findEntity(e.name);
        if (!existing) {
            diff.addEntities.push_back({e.name, formatEntityDefinition(e)});
            continue;
        }
        diffOwns(e, *existing, diff);
        diffPlays(e, *existing, diff);
    }

    for (const auto& r : desired.relations) {
        const auto* existing = current.findRelation(r.name);
        if (!existing) {
            diff.addRelations.push_back({r.name, formatRelationDefinition(r)});
            continue;
        }
        for (const auto& role : r.relates) {
            if (!existing->findRelates(role.role)) {
                diff.addRelates.push_back({r.name, role.role, role.card});
            }
        }
        diffOwns(r, *existing, diff);
        diffPlays(r, *existing, diff);
    }

    // Removals are reported, never generated
    for (const auto& e : current.entities) {
        if (!desired.findEntity(e.name)) {
            diff.removeTypes.push_back(e.name);
        }
    }
    for (const auto& r : current.relations) {
        if (!desired.findRelation(r.name)) {
            diff.removeTypes.push_back(r.name);
        }
    }
    for (const auto& a : current.attributes) {
        if (!desired.findAttribute(a.name)) {
            diff.removeTypes.push_back(a.name);
        }
    }

    return diff;
}

} // namespace strata::schema
