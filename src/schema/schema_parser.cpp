// Copyright 2025 Strata Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <vector>
#include <strata/schema/schema_parser.h>

namespace strata::schema {

namespace {

enum class TokenType { Word, Annotation, QuotedString, Comma, Semicolon, Symbol, EndOfInput };

struct Token {
    TokenType type;
    std::string value;
    size_t position;
};

bool isWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == ':' ||
           c == '[' || c == ']' || c == '$' || c == '.';
}

class SchemaTokenizer {
public:
    explicit SchemaTokenizer(std::string_view text) : text_(text) {}

    Result<std::vector<Token>> tokenize() {
        std::vector<Token> tokens;

        while (true) {
            skipWhitespaceAndComments();
            if (isAtEnd()) {
                break;
            }

            size_t startPos = position_;
            char c = peek();

            if (c == ',') {
                advance();
                tokens.push_back({TokenType::Comma, ",", startPos});
            } else if (c == ';') {
                advance();
                tokens.push_back({TokenType::Semicolon, ";", startPos});
            } else if (c == '"' || c == '\'') {
                auto quoted = readQuotedString(c);
                if (!quoted) {
                    return quoted.error();
                }
                tokens.push_back({TokenType::QuotedString, std::move(quoted).value(), startPos});
            } else if (c == '@') {
                auto annotation = readAnnotation();
                if (!annotation) {
                    return annotation.error();
                }
                tokens.push_back({TokenType::Annotation, std::move(annotation).value(), startPos});
            } else if (isWordChar(c)) {
                std::string value;
                while (!isAtEnd() && isWordChar(peek())) {
                    value += advance();
                }
                tokens.push_back({TokenType::Word, std::move(value), startPos});
            } else {
                advance();
                tokens.push_back({TokenType::Symbol, std::string(1, c), startPos});
            }
        }

        tokens.push_back({TokenType::EndOfInput, "", text_.size()});
        return tokens;
    }

private:
    std::string_view text_;
    size_t position_ = 0;

    bool isAtEnd() const { return position_ >= text_.size(); }

    char peek() const { return isAtEnd() ? '\0' : text_[position_]; }

    char advance() { return isAtEnd() ? '\0' : text_[position_++]; }

    void skipWhitespaceAndComments() {
        while (!isAtEnd()) {
            char c = peek();
            if (std::isspace(static_cast<unsigned char>(c))) {
                advance();
            } else if (c == '#') {
                while (!isAtEnd() && peek() != '\n') {
                    advance();
                }
            } else {
                break;
            }
        }
    }

    Result<std::string> readQuotedString(char quote) {
        size_t startPos = position_;
        advance(); // Skip opening quote

        std::string value;
        while (!isAtEnd() && peek() != quote) {
            if (peek() == '\\') {
                advance();
            }
            value += advance();
        }

        if (isAtEnd()) {
            return Error{ErrorCode::InvalidData,
                         fmt::format("unterminated string at offset {}", startPos)};
        }
        advance(); // Skip closing quote
        return value;
    }

    // "@name" or "@name(args)"; string arguments may contain parentheses
    Result<std::string> readAnnotation() {
        size_t startPos = position_;
        std::string value(1, advance());
        while (!isAtEnd() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_' ||
                              peek() == '-')) {
            value += advance();
        }

        if (peek() != '(') {
            return value;
        }

        int depth = 0;
        char quote = '\0';
        while (!isAtEnd()) {
            char c = advance();
            value += c;
            if (quote != '\0') {
                if (c == '\\' && !isAtEnd()) {
                    value += advance();
                } else if (c == quote) {
                    quote = '\0';
                }
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '(') {
                ++depth;
            } else if (c == ')' && --depth == 0) {
                return value;
            }
        }
        return Error{ErrorCode::InvalidData,
                     fmt::format("unterminated annotation at offset {}", startPos)};
    }
};

bool isKeyword(const Token& token, std::string_view keyword) {
    if (token.type != TokenType::Word || token.value.size() != keyword.size()) {
        return false;
    }
    return std::equal(token.value.begin(), token.value.end(), keyword.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == b;
    });
}

bool startsDefinition(const Token& token) {
    return isKeyword(token, "entity") || isKeyword(token, "relation") ||
           isKeyword(token, "attribute") || isKeyword(token, "struct") ||
           isKeyword(token, "fun") || isKeyword(token, "define");
}

// "email[]" declares a list ownership; the model only tracks the attribute
std::string stripListSuffix(std::string name) {
    if (name.size() > 2 && name.ends_with("[]")) {
        name.resize(name.size() - 2);
    }
    return name;
}

// "@card( 0 .. 1 )" -> "0..1"
std::string annotationArgument(const std::string& annotation) {
    auto open = annotation.find('(');
    auto close = annotation.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close <= open) {
        return {};
    }
    std::string arg;
    for (size_t i = open + 1; i < close; ++i) {
        if (!std::isspace(static_cast<unsigned char>(annotation[i]))) {
            arg += annotation[i];
        }
    }
    return arg;
}

bool annotationIs(const Token& token, std::string_view name) {
    if (token.type != TokenType::Annotation) {
        return false;
    }
    std::string_view value = token.value;
    return value == name || (value.starts_with(name) && value.size() > name.size() &&
                             value[name.size()] == '(');
}

enum class TypeKind { Attribute, Entity, Relation };

constexpr const char* typeKindToString(TypeKind kind) {
    switch (kind) {
        case TypeKind::Attribute:
            return "attribute";
        case TypeKind::Entity:
            return "entity";
        case TypeKind::Relation:
            return "relation";
    }
    return "type";
}

using Clause = std::vector<Token>;

/**
 * Applies one definition (a statement split at top-level commas) to a model.
 */
class DefinitionApplier {
public:
    explicit DefinitionApplier(SchemaModel& model) : model_(model) {}

    Result<void> apply(const std::vector<Clause>& clauses) {
        const Clause& head = clauses.front();
        size_t pos = 0;
        attribute_ = nullptr;
        entity_ = nullptr;
        relation_ = nullptr;

        std::optional<TypeKind> kind;
        if (isKeyword(head[0], "entity")) {
            kind = TypeKind::Entity;
        } else if (isKeyword(head[0], "relation")) {
            kind = TypeKind::Relation;
        } else if (isKeyword(head[0], "attribute")) {
            kind = TypeKind::Attribute;
        }
        if (kind) {
            ++pos;
        }

        if (pos >= head.size() || head[pos].type != TokenType::Word) {
            return Error{ErrorCode::InvalidData,
                         fmt::format("expected type name at offset {}", head[0].position)};
        }
        name_ = head[pos].value;
        ++pos;

        if (auto target = selectTarget(kind); !target) {
            return target;
        }

        if (auto result = applyClause(head, pos); !result) {
            return result;
        }
        for (size_t i = 1; i < clauses.size(); ++i) {
            if (auto result = applyClause(clauses[i], 0); !result) {
                return result;
            }
        }
        return {};
    }

private:
    SchemaModel& model_;
    std::string name_;
    AttributeSpec* attribute_ = nullptr;
    EntitySpec* entity_ = nullptr;
    RelationSpec* relation_ = nullptr;

    Result<void> selectTarget(std::optional<TypeKind> kind) {
        if (!kind) {
            // Additive form against an existing type
            if ((entity_ = model_.findEntity(name_))) {
                return {};
            }
            if ((relation_ = model_.findRelation(name_))) {
                return {};
            }
            for (auto& a : model_.attributes) {
                if (a.name == name_) {
                    attribute_ = &a;
                    return {};
                }
            }
            return Error{ErrorCode::InvalidData,
                         fmt::format("definition refers to unknown type '{}'", name_)};
        }

        if (auto conflict = existingKind(); conflict && *conflict != *kind) {
            return Error{ErrorCode::InvalidData,
                         fmt::format("'{}' is already defined as {}", name_,
                                     typeKindToString(*conflict))};
        }

        switch (*kind) {
            case TypeKind::Entity:
                entity_ = model_.findEntity(name_);
                if (!entity_) {
                    model_.entities.push_back(EntitySpec{.name = name_});
                    entity_ = &model_.entities.back();
                }
                break;
            case TypeKind::Relation:
                relation_ = model_.findRelation(name_);
                if (!relation_) {
                    model_.relations.push_back(RelationSpec{.name = name_});
                    relation_ = &model_.relations.back();
                }
                break;
            case TypeKind::Attribute:
                for (auto& a : model_.attributes) {
                    if (a.name == name_) {
                        attribute_ = &a;
                    }
                }
                if (!attribute_) {
                    model_.attributes.push_back(AttributeSpec{name_, ""});
                    attribute_ = &model_.attributes.back();
                }
                break;
        }
        return {};
    }

    std::optional<TypeKind> existingKind() const {
        if (model_.findEntity(name_)) {
            return TypeKind::Entity;
        }
        if (model_.findRelation(name_)) {
            return TypeKind::Relation;
        }
        if (model_.findAttribute(name_)) {
            return TypeKind::Attribute;
        }
        return std::nullopt;
    }

    Error unexpected(const Token& token) const {
        return Error{ErrorCode::InvalidData,
                     fmt::format("unexpected '{}' at offset {} in definition of '{}'",
                                 token.value, token.position, name_)};
    }

    Result<std::string> expectWord(const Clause& clause, size_t& pos, std::string_view after) const {
        if (pos >= clause.size() || clause[pos].type != TokenType::Word) {
            return Error{ErrorCode::InvalidData,
                         fmt::format("expected a name after '{}' in definition of '{}'", after,
                                     name_)};
        }
        return clause[pos++].value;
    }

    Result<void> applyClause(const Clause& clause, size_t pos) {
        while (pos < clause.size()) {
            const Token& token = clause[pos];

            if (token.type == TokenType::Annotation) {
                if (annotationIs(token, "@abstract")) {
                    setAbstract();
                }
                ++pos;
            } else if (isKeyword(token, "sub")) {
                ++pos;
                auto parent = expectWord(clause, pos, "sub");
                if (!parent) {
                    return parent.error();
                }
                setParent(std::move(parent).value());
            } else if (isKeyword(token, "owns")) {
                ++pos;
                auto attribute = expectWord(clause, pos, "owns");
                if (!attribute) {
                    return attribute.error();
                }
                OwnsSpec owns{.attribute = stripListSuffix(std::move(attribute).value())};
                for (; pos < clause.size() && clause[pos].type == TokenType::Annotation; ++pos) {
                    if (annotationIs(clause[pos], "@key")) {
                        owns.key = true;
                    } else if (annotationIs(clause[pos], "@unique")) {
                        owns.unique = true;
                    } else if (annotationIs(clause[pos], "@card")) {
                        owns.card = annotationArgument(clause[pos].value);
                    }
                }
                if (auto result = addOwns(std::move(owns)); !result) {
                    return result;
                }
            } else if (isKeyword(token, "relates")) {
                if (!relation_) {
                    return unexpected(token);
                }
                ++pos;
                auto role = expectWord(clause, pos, "relates");
                if (!role) {
                    return role.error();
                }
                RelatesSpec relates{.role = stripListSuffix(std::move(role).value())};
                if (pos < clause.size() && isKeyword(clause[pos], "as")) {
                    ++pos;
                    if (auto overridden = expectWord(clause, pos, "as"); !overridden) {
                        return overridden.error();
                    }
                }
                for (; pos < clause.size() && clause[pos].type == TokenType::Annotation; ++pos) {
                    if (annotationIs(clause[pos], "@card")) {
                        relates.card = annotationArgument(clause[pos].value);
                    }
                }
                addRelates(std::move(relates));
            } else if (isKeyword(token, "plays")) {
                ++pos;
                auto role = expectWord(clause, pos, "plays");
                if (!role) {
                    return role.error();
                }
                if (auto result = addPlays(std::move(role).value()); !result) {
                    return result;
                }
                while (pos < clause.size() && clause[pos].type == TokenType::Annotation) {
                    ++pos;
                }
            } else if (isKeyword(token, "value")) {
                if (!attribute_) {
                    return unexpected(token);
                }
                ++pos;
                auto valueType = expectWord(clause, pos, "value");
                if (!valueType) {
                    return valueType.error();
                }
                attribute_->valueType = std::move(valueType).value();
            } else if (isKeyword(token, "alias")) {
                ++pos;
                if (auto alias = expectWord(clause, pos, "alias"); !alias) {
                    return alias.error();
                }
            } else {
                return unexpected(token);
            }
        }
        return {};
    }

    void setAbstract() {
        if (entity_) {
            entity_->abstract = true;
        } else if (relation_) {
            relation_->abstract = true;
        }
    }

    void setParent(std::string parent) {
        if (entity_) {
            entity_->parent = std::move(parent);
        } else if (relation_) {
            relation_->parent = std::move(parent);
        }
    }

    static void mergeOwns(std::vector<OwnsSpec>& list, OwnsSpec owns) {
        auto it = std::find_if(list.begin(), list.end(), [&](const OwnsSpec& o) {
            return o.attribute == owns.attribute;
        });
        if (it == list.end()) {
            list.push_back(std::move(owns));
        } else {
            *it = std::move(owns);
        }
    }

    Result<void> addOwns(OwnsSpec owns) {
        if (entity_) {
            mergeOwns(entity_->owns, std::move(owns));
        } else if (relation_) {
            mergeOwns(relation_->owns, std::move(owns));
        } else {
            return Error{ErrorCode::InvalidData,
                         fmt::format("attribute '{}' cannot own '{}'", name_, owns.attribute)};
        }
        return {};
    }

    void addRelates(RelatesSpec relates) {
        auto& list = relation_->relates;
        auto it = std::find_if(list.begin(), list.end(), [&](const RelatesSpec& r) {
            return r.role == relates.role;
        });
        if (it == list.end()) {
            list.push_back(std::move(relates));
        } else {
            *it = std::move(relates);
        }
    }

    Result<void> addPlays(std::string role) {
        std::vector<std::string>* plays = nullptr;
        if (entity_) {
            plays = &entity_->plays;
        } else if (relation_) {
            plays = &relation_->plays;
        } else {
            return Error{ErrorCode::InvalidData,
                         fmt::format("attribute '{}' cannot play '{}'", name_, role)};
        }
        if (std::find(plays->begin(), plays->end(), role) == plays->end()) {
            plays->push_back(std::move(role));
        }
        return {};
    }
};

} // namespace

Result<SchemaModel> TypeQLSchemaParser::parse(std::string_view text) const {
    SchemaModel model;
    if (auto result = parseInto(text, model); !result) {
        return result.error();
    }
    return model;
}

Result<void> TypeQLSchemaParser::parseInto(std::string_view text, SchemaModel& model) const {
    SchemaTokenizer tokenizer(text);
    auto tokenResult = tokenizer.tokenize();
    if (!tokenResult) {
        return tokenResult.error();
    }
    const auto& tokens = tokenResult.value();

    SchemaModel working = model;
    DefinitionApplier applier(working);

    size_t pos = 0;
    auto skipStatement = [&] {
        while (tokens[pos].type != TokenType::EndOfInput && tokens[pos].type != TokenType::Semicolon) {
            ++pos;
        }
        if (tokens[pos].type == TokenType::Semicolon) {
            ++pos;
        }
    };

    while (tokens[pos].type != TokenType::EndOfInput) {
        const Token& token = tokens[pos];

        if (isKeyword(token, "define")) {
            ++pos;
            continue;
        }
        if (token.type == TokenType::Semicolon) {
            ++pos;
            continue;
        }
        if (isKeyword(token, "struct")) {
            skipStatement();
            continue;
        }
        if (isKeyword(token, "fun")) {
            // A function body holds several statements; it ends where the next definition starts
            skipStatement();
            while (tokens[pos].type != TokenType::EndOfInput && !startsDefinition(tokens[pos])) {
                skipStatement();
            }
            continue;
        }

        std::vector<Clause> clauses(1);
        while (tokens[pos].type != TokenType::EndOfInput && tokens[pos].type != TokenType::Semicolon) {
            if (tokens[pos].type == TokenType::Comma) {
                clauses.emplace_back();
            } else {
                clauses.back().push_back(tokens[pos]);
            }
            ++pos;
        }
        if (tokens[pos].type != TokenType::Semicolon) {
            return Error{ErrorCode::InvalidData,
                         fmt::format("unterminated definition at offset {}", token.position)};
        }
        ++pos;

        auto empty = std::find_if(clauses.begin(), clauses.end(),
                                  [](const Clause& c) { return c.empty(); });
        if (empty != clauses.end()) {
            return Error{ErrorCode::InvalidData,
                         fmt::format("empty clause in definition at offset {}", token.position)};
        }

        if (auto result = applier.apply(clauses); !result) {
            return result;
        }
    }

    model = std::move(working);
    return {};
}

} // namespace strata::schema
