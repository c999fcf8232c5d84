#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <strata/core/types.h>

namespace strata::store {

/**
 * @brief Discriminator for values decoded at the store boundary
 */
enum class ValueKind { Null, Text, Integer, Double, Boolean, Timestamp, List };

/**
 * @brief Tagged value returned by the store for a single column of a result row
 *
 * Drivers decode wire data into this type once; code above the driver inspects
 * kind() or the typed accessors instead of guessing at representations.
 */
class Value {
public:
    using List = std::vector<Value>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(std::string text) : data_(std::move(text)) {}
    Value(const char* text) : data_(std::string(text)) {}
    Value(int64_t number) : data_(number) {}
    Value(int number) : data_(static_cast<int64_t>(number)) {}
    Value(double number) : data_(number) {}
    Value(bool flag) : data_(flag) {}
    Value(TimePoint at) : data_(at) {}
    Value(List items) : data_(std::move(items)) {}

    [[nodiscard]] ValueKind kind() const;

    [[nodiscard]] bool isNull() const { return kind() == ValueKind::Null; }
    [[nodiscard]] bool isText() const { return kind() == ValueKind::Text; }
    [[nodiscard]] bool isInteger() const { return kind() == ValueKind::Integer; }
    [[nodiscard]] bool isTimestamp() const { return kind() == ValueKind::Timestamp; }

    /**
     * @brief Typed accessors; return std::nullopt when the kind does not match
     */
    [[nodiscard]] std::optional<std::string> asText() const;
    [[nodiscard]] std::optional<int64_t> asInteger() const;
    [[nodiscard]] std::optional<double> asDouble() const;
    [[nodiscard]] std::optional<bool> asBoolean() const;
    [[nodiscard]] std::optional<TimePoint> asTimestamp() const;
    [[nodiscard]] const List* asList() const;

    /**
     * @brief Timestamp value, also accepting text in datetime literal or RFC 3339 form
     */
    [[nodiscard]] std::optional<TimePoint> toTimestamp() const;

    /**
     * @brief Human readable rendering, used in logs and test diagnostics
     */
    [[nodiscard]] std::string toString() const;

    bool operator==(const Value& other) const = default;

private:
    std::variant<std::monostate, std::string, int64_t, double, bool, TimePoint, List> data_;
};

using Row = std::map<std::string, Value, std::less<>>;
using Rows = std::vector<Row>;

/**
 * @brief Look up a column in a row, nullptr when absent
 */
const Value* findField(const Row& row, std::string_view column);

constexpr const char* valueKindToString(ValueKind kind) {
    switch (kind) {
        case ValueKind::Null:
            return "null";
        case ValueKind::Text:
            return "text";
        case ValueKind::Integer:
            return "integer";
        case ValueKind::Double:
            return "double";
        case ValueKind::Boolean:
            return "boolean";
        case ValueKind::Timestamp:
            return "timestamp";
        case ValueKind::List:
            return "list";
    }
    return "unknown";
}

// Literal formatting for statements

/**
 * @brief Escape backslashes and double quotes for a quoted string literal
 */
std::string escapeString(std::string_view text);

/**
 * @brief Quote and escape a string literal
 */
std::string quoteString(std::string_view text);

/**
 * @brief Format a UTC datetime literal (YYYY-MM-DDTHH:MM:SS)
 */
std::string formatDatetime(TimePoint at);

/**
 * @brief Format an RFC 3339 UTC timestamp (YYYY-MM-DDTHH:MM:SSZ)
 */
std::string formatTimestampUtc(TimePoint at);

/**
 * @brief Parse a datetime literal or RFC 3339 UTC timestamp
 *
 * Accepts "YYYY-MM-DDTHH:MM:SS" with an optional fractional part and an optional
 * trailing "Z". Returns std::nullopt for anything else.
 */
std::optional<TimePoint> parseDatetime(std::string_view text);

} // namespace strata::store
