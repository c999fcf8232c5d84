// Copyright 2025 Strata Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <fmt/format.h>
#include <charconv>
#include <ctime>
#include <strata/store/value.h>

namespace strata::store {

namespace {

template <class... Ts> struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

std::tm toUtcTm(TimePoint at) {
    std::time_t t = std::chrono::system_clock::to_time_t(at);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return tm;
}

bool parseFixedInt(std::string_view text, size_t pos, size_t len, int& out) {
    if (pos + len > text.size()) {
        return false;
    }
    auto first = text.data() + pos;
    auto last = first + len;
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

} // namespace

ValueKind Value::kind() const {
    return std::visit(Overloaded{[](const std::monostate&) { return ValueKind::Null; },
                                 [](const std::string&) { return ValueKind::Text; },
                                 [](const int64_t&) { return ValueKind::Integer; },
                                 [](const double&) { return ValueKind::Double; },
                                 [](const bool&) { return ValueKind::Boolean; },
                                 [](const TimePoint&) { return ValueKind::Timestamp; },
                                 [](const List&) { return ValueKind::List; }},
                      data_);
}

std::optional<std::string> Value::asText() const {
    if (auto* s = std::get_if<std::string>(&data_)) {
        return *s;
    }
    return std::nullopt;
}

std::optional<int64_t> Value::asInteger() const {
    if (auto* n = std::get_if<int64_t>(&data_)) {
        return *n;
    }
    return std::nullopt;
}

std::optional<double> Value::asDouble() const {
    if (auto* d = std::get_if<double>(&data_)) {
        return *d;
    }
    if (auto* n = std::get_if<int64_t>(&data_)) {
        return static_cast<double>(*n);
    }
    return std::nullopt;
}

std::optional<bool> Value::asBoolean() const {
    if (auto* b = std::get_if<bool>(&data_)) {
        return *b;
    }
    return std::nullopt;
}

std::optional<TimePoint> Value::asTimestamp() const {
    if (auto* t = std::get_if<TimePoint>(&data_)) {
        return *t;
    }
    return std::nullopt;
}

const Value::List* Value::asList() const {
    return std::get_if<List>(&data_);
}

std::optional<TimePoint> Value::toTimestamp() const {
    if (auto t = asTimestamp()) {
        return t;
    }
    if (auto* s = std::get_if<std::string>(&data_)) {
        return parseDatetime(*s);
    }
    return std::nullopt;
}

std::string Value::toString() const {
    return std::visit(
        Overloaded{[](const std::monostate&) -> std::string { return "null"; },
                   [](const std::string& s) -> std::string { return quoteString(s); },
                   [](const int64_t& n) -> std::string { return std::to_string(n); },
                   [](const double& d) -> std::string { return fmt::format("{}", d); },
                   [](const bool& b) -> std::string { return b ? "true" : "false"; },
                   [](const TimePoint& t) -> std::string { return formatDatetime(t); },
                   [](const List& items) -> std::string {
                       std::string out = "[";
                       for (size_t i = 0; i < items.size(); ++i) {
                           if (i > 0) {
                               out += ", ";
                           }
                           out += items[i].toString();
                       }
                       return out + "]";
                   }},
        data_);
}

const Value* findField(const Row& row, std::string_view column) {
    auto it = row.find(column);
    return it == row.end() ? nullptr : &it->second;
}

std::string escapeString(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '\\' || c == '"') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

std::string quoteString(std::string_view text) {
    return "\"" + escapeString(text) + "\"";
}

std::string formatDatetime(TimePoint at) {
    auto tm = toUtcTm(at);
    return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}", tm.tm_year + 1900,
                       tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
}

std::string formatTimestampUtc(TimePoint at) {
    return formatDatetime(at) + "Z";
}

std::optional<TimePoint> parseDatetime(std::string_view text) {
    // YYYY-MM-DDTHH:MM:SS
    if (text.size() < 19 || text[4] != '-' || text[7] != '-' || (text[10] != 'T' && text[10] != ' ') ||
        text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }

    std::tm tm{};
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!parseFixedInt(text, 0, 4, year) || !parseFixedInt(text, 5, 2, month) ||
        !parseFixedInt(text, 8, 2, day) || !parseFixedInt(text, 11, 2, hour) ||
        !parseFixedInt(text, 14, 2, minute) || !parseFixedInt(text, 17, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
        second > 60) {
        return std::nullopt;
    }

    size_t pos = 19;
    long long nanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        long long scale = 100000000;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            nanos += (text[pos] - '0') * scale;
            scale /= 10;
            ++pos;
        }
    }
    if (pos < text.size() && text[pos] == 'Z') {
        ++pos;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    auto at = std::chrono::system_clock::from_time_t(t);
    return at + std::chrono::duration_cast<std::chrono::system_clock::duration>(
                    std::chrono::nanoseconds(nanos));
}

} // namespace strata::store
