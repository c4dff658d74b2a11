#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace sqlcomposer {

// ============================================================================
// Basic Enums
// ============================================================================

enum class JoinType {
    INNER,
    LEFT,
    RIGHT,
    FULL
};

enum class FilterOperator {
    EQ,
    NE,
    GT,
    LT,
    GE,
    LE,
    LIKE,
    ILIKE,
    IN,
    IS_NULL,
    IS_NOT_NULL
};

enum class AggregateFunction {
    NONE,
    COUNT,
    SUM,
    AVG,
    MIN,
    MAX
};

enum class SortDirection {
    ASC,
    DESC
};

// Unary operators take no value operand
[[nodiscard]] inline constexpr bool is_unary(FilterOperator op) noexcept {
    return op == FilterOperator::IS_NULL || op == FilterOperator::IS_NOT_NULL;
}

[[nodiscard]] inline constexpr bool is_pattern_match(FilterOperator op) noexcept {
    return op == FilterOperator::LIKE || op == FilterOperator::ILIKE;
}

// ============================================================================
// Utility Functions
// ============================================================================

inline const char* join_type_to_string(JoinType type) {
    switch (type) {
        case JoinType::INNER: return "INNER";
        case JoinType::LEFT: return "LEFT";
        case JoinType::RIGHT: return "RIGHT";
        case JoinType::FULL: return "FULL";
        default: return "UNKNOWN";
    }
}

inline const char* filter_operator_to_string(FilterOperator op) {
    switch (op) {
        case FilterOperator::EQ: return "=";
        case FilterOperator::NE: return "!=";
        case FilterOperator::GT: return ">";
        case FilterOperator::LT: return "<";
        case FilterOperator::GE: return ">=";
        case FilterOperator::LE: return "<=";
        case FilterOperator::LIKE: return "LIKE";
        case FilterOperator::ILIKE: return "ILIKE";
        case FilterOperator::IN: return "IN";
        case FilterOperator::IS_NULL: return "IS NULL";
        case FilterOperator::IS_NOT_NULL: return "IS NOT NULL";
        default: return "UNKNOWN";
    }
}

inline const char* aggregate_function_to_string(AggregateFunction fn) {
    switch (fn) {
        case AggregateFunction::NONE: return "NONE";
        case AggregateFunction::COUNT: return "COUNT";
        case AggregateFunction::SUM: return "SUM";
        case AggregateFunction::AVG: return "AVG";
        case AggregateFunction::MIN: return "MIN";
        case AggregateFunction::MAX: return "MAX";
        default: return "UNKNOWN";
    }
}

inline const char* sort_direction_to_string(SortDirection direction) {
    switch (direction) {
        case SortDirection::ASC: return "ASC";
        case SortDirection::DESC: return "DESC";
        default: return "UNKNOWN";
    }
}

namespace detail {

// Case-insensitive lookup over a small static table; keys are stored upper case
template<typename E>
[[nodiscard]] std::optional<E> lookup_upper(
    const std::unordered_map<std::string_view, E>& table, std::string_view text) {
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    // Collapse inner whitespace runs so "IS  NOT NULL" still matches
    std::string normalized;
    normalized.reserve(upper.size());
    bool in_space = false;
    for (const char c : upper) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            in_space = true;
            continue;
        }
        if (in_space && !normalized.empty()) normalized += ' ';
        in_space = false;
        normalized += c;
    }

    if (const auto it = table.find(normalized); it != table.end()) {
        return it->second;
    }
    return std::nullopt;
}

} // namespace detail

[[nodiscard]] inline std::optional<JoinType> parse_join_type(std::string_view text) {
    static const std::unordered_map<std::string_view, JoinType> lookup = {
        {"INNER", JoinType::INNER},
        {"LEFT",  JoinType::LEFT},
        {"RIGHT", JoinType::RIGHT},
        {"FULL",  JoinType::FULL},
    };
    return detail::lookup_upper(lookup, text);
}

[[nodiscard]] inline std::optional<FilterOperator> parse_filter_operator(std::string_view text) {
    static const std::unordered_map<std::string_view, FilterOperator> lookup = {
        {"=",           FilterOperator::EQ},
        {"!=",          FilterOperator::NE},
        {"<>",          FilterOperator::NE},
        {">",           FilterOperator::GT},
        {"<",           FilterOperator::LT},
        {">=",          FilterOperator::GE},
        {"<=",          FilterOperator::LE},
        {"LIKE",        FilterOperator::LIKE},
        {"ILIKE",       FilterOperator::ILIKE},
        {"IN",          FilterOperator::IN},
        {"IS NULL",     FilterOperator::IS_NULL},
        {"IS NOT NULL", FilterOperator::IS_NOT_NULL},
    };
    return detail::lookup_upper(lookup, text);
}

[[nodiscard]] inline std::optional<AggregateFunction> parse_aggregate_function(std::string_view text) {
    static const std::unordered_map<std::string_view, AggregateFunction> lookup = {
        {"NONE",  AggregateFunction::NONE},
        {"COUNT", AggregateFunction::COUNT},
        {"SUM",   AggregateFunction::SUM},
        {"AVG",   AggregateFunction::AVG},
        {"MIN",   AggregateFunction::MIN},
        {"MAX",   AggregateFunction::MAX},
    };
    return detail::lookup_upper(lookup, text);
}

[[nodiscard]] inline std::optional<SortDirection> parse_sort_direction(std::string_view text) {
    static const std::unordered_map<std::string_view, SortDirection> lookup = {
        {"ASC",  SortDirection::ASC},
        {"DESC", SortDirection::DESC},
    };
    return detail::lookup_upper(lookup, text);
}

} // namespace sqlcomposer
