#pragma once

#include <string>
#include <optional>

namespace sqlcomposer {

/**
 * @brief Error categories for the composer
 *
 * STRUCTURAL_ERROR and CONSISTENCY_ERROR are the two compile-time classes:
 * a structural error is a dangling reference (table/column not selected or
 * not in the schema), a consistency error is a rule violation among
 * otherwise well-formed references (grouping, unjoined tables).
 */
enum class ErrorCategory {
    NONE,
    STRUCTURAL_ERROR,
    CONSISTENCY_ERROR,
    EMPTY_SELECTION_ERROR,
    EXPRESSION_VALIDATION_ERROR,
    SYNTAX_ERROR,
    PARSE_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                        return "None";
        case ErrorCategory::STRUCTURAL_ERROR:            return "StructuralError";
        case ErrorCategory::CONSISTENCY_ERROR:           return "ConsistencyError";
        case ErrorCategory::EMPTY_SELECTION_ERROR:       return "EmptySelectionError";
        case ErrorCategory::EXPRESSION_VALIDATION_ERROR: return "ExpressionValidationError";
        case ErrorCategory::SYNTAX_ERROR:                return "SyntaxError";
        case ErrorCategory::PARSE_ERROR:                 return "ParseError";
        default: return "Unknown";
    }
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

} // namespace sqlcomposer
