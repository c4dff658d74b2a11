#pragma once

#include <cstddef>
#include <string>

namespace sqlcomposer {

/**
 * @brief Shallow well-formedness check for calculated-column formulas
 *
 * Runs when a calculated column is authored, before it enters Query State.
 * Checks, in order: alias non-empty, expression non-empty, '(' count equals
 * ')' count. Not a SQL grammar check: a balanced but invalid expression is
 * accepted here and left to SqlVerifier or the database.
 */
struct ValidationResult {
    bool valid = false;
    std::string reason;

    static ValidationResult ok() {
        ValidationResult result;
        result.valid = true;
        return result;
    }

    static ValidationResult error(std::string message) {
        ValidationResult result;
        result.valid = false;
        result.reason = std::move(message);
        return result;
    }
};

[[nodiscard]] ValidationResult validate_expression(const std::string& alias,
                                                   const std::string& expression);

/**
 * @brief Normalize a user-typed alias: trim, whitespace runs to '_', lowercase
 *
 * "Total Price" -> "total_price"
 */
[[nodiscard]] std::string sanitize_alias(const std::string& raw);

} // namespace sqlcomposer
