#include "validator/expression_validator.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace sqlcomposer {

ValidationResult validate_expression(const std::string& alias, const std::string& expression) {
    if (utils::trim(alias).empty()) {
        return ValidationResult::error("Alias must not be empty");
    }
    if (utils::trim(expression).empty()) {
        return ValidationResult::error("Expression must not be empty");
    }

    const auto opened = std::count(expression.begin(), expression.end(), '(');
    const auto closed = std::count(expression.begin(), expression.end(), ')');
    if (opened != closed) {
        return ValidationResult::error(std::format(
            "Unbalanced parentheses: {} '(' opened, {} ')' closed", opened, closed));
    }

    return ValidationResult::ok();
}

std::string sanitize_alias(const std::string& raw) {
    const std::string trimmed = utils::trim(raw);
    std::string result;
    result.reserve(trimmed.size());

    bool in_space = false;
    for (const char c : trimmed) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!in_space) result += '_';
            in_space = true;
            continue;
        }
        in_space = false;
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

} // namespace sqlcomposer
