#pragma once

#include <string>
#include <string_view>

namespace sqlcomposer {

/**
 * @brief Syntax check for compiled SQL - wraps libpg_query (PostgreSQL's parser)
 *
 * Named parameters (":region") are not PostgreSQL syntax, so they are
 * rewritten to positional placeholders ("$1") before parsing. Occurrences
 * inside string literals, quoted identifiers and "::" casts are left alone.
 *
 * Thread-safety: stateless, safe for concurrent use
 */
class SqlVerifier {
public:
    struct VerifyResult {
        bool success = false;
        std::string error_message;
        int cursor_position = 0;        // 1-based offset into prepared_sql, 0 if unknown
        std::string prepared_sql;       // Text handed to the parser

        static VerifyResult ok(std::string sql) {
            VerifyResult result;
            result.success = true;
            result.prepared_sql = std::move(sql);
            return result;
        }

        static VerifyResult error(std::string message, int cursor, std::string sql) {
            VerifyResult result;
            result.success = false;
            result.error_message = std::move(message);
            result.cursor_position = cursor;
            result.prepared_sql = std::move(sql);
            return result;
        }
    };

    /**
     * @brief Parse sql and require exactly one SELECT statement
     */
    [[nodiscard]] static VerifyResult verify(std::string_view sql);

    /**
     * @brief Replace ":name" parameters with "$1", "$2", ...
     *
     * Repeated names reuse their first number.
     */
    [[nodiscard]] static std::string bind_named_parameters(std::string_view sql);
};

} // namespace sqlcomposer
