#include "compiler/sql_verifier.hpp"
#include "core/utils.hpp"

// libpg_query C API
extern "C" {
#include "pg_query.h"
}

#include <nlohmann/json.hpp>

#include <cctype>
#include <format>
#include <unordered_map>

using json = nlohmann::json;

namespace sqlcomposer {

static constexpr const char* kSelectStmt = "SelectStmt";

[[nodiscard]] static inline bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

[[nodiscard]] static inline bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string SqlVerifier::bind_named_parameters(std::string_view sql) {
    std::string out;
    out.reserve(sql.size());
    std::unordered_map<std::string, int> numbers;

    size_t i = 0;
    while (i < sql.size()) {
        const char c = sql[i];

        // Copy quoted runs verbatim; doubled quotes stay inside the run
        if (c == '\'' || c == '"') {
            const char quote = c;
            out += c;
            ++i;
            while (i < sql.size()) {
                out += sql[i];
                if (sql[i] == quote) {
                    if (i + 1 < sql.size() && sql[i + 1] == quote) {
                        out += sql[++i];
                    } else {
                        ++i;
                        break;
                    }
                }
                ++i;
            }
            continue;
        }

        // "::type" casts
        if (c == ':' && i + 1 < sql.size() && sql[i + 1] == ':') {
            out += "::";
            i += 2;
            continue;
        }

        if (c == ':' && i + 1 < sql.size() && is_ident_start(sql[i + 1])) {
            size_t end = i + 1;
            while (end < sql.size() && is_ident_char(sql[end])) ++end;

            const std::string name(sql.substr(i + 1, end - i - 1));
            const auto [it, inserted] = numbers.try_emplace(name, static_cast<int>(numbers.size()) + 1);
            out += std::format("${}", it->second);
            i = end;
            continue;
        }

        out += c;
        ++i;
    }
    return out;
}

SqlVerifier::VerifyResult SqlVerifier::verify(std::string_view sql) {
    std::string prepared = bind_named_parameters(utils::trim(std::string(sql)));
    if (prepared.empty()) {
        return VerifyResult::error("Empty SQL query", 0, std::move(prepared));
    }

    PgQueryParseResult parse_result = pg_query_parse(prepared.c_str());

    // Early return: parse error
    if (parse_result.error) {
        std::string error_msg = parse_result.error->message
            ? parse_result.error->message
            : "Unknown parse error";
        const int cursor = parse_result.error->cursorpos;
        pg_query_free_parse_result(parse_result);
        return VerifyResult::error(std::move(error_msg), cursor, std::move(prepared));
    }

    json tree;
    try {
        tree = json::parse(parse_result.parse_tree ? parse_result.parse_tree : "{}");
    } catch (const json::exception& e) {
        pg_query_free_parse_result(parse_result);
        return VerifyResult::error(std::format("Unreadable parse tree: {}", e.what()), 0,
                                   std::move(prepared));
    }
    pg_query_free_parse_result(parse_result);

    // {"version": N, "stmts": [{"stmt": {"SelectStmt": {...}}}]}
    if (!tree.contains("stmts") || !tree["stmts"].is_array() || tree["stmts"].size() != 1) {
        return VerifyResult::error("Expected exactly one statement", 0, std::move(prepared));
    }
    const auto& stmt = tree["stmts"][0];
    if (!stmt.contains("stmt") || !stmt["stmt"].contains(kSelectStmt)) {
        return VerifyResult::error("Statement is not a SELECT", 0, std::move(prepared));
    }

    return VerifyResult::ok(std::move(prepared));
}

} // namespace sqlcomposer
