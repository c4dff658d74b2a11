#pragma once

#include "builder/query_state.hpp"
#include "core/error.hpp"
#include "schema/schema_model.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlcomposer {

enum class SqlLayout {
    COMPACT,    // One line, clauses separated by a single space
    PRETTY      // One clause per line, select items indented
};

[[nodiscard]] inline const char* sql_layout_to_string(SqlLayout layout) {
    switch (layout) {
        case SqlLayout::COMPACT: return "compact";
        case SqlLayout::PRETTY:  return "pretty";
        default: return "unknown";
    }
}

[[nodiscard]] std::optional<SqlLayout> parse_sql_layout(std::string_view text);

/**
 * @brief PREVIEW tolerates what GENERATE rejects
 *
 * A non-positive limit is dropped in PREVIEW and an error in GENERATE.
 * strict_cross_joins only escalates in GENERATE.
 */
enum class CompileMode {
    PREVIEW,
    GENERATE
};

struct CompilerOptions {
    SqlLayout layout = SqlLayout::COMPACT;
    bool quote_identifiers = false;
    bool terminate_with_semicolon = false;
    bool cast_like_operands = true;     // <col>::text for LIKE on non-character columns
    bool strict_cross_joins = false;
    bool verify_syntax = false;         // generate() runs SqlVerifier
    std::string empty_selection_message = "Select tables to start";
};

struct CompiledQuery {
    std::string sql;
    std::vector<std::string> warnings;  // Unjoined tables, in emission order
};

/**
 * @brief Compiles a QueryState into one SQL SELECT statement
 *
 * Pure: the same schema, state and options always produce the same text,
 * so callers may re-run it in full on every state change.
 *
 * Checks run before any text is emitted:
 *   1. no selected tables                         -> EMPTY_SELECTION_ERROR
 *   2. dangling table or column references         -> STRUCTURAL_ERROR
 *   3. calculated columns failing validation, or
 *      with unsanitized or duplicate aliases       -> EXPRESSION_VALIDATION_ERROR
 * Grouping, join-graph and limit rules are checked while emitting
 * (CONSISTENCY_ERROR). Every message names the offending table, column or
 * alias.
 */
class SqlCompiler {
public:
    explicit SqlCompiler(CompilerOptions options = {});

    [[nodiscard]] Result<CompiledQuery> compile(const SchemaModel& schema,
                                                const QueryState& state,
                                                CompileMode mode) const;

    /**
     * @brief Strict compilation for execution or export
     *
     * GENERATE mode, plus a libpg_query parse of the result when
     * verify_syntax is set (SYNTAX_ERROR on failure).
     */
    [[nodiscard]] Result<CompiledQuery> generate(const SchemaModel& schema,
                                                 const QueryState& state) const;

    /**
     * @brief Live preview text; errors become SQL comments
     *
     * "-- <Category>: <message>" for failures, the configured placeholder
     * for an empty selection, and "-- Warning: <message>" lines ahead of
     * the SQL for warnings.
     */
    [[nodiscard]] std::string preview(const SchemaModel& schema, const QueryState& state) const;

    [[nodiscard]] const CompilerOptions& options() const { return options_; }

private:
    struct Clauses {
        std::vector<std::string> select_items;
        std::string from;
        std::vector<std::string> joins;
        std::vector<std::string> where;
        std::vector<std::string> group_by;
        std::vector<std::string> order_by;
        std::optional<int64_t> limit;
    };

    struct Failure {
        ErrorCategory category;
        std::string message;
    };
    using Check = std::optional<Failure>;     // nullopt when the step passed

    using AliasMap = std::map<ColumnId, std::string>;

    [[nodiscard]] static Check check_structure(const SchemaModel& schema, const QueryState& state);
    [[nodiscard]] static Check check_calculated_columns(const QueryState& state);

    [[nodiscard]] Check build_select(const SchemaModel& schema, const QueryState& state,
                                     Clauses& clauses, AliasMap& aliases) const;
    [[nodiscard]] Check build_from(const QueryState& state, CompileMode mode,
                                   Clauses& clauses, std::vector<std::string>& warnings) const;
    [[nodiscard]] Check build_where(const SchemaModel& schema, const QueryState& state,
                                    Clauses& clauses) const;
    [[nodiscard]] Check build_order_by(const QueryState& state, const AliasMap& aliases,
                                       Clauses& clauses) const;

    [[nodiscard]] std::string render_table(const TableId& table) const;
    [[nodiscard]] std::string render_column(const ColumnId& column) const;
    [[nodiscard]] std::string render_alias(const std::string& alias) const;
    [[nodiscard]] std::string render_value(const std::string& value, const Column* column) const;
    // type is the keyword as emitted, mirrored when the join introduces its from side
    [[nodiscard]] std::string render_join(const ExplicitJoin& join, JoinType type,
                                          const TableId& introduced) const;
    [[nodiscard]] std::string assemble(const Clauses& clauses) const;

    CompilerOptions options_;
};

} // namespace sqlcomposer
