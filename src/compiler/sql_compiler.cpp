#include "compiler/sql_compiler.hpp"
#include "compiler/sql_verifier.hpp"
#include "core/utils.hpp"
#include "validator/expression_validator.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <set>
#include <unordered_map>

namespace sqlcomposer {

namespace {

constexpr std::string_view kIndent = "  ";

[[nodiscard]] bool is_named_parameter(std::string_view value) {
    if (value.size() < 2 || value[0] != ':') return false;
    const unsigned char first = static_cast<unsigned char>(value[1]);
    if (!std::isalpha(first) && first != '_') return false;
    return std::all_of(value.begin() + 2, value.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    });
}

[[nodiscard]] std::string join_strings(const std::vector<std::string>& parts, std::string_view sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

// "<column>_<fn>", then "<table>_<column>_<fn>", then numbered
[[nodiscard]] std::string unique_aggregate_alias(const ColumnId& column, AggregateFunction fn,
                                                 std::set<std::string>& taken) {
    const std::string fn_name = utils::to_lower(aggregate_function_to_string(fn));

    std::string alias = std::format("{}_{}", column.column, fn_name);
    if (taken.insert(alias).second) return alias;

    const std::string qualified = std::format("{}_{}_{}", column.table.name, column.column, fn_name);
    if (taken.insert(qualified).second) return qualified;

    for (int n = 2;; ++n) {
        alias = std::format("{}_{}", qualified, n);
        if (taken.insert(alias).second) return alias;
    }
}

// Swapping the operands of an outer join swaps its preserved side
[[nodiscard]] JoinType mirrored(JoinType type) {
    switch (type) {
        case JoinType::LEFT:  return JoinType::RIGHT;
        case JoinType::RIGHT: return JoinType::LEFT;
        default: return type;
    }
}

} // anonymous namespace

std::optional<SqlLayout> parse_sql_layout(std::string_view text) {
    static const std::unordered_map<std::string_view, SqlLayout> lookup = {
        {"compact", SqlLayout::COMPACT},
        {"pretty",  SqlLayout::PRETTY},
    };
    const auto it = lookup.find(utils::to_lower(std::string(text)));
    if (it == lookup.end()) return std::nullopt;
    return it->second;
}

SqlCompiler::SqlCompiler(CompilerOptions options)
    : options_(std::move(options)) {}

// ============================================================================
// Entry points
// ============================================================================

Result<CompiledQuery> SqlCompiler::compile(const SchemaModel& schema,
                                           const QueryState& state,
                                           CompileMode mode) const {
    auto fail = [](const Failure& f) {
        return Result<CompiledQuery>::error(f.category, f.message);
    };

    if (state.selected_tables.empty()) {
        return Result<CompiledQuery>::error(ErrorCategory::EMPTY_SELECTION_ERROR, "No tables selected");
    }
    if (auto f = check_structure(schema, state)) return fail(*f);
    if (auto f = check_calculated_columns(state)) return fail(*f);

    Clauses clauses;
    AliasMap aliases;
    CompiledQuery compiled;

    if (auto f = build_select(schema, state, clauses, aliases)) return fail(*f);
    if (auto f = build_from(state, mode, clauses, compiled.warnings)) return fail(*f);
    if (auto f = build_where(schema, state, clauses)) return fail(*f);

    for (const auto& col : state.group_by) {
        clauses.group_by.push_back(render_column(col));
    }

    if (auto f = build_order_by(state, aliases, clauses)) return fail(*f);

    if (state.limit > 0) {
        clauses.limit = state.limit;
    } else if (mode == CompileMode::GENERATE) {
        return Result<CompiledQuery>::error(ErrorCategory::CONSISTENCY_ERROR,
            std::format("Limit must be positive, got {}", state.limit));
    }

    compiled.sql = assemble(clauses);
    return Result<CompiledQuery>::ok(std::move(compiled));
}

Result<CompiledQuery> SqlCompiler::generate(const SchemaModel& schema,
                                            const QueryState& state) const {
    auto result = compile(schema, state, CompileMode::GENERATE);
    if (result.is_error()) {
        utils::log::error(std::format("SQL generation failed: {}: {}",
            error_category_to_string(result.error_category()), result.error_message()));
        return result;
    }

    for (const auto& warning : result.value().warnings) {
        utils::log::warn(warning);
    }

    if (options_.verify_syntax) {
        const auto verified = SqlVerifier::verify(result.value().sql);
        if (!verified.success) {
            auto message = verified.cursor_position > 0
                ? std::format("Generated SQL failed to parse: {} (at position {})",
                              verified.error_message, verified.cursor_position)
                : std::format("Generated SQL failed to parse: {}", verified.error_message);
            utils::log::error(message);
            return Result<CompiledQuery>::error(ErrorCategory::SYNTAX_ERROR, std::move(message));
        }
    }
    return result;
}

std::string SqlCompiler::preview(const SchemaModel& schema, const QueryState& state) const {
    try {
        const auto result = compile(schema, state, CompileMode::PREVIEW);
        if (result.is_error()) {
            if (result.error_category() == ErrorCategory::EMPTY_SELECTION_ERROR) {
                return std::format("-- {}", options_.empty_selection_message);
            }
            return std::format("-- {}: {}",
                error_category_to_string(result.error_category()), result.error_message());
        }

        std::string text;
        for (const auto& warning : result.value().warnings) {
            text += std::format("-- Warning: {}\n", warning);
        }
        text += result.value().sql;
        return text;
    } catch (const std::exception& e) {
        return std::format("-- Error: {}", e.what());
    }
}

// ============================================================================
// Pre-emission checks
// ============================================================================

SqlCompiler::Check SqlCompiler::check_structure(const SchemaModel& schema, const QueryState& state) {
    std::set<TableId> seen;
    for (const auto& table : state.selected_tables) {
        if (!seen.insert(table).second) {
            return Failure{ErrorCategory::STRUCTURAL_ERROR,
                std::format("Table {} is selected more than once", table.str())};
        }
        if (!schema.contains(table)) {
            return Failure{ErrorCategory::STRUCTURAL_ERROR,
                std::format("Table {} does not exist in schema", table.str())};
        }
    }

    auto check_column = [&](const ColumnId& col, std::string_view context) -> Check {
        if (!state.has_table(col.table)) {
            return Failure{ErrorCategory::STRUCTURAL_ERROR,
                std::format("{} column {} references table {}, which is not selected",
                            context, col.str(), col.table.str())};
        }
        if (!schema.find_column(col)) {
            return Failure{ErrorCategory::STRUCTURAL_ERROR,
                std::format("{} column {} does not exist in table {}",
                            context, col.str(), col.table.str())};
        }
        return std::nullopt;
    };

    for (const auto& col : state.selected_columns) {
        if (auto f = check_column(col, "Selected")) return f;
    }
    for (const auto& [col, fn] : state.aggregations) {
        if (auto f = check_column(col, "Aggregated")) return f;
    }
    for (const auto& col : state.group_by) {
        if (auto f = check_column(col, "GROUP BY")) return f;
    }
    for (const auto& sort : state.order_by) {
        if (auto f = check_column(sort.column, "ORDER BY")) return f;
    }
    for (const auto& filter : state.filters) {
        if (auto f = check_column(filter.column, "Filter")) return f;
    }
    for (const auto& join : state.joins) {
        if (join.from_column.empty() || join.to_column.empty()) {
            return Failure{ErrorCategory::STRUCTURAL_ERROR,
                std::format("Join between {} and {} is missing a column",
                            join.from_table.str(), join.to_table.str())};
        }
        if (auto f = check_column(join.from(), "Join")) return f;
        if (auto f = check_column(join.to(), "Join")) return f;
    }
    return std::nullopt;
}

SqlCompiler::Check SqlCompiler::check_calculated_columns(const QueryState& state) {
    std::set<std::string> aliases;
    for (const auto& calc : state.calculated_columns) {
        const auto validation = validate_expression(calc.alias, calc.expression);
        if (!validation.valid) {
            return Failure{ErrorCategory::EXPRESSION_VALIDATION_ERROR,
                std::format("Calculated column '{}': {}", calc.alias, validation.reason)};
        }
        // Aliases must already be in sanitize_alias form
        if (const std::string clean = sanitize_alias(calc.alias); clean != calc.alias) {
            return Failure{ErrorCategory::EXPRESSION_VALIDATION_ERROR,
                std::format("Calculated column alias '{}' is not a sanitized identifier (expected '{}')",
                            calc.alias, clean)};
        }
        if (!aliases.insert(calc.alias).second) {
            return Failure{ErrorCategory::EXPRESSION_VALIDATION_ERROR,
                std::format("Calculated column alias '{}' is used more than once", calc.alias)};
        }
    }
    return std::nullopt;
}

// ============================================================================
// Clause builders
// ============================================================================

SqlCompiler::Check SqlCompiler::build_select(const SchemaModel& schema, const QueryState& state,
                                             Clauses& clauses, AliasMap& aliases) const {
    const bool grouping = state.has_grouping();

    std::vector<ColumnId> projection;
    if (!state.selected_columns.empty()) {
        projection = state.selected_columns;
        for (const auto& [col, fn] : state.aggregations) {
            if (!state.has_column(col)) projection.push_back(col);
        }
    } else if (grouping) {
        for (const auto& table_id : state.selected_tables) {
            for (const auto& col : schema.find_table(table_id)->columns) {
                projection.emplace_back(table_id, col.name);
            }
        }
    } else {
        for (const auto& table_id : state.selected_tables) {
            clauses.select_items.push_back(render_table(table_id) + ".*");
        }
    }

    std::set<std::string> taken;
    for (const auto& calc : state.calculated_columns) taken.insert(calc.alias);

    for (const auto& col : projection) {
        const AggregateFunction fn = state.aggregation_of(col);
        if (fn == AggregateFunction::NONE) {
            if (grouping && !state.is_grouped(col)) {
                return Failure{ErrorCategory::CONSISTENCY_ERROR,
                    std::format("Column {} must appear in GROUP BY or be used in an aggregate function",
                                col.str())};
            }
            clauses.select_items.push_back(render_column(col));
            continue;
        }

        const std::string alias = unique_aggregate_alias(col, fn, taken);
        aliases[col] = alias;
        clauses.select_items.push_back(std::format("{}({}) AS {}",
            aggregate_function_to_string(fn), render_column(col), render_alias(alias)));
    }

    for (const auto& calc : state.calculated_columns) {
        clauses.select_items.push_back(
            std::format("({}) AS {}", calc.expression, render_alias(calc.alias)));
    }
    return std::nullopt;
}

SqlCompiler::Check SqlCompiler::build_from(const QueryState& state, CompileMode mode,
                                           Clauses& clauses, std::vector<std::string>& warnings) const {
    std::vector<TableId> introduced = {state.selected_tables.front()};
    clauses.from = render_table(introduced.front());

    auto is_introduced = [&](const TableId& t) {
        return std::find(introduced.begin(), introduced.end(), t) != introduced.end();
    };

    auto cross_join = [&](const TableId& table, std::string message) -> Check {
        if (options_.strict_cross_joins && mode == CompileMode::GENERATE) {
            return Failure{ErrorCategory::CONSISTENCY_ERROR, std::move(message)};
        }
        clauses.joins.push_back("CROSS JOIN " + render_table(table));
        introduced.push_back(table);
        warnings.push_back(std::move(message));
        return std::nullopt;
    };

    std::vector<const ExplicitJoin*> pending;
    for (const auto& join : state.joins) pending.push_back(&join);

    while (!pending.empty()) {
        // Attach everything reachable from the tables introduced so far
        bool progress = true;
        while (progress) {
            progress = false;
            std::vector<const ExplicitJoin*> deferred;
            for (const ExplicitJoin* join : pending) {
                const bool from_in = is_introduced(join->from_table);
                const bool to_in = is_introduced(join->to_table);

                if (from_in && to_in) {
                    return Failure{ErrorCategory::CONSISTENCY_ERROR,
                        std::format("Join {} = {} connects tables that are already joined",
                                    join->from().str(), join->to().str())};
                }
                if (from_in || to_in) {
                    const TableId& added = from_in ? join->to_table : join->from_table;
                    const JoinType type = from_in ? join->type : mirrored(join->type);
                    clauses.joins.push_back(render_join(*join, type, added));
                    introduced.push_back(added);
                    progress = true;
                } else {
                    deferred.push_back(join);
                }
            }
            pending = std::move(deferred);
        }

        // Detached join: bring in its left side unconditionally, then retry
        if (!pending.empty()) {
            const ExplicitJoin& detached = *pending.front();
            if (auto f = cross_join(detached.from_table, std::format(
                    "Table {} is emitted as CROSS JOIN so that join {} = {} can attach; "
                    "neither side is reachable from {}",
                    detached.from_table.str(), detached.from().str(), detached.to().str(),
                    introduced.front().str()))) {
                return f;
            }
        }
    }

    for (const auto& table : state.selected_tables) {
        if (is_introduced(table)) continue;
        if (auto f = cross_join(table, std::format(
                "Table {} is not joined to any other selected table; emitted as CROSS JOIN",
                table.str()))) {
            return f;
        }
    }
    return std::nullopt;
}

SqlCompiler::Check SqlCompiler::build_where(const SchemaModel& schema, const QueryState& state,
                                            Clauses& clauses) const {
    for (const auto& filter : state.filters) {
        const Column* column = schema.find_column(filter.column);
        std::string lhs = render_column(filter.column);
        const char* op = filter_operator_to_string(filter.op);

        if (is_unary(filter.op)) {
            clauses.where.push_back(std::format("{} {}", lhs, op));
            continue;
        }

        if (filter.op == FilterOperator::IN) {
            std::vector<std::string> items;
            for (const auto& raw : utils::split(filter.value, ',')) {
                const std::string item = utils::trim(raw);
                if (!item.empty()) items.push_back(render_value(item, column));
            }
            if (items.empty()) {
                return Failure{ErrorCategory::CONSISTENCY_ERROR,
                    std::format("Filter on {} uses IN with an empty value list", filter.column.str())};
            }
            clauses.where.push_back(std::format("{} IN ({})", lhs, join_strings(items, ", ")));
            continue;
        }

        if (is_pattern_match(filter.op)) {
            if (options_.cast_like_operands && column && !column->is_character_type()) {
                lhs += "::text";
            }
            const std::string pattern = is_named_parameter(filter.value)
                ? filter.value
                : utils::quote_literal(filter.value);
            clauses.where.push_back(std::format("{} {} {}", lhs, op, pattern));
            continue;
        }

        clauses.where.push_back(std::format("{} {} {}", lhs, op, render_value(filter.value, column)));
    }
    return std::nullopt;
}

SqlCompiler::Check SqlCompiler::build_order_by(const QueryState& state, const AliasMap& aliases,
                                               Clauses& clauses) const {
    const bool grouping = state.has_grouping();

    for (const auto& sort : state.order_by) {
        const char* direction = sort_direction_to_string(sort.direction);

        if (const auto it = aliases.find(sort.column); it != aliases.end()) {
            clauses.order_by.push_back(std::format("{} {}", render_alias(it->second), direction));
            continue;
        }
        if (grouping && !state.is_grouped(sort.column)) {
            return Failure{ErrorCategory::CONSISTENCY_ERROR,
                std::format("ORDER BY column {} must appear in GROUP BY or be aggregated",
                            sort.column.str())};
        }
        clauses.order_by.push_back(std::format("{} {}", render_column(sort.column), direction));
    }
    return std::nullopt;
}

// ============================================================================
// Rendering
// ============================================================================

std::string SqlCompiler::render_table(const TableId& table) const {
    if (!options_.quote_identifiers) return table.str();
    return utils::quote_identifier(table.schema) + "." + utils::quote_identifier(table.name);
}

std::string SqlCompiler::render_column(const ColumnId& column) const {
    if (!options_.quote_identifiers) return column.str();
    return render_table(column.table) + "." + utils::quote_identifier(column.column);
}

std::string SqlCompiler::render_alias(const std::string& alias) const {
    return options_.quote_identifiers ? utils::quote_identifier(alias) : alias;
}

std::string SqlCompiler::render_value(const std::string& value, const Column* column) const {
    if (is_named_parameter(value)) return value;

    // Numbers compared with a character column are still strings
    const bool character_column = column && column->is_character_type();
    if (utils::is_numeric_literal(value) && !character_column) return value;

    return utils::quote_literal(value);
}

std::string SqlCompiler::render_join(const ExplicitJoin& join, JoinType type,
                                     const TableId& introduced) const {
    return std::format("{} JOIN {} ON {} = {}",
        join_type_to_string(type), render_table(introduced),
        render_column(join.from()), render_column(join.to()));
}

std::string SqlCompiler::assemble(const Clauses& clauses) const {
    const bool pretty = options_.layout == SqlLayout::PRETTY;
    std::vector<std::string> parts;

    if (pretty) {
        std::string select = "SELECT";
        for (size_t i = 0; i < clauses.select_items.size(); ++i) {
            select += std::format("\n{}{}{}", kIndent, clauses.select_items[i],
                                  i + 1 < clauses.select_items.size() ? "," : "");
        }
        parts.push_back(std::move(select));
    } else {
        parts.push_back("SELECT " + join_strings(clauses.select_items, ", "));
    }

    parts.push_back("FROM " + clauses.from);
    for (const auto& join : clauses.joins) parts.push_back(join);

    if (!clauses.where.empty()) {
        const std::string sep = pretty ? std::format("\n{}AND ", kIndent) : std::string(" AND ");
        parts.push_back("WHERE " + join_strings(clauses.where, sep));
    }
    if (!clauses.group_by.empty()) {
        parts.push_back("GROUP BY " + join_strings(clauses.group_by, ", "));
    }
    if (!clauses.order_by.empty()) {
        parts.push_back("ORDER BY " + join_strings(clauses.order_by, ", "));
    }
    if (clauses.limit) {
        parts.push_back(std::format("LIMIT {}", *clauses.limit));
    }

    std::string sql = join_strings(parts, pretty ? "\n" : " ");
    if (options_.terminate_with_semicolon) sql += ';';
    return sql;
}

} // namespace sqlcomposer
