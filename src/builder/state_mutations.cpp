#include "builder/state_mutations.hpp"
#include "core/utils.hpp"
#include "validator/expression_validator.hpp"

#include <algorithm>
#include <format>

namespace sqlcomposer::mutation {

namespace {

// In-place helpers shared by the transitions below. Each public transition
// copies the state once and then edits the copy.

void ensure_table(QueryState& s, const TableId& table) {
    if (!s.has_table(table)) s.selected_tables.push_back(table);
}

template<typename T, typename Pred>
void remove_where(std::vector<T>& v, Pred pred) {
    v.erase(std::remove_if(v.begin(), v.end(), pred), v.end());
}

template<typename T>
auto find_by_id(std::vector<T>& v, const std::string& id) {
    return std::find_if(v.begin(), v.end(), [&](const T& item) { return item.id == id; });
}

void select_column_in_place(QueryState& s, const ColumnId& column) {
    ensure_table(s, column.table);
    if (!s.has_column(column)) s.selected_columns.push_back(column);
}

void deselect_column_in_place(QueryState& s, const ColumnId& column) {
    remove_where(s.selected_columns, [&](const ColumnId& c) { return c == column; });
    s.aggregations.erase(column);
}

} // anonymous namespace

// ============================================================================
// Tables
// ============================================================================

QueryState add_table(const QueryState& state, const TableId& table) {
    QueryState next = state;
    ensure_table(next, table);
    return next;
}

QueryState remove_table(const QueryState& state, const TableId& table) {
    QueryState next = state;
    const auto on_table = [&](const ColumnId& c) { return c.belongs_to(table); };

    remove_where(next.selected_tables, [&](const TableId& t) { return t == table; });
    remove_where(next.selected_columns, on_table);
    remove_where(next.group_by, on_table);
    remove_where(next.order_by, [&](const OrderBy& o) { return on_table(o.column); });
    remove_where(next.filters, [&](const Filter& f) { return on_table(f.column); });
    remove_where(next.joins, [&](const ExplicitJoin& j) { return j.mentions(table); });
    std::erase_if(next.aggregations, [&](const auto& entry) { return on_table(entry.first); });
    return next;
}

QueryState toggle_table(const QueryState& state, const TableId& table) {
    return state.has_table(table) ? remove_table(state, table) : add_table(state, table);
}

QueryState clear_all(const QueryState& state) {
    QueryState next;
    next.limit = state.limit;
    return next;
}

// ============================================================================
// Columns
// ============================================================================

QueryState toggle_column(const QueryState& state, const ColumnId& column) {
    QueryState next = state;
    if (next.has_column(column)) {
        deselect_column_in_place(next, column);
    } else {
        select_column_in_place(next, column);
    }
    return next;
}

QueryState select_columns(const QueryState& state, const TableId& table,
                          const std::vector<std::string>& column_names) {
    QueryState next = state;
    ensure_table(next, table);
    for (const auto& name : column_names) {
        select_column_in_place(next, ColumnId(table, name));
    }
    return next;
}

QueryState deselect_columns(const QueryState& state, const TableId& table,
                            const std::vector<std::string>& column_names) {
    QueryState next = state;
    for (const auto& name : column_names) {
        deselect_column_in_place(next, ColumnId(table, name));
    }
    return next;
}

QueryState set_aggregation(const QueryState& state, const ColumnId& column,
                           AggregateFunction fn) {
    QueryState next = state;
    if (fn == AggregateFunction::NONE) {
        next.aggregations.erase(column);
        return next;
    }
    next.aggregations[column] = fn;
    select_column_in_place(next, column);
    return next;
}

// ============================================================================
// Joins
// ============================================================================

QueryState add_join(const QueryState& state, ExplicitJoin join) {
    QueryState next = state;
    if (join.id.empty()) join.id = utils::generate_uuid();
    ensure_table(next, join.from_table);
    ensure_table(next, join.to_table);
    next.joins.push_back(std::move(join));
    return next;
}

QueryState update_join(const QueryState& state, const std::string& id, ExplicitJoin join) {
    QueryState next = state;
    auto it = find_by_id(next.joins, id);
    if (it == next.joins.end()) return next;

    join.id = id;
    ensure_table(next, join.from_table);
    ensure_table(next, join.to_table);
    *it = std::move(join);
    return next;
}

QueryState remove_join(const QueryState& state, const std::string& id) {
    QueryState next = state;
    remove_where(next.joins, [&](const ExplicitJoin& j) { return j.id == id; });
    return next;
}

// ============================================================================
// Filters
// ============================================================================

QueryState add_filter(const QueryState& state, Filter filter) {
    QueryState next = state;
    if (filter.id.empty()) filter.id = utils::generate_uuid();
    ensure_table(next, filter.column.table);
    next.filters.push_back(std::move(filter));
    return next;
}

QueryState update_filter(const QueryState& state, const std::string& id, Filter filter) {
    QueryState next = state;
    auto it = find_by_id(next.filters, id);
    if (it == next.filters.end()) return next;

    filter.id = id;
    ensure_table(next, filter.column.table);
    *it = std::move(filter);
    return next;
}

QueryState remove_filter(const QueryState& state, const std::string& id) {
    QueryState next = state;
    remove_where(next.filters, [&](const Filter& f) { return f.id == id; });
    return next;
}

// ============================================================================
// Grouping & ordering
// ============================================================================

QueryState toggle_group_by(const QueryState& state, const ColumnId& column) {
    QueryState next = state;
    if (next.is_grouped(column)) {
        remove_where(next.group_by, [&](const ColumnId& c) { return c == column; });
    } else {
        ensure_table(next, column.table);
        next.group_by.push_back(column);
    }
    return next;
}

QueryState add_sort(const QueryState& state, OrderBy sort) {
    QueryState next = state;
    if (sort.id.empty()) sort.id = utils::generate_uuid();
    ensure_table(next, sort.column.table);
    next.order_by.push_back(std::move(sort));
    return next;
}

QueryState update_sort(const QueryState& state, const std::string& id, OrderBy sort) {
    QueryState next = state;
    auto it = find_by_id(next.order_by, id);
    if (it == next.order_by.end()) return next;

    sort.id = id;
    ensure_table(next, sort.column.table);
    *it = std::move(sort);
    return next;
}

QueryState remove_sort(const QueryState& state, const std::string& id) {
    QueryState next = state;
    remove_where(next.order_by, [&](const OrderBy& o) { return o.id == id; });
    return next;
}

// ============================================================================
// Calculated columns
// ============================================================================

Result<QueryState> add_calculated_column(const QueryState& state,
                                         const std::string& alias,
                                         const std::string& expression) {
    const std::string clean_alias = sanitize_alias(alias);
    const auto validation = validate_expression(clean_alias, expression);
    if (!validation.valid) {
        return Result<QueryState>::error(ErrorCategory::EXPRESSION_VALIDATION_ERROR,
                                         validation.reason);
    }

    const bool taken = std::any_of(state.calculated_columns.begin(), state.calculated_columns.end(),
        [&](const CalculatedColumn& c) { return c.alias == clean_alias; });
    if (taken) {
        return Result<QueryState>::error(ErrorCategory::EXPRESSION_VALIDATION_ERROR,
            std::format("Alias '{}' is already used by another calculated column", clean_alias));
    }

    QueryState next = state;
    CalculatedColumn calc;
    calc.id = utils::generate_uuid();
    calc.alias = clean_alias;
    calc.expression = utils::trim(expression);
    next.calculated_columns.push_back(std::move(calc));
    return Result<QueryState>::ok(std::move(next));
}

QueryState remove_calculated_column(const QueryState& state, const std::string& id) {
    QueryState next = state;
    remove_where(next.calculated_columns, [&](const CalculatedColumn& c) { return c.id == id; });
    return next;
}

// ============================================================================
// Limit
// ============================================================================

QueryState set_limit(const QueryState& state, int64_t limit) {
    QueryState next = state;
    next.limit = limit;
    return next;
}

// ============================================================================
// Candidate admission
// ============================================================================

AdmissionReport admit_candidate(const SchemaModel& schema,
                                const QueryState& base,
                                const QueryState& candidate) {
    AdmissionReport report;
    QueryState& next = report.state;
    next = clear_all(base);

    const auto drop = [&](std::string reason) {
        utils::log::warn(std::format("Dropping candidate fragment: {}", reason));
        report.dropped.push_back(std::move(reason));
    };
    const auto known_column = [&](const ColumnId& c) { return schema.find_column(c) != nullptr; };

    for (const auto& table : candidate.selected_tables) {
        if (!schema.contains(table)) {
            drop(std::format("table {} is not in the schema", table.str()));
            continue;
        }
        next = add_table(next, table);
    }

    for (const auto& column : candidate.selected_columns) {
        if (!known_column(column)) {
            drop(std::format("column {} is not in the schema", column.str()));
            continue;
        }
        if (!next.has_column(column)) next = toggle_column(next, column);
    }

    for (const auto& [column, fn] : candidate.aggregations) {
        if (!known_column(column)) {
            drop(std::format("aggregation on unknown column {}", column.str()));
            continue;
        }
        next = set_aggregation(next, column, fn);
    }

    for (const auto& join : candidate.joins) {
        if (!known_column(join.from()) || !known_column(join.to())) {
            drop(std::format("join {} = {} names an unknown column",
                             join.from().str(), join.to().str()));
            continue;
        }
        next = add_join(next, join);
    }

    for (const auto& filter : candidate.filters) {
        if (!known_column(filter.column)) {
            drop(std::format("filter on unknown column {}", filter.column.str()));
            continue;
        }
        next = add_filter(next, filter);
    }

    for (const auto& column : candidate.group_by) {
        if (!known_column(column)) {
            drop(std::format("group by unknown column {}", column.str()));
            continue;
        }
        if (!next.is_grouped(column)) next = toggle_group_by(next, column);
    }

    for (const auto& sort : candidate.order_by) {
        if (!known_column(sort.column)) {
            drop(std::format("order by unknown column {}", sort.column.str()));
            continue;
        }
        next = add_sort(next, sort);
    }

    for (const auto& calc : candidate.calculated_columns) {
        auto added = add_calculated_column(next, calc.alias, calc.expression);
        if (added.is_error()) {
            drop(std::format("calculated column '{}': {}", calc.alias, added.error_message()));
            continue;
        }
        next = std::move(added.value());
    }

    if (candidate.limit > 0) next = set_limit(next, candidate.limit);
    return report;
}

} // namespace sqlcomposer::mutation
