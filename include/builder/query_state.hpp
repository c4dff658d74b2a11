#pragma once

#include "core/identifiers.hpp"
#include "core/types.hpp"

#include <algorithm>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace sqlcomposer {

inline constexpr int64_t kDefaultRowLimit = 100;

struct ExplicitJoin {
    std::string id;
    TableId from_table;
    std::string from_column;
    JoinType type = JoinType::INNER;
    TableId to_table;
    std::string to_column;

    [[nodiscard]] ColumnId from() const { return ColumnId(from_table, from_column); }
    [[nodiscard]] ColumnId to() const { return ColumnId(to_table, to_column); }

    [[nodiscard]] bool mentions(const TableId& table) const {
        return from_table == table || to_table == table;
    }

    bool operator==(const ExplicitJoin&) const = default;
};

struct Filter {
    std::string id;
    ColumnId column;
    FilterOperator op = FilterOperator::EQ;
    std::string value;      // Ignored for IS NULL / IS NOT NULL

    bool operator==(const Filter&) const = default;
};

struct OrderBy {
    std::string id;
    ColumnId column;
    SortDirection direction = SortDirection::ASC;

    bool operator==(const OrderBy&) const = default;
};

struct CalculatedColumn {
    std::string id;
    std::string alias;          // Sanitized identifier
    std::string expression;     // Opaque SQL fragment

    bool operator==(const CalculatedColumn&) const = default;
};

/**
 * @brief Description of a query under construction
 *
 * A plain value: mutation functions in builder/state_mutations.hpp take it by
 * const reference and return a new one, so callers can keep exact snapshots.
 * Vectors used as sets keep insertion order, which drives emission order.
 */
struct QueryState {
    std::vector<TableId> selected_tables;
    std::vector<ColumnId> selected_columns;
    std::map<ColumnId, AggregateFunction> aggregations;    // Never holds NONE
    std::vector<ExplicitJoin> joins;
    std::vector<Filter> filters;
    std::vector<ColumnId> group_by;
    std::vector<OrderBy> order_by;
    std::vector<CalculatedColumn> calculated_columns;
    int64_t limit = kDefaultRowLimit;

    [[nodiscard]] bool has_table(const TableId& table) const {
        return std::find(selected_tables.begin(), selected_tables.end(), table) != selected_tables.end();
    }

    [[nodiscard]] bool has_column(const ColumnId& column) const {
        return std::find(selected_columns.begin(), selected_columns.end(), column) != selected_columns.end();
    }

    [[nodiscard]] bool is_grouped(const ColumnId& column) const {
        return std::find(group_by.begin(), group_by.end(), column) != group_by.end();
    }

    // NONE when the column carries no aggregate
    [[nodiscard]] AggregateFunction aggregation_of(const ColumnId& column) const {
        const auto it = aggregations.find(column);
        return it == aggregations.end() ? AggregateFunction::NONE : it->second;
    }

    // Any aggregate or GROUP BY column switches the query to grouped semantics
    [[nodiscard]] bool has_grouping() const {
        for (const auto& [col, fn] : aggregations) {
            if (fn != AggregateFunction::NONE) return true;
        }
        return !group_by.empty();
    }

    [[nodiscard]] bool empty() const { return selected_tables.empty(); }

    bool operator==(const QueryState&) const = default;
};

} // namespace sqlcomposer
