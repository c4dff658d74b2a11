#pragma once

#include "builder/query_state.hpp"
#include "core/error.hpp"
#include "schema/schema_model.hpp"

#include <string>
#include <vector>

namespace sqlcomposer::mutation {

// ============================================================================
// Query State transitions
//
// Every function takes the current state by const reference and returns a new
// state satisfying the structural invariants: all referenced tables are
// selected, removing a table cascades to everything that mentions it, and
// calculated columns are validated before they are stored. The grouping rule
// (every plain column grouped once aggregates exist) is left to SqlCompiler.
// ============================================================================

// ---- Tables ----------------------------------------------------------------

[[nodiscard]] QueryState add_table(const QueryState& state, const TableId& table);

/**
 * @brief Deselect a table and everything that references it
 *
 * Drops its columns from selected_columns, aggregations, group_by and
 * order_by, and removes the joins and filters that mention it.
 */
[[nodiscard]] QueryState remove_table(const QueryState& state, const TableId& table);

[[nodiscard]] QueryState toggle_table(const QueryState& state, const TableId& table);

// Drops every selection; limit is kept
[[nodiscard]] QueryState clear_all(const QueryState& state);

// ---- Columns ---------------------------------------------------------------

// Selecting adds the owning table; deselecting also drops the aggregation
[[nodiscard]] QueryState toggle_column(const QueryState& state, const ColumnId& column);

[[nodiscard]] QueryState select_columns(const QueryState& state, const TableId& table,
                                        const std::vector<std::string>& column_names);

[[nodiscard]] QueryState deselect_columns(const QueryState& state, const TableId& table,
                                          const std::vector<std::string>& column_names);

// NONE removes the entry; anything else also selects the column
[[nodiscard]] QueryState set_aggregation(const QueryState& state, const ColumnId& column,
                                         AggregateFunction fn);

// ---- Joins -----------------------------------------------------------------

[[nodiscard]] QueryState add_join(const QueryState& state, ExplicitJoin join);
[[nodiscard]] QueryState update_join(const QueryState& state, const std::string& id,
                                     ExplicitJoin join);
[[nodiscard]] QueryState remove_join(const QueryState& state, const std::string& id);

// ---- Filters ---------------------------------------------------------------

[[nodiscard]] QueryState add_filter(const QueryState& state, Filter filter);
[[nodiscard]] QueryState update_filter(const QueryState& state, const std::string& id,
                                       Filter filter);
[[nodiscard]] QueryState remove_filter(const QueryState& state, const std::string& id);

// ---- Grouping & ordering ---------------------------------------------------

[[nodiscard]] QueryState toggle_group_by(const QueryState& state, const ColumnId& column);

[[nodiscard]] QueryState add_sort(const QueryState& state, OrderBy sort);
[[nodiscard]] QueryState update_sort(const QueryState& state, const std::string& id,
                                     OrderBy sort);
[[nodiscard]] QueryState remove_sort(const QueryState& state, const std::string& id);

// ---- Calculated columns ----------------------------------------------------

/**
 * @brief Validate and append a calculated column
 *
 * The alias is sanitized first. Fails with EXPRESSION_VALIDATION_ERROR when
 * the validator rejects the formula or the alias is already taken.
 */
[[nodiscard]] Result<QueryState> add_calculated_column(const QueryState& state,
                                                       const std::string& alias,
                                                       const std::string& expression);

[[nodiscard]] QueryState remove_calculated_column(const QueryState& state, const std::string& id);

// ---- Limit -----------------------------------------------------------------

[[nodiscard]] QueryState set_limit(const QueryState& state, int64_t limit);

// ============================================================================
// Candidate admission
// ============================================================================

struct AdmissionReport {
    QueryState state;
    std::vector<std::string> dropped;   // Human-readable, one entry per rejected fragment
};

/**
 * @brief Rebuild an externally generated candidate through the transitions
 *
 * Candidates come from generators ("fill the builder from a prompt") and are
 * never trusted as compiler input. Each fragment is replayed against the
 * schema; unknown tables or columns and invalid calculated columns are
 * dropped and reported. A non-positive candidate limit keeps base.limit.
 */
[[nodiscard]] AdmissionReport admit_candidate(const SchemaModel& schema,
                                              const QueryState& base,
                                              const QueryState& candidate);

} // namespace sqlcomposer::mutation
