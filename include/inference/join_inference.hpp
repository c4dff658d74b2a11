#pragma once

#include "builder/query_state.hpp"
#include "schema/schema_model.hpp"

#include <optional>

namespace sqlcomposer {

/**
 * @brief Propose how two tables relate, or nullopt when they do not
 *
 * Rules, first match wins:
 *   1. a has a foreign key resolving to b       -> a LEFT JOIN b on a.fk = b.ref
 *   2. b has a foreign key resolving to a       -> b LEFT JOIN a on b.fk = a.ref
 *   3. same table name in two schemas sharing a key column ("id" or a
 *      primary key) of identical name and type  -> a INNER JOIN b on that key
 *
 * Within one direction a three-part "schema.table.column" reference is
 * preferred over a legacy "table.column" one. The join id is derived from
 * the join's endpoints, so repeated calls return equal values. Unknown
 * tables and a == b yield nullopt.
 */
[[nodiscard]] std::optional<ExplicitJoin> infer_join(const SchemaModel& schema,
                                                     const TableId& a,
                                                     const TableId& b);

/**
 * @brief Join suggestion for a table about to be added to the selection
 *
 * Walks the already-selected tables in insertion order and returns the first
 * relation found, trying infer_join(existing, new_table) before
 * infer_join(new_table, existing). Advisory only: nothing is mutated.
 */
[[nodiscard]] std::optional<ExplicitJoin> suggest_join(const SchemaModel& schema,
                                                       const QueryState& state,
                                                       const TableId& new_table);

} // namespace sqlcomposer
