#pragma once

#include "builder/query_state.hpp"
#include "core/error.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace sqlcomposer {

/**
 * @brief Persisted JSON form of a QueryState
 *
 * Key names match what builder sessions store:
 *   selectedTables, selectedColumns, calculatedColumns, aggregations,
 *   joins [{id, fromTable, fromColumn, toTable, toColumn, type}],
 *   filters [{id, column, operator, value}], groupBy,
 *   orderBy [{id, column, direction}], limit
 *
 * Tables are "<schema>.<table>", columns "<schema>.<table>.<column>".
 * Missing keys take their defaults.
 */
[[nodiscard]] nlohmann::json state_to_json(const QueryState& state);

// PARSE_ERROR naming the offending key on a malformed document
[[nodiscard]] Result<QueryState> state_from_json(const nlohmann::json& root);
[[nodiscard]] Result<QueryState> state_from_string(const std::string& json_text);

} // namespace sqlcomposer
