#pragma once

#include "builder/query_state.hpp"
#include "schema/schema_model.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sqlcomposer {

struct StarterSuggestion {
    std::string title;
    std::string description;
    QueryState state;
};

inline constexpr size_t kMaxStarters = 3;

/**
 * @brief Ready-made first queries for an empty builder
 *
 * In order, each when the schema has a matching table:
 *   - list a users/customers table (limit 10)
 *   - count an orders/sales table by its primary key, or "id" without one
 *   - most recent rows of the first table with a created_at column (limit 20)
 * Falls back to exploring the first table (limit 10). At most kMaxStarters
 * entries; empty for an empty schema. The count starter uses default_limit.
 */
[[nodiscard]] std::vector<StarterSuggestion> suggest_starters(const SchemaModel& schema,
                                                              int64_t default_limit = kDefaultRowLimit);

} // namespace sqlcomposer
