#include "builder/starter_suggestions.hpp"
#include "builder/state_mutations.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <string_view>

namespace sqlcomposer {

namespace {

constexpr std::array<std::string_view, 6> kPeopleTables = {
    "users", "user", "customer", "customers", "cliente", "clientes"
};

constexpr std::array<std::string_view, 5> kTransactionTables = {
    "orders", "order", "sales", "vendas", "pedidos"
};

constexpr int64_t kListLimit = 10;
constexpr int64_t kRecentLimit = 20;

template<size_t N>
const Table* find_named(const SchemaModel& schema, const std::array<std::string_view, N>& names) {
    for (const auto& table : schema.tables()) {
        const std::string lower = utils::to_lower(table.name);
        if (std::find(names.begin(), names.end(), lower) != names.end()) return &table;
    }
    return nullptr;
}

QueryState list_table(const TableId& table, int64_t limit) {
    return mutation::set_limit(mutation::add_table(QueryState{}, table), limit);
}

} // anonymous namespace

std::vector<StarterSuggestion> suggest_starters(const SchemaModel& schema, int64_t default_limit) {
    std::vector<StarterSuggestion> starters;

    if (const Table* people = find_named(schema, kPeopleTables)) {
        starters.push_back({
            std::format("List {}", people->name),
            std::format("First {} rows", kListLimit),
            list_table(people->id(), kListLimit),
        });
    }

    if (const Table* orders = find_named(schema, kTransactionTables)) {
        std::string key = "id";
        const auto pk = std::find_if(orders->columns.begin(), orders->columns.end(),
            [](const Column& c) { return c.is_primary_key; });
        if (pk != orders->columns.end()) key = pk->name;

        QueryState state = mutation::set_limit(QueryState{}, default_limit);
        state = mutation::set_aggregation(state, ColumnId(orders->id(), key), AggregateFunction::COUNT);
        starters.push_back({
            std::format("Count {}", orders->name),
            "Total number of rows",
            std::move(state),
        });
    }

    const auto recent = std::find_if(schema.tables().begin(), schema.tables().end(),
        [](const Table& t) { return t.find_column("created_at") != nullptr; });
    if (recent != schema.tables().end()) {
        OrderBy sort;
        sort.column = ColumnId(recent->id(), "created_at");
        sort.direction = SortDirection::DESC;
        starters.push_back({
            std::format("Recent {}", recent->name),
            std::format("Latest {} rows by created_at", kRecentLimit),
            mutation::add_sort(list_table(recent->id(), kRecentLimit), sort),
        });
    }

    if (starters.empty() && schema.table_count() > 0) {
        const Table& first = schema.tables().front();
        starters.push_back({
            std::format("Explore {}", first.name),
            "Browse this table",
            list_table(first.id(), kListLimit),
        });
    }

    if (starters.size() > kMaxStarters) starters.resize(kMaxStarters);
    return starters;
}

} // namespace sqlcomposer
