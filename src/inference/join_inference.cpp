#include "inference/join_inference.hpp"
#include "core/utils.hpp"

namespace sqlcomposer {

namespace {

std::string derive_join_id(const ColumnId& from, const ColumnId& to) {
    return from.str() + "->" + to.str();
}

ExplicitJoin make_join(const TableId& from_table, const std::string& from_column,
                       JoinType type,
                       const TableId& to_table, const std::string& to_column) {
    ExplicitJoin join;
    join.from_table = from_table;
    join.from_column = from_column;
    join.type = type;
    join.to_table = to_table;
    join.to_column = to_column;
    join.id = derive_join_id(join.from(), join.to());
    return join;
}

/**
 * Foreign key of `source` pointing at `target`. Qualified references are
 * scanned first; legacy two-part references only when none matched.
 */
std::optional<ExplicitJoin> find_foreign_key(const Table& source, const Table& target) {
    const TableId target_id = target.id();

    for (const bool qualified_pass : {true, false}) {
        for (const auto& col : source.columns) {
            const auto fk = col.foreign_key_target();
            if (!fk || fk->is_qualified() != qualified_pass) continue;
            if (!fk->matches(target_id)) continue;

            return make_join(source.id(), col.name, JoinType::LEFT, target_id, fk->column);
        }
    }
    return std::nullopt;
}

// Rule 3: replicated table in a different schema sharing its key column
std::optional<ExplicitJoin> find_shared_key(const Table& a, const Table& b) {
    if (a.name != b.name || a.schema == b.schema) return std::nullopt;

    for (const auto& col : a.columns) {
        const Column* other = b.find_column(col.name);
        if (!other || other->type != col.type) continue;

        const bool is_key = utils::iequals(col.name, "id") ||
                            col.is_primary_key || other->is_primary_key;
        if (is_key) {
            return make_join(a.id(), col.name, JoinType::INNER, b.id(), other->name);
        }
    }
    return std::nullopt;
}

} // anonymous namespace

std::optional<ExplicitJoin> infer_join(const SchemaModel& schema,
                                       const TableId& a,
                                       const TableId& b) {
    if (a == b) return std::nullopt;

    const Table* table_a = schema.find_table(a);
    const Table* table_b = schema.find_table(b);
    if (!table_a || !table_b) return std::nullopt;

    if (auto join = find_foreign_key(*table_a, *table_b)) return join;
    if (auto join = find_foreign_key(*table_b, *table_a)) return join;
    return find_shared_key(*table_a, *table_b);
}

std::optional<ExplicitJoin> suggest_join(const SchemaModel& schema,
                                         const QueryState& state,
                                         const TableId& new_table) {
    for (const auto& existing : state.selected_tables) {
        if (existing == new_table) continue;

        if (auto join = infer_join(schema, existing, new_table)) return join;
        if (auto join = infer_join(schema, new_table, existing)) return join;
    }
    return std::nullopt;
}

} // namespace sqlcomposer
