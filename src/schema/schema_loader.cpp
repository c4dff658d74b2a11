#include "schema/schema_loader.hpp"
#include "core/utils.hpp"

#include <format>
#include <fstream>
#include <sstream>
#include <unordered_set>

using json = nlohmann::json;

namespace sqlcomposer {

// ============================================================================
// JSON helpers
// ============================================================================

[[nodiscard]] static inline std::string get_string(const json& node, const std::string& key) {
    if (node.is_object() && node.contains(key) && node[key].is_string()) {
        return node[key].get<std::string>();
    }
    return {};
}

[[nodiscard]] static inline bool get_bool(const json& node, const std::string& key) {
    if (node.is_object() && node.contains(key) && node[key].is_boolean()) {
        return node[key].get<bool>();
    }
    return false;
}

// ============================================================================
// SchemaLoader
// ============================================================================

SchemaLoader::LoadResult SchemaLoader::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return LoadResult::error(std::format("Cannot open schema file: {}", path));
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return load_from_string(buffer.str());
}

SchemaLoader::LoadResult SchemaLoader::load_from_string(const std::string& json_text) {
    try {
        return load_from_json(json::parse(json_text));
    } catch (const json::exception& e) {
        return LoadResult::error(std::format("Failed to parse schema JSON: {}", e.what()));
    }
}

SchemaLoader::LoadResult SchemaLoader::load_from_json(const json& root) {
    if (!root.is_object()) {
        return LoadResult::error("Schema document must be a JSON object");
    }
    if (!root.contains("tables") || !root["tables"].is_array()) {
        return LoadResult::error("Schema document has no \"tables\" array");
    }

    std::vector<Table> tables;
    tables.reserve(root["tables"].size());
    std::unordered_set<TableId> seen;

    size_t table_idx = 0;
    for (const auto& t : root["tables"]) {
        if (!t.is_object()) {
            return LoadResult::error(std::format("tables[{}] must be an object", table_idx));
        }

        Table table;
        table.name = get_string(t, "name");
        table.schema = get_string(t, "schema");
        if (table.schema.empty()) table.schema = std::string(kDefaultSchema);
        table.description = get_string(t, "description");

        if (table.name.empty()) {
            return LoadResult::error(std::format("tables[{}].name must not be empty", table_idx));
        }
        if (!seen.insert(table.id()).second) {
            return LoadResult::error(std::format("Duplicate table: {}", table.id().str()));
        }

        if (t.contains("columns") && t["columns"].is_array()) {
            size_t col_idx = 0;
            for (const auto& c : t["columns"]) {
                Column col;
                col.name = get_string(c, "name");
                col.type = get_string(c, "type");
                col.is_primary_key = get_bool(c, "isPrimaryKey");
                col.is_foreign_key = get_bool(c, "isForeignKey");
                if (auto ref = get_string(c, "references"); !ref.empty()) {
                    col.references = std::move(ref);
                }

                if (col.name.empty()) {
                    return LoadResult::error(std::format(
                        "{}.columns[{}].name must not be empty", table.id().str(), col_idx));
                }
                if (table.find_column(col.name)) {
                    return LoadResult::error(std::format(
                        "Duplicate column {} in table {}", col.name, table.id().str()));
                }
                table.columns.push_back(std::move(col));
                ++col_idx;
            }
        }

        tables.push_back(std::move(table));
        ++table_idx;
    }

    SchemaModel schema(get_string(root, "name"), std::move(tables));
    warn_dangling_references(schema);
    return LoadResult::ok(std::move(schema));
}

json SchemaLoader::to_json(const SchemaModel& schema) {
    json tables = json::array();
    for (const auto& table : schema.tables()) {
        json columns = json::array();
        for (const auto& col : table.columns) {
            json c = {
                {"name", col.name},
                {"type", col.type},
                {"isPrimaryKey", col.is_primary_key},
                {"isForeignKey", col.is_foreign_key},
            };
            if (col.references) c["references"] = *col.references;
            columns.push_back(std::move(c));
        }
        json t = {
            {"name", table.name},
            {"schema", table.schema},
            {"columns", std::move(columns)},
        };
        if (!table.description.empty()) t["description"] = table.description;
        tables.push_back(std::move(t));
    }
    return json{{"name", schema.name()}, {"tables", std::move(tables)}};
}

void SchemaLoader::warn_dangling_references(const SchemaModel& schema) {
    for (const auto& table : schema.tables()) {
        for (const auto& col : table.columns) {
            if (!col.is_foreign_key) continue;
            if (!col.references) {
                utils::log::warn(std::format(
                    "Foreign key {}.{} has no references target", table.id().str(), col.name));
                continue;
            }

            const auto target = ForeignKeyTarget::parse(*col.references);
            if (!target) {
                utils::log::warn(std::format(
                    "Foreign key {}.{} has malformed reference '{}'",
                    table.id().str(), col.name, *col.references));
                continue;
            }

            bool resolved = false;
            for (const auto& candidate : schema.tables()) {
                if (target->matches(candidate.id()) && candidate.find_column(target->column)) {
                    resolved = true;
                    break;
                }
            }
            if (!resolved) {
                utils::log::warn(std::format(
                    "Foreign key {}.{} references unknown column '{}'",
                    table.id().str(), col.name, *col.references));
            }
        }
    }
}

// ============================================================================
// Sample schema
// ============================================================================

SchemaModel sample_schema() {
    auto make_column = [](std::string name, std::string type, bool pk = false,
                          std::optional<std::string> references = std::nullopt) {
        Column col;
        col.name = std::move(name);
        col.type = std::move(type);
        col.is_primary_key = pk;
        col.is_foreign_key = references.has_value();
        col.references = std::move(references);
        return col;
    };

    Table users;
    users.schema = "public";
    users.name = "users";
    users.description = "Registered users";
    users.columns = {
        make_column("id", "SERIAL", true),
        make_column("name", "VARCHAR(100)"),
        make_column("email", "VARCHAR(100)"),
        make_column("created_at", "TIMESTAMP"),
        make_column("country", "VARCHAR(50)"),
    };

    Table orders;
    orders.schema = "public";
    orders.name = "orders";
    orders.description = "Placed orders";
    orders.columns = {
        make_column("id", "SERIAL", true),
        make_column("user_id", "INTEGER", false, "public.users.id"),
        make_column("total_amount", "DECIMAL(10,2)"),
        make_column("status", "VARCHAR(20)"),
        make_column("created_at", "TIMESTAMP"),
    };

    Table order_items;
    order_items.schema = "public";
    order_items.name = "order_items";
    order_items.description = "Line items of each order";
    order_items.columns = {
        make_column("id", "SERIAL", true),
        make_column("order_id", "INTEGER", false, "public.orders.id"),
        make_column("product_name", "VARCHAR(100)"),
        make_column("quantity", "INTEGER"),
        make_column("price", "DECIMAL(10,2)"),
    };

    return SchemaModel("ecommerce_sample",
        {std::move(users), std::move(orders), std::move(order_items)});
}

} // namespace sqlcomposer
