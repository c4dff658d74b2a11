#pragma once

#include "schema/schema_model.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace sqlcomposer {

/**
 * @brief Builds a SchemaModel from the JSON document schema connectors emit
 *
 * Document shape:
 *   { "name": "...",
 *     "tables": [ { "name": "orders", "schema": "public", "description": "...",
 *                   "columns": [ { "name": "user_id", "type": "INTEGER",
 *                                  "isPrimaryKey": false, "isForeignKey": true,
 *                                  "references": "public.users.id" } ] } ] }
 *
 * A missing "schema" defaults to "public". Duplicate table ids and nameless
 * tables or columns are rejected. Foreign keys whose reference is malformed
 * or points at no known table are kept and logged.
 */
class SchemaLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        SchemaModel schema;

        static LoadResult ok(SchemaModel model) {
            LoadResult result;
            result.success = true;
            result.schema = std::move(model);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& path);
    [[nodiscard]] static LoadResult load_from_string(const std::string& json_text);
    [[nodiscard]] static LoadResult load_from_json(const nlohmann::json& root);

    /**
     * @brief Serialize a SchemaModel back to the document shape above
     */
    [[nodiscard]] static nlohmann::json to_json(const SchemaModel& schema);

private:
    static void warn_dangling_references(const SchemaModel& schema);
};

/**
 * @brief Built-in e-commerce schema (users, orders, order_items)
 */
[[nodiscard]] SchemaModel sample_schema();

} // namespace sqlcomposer
