#pragma once

#include "schema/schema_model.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sqlcomposer::test {

inline Column col(std::string name, std::string type, bool pk = false,
                  std::optional<std::string> references = std::nullopt) {
    Column c;
    c.name = std::move(name);
    c.type = std::move(type);
    c.is_primary_key = pk;
    c.is_foreign_key = references.has_value();
    c.references = std::move(references);
    return c;
}

inline Table table(std::string schema, std::string name, std::vector<Column> columns) {
    Table t;
    t.schema = std::move(schema);
    t.name = std::move(name);
    t.columns = std::move(columns);
    return t;
}

inline TableId tid(const std::string& text) { return *TableId::parse(text); }
inline ColumnId cid(const std::string& text) { return *ColumnId::parse(text); }

// public.t (id, amount, region)
inline SchemaModel sales_schema() {
    return SchemaModel("sales", {
        table("public", "t", {
            col("id", "integer", true),
            col("amount", "numeric"),
            col("region", "varchar(20)"),
        }),
    });
}

} // namespace sqlcomposer::test
