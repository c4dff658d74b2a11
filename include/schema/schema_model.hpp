#pragma once

#include "core/identifiers.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sqlcomposer {

/**
 * @brief Target of a foreign-key "references" string
 *
 * "<schema>.<table>.<column>" is the preferred form; the legacy
 * "<table>.<column>" form carries no schema and matches on table name only.
 */
struct ForeignKeyTarget {
    std::optional<std::string> schema;
    std::string table;
    std::string column;

    [[nodiscard]] static std::optional<ForeignKeyTarget> parse(std::string_view references);

    [[nodiscard]] bool is_qualified() const { return schema.has_value(); }

    // Qualified: schema and table must match. Legacy: table name only.
    [[nodiscard]] bool matches(const TableId& table_id) const;
};

struct Column {
    std::string name;
    std::string type;                       // Declared type, free-form ("integer", "VARCHAR(100)")
    bool is_primary_key = false;
    bool is_foreign_key = false;
    std::optional<std::string> references;  // See ForeignKeyTarget

    // Parsed target when this is a foreign key with a well-formed reference
    [[nodiscard]] std::optional<ForeignKeyTarget> foreign_key_target() const;

    // char/varchar/text/uuid family: literals compared against it are quoted
    [[nodiscard]] bool is_character_type() const;
};

struct Table {
    std::string schema = "public";
    std::string name;
    std::string description;
    std::vector<Column> columns;

    [[nodiscard]] TableId id() const { return TableId(schema, name); }

    [[nodiscard]] const Column* find_column(std::string_view column_name) const;
};

/**
 * @brief Immutable description of the tables available to the builder
 *
 * Read-only for the lifetime of a query-building session. Lookups are by
 * TableId through an index built once at construction.
 */
class SchemaModel {
public:
    SchemaModel() = default;
    SchemaModel(std::string name, std::vector<Table> tables);

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::vector<Table>& tables() const { return tables_; }
    [[nodiscard]] size_t table_count() const { return tables_.size(); }

    [[nodiscard]] const Table* find_table(const TableId& id) const;
    [[nodiscard]] const Column* find_column(const ColumnId& id) const;
    [[nodiscard]] bool contains(const TableId& id) const { return find_table(id) != nullptr; }

private:
    std::string name_;
    std::vector<Table> tables_;
    std::unordered_map<TableId, size_t> table_index_;  // id -> index into tables_
};

} // namespace sqlcomposer
