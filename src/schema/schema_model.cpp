#include "schema/schema_model.hpp"
#include "core/utils.hpp"

#include <array>

namespace sqlcomposer {

std::optional<ForeignKeyTarget> ForeignKeyTarget::parse(std::string_view references) {
    // split() drops a trailing empty token, so "users.id." must be caught here
    if (references.empty() || references.back() == '.') return std::nullopt;

    const auto parts = utils::split(std::string(references), '.');
    for (const auto& part : parts) {
        if (part.empty()) return std::nullopt;
    }

    ForeignKeyTarget target;
    if (parts.size() == 3) {
        target.schema = parts[0];
        target.table = parts[1];
        target.column = parts[2];
        return target;
    }
    if (parts.size() == 2) {
        target.table = parts[0];
        target.column = parts[1];
        return target;
    }
    return std::nullopt;
}

bool ForeignKeyTarget::matches(const TableId& table_id) const {
    if (schema.has_value()) {
        return *schema == table_id.schema && table == table_id.name;
    }
    return table == table_id.name;
}

std::optional<ForeignKeyTarget> Column::foreign_key_target() const {
    if (!is_foreign_key || !references.has_value()) return std::nullopt;
    return ForeignKeyTarget::parse(*references);
}

bool Column::is_character_type() const {
    static constexpr std::array<std::string_view, 10> kCharacterTypes = {
        "char", "character", "varchar", "character varying", "text",
        "citext", "bpchar", "name", "uuid", "string"
    };

    // "VARCHAR(100)" -> "varchar"
    std::string base = utils::to_lower(utils::trim(type));
    if (const auto paren = base.find('('); paren != std::string::npos) {
        base = utils::trim(base.substr(0, paren));
    }
    for (const auto candidate : kCharacterTypes) {
        if (base == candidate) return true;
    }
    return false;
}

const Column* Table::find_column(std::string_view column_name) const {
    for (const auto& col : columns) {
        if (col.name == column_name) return &col;
    }
    return nullptr;
}

SchemaModel::SchemaModel(std::string name, std::vector<Table> tables)
    : name_(std::move(name)), tables_(std::move(tables)) {
    table_index_.reserve(tables_.size());
    for (size_t i = 0; i < tables_.size(); ++i) {
        // First definition wins; SchemaLoader rejects duplicates before we get here
        table_index_.emplace(tables_[i].id(), i);
    }
}

const Table* SchemaModel::find_table(const TableId& id) const {
    const auto it = table_index_.find(id);
    if (it == table_index_.end()) return nullptr;
    return &tables_[it->second];
}

const Column* SchemaModel::find_column(const ColumnId& id) const {
    const auto* table = find_table(id.table);
    return table ? table->find_column(id.column) : nullptr;
}

} // namespace sqlcomposer
