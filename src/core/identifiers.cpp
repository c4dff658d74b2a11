#include "core/identifiers.hpp"

namespace sqlcomposer {

TableId::TableId(std::string schema_name, std::string table_name)
    : schema(std::move(schema_name)), name(std::move(table_name)) {
    if (schema.empty()) schema = std::string(kDefaultSchema);
}

std::optional<TableId> TableId::parse(std::string_view text) {
    const auto dot = text.find('.');
    if (dot == std::string_view::npos) {
        if (text.empty()) return std::nullopt;
        return TableId(std::string(kDefaultSchema), std::string(text));
    }

    const auto schema_part = text.substr(0, dot);
    const auto table_part = text.substr(dot + 1);
    if (schema_part.empty() || table_part.empty()) return std::nullopt;
    return TableId(std::string(schema_part), std::string(table_part));
}

std::string TableId::str() const {
    return schema + "." + name;
}

ColumnId::ColumnId(TableId table_id, std::string column_name)
    : table(std::move(table_id)), column(std::move(column_name)) {}

std::optional<ColumnId> ColumnId::parse(std::string_view text) {
    const auto first = text.find('.');
    if (first == std::string_view::npos) return std::nullopt;

    const auto second = text.find('.', first + 1);
    if (second == std::string_view::npos) {
        // Legacy "table.column"
        const auto table_part = text.substr(0, first);
        const auto column_part = text.substr(first + 1);
        if (table_part.empty() || column_part.empty()) return std::nullopt;
        return ColumnId(TableId(std::string(kDefaultSchema), std::string(table_part)),
                        std::string(column_part));
    }

    const auto schema_part = text.substr(0, first);
    const auto table_part = text.substr(first + 1, second - first - 1);
    const auto column_part = text.substr(second + 1);
    if (schema_part.empty() || table_part.empty() || column_part.empty()) {
        return std::nullopt;
    }
    return ColumnId(TableId(std::string(schema_part), std::string(table_part)),
                    std::string(column_part));
}

std::string ColumnId::str() const {
    return table.str() + "." + column;
}

} // namespace sqlcomposer
