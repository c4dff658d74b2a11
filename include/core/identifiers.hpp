#pragma once

#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace sqlcomposer {

inline constexpr std::string_view kDefaultSchema = "public";

/**
 * @brief Table identifier: (schema, table), rendered "<schema>.<table>"
 *
 * Parsing splits on the first '.'; a bare table name gets the default
 * "public" schema.
 */
struct TableId {
    std::string schema;
    std::string name;

    TableId() = default;
    TableId(std::string schema_name, std::string table_name);

    /**
     * @brief Parse "schema.table" or "table"
     * @return nullopt when the schema or table part is empty
     */
    [[nodiscard]] static std::optional<TableId> parse(std::string_view text);

    [[nodiscard]] std::string str() const;

    [[nodiscard]] bool empty() const { return name.empty(); }

    auto operator<=>(const TableId&) const = default;
    bool operator==(const TableId&) const = default;
};

/**
 * @brief Fully-qualified column identifier: "<schema>.<table>.<column>"
 *
 * The only way Query State refers to a column. A two-part "table.column"
 * parses with the default schema.
 */
struct ColumnId {
    TableId table;
    std::string column;

    ColumnId() = default;
    ColumnId(TableId table_id, std::string column_name);

    [[nodiscard]] static std::optional<ColumnId> parse(std::string_view text);

    [[nodiscard]] std::string str() const;

    [[nodiscard]] bool belongs_to(const TableId& t) const { return table == t; }

    auto operator<=>(const ColumnId&) const = default;
    bool operator==(const ColumnId&) const = default;
};

} // namespace sqlcomposer

template<>
struct std::hash<sqlcomposer::TableId> {
    size_t operator()(const sqlcomposer::TableId& id) const noexcept {
        const size_t h1 = std::hash<std::string>{}(id.schema);
        const size_t h2 = std::hash<std::string>{}(id.name);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

template<>
struct std::hash<sqlcomposer::ColumnId> {
    size_t operator()(const sqlcomposer::ColumnId& id) const noexcept {
        const size_t h1 = std::hash<sqlcomposer::TableId>{}(id.table);
        const size_t h2 = std::hash<std::string>{}(id.column);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};
