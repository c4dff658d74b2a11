#include "builder/state_serializer.hpp"

#include <format>
#include <stdexcept>

using json = nlohmann::json;

namespace sqlcomposer {

namespace {

// Thrown by the readers below, converted to PARSE_ERROR at the boundary
class StateFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

[[nodiscard]] bool has_key(const json& node, const char* key) {
    return node.is_object() && node.contains(key) && !node[key].is_null();
}

[[nodiscard]] std::string require_string(const json& node, const char* key, const std::string& where) {
    if (!has_key(node, key) || !node[key].is_string()) {
        throw StateFormatError(std::format("{}.{} must be a string", where, key));
    }
    return node[key].get<std::string>();
}

[[nodiscard]] std::string optional_string(const json& node, const char* key) {
    if (has_key(node, key) && node[key].is_string()) {
        return node[key].get<std::string>();
    }
    return {};
}

[[nodiscard]] const json& optional_array(const json& root, const char* key) {
    static const json empty = json::array();
    if (!has_key(root, key)) return empty;
    if (!root[key].is_array()) {
        throw StateFormatError(std::format("{} must be an array", key));
    }
    return root[key];
}

[[nodiscard]] TableId read_table(const std::string& text, const std::string& where) {
    auto id = TableId::parse(text);
    if (!id) throw StateFormatError(std::format("{}: invalid table id '{}'", where, text));
    return *id;
}

[[nodiscard]] ColumnId read_column(const std::string& text, const std::string& where) {
    auto id = ColumnId::parse(text);
    if (!id) throw StateFormatError(std::format("{}: invalid column id '{}'", where, text));
    return *id;
}

[[nodiscard]] ColumnId read_column_element(const json& node, const std::string& where) {
    if (!node.is_string()) throw StateFormatError(std::format("{} must be a string", where));
    return read_column(node.get<std::string>(), where);
}

QueryState read_state(const json& root) {
    if (!root.is_object()) throw StateFormatError("Query state must be a JSON object");

    QueryState state;

    size_t idx = 0;
    for (const auto& t : optional_array(root, "selectedTables")) {
        const auto where = std::format("selectedTables[{}]", idx++);
        if (!t.is_string()) throw StateFormatError(std::format("{} must be a string", where));
        state.selected_tables.push_back(read_table(t.get<std::string>(), where));
    }

    idx = 0;
    for (const auto& c : optional_array(root, "selectedColumns")) {
        state.selected_columns.push_back(
            read_column_element(c, std::format("selectedColumns[{}]", idx++)));
    }

    if (has_key(root, "aggregations")) {
        if (!root["aggregations"].is_object()) {
            throw StateFormatError("aggregations must be an object");
        }
        for (const auto& [key, value] : root["aggregations"].items()) {
            const auto where = std::format("aggregations[{}]", key);
            if (!value.is_string()) throw StateFormatError(std::format("{} must be a string", where));
            const auto fn = parse_aggregate_function(value.get<std::string>());
            if (!fn) {
                throw StateFormatError(std::format("{}: unknown aggregate function '{}'",
                                                   where, value.get<std::string>()));
            }
            if (*fn == AggregateFunction::NONE) continue;
            state.aggregations[read_column(key, where)] = *fn;
        }
    }

    idx = 0;
    for (const auto& j : optional_array(root, "joins")) {
        const auto where = std::format("joins[{}]", idx++);
        ExplicitJoin join;
        join.id = optional_string(j, "id");
        join.from_table = read_table(require_string(j, "fromTable", where), where);
        join.from_column = require_string(j, "fromColumn", where);
        join.to_table = read_table(require_string(j, "toTable", where), where);
        join.to_column = require_string(j, "toColumn", where);

        const auto type_text = optional_string(j, "type");
        if (!type_text.empty()) {
            const auto type = parse_join_type(type_text);
            if (!type) throw StateFormatError(std::format("{}: unknown join type '{}'", where, type_text));
            join.type = *type;
        }
        state.joins.push_back(std::move(join));
    }

    idx = 0;
    for (const auto& f : optional_array(root, "filters")) {
        const auto where = std::format("filters[{}]", idx++);
        Filter filter;
        filter.id = optional_string(f, "id");
        filter.column = read_column(require_string(f, "column", where), where);

        const auto op_text = require_string(f, "operator", where);
        const auto op = parse_filter_operator(op_text);
        if (!op) throw StateFormatError(std::format("{}: unknown operator '{}'", where, op_text));
        filter.op = *op;

        // Numbers are accepted and kept in their JSON spelling
        if (has_key(f, "value")) {
            filter.value = f["value"].is_string() ? f["value"].get<std::string>() : f["value"].dump();
        }
        state.filters.push_back(std::move(filter));
    }

    idx = 0;
    for (const auto& g : optional_array(root, "groupBy")) {
        state.group_by.push_back(read_column_element(g, std::format("groupBy[{}]", idx++)));
    }

    idx = 0;
    for (const auto& o : optional_array(root, "orderBy")) {
        const auto where = std::format("orderBy[{}]", idx++);
        OrderBy sort;
        sort.id = optional_string(o, "id");
        sort.column = read_column(require_string(o, "column", where), where);

        const auto dir_text = optional_string(o, "direction");
        if (!dir_text.empty()) {
            const auto dir = parse_sort_direction(dir_text);
            if (!dir) throw StateFormatError(std::format("{}: unknown direction '{}'", where, dir_text));
            sort.direction = *dir;
        }
        state.order_by.push_back(std::move(sort));
    }

    idx = 0;
    for (const auto& c : optional_array(root, "calculatedColumns")) {
        const auto where = std::format("calculatedColumns[{}]", idx++);
        CalculatedColumn calc;
        calc.id = optional_string(c, "id");
        calc.alias = require_string(c, "alias", where);
        calc.expression = require_string(c, "expression", where);
        state.calculated_columns.push_back(std::move(calc));
    }

    if (has_key(root, "limit")) {
        if (!root["limit"].is_number_integer()) throw StateFormatError("limit must be an integer");
        state.limit = root["limit"].get<int64_t>();
    }

    return state;
}

} // anonymous namespace

json state_to_json(const QueryState& state) {
    json tables = json::array();
    for (const auto& t : state.selected_tables) tables.push_back(t.str());

    json columns = json::array();
    for (const auto& c : state.selected_columns) columns.push_back(c.str());

    json aggregations = json::object();
    for (const auto& [col, fn] : state.aggregations) {
        aggregations[col.str()] = aggregate_function_to_string(fn);
    }

    json joins = json::array();
    for (const auto& j : state.joins) {
        joins.push_back({
            {"id", j.id},
            {"fromTable", j.from_table.str()},
            {"fromColumn", j.from_column},
            {"toTable", j.to_table.str()},
            {"toColumn", j.to_column},
            {"type", join_type_to_string(j.type)},
        });
    }

    json filters = json::array();
    for (const auto& f : state.filters) {
        filters.push_back({
            {"id", f.id},
            {"column", f.column.str()},
            {"operator", filter_operator_to_string(f.op)},
            {"value", f.value},
        });
    }

    json group_by = json::array();
    for (const auto& g : state.group_by) group_by.push_back(g.str());

    json order_by = json::array();
    for (const auto& o : state.order_by) {
        order_by.push_back({
            {"id", o.id},
            {"column", o.column.str()},
            {"direction", sort_direction_to_string(o.direction)},
        });
    }

    json calculated = json::array();
    for (const auto& c : state.calculated_columns) {
        calculated.push_back({
            {"id", c.id},
            {"alias", c.alias},
            {"expression", c.expression},
        });
    }

    return json{
        {"selectedTables", std::move(tables)},
        {"selectedColumns", std::move(columns)},
        {"calculatedColumns", std::move(calculated)},
        {"aggregations", std::move(aggregations)},
        {"joins", std::move(joins)},
        {"filters", std::move(filters)},
        {"groupBy", std::move(group_by)},
        {"orderBy", std::move(order_by)},
        {"limit", state.limit},
    };
}

Result<QueryState> state_from_json(const json& root) {
    try {
        return Result<QueryState>::ok(read_state(root));
    } catch (const StateFormatError& e) {
        return Result<QueryState>::error(ErrorCategory::PARSE_ERROR, e.what());
    } catch (const json::exception& e) {
        return Result<QueryState>::error(ErrorCategory::PARSE_ERROR,
                                         std::format("Invalid query state: {}", e.what()));
    }
}

Result<QueryState> state_from_string(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::exception& e) {
        return Result<QueryState>::error(ErrorCategory::PARSE_ERROR,
                                         std::format("Failed to parse query state JSON: {}", e.what()));
    }
    return state_from_json(root);
}

} // namespace sqlcomposer
