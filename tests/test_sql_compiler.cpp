#include <catch2/catch_test_macros.hpp>
#include "compiler/sql_compiler.hpp"
#include "builder/state_mutations.hpp"
#include "builder/state_serializer.hpp"
#include "inference/join_inference.hpp"
#include "schema/schema_loader.hpp"
#include "fixtures.hpp"

using namespace sqlcomposer;
using namespace sqlcomposer::test;

namespace {

QueryState with_tables(std::initializer_list<const char*> tables) {
    QueryState s;
    for (const char* t : tables) s.selected_tables.push_back(tid(t));
    return s;
}

ExplicitJoin make_join(const std::string& from, const std::string& to,
                       JoinType type = JoinType::LEFT) {
    const auto f = cid(from);
    const auto t = cid(to);
    ExplicitJoin join;
    join.id = from + "->" + to;
    join.from_table = f.table;
    join.from_column = f.column;
    join.type = type;
    join.to_table = t.table;
    join.to_column = t.column;
    return join;
}

Filter make_filter(const std::string& column, FilterOperator op, std::string value = {}) {
    Filter f;
    f.id = column;
    f.column = cid(column);
    f.op = op;
    f.value = std::move(value);
    return f;
}

OrderBy make_sort(const std::string& column, SortDirection dir = SortDirection::ASC) {
    OrderBy o;
    o.id = column;
    o.column = cid(column);
    o.direction = dir;
    return o;
}

std::string compile_ok(const SqlCompiler& compiler, const SchemaModel& schema, const QueryState& state,
                       CompileMode mode = CompileMode::GENERATE) {
    const auto result = compiler.compile(schema, state, mode);
    INFO(result.error_message());
    REQUIRE(result.is_ok());
    return result.value().sql;
}

// public.t (region, amount)
SchemaModel grouping_schema() {
    return SchemaModel("g", {
        table("public", "t", {col("region", "varchar(20)"), col("amount", "numeric")}),
    });
}

} // namespace

// ============================================================================
// Baseline & empty selection
// ============================================================================

TEST_CASE("SqlCompiler: single table baseline", "[compiler]") {
    const auto schema = sample_schema();
    const SqlCompiler compiler;

    for (const auto& table : schema.tables()) {
        QueryState s;
        s.selected_tables = {table.id()};
        s.limit = 42;
        CHECK(compile_ok(compiler, schema, s) ==
              "SELECT " + table.id().str() + ".* FROM " + table.id().str() + " LIMIT 42");
    }

    CHECK(compile_ok(compiler, schema, with_tables({"public.users"})) ==
          "SELECT public.users.* FROM public.users LIMIT 100");
}

TEST_CASE("SqlCompiler: empty selection wins over everything else", "[compiler]") {
    const auto schema = sample_schema();
    const SqlCompiler compiler;

    QueryState s;
    s.selected_columns = {cid("public.users.zzz")};
    s.joins.push_back(make_join("public.a.x", "public.b.y"));
    s.filters.push_back(make_filter("public.nope.col", FilterOperator::IN));
    s.calculated_columns.push_back({"c1", "", "(("});
    s.limit = -3;

    for (const auto mode : {CompileMode::PREVIEW, CompileMode::GENERATE}) {
        const auto result = compiler.compile(schema, s, mode);
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::EMPTY_SELECTION_ERROR);
    }
    CHECK(compiler.preview(schema, s) == "-- Select tables to start");
}

TEST_CASE("SqlCompiler: compilation is deterministic", "[compiler]") {
    const auto schema = sample_schema();
    const SqlCompiler compiler;
    auto s = with_tables({"public.users", "public.orders"});
    s.joins.push_back(make_join("public.orders.user_id", "public.users.id"));
    s.filters.push_back(make_filter("public.orders.status", FilterOperator::EQ, "paid"));

    CHECK(compile_ok(compiler, schema, s) == compile_ok(compiler, schema, s));
}

// ============================================================================
// Structural checks
// ============================================================================

TEST_CASE("SqlCompiler: structural errors name the reference", "[compiler][structural]") {
    const auto schema = sample_schema();
    const SqlCompiler compiler;

    auto expect_structural = [&](const QueryState& s, const std::string& needle) {
        const auto result = compiler.compile(schema, s, CompileMode::PREVIEW);
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::STRUCTURAL_ERROR);
        CHECK(result.error_message().find(needle) != std::string::npos);
    };

    SECTION("unknown table") {
        expect_structural(with_tables({"public.ghosts"}), "public.ghosts");
    }
    SECTION("duplicate table") {
        expect_structural(with_tables({"public.users", "public.users"}), "more than once");
    }
    SECTION("column of an unselected table") {
        auto s = with_tables({"public.users"});
        s.selected_columns = {cid("public.orders.status")};
        expect_structural(s, "public.orders.status");
    }
    SECTION("column missing from the schema") {
        auto s = with_tables({"public.users"});
        s.selected_columns = {cid("public.users.shoe_size")};
        expect_structural(s, "public.users.shoe_size");
    }
    SECTION("filter on an unselected table") {
        auto s = with_tables({"public.users"});
        s.filters.push_back(make_filter("public.orders.status", FilterOperator::EQ, "x"));
        expect_structural(s, "public.orders.status");
    }
    SECTION("group by and order by references") {
        auto s = with_tables({"public.users"});
        s.order_by.push_back(make_sort("public.users.nickname"));
        expect_structural(s, "public.users.nickname");
    }
    SECTION("join endpoint on an unselected table") {
        auto s = with_tables({"public.orders"});
        s.joins.push_back(make_join("public.orders.user_id", "public.users.id"));
        expect_structural(s, "public.users.id");
    }
    SECTION("join without a column") {
        auto s = with_tables({"public.orders", "public.users"});
        auto join = make_join("public.orders.user_id", "public.users.id");
        join.to_column.clear();
        s.joins.push_back(join);
        expect_structural(s, "missing a column");
    }
}

TEST_CASE("SqlCompiler: invalid calculated column is rejected at compile time", "[compiler][calculated]") {
    const auto schema = sample_schema();
    auto s = with_tables({"public.users"});
    s.calculated_columns.push_back({"c1", "broken", "(price * 2"});

    const auto result = SqlCompiler().compile(schema, s, CompileMode::PREVIEW);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::EXPRESSION_VALIDATION_ERROR);
    CHECK(result.error_message().find("broken") != std::string::npos);
}

// ============================================================================
// SELECT list & grouping
// ============================================================================

TEST_CASE("SqlCompiler: ungrouped implicit column is a consistency error", "[compiler][grouping]") {
    const auto schema = grouping_schema();
    const SqlCompiler compiler;

    QueryState s = with_tables({"public.t"});
    s.aggregations[cid("t.amount")] = AggregateFunction::SUM;

    const auto result = compiler.compile(schema, s, CompileMode::GENERATE);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::CONSISTENCY_ERROR);
    CHECK(result.error_message().find("public.t.region") != std::string::npos);

    s.group_by.push_back(cid("public.t.region"));
    CHECK(compile_ok(compiler, schema, s) ==
          "SELECT public.t.region, SUM(public.t.amount) AS amount_sum "
          "FROM public.t GROUP BY public.t.region LIMIT 100");
}

TEST_CASE("SqlCompiler: selected columns with aggregates", "[compiler][grouping]") {
    const auto schema = sample_schema();
    QueryState s;
    s = mutation::set_aggregation(s, cid("public.orders.total_amount"), AggregateFunction::SUM);
    s = mutation::set_aggregation(s, cid("public.orders.id"), AggregateFunction::COUNT);

    CHECK(compile_ok(SqlCompiler(), schema, s) ==
          "SELECT SUM(public.orders.total_amount) AS total_amount_sum, "
          "COUNT(public.orders.id) AS id_count FROM public.orders LIMIT 100");
}

TEST_CASE("SqlCompiler: aggregated column outside the selection is appended", "[compiler][grouping]") {
    const auto schema = sample_schema();
    auto s = with_tables({"public.orders"});
    s.selected_columns = {cid("public.orders.status")};
    s.aggregations[cid("public.orders.id")] = AggregateFunction::COUNT;
    s.group_by = {cid("public.orders.status")};

    CHECK(compile_ok(SqlCompiler(), schema, s) ==
          "SELECT public.orders.status, COUNT(public.orders.id) AS id_count "
          "FROM public.orders GROUP BY public.orders.status LIMIT 100");
}

TEST_CASE("SqlCompiler: colliding aggregate aliases are qualified", "[compiler][grouping]") {
    const auto schema = sample_schema();
    auto s = with_tables({"public.orders", "public.users"});
    s.joins.push_back(make_join("public.orders.user_id", "public.users.id"));
    s.selected_columns = {cid("public.orders.id"), cid("public.users.id")};
    s.aggregations[cid("public.orders.id")] = AggregateFunction::COUNT;
    s.aggregations[cid("public.users.id")] = AggregateFunction::COUNT;

    CHECK(compile_ok(SqlCompiler(), schema, s) ==
          "SELECT COUNT(public.orders.id) AS id_count, COUNT(public.users.id) AS users_id_count "
          "FROM public.orders LEFT JOIN public.users ON public.orders.user_id = public.users.id "
          "LIMIT 100");
}

TEST_CASE("SqlCompiler: calculated column aliases are checked", "[compiler][calculated]") {
    const auto schema = sample_schema();
    const SqlCompiler compiler;

    SECTION("unsanitized alias") {
        auto s = with_tables({"public.users"});
        s.calculated_columns.push_back({"c1", "total price", "1+1"});
        const auto result = compiler.compile(schema, s, CompileMode::GENERATE);
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::EXPRESSION_VALIDATION_ERROR);
        CHECK(result.error_message().find("'total price'") != std::string::npos);
        CHECK(result.error_message().find("'total_price'") != std::string::npos);
    }
    SECTION("duplicate alias") {
        auto s = with_tables({"public.users"});
        s.calculated_columns.push_back({"c1", "total_price", "1+1"});
        s.calculated_columns.push_back({"c2", "total_price", "2+2"});
        const auto result = compiler.compile(schema, s, CompileMode::PREVIEW);
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::EXPRESSION_VALIDATION_ERROR);
        CHECK(result.error_message().find("used more than once") != std::string::npos);
    }
    SECTION("loaded from a persisted document") {
        const auto loaded = state_from_string(R"({
            "selectedTables": ["public.users"],
            "calculatedColumns": [{"id": "a", "alias": "Total Price", "expression": "1"}]
        })");
        REQUIRE(loaded.is_ok());
        const auto result = compiler.generate(schema, loaded.value());
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::EXPRESSION_VALIDATION_ERROR);
    }
}

TEST_CASE("SqlCompiler: calculated alias reserves its name", "[compiler][grouping]") {
    const auto schema = sample_schema();
    auto s = with_tables({"public.orders"});
    s.selected_columns = {cid("public.orders.id")};
    s.aggregations[cid("public.orders.id")] = AggregateFunction::COUNT;
    s.calculated_columns.push_back({"c1", "id_count", "42"});

    CHECK(compile_ok(SqlCompiler(), schema, s) ==
          "SELECT COUNT(public.orders.id) AS orders_id_count, (42) AS id_count "
          "FROM public.orders LIMIT 100");
}

TEST_CASE("SqlCompiler: calculated columns follow the projection", "[compiler][calculated]") {
    const auto schema = sample_schema();
    auto s = with_tables({"public.users"});
    s.selected_columns = {cid("public.users.name")};
    s.calculated_columns.push_back({"c1", "shout", "upper(public.users.name)"});

    CHECK(compile_ok(SqlCompiler(), schema, s) ==
          "SELECT public.users.name, (upper(public.users.name)) AS shout FROM public.users LIMIT 100");
}

// ============================================================================
// FROM / JOIN
// ============================================================================

TEST_CASE("SqlCompiler: join from the base table", "[compiler][joins]") {
    const auto schema = sample_schema();
    auto s = with_tables({"public.orders", "public.users"});
    s.selected_columns = {cid("public.users.name"), cid("public.orders.total_amount")};
    s.joins.push_back(make_join("public.orders.user_id", "public.users.id"));

    const auto result = SqlCompiler().compile(schema, s, CompileMode::GENERATE);
    REQUIRE(result.is_ok());
    CHECK(result.value().sql ==
          "SELECT public.users.name, public.orders.total_amount FROM public.orders "
          "LEFT JOIN public.users ON public.orders.user_id = public.users.id LIMIT 100");
    CHECK(result.value().warnings.empty());
}

TEST_CASE("SqlCompiler: join pointing at the base table introduces its from side", "[compiler][joins]") {
    const auto schema = sample_schema();
    auto s = with_tables({"public.users", "public.orders"});
    s.joins.push_back(make_join("public.orders.user_id", "public.users.id"));

    // orders LEFT JOIN users keeps every order, so with users first it reads RIGHT
    CHECK(compile_ok(SqlCompiler(), schema, s) ==
          "SELECT public.users.*, public.orders.* FROM public.users "
          "RIGHT JOIN public.orders ON public.orders.user_id = public.users.id LIMIT 100");
}

TEST_CASE("SqlCompiler: outer join side is preserved when operands swap", "[compiler][joins]") {
    const auto schema = sample_schema();
    const SqlCompiler compiler;

    auto right = with_tables({"public.users", "public.orders"});
    right.joins.push_back(make_join("public.orders.user_id", "public.users.id", JoinType::RIGHT));
    CHECK(compile_ok(compiler, schema, right) ==
          "SELECT public.users.*, public.orders.* FROM public.users "
          "LEFT JOIN public.orders ON public.orders.user_id = public.users.id LIMIT 100");

    for (const auto type : {JoinType::INNER, JoinType::FULL}) {
        auto s = with_tables({"public.users", "public.orders"});
        s.joins.push_back(make_join("public.orders.user_id", "public.users.id", type));
        CHECK(compile_ok(compiler, schema, s) ==
              std::string("SELECT public.users.*, public.orders.* FROM public.users ") +
              join_type_to_string(type) +
              " JOIN public.orders ON public.orders.user_id = public.users.id LIMIT 100");
    }

    // Same join with its from side first keeps the keyword as written
    auto forward = with_tables({"public.orders", "public.users"});
    forward.joins.push_back(make_join("public.orders.user_id", "public.users.id", JoinType::RIGHT));
    CHECK(compile_ok(compiler, schema, forward) ==
          "SELECT public.orders.*, public.users.* FROM public.orders "
          "RIGHT JOIN public.users ON public.orders.user_id = public.users.id LIMIT 100");
}

TEST_CASE("SqlCompiler: accepted join suggestion keeps the suggested semantics", "[compiler][joins]") {
    const auto schema = sample_schema();
    auto s = mutation::add_table(QueryState{}, tid("public.users"));
    const auto suggested = suggest_join(schema, s, tid("public.orders"));
    REQUIRE(suggested.has_value());
    REQUIRE(suggested->type == JoinType::LEFT);
    REQUIRE(suggested->from_table == tid("public.orders"));
    s = mutation::add_join(s, *suggested);

    CHECK(compile_ok(SqlCompiler(), schema, s) ==
          "SELECT public.users.*, public.orders.* FROM public.users "
          "RIGHT JOIN public.orders ON public.orders.user_id = public.users.id LIMIT 100");
}

TEST_CASE("SqlCompiler: detached joins are retried after the others", "[compiler][joins]") {
    const auto schema = sample_schema();
    auto s = with_tables({"public.users", "public.orders", "public.order_items"});
    s.joins.push_back(make_join("public.order_items.order_id", "public.orders.id", JoinType::INNER));
    s.joins.push_back(make_join("public.orders.user_id", "public.users.id"));

    CHECK(compile_ok(SqlCompiler(), schema, s) ==
          "SELECT public.users.*, public.orders.*, public.order_items.* FROM public.users "
          "RIGHT JOIN public.orders ON public.orders.user_id = public.users.id "
          "INNER JOIN public.order_items ON public.order_items.order_id = public.orders.id "
          "LIMIT 100");
}

TEST_CASE("SqlCompiler: unjoined table becomes a cross join with a warning", "[compiler][joins]") {
    const auto schema = sample_schema();
    const auto s = with_tables({"public.users", "public.orders"});

    const SqlCompiler compiler;
    const auto result = compiler.compile(schema, s, CompileMode::GENERATE);
    REQUIRE(result.is_ok());
    CHECK(result.value().sql ==
          "SELECT public.users.*, public.orders.* FROM public.users CROSS JOIN public.orders LIMIT 100");
    REQUIRE(result.value().warnings.size() == 1);
    CHECK(result.value().warnings[0].find("public.orders") != std::string::npos);

    CHECK(compiler.preview(schema, s) ==
          "-- Warning: " + result.value().warnings[0] + "\n" + result.value().sql);
}

TEST_CASE("SqlCompiler: join reachable from no introduced table", "[compiler][joins]") {
    const auto schema = sample_schema();
    auto s = with_tables({"public.users", "public.orders", "public.order_items"});
    s.joins.push_back(make_join("public.order_items.order_id", "public.orders.id", JoinType::INNER));

    const auto result = SqlCompiler().compile(schema, s, CompileMode::GENERATE);
    REQUIRE(result.is_ok());
    CHECK(result.value().sql ==
          "SELECT public.users.*, public.orders.*, public.order_items.* FROM public.users "
          "CROSS JOIN public.order_items "
          "INNER JOIN public.orders ON public.order_items.order_id = public.orders.id LIMIT 100");

    REQUIRE(result.value().warnings.size() == 1);
    const auto& warning = result.value().warnings[0];
    CHECK(warning.find("public.order_items") != std::string::npos);
    CHECK(warning.find("public.order_items.order_id = public.orders.id") != std::string::npos);
    CHECK(warning.find("not joined to any other selected table") == std::string::npos);
}

TEST_CASE("SqlCompiler: strict cross joins fail generation only", "[compiler][joins]") {
    const auto schema = sample_schema();
    const auto s = with_tables({"public.users", "public.orders"});

    CompilerOptions options;
    options.strict_cross_joins = true;
    const SqlCompiler compiler(options);

    const auto generated = compiler.generate(schema, s);
    REQUIRE(generated.is_error());
    CHECK(generated.error_category() == ErrorCategory::CONSISTENCY_ERROR);
    CHECK(generated.error_message().find("public.orders") != std::string::npos);

    CHECK(compiler.compile(schema, s, CompileMode::PREVIEW).is_ok());
}

TEST_CASE("SqlCompiler: redundant join between joined tables", "[compiler][joins]") {
    const auto schema = sample_schema();
    auto s = with_tables({"public.orders", "public.users"});
    s.joins.push_back(make_join("public.orders.user_id", "public.users.id"));
    s.joins.push_back(make_join("public.users.id", "public.orders.user_id", JoinType::INNER));

    const auto result = SqlCompiler().compile(schema, s, CompileMode::PREVIEW);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::CONSISTENCY_ERROR);
}

// ============================================================================
// WHERE
// ============================================================================

TEST_CASE("SqlCompiler: filter rendering", "[compiler][filters]") {
    const auto schema = sample_schema();
    const SqlCompiler compiler;

    auto where_of = [&](Filter filter) {
        auto s = with_tables({"public.users"});
        s.filters.push_back(std::move(filter));
        const std::string sql = compile_ok(compiler, schema, s);
        const auto start = sql.find(" WHERE ");
        const auto end = sql.find(" LIMIT ");
        REQUIRE(start != std::string::npos);
        return sql.substr(start + 7, end - start - 7);
    };

    CHECK(where_of(make_filter("public.users.country", FilterOperator::EQ, "BR")) ==
          "public.users.country = 'BR'");
    CHECK(where_of(make_filter("public.users.id", FilterOperator::GT, "10")) ==
          "public.users.id > 10");
    CHECK(where_of(make_filter("public.users.id", FilterOperator::NE, "-2.5")) ==
          "public.users.id != -2.5");
    CHECK(where_of(make_filter("public.users.name", FilterOperator::EQ, "O'Brien")) ==
          "public.users.name = 'O''Brien'");
    CHECK(where_of(make_filter("public.users.email", FilterOperator::IS_NULL, "ignored")) ==
          "public.users.email IS NULL");
    CHECK(where_of(make_filter("public.users.email", FilterOperator::IS_NOT_NULL)) ==
          "public.users.email IS NOT NULL");
    CHECK(where_of(make_filter("public.users.country", FilterOperator::EQ, ":region")) ==
          "public.users.country = :region");
}

TEST_CASE("SqlCompiler: numeric value against a text column is quoted", "[compiler][filters]") {
    const auto schema = sample_schema();
    auto s = with_tables({"public.users"});
    s.filters.push_back(make_filter("public.users.country", FilterOperator::EQ, "55"));

    CHECK(compile_ok(SqlCompiler(), schema, s) ==
          "SELECT public.users.* FROM public.users WHERE public.users.country = '55' LIMIT 100");
}

TEST_CASE("SqlCompiler: IN lists", "[compiler][filters]") {
    const auto schema = sample_schema();
    const SqlCompiler compiler;

    auto s = with_tables({"public.users"});
    s.filters.push_back(make_filter("public.users.id", FilterOperator::IN, "1, 2,3"));
    s.filters.push_back(make_filter("public.users.country", FilterOperator::IN, "BR,US"));
    CHECK(compile_ok(compiler, schema, s) ==
          "SELECT public.users.* FROM public.users WHERE public.users.id IN (1, 2, 3) "
          "AND public.users.country IN ('BR', 'US') LIMIT 100");

    auto empty = with_tables({"public.users"});
    empty.filters.push_back(make_filter("public.users.id", FilterOperator::IN, " , "));
    const auto result = compiler.compile(schema, empty, CompileMode::PREVIEW);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::CONSISTENCY_ERROR);
    CHECK(result.error_message().find("public.users.id") != std::string::npos);
}

TEST_CASE("SqlCompiler: LIKE casts non-text columns", "[compiler][filters]") {
    const auto schema = sample_schema();
    auto s = with_tables({"public.users"});
    s.filters.push_back(make_filter("public.users.id", FilterOperator::LIKE, "1%"));
    s.filters.push_back(make_filter("public.users.name", FilterOperator::ILIKE, "jo%"));

    CHECK(compile_ok(SqlCompiler(), schema, s) ==
          "SELECT public.users.* FROM public.users WHERE public.users.id::text LIKE '1%' "
          "AND public.users.name ILIKE 'jo%' LIMIT 100");

    CompilerOptions options;
    options.cast_like_operands = false;
    CHECK(compile_ok(SqlCompiler(options), schema, s) ==
          "SELECT public.users.* FROM public.users WHERE public.users.id LIKE '1%' "
          "AND public.users.name ILIKE 'jo%' LIMIT 100");
}

// ============================================================================
// ORDER BY & LIMIT
// ============================================================================

TEST_CASE("SqlCompiler: aggregated order column uses its alias", "[compiler][order]") {
    const auto schema = sample_schema();
    auto s = with_tables({"public.orders"});
    s.selected_columns = {cid("public.orders.status"), cid("public.orders.total_amount")};
    s.aggregations[cid("public.orders.total_amount")] = AggregateFunction::SUM;
    s.group_by = {cid("public.orders.status")};
    s.order_by = {make_sort("public.orders.total_amount", SortDirection::DESC)};

    CHECK(compile_ok(SqlCompiler(), schema, s) ==
          "SELECT public.orders.status, SUM(public.orders.total_amount) AS total_amount_sum "
          "FROM public.orders GROUP BY public.orders.status "
          "ORDER BY total_amount_sum DESC LIMIT 100");

    s.order_by.push_back(make_sort("public.orders.created_at"));
    const auto result = SqlCompiler().compile(schema, s, CompileMode::PREVIEW);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::CONSISTENCY_ERROR);
    CHECK(result.error_message().find("public.orders.created_at") != std::string::npos);
}

TEST_CASE("SqlCompiler: plain ORDER BY keeps list order", "[compiler][order]") {
    const auto schema = sample_schema();
    auto s = with_tables({"public.users"});
    s.order_by = {make_sort("public.users.created_at", SortDirection::DESC),
                  make_sort("public.users.name")};

    CHECK(compile_ok(SqlCompiler(), schema, s) ==
          "SELECT public.users.* FROM public.users "
          "ORDER BY public.users.created_at DESC, public.users.name ASC LIMIT 100");
}

TEST_CASE("SqlCompiler: non-positive limit", "[compiler][limit]") {
    const auto schema = sample_schema();
    auto s = with_tables({"public.users"});
    s.limit = 0;

    const SqlCompiler compiler;
    CHECK(compile_ok(compiler, schema, s, CompileMode::PREVIEW) == "SELECT public.users.* FROM public.users");

    const auto result = compiler.compile(schema, s, CompileMode::GENERATE);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::CONSISTENCY_ERROR);
}

// ============================================================================
// Layout & preview
// ============================================================================

TEST_CASE("SqlCompiler: pretty layout", "[compiler][layout]") {
    const auto schema = sample_schema();
    auto s = with_tables({"public.users"});
    s.selected_columns = {cid("public.users.name"), cid("public.users.email")};
    s.filters = {make_filter("public.users.country", FilterOperator::EQ, "BR"),
                 make_filter("public.users.id", FilterOperator::GT, "1")};
    s.limit = 5;

    CompilerOptions options;
    options.layout = SqlLayout::PRETTY;
    CHECK(compile_ok(SqlCompiler(options), schema, s) ==
          "SELECT\n"
          "  public.users.name,\n"
          "  public.users.email\n"
          "FROM public.users\n"
          "WHERE public.users.country = 'BR'\n"
          "  AND public.users.id > 1\n"
          "LIMIT 5");
}

TEST_CASE("SqlCompiler: quoted identifiers and semicolon", "[compiler][layout]") {
    const auto schema = sample_schema();
    CompilerOptions options;
    options.quote_identifiers = true;
    options.terminate_with_semicolon = true;

    auto s = with_tables({"public.orders"});
    s.selected_columns = {cid("public.orders.id")};
    s.aggregations[cid("public.orders.id")] = AggregateFunction::COUNT;

    CHECK(compile_ok(SqlCompiler(options), schema, with_tables({"public.users"})) ==
          R"(SELECT "public"."users".* FROM "public"."users" LIMIT 100;)");
    CHECK(compile_ok(SqlCompiler(options), schema, s) ==
          R"(SELECT COUNT("public"."orders"."id") AS "id_count" FROM "public"."orders" LIMIT 100;)");
}

TEST_CASE("SqlCompiler: preview turns errors into comments", "[compiler][preview]") {
    const auto schema = sample_schema();
    auto s = with_tables({"public.users"});
    s.selected_columns = {cid("public.users.shoe_size")};

    const std::string text = SqlCompiler().preview(schema, s);
    CHECK(text.starts_with("-- StructuralError: "));
    CHECK(text.find("public.users.shoe_size") != std::string::npos);
}

TEST_CASE("SqlCompiler: custom empty selection placeholder", "[compiler][preview]") {
    CompilerOptions options;
    options.empty_selection_message = "Pick a table";
    CHECK(SqlCompiler(options).preview(sample_schema(), QueryState{}) == "-- Pick a table");
}

TEST_CASE("SqlCompiler: layout names", "[compiler][layout]") {
    for (const auto layout : {SqlLayout::COMPACT, SqlLayout::PRETTY}) {
        CHECK(parse_sql_layout(sql_layout_to_string(layout)) == layout);
    }

    CompilerOptions options;
    options.layout = SqlLayout::PRETTY;
    CHECK(std::string(sql_layout_to_string(SqlCompiler(options).options().layout)) == "pretty");
    CHECK(SqlCompiler().options().layout == SqlLayout::COMPACT);

    CHECK(parse_sql_layout("Pretty") == SqlLayout::PRETTY);
    CHECK(parse_sql_layout("compact") == SqlLayout::COMPACT);
    CHECK_FALSE(parse_sql_layout("wide").has_value());
}
