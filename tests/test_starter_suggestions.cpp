#include <catch2/catch_test_macros.hpp>
#include "builder/starter_suggestions.hpp"
#include "compiler/sql_compiler.hpp"
#include "schema/schema_loader.hpp"
#include "fixtures.hpp"

using namespace sqlcomposer;
using namespace sqlcomposer::test;

TEST_CASE("StarterSuggestions: sample schema", "[starters]") {
    const auto schema = sample_schema();
    const auto starters = suggest_starters(schema);
    REQUIRE(starters.size() == 3);

    CHECK(starters[0].title == "List users");
    CHECK(starters[1].title == "Count orders");
    CHECK(starters[2].title == "Recent users");

    const SqlCompiler compiler;
    auto sql_of = [&](const StarterSuggestion& s) {
        const auto result = compiler.compile(schema, s.state, CompileMode::GENERATE);
        INFO(s.title << ": " << result.error_message());
        REQUIRE(result.is_ok());
        return result.value().sql;
    };

    CHECK(sql_of(starters[0]) == "SELECT public.users.* FROM public.users LIMIT 10");
    CHECK(sql_of(starters[1]) ==
          "SELECT COUNT(public.orders.id) AS id_count FROM public.orders LIMIT 100");
    CHECK(sql_of(starters[2]) ==
          "SELECT public.users.* FROM public.users ORDER BY public.users.created_at DESC LIMIT 20");
}

TEST_CASE("StarterSuggestions: count starter takes the given limit", "[starters]") {
    const auto starters = suggest_starters(sample_schema(), 500);
    REQUIRE(starters.size() == 3);
    CHECK(starters[1].state.limit == 500);
    CHECK(starters[0].state.limit == 10);
}

TEST_CASE("StarterSuggestions: names match case-insensitively and use the primary key", "[starters]") {
    const SchemaModel schema("shop", {
        table("sales", "Clientes", {col("codigo", "integer", true), col("nome", "text")}),
        table("sales", "Pedidos", {col("numero", "integer", true), col("valor", "numeric")}),
    });

    const auto starters = suggest_starters(schema);
    REQUIRE(starters.size() == 2);
    CHECK(starters[0].title == "List Clientes");
    CHECK(starters[1].title == "Count Pedidos");
    CHECK(starters[1].state.aggregation_of(cid("sales.Pedidos.numero")) == AggregateFunction::COUNT);
}

TEST_CASE("StarterSuggestions: fallback explores the first table", "[starters]") {
    const SchemaModel schema("inventory", {
        table("public", "products", {col("sku", "text", true)}),
        table("public", "warehouses", {col("code", "text", true)}),
    });

    const auto starters = suggest_starters(schema);
    REQUIRE(starters.size() == 1);
    CHECK(starters[0].title == "Explore products");
    REQUIRE(starters[0].state.selected_tables.size() == 1);
    CHECK(starters[0].state.selected_tables[0] == tid("public.products"));
    CHECK(starters[0].state.limit == 10);
}

TEST_CASE("StarterSuggestions: empty schema has no starters", "[starters]") {
    CHECK(suggest_starters(SchemaModel("empty", {})).empty());
}
