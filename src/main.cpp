#include "builder/starter_suggestions.hpp"
#include "builder/state_serializer.hpp"
#include "compiler/sql_compiler.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "inference/join_inference.hpp"
#include "schema/schema_loader.hpp"
#include "validator/expression_validator.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <format>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace sqlcomposer;
using json = nlohmann::json;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void print_usage() {
    std::cerr <<
        "Usage: sql-composer [--config <file.toml>] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  compile --schema <file|sample> --state <file> [--preview]\n"
        "  suggest-join --schema <file|sample> <tableA> <tableB>\n"
        "  validate-formula <alias> <expression>\n"
        "  starters --schema <file|sample>\n";
}

// Pulls "--name value" out of args; nullopt when absent
std::optional<std::string> take_option(std::vector<std::string>& args, const std::string& name) {
    for (size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == name) {
            std::string value = args[i + 1];
            args.erase(args.begin() + static_cast<std::ptrdiff_t>(i),
                       args.begin() + static_cast<std::ptrdiff_t>(i) + 2);
            return value;
        }
    }
    return std::nullopt;
}

bool take_flag(std::vector<std::string>& args, const std::string& name) {
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == name) {
            args.erase(args.begin() + static_cast<std::ptrdiff_t>(i));
            return true;
        }
    }
    return false;
}

std::optional<SchemaModel> load_schema(const std::string& source) {
    if (source == "sample") return sample_schema();

    auto loaded = SchemaLoader::load_from_file(source);
    if (!loaded.success) {
        utils::log::error(loaded.error_message);
        return std::nullopt;
    }
    utils::log::info(std::format("Schema '{}' loaded: {} tables",
                                 loaded.schema.name(), loaded.schema.table_count()));
    return std::move(loaded.schema);
}

json join_to_json(const ExplicitJoin& join) {
    return json{
        {"id", join.id},
        {"fromTable", join.from_table.str()},
        {"fromColumn", join.from_column},
        {"toTable", join.to_table.str()},
        {"toColumn", join.to_column},
        {"type", join_type_to_string(join.type)},
    };
}

// ============================================================================
// Commands
// ============================================================================

int run_compile(const ComposerConfig& config, std::vector<std::string> args) {
    const auto schema_source = take_option(args, "--schema");
    const auto state_path = take_option(args, "--state");
    const bool preview = take_flag(args, "--preview");
    if (!schema_source || !state_path || !args.empty()) {
        print_usage();
        return kExitUsage;
    }

    const auto schema = load_schema(*schema_source);
    if (!schema) return kExitFailure;

    std::ifstream in(*state_path);
    if (!in) {
        utils::log::error(std::format("Cannot open state file: {}", *state_path));
        return kExitFailure;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    json root;
    try {
        root = json::parse(buffer.str());
    } catch (const json::exception& e) {
        std::cerr << std::format("{}: {}\n",
            error_category_to_string(ErrorCategory::PARSE_ERROR), e.what());
        return kExitFailure;
    }
    // A state without a limit takes the configured default
    if (root.is_object() && !root.contains("limit")) root["limit"] = config.default_limit;

    auto state = state_from_json(root);
    if (state.is_error()) {
        std::cerr << std::format("{}: {}\n",
            error_category_to_string(state.error_category()), state.error_message());
        return kExitFailure;
    }

    const SqlCompiler compiler(config.compiler);
    utils::log::info(std::format("Compiling {} ({} layout)",
                                 *state_path, sql_layout_to_string(compiler.options().layout)));
    if (preview) {
        std::cout << compiler.preview(*schema, state.value()) << "\n";
        return kExitOk;
    }

    const auto compiled = compiler.generate(*schema, state.value());
    if (compiled.is_error()) {
        std::cerr << std::format("{}: {}\n",
            error_category_to_string(compiled.error_category()), compiled.error_message());
        return kExitFailure;
    }
    std::cout << compiled.value().sql << "\n";
    return kExitOk;
}

int run_suggest_join(std::vector<std::string> args) {
    const auto schema_source = take_option(args, "--schema");
    if (!schema_source || args.size() != 2) {
        print_usage();
        return kExitUsage;
    }

    const auto a = TableId::parse(args[0]);
    const auto b = TableId::parse(args[1]);
    if (!a || !b) {
        utils::log::error(std::format("Invalid table id: {}", !a ? args[0] : args[1]));
        return kExitUsage;
    }

    const auto schema = load_schema(*schema_source);
    if (!schema) return kExitFailure;

    const auto join = infer_join(*schema, *a, *b);
    if (!join) {
        std::cerr << std::format("No relationship found between {} and {}\n", a->str(), b->str());
        return kExitFailure;
    }
    std::cout << join_to_json(*join).dump(2) << "\n";
    return kExitOk;
}

int run_validate_formula(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        print_usage();
        return kExitUsage;
    }

    const std::string alias = sanitize_alias(args[0]);
    const auto result = validate_expression(alias, args[1]);
    if (!result.valid) {
        std::cerr << std::format("{}: {}\n",
            error_category_to_string(ErrorCategory::EXPRESSION_VALIDATION_ERROR), result.reason);
        return kExitFailure;
    }
    std::cout << std::format("({}) AS {}\n", utils::trim(args[1]), alias);
    return kExitOk;
}

int run_starters(const ComposerConfig& config, std::vector<std::string> args) {
    const auto schema_source = take_option(args, "--schema");
    if (!schema_source || !args.empty()) {
        print_usage();
        return kExitUsage;
    }

    const auto schema = load_schema(*schema_source);
    if (!schema) return kExitFailure;

    const SqlCompiler compiler(config.compiler);
    json out = json::array();
    for (const auto& starter : suggest_starters(*schema, config.default_limit)) {
        out.push_back({
            {"title", starter.title},
            {"description", starter.description},
            {"state", state_to_json(starter.state)},
            {"sql", compiler.preview(*schema, starter.state)},
        });
    }
    std::cout << out.dump(2) << "\n";
    return kExitOk;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        ComposerConfig config;
        if (const auto config_path = take_option(args, "--config")) {
            auto loaded = ConfigLoader::load_from_file(*config_path);
            if (!loaded.success) {
                utils::log::error(loaded.error_message);
                return kExitFailure;
            }
            config = std::move(loaded.config);
        }
        utils::log::set_level(config.logging.level);

        if (args.empty()) {
            print_usage();
            return kExitUsage;
        }

        const std::string command = args.front();
        args.erase(args.begin());

        if (command == "compile") return run_compile(config, std::move(args));
        if (command == "suggest-join") return run_suggest_join(std::move(args));
        if (command == "validate-formula") return run_validate_formula(args);
        if (command == "starters") return run_starters(config, std::move(args));

        utils::log::error(std::format("Unknown command: {}", command));
        print_usage();
        return kExitUsage;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitFailure;
    }
}
