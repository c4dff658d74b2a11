#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace sqlcomposer {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

constexpr int kMaxIncludeDepth = 10;

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 *
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include directives in a parsed TOML table.
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > kMaxIncludeDepth) {
        throw std::runtime_error(
            std::format("Config include depth exceeds {}; possible circular include", kMaxIncludeDepth));
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Included file is the base, the including file the overlay
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

void ConfigLoader::extract_compiler(const toml::table& root, ComposerConfig& config,
                                    std::vector<std::string>& errors) {
    const auto* compiler = root["compiler"].as_table();
    if (!compiler) return;
    const auto& c = *compiler;
    auto& opts = config.compiler;

    config.default_limit = c["default_limit"].value_or(int64_t{kDefaultRowLimit});

    const std::string layout = c["layout"].value_or("compact"s);
    if (const auto parsed = parse_sql_layout(layout)) {
        opts.layout = *parsed;
    } else {
        errors.push_back(std::format("compiler.layout must be \"compact\" or \"pretty\", got \"{}\"", layout));
    }

    opts.quote_identifiers = c["quote_identifiers"].value_or(false);
    opts.terminate_with_semicolon = c["terminate_with_semicolon"].value_or(false);
    opts.cast_like_operands = c["cast_like_operands"].value_or(true);
    opts.strict_cross_joins = c["strict_cross_joins"].value_or(false);
    opts.verify_syntax = c["verify_syntax"].value_or(false);
}

void ConfigLoader::extract_preview(const toml::table& root, ComposerConfig& config) {
    const auto* preview = root["preview"].as_table();
    if (!preview) return;

    config.compiler.empty_selection_message =
        (*preview)["empty_selection_message"].value_or(std::string(config.compiler.empty_selection_message));
}

void ConfigLoader::extract_logging(const toml::table& root, ComposerConfig& config,
                                   std::vector<std::string>& errors) {
    const auto* logging = root["logging"].as_table();
    if (!logging) return;

    const std::string level = (*logging)["level"].value_or("info"s);
    if (const auto parsed = utils::log::parse_level(level)) {
        config.logging.level = *parsed;
    } else {
        errors.push_back(std::format("logging.level must be info, warn or error, got \"{}\"", level));
    }
}

ConfigLoader::LoadResult ConfigLoader::extract_and_validate(const toml::table& root) {
    ComposerConfig config;
    std::vector<std::string> errors;

    extract_compiler(root, config, errors);
    extract_preview(root, config);
    extract_logging(root, config, errors);

    for (auto& err : validate_config(config)) errors.push_back(std::move(err));

    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return extract_and_validate(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return extract_and_validate(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const ComposerConfig& config) {
    std::vector<std::string> errors;

    if (config.default_limit <= 0) {
        errors.push_back(std::format("compiler.default_limit must be > 0, got {}", config.default_limit));
    }
    if (config.compiler.empty_selection_message.find('\n') != std::string::npos) {
        errors.push_back("preview.empty_selection_message must be a single line");
    }

    return errors;
}

} // namespace sqlcomposer
