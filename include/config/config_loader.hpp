#pragma once

#include "compiler/sql_compiler.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace sqlcomposer {

// ============================================================================
// Config sections (mirror the TOML hierarchy)
// ============================================================================

struct LoggingConfig {
    utils::log::Level level = utils::log::Level::INFO;
};

/**
 * @brief Everything sql-composer.toml configures
 *
 * [compiler] feeds CompilerOptions plus the row limit given to new states;
 * [preview] the placeholder shown for an empty selection.
 */
struct ComposerConfig {
    int64_t default_limit = kDefaultRowLimit;
    CompilerOptions compiler;
    LoggingConfig logging;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        ComposerConfig config;

        static LoadResult ok(ComposerConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from a TOML file
     * @param config_path Path to sql-composer.toml
     * @return LoadResult with parsed config or error
     *
     * "include" entries are resolved relative to the including file; the
     * including file wins on conflicts. ${VAR} in strings is expanded.
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML text (includes are not resolved)
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check value ranges; one message per offending key
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const ComposerConfig& config);

private:
    // Unknown enum spellings are collected into errors rather than defaulted
    static void extract_compiler(const toml::table& root, ComposerConfig& config,
                                 std::vector<std::string>& errors);
    static void extract_preview(const toml::table& root, ComposerConfig& config);
    static void extract_logging(const toml::table& root, ComposerConfig& config,
                                std::vector<std::string>& errors);

    static LoadResult extract_and_validate(const toml::table& root);
};

} // namespace sqlcomposer
