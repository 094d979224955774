#pragma once

#include <tsorg/result.hpp>
#include <string>
#include <unordered_set>
#include <optional>

namespace tsorg {

// [organize]: which reordering rules run
struct OrganizeConfig {
    bool imports = true;
    bool declarations = true;
    bool class_members = true;
    bool object_properties = true;
    bool jsx_attributes = true;
    bool enum_members = true;
};

// [format]: printer and style pass settings
struct FormatConfig {
    int indent_width = 4;
    bool trim_trailing_whitespace = true;
    bool final_newline = true;
    bool backup = true;
};

// Layered configuration: global > project > explicit --config file.
// Later layers override only the keys they set.
struct Config {
    OrganizeConfig organize;
    FormatConfig format;
    // Dotted keys ("organize.imports") explicitly present in the source TOML
    std::unordered_set<std::string> explicit_keys;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicit keys override this)
    void merge(const Config& other);

    bool is_set(const std::string& key) const {
        return explicit_keys.count(key) > 0;
    }

    // Build effective config from layers: global -> project -> explicit
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project,
                            const std::optional<Config>& explicit_file);
};

// Discover the global config file path: ~/.tsorg/config.toml
std::string global_config_path();

// Walk up from start_dir looking for tsorg.toml; empty string when none
std::string find_project_config(const std::string& start_dir);

} // namespace tsorg
