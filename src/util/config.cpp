#include <tsorg/config.hpp>
#include <tsorg/log.hpp>
#include <toml++/toml.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace fs = std::filesystem;

namespace tsorg {

// ---------------------------------------------------------------------------
// Key tables
// ---------------------------------------------------------------------------

namespace {

struct OrganizeKey {
    const char* name;
    bool OrganizeConfig::*field;
};

struct FormatBoolKey {
    const char* name;
    bool FormatConfig::*field;
};

const OrganizeKey kOrganizeKeys[] = {
    {"imports",           &OrganizeConfig::imports},
    {"declarations",      &OrganizeConfig::declarations},
    {"class-members",     &OrganizeConfig::class_members},
    {"object-properties", &OrganizeConfig::object_properties},
    {"jsx-attributes",    &OrganizeConfig::jsx_attributes},
    {"enum-members",      &OrganizeConfig::enum_members},
};

const FormatBoolKey kFormatBoolKeys[] = {
    {"trim-trailing-whitespace", &FormatConfig::trim_trailing_whitespace},
    {"final-newline",            &FormatConfig::final_newline},
    {"backup",                   &FormatConfig::backup},
};

TsorgError type_error(const std::string& key, const char* expected) {
    return TsorgError{TsorgError::Config,
        "config key '" + key + "' must be " + expected};
}

} // namespace

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return TsorgError{TsorgError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", "", static_cast<int>(e.source().begin.line)};
    }

    Config cfg;

    // [organize] section
    if (auto organize = doc["organize"].as_table()) {
        for (const auto& [key, val] : *organize) {
            std::string k(key.str());
            bool known = false;
            for (const auto& entry : kOrganizeKeys) {
                if (k != entry.name) continue;
                known = true;
                auto v = val.value<bool>();
                if (!val.is_boolean() || !v) {
                    return type_error("organize." + k, "a boolean");
                }
                cfg.organize.*entry.field = *v;
                cfg.explicit_keys.insert("organize." + k);
            }
            if (!known) {
                log::warn("ignoring unknown config key 'organize.%s'", k.c_str());
            }
        }
    }

    // [format] section
    if (auto format = doc["format"].as_table()) {
        for (const auto& [key, val] : *format) {
            std::string k(key.str());
            if (k == "indent-width") {
                auto v = val.value<int64_t>();
                if (!val.is_integer() || !v || *v < 1 || *v > 16) {
                    return type_error("format.indent-width",
                                      "an integer between 1 and 16");
                }
                cfg.format.indent_width = static_cast<int>(*v);
                cfg.explicit_keys.insert("format.indent-width");
                continue;
            }
            bool known = false;
            for (const auto& entry : kFormatBoolKeys) {
                if (k != entry.name) continue;
                known = true;
                auto v = val.value<bool>();
                if (!val.is_boolean() || !v) {
                    return type_error("format." + k, "a boolean");
                }
                cfg.format.*entry.field = *v;
                cfg.explicit_keys.insert("format." + k);
            }
            if (!known) {
                log::warn("ignoring unknown config key 'format.%s'", k.c_str());
            }
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return TsorgError{TsorgError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto r = Config::parse(ss.str());
    if (r.is_err() && r.error().file.empty()) {
        r.error().file = path;
    }
    return r;
}

void Config::merge(const Config& other) {
    for (const auto& entry : kOrganizeKeys) {
        std::string key = std::string("organize.") + entry.name;
        if (other.is_set(key)) {
            organize.*entry.field = other.organize.*entry.field;
            explicit_keys.insert(key);
        }
    }
    for (const auto& entry : kFormatBoolKeys) {
        std::string key = std::string("format.") + entry.name;
        if (other.is_set(key)) {
            format.*entry.field = other.format.*entry.field;
            explicit_keys.insert(key);
        }
    }
    if (other.is_set("format.indent-width")) {
        format.indent_width = other.format.indent_width;
        explicit_keys.insert("format.indent-width");
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project,
                         const std::optional<Config>& explicit_file) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    if (explicit_file.has_value()) result.merge(explicit_file.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.tsorg/config.toml";
}

std::string find_project_config(const std::string& start_dir) {
    std::error_code ec;
    fs::path dir = fs::absolute(start_dir, ec);
    if (ec) return "";
    while (true) {
        fs::path candidate = dir / "tsorg.toml";
        if (fs::is_regular_file(candidate, ec)) {
            return candidate.string();
        }
        if (!dir.has_parent_path() || dir.parent_path() == dir) break;
        dir = dir.parent_path();
    }
    return "";
}

} // namespace tsorg
