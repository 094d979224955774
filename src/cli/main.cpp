#include <tsorg/config.hpp>
#include <tsorg/files.hpp>
#include <tsorg/format/pipeline.hpp>
#include <tsorg/log.hpp>
#include <tsorg/result.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#ifndef TSORG_VERSION
#define TSORG_VERSION "0.0.0"
#endif

namespace fs = std::filesystem;
using namespace tsorg;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

struct CliOptions {
    std::vector<std::string> paths;
    bool check = false;
    bool to_stdout = false;
    bool no_backup = false;
    std::string config_file;
    int verbosity = 0;
    bool quiet = false;
    bool no_color = false;
    bool show_help = false;
    bool show_version = false;
};

const char* kUsage =
    "usage: tsorg [options] <paths...>\n"
    "\n"
    "Reorganize TypeScript files while keeping their comments in place.\n"
    "Paths may be files, directories or glob patterns; a leading '!'\n"
    "excludes matching files.\n"
    "\n"
    "options:\n"
    "  -c, --check        report files that would change, exit 1 if any\n"
    "      --stdout       print the result instead of writing files\n"
    "      --no-backup    do not write <file>.bak before overwriting\n"
    "      --config FILE  read settings from FILE\n"
    "  -v, --verbose      more logging (repeat for trace)\n"
    "  -q, --quiet        only log errors\n"
    "      --no-color     disable colored log output\n"
    "      --version      print the version and exit\n"
    "  -h, --help         print this help and exit\n";

Result<CliOptions> parse_args(int argc, char** argv) {
    CliOptions opts;
    bool only_paths = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (only_paths || arg.empty() || arg[0] != '-' || arg == "-") {
            opts.paths.push_back(arg);
        } else if (arg == "--") {
            only_paths = true;
        } else if (arg == "-c" || arg == "--check") {
            opts.check = true;
        } else if (arg == "--stdout") {
            opts.to_stdout = true;
        } else if (arg == "--no-backup") {
            opts.no_backup = true;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                return TsorgError{TsorgError::InvalidArg, "--config needs a file argument"};
            }
            opts.config_file = argv[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            opts.config_file = arg.substr(9);
        } else if (arg == "-v" || arg == "--verbose") {
            ++opts.verbosity;
        } else if (arg == "-vv") {
            opts.verbosity += 2;
        } else if (arg == "-q" || arg == "--quiet") {
            opts.quiet = true;
        } else if (arg == "--no-color") {
            opts.no_color = true;
        } else if (arg == "--version") {
            opts.show_version = true;
        } else if (arg == "-h" || arg == "--help") {
            opts.show_help = true;
        } else {
            return TsorgError{TsorgError::InvalidArg, "unknown option: " + arg,
                              "run 'tsorg --help' for the list of options"};
        }
    }
    if (opts.check && opts.to_stdout) {
        return TsorgError{TsorgError::InvalidArg, "--check and --stdout cannot be combined"};
    }
    if (!opts.show_help && !opts.show_version && opts.paths.empty()) {
        return TsorgError{TsorgError::InvalidArg, "no input paths given",
                          "usage: tsorg [options] <paths...>"};
    }
    return Result<CliOptions>::ok(std::move(opts));
}

void configure_logging(const CliOptions& opts) {
    if (opts.quiet) {
        log::set_level(log::Error);
    } else if (opts.verbosity >= 2) {
        log::set_level(log::Trace);
    } else if (opts.verbosity == 1) {
        log::set_level(log::Debug);
    }
    if (opts.no_color) log::set_color_enabled(false);
}

std::optional<Config> load_layer(const std::string& path, const char* what, bool& failed) {
    if (path.empty()) return std::nullopt;
    std::error_code ec;
    if (!fs::exists(path, ec)) return std::nullopt;
    auto r = Config::load(path);
    if (r.is_err()) {
        std::cerr << r.error().format() << "\n";
        failed = true;
        return std::nullopt;
    }
    log::debug("loaded %s config %s", what, path.c_str());
    return std::move(r).value();
}

Result<Config> load_config(const CliOptions& opts) {
    bool failed = false;
    auto global = load_layer(global_config_path(), "global", failed);
    std::error_code ec;
    auto project = load_layer(find_project_config(fs::current_path(ec).string()),
                              "project", failed);

    std::optional<Config> explicit_file;
    if (!opts.config_file.empty()) {
        auto r = Config::load(opts.config_file);
        if (r.is_err()) return std::move(r).error();
        explicit_file = std::move(r).value();
    }
    if (failed) {
        return TsorgError{TsorgError::Config, "invalid configuration file"};
    }
    return Result<Config>::ok(Config::effective(global, project, explicit_file));
}

int run(const CliOptions& opts) {
    auto config = load_config(opts);
    if (config.is_err()) {
        std::cerr << config.error().format() << "\n";
        return kExitFailure;
    }
    PipelineOptions pipeline = PipelineOptions::from_config(config.value());
    if (opts.no_backup) pipeline.backup = false;

    auto files = discover_files(opts.paths);
    if (files.is_err()) {
        std::cerr << files.error().format() << "\n";
        return kExitFailure;
    }
    if (files.value().empty()) {
        log::warn("no TypeScript files found");
        return kExitOk;
    }

    FormatMode mode = opts.check ? FormatMode::Check
                    : opts.to_stdout ? FormatMode::Stdout
                    : FormatMode::Write;

    size_t changed = 0;
    size_t failed = 0;
    for (const auto& path : files.value()) {
        auto outcome = format_file(path, pipeline, mode);
        if (outcome.is_err()) {
            auto err = std::move(outcome).error();
            if (err.file.empty()) err.file = path;
            std::cerr << err.format() << "\n";
            ++failed;
            continue;
        }
        const FileOutcome& out = outcome.value();
        if (out.changed) ++changed;
        switch (mode) {
        case FormatMode::Check:
            if (out.changed) std::cout << "would reformat " << path << "\n";
            break;
        case FormatMode::Stdout:
            std::cout << out.output;
            break;
        case FormatMode::Write:
            if (out.changed) log::info("formatted %s", path.c_str());
            else log::debug("%s already organized", path.c_str());
            break;
        }
    }

    size_t total = files.value().size();
    if (mode == FormatMode::Check) {
        log::info("%zu of %zu files would be reformatted", changed, total);
    } else if (mode == FormatMode::Write) {
        log::info("%zu of %zu files reformatted", changed, total);
    }
    if (failed > 0) {
        log::error("%zu files could not be processed", failed);
        return kExitFailure;
    }
    if (mode == FormatMode::Check && changed > 0) return kExitFailure;
    return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
    auto opts = parse_args(argc, argv);
    if (opts.is_err()) {
        std::cerr << opts.error().format() << "\n";
        return kExitUsage;
    }
    if (opts.value().show_help) {
        std::cout << kUsage;
        return kExitOk;
    }
    if (opts.value().show_version) {
        std::cout << "tsorg " << TSORG_VERSION << "\n";
        return kExitOk;
    }
    configure_logging(opts.value());
    return run(opts.value());
}
