#include <tsorg/files.hpp>
#include <tsorg/glob.hpp>
#include <tsorg/log.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace tsorg {

bool is_typescript_file(const fs::path& path) {
    auto ext = path.extension().string();
    return ext == ".ts" || ext == ".tsx" || ext == ".mts" || ext == ".cts";
}

static Status collect_directory(const fs::path& dir, std::vector<std::string>& out) {
    auto r = glob_expand("**", dir);
    if (r.is_err()) return std::move(r).error();
    for (const auto& rel : r.value()) {
        fs::path p = dir / rel;
        if (is_typescript_file(p)) out.push_back(p.generic_string());
    }
    return ok_status();
}

Result<std::vector<std::string>> discover_files(const std::vector<std::string>& args) {
    std::vector<std::string> files;
    std::vector<std::string> filters = {"**"};

    for (const auto& arg : args) {
        std::string inner;
        if (glob_is_negation(arg, inner)) {
            filters.push_back(arg);
            continue;
        }

        std::error_code ec;
        fs::path p(arg);
        if (fs::is_regular_file(p, ec)) {
            if (is_typescript_file(p)) {
                files.push_back(p.generic_string());
            } else {
                log::debug("skipping non-TypeScript file %s", arg.c_str());
            }
        } else if (fs::is_directory(p, ec)) {
            TSORG_TRY(collect_directory(p, files));
        } else if (glob_has_magic(arg)) {
            auto [base, rest] = glob_split_base(arg);
            if (!fs::is_directory(base, ec)) {
                log::debug("glob base %s does not exist", base.c_str());
                continue;
            }
            auto r = glob_expand(rest, base);
            if (r.is_err()) return std::move(r).error();
            for (const auto& rel : r.value()) {
                fs::path match = base == "." ? fs::path(rel) : fs::path(base) / rel;
                if (is_typescript_file(match)) files.push_back(match.generic_string());
            }
        } else {
            return TsorgError{TsorgError::NotFound,
                "path does not exist: " + arg,
                "pass a file, a directory or a glob pattern"};
        }
    }

    std::sort(files.begin(), files.end());
    files.erase(std::unique(files.begin(), files.end()), files.end());
    if (filters.size() > 1) files = glob_filter(filters, files);
    return Result<std::vector<std::string>>::ok(std::move(files));
}

Result<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return TsorgError{TsorgError::IO, "cannot open file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return TsorgError{TsorgError::IO, "error reading file: " + path};
    }
    return Result<std::string>::ok(ss.str());
}

std::string backup_path(const std::string& path) {
    return path + ".bak";
}

Status create_backup(const std::string& path) {
    std::error_code ec;
    fs::copy_file(path, backup_path(path), fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return TsorgError{TsorgError::IO,
            "cannot create backup " + backup_path(path) + ": " + ec.message()};
    }
    return ok_status();
}

Status write_file(const std::string& path, const std::string& content, bool backup) {
    if (backup) TSORG_TRY(create_backup(path));

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return TsorgError{TsorgError::IO, "cannot open file for writing: " + path};
    }
    file << content;
    file.close();
    if (file.fail()) {
        return TsorgError{TsorgError::IO, "error writing file: " + path};
    }
    return ok_status();
}

} // namespace tsorg
