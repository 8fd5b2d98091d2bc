// ---------------------------------------------------------------------------
// file_collector.cpp
// ---------------------------------------------------------------------------

#include "collector/file_collector.hpp"

#include <algorithm>
#include <filesystem>
#include <set>
#include <string>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace {

constexpr const char* kSqlExtension = ".sql";

std::expected<std::vector<fs::path>, std::string> scan_directory(const fs::path& dir) {
    std::vector<fs::path> found;
    std::error_code       ec;

    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return std::unexpected(fmt::format("cannot read directory '{}': {}",
                                           dir.string(), ec.message()));
    }

    const fs::recursive_directory_iterator end{};
    while (it != end) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && it->path().extension() == kSqlExtension) {
            found.push_back(it->path());
        }
        it.increment(ec);
        if (ec) {
            return std::unexpected(fmt::format("error while scanning '{}': {}",
                                               dir.string(), ec.message()));
        }
    }

    std::sort(found.begin(), found.end());
    spdlog::debug("file_collector: {} .sql file(s) under '{}'", found.size(), dir.string());
    return found;
}

// 중복 판정 키: 가능하면 정규 경로, 실패하면 lexical 정규화
fs::path identity_of(const fs::path& path) {
    std::error_code ec;
    auto canonical = fs::weakly_canonical(path, ec);
    if (ec) {
        return path.lexically_normal();
    }
    return canonical;
}

}  // namespace

std::expected<std::vector<fs::path>, std::string>
collect_sql_files(const std::vector<std::string>& paths) {
    std::vector<fs::path> files;
    std::set<fs::path>    seen;

    const auto add = [&](const fs::path& file) {
        if (!seen.insert(identity_of(file)).second) {
            spdlog::debug("file_collector: '{}' already collected, skipped", file.string());
            return;
        }
        files.push_back(file);
    };

    for (const auto& raw : paths) {
        const fs::path  path(raw);
        std::error_code ec;

        if (fs::is_directory(path, ec)) {
            auto scanned = scan_directory(path);
            if (!scanned) {
                return std::unexpected(scanned.error());
            }
            for (const auto& file : *scanned) {
                add(file);
            }
        } else if (fs::is_regular_file(path, ec)) {
            add(path);
        } else {
            return std::unexpected(fmt::format("{} not found", raw));
        }
    }

    return files;
}
