#include <relicta/plugin/plugin_discovery.h>
#include <relicta/plugin/plugin_host.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <system_error>

namespace relicta::plugin {

namespace fs = std::filesystem;

std::vector<fs::path> defaultPluginDirs() {
    const char* home = std::getenv("HOME");
    fs::path homeDir = (home != nullptr && *home != '\0') ? fs::path(home) : fs::path("/tmp");
    return {
        homeDir / ".relicta" / "plugins",
        fs::path(".relicta") / "plugins",
        "/usr/local/lib/relicta/plugins",
        "/usr/lib/relicta/plugins",
    };
}

bool isPathInAllowedDir(const fs::path& resolved, const std::vector<fs::path>& dirs) {
    std::error_code ec;
    auto candidate = fs::weakly_canonical(resolved, ec);
    if (ec)
        return false;

    for (const auto& dir : dirs) {
        std::error_code dec;
        auto base = fs::weakly_canonical(fs::absolute(dir, dec), dec);
        if (dec || base.empty())
            continue;

        auto rel = candidate.lexically_relative(base);
        if (rel.empty() || rel.is_absolute())
            continue;
        if (*rel.begin() == "..")
            continue;
        return true;
    }
    return false;
}

Result<fs::path> validatePluginBinary(const fs::path& path, const std::vector<fs::path>& dirs) {
    std::error_code ec;
    auto absPath = fs::absolute(path, ec);
    if (ec) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("failed to resolve plugin path: {}", ec.message())};
    }
    auto realPath = fs::canonical(absPath, ec);
    if (ec) {
        return Error{ErrorCode::NotFound,
                     fmt::format("failed to evaluate symlinks: {}: {}", absPath.string(),
                                 ec.message())};
    }
    if (!isPathInAllowedDir(realPath, dirs)) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("plugin binary {} is not in an allowed directory",
                                 realPath.string())};
    }

    auto status = fs::status(realPath, ec);
    if (ec) {
        return Error{ErrorCode::NotFound,
                     fmt::format("plugin binary not accessible: {}", ec.message())};
    }
    if (fs::is_directory(status)) {
        return Error{ErrorCode::InvalidArgument, "plugin path is a directory, not a file"};
    }
    if (!fs::is_regular_file(status)) {
        return Error{ErrorCode::InvalidArgument, "plugin path is not a regular file"};
    }
    constexpr auto anyExec = fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;
    if ((status.permissions() & anyExec) == fs::perms::none) {
        return Error{ErrorCode::InvalidArgument, "plugin binary is not executable"};
    }
    return realPath;
}

Result<fs::path> findPluginBinary(std::string_view name, const fs::path& explicitPath,
                                  const std::vector<fs::path>& dirs) {
    if (auto valid = validatePluginName(name); !valid) {
        return Error{valid.error().code, "invalid plugin name: " + valid.error().message};
    }

    if (!explicitPath.empty()) {
        auto validated = validatePluginBinary(explicitPath, dirs);
        if (!validated) {
            return Error{validated.error().code,
                         "plugin path validation failed: " + validated.error().message};
        }
        return validated;
    }

    for (const auto& dir : dirs) {
        auto candidate = dir / std::string(name);
        auto validated = validatePluginBinary(candidate, dirs);
        if (validated) {
            return validated;
        }
        spdlog::debug("PluginDiscovery: Skipping {}: {}", candidate.string(),
                      validated.error().message);
    }
    return Error{ErrorCode::NotFound,
                 fmt::format("plugin binary not found for {} in allowed directories", name)};
}

} // namespace relicta::plugin
