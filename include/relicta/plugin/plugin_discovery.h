#pragma once

#include <relicta/core/types.h>

#include <filesystem>
#include <string_view>
#include <vector>

namespace relicta::plugin {

/**
 * @brief Directories plugin binaries may live in, in search order
 *
 * $HOME/.relicta/plugins, ./.relicta/plugins, /usr/local/lib/relicta/plugins
 * and /usr/lib/relicta/plugins. Without HOME the first entry uses /tmp.
 */
[[nodiscard]] std::vector<std::filesystem::path> defaultPluginDirs();

/**
 * @brief True if resolved lies inside (or is) one of dirs
 *
 * Both sides are compared after canonicalisation, so a sibling such as
 * "plugins2" does not match "plugins" and ".." cannot escape.
 */
[[nodiscard]] bool isPathInAllowedDir(const std::filesystem::path& resolved,
                                      const std::vector<std::filesystem::path>& dirs);

/**
 * @brief Resolve symlinks and check the target is an executable regular file in dirs
 * @return The resolved path to spawn
 */
[[nodiscard]] Result<std::filesystem::path>
validatePluginBinary(const std::filesystem::path& path,
                     const std::vector<std::filesystem::path>& dirs);

/**
 * @brief Locate the binary for a plugin
 *
 * A non-empty explicitPath is validated as is. Otherwise the first valid
 * dirs/<name> wins.
 */
[[nodiscard]] Result<std::filesystem::path>
findPluginBinary(std::string_view name, const std::filesystem::path& explicitPath,
                 const std::vector<std::filesystem::path>& dirs);

} // namespace relicta::plugin
