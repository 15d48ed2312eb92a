#pragma once

#include <relicta/plugin/hook.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace relicta::plugin {

/// Free-form plugin configuration / outputs (a JSON object)
using ConfigMap = nlohmann::json;

/**
 * @brief Plugin metadata returned by GetInfo
 */
struct Info {
    std::string name;
    std::string version;
    std::string description;
    std::string author;
    std::vector<Hook> hooks;   ///< Hooks the plugin supports
    std::string configSchema; ///< JSON schema for the plugin configuration (optional)

    [[nodiscard]] bool supports(const Hook& hook) const;
};

/// A parsed conventional commit
struct ConventionalCommit {
    std::string hash;
    std::string type;
    std::string scope;
    std::string description;
    std::string body;
    bool breaking{false};
    std::string breakingDescription;
    std::vector<std::string> issues;
    std::string author;
    std::string date;
};

/// Commits grouped by category
struct CategorizedChanges {
    std::vector<ConventionalCommit> features;
    std::vector<ConventionalCommit> fixes;
    std::vector<ConventionalCommit> breaking;
    std::vector<ConventionalCommit> performance;
    std::vector<ConventionalCommit> refactor;
    std::vector<ConventionalCommit> docs;
    std::vector<ConventionalCommit> other;

    [[nodiscard]] std::size_t total() const noexcept;
};

/**
 * @brief Information about the release in progress
 *
 * Built by the host before each Execute call; read-only for plugins.
 */
struct ReleaseContext {
    std::string version;
    std::string previousVersion;
    std::string tagName;
    std::string releaseType; ///< major, minor, patch
    std::string repositoryUrl;
    std::string repositoryOwner;
    std::string repositoryName;
    std::string branch;
    std::string commitSha;
    std::string changelog;
    std::string releaseNotes;
    std::optional<CategorizedChanges> changes;
    std::map<std::string, std::string> environment; ///< Filtered environment variables
};

struct ExecuteRequest {
    Hook hook;
    ConfigMap config = ConfigMap::object();
    ReleaseContext context;
    bool dryRun{false};
};

/// A file or resource produced by a plugin
struct Artifact {
    std::string name;
    std::string path; ///< Local file or URL
    std::string type;
    int64_t size{0};
    std::string checksum;
};

struct ExecuteResponse {
    bool success{false};
    std::string message;
    std::string error;
    ConfigMap outputs = ConfigMap::object();
    std::vector<Artifact> artifacts;
};

struct ValidationError {
    std::string field;
    std::string message;
    std::string code;
};

struct ValidateResponse {
    bool valid{false};
    std::vector<ValidationError> errors;
};

} // namespace relicta::plugin
