#pragma once

#include <relicta/core/types.h>
#include <relicta/plugin/types.h>

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file config_parser.h
 * @brief Helpers for plugin authors reading and validating their ConfigMap
 */

namespace relicta::plugin {

/**
 * @brief Typed, lenient reads from a plugin configuration
 *
 * A missing field or a value of the wrong type reads as the zero value (or
 * the supplied default); nothing here throws.
 */
class ConfigParser {
public:
    explicit ConfigParser(ConfigMap config);

    /**
     * @brief Non-empty string field, else the first non-empty environment variable
     */
    [[nodiscard]] std::string getString(const std::string& field,
                                        const std::vector<std::string>& envVars = {}) const;

    [[nodiscard]] bool getBool(const std::string& field) const;
    [[nodiscard]] bool getBoolDefault(const std::string& field, bool defaultValue) const;

    /// Any JSON number, truncated toward zero
    [[nodiscard]] int64_t getInt(const std::string& field) const;
    [[nodiscard]] int64_t getIntDefault(const std::string& field, int64_t defaultValue) const;

    [[nodiscard]] double getFloat(const std::string& field) const;

    /// Array field; non-string elements are skipped
    [[nodiscard]] std::vector<std::string> getStringSlice(const std::string& field) const;

    /// Object field; non-string values are skipped
    [[nodiscard]] std::map<std::string, std::string> getStringMap(const std::string& field) const;

    /// Field present, even when null
    [[nodiscard]] bool has(const std::string& field) const;

    [[nodiscard]] const ConfigMap& raw() const noexcept { return raw_; }

private:
    const ConfigMap* find(const std::string& field) const;

    ConfigMap raw_;
};

/**
 * @brief Accumulates ValidationErrors in insertion order
 *
 * Every method returns *this so checks chain:
 * @code
 * return ValidationBuilder()
 *     .requireStringWithEnv(config, "token", {"SLACK_TOKEN"})
 *     .validateUrl(config, "webhook")
 *     .validateEnum(config, "format", {"plain", "markdown"})
 *     .build();
 * @endcode
 */
class ValidationBuilder {
public:
    ValidationBuilder& addError(std::string field, std::string message, std::string code);
    ValidationBuilder& addRequired(const std::string& field);
    ValidationBuilder& addTypeError(const std::string& field, const std::string& expectedType);
    ValidationBuilder& addEnumError(const std::string& field,
                                    const std::vector<std::string>& validValues);
    ValidationBuilder& addFormatError(const std::string& field, std::string message);

    ValidationBuilder& requireString(const ConfigMap& config, const std::string& field);
    ValidationBuilder& requireStringWithEnv(const ConfigMap& config, const std::string& field,
                                            const std::vector<std::string>& envVars);
    ValidationBuilder& validateStringSlice(const ConfigMap& config, const std::string& field);
    ValidationBuilder& validateRegex(const ConfigMap& config, const std::string& field);
    ValidationBuilder& validateUrl(const ConfigMap& config, const std::string& field);
    ValidationBuilder& validateEnum(const ConfigMap& config, const std::string& field,
                                    const std::vector<std::string>& validValues);

    [[nodiscard]] bool hasErrors() const noexcept { return !errors_.empty(); }
    [[nodiscard]] const std::vector<ValidationError>& errors() const noexcept { return errors_; }

    [[nodiscard]] ValidateResponse build() const;

private:
    std::vector<ValidationError> errors_;
};

struct ParsedUrl {
    std::string scheme; ///< lower-cased
    std::string host;   ///< host[:port], without userinfo
    std::string path;
    std::string query;
    std::string fragment;
};

/// Lenient URL split; rejects control characters, bad %-escapes and a missing scheme name
[[nodiscard]] Result<ParsedUrl> parseUrl(std::string_view text);

/**
 * @brief URL checks for outbound calls made by a plugin
 *
 * Restricting hosts keeps a configured webhook from pointing the plugin at an
 * arbitrary internal address.
 */
class UrlValidator {
public:
    explicit UrlValidator(std::string scheme);

    UrlValidator& withHosts(std::vector<std::string> hosts);
    UrlValidator& withPathPrefix(std::string prefix);

    /// ValidationError describing the first failed rule
    [[nodiscard]] Result<void> validate(std::string_view url) const;

private:
    std::string scheme_;
    std::vector<std::string> allowedHosts_;
    std::string pathPrefix_;
};

/**
 * @brief Resolve a release asset path
 *
 * The path may not climb with "..", must exist, must stay inside the current
 * working directory once symlinks are resolved, and must be a regular file.
 * @return the resolved absolute path
 */
[[nodiscard]] Result<std::filesystem::path> validateAssetPath(std::string_view assetPath);

enum class MentionFormat { Plain, Slack, Discord };

/**
 * @brief Space separated mentions in the syntax of a chat service
 *
 * Already formatted mentions pass through unchanged.
 */
std::string buildMentionText(const std::vector<std::string>& mentions, MentionFormat format);

} // namespace relicta::plugin
