#include <relicta/plugin/config_parser.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <regex>

namespace relicta::plugin {

namespace {

bool envSet(const std::string& name) {
    const char* raw = std::getenv(name.c_str());
    return raw && *raw;
}

// Non-empty string field, or nullptr
const std::string* nonEmptyString(const ConfigMap& config, const std::string& field) {
    if (!config.is_object()) {
        return nullptr;
    }
    auto it = config.find(field);
    if (it == config.end() || !it->is_string()) {
        return nullptr;
    }
    const auto& value = it->get_ref<const std::string&>();
    return value.empty() ? nullptr : &value;
}

bool isHex(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

bool startsWith(std::string_view text, std::string_view prefix) {
    return text.substr(0, prefix.size()) == prefix;
}

} // namespace

// ConfigParser

ConfigParser::ConfigParser(ConfigMap config) : raw_(std::move(config)) {
    if (!raw_.is_object()) {
        raw_ = ConfigMap::object();
    }
}

const ConfigMap* ConfigParser::find(const std::string& field) const {
    auto it = raw_.find(field);
    return it == raw_.end() ? nullptr : &*it;
}

std::string ConfigParser::getString(const std::string& field,
                                    const std::vector<std::string>& envVars) const {
    if (const auto* value = nonEmptyString(raw_, field)) {
        return *value;
    }
    for (const auto& name : envVars) {
        if (const char* raw = std::getenv(name.c_str()); raw && *raw) {
            return raw;
        }
    }
    return {};
}

bool ConfigParser::getBool(const std::string& field) const {
    return getBoolDefault(field, false);
}

bool ConfigParser::getBoolDefault(const std::string& field, bool defaultValue) const {
    const auto* value = find(field);
    return value && value->is_boolean() ? value->get<bool>() : defaultValue;
}

int64_t ConfigParser::getInt(const std::string& field) const {
    return getIntDefault(field, 0);
}

int64_t ConfigParser::getIntDefault(const std::string& field, int64_t defaultValue) const {
    const auto* value = find(field);
    if (!value || !value->is_number()) {
        return defaultValue;
    }
    if (value->is_number_float()) {
        // 2^63 is exact as a double; anything at or past it does not fit
        constexpr double kLimit = 9223372036854775808.0;
        double d = value->get<double>();
        if (!std::isfinite(d) || d >= kLimit || d < -kLimit) {
            return defaultValue;
        }
        return static_cast<int64_t>(d);
    }
    if (value->is_number_unsigned() &&
        value->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return defaultValue;
    }
    return value->get<int64_t>();
}

double ConfigParser::getFloat(const std::string& field) const {
    const auto* value = find(field);
    return value && value->is_number() ? value->get<double>() : 0.0;
}

std::vector<std::string> ConfigParser::getStringSlice(const std::string& field) const {
    std::vector<std::string> out;
    const auto* value = find(field);
    if (!value || !value->is_array()) {
        return out;
    }
    for (const auto& item : *value) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        }
    }
    return out;
}

std::map<std::string, std::string> ConfigParser::getStringMap(const std::string& field) const {
    std::map<std::string, std::string> out;
    const auto* value = find(field);
    if (!value || !value->is_object()) {
        return out;
    }
    for (const auto& [key, item] : value->items()) {
        if (item.is_string()) {
            out.emplace(key, item.get<std::string>());
        }
    }
    return out;
}

bool ConfigParser::has(const std::string& field) const {
    return raw_.contains(field);
}

// ValidationBuilder

ValidationBuilder& ValidationBuilder::addError(std::string field, std::string message,
                                               std::string code) {
    errors_.push_back(ValidationError{std::move(field), std::move(message), std::move(code)});
    return *this;
}

ValidationBuilder& ValidationBuilder::addRequired(const std::string& field) {
    return addError(field, fmt::format("{} is required", field), "required");
}

ValidationBuilder& ValidationBuilder::addTypeError(const std::string& field,
                                                   const std::string& expectedType) {
    return addError(field, fmt::format("{} must be {}", field, expectedType), "type");
}

ValidationBuilder& ValidationBuilder::addEnumError(const std::string& field,
                                                   const std::vector<std::string>& validValues) {
    return addError(field,
                    fmt::format("{} must be one of: {}", field, fmt::join(validValues, ", ")),
                    "enum");
}

ValidationBuilder& ValidationBuilder::addFormatError(const std::string& field,
                                                     std::string message) {
    return addError(field, std::move(message), "format");
}

ValidationBuilder& ValidationBuilder::requireString(const ConfigMap& config,
                                                    const std::string& field) {
    if (!nonEmptyString(config, field)) {
        addRequired(field);
    }
    return *this;
}

ValidationBuilder& ValidationBuilder::requireStringWithEnv(const ConfigMap& config,
                                                           const std::string& field,
                                                           const std::vector<std::string>& envVars) {
    if (nonEmptyString(config, field) || std::any_of(envVars.begin(), envVars.end(), envSet)) {
        return *this;
    }
    std::string hint;
    if (!envVars.empty()) {
        hint = fmt::format(" (or set {})", fmt::join(envVars, " or "));
    }
    return addError(field, fmt::format("{} is required{}", field, hint), "required");
}

ValidationBuilder& ValidationBuilder::validateStringSlice(const ConfigMap& config,
                                                          const std::string& field) {
    if (!config.is_object()) {
        return *this;
    }
    auto it = config.find(field);
    if (it == config.end() || !it->is_array()) {
        return *this;
    }
    for (std::size_t i = 0; i < it->size(); ++i) {
        if (!(*it)[i].is_string()) {
            addTypeError(fmt::format("{}[{}]", field, i), "string");
        }
    }
    return *this;
}

ValidationBuilder& ValidationBuilder::validateRegex(const ConfigMap& config,
                                                    const std::string& field) {
    const auto* pattern = nonEmptyString(config, field);
    if (!pattern) {
        return *this;
    }
    try {
        std::regex compiled(*pattern);
        (void)compiled;
    } catch (const std::regex_error& e) {
        addFormatError(field, fmt::format("invalid regex pattern: {}", e.what()));
    }
    return *this;
}

ValidationBuilder& ValidationBuilder::validateUrl(const ConfigMap& config,
                                                  const std::string& field) {
    const auto* url = nonEmptyString(config, field);
    if (url && !parseUrl(*url)) {
        addFormatError(field, "invalid URL format");
    }
    return *this;
}

ValidationBuilder& ValidationBuilder::validateEnum(const ConfigMap& config,
                                                   const std::string& field,
                                                   const std::vector<std::string>& validValues) {
    const auto* value = nonEmptyString(config, field);
    if (!value) {
        return *this;
    }
    if (std::find(validValues.begin(), validValues.end(), *value) == validValues.end()) {
        addEnumError(field, validValues);
    }
    return *this;
}

ValidateResponse ValidationBuilder::build() const {
    ValidateResponse response;
    response.valid = errors_.empty();
    response.errors = errors_;
    return response;
}

// URLs

Result<ParsedUrl> parseUrl(std::string_view text) {
    for (std::size_t i = 0; i < text.size(); ++i) {
        auto c = static_cast<unsigned char>(text[i]);
        if (c < 0x20 || c == 0x7f) {
            return Error{ErrorCode::InvalidData, "invalid control character in URL"};
        }
        if (c == '%' && (i + 2 >= text.size() || !isHex(text[i + 1]) || !isHex(text[i + 2]))) {
            return Error{ErrorCode::InvalidData,
                         fmt::format("invalid URL escape \"{}\"", text.substr(i, 3))};
        }
    }

    ParsedUrl url;
    std::string_view rest = text;

    // scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) ":"
    auto colon = rest.find(':');
    auto slash = rest.find('/');
    if (colon == 0) {
        return Error{ErrorCode::InvalidData, "missing protocol scheme"};
    }
    if (colon != std::string_view::npos && (slash == std::string_view::npos || colon < slash)) {
        auto scheme = rest.substr(0, colon);
        bool valid = std::isalpha(static_cast<unsigned char>(scheme.front())) != 0 &&
                     std::all_of(scheme.begin(), scheme.end(), [](char c) {
                         return std::isalnum(static_cast<unsigned char>(c)) || c == '+' ||
                                c == '-' || c == '.';
                     });
        if (valid) {
            url.scheme.reserve(scheme.size());
            for (char c : scheme) {
                url.scheme.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            }
            rest.remove_prefix(colon + 1);
        } else if (std::isalpha(static_cast<unsigned char>(scheme.front())) == 0) {
            return Error{ErrorCode::InvalidData, "first path segment in URL cannot contain colon"};
        }
    }

    if (auto hash = rest.find('#'); hash != std::string_view::npos) {
        url.fragment = std::string(rest.substr(hash + 1));
        rest = rest.substr(0, hash);
    }
    if (auto question = rest.find('?'); question != std::string_view::npos) {
        url.query = std::string(rest.substr(question + 1));
        rest = rest.substr(0, question);
    }

    if (startsWith(rest, "//")) {
        rest.remove_prefix(2);
        auto end = rest.find('/');
        auto authority = rest.substr(0, end);
        if (auto at = authority.rfind('@'); at != std::string_view::npos) {
            authority.remove_prefix(at + 1);
        }
        if (authority.find(' ') != std::string_view::npos) {
            return Error{ErrorCode::InvalidData, "invalid character \" \" in host name"};
        }
        url.host = std::string(authority);
        rest = end == std::string_view::npos ? std::string_view{} : rest.substr(end);
    }
    url.path = std::string(rest);
    return url;
}

UrlValidator::UrlValidator(std::string scheme) : scheme_(std::move(scheme)) {}

UrlValidator& UrlValidator::withHosts(std::vector<std::string> hosts) {
    allowedHosts_ = std::move(hosts);
    return *this;
}

UrlValidator& UrlValidator::withPathPrefix(std::string prefix) {
    pathPrefix_ = std::move(prefix);
    return *this;
}

Result<void> UrlValidator::validate(std::string_view url) const {
    if (url.empty()) {
        return Error{ErrorCode::ValidationError, "URL is required"};
    }
    auto parsed = parseUrl(url);
    if (!parsed) {
        return Error{ErrorCode::ValidationError,
                     fmt::format("invalid URL format: {}", parsed.error().message)};
    }
    const auto& u = parsed.value();

    if (!scheme_.empty() && u.scheme != scheme_) {
        return Error{ErrorCode::ValidationError, fmt::format("URL must use {} scheme", scheme_)};
    }
    if (!allowedHosts_.empty() &&
        std::find(allowedHosts_.begin(), allowedHosts_.end(), u.host) == allowedHosts_.end()) {
        return Error{ErrorCode::ValidationError,
                     fmt::format("URL host {} is not allowed, must be one of: {}", u.host,
                                 fmt::join(allowedHosts_, ", "))};
    }
    if (!pathPrefix_.empty() && !startsWith(u.path, pathPrefix_)) {
        return Error{ErrorCode::ValidationError,
                     fmt::format("URL path must start with {}", pathPrefix_)};
    }
    return {};
}

// Assets

Result<std::filesystem::path> validateAssetPath(std::string_view assetPath) {
    namespace fs = std::filesystem;
    if (assetPath.empty()) {
        return Error{ErrorCode::InvalidArgument, "asset path cannot be empty"};
    }

    std::error_code ec;
    auto cwd = fs::current_path(ec);
    if (ec) {
        return Error{ErrorCode::InternalError,
                     fmt::format("failed to get working directory: {}", ec.message())};
    }
    auto realCwd = fs::weakly_canonical(cwd, ec);
    if (ec) {
        realCwd = cwd;
    }

    auto clean = fs::path(assetPath).lexically_normal();
    auto cleanText = clean.generic_string();
    if (startsWith(cleanText, "..") || cleanText.find("/../") != std::string::npos) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("path traversal not allowed in asset path: {}", assetPath)};
    }

    auto absolute = clean.is_absolute() ? clean : cwd / clean;
    auto real = fs::canonical(absolute, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return Error{ErrorCode::NotFound,
                         fmt::format("asset file does not exist: {}", assetPath)};
        }
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("failed to resolve asset path: {}", ec.message())};
    }

    auto cwdText = realCwd.string();
    auto cwdWithSep = cwdText.ends_with('/') ? cwdText : cwdText + "/";
    auto realText = real.string();
    if (realText != cwdText && !startsWith(realText, cwdWithSep)) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("asset path resolves outside working directory: {}", assetPath)};
    }

    auto status = fs::status(real, ec);
    if (ec) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("failed to stat asset file: {}", ec.message())};
    }
    if (fs::is_directory(status)) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("asset path is a directory, not a file: {}", assetPath)};
    }
    if (!fs::is_regular_file(status)) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("asset path is not a regular file: {}", assetPath)};
    }
    return real;
}

// Mentions

std::string buildMentionText(const std::vector<std::string>& mentions, MentionFormat format) {
    std::string out;
    out.reserve(mentions.size() * 20);

    for (std::size_t i = 0; i < mentions.size(); ++i) {
        const auto& m = mentions[i];
        if (i > 0) {
            out += ' ';
        }
        switch (format) {
            case MentionFormat::Slack:
                // <@USER_ID>, <!channel>
                if (startsWith(m, "<")) {
                    out += m;
                } else if (startsWith(m, "@")) {
                    out += "<" + m + ">";
                } else {
                    out += "<@" + m + ">";
                }
                break;
            case MentionFormat::Discord:
                // <@USER_ID>, <@&ROLE_ID>, <#CHANNEL_ID>; broadcasts stay bare
                if (startsWith(m, "<@") || startsWith(m, "<#") || m == "@everyone" ||
                    m == "@here") {
                    out += m;
                } else {
                    out += "<@" + m + ">";
                }
                break;
            case MentionFormat::Plain:
                if (!startsWith(m, "@")) {
                    out += '@';
                }
                out += m;
                break;
        }
    }
    return out;
}

} // namespace relicta::plugin
