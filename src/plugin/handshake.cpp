#include <relicta/plugin/handshake.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <cstdlib>

namespace relicta::plugin {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
        s.remove_prefix(1);
    while (!s.empty() &&
           (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n'))
        s.remove_suffix(1);
    return s;
}

bool parseInt(std::string_view s, int& out) {
    s = trim(s);
    if (s.empty())
        return false;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

} // namespace

HandshakeConfig defaultHandshake() {
    return HandshakeConfig{1, "RELICTA_PLUGIN_MAGIC_COOKIE", "relicta_plugin_7b3c9e1f"};
}

bool isPlugin(const HandshakeConfig& cfg) {
    if (cfg.magicCookieKey.empty()) {
        return false;
    }
    const char* value = std::getenv(cfg.magicCookieKey.c_str());
    return value != nullptr && cfg.magicCookieValue == value;
}

std::vector<int> parseVersionList(std::string_view text) {
    std::vector<int> versions;
    while (!text.empty()) {
        auto comma = text.find(',');
        auto item = text.substr(0, comma);
        int v = 0;
        if (parseInt(item, v)) {
            versions.push_back(v);
        }
        if (comma == std::string_view::npos)
            break;
        text.remove_prefix(comma + 1);
    }
    return versions;
}

Result<int> negotiateProtocolVersion(const HandshakeConfig& cfg) {
    const char* advertised = std::getenv(std::string(kEnvProtocolVersions).c_str());
    if (advertised == nullptr || *advertised == '\0') {
        return cfg.protocolVersion;
    }
    auto versions = parseVersionList(advertised);
    if (std::find(versions.begin(), versions.end(), cfg.protocolVersion) == versions.end()) {
        return Error{ErrorCode::ProtocolMismatch,
                     "host supports protocol versions [" + std::string(advertised) +
                         "], plugin speaks " + std::to_string(cfg.protocolVersion)};
    }
    return cfg.protocolVersion;
}

std::string formatHandshakeLine(const HandshakeLine& line) {
    return std::to_string(line.coreVersion) + "|" + std::to_string(line.appVersion) + "|" +
           line.network + "|" + line.address + "|" + line.protocol;
}

Result<HandshakeLine> parseHandshakeLine(std::string_view text) {
    text = trim(text);
    std::vector<std::string_view> parts;
    while (true) {
        auto bar = text.find('|');
        parts.push_back(text.substr(0, bar));
        if (bar == std::string_view::npos)
            break;
        text.remove_prefix(bar + 1);
    }

    // The protocol field was optional in early plugins
    if (parts.size() != 4 && parts.size() != 5) {
        return Error{ErrorCode::InvalidData, "malformed handshake line: expected 5 fields, got " +
                                                 std::to_string(parts.size())};
    }

    HandshakeLine line;
    if (!parseInt(parts[0], line.coreVersion)) {
        return Error{ErrorCode::InvalidData,
                     "malformed handshake core version: " + std::string(parts[0])};
    }
    if (!parseInt(parts[1], line.appVersion)) {
        return Error{ErrorCode::InvalidData,
                     "malformed handshake app version: " + std::string(parts[1])};
    }
    line.network = std::string(trim(parts[2]));
    line.address = std::string(trim(parts[3]));
    line.protocol = parts.size() == 5 ? std::string(trim(parts[4])) : std::string(kProtocolJsonRpc);
    if (line.address.empty()) {
        return Error{ErrorCode::InvalidData, "handshake line carries no address"};
    }
    return line;
}

Result<HandshakeLine> verifyHandshake(std::string_view text, const HandshakeConfig& cfg) {
    auto parsed = parseHandshakeLine(text);
    if (!parsed) {
        return parsed.error();
    }
    const auto& line = parsed.value();
    if (line.coreVersion != kCoreProtocolVersion) {
        return Error{ErrorCode::ProtocolMismatch,
                     "incompatible core protocol version " + std::to_string(line.coreVersion) +
                         ", expected " + std::to_string(kCoreProtocolVersion)};
    }
    if (line.appVersion != cfg.protocolVersion) {
        return Error{ErrorCode::ProtocolMismatch,
                     "incompatible plugin protocol version " + std::to_string(line.appVersion) +
                         ", expected " + std::to_string(cfg.protocolVersion)};
    }
    if (line.network != kNetworkUnix) {
        return Error{ErrorCode::NotSupported, "unsupported plugin network: " + line.network};
    }
    if (line.protocol != kProtocolJsonRpc) {
        return Error{ErrorCode::NotSupported, "unsupported plugin protocol: " + line.protocol};
    }
    spdlog::debug("Handshake: plugin at {} speaks {} v{}", line.address, line.protocol,
                  line.appVersion);
    return parsed;
}

} // namespace relicta::plugin
