#pragma once

#include <relicta/core/types.h>

#include <string>
#include <string_view>
#include <vector>

/**
 * @file handshake.h
 * @brief Host/plugin discovery and protocol negotiation
 *
 * The host launches a plugin with the magic cookie in its environment. A
 * binary started without it is being run by hand and refuses to serve. Once
 * the plugin listens it writes a single handshake line to stdout:
 *
 *     CORE|APP|NETWORK|ADDRESS|PROTOCOL
 *
 * e.g. `1|1|unix|/tmp/relicta-plugin-1234.sock|jsonrpc`.
 */

namespace relicta::plugin {

/// Version of the handshake line format itself
inline constexpr int kCoreProtocolVersion = 1;

inline constexpr std::string_view kEnvProtocolVersions = "RELICTA_PLUGIN_PROTOCOL_VERSIONS";
inline constexpr std::string_view kEnvUnixSocketDir = "RELICTA_PLUGIN_UNIX_SOCKET_DIR";
inline constexpr std::string_view kNetworkUnix = "unix";
inline constexpr std::string_view kProtocolJsonRpc = "jsonrpc";

struct HandshakeConfig {
    int protocolVersion{1};
    std::string magicCookieKey;
    std::string magicCookieValue;
};

/// Constants shared by host and every plugin
HandshakeConfig defaultHandshake();

/**
 * @brief True when this process was launched by a host
 *
 * Only reads the environment: the variable named by magicCookieKey must be
 * set and equal magicCookieValue exactly.
 */
[[nodiscard]] bool isPlugin(const HandshakeConfig& cfg = defaultHandshake());

/**
 * @brief Plugin side: check the host's advertised versions
 *
 * Reads RELICTA_PLUGIN_PROTOCOL_VERSIONS. When it is unset the plugin's own
 * version is used; otherwise the version must appear in the list.
 */
[[nodiscard]] Result<int> negotiateProtocolVersion(const HandshakeConfig& cfg = defaultHandshake());

struct HandshakeLine {
    int coreVersion{kCoreProtocolVersion};
    int appVersion{1};
    std::string network{kNetworkUnix};
    std::string address;
    std::string protocol{kProtocolJsonRpc};
};

std::string formatHandshakeLine(const HandshakeLine& line);

/// Parse a line read from plugin stdout, trailing CR/LF tolerated
[[nodiscard]] Result<HandshakeLine> parseHandshakeLine(std::string_view text);

/**
 * @brief Host side: parse and check a handshake line
 *
 * Core/app version mismatches are ProtocolMismatch; a network or protocol the
 * host cannot speak is NotSupported.
 */
[[nodiscard]] Result<HandshakeLine> verifyHandshake(std::string_view text,
                                                    const HandshakeConfig& cfg = defaultHandshake());

/// Parse a comma separated version list such as "1,2"; junk entries are skipped
std::vector<int> parseVersionList(std::string_view text);

} // namespace relicta::plugin
