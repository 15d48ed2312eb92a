#pragma once

#include <relicta/core/types.h>
#include <relicta/plugin/handshake.h>
#include <relicta/plugin/plugin.h>

#include <filesystem>
#include <memory>
#include <string>

namespace relicta::plugin {

inline constexpr std::string_view kEnvLogLevel = "RELICTA_PLUGIN_LOG_LEVEL";

struct ServeConfig {
    HandshakeConfig handshake = defaultHandshake();
    /// Logger name used for notifications/message and the stderr logger
    std::string pluginName = "plugin";
};

/**
 * @brief Everything a host needs to connect to a service it did not start
 */
struct ReattachConfig {
    std::string protocol{kProtocolJsonRpc};
    int protocolVersion{1};
    std::string network{kNetworkUnix};
    std::string address;
    int pid{0};
    bool test{false};
};

struct ServeTestConfig {
    HandshakeConfig handshake = defaultHandshake();
    std::string pluginName = "plugin";
    /// Explicit socket path; a fresh one under the socket directory when empty
    std::filesystem::path socketPath;
};

namespace detail {
struct ServeTestState;
}

/**
 * @brief Handle to a service started by serveTest()
 *
 * Copies share the service. close() is idempotent and also runs when the
 * last copy goes away.
 */
class ServeTestHandle {
public:
    ServeTestHandle(ReattachConfig reattach, std::shared_ptr<detail::ServeTestState> state);

    const ReattachConfig& reattach() const { return reattach_; }

    /// Stop listening, close live connections and remove the socket file
    void close() const;

private:
    ReattachConfig reattach_;
    std::shared_ptr<detail::ServeTestState> state_;
};

/**
 * @brief Plugin process entry point
 *
 * Logs to stderr, refuses to run unless launched by a host (exit status 1),
 * negotiates the protocol version, listens on a fresh Unix socket, prints
 * the handshake line to stdout and serves the host until it disconnects or
 * sends $/shutdown. A socket that cannot be bound is fatal.
 */
void serve(std::shared_ptr<IPlugin> impl, ServeConfig cfg = {});

/**
 * @brief Run the service in-process for tests
 *
 * Returns once the service is listening, or with the bind error. The
 * handshake checks of serve() are skipped.
 */
[[nodiscard]] Result<ServeTestHandle> serveTest(std::shared_ptr<IPlugin> impl,
                                                ServeTestConfig cfg = {});

/// Fresh socket path under RELICTA_PLUGIN_UNIX_SOCKET_DIR, or the temp directory
std::filesystem::path makeSocketPath();

} // namespace relicta::plugin
