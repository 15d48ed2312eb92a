#pragma once

#include <relicta/core/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace relicta::plugin {

/**
 * @brief Process state for external plugins
 */
enum class ProcessState : uint8_t {
    Unstarted,    ///< Process not yet spawned
    Starting,     ///< Process spawn in progress
    Ready,        ///< Process running
    ShuttingDown, ///< Shutdown initiated
    Terminated,   ///< Process has exited
    Failed        ///< Process could not be spawned
};

/**
 * @brief Configuration for spawning a plugin process
 *
 * Example:
 * @code
 * PluginProcessConfig config{.executable = "/usr/libexec/relicta/plugins/slack"};
 * config.with_env("RELICTA_PLUGIN_MAGIC_COOKIE", cookie)
 *       .in_directory("/srv/release");
 * @endcode
 */
struct PluginProcessConfig {
    std::filesystem::path executable; ///< Path, or a name looked up in PATH
    std::vector<std::string> args;    ///< Command-line arguments (argv[1..])
    std::unordered_map<std::string, std::string> env; ///< Added to / overriding the environment
    std::optional<std::filesystem::path> workdir;     ///< Working directory (optional)
    bool inherit_env{true};                           ///< Start from the host's environment
    bool redirect_stderr{true};                       ///< Capture stderr for logging
    std::string log_name;                             ///< Tag for forwarded stderr lines

    auto& with_env(std::string key, std::string value) {
        env[std::move(key)] = std::move(value);
        return *this;
    }

    auto& with_args(std::vector<std::string> a) {
        args = std::move(a);
        return *this;
    }

    auto& in_directory(std::filesystem::path dir) {
        workdir = std::move(dir);
        return *this;
    }
};

/**
 * @brief RAII wrapper for a plugin child process
 *
 * The child gets /dev/null as stdin. Its stdout is buffered by a pump thread
 * and read line by line (the handshake). Its stderr is forwarded to spdlog at
 * debug level, one record per line; the most recent output is kept for error
 * reports.
 *
 * All public methods are thread-safe. The destructor terminates a still
 * running child.
 */
class PluginProcess {
public:
    /**
     * @brief Construct and spawn plugin process
     * @throws std::runtime_error if the process cannot be spawned or exec fails
     */
    explicit PluginProcess(PluginProcessConfig config);

    ~PluginProcess();

    PluginProcess(const PluginProcess&) = delete;
    PluginProcess& operator=(const PluginProcess&) = delete;

    PluginProcess(PluginProcess&&) noexcept;
    PluginProcess& operator=(PluginProcess&&) noexcept;

    [[nodiscard]] ProcessState state() const noexcept;

    /// True while the child has not exited; reaps it when it has
    [[nodiscard]] bool is_alive() const noexcept;

    /**
     * @brief SIGTERM, then SIGKILL if the child outlives the timeout
     */
    void terminate(std::chrono::milliseconds timeout = std::chrono::seconds{5});

    /**
     * @brief Next complete stdout line, without its terminator
     * @return std::nullopt on timeout, or once stdout hit EOF with no complete line left
     */
    [[nodiscard]] std::optional<std::string> read_line(std::chrono::milliseconds timeout);

    /// Unconsumed stdout bytes; valid until the next stdout call
    [[nodiscard]] std::span<const std::byte> read_stdout();

    /// Drop the first n buffered stdout bytes
    void consume_stdout(std::size_t n);

    /// Child closed its stdout
    [[nodiscard]] bool stdout_eof() const noexcept;

    /**
     * @brief Stop buffering stdout and log further lines at debug level
     *
     * Buffered bytes are logged too. Afterwards read_line() and read_stdout()
     * see nothing new. Until this is called, stdout is buffered up to 1 MiB,
     * keeping the newest bytes.
     */
    void forward_stdout();

    /// Last few KiB written to stderr
    [[nodiscard]] std::string stderr_tail() const;

    [[nodiscard]] int64_t pid() const noexcept;

    [[nodiscard]] std::chrono::milliseconds uptime() const noexcept;

    [[nodiscard]] bool wait_for_exit(std::chrono::milliseconds timeout);

    /**
     * @brief Exit status once reaped; 128+signal for a signalled child
     */
    [[nodiscard]] std::optional<int> exit_code() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace relicta::plugin
