#include <relicta/plugin/plugin_process.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace relicta::plugin {

namespace {

constexpr std::size_t kStderrTailBytes = 8 * 1024;
constexpr std::size_t kStdoutBufferBytes = 1024 * 1024;
constexpr int kPumpPollMs = 50;

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Build "KEY=VALUE" entries: the inherited environment overlaid with cfg.env
std::vector<std::string> build_environment(const PluginProcessConfig& cfg) {
    std::map<std::string, std::string> merged;
    if (cfg.inherit_env && environ != nullptr) {
        for (char** e = environ; *e != nullptr; ++e) {
            std::string_view entry{*e};
            auto eq = entry.find('=');
            if (eq == std::string_view::npos)
                continue;
            merged[std::string(entry.substr(0, eq))] = std::string(entry.substr(eq + 1));
        }
    }
    for (const auto& [key, value] : cfg.env) {
        merged[key] = value;
    }
    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        out.push_back(key + "=" + value);
    }
    return out;
}

// Log every complete line in pending and keep the unterminated remainder
void forward_lines(std::string& pending, std::string_view log_name, std::string_view stream) {
    std::size_t start = 0;
    for (auto nl = pending.find('\n'); nl != std::string::npos; nl = pending.find('\n', start)) {
        std::string_view line{pending.data() + start, nl - start};
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        if (!line.empty()) {
            spdlog::debug("[plugin:{}{}] {}", log_name, stream, line);
        }
        start = nl + 1;
    }
    pending.erase(0, start);
}

} // namespace

class PluginProcess::Impl {
public:
    explicit Impl(PluginProcessConfig config);
    ~Impl();

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    [[nodiscard]] ProcessState state() const noexcept;
    [[nodiscard]] bool is_alive() const noexcept;
    void terminate(std::chrono::milliseconds timeout);
    [[nodiscard]] std::optional<std::string> read_line(std::chrono::milliseconds timeout);
    [[nodiscard]] std::span<const std::byte> read_stdout();
    void consume_stdout(std::size_t n);
    [[nodiscard]] bool stdout_eof() const noexcept;
    void forward_stdout();
    [[nodiscard]] std::string stderr_tail() const;
    [[nodiscard]] int64_t pid() const noexcept;
    [[nodiscard]] std::chrono::milliseconds uptime() const noexcept;
    [[nodiscard]] bool wait_for_exit(std::chrono::milliseconds timeout);
    [[nodiscard]] std::optional<int> exit_code() const noexcept;

private:
    void spawn_process();
    void start_io_threads();
    void stop_io_threads();
    void read_stdout_loop(std::stop_token stop);
    void read_stderr_loop(std::stop_token stop);
    bool try_reap() const noexcept;

    PluginProcessConfig config_;
    std::string log_name_;
    mutable std::atomic<ProcessState> state_{ProcessState::Unstarted};
    std::chrono::steady_clock::time_point start_time_;

    mutable std::mutex reap_mutex_;
    mutable std::optional<int> exit_code_;

    std::vector<std::byte> stdout_buffer_;
    std::vector<std::byte> stdout_view_;
    bool stdout_eof_{false};
    bool stdout_forwarding_{false};
    bool stdout_overflowed_{false};
    std::string stdout_pending_;
    mutable std::mutex stdout_mutex_;
    std::condition_variable stdout_cv_;

    std::string stderr_pending_;
    std::string stderr_tail_;
    mutable std::mutex stderr_mutex_;

    std::jthread stdout_thread_;
    std::jthread stderr_thread_;

    pid_t process_id_{-1};
    int stdout_fd_{-1};
    int stderr_fd_{-1};
};

PluginProcess::Impl::Impl(PluginProcessConfig config)
    : config_{std::move(config)},
      log_name_{config_.log_name.empty() ? config_.executable.filename().string()
                                         : config_.log_name} {
    spdlog::debug("PluginProcess: Spawning process: {}", config_.executable.string());

    // A plugin dying mid-write must not take the host down
    signal(SIGPIPE, SIG_IGN);

    state_.store(ProcessState::Starting, std::memory_order_release);
    start_time_ = std::chrono::steady_clock::now();

    try {
        spawn_process();
        start_io_threads();
        state_.store(ProcessState::Ready, std::memory_order_release);
    } catch (const std::exception&) {
        state_.store(ProcessState::Failed, std::memory_order_release);
        close_fd(stdout_fd_);
        close_fd(stderr_fd_);
        throw;
    }
}

PluginProcess::Impl::~Impl() {
    if (is_alive()) {
        spdlog::debug("PluginProcess: {} still alive at destruction, terminating", log_name_);
        terminate(std::chrono::seconds{5});
    }
    stop_io_threads();
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

void PluginProcess::Impl::spawn_process() {
    int out_pipe[2];
    int err_pipe[2];
    int exec_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) < 0) {
        throw std::runtime_error("Failed to create stdout pipe: " + std::string(strerror(errno)));
    }
    if (pipe2(err_pipe, O_CLOEXEC) < 0) {
        int saved = errno;
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        throw std::runtime_error("Failed to create stderr pipe: " + std::string(strerror(saved)));
    }
    if (pipe2(exec_pipe, O_CLOEXEC) < 0) {
        int saved = errno;
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]})
            ::close(fd);
        throw std::runtime_error("Failed to create exec pipe: " + std::string(strerror(saved)));
    }

    // Everything the child needs is prepared before fork
    std::string exe_str = config_.executable.string();
    std::vector<char*> argv;
    argv.push_back(exe_str.data());
    for (auto& arg : config_.args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    auto env_strings = build_environment(config_);
    std::vector<char*> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto& e : env_strings) {
        envp.push_back(e.data());
    }
    envp.push_back(nullptr);

    std::string workdir = config_.workdir ? config_.workdir->string() : std::string{};

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1], exec_pipe[0],
                       exec_pipe[1]})
            ::close(fd);
        throw std::runtime_error("fork() failed: " + std::string(strerror(saved)));
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only from here on
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        if (config_.redirect_stderr) {
            dup2(err_pipe[1], STDERR_FILENO);
        }
        if (!workdir.empty() && chdir(workdir.c_str()) < 0) {
            int err = errno;
            (void)!write(exec_pipe[1], &err, sizeof(err));
            _exit(127);
        }
        execvpe(argv[0], argv.data(), envp.data());
        int err = errno;
        (void)!write(exec_pipe[1], &err, sizeof(err));
        _exit(127);
    }

    process_id_ = pid;
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::close(exec_pipe[1]);
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];

    // EOF means exec succeeded; an int means it did not
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        waitpid(process_id_, &status, 0);
        exit_code_ = 127;
        throw std::runtime_error("failed to execute " + exe_str + ": " +
                                 std::string(strerror(child_errno)));
    }

    spdlog::info("PluginProcess: Spawned process {} (pid={})", exe_str, process_id_);
}

void PluginProcess::Impl::start_io_threads() {
    stdout_thread_ = std::jthread{[this](std::stop_token stop) { read_stdout_loop(stop); }};
    if (config_.redirect_stderr) {
        stderr_thread_ = std::jthread{[this](std::stop_token stop) { read_stderr_loop(stop); }};
    }
}

void PluginProcess::Impl::stop_io_threads() {
    stdout_thread_.request_stop();
    stderr_thread_.request_stop();
    if (stdout_thread_.joinable()) {
        stdout_thread_.join();
    }
    if (stderr_thread_.joinable()) {
        stderr_thread_.join();
    }
}

void PluginProcess::Impl::read_stdout_loop(std::stop_token stop) {
    std::array<std::byte, 4096> buffer;
    pollfd pfd{stdout_fd_, POLLIN, 0};

    while (!stop.stop_requested()) {
        int ready = ::poll(&pfd, 1, kPumpPollMs);
        if (ready < 0 && errno == EINTR)
            continue;
        if (ready <= 0)
            continue;

        ssize_t bytes_read = ::read(stdout_fd_, buffer.data(), buffer.size());
        if (bytes_read > 0) {
            {
                std::lock_guard lock{stdout_mutex_};
                if (stdout_forwarding_) {
                    stdout_pending_.append(reinterpret_cast<const char*>(buffer.data()),
                                           static_cast<std::size_t>(bytes_read));
                    forward_lines(stdout_pending_, log_name_, " stdout");
                    if (stdout_pending_.size() > kStdoutBufferBytes) {
                        stdout_pending_.erase(0, stdout_pending_.size() - kStdoutBufferBytes);
                    }
                    continue;
                }
                stdout_buffer_.insert(stdout_buffer_.end(), buffer.begin(),
                                      buffer.begin() + bytes_read);
                if (stdout_buffer_.size() > kStdoutBufferBytes) {
                    // Nobody is reading; keep only the newest bytes
                    stdout_buffer_.erase(stdout_buffer_.begin(),
                                         stdout_buffer_.end() -
                                             static_cast<std::ptrdiff_t>(kStdoutBufferBytes));
                    if (!stdout_overflowed_) {
                        stdout_overflowed_ = true;
                        spdlog::warn("PluginProcess: '{}' stdout exceeded {} bytes, dropping "
                                     "oldest output",
                                     log_name_, kStdoutBufferBytes);
                    }
                }
            }
            stdout_cv_.notify_all();
        } else if (bytes_read == 0 || errno != EINTR) {
            break;
        }
    }

    {
        std::lock_guard lock{stdout_mutex_};
        stdout_eof_ = true;
        if (stdout_forwarding_ && !stdout_pending_.empty()) {
            spdlog::debug("[plugin:{} stdout] {}", log_name_, stdout_pending_);
            stdout_pending_.clear();
        }
    }
    stdout_cv_.notify_all();
}

void PluginProcess::Impl::read_stderr_loop(std::stop_token stop) {
    std::array<char, 4096> buffer;
    pollfd pfd{stderr_fd_, POLLIN, 0};

    while (!stop.stop_requested()) {
        int ready = ::poll(&pfd, 1, kPumpPollMs);
        if (ready < 0 && errno == EINTR)
            continue;
        if (ready <= 0)
            continue;

        ssize_t bytes_read = ::read(stderr_fd_, buffer.data(), buffer.size());
        if (bytes_read > 0) {
            std::lock_guard lock{stderr_mutex_};
            stderr_pending_.append(buffer.data(), static_cast<std::size_t>(bytes_read));
            stderr_tail_.append(buffer.data(), static_cast<std::size_t>(bytes_read));
            if (stderr_tail_.size() > kStderrTailBytes) {
                stderr_tail_.erase(0, stderr_tail_.size() - kStderrTailBytes);
            }
            forward_lines(stderr_pending_, log_name_, "");
        } else if (bytes_read == 0 || errno != EINTR) {
            break;
        }
    }

    std::lock_guard lock{stderr_mutex_};
    if (!stderr_pending_.empty()) {
        spdlog::debug("[plugin:{}] {}", log_name_, stderr_pending_);
        stderr_pending_.clear();
    }
}

std::optional<std::string> PluginProcess::Impl::read_line(std::chrono::milliseconds timeout) {
    std::unique_lock lock{stdout_mutex_};
    auto find_newline = [this] {
        return std::find(stdout_buffer_.begin(), stdout_buffer_.end(), std::byte{'\n'});
    };
    bool ready = stdout_cv_.wait_for(lock, timeout, [&] {
        return find_newline() != stdout_buffer_.end() || stdout_eof_;
    });
    if (!ready) {
        return std::nullopt;
    }
    auto nl = find_newline();
    if (nl == stdout_buffer_.end()) {
        return std::nullopt;
    }
    std::string line(reinterpret_cast<const char*>(stdout_buffer_.data()),
                     static_cast<std::size_t>(nl - stdout_buffer_.begin()));
    stdout_buffer_.erase(stdout_buffer_.begin(), nl + 1);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

std::span<const std::byte> PluginProcess::Impl::read_stdout() {
    std::lock_guard lock{stdout_mutex_};
    stdout_view_ = stdout_buffer_;
    return {stdout_view_.data(), stdout_view_.size()};
}

void PluginProcess::Impl::consume_stdout(std::size_t n) {
    std::lock_guard lock{stdout_mutex_};
    n = std::min(n, stdout_buffer_.size());
    stdout_buffer_.erase(stdout_buffer_.begin(),
                         stdout_buffer_.begin() + static_cast<std::ptrdiff_t>(n));
}

bool PluginProcess::Impl::stdout_eof() const noexcept {
    std::lock_guard lock{stdout_mutex_};
    return stdout_eof_ && std::find(stdout_buffer_.begin(), stdout_buffer_.end(),
                                    std::byte{'\n'}) == stdout_buffer_.end();
}

void PluginProcess::Impl::forward_stdout() {
    std::lock_guard lock{stdout_mutex_};
    if (stdout_forwarding_)
        return;
    stdout_forwarding_ = true;
    stdout_pending_.assign(reinterpret_cast<const char*>(stdout_buffer_.data()),
                           stdout_buffer_.size());
    stdout_buffer_.clear();
    stdout_buffer_.shrink_to_fit();
    forward_lines(stdout_pending_, log_name_, " stdout");
}

std::string PluginProcess::Impl::stderr_tail() const {
    std::lock_guard lock{stderr_mutex_};
    return stderr_tail_;
}

bool PluginProcess::Impl::try_reap() const noexcept {
    std::lock_guard lock{reap_mutex_};
    if (exit_code_) {
        return true;
    }
    if (process_id_ <= 0) {
        return false;
    }
    int status = 0;
    pid_t result = waitpid(process_id_, &status, WNOHANG);
    if (result == process_id_) {
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = 128 + WTERMSIG(status);
        } else {
            return false;
        }
        state_.store(ProcessState::Terminated, std::memory_order_release);
        return true;
    }
    if (result < 0 && errno == ECHILD) {
        // Reaped elsewhere; nothing more to learn about it
        exit_code_ = -1;
        state_.store(ProcessState::Terminated, std::memory_order_release);
        return true;
    }
    return false;
}

ProcessState PluginProcess::Impl::state() const noexcept {
    return state_.load(std::memory_order_acquire);
}

bool PluginProcess::Impl::is_alive() const noexcept {
    auto current_state = state();
    if (current_state != ProcessState::Starting && current_state != ProcessState::Ready &&
        current_state != ProcessState::ShuttingDown) {
        return false;
    }
    return !try_reap();
}

void PluginProcess::Impl::terminate(std::chrono::milliseconds timeout) {
    if (!is_alive()) {
        return;
    }
    if (process_id_ <= 0) {
        spdlog::warn("PluginProcess: Invalid process ID {} during termination", process_id_);
        state_.store(ProcessState::Terminated, std::memory_order_release);
        return;
    }

    spdlog::debug("PluginProcess: Terminating {} (pid={})", log_name_, process_id_);
    state_.store(ProcessState::ShuttingDown, std::memory_order_release);

    if (kill(process_id_, SIGTERM) == 0 && wait_for_exit(timeout)) {
        return;
    }

    spdlog::warn("PluginProcess: Forcefully killing {} (pid={})", log_name_, process_id_);
    kill(process_id_, SIGKILL);
    if (!wait_for_exit(std::chrono::seconds{1})) {
        spdlog::error("PluginProcess: {} (pid={}) did not exit after SIGKILL", log_name_,
                      process_id_);
    }
}

bool PluginProcess::Impl::wait_for_exit(std::chrono::milliseconds timeout) {
    auto start = std::chrono::steady_clock::now();
    while (true) {
        if (try_reap()) {
            return true;
        }
        if (std::chrono::steady_clock::now() - start >= timeout) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
}

int64_t PluginProcess::Impl::pid() const noexcept {
    return static_cast<int64_t>(process_id_);
}

std::chrono::milliseconds PluginProcess::Impl::uptime() const noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                 start_time_);
}

std::optional<int> PluginProcess::Impl::exit_code() const noexcept {
    std::lock_guard lock{reap_mutex_};
    return exit_code_;
}

// ============================================================================
// PluginProcess public interface (forwards to Impl)
// ============================================================================

PluginProcess::PluginProcess(PluginProcessConfig config)
    : impl_{std::make_unique<Impl>(std::move(config))} {}

PluginProcess::~PluginProcess() = default;

PluginProcess::PluginProcess(PluginProcess&&) noexcept = default;
PluginProcess& PluginProcess::operator=(PluginProcess&&) noexcept = default;

ProcessState PluginProcess::state() const noexcept {
    return impl_->state();
}

bool PluginProcess::is_alive() const noexcept {
    return impl_->is_alive();
}

void PluginProcess::terminate(std::chrono::milliseconds timeout) {
    impl_->terminate(timeout);
}

std::optional<std::string> PluginProcess::read_line(std::chrono::milliseconds timeout) {
    return impl_->read_line(timeout);
}

std::span<const std::byte> PluginProcess::read_stdout() {
    return impl_->read_stdout();
}

void PluginProcess::consume_stdout(std::size_t n) {
    impl_->consume_stdout(n);
}

void PluginProcess::forward_stdout() {
    impl_->forward_stdout();
}

bool PluginProcess::stdout_eof() const noexcept {
    return impl_->stdout_eof();
}

std::string PluginProcess::stderr_tail() const {
    return impl_->stderr_tail();
}

int64_t PluginProcess::pid() const noexcept {
    return impl_->pid();
}

std::chrono::milliseconds PluginProcess::uptime() const noexcept {
    return impl_->uptime();
}

bool PluginProcess::wait_for_exit(std::chrono::milliseconds timeout) {
    return impl_->wait_for_exit(timeout);
}

std::optional<int> PluginProcess::exit_code() const noexcept {
    return impl_->exit_code();
}

} // namespace relicta::plugin
