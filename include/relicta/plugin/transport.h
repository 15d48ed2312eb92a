#pragma once

#include <relicta/core/types.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/streambuf.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace relicta::plugin {

using json = nlohmann::json;
using MessageResult = Result<json>;

enum class TransportState : int {
    Disconnected = 0,
    Connecting = 1,
    Connected = 2,
    Error = 3,
    Closing = 4
};

/**
 * Message transport carrying one JSON-RPC message per call
 */
class ITransport {
public:
    virtual ~ITransport() = default;
    virtual Result<void> send(const json& message) = 0;
    /// Blocks until a full message arrives. NetworkError once the peer is gone,
    /// InvalidData for a frame that is not JSON (the stream stays usable).
    virtual MessageResult receive() = 0;
    virtual bool isConnected() const = 0;
    virtual void close() = 0;
    virtual TransportState getState() const = 0;
};

/**
 * Transport with a non-blocking outbound path for notifications.
 *
 * sendNotificationAsync only enqueues; a writer thread drains the queue. A
 * synchronous send() flushes everything queued before it, so notifications
 * emitted while handling a request reach the peer ahead of the response.
 */
class IStreamingTransport : public ITransport {
public:
    virtual void sendAsync(json message) = 0;
    virtual void sendNotificationAsync(std::string_view method, json params) = 0;
};

/**
 * NDJSON over a connected Unix domain stream socket.
 */
class SocketTransport final : public IStreamingTransport {
public:
    using Socket = boost::asio::local::stream_protocol::socket;

    /// Adopt an accepted socket; its io_context must outlive the transport
    explicit SocketTransport(Socket socket);
    ~SocketTransport() override;

    SocketTransport(const SocketTransport&) = delete;
    SocketTransport& operator=(const SocketTransport&) = delete;

    /// Connect to a listening socket at path
    static Result<std::unique_ptr<SocketTransport>> connect(const std::string& path);

    /// Two transports wired to each other, used by tests
    static std::pair<std::unique_ptr<SocketTransport>, std::unique_ptr<SocketTransport>>
    createPair();

    Result<void> send(const json& message) override;
    MessageResult receive() override;
    bool isConnected() const override { return state_.load() == TransportState::Connected; }
    void close() override;
    TransportState getState() const override { return state_.load(); }

    void sendAsync(json message) override;
    void sendNotificationAsync(std::string_view method, json params) override;

    /// Largest accepted inbound frame
    static constexpr std::size_t kMaxFrameBytes = 64 * 1024 * 1024;

private:
    SocketTransport(std::unique_ptr<boost::asio::io_context> io, Socket socket);

    Result<void> writeFrame(const std::string& frame);
    void writerLoop();
    void startWriter();

    // Declared before socket_ so that it outlives it
    std::unique_ptr<boost::asio::io_context> ownedIo_;
    Socket socket_;
    boost::asio::streambuf inbound_{kMaxFrameBytes};

    std::atomic<TransportState> state_{TransportState::Connected};

    mutable std::mutex outMutex_;
    std::mutex receiveMutex_;

    std::mutex queueMutex_;
    std::condition_variable queueCv_;
    std::deque<std::string> outQueue_;
    std::thread writerThread_;
    bool writerRunning_{false};

    std::once_flag closeOnce_;
};

} // namespace relicta::plugin
