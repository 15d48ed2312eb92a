#include <relicta/plugin/transport.h>
#include <relicta/plugin/wire.h>

#include <spdlog/spdlog.h>

#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/local/connect_pair.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>

namespace relicta::plugin {

namespace asio = boost::asio;
using local_stream = asio::local::stream_protocol;

SocketTransport::SocketTransport(Socket socket) : socket_(std::move(socket)) {
    startWriter();
}

SocketTransport::SocketTransport(std::unique_ptr<asio::io_context> io, Socket socket)
    : ownedIo_(std::move(io)), socket_(std::move(socket)) {
    startWriter();
}

SocketTransport::~SocketTransport() {
    close();
    boost::system::error_code ec;
    socket_.close(ec);
}

Result<std::unique_ptr<SocketTransport>> SocketTransport::connect(const std::string& path) {
    auto io = std::make_unique<asio::io_context>();
    Socket socket(*io);
    boost::system::error_code ec;
    socket.connect(local_stream::endpoint(path), ec);
    if (ec) {
        return Error{ErrorCode::NetworkError,
                     "failed to connect to plugin socket " + path + ": " + ec.message()};
    }
    spdlog::debug("SocketTransport: Connected to {}", path);
    return std::unique_ptr<SocketTransport>(new SocketTransport(std::move(io), std::move(socket)));
}

std::pair<std::unique_ptr<SocketTransport>, std::unique_ptr<SocketTransport>>
SocketTransport::createPair() {
    auto ioA = std::make_unique<asio::io_context>();
    auto ioB = std::make_unique<asio::io_context>();
    Socket a(*ioA);
    Socket b(*ioB);
    asio::local::connect_pair(a, b);
    return {std::unique_ptr<SocketTransport>(new SocketTransport(std::move(ioA), std::move(a))),
            std::unique_ptr<SocketTransport>(new SocketTransport(std::move(ioB), std::move(b)))};
}

void SocketTransport::startWriter() {
    {
        std::lock_guard lk(queueMutex_);
        writerRunning_ = true;
    }
    writerThread_ = std::thread([this] { writerLoop(); });
}

Result<void> SocketTransport::writeFrame(const std::string& frame) {
    boost::system::error_code ec;
    asio::write(socket_, asio::buffer(frame), ec);
    if (ec) {
        if (state_.load() == TransportState::Connected) {
            state_.store(TransportState::Error);
        }
        return Error{ErrorCode::NetworkError, "socket write failed: " + ec.message()};
    }
    return {};
}

Result<void> SocketTransport::send(const json& message) {
    if (!isConnected()) {
        return Error{ErrorCode::NetworkError, "transport is not connected"};
    }
    std::string frame = message.dump() + "\n";

    std::lock_guard outLock(outMutex_);
    std::deque<std::string> pending;
    {
        std::lock_guard lk(queueMutex_);
        pending.swap(outQueue_);
    }
    for (const auto& queued : pending) {
        if (auto r = writeFrame(queued); !r) {
            return r;
        }
    }
    return writeFrame(frame);
}

void SocketTransport::sendAsync(json message) {
    if (!isConnected()) {
        spdlog::debug("SocketTransport: Dropping async message on closed transport");
        return;
    }
    {
        std::lock_guard lk(queueMutex_);
        outQueue_.push_back(message.dump() + "\n");
    }
    queueCv_.notify_one();
}

void SocketTransport::sendNotificationAsync(std::string_view method, json params) {
    json notification = {{"jsonrpc", wire::kJsonRpcVersion}, {"method", method}};
    if (!params.is_null()) {
        notification["params"] = std::move(params);
    }
    sendAsync(std::move(notification));
}

void SocketTransport::writerLoop() {
    while (true) {
        {
            std::unique_lock lk(queueMutex_);
            queueCv_.wait(lk, [this] { return !outQueue_.empty() || !writerRunning_; });
            if (outQueue_.empty() && !writerRunning_) {
                return;
            }
        }
        // Pop under outMutex_ so a concurrent send() cannot overtake popped frames
        std::lock_guard outLock(outMutex_);
        std::deque<std::string> batch;
        {
            std::lock_guard lk(queueMutex_);
            batch.swap(outQueue_);
        }
        for (const auto& frame : batch) {
            if (auto r = writeFrame(frame); !r) {
                spdlog::debug("SocketTransport: Writer stopping: {}", r.error().message);
                std::lock_guard lk(queueMutex_);
                outQueue_.clear();
                writerRunning_ = false;
                return;
            }
        }
    }
}

MessageResult SocketTransport::receive() {
    std::lock_guard lk(receiveMutex_);
    if (state_.load() == TransportState::Closing || state_.load() == TransportState::Disconnected) {
        return Error{ErrorCode::NetworkError, "transport closed"};
    }

    boost::system::error_code ec;
    std::size_t n = asio::read_until(socket_, inbound_, '\n', ec);
    if (ec) {
        if (state_.load() == TransportState::Connected) {
            state_.store(TransportState::Disconnected);
        }
        if (ec == asio::error::eof) {
            return Error{ErrorCode::NetworkError, "connection closed by peer"};
        }
        if (ec == asio::error::not_found) {
            return Error{ErrorCode::InvalidData, "inbound frame exceeds size limit"};
        }
        return Error{ErrorCode::NetworkError, "socket read failed: " + ec.message()};
    }

    std::string line(asio::buffers_begin(inbound_.data()),
                     asio::buffers_begin(inbound_.data()) + static_cast<std::ptrdiff_t>(n));
    inbound_.consume(n);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }
    if (line.empty()) {
        return Error{ErrorCode::InvalidData, "empty frame"};
    }
    try {
        return json::parse(line);
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidData, std::string("invalid JSON frame: ") + e.what()};
    }
}

void SocketTransport::close() {
    std::call_once(closeOnce_, [this] {
        auto previous = state_.exchange(TransportState::Closing);
        {
            std::lock_guard lk(queueMutex_);
            writerRunning_ = false;
        }
        queueCv_.notify_all();
        if (writerThread_.joinable()) {
            writerThread_.join();
        }
        boost::system::error_code ec;
        socket_.shutdown(local_stream::socket::shutdown_both, ec);
        if (ec && previous == TransportState::Connected) {
            spdlog::debug("SocketTransport: shutdown: {}", ec.message());
        }
    });
}

} // namespace relicta::plugin
