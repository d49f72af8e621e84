#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/generic/stream_protocol.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace ondd::ipc {

struct Endpoint {
    enum class Kind {
        Local,
        Tcp
    };

    Kind kind = Kind::Local;
    std::string path;
    std::string host;
    std::uint16_t port = 0;

    // "unix:<path>", anything containing '/', or "<host>:<port>".
    // Throws InvalidArgumentError on an empty or unparseable endpoint.
    static Endpoint parse(const std::string& endpoint);

    std::string to_string() const;
};

struct TransportOptions {
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds write_timeout{5000};
    std::size_t max_response_size = 1024 * 1024;
};

// One connection to the daemon. A transport carries at most one exchange at a
// time; callers serialize send/receive pairs themselves.
class Transport {
public:
    virtual ~Transport() = default;

    virtual void open(const std::string& endpoint) = 0;
    virtual void send(const std::string& bytes) = 0;
    // Returns the response bytes preceding the response terminator.
    virtual std::string receive_response(std::chrono::milliseconds timeout) = 0;
    virtual void close() = 0;
    // Safe to call from another thread; aborts a pending send or receive.
    virtual void cancel() = 0;

    virtual bool is_open() const = 0;
    virtual const std::string& endpoint() const = 0;
};

class SocketTransport : public Transport {
public:
    explicit SocketTransport(TransportOptions options = {});
    ~SocketTransport() override;

    SocketTransport(const SocketTransport&) = delete;
    SocketTransport& operator=(const SocketTransport&) = delete;

    void open(const std::string& endpoint) override;
    void send(const std::string& bytes) override;
    std::string receive_response(std::chrono::milliseconds timeout) override;
    void close() override;
    void cancel() override;

    bool is_open() const override { return open_; }
    const std::string& endpoint() const override { return endpoint_; }

private:
    using socket_type = boost::asio::generic::stream_protocol::socket;

    // Runs queued operations until they finish or the timeout expires. On
    // expiry the socket is closed and false is returned.
    bool run_for(std::chrono::milliseconds timeout);
    void connect_local(const Endpoint& endpoint);
    void connect_tcp(const Endpoint& endpoint);
    void connect_to(const boost::asio::generic::stream_protocol::endpoint& endpoint);
    void close_socket();

    TransportOptions options_;
    boost::asio::io_context io_context_;
    socket_type socket_;
    std::string endpoint_;
    std::string read_buffer_;

    std::atomic<bool> open_;
    std::atomic<bool> cancel_requested_;
    std::mutex send_mutex_;
    std::mutex socket_mutex_;
};

}
