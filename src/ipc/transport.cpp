#include "ondd/ipc/transport.hpp"
#include "ondd/ipc/errors.hpp"
#include "ondd/ipc/stanza.hpp"
#include "ondd/core/logger.hpp"
#include "ondd/core/utils.hpp"
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <sys/socket.h>

namespace ondd::ipc {

Endpoint Endpoint::parse(const std::string& endpoint) {
    using core::utils::StringUtils;

    if (endpoint.empty()) {
        throw InvalidArgumentError("endpoint must not be empty");
    }

    Endpoint result;

    if (StringUtils::starts_with(endpoint, "unix:")) {
        result.path = endpoint.substr(5);
        if (result.path.empty()) {
            throw InvalidArgumentError("endpoint '" + endpoint + "' has an empty socket path");
        }
        return result;
    }

    auto colon = endpoint.rfind(':');
    if (endpoint.find('/') != std::string::npos || colon == std::string::npos) {
        result.path = endpoint;
        return result;
    }

    result.kind = Kind::Tcp;
    result.host = endpoint.substr(0, colon);

    auto port_str = endpoint.substr(colon + 1);
    unsigned int port = 0;
    auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
    if (result.host.empty() || port_str.empty() || ec != std::errc() ||
        ptr != port_str.data() + port_str.size() || port == 0 || port > 65535) {
        throw InvalidArgumentError("endpoint '" + endpoint + "' is not a socket path or host:port");
    }
    result.port = static_cast<std::uint16_t>(port);

    return result;
}

std::string Endpoint::to_string() const {
    if (kind == Kind::Tcp) {
        return host + ":" + std::to_string(port);
    }
    return "unix:" + path;
}

SocketTransport::SocketTransport(TransportOptions options)
    : options_(options)
    , io_context_()
    , socket_(io_context_)
    , open_(false)
    , cancel_requested_(false) {
}

SocketTransport::~SocketTransport() {
    close();
}

void SocketTransport::open(const std::string& endpoint) {
    if (open_) {
        return;
    }

    auto parsed = Endpoint::parse(endpoint);

    endpoint_ = endpoint;
    read_buffer_.clear();
    cancel_requested_ = false;

    if (parsed.kind == Endpoint::Kind::Tcp) {
        connect_tcp(parsed);
    } else {
        connect_local(parsed);
    }

    open_ = true;
    LOG_DEBUG("Connected to ONDD at {}", endpoint_);
}

void SocketTransport::connect_local(const Endpoint& endpoint) {
    boost::asio::local::stream_protocol::endpoint local_endpoint;
    try {
        local_endpoint = boost::asio::local::stream_protocol::endpoint(endpoint.path);
    } catch (const boost::system::system_error& e) {
        throw ConnectionError("invalid socket path '" + endpoint.path + "': " + e.what());
    }

    connect_to(boost::asio::generic::stream_protocol::endpoint(local_endpoint));
}

void SocketTransport::connect_tcp(const Endpoint& endpoint) {
    boost::asio::ip::tcp::resolver resolver(io_context_);
    boost::system::error_code ec;
    auto results = resolver.resolve(endpoint.host, std::to_string(endpoint.port), ec);
    if (ec) {
        throw ConnectionError("failed to resolve " + endpoint.host + ": " + ec.message());
    }

    std::string last_error = "no addresses for " + endpoint.host;
    for (const auto& entry : results) {
        try {
            connect_to(boost::asio::generic::stream_protocol::endpoint(entry.endpoint()));
            return;
        } catch (const ConnectionError& e) {
            LOG_DEBUG("Connect attempt to {} failed: {}", entry.endpoint().address().to_string(), e.what());
            last_error = e.what();
        }
    }

    throw ConnectionError(last_error);
}

void SocketTransport::connect_to(const boost::asio::generic::stream_protocol::endpoint& endpoint) {
    boost::system::error_code result = boost::asio::error::would_block;
    socket_.async_connect(endpoint, [&result](const boost::system::error_code& ec) {
        result = ec;
    });

    if (!run_for(options_.connect_timeout)) {
        throw ConnectionError("timed out connecting to " + endpoint_);
    }

    if (result) {
        close_socket();
        throw ConnectionError("failed to connect to " + endpoint_ + ": " + result.message());
    }
}

void SocketTransport::send(const std::string& bytes) {
    std::lock_guard<std::mutex> lock(send_mutex_);

    if (!open_) {
        throw ConnectionError("connection is closed");
    }

    boost::system::error_code result = boost::asio::error::would_block;
    boost::asio::async_write(socket_, boost::asio::buffer(bytes),
        [&result](const boost::system::error_code& ec, std::size_t) {
            result = ec;
        });

    if (!run_for(options_.write_timeout)) {
        LOG_WARN("Write to {} timed out", endpoint_);
        throw TimeoutError("timed out writing " + std::to_string(bytes.size()) + " bytes");
    }

    if (result) {
        close_socket();
        if (cancel_requested_) {
            throw CancelledError("exchange cancelled");
        }
        LOG_DEBUG("Write to {} failed: {}", endpoint_, result.message());
        throw ConnectionError("write to " + endpoint_ + " failed: " + result.message());
    }

    LOG_TRACE("Sent {} bytes to {}", bytes.size(), endpoint_);
}

std::string SocketTransport::receive_response(std::chrono::milliseconds timeout) {
    if (!open_) {
        throw ConnectionError("connection is closed");
    }

    boost::system::error_code result = boost::asio::error::would_block;
    std::size_t length = 0;
    boost::asio::async_read_until(socket_,
        boost::asio::dynamic_buffer(read_buffer_, options_.max_response_size),
        RESPONSE_TERMINATOR,
        [&result, &length](const boost::system::error_code& ec, std::size_t n) {
            result = ec;
            length = n;
        });

    if (!run_for(timeout)) {
        read_buffer_.clear();
        LOG_WARN("No complete response from {} within {} ms, closing connection",
                 endpoint_, timeout.count());
        throw TimeoutError("no complete response within " + std::to_string(timeout.count()) + " ms");
    }

    if (result) {
        read_buffer_.clear();
        close_socket();

        if (cancel_requested_) {
            throw CancelledError("exchange cancelled");
        }
        if (result == boost::asio::error::not_found) {
            throw MalformedResponseError("response exceeds " +
                                         std::to_string(options_.max_response_size) + " bytes");
        }
        if (result == boost::asio::error::eof) {
            LOG_DEBUG("ONDD at {} closed the connection mid-exchange", endpoint_);
            throw ConnectionError("connection closed by daemon at " + endpoint_);
        }
        LOG_DEBUG("Read from {} failed: {}", endpoint_, result.message());
        throw ConnectionError("read from " + endpoint_ + " failed: " + result.message());
    }

    std::string response = read_buffer_.substr(0, length - 1);
    read_buffer_.erase(0, length);

    LOG_TRACE("Received {} bytes from {}", length, endpoint_);
    return response;
}

void SocketTransport::close() {
    if (!open_) {
        return;
    }

    close_socket();
    read_buffer_.clear();
    LOG_DEBUG("Closed connection to {}", endpoint_);
}

void SocketTransport::cancel() {
    std::lock_guard<std::mutex> lock(socket_mutex_);

    if (!socket_.is_open()) {
        return;
    }

    cancel_requested_ = true;
    if (::shutdown(socket_.native_handle(), SHUT_RDWR) < 0) {
        LOG_DEBUG("Shutdown of {} during cancel failed: {}", endpoint_, std::strerror(errno));
        return;
    }
    LOG_DEBUG("Cancelled pending exchange with {}", endpoint_);
}

bool SocketTransport::run_for(std::chrono::milliseconds timeout) {
    io_context_.restart();
    io_context_.run_for(timeout);

    if (!io_context_.stopped()) {
        // Closing aborts the outstanding operation; run its handler before returning.
        close_socket();
        io_context_.run();
        return false;
    }

    return true;
}

void SocketTransport::close_socket() {
    std::lock_guard<std::mutex> lock(socket_mutex_);

    boost::system::error_code ec;
    if (socket_.is_open()) {
        socket_.shutdown(socket_type::shutdown_both, ec);
        socket_.close(ec);
    }
    open_ = false;
}

}
