#include "support/fake_daemon.hpp"
#include "ondd/core/logger.hpp"
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <sstream>

namespace ondd::testing {

FakeDaemon::FakeDaemon(const std::string& socket_path)
    : socket_path_(socket_path)
    , server_fd_(-1)
    , running_(false)
    , connection_count_(0) {
}

FakeDaemon::~FakeDaemon() {
    stop();
}

std::string FakeDaemon::unique_socket_path() {
    static std::atomic<int> counter{0};
    return "/tmp/ondd-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++) + ".sock";
}

bool FakeDaemon::start() {
    if (running_) {
        return false;
    }

    unlink(socket_path_.c_str());

    server_fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        LOG_ERROR("Failed to create Unix socket: {}", strerror(errno));
        return false;
    }

    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(server_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0 || listen(server_fd_, 8) < 0) {
        LOG_ERROR("Failed to bind fake daemon socket: {}", strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    running_ = true;
    accept_thread_ = std::thread([this]() {
        accept_loop();
    });

    return true;
}

void FakeDaemon::stop() {
    if (!running_) {
        return;
    }

    running_ = false;
    shutdown(server_fd_, SHUT_RDWR);
    close(server_fd_);
    server_fd_ = -1;

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (int fd : client_fds_) {
            shutdown(fd, SHUT_RDWR);
        }
        threads.swap(client_threads_);
    }
    for (auto& thread : threads) {
        thread.join();
    }

    unlink(socket_path_.c_str());
}

void FakeDaemon::set_response(const std::string& command, const std::string& response) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_[command] = response;
}

void FakeDaemon::set_silent(const std::string& command) {
    std::lock_guard<std::mutex> lock(mutex_);
    silent_.insert(command);
}

void FakeDaemon::set_hangup(const std::string& command) {
    std::lock_guard<std::mutex> lock(mutex_);
    hangup_.insert(command);
}

std::vector<std::string> FakeDaemon::requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

void FakeDaemon::accept_loop() {
    while (running_) {
        int client_fd = accept(server_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            break;
        }

        connection_count_++;

        std::lock_guard<std::mutex> lock(mutex_);
        client_fds_.insert(client_fd);
        client_threads_.emplace_back([this, client_fd]() {
            handle_client(client_fd);
        });
    }
}

void FakeDaemon::handle_client(int client_fd) {
    std::string pending;
    char buffer[4096];
    bool connected = true;

    while (connected) {
        ssize_t bytes_read = read(client_fd, buffer, sizeof(buffer));
        if (bytes_read <= 0) {
            break;
        }
        pending.append(buffer, static_cast<size_t>(bytes_read));

        size_t eol;
        while (connected && (eol = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, eol);
            pending.erase(0, eol + 1);

            std::istringstream iss(line);
            std::string command;
            iss >> command;

            std::string reply;
            bool silent = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                requests_.push_back(line);
                if (hangup_.count(command)) {
                    connected = false;
                    break;
                }
                silent = silent_.count(command) > 0;
                auto it = responses_.find(command);
                if (it != responses_.end()) {
                    reply = it->second;
                }
            }

            if (silent) {
                continue;
            }

            reply.push_back('\0');
            if (send(client_fd, reply.data(), reply.size(), MSG_NOSIGNAL) < 0) {
                connected = false;
            }
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    client_fds_.erase(client_fd);
    close(client_fd);
}

}
