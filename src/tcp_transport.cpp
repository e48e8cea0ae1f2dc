#include "tcp_transport.h"
#include "logger.h"
#include <arpa/inet.h>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <map>
#include <mutex>
#include <netinet/in.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace viva {

namespace {

// recv until len bytes arrive; returns bytes read (short only on close/error)
ssize_t recv_all(int fd, void* buf, size_t len) {
    size_t got = 0;
    auto* p = static_cast<char*>(buf);
    while (got < len) {
        ssize_t n = recv(fd, p + got, len - got, 0);
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            return got > 0 ? static_cast<ssize_t>(got) : -1;
        }
        got += static_cast<size_t>(n);
    }
    return static_cast<ssize_t>(got);
}

bool send_all(int fd, const void* buf, size_t len) {
    size_t sent = 0;
    auto* p = static_cast<const char*>(buf);
    while (sent < len) {
        ssize_t n = send(fd, p + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

} // namespace

Result<std::optional<std::string>> TcpTransport::read_message(int fd, size_t max_bytes) {
    uint32_t length = 0;
    ssize_t n = recv_all(fd, &length, sizeof(length));
    if (n == 0) {
        return std::optional<std::string>();
    }
    if (n != static_cast<ssize_t>(sizeof(length))) {
        return make_io_error("Connection closed inside a frame header");
    }
    length = ntohl(length);
    if (length > max_bytes) {
        return make_validation_error("Frame of " + std::to_string(length) + " bytes exceeds limit");
    }

    std::string payload(length, '\0');
    if (length > 0 && recv_all(fd, &payload[0], length) != static_cast<ssize_t>(length)) {
        return make_io_error("Connection closed inside a frame body");
    }
    return std::optional<std::string>(std::move(payload));
}

Result<void> TcpTransport::write_message(int fd, const std::string& payload) {
    uint32_t length = htonl(static_cast<uint32_t>(payload.size()));
    if (!send_all(fd, &length, sizeof(length)) ||
        (!payload.empty() && !send_all(fd, payload.data(), payload.size()))) {
        return make_io_error(std::string("send failed: ") + std::strerror(errno));
    }
    return Result<void>();
}

class TcpTransport::Impl {
public:
    Impl(const ServerConfig& config, MessageHandler on_message, DisconnectHandler on_disconnect)
        : config_(config)
        , on_message_(std::move(on_message))
        , on_disconnect_(std::move(on_disconnect)) {}

    ~Impl() {
        stop();
    }

    Result<void> start() {
        if (running_) {
            return make_invalid_state_error("Transport already running");
        }

        server_socket_ = socket(AF_INET, SOCK_STREAM, 0);
        if (server_socket_ < 0) {
            return make_network_error(std::string("socket: ") + std::strerror(errno));
        }
        int opt = 1;
        setsockopt(server_socket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(config_.port));
        if (inet_pton(AF_INET, config_.host.c_str(), &addr.sin_addr) != 1) {
            close_listener();
            return make_validation_error("Invalid listen address: " + config_.host);
        }

        if (bind(server_socket_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
            std::string reason = std::strerror(errno);
            close_listener();
            return make_network_error("bind " + config_.host + ":" + std::to_string(config_.port) + ": " + reason);
        }
        if (listen(server_socket_, 16) < 0) {
            std::string reason = std::strerror(errno);
            close_listener();
            return make_network_error("listen: " + reason);
        }

        socklen_t len = sizeof(addr);
        if (getsockname(server_socket_, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
            bound_port_ = ntohs(addr.sin_port);
        }

        running_ = true;
        accept_thread_ = std::thread(&Impl::accept_loop, this);
        LOG_SERVER("Listening on " + config_.host + ":" + std::to_string(bound_port_));
        return Result<void>();
    }

    void stop() {
        if (!running_.exchange(false)) return;

        if (server_socket_ >= 0) {
            shutdown(server_socket_, SHUT_RDWR);
        }
        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }
        close_listener();

        std::map<std::string, std::thread> threads;
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            for (auto& entry : connection_sockets_) {
                shutdown(entry.second, SHUT_RDWR);
            }
            threads.swap(connection_threads_);
            finished_.clear();
        }
        for (auto& entry : threads) {
            if (entry.second.joinable()) entry.second.join();
        }
        LOG_SERVER("Transport stopped");
    }

    bool is_running() const { return running_; }
    int port() const { return bound_port_; }

    size_t connection_threads() const {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        return connection_threads_.size();
    }

private:
    void accept_loop() {
        while (running_) {
            struct sockaddr_in client_addr;
            socklen_t client_len = sizeof(client_addr);
            int client_socket = accept(server_socket_, reinterpret_cast<struct sockaddr*>(&client_addr), &client_len);
            if (client_socket < 0) {
                if (!running_) break;
                if (errno == EINTR) continue;
                LOG_WARN(std::string("accept failed: ") + std::strerror(errno));
                continue;
            }

            char ip[INET_ADDRSTRLEN] = {0};
            inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
            std::string connection_id = "conn-" + std::to_string(++connection_counter_) +
                                        "@" + ip + ":" + std::to_string(ntohs(client_addr.sin_port));
            LOG_SERVER("New client connected: " + connection_id);

            reap_finished();
            std::lock_guard<std::mutex> lock(connections_mutex_);
            connection_sockets_[connection_id] = client_socket;
            connection_threads_[connection_id] =
                std::thread(&Impl::serve_connection, this, connection_id, client_socket);
        }
    }

    // Join threads whose connection has closed; each one has already left serve_connection
    void reap_finished() {
        std::vector<std::thread> done;
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            for (const auto& connection_id : finished_) {
                auto it = connection_threads_.find(connection_id);
                if (it == connection_threads_.end()) continue;
                done.push_back(std::move(it->second));
                connection_threads_.erase(it);
            }
            finished_.clear();
        }
        for (auto& t : done) {
            if (t.joinable()) t.join();
        }
    }

    void serve_connection(std::string connection_id, int client_socket) {
        while (running_) {
            auto message = read_message(client_socket, config_.max_message_bytes);
            if (!message) {
                LOG_WARN("Closing " + connection_id + ": " + message.error().message);
                break;
            }
            if (!message.value()) {
                break;
            }

            std::string reply;
            try {
                reply = on_message_(*message.value(), connection_id);
            } catch (const std::exception& e) {
                LOG_ERROR("Handler failed on " + connection_id + ": " + e.what());
                reply = std::string("{\"type\":\"error\",\"message\":\"Internal server error\"}");
            }

            auto sent = write_message(client_socket, reply);
            if (!sent) {
                LOG_WARN("Closing " + connection_id + ": " + sent.error().message);
                break;
            }
        }

        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            connection_sockets_.erase(connection_id);
            finished_.push_back(connection_id);
        }
        close(client_socket);
        LOG_SERVER("Client disconnected: " + connection_id);

        if (on_disconnect_) {
            try {
                on_disconnect_(connection_id);
            } catch (const std::exception& e) {
                LOG_ERROR("Disconnect cleanup failed for " + connection_id + ": " + e.what());
            }
        }
    }

    void close_listener() {
        if (server_socket_ >= 0) {
            close(server_socket_);
            server_socket_ = -1;
        }
    }

    ServerConfig config_;
    MessageHandler on_message_;
    DisconnectHandler on_disconnect_;
    int server_socket_ = -1;
    int bound_port_ = 0;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> connection_counter_{0};
    std::thread accept_thread_;
    mutable std::mutex connections_mutex_;
    std::map<std::string, int> connection_sockets_;
    std::map<std::string, std::thread> connection_threads_;
    std::vector<std::string> finished_;
};

TcpTransport::TcpTransport(const ServerConfig& config, MessageHandler on_message, DisconnectHandler on_disconnect)
    : pimpl_(std::make_unique<Impl>(config, std::move(on_message), std::move(on_disconnect))) {}

TcpTransport::~TcpTransport() = default;

Result<void> TcpTransport::start() {
    return pimpl_->start();
}

void TcpTransport::stop() {
    pimpl_->stop();
}

bool TcpTransport::is_running() const {
    return pimpl_->is_running();
}

int TcpTransport::port() const {
    return pimpl_->port();
}

size_t TcpTransport::connection_threads() const {
    return pimpl_->connection_threads();
}

} // namespace viva
