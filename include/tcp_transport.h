#pragma once

#include "config.h"
#include "errors.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace viva {

/**
 * @brief Length-prefixed message transport over TCP
 *
 * Each message is a 4-byte big-endian length followed by that many bytes of UTF-8 JSON.
 * One thread per accepted connection; requests on a connection are answered in order.
 * A frame larger than max_message_bytes closes the connection.
 */
class TcpTransport {
public:
    /// payload, connection id -> reply payload
    using MessageHandler = std::function<std::string(const std::string&, const std::string&)>;
    using DisconnectHandler = std::function<void(const std::string&)>;

    TcpTransport(const ServerConfig& config, MessageHandler on_message, DisconnectHandler on_disconnect);
    ~TcpTransport();

    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    /**
     * @brief Bind, listen and start the accept thread
     * @return IOError/NetworkError if the socket cannot be bound
     */
    Result<void> start();

    /// Close the listener and every connection, join all threads
    void stop();

    bool is_running() const;

    /// Bound port (useful when configured with port 0)
    int port() const;

    /// Connection threads not yet joined; closed connections are reaped on the next accept
    size_t connection_threads() const;

    /**
     * @brief Read one framed message
     * @return nullopt on orderly close; IOError on a short read; ValidationError if oversize
     */
    static Result<std::optional<std::string>> read_message(int fd, size_t max_bytes);

    static Result<void> write_message(int fd, const std::string& payload);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace viva
