#pragma once
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "log.hpp"

class Connection;

// Receives every decoded line of a connection plus its close notification.
// Both run on the io thread.
class MessageSink {
public:
    virtual ~MessageSink() = default;
    virtual void on_message(const std::shared_ptr<Connection>& conn, const nlohmann::json& message) = 0;
    virtual void on_closed(const std::shared_ptr<Connection>& conn) { (void)conn; }
};

// Newline-delimited JSON over one TCP socket.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    // Wraps an accepted socket and starts reading.
    static std::shared_ptr<Connection> create_incoming(asio::io_context& io,
                                                       asio::ip::tcp::socket sock,
                                                       std::weak_ptr<MessageSink> sink,
                                                       std::shared_ptr<Logger> logger);

    // Resolves and connects from the calling thread; the io_context must be
    // running elsewhere. Throws PeerUnavailableError.
    static std::shared_ptr<Connection> connect_outgoing(asio::io_context& io,
                                                        const std::string& host,
                                                        unsigned short port,
                                                        std::weak_ptr<MessageSink> sink,
                                                        std::shared_ptr<Logger> logger);

    ~Connection();

    void start();
    // Safe from any thread.
    void async_send_json(const nlohmann::json& j);
    void close();
    bool is_open() const { return !closed_.load(); }

    std::string peer_id() const;
    void set_peer_id(const std::string& id);
    const std::string& remote_address() const { return remote_address_; }

private:
    Connection(asio::io_context& io,
               asio::ip::tcp::socket sock,
               std::weak_ptr<MessageSink> sink,
               std::shared_ptr<Logger> logger);
    void do_read();
    void handle_line(std::string line);
    void do_write();
    void shutdown_socket();

    asio::io_context& io_;
    asio::ip::tcp::socket socket_;
    std::weak_ptr<MessageSink> sink_;
    std::shared_ptr<Logger> logger_;
    asio::streambuf read_buf_;
    std::deque<std::string> write_queue_;
    std::string remote_address_;
    mutable std::mutex id_mutex_;
    std::string peer_id_;
    std::atomic<bool> closed_{false};
    std::atomic<bool> close_reported_{false};
};
