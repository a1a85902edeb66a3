#include "connection.hpp"
#include "errors.hpp"
#include <istream>

using json = nlohmann::json;

std::shared_ptr<Connection> Connection::create_incoming(asio::io_context& io,
                                                        asio::ip::tcp::socket sock,
                                                        std::weak_ptr<MessageSink> sink,
                                                        std::shared_ptr<Logger> logger)
{
    auto c = std::shared_ptr<Connection>(new Connection(io, std::move(sock), std::move(sink), std::move(logger)));
    c->start();
    return c;
}

Connection::Connection(asio::io_context& io,
                       asio::ip::tcp::socket sock,
                       std::weak_ptr<MessageSink> sink,
                       std::shared_ptr<Logger> logger)
: io_(io), socket_(std::move(sock)), sink_(std::move(sink)), logger_(std::move(logger))
{
    std::error_code ec;
    auto ep = socket_.remote_endpoint(ec);
    if(!ec){
        remote_address_ = ep.address().to_string() + ":" + std::to_string(ep.port());
    }
}

Connection::~Connection(){
    std::error_code ec;
    socket_.close(ec);
}

void Connection::start(){
    auto self = shared_from_this();
    asio::post(io_, [self](){ self->do_read(); });
}

std::string Connection::peer_id() const {
    std::lock_guard lg(id_mutex_);
    return peer_id_;
}

void Connection::set_peer_id(const std::string& id){
    std::lock_guard lg(id_mutex_);
    peer_id_ = id;
}

void Connection::do_read(){
    auto self = shared_from_this();
    asio::async_read_until(socket_, read_buf_, "\n",
        [this, self](std::error_code ec, std::size_t){
            if(ec){
                if(ec != asio::error::eof && ec != asio::error::operation_aborted){
                    log_debug(logger_.get(), "Connection {} read error: {}", remote_address_, ec.message());
                }
                shutdown_socket();
                return;
            }
            std::istream is(&read_buf_);
            std::string line;
            std::getline(is, line);
            if(!line.empty()){
                handle_line(std::move(line));
            }
            if(!closed_.load()){
                do_read();
            }
        });
}

void Connection::handle_line(std::string line){
    json j;
    try{
        j = json::parse(line);
    } catch(const json::parse_error& ex){
        log_warn(logger_.get(), "Failed to parse JSON from {}: {}", remote_address_, ex.what());
        return;
    }
    if(!j.is_object() || !j.contains("type") || !j["type"].is_string()){
        log_warn(logger_.get(), "Message without type from {}", remote_address_);
        return;
    }
    auto sink = sink_.lock();
    if(!sink) return;
    // A handler that chokes on one message must not take the io thread down.
    try{
        sink->on_message(shared_from_this(), j);
    } catch(const std::exception& ex){
        log_warn(logger_.get(), "Dropped {} from {}: {}", j["type"].get<std::string>(), remote_address_, ex.what());
    }
}

void Connection::async_send_json(const nlohmann::json& j){
    // Invalid UTF-8 is replaced rather than thrown.
    auto s = j.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
    auto self = shared_from_this();
    asio::post(io_, [self, s = std::move(s)]() mutable {
        if(self->closed_.load()) return;
        bool start_write = self->write_queue_.empty();
        self->write_queue_.push_back(std::move(s));
        if(start_write){
            self->do_write();
        }
    });
}

void Connection::do_write(){
    if(write_queue_.empty()) return;
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(write_queue_.front()),
        [this, self](std::error_code ec, std::size_t){
            if(ec){
                log_debug(logger_.get(), "Connection {} write error: {}", remote_address_, ec.message());
                shutdown_socket();
                return;
            }
            write_queue_.pop_front();
            if(!write_queue_.empty()){
                do_write();
            }
        });
}

void Connection::close(){
    auto self = shared_from_this();
    asio::post(io_, [self](){ self->shutdown_socket(); });
}

void Connection::shutdown_socket(){
    closed_.store(true);
    std::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    write_queue_.clear();
    if(close_reported_.exchange(true)) return;
    if(auto sink = sink_.lock()){
        sink->on_closed(shared_from_this());
    }
}

std::shared_ptr<Connection> Connection::connect_outgoing(asio::io_context& io,
                                                         const std::string& host,
                                                         unsigned short port,
                                                         std::weak_ptr<MessageSink> sink,
                                                         std::shared_ptr<Logger> logger)
{
    std::string target = host + ":" + std::to_string(port);
    asio::ip::tcp::resolver resolver(io);
    std::error_code ec;
    auto results = resolver.resolve(host, std::to_string(port), ec);
    if(ec){
        throw PeerUnavailableError(target, "resolve failed: " + ec.message());
    }
    asio::ip::tcp::socket sock(io);
    asio::connect(sock, results, ec);
    if(ec){
        throw PeerUnavailableError(target, "connect failed: " + ec.message());
    }
    log_debug(logger.get(), "Connected outgoing to {}", target);
    return create_incoming(io, std::move(sock), std::move(sink), std::move(logger));
}
