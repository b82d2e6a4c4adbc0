#pragma once

#include <memory>
#include <string>
#include <vector>
#include <thread>
#include <atomic>
#include <functional>
#include <mutex>
#include <boost/asio.hpp>

#include "session.hpp"
#include "logger.hpp"

namespace mailcore {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

// Accept loop plus a worker pool running one io_context. Sessions are owned
// by their own pending handlers; the server only tracks them weakly.
template<typename SessionType>
class Server {
public:
    // The flag tells the factory whether the socket belongs to the TLS listener.
    using SessionFactory = std::function<std::shared_ptr<SessionType>(
        asio::io_context&, tcp::socket, bool tls)>;

    Server(std::string name, std::string bind_address, uint16_t port,
           bool tls, size_t thread_count, SessionFactory factory);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    bool start();
    void stop();

    bool is_running() const { return running_; }
    const std::string& name() const { return name_; }
    uint16_t port() const { return port_; }
    size_t connection_count();

    void set_max_connections(size_t max) { max_connections_ = max; }
    void set_session_timeout(std::chrono::seconds timeout) { session_timeout_ = timeout; }

private:
    void do_accept();
    void prune_sessions();

    std::string name_;
    std::string bind_address_;
    uint16_t port_;
    bool tls_;

    asio::io_context io_context_;
    tcp::acceptor acceptor_;
    std::vector<std::thread> threads_;

    std::atomic<bool> running_{false};
    size_t thread_count_;
    size_t max_connections_ = 1000;
    std::chrono::seconds session_timeout_{300};

    std::vector<std::weak_ptr<SessionType>> sessions_;
    std::mutex sessions_mutex_;

    SessionFactory session_factory_;
};

template<typename SessionType>
Server<SessionType>::Server(std::string name, std::string bind_address, uint16_t port,
                            bool tls, size_t thread_count, SessionFactory factory)
    : name_(std::move(name))
    , bind_address_(std::move(bind_address))
    , port_(port)
    , tls_(tls)
    , acceptor_(io_context_)
    , thread_count_(thread_count == 0 ? 1 : thread_count)
    , session_factory_(std::move(factory)) {
}

template<typename SessionType>
Server<SessionType>::~Server() {
    stop();
}

template<typename SessionType>
bool Server<SessionType>::start() {
    if (running_) return true;

    boost::system::error_code ec;
    auto address = asio::ip::make_address(bind_address_, ec);
    if (ec) {
        LOG_ERROR_FMT("{}: invalid bind address '{}': {}", name_, bind_address_, ec.message());
        return false;
    }

    tcp::endpoint endpoint(address, port_);
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        LOG_ERROR_FMT("{}: cannot listen on {}:{}: {}", name_, bind_address_, port_, ec.message());
        boost::system::error_code ignored;
        acceptor_.close(ignored);
        return false;
    }

    running_ = true;
    do_accept();

    for (size_t i = 0; i < thread_count_; ++i) {
        threads_.emplace_back([this]() {
            io_context_.run();
        });
    }

    LOG_INFO_FMT("{} listening on {}:{}{}", name_, bind_address_, port_, tls_ ? " (TLS)" : "");
    return true;
}

template<typename SessionType>
void Server<SessionType>::stop() {
    if (!running_) return;
    running_ = false;

    boost::system::error_code ec;
    acceptor_.close(ec);

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (auto& weak : sessions_) {
            if (auto session = weak.lock()) {
                session->close();
            }
        }
        sessions_.clear();
    }

    io_context_.stop();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    LOG_INFO_FMT("{} stopped", name_);
}

template<typename SessionType>
size_t Server<SessionType>::connection_count() {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    prune_sessions();
    return sessions_.size();
}

template<typename SessionType>
void Server<SessionType>::prune_sessions() {
    std::erase_if(sessions_, [](const std::weak_ptr<SessionType>& weak) {
        auto session = weak.lock();
        return !session || session->is_stopped();
    });
}

template<typename SessionType>
void Server<SessionType>::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (!running_) return;

            if (ec) {
                LOG_WARNING_FMT("{}: accept failed: {}", name_, ec.message());
            } else if (connection_count() >= max_connections_) {
                LOG_WARNING_FMT("{}: connection limit {} reached, rejecting client",
                                name_, max_connections_);
                boost::system::error_code ignored;
                socket.close(ignored);
            } else if (auto session = session_factory_(io_context_, std::move(socket), tls_)) {
                {
                    std::lock_guard<std::mutex> lock(sessions_mutex_);
                    sessions_.push_back(session);
                }
                session->set_timeout(session_timeout_);
                session->start();
            }

            do_accept();
        });
}

}  // namespace mailcore
