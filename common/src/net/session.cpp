#include "net/session.hpp"
#include "logger.hpp"

#include <atomic>
#include <format>

namespace mailcore {

namespace {

std::string next_connection_id() {
    static std::atomic<uint64_t> counter{0};
    static const auto epoch = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    return std::format("{:x}-{:06x}", epoch, ++counter);
}

}  // namespace

Session::Session(asio::io_context& io_context, tcp::socket socket)
    : io_context_(io_context)
    , strand_(asio::make_strand(io_context))
    , socket_(std::move(socket))
    , connection_id_(next_connection_id())
    , timeout_timer_(io_context) {
}

#ifdef MAILCORE_ENABLE_TLS
Session::Session(asio::io_context& io_context, tcp::socket socket, ssl::context& ssl_ctx)
    : io_context_(io_context)
    , strand_(asio::make_strand(io_context))
    , socket_(SSLSocket(std::move(socket), ssl_ctx))
    , is_tls_(true)
    , connection_id_(next_connection_id())
    , timeout_timer_(io_context) {
}
#endif

void Session::start() {
    boost::system::error_code ec;
    tcp::endpoint endpoint;
#ifdef MAILCORE_ENABLE_TLS
    if (is_tls_) {
        endpoint = std::get<SSLSocket>(socket_).lowest_layer().remote_endpoint(ec);
    } else {
        endpoint = std::get<PlainSocket>(socket_).remote_endpoint(ec);
    }
#else
    endpoint = socket_.remote_endpoint(ec);
#endif
    if (!ec) {
        remote_address_ = endpoint.address().to_string();
        remote_port_ = endpoint.port();
    }

    read_buffer_ = std::make_unique<asio::streambuf>(max_line_length_ + 2);

    auto self = shared_from_this();
    asio::dispatch(strand_, [this, self]() {
        reset_timeout();

#ifdef MAILCORE_ENABLE_TLS
        if (is_tls_) {
            std::get<SSLSocket>(socket_).async_handshake(
                ssl::stream_base::server,
                asio::bind_executor(strand_, [this, self](const boost::system::error_code& ec) {
                    if (ec) {
                        on_error(ec);
                        stop();
                        return;
                    }
                    LOG_DEBUG_FMT("TLS handshake completed for {}", connection_id_);
                    on_connect();
                    do_read();
                }));
            return;
        }
#endif
        on_connect();
        do_read();
    });
}

void Session::stop() {
    if (stopped_) return;
    stopped_ = true;

    timeout_timer_.cancel();
    on_disconnect();
    close_socket();
}

void Session::close() {
    auto self = shared_from_this();
    asio::post(strand_, [this, self]() { stop(); });
}

void Session::close_after_flush() {
    auto self = shared_from_this();
    asio::post(strand_, [this, self]() {
        closing_ = true;
        if (write_queue_.empty()) {
            stop();
        }
    });
}

void Session::close_socket() {
    boost::system::error_code ec;

#ifdef MAILCORE_ENABLE_TLS
    if (is_tls_) {
        std::get<SSLSocket>(socket_).lowest_layer().close(ec);
    } else {
        std::get<PlainSocket>(socket_).close(ec);
    }
#else
    socket_.close(ec);
#endif
}

void Session::reset_timeout() {
    timeout_timer_.expires_after(timeout_);
    auto self = shared_from_this();
    timeout_timer_.async_wait(asio::bind_executor(strand_,
        [this, self](const boost::system::error_code& ec) {
            handle_timeout(ec);
        }));
}

void Session::handle_timeout(const boost::system::error_code& ec) {
    if (ec == asio::error::operation_aborted || stopped_) {
        return;
    }
    // A re-armed timer also cancels the pending wait; only act on real expiry.
    if (timeout_timer_.expiry() > asio::steady_timer::clock_type::now()) {
        return;
    }
    on_timeout();
    stop();
}

void Session::send(const std::string& data) {
    auto self = shared_from_this();
    asio::post(strand_, [this, self, data]() {
        if (stopped_) return;
        bool was_empty = write_queue_.empty();
        write_queue_.push_back(data);
        if (was_empty) {
            do_write();
        }
    });
}

void Session::send_line(const std::string& line) {
    send(line + "\r\n");
}

void Session::do_read() {
    if (stopped_ || closing_) return;

#ifdef MAILCORE_ENABLE_TLS
    if (is_tls_) {
        do_read_impl(std::get<SSLSocket>(socket_));
    } else {
        do_read_impl(std::get<PlainSocket>(socket_));
    }
#else
    do_read_impl(socket_);
#endif
}

template<typename SocketType>
void Session::do_read_impl(SocketType& socket) {
    auto self = shared_from_this();
    asio::async_read_until(
        socket,
        *read_buffer_,
        "\r\n",
        asio::bind_executor(strand_,
            [this, self](const boost::system::error_code& ec, std::size_t bytes_transferred) {
                handle_read(ec, bytes_transferred);
            }));
}

void Session::handle_read(const boost::system::error_code& ec, std::size_t /* bytes_transferred */) {
    if (stopped_) return;

    if (ec == asio::error::not_found) {
        on_line_too_long();
        close_after_flush();
        return;
    }

    if (ec) {
        on_error(ec);
        stop();
        return;
    }

    reset_timeout();

    std::istream is(read_buffer_.get());
    std::string line;
    std::getline(is, line);

    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    on_line(line);
    do_read();
}

void Session::do_write() {
    if (stopped_ || write_queue_.empty()) return;

#ifdef MAILCORE_ENABLE_TLS
    if (is_tls_) {
        do_write_impl(std::get<SSLSocket>(socket_));
    } else {
        do_write_impl(std::get<PlainSocket>(socket_));
    }
#else
    do_write_impl(socket_);
#endif
}

template<typename SocketType>
void Session::do_write_impl(SocketType& socket) {
    auto self = shared_from_this();
    asio::async_write(
        socket,
        asio::buffer(write_queue_.front()),
        asio::bind_executor(strand_,
            [this, self](const boost::system::error_code& ec, std::size_t bytes_transferred) {
                handle_write(ec, bytes_transferred);
            }));
}

void Session::handle_write(const boost::system::error_code& ec, std::size_t /* bytes_transferred */) {
    if (stopped_) return;

    if (ec) {
        on_error(ec);
        stop();
        return;
    }

    write_queue_.pop_front();
    if (!write_queue_.empty()) {
        do_write();
    } else if (closing_) {
        stop();
    }
}

void Session::on_connect() {
    LOG_DEBUG_FMT("New connection {} from {}:{}", connection_id_, remote_address_, remote_port_);
}

void Session::on_line_too_long() {
    LOG_WARNING_FMT("Line too long from {}, closing {}", remote_address_, connection_id_);
}

void Session::on_timeout() {
    LOG_DEBUG_FMT("Session {} timed out", connection_id_);
}

void Session::on_disconnect() {
    LOG_DEBUG_FMT("Connection {} closed from {}:{}", connection_id_, remote_address_, remote_port_);
}

void Session::on_error(const boost::system::error_code& ec) {
    if (ec == asio::error::eof || ec == asio::error::connection_reset ||
        ec == asio::error::operation_aborted) {
        return;
    }
    LOG_ERROR_FMT("Session {} error: {}", connection_id_, ec.message());
}

}  // namespace mailcore
