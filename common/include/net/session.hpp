#pragma once

#include <memory>
#include <string>
#include <deque>
#include <chrono>
#include <variant>
#include <cstdint>
#include <utility>
#include <boost/asio.hpp>
#ifdef MAILCORE_ENABLE_TLS
#include <boost/asio/ssl.hpp>
#endif

namespace mailcore {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;
#ifdef MAILCORE_ENABLE_TLS
namespace ssl = asio::ssl;
#endif

// Line-oriented connection: reads CRLF-terminated lines, serializes writes,
// and closes itself after an idle timeout. All handlers of one session run
// on its strand.
class Session : public std::enable_shared_from_this<Session> {
public:
#ifdef MAILCORE_ENABLE_TLS
    using PlainSocket = tcp::socket;
    using SSLSocket = ssl::stream<tcp::socket>;
    using Socket = std::variant<PlainSocket, SSLSocket>;
#else
    using Socket = tcp::socket;
#endif

    static constexpr size_t DEFAULT_MAX_LINE_LENGTH = 8192;

    Session(asio::io_context& io_context, tcp::socket socket);
#ifdef MAILCORE_ENABLE_TLS
    Session(asio::io_context& io_context, tcp::socket socket, ssl::context& ssl_ctx);
#endif
    virtual ~Session() = default;

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    void start();
    void stop();
    // Thread-safe stop, queued on the session strand.
    void close();

    void send(const std::string& data);
    void send_line(const std::string& line);

    // Flushes pending writes, then closes.
    void close_after_flush();

    bool is_tls() const { return is_tls_; }
    bool is_stopped() const { return stopped_; }
    const std::string& connection_id() const { return connection_id_; }
    const std::string& remote_address() const { return remote_address_; }
    uint16_t remote_port() const { return remote_port_; }

    void set_timeout(std::chrono::seconds timeout) { timeout_ = timeout; }
    void set_max_line_length(size_t length) { max_line_length_ = length; }

protected:
    virtual void on_connect();
    virtual void on_line(const std::string& line) = 0;
    virtual void on_line_too_long();
    virtual void on_timeout();
    virtual void on_disconnect();
    virtual void on_error(const boost::system::error_code& ec);

private:
    void do_read();
    void do_write();
    void reset_timeout();
    void close_socket();

    void handle_read(const boost::system::error_code& ec, std::size_t bytes_transferred);
    void handle_write(const boost::system::error_code& ec, std::size_t bytes_transferred);
    void handle_timeout(const boost::system::error_code& ec);

    template<typename SocketType>
    void do_read_impl(SocketType& socket);

    template<typename SocketType>
    void do_write_impl(SocketType& socket);

    asio::io_context& io_context_;
    asio::strand<asio::io_context::executor_type> strand_;
    Socket socket_;
    bool is_tls_ = false;

    std::string connection_id_;
    std::string remote_address_ = "unknown";
    uint16_t remote_port_ = 0;

    std::unique_ptr<asio::streambuf> read_buffer_;
    size_t max_line_length_ = DEFAULT_MAX_LINE_LENGTH;
    std::deque<std::string> write_queue_;

    asio::steady_timer timeout_timer_;
    std::chrono::seconds timeout_{300};

    bool closing_ = false;
    bool stopped_ = false;
};

}  // namespace mailcore
