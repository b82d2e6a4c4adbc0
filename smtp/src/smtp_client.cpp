#include "smtp_client.hpp"
#include "encoding.hpp"
#include "logger.hpp"

#include <charconv>
#include <format>
#include <initializer_list>
#include <istream>
#include <memory>
#include <algorithm>
#include <boost/asio.hpp>
#ifdef MAILCORE_ENABLE_TLS
#include <boost/asio/ssl.hpp>
#include <openssl/err.h>
#endif

namespace mailcore::smtp {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using boost::system::error_code;

namespace {

constexpr size_t MAX_REPLY_BUFFER = 64 * 1024;
constexpr size_t MAX_REPLY_LINES = 100;

error_code protocol_error() {
    return boost::system::errc::make_error_code(boost::system::errc::protocol_error);
}

// Blocking-style connection built on async operations so that every step
// can be abandoned once the timeout expires.
class Connection {
public:
    explicit Connection(std::chrono::seconds timeout)
        : socket_(io_)
        , timeout_(timeout)
        , buffer_(MAX_REPLY_BUFFER) {
    }

    ~Connection() {
        close();
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    error_code connect(const std::string& host, uint16_t port) {
        error_code ec;
        tcp::resolver resolver(io_);
        auto endpoints = resolver.resolve(host, std::to_string(port), ec);
        if (ec) return ec;

        ec = asio::error::would_block;
        asio::async_connect(socket_, endpoints,
                            [&ec](const error_code& result, const tcp::endpoint&) { ec = result; });
        return run(ec);
    }

    error_code write(const std::string& data) {
        error_code ec = asio::error::would_block;
        auto handler = [&ec](const error_code& result, std::size_t) { ec = result; };
#ifdef MAILCORE_ENABLE_TLS
        if (tls_) {
            asio::async_write(*tls_, asio::buffer(data), handler);
            return run(ec);
        }
#endif
        asio::async_write(socket_, asio::buffer(data), handler);
        return run(ec);
    }

    error_code read_reply(SmtpReply& reply) {
        reply = SmtpReply{};
        for (size_t count = 0; count < MAX_REPLY_LINES; ++count) {
            std::string line;
            if (auto ec = read_line(line)) return ec;

            int code = 0;
            auto [end, parse_ec] = std::from_chars(line.data(), line.data() + std::min<size_t>(line.size(), 3), code);
            if (line.size() < 3 || parse_ec != std::errc{} || end != line.data() + 3) {
                return protocol_error();
            }

            reply.code = code;
            reply.lines.push_back(line.size() > 4 ? line.substr(4) : "");
            if (line.size() == 3 || line[3] == ' ') return {};
            if (line[3] != '-') return protocol_error();
        }
        return protocol_error();
    }

#ifdef MAILCORE_ENABLE_TLS
    error_code start_tls(ssl::context& context, const std::string& host, bool verify) {
        tls_ = std::make_unique<ssl::stream<tcp::socket>>(std::move(socket_), context);
        if (!SSL_set_tlsext_host_name(tls_->native_handle(), host.c_str())) {
            return error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category());
        }
        if (verify) {
            tls_->set_verify_callback(ssl::host_name_verification(host));
        }

        error_code ec = asio::error::would_block;
        tls_->async_handshake(ssl::stream_base::client, [&ec](const error_code& result) { ec = result; });
        return run(ec);
    }
#endif

    void close() {
        error_code ignored;
        lowest_layer().shutdown(tcp::socket::shutdown_both, ignored);
        lowest_layer().close(ignored);
    }

private:
    tcp::socket& lowest_layer() {
#ifdef MAILCORE_ENABLE_TLS
        if (tls_) return tls_->next_layer();
#endif
        return socket_;
    }

    error_code read_line(std::string& line) {
        error_code ec = asio::error::would_block;
        auto handler = [&ec](const error_code& result, std::size_t) { ec = result; };
#ifdef MAILCORE_ENABLE_TLS
        if (tls_) {
            asio::async_read_until(*tls_, buffer_, "\r\n", handler);
        } else {
            asio::async_read_until(socket_, buffer_, "\r\n", handler);
        }
#else
        asio::async_read_until(socket_, buffer_, "\r\n", handler);
#endif
        if (auto result = run(ec)) return result;

        std::istream is(&buffer_);
        std::getline(is, line);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        return {};
    }

    // Runs the pending operation. On timeout the socket is closed, which
    // completes the operation with operation_aborted.
    error_code run(const error_code& ec) {
        io_.restart();
        io_.run_for(timeout_);
        if (!io_.stopped()) {
            error_code ignored;
            lowest_layer().close(ignored);
            io_.run();
            return asio::error::timed_out;
        }
        return ec;
    }

    asio::io_context io_;
    tcp::socket socket_;
#ifdef MAILCORE_ENABLE_TLS
    std::unique_ptr<ssl::stream<tcp::socket>> tls_;
#endif
    std::chrono::seconds timeout_;
    asio::streambuf buffer_;
};

class Dialog {
public:
    Dialog(Connection& connection, TransferResult& result)
        : connection_(connection)
        , result_(result) {
    }

    // False on a network or syntax failure; the reply code is not checked.
    bool command(const std::string& line, const char* step) {
        if (auto ec = connection_.write(line + "\r\n")) {
            return broken(step, ec);
        }
        return read(step);
    }

    bool read(const char* step) {
        if (auto ec = connection_.read_reply(result_.reply)) {
            return broken(step, ec);
        }
        return true;
    }

    bool expect(std::initializer_list<int> codes, const char* step) {
        if (std::find(codes.begin(), codes.end(), result_.reply.code) != codes.end()) {
            return true;
        }
        result_.error = std::format("{} rejected: {}", step, result_.reply.summary());
        return false;
    }

    bool step(const std::string& line, std::initializer_list<int> codes, const char* name) {
        return command(line, name) && expect(codes, name);
    }

    void quit() {
        if (broken_) return;
        SmtpReply reply;
        if (connection_.write("QUIT\r\n") || connection_.read_reply(reply)) {
            LOG_DEBUG("SMTP QUIT not acknowledged");
        }
    }

private:
    bool broken(const char* step, const error_code& ec) {
        broken_ = true;
        result_.error = std::format("{} failed: {}", step, ec.message());
        return false;
    }

    Connection& connection_;
    TransferResult& result_;
    bool broken_ = false;
};

bool has_extension(const SmtpReply& ehlo, std::string_view keyword) {
    // The first line is the greeting text.
    for (size_t i = 1; i < ehlo.lines.size(); ++i) {
        const auto& line = ehlo.lines[i];
        if (istarts_with(line, keyword) && (line.size() == keyword.size() || line[keyword.size()] == ' ')) {
            return true;
        }
    }
    return false;
}

bool hello(Dialog& dialog, TransferResult& result, const std::string& name, SmtpReply& extensions) {
    if (dialog.step("EHLO " + name, {250}, "EHLO")) {
        extensions = result.reply;
        return true;
    }
    if (!dialog.step("HELO " + name, {250}, "HELO")) {
        return false;
    }
    extensions = SmtpReply{};
    result.error.clear();
    return true;
}

}  // namespace

std::string SmtpReply::text() const {
    std::string text;
    for (const auto& line : lines) {
        if (!text.empty()) text += '\n';
        text += line;
    }
    return text;
}

std::string SmtpReply::summary() const {
    return std::format("{} {}", code, lines.empty() ? "" : lines.front());
}

SmtpClient::SmtpClient(std::chrono::seconds timeout, SSLContext* tls_context)
    : timeout_(timeout)
    , tls_context_(tls_context) {
}

TransferResult SmtpClient::send(const TransferRequest& request) {
    TransferResult result;
    for (const auto& address : request.recipients) {
        result.recipients.push_back(RecipientReply{address, false, {}});
    }

    Connection connection(timeout_);
    if (auto ec = connection.connect(request.host, request.port)) {
        result.error = std::format("Connection to {}:{} failed: {}", request.host, request.port, ec.message());
        return result;
    }

    Dialog dialog(connection, result);
    if (!dialog.read("Greeting") || !dialog.expect({220}, "Greeting")) {
        dialog.quit();
        return result;
    }

    SmtpReply extensions;
    if (!hello(dialog, result, request.helo_name, extensions)) {
        dialog.quit();
        return result;
    }

    bool secured = false;
#ifdef MAILCORE_ENABLE_TLS
    bool tls_usable = tls_context_ && tls_context_->is_initialized();
    if (request.tls != TlsPolicy::None && tls_usable && has_extension(extensions, "STARTTLS")) {
        if (!dialog.step("STARTTLS", {220}, "STARTTLS")) {
            dialog.quit();
            return result;
        }
        if (auto ec = connection.start_tls(tls_context_->native(), request.host, tls_context_->verifies_peer())) {
            result.error = std::format("TLS handshake with {} failed: {}", request.host, ec.message());
            return result;
        }
        if (!hello(dialog, result, request.helo_name, extensions)) {
            dialog.quit();
            return result;
        }
        secured = true;
    }
#endif

    if (request.tls == TlsPolicy::Required && !secured) {
        result.error = std::format("{} does not offer STARTTLS", request.host);
        dialog.quit();
        return result;
    }

    if (!request.username.empty()) {
        std::string token = base64_encode(std::string(1, '\0') + request.username +
                                          std::string(1, '\0') + request.password);
        if (!dialog.step("AUTH PLAIN " + token, {235}, "AUTH")) {
            dialog.quit();
            return result;
        }
    }

    if (!dialog.step("MAIL FROM:<" + request.mail_from + ">", {250}, "MAIL FROM")) {
        dialog.quit();
        return result;
    }

    size_t accepted = 0;
    for (auto& recipient : result.recipients) {
        if (!dialog.command("RCPT TO:<" + recipient.address + ">", "RCPT TO")) {
            return result;
        }
        recipient.reply = result.reply;
        recipient.accepted = result.reply.code == 250 || result.reply.code == 251;
        if (recipient.accepted) ++accepted;
    }

    if (accepted == 0) {
        result.error = "All recipients rejected";
        dialog.quit();
        return result;
    }

    if (!dialog.step("DATA", {354}, "DATA")) {
        dialog.quit();
        return result;
    }

    // dot_stuff ends with CRLF, command() adds the one after the final dot.
    if (!dialog.step(dot_stuff(request.content) + ".", {250}, "Message")) {
        dialog.quit();
        return result;
    }

    result.delivered = true;
    LOG_DEBUG_FMT("SMTP {}:{} accepted message for {} of {} recipients",
                  request.host, request.port, accepted, result.recipients.size());
    dialog.quit();
    return result;
}

}  // namespace mailcore::smtp
