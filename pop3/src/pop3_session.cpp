#include "pop3_session.hpp"
#include "logger.hpp"

namespace mailcore::pop3 {

POP3Session::POP3Session(asio::io_context& io_context, tcp::socket socket,
                         Authenticator& authenticator, MessageStore& store, const POP3Config& config)
    : Session(io_context, std::move(socket))
    , context_(authenticator, store, config) {
    set_max_line_length(MAX_COMMAND_LENGTH);
}

#ifdef MAILCORE_ENABLE_TLS
POP3Session::POP3Session(asio::io_context& io_context, tcp::socket socket, ssl::context& ssl_ctx,
                         Authenticator& authenticator, MessageStore& store, const POP3Config& config)
    : Session(io_context, std::move(socket), ssl_ctx)
    , context_(authenticator, store, config) {
    set_max_line_length(MAX_COMMAND_LENGTH);
}
#endif

void POP3Session::on_connect() {
    Session::on_connect();
    context_.client_address = remote_address();
    LOG_INFO_FMT("POP3 connection {} from {}:{}{}", connection_id(), remote_address(), remote_port(),
                 is_tls() ? " (TLS)" : "");

    send_line(response::ok(context_.config.server_name + " POP3 server ready"));
}

void POP3Session::on_line(const std::string& line) {
    if (context_.state == SessionState::Update) return;
    process_command(line);
}

void POP3Session::process_command(const std::string& line) {
    Command cmd = Command::parse(line);
    LOG_DEBUG_FMT("POP3 {}: {}", connection_id(), cmd.type == CommandType::PASS ? cmd.name : line);

    std::string response = CommandHandler::instance().execute(context_, cmd);
    send(response + "\r\n");

    if (cmd.type == CommandType::QUIT) {
        close_after_flush();
    }
}

void POP3Session::on_line_too_long() {
    send_line(response::err("Command line too long"));
}

void POP3Session::on_disconnect() {
    if (context_.state == SessionState::Transaction && !context_.deleted.empty()) {
        LOG_INFO_FMT("POP3 connection {} dropped before QUIT, {} deletion marks discarded",
                     connection_id(), context_.deleted.size());
    }
    LOG_INFO_FMT("POP3 connection {} closed ({})", connection_id(),
                 context_.user ? context_.user->address : "not authenticated");
    Session::on_disconnect();
}

}  // namespace mailcore::pop3
