#include "imap_session.hpp"
#include "imap_parser.hpp"
#include "logger.hpp"

#include <algorithm>
#include <format>

namespace mailcore::imap {

IMAPSession::IMAPSession(asio::io_context& io_context, tcp::socket socket,
                         Authenticator& authenticator, MessageStore& store, const IMAPConfig& config)
    : Session(io_context, std::move(socket))
    , context_(authenticator, store, config) {
    set_max_line_length(MAX_COMMAND_LENGTH);
}

#ifdef MAILCORE_ENABLE_TLS
IMAPSession::IMAPSession(asio::io_context& io_context, tcp::socket socket, ssl::context& ssl_ctx,
                         Authenticator& authenticator, MessageStore& store, const IMAPConfig& config)
    : Session(io_context, std::move(socket), ssl_ctx)
    , context_(authenticator, store, config) {
    set_max_line_length(MAX_COMMAND_LENGTH);
}
#endif

void IMAPSession::on_connect() {
    Session::on_connect();
    context_.client_address = remote_address();
    LOG_INFO_FMT("IMAP connection {} from {}:{}{}", connection_id(), remote_address(), remote_port(),
                 is_tls() ? " (TLS)" : "");

    send_line(std::format("* OK [CAPABILITY {}] {} IMAP4rev2 server ready",
                          CommandHandler::capabilities(), context_.config.server_name));
}

void IMAPSession::on_line(const std::string& line) {
    if (context_.state == SessionState::Logout) return;

    if (in_literal_) {
        // Lines inside a literal are literal bytes; the CRLF counts too.
        if (line.size() < literal_remaining_) {
            pending_ += line;
            pending_ += "\r\n";
            literal_remaining_ -= std::min(literal_remaining_, line.size() + 2);
            if (literal_remaining_ > 0) return;
            in_literal_ = false;
        } else {
            in_literal_ = false;
            pending_ += line;
        }
    } else if (context_.pending_authenticate) {
        for (const auto& response : CommandHandler::instance().continue_authenticate(context_, line)) {
            send_line(response);
        }
        return;
    } else {
        pending_ = line;
    }

    if (pending_.size() > MAX_ASSEMBLED_COMMAND) {
        pending_.clear();
        send_line(response::bad("*", "Command too long"));
        return;
    }

    bool non_synchronizing = false;
    if (auto literal = IMAPParser::trailing_literal(pending_, non_synchronizing)) {
        if (*literal > MAX_ASSEMBLED_COMMAND) {
            pending_.clear();
            send_line(response::bad("*", "Literal too large"));
            return;
        }
        pending_ += "\r\n";
        if (*literal > 0) {
            in_literal_ = true;
            literal_remaining_ = *literal;
        }
        if (!non_synchronizing) {
            send_line(response::continuation("Ready for literal data"));
        }
        if (in_literal_) return;
    }

    std::string command = std::move(pending_);
    pending_.clear();
    process_command(command);
}

void IMAPSession::process_command(const std::string& text) {
    Command cmd = Command::parse(text);
    LOG_DEBUG_FMT("IMAP {} {}: {}", connection_id(), cmd.tag,
                  cmd.type == CommandType::LOGIN || cmd.type == CommandType::AUTHENTICATE ? cmd.name : text);

    for (const auto& response : CommandHandler::instance().execute(context_, cmd)) {
        send_line(response);
    }

    if (context_.state == SessionState::Logout) {
        close_after_flush();
    }
}

void IMAPSession::on_line_too_long() {
    send_line(response::bad("*", "Command line too long"));
}

void IMAPSession::on_disconnect() {
    LOG_INFO_FMT("IMAP connection {} closed ({})", connection_id(),
                 context_.user ? context_.user->address : "not authenticated");
    Session::on_disconnect();
}

}  // namespace mailcore::imap
