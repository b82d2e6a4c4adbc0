#pragma once

#include <string>

#include "net/session.hpp"
#include "pop3_commands.hpp"
#include "pop3_context.hpp"

namespace mailcore::pop3 {

class POP3Session : public Session {
public:
    POP3Session(asio::io_context& io_context, tcp::socket socket,
                Authenticator& authenticator, MessageStore& store, const POP3Config& config);

#ifdef MAILCORE_ENABLE_TLS
    POP3Session(asio::io_context& io_context, tcp::socket socket, ssl::context& ssl_ctx,
                Authenticator& authenticator, MessageStore& store, const POP3Config& config);
#endif

    ~POP3Session() override = default;

    const SessionContext& context() const { return context_; }

protected:
    void on_connect() override;
    void on_line(const std::string& line) override;
    void on_line_too_long() override;
    void on_disconnect() override;

private:
    void process_command(const std::string& line);

    SessionContext context_;
};

}  // namespace mailcore::pop3
