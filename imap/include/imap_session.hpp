#pragma once

#include <string>

#include "net/session.hpp"
#include "imap_commands.hpp"
#include "imap_context.hpp"

namespace mailcore::imap {

class IMAPSession : public Session {
public:
    // Upper bound for a command including its literals.
    static constexpr size_t MAX_ASSEMBLED_COMMAND = 1024 * 1024;

    IMAPSession(asio::io_context& io_context, tcp::socket socket,
                Authenticator& authenticator, MessageStore& store, const IMAPConfig& config);

#ifdef MAILCORE_ENABLE_TLS
    IMAPSession(asio::io_context& io_context, tcp::socket socket, ssl::context& ssl_ctx,
                Authenticator& authenticator, MessageStore& store, const IMAPConfig& config);
#endif

    ~IMAPSession() override = default;

    const SessionContext& context() const { return context_; }

protected:
    void on_connect() override;
    void on_line(const std::string& line) override;
    void on_line_too_long() override;
    void on_disconnect() override;

private:
    void process_command(const std::string& text);

    SessionContext context_;

    // Command being assembled across literal continuation lines.
    std::string pending_;
    size_t literal_remaining_ = 0;
    bool in_literal_ = false;
};

}  // namespace mailcore::imap
