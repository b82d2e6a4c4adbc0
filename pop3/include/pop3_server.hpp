#pragma once

#include <memory>

#include "net/server.hpp"
#include "auth/authenticator.hpp"
#include "ssl_context.hpp"
#include "config.hpp"
#include "pop3_session.hpp"

namespace mailcore::pop3 {

class POP3Server {
public:
    POP3Server(const POP3Config& config, Authenticator& authenticator, MessageStore& store,
               SSLContext* tls_context = nullptr);
    ~POP3Server();

    POP3Server(const POP3Server&) = delete;
    POP3Server& operator=(const POP3Server&) = delete;

    bool start();
    void stop();

    bool is_running() const;
    size_t connection_count();

private:
    std::unique_ptr<Server<POP3Session>> make_listener(const char* name, uint16_t port, bool tls);

    POP3Config config_;
    Authenticator& authenticator_;
    MessageStore& store_;
    SSLContext* tls_context_;

    std::unique_ptr<Server<POP3Session>> plain_server_;
    std::unique_ptr<Server<POP3Session>> tls_server_;
};

}  // namespace mailcore::pop3
