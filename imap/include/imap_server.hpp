#pragma once

#include <memory>

#include "net/server.hpp"
#include "auth/authenticator.hpp"
#include "ssl_context.hpp"
#include "config.hpp"
#include "imap_session.hpp"

namespace mailcore::imap {

// Plain listener plus, when a TLS context is supplied, the implicit-TLS listener.
class IMAPServer {
public:
    IMAPServer(const IMAPConfig& config, Authenticator& authenticator, MessageStore& store,
               SSLContext* tls_context = nullptr);
    ~IMAPServer();

    IMAPServer(const IMAPServer&) = delete;
    IMAPServer& operator=(const IMAPServer&) = delete;

    bool start();
    void stop();

    bool is_running() const;
    size_t connection_count();

private:
    std::unique_ptr<Server<IMAPSession>> make_listener(const char* name, uint16_t port, bool tls);

    IMAPConfig config_;
    Authenticator& authenticator_;
    MessageStore& store_;
    SSLContext* tls_context_;

    std::unique_ptr<Server<IMAPSession>> plain_server_;
    std::unique_ptr<Server<IMAPSession>> tls_server_;
};

}  // namespace mailcore::imap
