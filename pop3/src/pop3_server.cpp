#include "pop3_server.hpp"
#include "logger.hpp"

namespace mailcore::pop3 {

POP3Server::POP3Server(const POP3Config& config, Authenticator& authenticator, MessageStore& store,
                       SSLContext* tls_context)
    : config_(config)
    , authenticator_(authenticator)
    , store_(store)
    , tls_context_(tls_context) {
}

POP3Server::~POP3Server() {
    stop();
}

std::unique_ptr<Server<POP3Session>> POP3Server::make_listener(const char* name, uint16_t port, bool tls) {
    auto server = std::make_unique<Server<POP3Session>>(
        name, config_.bind_address, port, tls, config_.thread_pool_size,
        [this](asio::io_context& io_ctx, tcp::socket socket, bool use_tls) -> std::shared_ptr<POP3Session> {
#ifdef MAILCORE_ENABLE_TLS
            if (use_tls) {
                return std::make_shared<POP3Session>(io_ctx, std::move(socket), tls_context_->native(),
                                                     authenticator_, store_, config_);
            }
#else
            (void)use_tls;
#endif
            return std::make_shared<POP3Session>(io_ctx, std::move(socket), authenticator_, store_, config_);
        });

    server->set_max_connections(config_.max_connections);
    server->set_session_timeout(config_.session_timeout);
    return server;
}

bool POP3Server::start() {
    if (!config_.enabled) {
        LOG_INFO("POP3 disabled");
        return true;
    }

    if (config_.port > 0) {
        plain_server_ = make_listener("POP3", config_.port, false);
        if (!plain_server_->start()) {
            plain_server_.reset();
            return false;
        }
    }

#ifdef MAILCORE_ENABLE_TLS
    if (config_.tls_port > 0 && tls_context_ && tls_context_->is_initialized()) {
        tls_server_ = make_listener("POP3S", config_.tls_port, true);
        if (!tls_server_->start()) {
            tls_server_.reset();
            stop();
            return false;
        }
    } else if (config_.tls_port > 0) {
        LOG_WARNING_FMT("POP3S port {} not opened: no TLS certificate configured", config_.tls_port);
    }
#endif

    return true;
}

void POP3Server::stop() {
    if (plain_server_) {
        plain_server_->stop();
        plain_server_.reset();
    }
    if (tls_server_) {
        tls_server_->stop();
        tls_server_.reset();
    }
}

bool POP3Server::is_running() const {
    return (plain_server_ && plain_server_->is_running()) ||
           (tls_server_ && tls_server_->is_running());
}

size_t POP3Server::connection_count() {
    size_t count = 0;
    if (plain_server_) count += plain_server_->connection_count();
    if (tls_server_) count += tls_server_->connection_count();
    return count;
}

}  // namespace mailcore::pop3
