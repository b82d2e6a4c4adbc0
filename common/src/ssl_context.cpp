#include "ssl_context.hpp"
#include "logger.hpp"

#ifdef MAILCORE_ENABLE_TLS
#include <openssl/err.h>
#include <openssl/ssl.h>
#endif

namespace mailcore {

SSLContext::SSLContext(Mode mode)
    : mode_(mode) {
#ifdef MAILCORE_ENABLE_TLS
    context_ = std::make_unique<ssl::context>(
        mode == Mode::Server ? ssl::context::tls_server : ssl::context::tls_client);

    context_->set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 |
        ssl::context::no_sslv3 |
        ssl::context::no_tlsv1 |
        ssl::context::no_tlsv1_1 |
        ssl::context::single_dh_use
    );
#endif
}

SSLContext::~SSLContext() = default;

SSLContext::SSLContext(SSLContext&& other) noexcept
    : initialized_(other.initialized_)
    , last_error_(std::move(other.last_error_))
    , verify_peer_(other.verify_peer_)
    , mode_(other.mode_) {
#ifdef MAILCORE_ENABLE_TLS
    context_ = std::move(other.context_);
#endif
    other.initialized_ = false;
}

SSLContext& SSLContext::operator=(SSLContext&& other) noexcept {
    if (this != &other) {
#ifdef MAILCORE_ENABLE_TLS
        context_ = std::move(other.context_);
#endif
        initialized_ = other.initialized_;
        last_error_ = std::move(other.last_error_);
        verify_peer_ = other.verify_peer_;
        mode_ = other.mode_;
        other.initialized_ = false;
    }
    return *this;
}

bool SSLContext::load_certificate_chain(const std::filesystem::path& chain_file) {
#ifdef MAILCORE_ENABLE_TLS
    boost::system::error_code ec;
    context_->use_certificate_chain_file(chain_file.string(), ec);
    if (ec) {
        set_error("Failed to load certificate " + chain_file.string() + ": " + ec.message());
        return false;
    }
    return true;
#else
    (void)chain_file;
    set_error("TLS support not enabled");
    return false;
#endif
}

bool SSLContext::load_private_key(const std::filesystem::path& key_file) {
#ifdef MAILCORE_ENABLE_TLS
    boost::system::error_code ec;
    context_->use_private_key_file(key_file.string(), ssl::context::pem, ec);
    if (ec) {
        set_error("Failed to load private key " + key_file.string() + ": " + ec.message());
        return false;
    }
    return true;
#else
    (void)key_file;
    set_error("TLS support not enabled");
    return false;
#endif
}

bool SSLContext::load_ca_file(const std::filesystem::path& ca_file) {
#ifdef MAILCORE_ENABLE_TLS
    boost::system::error_code ec;
    context_->load_verify_file(ca_file.string(), ec);
    if (ec) {
        set_error("Failed to load CA file " + ca_file.string() + ": " + ec.message());
        return false;
    }
    return true;
#else
    (void)ca_file;
    set_error("TLS support not enabled");
    return false;
#endif
}

bool SSLContext::use_default_verify_paths() {
#ifdef MAILCORE_ENABLE_TLS
    boost::system::error_code ec;
    context_->set_default_verify_paths(ec);
    if (ec) {
        set_error("Failed to load system CA store: " + ec.message());
        return false;
    }
    return true;
#else
    set_error("TLS support not enabled");
    return false;
#endif
}

void SSLContext::set_verify_mode(bool verify_peer) {
    verify_peer_ = verify_peer;
#ifdef MAILCORE_ENABLE_TLS
    context_->set_verify_mode(verify_peer ? ssl::verify_peer : ssl::verify_none);
#endif
}

bool SSLContext::set_ciphers(const std::string& cipher_list) {
#ifdef MAILCORE_ENABLE_TLS
    if (SSL_CTX_set_cipher_list(context_->native_handle(), cipher_list.c_str()) != 1) {
        set_error("Invalid cipher list '" + cipher_list + "'");
        return false;
    }
    return true;
#else
    (void)cipher_list;
    return false;
#endif
}

void SSLContext::set_error(const std::string& msg) {
    last_error_ = msg;
#ifdef MAILCORE_ENABLE_TLS
    unsigned long err;
    while ((err = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(err, buf, sizeof(buf));
        last_error_ += std::string(" [") + buf + "]";
    }
#endif
    LOG_ERROR(last_error_);
}

SSLContext SSLContext::create_server_context(const TLSConfig& config) {
    SSLContext ctx(Mode::Server);

    if (!ctx.load_certificate_chain(config.certificate_file) ||
        !ctx.load_private_key(config.private_key_file)) {
        return ctx;
    }

    if (!config.ca_file.empty() && !ctx.load_ca_file(config.ca_file)) {
        return ctx;
    }

    if (!config.ciphers.empty() && !ctx.set_ciphers(config.ciphers)) {
        return ctx;
    }

    ctx.initialized_ = true;
    return ctx;
}

SSLContext SSLContext::create_client_context(bool verify_server,
                                             const std::filesystem::path& ca_file) {
    SSLContext ctx(Mode::Client);

    if (verify_server) {
        bool loaded = ca_file.empty() ? ctx.use_default_verify_paths()
                                      : ctx.load_ca_file(ca_file);
        if (!loaded) {
            return ctx;
        }
    }

    ctx.set_verify_mode(verify_server);
    ctx.initialized_ = true;
    return ctx;
}

}  // namespace mailcore
