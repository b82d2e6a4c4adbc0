#pragma once

#include <memory>
#include <string>
#include <filesystem>

#include "config.hpp"

#ifdef MAILCORE_ENABLE_TLS
#include <boost/asio/ssl.hpp>
#endif

namespace mailcore {

#ifdef MAILCORE_ENABLE_TLS
namespace ssl = boost::asio::ssl;
#endif

class SSLContext {
public:
    enum class Mode {
        Server,
        Client
    };

    explicit SSLContext(Mode mode = Mode::Server);
    ~SSLContext();

    SSLContext(const SSLContext&) = delete;
    SSLContext& operator=(const SSLContext&) = delete;
    SSLContext(SSLContext&&) noexcept;
    SSLContext& operator=(SSLContext&&) noexcept;

    bool load_certificate_chain(const std::filesystem::path& chain_file);
    bool load_private_key(const std::filesystem::path& key_file);
    bool load_ca_file(const std::filesystem::path& ca_file);
    bool use_default_verify_paths();

    void set_verify_mode(bool verify_peer);
    bool set_ciphers(const std::string& cipher_list);

    bool is_initialized() const { return initialized_; }
    bool verifies_peer() const { return verify_peer_; }
    Mode mode() const { return mode_; }
    const std::string& last_error() const { return last_error_; }

#ifdef MAILCORE_ENABLE_TLS
    ssl::context& native() { return *context_; }
    const ssl::context& native() const { return *context_; }
#endif

    // Listener context for the implicit-TLS ports.
    static SSLContext create_server_context(const TLSConfig& config);

    // Context for outbound STARTTLS. Without verification any certificate is accepted.
    static SSLContext create_client_context(bool verify_server,
                                            const std::filesystem::path& ca_file = "");

private:
    void set_error(const std::string& msg);

#ifdef MAILCORE_ENABLE_TLS
    std::unique_ptr<ssl::context> context_;
#endif
    bool initialized_ = false;
    bool verify_peer_ = false;
    std::string last_error_;
    Mode mode_;
};

}  // namespace mailcore
