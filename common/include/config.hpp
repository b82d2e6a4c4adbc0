#pragma once

#include <string>
#include <filesystem>
#include <optional>
#include <unordered_map>
#include <vector>
#include <chrono>
#include <cstdint>

#include "logger.hpp"

namespace mailcore {

struct ServerConfig {
    bool enabled = true;
    std::string bind_address = "0.0.0.0";
    uint16_t port = 0;
    uint16_t tls_port = 0;
    size_t max_connections = 1000;
    size_t thread_pool_size = 4;
    std::chrono::seconds session_timeout{300};
    size_t max_messages_per_session = 1000;
};

struct TLSConfig {
    std::filesystem::path certificate_file;
    std::filesystem::path private_key_file;
    std::filesystem::path ca_file;
    std::string ciphers = "HIGH:!aNULL:!MD5:!RC4";

    bool configured() const {
        return !certificate_file.empty() && !private_key_file.empty();
    }
};

struct DatabaseConfig {
    std::filesystem::path path = "/var/lib/mailcore/mailcore.db";
};

struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::filesystem::path file;
    bool log_to_console = true;
    size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    size_t max_files = 5;
};

struct SecurityConfig {
    std::string authentication_salt;
    int max_failed_attempts = 5;
    std::chrono::seconds lockout_window{15 * 60};
    std::chrono::milliseconds base_backoff_delay{1000};
    std::chrono::milliseconds max_backoff_delay{30000};
    std::chrono::seconds auth_cache_ttl{30};
    size_t auth_cache_max_entries = 10000;
    size_t background_queue_capacity = 10000;
    int hash_iterations = 100000;
};

struct IMAPConfig : ServerConfig {
    std::string server_name = "mailcore";
    size_t max_deleted_messages = 10000;

    IMAPConfig() {
        port = 143;
        tls_port = 993;
        session_timeout = std::chrono::minutes(30);
        max_messages_per_session = 2000;
    }
};

struct POP3Config : ServerConfig {
    std::string server_name = "mailcore";
    size_t max_deleted_messages = 10000;

    POP3Config() {
        port = 110;
        tls_port = 995;
        session_timeout = std::chrono::minutes(10);
        max_messages_per_session = 1000;
    }
};

struct SMTPConfig {
    bool mx_enabled = false;
    uint16_t mx_port = 25;
    uint16_t submission_port = 587;
    std::vector<std::string> hosted_domains;
    bool validate_recipients = true;
    size_t max_message_size = 25 * 1024 * 1024;     // 25 MB
    size_t max_attachment_size = 10 * 1024 * 1024;  // 10 MB
};

struct OutboundConfig {
    bool enabled = false;
    std::string relay_host;
    uint16_t relay_port = 587;
    std::string relay_username;
    std::string relay_password;
    bool relay_use_tls = true;
    size_t max_concurrency = 5;
    int max_retries = 10;
    std::chrono::seconds retry_base_delay{60};
    std::chrono::seconds retry_max_delay{3600};
    std::chrono::seconds poll_interval{15};
    std::chrono::seconds smtp_timeout{30};
    std::string sender_domain = "localhost";
    bool verify_certificates = false;

    bool uses_relay() const { return !relay_host.empty(); }
};

class Config {
public:
    static Config& instance();

    Config() = default;

    bool load(const std::filesystem::path& config_file);
    bool load_from_string(const std::string& content);

    const std::string& hostname() const { return hostname_; }
    const TLSConfig& tls() const { return tls_; }
    const DatabaseConfig& database() const { return database_; }
    const LogConfig& log() const { return log_; }
    const SecurityConfig& security() const { return security_; }
    const SMTPConfig& smtp() const { return smtp_; }
    const POP3Config& pop3() const { return pop3_; }
    const IMAPConfig& imap() const { return imap_; }
    const OutboundConfig& outbound() const { return outbound_; }

    TLSConfig& tls() { return tls_; }
    DatabaseConfig& database() { return database_; }
    LogConfig& log() { return log_; }
    SecurityConfig& security() { return security_; }
    SMTPConfig& smtp() { return smtp_; }
    POP3Config& pop3() { return pop3_; }
    IMAPConfig& imap() { return imap_; }
    OutboundConfig& outbound() { return outbound_; }

    std::optional<std::string> get(const std::string& key) const;
    void set(const std::string& key, const std::string& value);

private:
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void parse_section(const std::string& section, const std::string& key, const std::string& value);
    bool parse_listener(ServerConfig& server, const std::string& key, const std::string& value);

    std::string hostname_ = "localhost";
    TLSConfig tls_;
    DatabaseConfig database_;
    LogConfig log_;
    SecurityConfig security_;
    SMTPConfig smtp_;
    POP3Config pop3_;
    IMAPConfig imap_;
    OutboundConfig outbound_;

    std::unordered_map<std::string, std::string> custom_values_;
};

}  // namespace mailcore
