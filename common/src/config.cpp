#include "config.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <charconv>
#include <cctype>

namespace mailcore {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool to_bool(const std::string& v) {
    auto lower = to_lower(v);
    return lower == "true" || lower == "yes" || lower == "1" || lower == "on";
}

template<typename T>
T to_number(const std::string& v, T fallback) {
    T result{};
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), result);
    if (ec != std::errc() || ptr != v.data() + v.size()) {
        LOG_WARNING_FMT("Invalid numeric config value '{}'", v);
        return fallback;
    }
    return result;
}

std::vector<std::string> to_list(const std::string& value) {
    std::vector<std::string> items;
    std::istringstream iss(value);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

}  // namespace

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load(const std::filesystem::path& config_file) {
    std::ifstream file(config_file);
    if (!file.is_open()) {
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str());
}

bool Config::load_from_string(const std::string& content) {
    std::istringstream stream(content);
    std::string line;
    std::string current_section;

    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            current_section = to_lower(trim(line.substr(1, line.length() - 2)));
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = to_lower(trim(line.substr(0, eq_pos)));
        std::string value = trim(line.substr(eq_pos + 1));

        if (value.length() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.length() - 2);
        }

        parse_section(current_section, key, value);
    }

    return true;
}

bool Config::parse_listener(ServerConfig& server, const std::string& key,
                            const std::string& value) {
    if (key == "enabled") {
        server.enabled = to_bool(value);
    } else if (key == "bind_address" || key == "address") {
        server.bind_address = value;
    } else if (key == "port") {
        server.port = to_number<uint16_t>(value, server.port);
    } else if (key == "tls_port") {
        server.tls_port = to_number<uint16_t>(value, server.tls_port);
    } else if (key == "max_connections") {
        server.max_connections = to_number<size_t>(value, server.max_connections);
    } else if (key == "thread_pool_size" || key == "threads") {
        server.thread_pool_size = to_number<size_t>(value, server.thread_pool_size);
    } else if (key == "session_timeout") {
        server.session_timeout = std::chrono::seconds(
            to_number<int64_t>(value, server.session_timeout.count()));
    } else if (key == "max_messages_per_session") {
        server.max_messages_per_session = to_number<size_t>(value, server.max_messages_per_session);
    } else {
        return false;
    }
    return true;
}

void Config::parse_section(const std::string& section, const std::string& key,
                           const std::string& value) {
    if (section == "server" && key == "hostname") {
        hostname_ = value;
        imap_.server_name = value;
        pop3_.server_name = value;
    } else if (section == "tls" || section == "ssl") {
        if (key == "certificate" || key == "cert_file") {
            tls_.certificate_file = value;
        } else if (key == "private_key" || key == "key_file") {
            tls_.private_key_file = value;
        } else if (key == "ca_file") {
            tls_.ca_file = value;
        } else if (key == "ciphers") {
            tls_.ciphers = value;
        }
    } else if (section == "database" && key == "path") {
        database_.path = value;
    } else if (section == "log" || section == "logging") {
        if (key == "level") {
            if (auto level = parse_log_level(value)) {
                log_.level = *level;
            }
        } else if (key == "file") {
            log_.file = value;
        } else if (key == "console") {
            log_.log_to_console = to_bool(value);
        } else if (key == "max_file_size") {
            log_.max_file_size = to_number<size_t>(value, log_.max_file_size);
        } else if (key == "max_files") {
            log_.max_files = to_number<size_t>(value, log_.max_files);
        }
    } else if (section == "security") {
        if (key == "authentication_salt") {
            security_.authentication_salt = value;
        } else if (key == "max_failed_attempts") {
            security_.max_failed_attempts = to_number<int>(value, security_.max_failed_attempts);
        } else if (key == "lockout_window") {
            security_.lockout_window = std::chrono::seconds(
                to_number<int64_t>(value, security_.lockout_window.count()));
        } else if (key == "base_backoff_delay_ms") {
            security_.base_backoff_delay = std::chrono::milliseconds(
                to_number<int64_t>(value, security_.base_backoff_delay.count()));
        } else if (key == "max_backoff_delay_ms") {
            security_.max_backoff_delay = std::chrono::milliseconds(
                to_number<int64_t>(value, security_.max_backoff_delay.count()));
        } else if (key == "auth_cache_seconds") {
            security_.auth_cache_ttl = std::chrono::seconds(
                to_number<int64_t>(value, security_.auth_cache_ttl.count()));
        } else if (key == "background_queue_capacity") {
            security_.background_queue_capacity =
                to_number<size_t>(value, security_.background_queue_capacity);
        } else if (key == "hash_iterations") {
            security_.hash_iterations = to_number<int>(value, security_.hash_iterations);
        }
    } else if (section == "imap") {
        if (!parse_listener(imap_, key, value) && key == "max_deleted_messages") {
            imap_.max_deleted_messages = to_number<size_t>(value, imap_.max_deleted_messages);
        }
    } else if (section == "pop3") {
        if (!parse_listener(pop3_, key, value) && key == "max_deleted_messages") {
            pop3_.max_deleted_messages = to_number<size_t>(value, pop3_.max_deleted_messages);
        }
    } else if (section == "smtp") {
        if (key == "mx_enabled") {
            smtp_.mx_enabled = to_bool(value);
        } else if (key == "mx_port") {
            smtp_.mx_port = to_number<uint16_t>(value, smtp_.mx_port);
        } else if (key == "submission_port") {
            smtp_.submission_port = to_number<uint16_t>(value, smtp_.submission_port);
        } else if (key == "hosted_domains") {
            smtp_.hosted_domains = to_list(value);
        } else if (key == "validate_recipients") {
            smtp_.validate_recipients = to_bool(value);
        } else if (key == "max_message_size") {
            smtp_.max_message_size = to_number<size_t>(value, smtp_.max_message_size);
        } else if (key == "max_attachment_size") {
            smtp_.max_attachment_size = to_number<size_t>(value, smtp_.max_attachment_size);
        }
    } else if (section == "outbound") {
        if (key == "enabled") {
            outbound_.enabled = to_bool(value);
        } else if (key == "relay_host") {
            outbound_.relay_host = value;
        } else if (key == "relay_port") {
            outbound_.relay_port = to_number<uint16_t>(value, outbound_.relay_port);
        } else if (key == "relay_username") {
            outbound_.relay_username = value;
        } else if (key == "relay_password") {
            outbound_.relay_password = value;
        } else if (key == "relay_use_tls") {
            outbound_.relay_use_tls = to_bool(value);
        } else if (key == "max_concurrency") {
            outbound_.max_concurrency = to_number<size_t>(value, outbound_.max_concurrency);
        } else if (key == "max_retries") {
            outbound_.max_retries = to_number<int>(value, outbound_.max_retries);
        } else if (key == "retry_base_delay") {
            outbound_.retry_base_delay = std::chrono::seconds(
                to_number<int64_t>(value, outbound_.retry_base_delay.count()));
        } else if (key == "retry_max_delay") {
            outbound_.retry_max_delay = std::chrono::seconds(
                to_number<int64_t>(value, outbound_.retry_max_delay.count()));
        } else if (key == "poll_interval") {
            outbound_.poll_interval = std::chrono::seconds(
                to_number<int64_t>(value, outbound_.poll_interval.count()));
        } else if (key == "smtp_timeout") {
            outbound_.smtp_timeout = std::chrono::seconds(
                to_number<int64_t>(value, outbound_.smtp_timeout.count()));
        } else if (key == "sender_domain") {
            outbound_.sender_domain = value;
        } else if (key == "verify_certificates") {
            outbound_.verify_certificates = to_bool(value);
        }
    } else {
        std::string full_key = section.empty() ? key : section + "." + key;
        custom_values_[full_key] = value;
    }
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = custom_values_.find(key);
    if (it != custom_values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

void Config::set(const std::string& key, const std::string& value) {
    custom_values_[key] = value;
}

}  // namespace mailcore
