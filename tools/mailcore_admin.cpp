#include "auth/scope.hpp"
#include "auth/secret_hasher.hpp"
#include "storage/sqlite_store.hpp"
#include "config.hpp"
#include "encoding.hpp"
#include "logger.hpp"
#include "message_builder.hpp"
#include "message_ingestion.hpp"
#include "mime/message_parser.hpp"
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::cout << "mailcore administration tool\n\n"
              << "Usage: " << program << " [options] <command> [arguments]\n\n"
              << "Commands:\n"
              << "  user add <address> [display name]         Add a user\n"
              << "  user list                                 List users\n"
              << "  key add <address> <name> <scopes>         Create an API key (scopes: smtp,pop3,imap,...)\n"
              << "  key list <address>                        List a user's keys\n"
              << "  key revoke <key id>                       Revoke a key\n"
              << "  queue <from> <to>[,<to>...] <subject>     Queue an email, body read from stdin\n"
              << "  status <outbound id>                      Show delivery status and attempts\n"
              << "  deliver <recipient>...                    Store a raw message read from stdin\n\n"
              << "Options:\n"
              << "  -c, --config <file>    Configuration file (default: /etc/mailcore/mailcore.conf)\n"
              << "  -d, --database <file>  Database file (overrides config)\n"
              << "  -h, --help             Show this help\n";
}

std::string read_stdin() {
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
}

std::optional<mailcore::User> require_user(mailcore::SqliteStore& store, const std::string& address) {
    auto user = store.find_user_by_address(mailcore::to_lower(mailcore::trim(address)));
    if (!user) {
        std::cerr << "User not found: " << address << "\n";
    }
    return user;
}

int user_command(mailcore::SqliteStore& store, const std::vector<std::string>& args) {
    if (args.size() >= 3 && args[1] == "add") {
        std::string display_name = args.size() > 3 ? args[3] : "";
        if (mailcore::mime::address_domain(args[2]).empty()) {
            std::cerr << "Invalid address. Use: user@domain.com\n";
            return 1;
        }
        auto id = store.create_user(args[2], display_name);
        if (!id) {
            std::cerr << "Failed to create user: " << store.last_error() << "\n";
            return 1;
        }
        std::cout << "User created: " << mailcore::to_lower(args[2]) << " (id " << *id << ")\n";
        return 0;
    }

    if (args.size() >= 2 && args[1] == "list") {
        auto users = store.list_users();
        if (users.empty()) {
            std::cout << "No users found.\n";
            return 0;
        }
        std::cout << "Users:\n";
        for (const auto& user : users) {
            std::cout << "  " << user.id << "  " << user.address;
            if (!user.display_name.empty()) {
                std::cout << " (" << user.display_name << ")";
            }
            if (!user.active) {
                std::cout << " (inactive)";
            }
            std::cout << "\n";
        }
        return 0;
    }

    std::cerr << "Usage: user <add|list> [arguments]\n";
    return 1;
}

int key_command(mailcore::SqliteStore& store, const std::vector<std::string>& args, int hash_iterations) {
    if (args.size() >= 5 && args[1] == "add") {
        auto user = require_user(store, args[2]);
        if (!user) return 1;

        auto scopes = mailcore::ScopeSet::parse(args[4]);
        if (!scopes || scopes->empty()) {
            std::cerr << "Invalid scopes: " << args[4] << "\n";
            return 1;
        }

        std::string key = mailcore::SecretHasher::generate_key();
        mailcore::SecretHasher hasher(hash_iterations);
        auto id = store.add_credential(user->id, args[3], mailcore::SecretHasher::key_prefix(key),
                                       hasher.hash(key), *scopes);
        if (!id) {
            std::cerr << "Failed to create key: " << store.last_error() << "\n";
            return 1;
        }

        std::cout << "Key " << *id << " created for " << user->address
                  << " with scopes: " << scopes->to_string() << "\n";
        std::cout << "Key (shown once): " << key << "\n";
        return 0;
    }

    if (args.size() >= 3 && args[1] == "list") {
        auto user = require_user(store, args[2]);
        if (!user) return 1;

        auto credentials = store.list_credentials(user->id);
        if (credentials.empty()) {
            std::cout << "No keys found.\n";
            return 0;
        }
        std::cout << "Keys for " << user->address << ":\n";
        for (const auto& credential : credentials) {
            std::cout << "  " << credential.id << "  " << credential.name
                      << "  [" << credential.scopes.to_string() << "]";
            if (!credential.key_prefix.empty()) {
                std::cout << "  " << credential.key_prefix << "...";
            }
            if (credential.last_used_at) {
                std::cout << "  last used " << mailcore::smtp::format_date(*credential.last_used_at);
            }
            if (!credential.is_active()) {
                std::cout << "  (revoked)";
            }
            std::cout << "\n";
        }
        return 0;
    }

    if (args.size() >= 3 && args[1] == "revoke") {
        int64_t id = 0;
        try {
            id = std::stoll(args[2]);
        } catch (const std::exception&) {
            std::cerr << "Invalid key id: " << args[2] << "\n";
            return 1;
        }
        if (!store.revoke_credential(id)) {
            std::cerr << "Key not found or already revoked: " << id << "\n";
            return 1;
        }
        std::cout << "Key revoked: " << id << "\n";
        return 0;
    }

    std::cerr << "Usage: key <add|list|revoke> [arguments]\n";
    return 1;
}

int queue_command(mailcore::SqliteStore& store, const std::vector<std::string>& args) {
    if (args.size() < 4) {
        std::cerr << "Usage: queue <from> <to>[,<to>...] <subject>\n";
        return 1;
    }

    auto sender = require_user(store, args[1]);
    if (!sender) return 1;

    mailcore::OutboundEmail email;
    email.user_id = sender->id;
    email.from_address = sender->address;
    email.from_display_name = sender->display_name;
    email.subject = args[3];
    email.text_body = read_stdin();

    for (const auto& address : mailcore::mime::parse_address_list(args[2])) {
        mailcore::OutboundRecipient recipient;
        recipient.address = address.address;
        recipient.display_name = address.display_name;
        email.recipients.push_back(std::move(recipient));
    }
    if (email.recipients.empty()) {
        std::cerr << "No valid recipients in: " << args[2] << "\n";
        return 1;
    }

    if (!store.queue_outbound(email)) {
        std::cerr << "Failed to queue email: " << store.last_error() << "\n";
        return 1;
    }
    std::cout << "Queued email " << email.id << " for " << email.recipients.size() << " recipient(s)\n";
    return 0;
}

int status_command(mailcore::SqliteStore& store, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        std::cerr << "Usage: status <outbound id>\n";
        return 1;
    }

    int64_t id = 0;
    try {
        id = std::stoll(args[1]);
    } catch (const std::exception&) {
        std::cerr << "Invalid id: " << args[1] << "\n";
        return 1;
    }

    auto email = store.find_outbound(id);
    if (!email) {
        std::cerr << "Outbound email not found: " << id << "\n";
        return 1;
    }

    std::cout << "Email " << email->id << ": " << mailcore::outbound_status_name(email->status) << "\n";
    std::cout << "Subject: " << email->subject << "\n";
    if (!email->message_id.empty()) {
        std::cout << "Message-ID: " << email->message_id << "\n";
    }
    std::cout << "Attempts: " << email->retry_count << "\n";
    if (email->next_retry_at) {
        std::cout << "Next retry: " << mailcore::smtp::format_date(*email->next_retry_at) << "\n";
    }
    if (!email->last_error.empty()) {
        std::cout << "Last error: " << email->last_error << "\n";
    }

    std::cout << "Recipients:\n";
    for (const auto& recipient : email->recipients) {
        std::cout << "  " << recipient.address << " (" << mailcore::recipient_type_name(recipient.type)
                  << "): " << mailcore::recipient_status_name(recipient.status);
        if (!recipient.status_message.empty()) {
            std::cout << " - " << recipient.status_message;
        }
        std::cout << "\n";
    }

    auto logs = store.delivery_logs(id);
    if (!logs.empty()) {
        std::cout << "Delivery log:\n";
        for (const auto& log : logs) {
            std::cout << "  #" << log.attempt_number << " " << mailcore::smtp::format_date(log.attempted_at)
                      << " " << log.recipient_address << " via " << log.mx_host << ": "
                      << (log.success ? "ok" : "failed");
            if (log.smtp_status_code != 0) {
                std::cout << " " << log.smtp_status_code;
            }
            if (!log.error_message.empty()) {
                std::cout << " - " << log.error_message;
            }
            std::cout << " (" << log.duration.count() << " ms)\n";
        }
    }
    return 0;
}

int deliver_command(mailcore::SqliteStore& store, const mailcore::Config& config,
                    const std::vector<std::string>& args) {
    if (args.size() < 2) {
        std::cerr << "Usage: deliver <recipient>...\n";
        return 1;
    }

    mailcore::smtp::Envelope envelope;
    envelope.recipients.assign(args.begin() + 1, args.end());

    std::string raw = read_stdin();
    auto sender = mailcore::mime::parse_address_list(
        mailcore::mime::parse_message(raw).header("From").value_or(""));
    if (!sender.empty()) {
        envelope.mail_from = sender.front().address;
    }

    mailcore::smtp::MessageIngestion ingestion(config.smtp(), store, store, config.hostname());
    auto result = ingestion.ingest(raw, envelope);
    if (!result.ok()) {
        std::cerr << "Delivery failed: " << result.code << " " << result.message << "\n";
        return 1;
    }
    std::cout << "Stored message " << *result.email_id << "\n";
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string config_file = "/etc/mailcore/mailcore.conf";
    std::string db_file;

    // Parse global options
    int cmd_start = argc;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file = argv[++i];
        } else if ((arg == "-d" || arg == "--database") && i + 1 < argc) {
            db_file = argv[++i];
        } else if (arg[0] != '-') {
            cmd_start = i;
            break;
        }
    }

    if (cmd_start >= argc) {
        print_usage(argv[0]);
        return 1;
    }

    mailcore::Logger::instance().init(mailcore::LogLevel::Warning, true);

    auto& config = mailcore::Config::instance();
    if (!config.load(config_file)) {
        std::cerr << "Warning: could not load " << config_file << ", using defaults\n";
    }

    if (db_file.empty()) {
        db_file = config.database().path.string();
    }

    mailcore::SqliteStore store(db_file);
    if (!store.initialize()) {
        std::cerr << "Failed to initialize database: " << store.last_error() << "\n";
        return 1;
    }

    std::vector<std::string> args(argv + cmd_start, argv + argc);
    const std::string& command = args.front();

    try {
        if (command == "user") {
            return user_command(store, args);
        } else if (command == "key") {
            return key_command(store, args, config.security().hash_iterations);
        } else if (command == "queue") {
            return queue_command(store, args);
        } else if (command == "status") {
            return status_command(store, args);
        } else if (command == "deliver") {
            return deliver_command(store, config, args);
        }
    } catch (const mailcore::StoreError& e) {
        std::cerr << "Database error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}
