#include "imap_server.hpp"
#include "pop3_server.hpp"
#include "delivery_engine.hpp"
#include "mx_resolver.hpp"
#include "smtp_client.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "ssl_context.hpp"
#include "auth/authenticator.hpp"
#include "auth/rate_limiter.hpp"
#include "background_task_queue.hpp"
#include "storage/sqlite_store.hpp"
#include <iostream>
#include <csignal>
#include <atomic>
#include <memory>
#include <thread>

namespace {
    std::atomic<bool> g_running{true};
}

void signal_handler(int) {
    g_running = false;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  -c, --config <file>    Configuration file path\n"
              << "  -h, --help             Show this help message\n"
              << "  -v, --version          Show version information\n";
}

int main(int argc, char* argv[]) {
    std::string config_file = "/etc/mailcore/mailcore.conf";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            std::cout << "mailcored v1.0.0\n";
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    auto& config = mailcore::Config::instance();
    bool loaded = config.load(config_file);

    const auto& log = config.log();
    mailcore::Logger::instance().init(log.level, log.log_to_console, log.file,
                                      log.max_file_size, log.max_files);

    if (!loaded) {
        LOG_WARNING_FMT("Could not load config file: {}, using defaults", config_file);
    }
    LOG_INFO_FMT("mailcored starting as {}", config.hostname());

    mailcore::SqliteStore store(config.database().path);
    if (!store.initialize()) {
        LOG_FATAL_FMT("Failed to open database {}: {}", config.database().path.string(), store.last_error());
        return 1;
    }

    mailcore::RateLimiter rate_limiter(config.security());
    mailcore::BackgroundTaskQueue tasks(config.security().background_queue_capacity);
    tasks.start();
    mailcore::Authenticator authenticator(store, rate_limiter, tasks, config.security());

    std::unique_ptr<mailcore::SSLContext> server_tls;
    if (config.tls().configured()) {
        server_tls = std::make_unique<mailcore::SSLContext>(
            mailcore::SSLContext::create_server_context(config.tls()));
        if (!server_tls->is_initialized()) {
            LOG_WARNING_FMT("TLS configuration failed ({}), implicit TLS ports stay closed",
                            server_tls->last_error());
        }
    }

    auto client_tls = mailcore::SSLContext::create_client_context(config.outbound().verify_certificates,
                                                                  config.tls().ca_file);
    if (!client_tls.is_initialized()) {
        LOG_WARNING_FMT("Outbound TLS unavailable: {}", client_tls.last_error());
    }

    mailcore::imap::IMAPServer imap_server(config.imap(), authenticator, store, server_tls.get());
    mailcore::pop3::POP3Server pop3_server(config.pop3(), authenticator, store, server_tls.get());

    mailcore::smtp::DnsMxResolver resolver;
    mailcore::smtp::SmtpClient smtp_client(config.outbound().smtp_timeout, &client_tls);
    mailcore::smtp::DeliveryEngine delivery(config.outbound(), store, resolver, smtp_client);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    int exit_code = 0;
    try {
        if (!imap_server.start() || !pop3_server.start()) {
            LOG_FATAL("Failed to start mail listeners");
            exit_code = 1;
        } else {
            delivery.start();
            LOG_INFO("mailcored started successfully");

            while (g_running) {
                std::this_thread::sleep_for(std::chrono::seconds(1));
            }
            LOG_INFO("Shutdown requested");
        }
    } catch (const std::exception& e) {
        LOG_FATAL_FMT("Server error: {}", e.what());
        exit_code = 1;
    }

    delivery.stop();
    pop3_server.stop();
    imap_server.stop();
    tasks.shutdown();

    LOG_INFO("mailcored shutdown complete");
    mailcore::Logger::instance().shutdown();
    return exit_code;
}
