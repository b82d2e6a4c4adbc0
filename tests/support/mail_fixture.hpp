#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include <chrono>
#include <format>

#include "auth/authenticator.hpp"
#include "auth/rate_limiter.hpp"
#include "auth/secret_hasher.hpp"
#include "background_task_queue.hpp"
#include "config.hpp"
#include "storage/sqlite_store.hpp"

namespace mailcore::testing {

inline SecurityConfig test_security_config() {
    SecurityConfig config;
    config.authentication_salt = "test-salt";
    config.hash_iterations = 1000;
    return config;
}

// In-memory store with the authentication stack wired to it.
struct MailFixture {
    SecurityConfig security = test_security_config();
    SqliteStore store{":memory:"};
    RateLimiter rate_limiter{security};
    BackgroundTaskQueue tasks{100};
    Authenticator authenticator{store, rate_limiter, tasks, security};

    MailFixture() {
        if (!store.initialize()) {
            throw std::runtime_error("cannot initialize test store: " + store.last_error());
        }
    }

    int64_t add_user(const std::string& address) {
        auto id = store.create_user(address);
        if (!id) throw std::runtime_error(store.last_error());
        return *id;
    }

    // Returns the raw key.
    std::string add_key(int64_t user_id, const ScopeSet& scopes) {
        std::string key = SecretHasher::generate_key();
        SecretHasher hasher(security.hash_iterations);
        if (!store.add_credential(user_id, "test key", SecretHasher::key_prefix(key), hasher.hash(key), scopes)) {
            throw std::runtime_error(store.last_error());
        }
        return key;
    }

    int64_t deliver(int64_t user_id, const std::string& address, const std::string& subject,
                    const std::string& body, std::chrono::system_clock::time_point received_at =
                        std::chrono::system_clock::now()) {
        InboundEmail email;
        email.message_id = std::format("<{}.{}@test.example>", subject.size(), next_message_++);
        email.from_address = "sender@remote.example";
        email.subject = subject;
        email.text_body = body;
        email.raw_content = std::format(
            "From: Sender <sender@remote.example>\r\n"
            "To: {}\r\n"
            "Subject: {}\r\n"
            "Message-ID: {}\r\n"
            "\r\n"
            "{}\r\n",
            address, subject, email.message_id, body);
        email.size_bytes = email.raw_content.size();
        email.received_at = received_at;

        EmailRecipient recipient;
        recipient.address = address;
        recipient.user_id = user_id;
        email.recipients.push_back(recipient);

        if (!store.save_email(email)) throw std::runtime_error(store.last_error());
        return email.id;
    }

    int next_message_ = 1;
};

}  // namespace mailcore::testing
