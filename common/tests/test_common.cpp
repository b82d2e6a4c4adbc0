#include <catch2/catch_test_macros.hpp>

#include "auth/authenticator.hpp"
#include "auth/rate_limiter.hpp"
#include "auth/scope.hpp"
#include "auth/secret_hasher.hpp"
#include "background_task_queue.hpp"
#include "config.hpp"
#include "encoding.hpp"
#include "mime/message_parser.hpp"
#include "../../tests/support/mail_fixture.hpp"

#include <algorithm>
#include <atomic>
#include <vector>

using namespace mailcore;
using namespace std::chrono_literals;

namespace {

SecurityConfig limiter_config() {
    SecurityConfig config;
    config.authentication_salt = "salt";
    config.max_failed_attempts = 3;
    config.lockout_window = std::chrono::minutes(15);
    config.base_backoff_delay = 1000ms;
    config.max_backoff_delay = 30000ms;
    return config;
}

}  // namespace

TEST_CASE("Encoding helpers", "[common][encoding]") {
    SECTION("Base64") {
        REQUIRE(base64_encode("hello") == "aGVsbG8=");
        REQUIRE(base64_encode("").empty());
        REQUIRE(base64_decode("aGVs\r\nbG8=") == "hello");
        REQUIRE(base64_decode("aGk=") == "hi");
        REQUIRE_FALSE(base64_decode("aGVsbG8").has_value());
        REQUIRE_FALSE(base64_decode("a$==").has_value());
    }

    SECTION("Base64 lines") {
        std::string encoded = base64_encode_lines(std::string(100, 'x'));
        auto first_break = encoded.find("\r\n");
        REQUIRE(first_break == 76);
        REQUIRE(encoded.size() >= 2);
        REQUIRE(encoded.compare(encoded.size() - 2, 2, "\r\n") == 0);
    }

    SECTION("Hex") {
        REQUIRE(hex_encode(std::string("\x01\xab", 2)) == "01ab");
        REQUIRE(hex_decode("01AB") == std::string("\x01\xab", 2));
        REQUIRE_FALSE(hex_decode("abc").has_value());
        REQUIRE_FALSE(hex_decode("zz").has_value());
    }

    SECTION("Strings") {
        REQUIRE(to_lower("MiXeD") == "mixed");
        REQUIRE(to_upper("MiXeD") == "MIXED");
        REQUIRE(trim("  padded \r\n") == "padded");
        REQUIRE(iequals("User@Example.COM", "user@example.com"));
        REQUIRE_FALSE(iequals("abc", "abcd"));
        REQUIRE(istarts_with("AUTHENTICATE PLAIN", "auth"));
        REQUIRE(split("a,,b", ',') == std::vector<std::string>{"a", "b"});
        REQUIRE(split("a,,b", ',', false) == std::vector<std::string>{"a", "", "b"});
    }

    SECTION("Dot stuffing") {
        REQUIRE(dot_stuff("line\n.leading\r\n..double") == "line\r\n..leading\r\n...double\r\n");
        REQUIRE(dot_stuff(".") == "..\r\n");
        REQUIRE(dot_stuff("").empty());
    }
}

TEST_CASE("Message parsing", "[common][mime]") {
    SECTION("Address domains") {
        REQUIRE(mime::address_domain("user@Example.COM") == "example.com");
        REQUIRE(mime::address_domain("<user@mail.example.org>") == "mail.example.org");
        REQUIRE(mime::address_domain("\"a@b\"@c.example") == "c.example");
        REQUIRE(mime::address_domain("no-at-sign").empty());
        REQUIRE(mime::address_domain("").empty());
    }

    SECTION("Address lists") {
        auto addresses = mime::parse_address_list(
            "\"Doe, Jane\" <jane@example.com>, bob@example.org (Bob), =?UTF-8?B?Sm9zw6k=?= <jose@example.net>");
        REQUIRE(addresses.size() == 3);
        REQUIRE(addresses[0].display_name == "Doe, Jane");
        REQUIRE(addresses[0].address == "jane@example.com");
        REQUIRE(addresses[1].address == "bob@example.org");
        REQUIRE(addresses[2].display_name == "Jos\xc3\xa9");
    }

    SECTION("Message ids") {
        REQUIRE(mime::parse_message_ids("<a@x>  <b@y>\r\n <c@z>") ==
                std::vector<std::string>{"<a@x>", "<b@y>", "<c@z>"});
        REQUIRE(mime::parse_message_ids("").empty());
    }

    SECTION("Encoded words") {
        REQUIRE(mime::decode_encoded_words("=?UTF-8?Q?Caf=C3=A9_time?=") == "Caf\xc3\xa9 time");
        REQUIRE(mime::decode_encoded_words("Plain") == "Plain");
    }

    SECTION("Multipart messages") {
        std::string raw =
            "From: Alice <alice@example.com>\r\n"
            "Subject: Report\r\n"
            " continued\r\n"
            "Content-Type: multipart/mixed; boundary=\"outer\"\r\n"
            "\r\n"
            "--outer\r\n"
            "Content-Type: multipart/alternative; boundary=\"inner\"\r\n"
            "\r\n"
            "--inner\r\n"
            "Content-Type: text/plain; charset=utf-8\r\n"
            "\r\n"
            "Plain version\r\n"
            "--inner\r\n"
            "Content-Type: text/html; charset=utf-8\r\n"
            "\r\n"
            "<p>HTML version</p>\r\n"
            "--inner--\r\n"
            "--outer\r\n"
            "Content-Type: text/csv; name=\"data.csv\"\r\n"
            "Content-Disposition: attachment; filename=\"data.csv\"\r\n"
            "Content-Transfer-Encoding: base64\r\n"
            "\r\n"
            "YSxiCjEsMgo=\r\n"
            "--outer--\r\n";

        auto message = mime::parse_message(raw);
        REQUIRE(message.header("subject").has_value());
        REQUIRE(message.header("SUBJECT")->find("Report") == 0);
        REQUIRE(message.text_body.find("Plain version") != std::string::npos);
        REQUIRE(message.html_body.find("<p>HTML version</p>") != std::string::npos);
        REQUIRE(message.attachments.size() == 1);
        REQUIRE(message.attachments[0].file_name == "data.csv");
        REQUIRE(message.attachments[0].content == "a,b\n1,2\n");
        REQUIRE_FALSE(message.header("X-Missing").has_value());
    }
}

TEST_CASE("Scopes", "[common][auth]") {
    auto scopes = ScopeSet::parse("imap, smtp api:read");
    REQUIRE(scopes.has_value());
    REQUIRE(scopes->contains(Scope::Imap));
    REQUIRE(scopes->contains(Scope::Smtp));
    REQUIRE_FALSE(scopes->contains(Scope::Pop3));
    REQUIRE(scopes->to_string() == "smtp imap api:read");

    REQUIRE_FALSE(ScopeSet::parse("smtp bogus").has_value());
    REQUIRE(ScopeSet::parse("")->empty());
    REQUIRE(required_scope(Protocol::Pop3) == Scope::Pop3);
}

TEST_CASE("Secret hashing", "[common][auth]") {
    SECTION("Digests") {
        REQUIRE(hex_encode(crypto::sha256("abc")) ==
                "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
        REQUIRE(hex_encode(crypto::hmac_sha256("Jefe", "what do ya want for nothing?")) ==
                "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
        REQUIRE(crypto::random_bytes(16).size() == 16);
        REQUIRE(crypto::constant_time_equals("same", "same"));
        REQUIRE_FALSE(crypto::constant_time_equals("same", "sane"));
        REQUIRE_FALSE(crypto::constant_time_equals("short", "longer"));
    }

    SECTION("PBKDF2 round trip") {
        SecretHasher hasher(1000);
        std::string encoded = hasher.hash("correct horse");
        REQUIRE(encoded.rfind("$pbkdf2-sha256$1000$", 0) == 0);
        REQUIRE(hasher.verify("correct horse", encoded));
        REQUIRE_FALSE(hasher.verify("wrong horse", encoded));
        REQUIRE_FALSE(hasher.verify("correct horse", "$pbkdf2-sha256$garbage"));
        REQUIRE(hasher.hash("correct horse") != encoded);
    }

    SECTION("Generated keys") {
        std::string key = SecretHasher::generate_key();
        REQUIRE(key.size() == 48);
        REQUIRE(hex_decode(key).has_value());
        REQUIRE(SecretHasher::key_prefix(key) == key.substr(0, SecretHasher::KEY_PREFIX_LENGTH));
        REQUIRE(SecretHasher::generate_key() != key);
    }
}

TEST_CASE("Rate limiter backoff and lockout", "[common][ratelimit]") {
    auto now = RateLimiter::Clock::now();
    RateLimiter limiter(limiter_config(), [&now]() { return now; });
    const std::string client = "192.0.2.10";

    REQUIRE_FALSE(limiter.check(client, Protocol::Imap).blocked);

    SECTION("Each failure doubles the wait") {
        limiter.record_failure(client, Protocol::Imap);
        auto first = limiter.check(client, Protocol::Imap);
        REQUIRE(first.blocked);
        REQUIRE(first.failed_attempts == 1);
        REQUIRE(first.retry_after == 1000ms);

        now += 1000ms;
        REQUIRE_FALSE(limiter.check(client, Protocol::Imap).blocked);

        limiter.record_failure(client, Protocol::Imap);
        REQUIRE(limiter.check(client, Protocol::Imap).retry_after == 2000ms);
    }

    SECTION("Lockout lasts the window from the first failure") {
        for (int i = 0; i < 3; ++i) {
            limiter.record_failure(client, Protocol::Imap);
            now += 10s;
        }
        auto locked = limiter.check(client, Protocol::Imap);
        REQUIRE(locked.blocked);
        REQUIRE(locked.failed_attempts == 3);
        REQUIRE(locked.retry_after == std::chrono::duration_cast<std::chrono::milliseconds>(15min - 30s));

        now += 15min;
        auto released = limiter.check(client, Protocol::Imap);
        REQUIRE_FALSE(released.blocked);
        REQUIRE(released.failed_attempts == 0);
    }

    SECTION("Keys are per protocol and cleared on success") {
        limiter.record_failure(client, Protocol::Imap);
        REQUIRE_FALSE(limiter.check(client, Protocol::Pop3).blocked);
        REQUIRE_FALSE(limiter.check("192.0.2.11", Protocol::Imap).blocked);

        limiter.record_success(client, Protocol::Imap);
        REQUIRE_FALSE(limiter.check(client, Protocol::Imap).blocked);
        REQUIRE(limiter.tracked_entries() == 0);
    }

    SECTION("Expired entries are purged") {
        limiter.record_failure(client, Protocol::Imap);
        REQUIRE(limiter.tracked_entries() == 1);
        now += 16min;
        REQUIRE_FALSE(limiter.check("192.0.2.99", Protocol::Smtp).blocked);
        REQUIRE(limiter.tracked_entries() == 0);
    }

    SECTION("Cache keys") {
        auto key = limiter.cache_key("Alice@Example.com", "secret");
        REQUIRE(key == limiter.cache_key("alice@example.com", "secret"));
        REQUIRE(key != limiter.cache_key("alice@example.com", "other"));
        REQUIRE(base64_decode(key)->size() == 32);

        RateLimiter other(limiter_config());
        REQUIRE(other.cache_key("alice@example.com", "secret") == key);
    }
}

TEST_CASE("Background task queue", "[common][tasks]") {
    SECTION("Runs every queued task before shutdown returns") {
        BackgroundTaskQueue queue(100);
        queue.start();
        std::atomic<int> runs{0};
        for (int i = 0; i < 50; ++i) {
            REQUIRE(queue.enqueue("count", [&runs]() { ++runs; }));
        }
        queue.shutdown();
        REQUIRE(runs == 50);
        REQUIRE(queue.completed() == 50);
        REQUIRE_FALSE(queue.enqueue("late", [&runs]() { ++runs; }));
    }

    SECTION("A full queue drops its oldest task") {
        BackgroundTaskQueue queue(2);
        std::vector<int> order;
        for (int i = 1; i <= 3; ++i) {
            REQUIRE(queue.enqueue("task", [&order, i]() { order.push_back(i); }));
        }
        REQUIRE(queue.pending() == 2);
        REQUIRE(queue.dropped() == 1);

        queue.shutdown();
        REQUIRE(order == std::vector<int>{2, 3});
    }

    SECTION("Failing tasks are counted and do not stop the queue") {
        BackgroundTaskQueue queue(10);
        queue.start();
        bool ran = false;
        queue.enqueue("fails", []() { throw std::runtime_error("boom"); });
        queue.enqueue("runs", [&ran]() { ran = true; });
        queue.shutdown();
        REQUIRE(ran);
        REQUIRE(queue.failed() == 1);
        REQUIRE(queue.completed() == 1);
    }
}

TEST_CASE("Authenticator", "[common][auth]") {
    testing::MailFixture fixture;
    int64_t alice = fixture.add_user("alice@example.com");
    std::string imap_key = fixture.add_key(alice, {Scope::Imap, Scope::Smtp});
    std::string pop_key = fixture.add_key(alice, {Scope::Pop3});

    SECTION("Valid key with the protocol scope") {
        auto result = fixture.authenticator.authenticate("Alice@Example.com", imap_key, Protocol::Imap, "192.0.2.1");
        REQUIRE(is_success(result));
        const auto& success = std::get<auth_result::Success>(result);
        REQUIRE(success.user.id == alice);
        REQUIRE(success.user.address == "alice@example.com");
        REQUIRE(fixture.authenticator.cache_size() == 1);
    }

    SECTION("Key without the protocol scope") {
        auto result = fixture.authenticator.authenticate("alice@example.com", pop_key, Protocol::Imap, "192.0.2.2");
        REQUIRE(std::holds_alternative<auth_result::ScopeDenied>(result));
        REQUIRE(is_success(fixture.authenticator.authenticate("alice@example.com", pop_key, Protocol::Pop3,
                                                              "192.0.2.3")));
    }

    SECTION("Unknown user, wrong key and empty input") {
        REQUIRE(std::holds_alternative<auth_result::NotFound>(
            fixture.authenticator.authenticate("nobody@example.com", imap_key, Protocol::Imap, "192.0.2.4")));
        REQUIRE(std::holds_alternative<auth_result::NotFound>(
            fixture.authenticator.authenticate("alice@example.com", "not-a-key", Protocol::Imap, "192.0.2.5")));
        REQUIRE(std::holds_alternative<auth_result::NotFound>(
            fixture.authenticator.authenticate("", "", Protocol::Imap, "192.0.2.6")));
    }

    SECTION("Failures are rate limited per client") {
        auto first = fixture.authenticator.authenticate("alice@example.com", "bad", Protocol::Imap, "192.0.2.7");
        REQUIRE(std::holds_alternative<auth_result::NotFound>(first));

        auto second = fixture.authenticator.authenticate("alice@example.com", imap_key, Protocol::Imap, "192.0.2.7");
        REQUIRE(std::holds_alternative<auth_result::RateLimited>(second));
        REQUIRE(std::get<auth_result::RateLimited>(second).retry_after > 0ms);
        REQUIRE(std::string(describe(second)) == "rate limited");

        REQUIRE(is_success(fixture.authenticator.authenticate("alice@example.com", imap_key, Protocol::Imap,
                                                              "192.0.2.8")));
    }

    SECTION("Revoked keys stay valid until the cache entry goes") {
        REQUIRE(is_success(fixture.authenticator.authenticate("alice@example.com", imap_key, Protocol::Imap,
                                                              "192.0.2.9")));
        auto credentials = fixture.store.list_credentials(alice);
        for (const auto& credential : credentials) {
            REQUIRE(fixture.store.revoke_credential(credential.id));
        }

        REQUIRE(is_success(fixture.authenticator.authenticate("alice@example.com", imap_key, Protocol::Imap,
                                                              "192.0.2.9")));
        fixture.authenticator.clear_cache();
        REQUIRE(std::holds_alternative<auth_result::NotFound>(
            fixture.authenticator.authenticate("alice@example.com", imap_key, Protocol::Imap, "192.0.2.9")));
    }

    SECTION("Last use is recorded in the background") {
        REQUIRE(is_success(fixture.authenticator.authenticate("alice@example.com", imap_key, Protocol::Imap,
                                                              "192.0.2.10")));
        REQUIRE(fixture.tasks.pending() == 1);
        fixture.tasks.shutdown();

        auto credentials = fixture.store.list_credentials(alice);
        auto used = std::count_if(credentials.begin(), credentials.end(),
                                  [](const Credential& c) { return c.last_used_at.has_value(); });
        REQUIRE(used == 1);
    }
}

TEST_CASE("Configuration parsing", "[common][config]") {
    Config config;
    REQUIRE(config.load_from_string(R"(
# mailcore
[server]
hostname = mx.example.com

[log]
level = debug
file = "/var/log/mailcore/mailcore.log"

[security]
authentication_salt = pepper
max_failed_attempts = 7
auth_cache_seconds = 10

[imap]
port = 1143
tls_port = 1993
threads = 2

[pop3]
enabled = no

[smtp]
mx_enabled = yes
hosted_domains = example.com, Mail.Example.com ,
validate_recipients = false

[outbound]
enabled = true
relay_host = smtp.relay.example
relay_port = 2525
max_retries = 4
retry_base_delay = 30
sender_domain = example.com

[custom]
answer = 42
)"));

    REQUIRE(config.hostname() == "mx.example.com");
    REQUIRE(config.imap().server_name == "mx.example.com");
    REQUIRE(config.log().level == LogLevel::Debug);
    REQUIRE(config.log().file == "/var/log/mailcore/mailcore.log");
    REQUIRE(config.security().authentication_salt == "pepper");
    REQUIRE(config.security().max_failed_attempts == 7);
    REQUIRE(config.security().auth_cache_ttl == 10s);
    REQUIRE(config.imap().port == 1143);
    REQUIRE(config.imap().tls_port == 1993);
    REQUIRE(config.imap().thread_pool_size == 2);
    REQUIRE_FALSE(config.pop3().enabled);
    REQUIRE(config.pop3().tls_port == 995);
    REQUIRE(config.smtp().mx_enabled);
    REQUIRE(config.smtp().hosted_domains == std::vector<std::string>{"example.com", "Mail.Example.com"});
    REQUIRE_FALSE(config.smtp().validate_recipients);
    REQUIRE(config.outbound().enabled);
    REQUIRE(config.outbound().uses_relay());
    REQUIRE(config.outbound().relay_port == 2525);
    REQUIRE(config.outbound().max_retries == 4);
    REQUIRE(config.outbound().retry_base_delay == 30s);
    REQUIRE(config.outbound().retry_max_delay == 3600s);
    REQUIRE(config.outbound().sender_domain == "example.com");
    REQUIRE(config.get("custom.answer") == "42");
    REQUIRE_FALSE(config.get("custom.missing").has_value());

    SECTION("Invalid numbers keep the default") {
        Config fallback;
        fallback.load_from_string("[imap]\nport = not-a-port\n");
        REQUIRE(fallback.imap().port == 143);
    }

    SECTION("Missing files fail to load") {
        Config missing;
        REQUIRE_FALSE(missing.load("/nonexistent/mailcore.conf"));
    }
}

TEST_CASE("Log levels", "[common][logger]") {
    REQUIRE(parse_log_level("WARN") == LogLevel::Warning);
    REQUIRE(parse_log_level("warning") == LogLevel::Warning);
    REQUIRE(parse_log_level("trace") == LogLevel::Trace);
    REQUIRE_FALSE(parse_log_level("verbose").has_value());
}
