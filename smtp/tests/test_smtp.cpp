#include <catch2/catch_test_macros.hpp>

#include "relay_filter.hpp"
#include "message_ingestion.hpp"
#include "message_builder.hpp"
#include "delivery_engine.hpp"
#include "mx_resolver.hpp"
#include "../../tests/support/mail_fixture.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <mutex>
#include <set>

using namespace mailcore;
using namespace mailcore::smtp;

namespace {

class FakeResolver : public MxResolver {
public:
    std::map<std::string, std::vector<std::string>> hosts;

    std::vector<std::string> resolve(const std::string& domain) override {
        auto it = hosts.find(domain);
        return it == hosts.end() ? std::vector<std::string>{domain} : it->second;
    }
};

// Hosts in `reachable` take the message; addresses in `rejected` get a 550 at RCPT.
class FakeTransport : public SmtpTransport {
public:
    std::set<std::string> reachable;
    std::set<std::string> rejected;
    std::vector<TransferRequest> requests;

    TransferResult send(const TransferRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests.push_back(request);

        TransferResult result;
        if (reachable.count(request.host) == 0) {
            for (const auto& address : request.recipients) {
                result.recipients.push_back(RecipientReply{address, false, {}});
            }
            result.error = "Connection to " + request.host + " failed: Connection refused";
            return result;
        }

        size_t accepted = 0;
        for (const auto& address : request.recipients) {
            RecipientReply reply{address, false, {}};
            if (rejected.count(address)) {
                reply.reply.code = 550;
                reply.reply.lines = {"5.1.1 No such user"};
            } else {
                reply.accepted = true;
                reply.reply.code = 250;
                reply.reply.lines = {"OK"};
                ++accepted;
            }
            result.recipients.push_back(std::move(reply));
        }

        if (accepted == 0) {
            result.error = "All recipients rejected";
            return result;
        }
        result.delivered = true;
        result.reply.code = 250;
        result.reply.lines = {"Queued"};
        return result;
    }

    size_t requests_to(const std::string& host) {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::count_if(requests.begin(), requests.end(),
                             [&host](const TransferRequest& r) { return r.host == host; });
    }

private:
    std::mutex mutex_;
};

class RecordingDeliveryObserver : public DeliveryObserver {
public:
    void on_status_changed(int64_t, int64_t email_id, OutboundStatus status) override {
        std::lock_guard<std::mutex> lock(mutex_);
        statuses[email_id].push_back(status);
    }

    std::map<int64_t, std::vector<OutboundStatus>> statuses;

private:
    std::mutex mutex_;
};

class RecordingMailObserver : public NewMailObserver {
public:
    void on_new_mail(int64_t user_id, const InboundEmail& email) override {
        notified.push_back(user_id);
        last = email;
    }

    std::vector<int64_t> notified;
    InboundEmail last;
};

class UnavailableMessageStore : public MessageStore {
public:
    bool save_email(InboundEmail&) override { throw StoreError("database unavailable"); }
    std::optional<InboundEmail> find_by_message_id(const std::string&) override {
        throw StoreError("database unavailable");
    }
    std::vector<MessageSummary> list_messages(int64_t, size_t) override { return {}; }
    std::optional<std::string> get_message_content(int64_t, int64_t) override { return std::nullopt; }
    bool update_flags(int64_t, int64_t, uint8_t) override { return false; }
    size_t delete_messages(int64_t, const std::vector<int64_t>&) override { return 0; }
};

const EmailRecipient* find_recipient(const InboundEmail& email, const std::string& address) {
    for (const auto& recipient : email.recipients) {
        if (recipient.address == address) return &recipient;
    }
    return nullptr;
}

SMTPConfig mx_config(std::vector<std::string> hosted_domains, bool validate_recipients = false) {
    SMTPConfig config;
    config.mx_enabled = true;
    config.hosted_domains = std::move(hosted_domains);
    config.validate_recipients = validate_recipients;
    return config;
}

OutboundConfig outbound_config() {
    OutboundConfig config;
    config.enabled = true;
    config.max_retries = 3;
    config.retry_base_delay = std::chrono::seconds(60);
    config.retry_max_delay = std::chrono::seconds(3600);
    config.sender_domain = "mail.test";
    return config;
}

OutboundRecipient outbound_recipient(const std::string& address, RecipientType type = RecipientType::To) {
    OutboundRecipient recipient;
    recipient.address = address;
    recipient.type = type;
    return recipient;
}

int64_t queue_email(testing::MailFixture& fixture, int64_t user_id, std::vector<OutboundRecipient> recipients) {
    OutboundEmail email;
    email.user_id = user_id;
    email.from_address = "sender@mail.test";
    email.from_display_name = "Sender";
    email.subject = "Quarterly report";
    email.text_body = "See attached.";
    email.recipients = std::move(recipients);
    if (!fixture.store.queue_outbound(email)) throw std::runtime_error(fixture.store.last_error());
    return email.id;
}

TimePoint test_now() {
    return std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

}  // namespace

TEST_CASE("Relay filter accepts everything when MX acceptance is disabled", "[smtp][relay]") {
    testing::MailFixture fixture;
    SMTPConfig config;
    config.mx_enabled = false;
    RelayFilter filter(config, fixture.store);

    TransactionContext context{config.submission_port, "203.0.113.5", std::nullopt};
    REQUIRE(filter.can_accept_from(context, "anyone@anywhere.example"));
    REQUIRE(filter.can_deliver_to(context, "victim@elsewhere.example", "anyone@anywhere.example"));
}

TEST_CASE("Relay filter on the submission port", "[smtp][relay]") {
    testing::MailFixture fixture;
    SMTPConfig config = mx_config({"example.com"});
    RelayFilter filter(config, fixture.store);

    SECTION("Unauthenticated is always rejected") {
        TransactionContext context{config.submission_port, "203.0.113.5", std::nullopt};
        for (const std::string address : {"user@example.com", "user@other.org", "user@EXAMPLE.COM"}) {
            REQUIRE_FALSE(filter.can_accept_from(context, address));
            REQUIRE_FALSE(filter.can_deliver_to(context, address, "sender@other.org"));
        }
    }

    SECTION("Authenticated may send anywhere") {
        TransactionContext context{config.submission_port, "203.0.113.5", 42};
        REQUIRE(filter.can_accept_from(context, "me@example.com"));
        REQUIRE(filter.can_deliver_to(context, "friend@other.org", "me@example.com"));
    }
}

TEST_CASE("Relay filter on the MX port", "[smtp][relay]") {
    testing::MailFixture fixture;
    SMTPConfig config = mx_config({"example.com", "mail.example.com"});
    RelayFilter filter(config, fixture.store);
    TransactionContext context{config.mx_port, "198.51.100.7", std::nullopt};

    SECTION("Any sender is accepted") {
        REQUIRE(filter.can_accept_from(context, "someone@remote.org"));
        REQUIRE(filter.can_accept_from(context, ""));
    }

    SECTION("Hosted domains match exactly and case-insensitively") {
        REQUIRE(filter.can_deliver_to(context, "user@example.com", "someone@remote.org"));
        REQUIRE(filter.can_deliver_to(context, "user@EXAMPLE.COM", "someone@remote.org"));
        REQUIRE(filter.can_deliver_to(context, "user@mail.example.com", "someone@remote.org"));
        REQUIRE(filter.can_deliver_to(context, "<user@Example.Com>", "someone@remote.org"));
    }

    SECTION("Other domains are rejected") {
        REQUIRE_FALSE(filter.can_deliver_to(context, "user@sub.example.com", "someone@remote.org"));
        REQUIRE_FALSE(filter.can_deliver_to(context, "user@example.org", "someone@remote.org"));
        REQUIRE_FALSE(filter.can_deliver_to(context, "user@notexample.com", "someone@remote.org"));
        REQUIRE_FALSE(filter.can_deliver_to(context, "no-domain", "someone@remote.org"));
    }

    SECTION("An empty hosted domain list rejects every recipient") {
        RelayFilter empty(mx_config({}), fixture.store);
        REQUIRE_FALSE(empty.can_deliver_to(context, "user@example.com", "someone@remote.org"));
        REQUIRE_FALSE(empty.can_deliver_to(context, "user@anything.org", "someone@remote.org"));
    }

    SECTION("Authenticated sessions on the MX port are not restricted") {
        TransactionContext authenticated{config.mx_port, "198.51.100.7", 7};
        REQUIRE(filter.can_deliver_to(authenticated, "user@other.org", "me@example.com"));
    }
}

TEST_CASE("Relay filter validates recipients against known users", "[smtp][relay]") {
    testing::MailFixture fixture;
    fixture.add_user("alice@example.com");

    SMTPConfig config = mx_config({"example.com"}, true);
    RelayFilter filter(config, fixture.store);
    TransactionContext context{config.mx_port, "198.51.100.7", std::nullopt};

    REQUIRE(filter.can_deliver_to(context, "alice@example.com", "someone@remote.org"));
    REQUIRE(filter.can_deliver_to(context, "Alice@Example.com", "someone@remote.org"));
    REQUIRE_FALSE(filter.can_deliver_to(context, "bob@example.com", "someone@remote.org"));
    REQUIRE(filter.is_hosted_domain("EXAMPLE.com"));
    REQUIRE_FALSE(filter.is_hosted_domain("remote.org"));
}

TEST_CASE("Ingestion stores messages with linked recipients", "[smtp][ingest]") {
    testing::MailFixture fixture;
    int64_t alice = fixture.add_user("alice@example.com");
    int64_t bob = fixture.add_user("bob@example.com");

    SMTPConfig config = mx_config({"example.com"});
    MessageIngestion ingestion(config, fixture.store, fixture.store, "mail.test");
    RecordingMailObserver observer;
    ingestion.set_observer(&observer);

    std::string raw =
        "From: \"Carol Remote\" <carol@remote.org>\r\n"
        "To: Alice <alice@example.com>, stranger@remote.org\r\n"
        "Cc: alice@example.com\r\n"
        "Subject: =?UTF-8?B?SGVsbG8gd29ybGQ=?=\r\n"
        "Message-ID: <first@remote.org>\r\n"
        "\r\n"
        "Hi Alice\r\n";

    Envelope envelope;
    envelope.mail_from = "carol@remote.org";
    envelope.recipients = {"alice@example.com", "bob@example.com"};

    auto result = ingestion.ingest(raw, envelope);
    REQUIRE(result.ok());
    REQUIRE(result.email_id.has_value());

    SECTION("Headers are parsed") {
        auto stored = fixture.store.find_by_message_id("<first@remote.org>");
        REQUIRE(stored.has_value());
        REQUIRE(stored->subject == "Hello world");
        REQUIRE(stored->from_address == "carol@remote.org");
        REQUIRE(stored->from_display_name == "Carol Remote");
        REQUIRE(stored->size_bytes == raw.size());
        REQUIRE_FALSE(stored->thread_id.has_value());
    }

    SECTION("Envelope recipients missing from the headers become Bcc") {
        const auto& email = observer.last;
        REQUIRE(email.recipients.size() == 4);

        auto* hidden = find_recipient(email, "bob@example.com");
        REQUIRE(hidden != nullptr);
        REQUIRE(hidden->type == RecipientType::Bcc);
        REQUIRE(hidden->user_id == bob);

        auto* stranger = find_recipient(email, "stranger@remote.org");
        REQUIRE(stranger != nullptr);
        REQUIRE_FALSE(stranger->user_id.has_value());
    }

    SECTION("Each local user is notified once and sees the message") {
        REQUIRE(observer.notified == std::vector<int64_t>{alice, bob});
        REQUIRE(fixture.store.list_messages(alice, 10).size() == 1);
        REQUIRE(fixture.store.list_messages(bob, 10).size() == 1);
    }
}

TEST_CASE("Ingestion fills in missing headers", "[smtp][ingest]") {
    testing::MailFixture fixture;
    fixture.add_user("alice@example.com");
    MessageIngestion ingestion(mx_config({"example.com"}), fixture.store, fixture.store, "mail.test");
    RecordingMailObserver observer;
    ingestion.set_observer(&observer);

    Envelope envelope;
    envelope.recipients = {"alice@example.com"};
    auto result = ingestion.ingest("From: carol@remote.org\r\n\r\nNo headers to speak of\r\n", envelope);
    REQUIRE(result.ok());

    REQUIRE(observer.last.subject == "(No Subject)");
    REQUIRE(observer.last.message_id.front() == '<');
    REQUIRE(observer.last.message_id.find("@mail.test>") != std::string::npos);
    REQUIRE(observer.last.text_body.find("No headers to speak of") != std::string::npos);
}

TEST_CASE("Ingestion resolves threads", "[smtp][ingest]") {
    testing::MailFixture fixture;
    fixture.add_user("alice@example.com");
    MessageIngestion ingestion(mx_config({"example.com"}), fixture.store, fixture.store, "mail.test");
    Envelope envelope;
    envelope.recipients = {"alice@example.com"};

    auto parent = ingestion.ingest(
        "From: carol@remote.org\r\nTo: alice@example.com\r\nSubject: Plan\r\n"
        "Message-ID: <parent@remote.org>\r\n\r\nFirst\r\n", envelope);
    REQUIRE(parent.ok());

    auto reply = ingestion.ingest(
        "From: alice@example.com\r\nTo: carol@remote.org\r\nSubject: Re: Plan\r\n"
        "Message-ID: <reply@example.com>\r\nIn-Reply-To: <parent@remote.org>\r\n\r\nSecond\r\n", envelope);
    REQUIRE(reply.ok());

    SECTION("In-Reply-To names the parent") {
        auto stored = fixture.store.find_by_message_id("<reply@example.com>");
        REQUIRE(stored.has_value());
        REQUIRE(stored->thread_id == parent.email_id);
        REQUIRE(stored->in_reply_to == "<parent@remote.org>");
    }

    SECTION("Replies to replies stay in the thread") {
        auto third = ingestion.ingest(
            "From: carol@remote.org\r\nSubject: Re: Re: Plan\r\nMessage-ID: <third@remote.org>\r\n"
            "In-Reply-To: <reply@example.com>\r\n\r\nThird\r\n", envelope);
        REQUIRE(third.ok());
        REQUIRE(fixture.store.find_by_message_id("<third@remote.org>")->thread_id == parent.email_id);
    }

    SECTION("References are used when In-Reply-To is unknown") {
        auto other = ingestion.ingest(
            "From: dave@remote.org\r\nSubject: Re: Plan\r\nMessage-ID: <other@remote.org>\r\n"
            "In-Reply-To: <missing@remote.org>\r\n"
            "References: <parent@remote.org> <missing@remote.org>\r\n\r\nFourth\r\n", envelope);
        REQUIRE(other.ok());

        auto stored = fixture.store.find_by_message_id("<other@remote.org>");
        REQUIRE(stored->thread_id == parent.email_id);
        REQUIRE(stored->references == "<parent@remote.org> <missing@remote.org>");
    }

    SECTION("Unrelated messages start no thread") {
        REQUIRE_FALSE(ingestion.resolve_thread("<nobody@remote.org>", {}).has_value());
    }
}

TEST_CASE("Ingestion enforces size limits and reports store failures", "[smtp][ingest]") {
    testing::MailFixture fixture;
    SMTPConfig config = mx_config({"example.com"});
    Envelope envelope;
    envelope.recipients = {"alice@example.com"};

    SECTION("Oversized messages get 552") {
        config.max_message_size = 64;
        MessageIngestion ingestion(config, fixture.store, fixture.store, "mail.test");
        auto result = ingestion.ingest("Subject: big\r\n\r\n" + std::string(100, 'x') + "\r\n", envelope);
        REQUIRE(result.code == reply::SIZE_EXCEEDED);
        REQUIRE(result.message == "Message too large");
    }

    SECTION("Oversized attachments get 552") {
        config.max_attachment_size = 10;
        MessageIngestion ingestion(config, fixture.store, fixture.store, "mail.test");
        std::string raw =
            "Subject: files\r\n"
            "Content-Type: multipart/mixed; boundary=\"b1\"\r\n"
            "\r\n"
            "--b1\r\n"
            "Content-Type: text/plain\r\n"
            "\r\n"
            "body\r\n"
            "--b1\r\n"
            "Content-Type: application/octet-stream\r\n"
            "Content-Disposition: attachment; filename=\"data.bin\"\r\n"
            "Content-Transfer-Encoding: base64\r\n"
            "\r\n"
            "MDEyMzQ1Njc4OTAxMjM0NTY3ODk=\r\n"
            "--b1--\r\n";
        auto result = ingestion.ingest(raw, envelope);
        REQUIRE(result.code == reply::SIZE_EXCEEDED);
        REQUIRE(result.message == "Attachment 'data.bin' too large");
    }

    SECTION("Store failures get 451") {
        UnavailableMessageStore unavailable;
        MessageIngestion ingestion(config, unavailable, fixture.store, "mail.test");
        auto result = ingestion.ingest("Subject: hi\r\nMessage-ID: <x@y>\r\n\r\nbody\r\n", envelope);
        REQUIRE(result.code == reply::TRANSACTION_FAILED);
        REQUIRE_FALSE(result.email_id.has_value());
    }
}

TEST_CASE("Message builder renders RFC 5322 messages", "[smtp][builder]") {
    MessageBuilder builder("mail.test");

    OutboundEmail email;
    email.from_address = "sender@mail.test";
    email.from_display_name = "Sender, Esq.";
    email.subject = "Grüße";
    email.text_body = "Plain text\n.hidden dot";
    email.recipients = {outbound_recipient("to@a.example"),
                        outbound_recipient("cc@b.example", RecipientType::Cc),
                        outbound_recipient("secret@c.example", RecipientType::Bcc)};
    email.references = "<one@x> <two@x>";
    email.in_reply_to = "<two@x>";

    SECTION("Headers") {
        std::string message = builder.build(email);
        REQUIRE(email.message_id.find("@mail.test>") != std::string::npos);
        REQUIRE(message.find("Message-ID: " + email.message_id + "\r\n") == 0);
        REQUIRE(message.find("From: \"Sender, Esq.\" <sender@mail.test>\r\n") != std::string::npos);
        REQUIRE(message.find("To: to@a.example\r\n") != std::string::npos);
        REQUIRE(message.find("Cc: cc@b.example\r\n") != std::string::npos);
        REQUIRE(message.find("secret@c.example") == std::string::npos);
        REQUIRE(message.find("Subject: =?UTF-8?B?R3LDvMOfZQ==?=\r\n") != std::string::npos);
        REQUIRE(message.find("In-Reply-To: <two@x>\r\n") != std::string::npos);
        REQUIRE(message.find("References: <one@x>\r\n <two@x>\r\n") != std::string::npos);
        REQUIRE(message.find("Content-Type: text/plain; charset=utf-8\r\n") != std::string::npos);
        REQUIRE(message.find("\r\n\r\nPlain text\r\n.hidden dot\r\n") != std::string::npos);
    }

    SECTION("Existing Message-ID is kept") {
        email.message_id = "<fixed@mail.test>";
        builder.build(email);
        REQUIRE(email.message_id == "<fixed@mail.test>");
    }

    SECTION("Text and HTML become multipart/alternative") {
        email.html_body = "<p>Hi</p>";
        std::string message = builder.build(email);
        REQUIRE(message.find("Content-Type: multipart/alternative; boundary=") != std::string::npos);
        REQUIRE(message.find("Content-Type: text/html; charset=utf-8\r\n") != std::string::npos);
        REQUIRE(message.find("multipart/mixed") == std::string::npos);
    }

    SECTION("Attachments become multipart/mixed") {
        email.attachments.push_back(OutboundAttachment{"report.pdf", "application/pdf", "%PDF-1.4"});
        std::string message = builder.build(email);
        REQUIRE(message.find("Content-Type: multipart/mixed; boundary=") != std::string::npos);
        REQUIRE(message.find("Content-Disposition: attachment; filename=\"report.pdf\"\r\n") != std::string::npos);
        REQUIRE(message.find(base64_encode("%PDF-1.4")) != std::string::npos);
    }
}

TEST_CASE("Header formatting helpers", "[smtp][builder]") {
    REQUIRE(encode_header_text("Plain subject") == "Plain subject");
    REQUIRE(encode_header_text("").empty());
    REQUIRE(format_address("", "a@b.example") == "a@b.example");
    REQUIRE(format_address("Alice", "a@b.example") == "Alice <a@b.example>");

    TimePoint when = std::chrono::sys_days{std::chrono::year{2026} / std::chrono::October / 17} +
                     std::chrono::hours(9) + std::chrono::minutes(5);
    REQUIRE(format_date(when) == "Sat, 17 Oct 2026 09:05:00 +0000");

    SmtpReply reply;
    reply.code = 250;
    reply.lines = {"mx.example.org", "PIPELINING"};
    REQUIRE(reply.summary() == "250 mx.example.org");
    REQUIRE(reply.text() == "mx.example.org\nPIPELINING");
}

TEST_CASE("Delivery to every recipient marks the email sent", "[smtp][delivery]") {
    testing::MailFixture fixture;
    int64_t user = fixture.add_user("sender@mail.test");
    int64_t id = queue_email(fixture, user, {outbound_recipient("a@good.example"),
                                             outbound_recipient("b@good.example", RecipientType::Bcc)});

    FakeResolver resolver;
    resolver.hosts["good.example"] = {"mx.good.example"};
    FakeTransport transport;
    transport.reachable = {"mx.good.example"};
    RecordingDeliveryObserver observer;
    DeliveryEngine engine(outbound_config(), fixture.store, resolver, transport, &observer);

    auto email = *fixture.store.find_outbound(id);
    TimePoint now = test_now();
    engine.deliver(email, now);

    auto stored = fixture.store.find_outbound(id);
    REQUIRE(stored->status == OutboundStatus::Sent);
    REQUIRE(stored->sent_at == now);
    REQUIRE_FALSE(stored->message_id.empty());
    REQUIRE(stored->recipients[0].status == RecipientStatus::Sent);
    REQUIRE(stored->recipients[1].status == RecipientStatus::Sent);

    // One transaction per domain, Bcc only in the envelope.
    REQUIRE(transport.requests.size() == 1);
    REQUIRE(transport.requests[0].port == 25);
    REQUIRE(transport.requests[0].helo_name == "mail.test");
    REQUIRE(transport.requests[0].recipients == std::vector<std::string>{"a@good.example", "b@good.example"});
    REQUIRE(transport.requests[0].content.find("b@good.example") == std::string::npos);

    auto logs = fixture.store.delivery_logs(id);
    REQUIRE(logs.size() == 2);
    REQUIRE(std::all_of(logs.begin(), logs.end(), [](const DeliveryLog& log) {
        return log.success && log.mx_host == "mx.good.example" && log.attempt_number == 1 &&
               log.smtp_status_code == 250;
    }));

    REQUIRE(observer.statuses[id] == std::vector<OutboundStatus>{OutboundStatus::Sending, OutboundStatus::Sent});
}

TEST_CASE("Mixed delivery outcomes end in partial failure", "[smtp][delivery]") {
    testing::MailFixture fixture;
    int64_t user = fixture.add_user("sender@mail.test");
    int64_t id = queue_email(fixture, user, {outbound_recipient("alice@good.example"),
                                             outbound_recipient("bob@bad.example")});

    FakeResolver resolver;
    resolver.hosts["good.example"] = {"mx.good.example"};
    resolver.hosts["bad.example"] = {"mx1.bad.example", "mx2.bad.example"};
    FakeTransport transport;
    transport.reachable = {"mx.good.example"};
    RecordingDeliveryObserver observer;
    DeliveryEngine engine(outbound_config(), fixture.store, resolver, transport, &observer);

    auto email = *fixture.store.find_outbound(id);
    engine.deliver(email, test_now());

    auto stored = fixture.store.find_outbound(id);
    REQUIRE(stored->status == OutboundStatus::PartialFailure);
    REQUIRE(stored->retry_count == 0);
    REQUIRE_FALSE(stored->next_retry_at.has_value());
    REQUIRE(stored->recipients[0].status == RecipientStatus::Sent);
    REQUIRE(stored->recipients[1].status == RecipientStatus::Failed);
    REQUIRE(stored->recipients[1].status_message.find("All MX hosts for bad.example failed") != std::string::npos);
    REQUIRE(stored->last_error.find("bob@bad.example") != std::string::npos);

    // Both MX hosts of the failing domain were tried in order.
    REQUIRE(transport.requests_to("mx1.bad.example") == 1);
    REQUIRE(transport.requests_to("mx2.bad.example") == 1);

    auto logs = fixture.store.delivery_logs(id);
    REQUIRE(logs.size() == 3);
    size_t successes = std::count_if(logs.begin(), logs.end(), [](const DeliveryLog& log) { return log.success; });
    REQUIRE(successes == 1);

    std::vector<std::string> failed_hosts;
    for (const auto& log : logs) {
        if (!log.success) {
            REQUIRE(log.recipient_address == "bob@bad.example");
            REQUIRE_FALSE(log.error_message.empty());
            failed_hosts.push_back(log.mx_host);
        }
    }
    REQUIRE(failed_hosts == std::vector<std::string>{"mx1.bad.example", "mx2.bad.example"});

    REQUIRE(observer.statuses[id].back() == OutboundStatus::PartialFailure);
}

TEST_CASE("Later MX hosts are only tried after a failure", "[smtp][delivery]") {
    testing::MailFixture fixture;
    int64_t user = fixture.add_user("sender@mail.test");
    int64_t id = queue_email(fixture, user, {outbound_recipient("carol@multi.example")});

    FakeResolver resolver;
    resolver.hosts["multi.example"] = {"mx1.multi.example", "mx2.multi.example", "mx3.multi.example"};
    FakeTransport transport;
    transport.reachable = {"mx2.multi.example", "mx3.multi.example"};
    DeliveryEngine engine(outbound_config(), fixture.store, resolver, transport);

    auto email = *fixture.store.find_outbound(id);
    engine.deliver(email, test_now());

    REQUIRE(fixture.store.find_outbound(id)->status == OutboundStatus::Sent);
    REQUIRE(transport.requests_to("mx1.multi.example") == 1);
    REQUIRE(transport.requests_to("mx2.multi.example") == 1);
    REQUIRE(transport.requests_to("mx3.multi.example") == 0);
    REQUIRE(fixture.store.delivery_logs(id).size() == 2);
}

TEST_CASE("Permanent RCPT rejections are not retried on other hosts", "[smtp][delivery]") {
    testing::MailFixture fixture;
    int64_t user = fixture.add_user("sender@mail.test");
    int64_t id = queue_email(fixture, user, {outbound_recipient("known@good.example"),
                                             outbound_recipient("ghost@good.example")});

    FakeResolver resolver;
    resolver.hosts["good.example"] = {"mx1.good.example", "mx2.good.example"};
    FakeTransport transport;
    transport.reachable = {"mx1.good.example", "mx2.good.example"};
    transport.rejected = {"ghost@good.example"};
    DeliveryEngine engine(outbound_config(), fixture.store, resolver, transport);

    auto email = *fixture.store.find_outbound(id);
    engine.deliver(email, test_now());

    auto stored = fixture.store.find_outbound(id);
    REQUIRE(stored->status == OutboundStatus::PartialFailure);
    REQUIRE(stored->recipients[1].status_message.find("550") != std::string::npos);
    REQUIRE(transport.requests_to("mx2.good.example") == 0);

    auto logs = fixture.store.delivery_logs(id);
    REQUIRE(logs.size() == 2);
    auto rejected = std::find_if(logs.begin(), logs.end(),
                                 [](const DeliveryLog& log) { return log.recipient_address == "ghost@good.example"; });
    REQUIRE(rejected != logs.end());
    REQUIRE(rejected->smtp_status_code == 550);
    REQUIRE_FALSE(rejected->success);
}

TEST_CASE("Failed deliveries follow the retry policy", "[smtp][delivery]") {
    testing::MailFixture fixture;
    int64_t user = fixture.add_user("sender@mail.test");
    int64_t id = queue_email(fixture, user, {outbound_recipient("a@down.example"),
                                             outbound_recipient("b@down.example")});

    FakeResolver resolver;
    FakeTransport transport;
    RecordingDeliveryObserver observer;
    OutboundConfig config = outbound_config();
    DeliveryEngine engine(config, fixture.store, resolver, transport, &observer);

    TimePoint first = test_now();
    auto email = *fixture.store.find_outbound(id);
    engine.deliver(email, first);

    auto stored = fixture.store.find_outbound(id);
    REQUIRE(stored->status == OutboundStatus::Queued);
    REQUIRE(stored->retry_count == 1);
    REQUIRE(stored->next_retry_at == first + std::chrono::seconds(60));
    REQUIRE(stored->recipients[0].status == RecipientStatus::Deferred);
    REQUIRE(stored->recipients[1].status == RecipientStatus::Deferred);
    REQUIRE_FALSE(stored->last_error.empty());
    REQUIRE(observer.statuses[id] == std::vector<OutboundStatus>{OutboundStatus::Sending, OutboundStatus::Queued});

    SECTION("Not picked up before the retry time") {
        REQUIRE(fixture.store.fetch_due(10, first + std::chrono::seconds(30)).empty());
        REQUIRE(fixture.store.fetch_due(10, first + std::chrono::seconds(60)).size() == 1);
    }

    SECTION("Backoff doubles, then the email fails for good") {
        TimePoint second = first + std::chrono::seconds(60);
        email = *fixture.store.find_outbound(id);
        engine.deliver(email, second);

        stored = fixture.store.find_outbound(id);
        REQUIRE(stored->retry_count == 2);
        REQUIRE(stored->next_retry_at == second + std::chrono::seconds(120));

        TimePoint third = second + std::chrono::seconds(120);
        email = *fixture.store.find_outbound(id);
        engine.deliver(email, third);

        stored = fixture.store.find_outbound(id);
        REQUIRE(stored->status == OutboundStatus::Failed);
        REQUIRE(stored->retry_count == config.max_retries);
        REQUIRE_FALSE(stored->next_retry_at.has_value());
        REQUIRE(stored->recipients[0].status == RecipientStatus::Failed);

        auto logs = fixture.store.delivery_logs(id);
        REQUIRE(logs.size() == 6);
        REQUIRE(logs.back().attempt_number == 3);
        REQUIRE(fixture.store.fetch_due(10, third + std::chrono::hours(24)).empty());
    }
}

TEST_CASE("Retry delay grows exponentially up to the cap", "[smtp][delivery]") {
    testing::MailFixture fixture;
    FakeResolver resolver;
    FakeTransport transport;
    DeliveryEngine engine(outbound_config(), fixture.store, resolver, transport);

    REQUIRE(engine.retry_delay(1) == std::chrono::seconds(60));
    REQUIRE(engine.retry_delay(2) == std::chrono::seconds(120));
    REQUIRE(engine.retry_delay(3) == std::chrono::seconds(240));
    REQUIRE(engine.retry_delay(6) == std::chrono::seconds(1920));
    REQUIRE(engine.retry_delay(7) == std::chrono::seconds(3600));
    REQUIRE(engine.retry_delay(40) == std::chrono::seconds(3600));
}

TEST_CASE("Smarthost delivery uses one authenticated connection", "[smtp][delivery]") {
    testing::MailFixture fixture;
    int64_t user = fixture.add_user("sender@mail.test");
    int64_t id = queue_email(fixture, user, {outbound_recipient("a@one.example"),
                                             outbound_recipient("b@two.example", RecipientType::Cc)});

    OutboundConfig config = outbound_config();
    config.relay_host = "smtp.relay.example";
    config.relay_username = "relay-user";
    config.relay_password = "relay-pass";

    FakeResolver resolver;
    FakeTransport transport;
    transport.reachable = {"smtp.relay.example"};
    DeliveryEngine engine(config, fixture.store, resolver, transport);

    auto email = *fixture.store.find_outbound(id);
    engine.deliver(email, test_now());

    REQUIRE(transport.requests.size() == 1);
    const auto& request = transport.requests[0];
    REQUIRE(request.port == 587);
    REQUIRE(request.tls == TlsPolicy::Required);
    REQUIRE(request.username == "relay-user");
    REQUIRE(request.password == "relay-pass");
    REQUIRE(request.mail_from == "sender@mail.test");
    REQUIRE(request.recipients.size() == 2);

    REQUIRE(fixture.store.find_outbound(id)->status == OutboundStatus::Sent);
    auto logs = fixture.store.delivery_logs(id);
    REQUIRE(logs.size() == 2);
    REQUIRE(logs[0].mx_host == "smtp.relay.example");
}

TEST_CASE("Queue processing delivers due emails concurrently", "[smtp][delivery]") {
    testing::MailFixture fixture;
    int64_t user = fixture.add_user("sender@mail.test");
    int64_t first = queue_email(fixture, user, {outbound_recipient("a@good.example")});
    int64_t second = queue_email(fixture, user, {outbound_recipient("b@good.example")});
    int64_t third = queue_email(fixture, user, {outbound_recipient("c@down.example")});

    FakeResolver resolver;
    FakeTransport transport;
    transport.reachable = {"good.example"};
    RecordingDeliveryObserver observer;
    DeliveryEngine engine(outbound_config(), fixture.store, resolver, transport, &observer);

    TimePoint now = test_now();
    REQUIRE(engine.process_queue(now) == 3);

    REQUIRE(fixture.store.find_outbound(first)->status == OutboundStatus::Sent);
    REQUIRE(fixture.store.find_outbound(second)->status == OutboundStatus::Sent);
    REQUIRE(fixture.store.find_outbound(third)->status == OutboundStatus::Queued);
    REQUIRE(observer.statuses.size() == 3);

    // Nothing further is due until the retry time.
    REQUIRE(engine.process_queue(now) == 0);
}

TEST_CASE("Engine start is a no-op when outbound delivery is disabled", "[smtp][delivery]") {
    testing::MailFixture fixture;
    FakeResolver resolver;
    FakeTransport transport;
    OutboundConfig config = outbound_config();
    config.enabled = false;
    DeliveryEngine engine(config, fixture.store, resolver, transport);

    engine.start();
    REQUIRE_FALSE(engine.is_running());
    engine.stop();
}

TEST_CASE("Interrupted deliveries return to the queue", "[smtp][delivery]") {
    testing::MailFixture fixture;
    int64_t user = fixture.add_user("sender@mail.test");
    int64_t id = queue_email(fixture, user, {outbound_recipient("a@good.example")});

    auto email = fixture.store.find_outbound(id);
    email->status = OutboundStatus::Sending;
    REQUIRE(fixture.store.update(*email));
    REQUIRE(fixture.store.fetch_due(10, test_now()).empty());

    SECTION("A disabled engine leaves them alone") {
        FakeResolver resolver;
        FakeTransport transport;
        OutboundConfig config = outbound_config();
        config.enabled = false;
        DeliveryEngine engine(config, fixture.store, resolver, transport);
        engine.start();
        REQUIRE(fixture.store.find_outbound(id)->status == OutboundStatus::Sending);
    }

    SECTION("Requeued emails are due again") {
        REQUIRE(fixture.store.requeue_interrupted() == 1);
        REQUIRE(fixture.store.requeue_interrupted() == 0);
        REQUIRE(fixture.store.find_outbound(id)->status == OutboundStatus::Queued);

        auto due = fixture.store.fetch_due(10, test_now());
        REQUIRE(due.size() == 1);
        REQUIRE(due[0].id == id);
    }
}

namespace {

// MX response for example.com: mx2 at preference 20, then mx1 at 10.
std::vector<unsigned char> mx_answer() {
    std::vector<unsigned char> packet = {
        0x12, 0x34, 0x81, 0x80, 0x00, 0x01, 0x00, 0x02, 0x00, 0x00, 0x00, 0x00,
        7, 'e', 'x', 'a', 'm', 'p', 'l', 'e', 3, 'c', 'o', 'm', 0,
        0x00, 0x0f, 0x00, 0x01,
    };
    auto add_mx = [&packet](unsigned char preference, char label) {
        const unsigned char record[] = {
            0xc0, 0x0c, 0x00, 0x0f, 0x00, 0x01, 0x00, 0x00, 0x01, 0x2c, 0x00, 0x08,
            0x00, preference, 3, 'm', 'x', static_cast<unsigned char>(label), 0xc0, 0x0c,
        };
        packet.insert(packet.end(), std::begin(record), std::end(record));
    };
    add_mx(20, '2');
    add_mx(10, '1');
    return packet;
}

}  // namespace

TEST_CASE("MX answers are parsed within the buffer", "[smtp][mx]") {
    auto packet = mx_answer();

    SECTION("Records come back by preference") {
        auto records = DnsMxResolver::parse_answer(packet.data(), packet.size(), static_cast<int>(packet.size()));
        REQUIRE(records.size() == 2);
        REQUIRE(records[0].hostname == "mx1.example.com");
        REQUIRE(records[0].priority == 10);
        REQUIRE(records[1].hostname == "mx2.example.com");
    }

    SECTION("A reported length beyond the buffer is clamped") {
        auto records = DnsMxResolver::parse_answer(packet.data(), packet.size(), 65535);
        REQUIRE(records.size() == 2);
    }

    SECTION("A cut-off answer yields no records") {
        std::vector<unsigned char> cut(packet.begin(), packet.end() - 4);
        REQUIRE(DnsMxResolver::parse_answer(cut.data(), cut.size(), static_cast<int>(packet.size())).empty());
    }

    SECTION("Resolver errors yield no records") {
        REQUIRE(DnsMxResolver::parse_answer(packet.data(), packet.size(), -1).empty());
    }
}
