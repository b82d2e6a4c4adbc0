#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

#include "ssl_context.hpp"

namespace mailcore::smtp {

struct SmtpReply {
    int code = 0;
    std::vector<std::string> lines;  // text after the code, one entry per line

    bool positive() const { return code >= 200 && code < 400; }
    std::string text() const;
    // "250 first line" for logs and delivery records.
    std::string summary() const;
};

enum class TlsPolicy {
    None,
    Opportunistic,  // STARTTLS when the server offers it
    Required
};

struct TransferRequest {
    std::string host;
    uint16_t port = 25;
    std::string helo_name = "localhost";
    std::string mail_from;
    std::vector<std::string> recipients;
    std::string content;  // complete RFC 5322 message
    TlsPolicy tls = TlsPolicy::Opportunistic;
    std::string username;  // AUTH PLAIN when set
    std::string password;
};

struct RecipientReply {
    std::string address;
    bool accepted = false;
    SmtpReply reply;
};

struct TransferResult {
    // True once the server accepted the message data for the accepted recipients.
    bool delivered = false;
    SmtpReply reply;   // last reply received
    std::string error; // why the transaction failed, empty on delivery
    std::vector<RecipientReply> recipients;  // request order

    bool recipient_delivered(size_t index) const {
        return delivered && index < recipients.size() && recipients[index].accepted;
    }
};

// One SMTP client transaction per call.
class SmtpTransport {
public:
    virtual ~SmtpTransport() = default;
    virtual TransferResult send(const TransferRequest& request) = 0;
};

// Boost.Asio client. Each network step is bounded by the timeout.
class SmtpClient : public SmtpTransport {
public:
    explicit SmtpClient(std::chrono::seconds timeout, SSLContext* tls_context = nullptr);

    TransferResult send(const TransferRequest& request) override;

private:
    std::chrono::seconds timeout_;
    SSLContext* tls_context_;
};

}  // namespace mailcore::smtp
