#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cstdint>

#include "config.hpp"
#include "storage/stores.hpp"
#include "mime/message_parser.hpp"

namespace mailcore::smtp {

namespace reply {
constexpr int OK = 250;
constexpr int TRANSACTION_FAILED = 451;
constexpr int SIZE_EXCEEDED = 552;
}  // namespace reply

// Envelope of an accepted SMTP transaction.
struct Envelope {
    std::string mail_from;
    std::vector<std::string> recipients;
    std::optional<int64_t> authenticated_user_id;
};

struct IngestResult {
    int code = reply::OK;
    std::string message;
    std::optional<int64_t> email_id;

    bool ok() const { return code == reply::OK; }
};

// Turns the DATA buffer of an accepted transaction into a stored, threaded
// inbound email with its recipients linked to local users.
class MessageIngestion {
public:
    MessageIngestion(const SMTPConfig& config, MessageStore& messages, UserStore& users,
                     std::string local_domain);

    void set_observer(NewMailObserver* observer) { observer_ = observer; }

    IngestResult ingest(std::string_view raw, const Envelope& envelope);

    // Parent by In-Reply-To, else the newest References entry that resolves.
    // The thread is the parent's thread, or the parent itself.
    std::optional<int64_t> resolve_thread(const std::string& in_reply_to,
                                          const std::vector<std::string>& references);

private:
    InboundEmail build_email(std::string_view raw, const mime::ParsedMessage& parsed,
                             const Envelope& envelope);
    void add_recipients(InboundEmail& email, const std::vector<mime::Address>& addresses,
                        RecipientType type);
    void add_envelope_recipients(InboundEmail& email, const std::vector<std::string>& recipients);
    void notify(const InboundEmail& email);
    std::string generate_message_id() const;

    SMTPConfig config_;
    MessageStore& messages_;
    UserStore& users_;
    std::string local_domain_;
    NewMailObserver* observer_ = nullptr;
};

}  // namespace mailcore::smtp
