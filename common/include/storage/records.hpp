#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>

#include "auth/scope.hpp"

namespace mailcore {

using TimePoint = std::chrono::system_clock::time_point;

struct User {
    int64_t id = 0;
    std::string address;
    std::string display_name;
    bool active = true;
};

// API key. The raw key is shown once at creation; only its hash is kept.
struct Credential {
    int64_t id = 0;
    int64_t user_id = 0;
    std::string name;
    std::string key_prefix;
    std::string key_hash;
    ScopeSet scopes;
    TimePoint created_at{};
    std::optional<TimePoint> last_used_at;
    std::optional<TimePoint> revoked_at;

    bool is_active() const { return !revoked_at.has_value(); }
};

struct UserWithCredentials {
    User user;
    std::vector<Credential> credentials;  // active only
};

// Per-user mailbox flag bits, persisted with the recipient row.
namespace message_flags {
constexpr uint8_t SEEN = 1 << 0;
constexpr uint8_t ANSWERED = 1 << 1;
constexpr uint8_t FLAGGED = 1 << 2;
constexpr uint8_t DELETED = 1 << 3;
constexpr uint8_t DRAFT = 1 << 4;
constexpr uint8_t RECENT = 1 << 5;
}  // namespace message_flags

// One message as seen from a user's mailbox.
struct MessageSummary {
    int64_t email_id = 0;
    uint32_t uid = 0;
    uint64_t size = 0;
    uint8_t flags = 0;
    TimePoint received_at{};
    std::string message_id;
};

enum class RecipientType {
    To,
    Cc,
    Bcc
};

const char* recipient_type_name(RecipientType type);
std::optional<RecipientType> parse_recipient_type(std::string_view name);

struct EmailRecipient {
    int64_t id = 0;
    std::string address;
    std::string display_name;
    RecipientType type = RecipientType::To;
    std::optional<int64_t> user_id;
};

struct EmailAttachment {
    int64_t id = 0;
    std::string file_name;
    std::string content_type;
    std::string content;
};

struct InboundEmail {
    int64_t id = 0;
    std::string message_id;
    std::string from_address;
    std::string from_display_name;
    std::string subject;
    std::string text_body;
    std::string html_body;
    std::string raw_content;
    TimePoint received_at{};
    uint64_t size_bytes = 0;
    std::string in_reply_to;
    std::string references;
    std::optional<int64_t> thread_id;
    std::optional<int64_t> sent_by_user_id;
    std::vector<EmailRecipient> recipients;
    std::vector<EmailAttachment> attachments;
};

enum class OutboundStatus {
    Queued,
    Sending,
    Sent,
    PartialFailure,
    Failed
};

enum class RecipientStatus {
    Pending,
    Sent,
    Failed,
    Deferred
};

const char* outbound_status_name(OutboundStatus status);
const char* recipient_status_name(RecipientStatus status);

struct OutboundRecipient {
    int64_t id = 0;
    std::string address;
    std::string display_name;
    RecipientType type = RecipientType::To;
    RecipientStatus status = RecipientStatus::Pending;
    std::string status_message;
    std::optional<TimePoint> delivered_at;
};

struct OutboundAttachment {
    std::string file_name;
    std::string content_type;
    std::string content;
};

struct OutboundEmail {
    int64_t id = 0;
    int64_t user_id = 0;
    std::string from_address;
    std::string from_display_name;
    std::string subject;
    std::string text_body;
    std::string html_body;
    std::string message_id;
    std::string in_reply_to;
    std::string references;
    OutboundStatus status = OutboundStatus::Queued;
    TimePoint created_at{};
    std::optional<TimePoint> queued_at;
    std::optional<TimePoint> sent_at;
    int retry_count = 0;
    std::optional<TimePoint> next_retry_at;
    std::string last_error;
    std::vector<OutboundRecipient> recipients;
    std::vector<OutboundAttachment> attachments;
};

// One row per attempt per recipient per host. Never updated.
struct DeliveryLog {
    int64_t id = 0;
    int64_t outbound_email_id = 0;
    int64_t recipient_id = 0;
    std::string recipient_address;
    std::string mx_host;
    int smtp_status_code = 0;
    std::string smtp_response;
    bool success = false;
    std::string error_message;
    int attempt_number = 1;
    TimePoint attempted_at{};
    std::chrono::milliseconds duration{0};
};

}  // namespace mailcore
