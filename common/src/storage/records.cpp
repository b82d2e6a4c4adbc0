#include "storage/records.hpp"
#include "encoding.hpp"

namespace mailcore {

const char* recipient_type_name(RecipientType type) {
    switch (type) {
        case RecipientType::To:  return "to";
        case RecipientType::Cc:  return "cc";
        case RecipientType::Bcc: return "bcc";
    }
    return "to";
}

std::optional<RecipientType> parse_recipient_type(std::string_view name) {
    std::string lower = to_lower(name);
    if (lower == "to") return RecipientType::To;
    if (lower == "cc") return RecipientType::Cc;
    if (lower == "bcc") return RecipientType::Bcc;
    return std::nullopt;
}

const char* outbound_status_name(OutboundStatus status) {
    switch (status) {
        case OutboundStatus::Queued:         return "Queued";
        case OutboundStatus::Sending:        return "Sending";
        case OutboundStatus::Sent:           return "Sent";
        case OutboundStatus::PartialFailure: return "PartialFailure";
        case OutboundStatus::Failed:         return "Failed";
    }
    return "Unknown";
}

const char* recipient_status_name(RecipientStatus status) {
    switch (status) {
        case RecipientStatus::Pending:  return "Pending";
        case RecipientStatus::Sent:     return "Sent";
        case RecipientStatus::Failed:   return "Failed";
        case RecipientStatus::Deferred: return "Deferred";
    }
    return "Unknown";
}

}  // namespace mailcore
