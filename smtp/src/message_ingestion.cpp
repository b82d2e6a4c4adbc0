#include "message_ingestion.hpp"
#include "auth/secret_hasher.hpp"
#include "encoding.hpp"
#include "logger.hpp"

#include <algorithm>
#include <chrono>
#include <set>

namespace mailcore::smtp {

MessageIngestion::MessageIngestion(const SMTPConfig& config, MessageStore& messages, UserStore& users,
                                   std::string local_domain)
    : config_(config)
    , messages_(messages)
    , users_(users)
    , local_domain_(std::move(local_domain)) {
}

IngestResult MessageIngestion::ingest(std::string_view raw, const Envelope& envelope) {
    IngestResult result;

    if (raw.size() > config_.max_message_size) {
        LOG_WARNING_FMT("Message rejected: size {} bytes exceeds limit {} bytes",
                        raw.size(), config_.max_message_size);
        result.code = reply::SIZE_EXCEEDED;
        result.message = "Message too large";
        return result;
    }

    try {
        auto parsed = mime::parse_message(raw);

        for (const auto& attachment : parsed.attachments) {
            if (attachment.content.size() > config_.max_attachment_size) {
                LOG_WARNING_FMT("Attachment '{}' rejected: size {} bytes exceeds limit {} bytes",
                                attachment.file_name, attachment.content.size(), config_.max_attachment_size);
                result.code = reply::SIZE_EXCEEDED;
                result.message = "Attachment '" + attachment.file_name + "' too large";
                return result;
            }
        }

        InboundEmail email = build_email(raw, parsed, envelope);
        if (!messages_.save_email(email)) {
            LOG_ERROR_FMT("Failed to save email {} from {}", email.message_id, email.from_address);
            result.code = reply::TRANSACTION_FAILED;
            result.message = "Transaction failed";
            return result;
        }

        std::string addresses;
        for (const auto& recipient : email.recipients) {
            if (!addresses.empty()) addresses += ", ";
            addresses += recipient.address;
        }
        LOG_INFO_FMT("Email saved: {} from {} to {}", email.message_id, email.from_address, addresses);

        notify(email);

        result.message = "Ok";
        result.email_id = email.id;
    } catch (const std::exception& e) {
        LOG_ERROR_FMT("Failed to ingest message from {}: {}", envelope.mail_from, e.what());
        result.code = reply::TRANSACTION_FAILED;
        result.message = "Transaction failed";
    }

    return result;
}

InboundEmail MessageIngestion::build_email(std::string_view raw, const mime::ParsedMessage& parsed,
                                           const Envelope& envelope) {
    InboundEmail email;

    auto message_ids = mime::parse_message_ids(parsed.header("Message-ID").value_or(""));
    email.message_id = message_ids.empty() ? generate_message_id() : message_ids.front();

    auto from = mime::parse_address_list(parsed.header("From").value_or(""));
    if (!from.empty()) {
        email.from_address = from.front().address;
        email.from_display_name = from.front().display_name;
    }

    std::string subject = trim(mime::decode_encoded_words(parsed.header("Subject").value_or("")));
    email.subject = subject.empty() ? "(No Subject)" : subject;

    email.text_body = parsed.text_body;
    email.html_body = parsed.html_body;
    email.raw_content = std::string(raw);
    email.received_at = std::chrono::system_clock::now();
    email.size_bytes = raw.size();
    email.sent_by_user_id = envelope.authenticated_user_id;

    auto in_reply_to = mime::parse_message_ids(parsed.header("In-Reply-To").value_or(""));
    if (!in_reply_to.empty()) {
        email.in_reply_to = in_reply_to.front();
    }

    auto references = mime::parse_message_ids(parsed.header("References").value_or(""));
    for (const auto& reference : references) {
        if (!email.references.empty()) email.references += ' ';
        email.references += reference;
    }

    email.thread_id = resolve_thread(email.in_reply_to, references);

    add_recipients(email, mime::parse_address_list(parsed.header("To").value_or("")), RecipientType::To);
    add_recipients(email, mime::parse_address_list(parsed.header("Cc").value_or("")), RecipientType::Cc);
    add_recipients(email, mime::parse_address_list(parsed.header("Bcc").value_or("")), RecipientType::Bcc);
    add_envelope_recipients(email, envelope.recipients);

    for (const auto& attachment : parsed.attachments) {
        EmailAttachment stored;
        stored.file_name = attachment.file_name;
        stored.content_type = attachment.content_type;
        stored.content = attachment.content;
        email.attachments.push_back(std::move(stored));
    }

    return email;
}

std::optional<int64_t> MessageIngestion::resolve_thread(const std::string& in_reply_to,
                                                        const std::vector<std::string>& references) {
    std::optional<InboundEmail> parent;
    if (!in_reply_to.empty()) {
        parent = messages_.find_by_message_id(in_reply_to);
    }

    for (auto it = references.rbegin(); !parent && it != references.rend(); ++it) {
        if (*it != in_reply_to) {
            parent = messages_.find_by_message_id(*it);
        }
    }

    if (!parent) return std::nullopt;
    return parent->thread_id ? parent->thread_id : std::optional<int64_t>(parent->id);
}

void MessageIngestion::add_recipients(InboundEmail& email, const std::vector<mime::Address>& addresses,
                                      RecipientType type) {
    for (const auto& address : addresses) {
        EmailRecipient recipient;
        recipient.address = address.address;
        recipient.display_name = address.display_name;
        recipient.type = type;
        if (auto user = users_.find_user_by_address(to_lower(address.address))) {
            recipient.user_id = user->id;
        }
        email.recipients.push_back(std::move(recipient));
    }
}

void MessageIngestion::add_envelope_recipients(InboundEmail& email, const std::vector<std::string>& recipients) {
    std::vector<mime::Address> hidden;
    for (const auto& address : recipients) {
        bool listed = std::any_of(email.recipients.begin(), email.recipients.end(),
                                  [&](const EmailRecipient& r) { return iequals(r.address, address); });
        bool repeated = std::any_of(hidden.begin(), hidden.end(),
                                    [&](const mime::Address& a) { return iequals(a.address, address); });
        if (!listed && !repeated) {
            hidden.push_back(mime::Address{"", address});
        }
    }
    add_recipients(email, hidden, RecipientType::Bcc);
}

void MessageIngestion::notify(const InboundEmail& email) {
    if (!observer_) return;

    std::set<int64_t> notified;
    for (const auto& recipient : email.recipients) {
        if (!recipient.user_id || !notified.insert(*recipient.user_id).second) continue;
        try {
            observer_->on_new_mail(*recipient.user_id, email);
        } catch (const std::exception& e) {
            LOG_WARNING_FMT("New mail notification for user {} failed: {}", *recipient.user_id, e.what());
        }
    }
}

std::string MessageIngestion::generate_message_id() const {
    return "<" + hex_encode(crypto::random_bytes(16)) + "@" + local_domain_ + ">";
}

}  // namespace mailcore::smtp
