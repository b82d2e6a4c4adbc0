#include "message_builder.hpp"
#include "auth/secret_hasher.hpp"
#include "encoding.hpp"

#include <algorithm>
#include <chrono>
#include <format>

namespace mailcore::smtp {

namespace {

constexpr const char* WEEKDAYS[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
constexpr const char* MONTHS[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                  "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

// Bytes of UTF-8 per encoded word, keeps each word under 75 characters.
constexpr size_t ENCODED_WORD_BYTES = 45;
constexpr size_t MAX_LINE_LENGTH = 998;

bool is_plain_ascii(std::string_view text) {
    return std::all_of(text.begin(), text.end(), [](char c) {
        auto byte = static_cast<unsigned char>(c);
        return byte >= 0x20 && byte < 0x7f;
    });
}

bool fits_seven_bit(std::string_view text) {
    size_t line_length = 0;
    for (char c : text) {
        if (static_cast<unsigned char>(c) >= 0x80 || c == '\0') return false;
        if (c == '\n') {
            line_length = 0;
        } else if (++line_length > MAX_LINE_LENGTH) {
            return false;
        }
    }
    return true;
}

std::string normalize_crlf(std::string_view text) {
    std::string result;
    result.reserve(text.size() + text.size() / 40);
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\n' && (i == 0 || text[i - 1] != '\r')) {
            result += '\r';
        }
        result += text[i];
    }
    if (result.size() < 2 || result.compare(result.size() - 2, 2, "\r\n") != 0) {
        result += "\r\n";
    }
    return result;
}

bool needs_quoting(std::string_view name) {
    return name.find_first_of("()<>[]:;@\\,.\"") != std::string_view::npos;
}

std::string quote(std::string_view text) {
    std::string result = "\"";
    for (char c : text) {
        if (c == '"' || c == '\\') result += '\\';
        result += c;
    }
    result += '"';
    return result;
}

std::string parameter_value(std::string_view file_name) {
    std::string cleaned;
    for (char c : file_name) {
        if (c != '"' && c != '\\' && c != '\r' && c != '\n') cleaned += c;
    }
    return "\"" + encode_header_text(cleaned) + "\"";
}

std::string address_header(const OutboundEmail& email, RecipientType type) {
    std::string value;
    for (const auto& recipient : email.recipients) {
        if (recipient.type != type) continue;
        if (!value.empty()) value += ",\r\n ";
        value += format_address(recipient.display_name, recipient.address);
    }
    return value;
}

}  // namespace

std::string encode_header_text(std::string_view text) {
    if (is_plain_ascii(text)) {
        return std::string(text);
    }

    std::string result;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t end = std::min(pos + ENCODED_WORD_BYTES, text.size());
        // Never split a multi-byte sequence.
        while (end < text.size() && end > pos + 1 &&
               (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) {
            --end;
        }
        if (!result.empty()) result += "\r\n ";
        result += "=?UTF-8?B?" + base64_encode(text.substr(pos, end - pos)) + "?=";
        pos = end;
    }
    return result;
}

std::string format_address(const std::string& display_name, const std::string& address) {
    if (display_name.empty()) {
        return address;
    }
    if (!is_plain_ascii(display_name)) {
        return encode_header_text(display_name) + " <" + address + ">";
    }
    if (needs_quoting(display_name)) {
        return quote(display_name) + " <" + address + ">";
    }
    return display_name + " <" + address + ">";
}

std::string format_date(TimePoint when) {
    auto days = std::chrono::floor<std::chrono::days>(when);
    std::chrono::year_month_day ymd{days};
    std::chrono::weekday weekday{days};
    std::chrono::hh_mm_ss time{std::chrono::floor<std::chrono::seconds>(when - days)};

    return std::format("{}, {:02} {} {:04} {:02}:{:02}:{:02} +0000",
                       WEEKDAYS[weekday.c_encoding()],
                       static_cast<unsigned>(ymd.day()),
                       MONTHS[static_cast<unsigned>(ymd.month()) - 1],
                       static_cast<int>(ymd.year()),
                       time.hours().count(), time.minutes().count(), time.seconds().count());
}

MessageBuilder::MessageBuilder(std::string sender_domain)
    : sender_domain_(std::move(sender_domain)) {
}

std::string MessageBuilder::generate_message_id() const {
    return "<" + hex_encode(crypto::random_bytes(16)) + "@" + sender_domain_ + ">";
}

std::string MessageBuilder::build(OutboundEmail& email) const {
    if (email.message_id.empty()) {
        email.message_id = generate_message_id();
    }

    std::string message;
    message += "Message-ID: " + email.message_id + "\r\n";
    message += "Date: " + format_date(email.queued_at.value_or(std::chrono::system_clock::now())) + "\r\n";
    message += "From: " + format_address(email.from_display_name, email.from_address) + "\r\n";

    std::string to = address_header(email, RecipientType::To);
    if (!to.empty()) message += "To: " + to + "\r\n";
    std::string cc = address_header(email, RecipientType::Cc);
    if (!cc.empty()) message += "Cc: " + cc + "\r\n";

    message += "Subject: " + encode_header_text(email.subject) + "\r\n";
    if (!email.in_reply_to.empty()) {
        message += "In-Reply-To: " + email.in_reply_to + "\r\n";
    }
    if (!email.references.empty()) {
        std::string references;
        for (const auto& reference : split(email.references, ' ')) {
            if (!references.empty()) references += "\r\n ";
            references += reference;
        }
        message += "References: " + references + "\r\n";
    }
    message += "MIME-Version: 1.0\r\n";
    message += render_body(email);
    return message;
}

std::string MessageBuilder::render_text_part(const std::string& content_type, const std::string& text) const {
    if (fits_seven_bit(text)) {
        return "Content-Type: " + content_type + "; charset=utf-8\r\n"
               "Content-Transfer-Encoding: 7bit\r\n\r\n" + normalize_crlf(text);
    }
    return "Content-Type: " + content_type + "; charset=utf-8\r\n"
           "Content-Transfer-Encoding: base64\r\n\r\n" + base64_encode_lines(text);
}

std::string MessageBuilder::render_body(const OutboundEmail& email) const {
    std::string content;
    if (!email.text_body.empty() && !email.html_body.empty()) {
        std::string boundary = new_boundary();
        content = "Content-Type: multipart/alternative; boundary=\"" + boundary + "\"\r\n\r\n"
                  "--" + boundary + "\r\n" + render_text_part("text/plain", email.text_body) +
                  "--" + boundary + "\r\n" + render_text_part("text/html", email.html_body) +
                  "--" + boundary + "--\r\n";
    } else if (!email.html_body.empty()) {
        content = render_text_part("text/html", email.html_body);
    } else {
        content = render_text_part("text/plain", email.text_body);
    }

    if (email.attachments.empty()) {
        return content;
    }

    std::string boundary = new_boundary();
    std::string mixed = "Content-Type: multipart/mixed; boundary=\"" + boundary + "\"\r\n\r\n"
                        "--" + boundary + "\r\n" + content;
    for (const auto& attachment : email.attachments) {
        std::string type = attachment.content_type.empty() ? "application/octet-stream"
                                                            : attachment.content_type;
        mixed += "--" + boundary + "\r\n";
        mixed += "Content-Type: " + type + "; name=" + parameter_value(attachment.file_name) + "\r\n";
        mixed += "Content-Disposition: attachment; filename=" + parameter_value(attachment.file_name) + "\r\n";
        mixed += "Content-Transfer-Encoding: base64\r\n\r\n";
        mixed += base64_encode_lines(attachment.content);
    }
    mixed += "--" + boundary + "--\r\n";
    return mixed;
}

std::string MessageBuilder::new_boundary() const {
    return "=_mailcore_" + hex_encode(crypto::random_bytes(12));
}

}  // namespace mailcore::smtp
