#pragma once

#include <string>
#include <string_view>

#include "storage/records.hpp"

namespace mailcore::smtp {

// RFC 2047 B encoded word when the text is not plain ASCII.
std::string encode_header_text(std::string_view text);

// "Name <local@domain>", or the bare address without a display name.
std::string format_address(const std::string& display_name, const std::string& address);

// RFC 5322 date in UTC, e.g. "Sat, 17 Oct 2026 09:05:00 +0000".
std::string format_date(TimePoint when);

// Renders an outbound email as RFC 5322 text with CRLF line endings.
// Bcc recipients never appear in the headers.
class MessageBuilder {
public:
    explicit MessageBuilder(std::string sender_domain);

    // Assigns email.message_id when it is empty.
    std::string build(OutboundEmail& email) const;

    std::string generate_message_id() const;

private:
    std::string render_body(const OutboundEmail& email) const;
    std::string render_text_part(const std::string& content_type, const std::string& text) const;
    std::string new_boundary() const;

    std::string sender_domain_;
};

}  // namespace mailcore::smtp
