#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <optional>

namespace mailcore::mime {

struct Header {
    std::string name;
    std::string value;
};

struct Address {
    std::string display_name;
    std::string address;
};

struct ContentType {
    std::string type = "text/plain";  // lower case
    std::map<std::string, std::string> params;  // lower-case keys

    std::string param(const std::string& name) const;
};

struct Attachment {
    std::string file_name;
    std::string content_type;
    std::string content;  // decoded
};

struct ParsedMessage {
    std::vector<Header> headers;
    std::string text_body;
    std::string html_body;
    std::vector<Attachment> attachments;

    std::optional<std::string> header(std::string_view name) const;
};

// Header section including the terminating blank line, and the body after it.
struct MessageSections {
    std::string header;
    std::string body;
};

MessageSections split_message(std::string_view raw);

// Unfolds continuation lines. Header names keep their original case.
std::vector<Header> parse_headers(std::string_view header_block);
std::optional<std::string> find_header(const std::vector<Header>& headers, std::string_view name);

ContentType parse_content_type(std::string_view value);
std::vector<Address> parse_address_list(std::string_view value);

// Lower-case domain of "local@domain" or "<local@domain>"; empty without '@'.
std::string address_domain(std::string_view address);

// "<a@x> <b@y>" -> {"<a@x>", "<b@y>"}
std::vector<std::string> parse_message_ids(std::string_view value);

// Body parts between "--boundary" delimiters, each with its own headers.
std::vector<std::string> split_multipart(std::string_view body, const std::string& boundary);

std::string decode_quoted_printable(std::string_view input);

// RFC 2047 encoded words (B and Q). Charsets are passed through untranslated.
std::string decode_encoded_words(std::string_view input);

ParsedMessage parse_message(std::string_view raw);

}  // namespace mailcore::mime
