#include "imap_fetch.hpp"
#include "mime/message_parser.hpp"
#include "encoding.hpp"

#include <algorithm>
#include <format>

namespace mailcore::imap {

namespace {

constexpr int MAX_STRUCTURE_DEPTH = 10;

std::string address_list(const std::vector<mime::Header>& headers, std::string_view name) {
    auto value = mime::find_header(headers, name);
    if (!value) return "NIL";

    auto addresses = mime::parse_address_list(*value);
    if (addresses.empty()) return "NIL";

    std::string result = "(";
    for (const auto& address : addresses) {
        auto at = address.address.rfind('@');
        std::string mailbox = at == std::string::npos ? address.address : address.address.substr(0, at);
        std::string host = at == std::string::npos ? "" : address.address.substr(at + 1);
        result += std::format("({} NIL {} {})", IMAPParser::nstring(address.display_name),
                              IMAPParser::nstring(mailbox), IMAPParser::nstring(host));
    }
    result += ")";
    return result;
}

std::string header_nstring(const std::vector<mime::Header>& headers, std::string_view name) {
    return IMAPParser::nstring(mime::find_header(headers, name).value_or(""));
}

size_t count_lines(std::string_view body) {
    return static_cast<size_t>(std::count(body.begin(), body.end(), '\n'));
}

std::string part_structure(const std::vector<mime::Header>& headers, std::string_view body, int depth) {
    auto content_type = mime::parse_content_type(mime::find_header(headers, "Content-Type").value_or("text/plain"));
    auto slash = content_type.type.find('/');
    std::string type = to_upper(content_type.type.substr(0, slash));
    std::string subtype = slash == std::string::npos ? "PLAIN" : to_upper(content_type.type.substr(slash + 1));

    std::string boundary = content_type.param("boundary");
    if (type == "MULTIPART" && !boundary.empty() && depth < MAX_STRUCTURE_DEPTH) {
        std::string result = "(";
        for (const auto& part : mime::split_multipart(body, boundary)) {
            auto sections = mime::split_message(part);
            result += part_structure(mime::parse_headers(sections.header), sections.body, depth + 1);
        }
        result += " " + IMAPParser::quote_string(subtype) + ")";
        return result;
    }

    std::string params = "NIL";
    if (!content_type.params.empty()) {
        params = "(";
        bool first = true;
        for (const auto& [key, value] : content_type.params) {
            if (!first) params += ' ';
            params += IMAPParser::quote_string(to_upper(key)) + " " + IMAPParser::quote_string(value);
            first = false;
        }
        params += ")";
    } else if (type == "TEXT") {
        params = "(\"CHARSET\" \"US-ASCII\")";
    }

    std::string encoding = to_upper(trim(mime::find_header(headers, "Content-Transfer-Encoding").value_or("7BIT")));

    std::string result = std::format("({} {} {} {} {} {} {}",
                                     IMAPParser::quote_string(type), IMAPParser::quote_string(subtype),
                                     params, header_nstring(headers, "Content-ID"),
                                     header_nstring(headers, "Content-Description"),
                                     IMAPParser::quote_string(encoding), body.size());
    if (type == "TEXT") {
        result += std::format(" {}", count_lines(body));
    }
    result += ")";
    return result;
}

std::string filter_headers(std::string_view header_block, const std::vector<std::string>& fields, bool exclude) {
    std::string result;

    size_t pos = 0;
    bool keep = false;
    while (pos < header_block.size()) {
        size_t eol = header_block.find('\n', pos);
        size_t next = eol == std::string_view::npos ? header_block.size() : eol + 1;
        std::string_view line = header_block.substr(pos, next - pos);
        pos = next;

        if (line == "\r\n" || line == "\n") break;

        if (line.front() != ' ' && line.front() != '\t') {
            auto colon = line.find(':');
            std::string name = to_upper(trim(line.substr(0, colon)));
            bool listed = std::find(fields.begin(), fields.end(), name) != fields.end();
            keep = exclude ? !listed : listed;
        }
        if (keep) {
            result.append(line);
        }
    }

    result += "\r\n";
    return result;
}

}  // namespace

std::string envelope(std::string_view raw) {
    auto sections = mime::split_message(raw);
    auto headers = mime::parse_headers(sections.header);

    std::string from = address_list(headers, "From");
    std::string sender = address_list(headers, "Sender");
    std::string reply_to = address_list(headers, "Reply-To");

    return std::format("({} {} {} {} {} {} {} {} {} {})",
                       header_nstring(headers, "Date"),
                       header_nstring(headers, "Subject"),
                       from,
                       sender == "NIL" ? from : sender,
                       reply_to == "NIL" ? from : reply_to,
                       address_list(headers, "To"),
                       address_list(headers, "Cc"),
                       address_list(headers, "Bcc"),
                       header_nstring(headers, "In-Reply-To"),
                       header_nstring(headers, "Message-ID"));
}

std::string body_structure(std::string_view raw) {
    auto sections = mime::split_message(raw);
    return part_structure(mime::parse_headers(sections.header), sections.body, 0);
}

std::string section_content(std::string_view raw, const FetchItem& item) {
    std::string content;

    switch (item.type) {
        case FetchItem::Type::RFC822:
            return std::string(raw);
        case FetchItem::Type::RFC822_HEADER:
            return mime::split_message(raw).header;
        case FetchItem::Type::RFC822_TEXT:
            return mime::split_message(raw).body;
        default:
            break;
    }

    switch (item.section) {
        case FetchItem::Section::Full:
            content = raw;
            break;
        case FetchItem::Section::Header:
            content = mime::split_message(raw).header;
            break;
        case FetchItem::Section::Text:
            content = mime::split_message(raw).body;
            break;
        case FetchItem::Section::HeaderFields:
        case FetchItem::Section::HeaderFieldsNot:
            content = filter_headers(mime::split_message(raw).header, item.header_fields,
                                     item.section == FetchItem::Section::HeaderFieldsNot);
            break;
    }

    if (item.partial) {
        auto [start, count] = *item.partial;
        if (start >= content.size()) return "";
        return content.substr(start, count);
    }
    return content;
}

}  // namespace mailcore::imap
