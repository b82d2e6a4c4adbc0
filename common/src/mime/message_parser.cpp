#include "mime/message_parser.hpp"
#include "encoding.hpp"

#include <cctype>

namespace mailcore::mime {

namespace {

constexpr int MAX_MULTIPART_DEPTH = 10;

std::string strip_quotes(std::string_view s) {
    std::string value = trim(s);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        std::string unquoted;
        for (size_t i = 1; i + 1 < value.size(); ++i) {
            if (value[i] == '\\' && i + 2 < value.size()) {
                ++i;
            }
            unquoted.push_back(value[i]);
        }
        return unquoted;
    }
    return value;
}

// Splits on a separator that is outside quotes, angle brackets and comments.
std::vector<std::string> split_top_level(std::string_view s, char separator) {
    std::vector<std::string> parts;
    std::string current;
    bool in_quotes = false;
    int angle = 0;
    int comment = 0;

    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (in_quotes) {
            current.push_back(c);
            if (c == '\\' && i + 1 < s.size()) {
                current.push_back(s[++i]);
            } else if (c == '"') {
                in_quotes = false;
            }
            continue;
        }
        if (c == '"') in_quotes = true;
        else if (c == '<') ++angle;
        else if (c == '>' && angle > 0) --angle;
        else if (c == '(') ++comment;
        else if (c == ')' && comment > 0) --comment;

        if (c == separator && angle == 0 && comment == 0) {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    parts.push_back(current);
    return parts;
}

std::string remove_comments(std::string_view s) {
    std::string result;
    int depth = 0;
    bool in_quotes = false;
    for (char c : s) {
        if (c == '"' && depth == 0) in_quotes = !in_quotes;
        if (!in_quotes) {
            if (c == '(') { ++depth; continue; }
            if (c == ')' && depth > 0) { --depth; continue; }
        }
        if (depth == 0) result.push_back(c);
    }
    return result;
}

std::string decode_body(std::string_view body, const std::vector<Header>& headers) {
    std::string encoding = to_lower(trim(find_header(headers, "Content-Transfer-Encoding").value_or("")));
    if (encoding == "base64") {
        if (auto decoded = base64_decode(body)) {
            return *decoded;
        }
        return std::string(body);
    }
    if (encoding == "quoted-printable") {
        return decode_quoted_printable(body);
    }
    return std::string(body);
}

std::string disposition_filename(const std::vector<Header>& headers, const ContentType& type) {
    if (auto disposition = find_header(headers, "Content-Disposition")) {
        auto parsed = parse_content_type(*disposition);
        auto name = parsed.param("filename");
        if (!name.empty()) return decode_encoded_words(name);
    }
    auto name = type.param("name");
    return name.empty() ? "" : decode_encoded_words(name);
}

bool is_attachment_disposition(const std::vector<Header>& headers) {
    auto disposition = find_header(headers, "Content-Disposition");
    return disposition && istarts_with(trim(*disposition), "attachment");
}

void parse_part(const std::vector<Header>& headers, std::string_view body,
                ParsedMessage& message, int depth) {
    ContentType type = parse_content_type(find_header(headers, "Content-Type").value_or("text/plain"));

    if (type.type.rfind("multipart/", 0) == 0) {
        std::string boundary = type.param("boundary");
        if (boundary.empty() || depth >= MAX_MULTIPART_DEPTH) {
            return;
        }
        for (const auto& part : split_multipart(body, boundary)) {
            auto sections = split_message(part);
            parse_part(parse_headers(sections.header), sections.body, message, depth + 1);
        }
        return;
    }

    std::string file_name = disposition_filename(headers, type);
    std::string content = decode_body(body, headers);

    bool attachment = is_attachment_disposition(headers) || !file_name.empty();
    if (!attachment && type.type == "text/plain" && message.text_body.empty()) {
        message.text_body = std::move(content);
    } else if (!attachment && type.type == "text/html" && message.html_body.empty()) {
        message.html_body = std::move(content);
    } else if (attachment || (type.type.rfind("text/", 0) != 0 && type.type != "message/rfc822")) {
        message.attachments.push_back(Attachment{
            file_name.empty() ? "attachment" : file_name, type.type, std::move(content)});
    }
}

}  // namespace

std::vector<std::string> split_multipart(std::string_view body, const std::string& boundary) {
    std::vector<std::string> parts;
    const std::string delimiter = "--" + boundary;
    std::string current;
    bool in_part = false;

    size_t pos = 0;
    while (pos < body.size()) {
        size_t eol = body.find('\n', pos);
        size_t next = eol == std::string_view::npos ? body.size() : eol + 1;
        std::string_view line = body.substr(pos, next - pos);

        std::string_view bare = line;
        while (!bare.empty() && (bare.back() == '\n' || bare.back() == '\r')) {
            bare.remove_suffix(1);
        }

        if (bare.substr(0, delimiter.size()) == delimiter) {
            std::string_view rest = bare.substr(delimiter.size());
            if (in_part) {
                // The line break before a delimiter belongs to the delimiter.
                if (!current.empty() && current.back() == '\n') current.pop_back();
                if (!current.empty() && current.back() == '\r') current.pop_back();
                parts.push_back(std::move(current));
                current.clear();
            }
            if (rest.substr(0, 2) == "--") {
                return parts;
            }
            in_part = true;
        } else if (in_part) {
            current.append(line);
        }
        pos = next;
    }

    if (in_part && !current.empty()) {
        parts.push_back(std::move(current));
    }
    return parts;
}

std::string ContentType::param(const std::string& name) const {
    auto it = params.find(name);
    return it == params.end() ? "" : it->second;
}

std::optional<std::string> ParsedMessage::header(std::string_view name) const {
    return find_header(headers, name);
}

MessageSections split_message(std::string_view raw) {
    MessageSections sections;

    if (raw.substr(0, 2) == "\r\n") {
        sections.header = "\r\n";
        sections.body = std::string(raw.substr(2));
        return sections;
    }
    if (raw.substr(0, 1) == "\n") {
        sections.header = "\n";
        sections.body = std::string(raw.substr(1));
        return sections;
    }

    size_t crlf = raw.find("\r\n\r\n");
    size_t lf = raw.find("\n\n");
    if (crlf != std::string_view::npos && (lf == std::string_view::npos || crlf < lf)) {
        sections.header = std::string(raw.substr(0, crlf + 4));
        sections.body = std::string(raw.substr(crlf + 4));
    } else if (lf != std::string_view::npos) {
        sections.header = std::string(raw.substr(0, lf + 2));
        sections.body = std::string(raw.substr(lf + 2));
    } else {
        sections.header = std::string(raw);
    }
    return sections;
}

std::vector<Header> parse_headers(std::string_view header_block) {
    std::vector<Header> headers;

    size_t pos = 0;
    while (pos < header_block.size()) {
        size_t eol = header_block.find('\n', pos);
        size_t next = eol == std::string_view::npos ? header_block.size() : eol + 1;
        std::string_view line = header_block.substr(pos, next - pos);
        pos = next;

        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
            line.remove_suffix(1);
        }
        if (line.empty()) break;

        if ((line.front() == ' ' || line.front() == '\t') && !headers.empty()) {
            headers.back().value += ' ';
            headers.back().value += trim(line);
            continue;
        }

        size_t colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) continue;

        headers.push_back(Header{trim(line.substr(0, colon)), trim(line.substr(colon + 1))});
    }
    return headers;
}

std::optional<std::string> find_header(const std::vector<Header>& headers, std::string_view name) {
    for (const auto& header : headers) {
        if (iequals(header.name, name)) {
            return header.value;
        }
    }
    return std::nullopt;
}

ContentType parse_content_type(std::string_view value) {
    ContentType result;
    auto parts = split_top_level(value, ';');
    if (parts.empty()) return result;

    std::string type = to_lower(trim(remove_comments(parts[0])));
    if (!type.empty()) {
        result.type = type;
    }

    for (size_t i = 1; i < parts.size(); ++i) {
        auto eq = parts[i].find('=');
        if (eq == std::string::npos) continue;
        std::string key = to_lower(trim(parts[i].substr(0, eq)));
        if (!key.empty()) {
            result.params[key] = strip_quotes(parts[i].substr(eq + 1));
        }
    }
    return result;
}

std::vector<Address> parse_address_list(std::string_view value) {
    std::vector<Address> addresses;

    for (auto& item : split_top_level(value, ',')) {
        std::string entry = trim(item);
        if (entry.empty()) continue;

        // Group syntax "name: a@x, b@y;" keeps only the members.
        size_t colon = entry.find(':');
        if (colon != std::string::npos && entry.find('<') > colon && entry.find('"') > colon) {
            entry = trim(entry.substr(colon + 1));
            if (!entry.empty() && entry.back() == ';') entry.pop_back();
            if (entry.empty()) continue;
        }

        Address address;
        size_t open = entry.rfind('<');
        size_t close = entry.rfind('>');
        if (open != std::string::npos && close != std::string::npos && close > open) {
            address.address = trim(entry.substr(open + 1, close - open - 1));
            address.display_name = decode_encoded_words(strip_quotes(remove_comments(entry.substr(0, open))));
        } else {
            address.address = trim(remove_comments(entry));
        }

        if (!address.address.empty()) {
            addresses.push_back(std::move(address));
        }
    }
    return addresses;
}

std::string address_domain(std::string_view address) {
    std::string value = trim(address);
    if (!value.empty() && value.front() == '<') value.erase(0, 1);
    if (!value.empty() && value.back() == '>') value.pop_back();

    size_t at = value.rfind('@');
    if (at == std::string::npos) return "";
    return to_lower(value.substr(at + 1));
}

std::vector<std::string> parse_message_ids(std::string_view value) {
    std::vector<std::string> ids;
    size_t pos = 0;
    while ((pos = value.find('<', pos)) != std::string_view::npos) {
        size_t end = value.find('>', pos);
        if (end == std::string_view::npos) break;
        ids.emplace_back(value.substr(pos, end - pos + 1));
        pos = end + 1;
    }
    if (ids.empty()) {
        std::string bare = trim(value);
        if (!bare.empty()) ids.push_back(bare);
    }
    return ids;
}

std::string decode_quoted_printable(std::string_view input) {
    std::string output;
    output.reserve(input.size());

    for (size_t i = 0; i < input.size(); ++i) {
        char c = input[i];
        if (c != '=') {
            output.push_back(c);
            continue;
        }
        if (i + 1 < input.size() && input[i + 1] == '\n') {
            i += 1;
            continue;
        }
        if (i + 2 < input.size() && input[i + 1] == '\r' && input[i + 2] == '\n') {
            i += 2;
            continue;
        }
        if (i + 2 < input.size() &&
            std::isxdigit(static_cast<unsigned char>(input[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(input[i + 2]))) {
            if (auto byte = hex_decode(input.substr(i + 1, 2))) {
                output += *byte;
                i += 2;
                continue;
            }
        }
        output.push_back(c);
    }
    return output;
}

std::string decode_encoded_words(std::string_view input) {
    std::string output;
    size_t pos = 0;
    bool last_was_word = false;

    while (pos < input.size()) {
        size_t start = input.find("=?", pos);
        if (start == std::string_view::npos) {
            output.append(input.substr(pos));
            break;
        }

        size_t charset_end = input.find('?', start + 2);
        size_t encoding_end = charset_end == std::string_view::npos
            ? std::string_view::npos : input.find('?', charset_end + 1);
        size_t end = encoding_end == std::string_view::npos
            ? std::string_view::npos : input.find("?=", encoding_end + 1);
        if (end == std::string_view::npos || encoding_end != charset_end + 2) {
            output.append(input.substr(pos));
            break;
        }

        std::string_view between = input.substr(pos, start - pos);
        if (!(last_was_word && trim(between).empty())) {
            output.append(between);
        }

        char encoding = static_cast<char>(std::toupper(static_cast<unsigned char>(input[charset_end + 1])));
        std::string_view text = input.substr(encoding_end + 1, end - encoding_end - 1);

        if (encoding == 'B') {
            output += base64_decode(text).value_or(std::string(text));
        } else if (encoding == 'Q') {
            std::string q(text);
            for (char& c : q) {
                if (c == '_') c = ' ';
            }
            output += decode_quoted_printable(q);
        } else {
            output.append(input.substr(start, end + 2 - start));
        }

        last_was_word = true;
        pos = end + 2;
    }
    return output;
}

ParsedMessage parse_message(std::string_view raw) {
    ParsedMessage message;
    auto sections = split_message(raw);
    message.headers = parse_headers(sections.header);
    parse_part(message.headers, sections.body, message, 0);
    return message;
}

}  // namespace mailcore::mime
