#include "encoding.hpp"

#include <algorithm>
#include <cctype>

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>

namespace mailcore {

std::string base64_encode(std::string_view data) {
    if (data.empty()) return "";

    BIO* bio = BIO_new(BIO_s_mem());
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_push(b64, bio);

    BIO_write(bio, data.data(), static_cast<int>(data.size()));
    (void)BIO_flush(bio);

    BUF_MEM* buffer;
    BIO_get_mem_ptr(bio, &buffer);

    std::string result(buffer->data, buffer->length);
    BIO_free_all(bio);

    return result;
}

std::optional<std::string> base64_decode(std::string_view encoded) {
    std::string compact;
    compact.reserve(encoded.size());
    for (char c : encoded) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            compact.push_back(c);
        }
    }
    if (compact.empty()) return std::string();
    if (compact.size() % 4 != 0) return std::nullopt;

    for (size_t i = 0; i < compact.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(compact[i]);
        bool padding = c == '=' && i + 2 >= compact.size();
        if (!std::isalnum(c) && c != '+' && c != '/' && !padding) {
            return std::nullopt;
        }
    }

    std::string decoded(compact.size() / 4 * 3, '\0');
    int len = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(decoded.data()),
                              reinterpret_cast<const unsigned char*>(compact.data()),
                              static_cast<int>(compact.size()));
    if (len < 0) return std::nullopt;

    // EVP_DecodeBlock keeps the bytes produced by padding.
    size_t padding = 0;
    if (compact.back() == '=') ++padding;
    if (compact.size() > 1 && compact[compact.size() - 2] == '=') ++padding;
    decoded.resize(static_cast<size_t>(len) - padding);
    return decoded;
}

std::string base64_encode_lines(std::string_view data) {
    std::string encoded = base64_encode(data);
    std::string result;
    result.reserve(encoded.size() + encoded.size() / 76 * 2 + 2);
    for (size_t i = 0; i < encoded.size(); i += 76) {
        result.append(encoded, i, 76);
        result.append("\r\n");
    }
    return result;
}

std::string hex_encode(std::string_view data) {
    static const char digits[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (unsigned char c : data) {
        result.push_back(digits[c >> 4]);
        result.push_back(digits[c & 0x0F]);
    }
    return result;
}

std::optional<std::string> hex_decode(std::string_view hex) {
    if (hex.size() % 2 != 0) return std::nullopt;

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::string result;
    result.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        result.push_back(static_cast<char>((hi << 4) | lo));
    }
    return result;
}

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string to_upper(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return result;
}

std::string trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(start, end - start + 1));
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

bool istarts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && iequals(s.substr(0, prefix.size()), prefix);
}

std::vector<std::string> split(std::string_view s, char delimiter, bool skip_empty) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= s.size()) {
        size_t end = s.find(delimiter, start);
        if (end == std::string_view::npos) end = s.size();
        std::string part = trim(s.substr(start, end - start));
        if (!part.empty() || !skip_empty) {
            parts.push_back(std::move(part));
        }
        start = end + 1;
    }
    return parts;
}

std::string dot_stuff(std::string_view content) {
    std::string result;
    result.reserve(content.size() + content.size() / 50 + 2);

    size_t pos = 0;
    while (pos < content.size()) {
        size_t eol = content.find('\n', pos);
        std::string_view line = content.substr(pos, eol == std::string_view::npos ? std::string_view::npos
                                                                                  : eol - pos);
        pos = eol == std::string_view::npos ? content.size() : eol + 1;

        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (!line.empty() && line.front() == '.') {
            result += '.';
        }
        result.append(line);
        result += "\r\n";
    }
    return result;
}

}  // namespace mailcore
