#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <vector>

namespace mailcore {

std::string base64_encode(std::string_view data);

// Whitespace in the input is ignored. Returns nullopt on malformed input.
std::optional<std::string> base64_decode(std::string_view encoded);

// Base64 split into lines of at most 76 characters, CRLF terminated.
std::string base64_encode_lines(std::string_view data);

std::string hex_encode(std::string_view data);
std::optional<std::string> hex_decode(std::string_view hex);

std::string to_lower(std::string_view s);
std::string to_upper(std::string_view s);
std::string trim(std::string_view s);
bool iequals(std::string_view a, std::string_view b);
bool istarts_with(std::string_view s, std::string_view prefix);

std::vector<std::string> split(std::string_view s, char delimiter, bool skip_empty = true);

// Multi-line protocol body: CRLF line endings, lines starting with "." doubled,
// terminated by a final CRLF. The closing "." line is left to the caller.
std::string dot_stuff(std::string_view content);

}  // namespace mailcore
