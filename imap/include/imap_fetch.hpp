#pragma once

#include <string>
#include <string_view>

#include "imap_parser.hpp"

namespace mailcore::imap {

// Renderers for FETCH data items, working on the raw RFC 5322 message.

std::string envelope(std::string_view raw);
std::string body_structure(std::string_view raw);

// Content of BODY[section]<partial>, RFC822, RFC822.HEADER or RFC822.TEXT.
std::string section_content(std::string_view raw, const FetchItem& item);

}  // namespace mailcore::imap
