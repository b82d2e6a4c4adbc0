#include "imap_parser.hpp"
#include "encoding.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <format>
#include <unordered_map>

namespace mailcore::imap {

namespace {

constexpr std::array<const char*, 12> MONTHS = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
};

template<typename T>
std::optional<T> parse_number(std::string_view str) {
    if (str.empty()) return std::nullopt;
    T value{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc() || ptr != str.data() + str.size()) {
        return std::nullopt;
    }
    return value;
}

bool is_space(char c) {
    return c == ' ' || c == '\t';
}

// Parses "(A B C)" starting at tokens[pos] == "(".
std::optional<std::vector<std::string>> parse_paren_list(const std::vector<std::string>& tokens,
                                                          size_t& pos) {
    if (pos >= tokens.size() || tokens[pos] != "(") return std::nullopt;
    ++pos;
    std::vector<std::string> items;
    while (pos < tokens.size() && tokens[pos] != ")") {
        items.push_back(tokens[pos++]);
    }
    if (pos >= tokens.size()) return std::nullopt;
    ++pos;
    return items;
}

const std::unordered_map<std::string, SearchKey::Type>& simple_search_keys() {
    static const std::unordered_map<std::string, SearchKey::Type> keys = {
        {"ALL", SearchKey::Type::All},
        {"SEEN", SearchKey::Type::Seen},
        {"UNSEEN", SearchKey::Type::Unseen},
        {"ANSWERED", SearchKey::Type::Answered},
        {"UNANSWERED", SearchKey::Type::Unanswered},
        {"DELETED", SearchKey::Type::Deleted},
        {"UNDELETED", SearchKey::Type::Undeleted},
        {"FLAGGED", SearchKey::Type::Flagged},
        {"UNFLAGGED", SearchKey::Type::Unflagged},
        {"DRAFT", SearchKey::Type::Draft},
        {"UNDRAFT", SearchKey::Type::Undraft},
        {"RECENT", SearchKey::Type::Recent},
        {"NEW", SearchKey::Type::New},
        {"OLD", SearchKey::Type::Old},
    };
    return keys;
}

const std::unordered_map<std::string, SearchKey::Type>& string_search_keys() {
    static const std::unordered_map<std::string, SearchKey::Type> keys = {
        {"FROM", SearchKey::Type::From},
        {"TO", SearchKey::Type::To},
        {"CC", SearchKey::Type::Cc},
        {"BCC", SearchKey::Type::Bcc},
        {"SUBJECT", SearchKey::Type::Subject},
        {"BODY", SearchKey::Type::Body},
        {"TEXT", SearchKey::Type::Text},
    };
    return keys;
}

std::optional<SearchKey> parse_search_key(const std::vector<std::string>& tokens, size_t& pos, int depth);

std::optional<SearchKey> parse_search_group(const std::vector<std::string>& tokens, size_t& pos,
                                            int depth, bool parenthesized) {
    SearchKey group;
    group.type = SearchKey::Type::And;
    while (pos < tokens.size()) {
        if (tokens[pos] == ")") {
            if (!parenthesized) return std::nullopt;
            ++pos;
            return group.children.empty() ? std::nullopt : std::optional<SearchKey>(group);
        }
        auto key = parse_search_key(tokens, pos, depth + 1);
        if (!key) return std::nullopt;
        group.children.push_back(std::move(*key));
    }
    if (parenthesized || group.children.empty()) return std::nullopt;
    return group;
}

std::optional<SearchKey> parse_search_key(const std::vector<std::string>& tokens, size_t& pos, int depth) {
    if (pos >= tokens.size() || depth > 32) return std::nullopt;

    const std::string& raw = tokens[pos++];
    if (raw == "(") {
        return parse_search_group(tokens, pos, depth, true);
    }

    std::string token = to_upper(raw);
    SearchKey key;

    if (auto it = simple_search_keys().find(token); it != simple_search_keys().end()) {
        key.type = it->second;
        return key;
    }

    if (auto it = string_search_keys().find(token); it != string_search_keys().end()) {
        if (pos >= tokens.size()) return std::nullopt;
        key.type = it->second;
        key.value = tokens[pos++];
        return key;
    }

    if (token == "HEADER") {
        if (pos + 1 >= tokens.size()) return std::nullopt;
        key.type = SearchKey::Type::Header;
        key.header_name = tokens[pos++];
        key.value = tokens[pos++];
        return key;
    }

    if (token == "LARGER" || token == "SMALLER") {
        if (pos >= tokens.size()) return std::nullopt;
        auto number = parse_number<uint64_t>(tokens[pos++]);
        if (!number) return std::nullopt;
        key.type = token == "LARGER" ? SearchKey::Type::Larger : SearchKey::Type::Smaller;
        key.number = *number;
        return key;
    }

    if (token == "BEFORE" || token == "ON" || token == "SINCE") {
        if (pos >= tokens.size()) return std::nullopt;
        auto date = IMAPParser::parse_date(tokens[pos++]);
        if (!date) return std::nullopt;
        key.type = token == "BEFORE" ? SearchKey::Type::Before
                 : token == "ON" ? SearchKey::Type::On
                 : SearchKey::Type::Since;
        key.date = *date;
        return key;
    }

    if (token == "UID") {
        if (pos >= tokens.size()) return std::nullopt;
        key.set = SequenceSet::parse(tokens[pos++]);
        if (!key.set) return std::nullopt;
        key.type = SearchKey::Type::Uid;
        return key;
    }

    if (token == "NOT") {
        auto child = parse_search_key(tokens, pos, depth + 1);
        if (!child) return std::nullopt;
        key.type = SearchKey::Type::Not;
        key.children.push_back(std::move(*child));
        return key;
    }

    if (token == "OR") {
        auto left = parse_search_key(tokens, pos, depth + 1);
        if (!left) return std::nullopt;
        auto right = parse_search_key(tokens, pos, depth + 1);
        if (!right) return std::nullopt;
        key.type = SearchKey::Type::Or;
        key.children.push_back(std::move(*left));
        key.children.push_back(std::move(*right));
        return key;
    }

    if (!token.empty() && (std::isdigit(static_cast<unsigned char>(token[0])) || token[0] == '*')) {
        key.set = SequenceSet::parse(token);
        if (!key.set) return std::nullopt;
        key.type = SearchKey::Type::SequenceNumbers;
        return key;
    }

    return std::nullopt;
}

std::optional<FetchItem> parse_section(FetchItem item, std::string_view section) {
    std::string upper = to_upper(trim(section));
    if (upper.empty()) {
        item.section = FetchItem::Section::Full;
        return item;
    }
    if (upper == "HEADER") {
        item.section = FetchItem::Section::Header;
        return item;
    }
    if (upper == "TEXT") {
        item.section = FetchItem::Section::Text;
        return item;
    }

    bool negate = false;
    std::string_view rest;
    if (upper.starts_with("HEADER.FIELDS.NOT")) {
        negate = true;
        rest = std::string_view(upper).substr(17);
    } else if (upper.starts_with("HEADER.FIELDS")) {
        rest = std::string_view(upper).substr(13);
    } else {
        return std::nullopt;
    }

    std::string error;
    auto tokens = IMAPParser::tokenize(rest, error);
    if (!tokens) return std::nullopt;
    size_t pos = 0;
    auto fields = parse_paren_list(*tokens, pos);
    if (!fields || fields->empty() || pos != tokens->size()) return std::nullopt;

    item.section = negate ? FetchItem::Section::HeaderFieldsNot : FetchItem::Section::HeaderFields;
    item.header_fields = std::move(*fields);
    return item;
}

std::optional<std::pair<size_t, size_t>> parse_partial(std::string_view partial) {
    auto dot = partial.find('.');
    if (dot == std::string_view::npos) return std::nullopt;
    auto start = parse_number<size_t>(partial.substr(0, dot));
    auto count = parse_number<size_t>(partial.substr(dot + 1));
    if (!start || !count || *count == 0) return std::nullopt;
    return std::make_pair(*start, *count);
}

void append_macro(std::vector<FetchItem>& items, const std::string& name) {
    auto add = [&items](FetchItem::Type type) {
        FetchItem item;
        item.type = type;
        items.push_back(item);
    };
    add(FetchItem::Type::FLAGS);
    add(FetchItem::Type::INTERNALDATE);
    add(FetchItem::Type::RFC822_SIZE);
    if (name == "ALL" || name == "FULL") {
        add(FetchItem::Type::ENVELOPE);
    }
    if (name == "FULL") {
        FetchItem body;
        body.type = FetchItem::Type::BODYSTRUCTURE;
        body.peek = true;  // "BODY" without a section
        items.push_back(body);
    }
}

}  // namespace

bool SequenceSet::contains(uint32_t num, uint32_t max) const {
    for (const auto& range : ranges) {
        uint32_t start = range.start == 0 ? max : range.start;
        uint32_t end = range.end == 0 ? max : range.end;
        if (start > end) std::swap(start, end);
        if (num >= start && num <= end) {
            return true;
        }
    }
    return false;
}

std::optional<SequenceSet> SequenceSet::parse(std::string_view str) {
    if (str.empty()) return std::nullopt;

    auto parse_value = [](std::string_view value) -> std::optional<uint32_t> {
        if (value == "*") return 0u;
        auto number = parse_number<uint32_t>(value);
        if (!number || *number == 0) return std::nullopt;
        return number;
    };

    SequenceSet set;
    for (const auto& part : split(str, ',', false)) {
        if (set.ranges.size() >= MAX_SEQUENCE_PARTS) return std::nullopt;

        auto colon = part.find(':');
        Range range{};
        if (colon == std::string::npos) {
            auto value = parse_value(part);
            if (!value) return std::nullopt;
            range.start = range.end = *value;
        } else {
            auto start = parse_value(std::string_view(part).substr(0, colon));
            auto end = parse_value(std::string_view(part).substr(colon + 1));
            if (!start || !end) return std::nullopt;
            range.start = *start;
            range.end = *end;
        }
        set.ranges.push_back(range);
    }
    return set;
}

bool FetchItem::sets_seen() const {
    return !peek && (type == Type::BODY || type == Type::RFC822 || type == Type::RFC822_TEXT);
}

std::string FetchItem::response_name() const {
    switch (type) {
        case Type::UID: return "UID";
        case Type::FLAGS: return "FLAGS";
        case Type::INTERNALDATE: return "INTERNALDATE";
        case Type::RFC822_SIZE: return "RFC822.SIZE";
        case Type::ENVELOPE: return "ENVELOPE";
        case Type::BODYSTRUCTURE: return peek ? "BODY" : "BODYSTRUCTURE";
        case Type::RFC822: return "RFC822";
        case Type::RFC822_HEADER: return "RFC822.HEADER";
        case Type::RFC822_TEXT: return "RFC822.TEXT";
        case Type::BODY: break;
    }

    std::string name = "BODY[";
    switch (section) {
        case Section::Full: break;
        case Section::Header: name += "HEADER"; break;
        case Section::Text: name += "TEXT"; break;
        case Section::HeaderFields:
        case Section::HeaderFieldsNot:
            name += section == Section::HeaderFields ? "HEADER.FIELDS (" : "HEADER.FIELDS.NOT (";
            for (size_t i = 0; i < header_fields.size(); ++i) {
                if (i > 0) name += ' ';
                name += header_fields[i];
            }
            name += ')';
            break;
    }
    name += ']';
    if (partial) {
        name += std::format("<{}>", partial->first);
    }
    return name;
}

std::optional<std::vector<std::string>> IMAPParser::tokenize(std::string_view str, std::string& error) {
    std::vector<std::string> tokens;
    size_t pos = 0;

    while (pos < str.size()) {
        char c = str[pos];
        if (is_space(c)) {
            ++pos;
            continue;
        }

        if (tokens.size() >= MAX_ARGUMENTS) {
            error = "Too many arguments";
            return std::nullopt;
        }

        if (c == '(' || c == ')') {
            tokens.emplace_back(1, c);
            ++pos;
        } else if (c == '"') {
            ++pos;
            std::string value;
            bool closed = false;
            while (pos < str.size()) {
                char ch = str[pos++];
                if (ch == '\\' && pos < str.size()) {
                    value += str[pos++];
                } else if (ch == '"') {
                    closed = true;
                    break;
                } else if (ch == '\r' || ch == '\n') {
                    break;
                } else {
                    value += ch;
                }
            }
            if (!closed) {
                error = "Unterminated quoted string";
                return std::nullopt;
            }
            tokens.push_back(std::move(value));
        } else if (c == '{') {
            auto close = str.find('}', pos);
            if (close == std::string_view::npos) {
                error = "Invalid literal";
                return std::nullopt;
            }
            std::string_view spec = str.substr(pos + 1, close - pos - 1);
            if (!spec.empty() && spec.back() == '+') spec.remove_suffix(1);
            auto length = parse_number<size_t>(spec);
            if (!length || str.substr(close + 1, 2) != "\r\n" || close + 3 + *length > str.size()) {
                error = "Invalid literal";
                return std::nullopt;
            }
            tokens.emplace_back(str.substr(close + 3, *length));
            pos = close + 3 + *length;
        } else {
            size_t start = pos;
            while (pos < str.size() && !is_space(str[pos]) && str[pos] != '(' &&
                   str[pos] != ')' && str[pos] != '"') {
                ++pos;
            }
            tokens.emplace_back(str.substr(start, pos - start));
        }
    }

    return tokens;
}

std::optional<SequenceSet> IMAPParser::parse_sequence_set(std::string_view str) {
    return SequenceSet::parse(str);
}

std::optional<std::vector<FetchItem>> IMAPParser::parse_fetch_items(std::string_view str) {
    std::string text = trim(str);
    if (text.empty()) return std::nullopt;

    if (text.front() == '(') {
        if (text.back() != ')') return std::nullopt;
        text = trim(std::string_view(text).substr(1, text.size() - 2));
        if (text.empty()) return std::nullopt;
    }

    std::vector<FetchItem> items;
    size_t pos = 0;
    while (pos < text.size()) {
        if (is_space(text[pos])) {
            ++pos;
            continue;
        }

        size_t start = pos;
        while (pos < text.size() && !is_space(text[pos]) && text[pos] != '[') {
            ++pos;
        }
        std::string name = to_upper(std::string_view(text).substr(start, pos - start));

        std::optional<std::string> section;
        if (pos < text.size() && text[pos] == '[') {
            auto close = text.find(']', pos);
            if (close == std::string::npos) return std::nullopt;
            section = text.substr(pos + 1, close - pos - 1);
            pos = close + 1;
        }

        std::optional<std::pair<size_t, size_t>> partial;
        if (pos < text.size() && text[pos] == '<') {
            auto close = text.find('>', pos);
            if (close == std::string::npos || !section) return std::nullopt;
            partial = parse_partial(std::string_view(text).substr(pos + 1, close - pos - 1));
            if (!partial) return std::nullopt;
            pos = close + 1;
        }

        if (name == "ALL" || name == "FAST" || name == "FULL") {
            if (section) return std::nullopt;
            append_macro(items, name);
            continue;
        }

        FetchItem item;
        if (name == "BODY" || name == "BODY.PEEK") {
            if (!section) {
                if (name == "BODY.PEEK") return std::nullopt;
                item.type = FetchItem::Type::BODYSTRUCTURE;
                item.peek = true;
                items.push_back(item);
                continue;
            }
            item.type = FetchItem::Type::BODY;
            item.peek = name == "BODY.PEEK";
            item.partial = partial;
            auto parsed = parse_section(item, *section);
            if (!parsed) return std::nullopt;
            items.push_back(std::move(*parsed));
            continue;
        }

        if (section) return std::nullopt;

        static const std::unordered_map<std::string, FetchItem::Type> simple = {
            {"UID", FetchItem::Type::UID},
            {"FLAGS", FetchItem::Type::FLAGS},
            {"INTERNALDATE", FetchItem::Type::INTERNALDATE},
            {"RFC822.SIZE", FetchItem::Type::RFC822_SIZE},
            {"ENVELOPE", FetchItem::Type::ENVELOPE},
            {"BODYSTRUCTURE", FetchItem::Type::BODYSTRUCTURE},
            {"RFC822", FetchItem::Type::RFC822},
            {"RFC822.HEADER", FetchItem::Type::RFC822_HEADER},
            {"RFC822.TEXT", FetchItem::Type::RFC822_TEXT},
        };
        auto it = simple.find(name);
        if (it == simple.end()) return std::nullopt;
        item.type = it->second;
        items.push_back(item);
    }

    if (items.empty()) return std::nullopt;
    return items;
}

std::optional<SearchKey> IMAPParser::parse_search(std::string_view str) {
    std::string error;
    auto tokens = tokenize(str, error);
    if (!tokens || tokens->empty()) return std::nullopt;

    size_t pos = 0;
    if (iequals((*tokens)[0], "CHARSET")) {
        if (tokens->size() < 3) return std::nullopt;
        std::string charset = to_upper((*tokens)[1]);
        if (charset != "UTF-8" && charset != "US-ASCII") return std::nullopt;
        pos = 2;
    }

    auto group = parse_search_group(*tokens, pos, 0, false);
    if (!group) return std::nullopt;
    if (group->children.size() == 1) {
        return std::move(group->children.front());
    }
    return group;
}

std::optional<StoreAction> IMAPParser::parse_store_action(std::string_view str) {
    std::string text = trim(str);
    auto space = text.find(' ');
    std::string action = to_upper(std::string_view(text).substr(0, space));
    std::string list = space == std::string::npos ? "" : text.substr(space + 1);

    StoreAction store;
    std::string_view name = action;
    if (name.starts_with('+')) {
        store.mode = StoreAction::Mode::Add;
        name.remove_prefix(1);
    } else if (name.starts_with('-')) {
        store.mode = StoreAction::Mode::Remove;
        name.remove_prefix(1);
    }

    if (name == "FLAGS.SILENT") {
        store.silent = true;
    } else if (name != "FLAGS") {
        return std::nullopt;
    }

    list = trim(list);
    if (list.empty() && store.mode != StoreAction::Mode::Replace) {
        return std::nullopt;
    }
    if (!list.empty() && list.front() == '(' && list.back() != ')') {
        return std::nullopt;
    }

    store.flags = parse_flags(list);
    return store;
}

std::optional<size_t> IMAPParser::trailing_literal(std::string_view line, bool& non_synchronizing) {
    if (line.empty() || line.back() != '}') return std::nullopt;
    auto open = line.rfind('{');
    if (open == std::string_view::npos) return std::nullopt;

    std::string_view spec = line.substr(open + 1, line.size() - open - 2);
    non_synchronizing = !spec.empty() && spec.back() == '+';
    if (non_synchronizing) spec.remove_suffix(1);
    return parse_number<size_t>(spec);
}

std::string IMAPParser::quote_string(std::string_view str) {
    std::string result = "\"";
    for (char c : str) {
        if (c == '"' || c == '\\') {
            result += '\\';
        }
        result += c;
    }
    result += '"';
    return result;
}

std::string IMAPParser::nstring(std::string_view str) {
    if (str.empty()) return "NIL";

    bool needs_literal = std::any_of(str.begin(), str.end(), [](char c) {
        return c == '\r' || c == '\n' || static_cast<unsigned char>(c) >= 0x80;
    });
    if (needs_literal) {
        return std::format("{{{}}}\r\n{}", str.size(), str);
    }
    return quote_string(str);
}

std::optional<std::chrono::sys_days> IMAPParser::parse_date(std::string_view str) {
    auto parts = split(str, '-', false);
    if (parts.size() != 3) return std::nullopt;

    auto day = parse_number<unsigned>(parts[0]);
    auto year = parse_number<int>(parts[2]);
    if (!day || !year) return std::nullopt;

    unsigned month = 0;
    for (size_t i = 0; i < MONTHS.size(); ++i) {
        if (iequals(parts[1], MONTHS[i])) {
            month = static_cast<unsigned>(i + 1);
            break;
        }
    }
    if (month == 0) return std::nullopt;

    std::chrono::year_month_day ymd{std::chrono::year(*year), std::chrono::month(month),
                                    std::chrono::day(*day)};
    if (!ymd.ok()) return std::nullopt;
    return std::chrono::sys_days(ymd);
}

std::string IMAPParser::format_internal_date(std::chrono::system_clock::time_point tp) {
    auto days = std::chrono::floor<std::chrono::days>(tp);
    std::chrono::year_month_day ymd{days};
    std::chrono::hh_mm_ss time{std::chrono::floor<std::chrono::seconds>(tp - days)};

    return std::format("{:02}-{}-{:04} {:02}:{:02}:{:02} +0000",
                       static_cast<unsigned>(ymd.day()),
                       MONTHS[static_cast<unsigned>(ymd.month()) - 1],
                       static_cast<int>(ymd.year()),
                       time.hours().count(), time.minutes().count(), time.seconds().count());
}

bool IMAPParser::is_atom_char(char c) {
    if (std::isspace(static_cast<unsigned char>(c)) || std::iscntrl(static_cast<unsigned char>(c))) return false;
    if (static_cast<unsigned char>(c) >= 0x80) return false;
    if (c == '(' || c == ')' || c == '{') return false;
    if (c == '"' || c == '\\') return false;
    if (c == '%' || c == '*') return false;
    if (c == ']') return false;
    return true;
}

}  // namespace mailcore::imap
