#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "imap_flags.hpp"

namespace mailcore::imap {

inline constexpr size_t MAX_COMMAND_LENGTH = 8192;
inline constexpr size_t MAX_ARGUMENTS = 100;
inline constexpr size_t MAX_SEQUENCE_PARTS = 500;

struct SequenceSet {
    struct Range {
        uint32_t start;
        uint32_t end;  // 0 means *
    };
    std::vector<Range> ranges;

    // "*" stands for max, the largest number in use. Ranges are unordered
    // ("5:2" equals "2:5").
    bool contains(uint32_t num, uint32_t max) const;

    static std::optional<SequenceSet> parse(std::string_view str);
};

struct FetchItem {
    enum class Type {
        UID,
        FLAGS,
        INTERNALDATE,
        RFC822_SIZE,
        ENVELOPE,
        BODYSTRUCTURE,
        BODY,          // BODY[section] and BODY.PEEK[section]
        RFC822,
        RFC822_HEADER,
        RFC822_TEXT
    };

    enum class Section {
        Full,
        Header,
        HeaderFields,
        HeaderFieldsNot,
        Text
    };

    Type type = Type::UID;
    Section section = Section::Full;
    bool peek = false;  // BODY.PEEK; for BODYSTRUCTURE, requested as plain BODY
    std::vector<std::string> header_fields;  // upper case
    std::optional<std::pair<size_t, size_t>> partial;  // <start.count>

    // Whether fetching this item marks the message \Seen.
    bool sets_seen() const;
    // Item name as echoed in the FETCH response, e.g. "BODY[HEADER]".
    std::string response_name() const;
};

struct SearchKey {
    enum class Type {
        All,
        And,
        Or,
        Not,
        SequenceNumbers,
        Uid,
        Seen,
        Unseen,
        Answered,
        Unanswered,
        Deleted,
        Undeleted,
        Flagged,
        Unflagged,
        Draft,
        Undraft,
        Recent,
        New,
        Old,
        Larger,
        Smaller,
        Before,
        On,
        Since,
        From,
        To,
        Cc,
        Bcc,
        Subject,
        Header,
        Body,
        Text
    };

    Type type = Type::All;
    std::string value;
    std::string header_name;
    uint64_t number = 0;
    std::chrono::sys_days date{};
    std::optional<SequenceSet> set;
    std::vector<SearchKey> children;
};

struct StoreAction {
    enum class Mode {
        Replace,
        Add,
        Remove
    };

    Mode mode = Mode::Replace;
    bool silent = false;
    Flags flags;
};

class IMAPParser {
public:
    // Splits arguments into strings. Atoms end at whitespace; quoted strings
    // honour backslash escapes; "{n}" or "{n+}" followed by CRLF introduces a
    // literal of n bytes. Parenthesized lists are returned as one token each
    // for "(" and ")". Returns nullopt with error set on malformed input.
    static std::optional<std::vector<std::string>> tokenize(std::string_view str, std::string& error);

    static std::optional<SequenceSet> parse_sequence_set(std::string_view str);

    // Single item, macro (ALL, FAST, FULL) or parenthesized list.
    static std::optional<std::vector<FetchItem>> parse_fetch_items(std::string_view str);

    static std::optional<SearchKey> parse_search(std::string_view str);

    // "+FLAGS.SILENT (\Seen)" style action and flag list.
    static std::optional<StoreAction> parse_store_action(std::string_view str);

    // Length of a trailing "{n}" / "{n+}" literal marker, if the line ends with one.
    static std::optional<size_t> trailing_literal(std::string_view line, bool& non_synchronizing);

    static std::string quote_string(std::string_view str);
    // NIL for empty values, a quoted string or a literal otherwise.
    static std::string nstring(std::string_view str);

    // "17-Jul-1996" (dates in SEARCH).
    static std::optional<std::chrono::sys_days> parse_date(std::string_view str);
    // "17-Jul-1996 02:44:25 +0000"
    static std::string format_internal_date(std::chrono::system_clock::time_point tp);

    static bool is_atom_char(char c);
};

}  // namespace mailcore::imap
