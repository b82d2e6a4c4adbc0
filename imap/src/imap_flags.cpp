#include "imap_flags.hpp"
#include "encoding.hpp"

#include <array>

namespace mailcore::imap {

namespace {

constexpr std::array<Flag, 6> ALL_FLAGS = {
    Flag::Seen, Flag::Answered, Flag::Flagged, Flag::Deleted, Flag::Draft, Flag::Recent
};

std::optional<Flag> lookup(std::string_view token) {
    for (Flag flag : ALL_FLAGS) {
        if (iequals(token, flag_name(flag))) {
            return flag;
        }
    }
    return std::nullopt;
}

}  // namespace

const char* flag_name(Flag flag) {
    switch (flag) {
        case Flag::Seen: return "\\Seen";
        case Flag::Answered: return "\\Answered";
        case Flag::Flagged: return "\\Flagged";
        case Flag::Deleted: return "\\Deleted";
        case Flag::Draft: return "\\Draft";
        case Flag::Recent: return "\\Recent";
    }
    return "";
}

std::string to_imap_string(Flags flags) {
    std::string result;
    for (Flag flag : ALL_FLAGS) {
        if (!flags.has(flag)) continue;
        if (!result.empty()) result += ' ';
        result += flag_name(flag);
    }
    return result;
}

Flags parse_flags(std::string_view list) {
    std::string text = trim(list);
    if (!text.empty() && text.front() == '(') {
        text.erase(0, 1);
        if (!text.empty() && text.back() == ')') {
            text.pop_back();
        }
    }
    return parse_flags(split(text, ' '));
}

Flags parse_flags(const std::vector<std::string>& tokens) {
    Flags flags;
    for (const auto& token : tokens) {
        if (auto flag = lookup(trim(token))) {
            flags.set(*flag);
        }
    }
    return flags;
}

}  // namespace mailcore::imap
