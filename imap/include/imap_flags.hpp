#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <cstdint>

#include "storage/records.hpp"

namespace mailcore::imap {

// System flags. Bit values match the persisted message_flags so that a
// Flags value can be stored as is.
enum class Flag : uint8_t {
    Seen = message_flags::SEEN,
    Answered = message_flags::ANSWERED,
    Flagged = message_flags::FLAGGED,
    Deleted = message_flags::DELETED,
    Draft = message_flags::DRAFT,
    Recent = message_flags::RECENT
};

class Flags {
public:
    Flags() = default;
    explicit Flags(uint8_t bits) : bits_(bits) {}

    bool has(Flag flag) const { return (bits_ & static_cast<uint8_t>(flag)) != 0; }
    void set(Flag flag) { bits_ |= static_cast<uint8_t>(flag); }
    void clear(Flag flag) { bits_ &= static_cast<uint8_t>(~static_cast<uint8_t>(flag)); }

    void add(Flags other) { bits_ |= other.bits_; }
    void remove(Flags other) { bits_ &= static_cast<uint8_t>(~other.bits_); }

    uint8_t bits() const { return bits_; }
    bool empty() const { return bits_ == 0; }

    bool operator==(const Flags& other) const { return bits_ == other.bits_; }
    bool operator!=(const Flags& other) const { return bits_ != other.bits_; }

private:
    uint8_t bits_ = 0;
};

// Flags a client may change with STORE.
inline constexpr uint8_t STORABLE_FLAGS = message_flags::SEEN | message_flags::ANSWERED |
                                          message_flags::FLAGGED | message_flags::DELETED |
                                          message_flags::DRAFT;

const char* flag_name(Flag flag);

// "\Seen \Answered \Flagged \Deleted \Draft \Recent" order, single spaces,
// empty string for no flags.
std::string to_imap_string(Flags flags);

// Case-insensitive. Unknown flags and keywords are ignored. Surrounding
// parentheses are accepted.
Flags parse_flags(std::string_view list);
Flags parse_flags(const std::vector<std::string>& tokens);

}  // namespace mailcore::imap
