#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <cstdint>

namespace mailcore {

enum class Scope : uint8_t {
    Smtp = 1 << 0,
    Pop3 = 1 << 1,
    Imap = 1 << 2,
    ApiRead = 1 << 3,
    ApiWrite = 1 << 4,
    App = 1 << 5
};

std::optional<Scope> parse_scope(std::string_view name);
const char* scope_name(Scope scope);

// Closed set of credential permissions. Stored as the space separated
// canonical names ("smtp imap api:read").
class ScopeSet {
public:
    ScopeSet() = default;
    ScopeSet(std::initializer_list<Scope> scopes);

    void add(Scope scope) { bits_ |= static_cast<uint8_t>(scope); }
    void remove(Scope scope) { bits_ &= static_cast<uint8_t>(~static_cast<uint8_t>(scope)); }
    bool contains(Scope scope) const { return (bits_ & static_cast<uint8_t>(scope)) != 0; }
    bool empty() const { return bits_ == 0; }
    uint8_t bits() const { return bits_; }

    std::string to_string() const;

    // Accepts comma and/or space separated names. Any unknown name fails the whole parse.
    static std::optional<ScopeSet> parse(std::string_view text);

    bool operator==(const ScopeSet& other) const { return bits_ == other.bits_; }

private:
    uint8_t bits_ = 0;
};

enum class Protocol {
    Smtp,
    Pop3,
    Imap
};

const char* protocol_name(Protocol protocol);
Scope required_scope(Protocol protocol);

}  // namespace mailcore
