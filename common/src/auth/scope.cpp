#include "auth/scope.hpp"
#include "encoding.hpp"

#include <array>

namespace mailcore {

namespace {

constexpr std::array<Scope, 6> ALL_SCOPES = {
    Scope::Smtp, Scope::Pop3, Scope::Imap, Scope::ApiRead, Scope::ApiWrite, Scope::App
};

}  // namespace

std::optional<Scope> parse_scope(std::string_view name) {
    std::string lower = to_lower(name);
    for (Scope scope : ALL_SCOPES) {
        if (lower == scope_name(scope)) {
            return scope;
        }
    }
    return std::nullopt;
}

const char* scope_name(Scope scope) {
    switch (scope) {
        case Scope::Smtp:     return "smtp";
        case Scope::Pop3:     return "pop3";
        case Scope::Imap:     return "imap";
        case Scope::ApiRead:  return "api:read";
        case Scope::ApiWrite: return "api:write";
        case Scope::App:      return "app";
    }
    return "";
}

ScopeSet::ScopeSet(std::initializer_list<Scope> scopes) {
    for (Scope scope : scopes) {
        add(scope);
    }
}

std::string ScopeSet::to_string() const {
    std::string result;
    for (Scope scope : ALL_SCOPES) {
        if (contains(scope)) {
            if (!result.empty()) result += ' ';
            result += scope_name(scope);
        }
    }
    return result;
}

std::optional<ScopeSet> ScopeSet::parse(std::string_view text) {
    ScopeSet set;
    std::string normalized(text);
    for (char& c : normalized) {
        if (c == ',') c = ' ';
    }

    for (const auto& token : split(normalized, ' ')) {
        auto scope = parse_scope(token);
        if (!scope) {
            return std::nullopt;
        }
        set.add(*scope);
    }
    return set;
}

const char* protocol_name(Protocol protocol) {
    switch (protocol) {
        case Protocol::Smtp: return "smtp";
        case Protocol::Pop3: return "pop3";
        case Protocol::Imap: return "imap";
    }
    return "";
}

Scope required_scope(Protocol protocol) {
    switch (protocol) {
        case Protocol::Smtp: return Scope::Smtp;
        case Protocol::Pop3: return Scope::Pop3;
        case Protocol::Imap: return Scope::Imap;
    }
    return Scope::App;
}

}  // namespace mailcore
