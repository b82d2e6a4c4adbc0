#pragma once

#include <string>
#include <vector>
#include <optional>
#include <set>
#include <cstdint>

#include "auth/authenticator.hpp"
#include "config.hpp"
#include "storage/stores.hpp"

namespace mailcore::pop3 {

enum class SessionState {
    Authorization,
    Transaction,
    Update
};

const char* state_name(SessionState state);

struct MessageInfo {
    size_t number = 0;        // 1-based
    int64_t email_id = 0;
    std::string unique_id;
    uint64_t size = 0;
    uint8_t flags = 0;
};

// Per-connection state, mutated only by the command dispatcher of its
// session. Deletions are marks until QUIT commits them.
struct SessionContext {
    SessionContext(Authenticator& authenticator, MessageStore& store, const POP3Config& config);

    Authenticator& authenticator;
    MessageStore& store;
    const POP3Config& config;

    std::string client_address = "unknown";
    SessionState state = SessionState::Authorization;
    std::string pending_username;
    std::optional<User> user;

    // Fixed at Transaction entry. Message n is messages[n - 1].
    std::vector<MessageInfo> messages;
    std::set<size_t> deleted;

    // Enters Transaction with the user's mailbox listing.
    void begin_transaction(const User& authenticated);

    // nullptr for unknown or deleted message numbers.
    MessageInfo* find(size_t number);
    bool is_deleted(size_t number) const { return deleted.count(number) > 0; }

    std::optional<std::string> content(const MessageInfo& message);
    void mark_seen(MessageInfo& message);

    size_t total_messages() const;
    uint64_t total_size() const;

    // Update state: removes the marked messages from the store.
    size_t commit();
};

}  // namespace mailcore::pop3
