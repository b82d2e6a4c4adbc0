#pragma once

#include <string>
#include <vector>
#include <optional>
#include <set>
#include <cstdint>

#include "auth/authenticator.hpp"
#include "config.hpp"
#include "storage/stores.hpp"
#include "imap_flags.hpp"

namespace mailcore::imap {

enum class SessionState {
    NotAuthenticated,
    Authenticated,
    Selected,
    Logout
};

const char* state_name(SessionState state);

// UIDVALIDITY shared by every session of this process. Derived from the
// start time and never zero.
uint32_t uid_validity();

struct MailboxMessage {
    int64_t email_id = 0;
    uint32_t uid = 0;
    uint64_t size = 0;
    Flags flags;
    TimePoint internal_date{};
};

// Per-connection state. Owned by one session and only touched from its
// strand; the services it refers to are shared and internally synchronized.
// \Deleted is written to the store as soon as it is set; the messages
// pending expunge are the ones in `messages` carrying that flag.
struct SessionContext {
    SessionContext(Authenticator& authenticator, MessageStore& store, const IMAPConfig& config);

    Authenticator& authenticator;
    MessageStore& store;
    const IMAPConfig& config;

    std::string client_address = "unknown";
    SessionState state = SessionState::NotAuthenticated;
    std::optional<User> user;

    // Selected mailbox. Sequence number n is messages[n - 1].
    std::string mailbox;
    bool read_only = false;
    std::vector<MailboxMessage> messages;

    std::set<std::string> enabled_extensions;

    // Tag of an AUTHENTICATE waiting for its continuation line.
    std::optional<std::string> pending_authenticate;

    bool authenticated() const {
        return state == SessionState::Authenticated || state == SessionState::Selected;
    }

    uint32_t exists() const { return static_cast<uint32_t>(messages.size()); }
    uint32_t max_uid() const { return messages.empty() ? 0 : messages.back().uid; }
    uint32_t uid_next() const { return max_uid() + 1; }

    size_t count(Flag flag) const;

    // Sets the session's view of a message and persists it without \Recent.
    void update_flags(MailboxMessage& message, Flags flags);

    // Loads the user's INBOX. Clears \Recent in the store when read-write.
    void select(const std::string& name, bool examine);
    void deselect();

    // Removes every \Deleted message (restricted to uids when given) from
    // the store and the session. Returns the removed sequence numbers in
    // descending order.
    std::vector<uint32_t> expunge(const std::optional<std::vector<uint32_t>>& uids = std::nullopt);
};

}  // namespace mailcore::imap
