#include "imap_context.hpp"
#include "logger.hpp"

#include <algorithm>
#include <chrono>

namespace mailcore::imap {

const char* state_name(SessionState state) {
    switch (state) {
        case SessionState::NotAuthenticated: return "not authenticated";
        case SessionState::Authenticated: return "authenticated";
        case SessionState::Selected: return "selected";
        case SessionState::Logout: return "logout";
    }
    return "unknown";
}

uint32_t uid_validity() {
    static const uint32_t value = []() {
        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        auto derived = static_cast<uint32_t>(seconds);
        return derived == 0 ? 1u : derived;
    }();
    return value;
}

SessionContext::SessionContext(Authenticator& authenticator, MessageStore& store, const IMAPConfig& config)
    : authenticator(authenticator)
    , store(store)
    , config(config) {
}

size_t SessionContext::count(Flag flag) const {
    return static_cast<size_t>(std::count_if(messages.begin(), messages.end(),
        [flag](const MailboxMessage& message) { return message.flags.has(flag); }));
}

void SessionContext::update_flags(MailboxMessage& message, Flags flags) {
    Flags persisted = flags;
    persisted.clear(Flag::Recent);
    store.update_flags(user->id, message.email_id, persisted.bits());
    message.flags = flags;
}

void SessionContext::select(const std::string& name, bool examine) {
    messages.clear();

    auto summaries = store.list_messages(user->id, config.max_messages_per_session);
    messages.reserve(summaries.size());
    for (const auto& summary : summaries) {
        messages.push_back(MailboxMessage{summary.email_id, summary.uid, summary.size,
                                          Flags(summary.flags), summary.received_at});
    }
    // UIDs must ascend with sequence numbers.
    std::sort(messages.begin(), messages.end(),
              [](const MailboxMessage& a, const MailboxMessage& b) { return a.uid < b.uid; });

    if (!examine) {
        for (const auto& message : messages) {
            if (!message.flags.has(Flag::Recent)) continue;
            Flags persisted = message.flags;
            persisted.clear(Flag::Recent);
            store.update_flags(user->id, message.email_id, persisted.bits());
        }
    }

    mailbox = name;
    read_only = examine;
    state = SessionState::Selected;
}

void SessionContext::deselect() {
    mailbox.clear();
    messages.clear();
    read_only = false;
    state = SessionState::Authenticated;
}

std::vector<uint32_t> SessionContext::expunge(const std::optional<std::vector<uint32_t>>& uids) {
    std::vector<int64_t> email_ids;
    std::vector<uint32_t> sequences;

    for (uint32_t seq = exists(); seq >= 1; --seq) {
        const auto& message = messages[seq - 1];
        if (!message.flags.has(Flag::Deleted)) continue;
        if (uids && std::find(uids->begin(), uids->end(), message.uid) == uids->end()) continue;
        email_ids.push_back(message.email_id);
        sequences.push_back(seq);
    }

    if (email_ids.empty()) return {};

    size_t removed = store.delete_messages(user->id, email_ids);
    LOG_DEBUG_FMT("Expunged {} of {} messages for {}", removed, email_ids.size(), user->address);

    for (uint32_t seq : sequences) {
        messages.erase(messages.begin() + (seq - 1));
    }
    return sequences;
}

}  // namespace mailcore::imap
