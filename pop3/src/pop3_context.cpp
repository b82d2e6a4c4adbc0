#include "pop3_context.hpp"
#include "logger.hpp"

#include <algorithm>

namespace mailcore::pop3 {

namespace {

// Unique ids are 1 to 70 printable characters.
bool valid_unique_id(const std::string& id) {
    if (id.empty() || id.size() > 70) return false;
    return std::all_of(id.begin(), id.end(), [](char c) { return c >= 0x21 && c <= 0x7e; });
}

}  // namespace

const char* state_name(SessionState state) {
    switch (state) {
        case SessionState::Authorization: return "AUTHORIZATION";
        case SessionState::Transaction: return "TRANSACTION";
        case SessionState::Update: return "UPDATE";
    }
    return "UNKNOWN";
}

SessionContext::SessionContext(Authenticator& authenticator, MessageStore& store, const POP3Config& config)
    : authenticator(authenticator)
    , store(store)
    , config(config) {
}

void SessionContext::begin_transaction(const User& authenticated) {
    auto summaries = store.list_messages(authenticated.id, config.max_messages_per_session);

    user = authenticated;
    messages.clear();
    deleted.clear();

    size_t number = 1;
    for (const auto& summary : summaries) {
        MessageInfo info;
        info.number = number++;
        info.email_id = summary.email_id;
        info.unique_id = valid_unique_id(summary.message_id) ? summary.message_id
                                                             : std::to_string(summary.email_id);
        info.size = summary.size;
        info.flags = summary.flags;
        messages.push_back(std::move(info));
    }

    state = SessionState::Transaction;
    LOG_DEBUG_FMT("Loaded {} messages for {}", messages.size(), authenticated.address);
}

MessageInfo* SessionContext::find(size_t number) {
    if (number < 1 || number > messages.size() || is_deleted(number)) {
        return nullptr;
    }
    return &messages[number - 1];
}

std::optional<std::string> SessionContext::content(const MessageInfo& message) {
    return store.get_message_content(user->id, message.email_id);
}

void SessionContext::mark_seen(MessageInfo& message) {
    if (message.flags & message_flags::SEEN) return;

    uint8_t flags = message.flags | message_flags::SEEN;
    if (store.update_flags(user->id, message.email_id, flags)) {
        message.flags = flags;
    }
}

size_t SessionContext::total_messages() const {
    return messages.size() - deleted.size();
}

uint64_t SessionContext::total_size() const {
    uint64_t size = 0;
    for (const auto& message : messages) {
        if (!is_deleted(message.number)) {
            size += message.size;
        }
    }
    return size;
}

size_t SessionContext::commit() {
    if (deleted.empty()) return 0;

    std::vector<int64_t> email_ids;
    for (size_t number : deleted) {
        email_ids.push_back(messages[number - 1].email_id);
    }

    size_t removed = store.delete_messages(user->id, email_ids);
    if (removed != email_ids.size()) {
        LOG_WARNING_FMT("POP3 removed {} of {} messages for {}", removed, email_ids.size(), user->address);
    }
    deleted.clear();
    return removed;
}

}  // namespace mailcore::pop3
