#pragma once

#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include <cstdint>

#include "storage/records.hpp"

namespace mailcore {

// Infrastructure failure of a store (database unavailable, constraint
// violation). Not-found results are reported through optional/empty returns.
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class UserStore {
public:
    virtual ~UserStore() = default;

    // Exact (already normalized) address; only active credentials are returned.
    virtual std::optional<UserWithCredentials> find_user_with_credentials(const std::string& address) = 0;
    virtual std::vector<Credential> find_credentials_by_prefix(const std::string& prefix) = 0;
    virtual bool mark_credential_used(int64_t credential_id, TimePoint when) = 0;
    virtual std::optional<User> find_user_by_address(const std::string& address) = 0;
};

class MessageStore {
public:
    virtual ~MessageStore() = default;

    // Assigns email.id and the recipient ids.
    virtual bool save_email(InboundEmail& email) = 0;
    virtual std::optional<InboundEmail> find_by_message_id(const std::string& message_id) = 0;

    // The newest limit messages, returned oldest first.
    virtual std::vector<MessageSummary> list_messages(int64_t user_id, size_t limit) = 0;
    virtual std::optional<std::string> get_message_content(int64_t user_id, int64_t email_id) = 0;
    virtual bool update_flags(int64_t user_id, int64_t email_id, uint8_t flags) = 0;

    // Returns how many of the messages were removed from the user's mailbox.
    virtual size_t delete_messages(int64_t user_id, const std::vector<int64_t>& email_ids) = 0;
};

class OutboundStore {
public:
    virtual ~OutboundStore() = default;

    // Queued emails whose next retry is due, oldest first.
    virtual std::vector<OutboundEmail> fetch_due(size_t limit, TimePoint now) = 0;

    // Persists status, retry bookkeeping and recipient statuses.
    virtual bool update(const OutboundEmail& email) = 0;
    virtual bool append_delivery_log(const DeliveryLog& log) = 0;

    // Emails left in Sending by an interrupted process go back to Queued.
    virtual size_t requeue_interrupted() = 0;
};

class DeliveryObserver {
public:
    virtual ~DeliveryObserver() = default;
    virtual void on_status_changed(int64_t user_id, int64_t email_id, OutboundStatus status) = 0;
};

class NewMailObserver {
public:
    virtual ~NewMailObserver() = default;
    virtual void on_new_mail(int64_t user_id, const InboundEmail& email) = 0;
};

}  // namespace mailcore
