#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <vector>
#include <mutex>
#include <cstdint>

#include "storage/stores.hpp"

struct sqlite3;

namespace mailcore {

// SQLite-backed implementation of every store interface. One connection,
// serialized by a mutex. Query failures throw StoreError.
class SqliteStore : public UserStore, public MessageStore, public OutboundStore {
public:
    // ":memory:" opens a private in-memory database.
    explicit SqliteStore(std::filesystem::path db_path);
    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    bool initialize();
    const std::string& last_error() const { return last_error_; }

    // Administration
    std::optional<int64_t> create_user(const std::string& address, const std::string& display_name = "");
    std::vector<User> list_users();
    std::optional<int64_t> add_credential(int64_t user_id, const std::string& name,
                                          const std::string& key_prefix, const std::string& key_hash,
                                          const ScopeSet& scopes);
    std::vector<Credential> list_credentials(int64_t user_id);
    bool revoke_credential(int64_t credential_id);

    bool queue_outbound(OutboundEmail& email);
    std::optional<OutboundEmail> find_outbound(int64_t id);
    std::vector<DeliveryLog> delivery_logs(int64_t outbound_email_id);

    // UserStore
    std::optional<UserWithCredentials> find_user_with_credentials(const std::string& address) override;
    std::vector<Credential> find_credentials_by_prefix(const std::string& prefix) override;
    bool mark_credential_used(int64_t credential_id, TimePoint when) override;
    std::optional<User> find_user_by_address(const std::string& address) override;

    // MessageStore
    bool save_email(InboundEmail& email) override;
    std::optional<InboundEmail> find_by_message_id(const std::string& message_id) override;
    std::vector<MessageSummary> list_messages(int64_t user_id, size_t limit) override;
    std::optional<std::string> get_message_content(int64_t user_id, int64_t email_id) override;
    bool update_flags(int64_t user_id, int64_t email_id, uint8_t flags) override;
    size_t delete_messages(int64_t user_id, const std::vector<int64_t>& email_ids) override;

    // OutboundStore
    std::vector<OutboundEmail> fetch_due(size_t limit, TimePoint now) override;
    bool update(const OutboundEmail& email) override;
    bool append_delivery_log(const DeliveryLog& log) override;
    size_t requeue_interrupted() override;

private:
    bool execute_sql(const char* sql);
    bool create_tables();
    void require_open() const;

    std::vector<Credential> load_credentials(const char* sql, const std::string& key);
    void load_outbound_details(OutboundEmail& email);

    std::filesystem::path db_path_;
    sqlite3* db_ = nullptr;
    std::string last_error_;
    std::mutex mutex_;
};

}  // namespace mailcore
