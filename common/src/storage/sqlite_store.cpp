#include "storage/sqlite_store.hpp"
#include "encoding.hpp"
#include "logger.hpp"

#include <sqlite3.h>

#include <algorithm>

namespace mailcore {

namespace {

int64_t to_millis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint from_millis(int64_t ms) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(ms)));
}

// Prepared statement owning its sqlite3_stmt.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw StoreError(std::string("SQL prepare failed: ") + sqlite3_errmsg(db));
        }
    }

    ~Statement() {
        sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind_text(int index, const std::string& value) {
        check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                                SQLITE_TRANSIENT));
        return *this;
    }

    Statement& bind_blob(int index, const std::string& value) {
        check(sqlite3_bind_blob(stmt_, index, value.data(), static_cast<int>(value.size()),
                                SQLITE_TRANSIENT));
        return *this;
    }

    Statement& bind_int(int index, int64_t value) {
        check(sqlite3_bind_int64(stmt_, index, value));
        return *this;
    }

    Statement& bind_null(int index) {
        check(sqlite3_bind_null(stmt_, index));
        return *this;
    }

    Statement& bind_time(int index, const std::optional<TimePoint>& value) {
        return value ? bind_int(index, to_millis(*value)) : bind_null(index);
    }

    Statement& bind_id(int index, const std::optional<int64_t>& value) {
        return value ? bind_int(index, *value) : bind_null(index);
    }

    // True while rows are available.
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StoreError(std::string("SQL step failed: ") + sqlite3_errmsg(db_));
    }

    void reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    bool is_null(int column) const {
        return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
    }

    int64_t int_at(int column) const {
        return sqlite3_column_int64(stmt_, column);
    }

    std::string text_at(int column) const {
        auto text = sqlite3_column_text(stmt_, column);
        if (!text) return "";
        return std::string(reinterpret_cast<const char*>(text),
                           static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
    }

    std::string blob_at(int column) const {
        auto data = sqlite3_column_blob(stmt_, column);
        if (!data) return "";
        return std::string(static_cast<const char*>(data),
                           static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
    }

    std::optional<TimePoint> time_at(int column) const {
        if (is_null(column)) return std::nullopt;
        return from_millis(int_at(column));
    }

    std::optional<int64_t> id_at(int column) const {
        if (is_null(column)) return std::nullopt;
        return int_at(column);
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw StoreError(std::string("SQL bind failed: ") + sqlite3_errmsg(db_));
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

void exec_or_throw(sqlite3* db, const char* sql) {
    char* err_msg = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
        std::string message = err_msg ? err_msg : "unknown error";
        sqlite3_free(err_msg);
        throw StoreError("SQL error: " + message);
    }
}

// Rolls back unless committed.
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        exec_or_throw(db_, "BEGIN IMMEDIATE;");
    }

    ~Transaction() {
        if (!committed_) {
            sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    void commit() {
        exec_or_throw(db_, "COMMIT;");
        committed_ = true;
    }

private:
    sqlite3* db_;
    bool committed_ = false;
};

Credential read_credential(const Statement& stmt) {
    Credential credential;
    credential.id = stmt.int_at(0);
    credential.user_id = stmt.int_at(1);
    credential.name = stmt.text_at(2);
    credential.key_prefix = stmt.text_at(3);
    credential.key_hash = stmt.text_at(4);
    credential.created_at = from_millis(stmt.int_at(6));
    credential.last_used_at = stmt.time_at(7);
    credential.revoked_at = stmt.time_at(8);
    return credential;
}

constexpr const char* CREDENTIAL_COLUMNS =
    "id, user_id, name, key_prefix, key_hash, scopes, created_at, last_used_at, revoked_at";

constexpr const char* OUTBOUND_COLUMNS =
    "id, user_id, from_address, from_display_name, subject, text_body, html_body, message_id, "
    "in_reply_to, references_header, status, created_at, queued_at, sent_at, retry_count, "
    "next_retry_at, last_error";

OutboundEmail read_outbound(const Statement& stmt) {
    OutboundEmail email;
    email.id = stmt.int_at(0);
    email.user_id = stmt.int_at(1);
    email.from_address = stmt.text_at(2);
    email.from_display_name = stmt.text_at(3);
    email.subject = stmt.text_at(4);
    email.text_body = stmt.text_at(5);
    email.html_body = stmt.text_at(6);
    email.message_id = stmt.text_at(7);
    email.in_reply_to = stmt.text_at(8);
    email.references = stmt.text_at(9);
    email.status = static_cast<OutboundStatus>(stmt.int_at(10));
    email.created_at = from_millis(stmt.int_at(11));
    email.queued_at = stmt.time_at(12);
    email.sent_at = stmt.time_at(13);
    email.retry_count = static_cast<int>(stmt.int_at(14));
    email.next_retry_at = stmt.time_at(15);
    email.last_error = stmt.text_at(16);
    return email;
}

}  // namespace

SqliteStore::SqliteStore(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {
}

SqliteStore::~SqliteStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

bool SqliteStore::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (db_path_ != ":memory:") {
        if (auto parent = db_path_.parent_path(); !parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                last_error_ = "Cannot create " + parent.string() + ": " + ec.message();
                LOG_ERROR(last_error_);
                return false;
            }
        }
    }

    int rc = sqlite3_open(db_path_.string().c_str(), &db_);
    if (rc != SQLITE_OK) {
        last_error_ = std::string("Cannot open database: ") + sqlite3_errmsg(db_);
        LOG_ERROR(last_error_);
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_busy_timeout(db_, 5000);
    execute_sql("PRAGMA journal_mode=WAL;");
    execute_sql("PRAGMA foreign_keys=ON;");

    return create_tables();
}

bool SqliteStore::execute_sql(const char* sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        last_error_ = err_msg ? err_msg : "unknown error";
        sqlite3_free(err_msg);
        LOG_ERROR_FMT("SQL error: {}", last_error_);
        return false;
    }
    return true;
}

bool SqliteStore::create_tables() {
    const char* schema = R"(
        CREATE TABLE IF NOT EXISTS users (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            address TEXT UNIQUE NOT NULL,
            display_name TEXT NOT NULL DEFAULT '',
            active INTEGER NOT NULL DEFAULT 1,
            created_at INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS credentials (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            user_id INTEGER NOT NULL REFERENCES users(id) ON DELETE CASCADE,
            name TEXT NOT NULL DEFAULT '',
            key_prefix TEXT NOT NULL DEFAULT '',
            key_hash TEXT NOT NULL,
            scopes TEXT NOT NULL DEFAULT '',
            created_at INTEGER NOT NULL,
            last_used_at INTEGER,
            revoked_at INTEGER
        );
        CREATE INDEX IF NOT EXISTS idx_credentials_prefix ON credentials(key_prefix);
        CREATE INDEX IF NOT EXISTS idx_credentials_user ON credentials(user_id);

        CREATE TABLE IF NOT EXISTS emails (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            message_id TEXT NOT NULL,
            from_address TEXT NOT NULL DEFAULT '',
            from_display_name TEXT NOT NULL DEFAULT '',
            subject TEXT NOT NULL DEFAULT '',
            text_body TEXT NOT NULL DEFAULT '',
            html_body TEXT NOT NULL DEFAULT '',
            raw_content BLOB NOT NULL,
            received_at INTEGER NOT NULL,
            size_bytes INTEGER NOT NULL,
            in_reply_to TEXT NOT NULL DEFAULT '',
            references_header TEXT NOT NULL DEFAULT '',
            thread_id INTEGER,
            sent_by_user_id INTEGER
        );
        CREATE INDEX IF NOT EXISTS idx_emails_message_id ON emails(message_id);

        CREATE TABLE IF NOT EXISTS email_recipients (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            email_id INTEGER NOT NULL REFERENCES emails(id) ON DELETE CASCADE,
            address TEXT NOT NULL,
            display_name TEXT NOT NULL DEFAULT '',
            type INTEGER NOT NULL,
            user_id INTEGER,
            flags INTEGER NOT NULL DEFAULT 0,
            removed INTEGER NOT NULL DEFAULT 0
        );
        CREATE INDEX IF NOT EXISTS idx_recipients_user ON email_recipients(user_id, removed);
        CREATE INDEX IF NOT EXISTS idx_recipients_email ON email_recipients(email_id);

        CREATE TABLE IF NOT EXISTS email_attachments (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            email_id INTEGER NOT NULL REFERENCES emails(id) ON DELETE CASCADE,
            file_name TEXT NOT NULL DEFAULT '',
            content_type TEXT NOT NULL DEFAULT '',
            size_bytes INTEGER NOT NULL,
            content BLOB NOT NULL
        );

        CREATE TABLE IF NOT EXISTS outbound_emails (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            user_id INTEGER NOT NULL,
            from_address TEXT NOT NULL,
            from_display_name TEXT NOT NULL DEFAULT '',
            subject TEXT NOT NULL DEFAULT '',
            text_body TEXT NOT NULL DEFAULT '',
            html_body TEXT NOT NULL DEFAULT '',
            message_id TEXT NOT NULL DEFAULT '',
            in_reply_to TEXT NOT NULL DEFAULT '',
            references_header TEXT NOT NULL DEFAULT '',
            status INTEGER NOT NULL,
            created_at INTEGER NOT NULL,
            queued_at INTEGER,
            sent_at INTEGER,
            retry_count INTEGER NOT NULL DEFAULT 0,
            next_retry_at INTEGER,
            last_error TEXT NOT NULL DEFAULT ''
        );
        CREATE INDEX IF NOT EXISTS idx_outbound_due ON outbound_emails(status, next_retry_at);

        CREATE TABLE IF NOT EXISTS outbound_recipients (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            outbound_email_id INTEGER NOT NULL REFERENCES outbound_emails(id) ON DELETE CASCADE,
            address TEXT NOT NULL,
            display_name TEXT NOT NULL DEFAULT '',
            type INTEGER NOT NULL,
            status INTEGER NOT NULL,
            status_message TEXT NOT NULL DEFAULT '',
            delivered_at INTEGER
        );
        CREATE INDEX IF NOT EXISTS idx_outbound_recipients ON outbound_recipients(outbound_email_id);

        CREATE TABLE IF NOT EXISTS outbound_attachments (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            outbound_email_id INTEGER NOT NULL REFERENCES outbound_emails(id) ON DELETE CASCADE,
            file_name TEXT NOT NULL DEFAULT '',
            content_type TEXT NOT NULL DEFAULT '',
            content BLOB NOT NULL
        );

        CREATE TABLE IF NOT EXISTS delivery_logs (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            outbound_email_id INTEGER NOT NULL,
            recipient_id INTEGER NOT NULL,
            recipient_address TEXT NOT NULL,
            mx_host TEXT NOT NULL DEFAULT '',
            smtp_status_code INTEGER NOT NULL DEFAULT 0,
            smtp_response TEXT NOT NULL DEFAULT '',
            success INTEGER NOT NULL,
            error_message TEXT NOT NULL DEFAULT '',
            attempt_number INTEGER NOT NULL,
            attempted_at INTEGER NOT NULL,
            duration_ms INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_delivery_logs_email ON delivery_logs(outbound_email_id);
    )";

    return execute_sql(schema);
}

void SqliteStore::require_open() const {
    if (!db_) {
        throw StoreError("Database not initialized");
    }
}

// Administration

std::optional<int64_t> SqliteStore::create_user(const std::string& address,
                                                const std::string& display_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement stmt(db_, "INSERT OR IGNORE INTO users (address, display_name, created_at) VALUES (?, ?, ?);");
    stmt.bind_text(1, to_lower(trim(address)))
        .bind_text(2, display_name)
        .bind_int(3, to_millis(std::chrono::system_clock::now()));
    stmt.step();

    if (sqlite3_changes(db_) == 0) {
        last_error_ = "User " + address + " already exists";
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(db_);
}

std::vector<User> SqliteStore::list_users() {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    std::vector<User> users;
    Statement stmt(db_, "SELECT id, address, display_name, active FROM users ORDER BY address;");
    while (stmt.step()) {
        users.push_back(User{stmt.int_at(0), stmt.text_at(1), stmt.text_at(2), stmt.int_at(3) != 0});
    }
    return users;
}

std::optional<int64_t> SqliteStore::add_credential(int64_t user_id, const std::string& name,
                                                   const std::string& key_prefix,
                                                   const std::string& key_hash,
                                                   const ScopeSet& scopes) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement stmt(db_, R"(
        INSERT INTO credentials (user_id, name, key_prefix, key_hash, scopes, created_at)
        VALUES (?, ?, ?, ?, ?, ?);
    )");
    stmt.bind_int(1, user_id)
        .bind_text(2, name)
        .bind_text(3, key_prefix)
        .bind_text(4, key_hash)
        .bind_text(5, scopes.to_string())
        .bind_int(6, to_millis(std::chrono::system_clock::now()));
    stmt.step();
    return sqlite3_last_insert_rowid(db_);
}

std::vector<Credential> SqliteStore::list_credentials(int64_t user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    std::string sql = std::string("SELECT ") + CREDENTIAL_COLUMNS +
                      " FROM credentials WHERE user_id = ? ORDER BY id;";
    Statement stmt(db_, sql.c_str());
    stmt.bind_int(1, user_id);

    std::vector<Credential> credentials;
    while (stmt.step()) {
        auto credential = read_credential(stmt);
        credential.scopes = ScopeSet::parse(stmt.text_at(5)).value_or(ScopeSet{});
        credentials.push_back(std::move(credential));
    }
    return credentials;
}

bool SqliteStore::revoke_credential(int64_t credential_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement stmt(db_, "UPDATE credentials SET revoked_at = ? WHERE id = ? AND revoked_at IS NULL;");
    stmt.bind_int(1, to_millis(std::chrono::system_clock::now())).bind_int(2, credential_id);
    stmt.step();
    return sqlite3_changes(db_) > 0;
}

// UserStore

std::vector<Credential> SqliteStore::load_credentials(const char* sql, const std::string& key) {
    Statement stmt(db_, sql);
    stmt.bind_text(1, key);

    std::vector<Credential> credentials;
    while (stmt.step()) {
        auto credential = read_credential(stmt);
        auto scopes = ScopeSet::parse(stmt.text_at(5));
        if (!scopes) {
            LOG_WARNING_FMT("Key {} has unknown scopes '{}', ignoring it",
                            credential.id, stmt.text_at(5));
            continue;
        }
        credential.scopes = *scopes;
        credentials.push_back(std::move(credential));
    }
    return credentials;
}

std::optional<UserWithCredentials> SqliteStore::find_user_with_credentials(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement stmt(db_, "SELECT id, address, display_name, active FROM users WHERE address = ?;");
    stmt.bind_text(1, to_lower(address));
    if (!stmt.step()) {
        return std::nullopt;
    }

    UserWithCredentials result;
    result.user = User{stmt.int_at(0), stmt.text_at(1), stmt.text_at(2), stmt.int_at(3) != 0};

    result.credentials = load_credentials(R"(
        SELECT c.id, c.user_id, c.name, c.key_prefix, c.key_hash, c.scopes,
               c.created_at, c.last_used_at, c.revoked_at
        FROM credentials c JOIN users u ON u.id = c.user_id
        WHERE u.address = ? AND c.revoked_at IS NULL
        ORDER BY c.id;
    )", to_lower(address));
    return result;
}

std::vector<Credential> SqliteStore::find_credentials_by_prefix(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    if (prefix.empty()) return {};

    std::string sql = std::string("SELECT ") + CREDENTIAL_COLUMNS +
                      " FROM credentials WHERE key_prefix = ? AND revoked_at IS NULL ORDER BY id;";
    return load_credentials(sql.c_str(), prefix);
}

bool SqliteStore::mark_credential_used(int64_t credential_id, TimePoint when) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement stmt(db_, "UPDATE credentials SET last_used_at = ? WHERE id = ?;");
    stmt.bind_int(1, to_millis(when)).bind_int(2, credential_id);
    stmt.step();
    return sqlite3_changes(db_) > 0;
}

std::optional<User> SqliteStore::find_user_by_address(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement stmt(db_, "SELECT id, address, display_name, active FROM users WHERE address = ?;");
    stmt.bind_text(1, to_lower(trim(address)));
    if (!stmt.step()) {
        return std::nullopt;
    }
    return User{stmt.int_at(0), stmt.text_at(1), stmt.text_at(2), stmt.int_at(3) != 0};
}

// MessageStore

bool SqliteStore::save_email(InboundEmail& email) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Transaction tx(db_);

    Statement insert_email(db_, R"(
        INSERT INTO emails (message_id, from_address, from_display_name, subject, text_body,
                            html_body, raw_content, received_at, size_bytes, in_reply_to,
                            references_header, thread_id, sent_by_user_id)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )");
    insert_email.bind_text(1, email.message_id)
        .bind_text(2, email.from_address)
        .bind_text(3, email.from_display_name)
        .bind_text(4, email.subject)
        .bind_text(5, email.text_body)
        .bind_text(6, email.html_body)
        .bind_blob(7, email.raw_content)
        .bind_int(8, to_millis(email.received_at))
        .bind_int(9, static_cast<int64_t>(email.size_bytes))
        .bind_text(10, email.in_reply_to)
        .bind_text(11, email.references)
        .bind_id(12, email.thread_id)
        .bind_id(13, email.sent_by_user_id);
    insert_email.step();
    email.id = sqlite3_last_insert_rowid(db_);

    Statement insert_recipient(db_, R"(
        INSERT INTO email_recipients (email_id, address, display_name, type, user_id, flags)
        VALUES (?, ?, ?, ?, ?, ?);
    )");
    for (auto& recipient : email.recipients) {
        insert_recipient.reset();
        insert_recipient.bind_int(1, email.id)
            .bind_text(2, recipient.address)
            .bind_text(3, recipient.display_name)
            .bind_int(4, static_cast<int64_t>(recipient.type))
            .bind_id(5, recipient.user_id)
            .bind_int(6, recipient.user_id ? message_flags::RECENT : 0);
        insert_recipient.step();
        recipient.id = sqlite3_last_insert_rowid(db_);
    }

    Statement insert_attachment(db_, R"(
        INSERT INTO email_attachments (email_id, file_name, content_type, size_bytes, content)
        VALUES (?, ?, ?, ?, ?);
    )");
    for (auto& attachment : email.attachments) {
        insert_attachment.reset();
        insert_attachment.bind_int(1, email.id)
            .bind_text(2, attachment.file_name)
            .bind_text(3, attachment.content_type)
            .bind_int(4, static_cast<int64_t>(attachment.content.size()))
            .bind_blob(5, attachment.content);
        insert_attachment.step();
        attachment.id = sqlite3_last_insert_rowid(db_);
    }

    tx.commit();
    return true;
}

std::optional<InboundEmail> SqliteStore::find_by_message_id(const std::string& message_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement stmt(db_, R"(
        SELECT id, message_id, from_address, from_display_name, subject, received_at,
               size_bytes, in_reply_to, references_header, thread_id, sent_by_user_id
        FROM emails WHERE message_id = ? ORDER BY id LIMIT 1;
    )");
    stmt.bind_text(1, message_id);
    if (!stmt.step()) {
        return std::nullopt;
    }

    InboundEmail email;
    email.id = stmt.int_at(0);
    email.message_id = stmt.text_at(1);
    email.from_address = stmt.text_at(2);
    email.from_display_name = stmt.text_at(3);
    email.subject = stmt.text_at(4);
    email.received_at = from_millis(stmt.int_at(5));
    email.size_bytes = static_cast<uint64_t>(stmt.int_at(6));
    email.in_reply_to = stmt.text_at(7);
    email.references = stmt.text_at(8);
    email.thread_id = stmt.id_at(9);
    email.sent_by_user_id = stmt.id_at(10);
    return email;
}

std::vector<MessageSummary> SqliteStore::list_messages(int64_t user_id, size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement stmt(db_, R"(
        SELECT e.id, e.size_bytes, e.received_at, e.message_id, MAX(r.flags)
        FROM emails e JOIN email_recipients r ON r.email_id = e.id
        WHERE r.user_id = ? AND r.removed = 0
        GROUP BY e.id
        ORDER BY e.received_at DESC, e.id DESC
        LIMIT ?;
    )");
    stmt.bind_int(1, user_id).bind_int(2, static_cast<int64_t>(limit));

    std::vector<MessageSummary> messages;
    while (stmt.step()) {
        MessageSummary summary;
        summary.email_id = stmt.int_at(0);
        summary.uid = static_cast<uint32_t>(summary.email_id);
        summary.size = static_cast<uint64_t>(stmt.int_at(1));
        summary.received_at = from_millis(stmt.int_at(2));
        summary.message_id = stmt.text_at(3);
        summary.flags = static_cast<uint8_t>(stmt.int_at(4));
        messages.push_back(std::move(summary));
    }
    // Newest rows were selected; hand them back oldest first.
    std::reverse(messages.begin(), messages.end());
    return messages;
}

std::optional<std::string> SqliteStore::get_message_content(int64_t user_id, int64_t email_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement stmt(db_, R"(
        SELECT e.raw_content FROM emails e
        WHERE e.id = ? AND EXISTS (
            SELECT 1 FROM email_recipients r
            WHERE r.email_id = e.id AND r.user_id = ? AND r.removed = 0);
    )");
    stmt.bind_int(1, email_id).bind_int(2, user_id);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return stmt.blob_at(0);
}

bool SqliteStore::update_flags(int64_t user_id, int64_t email_id, uint8_t flags) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement stmt(db_, R"(
        UPDATE email_recipients SET flags = ?
        WHERE email_id = ? AND user_id = ? AND removed = 0;
    )");
    stmt.bind_int(1, flags).bind_int(2, email_id).bind_int(3, user_id);
    stmt.step();
    return sqlite3_changes(db_) > 0;
}

size_t SqliteStore::delete_messages(int64_t user_id, const std::vector<int64_t>& email_ids) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    if (email_ids.empty()) return 0;

    Transaction tx(db_);

    Statement remove(db_, R"(
        UPDATE email_recipients SET removed = 1
        WHERE email_id = ? AND user_id = ? AND removed = 0;
    )");
    Statement purge(db_, R"(
        DELETE FROM emails WHERE id = ? AND NOT EXISTS (
            SELECT 1 FROM email_recipients
            WHERE email_id = ? AND user_id IS NOT NULL AND removed = 0);
    )");

    size_t removed = 0;
    for (int64_t email_id : email_ids) {
        remove.reset();
        remove.bind_int(1, email_id).bind_int(2, user_id);
        remove.step();
        if (sqlite3_changes(db_) == 0) continue;
        ++removed;

        purge.reset();
        purge.bind_int(1, email_id).bind_int(2, email_id);
        purge.step();
    }

    tx.commit();
    return removed;
}

// OutboundStore

void SqliteStore::load_outbound_details(OutboundEmail& email) {
    Statement recipients(db_, R"(
        SELECT id, address, display_name, type, status, status_message, delivered_at
        FROM outbound_recipients WHERE outbound_email_id = ? ORDER BY id;
    )");
    recipients.bind_int(1, email.id);
    while (recipients.step()) {
        OutboundRecipient recipient;
        recipient.id = recipients.int_at(0);
        recipient.address = recipients.text_at(1);
        recipient.display_name = recipients.text_at(2);
        recipient.type = static_cast<RecipientType>(recipients.int_at(3));
        recipient.status = static_cast<RecipientStatus>(recipients.int_at(4));
        recipient.status_message = recipients.text_at(5);
        recipient.delivered_at = recipients.time_at(6);
        email.recipients.push_back(std::move(recipient));
    }

    Statement attachments(db_, R"(
        SELECT file_name, content_type, content
        FROM outbound_attachments WHERE outbound_email_id = ? ORDER BY id;
    )");
    attachments.bind_int(1, email.id);
    while (attachments.step()) {
        email.attachments.push_back(OutboundAttachment{
            attachments.text_at(0), attachments.text_at(1), attachments.blob_at(2)});
    }
}

bool SqliteStore::queue_outbound(OutboundEmail& email) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    auto now = std::chrono::system_clock::now();
    email.status = OutboundStatus::Queued;
    if (email.created_at == TimePoint{}) email.created_at = now;
    email.queued_at = now;

    Transaction tx(db_);

    Statement insert_email(db_, R"(
        INSERT INTO outbound_emails (user_id, from_address, from_display_name, subject, text_body,
                                     html_body, message_id, in_reply_to, references_header,
                                     status, created_at, queued_at, retry_count, next_retry_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )");
    insert_email.bind_int(1, email.user_id)
        .bind_text(2, email.from_address)
        .bind_text(3, email.from_display_name)
        .bind_text(4, email.subject)
        .bind_text(5, email.text_body)
        .bind_text(6, email.html_body)
        .bind_text(7, email.message_id)
        .bind_text(8, email.in_reply_to)
        .bind_text(9, email.references)
        .bind_int(10, static_cast<int64_t>(email.status))
        .bind_int(11, to_millis(email.created_at))
        .bind_time(12, email.queued_at)
        .bind_int(13, email.retry_count)
        .bind_time(14, email.next_retry_at);
    insert_email.step();
    email.id = sqlite3_last_insert_rowid(db_);

    Statement insert_recipient(db_, R"(
        INSERT INTO outbound_recipients (outbound_email_id, address, display_name, type, status)
        VALUES (?, ?, ?, ?, ?);
    )");
    for (auto& recipient : email.recipients) {
        insert_recipient.reset();
        insert_recipient.bind_int(1, email.id)
            .bind_text(2, recipient.address)
            .bind_text(3, recipient.display_name)
            .bind_int(4, static_cast<int64_t>(recipient.type))
            .bind_int(5, static_cast<int64_t>(recipient.status));
        insert_recipient.step();
        recipient.id = sqlite3_last_insert_rowid(db_);
    }

    Statement insert_attachment(db_, R"(
        INSERT INTO outbound_attachments (outbound_email_id, file_name, content_type, content)
        VALUES (?, ?, ?, ?);
    )");
    for (const auto& attachment : email.attachments) {
        insert_attachment.reset();
        insert_attachment.bind_int(1, email.id)
            .bind_text(2, attachment.file_name)
            .bind_text(3, attachment.content_type)
            .bind_blob(4, attachment.content);
        insert_attachment.step();
    }

    tx.commit();
    return true;
}

std::optional<OutboundEmail> SqliteStore::find_outbound(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    std::string sql = std::string("SELECT ") + OUTBOUND_COLUMNS + " FROM outbound_emails WHERE id = ?;";
    Statement stmt(db_, sql.c_str());
    stmt.bind_int(1, id);
    if (!stmt.step()) {
        return std::nullopt;
    }

    auto email = read_outbound(stmt);
    load_outbound_details(email);
    return email;
}

std::vector<DeliveryLog> SqliteStore::delivery_logs(int64_t outbound_email_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement stmt(db_, R"(
        SELECT id, outbound_email_id, recipient_id, recipient_address, mx_host, smtp_status_code,
               smtp_response, success, error_message, attempt_number, attempted_at, duration_ms
        FROM delivery_logs WHERE outbound_email_id = ? ORDER BY id;
    )");
    stmt.bind_int(1, outbound_email_id);

    std::vector<DeliveryLog> logs;
    while (stmt.step()) {
        DeliveryLog log;
        log.id = stmt.int_at(0);
        log.outbound_email_id = stmt.int_at(1);
        log.recipient_id = stmt.int_at(2);
        log.recipient_address = stmt.text_at(3);
        log.mx_host = stmt.text_at(4);
        log.smtp_status_code = static_cast<int>(stmt.int_at(5));
        log.smtp_response = stmt.text_at(6);
        log.success = stmt.int_at(7) != 0;
        log.error_message = stmt.text_at(8);
        log.attempt_number = static_cast<int>(stmt.int_at(9));
        log.attempted_at = from_millis(stmt.int_at(10));
        log.duration = std::chrono::milliseconds(stmt.int_at(11));
        logs.push_back(std::move(log));
    }
    return logs;
}

std::vector<OutboundEmail> SqliteStore::fetch_due(size_t limit, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    std::string sql = std::string("SELECT ") + OUTBOUND_COLUMNS + R"(
        FROM outbound_emails
        WHERE status = ? AND (next_retry_at IS NULL OR next_retry_at <= ?)
        ORDER BY COALESCE(queued_at, created_at), id
        LIMIT ?;
    )";
    Statement stmt(db_, sql.c_str());
    stmt.bind_int(1, static_cast<int64_t>(OutboundStatus::Queued))
        .bind_int(2, to_millis(now))
        .bind_int(3, static_cast<int64_t>(limit));

    std::vector<OutboundEmail> emails;
    while (stmt.step()) {
        emails.push_back(read_outbound(stmt));
    }
    for (auto& email : emails) {
        load_outbound_details(email);
    }
    return emails;
}

bool SqliteStore::update(const OutboundEmail& email) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Transaction tx(db_);

    Statement update_email(db_, R"(
        UPDATE outbound_emails
        SET status = ?, sent_at = ?, retry_count = ?, next_retry_at = ?, last_error = ?, message_id = ?
        WHERE id = ?;
    )");
    update_email.bind_int(1, static_cast<int64_t>(email.status))
        .bind_time(2, email.sent_at)
        .bind_int(3, email.retry_count)
        .bind_time(4, email.next_retry_at)
        .bind_text(5, email.last_error)
        .bind_text(6, email.message_id)
        .bind_int(7, email.id);
    update_email.step();
    if (sqlite3_changes(db_) == 0) {
        return false;
    }

    Statement update_recipient(db_, R"(
        UPDATE outbound_recipients SET status = ?, status_message = ?, delivered_at = ?
        WHERE id = ? AND outbound_email_id = ?;
    )");
    for (const auto& recipient : email.recipients) {
        update_recipient.reset();
        update_recipient.bind_int(1, static_cast<int64_t>(recipient.status))
            .bind_text(2, recipient.status_message)
            .bind_time(3, recipient.delivered_at)
            .bind_int(4, recipient.id)
            .bind_int(5, email.id);
        update_recipient.step();
    }

    tx.commit();
    return true;
}

bool SqliteStore::append_delivery_log(const DeliveryLog& log) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement stmt(db_, R"(
        INSERT INTO delivery_logs (outbound_email_id, recipient_id, recipient_address, mx_host,
                                   smtp_status_code, smtp_response, success, error_message,
                                   attempt_number, attempted_at, duration_ms)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )");
    stmt.bind_int(1, log.outbound_email_id)
        .bind_int(2, log.recipient_id)
        .bind_text(3, log.recipient_address)
        .bind_text(4, log.mx_host)
        .bind_int(5, log.smtp_status_code)
        .bind_text(6, log.smtp_response)
        .bind_int(7, log.success ? 1 : 0)
        .bind_text(8, log.error_message)
        .bind_int(9, log.attempt_number)
        .bind_int(10, to_millis(log.attempted_at))
        .bind_int(11, log.duration.count());
    stmt.step();
    return true;
}

size_t SqliteStore::requeue_interrupted() {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement stmt(db_, "UPDATE outbound_emails SET status = ? WHERE status = ?;");
    stmt.bind_int(1, static_cast<int64_t>(OutboundStatus::Queued))
        .bind_int(2, static_cast<int64_t>(OutboundStatus::Sending));
    stmt.step();
    return static_cast<size_t>(sqlite3_changes(db_));
}

}  // namespace mailcore
