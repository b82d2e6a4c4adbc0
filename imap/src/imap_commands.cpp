#include "imap_commands.hpp"
#include "imap_fetch.hpp"
#include "imap_parser.hpp"
#include "mime/message_parser.hpp"
#include "encoding.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace mailcore::imap {

namespace {

const std::string SYSTEM_FLAGS = "(\\Seen \\Answered \\Flagged \\Deleted \\Draft)";

std::pair<std::string, std::string> split_first(std::string_view text) {
    std::string trimmed = trim(text);
    auto space = trimmed.find(' ');
    if (space == std::string::npos) {
        return {trimmed, ""};
    }
    return {trimmed.substr(0, space), trim(std::string_view(trimmed).substr(space + 1))};
}

std::string completed(const Command& cmd) {
    return (cmd.uid ? "UID " : "") + cmd.name + " completed";
}

bool valid_tag(std::string_view tag) {
    if (tag.empty()) return false;
    return std::all_of(tag.begin(), tag.end(), [](char c) {
        return c != '+' && IMAPParser::is_atom_char(c);
    });
}

// '*' matches anything, '%' anything but the hierarchy delimiter.
bool wildcard_match(std::string_view pattern, std::string_view name) {
    if (pattern.empty()) return name.empty();

    char p = pattern.front();
    if (p == '*' || p == '%') {
        for (size_t i = 0; i <= name.size(); ++i) {
            if (wildcard_match(pattern.substr(1), name.substr(i))) return true;
            if (i < name.size() && p == '%' && name[i] == '/') return false;
        }
        return false;
    }

    if (name.empty()) return false;
    if (std::toupper(static_cast<unsigned char>(p)) != std::toupper(static_cast<unsigned char>(name.front()))) {
        return false;
    }
    return wildcard_match(pattern.substr(1), name.substr(1));
}

// Lazily loaded message content for FETCH and SEARCH.
class MessageContent {
public:
    MessageContent(SessionContext& ctx, const MailboxMessage& message)
        : ctx_(ctx), message_(message) {}

    const std::string& raw() {
        if (!raw_) {
            auto content = ctx_.store.get_message_content(ctx_.user->id, message_.email_id);
            if (!content) {
                LOG_WARNING_FMT("Content of message {} for {} is missing", message_.email_id, ctx_.user->address);
            }
            raw_ = content.value_or("");
        }
        return *raw_;
    }

    const std::vector<mime::Header>& headers() {
        if (!headers_) {
            headers_ = mime::parse_headers(mime::split_message(raw()).header);
        }
        return *headers_;
    }

private:
    SessionContext& ctx_;
    const MailboxMessage& message_;
    std::optional<std::string> raw_;
    std::optional<std::vector<mime::Header>> headers_;
};

bool contains_text(std::string_view haystack, std::string_view needle) {
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

bool header_contains(MessageContent& content, std::string_view name, std::string_view value) {
    for (const auto& header : content.headers()) {
        if (!iequals(header.name, name)) continue;
        if (value.empty() || contains_text(mime::decode_encoded_words(header.value), value)) {
            return true;
        }
    }
    return false;
}

bool matches(const SearchKey& key, const SessionContext& ctx, uint32_t seq,
             const MailboxMessage& message, MessageContent& content) {
    using Type = SearchKey::Type;
    const Flags& flags = message.flags;
    auto day = std::chrono::floor<std::chrono::days>(message.internal_date);

    switch (key.type) {
        case Type::All: return true;
        case Type::And:
            return std::all_of(key.children.begin(), key.children.end(), [&](const SearchKey& child) {
                return matches(child, ctx, seq, message, content);
            });
        case Type::Or:
            return matches(key.children[0], ctx, seq, message, content) ||
                   matches(key.children[1], ctx, seq, message, content);
        case Type::Not: return !matches(key.children[0], ctx, seq, message, content);
        case Type::SequenceNumbers: return key.set->contains(seq, ctx.exists());
        case Type::Uid: return key.set->contains(message.uid, ctx.max_uid());
        case Type::Seen: return flags.has(Flag::Seen);
        case Type::Unseen: return !flags.has(Flag::Seen);
        case Type::Answered: return flags.has(Flag::Answered);
        case Type::Unanswered: return !flags.has(Flag::Answered);
        case Type::Deleted: return flags.has(Flag::Deleted);
        case Type::Undeleted: return !flags.has(Flag::Deleted);
        case Type::Flagged: return flags.has(Flag::Flagged);
        case Type::Unflagged: return !flags.has(Flag::Flagged);
        case Type::Draft: return flags.has(Flag::Draft);
        case Type::Undraft: return !flags.has(Flag::Draft);
        case Type::Recent: return flags.has(Flag::Recent);
        case Type::New: return flags.has(Flag::Recent) && !flags.has(Flag::Seen);
        case Type::Old: return !flags.has(Flag::Recent);
        case Type::Larger: return message.size > key.number;
        case Type::Smaller: return message.size < key.number;
        case Type::Before: return day < key.date;
        case Type::On: return day == key.date;
        case Type::Since: return day >= key.date;
        case Type::From: return header_contains(content, "From", key.value);
        case Type::To: return header_contains(content, "To", key.value);
        case Type::Cc: return header_contains(content, "Cc", key.value);
        case Type::Bcc: return header_contains(content, "Bcc", key.value);
        case Type::Subject: return header_contains(content, "Subject", key.value);
        case Type::Header: return header_contains(content, key.header_name, key.value);
        case Type::Body: return contains_text(mime::split_message(content.raw()).body, key.value);
        case Type::Text: return contains_text(content.raw(), key.value);
    }
    return false;
}

std::string flags_item(Flags flags) {
    return "FLAGS (" + to_imap_string(flags) + ")";
}

std::vector<std::string> select_mailbox(SessionContext& ctx, const Command& cmd, bool examine) {
    if (cmd.args.size() != 1) {
        return {response::bad(cmd.tag, "Mailbox name required")};
    }

    std::vector<std::string> responses;
    if (ctx.state == SessionState::Selected) {
        ctx.deselect();
        responses.push_back(response::untagged("OK [CLOSED] Previous mailbox is now closed"));
    }

    if (!iequals(cmd.args[0], "INBOX")) {
        responses.push_back(response::no(cmd.tag, "Mailbox does not exist"));
        return responses;
    }

    ctx.select("INBOX", examine);

    responses.push_back(response::untagged(std::format("{} EXISTS", ctx.exists())));
    responses.push_back(response::untagged(std::format("{} RECENT", ctx.count(Flag::Recent))));
    responses.push_back(response::untagged("FLAGS " + SYSTEM_FLAGS));
    responses.push_back(response::untagged(examine ? "OK [PERMANENTFLAGS ()] No permanent flags permitted"
                                                   : "OK [PERMANENTFLAGS " + SYSTEM_FLAGS + "] Limited"));
    responses.push_back(response::untagged(std::format("OK [UIDVALIDITY {}] UIDs valid", uid_validity())));
    responses.push_back(response::untagged(std::format("OK [UIDNEXT {}] Predicted next UID", ctx.uid_next())));

    for (uint32_t seq = 1; seq <= ctx.exists(); ++seq) {
        if (!ctx.messages[seq - 1].flags.has(Flag::Seen)) {
            responses.push_back(response::untagged(std::format("OK [UNSEEN {}] First unseen", seq)));
            break;
        }
    }

    responses.push_back(response::ok(cmd.tag, examine ? "[READ-ONLY] EXAMINE completed"
                                                      : "[READ-WRITE] SELECT completed"));
    return responses;
}

std::vector<std::string> list_mailboxes(const Command& cmd, const char* verb) {
    std::string error;
    auto tokens = IMAPParser::tokenize(cmd.raw, error);
    if (!tokens) {
        return {response::bad(cmd.tag, error)};
    }
    if (tokens->size() != 2 || tokens->front() == "(") {
        return {response::bad(cmd.tag, std::format("{} expects a reference and a mailbox pattern", verb))};
    }

    const std::string& reference = (*tokens)[0];
    const std::string& pattern = (*tokens)[1];

    std::vector<std::string> responses;
    if (pattern.empty()) {
        responses.push_back(response::untagged(std::format("{} (\\Noselect) \"/\" \"\"", verb)));
    } else if (wildcard_match(reference + pattern, "INBOX")) {
        responses.push_back(response::untagged(std::format("{} (\\HasNoChildren) \"/\" INBOX", verb)));
    }

    responses.push_back(response::ok(cmd.tag, std::string(verb) + " completed"));
    return responses;
}

}  // namespace

Command Command::parse(std::string_view line) {
    Command cmd;

    std::string text = trim(line);
    if (text.empty()) {
        cmd.tag = "*";
        cmd.name = "NOOP";
        cmd.type = CommandType::NOOP;
        return cmd;
    }

    auto space = text.find(' ');
    cmd.tag = text.substr(0, space);
    if (!valid_tag(cmd.tag)) {
        cmd.tag = "*";
        cmd.error = "Invalid tag";
        return cmd;
    }
    if (space == std::string::npos) {
        cmd.error = "Missing command";
        return cmd;
    }

    std::string rest = trim(std::string_view(text).substr(space + 1));
    auto name_end = rest.find(' ');
    cmd.name = to_upper(std::string_view(rest).substr(0, name_end));
    cmd.raw = name_end == std::string::npos ? "" : rest.substr(name_end + 1);
    cmd.type = string_to_type(cmd.name);

    if (cmd.type != CommandType::UNKNOWN && !keeps_raw_arguments(cmd.type)) {
        std::string error;
        auto tokens = IMAPParser::tokenize(cmd.raw, error);
        if (!tokens) {
            cmd.error = error;
        } else {
            cmd.args = std::move(*tokens);
        }
    }

    return cmd;
}

CommandType Command::string_to_type(const std::string& name) {
    static const std::unordered_map<std::string, CommandType> mapping = {
        {"CAPABILITY", CommandType::CAPABILITY},
        {"NOOP", CommandType::NOOP},
        {"LOGOUT", CommandType::LOGOUT},
        {"ENABLE", CommandType::ENABLE},
        {"AUTHENTICATE", CommandType::AUTHENTICATE},
        {"LOGIN", CommandType::LOGIN},
        {"SELECT", CommandType::SELECT},
        {"EXAMINE", CommandType::EXAMINE},
        {"LIST", CommandType::LIST},
        {"LSUB", CommandType::LSUB},
        {"STATUS", CommandType::STATUS},
        {"CHECK", CommandType::CHECK},
        {"CLOSE", CommandType::CLOSE},
        {"UNSELECT", CommandType::UNSELECT},
        {"EXPUNGE", CommandType::EXPUNGE},
        {"SEARCH", CommandType::SEARCH},
        {"FETCH", CommandType::FETCH},
        {"STORE", CommandType::STORE},
        {"UID", CommandType::UID}
    };

    auto it = mapping.find(name);
    return it != mapping.end() ? it->second : CommandType::UNKNOWN;
}

std::string Command::type_to_string(CommandType type) {
    switch (type) {
        case CommandType::CAPABILITY: return "CAPABILITY";
        case CommandType::NOOP: return "NOOP";
        case CommandType::LOGOUT: return "LOGOUT";
        case CommandType::ENABLE: return "ENABLE";
        case CommandType::AUTHENTICATE: return "AUTHENTICATE";
        case CommandType::LOGIN: return "LOGIN";
        case CommandType::SELECT: return "SELECT";
        case CommandType::EXAMINE: return "EXAMINE";
        case CommandType::LIST: return "LIST";
        case CommandType::LSUB: return "LSUB";
        case CommandType::STATUS: return "STATUS";
        case CommandType::CHECK: return "CHECK";
        case CommandType::CLOSE: return "CLOSE";
        case CommandType::UNSELECT: return "UNSELECT";
        case CommandType::EXPUNGE: return "EXPUNGE";
        case CommandType::SEARCH: return "SEARCH";
        case CommandType::FETCH: return "FETCH";
        case CommandType::STORE: return "STORE";
        case CommandType::UID: return "UID";
        default: return "UNKNOWN";
    }
}

bool Command::keeps_raw_arguments(CommandType type) {
    switch (type) {
        case CommandType::FETCH:
        case CommandType::STORE:
        case CommandType::SEARCH:
        case CommandType::STATUS:
        case CommandType::LIST:
        case CommandType::LSUB:
        case CommandType::UID:
            return true;
        default:
            return false;
    }
}

CommandHandler& CommandHandler::instance() {
    static CommandHandler instance;
    return instance;
}

CommandHandler::CommandHandler() {
    handlers_[CommandType::CAPABILITY] = handle_capability;
    handlers_[CommandType::NOOP] = handle_noop;
    handlers_[CommandType::LOGOUT] = handle_logout;
    handlers_[CommandType::ENABLE] = handle_enable;
    handlers_[CommandType::AUTHENTICATE] = handle_authenticate;
    handlers_[CommandType::LOGIN] = handle_login;
    handlers_[CommandType::SELECT] = handle_select;
    handlers_[CommandType::EXAMINE] = handle_examine;
    handlers_[CommandType::LIST] = handle_list;
    handlers_[CommandType::LSUB] = handle_lsub;
    handlers_[CommandType::STATUS] = handle_status;
    handlers_[CommandType::CHECK] = handle_check;
    handlers_[CommandType::CLOSE] = handle_close;
    handlers_[CommandType::UNSELECT] = handle_unselect;
    handlers_[CommandType::EXPUNGE] = handle_expunge;
    handlers_[CommandType::SEARCH] = handle_search;
    handlers_[CommandType::FETCH] = handle_fetch;
    handlers_[CommandType::STORE] = handle_store;
    handlers_[CommandType::UID] = handle_uid;
}

bool CommandHandler::allowed_in(SessionState state, CommandType type) {
    switch (type) {
        case CommandType::CAPABILITY:
        case CommandType::NOOP:
        case CommandType::LOGOUT:
            return state != SessionState::Logout;
        case CommandType::AUTHENTICATE:
        case CommandType::LOGIN:
            return state == SessionState::NotAuthenticated;
        case CommandType::ENABLE:
        case CommandType::SELECT:
        case CommandType::EXAMINE:
        case CommandType::LIST:
        case CommandType::LSUB:
        case CommandType::STATUS:
            return state == SessionState::Authenticated || state == SessionState::Selected;
        default:
            return state == SessionState::Selected;
    }
}

std::vector<std::string> CommandHandler::execute(SessionContext& ctx, const Command& cmd) {
    if (!cmd.valid()) {
        return {response::bad(cmd.tag, cmd.error)};
    }

    auto it = handlers_.find(cmd.type);
    if (it == handlers_.end()) {
        return {response::bad(cmd.tag, "Unknown command")};
    }

    if (!allowed_in(ctx.state, cmd.type)) {
        return {response::bad(cmd.tag, std::format("{} not allowed in {} state",
                                                   cmd.name, state_name(ctx.state)))};
    }

    try {
        return it->second(ctx, cmd);
    } catch (const std::exception& e) {
        LOG_ERROR_FMT("IMAP {} from {} failed: {}", cmd.name, ctx.client_address, e.what());
        return {response::bad(cmd.tag, "Internal server error")};
    }
}

std::vector<std::string> CommandHandler::continue_authenticate(SessionContext& ctx, const std::string& line) {
    std::string tag = ctx.pending_authenticate.value_or("*");
    ctx.pending_authenticate.reset();

    if (trim(line) == "*") {
        return {response::bad(tag, "AUTHENTICATE cancelled")};
    }

    try {
        return plain_login(ctx, tag, trim(line));
    } catch (const std::exception& e) {
        LOG_ERROR_FMT("IMAP AUTHENTICATE from {} failed: {}", ctx.client_address, e.what());
        return {response::bad(tag, "Internal server error")};
    }
}

std::string CommandHandler::capabilities() {
    return "IMAP4rev2 AUTH=PLAIN LITERAL+ ENABLE UNSELECT UIDPLUS CHILDREN";
}

std::vector<std::string> CommandHandler::handle_capability(SessionContext& /* ctx */, const Command& cmd) {
    return {
        response::untagged("CAPABILITY " + capabilities()),
        response::ok(cmd.tag, "CAPABILITY completed")
    };
}

std::vector<std::string> CommandHandler::handle_noop(SessionContext& /* ctx */, const Command& cmd) {
    return {response::ok(cmd.tag, "NOOP completed")};
}

std::vector<std::string> CommandHandler::handle_logout(SessionContext& ctx, const Command& cmd) {
    if (ctx.state == SessionState::Selected && !ctx.read_only) {
        ctx.expunge();
    }
    ctx.state = SessionState::Logout;
    return {
        response::bye("IMAP4rev2 server logging out"),
        response::ok(cmd.tag, "LOGOUT completed")
    };
}

std::vector<std::string> CommandHandler::handle_enable(SessionContext& ctx, const Command& cmd) {
    if (cmd.args.empty()) {
        return {response::bad(cmd.tag, "ENABLE expects at least one capability")};
    }

    std::string enabled;
    for (const auto& capability : cmd.args) {
        if (iequals(capability, "UTF8=ACCEPT") && ctx.enabled_extensions.insert("UTF8=ACCEPT").second) {
            enabled += " UTF8=ACCEPT";
        }
    }

    return {
        response::untagged("ENABLED" + enabled),
        response::ok(cmd.tag, "ENABLE completed")
    };
}

std::vector<std::string> CommandHandler::handle_authenticate(SessionContext& ctx, const Command& cmd) {
    if (cmd.args.empty() || cmd.args.size() > 2) {
        return {response::bad(cmd.tag, "AUTHENTICATE expects a mechanism")};
    }
    if (!iequals(cmd.args[0], "PLAIN")) {
        return {response::no(cmd.tag, "Unsupported authentication mechanism")};
    }

    if (cmd.args.size() == 2) {
        return plain_login(ctx, cmd.tag, cmd.args[1]);
    }

    ctx.pending_authenticate = cmd.tag;
    return {response::continuation()};
}

std::vector<std::string> CommandHandler::plain_login(SessionContext& ctx, const std::string& tag,
                                                     const std::string& encoded) {
    std::optional<std::string> decoded = encoded == "=" ? std::optional<std::string>("")
                                                        : base64_decode(encoded);
    if (!decoded) {
        return {response::bad(tag, "Invalid base64 data")};
    }

    // authzid NUL authcid NUL passwd
    auto first = decoded->find('\0');
    auto second = first == std::string::npos ? std::string::npos : decoded->find('\0', first + 1);
    if (second == std::string::npos) {
        return {response::bad(tag, "Malformed PLAIN response")};
    }

    std::string authzid = decoded->substr(0, first);
    std::string authcid = decoded->substr(first + 1, second - first - 1);
    std::string password = decoded->substr(second + 1);

    if (!authzid.empty() && !iequals(authzid, authcid)) {
        LOG_WARNING_FMT("IMAP AUTHENTICATE from {} asked to act as {}", ctx.client_address, authzid);
        return {response::no(tag, "[AUTHENTICATIONFAILED] Authentication failed")};
    }

    return login(ctx, tag, authcid, password, "AUTHENTICATE");
}

std::vector<std::string> CommandHandler::login(SessionContext& ctx, const std::string& tag,
                                               const std::string& identifier, const std::string& secret,
                                               const char* command) {
    auto result = ctx.authenticator.authenticate(identifier, secret, Protocol::Imap, ctx.client_address);
    auto* success = std::get_if<auth_result::Success>(&result);
    if (!success) {
        return {response::no(tag, "[AUTHENTICATIONFAILED] Authentication failed")};
    }

    ctx.user = success->user;
    ctx.state = SessionState::Authenticated;
    return {response::ok(tag, std::format("[CAPABILITY {}] {} completed", capabilities(), command))};
}

std::vector<std::string> CommandHandler::handle_login(SessionContext& ctx, const Command& cmd) {
    if (cmd.args.size() != 2) {
        return {response::bad(cmd.tag, "LOGIN expects a user name and a password")};
    }
    return login(ctx, cmd.tag, cmd.args[0], cmd.args[1], "LOGIN");
}

std::vector<std::string> CommandHandler::handle_select(SessionContext& ctx, const Command& cmd) {
    return select_mailbox(ctx, cmd, false);
}

std::vector<std::string> CommandHandler::handle_examine(SessionContext& ctx, const Command& cmd) {
    return select_mailbox(ctx, cmd, true);
}

std::vector<std::string> CommandHandler::handle_list(SessionContext& /* ctx */, const Command& cmd) {
    return list_mailboxes(cmd, "LIST");
}

std::vector<std::string> CommandHandler::handle_lsub(SessionContext& /* ctx */, const Command& cmd) {
    return list_mailboxes(cmd, "LSUB");
}

std::vector<std::string> CommandHandler::handle_status(SessionContext& ctx, const Command& cmd) {
    std::string error;
    auto tokens = IMAPParser::tokenize(cmd.raw, error);
    if (!tokens) {
        return {response::bad(cmd.tag, error)};
    }
    if (tokens->size() < 4 || (*tokens)[1] != "(" || tokens->back() != ")") {
        return {response::bad(cmd.tag, "STATUS expects a mailbox and a list of items")};
    }
    if (!iequals((*tokens)[0], "INBOX")) {
        return {response::no(cmd.tag, "Mailbox does not exist")};
    }

    std::vector<MailboxMessage> loaded;
    const std::vector<MailboxMessage>* messages = &ctx.messages;
    if (ctx.state != SessionState::Selected) {
        for (const auto& summary : ctx.store.list_messages(ctx.user->id, ctx.config.max_messages_per_session)) {
            loaded.push_back(MailboxMessage{summary.email_id, summary.uid, summary.size,
                                            Flags(summary.flags), summary.received_at});
        }
        messages = &loaded;
    }

    auto count = [messages](auto predicate) {
        return std::count_if(messages->begin(), messages->end(), predicate);
    };
    uint32_t max_uid = 0;
    uint64_t total_size = 0;
    for (const auto& message : *messages) {
        max_uid = std::max(max_uid, message.uid);
        total_size += message.size;
    }

    std::string items;
    for (size_t i = 2; i + 1 < tokens->size(); ++i) {
        std::string item = to_upper((*tokens)[i]);
        std::string value;
        if (item == "MESSAGES") {
            value = std::to_string(messages->size());
        } else if (item == "RECENT") {
            value = std::to_string(count([](const MailboxMessage& m) { return m.flags.has(Flag::Recent); }));
        } else if (item == "UNSEEN") {
            value = std::to_string(count([](const MailboxMessage& m) { return !m.flags.has(Flag::Seen); }));
        } else if (item == "DELETED") {
            value = std::to_string(count([](const MailboxMessage& m) { return m.flags.has(Flag::Deleted); }));
        } else if (item == "UIDNEXT") {
            value = std::to_string(max_uid + 1);
        } else if (item == "UIDVALIDITY") {
            value = std::to_string(uid_validity());
        } else if (item == "SIZE") {
            value = std::to_string(total_size);
        } else {
            return {response::bad(cmd.tag, "Unknown STATUS item " + item)};
        }
        if (!items.empty()) items += ' ';
        items += item + " " + value;
    }

    return {
        response::untagged("STATUS INBOX (" + items + ")"),
        response::ok(cmd.tag, "STATUS completed")
    };
}

std::vector<std::string> CommandHandler::handle_check(SessionContext& /* ctx */, const Command& cmd) {
    return {response::ok(cmd.tag, "CHECK completed")};
}

std::vector<std::string> CommandHandler::handle_close(SessionContext& ctx, const Command& cmd) {
    if (!ctx.read_only) {
        ctx.expunge();
    }
    ctx.deselect();
    return {response::ok(cmd.tag, "CLOSE completed")};
}

std::vector<std::string> CommandHandler::handle_unselect(SessionContext& ctx, const Command& cmd) {
    ctx.deselect();
    return {response::ok(cmd.tag, "UNSELECT completed")};
}

std::vector<std::string> CommandHandler::handle_expunge(SessionContext& ctx, const Command& cmd) {
    if (ctx.read_only) {
        return {response::no(cmd.tag, "Mailbox is read-only")};
    }

    std::optional<std::vector<uint32_t>> uids;
    if (cmd.uid) {
        if (cmd.args.size() != 1) {
            return {response::bad(cmd.tag, "UID EXPUNGE expects a UID set")};
        }
        auto set = SequenceSet::parse(cmd.args[0]);
        if (!set) {
            return {response::bad(cmd.tag, "Invalid UID set")};
        }
        uids.emplace();
        for (const auto& message : ctx.messages) {
            if (set->contains(message.uid, ctx.max_uid())) {
                uids->push_back(message.uid);
            }
        }
    } else if (!cmd.args.empty()) {
        return {response::bad(cmd.tag, "EXPUNGE takes no arguments")};
    }

    std::vector<std::string> responses;
    for (uint32_t seq : ctx.expunge(uids)) {
        responses.push_back(response::untagged(std::format("{} EXPUNGE", seq)));
    }
    responses.push_back(response::ok(cmd.tag, completed(cmd)));
    return responses;
}

std::vector<std::string> CommandHandler::handle_search(SessionContext& ctx, const Command& cmd) {
    auto key = IMAPParser::parse_search(cmd.raw);
    if (!key) {
        return {response::bad(cmd.tag, "Invalid search criteria")};
    }

    std::string result = "SEARCH";
    for (uint32_t seq = 1; seq <= ctx.exists(); ++seq) {
        const auto& message = ctx.messages[seq - 1];
        MessageContent content(ctx, message);
        if (matches(*key, ctx, seq, message, content)) {
            result += " " + std::to_string(cmd.uid ? message.uid : seq);
        }
    }

    return {
        response::untagged(result),
        response::ok(cmd.tag, completed(cmd))
    };
}

std::vector<std::string> CommandHandler::handle_fetch(SessionContext& ctx, const Command& cmd) {
    auto [set_text, items_text] = split_first(cmd.raw);
    auto set = SequenceSet::parse(set_text);
    auto items = items_text.empty() ? std::nullopt : IMAPParser::parse_fetch_items(items_text);
    if (!set || !items) {
        return {response::bad(cmd.tag, "Invalid FETCH arguments")};
    }

    bool has_uid = std::any_of(items->begin(), items->end(),
                               [](const FetchItem& item) { return item.type == FetchItem::Type::UID; });
    if (cmd.uid && !has_uid) {
        items->insert(items->begin(), FetchItem{});
    }
    bool has_flags = std::any_of(items->begin(), items->end(),
                                 [](const FetchItem& item) { return item.type == FetchItem::Type::FLAGS; });
    bool marks_seen = !ctx.read_only && std::any_of(items->begin(), items->end(),
                                                    [](const FetchItem& item) { return item.sets_seen(); });

    std::vector<std::string> responses;
    for (uint32_t seq = 1; seq <= ctx.exists(); ++seq) {
        auto& message = ctx.messages[seq - 1];
        bool selected = cmd.uid ? set->contains(message.uid, ctx.max_uid())
                                : set->contains(seq, ctx.exists());
        if (!selected) continue;

        MessageContent content(ctx, message);
        bool seen_changed = false;
        if (marks_seen && !message.flags.has(Flag::Seen)) {
            Flags updated = message.flags;
            updated.set(Flag::Seen);
            ctx.update_flags(message, updated);
            seen_changed = true;
        }

        std::string data;
        for (const auto& item : *items) {
            if (!data.empty()) data += ' ';
            switch (item.type) {
                case FetchItem::Type::UID:
                    data += std::format("UID {}", message.uid);
                    break;
                case FetchItem::Type::FLAGS:
                    data += flags_item(message.flags);
                    break;
                case FetchItem::Type::INTERNALDATE:
                    data += "INTERNALDATE \"" + IMAPParser::format_internal_date(message.internal_date) + "\"";
                    break;
                case FetchItem::Type::RFC822_SIZE:
                    data += std::format("RFC822.SIZE {}", message.size);
                    break;
                case FetchItem::Type::ENVELOPE:
                    data += "ENVELOPE " + envelope(content.raw());
                    break;
                case FetchItem::Type::BODYSTRUCTURE:
                    data += item.response_name() + " " + body_structure(content.raw());
                    break;
                default: {
                    std::string section = section_content(content.raw(), item);
                    data += std::format("{} {{{}}}\r\n{}", item.response_name(), section.size(), section);
                    break;
                }
            }
        }
        if (seen_changed && !has_flags) {
            data += " " + flags_item(message.flags);
        }

        responses.push_back(response::untagged(std::format("{} FETCH ({})", seq, data)));
    }

    responses.push_back(response::ok(cmd.tag, completed(cmd)));
    return responses;
}

std::vector<std::string> CommandHandler::handle_store(SessionContext& ctx, const Command& cmd) {
    if (ctx.read_only) {
        return {response::no(cmd.tag, "Mailbox is read-only")};
    }

    auto [set_text, action_text] = split_first(cmd.raw);
    auto set = SequenceSet::parse(set_text);
    auto action = IMAPParser::parse_store_action(action_text);
    if (!set || !action) {
        return {response::bad(cmd.tag, "Invalid STORE arguments")};
    }

    Flags requested(action->flags.bits() & STORABLE_FLAGS);
    size_t deleted = ctx.count(Flag::Deleted);
    bool limit_reached = false;

    std::vector<std::string> responses;
    for (uint32_t seq = 1; seq <= ctx.exists(); ++seq) {
        auto& message = ctx.messages[seq - 1];
        bool selected = cmd.uid ? set->contains(message.uid, ctx.max_uid())
                                : set->contains(seq, ctx.exists());
        if (!selected) continue;

        Flags updated = message.flags;
        switch (action->mode) {
            case StoreAction::Mode::Replace:
                updated = Flags(static_cast<uint8_t>((message.flags.bits() & message_flags::RECENT) |
                                                     requested.bits()));
                break;
            case StoreAction::Mode::Add:
                updated.add(requested);
                break;
            case StoreAction::Mode::Remove:
                updated.remove(requested);
                break;
        }

        if (updated.has(Flag::Deleted) && !message.flags.has(Flag::Deleted)) {
            if (deleted >= ctx.config.max_deleted_messages) {
                limit_reached = true;
                continue;
            }
            ++deleted;
        } else if (!updated.has(Flag::Deleted) && message.flags.has(Flag::Deleted)) {
            --deleted;
        }

        if (updated != message.flags) {
            ctx.update_flags(message, updated);
        }

        if (!action->silent) {
            std::string data = flags_item(message.flags);
            if (cmd.uid) {
                data = std::format("UID {} {}", message.uid, data);
            }
            responses.push_back(response::untagged(std::format("{} FETCH ({})", seq, data)));
        }
    }

    if (limit_reached) {
        responses.push_back(response::no(cmd.tag, "Too many messages marked for deletion"));
    } else {
        responses.push_back(response::ok(cmd.tag, completed(cmd)));
    }
    return responses;
}

std::vector<std::string> CommandHandler::handle_uid(SessionContext& ctx, const Command& cmd) {
    Command sub = Command::parse(cmd.tag + " " + cmd.raw);
    if (!sub.valid()) {
        return {response::bad(cmd.tag, sub.error)};
    }
    sub.uid = true;

    switch (sub.type) {
        case CommandType::FETCH: return handle_fetch(ctx, sub);
        case CommandType::STORE: return handle_store(ctx, sub);
        case CommandType::SEARCH: return handle_search(ctx, sub);
        case CommandType::EXPUNGE: return handle_expunge(ctx, sub);
        default:
            return {response::bad(cmd.tag, "Unknown UID command")};
    }
}

}  // namespace mailcore::imap
