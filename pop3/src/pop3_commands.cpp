#include "pop3_commands.hpp"
#include "encoding.hpp"
#include "logger.hpp"

#include <charconv>
#include <sstream>

namespace mailcore::pop3 {

namespace {

const std::string NOT_AUTHENTICATED = response::err("Not authenticated");

std::string listing_line(const MessageInfo& message, bool unique_id) {
    return std::to_string(message.number) + " " +
           (unique_id ? message.unique_id : std::to_string(message.size));
}

// LIST and UIDL share their shape: one line for "n", the whole drop otherwise.
std::string scan_listing(SessionContext& ctx, const Command& cmd, bool unique_id) {
    if (!cmd.argument.empty()) {
        auto number = parse_number(cmd.args[0]);
        if (!number) {
            return response::err("Invalid message number");
        }
        auto* message = ctx.find(*number);
        if (!message) {
            return response::err("No such message");
        }
        return response::ok(listing_line(*message, unique_id));
    }

    std::ostringstream oss;
    if (unique_id) {
        oss << response::ok() << "\r\n";
    } else {
        oss << response::ok(std::to_string(ctx.total_messages()) + " messages (" +
                            std::to_string(ctx.total_size()) + " octets)") << "\r\n";
    }
    for (const auto& message : ctx.messages) {
        if (!ctx.is_deleted(message.number)) {
            oss << listing_line(message, unique_id) << "\r\n";
        }
    }
    oss << ".";
    return oss.str();
}

}  // namespace

std::optional<size_t> parse_number(std::string_view text) {
    if (text.empty()) return std::nullopt;
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::string message_top(std::string_view content, size_t lines) {
    size_t separator = content.find("\r\n\r\n");
    size_t body_start = separator == std::string_view::npos ? std::string_view::npos : separator + 4;
    if (separator == std::string_view::npos) {
        separator = content.find("\n\n");
        body_start = separator == std::string_view::npos ? std::string_view::npos : separator + 2;
    }
    if (separator == std::string_view::npos) {
        return std::string(content);
    }

    std::string result(content.substr(0, body_start));
    size_t pos = body_start;
    for (size_t count = 0; count < lines && pos < content.size(); ++count) {
        size_t eol = content.find('\n', pos);
        size_t next = eol == std::string_view::npos ? content.size() : eol + 1;
        result.append(content.substr(pos, next - pos));
        pos = next;
    }
    return result;
}

Command Command::parse(std::string_view line) {
    Command cmd;

    std::string text = trim(line);
    if (text.empty()) {
        return cmd;
    }

    auto space = text.find(' ');
    cmd.name = to_upper(std::string_view(text).substr(0, space));
    cmd.type = string_to_type(cmd.name);
    if (space != std::string::npos) {
        cmd.argument = trim(std::string_view(text).substr(space + 1));
    }
    cmd.args = split(cmd.argument, ' ');

    return cmd;
}

CommandType Command::string_to_type(const std::string& name) {
    static const std::unordered_map<std::string, CommandType> mapping = {
        {"USER", CommandType::USER},
        {"PASS", CommandType::PASS},
        {"STAT", CommandType::STAT},
        {"LIST", CommandType::LIST},
        {"RETR", CommandType::RETR},
        {"DELE", CommandType::DELE},
        {"NOOP", CommandType::NOOP},
        {"RSET", CommandType::RSET},
        {"QUIT", CommandType::QUIT},
        {"TOP", CommandType::TOP},
        {"UIDL", CommandType::UIDL},
        {"CAPA", CommandType::CAPA}
    };

    auto it = mapping.find(name);
    return it != mapping.end() ? it->second : CommandType::UNKNOWN;
}

std::string Command::type_to_string(CommandType type) {
    switch (type) {
        case CommandType::USER: return "USER";
        case CommandType::PASS: return "PASS";
        case CommandType::STAT: return "STAT";
        case CommandType::LIST: return "LIST";
        case CommandType::RETR: return "RETR";
        case CommandType::DELE: return "DELE";
        case CommandType::NOOP: return "NOOP";
        case CommandType::RSET: return "RSET";
        case CommandType::QUIT: return "QUIT";
        case CommandType::TOP: return "TOP";
        case CommandType::UIDL: return "UIDL";
        case CommandType::CAPA: return "CAPA";
        default: return "UNKNOWN";
    }
}

CommandHandler& CommandHandler::instance() {
    static CommandHandler instance;
    return instance;
}

CommandHandler::CommandHandler() {
    handlers_[CommandType::USER] = handle_user;
    handlers_[CommandType::PASS] = handle_pass;
    handlers_[CommandType::STAT] = handle_stat;
    handlers_[CommandType::LIST] = handle_list;
    handlers_[CommandType::RETR] = handle_retr;
    handlers_[CommandType::DELE] = handle_dele;
    handlers_[CommandType::NOOP] = handle_noop;
    handlers_[CommandType::RSET] = handle_rset;
    handlers_[CommandType::QUIT] = handle_quit;
    handlers_[CommandType::TOP] = handle_top;
    handlers_[CommandType::UIDL] = handle_uidl;
    handlers_[CommandType::CAPA] = handle_capa;
}

std::string CommandHandler::execute(SessionContext& ctx, const Command& cmd) {
    auto it = handlers_.find(cmd.type);
    if (it == handlers_.end()) {
        return response::err("Unknown command");
    }

    try {
        return it->second(ctx, cmd);
    } catch (const std::exception& e) {
        LOG_ERROR_FMT("POP3 {} from {} failed: {}", cmd.name, ctx.client_address, e.what());
        return response::err("Internal server error");
    }
}

std::string CommandHandler::handle_user(SessionContext& ctx, const Command& cmd) {
    if (ctx.state != SessionState::Authorization) {
        return response::err("Already authenticated");
    }
    if (cmd.argument.empty()) {
        return response::err("USER requires argument");
    }

    ctx.pending_username = cmd.argument;
    return response::ok("User accepted");
}

std::string CommandHandler::handle_pass(SessionContext& ctx, const Command& cmd) {
    if (ctx.state != SessionState::Authorization) {
        return response::err("Not in authorization state");
    }
    if (ctx.pending_username.empty()) {
        return response::err("USER required first");
    }
    if (cmd.argument.empty()) {
        return response::err("PASS requires argument");
    }

    auto result = ctx.authenticator.authenticate(ctx.pending_username, cmd.argument,
                                                 Protocol::Pop3, ctx.client_address);
    auto* success = std::get_if<auth_result::Success>(&result);
    if (!success) {
        ctx.pending_username.clear();
        return response::err("[AUTH] Authentication failed");
    }

    ctx.begin_transaction(success->user);
    return response::ok("Logged in, " + std::to_string(ctx.messages.size()) + " messages");
}

std::string CommandHandler::handle_stat(SessionContext& ctx, const Command& /* cmd */) {
    if (ctx.state != SessionState::Transaction) {
        return NOT_AUTHENTICATED;
    }

    return response::ok(std::to_string(ctx.total_messages()) + " " + std::to_string(ctx.total_size()));
}

std::string CommandHandler::handle_list(SessionContext& ctx, const Command& cmd) {
    if (ctx.state != SessionState::Transaction) {
        return NOT_AUTHENTICATED;
    }
    return scan_listing(ctx, cmd, false);
}

std::string CommandHandler::handle_retr(SessionContext& ctx, const Command& cmd) {
    if (ctx.state != SessionState::Transaction) {
        return NOT_AUTHENTICATED;
    }
    if (cmd.args.empty()) {
        return response::err("RETR requires message number");
    }

    auto number = parse_number(cmd.args[0]);
    if (!number) {
        return response::err("Invalid message number");
    }
    if (ctx.is_deleted(*number)) {
        return response::err("Message deleted");
    }
    auto* message = ctx.find(*number);
    if (!message) {
        return response::err("No such message");
    }

    auto content = ctx.content(*message);
    if (!content) {
        return response::err("Unable to retrieve message");
    }
    ctx.mark_seen(*message);

    return response::ok(std::to_string(content->size()) + " octets") + "\r\n" + dot_stuff(*content) + ".";
}

std::string CommandHandler::handle_dele(SessionContext& ctx, const Command& cmd) {
    if (ctx.state != SessionState::Transaction) {
        return NOT_AUTHENTICATED;
    }
    if (cmd.args.empty()) {
        return response::err("DELE requires message number");
    }

    auto number = parse_number(cmd.args[0]);
    if (!number) {
        return response::err("Invalid message number");
    }
    if (ctx.is_deleted(*number)) {
        return response::err("Message already deleted");
    }
    if (!ctx.find(*number)) {
        return response::err("No such message");
    }
    if (ctx.deleted.size() >= ctx.config.max_deleted_messages) {
        return response::err("Too many messages marked for deletion");
    }

    ctx.deleted.insert(*number);
    return response::ok("Message " + std::to_string(*number) + " deleted");
}

std::string CommandHandler::handle_noop(SessionContext& ctx, const Command& /* cmd */) {
    if (ctx.state != SessionState::Transaction) {
        return NOT_AUTHENTICATED;
    }
    return response::ok();
}

std::string CommandHandler::handle_rset(SessionContext& ctx, const Command& /* cmd */) {
    if (ctx.state != SessionState::Transaction) {
        return NOT_AUTHENTICATED;
    }

    ctx.deleted.clear();
    return response::ok(std::to_string(ctx.messages.size()) + " messages");
}

std::string CommandHandler::handle_quit(SessionContext& ctx, const Command& /* cmd */) {
    if (ctx.state != SessionState::Transaction) {
        ctx.state = SessionState::Update;
        return response::ok("Goodbye");
    }

    ctx.state = SessionState::Update;
    size_t removed = ctx.commit();
    LOG_INFO_FMT("POP3 session of {} ended, {} messages deleted", ctx.user->address, removed);
    return response::ok("Goodbye, " + std::to_string(removed) + " messages deleted");
}

std::string CommandHandler::handle_top(SessionContext& ctx, const Command& cmd) {
    if (ctx.state != SessionState::Transaction) {
        return NOT_AUTHENTICATED;
    }
    if (cmd.args.size() < 2) {
        return response::err("TOP requires message number and line count");
    }

    auto number = parse_number(cmd.args[0]);
    if (!number) {
        return response::err("Invalid message number");
    }
    auto lines = parse_number(cmd.args[1]);
    if (!lines) {
        return response::err("Invalid line count");
    }
    if (ctx.is_deleted(*number)) {
        return response::err("Message deleted");
    }
    auto* message = ctx.find(*number);
    if (!message) {
        return response::err("No such message");
    }

    auto content = ctx.content(*message);
    if (!content) {
        return response::err("Unable to retrieve message");
    }

    return response::ok() + "\r\n" + dot_stuff(message_top(*content, *lines)) + ".";
}

std::string CommandHandler::handle_uidl(SessionContext& ctx, const Command& cmd) {
    if (ctx.state != SessionState::Transaction) {
        return NOT_AUTHENTICATED;
    }
    return scan_listing(ctx, cmd, true);
}

std::string CommandHandler::handle_capa(SessionContext& ctx, const Command& /* cmd */) {
    std::ostringstream oss;
    oss << response::ok("Capability list follows") << "\r\n";
    oss << "USER\r\n";
    oss << "TOP\r\n";
    oss << "UIDL\r\n";
    oss << "RESP-CODES\r\n";
    oss << "AUTH-RESP-CODE\r\n";
    oss << "PIPELINING\r\n";

    if (ctx.state == SessionState::Transaction) {
        oss << "EXPIRE NEVER\r\n";
    }

    oss << "IMPLEMENTATION " << ctx.config.server_name << "\r\n";
    oss << ".";

    return oss.str();
}

}  // namespace mailcore::pop3
