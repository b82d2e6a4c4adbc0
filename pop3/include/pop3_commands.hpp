#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <functional>
#include <unordered_map>
#include <optional>

#include "pop3_context.hpp"

namespace mailcore::pop3 {

// RFC 2449 allows 255 octets; some clients send longer PASS lines.
inline constexpr size_t MAX_COMMAND_LENGTH = 512;

enum class CommandType {
    USER,
    PASS,
    STAT,
    LIST,
    RETR,
    DELE,
    NOOP,
    RSET,
    QUIT,
    TOP,
    UIDL,
    CAPA,
    UNKNOWN
};

struct Command {
    CommandType type = CommandType::UNKNOWN;
    std::string name;
    std::string argument;            // everything after the name, trimmed
    std::vector<std::string> args;

    static Command parse(std::string_view line);
    static CommandType string_to_type(const std::string& name);
    static std::string type_to_string(CommandType type);
};

class CommandHandler {
public:
    using Handler = std::function<std::string(SessionContext&, const Command&)>;

    static CommandHandler& instance();

    // Returns the complete response without the final CRLF. Multi-line
    // responses end with the "." terminator line.
    std::string execute(SessionContext& ctx, const Command& cmd);

    static std::string handle_user(SessionContext& ctx, const Command& cmd);
    static std::string handle_pass(SessionContext& ctx, const Command& cmd);
    static std::string handle_stat(SessionContext& ctx, const Command& cmd);
    static std::string handle_list(SessionContext& ctx, const Command& cmd);
    static std::string handle_retr(SessionContext& ctx, const Command& cmd);
    static std::string handle_dele(SessionContext& ctx, const Command& cmd);
    static std::string handle_noop(SessionContext& ctx, const Command& cmd);
    static std::string handle_rset(SessionContext& ctx, const Command& cmd);
    static std::string handle_quit(SessionContext& ctx, const Command& cmd);
    static std::string handle_top(SessionContext& ctx, const Command& cmd);
    static std::string handle_uidl(SessionContext& ctx, const Command& cmd);
    static std::string handle_capa(SessionContext& ctx, const Command& cmd);

private:
    CommandHandler();
    std::unordered_map<CommandType, Handler> handlers_;
};

// Header block, blank line and the first `lines` lines of the body.
std::string message_top(std::string_view content, size_t lines);

std::optional<size_t> parse_number(std::string_view text);

namespace response {
    constexpr const char* OK = "+OK";
    constexpr const char* ERR = "-ERR";

    inline std::string ok(const std::string& msg = "") {
        return msg.empty() ? std::string(OK) : std::string(OK) + " " + msg;
    }

    inline std::string err(const std::string& msg = "") {
        return msg.empty() ? std::string(ERR) : std::string(ERR) + " " + msg;
    }
}

}  // namespace mailcore::pop3
