#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <functional>
#include <unordered_map>

#include "imap_context.hpp"

namespace mailcore::imap {

enum class CommandType {
    // Any state
    CAPABILITY,
    NOOP,
    LOGOUT,
    ENABLE,

    // Not authenticated state
    AUTHENTICATE,
    LOGIN,

    // Authenticated state
    SELECT,
    EXAMINE,
    LIST,
    LSUB,
    STATUS,

    // Selected state
    CHECK,
    CLOSE,
    UNSELECT,
    EXPUNGE,
    SEARCH,
    FETCH,
    STORE,
    UID,

    UNKNOWN
};

struct Command {
    std::string tag;
    CommandType type = CommandType::UNKNOWN;
    std::string name;                // upper case
    std::vector<std::string> args;   // tokenized, except for raw-argument commands
    std::string raw;                 // argument tail exactly as received
    bool uid = false;                // dispatched through UID
    std::string error;               // set when the line is malformed

    bool valid() const { return error.empty(); }

    // "<tag> <NAME> [arguments]". An empty line yields a NOOP tagged "*".
    static Command parse(std::string_view line);
    static CommandType string_to_type(const std::string& name);
    static std::string type_to_string(CommandType type);
    // FETCH, STORE, SEARCH, STATUS, LIST, LSUB and UID keep their tail unparsed.
    static bool keeps_raw_arguments(CommandType type);
};

class CommandHandler {
public:
    using Handler = std::function<std::vector<std::string>(SessionContext&, const Command&)>;

    static CommandHandler& instance();

    // Runs the handler for cmd. Handler exceptions become a tagged BAD.
    std::vector<std::string> execute(SessionContext& ctx, const Command& cmd);

    // Second half of AUTHENTICATE: the client's response to the "+" prompt.
    std::vector<std::string> continue_authenticate(SessionContext& ctx, const std::string& line);

    static std::string capabilities();

    static std::vector<std::string> handle_capability(SessionContext& ctx, const Command& cmd);
    static std::vector<std::string> handle_noop(SessionContext& ctx, const Command& cmd);
    static std::vector<std::string> handle_logout(SessionContext& ctx, const Command& cmd);
    static std::vector<std::string> handle_enable(SessionContext& ctx, const Command& cmd);
    static std::vector<std::string> handle_authenticate(SessionContext& ctx, const Command& cmd);
    static std::vector<std::string> handle_login(SessionContext& ctx, const Command& cmd);
    static std::vector<std::string> handle_select(SessionContext& ctx, const Command& cmd);
    static std::vector<std::string> handle_examine(SessionContext& ctx, const Command& cmd);
    static std::vector<std::string> handle_list(SessionContext& ctx, const Command& cmd);
    static std::vector<std::string> handle_lsub(SessionContext& ctx, const Command& cmd);
    static std::vector<std::string> handle_status(SessionContext& ctx, const Command& cmd);
    static std::vector<std::string> handle_check(SessionContext& ctx, const Command& cmd);
    static std::vector<std::string> handle_close(SessionContext& ctx, const Command& cmd);
    static std::vector<std::string> handle_unselect(SessionContext& ctx, const Command& cmd);
    static std::vector<std::string> handle_expunge(SessionContext& ctx, const Command& cmd);
    static std::vector<std::string> handle_search(SessionContext& ctx, const Command& cmd);
    static std::vector<std::string> handle_fetch(SessionContext& ctx, const Command& cmd);
    static std::vector<std::string> handle_store(SessionContext& ctx, const Command& cmd);
    static std::vector<std::string> handle_uid(SessionContext& ctx, const Command& cmd);

private:
    CommandHandler();

    static bool allowed_in(SessionState state, CommandType type);
    static std::vector<std::string> login(SessionContext& ctx, const std::string& tag,
                                          const std::string& identifier, const std::string& secret,
                                          const char* command);
    static std::vector<std::string> plain_login(SessionContext& ctx, const std::string& tag,
                                                const std::string& encoded);

    std::unordered_map<CommandType, Handler> handlers_;
};

namespace response {
    inline std::string ok(const std::string& tag, const std::string& msg = "Completed") {
        return tag + " OK " + msg;
    }

    inline std::string no(const std::string& tag, const std::string& msg) {
        return tag + " NO " + msg;
    }

    inline std::string bad(const std::string& tag, const std::string& msg) {
        return tag + " BAD " + msg;
    }

    inline std::string untagged(const std::string& data) {
        return "* " + data;
    }

    inline std::string continuation(const std::string& data = "") {
        return "+ " + data;
    }

    inline std::string bye(const std::string& msg = "Logging out") {
        return "* BYE " + msg;
    }
}

}  // namespace mailcore::imap
