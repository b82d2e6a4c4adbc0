#include <catch2/catch_test_macros.hpp>

#include "pop3_commands.hpp"
#include "pop3_context.hpp"
#include "encoding.hpp"
#include "../../tests/support/mail_fixture.hpp"

using namespace mailcore;
using namespace mailcore::pop3;

namespace {

class UnavailableStore : public MessageStore {
public:
    bool save_email(InboundEmail&) override { throw StoreError("database unavailable"); }
    std::optional<InboundEmail> find_by_message_id(const std::string&) override {
        throw StoreError("database unavailable");
    }
    std::vector<MessageSummary> list_messages(int64_t, size_t) override {
        throw StoreError("database unavailable");
    }
    std::optional<std::string> get_message_content(int64_t, int64_t) override {
        throw StoreError("database unavailable");
    }
    bool update_flags(int64_t, int64_t, uint8_t) override { throw StoreError("database unavailable"); }
    size_t delete_messages(int64_t, const std::vector<int64_t>&) override {
        throw StoreError("database unavailable");
    }
};

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

TEST_CASE("POP3 command parsing", "[pop3][commands]") {
    SECTION("Parse USER command") {
        auto cmd = Command::parse("USER john@example.com");
        REQUIRE(cmd.type == CommandType::USER);
        REQUIRE(cmd.name == "USER");
        REQUIRE(cmd.argument == "john@example.com");
    }

    SECTION("PASS keeps embedded spaces") {
        auto cmd = Command::parse("PASS secret with spaces  ");
        REQUIRE(cmd.type == CommandType::PASS);
        REQUIRE(cmd.argument == "secret with spaces");
    }

    SECTION("Parse TOP command") {
        auto cmd = Command::parse("TOP 1 10");
        REQUIRE(cmd.type == CommandType::TOP);
        REQUIRE(cmd.args == std::vector<std::string>{"1", "10"});
    }

    SECTION("Parse LIST with and without argument") {
        REQUIRE(Command::parse("LIST").argument.empty());
        REQUIRE(Command::parse("LIST 1").argument == "1");
    }

    SECTION("Case insensitive parsing") {
        REQUIRE(Command::parse("user a").type == CommandType::USER);
        REQUIRE(Command::parse("Uidl").type == CommandType::UIDL);
        REQUIRE(Command::parse("capa").type == CommandType::CAPA);
    }

    SECTION("Unknown and empty commands") {
        REQUIRE(Command::parse("STLS").type == CommandType::UNKNOWN);
        REQUIRE(Command::parse("APOP a b").type == CommandType::UNKNOWN);
        REQUIRE(Command::parse("").type == CommandType::UNKNOWN);
    }

    SECTION("Type conversion") {
        REQUIRE(Command::type_to_string(CommandType::QUIT) == "QUIT");
        REQUIRE(Command::string_to_type("RSET") == CommandType::RSET);
        REQUIRE(Command::type_to_string(CommandType::UNKNOWN) == "UNKNOWN");
    }
}

TEST_CASE("POP3 responses", "[pop3][responses]") {
    REQUIRE(response::ok() == "+OK");
    REQUIRE(response::ok("Success") == "+OK Success");
    REQUIRE(response::err() == "-ERR");
    REQUIRE(response::err("Failed") == "-ERR Failed");
}

TEST_CASE("POP3 multi-line bodies", "[pop3][format]") {
    SECTION("Dot-stuffing normalizes line endings") {
        REQUIRE(dot_stuff("a\n.b\r\n..c") == "a\r\n..b\r\n...c\r\n");
        REQUIRE(dot_stuff("line\r\n") == "line\r\n");
        REQUIRE(dot_stuff("").empty());
    }

    SECTION("TOP keeps headers and the first body lines") {
        std::string message = "H: v\r\n\r\nl1\r\nl2\r\nl3\r\n";
        REQUIRE(message_top(message, 0) == "H: v\r\n\r\n");
        REQUIRE(message_top(message, 2) == "H: v\r\n\r\nl1\r\nl2\r\n");
        REQUIRE(message_top(message, 10) == message);
        REQUIRE(message_top("H: v\r\n", 3) == "H: v\r\n");
    }

    SECTION("Message numbers") {
        REQUIRE(parse_number("12") == 12u);
        REQUIRE_FALSE(parse_number("").has_value());
        REQUIRE_FALSE(parse_number("1a").has_value());
        REQUIRE_FALSE(parse_number("-1").has_value());
    }
}

TEST_CASE("POP3 session flows", "[pop3][dispatch]") {
    testing::MailFixture fx;
    int64_t alice = fx.add_user("alice@example.com");
    std::string key = fx.add_key(alice, ScopeSet{Scope::Pop3});
    fx.deliver(alice, "alice@example.com", "First", "one");
    fx.deliver(alice, "alice@example.com", "Second", "two");

    auto summaries = fx.store.list_messages(alice, 10);
    REQUIRE(summaries.size() == 2);
    uint64_t first_size = summaries[0].size;
    uint64_t second_size = summaries[1].size;

    POP3Config config;
    SessionContext ctx(fx.authenticator, fx.store, config);
    ctx.client_address = "192.0.2.20";
    auto& handler = CommandHandler::instance();
    auto run = [&](const std::string& line) { return handler.execute(ctx, Command::parse(line)); };

    SECTION("Transaction commands need authentication") {
        REQUIRE(run("STAT") == "-ERR Not authenticated");
        REQUIRE(run("RETR 1") == "-ERR Not authenticated");
        REQUIRE(run("PASS " + key) == "-ERR USER required first");
        REQUIRE(run("XYZZY") == "-ERR Unknown command");
    }

    SECTION("CAPA in authorization state") {
        auto capa = run("CAPA");
        REQUIRE(capa.starts_with("+OK"));
        REQUIRE(capa.find("\r\nUIDL\r\n") != std::string::npos);
        REQUIRE(capa.find("EXPIRE") == std::string::npos);
        REQUIRE(ends_with(capa, "IMPLEMENTATION mailcore\r\n."));
    }

    SECTION("Failed login is generic and resets USER") {
        REQUIRE(run("USER alice@example.com") == "+OK User accepted");
        REQUIRE(run("PASS wrong-key") == "-ERR [AUTH] Authentication failed");
        REQUIRE(ctx.state == SessionState::Authorization);
        REQUIRE(run("PASS " + key) == "-ERR USER required first");
    }

    SECTION("Key without the pop3 scope is refused") {
        int64_t bob = fx.add_user("bob@example.com");
        std::string imap_only = fx.add_key(bob, ScopeSet{Scope::Imap});
        run("USER bob@example.com");
        REQUIRE(run("PASS " + imap_only) == "-ERR [AUTH] Authentication failed");
    }

    SECTION("Authenticated session") {
        REQUIRE(run("USER Alice@Example.com") == "+OK User accepted");
        REQUIRE(run("PASS " + key) == "+OK Logged in, 2 messages");
        REQUIRE(ctx.state == SessionState::Transaction);
        REQUIRE(run("USER alice@example.com") == "-ERR Already authenticated");

        SECTION("STAT, LIST and UIDL") {
            REQUIRE(run("STAT") == "+OK 2 " + std::to_string(first_size + second_size));
            REQUIRE(run("LIST") == "+OK 2 messages (" + std::to_string(first_size + second_size) +
                                   " octets)\r\n1 " + std::to_string(first_size) + "\r\n2 " +
                                   std::to_string(second_size) + "\r\n.");
            REQUIRE(run("LIST 2") == "+OK 2 " + std::to_string(second_size));
            REQUIRE(run("UIDL 1") == "+OK 1 <5.1@test.example>");
            REQUIRE(run("UIDL") == "+OK\r\n1 <5.1@test.example>\r\n2 <6.2@test.example>\r\n.");
        }

        SECTION("Invalid message numbers") {
            REQUIRE(run("RETR abc") == "-ERR Invalid message number");
            REQUIRE(run("RETR 0") == "-ERR No such message");
            REQUIRE(run("RETR 9") == "-ERR No such message");
            REQUIRE(run("RETR") == "-ERR RETR requires message number");
            REQUIRE(run("TOP 1") == "-ERR TOP requires message number and line count");
        }

        SECTION("RETR returns the message and marks it seen") {
            auto retr = run("RETR 1");
            REQUIRE(retr.starts_with("+OK " + std::to_string(first_size) + " octets\r\nFrom: Sender"));
            REQUIRE(ends_with(retr, "\r\n\r\none\r\n."));
            REQUIRE((fx.store.list_messages(alice, 10)[0].flags & message_flags::SEEN) != 0);
            REQUIRE((fx.store.list_messages(alice, 10)[1].flags & message_flags::SEEN) == 0);
        }

        SECTION("TOP does not mark the message seen") {
            auto top = run("TOP 2 0");
            REQUIRE(top.starts_with("+OK\r\nFrom: Sender"));
            REQUIRE(ends_with(top, "Message-ID: <6.2@test.example>\r\n\r\n."));
            REQUIRE(ends_with(run("TOP 2 1"), "\r\n\r\ntwo\r\n."));
            REQUIRE((fx.store.list_messages(alice, 10)[1].flags & message_flags::SEEN) == 0);
        }

        SECTION("DELE marks only") {
            REQUIRE(run("DELE 1") == "+OK Message 1 deleted");
            REQUIRE(run("DELE 1") == "-ERR Message already deleted");
            REQUIRE(run("RETR 1") == "-ERR Message deleted");
            REQUIRE(run("LIST 1") == "-ERR No such message");
            REQUIRE(run("STAT") == "+OK 1 " + std::to_string(second_size));
            REQUIRE(fx.store.list_messages(alice, 10).size() == 2);

            SECTION("RSET clears the marks") {
                REQUIRE(run("RSET") == "+OK 2 messages");
                REQUIRE(run("STAT") == "+OK 2 " + std::to_string(first_size + second_size));
                REQUIRE(run("QUIT") == "+OK Goodbye, 0 messages deleted");
                REQUIRE(fx.store.list_messages(alice, 10).size() == 2);
            }

            SECTION("QUIT commits the deletions") {
                REQUIRE(run("QUIT") == "+OK Goodbye, 1 messages deleted");
                REQUIRE(ctx.state == SessionState::Update);

                auto remaining = fx.store.list_messages(alice, 10);
                REQUIRE(remaining.size() == 1);
                REQUIRE(remaining[0].message_id == "<6.2@test.example>");
            }
        }

        SECTION("Deletion limit") {
            config.max_deleted_messages = 1;
            REQUIRE(run("DELE 2") == "+OK Message 2 deleted");
            REQUIRE(run("DELE 1") == "-ERR Too many messages marked for deletion");
        }

        SECTION("CAPA in transaction state") {
            REQUIRE(run("CAPA").find("EXPIRE NEVER\r\n") != std::string::npos);
        }
    }

    SECTION("QUIT without authentication") {
        REQUIRE(run("QUIT") == "+OK Goodbye");
        REQUIRE(ctx.state == SessionState::Update);
    }
}

TEST_CASE("POP3 disconnect before QUIT keeps messages", "[pop3][dispatch]") {
    testing::MailFixture fx;
    int64_t alice = fx.add_user("alice@example.com");
    std::string key = fx.add_key(alice, ScopeSet{Scope::Pop3});
    fx.deliver(alice, "alice@example.com", "First", "one");
    fx.deliver(alice, "alice@example.com", "Second", "two");

    POP3Config config;
    auto& handler = CommandHandler::instance();

    {
        SessionContext dropped(fx.authenticator, fx.store, config);
        handler.execute(dropped, Command::parse("USER alice@example.com"));
        REQUIRE(handler.execute(dropped, Command::parse("PASS " + key)).starts_with("+OK"));
        REQUIRE(handler.execute(dropped, Command::parse("DELE 1")).starts_with("+OK"));
        REQUIRE(handler.execute(dropped, Command::parse("DELE 2")).starts_with("+OK"));
    }

    REQUIRE(fx.store.list_messages(alice, 10).size() == 2);

    SessionContext next(fx.authenticator, fx.store, config);
    handler.execute(next, Command::parse("USER alice@example.com"));
    REQUIRE(handler.execute(next, Command::parse("PASS " + key)) == "+OK Logged in, 2 messages");
}

TEST_CASE("POP3 store failures become -ERR", "[pop3][dispatch]") {
    testing::MailFixture fx;
    int64_t alice = fx.add_user("alice@example.com");
    std::string key = fx.add_key(alice, ScopeSet{Scope::Pop3});

    UnavailableStore broken;
    POP3Config config;
    SessionContext ctx(fx.authenticator, broken, config);
    auto& handler = CommandHandler::instance();

    handler.execute(ctx, Command::parse("USER alice@example.com"));
    REQUIRE(handler.execute(ctx, Command::parse("PASS " + key)) == "-ERR Internal server error");
    REQUIRE(ctx.state == SessionState::Authorization);
    REQUIRE_FALSE(ctx.user.has_value());
}

TEST_CASE("POP3 drop cap keeps the newest messages", "[pop3][dispatch]") {
    testing::MailFixture fx;
    int64_t alice = fx.add_user("alice@example.com");
    std::string key = fx.add_key(alice, ScopeSet{Scope::Pop3});
    auto t0 = std::chrono::system_clock::now() - std::chrono::hours(3);
    fx.deliver(alice, "alice@example.com", "Old", "one", t0);
    int64_t middle = fx.deliver(alice, "alice@example.com", "Middle", "two", t0 + std::chrono::hours(1));
    int64_t newest = fx.deliver(alice, "alice@example.com", "New", "three", t0 + std::chrono::hours(2));

    POP3Config config;
    config.max_messages_per_session = 2;
    SessionContext ctx(fx.authenticator, fx.store, config);
    auto& handler = CommandHandler::instance();

    handler.execute(ctx, Command::parse("USER alice@example.com"));
    REQUIRE(handler.execute(ctx, Command::parse("PASS " + key)) == "+OK Logged in, 2 messages");
    REQUIRE(ctx.messages[0].email_id == middle);
    REQUIRE(ctx.messages[1].email_id == newest);
    REQUIRE(handler.execute(ctx, Command::parse("RETR 2")).find("three") != std::string::npos);
}
