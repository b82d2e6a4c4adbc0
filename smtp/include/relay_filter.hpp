#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <set>
#include <cstdint>

#include "config.hpp"
#include "storage/stores.hpp"

namespace mailcore::smtp {

// What the transport knows about the connection a transaction arrived on.
struct TransactionContext {
    uint16_t local_port = 0;
    std::string client_address;
    std::optional<int64_t> authenticated_user_id;

    bool authenticated() const { return authenticated_user_id.has_value(); }
};

// MAIL FROM / RCPT TO acceptance. Unauthenticated mail is only taken on the
// MX port and only for recipients at hosted domains.
class RelayFilter {
public:
    RelayFilter(const SMTPConfig& config, UserStore& users);

    bool can_accept_from(const TransactionContext& context, const std::string& from) const;
    bool can_deliver_to(const TransactionContext& context, const std::string& to,
                        const std::string& from) const;

    // Exact match, case-insensitive. Subdomains are not hosted implicitly.
    bool is_hosted_domain(std::string_view domain) const;

private:
    bool recipient_exists(const std::string& to) const;

    SMTPConfig config_;
    UserStore& users_;
    std::set<std::string> hosted_domains_;  // lower case
};

}  // namespace mailcore::smtp
