#include "relay_filter.hpp"
#include "mime/message_parser.hpp"
#include "encoding.hpp"
#include "logger.hpp"

namespace mailcore::smtp {

namespace {

std::string bare_address(const std::string& address) {
    std::string value = trim(address);
    if (value.size() >= 2 && value.front() == '<' && value.back() == '>') {
        value = value.substr(1, value.size() - 2);
    }
    return value;
}

}  // namespace

RelayFilter::RelayFilter(const SMTPConfig& config, UserStore& users)
    : config_(config)
    , users_(users) {
    for (const auto& domain : config_.hosted_domains) {
        std::string normalized = to_lower(trim(domain));
        if (!normalized.empty()) {
            hosted_domains_.insert(std::move(normalized));
        }
    }
}

bool RelayFilter::is_hosted_domain(std::string_view domain) const {
    return hosted_domains_.count(to_lower(domain)) > 0;
}

bool RelayFilter::can_accept_from(const TransactionContext& context, const std::string& from) const {
    if (!config_.mx_enabled) return true;
    if (context.authenticated()) return true;

    if (context.local_port == config_.mx_port) {
        LOG_DEBUG_FMT("MX: accepting MAIL FROM {} on port {}", from, context.local_port);
        return true;
    }

    LOG_WARNING_FMT("Rejected unauthenticated MAIL FROM {} on port {} from {}",
                    from, context.local_port, context.client_address);
    return false;
}

bool RelayFilter::can_deliver_to(const TransactionContext& context, const std::string& to,
                                 const std::string& from) const {
    if (!config_.mx_enabled) return true;
    if (context.authenticated()) return true;

    if (context.local_port != config_.mx_port) {
        LOG_WARNING_FMT("Rejected unauthenticated RCPT TO {} on port {} from {}",
                        to, context.local_port, context.client_address);
        return false;
    }

    std::string domain = mime::address_domain(to);
    if (domain.empty() || !is_hosted_domain(domain)) {
        LOG_WARNING_FMT("MX: rejected relay attempt to {} from {} ({})", to, from, context.client_address);
        return false;
    }

    if (config_.validate_recipients && !recipient_exists(to)) {
        LOG_INFO_FMT("MX: rejected mail to unknown user {} from {}", to, from);
        return false;
    }

    LOG_DEBUG_FMT("MX: accepted RCPT TO {} from {}", to, from);
    return true;
}

bool RelayFilter::recipient_exists(const std::string& to) const {
    try {
        return users_.find_user_by_address(to_lower(bare_address(to))).has_value();
    } catch (const StoreError& e) {
        LOG_ERROR_FMT("MX: cannot verify recipient {}: {}", to, e.what());
        return false;
    }
}

}  // namespace mailcore::smtp
