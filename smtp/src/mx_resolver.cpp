#include "mx_resolver.hpp"
#include "logger.hpp"

#include <algorithm>

#include <netinet/in.h>
#include <arpa/nameser.h>
#include <resolv.h>

namespace mailcore::smtp {

std::vector<std::string> DnsMxResolver::resolve(const std::string& domain) {
    std::vector<std::string> hosts;
    for (auto& record : lookup_mx(domain)) {
        if (!record.hostname.empty() && record.hostname.back() == '.') {
            record.hostname.pop_back();
        }
        if (!record.hostname.empty()) {
            hosts.push_back(std::move(record.hostname));
        }
    }

    if (hosts.empty()) {
        LOG_DEBUG_FMT("No MX records for {}, falling back to the domain", domain);
        hosts.push_back(domain);
    } else {
        LOG_DEBUG_FMT("Resolved {} MX records for {}", hosts.size(), domain);
    }
    return hosts;
}

std::vector<MXRecord> DnsMxResolver::lookup_mx(const std::string& domain) {
    std::vector<MXRecord> records;

    // res_query shares per-thread resolver state; res_nquery keeps each call independent.
    struct __res_state state{};
    if (res_ninit(&state) != 0) {
        LOG_WARNING("Resolver initialization failed");
        return records;
    }

    std::vector<unsigned char> answer(NS_MAXMSG);
    int len = res_nquery(&state, domain.c_str(), ns_c_in, ns_t_mx, answer.data(),
                         static_cast<int>(answer.size()));
    res_nclose(&state);

    if (len < 0) {
        LOG_WARNING_FMT("MX lookup failed for {}", domain);
        return records;
    }

    return parse_answer(answer.data(), answer.size(), len);
}

std::vector<MXRecord> DnsMxResolver::parse_answer(const unsigned char* answer, size_t capacity, int length) {
    std::vector<MXRecord> records;
    if (length <= 0) {
        return records;
    }
    // A truncated answer reports its full length, not what fits the buffer.
    int len = std::min(length, static_cast<int>(capacity));

    ns_msg msg;
    if (ns_initparse(answer, len, &msg) < 0) {
        LOG_DEBUG_FMT("Malformed MX answer ({} of {} bytes)", len, length);
        return records;
    }

    int count = ns_msg_count(msg, ns_s_an);
    for (int i = 0; i < count; ++i) {
        ns_rr rr;
        if (ns_parserr(&msg, ns_s_an, i, &rr) < 0) {
            continue;
        }

        if (ns_rr_type(rr) != ns_t_mx || ns_rr_rdlen(rr) < 3) {
            continue;
        }

        const unsigned char* rdata = ns_rr_rdata(rr);
        int priority = ns_get16(rdata);

        char exchange[NS_MAXDNAME];
        if (dn_expand(answer, answer + len, rdata + 2, exchange, sizeof(exchange)) < 0) {
            continue;
        }

        records.push_back({exchange, priority});
    }

    std::stable_sort(records.begin(), records.end());
    return records;
}

}  // namespace mailcore::smtp
